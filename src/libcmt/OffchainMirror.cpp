#include <libcmt/OffchainMirror.h>
#include <libcmt/PathMath.h>

#include <xrpl/basics/contract.h>

#include <stdexcept>

namespace ripple {
namespace cmt {

bool
MerkleProof::verify() const
{
    return recompute(leaf, proof, leafIndex) == root;
}

std::vector<NodeHash>
MerkleProof::truncated(std::uint32_t canopyDepth) const
{
    if (canopyDepth > proof.size())
        ripple::Throw<std::invalid_argument>("Canopy deeper than proof");
    return {proof.begin(), proof.end() - canopyDepth};
}

OffchainMirror::OffchainMirror(std::uint32_t maxDepth)
    : depth_(maxDepth), nodes_(maxDepth + 1)
{
    if (maxDepth == 0 || maxDepth > MAX_EMPTY_LEVEL)
        ripple::Throw<std::invalid_argument>("Invalid mirror depth");
}

NodeHash
OffchainMirror::getNode(std::uint32_t level, std::uint64_t position) const
{
    auto const it = nodes_[level].find(position);
    if (it != nodes_[level].end())
        return it->second;
    return emptyNode(level);
}

void
OffchainMirror::setNode(std::uint32_t level, std::uint64_t position, NodeHash const& value)
{
    if (value == emptyNode(level))
        nodes_[level].erase(position);
    else
        nodes_[level][position] = value;
}

void
OffchainMirror::build(std::vector<NodeHash> const& leaves)
{
    if (leaves.size() > leafCapacity(depth_))
        ripple::Throw<std::out_of_range>("More leaves than the mirror holds");

    for (auto& level : nodes_)
        level.clear();

    for (std::size_t i = 0; i < leaves.size(); ++i)
        setNode(0, i, leaves[i]);

    // Rehash level by level over the occupied prefix only.
    std::uint64_t width = leaves.size();
    for (std::uint32_t level = 0; level < depth_ && width > 0; ++level)
    {
        width = (width + 1) / 2;
        for (std::uint64_t position = 0; position < width; ++position)
        {
            setNode(
                level + 1,
                position,
                combine(getNode(level, position << 1), getNode(level, (position << 1) + 1)));
        }
    }
}

NodeHash
OffchainMirror::updateLeaf(std::uint32_t leafIndex, NodeHash const& leaf)
{
    if (leafIndex >= leafCapacity(depth_))
        ripple::Throw<std::out_of_range>("Leaf index outside the mirror");

    NodeHash node = leaf;
    std::uint64_t position = leafIndex;
    setNode(0, position, node);
    for (std::uint32_t level = 0; level < depth_; ++level)
    {
        hashToParent(node, getNode(level, position ^ 1), (position & 1) == 0);
        position >>= 1;
        setNode(level + 1, position, node);
    }
    return node;
}

bool
OffchainMirror::apply(ChangeLogEvent const& event)
{
    if (event.path.size() != std::size_t{depth_} + 1)
        return false;
    return updateLeaf(event.index, event.leaf()) == event.root();
}

NodeHash
OffchainMirror::root() const
{
    return getNode(depth_, 0);
}

NodeHash
OffchainMirror::leaf(std::uint32_t leafIndex) const
{
    return getNode(0, leafIndex);
}

MerkleProof
OffchainMirror::getProof(std::uint32_t leafIndex) const
{
    if (leafIndex >= leafCapacity(depth_))
        ripple::Throw<std::out_of_range>("Leaf index outside the mirror");

    MerkleProof result;
    result.leaf = leaf(leafIndex);
    result.leafIndex = leafIndex;
    result.root = root();
    result.proof.reserve(depth_);

    std::uint64_t position = leafIndex;
    for (std::uint32_t level = 0; level < depth_; ++level)
    {
        result.proof.push_back(getNode(level, position ^ 1));
        position >>= 1;
    }
    return result;
}

} // namespace cmt
} // namespace ripple
