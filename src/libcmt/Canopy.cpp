#include <libcmt/Canopy.h>
#include <libcmt/PathMath.h>

#include <xrpl/basics/contract.h>

#include <bit>

namespace ripple {
namespace cmt {

Canopy::Canopy(std::uint32_t maxDepth, std::uint32_t canopyDepth)
    : maxDepth_(maxDepth), canopyDepth_(canopyDepth), nodes_(nodeCount(canopyDepth))
{
    if (canopyDepth > maxDepth)
        ripple::LogicError("Canopy deeper than its tree");
}

std::size_t
Canopy::nodeCount(std::uint32_t canopyDepth)
{
    return (std::size_t{1} << (canopyDepth + 1)) - 2;
}

ripple::Expected<std::uint32_t, TreeError>
Canopy::depthFromBytes(std::size_t bytes, std::uint32_t maxDepth)
{
    if (bytes % NodeHash::size() != 0)
        return ripple::Unexpected(TreeError::CorruptCanopy);

    // A full binary tree without its root has 2^n - 2 nodes.
    std::uint64_t const count = bytes / NodeHash::size() + 2;
    if (!std::has_single_bit(count))
        return ripple::Unexpected(TreeError::CorruptCanopy);

    auto const depth = static_cast<std::uint32_t>(std::countr_zero(count)) - 1;
    if (depth > maxDepth)
        return ripple::Unexpected(TreeError::CorruptCanopy);
    return depth;
}

std::uint32_t
Canopy::levelOf(std::uint64_t n) const
{
    return maxDepth_ - static_cast<std::uint32_t>(std::bit_width(n) - 1);
}

NodeHash
Canopy::valueAt(std::uint64_t n) const
{
    auto const& stored = nodes_[n - 2];
    if (stored.isZero())
        return emptyNode(levelOf(n));
    return stored;
}

std::vector<NodeHash>
Canopy::read(std::uint32_t leafIndex, std::uint32_t fromLevel) const
{
    if (fromLevel + canopyDepth_ < maxDepth_)
        ripple::LogicError("Canopy::read below the cached levels");

    std::vector<NodeHash> siblings;
    siblings.reserve(maxDepth_ - fromLevel);
    for (std::uint32_t level = fromLevel; level < maxDepth_; ++level)
        siblings.push_back(valueAt(nodeIndex(leafIndex, level, maxDepth_) ^ 1));
    return siblings;
}

void
Canopy::write(ChangeLogEntry const& change)
{
    for (std::uint32_t level = maxDepth_ - canopyDepth_; level < maxDepth_; ++level)
        nodes_[nodeIndex(change.index, level, maxDepth_) - 2] = change.path[level];
}

ripple::Expected<void, TreeError>
Canopy::setLeafNodes(std::uint32_t startIndex, std::vector<NodeHash> const& nodes)
{
    std::uint64_t const width = std::uint64_t{1} << canopyDepth_;
    if (canopyDepth_ == 0 || nodes.empty() || startIndex >= width ||
        nodes.size() > width - startIndex)
        return ripple::Unexpected(TreeError::InvalidCanopyRange);

    std::uint64_t first = width + startIndex;
    std::uint64_t last = first + nodes.size() - 1;
    for (std::size_t i = 0; i < nodes.size(); ++i)
        nodes_[first - 2 + i] = nodes[i];

    // Walk up to the root's children, rehashing every touched parent.
    while (first > 3)
    {
        first >>= 1;
        last >>= 1;
        for (auto n = first; n <= last; ++n)
            nodes_[n - 2] = combine(valueAt(n << 1), valueAt((n << 1) + 1));
    }
    return {};
}

NodeHash
Canopy::root() const
{
    if (canopyDepth_ == 0)
        ripple::LogicError("Canopy::root without a canopy");
    return combine(valueAt(2), valueAt(3));
}

bool
Canopy::emptyBeyond(std::uint32_t rightmostIndex) const
{
    for (std::uint32_t depth = 1; depth <= canopyDepth_; ++depth)
    {
        std::uint64_t const levelStart = std::uint64_t{1} << depth;
        std::uint64_t const boundary = static_cast<std::uint64_t>(rightmostIndex) >> (maxDepth_ - depth);
        for (auto position = boundary + 1; position < levelStart; ++position)
        {
            auto const n = levelStart + position;
            if (valueAt(n) != emptyNode(levelOf(n)))
                return false;
        }
    }
    return true;
}

void
Canopy::restore(std::vector<NodeHash> nodes)
{
    if (nodes.size() != nodes_.size())
        ripple::LogicError("Canopy::restore size mismatch");
    nodes_ = std::move(nodes);
}

} // namespace cmt
} // namespace ripple
