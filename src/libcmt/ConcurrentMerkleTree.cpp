#include <libcmt/ConcurrentMerkleTree.h>
#include <libcmt/PathMath.h>

#include <xrpl/basics/Log.h>
#include <xrpl/basics/contract.h>

#include <bit>
#include <stdexcept>
#include <string>

namespace ripple {
namespace cmt {

namespace {

TreeParams const&
checked(TreeParams const& params)
{
    if (!validate(params))
        ripple::Throw<std::invalid_argument>("Invalid concurrent merkle tree parameters");
    return params;
}

} // namespace

ConcurrentMerkleTree::ConcurrentMerkleTree(TreeParams const& params, beast::Journal j)
    : params_(checked(params))
    , changeLog_(params_.maxDepth, params_.maxBufferSize)
    , canopy_(params_.maxDepth, params_.canopyDepth)
    , j_(j)
{
    rightmost_.proof.resize(params_.maxDepth);
}

bool
ConcurrentMerkleTree::isInitialized() const
{
    // An initialized tree never has a zero root: even the empty tree's root
    // is the hash of its empty subtrees.
    return sequenceNumber_ != 0 || !root().isZero();
}

ripple::Expected<NodeHash, TreeError>
ConcurrentMerkleTree::initialize()
{
    if (isInitialized())
        return ripple::Unexpected(TreeError::TreeAlreadyInitialized);

    ChangeLogEntry empty;
    empty.root = emptyNode(params_.maxDepth);
    empty.path.resize(params_.maxDepth);
    for (std::uint32_t level = 0; level < params_.maxDepth; ++level)
        empty.path[level] = emptyNode(level);

    rightmost_.proof = empty.path;
    rightmost_.leaf = emptyNode(0);
    rightmost_.index = 0;
    sequenceNumber_ = 0;
    changeLog_.reset(std::move(empty));

    JLOG(j_.info()) << "Initialized empty tree, depth " << params_.maxDepth
                    << ", buffer " << params_.maxBufferSize
                    << ", canopy " << params_.canopyDepth;
    return root();
}

ripple::Expected<NodeHash, TreeError>
ConcurrentMerkleTree::initializeWithRoot(
    NodeHash const& root,
    NodeHash const& rightmostLeaf,
    std::uint32_t rightmostIndex,
    std::vector<NodeHash> const& proof)
{
    if (isInitialized())
        return ripple::Unexpected(TreeError::TreeAlreadyInitialized);
    if (rightmostIndex >= leafCapacity(params_.maxDepth))
        return ripple::Unexpected(TreeError::LeafIndexOutOfRange);

    if (canopy_.depth() > 0)
    {
        if (canopy_.root() != root)
        {
            JLOG(j_.warn()) << "Canopy does not hash to root " << root;
            return ripple::Unexpected(TreeError::CanopyRootMismatch);
        }
        if (!canopy_.emptyBeyond(rightmostIndex))
        {
            JLOG(j_.warn()) << "Canopy holds nodes right of leaf " << rightmostIndex;
            return ripple::Unexpected(TreeError::CanopyNodeBeyondRightmost);
        }
    }

    auto full = completeProof(rightmostIndex, proof);
    if (!full)
        return ripple::Unexpected(full.error());

    ChangeLogEntry change;
    change.index = rightmostIndex;
    change.root = recomputePath(rightmostLeaf, *full, rightmostIndex, change.path);
    if (change.root != root)
    {
        JLOG(j_.warn()) << "Rightmost proof does not fold to root " << root;
        return ripple::Unexpected(TreeError::ProofMismatch);
    }

    // The state before the trusted root is unknown, so the ring starts with
    // a blank slot that never becomes part of the recent window.
    ChangeLogEntry blank;
    blank.path.resize(params_.maxDepth);
    changeLog_.reset(std::move(blank));

    rightmost_.proof = std::move(*full);
    rightmost_.leaf = rightmostLeaf;
    rightmost_.index = rightmostIndex + 1;
    canopy_.write(change);
    changeLog_.push(std::move(change));
    sequenceNumber_ = 1;

    JLOG(j_.info()) << "Initialized tree with root " << root
                    << ", rightmost leaf " << rightmostIndex;
    return root;
}

ripple::Expected<NodeHash, TreeError>
ConcurrentMerkleTree::append(NodeHash const& leaf)
{
    if (!isInitialized())
        return ripple::Unexpected(TreeError::TreeNotInitialized);
    if (leaf.isZero())
        return ripple::Unexpected(TreeError::CannotAppendEmptyNode);
    if (rightmost_.index >= leafCapacity(params_.maxDepth))
    {
        JLOG(j_.warn()) << "Append rejected, all " << rightmost_.index << " leaves used";
        return ripple::Unexpected(TreeError::TreeFull);
    }

    return commit(rightmost_.index, leaf, appendProof());
}

ripple::Expected<NodeHash, TreeError>
ConcurrentMerkleTree::replace(
    std::uint32_t leafIndex,
    NodeHash const& oldLeaf,
    NodeHash const& newLeaf,
    std::vector<NodeHash> const& proof)
{
    if (auto const writable = checkWritable(leafIndex); !writable)
        return ripple::Unexpected(writable.error());

    auto full = completeProof(leafIndex, proof);
    if (!full)
        return ripple::Unexpected(full.error());

    auto const resolution = resolve(leafIndex, oldLeaf, std::move(*full));
    if (!resolution.valid)
        return ripple::Unexpected(TreeError::ProofMismatch);

    return commit(leafIndex, newLeaf, resolution.proof);
}

ripple::Expected<NodeHash, TreeError>
ConcurrentMerkleTree::insertOrAppend(
    std::uint32_t leafIndex,
    NodeHash const& leaf,
    std::vector<NodeHash> const& proof)
{
    if (auto const writable = checkWritable(leafIndex); !writable)
        return ripple::Unexpected(writable.error());

    auto full = completeProof(leafIndex, proof);
    if (!full)
        return ripple::Unexpected(full.error());

    auto const resolution = resolve(leafIndex, emptyNode(0), std::move(*full));
    if (resolution.valid)
        return commit(leafIndex, leaf, resolution.proof);

    if (resolution.leafModified)
    {
        JLOG(j_.debug()) << "Leaf " << leafIndex << " already filled, appending instead";
        return append(leaf);
    }
    return ripple::Unexpected(TreeError::ProofMismatch);
}

ripple::Expected<void, TreeError>
ConcurrentMerkleTree::verify(
    std::uint32_t leafIndex,
    NodeHash const& leaf,
    std::vector<NodeHash> const& proof) const
{
    if (!isInitialized())
        return ripple::Unexpected(TreeError::TreeNotInitialized);
    if (leafIndex >= leafCapacity(params_.maxDepth))
        return ripple::Unexpected(TreeError::LeafIndexOutOfRange);

    auto full = completeProof(leafIndex, proof);
    if (!full)
        return ripple::Unexpected(full.error());

    if (!resolve(leafIndex, leaf, std::move(*full)).valid)
        return ripple::Unexpected(TreeError::ProofMismatch);
    return {};
}

ripple::Expected<void, TreeError>
ConcurrentMerkleTree::proveEmpty() const
{
    if (!isInitialized())
        return ripple::Unexpected(TreeError::TreeNotInitialized);
    if (root() != emptyNode(params_.maxDepth))
        return ripple::Unexpected(TreeError::TreeNotEmpty);
    return {};
}

ripple::Expected<void, TreeError>
ConcurrentMerkleTree::setCanopyLeafNodes(
    std::uint32_t startIndex,
    std::vector<NodeHash> const& nodes)
{
    if (isInitialized())
        return ripple::Unexpected(TreeError::TreeAlreadyInitialized);
    return canopy_.setLeafNodes(startIndex, nodes);
}

void
ConcurrentMerkleTree::restore(
    std::uint64_t sequenceNumber,
    ChangeLogRing changeLog,
    RightmostPath rightmost,
    std::vector<NodeHash> canopyNodes)
{
    if (changeLog.capacity() != params_.maxBufferSize ||
        rightmost.proof.size() != params_.maxDepth)
        ripple::LogicError("ConcurrentMerkleTree::restore: state does not match tree shape");

    sequenceNumber_ = sequenceNumber;
    changeLog_ = std::move(changeLog);
    rightmost_ = std::move(rightmost);
    canopy_.restore(std::move(canopyNodes));
}

ripple::Expected<std::vector<NodeHash>, TreeError>
ConcurrentMerkleTree::completeProof(
    std::uint32_t leafIndex,
    std::vector<NodeHash> const& proof) const
{
    auto const depth = params_.maxDepth;
    if (proof.size() > depth || proof.size() + canopy_.depth() < depth)
    {
        JLOG(j_.warn()) << "Proof of " << proof.size() << " nodes for depth " << depth
                        << " with canopy " << canopy_.depth();
        return ripple::Unexpected(TreeError::InvalidProofLength);
    }

    std::vector<NodeHash> full(proof);
    if (full.size() < depth)
    {
        auto const cached = canopy_.read(leafIndex, static_cast<std::uint32_t>(full.size()));
        full.insert(full.end(), cached.begin(), cached.end());
    }
    return full;
}

ConcurrentMerkleTree::Resolution
ConcurrentMerkleTree::resolve(
    std::uint32_t leafIndex,
    NodeHash const& leaf,
    std::vector<NodeHash> proof) const
{
    Resolution resolution;

    auto const candidate = recompute(leaf, proof, leafIndex);
    if (candidate == root())
    {
        resolution.proof = std::move(proof);
        resolution.valid = true;
        return resolution;
    }

    auto patched = changeLog_.patch(leafIndex, leaf, std::move(proof));
    resolution.leafModified = patched.leafModified;
    resolution.valid = recompute(leaf, patched.proof, leafIndex) == root();
    resolution.proof = std::move(patched.proof);

    auto const age = changeLog_.findRoot(candidate);
    if (resolution.valid)
    {
        JLOG(j_.debug()) << "Patched proof for leaf " << leafIndex << " across "
                         << (age ? std::to_string(*age) : std::string("unknown"))
                         << " changes";
    }
    else if (resolution.leafModified)
    {
        JLOG(j_.warn()) << "Leaf " << leafIndex << " was modified inside the change log window";
    }
    else if (!age)
    {
        JLOG(j_.warn()) << "Proof root for leaf " << leafIndex
                        << " not in change log (expired or foreign)";
    }
    else
    {
        JLOG(j_.warn()) << "Proof for leaf " << leafIndex << " does not fold to the current root";
    }
    return resolution;
}

ripple::Expected<void, TreeError>
ConcurrentMerkleTree::checkWritable(std::uint32_t leafIndex) const
{
    if (!isInitialized())
        return ripple::Unexpected(TreeError::TreeNotInitialized);
    if (leafIndex >= leafCapacity(params_.maxDepth))
        return ripple::Unexpected(TreeError::LeafIndexOutOfRange);
    return {};
}

std::vector<NodeHash>
ConcurrentMerkleTree::appendProof() const
{
    auto const next = rightmost_.index;
    if (next == 0)
        return rightmost_.proof;

    // Below the lowest set bit of `next` the new leaf only has empty
    // siblings. At that bit its left sibling is the rightmost leaf's
    // ancestor; above it both leaves share their siblings.
    auto const intersection = static_cast<std::uint32_t>(std::countr_zero(next));
    auto const previous = next - 1;

    std::vector<NodeHash> proof(rightmost_.proof);
    NodeHash node = rightmost_.leaf;
    for (auto const& step : siblingsOf(previous, intersection))
    {
        hashToParent(node, rightmost_.proof[step.level], step.isLeft);
        proof[step.level] = emptyNode(step.level);
    }
    proof[intersection] = node;
    return proof;
}

NodeHash
ConcurrentMerkleTree::commit(
    std::uint32_t leafIndex,
    NodeHash const& newLeaf,
    std::vector<NodeHash> const& proof)
{
    ChangeLogEntry change;
    change.index = leafIndex;
    change.root = recomputePath(newLeaf, proof, leafIndex, change.path);

    updateRightmost(change, proof);
    canopy_.write(change);
    changeLog_.push(std::move(change));
    ++sequenceNumber_;

    JLOG(j_.trace()) << "Wrote leaf " << leafIndex << ", sequence " << sequenceNumber_
                     << ", active index " << changeLog_.activeIndex()
                     << ", buffer size " << changeLog_.bufferSize()
                     << ", rightmost index " << rightmost_.index;
    return root();
}

void
ConcurrentMerkleTree::updateRightmost(
    ChangeLogEntry const& change,
    std::vector<NodeHash> const& proof)
{
    if (change.index >= rightmost_.index)
    {
        rightmost_.proof = proof;
        rightmost_.leaf = change.leaf();
        rightmost_.index = change.index + 1;
    }
    else if (change.index + 1 == rightmost_.index)
    {
        rightmost_.leaf = change.leaf();
    }
    else if (!change.updateProof(rightmost_.index - 1, rightmost_.proof))
    {
        ripple::LogicError("ConcurrentMerkleTree: change to the rightmost leaf not detected");
    }
}

} // namespace cmt
} // namespace ripple
