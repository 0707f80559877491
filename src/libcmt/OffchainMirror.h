#pragma once

#include <libcmt/ChangeLogEvent.h>
#include <libcmt/Node.h>

#include <cstdint>
#include <unordered_map>
#include <vector>

namespace ripple {
namespace cmt {

/**
 * Membership proof produced by an OffchainMirror.
 */
struct MerkleProof {
    NodeHash leaf;
    std::vector<NodeHash> proof;
    std::uint32_t leafIndex = 0;
    NodeHash root;

    // True if `proof` folds `leaf` to `root`.
    bool
    verify() const;

    // Drop the top `canopyDepth` siblings a tree with a canopy fills in itself.
    std::vector<NodeHash>
    truncated(std::uint32_t canopyDepth) const;
};

/**
 * Fully materialized tree kept beside a ConcurrentMerkleTree.
 *
 * Produces the proofs callers submit and tracks the root the concurrent
 * tree should have. Only written nodes are stored, one map per level;
 * anything else reads as the empty subtree hash.
 */
class OffchainMirror {
public:
    explicit OffchainMirror(std::uint32_t maxDepth);

    // Reset to an empty tree and write `leaves` from index 0 on.
    void
    build(std::vector<NodeHash> const& leaves);

    // Set one leaf and recompute its path; returns the new root.
    NodeHash
    updateLeaf(std::uint32_t leafIndex, NodeHash const& leaf);

    /**
     * Replay a change record from a concurrent tree.
     *
     * Returns true if the mirror's root afterwards equals the event's root.
     */
    bool
    apply(ChangeLogEvent const& event);

    NodeHash
    root() const;

    NodeHash
    leaf(std::uint32_t leafIndex) const;

    MerkleProof
    getProof(std::uint32_t leafIndex) const;

    std::uint32_t
    depth() const
    {
        return depth_;
    }

private:
    NodeHash
    getNode(std::uint32_t level, std::uint64_t position) const;

    void
    setNode(std::uint32_t level, std::uint64_t position, NodeHash const& value);

    std::uint32_t depth_;
    // level -> position -> hash, level 0 holds the leaves
    std::vector<std::unordered_map<std::uint64_t, NodeHash>> nodes_;
};

} // namespace cmt
} // namespace ripple
