#pragma once

#include <libcmt/ChangeLog.h>
#include <libcmt/Node.h>
#include <libcmt/TreeError.h>

#include <xrpl/basics/Expected.h>

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ripple {
namespace cmt {

/**
 * Cache of the upper `depth()` levels of a concurrent tree, root excluded.
 *
 * Nodes are stored breadth first: slot 0 and 1 hold the root's children,
 * slots 2..5 their children, and so on, 2^(depth+1) - 2 slots in total.
 * A slot that was never written holds zero and reads as the empty subtree
 * hash of its level. With a canopy of depth C callers may omit the top C
 * elements of a proof.
 */
class Canopy {
public:
    Canopy(std::uint32_t maxDepth, std::uint32_t canopyDepth);

    // Number of cached nodes for a canopy of the given depth.
    static std::size_t
    nodeCount(std::uint32_t canopyDepth);

    // Canopy depth implied by the trailing bytes of a tree account.
    static ripple::Expected<std::uint32_t, TreeError>
    depthFromBytes(std::size_t bytes, std::uint32_t maxDepth);

    std::uint32_t
    depth() const
    {
        return canopyDepth_;
    }

    std::vector<NodeHash> const&
    nodes() const
    {
        return nodes_;
    }

    /**
     * Cached siblings of `leafIndex`'s path from `fromLevel` up to the root.
     *
     * `fromLevel` must be at least maxDepth - depth().
     */
    std::vector<NodeHash>
    read(std::uint32_t leafIndex, std::uint32_t fromLevel) const;

    // Overwrite the slots on the path touched by a mutation.
    void
    write(ChangeLogEntry const& change);

    /**
     * Set consecutive nodes of the lowest canopy level and recompute every
     * cached ancestor above them.
     */
    ripple::Expected<void, TreeError>
    setLeafNodes(std::uint32_t startIndex, std::vector<NodeHash> const& nodes);

    // Root implied by the two topmost cached nodes.
    NodeHash
    root() const;

    // True if every cached node lying entirely right of `rightmostIndex` is empty.
    bool
    emptyBeyond(std::uint32_t rightmostIndex) const;

    void
    restore(std::vector<NodeHash> nodes);

private:
    // Stored value of node `n`, or the empty hash of its level.
    NodeHash
    valueAt(std::uint64_t n) const;

    std::uint32_t
    levelOf(std::uint64_t n) const;

    std::uint32_t maxDepth_;
    std::uint32_t canopyDepth_;
    std::vector<NodeHash> nodes_;
};

} // namespace cmt
} // namespace ripple
