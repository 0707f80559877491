#pragma once

#include <libcmt/Node.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace ripple {
namespace cmt {

/**
 * Position of a node in a tree of fixed depth.
 *
 * Levels count upward from the leaves (level 0) to the root (level maxDepth).
 * `position` is the node's offset within its level.
 */
struct NodeCoordinate {
    std::uint32_t level = 0;
    std::uint64_t position = 0;
};

// One step of a leaf-to-root walk.
struct PathStep {
    std::uint32_t level = 0;
    bool isLeft = false;   // node on the walked path is the left child at this level
};

// Number of leaves in a tree of the given depth.
inline std::uint64_t
leafCapacity(std::uint32_t maxDepth)
{
    return std::uint64_t{1} << maxDepth;
}

/**
 * Left/right orientation of every node on the path from `leafIndex` up to
 * (but excluding) the root, leaf level first.
 */
std::vector<PathStep>
siblingsOf(std::uint32_t leafIndex, std::uint32_t maxDepth);

// Ancestor of `leafIndex` at `level`.
NodeCoordinate
ancestorAt(std::uint32_t leafIndex, std::uint32_t level);

/**
 * Breadth-first node number of the ancestor of `leafIndex` at `level`.
 *
 * The root is node 1 and the children of node n are 2n and 2n+1.
 */
std::uint64_t
nodeIndex(std::uint32_t leafIndex, std::uint32_t level, std::uint32_t maxDepth);

/**
 * Level at which the paths of two leaves diverge.
 *
 * The ancestors of `a` and `b` at this level are siblings, so a proof for
 * `a` holds a node of `b`'s path at exactly this position. Returns nothing
 * when a == b.
 */
std::optional<std::uint32_t>
critbit(std::uint32_t a, std::uint32_t b);

// Fold `leaf` with a bottom-up `proof` into the implied root.
NodeHash
recompute(NodeHash const& leaf, std::vector<NodeHash> const& proof, std::uint32_t leafIndex);

/**
 * Fold `leaf` with `proof`, recording every node on the way.
 *
 * On return `path[i]` is the node `i` levels above the leaf (path[0] is the
 * leaf itself) and the returned hash is the root.
 */
NodeHash
recomputePath(
    NodeHash const& leaf,
    std::vector<NodeHash> const& proof,
    std::uint32_t leafIndex,
    std::vector<NodeHash>& path);

} // namespace cmt
} // namespace ripple
