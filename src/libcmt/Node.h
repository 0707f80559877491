#pragma once

#include <xrpl/basics/base_uint.h>

#include <cstdint>

namespace ripple {
namespace cmt {

using NodeHash = ripple::uint256;

// Deepest tree whose empty subtree hashes are precomputed.
static constexpr std::uint32_t MAX_EMPTY_LEVEL = 32;

/**
 * Combine two child hashes into their parent.
 *
 * parent = SHA256(left || right). Any mirror producing proofs for a
 * concurrent tree must use the same function.
 */
NodeHash
combine(NodeHash const& left, NodeHash const& right);

/**
 * Hash of an entirely unwritten subtree spanning `level` levels.
 *
 * emptyNode(0) is the all-zero leaf, emptyNode(d) = combine(emptyNode(d-1), emptyNode(d-1)).
 */
NodeHash const&
emptyNode(std::uint32_t level);

// Replace `node` by its parent given the sibling on the other side.
inline void
hashToParent(NodeHash& node, NodeHash const& sibling, bool isLeft)
{
    node = isLeft ? combine(node, sibling) : combine(sibling, node);
}

} // namespace cmt
} // namespace ripple
