#pragma once

#include <libcmt/ChangeLog.h>
#include <libcmt/Node.h>
#include <libcmt/OffchainMirror.h>
#include <libcmt/PathMath.h>

#include <cstdint>
#include <utility>
#include <vector>

namespace ripple {
namespace cmt {
namespace test {

// Distinct non-empty leaf for slot `n`.
inline NodeHash
makeLeaf(std::uint64_t n)
{
    return combine(NodeHash{n + 1}, emptyNode(0));
}

inline std::vector<NodeHash>
makeLeaves(std::uint64_t count, std::uint64_t offset = 0)
{
    std::vector<NodeHash> leaves;
    leaves.reserve(count);
    for (std::uint64_t i = 0; i < count; ++i)
        leaves.push_back(makeLeaf(offset + i));
    return leaves;
}

// Change log entry for writing `newLeaf` at `leafIndex` with a current proof.
inline ChangeLogEntry
makeChange(std::uint32_t leafIndex, NodeHash const& newLeaf, std::vector<NodeHash> const& proof)
{
    ChangeLogEntry change;
    change.index = leafIndex;
    change.root = recomputePath(newLeaf, proof, leafIndex, change.path);
    return change;
}

// Hash of the subtree spanning `level` levels at `position` of that level.
inline NodeHash
subtreeRoot(OffchainMirror const& mirror, std::uint32_t level, std::uint64_t position)
{
    std::vector<NodeHash> nodes;
    std::uint64_t const first = position << level;
    for (std::uint64_t i = 0; i < (std::uint64_t{1} << level); ++i)
        nodes.push_back(mirror.leaf(static_cast<std::uint32_t>(first + i)));

    while (nodes.size() > 1)
    {
        std::vector<NodeHash> parents;
        for (std::size_t i = 0; i < nodes.size(); i += 2)
            parents.push_back(combine(nodes[i], nodes[i + 1]));
        nodes = std::move(parents);
    }
    return nodes.front();
}

} // namespace test
} // namespace cmt
} // namespace ripple
