#pragma once

#include <libcmt/ChangeLog.h>
#include <libcmt/Node.h>

#include <xrpl/basics/base_uint.h>
#include <xrpl/json/json_value.h>

#include <cstdint>
#include <vector>

namespace ripple {
namespace cmt {

// A node on a changed path with its breadth-first node number (root is 1).
struct PathNode {
    NodeHash node;
    std::uint64_t nodeIndex = 0;
};

/**
 * Record emitted for every successful mutation of a tree account.
 *
 * Indexers replay these to follow the tree without reading account state.
 * `path` runs from the changed leaf up to the root and has maxDepth + 1
 * entries.
 */
struct ChangeLogEvent {
    ripple::uint256 id;
    std::vector<PathNode> path;
    std::uint64_t seq = 0;
    std::uint32_t index = 0;

    static ChangeLogEvent
    fromChange(
        ripple::uint256 const& id,
        ChangeLogEntry const& change,
        std::uint64_t seq,
        std::uint32_t maxDepth);

    NodeHash const&
    root() const
    {
        return path.back().node;
    }

    NodeHash const&
    leaf() const
    {
        return path.front().node;
    }

    Json::Value
    getJson() const;
};

} // namespace cmt
} // namespace ripple
