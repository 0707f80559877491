#pragma once

#include <libcmt/Node.h>

#include <cstdint>
#include <optional>
#include <vector>

namespace ripple {
namespace cmt {

/**
 * Record of one applied mutation.
 *
 * `path[i]` is the node `i` levels above the modified leaf after the
 * mutation; `path[0]` is the new leaf value and `root` the resulting root.
 */
struct ChangeLogEntry {
    NodeHash root;
    std::vector<NodeHash> path;
    std::uint32_t index = 0;

    NodeHash const&
    leaf() const
    {
        return path.front();
    }

    /**
     * Bring a proof for `leafIndex` up to date with this change.
     *
     * If the two leaves differ, the proof element at the level where their
     * paths diverge is replaced by this entry's node. Returns false when the
     * entry wrote `leafIndex` itself; the proof is left alone in that case.
     */
    bool
    updateProof(std::uint32_t leafIndex, std::vector<NodeHash>& proof) const;
};

// Outcome of replaying the change log over a stale proof.
struct PatchedProof {
    std::vector<NodeHash> proof;
    // The newest change to the same leaf wrote something other than the
    // caller's leaf.
    bool leafModified = false;
};

/**
 * Fixed capacity circular buffer of the most recent mutations.
 *
 * The entry at `activeIndex()` always describes the current root. Storage
 * is allocated once at construction.
 */
class ChangeLogRing {
public:
    ChangeLogRing(std::uint32_t maxDepth, std::uint32_t capacity);

    std::uint32_t
    capacity() const
    {
        return static_cast<std::uint32_t>(entries_.size());
    }

    std::uint64_t
    activeIndex() const
    {
        return activeIndex_;
    }

    std::uint64_t
    bufferSize() const
    {
        return bufferSize_;
    }

    ChangeLogEntry const&
    active() const
    {
        return entries_[activeIndex_];
    }

    std::vector<ChangeLogEntry> const&
    entries() const
    {
        return entries_;
    }

    // Forget all history and make `entry` the active one.
    void
    reset(ChangeLogEntry entry);

    // Record a new mutation, overwriting the oldest entry once full.
    void
    push(ChangeLogEntry entry);

    // Replace the whole ring with persisted state.
    void
    restore(std::vector<ChangeLogEntry> entries, std::uint64_t activeIndex, std::uint64_t bufferSize);

    // Slots of the last bufferSize() entries, oldest first.
    std::vector<std::uint64_t>
    recent() const;

    // Number of mutations since `root` was current, if its entry is still stored.
    std::optional<std::uint64_t>
    findRoot(NodeHash const& root) const;

    /**
     * Replay every buffered change, oldest to newest, over `proof`.
     *
     * Newer entries overwrite patches made by older ones at the same level,
     * so the result is the proof the caller would have generated against
     * the current root, provided the proof is younger than the window.
     */
    PatchedProof
    patch(std::uint32_t leafIndex, NodeHash const& leaf, std::vector<NodeHash> proof) const;

private:
    std::vector<ChangeLogEntry> entries_;
    std::uint64_t activeIndex_ = 0;
    std::uint64_t bufferSize_ = 0;
};

} // namespace cmt
} // namespace ripple
