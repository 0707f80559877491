#include <libcmt/ChangeLog.h>
#include <libcmt/PathMath.h>

#include <xrpl/basics/contract.h>

#include <algorithm>

namespace ripple {
namespace cmt {

bool
ChangeLogEntry::updateProof(std::uint32_t leafIndex, std::vector<NodeHash>& proof) const
{
    auto const level = critbit(index, leafIndex);
    if (!level)
        return false;

    if (*level < proof.size())
        proof[*level] = path[*level];
    return true;
}

ChangeLogRing::ChangeLogRing(std::uint32_t maxDepth, std::uint32_t capacity)
    : entries_(capacity)
{
    if (capacity == 0)
        ripple::LogicError("ChangeLogRing: zero capacity");

    for (auto& entry : entries_)
        entry.path.resize(maxDepth);
}

void
ChangeLogRing::reset(ChangeLogEntry entry)
{
    activeIndex_ = 0;
    bufferSize_ = 0;
    entries_[activeIndex_] = std::move(entry);
}

void
ChangeLogRing::push(ChangeLogEntry entry)
{
    activeIndex_ = (activeIndex_ + 1) % entries_.size();
    bufferSize_ = std::min<std::uint64_t>(bufferSize_ + 1, entries_.size());
    entries_[activeIndex_] = std::move(entry);
}

void
ChangeLogRing::restore(
    std::vector<ChangeLogEntry> entries,
    std::uint64_t activeIndex,
    std::uint64_t bufferSize)
{
    if (entries.size() != entries_.size() || activeIndex >= entries.size() ||
        bufferSize > entries.size())
        ripple::LogicError("ChangeLogRing: restored state does not fit the ring");

    entries_ = std::move(entries);
    activeIndex_ = activeIndex;
    bufferSize_ = bufferSize;
}

std::vector<std::uint64_t>
ChangeLogRing::recent() const
{
    std::uint64_t const capacity = entries_.size();

    std::vector<std::uint64_t> slots;
    slots.reserve(bufferSize_);
    for (std::uint64_t age = bufferSize_; age-- > 0;)
        slots.push_back((activeIndex_ + capacity - age) % capacity);
    return slots;
}

std::optional<std::uint64_t>
ChangeLogRing::findRoot(NodeHash const& root) const
{
    // The entry just before the window is still intact until the ring wraps.
    std::uint64_t const capacity = entries_.size();
    for (std::uint64_t age = 0; age <= bufferSize_ && age < capacity; ++age)
    {
        if (entries_[(activeIndex_ + capacity - age) % capacity].root == root)
            return age;
    }
    return std::nullopt;
}

PatchedProof
ChangeLogRing::patch(std::uint32_t leafIndex, NodeHash const& leaf, std::vector<NodeHash> proof) const
{
    PatchedProof result{std::move(proof), false};
    for (auto const slot : recent())
    {
        auto const& entry = entries_[slot];
        if (!entry.updateProof(leafIndex, result.proof))
            result.leafModified = entry.leaf() != leaf;
    }
    return result;
}

} // namespace cmt
} // namespace ripple
