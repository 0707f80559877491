#include <libcmt/PathMath.h>

#include <bit>

namespace ripple {
namespace cmt {

std::vector<PathStep>
siblingsOf(std::uint32_t leafIndex, std::uint32_t maxDepth)
{
    std::vector<PathStep> steps;
    steps.reserve(maxDepth);
    for (std::uint32_t level = 0; level < maxDepth; ++level)
        steps.push_back({level, ((leafIndex >> level) & 1) == 0});
    return steps;
}

NodeCoordinate
ancestorAt(std::uint32_t leafIndex, std::uint32_t level)
{
    return {level, static_cast<std::uint64_t>(leafIndex) >> level};
}

std::uint64_t
nodeIndex(std::uint32_t leafIndex, std::uint32_t level, std::uint32_t maxDepth)
{
    return leafCapacity(maxDepth - level) + ancestorAt(leafIndex, level).position;
}

std::optional<std::uint32_t>
critbit(std::uint32_t a, std::uint32_t b)
{
    if (a == b)
        return std::nullopt;
    return static_cast<std::uint32_t>(std::bit_width(a ^ b) - 1);
}

NodeHash
recompute(NodeHash const& leaf, std::vector<NodeHash> const& proof, std::uint32_t leafIndex)
{
    NodeHash current = leaf;
    for (auto const& step : siblingsOf(leafIndex, static_cast<std::uint32_t>(proof.size())))
        hashToParent(current, proof[step.level], step.isLeft);
    return current;
}

NodeHash
recomputePath(
    NodeHash const& leaf,
    std::vector<NodeHash> const& proof,
    std::uint32_t leafIndex,
    std::vector<NodeHash>& path)
{
    path.resize(proof.size());

    NodeHash current = leaf;
    for (auto const& step : siblingsOf(leafIndex, static_cast<std::uint32_t>(proof.size())))
    {
        path[step.level] = current;
        hashToParent(current, proof[step.level], step.isLeft);
    }
    return current;
}

} // namespace cmt
} // namespace ripple
