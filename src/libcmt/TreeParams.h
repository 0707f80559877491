#pragma once

#include <libcmt/TreeError.h>

#include <xrpl/basics/BasicConfig.h>
#include <xrpl/basics/Expected.h>

#include <cstdint>

namespace ripple {
namespace cmt {

// Deepest supported tree; leaf index bit math stays within 32 bits.
static constexpr std::uint32_t MAX_TREE_DEPTH = 30;

/**
 * Shape of a concurrent merkle tree, fixed when the tree is created.
 */
struct TreeParams {
    std::uint32_t maxDepth = 0;
    std::uint32_t maxBufferSize = 0;
    std::uint32_t canopyDepth = 0;
};

bool
operator==(TreeParams const& lhs, TreeParams const& rhs);

ripple::Expected<void, TreeError>
validate(TreeParams const& params);

/**
 * Read tree parameters from a config section.
 *
 *   [merkle_tree]
 *   max_depth=14
 *   max_buffer_size=64
 *   canopy_depth=0
 *
 * Throws std::runtime_error if a required key is missing or the values are
 * out of bounds.
 */
TreeParams
setup_TreeParams(ripple::Section const& section);

} // namespace cmt
} // namespace ripple
