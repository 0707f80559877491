#include <libcmt/TreeParams.h>

#include <xrpl/basics/contract.h>

#include <stdexcept>

namespace ripple {
namespace cmt {

bool
operator==(TreeParams const& lhs, TreeParams const& rhs)
{
    return lhs.maxDepth == rhs.maxDepth && lhs.maxBufferSize == rhs.maxBufferSize &&
        lhs.canopyDepth == rhs.canopyDepth;
}

ripple::Expected<void, TreeError>
validate(TreeParams const& params)
{
    if (params.maxDepth == 0 || params.maxDepth > MAX_TREE_DEPTH)
        return ripple::Unexpected(TreeError::InvalidTreeParameters);
    if (params.maxBufferSize == 0)
        return ripple::Unexpected(TreeError::InvalidTreeParameters);
    if (params.canopyDepth > params.maxDepth)
        return ripple::Unexpected(TreeError::InvalidTreeParameters);
    return {};
}

TreeParams
setup_TreeParams(ripple::Section const& section)
{
    TreeParams params;
    if (!ripple::get_if_exists(section, "max_depth", params.maxDepth))
        ripple::Throw<std::runtime_error>(
            "Missing or invalid 'max_depth' in section [" + section.name() + "]");
    if (!ripple::get_if_exists(section, "max_buffer_size", params.maxBufferSize))
        ripple::Throw<std::runtime_error>(
            "Missing or invalid 'max_buffer_size' in section [" + section.name() + "]");
    params.canopyDepth = ripple::get<std::uint32_t>(section, "canopy_depth", 0);

    if (!validate(params))
        ripple::Throw<std::runtime_error>(
            "Invalid tree shape in section [" + section.name() + "]: " +
            transHuman(TreeError::InvalidTreeParameters));
    return params;
}

} // namespace cmt
} // namespace ripple
