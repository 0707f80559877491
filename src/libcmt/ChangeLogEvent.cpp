#include <libcmt/ChangeLogEvent.h>
#include <libcmt/PathMath.h>

#include <xrpl/basics/contract.h>

#include <string>

namespace ripple {
namespace cmt {

ChangeLogEvent
ChangeLogEvent::fromChange(
    ripple::uint256 const& id,
    ChangeLogEntry const& change,
    std::uint64_t seq,
    std::uint32_t maxDepth)
{
    if (change.path.size() != maxDepth)
        ripple::LogicError("ChangeLogEvent: change path does not match tree depth");

    ChangeLogEvent event;
    event.id = id;
    event.seq = seq;
    event.index = change.index;
    event.path.reserve(maxDepth + 1);
    for (std::uint32_t level = 0; level < maxDepth; ++level)
        event.path.push_back({change.path[level], nodeIndex(change.index, level, maxDepth)});
    event.path.push_back({change.root, 1});
    return event;
}

Json::Value
ChangeLogEvent::getJson() const
{
    Json::Value ret(Json::objectValue);
    ret["id"] = to_string(id);
    ret["seq"] = std::to_string(seq);
    ret["index"] = index;
    ret["root"] = to_string(root());

    Json::Value& nodes = (ret["path"] = Json::arrayValue);
    for (auto const& step : path)
    {
        Json::Value& node = nodes.append(Json::objectValue);
        node["node"] = to_string(step.node);
        node["node_index"] = std::to_string(step.nodeIndex);
    }
    return ret;
}

} // namespace cmt
} // namespace ripple
