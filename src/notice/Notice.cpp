#include "Notice.hpp"

#include "utils/TimeUtils.hpp"

namespace checkend
{

Json Notice::toJson() const
{
    Json out = Json::object();
    out["error_class"] = error_class;
    out["message"] = message;

    Json frames = Json::array();
    for (const auto& frame : backtrace)
    {
        frames.push_back({ { "file", frame.file }, { "line", frame.line }, { "method", frame.method } });
    }
    out["backtrace"] = std::move(frames);

    if (fingerprint && !fingerprint->empty())
        out["fingerprint"] = *fingerprint;
    if (!tags.empty())
        out["tags"] = tags;
    if (!context.empty())
        out["context"] = checkend::toJson(context);
    if (!request.empty())
        out["request"] = checkend::toJson(request);
    if (!user.empty())
        out["user"] = checkend::toJson(user);

    out["environment"] = environment;
    out["occurred_at"] = utils::formatIso8601(occurred_at);

    Json meta = Json::object();
    for (const auto& [key, value] : notifier)
        meta[key] = value;
    out["notifier"] = std::move(meta);
    return out;
}

} // namespace checkend
