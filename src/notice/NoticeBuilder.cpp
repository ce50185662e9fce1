#include "NoticeBuilder.hpp"

#include "CheckendVersion.hpp"
#include "filters/SanitizeFilter.hpp"
#include "utils/TextUtils.hpp"
#include "utils/TypeName.hpp"

#include <cpptrace/cpptrace.hpp>

#include <algorithm>
#include <typeinfo>

namespace checkend
{

namespace
{

// Frames belonging to the builder itself are skipped when tracing from the capture point.
constexpr std::size_t kBuilderFrames = 2;

} // namespace

NoticeBuilder::NoticeBuilder(const Configuration& cfg)
    : environment_(cfg.environment)
    , app_name_(cfg.app_name)
    , revision_(cfg.revision)
    , send_request_data_(cfg.send_request_data)
    , send_user_data_(cfg.send_user_data)
    , send_context_data_(cfg.send_context_data)
    , filter_keys_(cfg.filter_keys)
{
}

std::vector<BacktraceFrame> NoticeBuilder::convertTrace(const cpptrace::stacktrace& trace)
{
    std::vector<BacktraceFrame> frames;
    frames.reserve(std::min(trace.frames.size(), kMaxBacktraceFrames));
    for (const auto& f : trace.frames)
    {
        if (frames.size() >= kMaxBacktraceFrames)
            break;
        BacktraceFrame frame;
        frame.file = f.filename.empty() ? kUnknownFile : f.filename;
        frame.line = f.line.has_value() ? f.line.value() : 0;
        frame.method = f.symbol;
        frames.push_back(std::move(frame));
    }
    return frames;
}

Notice NoticeBuilder::build(const std::exception& ex, const NotifyOptions& options, const NoticeContext& ctx) const
{
    Notice n = makeBase(utils::demangledName(typeid(ex)), ex.what(), options, ctx);
    if (const auto* traced = dynamic_cast<const cpptrace::exception*>(&ex))
        n.backtrace = convertTrace(traced->trace());
    else
        n.backtrace = convertTrace(cpptrace::generate_trace(kBuilderFrames, kMaxBacktraceFrames));
    return n;
}

Notice NoticeBuilder::buildMessage(const std::string& error_class, const std::string& message,
                                   const NotifyOptions& options, const NoticeContext& ctx) const
{
    Notice n = makeBase(error_class, message, options, ctx);
    n.backtrace = convertTrace(cpptrace::generate_trace(kBuilderFrames, kMaxBacktraceFrames));
    return n;
}

Notice NoticeBuilder::makeBase(std::string error_class, const std::string& message, const NotifyOptions& options,
                               const NoticeContext& ctx) const
{
    Notice n;
    n.error_class = std::move(error_class);
    n.message = utils::utf8Truncate(message, kMaxMessageLength);
    n.fingerprint = options.fingerprint;
    n.tags = options.tags;
    n.environment = environment_;
    n.notifier = notifierInfo();

    if (send_context_data_)
        n.context = mergeAndFilter(ctx.context(), options.context);
    if (send_request_data_)
        n.request = mergeAndFilter(ctx.request(), options.request);
    if (send_user_data_)
        n.user = mergeAndFilter(ctx.user(), options.user);
    return n;
}

Value::Object NoticeBuilder::mergeAndFilter(const Value::Object& base, const Value::Object& overrides) const
{
    if (base.empty() && overrides.empty())
        return {};
    Value::Object merged = base;
    for (const auto& [key, value] : overrides)
        merged.insert_or_assign(key, value);
    return filters::SanitizeFilter::filter(merged, filter_keys_);
}

std::map<std::string, std::string> NoticeBuilder::notifierInfo() const
{
    std::map<std::string, std::string> info{
        { "name", kSdkName },
        { "version", kSdkVersion },
        { "language", "c++" },
        { "language_version", std::to_string(__cplusplus) },
    };
    if (!app_name_.empty())
        info["app_name"] = app_name_;
    if (!revision_.empty())
        info["revision"] = revision_;
    return info;
}

} // namespace checkend
