#pragma once

#include "Notice.hpp"
#include "NoticeContext.hpp"
#include "config/Configuration.hpp"

#include <cstddef>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace cpptrace
{
struct stacktrace;
}

namespace checkend
{

/// Per-call additions to a notice. Maps are merged over the NoticeContext, option keys winning.
struct NotifyOptions
{
    std::optional<std::string> fingerprint;
    std::vector<std::string> tags;
    Value::Object context;
    Value::Object request;
    Value::Object user;
};

class NoticeBuilder
{
public:
    static constexpr std::size_t kMaxMessageLength = 10000;
    static constexpr std::size_t kMaxBacktraceFrames = 100;
    static constexpr const char* kUnknownFile = "Unknown";

    explicit NoticeBuilder(const Configuration& cfg);

    Notice build(const std::exception& ex, const NotifyOptions& options = {}, const NoticeContext& ctx = {}) const;

    /// For faults that are not C++ exceptions. The backtrace is taken at the call site.
    Notice buildMessage(const std::string& error_class, const std::string& message, const NotifyOptions& options = {},
                        const NoticeContext& ctx = {}) const;

    static std::vector<BacktraceFrame> convertTrace(const cpptrace::stacktrace& trace);

private:
    Notice makeBase(std::string error_class, const std::string& message, const NotifyOptions& options,
                    const NoticeContext& ctx) const;
    Value::Object mergeAndFilter(const Value::Object& base, const Value::Object& overrides) const;
    std::map<std::string, std::string> notifierInfo() const;

    std::string environment_;
    std::string app_name_;
    std::string revision_;
    bool send_request_data_;
    bool send_user_data_;
    bool send_context_data_;
    filters::FilterKeys filter_keys_;
};

} // namespace checkend
