#pragma once

#include "Value.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace checkend
{

struct BacktraceFrame
{
    std::string file;
    std::uint32_t line = 0;
    std::string method;
};

/**
 * @brief One reported fault, ready for transmission.
 *
 * context/request/user are expected to be sanitized already. Once a Notice is handed to the
 * Delivery Worker (as a NoticePtr) it is never modified again.
 */
struct Notice
{
    std::string error_class;
    std::string message;
    std::vector<BacktraceFrame> backtrace;
    std::optional<std::string> fingerprint;
    std::vector<std::string> tags;
    Value::Object context;
    Value::Object request;
    Value::Object user;
    std::string environment;
    std::chrono::system_clock::time_point occurred_at = std::chrono::system_clock::now();
    std::map<std::string, std::string> notifier;

    /// Wire representation. Absent or empty optional sections are omitted.
    Json toJson() const;
};

using NoticePtr = std::shared_ptr<const Notice>;

} // namespace checkend
