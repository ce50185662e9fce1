#pragma once

#include "filters/IgnoreFilter.hpp"
#include "filters/SanitizeFilter.hpp"

#include <plog/Severity.h>

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace plog
{
class IAppender;
}

namespace checkend
{

struct Notice;

/// Runs before a notice is dispatched. Return false to drop it; edits to the notice are kept.
using BeforeNotify = std::function<bool(Notice&)>;

struct Configuration
{
    static constexpr const char* kDefaultEndpoint = "https://app.checkend.com";
    static constexpr int kDefaultConnectTimeoutMs = 5000;
    static constexpr int kDefaultReadTimeoutMs = 15000;
    static constexpr int kDefaultShutdownTimeoutMs = 5000;
    static constexpr std::size_t kDefaultMaxQueueSize = 1000;
    static constexpr int kDefaultProxyPort = 8080;

    // Core
    std::string api_key;
    std::string endpoint = kDefaultEndpoint;
    std::string environment = "development";
    bool enabled = true;
    bool async_send = true;
    std::size_t max_queue_size = kDefaultMaxQueueSize;
    bool debug = false;

    // Timeouts (milliseconds)
    int connect_timeout_ms = kDefaultConnectTimeoutMs;
    int read_timeout_ms = kDefaultReadTimeoutMs;
    int shutdown_timeout_ms = kDefaultShutdownTimeoutMs;

    // Proxy; used when proxy_host is non-empty
    std::string proxy_host;
    int proxy_port = 0;
    std::string proxy_username;
    std::string proxy_password;

    // Notifier metadata
    std::string app_name;
    std::string revision;

    // Data sections
    bool send_request_data = true;
    bool send_user_data = true;
    bool send_context_data = true;

    filters::FilterKeys filter_keys = defaultFilterKeys();
    std::vector<filters::IgnoreRule> ignored_exceptions;
    std::vector<BeforeNotify> before_notify;

    // Logging sink. Null appender: console when debug, otherwise silent.
    plog::IAppender* log_appender = nullptr;
    std::optional<plog::Severity> log_level;

    bool hasProxy() const { return !proxy_host.empty(); }
    bool hasProxyCredentials() const { return hasProxy() && !proxy_username.empty(); }

    /// Sets connect and read timeouts together.
    void setTimeout(int timeout_ms)
    {
        connect_timeout_ms = timeout_ms;
        read_timeout_ms = timeout_ms;
    }

    void addFilterKey(std::string key) { filter_keys.insert(std::move(key)); }
    void addIgnoredException(filters::IgnoreRule rule) { ignored_exceptions.push_back(std::move(rule)); }
    void addBeforeNotify(BeforeNotify callback) { before_notify.push_back(std::move(callback)); }

    plog::Severity effectiveLogLevel() const;

    /// Empty string when the configuration is usable, otherwise the reason it is not.
    std::string validate() const;

    static filters::FilterKeys defaultFilterKeys();
};

} // namespace checkend
