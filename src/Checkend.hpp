#pragma once

#include "config/Configuration.hpp"
#include "notice/NoticeBuilder.hpp"
#include "notice/NoticeContext.hpp"
#include "transport/HttpCommon.hpp"
#include "transport/Response.hpp"

#include <exception>
#include <memory>
#include <string>

namespace checkend
{

namespace delivery
{
class Worker;
}

namespace testing
{
class NoticeCapture;
}

/**
 * @brief Application-owned entry point: decides per notice whether to drop, capture, queue or send.
 *
 * Usage:
 *   checkend::Checkend reporter;
 *   auto cfg = checkend::ConfigLoader::fromEnvironment();
 *   cfg.api_key = "...";
 *   if (!reporter.configure(cfg))
 *       std::cerr << reporter.lastError();
 *   try { ... } catch (const std::exception& ex) { reporter.notify(ex); }
 *
 * All methods are thread-safe. Reporting never throws into the caller.
 */
class Checkend
{
public:
    static constexpr const char* kDropNotConfigured = "SDK not configured or disabled";
    static constexpr const char* kDropIgnored = "Exception ignored";
    static constexpr const char* kDropFiltered = "Filtered by before_notify";
    static constexpr const char* kCapturedBody = "Captured in testing mode";

    Checkend();
    /// Uses `http` for every Client this instance creates (tests, custom stacks).
    explicit Checkend(std::shared_ptr<transport::IHttpTransport> http);
    ~Checkend();

    Checkend(const Checkend&) = delete;
    Checkend& operator=(const Checkend&) = delete;

    /// Validates and applies `cfg`. Stops any previous worker. Returns false with lastError() set
    /// when the configuration is invalid; the previous configuration stays active in that case.
    bool configure(Configuration cfg);

    /// Async path (queued) unless async_send is off. Returns whether the notice was accepted.
    bool notify(const std::exception& ex, const NotifyOptions& options = {}, const NoticeContext& ctx = {});
    transport::Response notifySync(const std::exception& ex, const NotifyOptions& options = {},
                                   const NoticeContext& ctx = {});

    bool notifyMessage(const std::string& error_class, const std::string& message, const NotifyOptions& options = {},
                       const NoticeContext& ctx = {});
    transport::Response notifyMessageSync(const std::string& error_class, const std::string& message,
                                          const NotifyOptions& options = {}, const NoticeContext& ctx = {});

    bool flush(int timeout_ms = 30000);
    void stop();

    bool isConfigured() const;
    Configuration configuration() const;
    std::shared_ptr<delivery::Worker> worker() const;

    void attachCapture(std::shared_ptr<testing::NoticeCapture> capture);
    void detachCapture();

    std::string lastError() const;

private:
    struct State;
    struct Impl;

    std::shared_ptr<const State> snapshot() const;
    bool prepare(const State& state, Notice& notice, std::string& drop_reason) const;
    bool dispatchAsync(const State& state, Notice notice);
    transport::Response dispatchSync(const State& state, Notice notice);

    std::unique_ptr<Impl> impl_;
};

} // namespace checkend

// Process-wide handle for integration points that cannot carry a reference (terminate handlers).
checkend::Checkend* Checkend_Get();
void Checkend_Set(checkend::Checkend* instance);
