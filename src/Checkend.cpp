#include "Checkend.hpp"

#include "delivery/Worker.hpp"
#include "filters/IgnoreFilter.hpp"
#include "log/LogManager.hpp"
#include "testing/NoticeCapture.hpp"
#include "transport/Client.hpp"

#include <atomic>
#include <mutex>
#include <utility>

namespace checkend
{

struct Checkend::State
{
    Configuration cfg;
    NoticeBuilder builder;
    std::shared_ptr<const transport::Client> client;
    std::shared_ptr<delivery::Worker> worker;

    explicit State(Configuration c)
        : cfg(std::move(c))
        , builder(cfg)
    {
    }
};

struct Checkend::Impl
{
    std::shared_ptr<transport::IHttpTransport> http;
    mutable std::mutex mtx;
    std::shared_ptr<const State> state;
    std::shared_ptr<testing::NoticeCapture> capture;
    std::string last_error;
};

namespace
{

void applyLogging(const Configuration& cfg)
{
    const plog::Severity level = cfg.effectiveLogLevel();
    if (cfg.log_appender)
        log::LogManager::Configure(cfg.log_appender, level);
    else if (cfg.debug)
        log::LogManager::UseConsole(level);
    else
        log::LogManager::Disable();
}

transport::Response dropped(const char* reason)
{
    transport::Response r;
    r.status_code = 0;
    r.body = reason;
    return r;
}

} // namespace

Checkend::Checkend()
    : Checkend(nullptr)
{
}

Checkend::Checkend(std::shared_ptr<transport::IHttpTransport> http)
    : impl_(std::make_unique<Impl>())
{
    impl_->http = http ? std::move(http) : std::make_shared<transport::CprHttpTransport>();
}

Checkend::~Checkend() { stop(); }

bool Checkend::configure(Configuration cfg)
{
    const std::string error = cfg.validate();
    if (!error.empty())
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        impl_->last_error = error;
        CHECKEND_LOG_ERROR << "Invalid configuration: " << error;
        return false;
    }

    applyLogging(cfg);

    auto state = std::make_shared<State>(std::move(cfg));
    state->client = std::make_shared<transport::Client>(state->cfg, impl_->http);
    if (state->cfg.async_send)
        state->worker = std::make_shared<delivery::Worker>(state->client, state->cfg);

    std::shared_ptr<const State> previous;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        previous = std::exchange(impl_->state, state);
        impl_->last_error.clear();
    }
    if (previous && previous->worker)
        previous->worker->stop();

    CHECKEND_LOG_INFO << "Configured for " << state->client->ingestUrl() << " (environment: "
                      << state->cfg.environment << ", enabled: " << (state->cfg.enabled ? "yes" : "no") << ")";
    return true;
}

std::shared_ptr<const Checkend::State> Checkend::snapshot() const
{
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->state;
}

bool Checkend::prepare(const State& state, Notice& notice, std::string& drop_reason) const
{
    for (const auto& callback : state.cfg.before_notify)
    {
        if (!callback)
            continue;
        try
        {
            if (!callback(notice))
            {
                drop_reason = kDropFiltered;
                CHECKEND_LOG_DEBUG << "Notice filtered by before_notify: " << notice.error_class;
                return false;
            }
        }
        catch (const std::exception& ex)
        {
            CHECKEND_LOG_ERROR << "before_notify callback threw, continuing: " << ex.what();
        }
        catch (...)
        {
            CHECKEND_LOG_ERROR << "before_notify callback threw a non-standard exception, continuing";
        }
    }
    return true;
}

bool Checkend::dispatchAsync(const State& state, Notice notice)
{
    std::shared_ptr<testing::NoticeCapture> capture;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        capture = impl_->capture;
    }
    if (capture)
    {
        capture->record(std::move(notice));
        return true;
    }

    if (state.worker)
        return state.worker->enqueue(std::make_shared<const Notice>(std::move(notice)));
    return state.client->send(notice).isSuccess();
}

transport::Response Checkend::dispatchSync(const State& state, Notice notice)
{
    std::shared_ptr<testing::NoticeCapture> capture;
    {
        std::lock_guard<std::mutex> lock(impl_->mtx);
        capture = impl_->capture;
    }
    if (capture)
    {
        capture->record(std::move(notice));
        transport::Response r;
        r.status_code = 200;
        r.body = kCapturedBody;
        return r;
    }
    return state.client->send(notice);
}

bool Checkend::notify(const std::exception& ex, const NotifyOptions& options, const NoticeContext& ctx)
{
    auto state = snapshot();
    if (!state || !state->cfg.enabled)
        return false;
    if (filters::IgnoreFilter::shouldIgnore(ex, state->cfg.ignored_exceptions))
        return false;

    try
    {
        Notice notice = state->builder.build(ex, options, ctx);
        std::string reason;
        if (!prepare(*state, notice, reason))
            return false;
        return dispatchAsync(*state, std::move(notice));
    }
    catch (const std::exception& e)
    {
        CHECKEND_LOG_ERROR << "Failed to report exception: " << e.what();
        return false;
    }
}

transport::Response Checkend::notifySync(const std::exception& ex, const NotifyOptions& options,
                                         const NoticeContext& ctx)
{
    auto state = snapshot();
    if (!state || !state->cfg.enabled)
        return dropped(kDropNotConfigured);
    if (filters::IgnoreFilter::shouldIgnore(ex, state->cfg.ignored_exceptions))
        return dropped(kDropIgnored);

    try
    {
        Notice notice = state->builder.build(ex, options, ctx);
        std::string reason;
        if (!prepare(*state, notice, reason))
            return dropped(kDropFiltered);
        return dispatchSync(*state, std::move(notice));
    }
    catch (const std::exception& e)
    {
        CHECKEND_LOG_ERROR << "Failed to report exception: " << e.what();
        transport::Response r;
        r.body = e.what();
        return r;
    }
}

bool Checkend::notifyMessage(const std::string& error_class, const std::string& message,
                             const NotifyOptions& options, const NoticeContext& ctx)
{
    auto state = snapshot();
    if (!state || !state->cfg.enabled)
        return false;
    if (filters::IgnoreFilter::shouldIgnore(error_class, state->cfg.ignored_exceptions))
        return false;

    try
    {
        Notice notice = state->builder.buildMessage(error_class, message, options, ctx);
        std::string reason;
        if (!prepare(*state, notice, reason))
            return false;
        return dispatchAsync(*state, std::move(notice));
    }
    catch (const std::exception& e)
    {
        CHECKEND_LOG_ERROR << "Failed to report " << error_class << ": " << e.what();
        return false;
    }
}

transport::Response Checkend::notifyMessageSync(const std::string& error_class, const std::string& message,
                                                const NotifyOptions& options, const NoticeContext& ctx)
{
    auto state = snapshot();
    if (!state || !state->cfg.enabled)
        return dropped(kDropNotConfigured);
    if (filters::IgnoreFilter::shouldIgnore(error_class, state->cfg.ignored_exceptions))
        return dropped(kDropIgnored);

    try
    {
        Notice notice = state->builder.buildMessage(error_class, message, options, ctx);
        std::string reason;
        if (!prepare(*state, notice, reason))
            return dropped(kDropFiltered);
        return dispatchSync(*state, std::move(notice));
    }
    catch (const std::exception& e)
    {
        CHECKEND_LOG_ERROR << "Failed to report " << error_class << ": " << e.what();
        transport::Response r;
        r.body = e.what();
        return r;
    }
}

bool Checkend::flush(int timeout_ms)
{
    auto state = snapshot();
    if (!state || !state->worker)
        return true;
    return state->worker->flush(timeout_ms);
}

void Checkend::stop()
{
    auto state = snapshot();
    if (state && state->worker)
        state->worker->stop();
}

bool Checkend::isConfigured() const
{
    auto state = snapshot();
    return state && state->cfg.enabled;
}

Configuration Checkend::configuration() const
{
    auto state = snapshot();
    return state ? state->cfg : Configuration{};
}

std::shared_ptr<delivery::Worker> Checkend::worker() const
{
    auto state = snapshot();
    return state ? state->worker : nullptr;
}

void Checkend::attachCapture(std::shared_ptr<testing::NoticeCapture> capture)
{
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->capture = std::move(capture);
}

void Checkend::detachCapture()
{
    std::lock_guard<std::mutex> lock(impl_->mtx);
    impl_->capture.reset();
}

std::string Checkend::lastError() const
{
    std::lock_guard<std::mutex> lock(impl_->mtx);
    return impl_->last_error;
}

} // namespace checkend

namespace
{
std::atomic<checkend::Checkend*> g_checkend{ nullptr };
}

checkend::Checkend* Checkend_Get() { return g_checkend.load(); }

void Checkend_Set(checkend::Checkend* instance) { g_checkend.store(instance); }
