#include "LogManager.hpp"

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/IAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>

#include <atomic>
#include <mutex>

namespace checkend::log
{

namespace
{

class RoutingAppender : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (target_)
            target_->write(record);
    }

    void setTarget(plog::IAppender* target)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        target_ = target;
    }

    plog::IAppender* target() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return target_;
    }

private:
    mutable std::mutex mutex_;
    plog::IAppender* target_ = nullptr;
};

RoutingAppender& router()
{
    static RoutingAppender instance;
    return instance;
}

plog::IAppender& consoleAppender()
{
    static plog::ConsoleAppender<plog::TxtFormatter> console(plog::streamStdErr);
    return console;
}

std::once_flag g_init_once;
std::atomic<plog::Severity> g_level{ plog::none };

} // namespace

void LogManager::EnsureInitialized()
{
    std::call_once(g_init_once, []() { plog::init<kLogInstance>(plog::none, &router()); });
}

void LogManager::Configure(plog::IAppender* appender, plog::Severity level)
{
    EnsureInitialized();
    router().setTarget(appender);
    const plog::Severity effective = appender ? level : plog::none;
    g_level.store(effective, std::memory_order_relaxed);
    if (auto* logger = plog::get<kLogInstance>())
        logger->setMaxSeverity(effective);
}

void LogManager::UseConsole(plog::Severity level)
{
    Configure(&consoleAppender(), level);
}

void LogManager::Disable()
{
    Configure(nullptr, plog::none);
}

plog::IAppender* LogManager::CurrentTarget()
{
    return router().target();
}

plog::Severity LogManager::CurrentLevel()
{
    return g_level.load(std::memory_order_relaxed);
}

} // namespace checkend::log
