#include "TerminateHandler.hpp"

#include "Checkend.hpp"
#include "log/LogManager.hpp"

#include <atomic>
#include <cstdlib>
#include <exception>
#include <mutex>

namespace checkend::integrations
{

namespace
{

std::atomic<Checkend*> g_reporter{ nullptr };
std::terminate_handler g_prev_terminate = nullptr;
bool g_installed = false;
std::mutex g_install_mtx;

void ReportingTerminateHandler()
{
    if (auto* reporter = g_reporter.load())
        TerminateHandler::reportCurrentException(*reporter);

    if (g_prev_terminate)
    {
        g_prev_terminate();
        return;
    }
    std::abort();
}

} // namespace

void TerminateHandler::install(Checkend& reporter)
{
    std::lock_guard<std::mutex> lock(g_install_mtx);
    g_reporter.store(&reporter);
    if (!g_installed)
    {
        g_prev_terminate = std::set_terminate(ReportingTerminateHandler);
        g_installed = true;
    }
}

void TerminateHandler::uninstall()
{
    std::lock_guard<std::mutex> lock(g_install_mtx);
    if (!g_installed)
        return;
    std::set_terminate(g_prev_terminate);
    g_prev_terminate = nullptr;
    g_reporter.store(nullptr);
    g_installed = false;
}

bool TerminateHandler::isInstalled()
{
    std::lock_guard<std::mutex> lock(g_install_mtx);
    return g_installed;
}

void TerminateHandler::reportCurrentException(Checkend& reporter)
{
    NotifyOptions options;
    options.tags.push_back(kUnhandledTag);

    std::exception_ptr current = std::current_exception();
    if (!current)
    {
        reporter.notifyMessageSync("std::terminate", "terminate called without an active exception", options);
    }
    else
    {
        try
        {
            std::rethrow_exception(current);
        }
        catch (const std::exception& ex)
        {
            const auto response = reporter.notifySync(ex, options);
            CHECKEND_LOG_ERROR << "Unhandled exception reported: " << transport::describe(response);
        }
        catch (...)
        {
            // Not derived from std::exception; report what we can.
            reporter.notifyMessageSync("unknown", "Unhandled exception of unknown type", options);
        }
    }

    reporter.flush(reporter.configuration().shutdown_timeout_ms);
}

} // namespace checkend::integrations
