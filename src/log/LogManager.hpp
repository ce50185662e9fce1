#pragma once

#include <plog/Log.h>
#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace checkend::log
{

// Dedicated plog instance so SDK output never mixes with the host's default logger.
inline constexpr int kLogInstance = 17;

/**
 * @brief Routes the SDK's plog instance to whatever sink the configuration supplies.
 *
 * The instance is initialised once with an internal forwarding appender; Configure() only
 * swaps the forwarding target and the maximum severity, so reconfiguring never stacks
 * appenders on the plog logger.
 *
 * Usage:
 *   LogManager::Configure(&my_rolling_file_appender, plog::info);
 *   CHECKEND_LOG_INFO << "Configured with endpoint: " << endpoint;
 */
class LogManager
{
public:
    /// Forward to `appender` up to `level`. A null appender disables output.
    static void Configure(plog::IAppender* appender, plog::Severity level);

    /// Forward to the built-in stderr console appender.
    static void UseConsole(plog::Severity level);

    /// Discard everything (null logger).
    static void Disable();

    static plog::IAppender* CurrentTarget();
    static plog::Severity CurrentLevel();

private:
    LogManager() = default;

    static void EnsureInitialized();
};

} // namespace checkend::log

#define CHECKEND_LOG_DEBUG PLOG_DEBUG_(::checkend::log::kLogInstance)
#define CHECKEND_LOG_INFO PLOG_INFO_(::checkend::log::kLogInstance)
#define CHECKEND_LOG_WARN PLOG_WARNING_(::checkend::log::kLogInstance)
#define CHECKEND_LOG_ERROR PLOG_ERROR_(::checkend::log::kLogInstance)
