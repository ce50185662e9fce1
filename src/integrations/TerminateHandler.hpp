#pragma once

namespace checkend
{
class Checkend;
}

namespace checkend::integrations
{

/**
 * Reports uncaught exceptions through a Checkend instance.
 *
 * Chains std::set_terminate(): the active exception is sent synchronously (tagged "unhandled"),
 * the worker is flushed for its shutdown grace period, then the previous handler runs.
 */
class TerminateHandler
{
public:
    static constexpr const char* kUnhandledTag = "unhandled";

    /// Replaces any earlier installation. `reporter` must outlive the installation.
    static void install(Checkend& reporter);

    /// Restores the handler that was active before install(). No-op when not installed.
    static void uninstall();

    static bool isInstalled();

    /// What the installed handler does before chaining; exposed for tests.
    static void reportCurrentException(Checkend& reporter);
};

} // namespace checkend::integrations
