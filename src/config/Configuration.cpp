#include "Configuration.hpp"

namespace checkend
{

plog::Severity Configuration::effectiveLogLevel() const
{
    if (log_level)
        return *log_level;
    return debug ? plog::debug : plog::info;
}

std::string Configuration::validate() const
{
    if (api_key.empty())
        return "API key is required";
    if (endpoint.empty())
        return "Missing endpoint";
    if (max_queue_size == 0)
        return "max_queue_size must be greater than zero";
    if (connect_timeout_ms < 0 || read_timeout_ms < 0 || shutdown_timeout_ms < 0)
        return "Timeouts must not be negative";
    if (hasProxy() && (proxy_port <= 0 || proxy_port > 65535))
        return "Invalid proxy port: " + std::to_string(proxy_port);
    return {};
}

filters::FilterKeys Configuration::defaultFilterKeys()
{
    return { "password",    "password_confirmation", "secret",     "secret_key", "api_key",     "apikey",
             "access_token", "auth_token",            "authorization", "token",   "credit_card", "card_number",
             "cvv",          "cvc",                   "ssn",        "social_security" };
}

} // namespace checkend
