#pragma once

#include "Configuration.hpp"

#include <string>

namespace checkend
{

/**
 * @brief Builds a Configuration from CHECKEND_* environment variables and TOML files.
 *
 * TOML layout (all keys optional):
 *
 *   [checkend]
 *   api_key = "..."
 *   endpoint = "https://app.checkend.com"
 *   environment = "production"
 *   enabled = true
 *   filter_keys = ["session_id"]      # added to the defaults
 *   ignore = ["NotFoundError"]
 *   ignore_patterns = ["^Timeout.*"]
 *
 *   [checkend.proxy]
 *   host = "proxy.local"
 *   port = 3128
 */
class ConfigLoader
{
public:
    /// Defaults overlaid with the environment, including the production/staging auto-enable rule.
    static Configuration fromEnvironment();

    static void applyEnvironment(Configuration& cfg);

    /// Overlays the [checkend] table of `path` onto `cfg`. A missing file leaves `cfg` untouched
    /// and succeeds; a malformed file fails without modifying `cfg`.
    bool loadFile(const std::string& path, Configuration& cfg);

    /// Accepts `[http[s]://][user[:pass]@]host[:port]`. Returns false and leaves `cfg` untouched
    /// on malformed input.
    static bool parseProxy(const std::string& proxy, Configuration& cfg);

    /// First non-empty of ENVIRONMENT, ENV, RAILS_ENV, NODE_ENV, APP_ENV, else "development".
    static std::string detectEnvironment();

    const char* lastError() const { return last_error_.c_str(); }

private:
    std::string last_error_;
};

} // namespace checkend
