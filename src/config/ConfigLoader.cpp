#include "ConfigLoader.hpp"

#include "log/LogManager.hpp"
#include "utils/TextUtils.hpp"

#include <toml++/toml.h>

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <fstream>
#include <limits>

namespace checkend
{

namespace
{

std::string getEnv(const char* name)
{
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

bool iequals(const std::string& a, const char* b)
{
    std::size_t i = 0;
    for (; i < a.size() && b[i]; ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return i == a.size() && b[i] == '\0';
}

bool parsePort(const std::string& text, int& out)
{
    if (text.empty())
        return false;
    int port = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), port);
    if (ec != std::errc() || ptr != text.data() + text.size() || port <= 0 || port > 65535)
        return false;
    out = port;
    return true;
}

template <typename T>
void readValue(const toml::table& table, const char* key, T& out)
{
    if (auto value = table[key].value<T>())
        out = *value;
}

bool readInt(const toml::table& table, const char* key, int& out, std::string& error)
{
    auto value = table[key].value<int64_t>();
    if (!value)
        return true;
    if (*value < std::numeric_limits<int>::min() || *value > std::numeric_limits<int>::max())
    {
        error = std::string(key) + " is out of range: " + std::to_string(*value);
        return false;
    }
    out = static_cast<int>(*value);
    return true;
}

std::vector<std::string> readStringArray(const toml::table& table, const char* key)
{
    std::vector<std::string> out;
    if (auto* arr = table[key].as_array())
    {
        for (const auto& item : *arr)
        {
            if (auto s = item.value<std::string>())
                out.push_back(*s);
        }
    }
    return out;
}

} // namespace

Configuration ConfigLoader::fromEnvironment()
{
    Configuration cfg;
    applyEnvironment(cfg);
    return cfg;
}

void ConfigLoader::applyEnvironment(Configuration& cfg)
{
    if (auto api_key = getEnv("CHECKEND_API_KEY"); !api_key.empty())
        cfg.api_key = api_key;

    if (auto endpoint = getEnv("CHECKEND_ENDPOINT"); !endpoint.empty())
        cfg.endpoint = endpoint;

    if (auto environment = getEnv("CHECKEND_ENVIRONMENT"); !environment.empty())
        cfg.environment = environment;
    else
        cfg.environment = detectEnvironment();

    const auto debug = getEnv("CHECKEND_DEBUG");
    if (iequals(debug, "true") || debug == "1")
        cfg.debug = true;

    if (auto proxy = getEnv("CHECKEND_PROXY"); !proxy.empty())
    {
        if (!parseProxy(proxy, cfg))
            CHECKEND_LOG_WARN << "Ignoring malformed CHECKEND_PROXY value";
    }

    if (auto app_name = getEnv("CHECKEND_APP_NAME"); !app_name.empty())
        cfg.app_name = app_name;

    if (auto revision = getEnv("CHECKEND_REVISION"); !revision.empty())
        cfg.revision = revision;

    cfg.enabled = iequals(cfg.environment, "production") || iequals(cfg.environment, "staging");
}

std::string ConfigLoader::detectEnvironment()
{
    for (const char* var : { "ENVIRONMENT", "ENV", "RAILS_ENV", "NODE_ENV", "APP_ENV" })
    {
        if (auto value = getEnv(var); !value.empty())
            return value;
    }
    return "development";
}

bool ConfigLoader::parseProxy(const std::string& proxy, Configuration& cfg)
{
    std::string s = proxy;
    if (utils::startsWith(s, "http://"))
        s = s.substr(7);
    else if (utils::startsWith(s, "https://"))
        s = s.substr(8);

    while (!s.empty() && s.back() == '/')
        s.pop_back();

    std::string username;
    std::string password;
    const auto at = s.rfind('@');
    if (at != std::string::npos && at > 0)
    {
        const std::string auth = s.substr(0, at);
        s = s.substr(at + 1);
        const auto colon = auth.find(':');
        if (colon != std::string::npos && colon > 0)
        {
            username = auth.substr(0, colon);
            password = auth.substr(colon + 1);
        }
        else
        {
            username = auth;
        }
    }

    std::string host = s;
    int port = Configuration::kDefaultProxyPort;
    const auto colon = s.rfind(':');
    if (colon != std::string::npos && colon > 0)
    {
        host = s.substr(0, colon);
        if (!parsePort(s.substr(colon + 1), port))
            return false;
    }

    if (host.empty())
        return false;

    cfg.proxy_host = host;
    cfg.proxy_port = port;
    cfg.proxy_username = username;
    cfg.proxy_password = password;
    return true;
}

bool ConfigLoader::loadFile(const std::string& path, Configuration& cfg)
{
    last_error_.clear();
    std::ifstream ifs(path, std::ios::binary);
    if (!ifs)
        return true;

    toml::table root;
    try
    {
        root = toml::parse(ifs, path);
    }
    catch (const toml::parse_error& pe)
    {
        if (pe.source().begin.line > 0)
        {
            last_error_ = "Error at line " + std::to_string(pe.source().begin.line) + ": " +
                          std::string(pe.description());
        }
        else
        {
            last_error_ = "config parse error: " + std::string(pe.description());
        }
        CHECKEND_LOG_WARN << last_error_ << " (file: " << path << ")";
        return false;
    }

    const toml::table* section = root["checkend"].as_table();
    if (!section)
        return true;

    Configuration next = cfg;
    readValue(*section, "api_key", next.api_key);
    readValue(*section, "endpoint", next.endpoint);
    readValue(*section, "environment", next.environment);
    readValue(*section, "enabled", next.enabled);
    readValue(*section, "async_send", next.async_send);
    readValue(*section, "debug", next.debug);
    if (!readInt(*section, "connect_timeout_ms", next.connect_timeout_ms, last_error_) ||
        !readInt(*section, "read_timeout_ms", next.read_timeout_ms, last_error_) ||
        !readInt(*section, "shutdown_timeout_ms", next.shutdown_timeout_ms, last_error_))
        return false;
    readValue(*section, "app_name", next.app_name);
    readValue(*section, "revision", next.revision);
    readValue(*section, "send_request_data", next.send_request_data);
    readValue(*section, "send_user_data", next.send_user_data);
    readValue(*section, "send_context_data", next.send_context_data);

    if (auto queue = (*section)["max_queue_size"].value<int64_t>())
    {
        if (*queue <= 0)
        {
            last_error_ = "max_queue_size must be greater than zero";
            return false;
        }
        next.max_queue_size = static_cast<std::size_t>(*queue);
    }

    if (const toml::table* proxy = (*section)["proxy"].as_table())
    {
        readValue(*proxy, "host", next.proxy_host);
        if (!readInt(*proxy, "port", next.proxy_port, last_error_))
            return false;
        readValue(*proxy, "username", next.proxy_username);
        readValue(*proxy, "password", next.proxy_password);
        if (!next.proxy_host.empty() && next.proxy_port == 0)
            next.proxy_port = Configuration::kDefaultProxyPort;
    }

    for (auto& key : readStringArray(*section, "filter_keys"))
        next.addFilterKey(std::move(key));

    for (auto& name : readStringArray(*section, "ignore"))
        next.addIgnoredException(filters::ignoreName(std::move(name)));

    for (const auto& pattern : readStringArray(*section, "ignore_patterns"))
    {
        auto rule = filters::ignorePattern(pattern);
        if (!rule)
        {
            last_error_ = "Invalid ignore pattern: " + pattern;
            return false;
        }
        next.addIgnoredException(std::move(*rule));
    }

    cfg = std::move(next);
    CHECKEND_LOG_DEBUG << "Loaded configuration from " << path;
    return true;
}

} // namespace checkend
