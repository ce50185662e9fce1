#pragma once

#include <atomic>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace checkend::transport
{

struct Header
{
    std::string name;
    std::string value;
};

struct ProxySettings
{
    std::string host;
    int port = 0;
    // Sent to the proxy itself (including the CONNECT of an https tunnel), never to the origin.
    std::string username;
    std::string password;

    bool hasCredentials() const { return !username.empty(); }
};

struct HttpRequest
{
    std::string url;
    std::string body;
    std::vector<Header> headers;
    int connect_timeout_ms = 5000;
    int read_timeout_ms = 15000;
    std::optional<ProxySettings> proxy;
    // When set and true, an in-flight transfer is abandoned.
    const std::atomic<bool>* abort_flag = nullptr;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors
    std::vector<Header> headers;

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    /// Case-insensitive response header lookup.
    std::optional<std::string> header(std::string_view name) const;
};

bool headerNameEquals(std::string_view a, std::string_view b);

/// Headers meant for the origin server. Proxy-Authorization is left out when the request goes
/// through a proxy; the transport hands those credentials to the proxy instead.
std::vector<Header> originHeaders(const HttpRequest& request);

/// The plain HTTP capability the Transport Client is built on.
class IHttpTransport
{
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse post(const HttpRequest& request) = 0;
};

/// Production transport on libcurl via cpr.
class CprHttpTransport : public IHttpTransport
{
public:
    HttpResponse post(const HttpRequest& request) override;
};

} // namespace checkend::transport
