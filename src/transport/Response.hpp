#pragma once

#include <optional>
#include <string>

namespace checkend::transport
{

enum class Outcome
{
    Success,
    RateLimited,
    ClientError,
    ServerError,
    TransportError,
    Other
};

/// Result of one delivery attempt. status_code 0 means the request never got a response.
struct Response
{
    int status_code = 0;
    std::string body;
    std::optional<std::string> retry_after;

    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
    bool isRateLimited() const { return status_code == 429; }
    bool isClientError() const { return status_code >= 400 && status_code < 500 && status_code != 429; }
    bool isServerError() const { return status_code >= 500; }

    /// Retry-After as whole seconds converted to milliseconds. HTTP-date values, empty or
    /// malformed headers fall back to `default_ms`.
    long long retryDelayFor(long long default_ms) const;

    Outcome outcome() const;
};

const char* outcomeToString(Outcome outcome);

/// One-line summary for log output, body shortened.
std::string describe(const Response& response);

} // namespace checkend::transport
