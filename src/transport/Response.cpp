#include "Response.hpp"

#include <charconv>
#include <limits>

namespace checkend::transport
{

long long Response::retryDelayFor(long long default_ms) const
{
    if (!retry_after || retry_after->empty())
        return default_ms;

    const std::string& text = *retry_after;
    long long seconds = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), seconds);
    if (ec != std::errc() || ptr != text.data() + text.size() || seconds < 0)
        return default_ms;
    if (seconds > std::numeric_limits<long long>::max() / 1000)
        return default_ms;
    return seconds * 1000;
}

Outcome Response::outcome() const
{
    if (status_code == 0)
        return Outcome::TransportError;
    if (isSuccess())
        return Outcome::Success;
    if (isRateLimited())
        return Outcome::RateLimited;
    if (isClientError())
        return Outcome::ClientError;
    if (isServerError())
        return Outcome::ServerError;
    return Outcome::Other;
}

const char* outcomeToString(Outcome outcome)
{
    switch (outcome)
    {
    case Outcome::Success:
        return "Success";
    case Outcome::RateLimited:
        return "Rate limited";
    case Outcome::ClientError:
        return "Client error";
    case Outcome::ServerError:
        return "Server error";
    case Outcome::TransportError:
        return "Transport error";
    default:
        return "Unexpected response";
    }
}

std::string describe(const Response& response)
{
    static constexpr std::size_t kMaxSnippet = 200;
    std::string snippet = response.body.size() > kMaxSnippet ? response.body.substr(0, kMaxSnippet) + "..."
                                                              : response.body;
    std::string out = outcomeToString(response.outcome());
    if (response.status_code != 0)
        out += " (HTTP " + std::to_string(response.status_code) + ")";
    if (!snippet.empty())
        out += ": " + snippet;
    return out;
}

} // namespace checkend::transport
