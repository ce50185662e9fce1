#pragma once

#include "HttpCommon.hpp"
#include "Response.hpp"
#include "config/Configuration.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

namespace checkend
{
struct Notice;
}

namespace checkend::transport
{

/**
 * @brief Sends one notice to `<endpoint>/ingest/v1/errors` and interprets the reply.
 *
 * Stateless apart from the settings captured at construction; safe to call from several
 * threads as long as the underlying IHttpTransport is.
 */
class Client
{
public:
    static constexpr const char* kIngestPath = "/ingest/v1/errors";
    static constexpr const char* kApiKeyHeader = "Checkend-Ingestion-Key";

    Client(const Configuration& cfg, std::shared_ptr<IHttpTransport> http);

    /// Never throws. Transport failures come back as status 0 with the reason in `body`.
    Response send(const Notice& notice, const std::atomic<bool>* abort_flag = nullptr) const;

    const std::string& ingestUrl() const { return url_; }
    std::vector<Header> buildHeaders() const;

    static std::string serialize(const Notice& notice);
    static std::string userAgent();

private:
    std::shared_ptr<IHttpTransport> http_;
    std::string url_;
    std::string api_key_;
    int connect_timeout_ms_;
    int read_timeout_ms_;
    std::string proxy_host_;
    int proxy_port_;
    std::string proxy_username_;
    std::string proxy_password_;
};

} // namespace checkend::transport
