#include "Client.hpp"

#include "CheckendVersion.hpp"
#include "log/LogManager.hpp"
#include "notice/Notice.hpp"
#include "utils/Base64.hpp"

#include <exception>

namespace checkend::transport
{

namespace
{

std::string trimTrailingSlashes(std::string s)
{
    while (!s.empty() && s.back() == '/')
        s.pop_back();
    return s;
}

} // namespace

Client::Client(const Configuration& cfg, std::shared_ptr<IHttpTransport> http)
    : http_(std::move(http))
    , url_(trimTrailingSlashes(cfg.endpoint) + kIngestPath)
    , api_key_(cfg.api_key)
    , connect_timeout_ms_(cfg.connect_timeout_ms)
    , read_timeout_ms_(cfg.read_timeout_ms)
    , proxy_host_(cfg.proxy_host)
    , proxy_port_(cfg.proxy_port)
    , proxy_username_(cfg.proxy_username)
    , proxy_password_(cfg.proxy_password)
{
    if (!http_)
        http_ = std::make_shared<CprHttpTransport>();
}

std::string Client::userAgent() { return std::string(kSdkName) + "/" + kSdkVersion; }

std::vector<Header> Client::buildHeaders() const
{
    std::vector<Header> headers;
    headers.push_back({ "Content-Type", "application/json" });
    headers.push_back({ kApiKeyHeader, api_key_ });
    headers.push_back({ "User-Agent", userAgent() });
    if (!proxy_host_.empty() && !proxy_username_.empty())
    {
        headers.push_back(
            { "Proxy-Authorization", "Basic " + utils::base64Encode(proxy_username_ + ":" + proxy_password_) });
    }
    return headers;
}

std::string Client::serialize(const Notice& notice)
{
    // Invalid UTF-8 in user data is replaced rather than failing the whole notice.
    return notice.toJson().dump(-1, ' ', false, Json::error_handler_t::replace);
}

Response Client::send(const Notice& notice, const std::atomic<bool>* abort_flag) const
{
    Response out;
    try
    {
        HttpRequest req;
        req.url = url_;
        req.body = serialize(notice);
        req.headers = buildHeaders();
        req.connect_timeout_ms = connect_timeout_ms_;
        req.read_timeout_ms = read_timeout_ms_;
        req.abort_flag = abort_flag;
        if (!proxy_host_.empty())
            req.proxy = ProxySettings{ proxy_host_, proxy_port_, proxy_username_, proxy_password_ };

        CHECKEND_LOG_DEBUG << "Sending " << notice.error_class << " to " << url_;

        HttpResponse hr = http_->post(req);
        if (!hr.error.empty())
        {
            out.status_code = 0;
            out.body = hr.error;
            CHECKEND_LOG_ERROR << "Failed to send notice: " << hr.error;
            return out;
        }

        out.status_code = hr.status_code;
        out.body = std::move(hr.text);
        out.retry_after = hr.header("Retry-After");
        CHECKEND_LOG_DEBUG << "Collector replied: " << describe(out);
    }
    catch (const std::exception& ex)
    {
        out = Response{};
        out.body = ex.what();
        CHECKEND_LOG_ERROR << "Failed to send notice: " << ex.what();
    }
    return out;
}

} // namespace checkend::transport
