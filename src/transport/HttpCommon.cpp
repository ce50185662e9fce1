#include "HttpCommon.hpp"

#include <cpr/cpr.h>

#include <cctype>
#include <cstdint>
#include <exception>

namespace
{

inline void apply_common(cpr::Session& s, const checkend::transport::HttpRequest& req)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ req.connect_timeout_ms });
    // cpr's timeout covers the whole transfer, so allow the connect phase on top of the read budget.
    s.SetTimeout(cpr::Timeout{ req.connect_timeout_ms + req.read_timeout_ms });
    if (req.proxy)
    {
        const std::string address = req.proxy->host + ":" + std::to_string(req.proxy->port);
        s.SetProxies(cpr::Proxies{ { "http", address }, { "https", address } });
        if (req.proxy->hasCredentials())
        {
            s.SetProxyAuth(cpr::ProxyAuthentication{
                { "http", cpr::EncodedAuthentication{ req.proxy->username, req.proxy->password } },
                { "https", cpr::EncodedAuthentication{ req.proxy->username, req.proxy->password } } });
        }
    }
    if (req.abort_flag)
    {
        s.SetProgressCallback(cpr::ProgressCallback(
            [](cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, cpr::cpr_pf_arg_t, intptr_t userdata) -> bool {
                auto flag = reinterpret_cast<const std::atomic<bool>*>(userdata);
                return !(flag && flag->load());
            },
            reinterpret_cast<intptr_t>(req.abort_flag)));
    }
}

inline cpr::Header make_header(const std::vector<checkend::transport::Header>& headers)
{
    cpr::Header h;
    bool has_ct = false;
    for (auto& kv : headers)
    {
        if (!has_ct && checkend::transport::headerNameEquals(kv.name, "Content-Type"))
            has_ct = true;
        h.insert_or_assign(kv.name, kv.value);
    }
    if (!has_ct)
        h.emplace("Content-Type", "application/json");
    return h;
}

} // namespace

namespace checkend::transport
{

bool headerNameEquals(std::string_view a, std::string_view b)
{
    if (a.size() != b.size())
        return false;
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
            return false;
    }
    return true;
}

std::vector<Header> originHeaders(const HttpRequest& request)
{
    std::vector<Header> out;
    out.reserve(request.headers.size());
    for (const auto& h : request.headers)
    {
        if (request.proxy && headerNameEquals(h.name, "Proxy-Authorization"))
            continue;
        out.push_back(h);
    }
    return out;
}

std::optional<std::string> HttpResponse::header(std::string_view name) const
{
    for (const auto& h : headers)
    {
        if (headerNameEquals(h.name, name))
            return h.value;
    }
    return std::nullopt;
}

HttpResponse CprHttpTransport::post(const HttpRequest& request)
{
    HttpResponse hr;
    try
    {
        cpr::Session s;
        s.SetUrl(cpr::Url{ request.url });
        s.SetHeader(make_header(originHeaders(request)));
        s.SetBody(cpr::Body{ request.body });
        apply_common(s, request);
        auto r = s.Post();
        if (r.error)
        {
            hr.error = r.error.message.empty() ? std::string("transport error") : r.error.message;
            return hr;
        }
        hr.status_code = static_cast<int>(r.status_code);
        hr.text = std::move(r.text);
        for (const auto& [name, value] : r.header)
            hr.headers.push_back({ name, value });
    }
    catch (const std::exception& ex)
    {
        hr.status_code = 0;
        hr.error = ex.what();
    }
    return hr;
}

} // namespace checkend::transport
