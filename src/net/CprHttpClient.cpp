#include "CprHttpClient.hpp"

#include <cpr/cpr.h>
#include <plog/Log.h>

#include <fstream>

namespace
{

void apply_common(cpr::Session& s, const net::SessionConfig& cfg)
{
    s.SetConnectTimeout(cpr::ConnectTimeout{ cfg.connect_timeout_ms });
    if (cfg.timeout_ms > 0)
    {
        s.SetTimeout(cpr::Timeout{ cfg.timeout_ms });
    }
}

cpr::Header make_header(const net::SessionConfig& cfg, const std::string& contentType)
{
    cpr::Header h;
    for (const auto& kv : cfg.headers)
    {
        h.emplace(kv.name, kv.value);
    }
    if (cfg.bypass_cache)
    {
        h.emplace("Cache-Control", "no-cache");
        h.emplace("Pragma", "no-cache");
    }
    if (!contentType.empty())
    {
        h.insert_or_assign("Content-Type", contentType);
    }
    return h;
}

net::HttpResponse to_response(cpr::Response& r, bool keepText)
{
    net::HttpResponse hr;
    if (r.error)
    {
        hr.error = r.error.message.empty() ? "Network error" : r.error.message;
        return hr;
    }
    hr.status_code = static_cast<int>(r.status_code);
    if (keepText)
    {
        hr.text = std::move(r.text);
    }
    for (const auto& [name, value] : r.header)
    {
        hr.headers[name] = value;
    }
    return hr;
}

} // namespace

namespace net
{

HttpResponse CprHttpClient::get(const std::string& url, const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(cfg, ""));
    apply_common(s, cfg);
    auto r = s.Get();
    return to_response(r, true);
}

HttpResponse CprHttpClient::download(const std::string& url, const std::string& destPath, const SessionConfig& cfg)
{
    std::ofstream outputFile(destPath, std::ios::binary | std::ios::trunc);
    if (!outputFile.is_open())
    {
        PLOG_ERROR << "Failed to create output file: " << destPath;
        HttpResponse hr;
        hr.error = "Failed to create output file: " + destPath;
        return hr;
    }

    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(cfg, ""));
    apply_common(s, cfg);
    auto r = s.Download(outputFile);
    outputFile.close();

    HttpResponse hr = to_response(r, false);
    if (hr.error.empty() && !outputFile)
    {
        hr.error = "Failed to write " + destPath;
    }
    return hr;
}

HttpResponse CprHttpClient::post(const std::string& url, const std::string& body, const std::string& contentType,
                                 const SessionConfig& cfg)
{
    cpr::Session s;
    s.SetUrl(cpr::Url{ url });
    s.SetHeader(make_header(cfg, contentType));
    s.SetBody(cpr::Body{ body });
    apply_common(s, cfg);
    auto r = s.Post();
    return to_response(r, true);
}

} // namespace net
