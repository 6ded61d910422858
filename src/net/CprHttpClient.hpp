#pragma once

#include "HttpClient.hpp"

namespace net
{

// libcurl-backed transport. Stateless: every call builds its own cpr::Session,
// so one instance can be shared by all worker threads.
class CprHttpClient : public HttpClient
{
public:
    CprHttpClient() = default;
    ~CprHttpClient() override = default;

    HttpResponse get(const std::string& url, const SessionConfig& cfg) override;
    HttpResponse download(const std::string& url, const std::string& destPath, const SessionConfig& cfg) override;
    HttpResponse post(const std::string& url, const std::string& body, const std::string& contentType,
                      const SessionConfig& cfg) override;
};

} // namespace net
