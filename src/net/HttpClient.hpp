#pragma once

#include <map>
#include <string>
#include <vector>

namespace net
{

struct Header
{
    std::string name;
    std::string value;
};

struct SessionConfig
{
    int connect_timeout_ms = 5000;
    int timeout_ms = 0; // 0 keeps the transport default

    // Adds Cache-Control/Pragma no-cache so intermediaries never serve a stale body
    bool bypass_cache = false;

    std::vector<Header> headers;
};

struct HttpResponse
{
    int status_code = 0;
    std::string text;
    std::string error; // non-empty on network/transport errors
    std::map<std::string, std::string> headers;

    bool ok() const { return error.empty() && status_code >= 200 && status_code < 300; }

    // Case-insensitive header lookup, empty when absent
    std::string header(const std::string& name) const;

    // Human-readable failure description for logs and status lines
    std::string describeFailure() const;
};

// Transport seam shared by the status watcher and the sync engine.
// Implementations are called from worker threads and must be reentrant.
class HttpClient
{
public:
    virtual ~HttpClient() = default;

    virtual HttpResponse get(const std::string& url, const SessionConfig& cfg) = 0;

    // Streams the body into destPath; response text stays empty
    virtual HttpResponse download(const std::string& url, const std::string& destPath, const SessionConfig& cfg) = 0;

    virtual HttpResponse post(const std::string& url, const std::string& body, const std::string& contentType,
                              const SessionConfig& cfg) = 0;
};

} // namespace net
