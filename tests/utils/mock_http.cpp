#include "mock_http.hpp"

#include <fstream>
#include <regex>
#include <thread>

namespace test_utils {

void MockHttpClient::setResponse(const std::string& url, const MockResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    url_responses_[url] = response;
}

void MockHttpClient::setPatternResponse(const std::string& pattern, const MockResponse& response) {
    std::lock_guard<std::mutex> lock(mutex_);
    pattern_responses_[pattern] = response;
}

void MockHttpClient::simulateNetworkError(const std::string& error_msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    simulate_error_ = true;
    error_message_ = error_msg;
}

void MockHttpClient::clearResponses() {
    std::lock_guard<std::mutex> lock(mutex_);
    url_responses_.clear();
    pattern_responses_.clear();
    simulate_error_ = false;
    error_message_.clear();
}

MockResponse MockHttpClient::getResponse(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (simulate_error_) {
        MockResponse error_resp;
        error_resp.has_error = true;
        error_resp.error_message = error_message_;
        return error_resp;
    }
    
    // Check exact URL match first
    auto url_it = url_responses_.find(url);
    if (url_it != url_responses_.end()) {
        return url_it->second;
    }
    
    // Check pattern matches
    for (const auto& [pattern, response] : pattern_responses_) {
        try {
            std::regex pattern_regex(pattern);
            if (std::regex_search(url, pattern_regex)) {
                return response;
            }
        } catch (const std::regex_error&) {
            // Invalid regex pattern, skip
            continue;
        }
    }
    
    // Default 404 response
    MockResponse not_found;
    not_found.status_code = 404;
    not_found.body = "Not Found";
    return not_found;
}

std::vector<RecordedRequest> MockHttpClient::requests() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_;
}

std::vector<RecordedRequest> MockHttpClient::requestsTo(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<RecordedRequest> matching;
    for (const auto& request : requests_) {
        if (request.url == url) {
            matching.push_back(request);
        }
    }
    return matching;
}

size_t MockHttpClient::requestCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return requests_.size();
}

bool MockHttpClient::waitForRequests(size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return requests_cv_.wait_for(lock, timeout, [&] { return requests_.size() >= count; });
}

net::HttpResponse MockHttpClient::get(const std::string& url, const net::SessionConfig& cfg) {
    MockResponse mock = getResponse(url);
    record({"GET", url, "", "", cfg});
    applyDelay(mock);
    return toHttpResponse(mock);
}

net::HttpResponse MockHttpClient::download(const std::string& url, const std::string& destPath,
                                           const net::SessionConfig& cfg) {
    MockResponse mock = getResponse(url);
    record({"DOWNLOAD", url, "", "", cfg});
    applyDelay(mock);

    net::HttpResponse response = toHttpResponse(mock);
    response.text.clear();
    if (!mock.has_error) {
        // Like a streamed transfer, the body lands on disk whatever the status
        std::ofstream out(destPath, std::ios::binary | std::ios::trunc);
        out << mock.body;
    }
    return response;
}

net::HttpResponse MockHttpClient::post(const std::string& url, const std::string& body,
                                       const std::string& contentType, const net::SessionConfig& cfg) {
    MockResponse mock = getResponse(url);
    record({"POST", url, body, contentType, cfg});
    applyDelay(mock);
    return toHttpResponse(mock);
}

net::HttpResponse MockHttpClient::toHttpResponse(const MockResponse& mock) {
    net::HttpResponse response;
    if (mock.has_error) {
        response.error = mock.error_message;
        return response;
    }
    response.status_code = mock.status_code;
    response.text = mock.body;
    response.headers = mock.headers;
    return response;
}

void MockHttpClient::applyDelay(const MockResponse& mock) {
    if (mock.delay_ms > 0) {
        std::this_thread::sleep_for(std::chrono::milliseconds(mock.delay_ms));
    }
}

void MockHttpClient::record(RecordedRequest request) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.push_back(std::move(request));
    }
    requests_cv_.notify_all();
}

MockResponse MockResponses::status_received(const std::string& file_name) {
    MockResponse response;
    response.body = R"({"last_sent_file": null, "last_received_file": ")" + file_name +
                    R"(", "server_cwd": "/srv/share"})";
    return response;
}

MockResponse MockResponses::status_sent(const std::string& file_name) {
    MockResponse response;
    response.body = R"({
        "last_sent_file": {
            "name": ")" + file_name + R"(",
            "peer_id": "phone-1",
            "size": 2048,
            "timestamp": 1700000000,
            "succeeded": true,
            "sending": false
        },
        "last_received_file": null
    })";
    return response;
}

MockResponse MockResponses::status_sending(const std::string& file_name) {
    MockResponse response;
    response.body = R"({
        "last_sent_file": {"name": ")" + file_name + R"(", "succeeded": false, "sending": true},
        "last_received_file": null
    })";
    return response;
}

MockResponse MockResponses::status_empty() {
    MockResponse response;
    response.body = R"({"last_sent_file": null, "last_received_file": null})";
    return response;
}

MockResponse MockResponses::manifest(const std::string& json) {
    MockResponse response;
    response.body = json;
    return response;
}

MockResponse MockResponses::file(const std::string& content, const std::string& disposition_name) {
    MockResponse response;
    response.body = content;
    if (!disposition_name.empty()) {
        response.headers["Content-Disposition"] = "attachment; filename=\"" + disposition_name + "\"";
    }
    return response;
}

MockResponse MockResponses::http_error(int status_code) {
    MockResponse response;
    response.status_code = status_code;
    response.body = "error";
    return response;
}

// Generic error responses
MockResponse MockResponses::network_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Network connection failed";
    return response;
}

MockResponse MockResponses::timeout_error() {
    MockResponse response;
    response.has_error = true;
    response.error_message = "Request timeout";
    return response;
}

}  // namespace test_utils
