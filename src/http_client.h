#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <atomic>
#include <functional>

namespace cverify {

struct HttpResponse {
    long status_code = 0;  // 0 when the request never completed
    std::string body;
    std::string error;     // Transport error from libcurl

    bool transport_ok() const { return error.empty() && status_code != 0; }
};

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::vector<std::string> headers;  // "Name: value"
    std::string body;

    // Called once the final response headers have arrived, before the body
    std::function<void(long status_code)> on_headers;
    // Polled while the transfer runs; setting it aborts the request
    const std::atomic<bool>* cancel = nullptr;
};

// Blocking libcurl client. One easy handle per request; safe to share
// across threads once constructed.
class HttpClient {
public:
    // unix_socket non-empty routes every request over that socket
    explicit HttpClient(std::string unix_socket = "",
                        std::chrono::seconds timeout = std::chrono::seconds(60));
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse perform(const HttpRequest& request) const;

    HttpResponse get(const std::string& url, const std::vector<std::string>& headers = {}) const;
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::vector<std::string>& headers = {}) const;
    HttpResponse del(const std::string& url, const std::vector<std::string>& headers = {}) const;

private:
    std::string unix_socket_;
    std::chrono::seconds timeout_;
};

// Percent-encode a query or path component
std::string url_escape(const std::string& value);

} // namespace cverify
