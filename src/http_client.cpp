#include "http_client.h"
#include <curl/curl.h>
#include <mutex>
#include <cctype>

namespace cverify {

namespace {

std::once_flag curl_init_flag;

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

struct TransferHooks {
    CURL* curl;
    const HttpRequest* request;
};

size_t read_header(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* hooks = static_cast<TransferHooks*>(userdata);
    size_t length = size * nmemb;
    bool end_of_headers = (length == 2 && ptr[0] == '\r' && ptr[1] == '\n') ||
                          (length == 1 && ptr[0] == '\n');
    if (end_of_headers && hooks->request->on_headers) {
        long status = 0;
        curl_easy_getinfo(hooks->curl, CURLINFO_RESPONSE_CODE, &status);
        // Interim 1xx blocks are followed by the real response
        if (status >= 200) {
            hooks->request->on_headers(status);
        }
    }
    return length;
}

int check_cancel(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* hooks = static_cast<TransferHooks*>(userdata);
    return hooks->request->cancel->load() ? 1 : 0;
}

} // namespace

HttpClient::HttpClient(std::string unix_socket, std::chrono::seconds timeout)
    : unix_socket_(std::move(unix_socket)), timeout_(timeout) {
    std::call_once(curl_init_flag, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::perform(const HttpRequest& request) const {
    HttpResponse response;

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    for (const auto& header : request.headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_.count()));
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (header_list) {
        curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    }
    if (!unix_socket_.empty()) {
        curl_easy_setopt(curl, CURLOPT_UNIX_SOCKET_PATH, unix_socket_.c_str());
    }

    TransferHooks hooks{curl, &request};
    if (request.on_headers) {
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, read_header);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &hooks);
    }
    if (request.cancel) {
        curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, check_cancel);
        curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &hooks);
        curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    }

    if (request.method == "POST") {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, request.method.c_str());
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        response.error = curl_easy_strerror(rc);
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}

HttpResponse HttpClient::get(const std::string& url, const std::vector<std::string>& headers) const {
    return perform({"GET", url, headers, "", nullptr, nullptr});
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body,
                              const std::vector<std::string>& headers) const {
    return perform({"POST", url, headers, body, nullptr, nullptr});
}

HttpResponse HttpClient::del(const std::string& url, const std::vector<std::string>& headers) const {
    return perform({"DELETE", url, headers, "", nullptr, nullptr});
}

std::string url_escape(const std::string& value) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

} // namespace cverify
