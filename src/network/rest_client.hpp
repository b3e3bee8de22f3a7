#pragma once

#include <string>
#include <unordered_map>

namespace neo {

struct HttpResponse {
    long status_code = 0;
    std::string body;

    bool IsSuccess() const { return status_code >= 200 && status_code < 300; }
};

struct HttpRequest {
    std::string url;
    std::string method = "GET";
    std::unordered_map<std::string, std::string> headers;
    std::string body;
    long timeout_ms = 5000;
};

// Blocking libcurl client. Each request uses its own easy handle, so one instance can be
// shared across threads.
class RestClient {
public:
    RestClient();

    // Any HTTP status is returned as a response. Transport failures throw
    // TimeoutException or ConnectionException.
    HttpResponse Request(const HttpRequest& request);

    static std::string UrlEncode(const std::string& value);

    // curl_global_init is not thread-safe; called once from the constructor
    static void GlobalInit();

private:
    static size_t WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp);
};

} // namespace neo
