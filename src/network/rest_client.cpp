#include "rest_client.hpp"
#include "network_exception.hpp"
#include "../utils/logger.hpp"
#include <algorithm>
#include <memory>
#include <mutex>
#include <curl/curl.h>

namespace neo {

namespace {

std::once_flag curl_init_flag;

constexpr const char* kUserAgent = "neo-oracle/1.0";
constexpr long kConnectTimeoutMs = 3000;

struct CurlHandleDeleter {
    void operator()(CURL* handle) const { curl_easy_cleanup(handle); }
};

struct CurlSlistDeleter {
    void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

using CurlHandle = std::unique_ptr<CURL, CurlHandleDeleter>;
using CurlHeaderList = std::unique_ptr<curl_slist, CurlSlistDeleter>;

} // namespace

void RestClient::GlobalInit() {
    std::call_once(curl_init_flag, [] {
        CURLcode code = curl_global_init(CURL_GLOBAL_DEFAULT);
        if (code != CURLE_OK) {
            NEO_LOG_ERROR("curl_global_init failed: {}", curl_easy_strerror(code));
        }
    });
}

RestClient::RestClient() {
    GlobalInit();
}

HttpResponse RestClient::Request(const HttpRequest& request) {
    HttpResponse response;

    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw ConnectionException("Failed to initialize CURL handle");
    }

    curl_easy_setopt(curl.get(), CURLOPT_URL, request.url.c_str());

    if (request.method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));
    } else if (request.method != "GET") {
        curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, request.method.c_str());
        if (!request.body.empty()) {
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.length()));
        }
    }

    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, RestClient::WriteCallback);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);

    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, request.timeout_ms);
    curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT_MS, std::min(kConnectTimeoutMs, request.timeout_ms));
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, kUserAgent);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_SSL_VERIFYHOST, 2L);
    curl_easy_setopt(curl.get(), CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_MAXREDIRS, 5L);

    CurlHeaderList header_list;
    for (const auto& header : request.headers) {
        std::string header_str = header.first + ": " + header.second;
        curl_slist* appended = curl_slist_append(header_list.get(), header_str.c_str());
        if (!appended) {
            throw ConnectionException("Failed to build request headers");
        }
        header_list.release();
        header_list.reset(appended);
    }
    if (header_list) {
        curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list.get());
    }

    CURLcode result = curl_easy_perform(curl.get());

    long response_code = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response_code);
    response.status_code = response_code;

    if (result != CURLE_OK) {
        std::string error_message = curl_easy_strerror(result);
        NEO_LOG_DEBUG("CURL request to {} failed: {} ({})", request.url, error_message, static_cast<int>(result));
        if (result == CURLE_OPERATION_TIMEDOUT) {
            throw TimeoutException("Request timed out: " + error_message);
        }
        throw ConnectionException("Request failed: " + error_message);
    }

    if (response_code >= 400) {
        NEO_LOG_WARN("HTTP error {}: {}", response_code, request.url);
    }
    NEO_LOG_DEBUG("HTTP {} {} -> {} ({} bytes)", request.method, request.url, response_code, response.body.length());

    return response;
}

size_t RestClient::WriteCallback(void* contents, size_t size, size_t nmemb, std::string* userp) {
    size_t total = size * nmemb;
    userp->append(static_cast<char*>(contents), total);
    return total;
}

std::string RestClient::UrlEncode(const std::string& value) {
    GlobalInit();
    CurlHandle curl(curl_easy_init());
    if (!curl) {
        throw ConnectionException("Failed to initialize CURL handle");
    }
    char* encoded = curl_easy_escape(curl.get(), value.c_str(), static_cast<int>(value.length()));
    if (!encoded) {
        throw ConnectionException("Failed to URL-encode value");
    }
    std::string result(encoded);
    curl_free(encoded);
    return result;
}

} // namespace neo
