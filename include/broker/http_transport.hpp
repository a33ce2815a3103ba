#pragma once

#include <curl/curl.h>

#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace zonetrader {
namespace broker {

struct HttpRequest {
    std::string method = "GET";
    std::string url;
    std::string body;
    std::vector<std::pair<std::string, std::string>> headers;
    long timeout_seconds = 30;
};

struct HttpResponse {
    int status = 0;
    std::string body;
};

/**
 * One blocking HTTP exchange. Throws std::runtime_error when no response
 * was received at all (connect, TLS, timeout).
 */
class IHttpTransport {
public:
    virtual ~IHttpTransport() = default;
    virtual HttpResponse perform(const HttpRequest& request) = 0;
};

/**
 * libcurl transport. One easy handle reused across requests, serialized by
 * a mutex.
 */
class CurlTransport : public IHttpTransport {
public:
    CurlTransport() : curl_(nullptr) {
        curl_global_init(CURL_GLOBAL_DEFAULT);
        curl_ = curl_easy_init();
        if (!curl_) {
            throw std::runtime_error("Failed to initialize CURL");
        }
    }

    ~CurlTransport() override {
        if (curl_) {
            curl_easy_cleanup(curl_);
        }
        curl_global_cleanup();
    }

    CurlTransport(const CurlTransport&) = delete;
    CurlTransport& operator=(const CurlTransport&) = delete;

    HttpResponse perform(const HttpRequest& request) override {
        std::lock_guard<std::mutex> lock(mutex_);
        HttpResponse response;

        curl_easy_reset(curl_);
        curl_easy_setopt(curl_, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl_, CURLOPT_WRITEFUNCTION, write_callback);
        curl_easy_setopt(curl_, CURLOPT_WRITEDATA, &response.body);
        curl_easy_setopt(curl_, CURLOPT_TIMEOUT, request.timeout_seconds);
        curl_easy_setopt(curl_, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYPEER, 1L);
        curl_easy_setopt(curl_, CURLOPT_SSL_VERIFYHOST, 2L);

        if (request.method == "POST") {
            curl_easy_setopt(curl_, CURLOPT_POST, 1L);
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDS, request.body.c_str());
            curl_easy_setopt(curl_, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
        } else if (request.method != "GET") {
            curl_easy_setopt(curl_, CURLOPT_CUSTOMREQUEST, request.method.c_str());
        }

        struct curl_slist* headers = nullptr;
        for (const auto& [name, value] : request.headers) {
            std::string line = name + ": " + value;
            headers = curl_slist_append(headers, line.c_str());
        }
        if (headers)
            curl_easy_setopt(curl_, CURLOPT_HTTPHEADER, headers);

        CURLcode res = curl_easy_perform(curl_);
        curl_slist_free_all(headers);

        if (res != CURLE_OK) {
            throw std::runtime_error(std::string("CURL error: ") + curl_easy_strerror(res));
        }

        long http_code = 0;
        curl_easy_getinfo(curl_, CURLINFO_RESPONSE_CODE, &http_code);
        response.status = static_cast<int>(http_code);
        return response;
    }

private:
    CURL* curl_;
    std::mutex mutex_;

    static size_t write_callback(void* contents, size_t size, size_t nmemb, std::string* output) {
        size_t total_size = size * nmemb;
        output->append(static_cast<char*>(contents), total_size);
        return total_size;
    }
};

} // namespace broker
} // namespace zonetrader
