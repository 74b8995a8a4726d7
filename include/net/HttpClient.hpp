#pragma once

#include "net/Fetcher.hpp"
#include <chrono>
#include <cstdint>
#include <mutex>
#include <semaphore>
#include <string>
#include <vector>
#include <curl/curl.h>

namespace tankobon::util {
class Logger;
}

namespace tankobon::net {

struct HttpClientOptions {
    std::string user_agent = "Mozilla/5.0 (Windows NT 10.0; Win64; x64) AppleWebKit/537.36";
    long connect_timeout_s = 10;
    long request_timeout_s = 20;
    int max_connections = 20;

    // Transport-level retry, independent of any caller retry loop
    int transport_retries = 5;                    // Capped at MAX_TRANSPORT_RETRIES
    std::chrono::milliseconds transport_backoff{1000};
    std::chrono::milliseconds max_retry_wait{60000};  // Upper bound for backoff and Retry-After
};

struct HttpResponse {
    long status = 0;
    std::vector<uint8_t> body;
    std::string content_type;
    std::string error;          // Transport error text; empty when a response arrived
    long retry_after_s = -1;    // Parsed Retry-After header, -1 when absent

    bool ok() const { return error.empty() && status >= 200 && status < 300; }
    std::string text() const { return std::string(body.begin(), body.end()); }
};

/**
 * Pooled libcurl client.
 *
 * Easy handles are recycled through an idle list and share one connection
 * cache, DNS cache and TLS session cache (curl share handle), so repeated
 * requests to the same host reuse connections. At most max_connections
 * requests run at once. GET requests are retried on 429/500/502/503/504
 * and on transient transport errors with exponential backoff, never
 * waiting longer than max_retry_wait between attempts.
 */
class HttpClient : public Fetcher {
public:
    static constexpr int MAX_TRANSPORT_RETRIES = 10;
    // Only formats the image normalizer decodes
    static constexpr const char* IMAGE_ACCEPT = "image/jpeg,image/png,image/gif,image/bmp,*/*;q=0.5";

    HttpClient(HttpClientOptions options, util::Logger& logger);
    ~HttpClient() override;

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    HttpResponse get(const std::string& url, const std::vector<std::string>& headers = {});
    HttpResponse post(const std::string& url, const std::string& body,
                      const std::string& content_type = "application/json");
    HttpResponse del(const std::string& url);

    // Image GET with browser-like headers; non-2xx becomes a Fetch error
    util::Result<std::vector<uint8_t>> fetch(const std::string& url) override;

    static bool is_retryable_status(long status);

    // Percent-encodes characters that are not valid in a request URL
    static std::string encode_for_transport(const std::string& url);

    const HttpClientOptions& options() const { return options_; }

private:
    enum class Method { Get, Post, Delete };

    HttpResponse perform(Method method, const std::string& url, const std::string* body,
                         const std::vector<std::string>& headers, long timeout_s);
    HttpResponse perform_once(CURL* handle, Method method, const std::string& url, const std::string* body,
                              const std::vector<std::string>& headers, long timeout_s);

    CURL* acquire_handle();
    void release_handle(CURL* handle);

    static void lock_share(CURL* handle, curl_lock_data data, curl_lock_access access, void* userptr);
    static void unlock_share(CURL* handle, curl_lock_data data, void* userptr);

    HttpClientOptions options_;
    util::Logger& logger_;

    CURLSH* share_ = nullptr;
    std::mutex share_mutexes_[CURL_LOCK_DATA_LAST];

    std::mutex idle_mutex_;
    std::vector<CURL*> idle_handles_;

    std::counting_semaphore<1024> slots_;
};

}  // namespace tankobon::net
