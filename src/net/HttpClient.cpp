#include "net/HttpClient.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <thread>
#include <utility>

namespace tankobon::net {

namespace {

size_t write_body(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* body = static_cast<std::vector<uint8_t>*>(userdata);
    const size_t total = size * nmemb;
    body->insert(body->end(), ptr, ptr + total);
    return total;
}

bool is_transient_transport_error(CURLcode code) {
    switch (code) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_CONNECT:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
        case CURLE_GOT_NOTHING:
        case CURLE_PARTIAL_FILE:
        case CURLE_HTTP2:
        case CURLE_HTTP2_STREAM:
            return true;
        default:
            return false;
    }
}

// curl_global_init is not thread-safe; run it once per process
void ensure_curl_initialized() {
    static const CURLcode init = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (init != CURLE_OK) {
        throw std::runtime_error(std::string("HttpClient: curl_global_init failed: ") + curl_easy_strerror(init));
    }
}

}  // namespace

HttpClient::HttpClient(HttpClientOptions options, util::Logger& logger)
    : options_(std::move(options)),
      logger_(logger),
      slots_(std::clamp(options_.max_connections, 1, 1024)) {
    ensure_curl_initialized();

    share_ = curl_share_init();
    if (!share_) {
        throw std::runtime_error("HttpClient: curl_share_init failed");
    }
    curl_share_setopt(share_, CURLSHOPT_LOCKFUNC, &HttpClient::lock_share);
    curl_share_setopt(share_, CURLSHOPT_UNLOCKFUNC, &HttpClient::unlock_share);
    curl_share_setopt(share_, CURLSHOPT_USERDATA, this);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_CONNECT);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_DNS);
    curl_share_setopt(share_, CURLSHOPT_SHARE, CURL_LOCK_DATA_SSL_SESSION);

    logger_.debug("HttpClient: Pool ready (max " + std::to_string(options_.max_connections) + " connections)");
}

HttpClient::~HttpClient() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }
    if (share_) {
        curl_share_cleanup(share_);
    }
}

void HttpClient::lock_share(CURL*, curl_lock_data data, curl_lock_access, void* userptr) {
    static_cast<HttpClient*>(userptr)->share_mutexes_[data].lock();
}

void HttpClient::unlock_share(CURL*, curl_lock_data data, void* userptr) {
    static_cast<HttpClient*>(userptr)->share_mutexes_[data].unlock();
}

CURL* HttpClient::acquire_handle() {
    {
        std::lock_guard<std::mutex> lock(idle_mutex_);
        if (!idle_handles_.empty()) {
            CURL* handle = idle_handles_.back();
            idle_handles_.pop_back();
            curl_easy_reset(handle);
            return handle;
        }
    }
    CURL* handle = curl_easy_init();
    if (!handle) {
        throw std::runtime_error("HttpClient: curl_easy_init failed");
    }
    return handle;
}

void HttpClient::release_handle(CURL* handle) {
    std::lock_guard<std::mutex> lock(idle_mutex_);
    idle_handles_.push_back(handle);
}

bool HttpClient::is_retryable_status(long status) {
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

std::string HttpClient::encode_for_transport(const std::string& url) {
    static const char HEX[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(url.size());
    for (unsigned char c : url) {
        if (c <= 0x20 || c >= 0x7F || c == '"' || c == '<' || c == '>' || c == '\\' ||
            c == '^' || c == '`' || c == '{' || c == '|' || c == '}') {
            out += '%';
            out += HEX[c >> 4];
            out += HEX[c & 0x0F];
        } else {
            out += static_cast<char>(c);
        }
    }
    return out;
}

HttpResponse HttpClient::get(const std::string& url, const std::vector<std::string>& headers) {
    return perform(Method::Get, url, nullptr, headers, options_.request_timeout_s);
}

HttpResponse HttpClient::post(const std::string& url, const std::string& body, const std::string& content_type) {
    return perform(Method::Post, url, &body, {"Content-Type: " + content_type}, options_.request_timeout_s);
}

HttpResponse HttpClient::del(const std::string& url) {
    return perform(Method::Delete, url, nullptr, {}, options_.request_timeout_s);
}

util::Result<std::vector<uint8_t>> HttpClient::fetch(const std::string& url) {
    using R = util::Result<std::vector<uint8_t>>;

    static const std::vector<std::string> IMAGE_HEADERS = {
        std::string("Accept: ") + IMAGE_ACCEPT,
    };

    HttpResponse response = get(url, IMAGE_HEADERS);
    if (!response.error.empty()) {
        return R::failure(util::ErrorKind::Fetch, response.error + " (" + url + ")");
    }
    if (!response.ok()) {
        return R::failure(util::ErrorKind::Fetch, "HTTP " + std::to_string(response.status) + " (" + url + ")");
    }
    return std::move(response.body);
}

HttpResponse HttpClient::perform(Method method, const std::string& url, const std::string* body,
                                 const std::vector<std::string>& headers, long timeout_s) {
    const std::string target = encode_for_transport(url);
    const int retries = method == Method::Get ? std::clamp(options_.transport_retries, 0, MAX_TRANSPORT_RETRIES) : 0;
    const std::chrono::milliseconds max_wait = std::max(options_.max_retry_wait, std::chrono::milliseconds(0));

    HttpResponse response;
    for (int attempt = 0; attempt <= retries; ++attempt) {
        {
            slots_.acquire();
            CURL* handle = nullptr;
            try {
                handle = acquire_handle();
                response = perform_once(handle, method, target, body, headers, timeout_s);
            } catch (...) {
                if (handle) release_handle(handle);
                slots_.release();
                throw;
            }
            release_handle(handle);
            slots_.release();
        }

        const bool transient = response.error.empty() ? is_retryable_status(response.status)
                                                      : response.status == -1;
        if (!transient || attempt == retries) {
            break;
        }

        std::chrono::milliseconds delay = options_.transport_backoff * (1LL << attempt);
        if (response.retry_after_s > 0) {
            // Compared in seconds first: a huge header value must not overflow the conversion
            const long long cap_s = std::chrono::duration_cast<std::chrono::seconds>(max_wait).count() + 1;
            const std::chrono::seconds requested(std::min<long long>(response.retry_after_s, cap_s));
            delay = std::max<std::chrono::milliseconds>(delay, requested);
        }
        delay = std::clamp(delay, std::chrono::milliseconds(0), max_wait);
        logger_.debug("HttpClient: Transport retry " + std::to_string(attempt + 1) + "/" +
                      std::to_string(retries) + " for " + url + " (" +
                      (response.error.empty() ? "HTTP " + std::to_string(response.status) : response.error) +
                      "), waiting " + std::to_string(delay.count()) + " ms");
        std::this_thread::sleep_for(delay);
    }
    return response;
}

HttpResponse HttpClient::perform_once(CURL* handle, Method method, const std::string& url, const std::string* body,
                                      const std::vector<std::string>& headers, long timeout_s) {
    HttpResponse response;

    curl_slist* header_list = nullptr;
    for (const auto& header : headers) {
        header_list = curl_slist_append(header_list, header.c_str());
    }

    curl_easy_setopt(handle, CURLOPT_URL, url.c_str());
    curl_easy_setopt(handle, CURLOPT_SHARE, share_);
    curl_easy_setopt(handle, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle, CURLOPT_MAXREDIRS, 10L);
    curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle, CURLOPT_USERAGENT, options_.user_agent.c_str());
    curl_easy_setopt(handle, CURLOPT_ACCEPT_ENCODING, "");
    curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT, options_.connect_timeout_s);
    curl_easy_setopt(handle, CURLOPT_TIMEOUT, timeout_s);
    curl_easy_setopt(handle, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, write_body);
    curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body);

    switch (method) {
        case Method::Get:
            curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L);
            break;
        case Method::Post:
            curl_easy_setopt(handle, CURLOPT_POST, 1L);
            curl_easy_setopt(handle, CURLOPT_POSTFIELDS, body ? body->c_str() : "");
            curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                             static_cast<curl_off_t>(body ? body->size() : 0));
            break;
        case Method::Delete:
            curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, "DELETE");
            break;
    }

    CURLcode code = curl_easy_perform(handle);
    curl_slist_free_all(header_list);

    if (code != CURLE_OK) {
        response.error = curl_easy_strerror(code);
        // -1 marks a transport failure worth retrying
        response.status = is_transient_transport_error(code) ? -1 : 0;
        response.body.clear();
        return response;
    }

    curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);

    char* content_type = nullptr;
    if (curl_easy_getinfo(handle, CURLINFO_CONTENT_TYPE, &content_type) == CURLE_OK && content_type) {
        response.content_type = content_type;
    }

    curl_header* retry_after = nullptr;
    if (curl_easy_header(handle, "Retry-After", 0, CURLH_HEADER, -1, &retry_after) == CURLHE_OK && retry_after) {
        char* end = nullptr;
        long seconds = std::strtol(retry_after->value, &end, 10);
        if (end != retry_after->value && seconds >= 0) {
            response.retry_after_s = seconds;
        }
    }

    return response;
}

}  // namespace tankobon::net
