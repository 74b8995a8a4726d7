#pragma once

#include "model/Book.hpp"
#include "util/Result.hpp"
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <string>
#include <vector>

namespace tankobon::util {
class Logger;
class WorkerPool;
}
namespace tankobon::net { class Fetcher; }

namespace tankobon::backend {

struct AcquisitionOptions {
    int attempts = 3;
    std::chrono::milliseconds backoff{1000};   // Doubled after every failed attempt
};

/**
 * Fetches and normalizes the images of one chapter concurrently.
 *
 * Each URL gets up to `attempts` tries (fetch + normalize) with exponential
 * backoff. The call is all-or-nothing: once any URL exhausts its budget the
 * remaining work is cancelled and an error is returned. On success the
 * images are in input order whatever order the fetches completed in.
 *
 * Must not be called from a thread of the worker pool it submits to.
 */
class AcquisitionPool {
public:
    AcquisitionPool(net::Fetcher& fetcher, util::WorkerPool& workers, util::Logger& logger,
                    AcquisitionOptions options = {});

    // context names the chapter in log lines
    util::Result<std::vector<model::EncodedImage>> acquire(const std::vector<std::string>& urls,
                                                           const std::string& context = "");

private:
    class Cancellation {
    public:
        void cancel();
        bool cancelled() const;
        // false if cancelled before the delay elapsed
        bool sleep_for(std::chrono::milliseconds delay) const;

    private:
        mutable std::mutex mutex_;
        mutable std::condition_variable cv_;
        bool cancelled_ = false;
    };

    util::Result<model::EncodedImage> acquire_one(const std::string& url, const std::string& context,
                                                  const Cancellation& cancellation);

    net::Fetcher& fetcher_;
    util::WorkerPool& workers_;
    util::Logger& logger_;
    AcquisitionOptions options_;
};

}  // namespace tankobon::backend
