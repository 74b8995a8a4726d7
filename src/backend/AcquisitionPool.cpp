#include "backend/AcquisitionPool.hpp"
#include "imaging/ImageNormalizer.hpp"
#include "net/Fetcher.hpp"
#include "util/Logger.hpp"
#include "util/WorkerPool.hpp"
#include <future>
#include <optional>

namespace tankobon::backend {

void AcquisitionPool::Cancellation::cancel() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        cancelled_ = true;
    }
    cv_.notify_all();
}

bool AcquisitionPool::Cancellation::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

bool AcquisitionPool::Cancellation::sleep_for(std::chrono::milliseconds delay) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return !cv_.wait_for(lock, delay, [this] { return cancelled_; });
}

AcquisitionPool::AcquisitionPool(net::Fetcher& fetcher, util::WorkerPool& workers, util::Logger& logger,
                                 AcquisitionOptions options)
    : fetcher_(fetcher), workers_(workers), logger_(logger), options_(options) {}

util::Result<model::EncodedImage> AcquisitionPool::acquire_one(const std::string& url, const std::string& context,
                                                               const Cancellation& cancellation) {
    const int attempts = options_.attempts < 1 ? 1 : options_.attempts;
    util::Error last{util::ErrorKind::Fetch, "not attempted"};

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        if (cancellation.cancelled()) {
            return util::Error{util::ErrorKind::Fetch, "cancelled: " + url};
        }

        auto raw = fetcher_.fetch(url);
        if (raw) {
            auto image = imaging::ImageNormalizer::normalize(raw.value());
            if (image) {
                return image;
            }
            last = image.error();
        } else {
            last = raw.error();
        }

        logger_.warn("Acquisition: " + context + " " + url + " attempt " + std::to_string(attempt) + "/" +
                     std::to_string(attempts) + " failed (" + util::to_string(last.kind) + "): " + last.message);

        if (attempt < attempts) {
            auto delay = options_.backoff * (1 << (attempt - 1));
            if (!cancellation.sleep_for(delay)) {
                return util::Error{util::ErrorKind::Fetch, "cancelled: " + url};
            }
        }
    }
    return last;
}

util::Result<std::vector<model::EncodedImage>> AcquisitionPool::acquire(const std::vector<std::string>& urls,
                                                                        const std::string& context) {
    if (urls.empty()) {
        return util::Error{util::ErrorKind::Fetch, "no image references for " + context};
    }

    std::vector<std::optional<util::Result<model::EncodedImage>>> slots(urls.size());
    std::vector<std::future<void>> pending;
    pending.reserve(urls.size());
    Cancellation cancellation;

    std::string submit_error;
    for (size_t i = 0; i < urls.size() && submit_error.empty(); ++i) {
        auto job = [this, &urls, &slots, &cancellation, &context, i] {
            try {
                auto result = acquire_one(urls[i], context, cancellation);
                if (!result) cancellation.cancel();
                slots[i] = std::move(result);
            } catch (const std::exception& e) {
                cancellation.cancel();
                slots[i] = util::Result<model::EncodedImage>::failure(util::ErrorKind::Fetch,
                                                                      urls[i] + ": " + e.what());
            }
        };
        try {
            pending.push_back(workers_.submit(job));
        } catch (const std::runtime_error& e) {
            submit_error = e.what();
            cancellation.cancel();
        }
    }
    for (auto& job : pending) {
        job.wait();
    }
    if (!submit_error.empty()) {
        return util::Error{util::ErrorKind::Fetch, context + ": worker pool unavailable: " + submit_error};
    }

    // Report the first real failure in page order, not a cancellation
    std::optional<util::Error> failure;
    for (size_t i = 0; i < slots.size(); ++i) {
        const auto& slot = slots[i];
        if (slot && slot->ok()) continue;
        util::Error error = slot ? slot->error() : util::Error{util::ErrorKind::Fetch, "no result: " + urls[i]};
        bool is_cancel = error.message.rfind("cancelled: ", 0) == 0;
        if (!failure || (!is_cancel && failure->message.rfind("cancelled: ", 0) == 0)) {
            failure = error;
        }
    }
    if (failure) {
        logger_.error("Acquisition: " + context + " essential image missing: " + failure->message);
        return util::Error{util::ErrorKind::Fetch, "essential image missing: " + failure->message};
    }

    std::vector<model::EncodedImage> images;
    images.reserve(slots.size());
    for (auto& slot : slots) {
        images.push_back(std::move(*slot).value());
    }
    logger_.info("Acquisition: " + context + " fetched " + std::to_string(images.size()) + " images");
    return images;
}

}  // namespace tankobon::backend
