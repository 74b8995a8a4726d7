#include "util/WorkerPool.hpp"
#include "util/Logger.hpp"
#include <algorithm>
#include <stdexcept>

namespace tankobon::util {

WorkerPool::WorkerPool(size_t num_threads, Logger& logger, size_t max_queue_size)
    : max_queue_size_(std::max<size_t>(1, max_queue_size)), logger_(logger) {
    num_threads = std::max<size_t>(1, num_threads);

    logger_.debug("WorkerPool: Initializing with " + std::to_string(num_threads) + " worker threads");

    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back([this]() {
            worker_thread();
        });
    }
}

WorkerPool::~WorkerPool() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    cv_.notify_all();
    space_cv_.notify_all();

    // Workers drain the queue before exiting
    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }

    logger_.debug("WorkerPool: Shutdown complete");
}

std::future<void> WorkerPool::submit(Job job) {
    std::packaged_task<void()> task(std::move(job));
    auto future = task.get_future();

    {
        std::unique_lock<std::mutex> lock(queue_mutex_);
        space_cv_.wait(lock, [this]() {
            return stop_ || job_queue_.size() < max_queue_size_;
        });

        if (stop_) {
            throw std::runtime_error("WorkerPool: submit after shutdown");
        }

        job_queue_.push(std::move(task));
    }

    cv_.notify_one();
    return future;
}

size_t WorkerPool::bounded_thread_count(size_t cap) {
    size_t hw = std::thread::hardware_concurrency();
    if (hw == 0) hw = 4;  // Unknown; assume a small machine
    return std::max<size_t>(1, std::min({cap, hw, MAX_THREADS}));
}

void WorkerPool::worker_thread() {
    while (true) {
        std::packaged_task<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this]() {
                return stop_ || !job_queue_.empty();
            });

            if (stop_ && job_queue_.empty()) {
                break;
            }

            task = std::move(job_queue_.front());
            job_queue_.pop();
        }
        space_cv_.notify_one();

        // Exceptions are captured into the task's future
        task();
    }
}

}  // namespace tankobon::util
