#pragma once

#include <vector>
#include <queue>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <future>
#include <string>

namespace tankobon::util {

class Logger;

// Fixed thread pool shared through the run context.
// Jobs run in FIFO order; submit() blocks while the queue is full.
class WorkerPool {
public:
    using Job = std::function<void()>;

    WorkerPool(size_t num_threads, Logger& logger, size_t max_queue_size = 256);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // Enqueue a job; the future becomes ready when it has run
    // (and carries any exception it threw).
    [[nodiscard]] std::future<void> submit(Job job);

    // Ceiling for any configured worker count
    static constexpr size_t MAX_THREADS = 20;

    [[nodiscard]] size_t size() const { return workers_.size(); }

    // min(cap, hardware_concurrency, MAX_THREADS), at least 1
    static size_t bounded_thread_count(size_t cap);

private:
    void worker_thread();

    std::vector<std::thread> workers_;

    std::queue<std::packaged_task<void()>> job_queue_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable space_cv_;

    bool stop_ = false;
    size_t max_queue_size_;
    Logger& logger_;
};

}  // namespace tankobon::util
