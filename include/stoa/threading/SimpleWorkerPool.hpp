#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace stoa {

/**
 * Fixed set of threads running application calls off the loop thread.
 * The queue is bounded: post() refuses work instead of letting a burst of
 * requests queue without limit.
 */
class SimpleWorkerPool {
public:
    explicit SimpleWorkerPool(size_t num_threads = std::thread::hardware_concurrency(),
                              size_t max_queued = 1024);
    ~SimpleWorkerPool();

    SimpleWorkerPool(const SimpleWorkerPool&) = delete;
    SimpleWorkerPool& operator=(const SimpleWorkerPool&) = delete;

    // false when the queue is full or the pool is shutting down
    bool post(std::function<void()> task);

    // Runs what is already queued, then joins the threads
    void shutdown();

    size_t threadCount() const { return workers_.size(); }
    size_t queued() const;

private:
    void worker_thread();

    std::vector<std::thread> workers_;
    std::queue<std::function<void()>> tasks_;
    size_t max_queued_;
    mutable std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
};

} // namespace stoa
