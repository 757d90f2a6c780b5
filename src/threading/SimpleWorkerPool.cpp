#include "stoa/threading/SimpleWorkerPool.hpp"
#include "stoa/logger/Logger.hpp"

#include <exception>

namespace stoa {

SimpleWorkerPool::SimpleWorkerPool(size_t num_threads, size_t max_queued)
    : max_queued_(max_queued) {
    if (num_threads == 0) {
        num_threads = 1;
    }
    workers_.reserve(num_threads);
    for (size_t i = 0; i < num_threads; ++i) {
        workers_.emplace_back(&SimpleWorkerPool::worker_thread, this);
    }
}

SimpleWorkerPool::~SimpleWorkerPool() {
    shutdown();
}

bool SimpleWorkerPool::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_ || tasks_.size() >= max_queued_) {
            return false;
        }
        tasks_.emplace(std::move(task));
    }
    condition_.notify_one();
    return true;
}

size_t SimpleWorkerPool::queued() const {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    return tasks_.size();
}

void SimpleWorkerPool::shutdown() {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        stop_ = true;
    }
    condition_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

void SimpleWorkerPool::worker_thread() {
    while (true) {
        std::function<void()> task;

        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !tasks_.empty(); });

            if (stop_ && tasks_.empty()) {
                break;
            }

            task = std::move(tasks_.front());
            tasks_.pop();
        }

        // Tasks report their own failures; anything escaping is a bug in the task
        try {
            task();
        } catch (const std::exception& e) {
            Logger::getInstance().logError(std::string("SimpleWorkerPool: task threw: ") + e.what());
        }
    }
}

} // namespace stoa
