#pragma once

#include "stoa/ring_buffer/MPMCRingBuffer.hpp"
#include <atomic>
#include <utility>

namespace stoa {

/**
 * MPMCRingBuffer plus C++20 atomic wait/notify so consumers sleep instead of
 * spinning. Used by AsyncLogger to hand lines to its drain thread.
 */
template <typename T, size_t N>
class NotifyingRingBuffer {
  public:
    NotifyingRingBuffer() = default;

    NotifyingRingBuffer(const NotifyingRingBuffer&) = delete;
    NotifyingRingBuffer& operator=(const NotifyingRingBuffer&) = delete;

    bool enqueue(T&& item) {
        if (!ring_.enqueue(std::move(item))) {
            return false;
        }
        signal();
        return true;
    }

    bool enqueue(const T& item) {
        if (!ring_.enqueue(item)) {
            return false;
        }
        signal();
        return true;
    }

    /**
     * Blocks until an item is available.
     * @return false once shutdown() has been called
     */
    bool dequeue(T& item) {
        if (ring_.dequeue(item)) {
            return true;
        }

        while (!shutdown_.load(std::memory_order_acquire)) {
            has_data_.wait(false, std::memory_order_acquire);

            if (shutdown_.load(std::memory_order_acquire)) {
                return false;
            }
            if (ring_.dequeue(item)) {
                return true;
            }
            has_data_.store(false, std::memory_order_release);
        }
        return false;
    }

    bool try_dequeue(T& item) { return ring_.dequeue(item); }

    void shutdown() {
        shutdown_.store(true, std::memory_order_release);
        notify_all();
    }

    void notify_all() {
        has_data_.store(true, std::memory_order_release);
        has_data_.notify_all();
    }

  private:
    void signal() {
        has_data_.store(true, std::memory_order_release);
        has_data_.notify_one();
    }

    MPMCRingBuffer<T, N> ring_;
    std::atomic<bool> has_data_{false};
    std::atomic<bool> shutdown_{false};
};

} // namespace stoa
