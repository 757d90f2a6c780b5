#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <utility>

namespace stoa {

/**
 * Bounded lock-free multi-producer multi-consumer queue.
 * Reference: "Bounded MPMC queue" by Dmitry Vyukov
 * http://www.1024cores.net/home/lock-free-algorithms/queues/bounded-mpmc-queue
 */

constexpr size_t ring_index(size_t position, size_t capacity) {
    return position & (capacity - 1);
}

constexpr bool is_power_of_two(size_t n) {
    return n != 0 && (n & (n - 1)) == 0;
}

template <typename T>
struct RingSlot {
    std::atomic<size_t> sequence;
    T data;

    explicit RingSlot(size_t initial_sequence = 0) : sequence(initial_sequence), data{} {}

    RingSlot(const RingSlot&) = delete;
    RingSlot& operator=(const RingSlot&) = delete;
};

template <typename T, size_t Size>
class MPMCRingBuffer {
  public:
    static_assert(is_power_of_two(Size), "Size must be a power of 2");

    MPMCRingBuffer() : head_(0), tail_(0) {
        for (size_t i = 0; i < Size; ++i) {
            slots_[i].sequence.store(i, std::memory_order_relaxed);
        }
    }

    MPMCRingBuffer(const MPMCRingBuffer&) = delete;
    MPMCRingBuffer& operator=(const MPMCRingBuffer&) = delete;

    // false when full
    bool enqueue(T&& item) {
        size_t pos = head_.load(std::memory_order_relaxed);
        while (true) {
            RingSlot<T>& slot = slots_[ring_index(pos, Size)];
            size_t seq = slot.sequence.load(std::memory_order_acquire);
            intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos);
            if (diff == 0) {
                if (head_.compare_exchange_weak(pos, pos + 1, std::memory_order_acq_rel,
                                                std::memory_order_relaxed)) {
                    slot.data = std::move(item);
                    slot.sequence.store(pos + 1, std::memory_order_release);
                    return true;
                }
            } else if (diff < 0) {
                return false;
            } else {
                pos = head_.load(std::memory_order_relaxed);
            }
        }
    }

    bool enqueue(const T& item) {
        T copy = item;
        return enqueue(std::move(copy));
    }

    // false when empty
    bool dequeue(T& item) {
        size_t pos = tail_.load(std::memory_order_relaxed);
        while (true) {
            RingSlot<T>& slot = slots_[ring_index(pos, Size)];
            size_t seq = slot.sequence.load(std::memory_order_acquire);
            intptr_t diff = static_cast<intptr_t>(seq) - static_cast<intptr_t>(pos + 1);
            if (diff == 0) {
                if (tail_.compare_exchange_weak(pos, pos + 1, std::memory_order_acq_rel,
                                                std::memory_order_relaxed)) {
                    item = std::move(slot.data);
                    slot.sequence.store(pos + Size, std::memory_order_release);
                    return true;
                }
            } else if (diff < 0) {
                return false;
            } else {
                pos = tail_.load(std::memory_order_relaxed);
            }
        }
    }

  private:
    RingSlot<T> slots_[Size];
    std::atomic<size_t> head_;
    std::atomic<size_t> tail_;
};

} // namespace stoa
