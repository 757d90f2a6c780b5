#pragma once

#include <cstddef>
#include <cstdlib>
#include <new>
#include <utility>

namespace stoa {

/**
 * Slab allocator with an intrusive free list, one instance per thread.
 * Every job the loop creates for a connection (writes, file streams, TLS
 * handshakes) is allocated and freed on the loop thread, so no locking.
 */
template<typename T>
class ThreadLocalPool {
private:
    union Slot {
        Slot* next;
        alignas(T) std::byte storage[sizeof(T)];
    };

public:
    explicit ThreadLocalPool(size_t capacity)
        : capacity_(capacity), slab_(nullptr), free_head_(nullptr), in_use_(0) {
        if (capacity == 0) {
            return;
        }

        constexpr size_t alignment = alignof(Slot);
        size_t size = capacity * sizeof(Slot);
        size = (size + alignment - 1) & ~(alignment - 1);

        slab_ = static_cast<Slot*>(std::aligned_alloc(alignment, size));
        if (!slab_) {
            throw std::bad_alloc();
        }

        for (size_t i = 0; i < capacity - 1; ++i) {
            slab_[i].next = &slab_[i + 1];
        }
        slab_[capacity - 1].next = nullptr;
        free_head_ = slab_;
    }

    ~ThreadLocalPool() {
        std::free(slab_);
    }

    ThreadLocalPool(const ThreadLocalPool&) = delete;
    ThreadLocalPool& operator=(const ThreadLocalPool&) = delete;

    // nullptr when exhausted
    template<typename... Args>
    T* allocate(Args&&... args) {
        if (!free_head_) {
            return nullptr;
        }

        Slot* slot = free_head_;
        free_head_ = slot->next;

        T* ptr = reinterpret_cast<T*>(slot->storage);
        try {
            new (ptr) T(std::forward<Args>(args)...);
        } catch (...) {
            slot->next = free_head_;
            free_head_ = slot;
            throw;
        }
        ++in_use_;
        return ptr;
    }

    void deallocate(T* ptr) {
        if (!ptr) return;

        ptr->~T();
        Slot* slot = reinterpret_cast<Slot*>(ptr);
        slot->next = free_head_;
        free_head_ = slot;
        --in_use_;
    }

    size_t capacity() const { return capacity_; }
    size_t allocated() const { return in_use_; }
    size_t available() const { return capacity_ - in_use_; }

private:
    size_t capacity_;
    Slot* slab_;
    Slot* free_head_;
    size_t in_use_;
};

} // namespace stoa
