#pragma once

#include "stoa/util/ThreadLocalPool.hpp"
#include <cstddef>
#include <utility>

namespace stoa {

/**
 * Per-type, per-thread job pools.
 *
 *   auto* job = PoolManager::allocate<WriteJob>(args...);
 *   PoolManager::deallocate(job);
 *
 * Capacities are specialized next to each job's implementation.
 */
class PoolManager {
public:
    template<typename T, typename... Args>
    static T* allocate(Args&&... args) {
        return getPool<T>().allocate(std::forward<Args>(args)...);
    }

    template<typename T>
    static void deallocate(T* ptr) {
        getPool<T>().deallocate(ptr);
    }

    template<typename T>
    static size_t allocated() {
        return getPool<T>().allocated();
    }

private:
    template<typename T>
    static ThreadLocalPool<T>& getPool() {
        constexpr size_t capacity = getPoolCapacity<T>();
        thread_local ThreadLocalPool<T> pool(capacity);
        return pool;
    }

    template<typename T>
    static constexpr size_t getPoolCapacity() {
        return 1000;
    }
};

} // namespace stoa
