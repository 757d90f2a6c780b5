#pragma once

#include "LockFreeMemoryPool.h"
#include <memory>
#include <utility>

namespace stoa {

// shared_ptr deleter that hands the object back to its lock-free pool
template<typename T>
struct PoolDeleter {
    void operator()(T* ptr) const {
        if (ptr) {
            lfmemorypool::lockfree_pool_free_fast<T>(ptr);
        }
    }
};

/**
 * shared_ptr backed by the lock-free pool for T (declared with
 * DEFINE_LOCKFREE_POOL). Returns nullptr when the pool is exhausted.
 */
template<typename T, typename... Args>
std::shared_ptr<T> makeSharedFromPool(Args&&... args) {
    T* ptr = lfmemorypool::lockfree_pool_alloc_fast<T>(std::forward<Args>(args)...);
    if (!ptr) {
        return nullptr;
    }
    return std::shared_ptr<T>(ptr, PoolDeleter<T>());
}

} // namespace stoa
