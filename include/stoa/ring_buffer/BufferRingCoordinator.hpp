#pragma once

#include <cstddef>
#include <liburing.h>

namespace stoa {

/**
 * Provided-buffer ring for multishot recv: one mmap'd block carved into
 * equal buffers that the kernel picks from and the loop hands back.
 */
class BufferRingCoordinator {
public:
    static constexpr unsigned DEFAULT_BUF_COUNT = 512;
    static constexpr size_t DEFAULT_BUFFER_SIZE = 16384;
    static constexpr unsigned DEFAULT_BUF_GROUP_ID = 1;

    explicit BufferRingCoordinator(unsigned buf_count = DEFAULT_BUF_COUNT,
                                   size_t buf_size = DEFAULT_BUFFER_SIZE,
                                   unsigned buf_group_id = DEFAULT_BUF_GROUP_ID);
    ~BufferRingCoordinator();

    BufferRingCoordinator(const BufferRingCoordinator&) = delete;
    BufferRingCoordinator& operator=(const BufferRingCoordinator&) = delete;

    bool setupBufferRing(struct io_uring* ring);
    void cleanupBufferRing();

    bool hasBufferRing() const { return buffer_ring_ != nullptr; }
    unsigned getBufferGroupId() const { return buf_group_id_; }

    void* getBufferPtr(unsigned buffer_id) const;
    size_t getBufferSize() const { return buf_size_; }
    unsigned getBufferCount() const { return buf_count_; }

    // Loop thread only
    void recycleBuffer(unsigned buffer_id);

private:
    unsigned buf_count_;
    size_t buf_size_;
    unsigned buf_group_id_;

    struct io_uring* ring_{nullptr};
    struct io_uring_buf_ring* buffer_ring_{nullptr};
    void* buffer_block_{nullptr};
    int buffer_ring_mask_{0};
};

} // namespace stoa
