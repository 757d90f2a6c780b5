#include "stoa/ring_buffer/BufferRingCoordinator.hpp"
#include "stoa/Config.hpp"
#include "stoa/logger/Logger.hpp"
#include <cerrno>
#include <cstring>
#include <string>
#include <sys/mman.h>

namespace stoa {

BufferRingCoordinator::BufferRingCoordinator(unsigned buf_count, size_t buf_size, unsigned buf_group_id)
    : buf_count_(buf_count), buf_size_(buf_size), buf_group_id_(buf_group_id) {}

BufferRingCoordinator::~BufferRingCoordinator() {
    cleanupBufferRing();
}

bool BufferRingCoordinator::setupBufferRing(struct io_uring* ring) {
    Logger& logger = Logger::getInstance();
    if (buffer_ring_) {
        return true;
    }

    size_t total_size = buf_count_ * buf_size_;
    buffer_block_ = ::mmap(nullptr, total_size, PROT_READ | PROT_WRITE, MAP_PRIVATE | MAP_ANONYMOUS, -1, 0);
    if (buffer_block_ == MAP_FAILED) {
        logger.logError("BufferRingCoordinator: cannot map buffer block: " + std::string(strerror(errno)));
        buffer_block_ = nullptr;
        return false;
    }

    int err = 0;
    buffer_ring_ = io_uring_setup_buf_ring(ring, buf_count_, static_cast<int>(buf_group_id_), 0, &err);
    if (!buffer_ring_) {
        logger.logError("BufferRingCoordinator: cannot register buffer ring: " + std::string(strerror(-err)));
        cleanupBufferRing();
        return false;
    }
    ring_ = ring;
    buffer_ring_mask_ = io_uring_buf_ring_mask(buf_count_);

    for (unsigned i = 0; i < buf_count_; ++i) {
        void* base = static_cast<char*>(buffer_block_) + i * buf_size_;
        io_uring_buf_ring_add(buffer_ring_, base, static_cast<unsigned>(buf_size_),
                              static_cast<unsigned short>(i), buffer_ring_mask_, static_cast<int>(i));
    }
    io_uring_buf_ring_advance(buffer_ring_, static_cast<int>(buf_count_));

    logger.logMessage("BufferRingCoordinator: " + std::to_string(buf_count_) + " buffers of " +
                      std::to_string(buf_size_) + " bytes in group " + std::to_string(buf_group_id_));
    return true;
}

void BufferRingCoordinator::cleanupBufferRing() {
    // Unregister before unmapping so the kernel stops handing out the buffers
    if (buffer_ring_ && ring_) {
        io_uring_free_buf_ring(ring_, buffer_ring_, buf_count_, static_cast<int>(buf_group_id_));
    }
    buffer_ring_ = nullptr;
    ring_ = nullptr;

    if (buffer_block_) {
        ::munmap(buffer_block_, buf_count_ * buf_size_);
        buffer_block_ = nullptr;
    }
}

void* BufferRingCoordinator::getBufferPtr(unsigned buffer_id) const {
    if (!buffer_block_ || buffer_id >= buf_count_) {
        return nullptr;
    }
    return static_cast<char*>(buffer_block_) + buffer_id * buf_size_;
}

void BufferRingCoordinator::recycleBuffer(unsigned buffer_id) {
    void* base = getBufferPtr(buffer_id);
    if (!buffer_ring_ || !base) {
        Logger::getInstance().logError("BufferRingCoordinator: cannot recycle buffer " + std::to_string(buffer_id));
        return;
    }

    io_uring_buf_ring_add(buffer_ring_, base, static_cast<unsigned>(buf_size_),
                          static_cast<unsigned short>(buffer_id), buffer_ring_mask_, 0);
    io_uring_buf_ring_advance(buffer_ring_, 1);
    STOA_DEBUG_LOG("BufferRingCoordinator: recycled buffer " << buffer_id);
}

} // namespace stoa
