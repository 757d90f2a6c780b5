#pragma once

#include <sys/eventfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <system_error>

namespace stoa {

/**
 * RAII wrapper for a Linux eventfd.
 * The loop thread keeps a read armed on it through EventFdMonitorJob; any
 * other thread calls signal() to wake the loop. Writes coalesce, so one read
 * may account for many signals.
 */
class EventFd {
public:
    explicit EventFd(bool nonblocking = true) {
        int flags = EFD_CLOEXEC;
        if (nonblocking) flags |= EFD_NONBLOCK;

        fd_ = eventfd(0, flags);
        if (fd_ < 0) {
            throw std::system_error(errno, std::system_category(), "eventfd creation failed");
        }
    }

    ~EventFd() {
        if (fd_ >= 0) {
            close(fd_);
        }
    }

    EventFd(const EventFd&) = delete;
    EventFd& operator=(const EventFd&) = delete;

    EventFd(EventFd&& other) noexcept : fd_(other.fd_) {
        other.fd_ = -1;
    }

    EventFd& operator=(EventFd&& other) noexcept {
        if (this != &other) {
            if (fd_ >= 0) {
                close(fd_);
            }
            fd_ = other.fd_;
            other.fd_ = -1;
        }
        return *this;
    }

    int fd() const { return fd_; }

    // Safe from any thread
    void signal() {
        uint64_t value = 1;
        ssize_t result = write(fd_, &value, sizeof(value));
        // EAGAIN: the counter is saturated, the loop is already due to wake
        if (result < 0 && errno != EAGAIN) {
            throw std::system_error(errno, std::system_category(), "eventfd write failed");
        }
    }

    // Returns the accumulated count, 0 when nothing is pending
    uint64_t consume() {
        uint64_t value = 0;
        ssize_t result = read(fd_, &value, sizeof(value));
        if (result < 0) {
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                return 0;
            }
            throw std::system_error(errno, std::system_category(), "eventfd read failed");
        }
        return value;
    }

private:
    int fd_;
};

} // namespace stoa
