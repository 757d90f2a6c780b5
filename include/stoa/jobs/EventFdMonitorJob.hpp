#pragma once

#include "IoJob.hpp"
#include <cstdint>
#include <functional>

namespace stoa {

/**
 * Read of an eventfd counter that rearms itself after every signal, so
 * one job serves the lifetime of the loop. The owner frees it after the
 * ring has been torn down.
 */
class EventFdMonitorJob : public IoJob {
public:
    using SignalCallback = std::function<void(uint64_t counter)>;
    using ErrorCallback = std::function<void(int error)>;

    static EventFdMonitorJob* createFromPool(int fd,
                                             SignalCallback on_signal,
                                             ErrorCallback on_error = nullptr);
    static void freePoolAllocated(EventFdMonitorJob* job);

    // false when no SQE could be obtained; the read is not armed then
    bool arm(Server& server);

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(Server& server, struct io_uring_cqe* cqe) override;

    explicit EventFdMonitorJob(int fd);

    uint64_t signalCount() const { return signals_; }

private:
    int fd_;
    uint64_t counter_buffer_;
    uint64_t signals_;

    SignalCallback on_signal_;
    ErrorCallback on_error_;
};

} // namespace stoa
