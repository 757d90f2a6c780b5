#include "stoa/jobs/EventFdMonitorJob.hpp"
#include "stoa/Config.hpp"
#include "stoa/Server.hpp"
#include "stoa/logger/Logger.hpp"
#include "LockFreeMemoryPool.h"
#include <cerrno>
#include <liburing.h>

// One per Server
DEFINE_LOCKFREE_POOL(stoa::EventFdMonitorJob, 100);

namespace stoa {

EventFdMonitorJob::EventFdMonitorJob(int fd)
    : fd_(fd), counter_buffer_(0), signals_(0) {
}

EventFdMonitorJob* EventFdMonitorJob::createFromPool(int fd,
                                                     SignalCallback on_signal,
                                                     ErrorCallback on_error) {
    EventFdMonitorJob* job = lfmemorypool::lockfree_pool_alloc_fast<EventFdMonitorJob>(fd);
    if (!job) {
        return nullptr;
    }
    job->on_signal_ = std::move(on_signal);
    job->on_error_ = std::move(on_error);
    return job;
}

void EventFdMonitorJob::freePoolAllocated(EventFdMonitorJob* job) {
    if (job) {
        lfmemorypool::lockfree_pool_free_fast<EventFdMonitorJob>(job);
    }
}

bool EventFdMonitorJob::arm(Server& server) {
    struct io_uring_sqe* sqe = server.registerJob(this);
    if (!sqe) {
        server.submit();
        sqe = server.registerJob(this);
        if (!sqe) {
            Logger::getInstance().logError("EventFdMonitorJob: no SQE available to arm fd=" + std::to_string(fd_));
            return false;
        }
    }
    prepareSqe(sqe);
    server.submit();
    return true;
}

void EventFdMonitorJob::prepareSqe(struct io_uring_sqe* sqe) {
    io_uring_prep_read(sqe, fd_, &counter_buffer_, sizeof(counter_buffer_), 0);
}

std::optional<IoJob::CleanupCallback> EventFdMonitorJob::handleCompletion(Server& server, struct io_uring_cqe* cqe) {
    int result = cqe->res;
    STOA_DEBUG_LOG("EventFdMonitorJob fd=" << fd_ << " result=" << result);

    if (result == -ECANCELED) {
        // Ring teardown
        return std::nullopt;
    }
    if (result <= 0) {
        if (on_error_) {
            on_error_(result == 0 ? EIO : -result);
        }
        return std::nullopt;
    }

    ++signals_;
    if (on_signal_) {
        on_signal_(counter_buffer_);
    }
    // Several signals may collapse into one counter read; one rearm covers them
    arm(server);
    return std::nullopt;
}

} // namespace stoa
