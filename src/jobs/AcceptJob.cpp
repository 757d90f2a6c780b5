#include "stoa/jobs/AcceptJob.hpp"
#include "stoa/Server.hpp"
#include "stoa/logger/Logger.hpp"
#include "LockFreeMemoryPool.h"
#include <cerrno>
#include <liburing.h>
#include <sys/socket.h>

// Usually one per listening socket
DEFINE_LOCKFREE_POOL(stoa::AcceptJob, 100);

namespace stoa {

AcceptJob::AcceptJob(int server_fd)
    : server_fd_(server_fd) {
}

AcceptJob* AcceptJob::create(int server_fd,
                             ConnectionCallback on_connection,
                             ErrorCallback on_error) {
    AcceptJob* job = lfmemorypool::lockfree_pool_alloc_fast<AcceptJob>(server_fd);
    if (job) {
        job->on_connection_ = std::move(on_connection);
        job->on_error_ = std::move(on_error);
    }
    return job;
}

void AcceptJob::freePoolAllocated(AcceptJob* job) {
    if (job) {
        lfmemorypool::lockfree_pool_free_fast<AcceptJob>(job);
    }
}

void AcceptJob::cleanupAcceptJob(IoJob* job) {
    freePoolAllocated(static_cast<AcceptJob*>(job));
}

bool AcceptJob::isTransient(int error) {
    return error == EMFILE || error == ENFILE || error == ENOBUFS || error == ENOMEM ||
           error == ECONNABORTED || error == EINTR || error == EAGAIN;
}

void AcceptJob::prepareSqe(struct io_uring_sqe* sqe) {
    io_uring_prep_multishot_accept(sqe, server_fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
}

bool AcceptJob::start(Server& server) {
    struct io_uring_sqe* sqe = server.registerJob(this);
    if (!sqe) {
        return false;
    }
    prepareSqe(sqe);
    server.submit();
    return true;
}

std::optional<IoJob::CleanupCallback> AcceptJob::handleCompletion(Server& server, struct io_uring_cqe* cqe) {
    int result = cqe->res;
    bool more = cqe->flags & IORING_CQE_F_MORE;

    if (result < 0) {
        int error = -result;
        if (on_error_) {
            on_error_(error);
        }
        if (more) {
            return std::nullopt;
        }
        if (isTransient(error)) {
            if (start(server)) {
                return std::nullopt;
            }
            Logger::getInstance().logError("AcceptJob: no SQE available to resume accepting");
        }
        return cleanupAcceptJob;
    }

    if (result > 0 && on_connection_) {
        on_connection_(result);
    }

    if (!more && !start(server)) {
        Logger::getInstance().logError("AcceptJob: no SQE available to resume accepting");
        return cleanupAcceptJob;
    }
    return std::nullopt;
}

} // namespace stoa
