#include "stoa/jobs/WriteJob.hpp"
#include "stoa/Server.hpp"
#include "stoa/logger/Logger.hpp"
#include "stoa/util/PoolManager.hpp"
#include <cerrno>
#include <liburing.h>

// Every response head and buffered body goes through one of these
template<>
constexpr size_t stoa::PoolManager::getPoolCapacity<stoa::WriteJob>() {
    return 10000;
}

namespace {
    void cleanupWriteJob(stoa::IoJob* job) {
        stoa::PoolManager::deallocate(static_cast<stoa::WriteJob*>(job));
    }
}

namespace stoa {

WriteJob::WriteJob(int fd, std::string data)
    : fd_(fd), data_(std::move(data)), bytes_written_(0) {
}

WriteJob* WriteJob::createFromPool(int fd, std::string data,
                                   CompletionCallback on_complete,
                                   ErrorCallback on_error) {
    WriteJob* job = PoolManager::allocate<WriteJob>(fd, std::move(data));
    if (!job) {
        return nullptr;
    }
    job->on_complete_ = std::move(on_complete);
    job->on_error_ = std::move(on_error);
    return job;
}

void WriteJob::freePoolAllocated(WriteJob* job) {
    if (job) {
        PoolManager::deallocate<WriteJob>(job);
    }
}

void WriteJob::prepareSqe(struct io_uring_sqe* sqe) {
    io_uring_prep_write(sqe, fd_, data_.data() + bytes_written_,
                        static_cast<unsigned>(data_.size() - bytes_written_), 0);
}

bool WriteJob::start(Server& server) {
    return submitWrite(server);
}

bool WriteJob::submitWrite(Server& server) {
    struct io_uring_sqe* sqe = server.registerJob(this);
    if (!sqe) {
        // Flush what is queued to free up submission slots
        int flush_ret = server.submit();
        if (flush_ret < 0) {
            Logger::getInstance().logError("WriteJob: cannot flush submissions: error=" + std::to_string(-flush_ret));
            return false;
        }
        sqe = server.registerJob(this);
        if (!sqe) {
            Logger::getInstance().logError("WriteJob: no SQE available");
            return false;
        }
    }

    prepareSqe(sqe);
    int ret = server.submit();
    if (ret < 0) {
        Logger::getInstance().logError("WriteJob: io_uring_submit failed: error=" + std::to_string(-ret));
        return false;
    }
    return true;
}

std::optional<IoJob::CleanupCallback> WriteJob::handleCompletion(Server& server, struct io_uring_cqe* cqe) {
    int result = cqe->res;

    if (result < 0) {
        if (on_error_) {
            on_error_(fd_, -result);
        }
        return cleanupWriteJob;
    }
    if (result == 0 && bytes_written_ < data_.size()) {
        if (on_error_) {
            on_error_(fd_, EPIPE);
        }
        return cleanupWriteJob;
    }

    bytes_written_ += static_cast<size_t>(result);
    if (bytes_written_ >= data_.size()) {
        if (on_complete_) {
            on_complete_(fd_, bytes_written_);
        }
        return cleanupWriteJob;
    }

    if (!submitWrite(server)) {
        if (on_error_) {
            on_error_(fd_, EAGAIN);
        }
        return cleanupWriteJob;
    }
    return std::nullopt;
}

} // namespace stoa
