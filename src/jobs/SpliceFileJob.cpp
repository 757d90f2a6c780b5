#include "stoa/jobs/SpliceFileJob.hpp"
#include "stoa/Config.hpp"
#include "stoa/Server.hpp"
#include "stoa/logger/Logger.hpp"
#include "stoa/util/PoolManager.hpp"
#include <algorithm>
#include <cerrno>
#include <fcntl.h>
#include <liburing.h>
#include <unistd.h>

template<>
constexpr size_t stoa::PoolManager::getPoolCapacity<stoa::SpliceFileJob>() {
    return 1000;
}

namespace {
    void cleanupSpliceFileJob(stoa::IoJob* job) {
        stoa::PoolManager::deallocate(static_cast<stoa::SpliceFileJob*>(job));
    }
}

namespace stoa {

SpliceFileJob::SpliceFileJob(int client_fd, int file_fd, uint64_t offset, uint64_t length)
    : stage_(Stage::FileToPipe)
    , client_fd_(client_fd)
    , file_fd_(file_fd)
    , offset_(offset)
    , remaining_(length)
    , total_transferred_(0)
    , bytes_in_pipe_(0)
    , pending_operations_(0)
    , error_(0) {
    pipe_fds_[0] = -1;
    pipe_fds_[1] = -1;
}

SpliceFileJob::~SpliceFileJob() {
    closeFile();
    closePipe();
}

SpliceFileJob* SpliceFileJob::createFromPool(int client_fd, int file_fd, uint64_t offset, uint64_t length,
                                             CompletionCallback on_complete,
                                             ErrorCallback on_error) {
    SpliceFileJob* job = PoolManager::allocate<SpliceFileJob>(client_fd, file_fd, offset, length);
    if (job) {
        job->on_complete_ = std::move(on_complete);
        job->on_error_ = std::move(on_error);
    }
    return job;
}

void SpliceFileJob::freePoolAllocated(SpliceFileJob* job) {
    if (job) {
        PoolManager::deallocate<SpliceFileJob>(job);
    }
}

void SpliceFileJob::prepareSqe(struct io_uring_sqe* sqe) {
    // Single-op stage used for draining; linked pairs are prepared in startLinkedSplice
    io_uring_prep_splice(sqe, pipe_fds_[0], -1, client_fd_, -1,
                         static_cast<unsigned>(bytes_in_pipe_), 0);
}

bool SpliceFileJob::start(Server& server) {
    if (::pipe2(pipe_fds_, O_CLOEXEC) < 0) {
        Logger::getInstance().logError("SpliceFileJob: pipe2() failed: errno=" + std::to_string(errno));
        return false;
    }
    if (remaining_ == 0) {
        // Nothing to send; complete through the ring so callers never see a synchronous callback
        struct io_uring_sqe* sqe = server.registerJob(this);
        if (!sqe) {
            return false;
        }
        io_uring_prep_nop(sqe);
        stage_ = Stage::PipeToSocket;
        pending_operations_ = 1;
        server.submit();
        return true;
    }
    return startLinkedSplice(server);
}

bool SpliceFileJob::startLinkedSplice(Server& server) {
    if (server.sqSpaceLeft() < 2) {
        server.submit();
        if (server.sqSpaceLeft() < 2) {
            Logger::getInstance().logError("SpliceFileJob: no SQEs available for linked splice");
            return false;
        }
    }

    unsigned chunk_size = static_cast<unsigned>(std::min<uint64_t>(remaining_, SPLICE_CHUNK_SIZE));

    struct io_uring_sqe* sqe1 = server.registerJob(this);
    io_uring_prep_splice(sqe1, file_fd_, static_cast<int64_t>(offset_), pipe_fds_[1], -1, chunk_size, 0);
    sqe1->flags |= IOSQE_IO_LINK;

    struct io_uring_sqe* sqe2 = server.registerJob(this);
    io_uring_prep_splice(sqe2, pipe_fds_[0], -1, client_fd_, -1, chunk_size, 0);

    stage_ = Stage::FileToPipe;
    pending_operations_ = 2;
    server.submit();
    return true;
}

bool SpliceFileJob::drainPipeToSocket(Server& server) {
    struct io_uring_sqe* sqe = server.registerJob(this);
    if (!sqe) {
        server.submit();
        sqe = server.registerJob(this);
        if (!sqe) {
            Logger::getInstance().logError("SpliceFileJob: no SQE available to drain pipe");
            return false;
        }
    }
    prepareSqe(sqe);
    stage_ = Stage::PipeToSocket;
    pending_operations_ = 1;
    server.submit();
    return true;
}

std::optional<IoJob::CleanupCallback> SpliceFileJob::handleCompletion(Server& server, struct io_uring_cqe* cqe) {
    int result = cqe->res;
    --pending_operations_;

    if (stage_ == Stage::FileToPipe) {
        if (result < 0) {
            error_ = -result;
        } else if (result == 0) {
            // File shorter than the length we promised the peer
            error_ = EIO;
        } else {
            offset_ += static_cast<uint64_t>(result);
            bytes_in_pipe_ += static_cast<size_t>(result);
            remaining_ -= std::min<uint64_t>(remaining_, static_cast<uint64_t>(result));
        }
        stage_ = Stage::PipeToSocket;
    } else if (result == -ECANCELED && pending_operations_ == 0 && bytes_in_pipe_ > 0) {
        // Link broken by a short file -> pipe splice; drained below
    } else if (result < 0) {
        if (error_ == 0 && result != -ECANCELED) {
            error_ = -result;
        }
    } else if (result == 0 && bytes_in_pipe_ > 0) {
        error_ = EPIPE;
    } else {
        total_transferred_ += static_cast<size_t>(result);
        bytes_in_pipe_ -= std::min(bytes_in_pipe_, static_cast<size_t>(result));
    }

    if (pending_operations_ > 0) {
        return std::nullopt;
    }

    if (error_ == 0) {
        if (bytes_in_pipe_ > 0) {
            if (drainPipeToSocket(server)) {
                return std::nullopt;
            }
            error_ = EAGAIN;
        } else if (remaining_ > 0) {
            if (startLinkedSplice(server)) {
                return std::nullopt;
            }
            error_ = EAGAIN;
        }
    }

    closeFile();
    if (error_ != 0) {
        STOA_DEBUG_LOG("SpliceFileJob: fd=" << client_fd_ << " failed error=" << error_);
        if (on_error_) {
            on_error_(client_fd_, error_);
        }
    } else {
        STOA_DEBUG_LOG("SpliceFileJob: fd=" << client_fd_ << " sent " << total_transferred_ << " bytes");
        if (on_complete_) {
            on_complete_(client_fd_, total_transferred_);
        }
    }
    return cleanupSpliceFileJob;
}

void SpliceFileJob::closeFile() {
    if (file_fd_ >= 0) {
        ::close(file_fd_);
        file_fd_ = -1;
    }
}

void SpliceFileJob::closePipe() {
    for (int& fd : pipe_fds_) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

} // namespace stoa
