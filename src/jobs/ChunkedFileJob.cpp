#include "stoa/jobs/ChunkedFileJob.hpp"
#include "stoa/Config.hpp"
#include "stoa/Server.hpp"
#include "stoa/http/HttpTypes.hpp"
#include "stoa/logger/Logger.hpp"
#include "stoa/util/PoolManager.hpp"
#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <liburing.h>
#include <unistd.h>

template<>
constexpr size_t stoa::PoolManager::getPoolCapacity<stoa::ChunkedFileJob>() {
    return 1000;
}

namespace {
    void cleanupChunkedFileJob(stoa::IoJob* job) {
        stoa::PoolManager::deallocate(static_cast<stoa::ChunkedFileJob*>(job));
    }
}

namespace stoa {

ChunkedFileJob::ChunkedFileJob(int client_fd, int file_fd, uint64_t length)
    : state_(State::Reading)
    , client_fd_(client_fd)
    , file_fd_(file_fd)
    , offset_(0)
    , remaining_(length)
    , bytes_sent_(0)
    , buffer_(std::make_unique<char[]>(BUFFER_SIZE))
    , write_pos_(0)
    , write_end_(0) {
}

ChunkedFileJob::~ChunkedFileJob() {
    closeFile();
}

ChunkedFileJob* ChunkedFileJob::createFromPool(int client_fd, int file_fd, uint64_t length,
                                               CompletionCallback on_complete,
                                               ErrorCallback on_error) {
    ChunkedFileJob* job = PoolManager::allocate<ChunkedFileJob>(client_fd, file_fd, length);
    if (job) {
        job->on_complete_ = std::move(on_complete);
        job->on_error_ = std::move(on_error);
    }
    return job;
}

void ChunkedFileJob::freePoolAllocated(ChunkedFileJob* job) {
    if (job) {
        PoolManager::deallocate<ChunkedFileJob>(job);
    }
}

void ChunkedFileJob::prepareSqe(struct io_uring_sqe* sqe) {
    if (state_ == State::Reading) {
        unsigned want = static_cast<unsigned>(std::min<uint64_t>(remaining_, CHUNK_DATA_SIZE));
        io_uring_prep_read(sqe, file_fd_, buffer_.get() + HEADER_ROOM, want, offset_);
    } else {
        io_uring_prep_write(sqe, client_fd_, buffer_.get() + write_pos_,
                            static_cast<unsigned>(write_end_ - write_pos_), 0);
    }
}

bool ChunkedFileJob::start(Server& server) {
    if (remaining_ == 0) {
        prepareLastChunk();
    }
    return submit(server);
}

bool ChunkedFileJob::submit(Server& server) {
    struct io_uring_sqe* sqe = server.registerJob(this);
    if (!sqe) {
        server.submit();
        sqe = server.registerJob(this);
        if (!sqe) {
            Logger::getInstance().logError("ChunkedFileJob: no SQE available");
            return false;
        }
    }
    prepareSqe(sqe);
    server.submit();
    return true;
}

void ChunkedFileJob::frameChunk(size_t data_length) {
    char size_line[HEADER_ROOM];
    int n = std::snprintf(size_line, sizeof(size_line), "%zx\r\n", data_length);
    size_t header_length = static_cast<size_t>(n);

    write_pos_ = HEADER_ROOM - header_length;
    std::memcpy(buffer_.get() + write_pos_, size_line, header_length);
    std::memcpy(buffer_.get() + HEADER_ROOM + data_length, "\r\n", 2);
    write_end_ = HEADER_ROOM + data_length + 2;
    state_ = State::Writing;
}

void ChunkedFileJob::prepareLastChunk() {
    std::memcpy(buffer_.get(), LAST_CHUNK.data(), LAST_CHUNK.size());
    write_pos_ = 0;
    write_end_ = LAST_CHUNK.size();
    state_ = State::WritingLastChunk;
}

std::optional<IoJob::CleanupCallback> ChunkedFileJob::handleCompletion(Server& server, struct io_uring_cqe* cqe) {
    int result = cqe->res;
    int error = 0;

    if (result < 0) {
        error = -result;
    } else if (state_ == State::Reading) {
        if (result == 0) {
            // EOF before length; end the body where the file ends
            remaining_ = 0;
            prepareLastChunk();
        } else {
            offset_ += static_cast<uint64_t>(result);
            remaining_ -= std::min<uint64_t>(remaining_, static_cast<uint64_t>(result));
            frameChunk(static_cast<size_t>(result));
        }
    } else if (result == 0) {
        error = EPIPE;
    } else {
        write_pos_ += static_cast<size_t>(result);
        bytes_sent_ += static_cast<size_t>(result);
        if (write_pos_ >= write_end_) {
            if (state_ == State::WritingLastChunk) {
                closeFile();
                STOA_DEBUG_LOG("ChunkedFileJob: fd=" << client_fd_ << " sent " << bytes_sent_ << " bytes");
                if (on_complete_) {
                    on_complete_(client_fd_, bytes_sent_);
                }
                return cleanupChunkedFileJob;
            }
            if (remaining_ == 0) {
                prepareLastChunk();
            } else {
                state_ = State::Reading;
            }
        }
    }

    if (error == 0 && submit(server)) {
        return std::nullopt;
    }

    closeFile();
    if (on_error_) {
        on_error_(client_fd_, error != 0 ? error : EAGAIN);
    }
    return cleanupChunkedFileJob;
}

void ChunkedFileJob::closeFile() {
    if (file_fd_ >= 0) {
        ::close(file_fd_);
        file_fd_ = -1;
    }
}

} // namespace stoa
