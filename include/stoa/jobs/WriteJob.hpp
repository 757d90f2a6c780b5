#pragma once

#include "IoJob.hpp"
#include <functional>
#include <string>

namespace stoa {

/**
 * Writes one owned buffer to a file descriptor, resubmitting after partial
 * writes until everything is out. Pool-allocated through PoolManager.
 */
class WriteJob : public IoJob {
public:
    using CompletionCallback = std::function<void(int fd, size_t bytes_written)>;
    using ErrorCallback = std::function<void(int fd, int error)>;

    static WriteJob* createFromPool(int fd, std::string data,
                                    CompletionCallback on_complete = nullptr,
                                    ErrorCallback on_error = nullptr);
    static void freePoolAllocated(WriteJob* job);

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(Server& server, struct io_uring_cqe* cqe) override;

    // false when nothing could be submitted; the caller still owns the job then
    bool start(Server& server);

    WriteJob(int fd, std::string data);

private:
    bool submitWrite(Server& server);

    int fd_;
    std::string data_;
    size_t bytes_written_;

    CompletionCallback on_complete_;
    ErrorCallback on_error_;
};

} // namespace stoa
