#pragma once

#include "stoa/jobs/IoJob.hpp"
#include <cstdint>
#include <functional>

namespace stoa {

/**
 * Zero-copy file transfer: splice(file -> pipe) linked to
 * splice(pipe -> socket), one chunk per linked pair.
 *
 * The job owns file_fd and closes it before either callback runs. A short
 * file -> pipe splice breaks the link, so whatever reached the pipe is
 * drained with a separate pipe -> socket splice before the next pair.
 */
class SpliceFileJob : public IoJob {
public:
    using CompletionCallback = std::function<void(int client_fd, size_t bytes_transferred)>;
    using ErrorCallback = std::function<void(int client_fd, int error)>;

    static SpliceFileJob* createFromPool(int client_fd, int file_fd, uint64_t offset, uint64_t length,
                                         CompletionCallback on_complete = nullptr,
                                         ErrorCallback on_error = nullptr);
    static void freePoolAllocated(SpliceFileJob* job);

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(Server& server, struct io_uring_cqe* cqe) override;

    // false when the transfer could not be started; the caller still owns the job then
    bool start(Server& server);

    SpliceFileJob(int client_fd, int file_fd, uint64_t offset, uint64_t length);
    ~SpliceFileJob();

private:
    enum class Stage {
        FileToPipe,
        PipeToSocket
    };

    bool startLinkedSplice(Server& server);
    bool drainPipeToSocket(Server& server);
    void closeFile();
    void closePipe();

    Stage stage_;
    int client_fd_;
    int file_fd_;
    uint64_t offset_;
    uint64_t remaining_;
    size_t total_transferred_;

    int pipe_fds_[2];
    size_t bytes_in_pipe_;
    int pending_operations_;
    int error_;

    CompletionCallback on_complete_;
    ErrorCallback on_error_;

    static constexpr size_t SPLICE_CHUNK_SIZE = 64 * 1024;
};

} // namespace stoa
