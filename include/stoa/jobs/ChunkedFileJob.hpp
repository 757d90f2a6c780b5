#pragma once

#include "stoa/jobs/IoJob.hpp"
#include <cstdint>
#include <functional>
#include <memory>

namespace stoa {

/**
 * Sends a file with chunked transfer coding: read a block, write it framed
 * as one chunk, repeat, then write the zero-length last chunk.
 *
 * The job owns file_fd and closes it before either callback runs. Reading
 * stops at EOF or after length bytes, whichever comes first.
 */
class ChunkedFileJob : public IoJob {
public:
    using CompletionCallback = std::function<void(int client_fd, size_t bytes_sent)>;
    using ErrorCallback = std::function<void(int client_fd, int error)>;

    static ChunkedFileJob* createFromPool(int client_fd, int file_fd, uint64_t length,
                                          CompletionCallback on_complete = nullptr,
                                          ErrorCallback on_error = nullptr);
    static void freePoolAllocated(ChunkedFileJob* job);

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(Server& server, struct io_uring_cqe* cqe) override;

    // false when nothing could be submitted; the caller still owns the job then
    bool start(Server& server);

    ChunkedFileJob(int client_fd, int file_fd, uint64_t length);
    ~ChunkedFileJob();

private:
    enum class State {
        Reading,
        Writing,
        WritingLastChunk
    };

    bool submit(Server& server);
    void frameChunk(size_t data_length);
    void prepareLastChunk();
    void closeFile();

    State state_;
    int client_fd_;
    int file_fd_;
    uint64_t offset_;
    uint64_t remaining_;
    size_t bytes_sent_;

    std::unique_ptr<char[]> buffer_;
    size_t write_pos_;
    size_t write_end_;

    CompletionCallback on_complete_;
    ErrorCallback on_error_;

    static constexpr size_t CHUNK_DATA_SIZE = 64 * 1024;
    // Room for the hex size line in front of the data
    static constexpr size_t HEADER_ROOM = 32;
    static constexpr size_t BUFFER_SIZE = HEADER_ROOM + CHUNK_DATA_SIZE + 2;
};

} // namespace stoa
