#pragma once

#include "IoJob.hpp"
#include <functional>

namespace stoa {

/**
 * Multishot accept on a listening socket.
 * Accepted sockets are non-blocking and close-on-exec. The job resubmits
 * itself whenever the kernel ends the multishot, and frees itself once an
 * error leaves the listening socket unusable.
 */
class AcceptJob : public IoJob {
public:
    using ConnectionCallback = std::function<void(int client_fd)>;
    using ErrorCallback = std::function<void(int error)>;

    static AcceptJob* create(int server_fd,
                             ConnectionCallback on_connection,
                             ErrorCallback on_error = nullptr);
    static void freePoolAllocated(AcceptJob* job);

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(Server& server, struct io_uring_cqe* cqe) override;

    // false when no SQE was available; the caller still owns the job then
    bool start(Server& server);

    explicit AcceptJob(int server_fd);

private:
    static bool isTransient(int error);
    static void cleanupAcceptJob(IoJob* job);

    int server_fd_;
    ConnectionCallback on_connection_;
    ErrorCallback on_error_;
};

} // namespace stoa
