#pragma once

#include <optional>

// Forward declarations to keep liburing.h out of this header
struct io_uring_cqe;
struct io_uring_sqe;

namespace stoa {

class Server;

/**
 * Base interface for all io_uring operations.
 * A job owns the state of one operation and is passed as the SQE user data.
 */
class IoJob {
public:
    using CleanupCallback = void(*)(IoJob*);

    virtual ~IoJob() = default;

    virtual void prepareSqe(struct io_uring_sqe* sqe) = 0;

    /**
     * Handle one completion for this job.
     * @return cleanup to run once handleCompletion has returned (usually
     *         handing the job back to its pool), or nullopt while the job
     *         still has operations in flight
     */
    virtual std::optional<CleanupCallback> handleCompletion(Server& server, struct io_uring_cqe* cqe) = 0;
};

} // namespace stoa
