#pragma once

#include "stoa/jobs/IoJob.hpp"
#include "stoa/Server.hpp"
#include "stoa/ring_buffer/BufferRingCoordinator.hpp"
#include "stoa/util/ProvidedBufferToken.hpp"
#include "LockFreeMemoryPool.h"
#include <cerrno>
#include <concepts>
#include <liburing.h>
#include <memory>

namespace stoa {

/**
 * What MultishotRecvJob needs from its handler:
 * onDataToken gets each received buffer, onError the terminal result
 * (0 for EOF, negative errno otherwise).
 */
template<typename H>
concept ResponseHandler = requires(H handler,
                                   std::shared_ptr<ProvidedBufferToken> token,
                                   int error) {
    { handler.onDataToken(token) } -> std::same_as<void>;
    { handler.onError(error) } -> std::same_as<void>;
};

/**
 * Persistent multishot recv using the server's provided buffer ring.
 *
 * The kernel ends a multishot without error when the buffer ring runs dry
 * or on some internal conditions; the job rearms itself in both cases and
 * only reports EOF and real errors to the handler, after which it frees
 * itself.
 */
template<ResponseHandler Handler>
class MultishotRecvJob : public IoJob {
public:
    static MultishotRecvJob* createFromPool(int fd, Handler handler);
    static void freePoolAllocated(MultishotRecvJob* job);

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(Server& server, struct io_uring_cqe* cqe) override;

    // false when no SQE was available; the caller still owns the job then
    bool start(Server& server);

    MultishotRecvJob(int fd, Handler handler);

private:
    std::optional<CleanupCallback> terminate(int result);
    static void cleanupMultishotRecvJob(IoJob* job);

    int fd_;
    Handler handler_;
};

template<ResponseHandler Handler>
MultishotRecvJob<Handler>::MultishotRecvJob(int fd, Handler handler)
    : fd_(fd)
    , handler_(std::move(handler)) {
}

template<ResponseHandler Handler>
MultishotRecvJob<Handler>* MultishotRecvJob<Handler>::createFromPool(int fd, Handler handler) {
    return lfmemorypool::lockfree_pool_alloc_fast<MultishotRecvJob<Handler>>(fd, std::move(handler));
}

template<ResponseHandler Handler>
void MultishotRecvJob<Handler>::freePoolAllocated(MultishotRecvJob* job) {
    if (job) {
        lfmemorypool::lockfree_pool_free_fast<MultishotRecvJob<Handler>>(job);
    }
}

template<ResponseHandler Handler>
void MultishotRecvJob<Handler>::prepareSqe(struct io_uring_sqe* sqe) {
    io_uring_prep_recv_multishot(sqe, fd_, nullptr, 0, 0);
    sqe->flags |= IOSQE_BUFFER_SELECT;
    io_uring_sqe_set_data(sqe, this);
}

template<ResponseHandler Handler>
bool MultishotRecvJob<Handler>::start(Server& server) {
    struct io_uring_sqe* sqe = server.registerJob(this);
    if (!sqe) {
        server.submit();
        sqe = server.registerJob(this);
        if (!sqe) {
            return false;
        }
    }
    prepareSqe(sqe);
    sqe->buf_group = static_cast<__u16>(server.getBufferGroupId());
    server.submit();
    return true;
}

template<ResponseHandler Handler>
std::optional<IoJob::CleanupCallback> MultishotRecvJob<Handler>::handleCompletion(
    Server& server, struct io_uring_cqe* cqe) {
    int result = cqe->res;
    bool more = cqe->flags & IORING_CQE_F_MORE;

    if (result == -ENOBUFS) {
        // Buffer ring exhausted; buffers come back as tokens are released
        if (!more && !start(server)) {
            return terminate(-ENOBUFS);
        }
        return std::nullopt;
    }
    if (result <= 0) {
        return terminate(result);
    }

    auto buffer_coordinator = server.getBufferRingCoordinator();
    unsigned buffer_id = cqe->flags >> IORING_CQE_BUFFER_SHIFT;
    void* buffer_ptr = buffer_coordinator ? buffer_coordinator->getBufferPtr(buffer_id) : nullptr;
    if (!buffer_ptr) {
        return terminate(-EINVAL);
    }

    auto token = std::make_shared<ProvidedBufferToken>(
        [buffer_coordinator](unsigned buf_id) {
            buffer_coordinator->recycleBuffer(buf_id);
        },
        buffer_id,
        static_cast<char*>(buffer_ptr),
        static_cast<size_t>(result));
    handler_.onDataToken(std::move(token));

    if (!more && !start(server)) {
        return terminate(-EAGAIN);
    }
    return std::nullopt;
}

template<ResponseHandler Handler>
std::optional<IoJob::CleanupCallback> MultishotRecvJob<Handler>::terminate(int result) {
    handler_.onError(result);
    return cleanupMultishotRecvJob;
}

template<ResponseHandler Handler>
void MultishotRecvJob<Handler>::cleanupMultishotRecvJob(IoJob* job) {
    freePoolAllocated(static_cast<MultishotRecvJob<Handler>*>(job));
}

} // namespace stoa
