#pragma once

#include "stoa/jobs/IoJob.hpp"
#include <functional>
#include <linux/time_types.h>
#include <openssl/ssl.h>

namespace stoa {

/**
 * Server-side TLS handshake that ends with the socket in kernel TLS mode.
 *
 * SSL_accept is driven by poll operations, each linked to a timeout of
 * STOA_KTLS_HANDSHAKE_TIMEOUT_MS so a stalled peer cannot hold the job.
 * On success the SSL object passes to the success callback, which owns it
 * from then on. The job returns itself to its pool only once every poll and
 * timeout it submitted has completed.
 */
class KTLSJob : public IoJob {
public:
    enum class State {
        HANDSHAKING,
        KTLS_READY,
        ERROR_STATE
    };

    using SuccessCallback = std::function<void(int client_fd, SSL* ssl)>;
    using ErrorCallback = std::function<void(int client_fd, int error_code)>;

    static KTLSJob* createFromPool(int client_fd, SSL_CTX* ssl_ctx,
                                   SuccessCallback on_success, ErrorCallback on_error);
    static void freePoolAllocated(KTLSJob* job);

    ~KTLSJob() override;

    void prepareSqe(struct io_uring_sqe* sqe) override;
    std::optional<CleanupCallback> handleCompletion(Server& server, struct io_uring_cqe* cqe) override;

    // false when nothing could be submitted; the caller still owns the job then
    bool start(Server& server);

    State getState() const { return state_; }

    KTLSJob(int client_fd, SSL_CTX* ssl_ctx, SuccessCallback on_success, ErrorCallback on_error);

private:
    bool initializeSSL();
    void performHandshakeStep(Server& server);
    void completeHandshake();
    bool kernelTLSActive() const;
    void fail(int error_code);
    void submitPollOperation(Server& server, short events);

    int client_fd_;
    SSL_CTX* ssl_ctx_;
    SSL* ssl_;
    State state_;
    int pending_operations_;
    __kernel_timespec timeout_;

    SuccessCallback on_success_;
    ErrorCallback on_error_;
};

} // namespace stoa
