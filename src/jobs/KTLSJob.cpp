#include "stoa/jobs/KTLSJob.hpp"
#include "stoa/Config.hpp"
#include "stoa/Server.hpp"
#include "stoa/logger/Logger.hpp"
#include "stoa/util/PoolManager.hpp"
#include <cerrno>
#include <cstring>
#include <liburing.h>
#include <openssl/err.h>
#include <poll.h>

#ifndef STOA_KTLS_POOL_SIZE
#define STOA_KTLS_POOL_SIZE 5000
#endif

template<>
constexpr size_t stoa::PoolManager::getPoolCapacity<stoa::KTLSJob>() {
    return STOA_KTLS_POOL_SIZE;
}

namespace {
    void cleanupKTLSJob(stoa::IoJob* job) {
        stoa::PoolManager::deallocate(static_cast<stoa::KTLSJob*>(job));
    }
}

namespace stoa {

KTLSJob* KTLSJob::createFromPool(int client_fd, SSL_CTX* ssl_ctx,
                                 SuccessCallback on_success, ErrorCallback on_error) {
    return PoolManager::allocate<KTLSJob>(client_fd, ssl_ctx, std::move(on_success), std::move(on_error));
}

void KTLSJob::freePoolAllocated(KTLSJob* job) {
    if (job) {
        PoolManager::deallocate<KTLSJob>(job);
    }
}

KTLSJob::KTLSJob(int client_fd, SSL_CTX* ssl_ctx, SuccessCallback on_success, ErrorCallback on_error)
    : client_fd_(client_fd)
    , ssl_ctx_(ssl_ctx)
    , ssl_(nullptr)
    , state_(State::HANDSHAKING)
    , pending_operations_(0)
    , timeout_{}
    , on_success_(std::move(on_success))
    , on_error_(std::move(on_error)) {
    timeout_.tv_sec = STOA_KTLS_HANDSHAKE_TIMEOUT_MS / 1000;
    timeout_.tv_nsec = (STOA_KTLS_HANDSHAKE_TIMEOUT_MS % 1000) * 1000000LL;
}

KTLSJob::~KTLSJob() {
    // Only set while the handshake has not handed the session over
    if (ssl_) {
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
}

bool KTLSJob::initializeSSL() {
    if (!ssl_ctx_) {
        Logger::getInstance().logError("KTLSJob: no SSL context");
        return false;
    }
    ssl_ = SSL_new(ssl_ctx_);
    if (!ssl_) {
        Logger::getInstance().logError("KTLSJob: SSL_new failed");
        return false;
    }
    SSL_set_options(ssl_, SSL_OP_ENABLE_KTLS);
    if (!SSL_set_fd(ssl_, client_fd_)) {
        Logger::getInstance().logError("KTLSJob: SSL_set_fd failed for fd=" + std::to_string(client_fd_));
        SSL_free(ssl_);
        ssl_ = nullptr;
        return false;
    }
    return true;
}

bool KTLSJob::start(Server& server) {
    if (!ssl_ && !initializeSSL()) {
        return false;
    }
    struct io_uring_sqe* sqe = server.registerJob(this);
    if (!sqe) {
        return false;
    }
    prepareSqe(sqe);
    pending_operations_ = 1;
    server.submit();
    return true;
}

void KTLSJob::prepareSqe(struct io_uring_sqe* sqe) {
    // The first SSL_accept runs from the completion, on the loop's schedule
    io_uring_prep_nop(sqe);
}

std::optional<IoJob::CleanupCallback> KTLSJob::handleCompletion(Server& server, struct io_uring_cqe* cqe) {
    if (pending_operations_ > 0) {
        --pending_operations_;
    }

    if (state_ == State::HANDSHAKING) {
        int result = cqe->res;
        if (result == -ECANCELED) {
            // The other half of a poll/timeout pair finished first
        } else if (result < 0) {
            Logger::getInstance().logError("KTLSJob: handshake poll failed for fd=" + std::to_string(client_fd_) +
                                           ": " + std::string(strerror(-result)) +
                                           (result == -ETIME ? " (handshake step timed out)" : ""));
            fail(-result);
        } else {
            performHandshakeStep(server);
        }
    }

    if (state_ != State::HANDSHAKING && pending_operations_ == 0) {
        return cleanupKTLSJob;
    }
    return std::nullopt;
}

void KTLSJob::performHandshakeStep(Server& server) {
    ERR_clear_error();
    int ret = SSL_accept(ssl_);
    if (ret == 1) {
        completeHandshake();
        return;
    }

    int ssl_error = SSL_get_error(ssl_, ret);
    switch (ssl_error) {
    case SSL_ERROR_WANT_READ:
        submitPollOperation(server, POLLIN);
        break;
    case SSL_ERROR_WANT_WRITE:
        submitPollOperation(server, POLLOUT);
        break;
    default: {
        char reason[256] = "peer closed during handshake";
        if (unsigned long code = ERR_get_error()) {
            ERR_error_string_n(code, reason, sizeof(reason));
        }
        Logger::getInstance().logError("KTLSJob: handshake failed for fd=" + std::to_string(client_fd_) +
                                       ": " + reason);
        fail(EPROTO);
        break;
    }
    }
}

void KTLSJob::completeHandshake() {
    if (!kernelTLSActive()) {
        const char* version = SSL_get_version(ssl_);
        const char* cipher = SSL_get_cipher_name(ssl_);
        Logger::getInstance().logError(std::string("KTLSJob: kernel TLS not available for fd=") +
                                       std::to_string(client_fd_) + " (" + (version ? version : "unknown") +
                                       ", " + (cipher ? cipher : "unknown") + ")");
        fail(EPROTONOSUPPORT);
        return;
    }

    STOA_DEBUG_LOG("KTLSJob: kTLS enabled for fd=" << client_fd_);
    state_ = State::KTLS_READY;
    SSL* ssl = ssl_;
    ssl_ = nullptr;
    if (on_success_) {
        on_success_(client_fd_, ssl);
    } else {
        SSL_free(ssl);
    }
}

bool KTLSJob::kernelTLSActive() const {
    BIO* wbio = SSL_get_wbio(ssl_);
    BIO* rbio = SSL_get_rbio(ssl_);
    return wbio && rbio && BIO_get_ktls_send(wbio) && BIO_get_ktls_recv(rbio);
}

void KTLSJob::fail(int error_code) {
    state_ = State::ERROR_STATE;
    if (on_error_) {
        on_error_(client_fd_, error_code);
    }
}

void KTLSJob::submitPollOperation(Server& server, short events) {
    if (server.sqSpaceLeft() < 2) {
        server.submit();
        if (server.sqSpaceLeft() < 2) {
            Logger::getInstance().logError("KTLSJob: no SQEs available for handshake poll");
            fail(EAGAIN);
            return;
        }
    }

    struct io_uring_sqe* sqe = server.registerJob(this);
    io_uring_prep_poll_add(sqe, client_fd_, static_cast<unsigned>(events));
    sqe->flags |= IOSQE_IO_LINK;

    struct io_uring_sqe* tsqe = server.registerJob(this);
    io_uring_prep_link_timeout(tsqe, &timeout_, 0);

    pending_operations_ += 2;
    server.submit();
}

} // namespace stoa
