#pragma once

#include "stoa/http/ConnectionTransport.hpp"
#include <deque>
#include <memory>
#include <openssl/ssl.h>
#include <string>

namespace stoa {

class Server;

/**
 * ConnectionTransport over an accepted socket on the io_uring loop.
 *
 * Outbound items go out strictly in order with at most one write or file
 * transfer in flight; consecutive byte items are coalesced into one write.
 * Jobs in flight hold a shared_ptr to the transport, so the socket (and the
 * kTLS session, when there is one) is closed only after the last of them
 * has completed. close() shuts the socket down, which also ends the
 * connection's multishot recv.
 */
class UringTransport : public ConnectionTransport,
                       public std::enable_shared_from_this<UringTransport> {
public:
    // Takes ownership of fd and ssl
    UringTransport(Server& server, int fd, bool unix_socket, SSL* ssl = nullptr);
    ~UringTransport() override;

    UringTransport(const UringTransport&) = delete;
    UringTransport& operator=(const UringTransport&) = delete;

    void send(std::string data) override;
    void streamFile(const std::string& path, uint64_t size, bool chunked, StreamCallback done) override;
    void closeAfterWriting() override;
    void close() override;
    std::string peerAddress() const override;
    bool isUnixSocket() const override { return unix_socket_; }
    void setErrorHandler(ErrorHandler handler) override { on_error_ = std::move(handler); }

    int fd() const { return fd_; }
    bool isClosed() const { return closed_; }
    bool isTLS() const { return ssl_ != nullptr; }

    static constexpr size_t MAX_COALESCED_WRITE = 64 * 1024;

private:
    struct Outbound {
        std::string data;
        // >= 0 for a file transfer
        int file_fd = -1;
        uint64_t size = 0;
        bool chunked = false;
        StreamCallback done;
    };

    void pump();
    void startWrite();
    void startFile(Outbound item);
    void onWriteDone();
    void onFileDone(const StreamCallback& done, int error);
    void fail(int error);
    void dropQueue(bool notify);
    void ensureWritable() const;

    Server& server_;
    int fd_;
    bool unix_socket_;
    SSL* ssl_;

    std::deque<Outbound> queue_;
    bool in_flight_ = false;
    bool close_after_writing_ = false;
    bool closed_ = false;
    ErrorHandler on_error_;
};

} // namespace stoa
