#include "stoa/http/UringTransport.hpp"
#include "stoa/Config.hpp"
#include "stoa/Server.hpp"
#include "stoa/http/ErrorReporter.hpp"
#include "stoa/jobs/ChunkedFileJob.hpp"
#include "stoa/jobs/SpliceFileJob.hpp"
#include "stoa/jobs/WriteJob.hpp"
#include "stoa/logger/Logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

namespace stoa {

UringTransport::UringTransport(Server& server, int fd, bool unix_socket, SSL* ssl)
    : server_(server), fd_(fd), unix_socket_(unix_socket), ssl_(ssl) {
}

UringTransport::~UringTransport() {
    dropQueue(false);
    if (ssl_) {
        SSL_free(ssl_);
        ssl_ = nullptr;
    }
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

void UringTransport::ensureWritable() const {
    if (closed_) {
        throw TransmissionError("connection is closed");
    }
    if (close_after_writing_) {
        throw TransmissionError("connection is closing");
    }
}

void UringTransport::send(std::string data) {
    ensureWritable();
    if (data.empty()) {
        return;
    }
    Outbound item;
    item.data = std::move(data);
    queue_.push_back(std::move(item));
    pump();
}

void UringTransport::streamFile(const std::string& path, uint64_t size, bool chunked, StreamCallback done) {
    ensureWritable();

    int file_fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (file_fd < 0) {
        throw TransmissionError("cannot open " + path + ": " + std::string(strerror(errno)));
    }

    Outbound item;
    item.file_fd = file_fd;
    item.size = size;
    item.chunked = chunked;
    item.done = std::move(done);
    queue_.push_back(std::move(item));
    pump();
}

void UringTransport::closeAfterWriting() {
    if (closed_) {
        return;
    }
    close_after_writing_ = true;
    pump();
}

void UringTransport::close() {
    if (closed_) {
        return;
    }
    closed_ = true;
    dropQueue(true);
    // Fails whatever is in flight and ends the multishot recv with EOF
    ::shutdown(fd_, SHUT_RDWR);
    STOA_DEBUG_LOG("UringTransport: fd=" << fd_ << " shut down");
}

std::string UringTransport::peerAddress() const {
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        throw std::system_error(errno, std::system_category(), "getpeername failed");
    }

    char buffer[INET6_ADDRSTRLEN] = {};
    const char* result = nullptr;
    if (addr.ss_family == AF_INET) {
        result = ::inet_ntop(AF_INET, &reinterpret_cast<sockaddr_in*>(&addr)->sin_addr, buffer, sizeof(buffer));
    } else if (addr.ss_family == AF_INET6) {
        result = ::inet_ntop(AF_INET6, &reinterpret_cast<sockaddr_in6*>(&addr)->sin6_addr, buffer, sizeof(buffer));
    } else {
        throw std::system_error(EAFNOSUPPORT, std::system_category(), "peer is not an IP socket");
    }
    if (!result) {
        throw std::system_error(errno, std::system_category(), "inet_ntop failed");
    }
    return buffer;
}

void UringTransport::pump() {
    if (in_flight_ || closed_) {
        return;
    }
    if (queue_.empty()) {
        if (close_after_writing_) {
            close();
        }
        return;
    }

    if (queue_.front().file_fd >= 0) {
        Outbound item = std::move(queue_.front());
        queue_.pop_front();
        startFile(std::move(item));
    } else {
        startWrite();
    }
}

void UringTransport::startWrite() {
    std::string batch = std::move(queue_.front().data);
    queue_.pop_front();
    while (!queue_.empty() && queue_.front().file_fd < 0 &&
           batch.size() + queue_.front().data.size() <= MAX_COALESCED_WRITE) {
        batch += queue_.front().data;
        queue_.pop_front();
    }

    auto self = shared_from_this();
    WriteJob* job = WriteJob::createFromPool(
        fd_, std::move(batch),
        [self](int, size_t) { self->onWriteDone(); },
        [self](int, int error) { self->fail(error); });
    if (!job) {
        Logger::getInstance().logError("UringTransport: WriteJob pool exhausted");
        fail(ENOMEM);
        return;
    }

    in_flight_ = true;
    if (!job->start(server_)) {
        WriteJob::freePoolAllocated(job);
        in_flight_ = false;
        fail(EAGAIN);
    }
}

void UringTransport::startFile(Outbound item) {
    auto self = shared_from_this();
    StreamCallback done = std::move(item.done);
    auto on_complete = [self, done](int, size_t) { self->onFileDone(done, 0); };
    auto on_error = [self, done](int, int error) { self->onFileDone(done, error != 0 ? error : EIO); };

    in_flight_ = true;
    bool started = false;
    if (item.chunked) {
        ChunkedFileJob* job = ChunkedFileJob::createFromPool(fd_, item.file_fd, item.size, on_complete, on_error);
        if (job) {
            item.file_fd = -1;
            started = job->start(server_);
            if (!started) {
                ChunkedFileJob::freePoolAllocated(job);
            }
        }
    } else {
        SpliceFileJob* job = SpliceFileJob::createFromPool(fd_, item.file_fd, 0, item.size, on_complete, on_error);
        if (job) {
            item.file_fd = -1;
            started = job->start(server_);
            if (!started) {
                SpliceFileJob::freePoolAllocated(job);
            }
        }
    }

    if (!started) {
        if (item.file_fd >= 0) {
            ::close(item.file_fd);
        }
        in_flight_ = false;
        Logger::getInstance().logError("UringTransport: cannot start file transfer on fd=" + std::to_string(fd_));
        // done must not run inside the caller's streamFile; nothing may overtake the failed body
        server_.post([self, done] { self->onFileDone(done, EAGAIN); });
        close();
    }
}

void UringTransport::onWriteDone() {
    in_flight_ = false;
    pump();
}

void UringTransport::onFileDone(const StreamCallback& done, int error) {
    in_flight_ = false;
    STOA_DEBUG_LOG("UringTransport: file transfer on fd=" << fd_ << " finished, error=" << error);
    if (done) {
        done(error);
    }
    pump();
}

void UringTransport::fail(int error) {
    in_flight_ = false;
    if (closed_) {
        return;
    }
    close();

    // Report from the loop, never from inside the caller's send()
    auto self = shared_from_this();
    server_.post([self, error] {
        if (self->on_error_) {
            self->on_error_(error);
        }
    });
}

void UringTransport::dropQueue(bool notify) {
    for (Outbound& item : queue_) {
        if (item.file_fd >= 0) {
            ::close(item.file_fd);
        }
        if (notify && item.done) {
            server_.post([done = std::move(item.done)] { done(ECANCELED); });
        }
    }
    queue_.clear();
}

} // namespace stoa
