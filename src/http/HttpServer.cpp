#include "stoa/http/HttpServer.hpp"
#include "stoa/Config.hpp"
#include "stoa/http/HttpConnectionRecvHandler.hpp"
#include "stoa/http/UringTransport.hpp"
#include "stoa/jobs/AcceptJob.hpp"
#include "stoa/jobs/KTLSContextHelper.hpp"
#include "stoa/jobs/KTLSJob.hpp"
#include "stoa/jobs/MultishotRecvJob.hpp"
#include "stoa/logger/Logger.hpp"
#include "stoa/util/PoolDeleter.hpp"
#include "LockFreeMemoryPool.h"
#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using HttpMultishotRecvJob = stoa::MultishotRecvJob<stoa::HttpConnectionRecvHandler>;

// One of each per open connection; cache alignment keeps neighbouring slots
// from sharing lines with the worker threads touching connection state
DEFINE_LOCKFREE_POOL_CACHE_ALIGNED(stoa::HttpConnection, 10000);
DEFINE_LOCKFREE_POOL_CACHE_ALIGNED(stoa::UringTransport, 10000);
DEFINE_LOCKFREE_POOL_CACHE_ALIGNED(HttpMultishotRecvJob, 10000);

namespace stoa {

HttpServer::HttpServer(HttpApplication app, ServerOptions options)
    : options_(std::move(options)),
      context_(std::make_shared<ConnectionContext>(std::move(app), server_, Logger::getInstance())) {
    server_.init(options_.queue_depth);

    context_->options = options_.connection;
    context_->options.verbose = options_.connection.verbose || options_.verbose;
    context_->multiprocess = options_.prefork;

    if (options_.threaded) {
        workers_ = std::make_unique<SimpleWorkerPool>(options_.worker_threads, options_.worker_queue_capacity);
        context_->workers = workers_.get();
    }
}

HttpServer::~HttpServer() {
    server_.stop();
    if (workers_) {
        // Results they post land in the loop's queue and are dropped with it
        workers_->shutdown();
    }
    closeListeners();
    closeConnections();
}

bool HttpServer::listen(int port, const std::string& bind_addr) {
    int server_fd = createServerSocket(port, bind_addr);
    if (server_fd < 0) {
        return false;
    }
    if (!startAccepting(server_fd, ListenerKind::Tcp)) {
        return false;
    }
    Logger::getInstance().logMessage("HttpServer: Listening on " + bind_addr + ":" + std::to_string(localPort()));
    return true;
}

bool HttpServer::listenUnix(const std::string& path) {
    int server_fd = createUnixSocket(path);
    if (server_fd < 0) {
        return false;
    }
    if (!startAccepting(server_fd, ListenerKind::Unix, path)) {
        return false;
    }
    Logger::getInstance().logMessage("HttpServer: Listening on unix:" + path);
    return true;
}

bool HttpServer::listenKTLS(int port, const std::string& cert_path, const std::string& key_path,
                            const std::string& bind_addr) {
    if (!ssl_ctx_) {
        ssl_ctx_ = KTLSContextHelper::createServerContext(cert_path, key_path);
        if (!ssl_ctx_) {
            Logger::getInstance().logError("HttpServer: Failed to create kTLS context");
            return false;
        }
    }

    int server_fd = createServerSocket(port, bind_addr);
    if (server_fd < 0) {
        return false;
    }
    if (!startAccepting(server_fd, ListenerKind::Tls)) {
        return false;
    }
    Logger::getInstance().logMessage("HttpServer: Listening with kTLS on " + bind_addr + ":" + std::to_string(port));
    return true;
}

void HttpServer::run() {
    server_.run();
}

void HttpServer::stop() {
    server_.stop();
}

int HttpServer::localPort() const {
    for (const Listener& listener : listeners_) {
        if (listener.kind == ListenerKind::Unix) {
            continue;
        }
        sockaddr_in addr{};
        socklen_t len = sizeof(addr);
        if (::getsockname(listener.fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            return ntohs(addr.sin_port);
        }
    }
    return -1;
}

bool HttpServer::startAccepting(int server_fd, ListenerKind kind, std::string unix_path) {
    AcceptJob* job = AcceptJob::create(
        server_fd,
        [this, kind](int client_fd) { handleNewConnection(client_fd, kind); },
        [server_fd](int error) {
            Logger::getInstance().logError("HttpServer: accept on fd=" + std::to_string(server_fd) +
                                           " failed: " + std::string(strerror(error)));
        });
    if (!job) {
        Logger::getInstance().logError("HttpServer: AcceptJob pool exhausted");
        ::close(server_fd);
        return false;
    }
    if (!job->start(server_)) {
        Logger::getInstance().logError("HttpServer: no SQE available to start accepting");
        AcceptJob::freePoolAllocated(job);
        ::close(server_fd);
        return false;
    }

    listeners_.push_back(Listener{server_fd, kind, std::move(unix_path)});
    return true;
}

void HttpServer::handleNewConnection(int client_fd, ListenerKind kind) {
    STOA_DEBUG_LOG("HttpServer: accepted fd=" << client_fd);

    switch (kind) {
    case ListenerKind::Unix:
        createConnection(client_fd, true, nullptr);
        break;

    case ListenerKind::Tcp: {
        int one = 1;
        ::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        createConnection(client_fd, false, nullptr);
        break;
    }

    case ListenerKind::Tls: {
        int one = 1;
        ::setsockopt(client_fd, IPPROTO_TCP, TCP_NODELAY, &one, sizeof(one));
        KTLSJob* job = KTLSJob::createFromPool(
            client_fd, ssl_ctx_.get(),
            [this](int fd, SSL* ssl) { handleKTLSReady(fd, ssl); },
            [this](int fd, int error) { handleKTLSError(fd, error); });
        if (!job) {
            Logger::getInstance().logError("HttpServer: KTLSJob pool exhausted, dropping fd=" + std::to_string(client_fd));
            ::close(client_fd);
            return;
        }
        if (!job->start(server_)) {
            Logger::getInstance().logError("HttpServer: cannot start TLS handshake on fd=" + std::to_string(client_fd));
            KTLSJob::freePoolAllocated(job);
            ::close(client_fd);
        }
        break;
    }
    }
}

void HttpServer::handleKTLSReady(int client_fd, SSL* ssl) {
    createConnection(client_fd, false, ssl);
}

void HttpServer::handleKTLSError(int client_fd, int error) {
    Logger::getInstance().logError("HttpServer: TLS handshake failed on fd=" + std::to_string(client_fd) +
                                   ": " + std::strerror(error));
    ::close(client_fd);
}

void HttpServer::createConnection(int client_fd, bool unix_socket, SSL* ssl) {
    auto transport = makeSharedFromPool<UringTransport>(server_, client_fd, unix_socket, ssl);
    if (!transport) {
        Logger::getInstance().logError("HttpServer: connection pool exhausted, dropping fd=" + std::to_string(client_fd));
        if (ssl) {
            SSL_free(ssl);
        }
        ::close(client_fd);
        return;
    }

    auto connection = makeSharedFromPool<HttpConnection>(
        std::shared_ptr<const ConnectionContext>(context_),
        std::static_pointer_cast<ConnectionTransport>(transport));
    if (!connection) {
        Logger::getInstance().logError("HttpServer: connection pool exhausted, dropping fd=" + std::to_string(client_fd));
        // The transport owns the socket now and closes it
        return;
    }
    connection->start();

    auto* recv_job = HttpMultishotRecvJob::createFromPool(client_fd, HttpConnectionRecvHandler{this, client_fd});
    if (!recv_job) {
        Logger::getInstance().logError("HttpServer: recv job pool exhausted, dropping fd=" + std::to_string(client_fd));
        connection->unbind();
        return;
    }

    connections_[client_fd] = ConnectionEntry{connection, transport};
    if (!recv_job->start(server_)) {
        Logger::getInstance().logError("HttpServer: no SQE available for recv on fd=" + std::to_string(client_fd));
        HttpMultishotRecvJob::freePoolAllocated(recv_job);
        connection->unbind();
        connections_.erase(client_fd);
    }
}

void HttpServer::onData(int fd, std::string_view data) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return;
    }
    // Keep the connection alive through whatever the data triggers
    std::shared_ptr<HttpConnection> connection = it->second.connection;
    connection->receiveData(data);
}

void HttpServer::onDisconnect(int fd, int result) {
    auto it = connections_.find(fd);
    if (it == connections_.end()) {
        return;
    }
    if (result < 0 && result != -ECONNRESET) {
        STOA_DEBUG_LOG("HttpServer: recv on fd=" << fd << " ended: " << strerror(-result));
    }

    ConnectionEntry entry = std::move(it->second);
    connections_.erase(it);
    entry.connection->unbind();
    entry.transport->close();
}

void HttpServer::closeListeners() {
    for (const Listener& listener : listeners_) {
        // Ends the multishot accept; the job frees itself on that completion
        ::shutdown(listener.fd, SHUT_RDWR);
        ::close(listener.fd);
        if (!listener.unix_path.empty()) {
            ::unlink(listener.unix_path.c_str());
        }
    }
    listeners_.clear();
}

void HttpServer::closeConnections() {
    auto connections = std::move(connections_);
    connections_.clear();
    for (auto& [fd, entry] : connections) {
        entry.connection->unbind();
        entry.transport->close();
    }
}

int HttpServer::createServerSocket(int port, const std::string& bind_addr) {
    Logger& logger = Logger::getInstance();

    int server_fd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd < 0) {
        logger.logError("HttpServer: Failed to create socket: " + std::string(strerror(errno)));
        return -1;
    }

    int opt = 1;
    if (::setsockopt(server_fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0 ||
        ::setsockopt(server_fd, SOL_SOCKET, SO_REUSEPORT, &opt, sizeof(opt)) < 0) {
        logger.logError("HttpServer: Failed to set socket options: " + std::string(strerror(errno)));
        ::close(server_fd);
        return -1;
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));
    if (::inet_pton(AF_INET, bind_addr.c_str(), &addr.sin_addr) <= 0) {
        logger.logError("HttpServer: Invalid bind address: " + bind_addr);
        ::close(server_fd);
        return -1;
    }

    if (::bind(server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        logger.logError("HttpServer: Failed to bind " + bind_addr + ":" + std::to_string(port) +
                        ": " + std::string(strerror(errno)));
        ::close(server_fd);
        return -1;
    }

    if (::listen(server_fd, SOMAXCONN) < 0) {
        logger.logError("HttpServer: Failed to listen: " + std::string(strerror(errno)));
        ::close(server_fd);
        return -1;
    }
    return server_fd;
}

int HttpServer::createUnixSocket(const std::string& path) {
    Logger& logger = Logger::getInstance();

    sockaddr_un addr{};
    if (path.empty() || path.size() >= sizeof(addr.sun_path)) {
        logger.logError("HttpServer: Invalid unix socket path: " + path);
        return -1;
    }

    int server_fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (server_fd < 0) {
        logger.logError("HttpServer: Failed to create unix socket: " + std::string(strerror(errno)));
        return -1;
    }

    // A stale socket file from an earlier run would make bind fail
    ::unlink(path.c_str());

    addr.sun_family = AF_UNIX;
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    if (::bind(server_fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        logger.logError("HttpServer: Failed to bind unix:" + path + ": " + std::string(strerror(errno)));
        ::close(server_fd);
        return -1;
    }
    if (::listen(server_fd, SOMAXCONN) < 0) {
        logger.logError("HttpServer: Failed to listen on unix:" + path + ": " + std::string(strerror(errno)));
        ::close(server_fd);
        ::unlink(path.c_str());
        return -1;
    }
    return server_fd;
}

} // namespace stoa
