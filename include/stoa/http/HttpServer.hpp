#pragma once

#include "stoa/Server.hpp"
#include "stoa/http/HttpConnection.hpp"
#include "stoa/http/HttpTypes.hpp"
#include "stoa/jobs/KTLSContextHelper.hpp"
#include "stoa/threading/SimpleWorkerPool.hpp"
#include <memory>
#include <openssl/ssl.h>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace stoa {

class AcceptJob;
class UringTransport;

struct ServerOptions {
    // Run the application on the worker pool instead of the loop thread
    bool threaded = false;
    size_t worker_threads = 20;
    size_t worker_queue_capacity = 1024;
    // Reported to the application as the multi-process flag
    bool prefork = false;
    unsigned queue_depth = 256;
    bool verbose = false;
    ConnectionOptions connection;
};

/**
 * HTTP server on one io_uring loop.
 *
 * Owns the loop, the listening sockets and one HttpConnection per accepted
 * socket. Listeners may be added before run() or from a task posted to the
 * loop. run() blocks until stop(), which is safe from any thread.
 *
 *   HttpServer server([](HttpRequest& req) {
 *       return DispatchOutcome::completed(ResponseParts::chunks(200, {}, {"hello"}));
 *   });
 *   server.listen(8080);
 *   server.run();
 */
class HttpServer {
public:
    // Throws std::runtime_error when the loop cannot be initialized
    explicit HttpServer(HttpApplication app, ServerOptions options = {});
    ~HttpServer();

    HttpServer(const HttpServer&) = delete;
    HttpServer& operator=(const HttpServer&) = delete;

    bool listen(int port, const std::string& bind_addr = "0.0.0.0");
    bool listenUnix(const std::string& path);
    bool listenKTLS(int port, const std::string& cert_path, const std::string& key_path,
                    const std::string& bind_addr = "0.0.0.0");

    void run();
    void stop();

    // Port of the first TCP listener (useful after listen(0)), -1 without one
    int localPort() const;
    size_t connectionCount() const { return connections_.size(); }
    const ServerOptions& options() const { return options_; }
    Server& loop() { return server_; }

    // Recv results for accepted sockets, on the loop thread
    void onData(int fd, std::string_view data);
    void onDisconnect(int fd, int result);

private:
    enum class ListenerKind {
        Tcp,
        Unix,
        Tls
    };

    struct Listener {
        int fd;
        ListenerKind kind;
        std::string unix_path;
    };

    struct ConnectionEntry {
        std::shared_ptr<HttpConnection> connection;
        std::shared_ptr<UringTransport> transport;
    };

    bool startAccepting(int server_fd, ListenerKind kind, std::string unix_path = {});
    void handleNewConnection(int client_fd, ListenerKind kind);
    void handleKTLSReady(int client_fd, SSL* ssl);
    void handleKTLSError(int client_fd, int error);
    void createConnection(int client_fd, bool unix_socket, SSL* ssl);
    void closeListeners();
    void closeConnections();

    int createServerSocket(int port, const std::string& bind_addr);
    int createUnixSocket(const std::string& path);

    Server server_;
    ServerOptions options_;
    std::shared_ptr<ConnectionContext> context_;
    std::unique_ptr<SimpleWorkerPool> workers_;
    SslContextPtr ssl_ctx_;

    std::vector<Listener> listeners_;
    std::unordered_map<int, ConnectionEntry> connections_;
};

} // namespace stoa
