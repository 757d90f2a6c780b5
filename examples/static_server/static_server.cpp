/**
 * Static file server
 *
 * Serves files below a document root over plain HTTP, or over HTTPS with
 * kernel TLS when a certificate and key are given.
 *
 * Usage: ./static_server <document_root> [port] [log_file] [cert_path] [key_path]
 *
 * Examples:
 *   ./static_server site 8080                          # HTTP, console logging
 *   ./static_server /var/www 8080 /var/log/stoa.log    # HTTP, file logging (SIGHUP reopens)
 *   ./static_server /var/www 8443 "" cert.pem key.pem  # HTTPS with kTLS
 */

#include "stoa/http/HttpServer.hpp"
#include "stoa/http/HttpRequest.hpp"
#include "stoa/logger/AsyncLogger.hpp"
#include "stoa/logger/ConsoleLogger.hpp"
#include "stoa/logger/FileLogger.hpp"
#include <filesystem>
#include <iostream>
#include <pthread.h>
#include <signal.h>
#include <thread>

using namespace stoa;
namespace fs = std::filesystem;

static std::unique_ptr<HttpServer> http_server;

static DispatchOutcome plainText(int status, std::string text) {
    return DispatchOutcome::completed(
        ResponseParts::chunks(status, {{"Content-Type", "text/plain"}}, {std::move(text)}));
}

// Maps a request path into docroot, empty when it escapes it
static fs::path resolve(const fs::path& root, const std::string& request_path) {
    std::string relative = request_path == "/" ? "index.html" : request_path.substr(1);
    if (relative.empty()) {
        return {};
    }
    fs::path candidate = fs::weakly_canonical(root / relative);
    auto rel = candidate.lexically_relative(root);
    if (rel.empty() || rel.string().rfind("..", 0) == 0) {
        return {};
    }
    return candidate;
}

int main(int argc, char** argv) {
    try {
        std::string docroot = argc > 1 ? argv[1] : "site";
        int port = argc > 2 ? std::stoi(argv[2]) : 8080;
        std::string log_file = argc > 3 ? argv[3] : "";
        std::string cert_path = argc > 4 ? argv[4] : "";
        std::string key_path = argc > 5 ? argv[5] : "";

        static std::unique_ptr<AsyncLogger> async_logger;
        static std::unique_ptr<ConsoleLogger> console_logger;
        FileLogger* file_logger = nullptr;

        if (!log_file.empty()) {
            auto file = std::make_unique<FileLogger>(log_file, true);
            file_logger = file.get();
            async_logger = std::make_unique<AsyncLogger>(std::move(file));
            Logger::setGlobalLogger(async_logger.get());
        } else {
            console_logger = std::make_unique<ConsoleLogger>();
            Logger::setGlobalLogger(console_logger.get());
        }

        // Signals are handled on a dedicated thread through sigwait
        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        sigaddset(&set, SIGHUP);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);

        std::thread([set, file_logger]() {
            int sig = 0;
            while (sigwait(&set, &sig) == 0) {
                if (sig == SIGHUP) {
                    if (file_logger) {
                        file_logger->reopen();
                    }
                    continue;
                }
                Logger::getInstance().logMessage("Received signal " + std::to_string(sig) + ", shutting down");
                if (http_server) {
                    http_server->stop();
                }
                return;
            }
        }).detach();

        fs::path root = fs::weakly_canonical(docroot);

        http_server = std::make_unique<HttpServer>([root](HttpRequest& req) {
            if (req.method() != "GET" && req.method() != "HEAD") {
                return plainText(405, "405 Method Not Allowed\n");
            }
            fs::path file = resolve(root, req.path());
            if (file.empty()) {
                return plainText(403, "403 Forbidden\n");
            }
            std::error_code ec;
            if (!fs::is_regular_file(file, ec)) {
                return plainText(404, "404 Not Found\n");
            }
            return DispatchOutcome::completed(ResponseParts::file(200, {}, file.string()));
        });

        bool listening = cert_path.empty()
            ? http_server->listen(port)
            : http_server->listenKTLS(port, cert_path, key_path);
        if (!listening) {
            std::cerr << "Failed to listen on port " << port << std::endl;
            return 1;
        }

        std::cout << "Serving " << root << " on " << (cert_path.empty() ? "http" : "https")
                  << "://0.0.0.0:" << port << "\nPress Ctrl+C to stop\n";
        http_server->run();

        http_server.reset();
        Logger::getInstance().logMessage("Shutdown complete");
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        Logger::getInstance().logError("Fatal error: " + std::string(e.what()));
        return 1;
    }
}
