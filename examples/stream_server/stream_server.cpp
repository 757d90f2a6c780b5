/**
 * Streaming and async responses
 *
 * Usage: ./stream_server [port] [--threaded]
 *
 *   GET  /            plain response
 *   POST /echo        echoes the request body (large bodies spill to a temp file)
 *   GET  /later       answered from another thread through the async callback
 *   GET  /ticks?n=5   chunked body pushed from a background thread
 */

#include "stoa/http/DeferredBody.hpp"
#include "stoa/http/HttpRequest.hpp"
#include "stoa/http/HttpServer.hpp"
#include "stoa/logger/ConsoleLogger.hpp"
#include <algorithm>
#include <chrono>
#include <cstring>
#include <iostream>
#include <pthread.h>
#include <signal.h>
#include <thread>

using namespace stoa;

static std::unique_ptr<HttpServer> http_server;

static int tickCount(const std::string& query) {
    if (query.rfind("n=", 0) == 0) {
        try {
            return std::max(1, std::min(100, std::stoi(query.substr(2))));
        } catch (const std::exception&) {
            return 5;
        }
    }
    return 5;
}

static DispatchOutcome handle(HttpRequest& req) {
    if (req.path() == "/echo") {
        HeaderList headers{{"Content-Type", "application/octet-stream"}};
        return DispatchOutcome::completed(ResponseParts::chunks(200, std::move(headers), {req.body().str()}));
    }

    if (req.path() == "/later") {
        AsyncCallback reply = req.asyncCallback();
        std::thread([reply]() {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
            reply(ResponseParts::chunks(200, {{"Content-Type", "text/plain"}}, {"answered later\n"}));
        }).detach();
        return DispatchOutcome::asyncPending();
    }

    if (req.path() == "/ticks") {
        auto body = DeferredBody::create();
        int count = tickCount(req.queryString());
        std::thread([body, count]() {
            for (int i = 1; i <= count; ++i) {
                body->push("tick " + std::to_string(i) + "\n");
                std::this_thread::sleep_for(std::chrono::milliseconds(200));
            }
            body->succeed();
        }).detach();
        return DispatchOutcome::completed(ResponseParts::deferred(200, {{"Content-Type", "text/plain"}}, body));
    }

    std::string text = "hello from " + req.serverName() + ":" + req.serverPort() +
                       (req.multithread() ? " (worker thread)\n" : "\n");
    return DispatchOutcome::completed(ResponseParts::chunks(200, {{"Content-Type", "text/plain"}}, {text}));
}

int main(int argc, char** argv) {
    try {
        int port = argc > 1 ? std::stoi(argv[1]) : 8080;
        bool threaded = argc > 2 && std::strcmp(argv[2], "--threaded") == 0;

        static ConsoleLogger console_logger;
        Logger::setGlobalLogger(&console_logger);

        sigset_t set;
        sigemptyset(&set);
        sigaddset(&set, SIGINT);
        sigaddset(&set, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &set, nullptr);
        std::thread([set]() {
            int sig = 0;
            if (sigwait(&set, &sig) == 0 && http_server) {
                http_server->stop();
            }
        }).detach();

        ServerOptions options;
        options.threaded = threaded;
        options.worker_threads = 4;
        http_server = std::make_unique<HttpServer>(handle, options);
        if (!http_server->listen(port)) {
            std::cerr << "Failed to listen on port " << port << std::endl;
            return 1;
        }

        std::cout << "Listening on http://0.0.0.0:" << port << (threaded ? " (threaded)" : "") << "\n";
        http_server->run();
        http_server.reset();
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
