#pragma once

#include "stoa/LoopExecutor.hpp"
#include "stoa/http/ConnectionTransport.hpp"
#include "stoa/http/ErrorReporter.hpp"
#include "stoa/http/HttpParser.hpp"
#include "stoa/http/HttpRequest.hpp"
#include "stoa/http/HttpResponse.hpp"
#include "stoa/http/HttpTypes.hpp"
#include "stoa/logger/Logger.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace stoa {

class SimpleWorkerPool;

struct ConnectionOptions {
    bool verbose = false;
    // Request body bytes kept in memory before spilling to a temporary file
    size_t max_body_in_memory = RequestBody::DEFAULT_MAX_IN_MEMORY;
    // Value of the Server header; empty leaves it out
    std::string server_software = "stoa";
};

/**
 * Everything connections of one server share. The loop must outlive every
 * connection and every async callback handed to the application.
 */
struct ConnectionContext {
    ConnectionContext(HttpApplication application, LoopExecutor& executor, Logger& log)
        : app(std::move(application)), loop(executor), logger(log) {}

    HttpApplication app;
    LoopExecutor& loop;
    Logger& logger;
    // Set when the application runs on worker threads
    SimpleWorkerPool* workers = nullptr;
    // Reported to the application; the engine itself is one process
    bool multiprocess = false;
    ConnectionOptions options;
};

/**
 * One client connection: assembles requests from parser events, runs the
 * application, writes its responses and decides whether the connection
 * survives each exchange.
 *
 * Lives in a shared_ptr; worker tasks and async callbacks only hold weak
 * references and a generation number, so a result for a request the
 * connection has moved past, or for a connection that is gone, is dropped.
 * All methods run on the loop thread.
 */
class HttpConnection : public HttpParserListener,
                       public std::enable_shared_from_this<HttpConnection> {
public:
    enum class State {
        Idle,         // waiting for the next request
        Headers,      // request line and headers arriving
        Body,         // body arriving
        Dispatching,  // the application has the request
        AsyncWait,    // the application will answer through the async callback
        Sending,      // response on its way out
        Closed
    };

    static const char* to_string(State state);

    // Result of calling the application once
    struct DispatchResult {
        std::optional<DispatchOutcome> outcome;
        std::exception_ptr error;
    };

    HttpConnection(std::shared_ptr<const ConnectionContext> context,
                   std::shared_ptr<ConnectionTransport> transport);
    ~HttpConnection() override;

    HttpConnection(const HttpConnection&) = delete;
    HttpConnection& operator=(const HttpConnection&) = delete;

    // Call once, after the connection is owned by a shared_ptr
    void start();

    // Bytes from the peer. Input that arrives mid-exchange is held until
    // the connection is ready for the next request.
    void receiveData(std::string_view data);

    // The peer is gone: drop the exchange in flight without writing
    void unbind();

    State state() const { return state_; }
    bool closed() const { return state_ == State::Closed; }
    const std::shared_ptr<HttpRequest>& currentRequest() const { return request_; }
    uint64_t requestsDispatched() const { return dispatched_; }

    // Runs the application, capturing whatever it throws. Releases the
    // request body afterwards.
    static DispatchResult invokeApplication(const HttpApplication& app, HttpRequest& request);

    static constexpr size_t MAX_BUFFERED_INPUT = 1024 * 1024;

private:
    // HttpParserListener
    void onMessageBegin() override;
    void onHeadersComplete(RequestHead& head) override;
    void onBody(std::string_view chunk) override;
    void onMessageComplete() override;
    void onParseError(std::string_view detail) override;

    bool acceptsInput() const;
    void processInput();
    void handleParseError();

    void dispatch();
    void completeDispatch(uint64_t generation, DispatchResult result);
    void onAsyncResponse(uint64_t generation, ResponseParts parts);

    void processResponse(ResponseParts parts);
    void respondToFailure(ErrorKind kind, std::string_view context, std::exception_ptr error);
    void respondWithError(int status, bool keep_alive);

    void sendResponse();
    void sendFile();
    void sendDeferredBody();
    void onFileStreamed(uint64_t generation, int error);
    void onDeferredChunk(uint64_t generation, bool chunked, std::string chunk);
    void onDeferredDone(uint64_t generation, bool chunked, bool ok);
    void onTransmissionError(int error);

    void reset();
    void releaseExchange();
    void closeNow();

    std::string socketAddress();
    void trace(std::string_view msg) const;

    std::shared_ptr<const ConnectionContext> ctx_;
    std::shared_ptr<ConnectionTransport> transport_;
    ErrorReporter reporter_;
    std::unique_ptr<HttpParser> parser_;
    std::shared_ptr<HttpRequest> request_;
    std::unique_ptr<HttpResponse> response_;
    State state_ = State::Idle;

    // Bumped whenever an exchange is retired
    uint64_t generation_ = 0;
    // Claimed by whichever response for the current request arrives first
    std::shared_ptr<std::atomic<bool>> completion_claim_;
    // A worker thread is using request_
    bool offloaded_ = false;

    std::string pending_input_;
    bool processing_input_ = false;
    bool message_ready_ = false;
    bool parse_failed_ = false;
    std::string parse_error_;
    uint64_t dispatched_ = 0;
};

} // namespace stoa
