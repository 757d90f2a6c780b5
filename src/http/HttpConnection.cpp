#include "stoa/http/HttpConnection.hpp"
#include "stoa/Config.hpp"
#include "stoa/http/DeferredBody.hpp"
#include "stoa/threading/SimpleWorkerPool.hpp"

#include <cstring>
#include <stdexcept>
#include <utility>

namespace stoa {

const char* HttpConnection::to_string(State state) {
    switch (state) {
        case State::Idle: return "IDLE";
        case State::Headers: return "HEADERS";
        case State::Body: return "BODY";
        case State::Dispatching: return "DISPATCHING";
        case State::AsyncWait: return "ASYNC_WAIT";
        case State::Sending: return "SENDING";
        case State::Closed: return "CLOSED";
    }
    return "UNKNOWN";
}

HttpConnection::HttpConnection(std::shared_ptr<const ConnectionContext> context,
                               std::shared_ptr<ConnectionTransport> transport)
    : ctx_(std::move(context)),
      transport_(std::move(transport)),
      reporter_(ctx_->logger, ctx_->options.verbose),
      parser_(std::make_unique<HttpParser>(*this)) {}

HttpConnection::~HttpConnection() {
    releaseExchange();
}

void HttpConnection::start() {
    std::weak_ptr<HttpConnection> weak = weak_from_this();
    transport_->setErrorHandler([weak](int error) {
        if (auto self = weak.lock()) {
            self->onTransmissionError(error);
        }
    });
    state_ = State::Idle;
}

void HttpConnection::receiveData(std::string_view data) {
    if (state_ == State::Closed || data.empty()) {
        return;
    }
    if (pending_input_.size() + data.size() > MAX_BUFFERED_INPUT) {
        ctx_->logger.logError("HttpConnection: peer sent more than " + std::to_string(MAX_BUFFERED_INPUT) +
                              " bytes ahead of its responses, closing");
        closeNow();
        return;
    }
    pending_input_.append(data);
    processInput();
}

bool HttpConnection::acceptsInput() const {
    return state_ == State::Idle || state_ == State::Headers || state_ == State::Body;
}

void HttpConnection::processInput() {
    // Dispatch may finish synchronously and reset into this again; the
    // outermost call keeps looping instead
    if (processing_input_) {
        return;
    }
    processing_input_ = true;

    while (!pending_input_.empty() && acceptsInput()) {
        size_t consumed = 0;
        try {
            consumed = parser_->feed(pending_input_);
        } catch (const std::exception&) {
            // Body storage failed; the rest of this message cannot be framed
            pending_input_.clear();
            int status = reporter_.report(ErrorKind::ApplicationError, "request body storage",
                                          std::current_exception());
            respondWithError(status, false);
            continue;
        }
        pending_input_.erase(0, consumed);

        if (parse_failed_) {
            handleParseError();
        } else if (message_ready_) {
            message_ready_ = false;
            dispatch();
        } else if (consumed == 0) {
            break;
        }
    }

    processing_input_ = false;
}

void HttpConnection::onMessageBegin() {
    request_ = std::make_shared<HttpRequest>(ctx_->options.max_body_in_memory);
    state_ = State::Headers;
}

void HttpConnection::onHeadersComplete(RequestHead& head) {
    request_->setRequestLine(std::move(head.method), std::move(head.target), std::move(head.version));
    request_->setHeaders(std::move(head.headers));
    request_->setKeepAlive(head.keep_alive);
    request_->setRemoteAddress(socketAddress());
    request_->setConcurrency(ctx_->workers != nullptr, ctx_->multiprocess);
    state_ = State::Body;

    if (reporter_.verbose()) {
        trace(request_->method() + " " + request_->target() + " " + request_->version());
    }
}

void HttpConnection::onBody(std::string_view chunk) {
    request_->body().append(chunk);
}

void HttpConnection::onMessageComplete() {
    request_->markFinished();
    message_ready_ = true;
}

void HttpConnection::onParseError(std::string_view detail) {
    parse_failed_ = true;
    parse_error_ = std::string(detail);
}

void HttpConnection::handleParseError() {
    parse_failed_ = false;
    // Whatever follows the bad bytes cannot be trusted as a message boundary
    pending_input_.clear();

    const bool keep_alive = parser_->headersComplete() && parser_->keepAlive();
    int status = reporter_.report(ErrorKind::ParseError, "request parsing", parse_error_);
    respondWithError(status, keep_alive);
}

void HttpConnection::dispatch() {
    state_ = State::Dispatching;
    ++dispatched_;

    const uint64_t generation = generation_;
    auto claim = std::make_shared<std::atomic<bool>>(false);
    completion_claim_ = claim;

    std::weak_ptr<HttpConnection> weak = weak_from_this();
    std::shared_ptr<const ConnectionContext> ctx = ctx_;
    request_->setAsyncCallback([weak, ctx, generation, claim](ResponseParts parts) {
        if (claim->exchange(true)) {
            ctx->logger.logError("HttpConnection: request answered more than once, ignoring the async response");
            return;
        }
        ctx->loop.post([weak, generation, parts = std::move(parts)]() mutable {
            if (auto self = weak.lock()) {
                self->onAsyncResponse(generation, std::move(parts));
            }
        });
    });

    if (!ctx_->workers) {
        completeDispatch(generation, invokeApplication(ctx_->app, *request_));
        return;
    }

    offloaded_ = true;
    std::shared_ptr<HttpRequest> request = request_;
    bool queued = ctx_->workers->post([weak, ctx, generation, request] {
        auto result = std::make_shared<DispatchResult>(invokeApplication(ctx->app, *request));
        ctx->loop.post([weak, generation, result] {
            if (auto self = weak.lock()) {
                self->completeDispatch(generation, std::move(*result));
            }
        });
    });

    if (!queued) {
        offloaded_ = false;
        request_->body().close();
        DispatchResult saturated;
        saturated.error = std::make_exception_ptr(std::runtime_error("worker pool saturated"));
        completeDispatch(generation, std::move(saturated));
    }
}

HttpConnection::DispatchResult HttpConnection::invokeApplication(const HttpApplication& app,
                                                                 HttpRequest& request) {
    DispatchResult result;
    try {
        if (!app) {
            throw std::logic_error("no application installed");
        }
        result.outcome = app(request);
    } catch (...) {
        // Reported on the loop thread by completeDispatch
        result.error = std::current_exception();
    }
    request.body().close();
    return result;
}

void HttpConnection::completeDispatch(uint64_t generation, DispatchResult result) {
    if (generation != generation_ || state_ == State::Closed) {
        STOA_DEBUG_LOG("HttpConnection: dropping result for a retired request");
        return;
    }
    offloaded_ = false;

    const bool completed = !result.error && result.outcome && !result.outcome->isAsyncPending();
    if (state_ != State::Dispatching) {
        // The async callback already answered this request
        if (result.error) {
            reporter_.report(ErrorKind::ApplicationError, "application", result.error);
        } else if (completed) {
            ctx_->logger.logError("HttpConnection: request answered more than once, ignoring the returned response");
        }
        return;
    }

    if (result.error) {
        respondToFailure(ErrorKind::ApplicationError, "application", result.error);
        return;
    }

    if (!completed) {
        state_ = State::AsyncWait;
        trace("response deferred by the application");
        return;
    }

    if (completion_claim_->exchange(true)) {
        // The async callback fired first; its response is on the way
        ctx_->logger.logError("HttpConnection: request answered more than once, ignoring the returned response");
        state_ = State::AsyncWait;
        return;
    }

    processResponse(std::move(result.outcome->response()));
}

void HttpConnection::onAsyncResponse(uint64_t generation, ResponseParts parts) {
    if (generation != generation_ || (state_ != State::Dispatching && state_ != State::AsyncWait)) {
        trace("late async response dropped");
        return;
    }
    processResponse(std::move(parts));
}

void HttpConnection::processResponse(ResponseParts parts) {
    state_ = State::Sending;
    try {
        auto response = std::make_unique<HttpResponse>(std::move(parts));
        response->setKeepAlive(request_->keepAlive());
        response->finish(request_->isHead(), request_->supportsChunkedEncoding(),
                         ctx_->options.server_software);
        response_ = std::move(response);
    } catch (const std::exception&) {
        respondToFailure(ErrorKind::FinalizationError, "response finalization", std::current_exception());
        return;
    }
    sendResponse();
}

void HttpConnection::respondToFailure(ErrorKind kind, std::string_view context, std::exception_ptr error) {
    int status = reporter_.report(kind, context, error);
    if (status == 0) {
        closeNow();
        return;
    }
    respondWithError(status, request_ && request_->keepAlive());
}

void HttpConnection::respondWithError(int status, bool keep_alive) {
    state_ = State::Sending;
    if (response_) {
        response_->close();
    }
    response_ = std::make_unique<HttpResponse>(HttpResponse::error(status));
    response_->setKeepAlive(keep_alive);
    response_->finish(request_ && request_->isHead(), false, ctx_->options.server_software);
    sendResponse();
}

void HttpConnection::sendResponse() {
    state_ = State::Sending;
    if (reporter_.verbose()) {
        const std::string& head = response_->head();
        trace("responding " + head.substr(0, head.find('\r')));
    }

    bool finished_inline = false;
    try {
        transport_->send(response_->head());

        if (!response_->sendsBody()) {
            finished_inline = true;
        } else {
            switch (response_->bodyKind()) {
                case HttpResponse::BodyKind::Chunks:
                    for (const auto& chunk : response_->chunks()) {
                        if (!chunk.empty()) {
                            transport_->send(chunk);
                        }
                    }
                    finished_inline = true;
                    break;
                case HttpResponse::BodyKind::File:
                    sendFile();
                    break;
                case HttpResponse::BodyKind::Deferred:
                    sendDeferredBody();
                    break;
            }
        }
    } catch (const std::exception&) {
        reporter_.report(ErrorKind::TransmissionError, "response transmission", std::current_exception());
        closeNow();
        return;
    }

    if (finished_inline) {
        reset();
    }
}

void HttpConnection::sendFile() {
    const uint64_t generation = generation_;
    std::weak_ptr<HttpConnection> weak = weak_from_this();
    trace("streaming " + response_->filePath() + (response_->chunked() ? " chunked" : ""));

    transport_->streamFile(response_->filePath(), response_->fileSize(), response_->chunked(),
                           [weak, generation](int error) {
                               if (auto self = weak.lock()) {
                                   self->onFileStreamed(generation, error);
                               }
                           });
}

void HttpConnection::onFileStreamed(uint64_t generation, int error) {
    if (generation != generation_ || state_ != State::Sending) {
        return;
    }
    if (error != 0) {
        reporter_.report(ErrorKind::TransmissionError, "file streaming",
                         response_->filePath() + ": " + std::strerror(error));
        response_->setKeepAlive(false);
    }
    reset();
}

void HttpConnection::sendDeferredBody() {
    const uint64_t generation = generation_;
    const bool chunked = response_->chunked();
    std::weak_ptr<HttpConnection> weak = weak_from_this();

    // May replay chunks and the outcome right here
    std::shared_ptr<DeferredBody> body = response_->deferredBody();
    body->attach(
        ctx_->loop,
        [weak, generation, chunked](std::string chunk) {
            if (auto self = weak.lock()) {
                self->onDeferredChunk(generation, chunked, std::move(chunk));
            }
        },
        [weak, generation, chunked](bool ok) {
            if (auto self = weak.lock()) {
                self->onDeferredDone(generation, chunked, ok);
            }
        });
}

void HttpConnection::onDeferredChunk(uint64_t generation, bool chunked, std::string chunk) {
    if (generation != generation_ || state_ != State::Sending || chunk.empty()) {
        return;
    }
    try {
        transport_->send(chunked ? chunk_frame(chunk) : std::move(chunk));
    } catch (const std::exception&) {
        reporter_.report(ErrorKind::TransmissionError, "deferred body", std::current_exception());
        closeNow();
    }
}

void HttpConnection::onDeferredDone(uint64_t generation, bool chunked, bool ok) {
    if (generation != generation_ || state_ != State::Sending) {
        return;
    }
    if (ok) {
        if (chunked) {
            try {
                transport_->send(std::string(LAST_CHUNK));
            } catch (const std::exception&) {
                reporter_.report(ErrorKind::TransmissionError, "deferred body", std::current_exception());
                closeNow();
                return;
            }
        }
    } else {
        // Headers are gone already; the close tells the client the body is cut short
        reporter_.report(ErrorKind::ApplicationError, "deferred body",
                         response_->deferredBody()->failureReason());
        response_->setKeepAlive(false);
    }
    reset();
}

void HttpConnection::onTransmissionError(int error) {
    if (state_ == State::Closed) {
        STOA_DEBUG_LOG("HttpConnection: write error after close: " << error);
        return;
    }
    reporter_.report(ErrorKind::TransmissionError, "socket write", std::strerror(error));
    closeNow();
}

void HttpConnection::reset() {
    if (state_ == State::Closed) {
        return;
    }
    const bool keep_alive = response_ && response_->keepAlive();
    releaseExchange();

    if (keep_alive) {
        parser_ = std::make_unique<HttpParser>(*this);
        message_ready_ = false;
        parse_failed_ = false;
        state_ = State::Idle;
        processInput();
    } else {
        state_ = State::Closed;
        pending_input_.clear();
        transport_->closeAfterWriting();
    }
}

void HttpConnection::releaseExchange() {
    if (request_) {
        // A worker still inside the application closes the body itself
        if (!offloaded_) {
            request_->close();
        }
        request_.reset();
    }
    offloaded_ = false;
    if (response_) {
        response_->close();
        response_.reset();
    }
    completion_claim_.reset();
    ++generation_;
}

void HttpConnection::unbind() {
    releaseExchange();
    state_ = State::Closed;
    pending_input_.clear();
}

void HttpConnection::closeNow() {
    releaseExchange();
    state_ = State::Closed;
    pending_input_.clear();
    transport_->close();
}

std::string HttpConnection::socketAddress() {
    if (transport_->isUnixSocket()) {
        return "";
    }
    try {
        return transport_->peerAddress();
    } catch (const std::exception&) {
        reporter_.report(ErrorKind::AddressResolutionError, "peer address lookup", std::current_exception());
        return "";
    }
}

void HttpConnection::trace(std::string_view msg) const {
    if (reporter_.verbose()) {
        std::string line = "HttpConnection: ";
        line += msg;
        ctx_->logger.logMessage(line);
    }
}

} // namespace stoa
