#pragma once
#include "stoa/http/HttpTypes.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace stoa {

// Request line and headers of one message, as seen on the wire
struct RequestHead {
    std::string method;
    std::string target;
    std::string version;
    HeaderMap headers;   // lowercase names, repeated headers joined with ", "
    bool keep_alive = false;
};

/**
 * Receives parser events. For each message the order is
 * onMessageBegin, onHeadersComplete, onBody*, onMessageComplete;
 * onParseError may replace any remaining part of that sequence.
 */
class HttpParserListener {
public:
    virtual ~HttpParserListener() = default;
    virtual void onMessageBegin() = 0;
    virtual void onHeadersComplete(RequestHead& head) = 0;
    virtual void onBody(std::string_view chunk) = 0;
    virtual void onMessageComplete() = 0;
    virtual void onParseError(std::string_view detail) = 0;
};

/**
 * Incremental HTTP/1.x request parser. Bytes are pushed with feed() in
 * pieces of any size. The parser stops after each complete message (so the
 * owner can answer it before the next pipelined one is parsed) and after
 * an error; reset() readies it for the next message.
 */
class HttpParser {
  public:
    static constexpr size_t MAX_REQUEST_LINE = 8 * 1024;      // 8 KiB
    static constexpr size_t MAX_HEADERS = 200;               // max header count
    static constexpr size_t MAX_HEADER_LINE = 16 * 1024;     // 16 KiB per header
    static constexpr uint64_t MAX_CONTENT_LENGTH = 1024ull * 1024 * 1024; // 1 GiB
    static constexpr size_t MAX_CHUNK_LINE = 1024;

    explicit HttpParser(HttpParserListener& listener) : listener_(listener) {}

    /**
     * Parse as much of data as belongs to the current message.
     * @return bytes consumed; less than data.size() once the message is
     *         complete or the input was rejected
     */
    size_t feed(std::string_view data);

    void reset();

    bool messageComplete() const { return state_ == State::Complete; }
    bool failed() const { return state_ == State::Failed; }
    bool headersComplete() const { return headers_complete_; }
    // Persistence the current message asked for; false before its headers
    bool keepAlive() const { return keep_alive_; }

  private:
    enum class State {
        Idle,           // between messages, skipping stray CRLFs
        RequestLine,
        Headers,
        Body,           // Content-Length delimited
        ChunkSize,
        ChunkData,
        ChunkDataEnd,
        Trailers,
        Complete,
        Failed
    };

    // Accumulates a CRLF (or bare LF) terminated line; true when line_ holds one
    bool takeLine(std::string_view data, size_t& pos, size_t limit, const char* what);

    bool parseRequestLine(std::string_view line);
    bool parseHeaderLine(std::string_view line);
    bool finishHeaders();
    bool parseChunkSize(std::string_view line);
    void completeMessage();
    void fail(std::string detail);

    static bool isToken(std::string_view s);
    static std::string trimValue(std::string_view value);

    HttpParserListener& listener_;
    State state_ = State::Idle;
    std::string line_;
    RequestHead head_;
    size_t header_count_ = 0;
    uint64_t body_remaining_ = 0;
    uint64_t body_total_ = 0;
    size_t trailer_count_ = 0;
    bool headers_complete_ = false;
    bool keep_alive_ = false;
};

} // namespace stoa
