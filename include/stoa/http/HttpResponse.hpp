#pragma once
#include "stoa/http/HttpTypes.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace stoa {

/**
 * Outgoing response built from the application's ResponseParts.
 *
 * finish() applies the connection's framing rules and renders the head
 * (status line plus header block); after that the connection only reads it.
 */
class HttpResponse {
public:
    enum class BodyKind { Chunks, File, Deferred };

    HttpResponse() = default;

    // Throws std::invalid_argument for a status outside 100..999, a bad
    // header name or value, an empty file path or a null deferred body
    explicit HttpResponse(ResponseParts parts);

    // text/plain response whose body is the reason phrase
    static HttpResponse error(int status);

    int status() const { return status_; }
    const HeaderList& headers() const { return headers_; }
    std::string getHeader(std::string_view name) const;
    bool hasHeader(std::string_view name) const;

    // Replaces every header with this name
    void setHeader(std::string_view name, std::string value);
    void removeHeader(std::string_view name);

    bool keepAlive() const { return keep_alive_; }
    void setKeepAlive(bool keep_alive) { keep_alive_ = keep_alive; }

    BodyKind bodyKind() const { return kind_; }
    const ChunkList& chunks() const { return chunks_; }
    const std::string& filePath() const { return file_path_; }
    uint64_t fileSize() const { return file_size_; }
    const std::shared_ptr<DeferredBody>& deferredBody() const { return deferred_; }

    /**
     * Decide framing and render the head.
     * @param head_request body bytes are not sent (HEAD)
     * @param chunked_supported the client understands chunked transfer coding
     * Throws std::system_error when a file body cannot be inspected.
     */
    void finish(bool head_request, bool chunked_supported, std::string_view server_software);

    bool finished() const { return finished_; }
    const std::string& head() const { return head_; }

    // Body bytes go on the wire at all (false for HEAD, 1xx, 204, 304)
    bool sendsBody() const { return sends_body_; }
    // File and deferred bodies are framed as chunks
    bool chunked() const { return chunked_; }

    // Drops the body and any deferred producer binding
    void close();

private:
    static bool statusForbidsBody(int status);
    static void validateHeader(std::string_view name, std::string_view value);
    static std::string contentTypeFor(std::string_view path);

    int status_ = 200;
    HeaderList headers_;
    BodyKind kind_ = BodyKind::Chunks;
    ChunkList chunks_;
    std::string file_path_;
    uint64_t file_size_ = 0;
    std::shared_ptr<DeferredBody> deferred_;
    bool keep_alive_ = false;

    bool finished_ = false;
    bool sends_body_ = true;
    bool chunked_ = false;
    std::string head_;
};

} // namespace stoa
