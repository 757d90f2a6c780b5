#pragma once
#include "stoa/http/HttpTypes.hpp"

#include <cstddef>
#include <string>
#include <string_view>

namespace stoa {

/**
 * Request body storage. Small bodies stay in memory; once the body grows past
 * max_in_memory bytes it moves to an unlinked temporary file, so nothing is
 * left on disk whatever way the process exits.
 */
class RequestBody {
public:
    static constexpr size_t DEFAULT_MAX_IN_MEMORY = 112 * 1024;

    explicit RequestBody(size_t max_in_memory = DEFAULT_MAX_IN_MEMORY);
    ~RequestBody();

    RequestBody(const RequestBody&) = delete;
    RequestBody& operator=(const RequestBody&) = delete;

    // Throws std::system_error when the temporary file cannot be created or written
    void append(std::string_view data);

    size_t size() const { return size_; }
    bool spooled() const { return fd_ >= 0; }
    bool closed() const { return closed_; }

    // Sequential reads from the current position; 0 at the end
    size_t read(char* dst, size_t len);
    std::string read(size_t max_len);
    void rewind() { read_pos_ = 0; }

    // Whole body, independent of the read position
    std::string str() const;

    // Descriptor of the temporary file, -1 while in memory
    int fileDescriptor() const { return fd_; }

    // Drops the memory buffer or temporary file; idempotent
    void close();

private:
    void spill();

    size_t max_in_memory_;
    std::string memory_;
    int fd_ = -1;
    size_t size_ = 0;
    size_t read_pos_ = 0;
    bool closed_ = false;
};

/**
 * One HTTP request as handed to the application.
 * Filled in by the connection from parser events; read-only once finished.
 */
class HttpRequest {
public:
    explicit HttpRequest(size_t max_body_in_memory = RequestBody::DEFAULT_MAX_IN_MEMORY);

    HttpRequest(const HttpRequest&) = delete;
    HttpRequest& operator=(const HttpRequest&) = delete;

    // Splits target into path, query string and fragment
    void setRequestLine(std::string method, std::string target, std::string version);
    void setHeaders(HeaderMap headers) { headers_ = std::move(headers); }
    void setKeepAlive(bool keep_alive) { keep_alive_ = keep_alive; }
    void setRemoteAddress(std::string address) { remote_address_ = std::move(address); }
    void setConcurrency(bool multithread, bool multiprocess) {
        multithread_ = multithread;
        multiprocess_ = multiprocess;
    }
    void setAsyncCallback(AsyncCallback callback) { async_callback_ = std::move(callback); }
    void markFinished() { finished_ = true; }

    const std::string& method() const { return method_; }
    const std::string& target() const { return target_; }
    const std::string& path() const { return path_; }
    const std::string& queryString() const { return query_; }
    const std::string& fragment() const { return fragment_; }
    const std::string& version() const { return version_; }
    const HeaderMap& headers() const { return headers_; }
    std::string getHeader(const std::string& name) const { return read_header(headers_, name); }

    bool keepAlive() const { return keep_alive_; }
    const std::string& remoteAddress() const { return remote_address_; }
    bool multithread() const { return multithread_; }
    bool multiprocess() const { return multiprocess_; }
    bool finished() const { return finished_; }
    bool isHead() const { return method_ == "HEAD"; }

    // Host header without the port, or "localhost" when absent
    std::string serverName() const;
    // Port from the Host header, "80" when absent
    std::string serverPort() const;

    // HTTP/1.1 and newer, or any client listing chunked in TE
    bool supportsChunkedEncoding() const;

    RequestBody& body() { return body_; }
    const RequestBody& body() const { return body_; }

    /**
     * Completes an async-pending request. Copy it out of the request to call
     * it later from any thread; only the first response delivered counts.
     */
    const AsyncCallback& asyncCallback() const { return async_callback_; }

    // Releases the body and drops the async binding
    void close();

private:
    std::string method_;
    std::string target_;
    std::string path_;
    std::string query_;
    std::string fragment_;
    std::string version_;
    HeaderMap headers_;
    bool keep_alive_ = false;
    std::string remote_address_;
    bool multithread_ = false;
    bool multiprocess_ = false;
    bool finished_ = false;
    RequestBody body_;
    AsyncCallback async_callback_;
};

} // namespace stoa
