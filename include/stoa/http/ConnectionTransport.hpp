#pragma once

#include <cstdint>
#include <functional>
#include <string>

namespace stoa {

/**
 * Socket side of one connection as seen by HttpConnection.
 * Every method is called on the loop thread, and every callback the
 * transport makes runs there too.
 */
class ConnectionTransport {
public:
    // 0 when the whole file went out, otherwise the errno that stopped it
    using StreamCallback = std::function<void(int error)>;
    using ErrorHandler = std::function<void(int error)>;

    virtual ~ConnectionTransport() = default;

    // Queue bytes after everything queued before.
    // Throws TransmissionError once the connection can no longer be written.
    virtual void send(std::string data) = 0;

    /**
     * Queue the contents of a file after everything queued before, framed
     * as chunks (ending with the zero-length chunk) when chunked is set.
     * done runs exactly once, never before streamFile returns; the file is
     * closed before it does. Throws TransmissionError when the file cannot
     * be opened or the connection can no longer be written.
     */
    virtual void streamFile(const std::string& path, uint64_t size, bool chunked, StreamCallback done) = 0;

    // Close once the queued bytes have gone out
    virtual void closeAfterWriting() = 0;

    // Close now, dropping anything still queued
    virtual void close() = 0;

    // Numeric peer address; throws std::system_error when it cannot be determined
    virtual std::string peerAddress() const = 0;

    virtual bool isUnixSocket() const = 0;

    // Receives errno values for writes that fail after send() returned
    virtual void setErrorHandler(ErrorHandler handler) = 0;
};

} // namespace stoa
