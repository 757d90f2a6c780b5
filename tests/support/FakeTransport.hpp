#pragma once

#include "stoa/LoopExecutor.hpp"
#include "stoa/http/ConnectionTransport.hpp"
#include "stoa/http/ErrorReporter.hpp"
#include "stoa/http/HttpTypes.hpp"

#include <algorithm>
#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>
#include <system_error>

namespace stoa::test {

/**
 * In-memory transport. Everything sent is appended to written; file
 * completions are posted to the loop like the real transport does.
 */
class FakeTransport : public ConnectionTransport {
public:
    explicit FakeTransport(LoopExecutor& loop) : loop_(loop) {}

    void send(std::string data) override {
        ensureWritable();
        if (fail_sends) {
            throw TransmissionError("injected send failure");
        }
        written += data;
    }

    void streamFile(const std::string& path, uint64_t size, bool chunked, StreamCallback done) override {
        ensureWritable();
        std::ifstream in(path, std::ios::binary);
        if (!in) {
            throw TransmissionError("cannot open " + path);
        }
        std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        contents.resize(std::min<uint64_t>(contents.size(), size));
        if (chunked) {
            if (!contents.empty()) {
                written += chunk_frame(contents);
            }
            written += LAST_CHUNK;
        } else {
            written += contents;
        }
        ++files_streamed;
        int error = fail_files ? EIO : 0;
        loop_.post([done = std::move(done), error] { done(error); });
    }

    void closeAfterWriting() override { close_after_writing = true; }
    void close() override { closed = true; }

    std::string peerAddress() const override {
        if (peer_fails) {
            throw std::system_error(ENOTCONN, std::system_category(), "getpeername");
        }
        return peer;
    }

    bool isUnixSocket() const override { return unix_socket; }

    void setErrorHandler(ErrorHandler handler) override { error_handler_ = std::move(handler); }

    // Reports a write failure the way a completion would
    void injectWriteError(int error) {
        if (error_handler_) {
            error_handler_(error);
        }
    }

    size_t responses() const {
        size_t count = 0;
        for (size_t pos = written.find("HTTP/1.1 "); pos != std::string::npos;
             pos = written.find("HTTP/1.1 ", pos + 1)) {
            ++count;
        }
        return count;
    }

    std::string written;
    std::string peer = "192.0.2.7";
    bool peer_fails = false;
    bool unix_socket = false;
    bool fail_sends = false;
    bool fail_files = false;
    bool close_after_writing = false;
    bool closed = false;
    int files_streamed = 0;

private:
    void ensureWritable() const {
        if (closed || close_after_writing) {
            throw TransmissionError("connection is closing");
        }
    }

    LoopExecutor& loop_;
    ErrorHandler error_handler_;
};

} // namespace stoa::test
