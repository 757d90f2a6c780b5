#include "stoa/http/HttpRequest.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <system_error>
#include <unistd.h>

namespace stoa {

namespace {

int createSpoolFile() {
    const char* tmpdir = std::getenv("TMPDIR");
    std::string pattern = (tmpdir && *tmpdir) ? tmpdir : "/tmp";
    pattern += "/stoa-body-XXXXXX";

    int fd = ::mkostemp(pattern.data(), O_CLOEXEC);
    if (fd < 0) {
        throw std::system_error(errno, std::system_category(), "cannot create request body file");
    }
    // Only the descriptor keeps the file alive from here on
    ::unlink(pattern.c_str());
    return fd;
}

void writeAll(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = ::write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::system_category(), "cannot write request body file");
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
}

} // namespace

RequestBody::RequestBody(size_t max_in_memory) : max_in_memory_(max_in_memory) {}

RequestBody::~RequestBody() {
    close();
}

void RequestBody::append(std::string_view data) {
    if (closed_ || data.empty()) {
        return;
    }
    if (fd_ < 0 && memory_.size() + data.size() > max_in_memory_) {
        spill();
    }
    if (fd_ >= 0) {
        writeAll(fd_, data.data(), data.size());
    } else {
        memory_.append(data);
    }
    size_ += data.size();
}

void RequestBody::spill() {
    int fd = createSpoolFile();
    try {
        writeAll(fd, memory_.data(), memory_.size());
    } catch (const std::system_error&) {
        ::close(fd);
        throw;
    }
    fd_ = fd;
    memory_.clear();
    memory_.shrink_to_fit();
}

size_t RequestBody::read(char* dst, size_t len) {
    if (closed_ || read_pos_ >= size_ || len == 0) {
        return 0;
    }
    len = std::min(len, size_ - read_pos_);
    if (fd_ < 0) {
        std::memcpy(dst, memory_.data() + read_pos_, len);
        read_pos_ += len;
        return len;
    }

    ssize_t n;
    do {
        n = ::pread(fd_, dst, len, static_cast<off_t>(read_pos_));
    } while (n < 0 && errno == EINTR);
    if (n < 0) {
        throw std::system_error(errno, std::system_category(), "cannot read request body file");
    }
    read_pos_ += static_cast<size_t>(n);
    return static_cast<size_t>(n);
}

std::string RequestBody::read(size_t max_len) {
    std::string out(std::min(max_len, size_ - std::min(read_pos_, size_)), '\0');
    size_t n = read(out.data(), out.size());
    out.resize(n);
    return out;
}

std::string RequestBody::str() const {
    if (closed_) {
        return std::string();
    }
    if (fd_ < 0) {
        return memory_;
    }

    std::string out(size_, '\0');
    size_t done = 0;
    while (done < size_) {
        ssize_t n = ::pread(fd_, out.data() + done, size_ - done, static_cast<off_t>(done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw std::system_error(errno, std::system_category(), "cannot read request body file");
        }
        if (n == 0) break;
        done += static_cast<size_t>(n);
    }
    out.resize(done);
    return out;
}

void RequestBody::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    memory_.clear();
    memory_.shrink_to_fit();
    closed_ = true;
}

HttpRequest::HttpRequest(size_t max_body_in_memory) : body_(max_body_in_memory) {}

void HttpRequest::setRequestLine(std::string method, std::string target, std::string version) {
    method_ = std::move(method);
    version_ = std::move(version);
    target_ = std::move(target);

    std::string_view rest = target_;
    size_t hash = rest.find('#');
    if (hash != std::string_view::npos) {
        fragment_ = std::string(rest.substr(hash + 1));
        rest = rest.substr(0, hash);
    } else {
        fragment_.clear();
    }

    size_t question = rest.find('?');
    if (question != std::string_view::npos) {
        query_ = std::string(rest.substr(question + 1));
        rest = rest.substr(0, question);
    } else {
        query_.clear();
    }
    path_ = std::string(rest);
}

std::string HttpRequest::serverName() const {
    std::string host = getHeader("host");
    if (host.empty()) {
        return "localhost";
    }
    // [v6-literal]:port
    if (host.front() == '[') {
        size_t close = host.find(']');
        return close == std::string::npos ? host : host.substr(0, close + 1);
    }
    size_t colon = host.find(':');
    return colon == std::string::npos ? host : host.substr(0, colon);
}

std::string HttpRequest::serverPort() const {
    std::string host = getHeader("host");
    size_t start = 0;
    if (!host.empty() && host.front() == '[') {
        size_t close = host.find(']');
        start = close == std::string::npos ? host.size() : close + 1;
    }
    size_t colon = host.find(':', start);
    if (colon == std::string::npos || colon + 1 >= host.size()) {
        return "80";
    }
    return host.substr(colon + 1);
}

bool HttpRequest::supportsChunkedEncoding() const {
    if (version_ != "HTTP/1.0" && version_ != "HTTP/0.9" && version_.rfind("HTTP/", 0) == 0) {
        return true;
    }
    return header_has_token(getHeader("te"), "chunked");
}

void HttpRequest::close() {
    body_.close();
    async_callback_ = nullptr;
}

} // namespace stoa
