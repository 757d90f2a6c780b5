#include "stoa/http/HttpParser.hpp"
#include <algorithm>
#include <cctype>
#include <charconv>

namespace stoa {

size_t HttpParser::feed(std::string_view data) {
    size_t pos = 0;

    while (pos < data.size()) {
        switch (state_) {
            case State::Complete:
            case State::Failed:
                return pos;

            case State::Idle: {
                // Tolerate empty lines before a request line
                char c = data[pos];
                if (c == '\r' || c == '\n') {
                    ++pos;
                    break;
                }
                state_ = State::RequestLine;
                listener_.onMessageBegin();
                break;
            }

            case State::RequestLine:
                if (!takeLine(data, pos, MAX_REQUEST_LINE, "request line")) {
                    return state_ == State::Failed ? pos : data.size();
                }
                if (!parseRequestLine(line_)) {
                    return pos;
                }
                line_.clear();
                state_ = State::Headers;
                break;

            case State::Headers:
                if (!takeLine(data, pos, MAX_HEADER_LINE, "header line")) {
                    return state_ == State::Failed ? pos : data.size();
                }
                if (line_.empty()) {
                    if (!finishHeaders()) {
                        return pos;
                    }
                } else if (!parseHeaderLine(line_)) {
                    return pos;
                }
                line_.clear();
                break;

            case State::Body: {
                size_t n = static_cast<size_t>(
                    std::min<uint64_t>(body_remaining_, data.size() - pos));
                body_remaining_ -= n;
                listener_.onBody(data.substr(pos, n));
                pos += n;
                if (body_remaining_ == 0) {
                    completeMessage();
                }
                break;
            }

            case State::ChunkSize:
                if (!takeLine(data, pos, MAX_CHUNK_LINE, "chunk size line")) {
                    return state_ == State::Failed ? pos : data.size();
                }
                if (!parseChunkSize(line_)) {
                    return pos;
                }
                line_.clear();
                break;

            case State::ChunkData: {
                size_t n = static_cast<size_t>(
                    std::min<uint64_t>(body_remaining_, data.size() - pos));
                body_remaining_ -= n;
                listener_.onBody(data.substr(pos, n));
                pos += n;
                if (body_remaining_ == 0) {
                    state_ = State::ChunkDataEnd;
                }
                break;
            }

            case State::ChunkDataEnd:
                if (!takeLine(data, pos, MAX_CHUNK_LINE, "chunk terminator")) {
                    return state_ == State::Failed ? pos : data.size();
                }
                if (!line_.empty()) {
                    fail("chunk data longer than its declared size");
                    return pos;
                }
                state_ = State::ChunkSize;
                break;

            case State::Trailers:
                if (!takeLine(data, pos, MAX_HEADER_LINE, "trailer line")) {
                    return state_ == State::Failed ? pos : data.size();
                }
                if (line_.empty()) {
                    completeMessage();
                } else if (++trailer_count_ > MAX_HEADERS) {
                    fail("too many trailer fields");
                    return pos;
                }
                line_.clear();
                break;
        }
    }

    // A message whose body is empty completes on its final header line
    return pos;
}

void HttpParser::reset() {
    state_ = State::Idle;
    line_.clear();
    head_ = RequestHead{};
    header_count_ = 0;
    body_remaining_ = 0;
    body_total_ = 0;
    trailer_count_ = 0;
    headers_complete_ = false;
    keep_alive_ = false;
}

bool HttpParser::takeLine(std::string_view data, size_t& pos, size_t limit, const char* what) {
    size_t eol = data.find('\n', pos);
    size_t end = eol == std::string_view::npos ? data.size() : eol;

    line_.append(data.substr(pos, end - pos));
    pos = eol == std::string_view::npos ? data.size() : eol + 1;

    if (line_.size() > limit + 1) {
        fail(std::string(what) + " too long");
        return false;
    }
    if (eol == std::string_view::npos) {
        return false;
    }
    if (!line_.empty() && line_.back() == '\r') {
        line_.pop_back();
    }
    if (line_.size() > limit) {
        fail(std::string(what) + " too long");
        return false;
    }
    return true;
}

bool HttpParser::parseRequestLine(std::string_view line) {
    size_t sp1 = line.find(' ');
    size_t sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
    if (sp1 == std::string_view::npos || sp2 == std::string_view::npos ||
        line.find(' ', sp2 + 1) != std::string_view::npos) {
        fail("malformed request line");
        return false;
    }

    std::string_view method = line.substr(0, sp1);
    std::string_view target = line.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string_view version = line.substr(sp2 + 1);

    if (!isToken(method)) {
        fail("invalid method");
        return false;
    }
    if (target.empty() || std::any_of(target.begin(), target.end(), [](unsigned char c) {
            return c <= 0x20 || c == 0x7f;
        })) {
        fail("invalid request target");
        return false;
    }
    if (version.size() != 8 || version.substr(0, 5) != "HTTP/" ||
        !std::isdigit(static_cast<unsigned char>(version[5])) || version[6] != '.' ||
        !std::isdigit(static_cast<unsigned char>(version[7]))) {
        fail("invalid HTTP version");
        return false;
    }
    if (version[5] != '1') {
        fail("unsupported HTTP version");
        return false;
    }

    head_.method = std::string(method);
    head_.target = std::string(target);
    head_.version = std::string(version);
    return true;
}

bool HttpParser::parseHeaderLine(std::string_view line) {
    if (line.front() == ' ' || line.front() == '\t') {
        fail("obsolete header line folding");
        return false;
    }
    if (++header_count_ > MAX_HEADERS) {
        fail("too many header fields");
        return false;
    }

    size_t colon = line.find(':');
    if (colon == std::string_view::npos || colon == 0 || !isToken(line.substr(0, colon))) {
        fail("malformed header field");
        return false;
    }

    std::string name = to_lower(line.substr(0, colon));
    std::string value = trimValue(line.substr(colon + 1));

    auto it = head_.headers.find(name);
    if (it == head_.headers.end()) {
        head_.headers.emplace(std::move(name), std::move(value));
    } else if (name == "content-length") {
        if (it->second != value) {
            fail("conflicting Content-Length values");
            return false;
        }
    } else {
        it->second += ", ";
        it->second += value;
    }
    return true;
}

bool HttpParser::finishHeaders() {
    const bool http11 = head_.version == "HTTP/1.1";
    std::string connection = read_header(head_.headers, "connection");
    keep_alive_ = http11 ? !header_has_token(connection, "close")
                         : header_has_token(connection, "keep-alive");
    head_.keep_alive = keep_alive_;

    bool chunked = false;
    auto te = head_.headers.find("transfer-encoding");
    if (te != head_.headers.end()) {
        // chunked must be the final coding; nothing else is decoded here
        std::string_view codings = te->second;
        size_t last_comma = codings.rfind(',');
        std::string_view last = last_comma == std::string_view::npos ? codings : codings.substr(last_comma + 1);
        if (!header_has_token(last, "chunked") || codings.find(',') != std::string_view::npos) {
            fail("unsupported Transfer-Encoding");
            return false;
        }
        chunked = true;
        head_.headers.erase("content-length");
    }

    uint64_t length = 0;
    if (!chunked) {
        auto cl = head_.headers.find("content-length");
        if (cl != head_.headers.end()) {
            const std::string& v = cl->second;
            auto [ptr, ec] = std::from_chars(v.data(), v.data() + v.size(), length);
            if (v.empty() || ec != std::errc() || ptr != v.data() + v.size()) {
                fail("invalid Content-Length");
                return false;
            }
            if (length > MAX_CONTENT_LENGTH) {
                fail("Content-Length exceeds limit");
                return false;
            }
        }
    }

    headers_complete_ = true;
    listener_.onHeadersComplete(head_);

    if (chunked) {
        state_ = State::ChunkSize;
    } else if (length > 0) {
        body_remaining_ = length;
        state_ = State::Body;
    } else {
        completeMessage();
    }
    return true;
}

bool HttpParser::parseChunkSize(std::string_view line) {
    size_t semi = line.find(';');
    std::string_view digits = line.substr(0, semi);
    while (!digits.empty() && (digits.back() == ' ' || digits.back() == '\t')) {
        digits.remove_suffix(1);
    }

    uint64_t size = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), size, 16);
    if (digits.empty() || ec != std::errc() || ptr != digits.data() + digits.size()) {
        fail("invalid chunk size");
        return false;
    }

    body_total_ += size;
    if (size > MAX_CONTENT_LENGTH || body_total_ > MAX_CONTENT_LENGTH) {
        fail("chunked body exceeds limit");
        return false;
    }

    if (size == 0) {
        state_ = State::Trailers;
    } else {
        body_remaining_ = size;
        state_ = State::ChunkData;
    }
    return true;
}

void HttpParser::completeMessage() {
    state_ = State::Complete;
    listener_.onMessageComplete();
}

void HttpParser::fail(std::string detail) {
    state_ = State::Failed;
    line_.clear();
    listener_.onParseError(detail);
}

bool HttpParser::isToken(std::string_view s) {
    static constexpr std::string_view separators = "()<>@,;:\\\"/[]?={} \t";
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return c > 0x20 && c < 0x7f && separators.find(static_cast<char>(c)) == std::string_view::npos;
    });
}

std::string HttpParser::trimValue(std::string_view value) {
    while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) {
        value.remove_prefix(1);
    }
    while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) {
        value.remove_suffix(1);
    }
    return std::string(value);
}

} // namespace stoa
