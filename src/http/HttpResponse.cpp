#include "stoa/http/HttpResponse.hpp"
#include "stoa/http/DeferredBody.hpp"

#include <algorithm>
#include <cerrno>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>

namespace stoa {

HttpResponse::HttpResponse(ResponseParts parts) : status_(parts.status) {
    if (status_ < 100 || status_ > 999) {
        throw std::invalid_argument("response status out of range: " + std::to_string(status_));
    }
    for (const auto& [name, value] : parts.headers) {
        validateHeader(name, value);
    }
    headers_ = std::move(parts.headers);

    if (auto* chunks = std::get_if<ChunkList>(&parts.body)) {
        kind_ = BodyKind::Chunks;
        chunks_ = std::move(*chunks);
    } else if (auto* file = std::get_if<FileBody>(&parts.body)) {
        if (file->path.empty()) {
            throw std::invalid_argument("file body without a path");
        }
        kind_ = BodyKind::File;
        file_path_ = std::move(file->path);
    } else {
        auto& deferred = std::get<std::shared_ptr<DeferredBody>>(parts.body);
        if (!deferred) {
            throw std::invalid_argument("deferred body is null");
        }
        kind_ = BodyKind::Deferred;
        deferred_ = std::move(deferred);
    }
}

HttpResponse HttpResponse::error(int status) {
    std::string reason = status_text(status);
    return HttpResponse(ResponseParts::chunks(
        status, {{"Content-Type", "text/plain"}}, ChunkList{std::move(reason)}));
}

std::string HttpResponse::getHeader(std::string_view name) const {
    for (const auto& [key, value] : headers_) {
        if (iequals(key, name)) {
            return value;
        }
    }
    return "";
}

bool HttpResponse::hasHeader(std::string_view name) const {
    return std::any_of(headers_.begin(), headers_.end(),
                       [&](const auto& h) { return iequals(h.first, name); });
}

void HttpResponse::setHeader(std::string_view name, std::string value) {
    validateHeader(name, value);
    removeHeader(name);
    headers_.emplace_back(std::string(name), std::move(value));
}

void HttpResponse::removeHeader(std::string_view name) {
    headers_.erase(std::remove_if(headers_.begin(), headers_.end(),
                                  [&](const auto& h) { return iequals(h.first, name); }),
                   headers_.end());
}

bool HttpResponse::statusForbidsBody(int status) {
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

void HttpResponse::validateHeader(std::string_view name, std::string_view value) {
    if (name.empty()) {
        throw std::invalid_argument("empty header name");
    }
    auto bad_name = [](unsigned char c) { return c <= 0x20 || c >= 0x7f || c == ':'; };
    if (std::any_of(name.begin(), name.end(), bad_name)) {
        throw std::invalid_argument("invalid header name: " + std::string(name));
    }
    if (value.find_first_of("\r\n") != std::string_view::npos) {
        throw std::invalid_argument("line break in value of header " + std::string(name));
    }
}

std::string HttpResponse::contentTypeFor(std::string_view path) {
    size_t slash = path.find_last_of('/');
    size_t dot = path.find_last_of('.');
    if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash)) {
        return "application/octet-stream";
    }
    std::string ext = to_lower(path.substr(dot + 1));
    if (ext == "html" || ext == "htm") return "text/html";
    if (ext == "css") return "text/css";
    if (ext == "js") return "application/javascript";
    if (ext == "json") return "application/json";
    if (ext == "png") return "image/png";
    if (ext == "jpg" || ext == "jpeg") return "image/jpeg";
    if (ext == "gif") return "image/gif";
    if (ext == "svg") return "image/svg+xml";
    if (ext == "ico") return "image/x-icon";
    if (ext == "txt") return "text/plain";
    if (ext == "xml") return "application/xml";
    if (ext == "pdf") return "application/pdf";
    return "application/octet-stream";
}

void HttpResponse::finish(bool head_request, bool chunked_supported, std::string_view server_software) {
    const bool bodiless_status = statusForbidsBody(status_);
    sends_body_ = !bodiless_status && !head_request;
    chunked_ = false;

    if (bodiless_status) {
        removeHeader("Content-Length");
        removeHeader("Transfer-Encoding");
    } else {
        switch (kind_) {
            case BodyKind::Chunks:
                // Transfer-Encoding wins over Content-Length (RFC 9112 6.3)
                if (hasHeader("Transfer-Encoding")) {
                    removeHeader("Content-Length");
                } else if (!hasHeader("Content-Length")) {
                    size_t length = 0;
                    for (const auto& chunk : chunks_) {
                        length += chunk.size();
                    }
                    setHeader("Content-Length", std::to_string(length));
                }
                break;

            case BodyKind::File: {
                struct stat st {};
                if (::stat(file_path_.c_str(), &st) != 0) {
                    throw std::system_error(errno, std::system_category(), "cannot stat " + file_path_);
                }
                if (!S_ISREG(st.st_mode)) {
                    throw std::system_error(EISDIR, std::system_category(), "not a regular file: " + file_path_);
                }
                file_size_ = static_cast<uint64_t>(st.st_size);
                if (!hasHeader("Content-Type")) {
                    setHeader("Content-Type", contentTypeFor(file_path_));
                }
                if (chunked_supported) {
                    chunked_ = true;
                    removeHeader("Content-Length");
                    setHeader("Transfer-Encoding", "chunked");
                } else {
                    removeHeader("Transfer-Encoding");
                    setHeader("Content-Length", std::to_string(file_size_));
                }
                break;
            }

            case BodyKind::Deferred:
                if (hasHeader("Content-Length")) {
                    removeHeader("Transfer-Encoding");
                } else if (chunked_supported) {
                    chunked_ = true;
                    setHeader("Transfer-Encoding", "chunked");
                } else {
                    // Only the close can mark where this body ends
                    removeHeader("Transfer-Encoding");
                    keep_alive_ = false;
                }
                break;
        }
    }

    setHeader("Connection", keep_alive_ ? "keep-alive" : "close");
    if (!server_software.empty() && !hasHeader("Server")) {
        setHeader("Server", std::string(server_software));
    }

    head_ = "HTTP/1.1 ";
    head_ += std::to_string(status_);
    head_ += ' ';
    head_ += status_text(status_);
    head_ += "\r\n";
    for (const auto& [name, value] : headers_) {
        head_ += name;
        head_ += ": ";
        head_ += value;
        head_ += "\r\n";
    }
    head_ += "\r\n";
    finished_ = true;
}

void HttpResponse::close() {
    if (deferred_) {
        deferred_->detach();
        deferred_.reset();
    }
    chunks_.clear();
}

} // namespace stoa
