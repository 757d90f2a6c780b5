#pragma once
#include <algorithm>
#include <cctype>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace stoa {

class HttpRequest;
class DeferredBody;

// Request headers, keyed by lowercase name
using HeaderMap = std::unordered_map<std::string, std::string>;

// Response headers in application order, names as given
using HeaderList = std::vector<std::pair<std::string, std::string>>;

inline std::string to_lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

inline bool iequals(std::string_view a, std::string_view b) {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(), [](unsigned char x, unsigned char y) {
               return std::tolower(x) == std::tolower(y);
           });
}

// Case-insensitive search for token in a comma separated header value
inline bool header_has_token(std::string_view value, std::string_view token) {
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        std::string_view item = value.substr(pos, comma == std::string_view::npos ? value.npos : comma - pos);
        while (!item.empty() && (item.front() == ' ' || item.front() == '\t')) item.remove_prefix(1);
        while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.remove_suffix(1);
        size_t semi = item.find(';');
        if (semi != std::string_view::npos) {
            item = item.substr(0, semi);
            while (!item.empty() && (item.back() == ' ' || item.back() == '\t')) item.remove_suffix(1);
        }
        if (iequals(item, token)) {
            return true;
        }
        if (comma == std::string_view::npos) {
            break;
        }
        pos = comma + 1;
    }
    return false;
}

template<typename HeaderMapT>
std::string read_header(const HeaderMapT &headers, const std::string &name) {
    auto it = headers.find(to_lower(name));
    return it != headers.end() ? it->second : "";
}

// Standard reason phrase, "Unknown" for codes without one
const char* status_text(int code);

// Chunked transfer framing
std::string chunk_frame(std::string_view data);
inline constexpr std::string_view LAST_CHUNK = "0\r\n\r\n";

using ChunkList = std::vector<std::string>;

struct FileBody {
    std::string path;
};

// Exactly one body representation per response
using ResponseBody = std::variant<ChunkList, FileBody, std::shared_ptr<DeferredBody>>;

/**
 * What the application hands back: status, headers and a body producer.
 */
struct ResponseParts {
    int status = 200;
    HeaderList headers;
    ResponseBody body;

    static ResponseParts chunks(int status, HeaderList headers, ChunkList body) {
        return ResponseParts{status, std::move(headers), ResponseBody(std::move(body))};
    }

    static ResponseParts file(int status, HeaderList headers, std::string path) {
        return ResponseParts{status, std::move(headers), ResponseBody(FileBody{std::move(path)})};
    }

    static ResponseParts deferred(int status, HeaderList headers, std::shared_ptr<DeferredBody> body) {
        return ResponseParts{status, std::move(headers), ResponseBody(std::move(body))};
    }
};

/**
 * Result of calling the application: a finished response, or a promise that
 * the request's async callback will be invoked with one later.
 */
class DispatchOutcome {
public:
    static DispatchOutcome completed(ResponseParts parts) {
        return DispatchOutcome(std::move(parts));
    }

    static DispatchOutcome asyncPending() {
        return DispatchOutcome();
    }

    bool isAsyncPending() const { return !parts_.has_value(); }

    ResponseParts& response() { return *parts_; }
    const ResponseParts& response() const { return *parts_; }

private:
    DispatchOutcome() = default;
    explicit DispatchOutcome(ResponseParts parts) : parts_(std::move(parts)) {}

    std::optional<ResponseParts> parts_;
};

// Delivers a later response for an async-pending request; callable from any thread
using AsyncCallback = std::function<void(ResponseParts)>;

using HttpApplication = std::function<DispatchOutcome(HttpRequest&)>;

} // namespace stoa
