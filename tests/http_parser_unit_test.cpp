#include <gtest/gtest.h>
#include "stoa/http/HttpParser.hpp"

#include <string>
#include <vector>

using namespace stoa;

namespace {

// Records parser events as a trace of tags
class RecordingListener : public HttpParserListener {
public:
    void onMessageBegin() override { events.push_back("begin"); }
    void onHeadersComplete(RequestHead& h) override {
        events.push_back("headers");
        head = h;
    }
    void onBody(std::string_view chunk) override { body.append(chunk); }
    void onMessageComplete() override { events.push_back("complete"); }
    void onParseError(std::string_view detail) override {
        events.push_back("error");
        error = std::string(detail);
    }

    std::vector<std::string> events;
    RequestHead head;
    std::string body;
    std::string error;
};

} // namespace

class HttpParserUnitTest : public ::testing::Test {
protected:
    RecordingListener listener;
    HttpParser parser{listener};
};

TEST_F(HttpParserUnitTest, ParsesSimpleGetRequest) {
    std::string request =
        "GET /path?x=1 HTTP/1.1\r\n"
        "Host: example.com\r\n"
        "\r\n";

    EXPECT_EQ(parser.feed(request), request.size());
    EXPECT_TRUE(parser.messageComplete());
    EXPECT_EQ(listener.head.method, "GET");
    EXPECT_EQ(listener.head.target, "/path?x=1");
    EXPECT_EQ(listener.head.version, "HTTP/1.1");
    EXPECT_EQ(listener.head.headers.at("host"), "example.com");
    EXPECT_TRUE(listener.head.keep_alive);
    EXPECT_EQ(listener.events, (std::vector<std::string>{"begin", "headers", "complete"}));
}

TEST_F(HttpParserUnitTest, ParsesPostRequestWithBody) {
    std::string request =
        "POST /api/data HTTP/1.1\r\n"
        "Content-Type: application/json\r\n"
        "Content-Length: 13\r\n"
        "\r\n"
        "{\"key\":\"val\"}";

    EXPECT_EQ(parser.feed(request), request.size());
    EXPECT_TRUE(parser.messageComplete());
    EXPECT_EQ(listener.head.headers.at("content-type"), "application/json");
    EXPECT_EQ(listener.body, "{\"key\":\"val\"}");
}

TEST_F(HttpParserUnitTest, AcceptsBytesOneAtATime) {
    std::string request =
        "POST /upload HTTP/1.1\r\n"
        "Content-Length: 5\r\n"
        "\r\n"
        "hello";

    for (char c : request) {
        ASSERT_FALSE(parser.messageComplete());
        EXPECT_EQ(parser.feed(std::string_view(&c, 1)), 1u);
    }
    EXPECT_TRUE(parser.messageComplete());
    EXPECT_EQ(listener.body, "hello");
}

TEST_F(HttpParserUnitTest, NormalizesHeaderNamesAndTrimsValues) {
    std::string request =
        "GET / HTTP/1.1\r\n"
        "User-Agent:   TestAgent/1.0  \r\n"
        "Content-TYPE:\ttext/plain\r\n"
        "\r\n";

    parser.feed(request);
    EXPECT_EQ(listener.head.headers.at("user-agent"), "TestAgent/1.0");
    EXPECT_EQ(listener.head.headers.at("content-type"), "text/plain");
}

TEST_F(HttpParserUnitTest, JoinsRepeatedHeaders) {
    parser.feed("GET / HTTP/1.1\r\nAccept: a\r\nAccept: b\r\n\r\n");
    EXPECT_EQ(listener.head.headers.at("accept"), "a, b");
}

TEST_F(HttpParserUnitTest, AcceptsBareLineFeeds) {
    parser.feed("GET / HTTP/1.1\nHost: h\n\n");
    EXPECT_TRUE(parser.messageComplete());
    EXPECT_EQ(listener.head.headers.at("host"), "h");
}

TEST_F(HttpParserUnitTest, StopsAfterEachPipelinedMessage) {
    std::string first = "GET /a HTTP/1.1\r\n\r\n";
    std::string both = first + "GET /b HTTP/1.1\r\n\r\n";

    EXPECT_EQ(parser.feed(both), first.size());
    EXPECT_EQ(listener.head.target, "/a");

    // Further input is refused until the owner resets
    EXPECT_EQ(parser.feed(std::string_view(both).substr(first.size())), 0u);

    parser.reset();
    EXPECT_EQ(parser.feed(std::string_view(both).substr(first.size())), both.size() - first.size());
    EXPECT_EQ(listener.head.target, "/b");
}

TEST_F(HttpParserUnitTest, SkipsBlankLinesBetweenMessages) {
    std::string request = "\r\n\r\nGET / HTTP/1.1\r\n\r\n";
    EXPECT_EQ(parser.feed(request), request.size());
    EXPECT_TRUE(parser.messageComplete());
    EXPECT_EQ(listener.events.front(), "begin");
}

TEST_F(HttpParserUnitTest, DecodesChunkedBody) {
    std::string request =
        "POST /c HTTP/1.1\r\n"
        "Transfer-Encoding: chunked\r\n"
        "\r\n"
        "5;ext=1\r\nhello\r\n"
        "6\r\n world\r\n"
        "0\r\n"
        "X-Trailer: yes\r\n"
        "\r\n";

    EXPECT_EQ(parser.feed(request), request.size());
    EXPECT_TRUE(parser.messageComplete());
    EXPECT_EQ(listener.body, "hello world");
}

TEST_F(HttpParserUnitTest, ChunkedOverridesContentLength) {
    parser.feed("POST / HTTP/1.1\r\nContent-Length: 100\r\nTransfer-Encoding: chunked\r\n\r\n"
                "3\r\nabc\r\n0\r\n\r\n");
    EXPECT_TRUE(parser.messageComplete());
    EXPECT_EQ(listener.body, "abc");
    EXPECT_EQ(listener.head.headers.count("content-length"), 0u);
}

TEST_F(HttpParserUnitTest, KeepAliveDefaults) {
    parser.feed("GET / HTTP/1.0\r\n\r\n");
    EXPECT_FALSE(parser.keepAlive());

    parser.reset();
    parser.feed("GET / HTTP/1.0\r\nConnection: Keep-Alive\r\n\r\n");
    EXPECT_TRUE(parser.keepAlive());

    parser.reset();
    parser.feed("GET / HTTP/1.1\r\nConnection: close\r\n\r\n");
    EXPECT_FALSE(parser.keepAlive());
}

TEST_F(HttpParserUnitTest, HandlesIncompleteRequest) {
    std::string partial = "GET / HTTP/1.1\r\nHost: exa";
    EXPECT_EQ(parser.feed(partial), partial.size());
    EXPECT_FALSE(parser.messageComplete());
    EXPECT_FALSE(parser.headersComplete());
}

TEST_F(HttpParserUnitTest, HandlesPartialBody) {
    parser.feed("POST / HTTP/1.1\r\nContent-Length: 10\r\n\r\n12345");
    EXPECT_TRUE(parser.headersComplete());
    EXPECT_FALSE(parser.messageComplete());
    parser.feed("67890");
    EXPECT_TRUE(parser.messageComplete());
    EXPECT_EQ(listener.body, "1234567890");
}

TEST_F(HttpParserUnitTest, RejectsMalformedRequestLine) {
    parser.feed("GARBAGE\r\n\r\n");
    EXPECT_TRUE(parser.failed());
    EXPECT_FALSE(parser.headersComplete());
    EXPECT_EQ(listener.events.back(), "error");
}

TEST_F(HttpParserUnitTest, RejectsUnsupportedVersion) {
    parser.feed("GET / HTTP/2.0\r\n\r\n");
    EXPECT_TRUE(parser.failed());
}

TEST_F(HttpParserUnitTest, RejectsOversizeRequestLine) {
    std::string request = "GET /" + std::string(HttpParser::MAX_REQUEST_LINE + 10, 'a') + " HTTP/1.1\r\n\r\n";
    parser.feed(request);
    EXPECT_TRUE(parser.failed());
    EXPECT_NE(listener.error.find("too long"), std::string::npos);
}

TEST_F(HttpParserUnitTest, RejectsTooManyHeaders) {
    std::string request = "GET / HTTP/1.1\r\n";
    for (size_t i = 0; i <= HttpParser::MAX_HEADERS; ++i) {
        request += "X-H" + std::to_string(i) + ": v\r\n";
    }
    request += "\r\n";
    parser.feed(request);
    EXPECT_TRUE(parser.failed());
}

TEST_F(HttpParserUnitTest, RejectsInvalidContentLength) {
    parser.feed("POST / HTTP/1.1\r\nContent-Length: 12abc\r\n\r\n");
    EXPECT_TRUE(parser.failed());
}

TEST_F(HttpParserUnitTest, RejectsConflictingContentLength) {
    parser.feed("POST / HTTP/1.1\r\nContent-Length: 3\r\nContent-Length: 4\r\n\r\nabcd");
    EXPECT_TRUE(parser.failed());
}

TEST_F(HttpParserUnitTest, RejectsUnknownTransferEncoding) {
    parser.feed("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n");
    EXPECT_TRUE(parser.failed());
}

TEST_F(HttpParserUnitTest, RejectsBadChunkSize) {
    parser.feed("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
    EXPECT_TRUE(parser.failed());
    // Headers were accepted before the body went wrong
    EXPECT_TRUE(parser.headersComplete());
}

TEST_F(HttpParserUnitTest, RejectsHeaderFolding) {
    parser.feed("GET / HTTP/1.1\r\nX-A: 1\r\n  continued\r\n\r\n");
    EXPECT_TRUE(parser.failed());
}

TEST_F(HttpParserUnitTest, ResetClearsFailure) {
    parser.feed("BAD\r\n");
    ASSERT_TRUE(parser.failed());
    parser.reset();
    EXPECT_FALSE(parser.failed());
    parser.feed("GET / HTTP/1.1\r\n\r\n");
    EXPECT_TRUE(parser.messageComplete());
}
