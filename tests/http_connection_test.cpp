#include <gtest/gtest.h>
#include "stoa/http/DeferredBody.hpp"
#include "stoa/http/HttpConnection.hpp"
#include "stoa/threading/SimpleWorkerPool.hpp"
#include "support/CapturingLogger.hpp"
#include "support/FakeTransport.hpp"
#include "support/ManualLoop.hpp"

#include <atomic>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <thread>
#include <unistd.h>

using namespace stoa;
namespace fs = std::filesystem;

namespace {

DispatchOutcome text(int status, std::string body) {
    return DispatchOutcome::completed(
        ResponseParts::chunks(status, {{"Content-Type", "text/plain"}}, ChunkList{std::move(body)}));
}

HttpApplication echoPath() {
    return [](HttpRequest& req) { return text(200, "path=" + req.path()); };
}

} // namespace

class HttpConnectionTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport_ = std::make_shared<test::FakeTransport>(loop_);
    }

    std::shared_ptr<HttpConnection> connect(HttpApplication app,
                                            const std::function<void(ConnectionContext&)>& configure = {}) {
        auto ctx = std::make_shared<ConnectionContext>(std::move(app), loop_, logger_);
        if (configure) {
            configure(*ctx);
        }
        auto connection = std::make_shared<HttpConnection>(ctx, transport_);
        connection->start();
        return connection;
    }

    const std::string& written() const { return transport_->written; }

    test::ManualLoop loop_;
    test::CapturingLogger logger_;
    std::shared_ptr<test::FakeTransport> transport_;
};

TEST_F(HttpConnectionTest, AnswersSimpleGet) {
    auto conn = connect(echoPath());
    conn->receiveData("GET /hello?x=1 HTTP/1.1\r\nHost: example.com\r\n\r\n");

    EXPECT_EQ(written().rfind("HTTP/1.1 200 OK\r\n", 0), 0u);
    EXPECT_NE(written().find("Content-Length: 11\r\n"), std::string::npos);
    EXPECT_NE(written().find("Connection: keep-alive\r\n"), std::string::npos);
    EXPECT_NE(written().find("Server: stoa\r\n"), std::string::npos);
    EXPECT_NE(written().find("\r\n\r\npath=/hello"), std::string::npos);
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);
    EXPECT_EQ(conn->requestsDispatched(), 1u);
    EXPECT_FALSE(transport_->close_after_writing);
}

TEST_F(HttpConnectionTest, ConnectionCloseEndsAfterResponse) {
    auto conn = connect(echoPath());
    conn->receiveData("GET / HTTP/1.1\r\nConnection: close\r\n\r\n");

    EXPECT_NE(written().find("Connection: close\r\n"), std::string::npos);
    EXPECT_TRUE(conn->closed());
    EXPECT_TRUE(transport_->close_after_writing);
    EXPECT_FALSE(transport_->closed);
}

TEST_F(HttpConnectionTest, Http10ClosesUnlessAskedToKeepAlive) {
    auto conn = connect(echoPath());
    conn->receiveData("GET / HTTP/1.0\r\n\r\n");
    EXPECT_TRUE(conn->closed());

    auto other = std::make_shared<test::FakeTransport>(loop_);
    auto ctx = std::make_shared<ConnectionContext>(echoPath(), loop_, logger_);
    auto kept = std::make_shared<HttpConnection>(ctx, other);
    kept->start();
    kept->receiveData("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
    EXPECT_EQ(kept->state(), HttpConnection::State::Idle);
    EXPECT_NE(other->written.find("Connection: keep-alive"), std::string::npos);
}

TEST_F(HttpConnectionTest, RequestSplitAcrossReads) {
    auto conn = connect(echoPath());
    conn->receiveData("GET /sp");
    EXPECT_EQ(conn->state(), HttpConnection::State::Headers);
    conn->receiveData("lit HTTP/1.1\r\nHost: h\r\n");
    EXPECT_TRUE(written().empty());
    conn->receiveData("\r\n");
    EXPECT_NE(written().find("path=/split"), std::string::npos);
}

TEST_F(HttpConnectionTest, PipelinedRequestsAnsweredInOrder) {
    auto conn = connect(echoPath());
    conn->receiveData("GET /one HTTP/1.1\r\n\r\nGET /two HTTP/1.1\r\n\r\nGET /three HTTP/1.1\r\n\r\n");

    EXPECT_EQ(transport_->responses(), 3u);
    size_t one = written().find("path=/one");
    size_t two = written().find("path=/two");
    size_t three = written().find("path=/three");
    ASSERT_NE(one, std::string::npos);
    ASSERT_NE(two, std::string::npos);
    ASSERT_NE(three, std::string::npos);
    EXPECT_LT(one, two);
    EXPECT_LT(two, three);
    EXPECT_EQ(conn->requestsDispatched(), 3u);
}

TEST_F(HttpConnectionTest, PipelineStopsAtConnectionClose) {
    auto conn = connect(echoPath());
    conn->receiveData("GET /one HTTP/1.1\r\nConnection: close\r\n\r\nGET /two HTTP/1.1\r\n\r\n");

    EXPECT_EQ(transport_->responses(), 1u);
    EXPECT_EQ(written().find("path=/two"), std::string::npos);
    EXPECT_TRUE(conn->closed());
}

TEST_F(HttpConnectionTest, HeadSendsHeadersOnly) {
    auto conn = connect([](HttpRequest&) { return text(200, "invisible"); });
    conn->receiveData("HEAD / HTTP/1.1\r\n\r\n");

    EXPECT_NE(written().find("Content-Length: 9\r\n"), std::string::npos);
    EXPECT_EQ(written().find("invisible"), std::string::npos);
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);
}

TEST_F(HttpConnectionTest, MalformedRequestGets400AndClose) {
    bool called = false;
    auto conn = connect([&called](HttpRequest&) {
        called = true;
        return text(200, "no");
    });
    conn->receiveData("NOT A REQUEST LINE AT ALL\r\n\r\n");

    EXPECT_FALSE(called);
    EXPECT_EQ(written().rfind("HTTP/1.1 400 Bad Request\r\n", 0), 0u);
    EXPECT_NE(written().find("Connection: close"), std::string::npos);
    EXPECT_TRUE(conn->closed());
    EXPECT_TRUE(logger_.hasError("ParseError"));
}

TEST_F(HttpConnectionTest, BadBodyAfterHeadersKeepsConnection) {
    auto conn = connect(echoPath());
    conn->receiveData("POST /up HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\nGET /lost HTTP/1.1\r\n\r\n");

    EXPECT_EQ(transport_->responses(), 1u);
    EXPECT_NE(written().find("400 Bad Request"), std::string::npos);
    EXPECT_NE(written().find("Connection: keep-alive"), std::string::npos);
    // Bytes after the bad message are discarded
    EXPECT_EQ(written().find("path=/lost"), std::string::npos);
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);

    conn->receiveData("GET /again HTTP/1.1\r\n\r\n");
    EXPECT_NE(written().find("path=/again"), std::string::npos);
}

TEST_F(HttpConnectionTest, ApplicationExceptionGets500) {
    auto conn = connect([](HttpRequest&) -> DispatchOutcome { throw std::runtime_error("handler blew up"); });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");

    EXPECT_EQ(written().rfind("HTTP/1.1 500 Internal Server Error\r\n", 0), 0u);
    EXPECT_TRUE(logger_.hasError("handler blew up"));
    // The request asked for keep-alive and still gets it
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);
}

TEST_F(HttpConnectionTest, MissingApplicationGets500) {
    auto conn = connect(HttpApplication{});
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    EXPECT_NE(written().find("500"), std::string::npos);
}

TEST_F(HttpConnectionTest, UnusableResponseGets500) {
    auto conn = connect([](HttpRequest&) {
        return DispatchOutcome::completed(ResponseParts::chunks(42, {}, {}));
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");

    EXPECT_NE(written().find("500 Internal Server Error"), std::string::npos);
    EXPECT_TRUE(logger_.hasError("FinalizationError"));
}

TEST_F(HttpConnectionTest, RequestCarriesConnectionFacts) {
    std::string address;
    bool multithread = true;
    bool multiprocess = true;
    auto conn = connect([&](HttpRequest& req) {
        address = req.remoteAddress();
        multithread = req.multithread();
        multiprocess = req.multiprocess();
        return text(200, "ok");
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");

    EXPECT_EQ(address, "192.0.2.7");
    EXPECT_FALSE(multithread);
    EXPECT_FALSE(multiprocess);
}

TEST_F(HttpConnectionTest, UnresolvablePeerIsNotAnError) {
    transport_->peer_fails = true;
    std::string address = "unset";
    auto conn = connect([&](HttpRequest& req) {
        address = req.remoteAddress();
        return text(200, "ok");
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");

    EXPECT_EQ(address, "");
    EXPECT_TRUE(logger_.errors().empty());
    EXPECT_TRUE(logger_.hasMessage("AddressResolutionError"));
    EXPECT_NE(written().find("200 OK"), std::string::npos);
}

TEST_F(HttpConnectionTest, UnixSocketHasNoPeerAddress) {
    transport_->unix_socket = true;
    std::string address = "unset";
    auto conn = connect([&](HttpRequest& req) {
        address = req.remoteAddress();
        return text(200, "ok");
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    EXPECT_EQ(address, "");
}

TEST_F(HttpConnectionTest, LargeBodyIsSpooledToFile) {
    bool spooled = false;
    std::string seen;
    auto conn = connect(
        [&](HttpRequest& req) {
            spooled = req.body().spooled();
            seen = req.body().str();
            return text(200, std::to_string(req.body().size()));
        },
        [](ConnectionContext& ctx) { ctx.options.max_body_in_memory = 16; });

    std::string payload(100, 'z');
    conn->receiveData("POST /up HTTP/1.1\r\nContent-Length: 100\r\n\r\n" + payload.substr(0, 40));
    EXPECT_EQ(conn->state(), HttpConnection::State::Body);
    conn->receiveData(payload.substr(40));

    EXPECT_TRUE(spooled);
    EXPECT_EQ(seen, payload);
    EXPECT_NE(written().find("\r\n\r\n100"), std::string::npos);
}

TEST_F(HttpConnectionTest, AsyncResponseFromAnotherThread) {
    AsyncCallback callback;
    auto conn = connect([&](HttpRequest& req) {
        callback = req.asyncCallback();
        return DispatchOutcome::asyncPending();
    });
    conn->receiveData("GET /later HTTP/1.1\r\n\r\n");
    EXPECT_EQ(conn->state(), HttpConnection::State::AsyncWait);
    EXPECT_TRUE(written().empty());
    ASSERT_TRUE(callback);

    std::thread([callback] {
        callback(ResponseParts::chunks(202, {}, {"done later"}));
    }).join();
    loop_.runPending();

    EXPECT_NE(written().find("202 Accepted"), std::string::npos);
    EXPECT_NE(written().find("done later"), std::string::npos);
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);
}

TEST_F(HttpConnectionTest, InputDuringAsyncWaitIsHeldInOrder) {
    AsyncCallback callback;
    auto conn = connect([&](HttpRequest& req) {
        if (req.path() == "/slow") {
            callback = req.asyncCallback();
            return DispatchOutcome::asyncPending();
        }
        return text(200, "fast");
    });
    conn->receiveData("GET /slow HTTP/1.1\r\n\r\nGET /fast HTTP/1.1\r\n\r\n");
    EXPECT_TRUE(written().empty());

    callback(ResponseParts::chunks(200, {}, {"slow"}));
    loop_.runPending();

    size_t slow = written().find("\r\n\r\nslow");
    size_t fast = written().find("\r\n\r\nfast");
    ASSERT_NE(slow, std::string::npos);
    ASSERT_NE(fast, std::string::npos);
    EXPECT_LT(slow, fast);
}

TEST_F(HttpConnectionTest, SecondAsyncResponseIsIgnored) {
    AsyncCallback callback;
    auto conn = connect([&](HttpRequest& req) {
        callback = req.asyncCallback();
        return DispatchOutcome::asyncPending();
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");

    callback(ResponseParts::chunks(200, {}, {"first"}));
    callback(ResponseParts::chunks(200, {}, {"second"}));
    loop_.runPending();

    EXPECT_EQ(transport_->responses(), 1u);
    EXPECT_NE(written().find("first"), std::string::npos);
    EXPECT_EQ(written().find("second"), std::string::npos);
    EXPECT_TRUE(logger_.hasError("more than once"));
}

TEST_F(HttpConnectionTest, AsyncCallbackBeatsReturnedResponse) {
    auto conn = connect([](HttpRequest& req) {
        req.asyncCallback()(ResponseParts::chunks(200, {}, {"via callback"}));
        return text(200, "via return");
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    loop_.runPending();

    EXPECT_EQ(transport_->responses(), 1u);
    EXPECT_NE(written().find("via callback"), std::string::npos);
    EXPECT_EQ(written().find("via return"), std::string::npos);
}

TEST_F(HttpConnectionTest, AsyncResponseAfterDisconnectIsDropped) {
    AsyncCallback callback;
    auto conn = connect([&](HttpRequest& req) {
        callback = req.asyncCallback();
        return DispatchOutcome::asyncPending();
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    conn->unbind();

    callback(ResponseParts::chunks(200, {}, {"too late"}));
    loop_.runPending();

    EXPECT_TRUE(written().empty());
    EXPECT_TRUE(conn->closed());
}

TEST_F(HttpConnectionTest, AsyncResponseAfterConnectionIsGone) {
    AsyncCallback callback;
    {
        auto conn = connect([&](HttpRequest& req) {
            callback = req.asyncCallback();
            return DispatchOutcome::asyncPending();
        });
        conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    }
    callback(ResponseParts::chunks(200, {}, {"nobody listens"}));
    loop_.runPending();
    EXPECT_TRUE(written().empty());
}

TEST_F(HttpConnectionTest, ThreadedDispatchRunsOnWorker) {
    SimpleWorkerPool workers(2);
    std::thread::id app_thread;
    bool multithread = false;
    auto conn = connect(
        [&](HttpRequest& req) {
            app_thread = std::this_thread::get_id();
            multithread = req.multithread();
            return text(200, "threaded");
        },
        [&workers](ConnectionContext& ctx) { ctx.workers = &workers; });

    conn->receiveData("GET / HTTP/1.1\r\n\r\nGET /2 HTTP/1.1\r\n\r\n");
    EXPECT_EQ(conn->state(), HttpConnection::State::Dispatching);

    ASSERT_TRUE(loop_.runUntil([&] { return transport_->responses() == 2; }));
    EXPECT_NE(app_thread, std::this_thread::get_id());
    EXPECT_TRUE(multithread);
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);
}

TEST_F(HttpConnectionTest, WorkerResultAfterDisconnectIsDropped) {
    SimpleWorkerPool workers(1);
    std::atomic<bool> ran{false};
    auto conn = connect(
        [&](HttpRequest&) {
            ran = true;
            return text(200, "orphan");
        },
        [&workers](ConnectionContext& ctx) { ctx.workers = &workers; });

    conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    conn->unbind();
    workers.shutdown();
    loop_.runPending();

    EXPECT_TRUE(ran.load());
    EXPECT_TRUE(written().empty());
}

TEST_F(HttpConnectionTest, DeferredBodyStreamsAsChunks) {
    auto body = DeferredBody::create();
    auto conn = connect([&](HttpRequest&) {
        body->push("early");
        return DispatchOutcome::completed(ResponseParts::deferred(200, {}, body));
    });
    conn->receiveData("GET /stream HTTP/1.1\r\n\r\n");

    EXPECT_NE(written().find("Transfer-Encoding: chunked"), std::string::npos);
    EXPECT_NE(written().find("5\r\nearly\r\n"), std::string::npos);
    EXPECT_EQ(conn->state(), HttpConnection::State::Sending);

    std::thread([body] {
        body->push("late");
        body->succeed();
    }).join();
    loop_.runPending();

    EXPECT_NE(written().find("4\r\nlate\r\n0\r\n\r\n"), std::string::npos);
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);
}

TEST_F(HttpConnectionTest, DeferredBodyWithoutChunkingEndsWithClose) {
    auto body = DeferredBody::create();
    auto conn = connect([&](HttpRequest&) {
        return DispatchOutcome::completed(ResponseParts::deferred(200, {}, body));
    });
    conn->receiveData("GET / HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
    body->push("raw");
    body->succeed();
    loop_.runPending();

    EXPECT_NE(written().find("Connection: close"), std::string::npos);
    EXPECT_NE(written().find("\r\n\r\nraw"), std::string::npos);
    EXPECT_TRUE(conn->closed());
    EXPECT_TRUE(transport_->close_after_writing);
}

TEST_F(HttpConnectionTest, FailedDeferredBodyClosesConnection) {
    auto body = DeferredBody::create();
    auto conn = connect([&](HttpRequest&) {
        return DispatchOutcome::completed(ResponseParts::deferred(200, {}, body));
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    body->push("part");
    body->fail("upstream went away");
    loop_.runPending();

    EXPECT_NE(written().find("part"), std::string::npos);
    EXPECT_EQ(written().find("0\r\n\r\n"), std::string::npos);
    EXPECT_TRUE(conn->closed());
    EXPECT_TRUE(transport_->close_after_writing);
    EXPECT_TRUE(logger_.hasError("upstream went away"));
}

TEST_F(HttpConnectionTest, DeferredBodyOnHeadIsNotWaitedFor) {
    auto body = DeferredBody::create();
    auto conn = connect([&](HttpRequest&) {
        return DispatchOutcome::completed(ResponseParts::deferred(200, {}, body));
    });
    conn->receiveData("HEAD / HTTP/1.1\r\n\r\n");
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);

    body->push("ignored");
    body->succeed();
    loop_.runPending();
    EXPECT_EQ(written().find("ignored"), std::string::npos);
}

class HttpConnectionFileTest : public HttpConnectionTest {
protected:
    void SetUp() override {
        HttpConnectionTest::SetUp();
        dir_ = fs::temp_directory_path() / ("stoa_connection_test_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
        path_ = (dir_ / "notes.txt").string();
        std::ofstream(path_) << "file contents";
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    HttpApplication serveFile() {
        return [this](HttpRequest&) {
            return DispatchOutcome::completed(ResponseParts::file(200, {}, path_));
        };
    }

    fs::path dir_;
    std::string path_;
};

TEST_F(HttpConnectionFileTest, FileIsStreamedChunked) {
    auto conn = connect(serveFile());
    conn->receiveData("GET /notes HTTP/1.1\r\n\r\n");

    EXPECT_EQ(transport_->files_streamed, 1);
    EXPECT_EQ(conn->state(), HttpConnection::State::Sending);
    loop_.runPending();

    EXPECT_NE(written().find("Content-Type: text/plain"), std::string::npos);
    EXPECT_NE(written().find("Transfer-Encoding: chunked"), std::string::npos);
    EXPECT_NE(written().find("d\r\nfile contents\r\n0\r\n\r\n"), std::string::npos);
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);
}

TEST_F(HttpConnectionFileTest, FileHasContentLengthForHttp10) {
    auto conn = connect(serveFile());
    conn->receiveData("GET /notes HTTP/1.0\r\nConnection: keep-alive\r\n\r\n");
    loop_.runPending();

    EXPECT_NE(written().find("Content-Length: 13"), std::string::npos);
    EXPECT_NE(written().find("\r\n\r\nfile contents"), std::string::npos);
    EXPECT_EQ(conn->state(), HttpConnection::State::Idle);
}

TEST_F(HttpConnectionFileTest, PipelinedRequestWaitsForFile) {
    auto conn = connect([this](HttpRequest& req) {
        if (req.path() == "/file") {
            return DispatchOutcome::completed(ResponseParts::file(200, {}, path_));
        }
        return text(200, "after file");
    });
    conn->receiveData("GET /file HTTP/1.1\r\n\r\nGET /next HTTP/1.1\r\n\r\n");
    EXPECT_EQ(written().find("after file"), std::string::npos);

    loop_.runPending();
    EXPECT_LT(written().find("file contents"), written().find("after file"));
}

TEST_F(HttpConnectionFileTest, MissingFileGets500) {
    auto conn = connect([this](HttpRequest&) {
        return DispatchOutcome::completed(ResponseParts::file(200, {}, (dir_ / "absent").string()));
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");

    EXPECT_NE(written().find("500 Internal Server Error"), std::string::npos);
    EXPECT_EQ(transport_->files_streamed, 0);
}

TEST_F(HttpConnectionFileTest, FailedStreamClosesConnection) {
    transport_->fail_files = true;
    auto conn = connect(serveFile());
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    loop_.runPending();

    EXPECT_TRUE(conn->closed());
    EXPECT_TRUE(transport_->close_after_writing);
    EXPECT_TRUE(logger_.hasError("TransmissionError"));
    // The errno that stopped the transfer reaches the log
    EXPECT_TRUE(logger_.hasError(std::strerror(EIO)));
}

TEST_F(HttpConnectionTest, SendFailureClosesImmediately) {
    transport_->fail_sends = true;
    auto conn = connect(echoPath());
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");

    EXPECT_TRUE(conn->closed());
    EXPECT_TRUE(transport_->closed);
    EXPECT_TRUE(logger_.hasError("TransmissionError"));
}

TEST_F(HttpConnectionTest, LateWriteErrorClosesConnection) {
    AsyncCallback callback;
    auto conn = connect([&](HttpRequest& req) {
        callback = req.asyncCallback();
        return DispatchOutcome::asyncPending();
    });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    transport_->injectWriteError(EPIPE);

    EXPECT_TRUE(conn->closed());
    EXPECT_TRUE(transport_->closed);

    callback(ResponseParts::chunks(200, {}, {"never sent"}));
    loop_.runPending();
    EXPECT_TRUE(written().empty());
}

TEST_F(HttpConnectionTest, TooMuchBufferedInputCloses) {
    auto conn = connect([](HttpRequest&) { return DispatchOutcome::asyncPending(); });
    conn->receiveData("GET / HTTP/1.1\r\n\r\n");
    ASSERT_EQ(conn->state(), HttpConnection::State::AsyncWait);

    conn->receiveData(std::string(HttpConnection::MAX_BUFFERED_INPUT + 1, 'x'));
    EXPECT_TRUE(conn->closed());
    EXPECT_TRUE(transport_->closed);
}

TEST_F(HttpConnectionTest, InputAfterCloseIsIgnored) {
    auto conn = connect(echoPath());
    conn->receiveData("GET / HTTP/1.1\r\nConnection: close\r\n\r\n");
    size_t before = written().size();
    conn->receiveData("GET /more HTTP/1.1\r\n\r\n");
    EXPECT_EQ(written().size(), before);
}

TEST_F(HttpConnectionTest, VerboseModeTracesRequests) {
    logger_.setVerbose(true);
    auto conn = connect(echoPath());
    conn->receiveData("GET /traced HTTP/1.1\r\n\r\n");
    EXPECT_TRUE(logger_.hasMessage("GET /traced HTTP/1.1"));
    EXPECT_TRUE(logger_.hasMessage("responding HTTP/1.1 200 OK"));
}

TEST(HttpConnectionStateTest, StateNames) {
    EXPECT_STREQ(HttpConnection::to_string(HttpConnection::State::AsyncWait), "ASYNC_WAIT");
    EXPECT_STREQ(HttpConnection::to_string(HttpConnection::State::Closed), "CLOSED");
}
