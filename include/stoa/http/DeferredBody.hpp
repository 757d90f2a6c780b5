#pragma once

#include "stoa/LoopExecutor.hpp"

#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace stoa {

/**
 * Body the application produces after it has returned its response.
 * push(), succeed() and fail() may be called from any thread; the connection
 * receives the chunks and the final outcome on the loop thread, in order.
 * Chunks pushed before the connection attaches are held until it does.
 */
class DeferredBody : public std::enable_shared_from_this<DeferredBody> {
public:
    using DataHandler = std::function<void(std::string chunk)>;
    using DoneHandler = std::function<void(bool ok)>;

    static std::shared_ptr<DeferredBody> create() {
        return std::shared_ptr<DeferredBody>(new DeferredBody());
    }

    DeferredBody(const DeferredBody&) = delete;
    DeferredBody& operator=(const DeferredBody&) = delete;

    void push(std::string chunk);
    void succeed();
    void fail(std::string reason);

    bool finished() const;
    // Reason given to fail(), empty otherwise
    std::string failureReason() const;

    // Loop thread only. Replays anything pushed so far.
    void attach(LoopExecutor& loop, DataHandler on_data, DoneHandler on_done);

    // Loop thread only. Later pushes and outcomes are dropped.
    void detach();

private:
    DeferredBody() = default;

    enum class Outcome { Pending, Succeeded, Failed };

    void deliverChunk(std::string chunk);
    void deliverDone();

    mutable std::mutex mutex_;
    LoopExecutor* loop_ = nullptr;
    bool detached_ = false;
    bool done_delivered_ = false;
    std::vector<std::string> backlog_;
    Outcome outcome_ = Outcome::Pending;
    std::string failure_reason_;
    DataHandler on_data_;
    DoneHandler on_done_;
};

} // namespace stoa
