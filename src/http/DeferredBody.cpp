#include "stoa/http/DeferredBody.hpp"

namespace stoa {

void DeferredBody::push(std::string chunk) {
    LoopExecutor* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome_ != Outcome::Pending || detached_) {
            return;
        }
        if (!loop_) {
            backlog_.push_back(std::move(chunk));
            return;
        }
        loop = loop_;
    }
    auto self = shared_from_this();
    loop->post([self, chunk = std::move(chunk)]() mutable { self->deliverChunk(std::move(chunk)); });
}

void DeferredBody::succeed() {
    LoopExecutor* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome_ != Outcome::Pending) {
            return;
        }
        outcome_ = Outcome::Succeeded;
        loop = loop_;
    }
    if (loop) {
        auto self = shared_from_this();
        loop->post([self] { self->deliverDone(); });
    }
}

void DeferredBody::fail(std::string reason) {
    LoopExecutor* loop = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outcome_ != Outcome::Pending) {
            return;
        }
        outcome_ = Outcome::Failed;
        failure_reason_ = std::move(reason);
        loop = loop_;
    }
    if (loop) {
        auto self = shared_from_this();
        loop->post([self] { self->deliverDone(); });
    }
}

bool DeferredBody::finished() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return outcome_ != Outcome::Pending;
}

std::string DeferredBody::failureReason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failure_reason_;
}

void DeferredBody::attach(LoopExecutor& loop, DataHandler on_data, DoneHandler on_done) {
    std::vector<std::string> backlog;
    bool finished = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
        on_data_ = std::move(on_data);
        on_done_ = std::move(on_done);
        backlog.swap(backlog_);
        finished = outcome_ != Outcome::Pending;
    }

    for (auto& chunk : backlog) {
        deliverChunk(std::move(chunk));
    }
    if (finished) {
        deliverDone();
    }
}

void DeferredBody::detach() {
    std::lock_guard<std::mutex> lock(mutex_);
    detached_ = true;
    backlog_.clear();
    on_data_ = nullptr;
    on_done_ = nullptr;
}

void DeferredBody::deliverChunk(std::string chunk) {
    DataHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (detached_ || done_delivered_) {
            return;
        }
        handler = on_data_;
    }
    if (handler) {
        handler(std::move(chunk));
    }
}

void DeferredBody::deliverDone() {
    DoneHandler handler;
    bool ok = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (detached_ || done_delivered_) {
            return;
        }
        done_delivered_ = true;
        ok = outcome_ == Outcome::Succeeded;
        handler = std::move(on_done_);
        on_data_ = nullptr;
    }
    if (handler) {
        handler(ok);
    }
}

} // namespace stoa
