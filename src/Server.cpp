#include "stoa/Server.hpp"
#include "stoa/jobs/EventFdMonitorJob.hpp"
#include "stoa/jobs/IoJob.hpp"
#include "stoa/logger/Logger.hpp"
#include "stoa/ring_buffer/BufferRingCoordinator.hpp"
#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace stoa {

Server::Server()
    : ring_{}, ring_initialized_(false), stop_requested_(false),
      buffer_ring_coordinator_(std::make_shared<BufferRingCoordinator>()),
      wakeup_job_(nullptr) {
}

Server::~Server() {
    stop();
    if (ring_initialized_) {
        buffer_ring_coordinator_->cleanupBufferRing();
        io_uring_queue_exit(&ring_);
    }
    // The ring is gone, so the armed read can no longer complete
    EventFdMonitorJob::freePoolAllocated(wakeup_job_);
}

bool Server::init(unsigned queue_depth) {
    int ret = io_uring_queue_init(queue_depth, &ring_, 0);
    if (ret < 0) {
        throw std::runtime_error("Failed to initialize io_uring: " + std::string(strerror(-ret)));
    }
    ring_initialized_ = true;

    if (!buffer_ring_coordinator_->setupBufferRing(&ring_)) {
        throw std::runtime_error("Failed to setup buffer ring - this requires a recent kernel with buffer ring support");
    }

    wakeup_job_ = EventFdMonitorJob::createFromPool(
        wakeup_.fd(),
        [this](uint64_t) { runPostedTasks(); },
        [](int error) {
            Logger::getInstance().logError("Server: wakeup eventfd failed: " + std::string(strerror(error)));
        });
    if (!wakeup_job_) {
        throw std::runtime_error("Failed to allocate wakeup job");
    }
    if (!wakeup_job_->arm(*this)) {
        throw std::runtime_error("Failed to arm wakeup eventfd");
    }

    Logger::getInstance().logMessage("Server initialized with queue depth " + std::to_string(queue_depth));
    return true;
}

void Server::run() {
    loop_thread_.store(std::this_thread::get_id());

    while (!stop_requested_.load(std::memory_order_acquire)) {
        processCompletions();
    }

    drainCompletions();
    runPostedTasks();
    loop_thread_.store(std::thread::id());
    Logger::getInstance().logMessage("Server: Stopped with all jobs drained");
}

void Server::stop() {
    if (stop_requested_.exchange(true)) {
        return;
    }
    wakeup_.signal();
    Logger::getInstance().logMessage("Server: Stop requested");
}

void Server::post(std::function<void()> task) {
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        tasks_.push_back(std::move(task));
    }
    wakeup_.signal();
}

bool Server::isLoopThread() const {
    return loop_thread_.load() == std::this_thread::get_id();
}

void Server::runPostedTasks() {
    std::deque<std::function<void()>> batch;
    {
        std::lock_guard<std::mutex> lock(tasks_mutex_);
        batch.swap(tasks_);
    }
    for (auto& task : batch) {
        try {
            task();
        } catch (const std::exception& e) {
            Logger::getInstance().logError(std::string("Server: posted task threw: ") + e.what());
        }
    }
}

struct io_uring_sqe* Server::registerJob(IoJob* job) {
    struct io_uring_sqe* sqe = io_uring_get_sqe(&ring_);
    if (!sqe) {
        return nullptr;
    }
    io_uring_sqe_set_data64(sqe, reinterpret_cast<uintptr_t>(job));
    return sqe;
}

int Server::submit() {
    return io_uring_submit(&ring_);
}

unsigned Server::sqSpaceLeft() {
    return io_uring_sq_space_left(&ring_);
}

int Server::getBufferGroupId() const {
    return static_cast<int>(buffer_ring_coordinator_->getBufferGroupId());
}

std::shared_ptr<BufferRingCoordinator> Server::getBufferRingCoordinator() const {
    return buffer_ring_coordinator_;
}

void Server::drainCompletions() {
    struct io_uring_cqe* cqe;
    int iterations = 0;

    while (iterations < 100 && io_uring_peek_cqe(&ring_, &cqe) == 0) {
        processAvailableCompletions();
        ++iterations;
    }
    Logger::getInstance().logMessage("Server: Drain complete after " + std::to_string(iterations) + " iterations");
}

void Server::processCompletions() {
    struct io_uring_cqe* cqe;

    int ret = io_uring_wait_cqe(&ring_, &cqe);
    if (ret < 0) {
        if (ret != -EINTR) {
            Logger::getInstance().logError("io_uring_wait_cqe failed: " + std::string(strerror(-ret)) +
                                           " (code: " + std::to_string(ret) + ")");
        }
        return;
    }
    processAvailableCompletions();
}

void Server::processAvailableCompletions() {
    struct io_uring_cqe* cqe;
    unsigned head;
    unsigned handled = 0;

    io_uring_for_each_cqe(&ring_, head, cqe) {
        handleCompletion(cqe);
        ++handled;
    }
    io_uring_cq_advance(&ring_, handled);
}

void Server::handleCompletion(struct io_uring_cqe* cqe) {
    uint64_t user_data = io_uring_cqe_get_data64(cqe);
    if (user_data == 0) {
        Logger::getInstance().logError("Server: Completion with null user_data");
        return;
    }

    IoJob* job = reinterpret_cast<IoJob*>(user_data);
    auto cleanup = job->handleCompletion(*this, cqe);
    if (cleanup) {
        (*cleanup)(job);
    }
}

} // namespace stoa
