#pragma once

#include "stoa/LoopExecutor.hpp"
#include "stoa/util/EventFd.hpp"
#include <atomic>
#include <deque>
#include <functional>
#include <liburing.h>
#include <memory>
#include <mutex>
#include <thread>

namespace stoa {

class BufferRingCoordinator;
class EventFdMonitorJob;
class IoJob;

/**
 * io_uring event loop with direct job registration.
 *
 * Jobs get an SQE through registerJob(), prepare it, and submit(); their
 * completions come back through IoJob::handleCompletion on the thread that
 * called run(). Everything except post() and stop() must be called on that
 * thread, or before run() starts.
 *
 *   struct io_uring_sqe* sqe = server.registerJob(job);
 *   job->prepareSqe(sqe);
 *   server.submit();
 *
 * post() is the way in for other threads: tasks are queued under a mutex
 * and an eventfd read armed on the ring wakes the loop to run them.
 */
class Server : public LoopExecutor {
public:
    Server();
    ~Server() override;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Throws std::runtime_error when the ring or buffer ring cannot be set up
    bool init(unsigned queue_depth = 256);

    // Blocks until stop(); returns at once if stop() came first
    void run();

    // Safe from any thread
    void stop();

    // Safe from any thread
    void post(std::function<void()> task) override;

    bool isLoopThread() const;

    // nullptr when the submission queue is full
    struct io_uring_sqe* registerJob(IoJob* job);
    int submit();
    unsigned sqSpaceLeft();

    int getBufferGroupId() const;
    std::shared_ptr<BufferRingCoordinator> getBufferRingCoordinator() const;
    struct io_uring* getRing() { return &ring_; }

private:
    void runPostedTasks();
    void processCompletions();
    void drainCompletions();
    void processAvailableCompletions();
    void handleCompletion(struct io_uring_cqe* cqe);

    struct io_uring ring_;
    bool ring_initialized_;
    std::atomic<bool> stop_requested_;
    std::atomic<std::thread::id> loop_thread_;

    std::shared_ptr<BufferRingCoordinator> buffer_ring_coordinator_;

    EventFd wakeup_;
    EventFdMonitorJob* wakeup_job_;
    std::mutex tasks_mutex_;
    std::deque<std::function<void()>> tasks_;
};

} // namespace stoa
