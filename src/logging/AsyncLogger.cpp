#include "stoa/logger/AsyncLogger.hpp"
#include "../ring_buffer/NotifyingRingBuffer.hpp"
#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstring>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace stoa {

namespace {

enum class LogLevel : uint8_t { MESSAGE = 0, ERROR = 1 };

// Fixed-size entry so enqueueing never allocates
struct LogEntry {
    LogLevel level = LogLevel::MESSAGE;
    size_t length = 0;
    char text[1024];

    LogEntry() = default;

    LogEntry(LogLevel lvl, std::string_view msg)
        : level(lvl), length(std::min(msg.size(), sizeof(text) - 1)) {
        std::memcpy(text, msg.data(), length);
        text[length] = '\0';
    }

    std::string_view view() const { return std::string_view(text, length); }
};

constexpr size_t kQueueSlots = 16384;

} // namespace

class AsyncLogger::Impl {
  public:
    Impl(std::unique_ptr<Logger> delegate)
        : fDelegate(std::move(delegate)), fRunning(true),
          fWorkerThread(&Impl::drainLoop, this) {}

    ~Impl() {
        fRunning.store(false, std::memory_order_release);
        fQueue.shutdown();

        // The drain thread must be gone before fQueue and fDelegate are destroyed
        if (fWorkerThread.joinable()) {
            fWorkerThread.join();
        }
    }

    void logMessage(std::string_view msg) { enqueue(LogLevel::MESSAGE, msg); }

    void logError(std::string_view msg) { enqueue(LogLevel::ERROR, msg); }

    uint64_t overflowCount() const { return fOverflows.load(std::memory_order_relaxed); }

  private:
    void enqueue(LogLevel level, std::string_view msg) {
        if (!fRunning.load(std::memory_order_acquire)) {
            return;
        }

        if (fQueue.enqueue(LogEntry(level, msg))) {
            return;
        }

        // Queue full: write through synchronously and say so
        if (!fRunning.load(std::memory_order_acquire)) {
            return;
        }
        fOverflows.fetch_add(1, std::memory_order_relaxed);
        std::string fallback = "[ASYNC_BUFFER_FULL] ";
        fallback += msg;
        forward(level, fallback);
    }

    void drainLoop() {
        LogEntry entry;
        while (fRunning.load(std::memory_order_relaxed)) {
            if (!fQueue.dequeue(entry)) {
                break; // shutdown signaled
            }
            forward(entry.level, entry.view());
        }

        while (fQueue.try_dequeue(entry)) {
            forward(entry.level, entry.view());
        }
    }

    void forward(LogLevel level, std::string_view msg) {
        if (level == LogLevel::ERROR) {
            fDelegate->logError(msg);
        } else {
            fDelegate->logMessage(msg);
        }
    }

    std::unique_ptr<Logger> fDelegate;
    NotifyingRingBuffer<LogEntry, kQueueSlots> fQueue;
    std::atomic<bool> fRunning;
    std::atomic<uint64_t> fOverflows{0};
    std::thread fWorkerThread;
};

AsyncLogger::AsyncLogger(std::unique_ptr<Logger> delegate) {
    setVerbose(delegate && delegate->isVerbose());
    fImpl = std::make_unique<AsyncLogger::Impl>(std::move(delegate));
}

AsyncLogger::~AsyncLogger() = default;

void AsyncLogger::logMessage(std::string_view msg) { fImpl->logMessage(msg); }
void AsyncLogger::logError(std::string_view msg) { fImpl->logError(msg); }
uint64_t AsyncLogger::overflowCount() const { return fImpl->overflowCount(); }

} // namespace stoa
