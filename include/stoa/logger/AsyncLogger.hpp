#pragma once

#include "stoa/logger/Logger.hpp"

#include <cstdint>
#include <memory>
#include <string_view>

namespace stoa {

/**
 * Decorator that hands lines to a background thread which forwards them to
 * the delegate, so the io_uring loop never blocks on a sink. Starts with the
 * delegate's verbosity. Lines still queued on destruction are written out
 * before the thread exits.
 */
class AsyncLogger : public Logger {
  public:
    explicit AsyncLogger(std::unique_ptr<Logger> delegate);
    ~AsyncLogger();

    void logMessage(std::string_view msg) override;
    void logError(std::string_view msg) override;

    // Lines written synchronously because the queue was full
    uint64_t overflowCount() const;

  private:
    class Impl;
    std::unique_ptr<Impl> fImpl;
};
} // namespace stoa
