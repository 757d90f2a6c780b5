#pragma once

#include "stoa/logger/Logger.hpp"
#include <fstream>
#include <mutex>
#include <string>

namespace stoa {

/**
 * File logger that writes timestamped [INFO]/[ERROR] lines to a file.
 * Usually wrapped in an AsyncLogger so the loop thread never blocks on disk.
 * reopen() may be called from another thread (e.g. a SIGHUP watcher) while
 * the logging thread writes.
 */
class FileLogger : public Logger {
  public:
    /**
     * @param filepath Path to log file (created or appended to)
     * @param auto_flush If true, flush after each log message
     */
    explicit FileLogger(const std::string& filepath, bool auto_flush = true);
    ~FileLogger();

    void logMessage(std::string_view msg) override;
    void logError(std::string_view msg) override;

    void flush();

    // Close and reopen the same path (log rotation)
    void reopen();

  private:
    void writeLine(std::string_view level, std::string_view msg);

    std::mutex mutex_;
    std::ofstream file_;
    bool auto_flush_;
    std::string filepath_;
};

} // namespace stoa
