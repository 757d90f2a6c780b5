#pragma once
#include <atomic>
#include <exception>
#include <string>
#include <string_view>

namespace stoa {

class Logger {
public:
    virtual ~Logger() = default;
    virtual void logMessage(std::string_view msg) = 0;
    virtual void logError(std::string_view msg) = 0;

    /**
     * Trace output that only reaches the sink when the logger is verbose.
     */
    void logDebug(std::string_view msg);

    void setVerbose(bool verbose) { verbose_.store(verbose, std::memory_order_relaxed); }
    bool isVerbose() const { return verbose_.load(std::memory_order_relaxed); }

    /**
     * Log the current exception with a context message.
     * Should be called from within a catch block.
     * In verbose mode the whole std::nested_exception chain is written.
     */
    void logCurrentError(std::string_view context_msg);

    /**
     * Render an exception as "what()" or, with include_nested, as the chain
     * "outer <- inner <- ..." built from std::throw_with_nested.
     */
    static std::string describeException(std::exception_ptr eptr, bool include_nested);

    static void setGlobalLogger(Logger* ptr);
    static Logger& getInstance();

private:
    std::atomic<bool> verbose_{false};
};

} // namespace stoa
