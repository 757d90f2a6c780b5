#include "stoa/logger/Logger.hpp"
#include "stoa/logger/ConsoleLogger.hpp"

#include <atomic>
#include <exception>
#include <stdexcept>
#include <string>

namespace {
    static std::atomic<stoa::Logger*> logger{nullptr};

    void appendNested(const std::exception& e, std::string& out) {
        try {
            std::rethrow_if_nested(e);
        } catch (const std::exception& inner) {
            out += " <- ";
            out += inner.what();
            appendNested(inner, out);
        } catch (...) {
            out += " <- unknown exception type";
        }
    }
}

namespace stoa {

void Logger::logDebug(std::string_view msg) {
    if (isVerbose()) {
        logMessage(msg);
    }
}

std::string Logger::describeException(std::exception_ptr eptr, bool include_nested) {
    if (!eptr) {
        return "no current exception";
    }
    std::string description;
    try {
        std::rethrow_exception(eptr);
    } catch (const std::exception& e) {
        description = e.what();
        if (include_nested) {
            appendNested(e, description);
        }
    } catch (...) {
        description = "unknown exception type";
    }
    return description;
}

void Logger::logCurrentError(std::string_view context_msg) {
    std::string full_message(context_msg);
    full_message += ": ";
    full_message += describeException(std::current_exception(), isVerbose());
    logError(full_message);
}

void Logger::setGlobalLogger(Logger* ptr) {
    logger.store(ptr, std::memory_order_release);
}

Logger& Logger::getInstance() {
    auto* ptr = logger.load(std::memory_order_acquire);
    if (!ptr) {
        // Fallback when nothing was installed: console output
        static stoa::ConsoleLogger* fallback_logger = new stoa::ConsoleLogger();
        return *fallback_logger;
    }
    return *ptr;
}

} // namespace stoa
