#include "stoa/logger/ConsoleLogger.hpp"

namespace stoa {

void ConsoleLogger::logMessage(std::string_view msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << msg << '\n';
}

// Errors are flushed at once; messages ride the stream's own buffering
void ConsoleLogger::logError(std::string_view msg) {
    std::lock_guard<std::mutex> lock(mutex_);
    err_ << "[ERROR] " << msg << std::endl;
}

} // namespace stoa
