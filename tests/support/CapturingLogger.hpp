#pragma once

#include "stoa/logger/Logger.hpp"
#include <algorithm>
#include <mutex>
#include <string>
#include <vector>

namespace stoa::test {

// Keeps every line so tests can assert on what was logged
class CapturingLogger : public Logger {
public:
    void logMessage(std::string_view msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        messages_.emplace_back(msg);
    }

    void logError(std::string_view msg) override {
        std::lock_guard<std::mutex> lock(mutex_);
        errors_.emplace_back(msg);
    }

    std::vector<std::string> messages() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return messages_;
    }

    std::vector<std::string> errors() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return errors_;
    }

    bool hasError(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(errors_.begin(), errors_.end(), [&](const std::string& line) {
            return line.find(needle) != std::string::npos;
        });
    }

    bool hasMessage(std::string_view needle) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::any_of(messages_.begin(), messages_.end(), [&](const std::string& line) {
            return line.find(needle) != std::string::npos;
        });
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
    std::vector<std::string> errors_;
};

} // namespace stoa::test
