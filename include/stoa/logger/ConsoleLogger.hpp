#pragma once

#include "stoa/logger/Logger.hpp"

#include <iostream>
#include <mutex>
#include <ostream>

namespace stoa {

// Messages to one stream (stdout by default), errors to another (stderr).
// Serialized so lines from the loop thread and worker threads do not interleave.
class ConsoleLogger : public Logger {
  public:
    ConsoleLogger() : ConsoleLogger(std::cout, std::cerr) {}
    ConsoleLogger(std::ostream& out, std::ostream& err) : out_(out), err_(err) {}

    void logMessage(std::string_view msg) override;
    void logError(std::string_view msg) override;

  private:
    std::ostream& out_;
    std::ostream& err_;
    std::mutex mutex_;
};
} // namespace stoa
