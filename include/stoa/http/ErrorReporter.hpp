#pragma once

#include "stoa/logger/Logger.hpp"

#include <exception>
#include <stdexcept>
#include <string_view>

namespace stoa {

enum class ErrorKind {
    ParseError,             // malformed request bytes: 400
    ApplicationError,       // the application threw: 500
    FinalizationError,      // the application's response was unusable: 500
    TransmissionError,      // writing to the peer failed: hard close
    AddressResolutionError  // peer address lookup failed: empty address
};

const char* to_string(ErrorKind kind);

// Raised by transports when bytes cannot be handed to the socket
class TransmissionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * Central failure sink for connections. Logs the failure and says which
 * response, if any, should be synthesized for it.
 */
class ErrorReporter {
public:
    explicit ErrorReporter(Logger& logger, bool verbose = false)
        : logger_(logger), verbose_(verbose) {}

    /**
     * Log an exception raised at one of the engine's stages.
     * Verbose mode adds the nested exception chain.
     * @return status code to answer with, 0 when the connection must not be written to
     */
    int report(ErrorKind kind, std::string_view context, std::exception_ptr error) const;

    // Same, for failures that are described rather than thrown
    int report(ErrorKind kind, std::string_view context, std::string_view detail) const;

    static int statusFor(ErrorKind kind);

    Logger& logger() const { return logger_; }
    bool verbose() const { return verbose_ || logger_.isVerbose(); }

private:
    Logger& logger_;
    bool verbose_;
};

} // namespace stoa
