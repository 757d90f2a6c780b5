#include "stoa/http/ErrorReporter.hpp"

#include <string>

namespace stoa {

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError: return "ParseError";
        case ErrorKind::ApplicationError: return "ApplicationError";
        case ErrorKind::FinalizationError: return "FinalizationError";
        case ErrorKind::TransmissionError: return "TransmissionError";
        case ErrorKind::AddressResolutionError: return "AddressResolutionError";
    }
    return "UnknownError";
}

int ErrorReporter::statusFor(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::ParseError:
            return 400;
        case ErrorKind::ApplicationError:
        case ErrorKind::FinalizationError:
            return 500;
        case ErrorKind::TransmissionError:
        case ErrorKind::AddressResolutionError:
            return 0;
    }
    return 500;
}

int ErrorReporter::report(ErrorKind kind, std::string_view context, std::exception_ptr error) const {
    return report(kind, context, Logger::describeException(error, verbose()));
}

int ErrorReporter::report(ErrorKind kind, std::string_view context, std::string_view detail) const {
    std::string line = to_string(kind);
    line += " in ";
    line += context;
    line += ": ";
    line += detail;

    // A peer that cannot be resolved is routine; the rest are real failures
    if (kind == ErrorKind::AddressResolutionError) {
        logger_.logMessage(line);
    } else {
        logger_.logError(line);
    }
    return statusFor(kind);
}

} // namespace stoa
