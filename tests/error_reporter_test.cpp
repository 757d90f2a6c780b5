#include <gtest/gtest.h>
#include "stoa/http/ErrorReporter.hpp"
#include "support/CapturingLogger.hpp"

#include <stdexcept>

using namespace stoa;

namespace {

std::exception_ptr nestedFailure() {
    try {
        try {
            throw std::runtime_error("socket closed");
        } catch (...) {
            std::throw_with_nested(std::runtime_error("render failed"));
        }
    } catch (...) {
        return std::current_exception();
    }
    return nullptr;
}

} // namespace

class ErrorReporterTest : public ::testing::Test {
protected:
    test::CapturingLogger logger_;
};

TEST_F(ErrorReporterTest, StatusPerKind) {
    EXPECT_EQ(ErrorReporter::statusFor(ErrorKind::ParseError), 400);
    EXPECT_EQ(ErrorReporter::statusFor(ErrorKind::ApplicationError), 500);
    EXPECT_EQ(ErrorReporter::statusFor(ErrorKind::FinalizationError), 500);
    EXPECT_EQ(ErrorReporter::statusFor(ErrorKind::TransmissionError), 0);
    EXPECT_EQ(ErrorReporter::statusFor(ErrorKind::AddressResolutionError), 0);
}

TEST_F(ErrorReporterTest, ApplicationErrorIsLoggedAsError) {
    ErrorReporter reporter(logger_);
    int status = reporter.report(ErrorKind::ApplicationError, "GET /boom",
                                 std::make_exception_ptr(std::runtime_error("kaput")));

    EXPECT_EQ(status, 500);
    auto errors = logger_.errors();
    ASSERT_EQ(errors.size(), 1u);
    const std::string& line = errors[0];
    EXPECT_NE(line.find("ApplicationError"), std::string::npos);
    EXPECT_NE(line.find("GET /boom"), std::string::npos);
    EXPECT_NE(line.find("kaput"), std::string::npos);
}

TEST_F(ErrorReporterTest, AddressResolutionIsNotAnError) {
    ErrorReporter reporter(logger_);
    int status = reporter.report(ErrorKind::AddressResolutionError, "peer", "ENOTCONN");

    EXPECT_EQ(status, 0);
    EXPECT_TRUE(logger_.errors().empty());
    EXPECT_TRUE(logger_.hasMessage("ENOTCONN"));
}

TEST_F(ErrorReporterTest, QuietModeOmitsNestedCause) {
    ErrorReporter reporter(logger_);
    reporter.report(ErrorKind::FinalizationError, "response", nestedFailure());

    EXPECT_TRUE(logger_.hasError("render failed"));
    EXPECT_FALSE(logger_.hasError("socket closed"));
}

TEST_F(ErrorReporterTest, VerboseModeWritesNestedCause) {
    ErrorReporter reporter(logger_, true);
    reporter.report(ErrorKind::FinalizationError, "response", nestedFailure());

    EXPECT_TRUE(logger_.hasError("render failed <- socket closed"));
}

TEST_F(ErrorReporterTest, VerboseLoggerAlsoEnablesChain) {
    logger_.setVerbose(true);
    ErrorReporter reporter(logger_);
    EXPECT_TRUE(reporter.verbose());
}

TEST_F(ErrorReporterTest, KindNames) {
    EXPECT_STREQ(to_string(ErrorKind::ParseError), "ParseError");
    EXPECT_STREQ(to_string(ErrorKind::TransmissionError), "TransmissionError");
}
