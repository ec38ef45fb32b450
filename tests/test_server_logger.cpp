#include <gtest/gtest.h>
#include "server_logger.hpp"

using namespace redirector;

TEST(ServerLoggerTest, SanitizationLogic) {
    EXPECT_EQ(ServerLogger::sanitize_log_message("Normal message"), "Normal message");
    EXPECT_EQ(ServerLogger::sanitize_log_message("quote \" and \n newline"), "quote   and   newline");
    EXPECT_EQ(ServerLogger::sanitize_log_message(std::string("a\0b\x07" "c", 5)), "abc");
}

TEST(ServerLoggerTest, LineFormat) {
    ::testing::internal::CaptureStdout();
    ServerLogger::log(ServerLogger::Level::INFO, ServerLogger::EventType::FALLBACK, "internal", "No paths matched");
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_NE(out.find("[INFO] [FALLBACK] ip=internal msg=\"No paths matched\""), std::string::npos);
}

TEST(ServerLoggerTest, AddressesAreBlinded) {
    ::testing::internal::CaptureStdout();
    ServerLogger::log(ServerLogger::Level::WARNING, ServerLogger::EventType::DNS_FAILURE, "203.0.113.9", "x");
    std::string out = ::testing::internal::GetCapturedStdout();

    EXPECT_EQ(out.find("203.0.113.9"), std::string::npos);
    EXPECT_NE(out.find("ip=anon_"), std::string::npos);
    EXPECT_NE(out.find("[WARN] [DNS_FAILURE]"), std::string::npos);
}

TEST(ServerLoggerTest, ErrorsGoToStderr) {
    ::testing::internal::CaptureStderr();
    ServerLogger::log(ServerLogger::Level::ERROR, ServerLogger::EventType::STORE_FAILURE, "internal", "disk full");
    std::string err = ::testing::internal::GetCapturedStderr();
    EXPECT_NE(err.find("[ERROR] [STORE_FAILURE]"), std::string::npos);
}
