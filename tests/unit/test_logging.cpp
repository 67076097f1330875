#include <catch2/catch_test_macros.hpp>
#include "obscur/logging/logger.hpp"
#include "helpers/log_capture.hpp"
using namespace obscur::core;
using obscur::core::test_helpers::LogCapture;
TEST_CASE("Logging - Sanitized context", "[logging]") {
    LogCapture capture;
    SECTION("Sensitive fields never reach the sink") {
        logging::LogSanitized(spdlog::level::warn, "publish failed",
                              {{"relayUrl", "wss://relay"}, {"privateKey", "abcdef0123"}});
        const auto output = capture.Text();
        REQUIRE(output.find("warning publish failed") != std::string::npos);
        REQUIRE(output.find("wss://relay") != std::string::npos);
        REQUIRE(output.find("[REDACTED]") != std::string::npos);
        REQUIRE(output.find("abcdef0123") == std::string::npos);
    }
    SECTION("Failures are logged in redacted form") {
        const std::string key(64, 'c');
        logging::LogFailure(spdlog::level::err, "bridge call failed",
                            ObscurFailure::Crypto("rejected privateKey=" + key));
        const auto output = capture.Text();
        REQUIRE(output.find("error bridge call failed") != std::string::npos);
        REQUIRE(output.find("CryptoError") != std::string::npos);
        REQUIRE(output.find(key) == std::string::npos);
    }
    SECTION("Invalid UTF-8 in context does not throw") {
        REQUIRE_NOTHROW(logging::LogSanitized(spdlog::level::info, "relay notice",
                                              {{"relayUrl", std::string("wss://r\xff")}}));
        REQUIRE(capture.Text().find("info relay notice") != std::string::npos);
    }
    SECTION("Shared logger is named") {
        REQUIRE(logging::Logger()->name() == "obscur");
        REQUIRE(logging::Logger() == logging::Logger());
    }
}
