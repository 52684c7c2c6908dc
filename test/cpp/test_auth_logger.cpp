// test/cpp/test_auth_logger.cpp
// Unit tests for log level parsing and filtering

#include <catch2/catch.hpp>

#include "test_fakes.hpp"

using namespace pam_oauth2;
using namespace pam_oauth2::test;

namespace {

class InfoLogger : public AuthLogger {
public:
	InfoLogger() : AuthLogger(LogLevel::LEVEL_INFO) {}

	std::vector<std::string> lines;

protected:
	void Write(LogLevel level, const std::string &message) override {
		lines.push_back(std::string(LogLevelToString(level)) + " " + message);
	}
};

}  // namespace

TEST_CASE("AuthLogger - Level parsing", "[auth_logger]") {
	REQUIRE(ParseLogLevel("debug") == LogLevel::LEVEL_DEBUG);
	REQUIRE(ParseLogLevel(" INFO ") == LogLevel::LEVEL_INFO);
	REQUIRE(ParseLogLevel("warning") == LogLevel::LEVEL_WARN);
	REQUIRE(ParseLogLevel("error") == LogLevel::LEVEL_ERROR);
	REQUIRE(ParseLogLevel("off") == LogLevel::LEVEL_NONE);
	REQUIRE(ParseLogLevel("chatty", LogLevel::LEVEL_WARN) == LogLevel::LEVEL_WARN);
	REQUIRE(std::string(LogLevelToString(LogLevel::LEVEL_WARN)) == "WARN");
}

TEST_CASE("AuthLogger - Filtering and formatting", "[auth_logger]") {
	InfoLogger logger;
	REQUIRE(logger.GetMinLevel() == LogLevel::LEVEL_INFO);
	REQUIRE_FALSE(logger.IsEnabled(LogLevel::LEVEL_DEBUG));
	REQUIRE(logger.IsEnabled(LogLevel::LEVEL_ERROR));
	REQUIRE_FALSE(logger.IsEnabled(LogLevel::LEVEL_NONE));

	logger.Debug("hidden %d", 1);
	logger.Info("user %s attempt %d", "alice", 2);
	logger.Warn("%s", "careful");
	logger.Log(LogLevel::LEVEL_ERROR, "plain message with %d no formatting");

	REQUIRE(logger.lines.size() == 3);
	REQUIRE(logger.lines[0] == "INFO user alice attempt 2");
	REQUIRE(logger.lines[1] == "WARN careful");
	REQUIRE(logger.lines[2] == "ERROR plain message with %d no formatting");
}

TEST_CASE("AuthLogger - Long messages are not truncated", "[auth_logger]") {
	CapturingLogger logger;
	std::string long_text(5000, 'x');
	logger.Error("%s", long_text.c_str());
	REQUIRE(logger.lines.size() == 1);
	REQUIRE(logger.lines[0] == "ERROR " + long_text);
}
