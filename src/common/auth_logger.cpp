//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// auth_logger.cpp
//
// Leveled logging and the stderr sink
//===----------------------------------------------------------------------===//

#include "common/auth_logger.hpp"
#include "common/string_util.hpp"

#include <cstdarg>
#include <cstdio>
#include <cstdlib>

namespace pam_oauth2 {

// Debug logging controlled by PAM_OAUTH2_DEBUG environment variable
static int GetEnvDebugLevel() {
	const char *env = std::getenv("PAM_OAUTH2_DEBUG");
	return env ? std::atoi(env) : 0;
}

const char *LogLevelToString(LogLevel level) {
	switch (level) {
	case LogLevel::LEVEL_DEBUG:
		return "DEBUG";
	case LogLevel::LEVEL_INFO:
		return "INFO";
	case LogLevel::LEVEL_WARN:
		return "WARN";
	case LogLevel::LEVEL_ERROR:
		return "ERROR";
	case LogLevel::LEVEL_NONE:
		return "NONE";
	default:
		return "UNKNOWN";
	}
}

LogLevel ParseLogLevel(const std::string &name, LogLevel fallback) {
	auto lower = StringUtil::Lower(StringUtil::Trim(name));
	if (lower == "debug" || lower == "trace") {
		return LogLevel::LEVEL_DEBUG;
	}
	if (lower == "info") {
		return LogLevel::LEVEL_INFO;
	}
	if (lower == "warn" || lower == "warning") {
		return LogLevel::LEVEL_WARN;
	}
	if (lower == "error") {
		return LogLevel::LEVEL_ERROR;
	}
	if (lower == "none" || lower == "off") {
		return LogLevel::LEVEL_NONE;
	}
	return fallback;
}

//===----------------------------------------------------------------------===//
// AuthLogger
//===----------------------------------------------------------------------===//

#define PAM_OAUTH2_LOG_VARARGS(level)                           \
	do {                                                        \
		if (!IsEnabled(level)) {                                \
			return;                                             \
		}                                                       \
		va_list args;                                           \
		va_start(args, fmt);                                    \
		std::string message = StringUtil::FormatVA(fmt, args);  \
		va_end(args);                                           \
		Write(level, message);                                  \
	} while (0)

void AuthLogger::Debug(const char *fmt, ...) {
	PAM_OAUTH2_LOG_VARARGS(LogLevel::LEVEL_DEBUG);
}

void AuthLogger::Info(const char *fmt, ...) {
	PAM_OAUTH2_LOG_VARARGS(LogLevel::LEVEL_INFO);
}

void AuthLogger::Warn(const char *fmt, ...) {
	PAM_OAUTH2_LOG_VARARGS(LogLevel::LEVEL_WARN);
}

void AuthLogger::Error(const char *fmt, ...) {
	PAM_OAUTH2_LOG_VARARGS(LogLevel::LEVEL_ERROR);
}

#undef PAM_OAUTH2_LOG_VARARGS

//===----------------------------------------------------------------------===//
// StderrAuthLogger
//===----------------------------------------------------------------------===//

StderrAuthLogger::StderrAuthLogger(LogLevel min_level)
    : AuthLogger(GetEnvDebugLevel() >= 1 ? LogLevel::LEVEL_DEBUG : min_level) {}

void StderrAuthLogger::Write(LogLevel level, const std::string &message) {
	std::lock_guard<std::mutex> lock(mutex_);
	fprintf(stderr, "[PAM OAUTH2] %s %s\n", LogLevelToString(level), message.c_str());
}

}  // namespace pam_oauth2
