//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// auth_logger.hpp
//
// Logging capability injected into the engine. The core never creates or
// configures a sink; whoever drives an authentication attempt owns it.
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <mutex>
#include <string>

namespace pam_oauth2 {

enum class LogLevel : uint8_t { LEVEL_DEBUG = 0, LEVEL_INFO = 1, LEVEL_WARN = 2, LEVEL_ERROR = 3, LEVEL_NONE = 4 };

const char *LogLevelToString(LogLevel level);

// Parse "debug", "info", "warn", "error", "none"; unknown names yield fallback
LogLevel ParseLogLevel(const std::string &name, LogLevel fallback = LogLevel::LEVEL_INFO);

//===----------------------------------------------------------------------===//
// AuthLogger - Abstract sink for structured authentication events
//===----------------------------------------------------------------------===//
class AuthLogger {
public:
	explicit AuthLogger(LogLevel min_level = LogLevel::LEVEL_INFO) : min_level_(min_level) {}
	virtual ~AuthLogger() = default;

	bool IsEnabled(LogLevel level) const {
		return level != LogLevel::LEVEL_NONE && level >= min_level_;
	}

	LogLevel GetMinLevel() const {
		return min_level_;
	}

	void Log(LogLevel level, const std::string &message) {
		if (IsEnabled(level)) {
			Write(level, message);
		}
	}

	// printf-style convenience wrappers
	void Debug(const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
	    __attribute__((format(printf, 2, 3)))
#endif
	    ;
	void Info(const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
	    __attribute__((format(printf, 2, 3)))
#endif
	    ;
	void Warn(const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
	    __attribute__((format(printf, 2, 3)))
#endif
	    ;
	void Error(const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
	    __attribute__((format(printf, 2, 3)))
#endif
	    ;

protected:
	// Called only for enabled levels
	virtual void Write(LogLevel level, const std::string &message) = 0;

private:
	LogLevel min_level_;
};

//===----------------------------------------------------------------------===//
// StderrAuthLogger - "[PAM OAUTH2] LEVEL message" lines on stderr
//
// PAM_OAUTH2_DEBUG=1 in the environment lowers the threshold to DEBUG.
//===----------------------------------------------------------------------===//
class StderrAuthLogger : public AuthLogger {
public:
	explicit StderrAuthLogger(LogLevel min_level = LogLevel::LEVEL_INFO);

protected:
	void Write(LogLevel level, const std::string &message) override;

private:
	std::mutex mutex_;
};

}  // namespace pam_oauth2
