// test/cpp/test_fakes.hpp
// Scripted transport, manual clock and capturing logger for engine tests.
// Nothing here touches the network or sleeps.

#pragma once

#include <chrono>
#include <deque>
#include <functional>
#include <string>
#include <vector>

#include "common/auth_logger.hpp"
#include "common/clock.hpp"
#include "http/http_client.hpp"
#include "oauth/oauth_client.hpp"

namespace pam_oauth2 {
namespace test {

//==============================================================================
// ScriptedTransport - Replays queued responses and records every request
//==============================================================================
struct RecordedRequest {
	std::string url;
	std::string body;
	std::vector<std::string> headers;
	int timeout_seconds;
};

class ScriptedTransport : public http::HttpTransport {
public:
	void Push(int status, const std::string &body) {
		http::HttpResponse response;
		response.status = status;
		response.body = body;
		responses_.push_back(response);
	}

	void PushNetworkError(const std::string &error) {
		http::HttpResponse response;
		response.error = error;
		responses_.push_back(response);
	}

	http::HttpResponse Post(const http::HttpRequest &request) override {
		RecordedRequest recorded;
		recorded.url = request.url;
		recorded.body = request.body.Expose();
		for (const auto &header : request.headers) {
			recorded.headers.push_back(header.Expose());
		}
		recorded.timeout_seconds = request.timeout_seconds;
		requests.push_back(recorded);

		if (on_post) {
			on_post();
		}
		if (responses_.empty()) {
			http::HttpResponse response;
			response.error = "no scripted response";
			return response;
		}
		auto response = responses_.front();
		responses_.pop_front();
		return response;
	}

	size_t CountRequestsTo(const std::string &url) const {
		size_t count = 0;
		for (const auto &request : requests) {
			if (request.url == url) {
				count++;
			}
		}
		return count;
	}

	std::vector<RecordedRequest> requests;
	std::function<void()> on_post;  // Runs before each response is returned

private:
	std::deque<http::HttpResponse> responses_;
};

//==============================================================================
// ManualClock - Time advances only through SleepFor() and Advance()
//==============================================================================
class ManualClock : public Clock {
public:
	TimePoint Now() override {
		return now_;
	}

	void SleepFor(std::chrono::seconds duration) override {
		sleeps.push_back(duration.count());
		now_ += duration;
	}

	int64_t UnixTime() override {
		return unix_base + std::chrono::duration_cast<std::chrono::seconds>(now_ - TimePoint()).count();
	}

	void Advance(std::chrono::seconds duration) {
		now_ += duration;
	}

	int64_t ElapsedSeconds() const {
		return std::chrono::duration_cast<std::chrono::seconds>(now_ - TimePoint()).count();
	}

	std::vector<int64_t> sleeps;
	int64_t unix_base = 1700000000;

private:
	TimePoint now_ {};
};

//==============================================================================
// CapturingLogger - Keeps every message at or above DEBUG
//==============================================================================
class CapturingLogger : public AuthLogger {
public:
	CapturingLogger() : AuthLogger(LogLevel::LEVEL_DEBUG) {}

	bool Contains(const std::string &needle) const {
		for (const auto &line : lines) {
			if (line.find(needle) != std::string::npos) {
				return true;
			}
		}
		return false;
	}

	std::vector<std::string> lines;

protected:
	void Write(LogLevel level, const std::string &message) override {
		lines.push_back(std::string(LogLevelToString(level)) + " " + message);
	}
};

//==============================================================================
// Fixtures
//==============================================================================
constexpr const char *DEVICE_URL = "https://auth.example.com/device";
constexpr const char *TOKEN_URL = "https://auth.example.com/token";
constexpr const char *INTROSPECT_URL = "https://auth.example.com/introspect";

constexpr const char *DEVICE_CODE_BODY =
    R"({"device_code":"DC-123","user_code":"WDJB-MJHT","verification_uri":"https://auth.example.com/activate",)"
    R"("verification_uri_complete":"https://auth.example.com/activate?user_code=WDJB-MJHT",)"
    R"("expires_in":900,"interval":5})";

constexpr const char *TOKEN_BODY =
    R"({"access_token":"T","refresh_token":"R","token_type":"bearer","expires_in":86400})";

constexpr const char *PENDING_BODY = R"({"error":"authorization_pending"})";
constexpr const char *SLOW_DOWN_BODY = R"({"error":"slow_down"})";

inline ClientConfig MakeClientConfig() {
	ClientConfig config;
	config.device_code_url = DEVICE_URL;
	config.token_url = TOKEN_URL;
	config.introspection_url = INTROSPECT_URL;
	config.client_id = "test-client";
	return config;
}

}  // namespace test
}  // namespace pam_oauth2
