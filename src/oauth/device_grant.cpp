//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// device_grant.cpp
//
// Device code request and token polling (RFC 8628 section 3.4 - 3.5)
//===----------------------------------------------------------------------===//

#include "oauth/device_grant.hpp"
#include "common/exception.hpp"
#include "common/string_util.hpp"

#include <algorithm>

namespace pam_oauth2 {

const char *GrantStateToString(GrantState state) {
	switch (state) {
	case GrantState::INIT:
		return "INIT";
	case GrantState::AWAITING_DEVICE_CODE:
		return "AWAITING_DEVICE_CODE";
	case GrantState::POLLING:
		return "POLLING";
	case GrantState::SUCCEEDED:
		return "SUCCEEDED";
	case GrantState::DENIED:
		return "DENIED";
	case GrantState::EXPIRED:
		return "EXPIRED";
	case GrantState::TIMED_OUT:
		return "TIMED_OUT";
	case GrantState::TRANSPORT_ERROR:
		return "TRANSPORT_ERROR";
	default:
		return "UNKNOWN";
	}
}

bool IsTerminalState(GrantState state) {
	switch (state) {
	case GrantState::SUCCEEDED:
	case GrantState::DENIED:
	case GrantState::EXPIRED:
	case GrantState::TIMED_OUT:
	case GrantState::TRANSPORT_ERROR:
		return true;
	default:
		return false;
	}
}

//===----------------------------------------------------------------------===//
// PollingState
//===----------------------------------------------------------------------===//

PollingState InitialPollingState(Clock::TimePoint now, std::chrono::seconds timeout, std::chrono::seconds interval,
                                 std::chrono::seconds expires_in) {
	PollingState state;
	state.interval = interval;
	state.deadline = now + std::min(timeout, expires_in);
	state.attempts = 0;
	return state;
}

PollingState NextPollingState(const PollingState &state, TokenPollStatus status, std::chrono::seconds increment) {
	PollingState next = state;
	next.attempts++;
	if (status == TokenPollStatus::SLOW_DOWN) {
		next.interval += increment;
	}
	return next;
}

bool CanPollBeforeDeadline(const PollingState &state, Clock::TimePoint now) {
	return now + state.interval < state.deadline;
}

int64_t RemainingSeconds(Clock::TimePoint deadline, Clock::TimePoint now) {
	auto remaining_ms = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
	return std::max<int64_t>((remaining_ms + 999) / 1000, 1);
}

//===----------------------------------------------------------------------===//
// DeviceGrant
//===----------------------------------------------------------------------===//

DeviceGrant::DeviceGrant(OAuthClient &client, Clock &clock, AuthLogger &logger)
    : client_(client), clock_(clock), logger_(logger) {}

void DeviceGrant::TransitionTo(GrantState next) {
	bool allowed = false;
	switch (state_) {
	case GrantState::INIT:
		allowed = next == GrantState::AWAITING_DEVICE_CODE;
		break;
	case GrantState::AWAITING_DEVICE_CODE:
		allowed = next == GrantState::POLLING || next == GrantState::TRANSPORT_ERROR;
		break;
	case GrantState::POLLING:
		allowed = IsTerminalState(next);
		break;
	default:
		allowed = false;
		break;
	}
	if (!allowed) {
		throw InvalidStateException(StringUtil::Format("Illegal device grant transition %s -> %s",
		                                               GrantStateToString(state_), GrantStateToString(next)));
	}

	logger_.Debug("Device grant state %s -> %s", GrantStateToString(state_), GrantStateToString(next));
	if (state_ == GrantState::POLLING) {
		device_code_.device_code.Wipe();
	}
	state_ = next;
}

bool DeviceGrant::Start(std::chrono::seconds timeout) {
	if (state_ != GrantState::INIT) {
		throw InvalidStateException(
		    StringUtil::Format("Device grant already started (state %s)", GrantStateToString(state_)));
	}
	TransitionTo(GrantState::AWAITING_DEVICE_CODE);

	auto result = client_.RequestDeviceCode();
	if (!result.success) {
		error_ = result.error;
		TransitionTo(GrantState::TRANSPORT_ERROR);
		return false;
	}

	device_code_ = std::move(result.response);
	auto &config = client_.GetConfig();
	polling_ = InitialPollingState(clock_.Now(), timeout, std::chrono::seconds(device_code_.interval),
	                               std::chrono::seconds(device_code_.expires_in));
	logger_.Debug("Received %s", device_code_.ToString().c_str());
	logger_.Debug("Polling every %llds, slow_down increment %llds",
	              static_cast<long long>(polling_.interval.count()),
	              static_cast<long long>(config.slow_down_increment_seconds));
	TransitionTo(GrantState::POLLING);
	return true;
}

GrantOutcome DeviceGrant::Finish(GrantState state, const OAuthError &error) {
	error_ = error;
	TransitionTo(state);
	GrantOutcome outcome;
	outcome.state = state;
	outcome.error = error;
	return outcome;
}

GrantOutcome DeviceGrant::Poll() {
	if (state_ != GrantState::POLLING) {
		throw InvalidStateException(
		    StringUtil::Format("Cannot poll device grant in state %s", GrantStateToString(state_)));
	}

	auto increment = std::chrono::seconds(client_.GetConfig().slow_down_increment_seconds);
	auto timed_out = [this]() {
		return OAuthError::Timeout(
		    StringUtil::Format("Device authorization not completed after %d token request(s)", polling_.attempts));
	};

	while (true) {
		auto now = clock_.Now();
		if (!CanPollBeforeDeadline(polling_, now)) {
			return Finish(GrantState::TIMED_OUT, timed_out());
		}

		clock_.SleepFor(polling_.interval);

		now = clock_.Now();
		if (now >= polling_.deadline) {
			return Finish(GrantState::TIMED_OUT, timed_out());
		}

		logger_.Debug("Polling token endpoint (attempt %d)", polling_.attempts + 1);
		auto result = client_.RequestToken(device_code_.device_code, RemainingSeconds(polling_.deadline, now));
		polling_ = NextPollingState(polling_, result.status, increment);

		switch (result.status) {
		case TokenPollStatus::SUCCESS: {
			error_ = OAuthError();
			TransitionTo(GrantState::SUCCEEDED);
			GrantOutcome outcome;
			outcome.state = GrantState::SUCCEEDED;
			outcome.token = std::move(result.token);
			logger_.Debug("Received %s", outcome.token.ToString().c_str());
			return outcome;
		}
		case TokenPollStatus::AUTHORIZATION_PENDING:
			continue;
		case TokenPollStatus::SLOW_DOWN:
			logger_.Debug("Server requested slow_down; polling interval now %llds",
			              static_cast<long long>(polling_.interval.count()));
			continue;
		case TokenPollStatus::EXPIRED_TOKEN:
			return Finish(GrantState::EXPIRED, result.error);
		case TokenPollStatus::ACCESS_DENIED:
			return Finish(GrantState::DENIED, result.error);
		case TokenPollStatus::FAILED:
		default:
			return Finish(GrantState::TRANSPORT_ERROR, result.error);
		}
	}
}

}  // namespace pam_oauth2
