//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// device_grant.hpp
//
// RFC 8628 device authorization grant state machine:
//
//   INIT -> AWAITING_DEVICE_CODE -> POLLING -> SUCCEEDED
//                     |                  |---> DENIED
//                     |                  |---> EXPIRED
//                     |                  |---> TIMED_OUT
//                     +------------------+---> TRANSPORT_ERROR
//
// Terminal states are final. The device code is wiped when POLLING ends.
//===----------------------------------------------------------------------===//

#pragma once

#include "common/auth_logger.hpp"
#include "common/clock.hpp"
#include "oauth/oauth_client.hpp"

#include <chrono>
#include <cstdint>

namespace pam_oauth2 {

enum class GrantState : uint8_t {
	INIT,
	AWAITING_DEVICE_CODE,
	POLLING,
	SUCCEEDED,
	DENIED,
	EXPIRED,
	TIMED_OUT,
	TRANSPORT_ERROR
};

const char *GrantStateToString(GrantState state);

bool IsTerminalState(GrantState state);

//===----------------------------------------------------------------------===//
// PollingState - Back-off state of the polling loop
//===----------------------------------------------------------------------===//
struct PollingState {
	std::chrono::seconds interval {0};
	Clock::TimePoint deadline;
	int attempts = 0;
};

// Initial state once a device code is known.
// deadline = now + timeout, capped by the device code's expires_in.
PollingState InitialPollingState(Clock::TimePoint now, std::chrono::seconds timeout, std::chrono::seconds interval,
                                 std::chrono::seconds expires_in);

// State after one token request returned status. The interval never
// decreases; slow_down adds increment.
PollingState NextPollingState(const PollingState &state, TokenPollStatus status, std::chrono::seconds increment);

// True when a request issued after sleeping the current interval would still
// fall strictly before the deadline
bool CanPollBeforeDeadline(const PollingState &state, Clock::TimePoint now);

// Whole seconds left before the deadline, rounded up, at least 1
int64_t RemainingSeconds(Clock::TimePoint deadline, Clock::TimePoint now);

//===----------------------------------------------------------------------===//
// GrantOutcome - Terminal result of Poll()
//===----------------------------------------------------------------------===//
struct GrantOutcome {
	GrantState state = GrantState::INIT;
	TokenResponse token;  // Set only for SUCCEEDED
	OAuthError error;     // Set for every other terminal state

	bool Succeeded() const {
		return state == GrantState::SUCCEEDED;
	}
};

//===----------------------------------------------------------------------===//
// DeviceGrant - One device authorization lifecycle
//
// Not reusable: Start() once, then Poll() once. Calling either out of order
// throws InvalidStateException.
//===----------------------------------------------------------------------===//
class DeviceGrant {
public:
	DeviceGrant(OAuthClient &client, Clock &clock, AuthLogger &logger);

	// Request the device code. On success the grant is POLLING and
	// GetDeviceCode() holds the prompt data; on failure it is TRANSPORT_ERROR
	// and GetError() says why.
	bool Start(std::chrono::seconds timeout);

	// Poll the token endpoint until a terminal state
	GrantOutcome Poll();

	GrantState GetState() const {
		return state_;
	}

	const DeviceCodeResponse &GetDeviceCode() const {
		return device_code_;
	}

	const PollingState &GetPollingState() const {
		return polling_;
	}

	const OAuthError &GetError() const {
		return error_;
	}

private:
	void TransitionTo(GrantState next);
	GrantOutcome Finish(GrantState state, const OAuthError &error);

	OAuthClient &client_;
	Clock &clock_;
	AuthLogger &logger_;

	GrantState state_ = GrantState::INIT;
	DeviceCodeResponse device_code_;
	PollingState polling_;
	OAuthError error_;
};

}  // namespace pam_oauth2
