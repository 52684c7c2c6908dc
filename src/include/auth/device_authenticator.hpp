//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// device_authenticator.hpp
//
// One complete authentication attempt: device code, user prompt, token
// polling, introspection and identity validation
//===----------------------------------------------------------------------===//

#pragma once

#include "auth/identity_validator.hpp"
#include "common/auth_logger.hpp"
#include "common/clock.hpp"
#include "oauth/device_grant.hpp"
#include "oauth/oauth_client.hpp"

#include <cstdint>
#include <functional>
#include <string>

namespace pam_oauth2 {

// Stage at which an attempt stopped
enum class AuthStage : uint8_t { NONE, DEVICE_CODE, PROMPT, TOKEN, INTROSPECTION, VALIDATION };

const char *AuthStageToString(AuthStage stage);

//===----------------------------------------------------------------------===//
// AuthOutcome - Decision plus the operator-facing detail
//===----------------------------------------------------------------------===//
struct AuthOutcome {
	bool granted = false;
	std::string remote_username;
	GrantState grant_state = GrantState::INIT;
	AuthStage failed_stage = AuthStage::NONE;
	OAuthError error;
};

// Shows the device code to the user. Returns false if the user could not be
// reached (the attempt then fails at the PROMPT stage).
using PromptCallback = std::function<bool(const DeviceCodeResponse &)>;

//===----------------------------------------------------------------------===//
// DeviceAuthenticator
//===----------------------------------------------------------------------===//
class DeviceAuthenticator {
public:
	DeviceAuthenticator(OAuthClient &client, const IdentityValidator &validator, Clock &clock, AuthLogger &logger);

	AuthOutcome Authenticate(const std::string &local_user, const PromptCallback &prompt);

private:
	AuthOutcome Fail(AuthOutcome outcome, AuthStage stage, const OAuthError &error, const std::string &context);

	OAuthClient &client_;
	const IdentityValidator &validator_;
	Clock &clock_;
	AuthLogger &logger_;
};

}  // namespace pam_oauth2
