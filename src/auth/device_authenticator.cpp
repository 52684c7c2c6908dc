//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// device_authenticator.cpp
//
// One login attempt from device code request to identity binding
//===----------------------------------------------------------------------===//

#include "auth/device_authenticator.hpp"
#include "common/string_util.hpp"

#include <algorithm>

namespace pam_oauth2 {

const char *AuthStageToString(AuthStage stage) {
	switch (stage) {
	case AuthStage::NONE:
		return "NONE";
	case AuthStage::DEVICE_CODE:
		return "DEVICE_CODE";
	case AuthStage::PROMPT:
		return "PROMPT";
	case AuthStage::TOKEN:
		return "TOKEN";
	case AuthStage::INTROSPECTION:
		return "INTROSPECTION";
	case AuthStage::VALIDATION:
		return "VALIDATION";
	default:
		return "UNKNOWN";
	}
}

DeviceAuthenticator::DeviceAuthenticator(OAuthClient &client, const IdentityValidator &validator, Clock &clock,
                                         AuthLogger &logger)
    : client_(client), validator_(validator), clock_(clock), logger_(logger) {}

AuthOutcome DeviceAuthenticator::Fail(AuthOutcome outcome, AuthStage stage, const OAuthError &error,
                                      const std::string &context) {
	outcome.granted = false;
	outcome.failed_stage = stage;
	outcome.error = error;
	logger_.Error("%s", FormatErrorChain(context, error).c_str());
	return outcome;
}

AuthOutcome DeviceAuthenticator::Authenticate(const std::string &local_user, const PromptCallback &prompt) {
	AuthOutcome outcome;
	const auto &config = client_.GetConfig();

	if (local_user.empty()) {
		return Fail(outcome, AuthStage::VALIDATION, OAuthError::Validation("no local user"),
		            "Login failed for user: <unknown>");
	}

	DeviceGrant grant(client_, clock_, logger_);
	bool started = grant.Start(std::chrono::seconds(config.auth_timeout_seconds));
	outcome.grant_state = grant.GetState();
	if (!started) {
		return Fail(outcome, AuthStage::DEVICE_CODE, grant.GetError(), "Failed to receive device code response");
	}

	if (prompt && !prompt(grant.GetDeviceCode())) {
		return Fail(outcome, AuthStage::PROMPT, OAuthError::Other("Could not show device code to user"),
		            "Failed to prompt user");
	}

	auto grant_outcome = grant.Poll();
	outcome.grant_state = grant_outcome.state;
	if (!grant_outcome.Succeeded()) {
		return Fail(outcome, AuthStage::TOKEN, grant_outcome.error, "Failed to receive user token");
	}

	// Introspection shares the grant's deadline
	auto now = clock_.Now();
	auto deadline = grant.GetPollingState().deadline;
	if (now >= deadline) {
		return Fail(outcome, AuthStage::INTROSPECTION,
		            OAuthError::Timeout("Deadline reached before the token could be introspected"),
		            "Failed to introspect user token");
	}
	int64_t timeout = std::min(config.http_timeout_seconds, RemainingSeconds(deadline, now));
	auto introspection = client_.Introspect(grant_outcome.token.access_token, timeout);
	grant_outcome.token.access_token.Wipe();
	grant_outcome.token.refresh_token.Wipe();
	if (!introspection.success) {
		return Fail(outcome, AuthStage::INTROSPECTION, introspection.error, "Failed to introspect user token");
	}

	auto validation = validator_.Validate(introspection.response, local_user, clock_.UnixTime());
	outcome.remote_username = validation.remote_username;
	if (!validation.valid) {
		return Fail(outcome, AuthStage::VALIDATION, OAuthError::Validation(validation.reason),
		            "Login failed for user: " + local_user);
	}

	outcome.granted = true;
	logger_.Info("Authentication successful for remote user: %s -> local user: %s",
	             validation.remote_username.c_str(), local_user.c_str());
	return outcome;
}

}  // namespace pam_oauth2
