// test/cpp/test_device_authenticator.cpp
// End-to-end authentication attempts against a scripted authorization server
//
// Run:
//   ./build/test/unittest "[device_authenticator]"

#include <catch2/catch.hpp>

#include "auth/device_authenticator.hpp"
#include "test_fakes.hpp"

using namespace pam_oauth2;
using namespace pam_oauth2::test;

namespace {

struct AuthenticatorFixture {
	AuthenticatorFixture() : transport(std::make_shared<ScriptedTransport>()), validator(ValidatorConfig()) {
		client = OAuthClient::Create(MakeClientConfig(), transport);
	}

	AuthOutcome Run(const std::string &local_user) {
		DeviceAuthenticator authenticator(*client, validator, clock, logger);
		return authenticator.Authenticate(local_user, [this](const DeviceCodeResponse &device_code) {
			prompted_user_code = device_code.user_code;
			return prompt_succeeds;
		});
	}

	std::shared_ptr<ScriptedTransport> transport;
	std::unique_ptr<OAuthClient> client;
	IdentityValidator validator;
	ManualClock clock;
	CapturingLogger logger;
	bool prompt_succeeds = true;
	std::string prompted_user_code;
};

}  // namespace

TEST_CASE("DeviceAuthenticator - Successful login", "[device_authenticator]") {
	AuthenticatorFixture f;
	f.transport->Push(200, DEVICE_CODE_BODY);
	f.transport->Push(400, PENDING_BODY);
	f.transport->Push(200, TOKEN_BODY);
	f.transport->Push(200, R"({"active":true,"username":"alice"})");

	auto outcome = f.Run("alice");
	REQUIRE(outcome.granted);
	REQUIRE(outcome.remote_username == "alice");
	REQUIRE(outcome.grant_state == GrantState::SUCCEEDED);
	REQUIRE(outcome.failed_stage == AuthStage::NONE);
	REQUIRE(f.prompted_user_code == "WDJB-MJHT");

	REQUIRE(f.transport->requests.size() == 4);
	REQUIRE(f.transport->requests[3].url == INTROSPECT_URL);
	REQUIRE(f.transport->requests[3].body.find("token=T&") == 0);
	REQUIRE(f.logger.Contains("Authentication successful for remote user: alice -> local user: alice"));
}

TEST_CASE("DeviceAuthenticator - Failures", "[device_authenticator]") {
	AuthenticatorFixture f;

	SECTION("Device code request fails") {
		f.transport->PushNetworkError("Could not resolve host");
		auto outcome = f.Run("alice");
		REQUIRE_FALSE(outcome.granted);
		REQUIRE(outcome.failed_stage == AuthStage::DEVICE_CODE);
		REQUIRE(outcome.grant_state == GrantState::TRANSPORT_ERROR);
		REQUIRE(outcome.error.kind == OAuthErrorKind::TRANSPORT);
		REQUIRE(f.prompted_user_code.empty());
		REQUIRE(f.logger.Contains("Failed to receive device code response\n    caused by: Request failed:"));
	}

	SECTION("Prompt cannot reach the user") {
		f.prompt_succeeds = false;
		f.transport->Push(200, DEVICE_CODE_BODY);
		f.transport->Push(200, TOKEN_BODY);
		auto outcome = f.Run("alice");
		REQUIRE_FALSE(outcome.granted);
		REQUIRE(outcome.failed_stage == AuthStage::PROMPT);
		REQUIRE(f.transport->CountRequestsTo(TOKEN_URL) == 0);
	}

	SECTION("User denies access") {
		f.transport->Push(200, DEVICE_CODE_BODY);
		f.transport->Push(403, R"({"error":"access_denied","error_description":"The user denied access"})");
		auto outcome = f.Run("alice");
		REQUIRE_FALSE(outcome.granted);
		REQUIRE(outcome.failed_stage == AuthStage::TOKEN);
		REQUIRE(outcome.grant_state == GrantState::DENIED);
		REQUIRE(outcome.error.kind == OAuthErrorKind::PROTOCOL);
		REQUIRE(f.logger.Contains("Failed to receive user token"));
		REQUIRE(f.transport->CountRequestsTo(INTROSPECT_URL) == 0);
	}

	SECTION("Introspection says inactive") {
		f.transport->Push(200, DEVICE_CODE_BODY);
		f.transport->Push(200, TOKEN_BODY);
		f.transport->Push(200, R"({"active":false})");
		auto outcome = f.Run("alice");
		REQUIRE_FALSE(outcome.granted);
		REQUIRE(outcome.grant_state == GrantState::SUCCEEDED);
		REQUIRE(outcome.failed_stage == AuthStage::VALIDATION);
		REQUIRE(outcome.error.kind == OAuthErrorKind::VALIDATION);
		REQUIRE(f.logger.Contains("Login failed for user: alice"));
	}

	SECTION("Introspection endpoint fails") {
		f.transport->Push(200, DEVICE_CODE_BODY);
		f.transport->Push(200, TOKEN_BODY);
		f.transport->Push(500, "");
		auto outcome = f.Run("alice");
		REQUIRE_FALSE(outcome.granted);
		REQUIRE(outcome.failed_stage == AuthStage::INTROSPECTION);
		REQUIRE(outcome.error.kind == OAuthErrorKind::OTHER);
		REQUIRE(f.logger.Contains("Failed to introspect user token"));
	}

	SECTION("Remote identity belongs to someone else") {
		f.transport->Push(200, DEVICE_CODE_BODY);
		f.transport->Push(200, TOKEN_BODY);
		f.transport->Push(200, R"({"active":true,"username":"alice"})");
		auto outcome = f.Run("bob");
		REQUIRE_FALSE(outcome.granted);
		REQUIRE(outcome.remote_username == "alice");
		REQUIRE(outcome.failed_stage == AuthStage::VALIDATION);
	}

	SECTION("Timeout") {
		auto config = MakeClientConfig();
		config.auth_timeout_seconds = 12;
		f.client = OAuthClient::Create(config, f.transport);
		f.transport->Push(200, DEVICE_CODE_BODY);
		for (int i = 0; i < 5; i++) {
			f.transport->Push(400, PENDING_BODY);
		}
		auto outcome = f.Run("alice");
		REQUIRE_FALSE(outcome.granted);
		REQUIRE(outcome.grant_state == GrantState::TIMED_OUT);
		REQUIRE(outcome.error.kind == OAuthErrorKind::TIMEOUT);
		REQUIRE(f.transport->CountRequestsTo(TOKEN_URL) == 2);
	}

	SECTION("Introspection gets only the time left") {
		auto config = MakeClientConfig();
		config.auth_timeout_seconds = 12;
		f.client = OAuthClient::Create(config, f.transport);
		f.transport->Push(200, DEVICE_CODE_BODY);
		f.transport->Push(400, PENDING_BODY);
		f.transport->Push(200, TOKEN_BODY);
		f.transport->Push(200, R"({"active":true,"username":"alice"})");
		auto outcome = f.Run("alice");
		REQUIRE(outcome.granted);
		REQUIRE(f.clock.ElapsedSeconds() == 10);
		REQUIRE(f.transport->requests.size() == 4);
		REQUIRE(f.transport->requests[3].url == INTROSPECT_URL);
		REQUIRE(f.transport->requests[3].timeout_seconds == 2);
	}

	SECTION("Deadline passes during the token request") {
		auto config = MakeClientConfig();
		config.auth_timeout_seconds = 12;
		f.client = OAuthClient::Create(config, f.transport);
		int posts = 0;
		f.transport->on_post = [&f, &posts]() {
			if (++posts == 2) {
				f.clock.Advance(std::chrono::seconds(20));
			}
		};
		f.transport->Push(200, DEVICE_CODE_BODY);
		f.transport->Push(200, TOKEN_BODY);
		auto outcome = f.Run("alice");
		REQUIRE_FALSE(outcome.granted);
		REQUIRE(outcome.grant_state == GrantState::SUCCEEDED);
		REQUIRE(outcome.failed_stage == AuthStage::INTROSPECTION);
		REQUIRE(outcome.error.kind == OAuthErrorKind::TIMEOUT);
		REQUIRE(f.transport->CountRequestsTo(INTROSPECT_URL) == 0);
		REQUIRE(f.logger.Contains("Failed to introspect user token"));
	}

	SECTION("No local user") {
		auto outcome = f.Run("");
		REQUIRE_FALSE(outcome.granted);
		REQUIRE(outcome.failed_stage == AuthStage::VALIDATION);
		REQUIRE(f.transport->requests.empty());
	}

	SECTION("No token material in the log") {
		f.transport->Push(200, DEVICE_CODE_BODY);
		f.transport->Push(200, R"({"access_token":"secret-access-token","token_type":"bearer"})");
		f.transport->Push(200, R"({"active":true,"username":"alice"})");
		auto outcome = f.Run("alice");
		REQUIRE(outcome.granted);
		REQUIRE_FALSE(f.logger.Contains("secret-access-token"));
		REQUIRE_FALSE(f.logger.Contains("DC-123"));
	}
}
