//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// oauth_client.hpp
//
// Configured client for the three authorization-server endpoints. Each call
// performs exactly one HTTP request and classifies the outcome; polling
// policy lives in DeviceGrant.
//===----------------------------------------------------------------------===//

#pragma once

#include "common/secret_string.hpp"
#include "http/http_client.hpp"
#include "oauth/oauth_constants.hpp"
#include "oauth/oauth_error.hpp"
#include "oauth/oauth_types.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// ClientAuthMethod - How client credentials reach the server
//===----------------------------------------------------------------------===//
enum class ClientAuthMethod : uint8_t {
	BASIC,  // Authorization: Basic base64(id:secret)
	POST    // client_id/client_secret form fields
};

const char *ClientAuthMethodToString(ClientAuthMethod method);

// "basic" or "post" (case-insensitive); throws ConfigurationException otherwise
ClientAuthMethod ParseClientAuthMethod(const std::string &name);

//===----------------------------------------------------------------------===//
// ClientConfig - Endpoints, credentials and grant parameters
//===----------------------------------------------------------------------===//
struct ClientConfig {
	std::string device_code_url;
	std::string token_url;
	std::string introspection_url;

	std::string client_id;
	SecretString client_secret;  // Empty for public clients
	std::string scope = DEFAULT_SCOPE;
	ClientAuthMethod auth_method = ClientAuthMethod::BASIC;

	int64_t auth_timeout_seconds = DEFAULT_AUTH_TIMEOUT_SECONDS;
	int64_t http_timeout_seconds = DEFAULT_HTTP_TIMEOUT_SECONDS;
	int64_t poll_interval_seconds = DEFAULT_POLL_INTERVAL_SECONDS;
	int64_t slow_down_increment_seconds = SLOW_DOWN_INCREMENT_SECONDS;

	bool verify_tls = true;
	std::string ca_bundle;
	bool allow_insecure_http = false;
};

// Throws ConfigurationException naming the first invalid field
void ValidateClientConfig(const ClientConfig &config);

//===----------------------------------------------------------------------===//
// Endpoint results
//===----------------------------------------------------------------------===//
struct DeviceCodeResult {
	bool success = false;
	DeviceCodeResponse response;
	OAuthError error;

	static DeviceCodeResult Failure(const OAuthError &error) {
		DeviceCodeResult result;
		result.error = error;
		return result;
	}
};

enum class TokenPollStatus : uint8_t {
	SUCCESS,
	AUTHORIZATION_PENDING,
	SLOW_DOWN,
	EXPIRED_TOKEN,
	ACCESS_DENIED,
	FAILED  // Any other protocol error, transport failure or malformed body
};

const char *TokenPollStatusToString(TokenPollStatus status);

struct TokenPollResult {
	TokenPollStatus status = TokenPollStatus::FAILED;
	TokenResponse token;  // Set only for SUCCESS
	OAuthError error;     // Set for every other status

	static TokenPollResult Failure(TokenPollStatus status, const OAuthError &error) {
		TokenPollResult result;
		result.status = status;
		result.error = error;
		return result;
	}
};

struct IntrospectionResult {
	bool success = false;
	IntrospectionResponse response;
	OAuthError error;

	static IntrospectionResult Failure(const OAuthError &error) {
		IntrospectionResult result;
		result.error = error;
		return result;
	}
};

//===----------------------------------------------------------------------===//
// OAuthClient
//===----------------------------------------------------------------------===//
class OAuthClient {
public:
	// Validates config; throws ConfigurationException when invalid
	static std::unique_ptr<OAuthClient> Create(ClientConfig config, std::shared_ptr<http::HttpTransport> transport);

	const ClientConfig &GetConfig() const {
		return config_;
	}

	// POST client_id, scope to the device authorization endpoint
	DeviceCodeResult RequestDeviceCode();

	// POST grant_type, device_code, client_id to the token endpoint.
	// timeout_seconds bounds this one request.
	TokenPollResult RequestToken(const SecretString &device_code, int64_t timeout_seconds);

	// POST token, token_type_hint to the introspection endpoint
	IntrospectionResult Introspect(const SecretString &access_token, int64_t timeout_seconds);

private:
	OAuthClient(ClientConfig config, std::shared_ptr<http::HttpTransport> transport);

	// Adds client authentication to params/headers and wipes params once encoded
	http::HttpRequest BuildRequest(const std::string &url, http::FormParams &params, bool include_client_id,
	                               int64_t timeout_seconds) const;

	ClientConfig config_;
	std::shared_ptr<http::HttpTransport> transport_;
};

// libcurl transport with the TLS options from config
std::shared_ptr<http::HttpTransport> CreateDefaultTransport(const ClientConfig &config);

// "Basic " + base64(urlencode(id) ":" urlencode(secret))
SecretString BuildBasicAuthorization(const std::string &client_id, const SecretString &client_secret);

}  // namespace pam_oauth2
