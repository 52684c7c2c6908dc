//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// oauth_types.hpp
//
// Decoded bodies of the device-code, token and introspection endpoints
//===----------------------------------------------------------------------===//

#pragma once

#include "common/secret_string.hpp"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// DeviceCodeResponse - Response from the device authorization endpoint
//===----------------------------------------------------------------------===//
struct DeviceCodeResponse {
	SecretString device_code;              // Long code for token polling
	std::string user_code;                 // Short code displayed to user (e.g., "WDJB-MJHT")
	std::string verification_uri;          // URL user visits
	std::string verification_uri_complete; // URL with the user code embedded (optional)
	std::string message;                   // Human-readable instructions (optional)
	int64_t expires_in = 0;                // Seconds until device code expires
	int64_t interval = 0;                  // Seconds to wait between polling requests

	// Secret-free rendering for debug logs
	std::string ToString() const;
};

//===----------------------------------------------------------------------===//
// TokenResponse - Successful response from the token endpoint
//===----------------------------------------------------------------------===//
struct TokenResponse {
	SecretString access_token;
	SecretString refresh_token;  // Empty when not issued
	std::string token_type;
	int64_t expires_in = 0;
	bool has_expires_in = false;
	std::string scope;

	std::string ToString() const;
};

//===----------------------------------------------------------------------===//
// IntrospectionResponse - Response from the introspection endpoint
//
// Every top-level string member is kept as a claim. Lookups go through
// TryGetClaim so a missing claim is an ordinary outcome.
//===----------------------------------------------------------------------===//
struct IntrospectionResponse {
	bool active = false;
	std::map<std::string, std::string> claims;
	std::vector<std::string> audience;
	int64_t exp = 0;
	bool has_exp = false;

	bool TryGetClaim(const std::string &name, std::string &out) const;

	bool HasAudience(const std::string &aud) const;
};

//===----------------------------------------------------------------------===//
// Body decoders
//
// Return false and set error when a 2xx body is not the expected shape.
// Absent optional members take the documented defaults.
//===----------------------------------------------------------------------===//

// Missing interval/expires_in become the given defaults
bool ParseDeviceCodeResponse(const std::string &body, int64_t default_interval, int64_t default_expires_in,
                             DeviceCodeResponse &result, std::string &error);

bool ParseTokenResponse(const std::string &body, TokenResponse &result, std::string &error);

bool ParseIntrospectionResponse(const std::string &body, IntrospectionResponse &result, std::string &error);

}  // namespace pam_oauth2
