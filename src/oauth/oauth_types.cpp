//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// oauth_types.cpp
//
// Decoding of authorization-server response bodies
//===----------------------------------------------------------------------===//

#include "oauth/oauth_types.hpp"
#include "common/json_util.hpp"
#include "common/string_util.hpp"

#include <algorithm>

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// Rendering
//===----------------------------------------------------------------------===//

std::string DeviceCodeResponse::ToString() const {
	return StringUtil::Format("DeviceCodeResponse{device_code=%s, user_code=%s, verification_uri=%s, "
	                          "expires_in=%lld, interval=%lld}",
	                          device_code.ToString().c_str(), user_code.c_str(), verification_uri.c_str(),
	                          static_cast<long long>(expires_in), static_cast<long long>(interval));
}

std::string TokenResponse::ToString() const {
	return StringUtil::Format("TokenResponse{access_token=%s, refresh_token=%s, token_type=%s, expires_in=%s, "
	                          "scope=%s}",
	                          access_token.ToString().c_str(), refresh_token.ToString().c_str(), token_type.c_str(),
	                          has_expires_in ? std::to_string(expires_in).c_str() : "<none>", scope.c_str());
}

//===----------------------------------------------------------------------===//
// IntrospectionResponse
//===----------------------------------------------------------------------===//

bool IntrospectionResponse::TryGetClaim(const std::string &name, std::string &out) const {
	auto it = claims.find(name);
	if (it == claims.end()) {
		return false;
	}
	out = it->second;
	return true;
}

bool IntrospectionResponse::HasAudience(const std::string &aud) const {
	return std::find(audience.begin(), audience.end(), aud) != audience.end();
}

//===----------------------------------------------------------------------===//
// Decoders
//===----------------------------------------------------------------------===//

// Optional integer member; present with a wrong type is an error
static bool ReadOptionalInt(const JsonObject &json, const char *key, int64_t &out, bool &present,
                            std::string &error) {
	present = false;
	if (!json.Has(key) || json.GetType(key) == JsonType::NULL_VALUE) {
		return true;
	}
	if (!json.GetInt(key, out)) {
		error = StringUtil::Format("Member '%s' is not an integer", key);
		return false;
	}
	present = true;
	return true;
}

bool ParseDeviceCodeResponse(const std::string &body, int64_t default_interval, int64_t default_expires_in,
                             DeviceCodeResponse &result, std::string &error) {
	JsonObject json;
	if (!JsonObject::Parse(body, json, &error)) {
		error = "Invalid device code response: " + error;
		return false;
	}

	std::string device_code;
	if (!json.GetString("device_code", device_code) || device_code.empty()) {
		error = "Invalid device code response: missing device_code";
		return false;
	}
	result.device_code = SecretString(device_code);
	SecureWipe(device_code);

	if (!json.GetString("user_code", result.user_code) || result.user_code.empty()) {
		error = "Invalid device code response: missing user_code";
		return false;
	}

	// Some servers (Google) send verification_url instead
	if (!json.GetString("verification_uri", result.verification_uri) &&
	    !json.GetString("verification_url", result.verification_uri)) {
		error = "Invalid device code response: missing verification_uri";
		return false;
	}
	json.GetString("verification_uri_complete", result.verification_uri_complete);
	json.GetString("message", result.message);

	bool present = false;
	if (!ReadOptionalInt(json, "expires_in", result.expires_in, present, error)) {
		error = "Invalid device code response: " + error;
		return false;
	}
	if (!present || result.expires_in <= 0) {
		result.expires_in = default_expires_in;
	}
	if (!ReadOptionalInt(json, "interval", result.interval, present, error)) {
		error = "Invalid device code response: " + error;
		return false;
	}
	if (!present || result.interval <= 0) {
		result.interval = default_interval;
	}
	return true;
}

bool ParseTokenResponse(const std::string &body, TokenResponse &result, std::string &error) {
	JsonObject json;
	if (!JsonObject::Parse(body, json, &error)) {
		error = "Invalid token response: " + error;
		return false;
	}

	std::string value;
	if (!json.GetString("access_token", value) || value.empty()) {
		error = "Invalid token response: missing access_token";
		return false;
	}
	result.access_token = SecretString(value);
	SecureWipe(value);

	if (!json.GetString("token_type", result.token_type) || result.token_type.empty()) {
		error = "Invalid token response: missing token_type";
		return false;
	}

	if (json.GetString("refresh_token", value)) {
		result.refresh_token = SecretString(value);
		SecureWipe(value);
	}

	if (!ReadOptionalInt(json, "expires_in", result.expires_in, result.has_expires_in, error)) {
		error = "Invalid token response: " + error;
		return false;
	}
	json.GetString("scope", result.scope);
	return true;
}

bool ParseIntrospectionResponse(const std::string &body, IntrospectionResponse &result, std::string &error) {
	JsonObject json;
	if (!JsonObject::Parse(body, json, &error)) {
		error = "Invalid introspection response: " + error;
		return false;
	}

	if (!json.GetBool("active", result.active)) {
		error = "Invalid introspection response: missing boolean 'active'";
		return false;
	}

	result.claims = json.GetStringMembers();

	bool has_aud = json.Has("aud") && json.GetType("aud") != JsonType::NULL_VALUE;
	if (has_aud && !json.GetStringArray("aud", result.audience)) {
		error = "Invalid introspection response: 'aud' is not a string or string array";
		return false;
	}

	if (!ReadOptionalInt(json, "exp", result.exp, result.has_exp, error)) {
		error = "Invalid introspection response: " + error;
		return false;
	}
	return true;
}

}  // namespace pam_oauth2
