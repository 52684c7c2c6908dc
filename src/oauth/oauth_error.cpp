//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// oauth_error.cpp
//
// Error classification and operator-log messages
//===----------------------------------------------------------------------===//

#include "oauth/oauth_error.hpp"
#include "common/json_util.hpp"
#include "common/string_util.hpp"

namespace pam_oauth2 {

const char *OAuthErrorKindToString(OAuthErrorKind kind) {
	switch (kind) {
	case OAuthErrorKind::NONE:
		return "NONE";
	case OAuthErrorKind::TRANSPORT:
		return "TRANSPORT";
	case OAuthErrorKind::PROTOCOL:
		return "PROTOCOL";
	case OAuthErrorKind::OTHER:
		return "OTHER";
	case OAuthErrorKind::VALIDATION:
		return "VALIDATION";
	case OAuthErrorKind::TIMEOUT:
		return "TIMEOUT";
	default:
		return "UNKNOWN";
	}
}

std::string OAuthError::ToString() const {
	switch (kind) {
	case OAuthErrorKind::NONE:
		return "No error";
	case OAuthErrorKind::TRANSPORT:
		return "Request failed: " + detail;
	case OAuthErrorKind::PROTOCOL:
		if (detail.empty()) {
			return "Server returned error response: " + code;
		}
		return "Server returned error response: " + code + ": " + detail;
	case OAuthErrorKind::OTHER:
		return "Other error: " + detail;
	case OAuthErrorKind::VALIDATION:
		return "Token validation failed: " + detail;
	case OAuthErrorKind::TIMEOUT:
		return "Timed out: " + detail;
	default:
		return "Unknown error: " + detail;
	}
}

OAuthError DecodeErrorResponse(int status, const std::string &body) {
	if (StringUtil::Trim(body).empty()) {
		return OAuthError::Other("Server returned empty error response");
	}

	JsonObject json;
	std::string code;
	if (JsonObject::Parse(body, json) && json.GetString("error", code) && !code.empty()) {
		std::string description;
		json.GetString("error_description", description);
		return OAuthError::Protocol(code, description);
	}
	return OAuthError::Other(StringUtil::Format("Server returned unparseable error response (HTTP %d)", status));
}

bool DecodeErrorInSuccessBody(const std::string &body, OAuthError &error) {
	JsonObject json;
	if (!JsonObject::Parse(body, json) || json.Has("access_token")) {
		return false;
	}
	std::string code;
	if (!json.GetString("error", code) || code.empty()) {
		return false;
	}
	std::string description;
	json.GetString("error_description", description);
	error = OAuthError::Protocol(code, description);
	return true;
}

std::string FormatErrorChain(const std::string &context, const OAuthError &error) {
	return context + "\n    caused by: " + error.ToString();
}

}  // namespace pam_oauth2
