//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// oauth_error.hpp
//
// Classification of every way an authentication attempt can fail
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <string>

namespace pam_oauth2 {

enum class OAuthErrorKind : uint8_t {
	NONE,
	TRANSPORT,   // Connection/TLS/timeout failure, or a malformed success body
	PROTOCOL,    // Server returned an OAuth error code
	OTHER,       // Server error without a usable OAuth error body
	VALIDATION,  // Token obtained but identity checks failed
	TIMEOUT      // Caller deadline reached while polling
};

const char *OAuthErrorKindToString(OAuthErrorKind kind);

//===----------------------------------------------------------------------===//
// OAuthError - Kind plus the most specific detail available
//
// For PROTOCOL errors code holds the OAuth "error" member and detail the
// optional "error_description". For the other kinds detail is the message.
//===----------------------------------------------------------------------===//
struct OAuthError {
	OAuthErrorKind kind = OAuthErrorKind::NONE;
	std::string code;
	std::string detail;

	bool IsError() const {
		return kind != OAuthErrorKind::NONE;
	}

	// "Request failed: ...", "Server returned error response: code[: description]", ...
	std::string ToString() const;

	// Factory methods
	static OAuthError Transport(const std::string &detail) {
		return {OAuthErrorKind::TRANSPORT, "", detail};
	}

	static OAuthError Protocol(const std::string &code, const std::string &description = "") {
		return {OAuthErrorKind::PROTOCOL, code, description};
	}

	static OAuthError Other(const std::string &detail) {
		return {OAuthErrorKind::OTHER, "", detail};
	}

	static OAuthError Validation(const std::string &reason) {
		return {OAuthErrorKind::VALIDATION, "", reason};
	}

	static OAuthError Timeout(const std::string &detail) {
		return {OAuthErrorKind::TIMEOUT, "", detail};
	}
};

//===----------------------------------------------------------------------===//
// DecodeErrorResponse - Classify a non-2xx response body
//
//   empty body                      -> OTHER("Server returned empty error response")
//   object with string "error"      -> PROTOCOL(error, error_description)
//   anything else                   -> OTHER("Server returned unparseable error response (HTTP n)")
//===----------------------------------------------------------------------===//
OAuthError DecodeErrorResponse(int status, const std::string &body);

// Checks a 2xx body for an OAuth "error" member without an access token.
// Returns true and fills error when found.
bool DecodeErrorInSuccessBody(const std::string &body, OAuthError &error);

// "<context>\n    caused by: <error>"
std::string FormatErrorChain(const std::string &context, const OAuthError &error);

}  // namespace pam_oauth2
