//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// user_prompt.hpp
//
// Text shown to the user while the device grant is pending
//===----------------------------------------------------------------------===//

#pragma once

#include "oauth/oauth_types.hpp"

#include <string>

namespace pam_oauth2 {

constexpr const char *DEFAULT_ENTER_MESSAGE = "Press \"ENTER\" after successful authentication: ";

struct PromptConfig {
	bool show_complete_uri = true;  // Also show verification_uri_complete when the server sends one
	bool wait_for_enter = true;     // Ask for ENTER (echo off) instead of an info message
	std::string enter_message = DEFAULT_ENTER_MESSAGE;
	bool qr_enabled = false;        // Draw the sign-in URI as a QR code
};

// QR code for payload drawn with Unicode half blocks, two module rows per
// line, inside a two-module quiet zone. Empty when payload cannot be encoded.
std::string RenderQrCode(const std::string &payload);

//===----------------------------------------------------------------------===//
// UserPrompt - Renders the verification URI and user code
//===----------------------------------------------------------------------===//
class UserPrompt {
public:
	UserPrompt(const DeviceCodeResponse &device_code, const PromptConfig &config);

	// Full text, including the ENTER line when wait_for_enter is set
	std::string ToString() const;

	bool WaitForEnter() const {
		return config_.wait_for_enter;
	}

	// Encodes verification_uri_complete, or verification_uri without one.
	// Returns false when the URI does not fit in a QR code.
	bool GenerateQr();

	bool HasQrCode() const {
		return !qr_code_.empty();
	}

private:
	std::string verification_uri_;
	std::string verification_uri_complete_;
	std::string user_code_;
	std::string qr_code_;
	PromptConfig config_;
};

}  // namespace pam_oauth2
