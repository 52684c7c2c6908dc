//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// user_prompt.cpp
//
// Sign-in instructions and the optional QR code
//===----------------------------------------------------------------------===//

#include "prompt/user_prompt.hpp"

#include <qrcodegen.hpp>

#include <sstream>
#include <stdexcept>

namespace pam_oauth2 {

static constexpr int QR_QUIET_ZONE = 2;

// UTF-8 block elements: full, upper half, lower half
static const char *const BLOCK_FULL = "\xE2\x96\x88";
static const char *const BLOCK_UPPER = "\xE2\x96\x80";
static const char *const BLOCK_LOWER = "\xE2\x96\x84";

std::string RenderQrCode(const std::string &payload) {
	if (payload.empty()) {
		return std::string();
	}
	try {
		auto qr = qrcodegen::QrCode::encodeText(payload.c_str(), qrcodegen::QrCode::Ecc::LOW);
		int size = qr.getSize();
		std::ostringstream ss;
		// getModule() is false outside the symbol, which draws the quiet zone
		for (int y = -QR_QUIET_ZONE; y < size + QR_QUIET_ZONE; y += 2) {
			for (int x = -QR_QUIET_ZONE; x < size + QR_QUIET_ZONE; x++) {
				bool top = qr.getModule(x, y);
				bool bottom = qr.getModule(x, y + 1);
				if (top && bottom) {
					ss << BLOCK_FULL;
				} else if (top) {
					ss << BLOCK_UPPER;
				} else if (bottom) {
					ss << BLOCK_LOWER;
				} else {
					ss << ' ';
				}
			}
			ss << "\n";
		}
		return ss.str();
	} catch (const std::length_error &) {
		// qrcodegen::data_too_long
		return std::string();
	}
}

UserPrompt::UserPrompt(const DeviceCodeResponse &device_code, const PromptConfig &config)
    : verification_uri_(device_code.verification_uri),
      verification_uri_complete_(device_code.verification_uri_complete), user_code_(device_code.user_code),
      config_(config) {}

bool UserPrompt::GenerateQr() {
	qr_code_ = RenderQrCode(verification_uri_complete_.empty() ? verification_uri_ : verification_uri_complete_);
	return !qr_code_.empty();
}

std::string UserPrompt::ToString() const {
	std::ostringstream ss;
	ss << "\n";
	if (!qr_code_.empty()) {
		ss << qr_code_ << "\n";
	}
	if (config_.show_complete_uri && !verification_uri_complete_.empty()) {
		ss << "Please login at " << verification_uri_complete_ << "\n";
		ss << "or visit " << verification_uri_ << " and enter code: " << user_code_ << "\n";
	} else {
		ss << "Please visit " << verification_uri_ << " and enter code: " << user_code_ << "\n";
	}
	if (config_.wait_for_enter) {
		ss << "\n" << config_.enter_message;
	}
	return ss.str();
}

}  // namespace pam_oauth2
