// test/cpp/test_user_prompt.cpp
// Unit tests for the device code prompt text

#include <catch2/catch.hpp>

#include "prompt/user_prompt.hpp"

#include <sstream>
#include <vector>

using namespace pam_oauth2;

namespace {

DeviceCodeResponse MakeDeviceCode(const std::string &complete_uri) {
	DeviceCodeResponse response;
	response.device_code = SecretString("DC-123");
	response.user_code = "WDJB-MJHT";
	response.verification_uri = "https://idp.example.org/activate";
	response.verification_uri_complete = complete_uri;
	return response;
}

// Code points in a UTF-8 string
size_t GlyphCount(const std::string &line) {
	size_t count = 0;
	for (unsigned char c : line) {
		if ((c & 0xC0) != 0x80) {
			count++;
		}
	}
	return count;
}

std::vector<std::string> Lines(const std::string &text) {
	std::vector<std::string> lines;
	std::istringstream ss(text);
	std::string line;
	while (std::getline(ss, line)) {
		lines.push_back(line);
	}
	return lines;
}

const char *const FULL = "\xE2\x96\x88";
const char *const UPPER = "\xE2\x96\x80";

}  // namespace

TEST_CASE("UserPrompt - Rendering", "[user_prompt]") {
	PromptConfig config;

	SECTION("Complete URI shown with the plain URI as fallback") {
		auto text = UserPrompt(MakeDeviceCode("https://idp.example.org/activate?code=WDJB-MJHT"), config).ToString();
		REQUIRE(text == "\nPlease login at https://idp.example.org/activate?code=WDJB-MJHT\n"
		                "or visit https://idp.example.org/activate and enter code: WDJB-MJHT\n"
		                "\nPress \"ENTER\" after successful authentication: ");
	}

	SECTION("No complete URI from the server") {
		auto text = UserPrompt(MakeDeviceCode(""), config).ToString();
		REQUIRE(text == "\nPlease visit https://idp.example.org/activate and enter code: WDJB-MJHT\n"
		                "\nPress \"ENTER\" after successful authentication: ");
	}

	SECTION("Complete URI disabled") {
		config.show_complete_uri = false;
		auto text = UserPrompt(MakeDeviceCode("https://idp.example.org/activate?code=X"), config).ToString();
		REQUIRE(text.find("?code=X") == std::string::npos);
	}

	SECTION("Without waiting for ENTER") {
		config.wait_for_enter = false;
		UserPrompt prompt(MakeDeviceCode(""), config);
		REQUIRE_FALSE(prompt.WaitForEnter());
		REQUIRE(prompt.ToString().find("ENTER") == std::string::npos);
	}

	SECTION("Custom ENTER message") {
		config.enter_message = "Done? ";
		auto text = UserPrompt(MakeDeviceCode(""), config).ToString();
		REQUIRE(text.size() >= 6);
		REQUIRE(text.substr(text.size() - 6) == "Done? ");
	}

	SECTION("Device code never appears") {
		auto text = UserPrompt(MakeDeviceCode("https://idp.example.org/activate?code=WDJB-MJHT"), config).ToString();
		REQUIRE(text.find("DC-123") == std::string::npos);
	}
}

TEST_CASE("UserPrompt - QR code", "[user_prompt]") {
	SECTION("Square symbol with quiet zone and finder patterns") {
		auto qr = RenderQrCode("https://idp.example.org/activate?code=WDJB-MJHT");
		REQUIRE_FALSE(qr.empty());

		auto lines = Lines(qr);
		REQUIRE(lines.size() >= 2);
		size_t width = GlyphCount(lines[0]);
		for (const auto &line : lines) {
			REQUIRE(GlyphCount(line) == width);
		}
		// Two module rows per line over an odd number of rows
		REQUIRE(lines.size() * 2 - 1 == width);
		REQUIRE(lines[0] == std::string(width, ' '));

		// Rows 0 and 1 of the top-left finder pattern
		std::string finder = std::string("  ") + FULL;
		for (int i = 0; i < 5; i++) {
			finder += UPPER;
		}
		finder += FULL;
		finder += " ";
		REQUIRE(lines[1].compare(0, finder.size(), finder) == 0);
	}

	SECTION("Payload too large") {
		REQUIRE(RenderQrCode(std::string(5000, 'x')).empty());
		REQUIRE(RenderQrCode("").empty());
	}

	SECTION("Prompt includes the QR code only after GenerateQr") {
		PromptConfig config;
		config.qr_enabled = true;
		UserPrompt prompt(MakeDeviceCode("https://idp.example.org/activate?code=WDJB-MJHT"), config);
		REQUIRE_FALSE(prompt.HasQrCode());
		REQUIRE(prompt.ToString().find(FULL) == std::string::npos);

		REQUIRE(prompt.GenerateQr());
		REQUIRE(prompt.HasQrCode());
		auto text = prompt.ToString();
		auto qr_at = text.find(FULL);
		REQUIRE(qr_at != std::string::npos);
		REQUIRE(qr_at < text.find("Please login at"));
		REQUIRE(text.find(RenderQrCode("https://idp.example.org/activate?code=WDJB-MJHT")) != std::string::npos);
	}

	SECTION("Falls back to the plain URI") {
		UserPrompt prompt(MakeDeviceCode(""), PromptConfig());
		REQUIRE(prompt.GenerateQr());
		REQUIRE(prompt.ToString().find(RenderQrCode("https://idp.example.org/activate")) != std::string::npos);
	}
}
