//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// module_config.hpp
//
// JSON configuration file and PAM module arguments
//===----------------------------------------------------------------------===//

#pragma once

#include "auth/identity_validator.hpp"
#include "common/auth_logger.hpp"
#include "oauth/oauth_client.hpp"
#include "prompt/user_prompt.hpp"

#include <string>
#include <vector>

namespace pam_oauth2 {

constexpr const char *DEFAULT_CONFIG_PATH = "/etc/pam_oauth2_device/config.json";

//===----------------------------------------------------------------------===//
// ModuleConfig - Everything one authentication attempt needs
//===----------------------------------------------------------------------===//
struct ModuleConfig {
	ClientConfig client;
	ValidatorConfig validator;
	PromptConfig prompt;
};

//===----------------------------------------------------------------------===//
// ParseModuleConfig - Build a validated ModuleConfig from JSON text
//
// Unknown keys are ignored. Throws ConfigurationException for syntax errors,
// wrong member types, missing required settings and invalid values.
//===----------------------------------------------------------------------===//
ModuleConfig ParseModuleConfig(const std::string &json);

// Reads path and calls ParseModuleConfig. Errors name the file.
ModuleConfig LoadModuleConfig(const std::string &path);

//===----------------------------------------------------------------------===//
// ModuleArgs - Arguments from the pam.d line ("config=...", "log_level=...")
//===----------------------------------------------------------------------===//
struct ModuleArgs {
	std::string config_path = DEFAULT_CONFIG_PATH;
	LogLevel log_level = LogLevel::LEVEL_INFO;
	std::vector<std::string> unknown;  // Unrecognised arguments, for a warning
};

ModuleArgs ParseModuleArgs(int argc, const char **argv);

}  // namespace pam_oauth2
