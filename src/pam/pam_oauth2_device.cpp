//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// pam_oauth2_device.cpp
//
// PAM service module entry points. Maps one pam_sm_authenticate call onto a
// DeviceAuthenticator attempt; no exception crosses into the PAM stack.
//===----------------------------------------------------------------------===//

#include "auth/device_authenticator.hpp"
#include "common/exception.hpp"
#include "config/module_config.hpp"
#include "prompt/user_prompt.hpp"

#include <security/pam_appl.h>
#include <security/pam_ext.h>
#include <security/pam_modules.h>
#include <syslog.h>

#include <cstdlib>
#include <cstring>
#include <exception>
#include <memory>
#include <string>

namespace pam_oauth2 {
namespace {

//===----------------------------------------------------------------------===//
// PamSyslogLogger - AuthLogger backed by pam_syslog
//===----------------------------------------------------------------------===//
class PamSyslogLogger : public AuthLogger {
public:
	PamSyslogLogger(pam_handle_t *pamh, LogLevel min_level) : AuthLogger(min_level), pamh_(pamh) {}

protected:
	void Write(LogLevel level, const std::string &message) override {
		pam_syslog(pamh_, ToSyslogPriority(level), "%s", message.c_str());
	}

private:
	static int ToSyslogPriority(LogLevel level) {
		switch (level) {
		case LogLevel::LEVEL_DEBUG:
			return LOG_DEBUG;
		case LogLevel::LEVEL_INFO:
			return LOG_INFO;
		case LogLevel::LEVEL_WARN:
			return LOG_WARNING;
		default:
			return LOG_ERR;
		}
	}

	pam_handle_t *pamh_;
};

//===----------------------------------------------------------------------===//
// Conversation
//===----------------------------------------------------------------------===//

// Sends one message; the reply (if any) is wiped and discarded
bool Converse(pam_handle_t *pamh, int style, const std::string &text) {
	const void *item = nullptr;
	if (pam_get_item(pamh, PAM_CONV, &item) != PAM_SUCCESS || !item) {
		return false;
	}
	auto conv = static_cast<const struct pam_conv *>(item);
	if (!conv->conv) {
		return false;
	}

	struct pam_message message;
	message.msg_style = style;
	message.msg = text.c_str();
	const struct pam_message *messages[1] = {&message};
	struct pam_response *responses = nullptr;

	int rc = conv->conv(1, messages, &responses, conv->appdata_ptr);
	if (responses) {
		if (responses[0].resp) {
			std::memset(responses[0].resp, 0, std::strlen(responses[0].resp));
			std::free(responses[0].resp);
		}
		std::free(responses);
	}
	return rc == PAM_SUCCESS;
}

int MapOutcome(const AuthOutcome &outcome) {
	if (outcome.granted) {
		return PAM_SUCCESS;
	}
	if (outcome.failed_stage == AuthStage::PROMPT) {
		return PAM_CONV_ERR;
	}
	return PAM_AUTH_ERR;
}

int Authenticate(pam_handle_t *pamh, int argc, const char **argv) {
	auto args = ParseModuleArgs(argc, argv);
	PamSyslogLogger logger(pamh, args.log_level);
	for (const auto &arg : args.unknown) {
		logger.Warn("Ignoring unknown module argument: %s", arg.c_str());
	}

	const char *user = nullptr;
	if (pam_get_user(pamh, &user, nullptr) != PAM_SUCCESS || !user || user[0] == '\0') {
		logger.Error("Could not get PAM user");
		return PAM_USER_UNKNOWN;
	}
	std::string local_user(user);

	ModuleConfig config;
	std::unique_ptr<OAuthClient> client;
	std::unique_ptr<IdentityValidator> validator;
	try {
		config = LoadModuleConfig(args.config_path);
		auto transport = CreateDefaultTransport(config.client);
		client = OAuthClient::Create(config.client, transport);
		validator.reset(new IdentityValidator(config.validator));
	} catch (const ConfigurationException &ex) {
		logger.Error("Configuration error: %s", ex.what());
		return PAM_SYSTEM_ERR;
	}

	SystemClock clock;
	DeviceAuthenticator authenticator(*client, *validator, clock, logger);

	const auto &prompt_config = config.prompt;
	auto prompt = [pamh, &prompt_config, &logger](const DeviceCodeResponse &device_code) {
		UserPrompt rendered(device_code, prompt_config);
		if (prompt_config.qr_enabled) {
			logger.Debug("Generating QR code");
			if (!rendered.GenerateQr()) {
				logger.Warn("Verification URI does not fit in a QR code; showing text only");
			}
		}
		int style = rendered.WaitForEnter() ? PAM_PROMPT_ECHO_OFF : PAM_TEXT_INFO;
		return Converse(pamh, style, rendered.ToString());
	};

	auto outcome = authenticator.Authenticate(local_user, prompt);
	if (!outcome.granted) {
		logger.Info("Authentication for %s failed at stage %s (state %s, %s)", local_user.c_str(),
		            AuthStageToString(outcome.failed_stage), GrantStateToString(outcome.grant_state),
		            OAuthErrorKindToString(outcome.error.kind));
	}
	return MapOutcome(outcome);
}

}  // namespace
}  // namespace pam_oauth2

extern "C" {

PAM_EXTERN int pam_sm_authenticate(pam_handle_t *pamh, int flags, int argc, const char **argv) {
	(void)flags;
	try {
		return pam_oauth2::Authenticate(pamh, argc, argv);
	} catch (const std::exception &ex) {
		pam_syslog(pamh, LOG_ERR, "Unexpected error during authentication: %s", ex.what());
		return PAM_SYSTEM_ERR;
	} catch (...) {
		pam_syslog(pamh, LOG_ERR, "Unexpected non-standard exception during authentication");
		return PAM_SYSTEM_ERR;
	}
}

PAM_EXTERN int pam_sm_setcred(pam_handle_t *pamh, int flags, int argc, const char **argv) {
	(void)pamh;
	(void)flags;
	(void)argc;
	(void)argv;
	return PAM_SUCCESS;
}

PAM_EXTERN int pam_sm_acct_mgmt(pam_handle_t *pamh, int flags, int argc, const char **argv) {
	(void)pamh;
	(void)flags;
	(void)argc;
	(void)argv;
	return PAM_SUCCESS;
}

}  // extern "C"
