#include <iostream>
#include <memory>
#include <string>
#include "auth/device_authenticator.hpp"
#include "common/exception.hpp"
#include "config/module_config.hpp"
#include "prompt/user_prompt.hpp"

using namespace pam_oauth2;

// Runs one device authorization attempt against a real server.
// Usage: debug_device_flow <config.json> <local_user> [log_level]
int main(int argc, char **argv) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <config.json> <local_user> [debug|info|warn|error]" << std::endl;
        return 2;
    }
    std::string config_path = argv[1];
    std::string local_user = argv[2];
    LogLevel level = argc > 3 ? ParseLogLevel(argv[3], LogLevel::LEVEL_DEBUG) : LogLevel::LEVEL_DEBUG;

    StderrAuthLogger logger(level);

    std::cout << "Loading configuration from " << config_path << "..." << std::endl;
    ModuleConfig config;
    std::unique_ptr<OAuthClient> client;
    std::unique_ptr<IdentityValidator> validator;
    try {
        config = LoadModuleConfig(config_path);
        client = OAuthClient::Create(config.client, CreateDefaultTransport(config.client));
        validator.reset(new IdentityValidator(config.validator));
    } catch (const ConfigurationException &ex) {
        std::cerr << "Configuration error: " << ex.what() << std::endl;
        return 1;
    }

    std::cout << "Device endpoint:        " << config.client.device_code_url << std::endl;
    std::cout << "Token endpoint:         " << config.client.token_url << std::endl;
    std::cout << "Introspection endpoint: " << config.client.introspection_url << std::endl;
    std::cout << "Client auth method:     " << ClientAuthMethodToString(config.client.auth_method) << std::endl;
    std::cout << "Binding rule:           " << validator->GetRule().GetName() << std::endl;

    SystemClock clock;
    DeviceAuthenticator authenticator(*client, *validator, clock, logger);

    // ENTER is not awaited here; polling starts as soon as the code is shown
    PromptConfig prompt_config = config.prompt;
    prompt_config.wait_for_enter = false;
    auto prompt = [&prompt_config](const DeviceCodeResponse &device_code) {
        UserPrompt rendered(device_code, prompt_config);
        if (prompt_config.qr_enabled && !rendered.GenerateQr()) {
            std::cout << "QR code could not be generated" << std::endl;
        }
        std::cout << rendered.ToString() << std::endl;
        return true;
    };

    auto outcome = authenticator.Authenticate(local_user, prompt);

    std::cout << "Grant state: " << GrantStateToString(outcome.grant_state) << std::endl;
    if (!outcome.granted) {
        std::cerr << "Authentication failed at stage " << AuthStageToString(outcome.failed_stage) << ": "
                  << outcome.error.ToString() << std::endl;
        return 1;
    }
    std::cout << "Authenticated remote user " << outcome.remote_username << " as " << local_user << std::endl;
    return 0;
}
