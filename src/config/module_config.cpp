//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// module_config.cpp
//
// Configuration file schema (see conf/example-config.json)
//===----------------------------------------------------------------------===//

#include "config/module_config.hpp"
#include "common/exception.hpp"
#include "common/json_util.hpp"
#include "common/string_util.hpp"

#include <fstream>
#include <sstream>

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// Typed member readers
//
// Absent or null members leave out untouched; any other type mismatch throws.
//===----------------------------------------------------------------------===//

static bool IsAbsent(const JsonObject &json, const char *key) {
	return !json.Has(key) || json.GetType(key) == JsonType::NULL_VALUE;
}

[[noreturn]] static void TypeMismatch(const JsonObject &json, const char *key, const char *expected) {
	throw ConfigurationException(StringUtil::Format("Setting '%s' must be %s, got %s", key, expected,
	                                                JsonTypeToString(json.GetType(key))));
}

static void ReadString(const JsonObject &json, const char *key, std::string &out) {
	if (IsAbsent(json, key)) {
		return;
	}
	if (!json.GetString(key, out)) {
		TypeMismatch(json, key, "a string");
	}
}

static void ReadBool(const JsonObject &json, const char *key, bool &out) {
	if (IsAbsent(json, key)) {
		return;
	}
	if (!json.GetBool(key, out)) {
		TypeMismatch(json, key, "a boolean");
	}
}

static void ReadSeconds(const JsonObject &json, const char *key, int64_t &out) {
	if (IsAbsent(json, key)) {
		return;
	}
	int64_t value = 0;
	if (!json.GetInt(key, value)) {
		TypeMismatch(json, key, "an integer");
	}
	if (value <= 0) {
		throw ConfigurationException(
		    StringUtil::Format("Setting '%s' must be greater than 0, got %lld", key, static_cast<long long>(value)));
	}
	out = value;
}

static void ReadAliases(const JsonObject &json, const char *key, std::map<std::string, std::string> &out) {
	if (IsAbsent(json, key)) {
		return;
	}
	JsonObject aliases;
	if (!json.GetObject(key, aliases)) {
		TypeMismatch(json, key, "an object");
	}
	auto members = aliases.GetStringMembers();
	if (members.size() != aliases.Size()) {
		throw ConfigurationException(StringUtil::Format("Setting '%s' must map names to strings", key));
	}
	out = std::move(members);
}

//===----------------------------------------------------------------------===//
// ParseModuleConfig
//===----------------------------------------------------------------------===//

ModuleConfig ParseModuleConfig(const std::string &json_text) {
	JsonObject json;
	std::string error;
	if (!JsonObject::Parse(json_text, json, &error)) {
		throw ConfigurationException("Invalid configuration JSON: " + error);
	}

	ModuleConfig config;
	auto &client = config.client;

	ReadString(json, "client_id", client.client_id);
	std::string secret;
	ReadString(json, "client_secret", secret);
	client.client_secret = SecretString(secret);
	SecureWipe(secret);
	ReadString(json, "scope", client.scope);
	ReadString(json, "oauth_device_url", client.device_code_url);
	ReadString(json, "oauth_token_url", client.token_url);
	ReadString(json, "oauth_token_introspect_url", client.introspection_url);

	std::string auth_method;
	ReadString(json, "client_auth_method", auth_method);
	if (!auth_method.empty()) {
		client.auth_method = ParseClientAuthMethod(auth_method);
	}

	ReadSeconds(json, "oauth_auth_timeout", client.auth_timeout_seconds);
	ReadSeconds(json, "http_timeout", client.http_timeout_seconds);
	ReadSeconds(json, "poll_interval", client.poll_interval_seconds);
	ReadSeconds(json, "slow_down_increment", client.slow_down_increment_seconds);
	ReadBool(json, "verify_tls", client.verify_tls);
	ReadString(json, "ca_bundle", client.ca_bundle);
	ReadBool(json, "allow_insecure_http", client.allow_insecure_http);

	auto &validator = config.validator;
	ReadString(json, "identity_claim", validator.identity_claim);
	ReadString(json, "binding_rule", validator.binding_rule);
	ReadString(json, "allowed_domain", validator.allowed_domain);
	ReadAliases(json, "aliases", validator.aliases);
	ReadString(json, "required_audience", validator.required_audience);
	ReadBool(json, "check_expiry", validator.check_expiry);

	auto &prompt = config.prompt;
	ReadBool(json, "show_complete_uri", prompt.show_complete_uri);
	ReadBool(json, "wait_for_enter", prompt.wait_for_enter);
	ReadString(json, "enter_message", prompt.enter_message);
	ReadBool(json, "qr_enabled", prompt.qr_enabled);

	ValidateClientConfig(client);
	if (StringUtil::Trim(validator.identity_claim).empty()) {
		throw ConfigurationException("Setting 'identity_claim' must not be empty");
	}
	// Rejects unknown binding rule names
	BindingRuleFactory::Create(validator);

	return config;
}

ModuleConfig LoadModuleConfig(const std::string &path) {
	std::ifstream file(path);
	if (!file.is_open()) {
		throw ConfigurationException(StringUtil::Format("Cannot open configuration file '%s'", path.c_str()));
	}
	std::stringstream buffer;
	buffer << file.rdbuf();
	if (file.bad()) {
		throw ConfigurationException(StringUtil::Format("Cannot read configuration file '%s'", path.c_str()));
	}

	std::string text = buffer.str();
	try {
		auto config = ParseModuleConfig(text);
		SecureWipe(text);
		return config;
	} catch (const ConfigurationException &ex) {
		SecureWipe(text);
		throw ConfigurationException(StringUtil::Format("%s: %s", path.c_str(), ex.what()));
	}
}

//===----------------------------------------------------------------------===//
// ParseModuleArgs
//===----------------------------------------------------------------------===//

ModuleArgs ParseModuleArgs(int argc, const char **argv) {
	ModuleArgs args;
	for (int i = 0; i < argc; i++) {
		if (!argv || !argv[i]) {
			continue;
		}
		std::string arg = argv[i];
		auto eq = arg.find('=');
		std::string key = eq == std::string::npos ? arg : arg.substr(0, eq);
		std::string value = eq == std::string::npos ? "" : arg.substr(eq + 1);

		if (key == "config" && !value.empty()) {
			args.config_path = value;
		} else if (key == "log_level" && !value.empty()) {
			args.log_level = ParseLogLevel(value, args.log_level);
		} else if (key == "debug" && value.empty()) {
			args.log_level = LogLevel::LEVEL_DEBUG;
		} else {
			args.unknown.push_back(arg);
		}
	}
	return args;
}

}  // namespace pam_oauth2
