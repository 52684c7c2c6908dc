//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// identity_validator.hpp
//
// Decides whether an introspected token authorizes a login as a given
// local account
//===----------------------------------------------------------------------===//

#pragma once

#include "auth/binding_rule.hpp"
#include "oauth/oauth_types.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// ValidatorConfig
//===----------------------------------------------------------------------===//
struct ValidatorConfig {
	std::string identity_claim = "username";  // Introspection member naming the remote user
	std::string binding_rule = "exact";       // exact | strip_domain | alias
	std::string allowed_domain;               // strip_domain only
	std::map<std::string, std::string> aliases;  // alias only: remote -> local
	std::string required_audience;            // Empty: no audience check
	bool check_expiry = true;
};

//===----------------------------------------------------------------------===//
// BindingRuleFactory - Creates the binding rule named in ValidatorConfig
//===----------------------------------------------------------------------===//
class BindingRuleFactory {
public:
	// Throws ConfigurationException for unknown rule names
	static BindingRulePtr Create(const ValidatorConfig &config);

	static BindingRulePtr CreateExact();
	static BindingRulePtr CreateStripDomain(const std::string &allowed_domain);
	static BindingRulePtr CreateAlias(const std::map<std::string, std::string> &aliases);
};

//===----------------------------------------------------------------------===//
// ValidationResult
//===----------------------------------------------------------------------===//
struct ValidationResult {
	bool valid = false;
	std::string remote_username;  // Resolved identity claim (empty if absent)
	std::string reason;           // Why validation failed, for the audit log

	static ValidationResult Success(const std::string &remote_username) {
		return {true, remote_username, ""};
	}

	static ValidationResult Failure(const std::string &reason, const std::string &remote_username = "") {
		return {false, remote_username, reason};
	}
};

//===----------------------------------------------------------------------===//
// IdentityValidator
//
// Checks, in order: the token is active; exp (when present and enabled) is
// in the future; the required audience (if any) is listed in aud; the
// identity claim is present and non-empty; the binding rule accepts.
//===----------------------------------------------------------------------===//
class IdentityValidator {
public:
	// Throws ConfigurationException for an invalid config
	explicit IdentityValidator(ValidatorConfig config);

	IdentityValidator(ValidatorConfig config, BindingRulePtr rule);

	ValidationResult Validate(const IntrospectionResponse &introspection, const std::string &local_user,
	                          int64_t now_unix) const;

	const ValidatorConfig &GetConfig() const {
		return config_;
	}

	const BindingRule &GetRule() const {
		return *rule_;
	}

private:
	ValidatorConfig config_;
	BindingRulePtr rule_;
};

}  // namespace pam_oauth2
