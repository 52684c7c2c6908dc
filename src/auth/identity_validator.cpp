//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// identity_validator.cpp
//
// Binding rule factory and introspection checks
//===----------------------------------------------------------------------===//

#include "auth/identity_validator.hpp"
#include "common/exception.hpp"
#include "common/string_util.hpp"

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// BindingRuleFactory
//===----------------------------------------------------------------------===//

BindingRulePtr BindingRuleFactory::Create(const ValidatorConfig &config) {
	auto name = StringUtil::Lower(StringUtil::Trim(config.binding_rule));
	if (name.empty() || name == "exact") {
		return CreateExact();
	} else if (name == "strip_domain") {
		return CreateStripDomain(config.allowed_domain);
	} else if (name == "alias") {
		return CreateAlias(config.aliases);
	}
	throw ConfigurationException(StringUtil::Format(
	    "Invalid binding_rule '%s'. Must be 'exact', 'strip_domain' or 'alias'", config.binding_rule.c_str()));
}

BindingRulePtr BindingRuleFactory::CreateExact() {
	return std::make_shared<ExactBindingRule>();
}

BindingRulePtr BindingRuleFactory::CreateStripDomain(const std::string &allowed_domain) {
	return std::make_shared<StripDomainBindingRule>(allowed_domain);
}

BindingRulePtr BindingRuleFactory::CreateAlias(const std::map<std::string, std::string> &aliases) {
	return std::make_shared<AliasBindingRule>(aliases);
}

//===----------------------------------------------------------------------===//
// IdentityValidator
//===----------------------------------------------------------------------===//

IdentityValidator::IdentityValidator(ValidatorConfig config) : config_(std::move(config)) {
	if (StringUtil::Trim(config_.identity_claim).empty()) {
		throw ConfigurationException("Setting 'identity_claim' must not be empty");
	}
	rule_ = BindingRuleFactory::Create(config_);
}

IdentityValidator::IdentityValidator(ValidatorConfig config, BindingRulePtr rule)
    : config_(std::move(config)), rule_(std::move(rule)) {
	if (!rule_) {
		throw ConfigurationException("Identity validator requires a binding rule");
	}
}

ValidationResult IdentityValidator::Validate(const IntrospectionResponse &introspection,
                                             const std::string &local_user, int64_t now_unix) const {
	if (!introspection.active) {
		return ValidationResult::Failure("token is not active");
	}

	if (config_.check_expiry && introspection.has_exp && introspection.exp <= now_unix) {
		return ValidationResult::Failure(StringUtil::Format("token expired at %lld",
		                                                    static_cast<long long>(introspection.exp)));
	}

	if (!config_.required_audience.empty() && !introspection.HasAudience(config_.required_audience)) {
		return ValidationResult::Failure(
		    StringUtil::Format("token audience does not include '%s'", config_.required_audience.c_str()));
	}

	std::string remote_user;
	if (!introspection.TryGetClaim(config_.identity_claim, remote_user) || remote_user.empty()) {
		return ValidationResult::Failure(
		    StringUtil::Format("claim '%s' missing from introspection response", config_.identity_claim.c_str()));
	}

	std::string reason;
	if (!rule_->Accepts(remote_user, local_user, reason)) {
		return ValidationResult::Failure(reason, remote_user);
	}
	return ValidationResult::Success(remote_user);
}

}  // namespace pam_oauth2
