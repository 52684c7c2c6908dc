//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// binding_rule.cpp
//
// Remote identity to local account mapping rules
//===----------------------------------------------------------------------===//

#include "auth/binding_rule.hpp"
#include "common/string_util.hpp"

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// ExactBindingRule
//===----------------------------------------------------------------------===//

bool ExactBindingRule::Accepts(const std::string &remote_user, const std::string &local_user,
                               std::string &reason) const {
	if (remote_user == local_user) {
		return true;
	}
	reason = StringUtil::Format("remote user '%s' does not match local user '%s'", remote_user.c_str(),
	                            local_user.c_str());
	return false;
}

//===----------------------------------------------------------------------===//
// StripDomainBindingRule
//===----------------------------------------------------------------------===//

StripDomainBindingRule::StripDomainBindingRule(std::string allowed_domain)
    : allowed_domain_(std::move(allowed_domain)) {}

bool StripDomainBindingRule::Accepts(const std::string &remote_user, const std::string &local_user,
                                     std::string &reason) const {
	std::string name = remote_user;
	std::string domain;
	auto at = remote_user.rfind('@');
	if (at != std::string::npos) {
		name = remote_user.substr(0, at);
		domain = remote_user.substr(at + 1);
	}

	if (!allowed_domain_.empty() && StringUtil::Lower(domain) != StringUtil::Lower(allowed_domain_)) {
		reason = StringUtil::Format("remote user '%s' is not in allowed domain '%s'", remote_user.c_str(),
		                            allowed_domain_.c_str());
		return false;
	}
	if (name.empty() || name != local_user) {
		reason = StringUtil::Format("remote user '%s' does not match local user '%s'", remote_user.c_str(),
		                            local_user.c_str());
		return false;
	}
	return true;
}

//===----------------------------------------------------------------------===//
// AliasBindingRule
//===----------------------------------------------------------------------===//

AliasBindingRule::AliasBindingRule(std::map<std::string, std::string> aliases) : aliases_(std::move(aliases)) {}

bool AliasBindingRule::Accepts(const std::string &remote_user, const std::string &local_user,
                               std::string &reason) const {
	auto it = aliases_.find(remote_user);
	if (it == aliases_.end()) {
		return ExactBindingRule().Accepts(remote_user, local_user, reason);
	}
	if (it->second == local_user) {
		return true;
	}
	reason = StringUtil::Format("remote user '%s' is mapped to local user '%s', not '%s'", remote_user.c_str(),
	                            it->second.c_str(), local_user.c_str());
	return false;
}

}  // namespace pam_oauth2
