//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// binding_rule.hpp
//
// Policy deciding whether a remote identity may log in as a local account
//===----------------------------------------------------------------------===//

#pragma once

#include <map>
#include <memory>
#include <string>

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// BindingRule - Abstract interface for identity binding policies
//===----------------------------------------------------------------------===//

class BindingRule {
public:
	virtual ~BindingRule() = default;

	// Human-readable name for logging/debugging
	virtual std::string GetName() const = 0;

	// True when remote_user may authenticate as local_user.
	// On rejection, reason is set for the audit log.
	virtual bool Accepts(const std::string &remote_user, const std::string &local_user, std::string &reason) const = 0;

protected:
	BindingRule() = default;
};

using BindingRulePtr = std::shared_ptr<BindingRule>;

//===----------------------------------------------------------------------===//
// ExactBindingRule - Remote and local names must be byte-equal
//===----------------------------------------------------------------------===//

class ExactBindingRule : public BindingRule {
public:
	std::string GetName() const override {
		return "exact";
	}

	bool Accepts(const std::string &remote_user, const std::string &local_user, std::string &reason) const override;
};

//===----------------------------------------------------------------------===//
// StripDomainBindingRule - "alice@example.org" binds to "alice"
//
// When allowed_domain is set, the remote name must carry exactly that
// domain (compared case-insensitively).
//===----------------------------------------------------------------------===//

class StripDomainBindingRule : public BindingRule {
public:
	explicit StripDomainBindingRule(std::string allowed_domain);

	std::string GetName() const override {
		return "strip_domain";
	}

	bool Accepts(const std::string &remote_user, const std::string &local_user, std::string &reason) const override;

private:
	std::string allowed_domain_;
};

//===----------------------------------------------------------------------===//
// AliasBindingRule - Remote names mapped to local accounts
//
// Unmapped remote names fall back to exact equality.
//===----------------------------------------------------------------------===//

class AliasBindingRule : public BindingRule {
public:
	explicit AliasBindingRule(std::map<std::string, std::string> aliases);

	std::string GetName() const override {
		return "alias";
	}

	bool Accepts(const std::string &remote_user, const std::string &local_user, std::string &reason) const override;

private:
	std::map<std::string, std::string> aliases_;  // remote -> local
};

}  // namespace pam_oauth2
