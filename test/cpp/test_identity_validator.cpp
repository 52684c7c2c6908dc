// test/cpp/test_identity_validator.cpp
// Unit tests for binding rules and introspection checks

#include <catch2/catch.hpp>

#include "auth/identity_validator.hpp"
#include "common/exception.hpp"

using namespace pam_oauth2;

namespace {

const int64_t NOW = 1700000000;

IntrospectionResponse ActiveToken(const std::string &username) {
	IntrospectionResponse response;
	response.active = true;
	response.claims["username"] = username;
	response.claims["email"] = username + "@example.org";
	return response;
}

}  // namespace

TEST_CASE("IdentityValidator - Exact binding", "[identity_validator]") {
	IdentityValidator validator {ValidatorConfig()};

	SECTION("Matching user") {
		auto result = validator.Validate(ActiveToken("alice"), "alice", NOW);
		REQUIRE(result.valid);
		REQUIRE(result.remote_username == "alice");
		REQUIRE(result.reason.empty());
	}

	SECTION("Different user") {
		auto result = validator.Validate(ActiveToken("alice"), "bob", NOW);
		REQUIRE_FALSE(result.valid);
		REQUIRE(result.remote_username == "alice");
		REQUIRE_FALSE(result.reason.empty());
	}

	SECTION("Comparison is case-sensitive") {
		REQUIRE_FALSE(validator.Validate(ActiveToken("Alice"), "alice", NOW).valid);
	}

	SECTION("Missing claim") {
		IntrospectionResponse response;
		response.active = true;
		auto result = validator.Validate(response, "alice", NOW);
		REQUIRE_FALSE(result.valid);
		REQUIRE(result.remote_username.empty());
	}

	SECTION("Empty claim") {
		REQUIRE_FALSE(validator.Validate(ActiveToken(""), "", NOW).valid);
	}

	SECTION("Inactive token") {
		auto response = ActiveToken("alice");
		response.active = false;
		auto result = validator.Validate(response, "alice", NOW);
		REQUIRE_FALSE(result.valid);
		REQUIRE(result.reason == "token is not active");
	}
}

TEST_CASE("IdentityValidator - Expiry and audience", "[identity_validator]") {
	ValidatorConfig config;
	config.required_audience = "ssh-hosts";
	IdentityValidator validator(config);

	auto response = ActiveToken("alice");
	response.audience = {"other", "ssh-hosts"};

	SECTION("Valid audience and future expiry") {
		response.has_exp = true;
		response.exp = NOW + 60;
		REQUIRE(validator.Validate(response, "alice", NOW).valid);
	}

	SECTION("Expired token") {
		response.has_exp = true;
		response.exp = NOW;
		REQUIRE_FALSE(validator.Validate(response, "alice", NOW).valid);
	}

	SECTION("Expiry check disabled") {
		config.check_expiry = false;
		IdentityValidator lenient(config);
		response.has_exp = true;
		response.exp = NOW - 10;
		REQUIRE(lenient.Validate(response, "alice", NOW).valid);
	}

	SECTION("Audience missing") {
		response.audience = {"other"};
		REQUIRE_FALSE(validator.Validate(response, "alice", NOW).valid);
	}
}

TEST_CASE("IdentityValidator - Identity claim", "[identity_validator]") {
	ValidatorConfig config;
	config.identity_claim = "email";
	config.binding_rule = "strip_domain";
	IdentityValidator validator(config);

	auto result = validator.Validate(ActiveToken("alice"), "alice", NOW);
	REQUIRE(result.valid);
	REQUIRE(result.remote_username == "alice@example.org");
}

TEST_CASE("BindingRule - strip_domain", "[identity_validator]") {
	std::string reason;

	SECTION("Any domain") {
		StripDomainBindingRule rule("");
		REQUIRE(rule.Accepts("alice@example.org", "alice", reason));
		REQUIRE(rule.Accepts("alice", "alice", reason));
		REQUIRE_FALSE(rule.Accepts("alice@example.org", "bob", reason));
	}

	SECTION("Allowed domain") {
		StripDomainBindingRule rule("example.org");
		REQUIRE(rule.Accepts("alice@Example.ORG", "alice", reason));
		REQUIRE_FALSE(rule.Accepts("alice@evil.example", "alice", reason));
		REQUIRE_FALSE(rule.Accepts("alice", "alice", reason));
		REQUIRE(reason.find("allowed domain") != std::string::npos);
	}

	SECTION("Only the last domain is stripped") {
		StripDomainBindingRule rule("");
		REQUIRE(rule.Accepts("a@b@example.org", "a@b", reason));
		REQUIRE_FALSE(rule.Accepts("@example.org", "", reason));
	}
}

TEST_CASE("BindingRule - alias", "[identity_validator]") {
	std::map<std::string, std::string> aliases;
	aliases["alice.smith@example.org"] = "alice";
	AliasBindingRule rule(aliases);
	std::string reason;

	REQUIRE(rule.Accepts("alice.smith@example.org", "alice", reason));
	REQUIRE_FALSE(rule.Accepts("alice.smith@example.org", "root", reason));
	REQUIRE(rule.Accepts("bob", "bob", reason));
	REQUIRE_FALSE(rule.Accepts("bob", "alice", reason));
}

TEST_CASE("BindingRuleFactory - Rule selection", "[identity_validator]") {
	ValidatorConfig config;
	REQUIRE(BindingRuleFactory::Create(config)->GetName() == "exact");

	config.binding_rule = "strip_domain";
	REQUIRE(BindingRuleFactory::Create(config)->GetName() == "strip_domain");

	config.binding_rule = "ALIAS";
	REQUIRE(BindingRuleFactory::Create(config)->GetName() == "alias");

	config.binding_rule = "regex";
	REQUIRE_THROWS_AS(BindingRuleFactory::Create(config), ConfigurationException);
	REQUIRE_THROWS_AS(IdentityValidator(config), ConfigurationException);

	ValidatorConfig no_claim;
	no_claim.identity_claim = " ";
	REQUIRE_THROWS_AS(IdentityValidator(no_claim), ConfigurationException);
}
