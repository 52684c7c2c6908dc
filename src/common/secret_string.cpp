//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// secret_string.cpp
//
// Credential wiping and redacted rendering
//===----------------------------------------------------------------------===//

#include "common/secret_string.hpp"

#include <openssl/crypto.h>

namespace pam_oauth2 {

void SecureWipe(std::string &value) {
	// resize() within capacity never reallocates
	value.resize(value.capacity());
	if (!value.empty()) {
		OPENSSL_cleanse(&value[0], value.size());
	}
	value.clear();
}

SecretString &SecretString::operator=(const SecretString &other) {
	if (this != &other) {
		Wipe();
		value_ = other.value_;
	}
	return *this;
}

SecretString &SecretString::operator=(SecretString &&other) {
	if (this != &other) {
		Wipe();
		value_ = other.value_;
		other.Wipe();
	}
	return *this;
}

std::string SecretString::ToString() const {
	return value_.empty() ? "<empty>" : REDACTED_MARKER;
}

bool SecretString::operator==(const SecretString &other) const {
	if (value_.size() != other.value_.size()) {
		return false;
	}
	return CRYPTO_memcmp(value_.data(), other.value_.data(), value_.size()) == 0;
}

std::ostream &operator<<(std::ostream &os, const SecretString &secret) {
	return os << secret.ToString();
}

}  // namespace pam_oauth2
