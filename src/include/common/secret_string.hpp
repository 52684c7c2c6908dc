//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// secret_string.hpp
//
// Owning string for credentials (device codes, tokens, client secrets).
// The buffer is wiped when the value is replaced or destroyed, and every
// printable rendering is redacted.
//===----------------------------------------------------------------------===//

#pragma once

#include <ostream>
#include <string>

namespace pam_oauth2 {

// Marker printed in place of secret material
static const char *const REDACTED_MARKER = "[redacted]";

// Overwrite the string's whole buffer, up to capacity(), with zeros
// (OPENSSL_cleanse) and clear it
void SecureWipe(std::string &value);

class SecretString {
public:
	SecretString() = default;
	// Copies; the caller wipes its own buffer
	explicit SecretString(const std::string &value) : value_(value) {}

	SecretString(const SecretString &other) : value_(other.value_) {}
	// Copies and wipes the source: moving a short string leaves its bytes
	// in the source's inline buffer
	SecretString(SecretString &&other) : value_(other.value_) {
		other.Wipe();
	}

	SecretString &operator=(const SecretString &other);
	SecretString &operator=(SecretString &&other);

	~SecretString() {
		Wipe();
	}

	// Raw secret for building requests - never pass to a logger
	const std::string &Expose() const {
		return value_;
	}

	bool Empty() const {
		return value_.empty();
	}

	size_t Size() const {
		return value_.size();
	}

	void Wipe() {
		SecureWipe(value_);
	}

	// "[redacted]" or "<empty>"
	std::string ToString() const;

	bool operator==(const SecretString &other) const;
	bool operator!=(const SecretString &other) const {
		return !(*this == other);
	}

private:
	std::string value_;
};

std::ostream &operator<<(std::ostream &os, const SecretString &secret);

}  // namespace pam_oauth2
