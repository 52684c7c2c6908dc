//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// exception.hpp
//
// Exceptions for invalid configuration and illegal engine use.
// Protocol outcomes are never thrown; they are returned as result structs.
//===----------------------------------------------------------------------===//

#pragma once

#include <stdexcept>
#include <string>

namespace pam_oauth2 {

//===----------------------------------------------------------------------===//
// ConfigurationException - Invalid or incomplete module configuration
//===----------------------------------------------------------------------===//
class ConfigurationException : public std::runtime_error {
public:
	explicit ConfigurationException(const std::string &message) : std::runtime_error(message) {}
};

//===----------------------------------------------------------------------===//
// InvalidStateException - Operation not allowed in the current engine state
//
// Thrown for programming errors such as polling a device code twice.
//===----------------------------------------------------------------------===//
class InvalidStateException : public std::logic_error {
public:
	explicit InvalidStateException(const std::string &message) : std::logic_error(message) {}
};

}  // namespace pam_oauth2
