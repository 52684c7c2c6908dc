//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// string_util.hpp
//
// Small string helpers shared by the client, config loader and PAM adapter
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdarg>
#include <string>

namespace pam_oauth2 {

class StringUtil {
public:
	// printf-style formatting into a std::string
	static std::string Format(const char *fmt, ...)
#if defined(__GNUC__) || defined(__clang__)
	    __attribute__((format(printf, 1, 2)))
#endif
	    ;

	// vprintf-style variant; args is consumed
	static std::string FormatVA(const char *fmt, va_list args);

	// Strip leading/trailing spaces, tabs, CR and LF
	static std::string Trim(const std::string &value);

	static std::string Lower(const std::string &value);

	static bool StartsWith(const std::string &value, const std::string &prefix);
};

}  // namespace pam_oauth2
