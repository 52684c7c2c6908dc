//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// string_util.cpp
//
// printf-style formatting and small string helpers
//===----------------------------------------------------------------------===//

#include "common/string_util.hpp"

#include <cctype>
#include <cstdarg>
#include <cstdio>

namespace pam_oauth2 {

std::string StringUtil::Format(const char *fmt, ...) {
	va_list args;
	va_start(args, fmt);
	std::string result = FormatVA(fmt, args);
	va_end(args);
	return result;
}

std::string StringUtil::FormatVA(const char *fmt, va_list args) {
	va_list args_copy;
	va_copy(args_copy, args);
	int needed = vsnprintf(nullptr, 0, fmt, args_copy);
	va_end(args_copy);
	if (needed < 0) {
		return fmt;
	}

	std::string result(static_cast<size_t>(needed) + 1, '\0');
	vsnprintf(&result[0], result.size(), fmt, args);
	result.resize(static_cast<size_t>(needed));
	return result;
}

std::string StringUtil::Trim(const std::string &value) {
	size_t start = value.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) {
		return "";
	}
	size_t end = value.find_last_not_of(" \t\r\n");
	return value.substr(start, end - start + 1);
}

std::string StringUtil::Lower(const std::string &value) {
	std::string result = value;
	for (auto &c : result) {
		c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
	}
	return result;
}

bool StringUtil::StartsWith(const std::string &value, const std::string &prefix) {
	return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

}  // namespace pam_oauth2
