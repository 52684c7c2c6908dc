//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// json_util.hpp
//
// Minimal JSON object reader for authorization-server responses and the
// module configuration file. Only the top level of an object is indexed;
// nested objects are re-parsed on demand with GetObject().
//===----------------------------------------------------------------------===//

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace pam_oauth2 {

enum class JsonType : uint8_t { NONE, NULL_VALUE, BOOLEAN, NUMBER, STRING, ARRAY, OBJECT };

const char *JsonTypeToString(JsonType type);

//===----------------------------------------------------------------------===//
// JsonObject - Top-level members of a parsed JSON object
//
// Members are kept as raw JSON text and decoded by the typed getters.
// Getters return false when the member is absent or has another type.
// Duplicate keys: the last occurrence wins.
//===----------------------------------------------------------------------===//
class JsonObject {
public:
	// Parse a complete document that must be a single JSON object.
	// Returns false (and leaves error set) on any syntax error.
	static bool Parse(const std::string &json, JsonObject &result, std::string *error = nullptr);

	bool Has(const std::string &key) const;

	JsonType GetType(const std::string &key) const;

	bool GetString(const std::string &key, std::string &out) const;

	// Accepts integral numbers and, for interoperability, strings holding only digits
	bool GetInt(const std::string &key, int64_t &out) const;

	bool GetBool(const std::string &key, bool &out) const;

	// Accepts an array of strings, or a single string as a one-element array
	bool GetStringArray(const std::string &key, std::vector<std::string> &out) const;

	bool GetObject(const std::string &key, JsonObject &out) const;

	// Keys of all members with string values, in key order
	std::map<std::string, std::string> GetStringMembers() const;

	size_t Size() const {
		return members_.size();
	}

private:
	std::map<std::string, std::string> members_;  // key -> raw JSON value
};

}  // namespace pam_oauth2
