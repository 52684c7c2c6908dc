//===----------------------------------------------------------------------===//
//                         PAM OAuth2 Device
//
// json_util.cpp
//
// Recursive scanner for JSON objects. Grew out of the key-search helpers
// (ParseJsonString / ParseJsonInt) once error bodies had to be told apart
// from unparseable ones.
//===----------------------------------------------------------------------===//

#include "common/json_util.hpp"
#include "common/string_util.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>

namespace pam_oauth2 {

// Server responses are untrusted; bound recursion on nested values
static constexpr int MAX_JSON_DEPTH = 64;

const char *JsonTypeToString(JsonType type) {
	switch (type) {
	case JsonType::NONE:
		return "missing";
	case JsonType::NULL_VALUE:
		return "null";
	case JsonType::BOOLEAN:
		return "boolean";
	case JsonType::NUMBER:
		return "number";
	case JsonType::STRING:
		return "string";
	case JsonType::ARRAY:
		return "array";
	case JsonType::OBJECT:
		return "object";
	default:
		return "unknown";
	}
}

//===----------------------------------------------------------------------===//
// Scanner
//===----------------------------------------------------------------------===//

namespace {

class JsonScanner {
public:
	explicit JsonScanner(const std::string &json) : json_(json), pos_(0) {}

	void SkipWhitespace() {
		while (pos_ < json_.size() &&
		       (json_[pos_] == ' ' || json_[pos_] == '\t' || json_[pos_] == '\n' || json_[pos_] == '\r')) {
			pos_++;
		}
	}

	bool AtEnd() const {
		return pos_ >= json_.size();
	}

	size_t Position() const {
		return pos_;
	}

	const std::string &Error() const {
		return error_;
	}

	// Scan a full object, recording top-level members as raw text
	bool ScanTopLevelObject(std::map<std::string, std::string> &members) {
		SkipWhitespace();
		if (!Expect('{')) {
			return false;
		}
		SkipWhitespace();
		if (Peek() == '}') {
			pos_++;
			return true;
		}
		while (true) {
			SkipWhitespace();
			std::string key;
			if (!ScanString(key)) {
				return false;
			}
			SkipWhitespace();
			if (!Expect(':')) {
				return false;
			}
			SkipWhitespace();
			size_t value_start = pos_;
			if (!SkipValue(1)) {
				return false;
			}
			members[key] = json_.substr(value_start, pos_ - value_start);
			SkipWhitespace();
			if (Peek() == ',') {
				pos_++;
				continue;
			}
			return Expect('}');
		}
	}

	// Scan a string starting at the opening quote, decoding escapes into out
	bool ScanString(std::string &out) {
		if (!Expect('"')) {
			return false;
		}
		out.clear();
		while (pos_ < json_.size()) {
			char c = json_[pos_++];
			if (c == '"') {
				return true;
			}
			if (static_cast<unsigned char>(c) < 0x20) {
				return Fail("control character in string");
			}
			if (c != '\\') {
				out.push_back(c);
				continue;
			}
			if (pos_ >= json_.size()) {
				break;
			}
			char esc = json_[pos_++];
			switch (esc) {
			case '"':
			case '\\':
			case '/':
				out.push_back(esc);
				break;
			case 'b':
				out.push_back('\b');
				break;
			case 'f':
				out.push_back('\f');
				break;
			case 'n':
				out.push_back('\n');
				break;
			case 'r':
				out.push_back('\r');
				break;
			case 't':
				out.push_back('\t');
				break;
			case 'u': {
				uint32_t code_point;
				if (!ScanUnicodeEscape(code_point)) {
					return false;
				}
				AppendUtf8(out, code_point);
				break;
			}
			default:
				return Fail("invalid escape sequence");
			}
		}
		return Fail("unterminated string");
	}

private:
	char Peek() const {
		return pos_ < json_.size() ? json_[pos_] : '\0';
	}

	bool Expect(char c) {
		if (Peek() != c) {
			return Fail(StringUtil::Format("expected '%c' at offset %zu", c, pos_));
		}
		pos_++;
		return true;
	}

	bool Fail(const std::string &message) {
		if (error_.empty()) {
			error_ = message;
		}
		return false;
	}

	bool ScanHex4(uint32_t &value) {
		if (pos_ + 4 > json_.size()) {
			return Fail("truncated unicode escape");
		}
		value = 0;
		for (int i = 0; i < 4; i++) {
			char c = json_[pos_++];
			value <<= 4;
			if (c >= '0' && c <= '9') {
				value |= static_cast<uint32_t>(c - '0');
			} else if (c >= 'a' && c <= 'f') {
				value |= static_cast<uint32_t>(c - 'a' + 10);
			} else if (c >= 'A' && c <= 'F') {
				value |= static_cast<uint32_t>(c - 'A' + 10);
			} else {
				return Fail("invalid unicode escape");
			}
		}
		return true;
	}

	bool ScanUnicodeEscape(uint32_t &code_point) {
		if (!ScanHex4(code_point)) {
			return false;
		}
		if (code_point >= 0xD800 && code_point <= 0xDBFF) {
			// High surrogate: a low surrogate escape must follow
			if (pos_ + 2 > json_.size() || json_[pos_] != '\\' || json_[pos_ + 1] != 'u') {
				return Fail("unpaired surrogate in unicode escape");
			}
			pos_ += 2;
			uint32_t low;
			if (!ScanHex4(low)) {
				return false;
			}
			if (low < 0xDC00 || low > 0xDFFF) {
				return Fail("invalid low surrogate in unicode escape");
			}
			code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
		} else if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
			return Fail("unpaired surrogate in unicode escape");
		}
		return true;
	}

	static void AppendUtf8(std::string &out, uint32_t cp) {
		if (cp < 0x80) {
			out.push_back(static_cast<char>(cp));
		} else if (cp < 0x800) {
			out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
			out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
		} else if (cp < 0x10000) {
			out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
			out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
			out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
		} else {
			out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
			out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
			out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
			out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
		}
	}

	bool ScanLiteral(const char *literal) {
		std::string expected(literal);
		if (json_.compare(pos_, expected.size(), expected) != 0) {
			return Fail(StringUtil::Format("invalid literal at offset %zu", pos_));
		}
		pos_ += expected.size();
		return true;
	}

	bool ScanDigits() {
		size_t start = pos_;
		while (pos_ < json_.size() && json_[pos_] >= '0' && json_[pos_] <= '9') {
			pos_++;
		}
		return pos_ > start;
	}

	bool ScanNumber() {
		if (Peek() == '-') {
			pos_++;
		}
		if (!ScanDigits()) {
			return Fail(StringUtil::Format("invalid number at offset %zu", pos_));
		}
		if (Peek() == '.') {
			pos_++;
			if (!ScanDigits()) {
				return Fail("invalid fraction in number");
			}
		}
		if (Peek() == 'e' || Peek() == 'E') {
			pos_++;
			if (Peek() == '+' || Peek() == '-') {
				pos_++;
			}
			if (!ScanDigits()) {
				return Fail("invalid exponent in number");
			}
		}
		return true;
	}

	bool SkipValue(int depth) {
		if (depth > MAX_JSON_DEPTH) {
			return Fail("nesting too deep");
		}
		std::string scratch;
		switch (Peek()) {
		case '"':
			return ScanString(scratch);
		case '{':
			return SkipContainer('{', '}', depth, true);
		case '[':
			return SkipContainer('[', ']', depth, false);
		case 't':
			return ScanLiteral("true");
		case 'f':
			return ScanLiteral("false");
		case 'n':
			return ScanLiteral("null");
		default:
			return ScanNumber();
		}
	}

	bool SkipContainer(char open, char close, int depth, bool is_object) {
		if (!Expect(open)) {
			return false;
		}
		SkipWhitespace();
		if (Peek() == close) {
			pos_++;
			return true;
		}
		while (true) {
			SkipWhitespace();
			if (is_object) {
				std::string key;
				if (!ScanString(key)) {
					return false;
				}
				SkipWhitespace();
				if (!Expect(':')) {
					return false;
				}
				SkipWhitespace();
			}
			if (!SkipValue(depth + 1)) {
				return false;
			}
			SkipWhitespace();
			if (Peek() == ',') {
				pos_++;
				continue;
			}
			return Expect(close);
		}
	}

	const std::string &json_;
	size_t pos_;
	std::string error_;
};

JsonType ClassifyRaw(const std::string &raw) {
	if (raw.empty()) {
		return JsonType::NONE;
	}
	switch (raw[0]) {
	case '"':
		return JsonType::STRING;
	case '{':
		return JsonType::OBJECT;
	case '[':
		return JsonType::ARRAY;
	case 't':
	case 'f':
		return JsonType::BOOLEAN;
	case 'n':
		return JsonType::NULL_VALUE;
	default:
		return JsonType::NUMBER;
	}
}

bool DecodeRawString(const std::string &raw, std::string &out) {
	JsonScanner scanner(raw);
	return scanner.ScanString(out);
}

bool ParseInt64(const std::string &text, int64_t &out) {
	if (text.empty()) {
		return false;
	}
	size_t i = text[0] == '-' ? 1 : 0;
	if (i == text.size()) {
		return false;
	}
	for (; i < text.size(); i++) {
		if (text[i] < '0' || text[i] > '9') {
			return false;
		}
	}
	errno = 0;
	char *end = nullptr;
	long long value = std::strtoll(text.c_str(), &end, 10);
	if (errno == ERANGE || end != text.c_str() + text.size()) {
		return false;
	}
	out = static_cast<int64_t>(value);
	return true;
}

// JSON number whose value is a whole number, written with a fraction or an
// exponent ("5.0", "1.8e3"). Digits are shifted instead of going through
// strtod so the result does not depend on the locale.
bool ParseIntegralNumber(const std::string &text, int64_t &out) {
	size_t i = 0;
	bool negative = i < text.size() && text[i] == '-';
	if (negative) {
		i++;
	}
	std::string digits;
	while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
		digits.push_back(text[i++]);
	}
	if (digits.empty()) {
		return false;
	}
	int64_t exponent = 0;
	if (i < text.size() && text[i] == '.') {
		i++;
		size_t start = i;
		while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
			digits.push_back(text[i++]);
		}
		if (i == start) {
			return false;
		}
		exponent -= static_cast<int64_t>(i - start);
	}
	if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
		i++;
		bool exponent_negative = false;
		if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
			exponent_negative = text[i] == '-';
			i++;
		}
		size_t start = i;
		int64_t value = 0;
		while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i]))) {
			if (value < 1000) {
				value = value * 10 + (text[i] - '0');
			}
			i++;
		}
		if (i == start) {
			return false;
		}
		exponent += exponent_negative ? -value : value;
	}
	if (i != text.size()) {
		return false;
	}

	// Trailing zeros absorb a negative exponent; anything left is a fraction
	while (exponent < 0 && digits.size() > 1 && digits.back() == '0') {
		digits.pop_back();
		exponent++;
	}
	if (exponent < 0) {
		if (digits.find_first_not_of('0') != std::string::npos) {
			return false;
		}
		exponent = 0;
	}
	auto first = digits.find_first_not_of('0');
	digits = first == std::string::npos ? "0" : digits.substr(first);
	if (digits != "0") {
		if (static_cast<int64_t>(digits.size()) + exponent > 19) {
			return false;
		}
		digits.append(static_cast<size_t>(exponent), '0');
	}
	return ParseInt64(negative ? "-" + digits : digits, out);
}

}  // namespace

//===----------------------------------------------------------------------===//
// JsonObject
//===----------------------------------------------------------------------===//

bool JsonObject::Parse(const std::string &json, JsonObject &result, std::string *error) {
	std::map<std::string, std::string> members;
	JsonScanner scanner(json);
	bool ok = scanner.ScanTopLevelObject(members);
	if (ok) {
		scanner.SkipWhitespace();
		if (!scanner.AtEnd()) {
			if (error) {
				*error = StringUtil::Format("trailing data at offset %zu", scanner.Position());
			}
			return false;
		}
	} else {
		if (error) {
			*error = scanner.Error().empty() ? "invalid JSON object" : scanner.Error();
		}
		return false;
	}
	result.members_.swap(members);
	return true;
}

bool JsonObject::Has(const std::string &key) const {
	return members_.find(key) != members_.end();
}

JsonType JsonObject::GetType(const std::string &key) const {
	auto it = members_.find(key);
	if (it == members_.end()) {
		return JsonType::NONE;
	}
	return ClassifyRaw(it->second);
}

bool JsonObject::GetString(const std::string &key, std::string &out) const {
	auto it = members_.find(key);
	if (it == members_.end() || ClassifyRaw(it->second) != JsonType::STRING) {
		return false;
	}
	return DecodeRawString(it->second, out);
}

bool JsonObject::GetInt(const std::string &key, int64_t &out) const {
	auto it = members_.find(key);
	if (it == members_.end()) {
		return false;
	}
	auto type = ClassifyRaw(it->second);
	if (type == JsonType::NUMBER) {
		return ParseInt64(it->second, out) || ParseIntegralNumber(it->second, out);
	}
	if (type == JsonType::STRING) {
		std::string text;
		return DecodeRawString(it->second, text) && ParseInt64(text, out);
	}
	return false;
}

bool JsonObject::GetBool(const std::string &key, bool &out) const {
	auto it = members_.find(key);
	if (it == members_.end() || ClassifyRaw(it->second) != JsonType::BOOLEAN) {
		return false;
	}
	out = it->second == "true";
	return true;
}

bool JsonObject::GetStringArray(const std::string &key, std::vector<std::string> &out) const {
	auto it = members_.find(key);
	if (it == members_.end()) {
		return false;
	}
	const std::string &raw = it->second;
	auto type = ClassifyRaw(raw);
	if (type == JsonType::STRING) {
		std::string value;
		if (!DecodeRawString(raw, value)) {
			return false;
		}
		out.assign(1, value);
		return true;
	}
	if (type != JsonType::ARRAY) {
		return false;
	}

	// Elements were validated when the enclosing object was scanned
	std::vector<std::string> values;
	size_t pos = 1;
	while (pos < raw.size()) {
		while (pos < raw.size() && (raw[pos] == ' ' || raw[pos] == '\t' || raw[pos] == '\n' || raw[pos] == '\r' ||
		                            raw[pos] == ',')) {
			pos++;
		}
		if (pos >= raw.size() || raw[pos] == ']') {
			break;
		}
		if (raw[pos] != '"') {
			return false;
		}
		std::string remainder = raw.substr(pos);
		JsonScanner element(remainder);
		std::string value;
		if (!element.ScanString(value)) {
			return false;
		}
		values.push_back(value);
		pos += element.Position();
	}
	out.swap(values);
	return true;
}

bool JsonObject::GetObject(const std::string &key, JsonObject &out) const {
	auto it = members_.find(key);
	if (it == members_.end() || ClassifyRaw(it->second) != JsonType::OBJECT) {
		return false;
	}
	return Parse(it->second, out);
}

std::map<std::string, std::string> JsonObject::GetStringMembers() const {
	std::map<std::string, std::string> result;
	for (const auto &member : members_) {
		std::string value;
		if (ClassifyRaw(member.second) == JsonType::STRING && DecodeRawString(member.second, value)) {
			result[member.first] = value;
		}
	}
	return result;
}

}  // namespace pam_oauth2
