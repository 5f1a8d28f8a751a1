#include "LiteralUtils.h"

#include <charconv>
#include <cmath>
#include <format>
#include <limits>
#include <system_error>

namespace TmplCpp {

namespace {

int hex_value(char c) {
	if (c >= '0' && c <= '9') return c - '0';
	if (c >= 'a' && c <= 'f') return c - 'a' + 10;
	if (c >= 'A' && c <= 'F') return c - 'A' + 10;
	return -1;
}

bool is_valid_code_point(uint32_t cp) {
	return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

// Decode one UTF-8 sequence starting at s[i]; advances i.
std::optional<char32_t> decode_utf8(std::string_view s, size_t& i) {
	unsigned char lead = static_cast<unsigned char>(s[i]);
	size_t length;
	uint32_t cp;
	if (lead < 0x80) {
		++i;
		return static_cast<char32_t>(lead);
	} else if ((lead & 0xE0) == 0xC0) {
		length = 2;
		cp = lead & 0x1F;
	} else if ((lead & 0xF0) == 0xE0) {
		length = 3;
		cp = lead & 0x0F;
	} else if ((lead & 0xF8) == 0xF0) {
		length = 4;
		cp = lead & 0x07;
	} else {
		return std::nullopt;
	}
	if (i + length > s.size()) {
		return std::nullopt;
	}
	for (size_t k = 1; k < length; ++k) {
		unsigned char c = static_cast<unsigned char>(s[i + k]);
		if ((c & 0xC0) != 0x80) {
			return std::nullopt;
		}
		cp = (cp << 6) | (c & 0x3F);
	}
	if (!is_valid_code_point(cp)) {
		return std::nullopt;
	}
	i += length;
	return static_cast<char32_t>(cp);
}

// One decoded element of a quoted literal: either a code point or, for \x
// and octal escapes inside strings, a raw byte.
struct Unit {
	uint32_t value;
	bool is_byte;
};

// Decode the character or escape sequence at s[i], advancing i.
// quote is the surrounding quote character, which may not appear unescaped.
std::optional<Unit> unquote_unit(std::string_view s, size_t& i, char quote) {
	char c = s[i];
	if (c == quote && (quote == '\'' || quote == '"')) {
		return std::nullopt;
	}
	if (c != '\\') {
		std::optional<char32_t> cp = decode_utf8(s, i);
		if (!cp) {
			return std::nullopt;
		}
		return Unit{static_cast<uint32_t>(*cp), false};
	}

	if (i + 1 >= s.size()) {
		return std::nullopt;
	}
	char escape = s[i + 1];
	i += 2;
	switch (escape) {
	case 'a':  return Unit{'\a', false};
	case 'b':  return Unit{'\b', false};
	case 'f':  return Unit{'\f', false};
	case 'n':  return Unit{'\n', false};
	case 'r':  return Unit{'\r', false};
	case 't':  return Unit{'\t', false};
	case 'v':  return Unit{'\v', false};
	case '\\': return Unit{'\\', false};
	case '\'':
	case '"':
		if (escape != quote) {
			return std::nullopt;
		}
		return Unit{static_cast<uint32_t>(escape), false};
	case 'x':
	case 'u':
	case 'U': {
		size_t digits = escape == 'x' ? 2 : (escape == 'u' ? 4 : 8);
		if (i + digits > s.size()) {
			return std::nullopt;
		}
		uint32_t value = 0;
		for (size_t k = 0; k < digits; ++k) {
			int h = hex_value(s[i + k]);
			if (h < 0) {
				return std::nullopt;
			}
			value = (value << 4) | static_cast<uint32_t>(h);
		}
		i += digits;
		if (escape == 'x') {
			return Unit{value, quote != '\''};
		}
		if (!is_valid_code_point(value)) {
			return std::nullopt;
		}
		return Unit{value, false};
	}
	case '0': case '1': case '2': case '3':
	case '4': case '5': case '6': case '7': {
		// Exactly three octal digits, the first already consumed
		if (i + 2 > s.size()) {
			return std::nullopt;
		}
		uint32_t value = static_cast<uint32_t>(escape - '0');
		for (size_t k = 0; k < 2; ++k) {
			char d = s[i + k];
			if (d < '0' || d > '7') {
				return std::nullopt;
			}
			value = (value << 3) | static_cast<uint32_t>(d - '0');
		}
		i += 2;
		if (value > 255) {
			return std::nullopt;
		}
		return Unit{value, quote != '\''};
	}
	default:
		return std::nullopt;
	}
}

// Underscores may only separate digits, or follow a base prefix
bool underscores_ok(std::string_view s) {
	if (s.find('_') == std::string_view::npos) {
		return true;
	}
	size_t i = 0;
	if (i < s.size() && (s[i] == '+' || s[i] == '-')) {
		++i;
	}
	bool has_prefix = false;
	if (i + 1 < s.size() && s[i] == '0') {
		char p = static_cast<char>(s[i + 1] | 0x20);
		if (p == 'x' || p == 'o' || p == 'b') {
			has_prefix = true;
			i += 2;
		}
	}
	char prev = has_prefix ? '0' : '^';
	for (; i < s.size(); ++i) {
		char c = s[i];
		bool is_digit = (c >= '0' && c <= '9') || hex_value(c) >= 0;
		if (c == '_') {
			if (prev != '0') {
				return false;
			}
			prev = '_';
		} else if (is_digit) {
			prev = '0';
		} else {
			if (prev == '_') {
				return false;
			}
			prev = '!';
		}
	}
	return prev != '_';
}

std::string strip_underscores(std::string_view s) {
	std::string result;
	result.reserve(s.size());
	for (char c : s) {
		if (c != '_') {
			result += c;
		}
	}
	return result;
}

// Split a base prefix off an unsigned literal body: 0x, 0o, 0b, or a
// leading 0 meaning octal.
int detect_base(std::string_view& digits) {
	if (digits.size() >= 2 && digits[0] == '0') {
		switch (digits[1]) {
		case 'x': case 'X': digits.remove_prefix(2); return 16;
		case 'o': case 'O': digits.remove_prefix(2); return 8;
		case 'b': case 'B': digits.remove_prefix(2); return 2;
		default:            digits.remove_prefix(1); return 8;
		}
	}
	return 10;
}

std::optional<uint64_t> parse_unsigned(std::string_view text) {
	if (text.empty() || text[0] == '+' || text[0] == '-' || !underscores_ok(text)) {
		return std::nullopt;
	}
	std::string clean = strip_underscores(text);
	std::string_view digits = clean;
	int base = detect_base(digits);
	if (digits.empty()) {
		return std::nullopt;
	}
	uint64_t value = 0;
	auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value, base);
	if (ec != std::errc() || ptr != digits.data() + digits.size()) {
		return std::nullopt;
	}
	return value;
}

std::optional<int64_t> parse_signed(std::string_view text) {
	bool negative = false;
	if (!text.empty() && (text[0] == '+' || text[0] == '-')) {
		negative = text[0] == '-';
		text.remove_prefix(1);
	}
	std::optional<uint64_t> magnitude = parse_unsigned(text);
	if (!magnitude) {
		return std::nullopt;
	}
	constexpr uint64_t kMaxPositive = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
	if (negative) {
		if (*magnitude > kMaxPositive + 1) {
			return std::nullopt;
		}
		if (*magnitude == kMaxPositive + 1) {
			return std::numeric_limits<int64_t>::min();
		}
		return -static_cast<int64_t>(*magnitude);
	}
	if (*magnitude > kMaxPositive) {
		return std::nullopt;
	}
	return static_cast<int64_t>(*magnitude);
}

std::optional<double> parse_float(std::string_view text) {
	if (!underscores_ok(text)) {
		return std::nullopt;
	}
	std::string clean = strip_underscores(text);
	std::string_view body = clean;
	bool negative = false;
	if (!body.empty() && (body[0] == '+' || body[0] == '-')) {
		negative = body[0] == '-';
		body.remove_prefix(1);
	}
	std::chars_format format = std::chars_format::general;
	if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
		body.remove_prefix(2);
		format = std::chars_format::hex;
		// A hex float needs its binary exponent
		if (body.find_first_of("pP") == std::string_view::npos) {
			return std::nullopt;
		}
	} else if (body.size() >= 2 && body[0] == '0' &&
		(body[1] == 'o' || body[1] == 'O' || body[1] == 'b' || body[1] == 'B')) {
		return std::nullopt;
	}
	if (body.empty() || body[0] == '+' || body[0] == '-') {
		return std::nullopt;
	}
	double value = 0.0;
	auto [ptr, ec] = std::from_chars(body.data(), body.data() + body.size(), value, format);
	if (ec != std::errc() || ptr != body.data() + body.size() || !std::isfinite(value)) {
		return std::nullopt;
	}
	return negative ? -value : value;
}

void set_error(std::string* error, std::string message) {
	if (error) {
		*error = std::move(message);
	}
}

} // namespace

void append_utf8(std::string& out, char32_t code_point) {
	uint32_t cp = static_cast<uint32_t>(code_point);
	if (cp < 0x80) {
		out += static_cast<char>(cp);
	} else if (cp < 0x800) {
		out += static_cast<char>(0xC0 | (cp >> 6));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else if (cp < 0x10000) {
		out += static_cast<char>(0xE0 | (cp >> 12));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	} else {
		out += static_cast<char>(0xF0 | (cp >> 18));
		out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
		out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
		out += static_cast<char>(0x80 | (cp & 0x3F));
	}
}

std::optional<std::string> unquote(std::string_view quoted) {
	if (quoted.size() < 2) {
		return std::nullopt;
	}
	char quote = quoted.front();
	if (quote != quoted.back()) {
		return std::nullopt;
	}
	std::string_view body = quoted.substr(1, quoted.size() - 2);

	if (quote == '`') {
		if (body.find('`') != std::string_view::npos) {
			return std::nullopt;
		}
		// Carriage returns are discarded from raw strings
		std::string result;
		result.reserve(body.size());
		for (char c : body) {
			if (c != '\r') {
				result += c;
			}
		}
		return result;
	}
	if (quote != '"') {
		return std::nullopt;
	}

	std::string result;
	result.reserve(body.size());
	size_t i = 0;
	while (i < body.size()) {
		if (body[i] == '\n') {
			return std::nullopt;
		}
		std::optional<Unit> unit = unquote_unit(body, i, quote);
		if (!unit) {
			return std::nullopt;
		}
		if (unit->is_byte) {
			result += static_cast<char>(unit->value);
		} else {
			append_utf8(result, static_cast<char32_t>(unit->value));
		}
	}
	return result;
}

std::optional<char32_t> unquote_char(std::string_view quoted) {
	if (quoted.size() < 3 || quoted.front() != '\'' || quoted.back() != '\'') {
		return std::nullopt;
	}
	std::string_view body = quoted.substr(1, quoted.size() - 2);
	size_t i = 0;
	std::optional<Unit> unit = unquote_unit(body, i, '\'');
	if (!unit || i != body.size()) {
		return std::nullopt;
	}
	return static_cast<char32_t>(unit->value);
}

std::optional<NumberValue> parse_number(std::string_view text, TokenKind kind, std::string* error) {
	NumberValue number;

	if (kind == TokenKind::CharConstant) {
		std::optional<char32_t> cp = unquote_char(text);
		if (!cp) {
			set_error(error, std::format("malformed character constant: {}", text));
			return std::nullopt;
		}
		number.is_int = number.is_uint = number.is_float = true;
		number.int_value = static_cast<int64_t>(*cp);
		number.uint_value = static_cast<uint64_t>(*cp);
		number.float_value = static_cast<double>(*cp);
		return number;
	}

	if (std::optional<uint64_t> u = parse_unsigned(text)) {
		number.is_uint = true;
		number.uint_value = *u;
	}
	if (std::optional<int64_t> i = parse_signed(text)) {
		number.is_int = true;
		number.int_value = *i;
		if (*i == 0) {
			// -0 is representable as unsigned too
			number.is_uint = true;
			number.uint_value = 0;
		}
	}

	if (number.is_int) {
		number.is_float = true;
		number.float_value = static_cast<double>(number.int_value);
	} else if (number.is_uint) {
		number.is_float = true;
		number.float_value = static_cast<double>(number.uint_value);
	} else if (std::optional<double> f = parse_float(text)) {
		if (text.find_first_of(".eEpP") == std::string_view::npos) {
			// Integer syntax that did not fit in 64 bits
			set_error(error, std::format("integer overflow: \"{}\"", text));
			return std::nullopt;
		}
		number.is_float = true;
		number.float_value = *f;
		// An integral float is also usable as an integer
		if (std::trunc(*f) == *f) {
			if (*f >= -9223372036854775808.0 && *f < 9223372036854775808.0) {
				number.is_int = true;
				number.int_value = static_cast<int64_t>(*f);
			}
			if (*f >= 0.0 && *f < 18446744073709551616.0) {
				number.is_uint = true;
				number.uint_value = static_cast<uint64_t>(*f);
			}
		}
	}

	if (!number.is_int && !number.is_uint && !number.is_float) {
		set_error(error, std::format("illegal number syntax: \"{}\"", text));
		return std::nullopt;
	}
	return number;
}

} // namespace TmplCpp
