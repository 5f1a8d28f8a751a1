#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "TokenKind.h"

namespace TmplCpp {

// Numeric interpretations of a number literal. A literal may be
// representable as several of these at once, e.g. 7 is int, uint and float.
struct NumberValue {
	bool is_int = false;
	bool is_uint = false;
	bool is_float = false;
	int64_t int_value = 0;
	uint64_t uint_value = 0;
	double float_value = 0.0;
};

// Decode a quoted literal as written in source ("..." or `...`) into its
// UTF-8 value. Returns nullopt for malformed quoting or escapes.
std::optional<std::string> unquote(std::string_view quoted);

// Decode a character constant such as 'a' or '\n' into its code point.
std::optional<char32_t> unquote_char(std::string_view quoted);

// Interpret a Number or CharConstant token. On failure returns nullopt and,
// when error is non-null, stores the diagnostic text there.
std::optional<NumberValue> parse_number(std::string_view text, TokenKind kind, std::string* error = nullptr);

// Append the UTF-8 encoding of a code point
void append_utf8(std::string& out, char32_t code_point);

} // namespace TmplCpp
