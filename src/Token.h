#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include "TokenKind.h"

namespace TmplCpp {

class Token {
public:
	Token() = default;
	Token(TokenKind kind, std::string value, size_t pos, size_t line)
		: value_(std::move(value)), pos_(pos), line_(line), kind_(kind) {}

	TokenKind kind() const { return kind_; }
	std::string_view value() const { return value_; }
	size_t pos() const { return pos_; }
	size_t line() const { return line_; }

	bool is(TokenKind kind) const { return kind_ == kind; }
	bool is_keyword() const { return TmplCpp::is_keyword(kind_); }

	// Form used inside diagnostics: EOF, <keyword>, or the quoted raw text
	std::string to_string() const {
		if (kind_ == TokenKind::EndOfFile) {
			return "EOF";
		}
		if (kind_ == TokenKind::Error) {
			return value_;
		}
		if (is_keyword()) {
			return "<" + value_ + ">";
		}
		if (value_.size() > 10) {
			return quote(std::string_view(value_).substr(0, 10)) + "...";
		}
		return quote(value_);
	}

private:
	static std::string quote(std::string_view text) {
		std::string result = "\"";
		for (char c : text) {
			switch (c) {
			case '"':  result += "\\\""; break;
			case '\\': result += "\\\\"; break;
			case '\n': result += "\\n"; break;
			case '\t': result += "\\t"; break;
			case '\r': result += "\\r"; break;
			default:   result += c; break;
			}
		}
		result += '"';
		return result;
	}

	std::string value_;
	size_t pos_ = 0;
	size_t line_ = 0;
	TokenKind kind_ = TokenKind::EndOfFile;
};

} // namespace TmplCpp
