#pragma once

#include <cstdint>
#include <string_view>

namespace TmplCpp {

enum class TokenKind : uint8_t {
	Error,          // lexer failure; value holds the message
	Bool,           // true / false
	Char,           // printable ASCII punctuation with no dedicated kind
	CharConstant,   // 'x'
	ColonEquals,    // :=
	Comma,          // ,
	EndOfFile,
	Field,          // .Name
	Identifier,     // function name
	LeftDelim,      // {{ (configurable)
	LeftParen,
	Number,
	Pipe,           // |
	RawString,      // `abc`
	RightDelim,     // }} (configurable)
	RightParen,
	Space,          // run of blanks/newlines inside an action
	String,         // "abc", still quoted
	Text,           // literal text outside actions
	Variable,       // $name, or bare $

	// Keywords - everything after this point prints as <value>
	Keyword,        // sentinel, never emitted
	Block,
	Dot,
	Define,
	Else,
	End,
	If,
	Nil,
	Range,
	Template,
	With,
};

constexpr bool is_keyword(TokenKind kind) {
	return static_cast<uint8_t>(kind) > static_cast<uint8_t>(TokenKind::Keyword);
}

constexpr std::string_view token_kind_name(TokenKind kind) {
	switch (kind) {
	case TokenKind::Error:        return "error";
	case TokenKind::Bool:         return "bool";
	case TokenKind::Char:         return "char";
	case TokenKind::CharConstant: return "char constant";
	case TokenKind::ColonEquals:  return ":=";
	case TokenKind::Comma:        return "comma";
	case TokenKind::EndOfFile:    return "EOF";
	case TokenKind::Field:        return "field";
	case TokenKind::Identifier:   return "identifier";
	case TokenKind::LeftDelim:    return "left delim";
	case TokenKind::LeftParen:    return "(";
	case TokenKind::Number:       return "number";
	case TokenKind::Pipe:         return "|";
	case TokenKind::RawString:    return "raw string";
	case TokenKind::RightDelim:   return "right delim";
	case TokenKind::RightParen:   return ")";
	case TokenKind::Space:        return "space";
	case TokenKind::String:       return "string";
	case TokenKind::Text:         return "text";
	case TokenKind::Variable:     return "variable";
	case TokenKind::Keyword:      return "keyword";
	case TokenKind::Block:        return "block";
	case TokenKind::Dot:          return ".";
	case TokenKind::Define:       return "define";
	case TokenKind::Else:         return "else";
	case TokenKind::End:          return "end";
	case TokenKind::If:           return "if";
	case TokenKind::Nil:          return "nil";
	case TokenKind::Range:        return "range";
	case TokenKind::Template:     return "template";
	case TokenKind::With:         return "with";
	}
	return "unknown";
}

// Keyword spelling to kind; returns Identifier for anything else.
// true/false are handled separately since they lex as Bool.
constexpr TokenKind keyword_kind(std::string_view word) {
	if (word == "block")    return TokenKind::Block;
	if (word == "define")   return TokenKind::Define;
	if (word == "else")     return TokenKind::Else;
	if (word == "end")      return TokenKind::End;
	if (word == "if")       return TokenKind::If;
	if (word == "nil")      return TokenKind::Nil;
	if (word == "range")    return TokenKind::Range;
	if (word == "template") return TokenKind::Template;
	if (word == "with")     return TokenKind::With;
	return TokenKind::Identifier;
}

} // namespace TmplCpp
