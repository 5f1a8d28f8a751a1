#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

namespace TmplCpp {

enum class ParseErrorKind {
	UnexpectedEnd,
	UnexpectedToken,
	LexError,
	UndefinedFunction,
	UndefinedVariable,
	MultipleDefinitions,
	MalformedLiteral,
	TooManyDeclarations,
	RangeDeclaration,
	NonExecutableCommand,
	MissingValue,
	EmptyCommand,
	UnclosedParen,
	DynamicTemplateUnsupported,

	// Parser bookkeeping went wrong; not reachable from template input
	NoTree,
	InvalidNode,
};

inline std::string_view get_parse_error_kind_string(ParseErrorKind kind) {
	switch (kind) {
	case ParseErrorKind::UnexpectedEnd:
		return "Unexpected end of input";
	case ParseErrorKind::UnexpectedToken:
		return "Unexpected token";
	case ParseErrorKind::LexError:
		return "Lexer error";
	case ParseErrorKind::UndefinedFunction:
		return "Undefined function";
	case ParseErrorKind::UndefinedVariable:
		return "Undefined variable";
	case ParseErrorKind::MultipleDefinitions:
		return "Multiple definitions of template";
	case ParseErrorKind::MalformedLiteral:
		return "Malformed literal";
	case ParseErrorKind::TooManyDeclarations:
		return "Too many declarations";
	case ParseErrorKind::RangeDeclaration:
		return "Invalid range declaration";
	case ParseErrorKind::NonExecutableCommand:
		return "Non executable command in pipeline";
	case ParseErrorKind::MissingValue:
		return "Missing value";
	case ParseErrorKind::EmptyCommand:
		return "Empty command";
	case ParseErrorKind::UnclosedParen:
		return "Unclosed parenthesis";
	case ParseErrorKind::DynamicTemplateUnsupported:
		return "Dynamic template names not enabled";
	case ParseErrorKind::NoTree:
		return "Internal error: no active tree";
	case ParseErrorKind::InvalidNode:
		return "Internal error: invalid node";
	}
	return "Internal error";
}

// A parse failure, located by the innermost tree being parsed and the line
// of the last token read.
struct ParseError {
	ParseErrorKind kind = ParseErrorKind::UnexpectedToken;
	std::string tree_name;
	size_t line = 0;
	std::string message;

	// template: <tree>:<line>:<message>
	std::string to_string() const {
		return "template: " + tree_name + ":" + std::to_string(line) + ":" + message;
	}
};

// Thrown by the grammar routines; the parser entry point turns it back
// into a ParseResult so nothing escapes to callers.
class TemplateError : public std::runtime_error {
public:
	explicit TemplateError(ParseError error)
		: std::runtime_error(error.to_string()), error_(std::move(error)) {}

	const ParseError& error() const { return error_; }
	ParseErrorKind kind() const { return error_.kind; }

private:
	ParseError error_;
};

} // namespace TmplCpp
