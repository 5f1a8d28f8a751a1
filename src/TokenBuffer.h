#pragma once

#include <cstddef>
#include <deque>
#include <optional>

#include "Lexer.h"
#include "Token.h"

namespace TmplCpp {

// Lookahead over the lexer with up to three tokens of pushback. Tokens
// handed back with backup*() are returned again, most recent call first,
// before anything new is pulled from the lexer.
class TokenBuffer {
public:
	explicit TokenBuffer(Lexer& lexer) : lexer_(lexer) {}

	std::optional<Token> next();

	// Push t back so it is the next token returned
	void backup(Token t);
	// t0 is returned first, then t1
	void backup2(Token t0, Token t1);
	// t0, then t1, then t2
	void backup3(Token t0, Token t1, Token t2);

	std::optional<Token> peek();
	std::optional<Token> next_non_space();
	std::optional<Token> peek_non_space();

	// Line of the most recently returned token
	size_t line() const { return line_; }
	size_t pushed_back() const { return pushed_back_.size(); }

private:
	Lexer& lexer_;
	std::deque<Token> pushed_back_;
	size_t line_ = 0;
};

} // namespace TmplCpp
