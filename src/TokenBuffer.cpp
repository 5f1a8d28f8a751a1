#include "TokenBuffer.h"

#include <utility>

#include "Log.h"

namespace TmplCpp {

std::optional<Token> TokenBuffer::next() {
	std::optional<Token> token;
	if (!pushed_back_.empty()) {
		token = std::move(pushed_back_.front());
		pushed_back_.pop_front();
	} else {
		token = lexer_.next_token();
	}
	if (token) {
		line_ = token->line();
		TMPL_LOG_FORMAT(Parser, Trace, "token {} at line {}", token->to_string(), line_);
	}
	return token;
}

void TokenBuffer::backup(Token t) {
	pushed_back_.push_front(std::move(t));
}

void TokenBuffer::backup2(Token t0, Token t1) {
	pushed_back_.push_front(std::move(t1));
	pushed_back_.push_front(std::move(t0));
}

void TokenBuffer::backup3(Token t0, Token t1, Token t2) {
	pushed_back_.push_front(std::move(t2));
	pushed_back_.push_front(std::move(t1));
	pushed_back_.push_front(std::move(t0));
}

std::optional<Token> TokenBuffer::peek() {
	std::optional<Token> token = next();
	if (token) {
		backup(*token);
	}
	return token;
}

std::optional<Token> TokenBuffer::next_non_space() {
	std::optional<Token> token = next();
	while (token && token->is(TokenKind::Space)) {
		token = next();
	}
	return token;
}

std::optional<Token> TokenBuffer::peek_non_space() {
	std::optional<Token> token = next_non_space();
	if (token) {
		backup(*token);
	}
	return token;
}

} // namespace TmplCpp
