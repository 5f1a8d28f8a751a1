#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "Token.h"

namespace TmplCpp {

// Pull-based tokenizer for template source. Text outside the delimiters is
// handed out as Text tokens; the inside of each action is split into the
// fine-grained kinds of TokenKind. The stream ends with exactly one
// EndOfFile or Error token, after which next_token() returns nullopt.
class Lexer {
public:
	explicit Lexer(std::string_view source,
	               std::string_view left_delim = "{{",
	               std::string_view right_delim = "}}");

	std::optional<Token> next_token();

	// Get the text of a specific line (1-based) for diagnostics
	std::string get_line_text(size_t line_num) const;

private:
	enum class State {
		Text,
		LeftDelim,
		Comment,
		RightDelim,
		InsideAction,
		Space,
		Identifier,
		Field,
		Variable,
		CharConstant,
		Number,
		Quote,
		RawQuote,
		Done,
	};

	static constexpr int kEof = -1;

	State step(State state);

	State lex_text();
	State lex_left_delim();
	State lex_comment();
	State lex_right_delim();
	State lex_inside_action();
	State lex_space();
	State lex_identifier();
	State lex_field_or_variable(TokenKind kind);
	State lex_char_constant();
	State lex_number();
	State lex_quote();
	State lex_raw_quote();

	bool scan_number();

	int next_char();
	int peek_char();
	void backup_char();
	bool accept(std::string_view valid);
	void accept_run(std::string_view valid);
	void skip_to(size_t pos);

	void emit(TokenKind kind);
	void ignore();
	State errorf(std::string message);

	bool at_terminator();
	// Returns {at right delimiter, delimiter carries a trim marker}
	std::pair<bool, bool> at_right_delim() const;
	bool has_left_trim_marker(size_t pos) const;
	bool has_right_trim_marker(size_t pos) const;

	std::string_view source_;
	std::string left_delim_;
	std::string right_delim_;

	size_t cursor_ = 0;
	size_t start_ = 0;
	size_t line_ = 1;
	size_t start_line_ = 1;
	bool last_was_eof_ = false;
	int paren_depth_ = 0;

	State state_ = State::Text;
	std::deque<Token> pending_;
};

} // namespace TmplCpp
