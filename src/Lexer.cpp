#include "Lexer.h"

#include <algorithm>
#include <format>

#include "Log.h"

namespace TmplCpp {

namespace {

constexpr std::string_view kLeftComment = "/*";
constexpr std::string_view kRightComment = "*/";
constexpr char kTrimMarker = '-';
constexpr size_t kTrimMarkerLen = 2;  // marker plus the mandatory space

constexpr std::string_view kDecimalDigits = "0123456789_";
constexpr std::string_view kHexDigits = "0123456789abcdefABCDEF_";
constexpr std::string_view kOctalDigits = "01234567_";
constexpr std::string_view kBinaryDigits = "01_";

bool is_space(int c) {
	return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

// Bytes of multi-byte UTF-8 sequences are accepted as letters
bool is_alpha_numeric(int c) {
	if (c < 0) {
		return false;
	}
	return c == '_' || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
		(c >= '0' && c <= '9') || c >= 0x80;
}

size_t left_trim_length(std::string_view s) {
	size_t i = 0;
	while (i < s.size() && is_space(static_cast<unsigned char>(s[i]))) {
		++i;
	}
	return i;
}

size_t right_trim_length(std::string_view s) {
	size_t i = s.size();
	while (i > 0 && is_space(static_cast<unsigned char>(s[i - 1]))) {
		--i;
	}
	return s.size() - i;
}

std::string describe_char(int c) {
	if (c >= 0x20 && c < 0x7f) {
		return std::format("U+{:04X} '{}'", c, static_cast<char>(c));
	}
	return std::format("U+{:04X}", c);
}

} // namespace

Lexer::Lexer(std::string_view source, std::string_view left_delim, std::string_view right_delim)
	: source_(source),
	  left_delim_(left_delim.empty() ? "{{" : left_delim),
	  right_delim_(right_delim.empty() ? "}}" : right_delim) {
}

std::optional<Token> Lexer::next_token() {
	while (pending_.empty() && state_ != State::Done) {
		state_ = step(state_);
	}
	if (pending_.empty()) {
		return std::nullopt;
	}
	Token token = std::move(pending_.front());
	pending_.pop_front();
	return token;
}

std::string Lexer::get_line_text(size_t line_num) const {
	size_t current_line = 1;
	size_t line_start = 0;
	for (size_t i = 0; i < source_.size() && current_line < line_num; ++i) {
		if (source_[i] == '\n') {
			++current_line;
			line_start = i + 1;
		}
	}
	if (current_line != line_num) {
		return "";
	}
	size_t line_end = source_.find('\n', line_start);
	if (line_end == std::string_view::npos) {
		line_end = source_.size();
	}
	return std::string(source_.substr(line_start, line_end - line_start));
}

Lexer::State Lexer::step(State state) {
	switch (state) {
	case State::Text:         return lex_text();
	case State::LeftDelim:    return lex_left_delim();
	case State::Comment:      return lex_comment();
	case State::RightDelim:   return lex_right_delim();
	case State::InsideAction: return lex_inside_action();
	case State::Space:        return lex_space();
	case State::Identifier:   return lex_identifier();
	case State::Field:        return lex_field_or_variable(TokenKind::Field);
	case State::Variable:
		if (at_terminator()) {
			// Bare $
			emit(TokenKind::Variable);
			return State::InsideAction;
		}
		return lex_field_or_variable(TokenKind::Variable);
	case State::CharConstant: return lex_char_constant();
	case State::Number:       return lex_number();
	case State::Quote:        return lex_quote();
	case State::RawQuote:     return lex_raw_quote();
	case State::Done:         return State::Done;
	}
	return State::Done;
}

// ---------------------------------------------------------------------------
// Cursor helpers
// ---------------------------------------------------------------------------

int Lexer::next_char() {
	if (cursor_ >= source_.size()) {
		last_was_eof_ = true;
		return kEof;
	}
	last_was_eof_ = false;
	unsigned char c = static_cast<unsigned char>(source_[cursor_++]);
	if (c == '\n') {
		++line_;
	}
	return c;
}

int Lexer::peek_char() {
	int c = next_char();
	backup_char();
	return c;
}

void Lexer::backup_char() {
	if (last_was_eof_ || cursor_ == 0) {
		return;
	}
	--cursor_;
	if (source_[cursor_] == '\n') {
		--line_;
	}
}

bool Lexer::accept(std::string_view valid) {
	int c = next_char();
	if (c != kEof && valid.find(static_cast<char>(c)) != std::string_view::npos) {
		return true;
	}
	backup_char();
	return false;
}

void Lexer::accept_run(std::string_view valid) {
	while (accept(valid)) {
	}
}

void Lexer::skip_to(size_t pos) {
	pos = std::min(pos, source_.size());
	if (pos >= cursor_) {
		line_ += std::count(source_.begin() + cursor_, source_.begin() + pos, '\n');
	} else {
		line_ -= std::count(source_.begin() + pos, source_.begin() + cursor_, '\n');
	}
	cursor_ = pos;
	last_was_eof_ = false;
}

void Lexer::emit(TokenKind kind) {
	std::string value(source_.substr(start_, cursor_ - start_));
	TMPL_LOG_FORMAT(Lexer, Trace, "emit {} '{}' at {} line {}", token_kind_name(kind), value, start_, start_line_);
	pending_.emplace_back(kind, std::move(value), start_, start_line_);
	start_ = cursor_;
	start_line_ = line_;
}

void Lexer::ignore() {
	start_ = cursor_;
	start_line_ = line_;
}

Lexer::State Lexer::errorf(std::string message) {
	TMPL_LOG_FORMAT(Lexer, Debug, "error at {} line {}: {}", start_, start_line_, message);
	pending_.emplace_back(TokenKind::Error, std::move(message), start_, start_line_);
	return State::Done;
}

bool Lexer::has_left_trim_marker(size_t pos) const {
	return pos + 1 < source_.size() && source_[pos] == kTrimMarker &&
		is_space(static_cast<unsigned char>(source_[pos + 1]));
}

bool Lexer::has_right_trim_marker(size_t pos) const {
	return pos + 1 < source_.size() && is_space(static_cast<unsigned char>(source_[pos])) &&
		source_[pos + 1] == kTrimMarker;
}

std::pair<bool, bool> Lexer::at_right_delim() const {
	std::string_view rest = source_.substr(cursor_);
	if (rest.starts_with(right_delim_)) {
		return {true, false};
	}
	if (has_right_trim_marker(cursor_) && rest.substr(kTrimMarkerLen).starts_with(right_delim_)) {
		return {true, true};
	}
	return {false, false};
}

bool Lexer::at_terminator() {
	int c = peek_char();
	if (is_space(c)) {
		return true;
	}
	switch (c) {
	case kEof:
	case '.':
	case ',':
	case '|':
	case ':':
	case ')':
	case '(':
		return true;
	default:
		break;
	}
	return static_cast<char>(c) == right_delim_.front();
}

// ---------------------------------------------------------------------------
// States
// ---------------------------------------------------------------------------

Lexer::State Lexer::lex_text() {
	size_t delim_pos = source_.find(left_delim_, cursor_);
	if (delim_pos == std::string_view::npos) {
		skip_to(source_.size());
		if (cursor_ > start_) {
			emit(TokenKind::Text);
		}
		emit(TokenKind::EndOfFile);
		return State::Done;
	}
	if (delim_pos > cursor_) {
		size_t text_end = delim_pos;
		if (has_left_trim_marker(delim_pos + left_delim_.size())) {
			text_end -= right_trim_length(source_.substr(start_, delim_pos - start_));
		}
		skip_to(text_end);
		if (cursor_ > start_) {
			emit(TokenKind::Text);
		}
		skip_to(delim_pos);
		ignore();
	}
	return State::LeftDelim;
}

Lexer::State Lexer::lex_left_delim() {
	skip_to(cursor_ + left_delim_.size());
	bool trim_space = has_left_trim_marker(cursor_);
	size_t after_marker = trim_space ? kTrimMarkerLen : 0;
	if (source_.substr(cursor_ + after_marker).starts_with(kLeftComment)) {
		skip_to(cursor_ + after_marker);
		ignore();
		return State::Comment;
	}
	emit(TokenKind::LeftDelim);
	skip_to(cursor_ + after_marker);
	ignore();
	paren_depth_ = 0;
	return State::InsideAction;
}

Lexer::State Lexer::lex_comment() {
	skip_to(cursor_ + kLeftComment.size());
	size_t close = source_.find(kRightComment, cursor_);
	if (close == std::string_view::npos) {
		return errorf("unclosed comment");
	}
	skip_to(close + kRightComment.size());
	auto [delim, trim_space] = at_right_delim();
	if (!delim) {
		return errorf("comment ends before closing delimiter");
	}
	if (trim_space) {
		skip_to(cursor_ + kTrimMarkerLen);
	}
	skip_to(cursor_ + right_delim_.size());
	if (trim_space) {
		skip_to(cursor_ + left_trim_length(source_.substr(cursor_)));
	}
	ignore();
	return State::Text;
}

Lexer::State Lexer::lex_right_delim() {
	bool trim_space = at_right_delim().second;
	if (trim_space) {
		skip_to(cursor_ + kTrimMarkerLen);
		ignore();
	}
	skip_to(cursor_ + right_delim_.size());
	emit(TokenKind::RightDelim);
	if (trim_space) {
		skip_to(cursor_ + left_trim_length(source_.substr(cursor_)));
		ignore();
	}
	return State::Text;
}

Lexer::State Lexer::lex_inside_action() {
	if (at_right_delim().first) {
		if (paren_depth_ == 0) {
			return State::RightDelim;
		}
		return errorf("unclosed left paren");
	}

	int c = next_char();
	if (c == kEof) {
		return errorf("unclosed action");
	}
	if (is_space(c)) {
		backup_char();
		return State::Space;
	}
	switch (c) {
	case ':':
		if (next_char() != '=') {
			return errorf("expected :=");
		}
		emit(TokenKind::ColonEquals);
		return State::InsideAction;
	case '|':
		emit(TokenKind::Pipe);
		return State::InsideAction;
	case ',':
		emit(TokenKind::Comma);
		return State::InsideAction;
	case '"':
		return State::Quote;
	case '`':
		return State::RawQuote;
	case '$':
		return State::Variable;
	case '\'':
		return State::CharConstant;
	case '(':
		emit(TokenKind::LeftParen);
		++paren_depth_;
		return State::InsideAction;
	case ')':
		--paren_depth_;
		if (paren_depth_ < 0) {
			return errorf("unexpected right paren");
		}
		emit(TokenKind::RightParen);
		return State::InsideAction;
	case '.':
		// .5 is a number, anything else starting with a dot is a field or dot
		if (cursor_ >= source_.size() || source_[cursor_] < '0' || source_[cursor_] > '9') {
			return State::Field;
		}
		backup_char();
		return State::Number;
	default:
		break;
	}
	if (c == '+' || c == '-' || (c >= '0' && c <= '9')) {
		backup_char();
		return State::Number;
	}
	if (is_alpha_numeric(c)) {
		backup_char();
		return State::Identifier;
	}
	if (c < 0x80 && c >= 0x20 && c < 0x7f) {
		emit(TokenKind::Char);
		return State::InsideAction;
	}
	return errorf(std::format("unrecognized character in action: {}", describe_char(c)));
}

Lexer::State Lexer::lex_space() {
	size_t num_spaces = 0;
	while (is_space(peek_char())) {
		next_char();
		++num_spaces;
	}
	// A space followed by "- }}" belongs to a trim-marked right delimiter
	if (has_right_trim_marker(cursor_ - 1) &&
		source_.substr(cursor_ - 1 + kTrimMarkerLen).starts_with(right_delim_)) {
		skip_to(cursor_ - 1);
		if (num_spaces == 1) {
			return State::RightDelim;
		}
	}
	emit(TokenKind::Space);
	return State::InsideAction;
}

Lexer::State Lexer::lex_identifier() {
	int c;
	do {
		c = next_char();
	} while (is_alpha_numeric(c));
	backup_char();

	if (!at_terminator()) {
		return errorf(std::format("bad character {}", describe_char(c)));
	}
	std::string_view word = source_.substr(start_, cursor_ - start_);
	TokenKind kind = keyword_kind(word);
	if (kind != TokenKind::Identifier) {
		emit(kind);
	} else if (word == "true" || word == "false") {
		emit(TokenKind::Bool);
	} else {
		emit(TokenKind::Identifier);
	}
	return State::InsideAction;
}

Lexer::State Lexer::lex_field_or_variable(TokenKind kind) {
	if (at_terminator()) {
		// Only a lone dot can get here; a bare $ is handled by the caller
		emit(kind == TokenKind::Variable ? TokenKind::Variable : TokenKind::Dot);
		return State::InsideAction;
	}
	int c;
	do {
		c = next_char();
	} while (is_alpha_numeric(c));
	backup_char();

	if (!at_terminator()) {
		return errorf(std::format("bad character {}", describe_char(c)));
	}
	emit(kind);
	return State::InsideAction;
}

Lexer::State Lexer::lex_char_constant() {
	for (;;) {
		int c = next_char();
		if (c == '\\') {
			c = next_char();
			if (c != kEof && c != '\n') {
				continue;
			}
		}
		if (c == kEof || c == '\n') {
			return errorf("unterminated character constant");
		}
		if (c == '\'') {
			break;
		}
	}
	emit(TokenKind::CharConstant);
	return State::InsideAction;
}

Lexer::State Lexer::lex_number() {
	if (!scan_number()) {
		return errorf(std::format("bad number syntax: \"{}\"", source_.substr(start_, cursor_ - start_)));
	}
	emit(TokenKind::Number);
	return State::InsideAction;
}

bool Lexer::scan_number() {
	accept("+-");
	std::string_view digits = kDecimalDigits;
	if (accept("0")) {
		if (accept("xX")) {
			digits = kHexDigits;
		} else if (accept("oO")) {
			digits = kOctalDigits;
		} else if (accept("bB")) {
			digits = kBinaryDigits;
		}
	}
	accept_run(digits);
	if (accept(".")) {
		accept_run(digits);
	}
	if (digits.size() == kDecimalDigits.size() && accept("eE")) {
		accept("+-");
		accept_run(kDecimalDigits);
	}
	if (digits.size() == kHexDigits.size() && accept("pP")) {
		accept("+-");
		accept_run(kDecimalDigits);
	}
	if (is_alpha_numeric(peek_char())) {
		next_char();
		return false;
	}
	return true;
}

Lexer::State Lexer::lex_quote() {
	for (;;) {
		int c = next_char();
		if (c == '\\') {
			c = next_char();
			if (c != kEof && c != '\n') {
				continue;
			}
		}
		if (c == kEof || c == '\n') {
			return errorf("unterminated quoted string");
		}
		if (c == '"') {
			break;
		}
	}
	emit(TokenKind::String);
	return State::InsideAction;
}

Lexer::State Lexer::lex_raw_quote() {
	for (;;) {
		int c = next_char();
		if (c == kEof) {
			return errorf("unterminated raw quoted string");
		}
		if (c == '`') {
			break;
		}
	}
	emit(TokenKind::RawString);
	return State::InsideAction;
}

} // namespace TmplCpp
