#include "Lexer.h"
#include "LiteralUtils.h"
#include "AstNodeTypes.h"
#include "TemplateError.h"
#include "Token.h"
#include "TokenBuffer.h"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include "doctest.h"

using namespace TmplCpp;

// Drain the lexer; the last token is EOF or an error
static std::vector<Token> lex_all(std::string_view input, std::string_view left = "{{", std::string_view right = "}}") {
	Lexer lexer(input, left, right);
	std::vector<Token> tokens;
	while (auto token = lexer.next_token()) {
		tokens.push_back(std::move(*token));
	}
	return tokens;
}

static void check_tokens(const std::vector<Token>& tokens, const std::vector<std::pair<TokenKind, std::string>>& expected) {
	REQUIRE(tokens.size() == expected.size());
	for (size_t i = 0; i < expected.size(); ++i) {
		INFO(tokens[i].to_string());
		CHECK(tokens[i].kind() == expected[i].first);
		CHECK(tokens[i].value() == expected[i].second);
	}
}

TEST_SUITE("Lexer") {
	TEST_CASE("Text without actions") {
		Lexer lexer("hello");
		auto text = lexer.next_token();
		REQUIRE(text);
		CHECK(text->kind() == TokenKind::Text);
		CHECK(text->value() == "hello");
		auto eof = lexer.next_token();
		REQUIRE(eof);
		CHECK(eof->kind() == TokenKind::EndOfFile);
		CHECK(!lexer.next_token());
		CHECK(!lexer.next_token());
	}

	TEST_CASE("Field between text") {
		check_tokens(lex_all("a{{.x}}b"), {
			{TokenKind::Text, "a"},
			{TokenKind::LeftDelim, "{{"},
			{TokenKind::Field, ".x"},
			{TokenKind::RightDelim, "}}"},
			{TokenKind::Text, "b"},
			{TokenKind::EndOfFile, ""},
		});
	}

	TEST_CASE("Keywords") {
		std::vector<Token> tokens = lex_all("{{if .a}}x{{else}}y{{end}}");
		std::vector<TokenKind> expected{
			TokenKind::LeftDelim, TokenKind::If, TokenKind::Space, TokenKind::Field, TokenKind::RightDelim,
			TokenKind::Text,
			TokenKind::LeftDelim, TokenKind::Else, TokenKind::RightDelim,
			TokenKind::Text,
			TokenKind::LeftDelim, TokenKind::End, TokenKind::RightDelim,
			TokenKind::EndOfFile,
		};
		REQUIRE(tokens.size() == expected.size());
		for (size_t i = 0; i < expected.size(); ++i) {
			CHECK(tokens[i].kind() == expected[i]);
		}
		CHECK(tokens[1].is_keyword());
		CHECK(tokens[1].to_string() == "<if>");
	}

	TEST_CASE("Trim markers eat surrounding space") {
		check_tokens(lex_all("a  {{- .x -}}  b"), {
			{TokenKind::Text, "a"},
			{TokenKind::LeftDelim, "{{"},
			{TokenKind::Field, ".x"},
			{TokenKind::RightDelim, "}}"},
			{TokenKind::Text, "b"},
			{TokenKind::EndOfFile, ""},
		});
	}

	TEST_CASE("Comments produce no tokens") {
		check_tokens(lex_all("a{{/* note */}}b"), {
			{TokenKind::Text, "a"},
			{TokenKind::Text, "b"},
			{TokenKind::EndOfFile, ""},
		});
	}

	TEST_CASE("Unclosed comment") {
		std::vector<Token> tokens = lex_all("a{{/* note");
		REQUIRE(!tokens.empty());
		CHECK(tokens.back().kind() == TokenKind::Error);
		CHECK(tokens.back().value() == "unclosed comment");
	}

	TEST_CASE("Variables and declarations") {
		check_tokens(lex_all("{{$x := $}}"), {
			{TokenKind::LeftDelim, "{{"},
			{TokenKind::Variable, "$x"},
			{TokenKind::Space, " "},
			{TokenKind::ColonEquals, ":="},
			{TokenKind::Space, " "},
			{TokenKind::Variable, "$"},
			{TokenKind::RightDelim, "}}"},
			{TokenKind::EndOfFile, ""},
		});
	}

	TEST_CASE("Numbers and character constants") {
		check_tokens(lex_all("{{1 -2 0x1F 1.5e3 'a'}}"), {
			{TokenKind::LeftDelim, "{{"},
			{TokenKind::Number, "1"},
			{TokenKind::Space, " "},
			{TokenKind::Number, "-2"},
			{TokenKind::Space, " "},
			{TokenKind::Number, "0x1F"},
			{TokenKind::Space, " "},
			{TokenKind::Number, "1.5e3"},
			{TokenKind::Space, " "},
			{TokenKind::CharConstant, "'a'"},
			{TokenKind::RightDelim, "}}"},
			{TokenKind::EndOfFile, ""},
		});
	}

	TEST_CASE("Parentheses and pipes") {
		check_tokens(lex_all("{{(1) | f}}"), {
			{TokenKind::LeftDelim, "{{"},
			{TokenKind::LeftParen, "("},
			{TokenKind::Number, "1"},
			{TokenKind::RightParen, ")"},
			{TokenKind::Space, " "},
			{TokenKind::Pipe, "|"},
			{TokenKind::Space, " "},
			{TokenKind::Identifier, "f"},
			{TokenKind::RightDelim, "}}"},
			{TokenKind::EndOfFile, ""},
		});
	}

	TEST_CASE("Custom delimiters") {
		check_tokens(lex_all("<<.x>>", "<<", ">>"), {
			{TokenKind::LeftDelim, "<<"},
			{TokenKind::Field, ".x"},
			{TokenKind::RightDelim, ">>"},
			{TokenKind::EndOfFile, ""},
		});
	}

	TEST_CASE("Line numbers") {
		std::vector<Token> tokens = lex_all("a\nb{{.x\n.y}}");
		REQUIRE(tokens.size() >= 5);
		CHECK(tokens[0].line() == 1);
		CHECK(tokens[1].kind() == TokenKind::LeftDelim);
		CHECK(tokens[1].line() == 2);
		CHECK(tokens[2].line() == 2);
		CHECK(tokens[3].kind() == TokenKind::Space);
		CHECK(tokens[4].value() == ".y");
		CHECK(tokens[4].line() == 3);
	}

	TEST_CASE("Source lines for diagnostics") {
		Lexer lexer("first\n{{.a}}\nthird");
		CHECK(lexer.get_line_text(1) == "first");
		CHECK(lexer.get_line_text(2) == "{{.a}}");
		CHECK(lexer.get_line_text(3) == "third");
		CHECK(lexer.get_line_text(4) == "");
	}

	TEST_CASE("Lexical errors end the stream") {
		auto last_error = [](std::string_view input) {
			std::vector<Token> tokens = lex_all(input);
			REQUIRE(!tokens.empty());
			REQUIRE(tokens.back().kind() == TokenKind::Error);
			return std::string(tokens.back().value());
		};
		CHECK(last_error("{{.x") == "unclosed action");
		CHECK(last_error("{{\"abc}}") == "unterminated quoted string");
		CHECK(last_error("{{`abc") == "unterminated raw quoted string");
		CHECK(last_error("{{3k}}") == "bad number syntax: \"3k\"");
		CHECK(last_error("{{(1}}") == "unclosed left paren");
		CHECK(last_error("{{)}}") == "unexpected right paren");
		CHECK(last_error("{{:}}") == "expected :=");
	}
}

TEST_SUITE("TokenBuffer") {
	TEST_CASE("Pushed back tokens come out in order") {
		Lexer lexer("{{.a .b}}");
		TokenBuffer buffer(lexer);

		auto t0 = buffer.next();
		auto t1 = buffer.next();
		auto t2 = buffer.next();
		REQUIRE(t0);
		REQUIRE(t1);
		REQUIRE(t2);
		CHECK(t2->kind() == TokenKind::Space);

		buffer.backup3(*t0, *t1, *t2);
		CHECK(buffer.pushed_back() == 3);
		CHECK(buffer.next()->kind() == TokenKind::LeftDelim);
		CHECK(buffer.next()->value() == ".a");
		CHECK(buffer.next()->kind() == TokenKind::Space);
		CHECK(buffer.next()->value() == ".b");
		CHECK(buffer.pushed_back() == 0);
	}

	TEST_CASE("backup2 returns the first argument first") {
		Lexer lexer("{{.a}}");
		TokenBuffer buffer(lexer);
		Token left = *buffer.next();
		Token field = *buffer.next();
		buffer.backup2(left, field);
		CHECK(buffer.next()->kind() == TokenKind::LeftDelim);
		CHECK(buffer.next()->kind() == TokenKind::Field);
		CHECK(buffer.next()->kind() == TokenKind::RightDelim);
	}

	TEST_CASE("Peeking skips spaces without consuming") {
		Lexer lexer("{{ .a}}");
		TokenBuffer buffer(lexer);
		buffer.next();
		auto peeked = buffer.peek_non_space();
		REQUIRE(peeked);
		CHECK(peeked->kind() == TokenKind::Field);
		CHECK(buffer.next_non_space()->kind() == TokenKind::Field);
		CHECK(buffer.peek()->kind() == TokenKind::RightDelim);
		CHECK(buffer.next()->kind() == TokenKind::RightDelim);
		CHECK(buffer.next()->kind() == TokenKind::EndOfFile);
		CHECK(!buffer.next());
	}

	TEST_CASE("Line follows the last token read") {
		Lexer lexer("x\n\n{{.a}}");
		TokenBuffer buffer(lexer);
		buffer.next();
		CHECK(buffer.line() == 1);
		buffer.next();
		CHECK(buffer.line() == 3);
	}
}

TEST_SUITE("Literals") {
	TEST_CASE("unquote") {
		CHECK(unquote("\"a\\tb\"") == std::optional<std::string>("a\tb"));
		CHECK(unquote("\"\\u00e9\"") == std::optional<std::string>("\xc3\xa9"));
		CHECK(unquote("\"\\x41\\101\"") == std::optional<std::string>("AA"));
		CHECK(unquote("`a\\n`") == std::optional<std::string>("a\\n"));
		CHECK(unquote("`a\r\nb`") == std::optional<std::string>("a\nb"));
		CHECK(!unquote("\"\\q\""));
		CHECK(!unquote("\"abc"));
		CHECK(!unquote("abc"));
	}

	TEST_CASE("unquote_char") {
		CHECK(unquote_char("'a'") == std::optional<char32_t>(U'a'));
		CHECK(unquote_char("'\\n'") == std::optional<char32_t>(U'\n'));
		CHECK(unquote_char("'\xc3\xa9'") == std::optional<char32_t>(0xE9));
		CHECK(!unquote_char("'ab'"));
		CHECK(!unquote_char("''"));
	}

	TEST_CASE("Integers are also floats") {
		auto value = parse_number("42", TokenKind::Number);
		REQUIRE(value);
		CHECK(value->is_int);
		CHECK(value->is_uint);
		CHECK(value->is_float);
		CHECK(value->int_value == 42);
		CHECK(value->uint_value == 42);
		CHECK(value->float_value == doctest::Approx(42.0));
	}

	TEST_CASE("Negative numbers are not unsigned") {
		auto value = parse_number("-7", TokenKind::Number);
		REQUIRE(value);
		CHECK(value->is_int);
		CHECK(!value->is_uint);
		CHECK(value->int_value == -7);
	}

	TEST_CASE("Floats with an integral value") {
		auto exact = parse_number("1e3", TokenKind::Number);
		REQUIRE(exact);
		CHECK(exact->is_float);
		CHECK(exact->is_int);
		CHECK(exact->int_value == 1000);

		auto fraction = parse_number("1.5", TokenKind::Number);
		REQUIRE(fraction);
		CHECK(fraction->is_float);
		CHECK(!fraction->is_int);
		CHECK(!fraction->is_uint);
	}

	TEST_CASE("Bases and separators") {
		CHECK(parse_number("0x1F", TokenKind::Number)->int_value == 31);
		CHECK(parse_number("0b101", TokenKind::Number)->int_value == 5);
		CHECK(parse_number("0o17", TokenKind::Number)->int_value == 15);
		CHECK(parse_number("017", TokenKind::Number)->int_value == 15);
		CHECK(parse_number("1_000", TokenKind::Number)->int_value == 1000);
	}

	TEST_CASE("Character constants are numbers") {
		auto value = parse_number("'a'", TokenKind::CharConstant);
		REQUIRE(value);
		CHECK(value->is_int);
		CHECK(value->int_value == 97);
		CHECK(value->float_value == doctest::Approx(97.0));
	}

	TEST_CASE("Largest unsigned value") {
		auto value = parse_number("18446744073709551615", TokenKind::Number);
		REQUIRE(value);
		CHECK(value->is_uint);
		CHECK(!value->is_int);
		CHECK(value->is_float);
	}

	TEST_CASE("Malformed numbers") {
		std::string message;
		CHECK(!parse_number("99999999999999999999", TokenKind::Number, &message));
		CHECK(message == "integer overflow: \"99999999999999999999\"");
		CHECK(!parse_number("0x", TokenKind::Number, &message));
		CHECK(message == "illegal number syntax: \"0x\"");
		CHECK(!parse_number("1_", TokenKind::Number, &message));
		CHECK(message == "illegal number syntax: \"1_\"");
		CHECK(!parse_number("'ab'", TokenKind::CharConstant, &message));
		CHECK(message == "malformed character constant: 'ab'");
	}
}

TEST_SUITE("Nodes") {
	TEST_CASE("Field and variable paths") {
		FieldNode field(1, 0, ".a.b");
		CHECK(field.get_ident() == std::vector<std::string>{"a", "b"});
		CHECK(field.to_string() == ".a.b");

		VariableNode var(1, 0, "$x.y");
		CHECK(var.get_ident() == std::vector<std::string>{"$x", "y"});
		CHECK(var.get_name() == "$x");
		CHECK(var.to_string() == "$x.y");
	}

	TEST_CASE("Chains render their base and fields") {
		ChainNode chain(1, 0, IdentifierNode(1, 0, "f"));
		chain.add(".x");
		chain.add("y");
		CHECK(chain.get_node().is<IdentifierNode>());
		CHECK(chain.get_fields() == std::vector<std::string>{"x", "y"});
		CHECK(chain.to_string() == "f.x.y");
	}

	TEST_CASE("Parenthesized pipeline arguments") {
		CommandNode inner(1, 1);
		inner.append(IdentifierNode(1, 1, "len"));
		inner.append(FieldNode(1, 5, ".a"));
		PipeNode pipe(1, 1, {});
		pipe.append(std::move(inner));

		CommandNode outer(1, 0);
		outer.append(IdentifierNode(1, 0, "print"));
		outer.append(std::move(pipe));
		CHECK(outer.to_string() == "print (len .a)");
	}

	TEST_CASE("Node reports its kind") {
		Node node = TextNode(3, 7, "hi");
		CHECK(node.is<TextNode>());
		CHECK(node.type() == NodeType::Text);
		CHECK(node.type_name() == "text");
		CHECK(node.tree_id() == 3);
		CHECK(node.pos() == 7);
		CHECK(node.as<TextNode>().get_text() == "hi");
	}

	TEST_CASE("Empty tree detection") {
		ListNode blank(1, 0);
		blank.append(TextNode(1, 0, " \n\t"));
		CHECK(is_empty_tree(blank));
		CHECK(is_empty_tree(ListNode(1, 0)));

		ListNode with_action(1, 0);
		with_action.append(TextNode(1, 0, " "));
		with_action.append(ActionNode(1, 3, PipeNode(1, 3, {})));
		CHECK(!is_empty_tree(with_action));

		ListNode with_text(1, 0);
		with_text.append(TextNode(1, 0, "x"));
		CHECK(!is_empty_tree(with_text));

		Node pipe = PipeNode(1, 0, {});
		CHECK_THROWS_AS(is_empty_tree(pipe), TemplateError);
	}
}
