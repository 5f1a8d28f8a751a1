#include "Lexer.h"
#include "ParseContext.h"
#include "Parser.h"
#include "TemplateError.h"
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include "doctest.h"

using namespace TmplCpp;

// Helper function to read test files from Reference directory
static std::string read_test_file(const std::string& filename) {
	std::ifstream file("tests/Reference/" + filename);
	if (!file.is_open()) {
		throw std::runtime_error("Could not open test file: tests/Reference/" + filename);
	}

	std::stringstream buffer;
	buffer << file.rdbuf();
	return buffer.str();
}

static std::string render_tree(const ParseResult& result, std::string_view name) {
	const Tree* tree = result.find_tree(name);
	REQUIRE(tree != nullptr);
	REQUIRE(tree->get_root().has_value());
	return tree->get_root()->to_string();
}

// Parsing then rendering reproduces the input
static void check_round_trip(std::string_view text, FunctionSet funcs = {}) {
	ParseResult result = parse("foo", text, std::move(funcs));
	INFO(result.error_message());
	REQUIRE(!result.is_error());
	CHECK(render_tree(result, "foo") == text);
}

static std::string parse_error(std::string_view text, FunctionSet funcs = {}) {
	ParseResult result = parse("foo", text, std::move(funcs));
	REQUIRE(result.is_error());
	return result.error_message();
}

TEST_SUITE("Parser") {
	TEST_CASE("Text only") {
		ParseResult result = parse("foo", "hello world");
		REQUIRE(!result.is_error());
		CHECK(result.trees().size() == 1);

		const Tree* tree = result.find_tree("foo");
		REQUIRE(tree != nullptr);
		CHECK(tree->get_name() == "foo");
		CHECK(tree->get_id() == 1);
		const std::vector<Node>& nodes = tree->get_root()->get_nodes();
		REQUIRE(nodes.size() == 1);
		REQUIRE(nodes[0].is<TextNode>());
		CHECK(nodes[0].as<TextNode>().get_text() == "hello world");
	}

	TEST_CASE("Empty input") {
		ParseResult result = parse("foo", "");
		REQUIRE(!result.is_error());
		const Tree* tree = result.find_tree("foo");
		REQUIRE(tree != nullptr);
		CHECK(tree->get_root()->empty());
		CHECK(result.error_message().empty());
	}

	TEST_CASE("Round trips") {
		check_round_trip("{{.a}}");
		check_round_trip("{{if .a}}x{{else}}y{{end}}");
		check_round_trip("{{with .a}}x{{else}}y{{end}}");
		check_round_trip("{{with $x := .a}}{{$x}}{{end}}");
		check_round_trip("{{range $i, $v := .items}}{{$i}}={{$v}}{{end}}");
		check_round_trip("{{$x := .}}{{$x.a.b}}");
		check_round_trip("{{.a | printf \"%d\" | len}}", {"printf", "len"});
		check_round_trip("{{(len .a).b}}", {"len"});
		check_round_trip("{{f.x}}", {"f"});
		check_round_trip("{{template \"x\"}}{{template \"y\" .}}");
		check_round_trip("{{1 2.5 'c' true nil `raw`}}", {});
	}

	TEST_CASE("Else if is a nested if") {
		ParseResult result = parse("foo", "{{if .a}}A{{else if .b}}B{{else}}C{{end}}");
		REQUIRE(!result.is_error());
		CHECK(render_tree(result, "foo") == "{{if .a}}A{{else}}{{if .b}}B{{else}}C{{end}}{{end}}");

		const Node& outer = result.find_tree("foo")->get_root()->get_nodes().front();
		REQUIRE(outer.is<IfNode>());
		const std::optional<ListNode>& else_list = outer.as<IfNode>().get_else_list();
		REQUIRE(else_list);
		REQUIRE(else_list->get_nodes().size() == 1);
		CHECK(else_list->get_nodes().front().is<IfNode>());
	}

	TEST_CASE("Else if only follows if") {
		CHECK(parse_error("{{range .a}}x{{else if .b}}y{{end}}") == "template: foo:1:unexpected <if> in input");
	}

	TEST_CASE("Trim markers and comments") {
		ParseResult trimmed = parse("foo", "a {{- .x -}} b");
		REQUIRE(!trimmed.is_error());
		CHECK(render_tree(trimmed, "foo") == "a{{.x}}b");

		ParseResult commented = parse("foo", "a{{/* hi */}}b");
		REQUIRE(!commented.is_error());
		CHECK(render_tree(commented, "foo") == "ab");
		CHECK(commented.find_tree("foo")->get_root()->get_nodes().size() == 2);
	}

	TEST_CASE("Custom delimiters") {
		ParseContext context;
		context.setName("foo");
		context.setDelims("<<", ">>");
		ParseResult result = parse("<<if .a>>x<<end>>", context);
		REQUIRE(!result.is_error());
		CHECK(render_tree(result, "foo") == "{{if .a}}x{{end}}");
	}

	TEST_CASE("Node positions and tree ids") {
		ParseResult result = parse("foo", "ab{{.x}}");
		REQUIRE(!result.is_error());
		const std::vector<Node>& nodes = result.find_tree("foo")->get_root()->get_nodes();
		REQUIRE(nodes.size() == 2);
		CHECK(nodes[0].pos() == 0);
		CHECK(nodes[1].is<ActionNode>());
		CHECK(nodes[1].pos() == 4);
		CHECK(nodes[1].tree_id() == 1);
	}

	TEST_CASE("Literal operands") {
		ParseResult result = parse("foo", R"({{3.5 "a\tb"}})");
		REQUIRE(!result.is_error());
		const Node& action = result.find_tree("foo")->get_root()->get_nodes().front();
		REQUIRE(action.is<ActionNode>());
		const PipeNode& pipe = action.as<ActionNode>().get_pipe();
		REQUIRE(pipe.get_cmds().size() == 1);
		const std::vector<Node>& args = pipe.get_cmds().front().get_args();
		REQUIRE(args.size() == 2);

		REQUIRE(args[0].is<NumberNode>());
		CHECK(args[0].as<NumberNode>().is_float());
		CHECK(!args[0].as<NumberNode>().is_int());

		REQUIRE(args[1].is<StringNode>());
		CHECK(args[1].as<StringNode>().get_quoted() == R"("a\tb")");
		CHECK(args[1].as<StringNode>().get_text() == "a\tb");
	}

	TEST_CASE("Fields are collected per tree") {
		ParseResult result = parse("foo", "{{.a.b}} {{.c}}{{define \"d\"}}{{.e}}{{end}}");
		REQUIRE(!result.is_error());
		const Tree* foo = result.find_tree("foo");
		REQUIRE(foo != nullptr);
		CHECK(foo->get_fields().count(".a.b") == 1);
		CHECK(foo->get_fields().count(".c") == 1);
		CHECK(foo->get_fields().count(".e") == 0);
		CHECK(result.find_tree("d")->get_fields().count(".e") == 1);
	}
}

TEST_SUITE("Parser variables") {
	TEST_CASE("Declared variables resolve") {
		CHECK(!parse("foo", "{{$x := 1}}{{$x}}").is_error());
		CHECK(!parse("foo", "{{$}}").is_error());
	}

	TEST_CASE("Undefined variable") {
		ParseResult result = parse("foo", "{{$x}}");
		REQUIRE(result.is_error());
		CHECK(result.error().kind == ParseErrorKind::UndefinedVariable);
		CHECK(result.error_message() == "template: foo:1:undefined variable $x");
	}

	TEST_CASE("Control declarations go out of scope at end") {
		CHECK(!parse("foo", "{{if $x := .a}}{{$x}}{{end}}").is_error());
		CHECK(parse_error("{{if $x := .a}}{{$x}}{{end}}{{$x}}") == "template: foo:1:undefined variable $x");
	}

	TEST_CASE("Defined templates do not see outer variables") {
		CHECK(parse_error("{{$x := 1}}{{define \"d\"}}{{$x}}{{end}}") == "template: d:1:undefined variable $x");
	}

	TEST_CASE("Range declares two variables") {
		ParseResult result = parse("foo", "{{range $i, $v := .}}{{$i}}{{$v}}{{end}}");
		REQUIRE(!result.is_error());
		const Node& range = result.find_tree("foo")->get_root()->get_nodes().front();
		REQUIRE(range.is<RangeNode>());
		const std::vector<VariableNode>& decl = range.as<RangeNode>().get_pipe().get_decl();
		REQUIRE(decl.size() == 2);
		CHECK(decl[0].get_name() == "$i");
		CHECK(decl[1].get_name() == "$v");
	}

	TEST_CASE("Too many declarations") {
		CHECK(parse_error("{{range $i, $j, $k := .}}{{end}}") == "template: foo:1:too many declarations in range");
		CHECK(parse_error("{{if $a, $b := .}}{{end}}") == "template: foo:1:too many declarations in if");
		CHECK(parse_error("{{with $a, $b := .}}{{end}}") == "template: foo:1:too many declarations in with");
		CHECK(parse_error("{{$a, $b := .}}") == "template: foo:1:too many declarations in command");
	}

	TEST_CASE("Range declarations must be variables") {
		ParseResult result = parse("foo", "{{range $i, 3 := .}}{{end}}");
		REQUIRE(result.is_error());
		CHECK(result.error().kind == ParseErrorKind::RangeDeclaration);
		CHECK(result.error_message() == "template: foo:1:range can only initialize variables");
	}
}

TEST_SUITE("Parser templates") {
	TEST_CASE("Define and template") {
		ParseResult result = parse("foo",
			"{{define \"T1\"}}ONE{{end}}{{define \"T2\"}}TWO {{template \"T1\"}}{{end}}{{template \"T2\"}}");
		REQUIRE(!result.is_error());
		CHECK(result.trees().size() == 3);
		CHECK(render_tree(result, "T1") == "ONE");
		CHECK(render_tree(result, "T2") == "TWO {{template \"T1\"}}");
		CHECK(render_tree(result, "foo") == "{{template \"T2\"}}");
		CHECK(result.find_tree("T1")->get_id() == 2);
		CHECK(result.find_tree("T2")->get_id() == 2);
	}

	TEST_CASE("Block defines a tree and invokes it") {
		ParseResult result = parse("foo", "a{{block \"inner\" .}}b{{end}}c");
		REQUIRE(!result.is_error());
		CHECK(render_tree(result, "foo") == "a{{template \"inner\" .}}c");
		CHECK(render_tree(result, "inner") == "b");
		CHECK(result.find_tree("inner")->get_id() == 2);
	}

	TEST_CASE("Blocks get fresh ids") {
		ParseResult result = parse("foo", "{{define \"a\"}}{{block \"b\" .}}x{{end}}{{end}}");
		REQUIRE(!result.is_error());
		CHECK(result.find_tree("foo")->get_id() == 1);
		CHECK(result.find_tree("a")->get_id() == 2);
		CHECK(result.find_tree("b")->get_id() == 3);
	}

	TEST_CASE("Multiple definitions") {
		ParseResult result = parse("foo", "{{define \"a\"}}x{{end}}{{define \"a\"}}y{{end}}");
		REQUIRE(result.is_error());
		CHECK(result.error().kind == ParseErrorKind::MultipleDefinitions);
		CHECK(result.error_message() == "template: a:1:multiple definitions of template a");
	}

	TEST_CASE("Empty definitions may be replaced") {
		ParseResult result = parse("foo", "{{define \"a\"}} {{end}}{{define \"a\"}}y{{end}}");
		REQUIRE(!result.is_error());
		CHECK(render_tree(result, "a") == "y");
	}

	TEST_CASE("Template names must be strings") {
		CHECK(parse_error("{{template .x}}") == "template: foo:1:unexpected \".x\" in template clause");
	}

	TEST_CASE("Dynamic template names") {
		CHECK(parse_error("{{template (.name) .}}") == "template: foo:1:dynamic template names are not enabled");

		ParseContext context;
		context.setName("foo");
		context.setDynamicTemplateEnabled(true);
		ParseResult result = parse("{{template (.name) .}}", context);
		REQUIRE(!result.is_error());
		CHECK(render_tree(result, "foo") == "{{template (.name) .}}");

		const Node& node = result.find_tree("foo")->get_root()->get_nodes().front();
		REQUIRE(node.is<TemplateNode>());
		CHECK(node.as<TemplateNode>().is_dynamic());
	}

	TEST_CASE("Reference template") {
		FunctionSet funcs{"printf"};
		ParseResult result = parse("layout.tmpl", read_test_file("layout.tmpl"), funcs);
		INFO(result.error_message());
		REQUIRE(!result.is_error());
		CHECK(result.trees().size() == 4);

		CHECK(render_tree(result, "header") == "<h1>{{.Title}}</h1>");
		CHECK(render_tree(result, "item") == "<li>{{.Name | printf \"%s\"}}</li>");
		CHECK(render_tree(result, "footer") == "<p>{{.Year}}</p>");

		std::string page = render_tree(result, "layout.tmpl");
		CHECK(page.find("{{range $i, $item := .Items}}") != std::string::npos);
		CHECK(page.find("{{template \"footer\" .}}") != std::string::npos);
		CHECK(page.find("page body") == std::string::npos);

		CHECK(result.find_tree("layout.tmpl")->get_fields().count(".Items") == 1);
		CHECK(result.find_tree("header")->get_id() == 2);
		CHECK(result.find_tree("footer")->get_id() == 3);
	}

	TEST_CASE("Reference template with a duplicate definition") {
		ParseResult result = parse("bad_define.tmpl", read_test_file("bad_define.tmpl"));
		REQUIRE(result.is_error());
		CHECK(result.error_message() == "template: row:6:multiple definitions of template row");
	}
}

TEST_SUITE("Parser errors") {
	TEST_CASE("Undefined function") {
		ParseResult result = parse("foo", "{{ if eq .foo \"bar\" }}");
		REQUIRE(result.is_error());
		CHECK(result.error().kind == ParseErrorKind::UndefinedFunction);
		CHECK(result.error().tree_name == "foo");
		CHECK(result.error().line == 1);
		CHECK(result.error_message() == "template: foo:1:function eq not defined");
	}

	TEST_CASE("Known function") {
		ParseResult result = parse("foo", "{{ if eq .foo \"bar\" }}yes{{ end }}", {"eq"});
		REQUIRE(!result.is_error());
		CHECK(render_tree(result, "foo") == "{{if eq .foo \"bar\"}}yes{{end}}");
	}

	TEST_CASE("Error line is the line of the offending token") {
		CHECK(parse_error("line1\n{{.a}}\n{{nope}}") == "template: foo:3:function nope not defined");
	}

	TEST_CASE("Missing values") {
		CHECK(parse_error("{{if}}{{end}}") == "template: foo:1:missing value for if");
		CHECK(parse_error("{{}}") == "template: foo:1:missing value for command");
	}

	TEST_CASE("Later pipeline stages must be executable") {
		ParseResult result = parse("foo", "{{.a | 3}}");
		REQUIRE(result.is_error());
		CHECK(result.error().kind == ParseErrorKind::NonExecutableCommand);
		CHECK(result.error_message() == "template: foo:1:non executable command in pipeline stage 2");
	}

	TEST_CASE("Stray end and else") {
		CHECK(parse_error("{{end}}") == "template: foo:1:unexpected {{end}}");
		CHECK(parse_error("{{else}}") == "template: foo:1:unexpected {{else}}");
	}

	TEST_CASE("Unterminated control") {
		CHECK(parse_error("{{if .a}}x") == "template: foo:1:unexpected EOF");
	}

	TEST_CASE("Lexical errors surface with the tree name") {
		ParseResult result = parse("foo", "{{(1}}");
		REQUIRE(result.is_error());
		CHECK(result.error().kind == ParseErrorKind::LexError);
		CHECK(result.error_message() == "template: foo:1:unclosed left paren");

		CHECK(parse_error("{{\"abc") == "template: foo:1:unterminated quoted string");
	}

	TEST_CASE("Field access on a literal") {
		CHECK(parse_error("{{true.a}}") == "template: foo:1:unexpected . after term \"true\"");
	}

	TEST_CASE("Malformed number") {
		ParseResult result = parse("foo", "{{0x}}");
		REQUIRE(result.is_error());
		CHECK(result.error().kind == ParseErrorKind::MalformedLiteral);
		CHECK(result.error_message() == "template: foo:1:illegal number syntax: \"0x\"");
	}

	TEST_CASE("Parser keeps the last error") {
		Lexer lexer("{{$x}}");
		ParseContext context;
		context.setName("direct");
		Parser parser(lexer, context);
		ParseResult result = parser.parse();
		REQUIRE(result.is_error());
		CHECK(parser.get_last_error() == "template: direct:1:undefined variable $x");
	}
}
