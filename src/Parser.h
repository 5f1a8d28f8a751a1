#pragma once

#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "AstNodeTypes.h"
#include "Lexer.h"
#include "ParseContext.h"
#include "TemplateError.h"
#include "Token.h"
#include "TokenBuffer.h"

using namespace std::literals::string_view_literals;

namespace TmplCpp {

// RAII helper to execute a cleanup function on scope exit
// Usage: ScopeGuard guard([&]() { cleanup(); });
template<typename Func>
class ScopeGuard {
public:
	explicit ScopeGuard(Func&& cleanup) : cleanup_(std::forward<Func>(cleanup)) {}
	~ScopeGuard() { cleanup_(); }

	ScopeGuard(const ScopeGuard&) = delete;
	ScopeGuard& operator=(const ScopeGuard&) = delete;

private:
	Func cleanup_;
};

template<typename Func>
ScopeGuard(Func) -> ScopeGuard<Func>;

// One named template: its parsed body plus the variables in scope while
// parsing and every field path referenced in it.
class Tree {
public:
	Tree(std::string name, TreeId id) : name_(std::move(name)), id_(id) {}

	const std::string& get_name() const { return name_; }
	TreeId get_id() const { return id_; }

	const std::optional<ListNode>& get_root() const { return root_; }
	void set_root(ListNode root) { root_ = std::move(root); }

	// Field paths in source form, e.g. ".a.b"
	const std::set<std::string>& get_fields() const { return fields_; }
	void add_field(std::string_view field) { fields_.emplace(field); }

	const std::vector<std::string>& get_vars() const { return vars_; }
	void add_var(std::string_view name) { vars_.emplace_back(name); }
	bool has_var(std::string_view name) const;
	// Drop variables declared after the first n
	void truncate_vars(size_t n);

private:
	std::string name_;
	TreeId id_;
	std::optional<ListNode> root_;
	std::vector<std::string> vars_;
	std::set<std::string> fields_;
};

// Every tree produced by one parse, keyed by template name
using TreeSet = std::map<std::string, Tree, std::less<>>;

class ParseResult {
public:
	ParseResult(TreeSet trees) : value_or_error_(std::move(trees)) {}
	ParseResult(ParseError error) : value_or_error_(std::move(error)) {}

	bool is_error() const {
		return std::holds_alternative<ParseError>(value_or_error_);
	}

	const ParseError& error() const {
		static const ParseError empty;
		return is_error() ? std::get<ParseError>(value_or_error_) : empty;
	}

	// template: <tree>:<line>:<message>, or empty on success
	std::string error_message() const {
		return is_error() ? error().to_string() : std::string();
	}

	const TreeSet& trees() const {
		static const TreeSet empty;
		return is_error() ? empty : std::get<TreeSet>(value_or_error_);
	}

	TreeSet& trees() {
		return std::get<TreeSet>(value_or_error_);
	}

	const Tree* find_tree(std::string_view name) const {
		const TreeSet& set = trees();
		auto it = set.find(name);
		return it == set.end() ? nullptr : &it->second;
	}

private:
	std::variant<TreeSet, ParseError> value_or_error_;
};

class Parser {
public:
	explicit Parser(Lexer& lexer, const ParseContext& context);

	// Parse the whole input into the named top-level tree plus every
	// define/block tree found along the way
	ParseResult parse();

	std::string get_last_error() const { return last_error_; }

private:
	// Parser_Core.cpp: token access, tree stack and registry, diagnostics
	Token next_must(std::string_view context);
	Token next_non_space_must(std::string_view context);
	Token peek_non_space_must(std::string_view context);
	Token expect(TokenKind kind, std::string_view context);

	Tree& active_tree();
	void start_parse(std::string name, TreeId id);
	void stop_parse();
	void add_to_tree_set();
	void add_var(std::string_view name);
	void truncate_vars(size_t n);
	size_t var_count();

	[[noreturn]] void error(ParseErrorKind kind, std::string message) const;
	[[noreturn]] void unexpected(const Token& token, std::string_view context) const;

	void parse_tree();
	void parse_top_level();
	void parse_definition();
	std::string parse_template_name(const Token& token, std::string_view context);

	// Parser_Control.cpp: lists, actions and control structures
	struct ControlParts {
		Pos pos;
		PipeNode pipe;
		ListNode list;
		std::optional<ListNode> else_list;
	};

	std::pair<ListNode, Node> item_list();
	Node text_or_action();
	Node action();
	ControlParts parse_control(bool allow_else_if, std::string_view context);
	Node if_control();
	Node range_control();
	Node with_control();
	Node end_control();
	Node else_control();
	Node block_control();
	Node template_control();

	// Parser_Pipeline.cpp: pipelines, commands and operands
	PipeNode pipeline(std::string_view context);
	void check_pipeline(const PipeNode& pipe, std::string_view context);
	CommandNode command();
	std::optional<Node> operand();
	std::optional<Node> term();
	VariableNode use_var(Pos pos, std::string_view name);

	TokenBuffer tokens_;
	const ParseContext& context_;
	TreeSet tree_set_;
	std::optional<Tree> tree_;
	std::vector<Tree> tree_stack_;
	TreeId tree_id_ = 0;
	TreeId max_tree_id_ = 0;
	std::string last_error_;
};

// Parse text as the template called name, with funcs as the set of
// function names that may be called from actions
ParseResult parse(std::string_view name, std::string_view text, FunctionSet funcs = {});

// Same, with delimiters and optional features taken from context
ParseResult parse(std::string_view text, const ParseContext& context);

} // namespace TmplCpp
