#include "Parser.h"

#include <algorithm>
#include <format>

#include "Log.h"

namespace TmplCpp {

bool Tree::has_var(std::string_view name) const {
	return std::find(vars_.begin(), vars_.end(), name) != vars_.end();
}

void Tree::truncate_vars(size_t n) {
	if (n < vars_.size()) {
		vars_.resize(n);
	}
}

Parser::Parser(Lexer& lexer, const ParseContext& context)
	: tokens_(lexer), context_(context) {
}

ParseResult Parser::parse() {
	try {
		parse_tree();
	} catch (const TemplateError& e) {
		last_error_ = e.what();
		TMPL_LOG_FORMAT(Parser, Debug, "parse failed: {}", last_error_);
		return ParseResult(e.error());
	}
	return ParseResult(std::move(tree_set_));
}

// ---------------------------------------------------------------------------
// Token access
// ---------------------------------------------------------------------------

Token Parser::next_must(std::string_view context) {
	std::optional<Token> token = tokens_.next();
	if (!token) {
		error(ParseErrorKind::UnexpectedEnd, std::format("unexpected end in {}", context));
	}
	return std::move(*token);
}

Token Parser::next_non_space_must(std::string_view context) {
	std::optional<Token> token = tokens_.next_non_space();
	if (!token) {
		error(ParseErrorKind::UnexpectedEnd, std::format("unexpected end in {}", context));
	}
	return std::move(*token);
}

Token Parser::peek_non_space_must(std::string_view context) {
	std::optional<Token> token = tokens_.peek_non_space();
	if (!token) {
		error(ParseErrorKind::UnexpectedEnd, std::format("unexpected end in {}", context));
	}
	return std::move(*token);
}

Token Parser::expect(TokenKind kind, std::string_view context) {
	Token token = next_non_space_must(context);
	if (!token.is(kind)) {
		unexpected(token, context);
	}
	return token;
}

// ---------------------------------------------------------------------------
// Tree stack and registry
// ---------------------------------------------------------------------------

Tree& Parser::active_tree() {
	if (!tree_) {
		error(ParseErrorKind::NoTree, "no tree");
	}
	return *tree_;
}

void Parser::start_parse(std::string name, TreeId id) {
	if (tree_) {
		tree_stack_.push_back(std::move(*tree_));
	}
	TMPL_LOG_FORMAT(Registry, Debug, "start tree {} (id {}), depth {}", name, id, tree_stack_.size());
	tree_.emplace(std::move(name), id);
	tree_id_ = id;
	max_tree_id_ = std::max(max_tree_id_, id);
}

void Parser::stop_parse() {
	add_to_tree_set();
	if (!tree_stack_.empty()) {
		tree_.emplace(std::move(tree_stack_.back()));
		tree_stack_.pop_back();
		tree_id_ = tree_->get_id();
	} else {
		tree_.reset();
		tree_id_ = 0;
	}
}

void Parser::add_to_tree_set() {
	Tree& tree = active_tree();
	auto existing = tree_set_.find(tree.get_name());
	if (existing != tree_set_.end()) {
		const std::optional<ListNode>& root = existing->second.get_root();
		if (root && !is_empty_tree(*root)) {
			error(ParseErrorKind::MultipleDefinitions,
				std::format("multiple definitions of template {}", tree.get_name()));
		}
	}
	TMPL_LOG_FORMAT(Registry, Debug, "register tree {} (id {})", tree.get_name(), tree.get_id());
	std::string name = tree.get_name();
	tree_set_.insert_or_assign(std::move(name), std::move(tree));
	tree_.reset();
}

void Parser::add_var(std::string_view name) {
	TMPL_LOG_FORMAT(Scope, Trace, "declare {}", name);
	active_tree().add_var(name);
}

void Parser::truncate_vars(size_t n) {
	// Also runs during unwinding, so must not throw
	if (tree_) {
		TMPL_LOG_FORMAT(Scope, Trace, "truncate scope to {} vars", n);
		tree_->truncate_vars(n);
	}
}

size_t Parser::var_count() {
	return active_tree().get_vars().size();
}

// ---------------------------------------------------------------------------
// Diagnostics
// ---------------------------------------------------------------------------

void Parser::error(ParseErrorKind kind, std::string message) const {
	// Attribute the error to the innermost tree being parsed
	std::string tree_name = tree_ ? tree_->get_name() : context_.getName();
	throw TemplateError(ParseError{kind, std::move(tree_name), tokens_.line(), std::move(message)});
}

void Parser::unexpected(const Token& token, std::string_view context) const {
	if (token.is(TokenKind::Error)) {
		error(ParseErrorKind::LexError, std::string(token.value()));
	}
	error(ParseErrorKind::UnexpectedToken, std::format("unexpected {} in {}", token.to_string(), context));
}

// ---------------------------------------------------------------------------
// Top level
// ---------------------------------------------------------------------------

void Parser::parse_tree() {
	start_parse(context_.getName(), 1);
	parse_top_level();
	stop_parse();
}

void Parser::parse_top_level() {
	if (!tree_) {
		error(ParseErrorKind::NoTree, "no tree");
	}
	TreeId id = tree_id_;

	std::optional<Token> token = tokens_.next();
	if (!token) {
		error(ParseErrorKind::UnexpectedEnd, std::format("unable to peek for tree {}", id));
	}
	ListNode root(id, token->pos());

	while (!token->is(TokenKind::EndOfFile)) {
		if (token->is(TokenKind::LeftDelim)) {
			std::optional<Token> keyword = tokens_.next_non_space();
			if (keyword && keyword->is(TokenKind::Define)) {
				parse_definition();
				token = tokens_.next();
				if (!token) {
					error(ParseErrorKind::UnexpectedEnd, std::format("unable to peek for tree {}", id));
				}
				continue;
			}
			if (keyword) {
				tokens_.backup2(std::move(*token), std::move(*keyword));
			} else {
				tokens_.backup(std::move(*token));
			}
		} else {
			tokens_.backup(std::move(*token));
		}

		Node node = text_or_action();
		if (node.is<EndNode>() || node.is<ElseNode>()) {
			error(ParseErrorKind::UnexpectedToken, "unexpected " + node.to_string());
		}
		root.append(std::move(node));

		token = tokens_.next();
		if (!token) {
			error(ParseErrorKind::UnexpectedEnd, std::format("unable to peek for tree {}", id));
		}
	}
	tokens_.backup(std::move(*token));
	active_tree().set_root(std::move(root));
}

void Parser::parse_definition() {
	constexpr std::string_view context = "define clause"sv;
	TreeId id = tree_id_;
	Token token = next_non_space_must(context);
	std::string name = parse_template_name(token, context);
	expect(TokenKind::RightDelim, "define end"sv);

	start_parse(std::move(name), id + 1);
	auto [list, end] = item_list();
	if (!end.is<EndNode>()) {
		error(ParseErrorKind::UnexpectedToken, std::format("unexpected {} in {}", end.to_string(), context));
	}
	active_tree().set_root(std::move(list));
	stop_parse();
}

std::string Parser::parse_template_name(const Token& token, std::string_view context) {
	if (!token.is(TokenKind::String) && !token.is(TokenKind::RawString)) {
		unexpected(token, context);
	}
	std::optional<std::string> name = unquote(token.value());
	if (!name) {
		error(ParseErrorKind::MalformedLiteral, std::format("unable to unquote string: {}", token.value()));
	}
	return std::move(*name);
}

ParseResult parse(std::string_view name, std::string_view text, FunctionSet funcs) {
	ParseContext context;
	context.setName(name);
	context.setFunctions(std::move(funcs));
	return parse(text, context);
}

ParseResult parse(std::string_view text, const ParseContext& context) {
	Lexer lexer(text, context.getLeftDelim(), context.getRightDelim());
	Parser parser(lexer, context);
	return parser.parse();
}

} // namespace TmplCpp
