#include "Parser.h"

#include <format>

#include "Log.h"

namespace TmplCpp {

// Items up to the next {{end}} or {{else}}, which is returned alongside
std::pair<ListNode, Node> Parser::item_list() {
	Pos pos = peek_non_space_must("item list"sv).pos();
	ListNode list(tree_id_, pos);
	for (;;) {
		Token peeked = peek_non_space_must("item list"sv);
		if (peeked.is(TokenKind::EndOfFile)) {
			break;
		}
		Node node = text_or_action();
		if (node.is<EndNode>() || node.is<ElseNode>()) {
			return {std::move(list), std::move(node)};
		}
		list.append(std::move(node));
	}
	error(ParseErrorKind::UnexpectedEnd, "unexpected EOF");
}

Node Parser::text_or_action() {
	std::optional<Token> token = tokens_.next_non_space();
	if (!token) {
		error(ParseErrorKind::UnexpectedEnd, "unexpected end of input");
	}
	switch (token->kind()) {
	case TokenKind::Text:
		return TextNode(tree_id_, token->pos(), token->value());
	case TokenKind::LeftDelim:
		return action();
	default:
		unexpected(*token, "input"sv);
	}
}

// First token after the left delimiter decides what kind of action follows
Node Parser::action() {
	Token token = next_non_space_must("command"sv);
	switch (token.kind()) {
	case TokenKind::Block:
		return block_control();
	case TokenKind::Else:
		return else_control();
	case TokenKind::End:
		return end_control();
	case TokenKind::If:
		return if_control();
	case TokenKind::Range:
		return range_control();
	case TokenKind::Template:
		return template_control();
	case TokenKind::With:
		return with_control();
	default:
		break;
	}
	Pos pos = token.pos();
	tokens_.backup(std::move(token));
	return ActionNode(tree_id_, pos, pipeline("command"sv));
}

Parser::ControlParts Parser::parse_control(bool allow_else_if, std::string_view context) {
	// Variables declared in the control pipeline or body go out of scope at {{end}}
	ScopeGuard restore_vars([this, saved = var_count()]() { truncate_vars(saved); });

	PipeNode pipe = pipeline(context);
	Pos pos = pipe.pos();
	auto [list, next] = item_list();

	std::optional<ListNode> else_list;
	if (next.is<ElseNode>()) {
		if (allow_else_if && peek_non_space_must("else if"sv).is(TokenKind::If)) {
			// {{else if ...}} is shorthand for {{else}}{{if ...}}...{{end}}{{end}},
			// so the nested if consumes the shared {{end}}
			next_non_space_must("else if"sv);
			else_list.emplace(tree_id_, next.pos());
			else_list->append(if_control());
		} else {
			auto [nested_list, nested_next] = item_list();
			if (!nested_next.is<EndNode>()) {
				error(ParseErrorKind::UnexpectedToken, std::format("expected end; found {}", nested_next.to_string()));
			}
			else_list = std::move(nested_list);
		}
	}
	return ControlParts{pos, std::move(pipe), std::move(list), std::move(else_list)};
}

Node Parser::if_control() {
	ControlParts parts = parse_control(true, "if"sv);
	return IfNode(tree_id_, parts.pos, std::move(parts.pipe), std::move(parts.list), std::move(parts.else_list));
}

Node Parser::range_control() {
	ControlParts parts = parse_control(false, "range"sv);
	return RangeNode(tree_id_, parts.pos, std::move(parts.pipe), std::move(parts.list), std::move(parts.else_list));
}

Node Parser::with_control() {
	ControlParts parts = parse_control(false, "with"sv);
	return WithNode(tree_id_, parts.pos, std::move(parts.pipe), std::move(parts.list), std::move(parts.else_list));
}

Node Parser::end_control() {
	Token token = expect(TokenKind::RightDelim, "end"sv);
	return EndNode(tree_id_, token.pos());
}

Node Parser::else_control() {
	// {{else if}} leaves the if for parse_control to pick up
	Token peeked = peek_non_space_must("else"sv);
	if (peeked.is(TokenKind::If)) {
		return ElseNode(tree_id_, peeked.pos());
	}
	Token token = expect(TokenKind::RightDelim, "else"sv);
	return ElseNode(tree_id_, token.pos());
}

// {{block "name" pipeline}} defines a template and executes it in place
Node Parser::block_control() {
	constexpr std::string_view context = "block clause"sv;
	Token token = next_non_space_must(context);
	std::string name = parse_template_name(token, context);
	PipeNode pipe = pipeline(context);

	TreeId id = ++max_tree_id_;
	start_parse(name, id);
	auto [root, end] = item_list();
	if (!end.is<EndNode>()) {
		error(ParseErrorKind::UnexpectedToken, std::format("unexpected {} in {}", end.to_string(), context));
	}
	active_tree().set_root(std::move(root));
	stop_parse();

	std::optional<PipeNode> template_pipe;
	template_pipe.emplace(std::move(pipe));
	return TemplateNode(tree_id_, token.pos(), std::move(name), std::move(template_pipe));
}

Node Parser::template_control() {
	constexpr std::string_view context = "template clause"sv;
	std::optional<Token> token = tokens_.next_non_space();
	if (!token) {
		error(ParseErrorKind::UnexpectedEnd, std::format("unexpected end in {}", context));
	}

	TemplateNode::Name name;
	if (token->is(TokenKind::LeftParen)) {
		if (!context_.isDynamicTemplateEnabled()) {
			error(ParseErrorKind::DynamicTemplateUnsupported, "dynamic template names are not enabled");
		}
		PipeNode name_pipe = pipeline(context);
		next_must("template name pipeline end"sv);
		name = std::move(name_pipe);
	} else {
		name = parse_template_name(*token, context);
	}

	std::optional<Token> next = tokens_.next_non_space();
	if (!next) {
		error(ParseErrorKind::UnexpectedEnd, std::format("unexpected end in {}", context));
	}
	std::optional<PipeNode> pipe;
	if (!next->is(TokenKind::RightDelim)) {
		tokens_.backup(std::move(*next));
		pipe.emplace(pipeline(context));
	}
	TMPL_LOG_FORMAT(Parser, Debug, "template invocation at {}", token->pos());
	return TemplateNode(tree_id_, token->pos(), std::move(name), std::move(pipe));
}

} // namespace TmplCpp
