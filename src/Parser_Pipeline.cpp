#include "Parser.h"

#include <format>

#include "Log.h"

namespace TmplCpp {

// [$v :=] or, for range, [$k, $v :=] followed by commands separated by |
PipeNode Parser::pipeline(std::string_view context) {
	std::vector<VariableNode> decl;
	Token token = next_non_space_must("pipeline"sv);
	Pos pos = token.pos();

	if (token.is(TokenKind::Variable)) {
		while (token.is(TokenKind::Variable)) {
			Token token_after_var = next_must("variable"sv);
			Token next;
			if (token_after_var.is(TokenKind::Space)) {
				next = next_non_space_must("variable"sv);
				if (!next.is(TokenKind::ColonEquals) && !next.is(TokenKind::Comma)) {
					// Not a declaration; the variable starts the first command
					tokens_.backup3(std::move(token), std::move(token_after_var), std::move(next));
					break;
				}
			} else {
				next = std::move(token_after_var);
			}

			if (!next.is(TokenKind::ColonEquals) && !next.is(TokenKind::Comma)) {
				tokens_.backup2(std::move(token), std::move(next));
				break;
			}

			decl.emplace_back(tree_id_, token.pos(), token.value());
			add_var(token.value());
			if (next.is(TokenKind::Comma)) {
				if (context == "range"sv && decl.size() < 2) {
					Token following = peek_non_space_must("variable"sv);
					if (!following.is(TokenKind::Variable)) {
						error(ParseErrorKind::RangeDeclaration, "range can only initialize variables");
					}
					token = next_non_space_must("variable"sv);
					continue;
				}
				error(ParseErrorKind::TooManyDeclarations, std::format("too many declarations in {}", context));
			}
			break;
		}
	} else {
		tokens_.backup(std::move(token));
	}

	PipeNode pipe(tree_id_, pos, std::move(decl));
	for (;;) {
		Token next = next_non_space_must("pipeline"sv);
		switch (next.kind()) {
		case TokenKind::RightDelim:
		case TokenKind::RightParen:
			check_pipeline(pipe, context);
			if (next.is(TokenKind::RightParen)) {
				tokens_.backup(std::move(next));
			}
			return pipe;
		case TokenKind::Bool:
		case TokenKind::CharConstant:
		case TokenKind::Dot:
		case TokenKind::Field:
		case TokenKind::Identifier:
		case TokenKind::Number:
		case TokenKind::Nil:
		case TokenKind::RawString:
		case TokenKind::String:
		case TokenKind::Variable:
		case TokenKind::LeftParen:
			tokens_.backup(std::move(next));
			pipe.append(command());
			break;
		default:
			unexpected(next, context);
		}
	}
}

void Parser::check_pipeline(const PipeNode& pipe, std::string_view context) {
	const std::vector<CommandNode>& cmds = pipe.get_cmds();
	if (cmds.empty()) {
		error(ParseErrorKind::MissingValue, std::format("missing value for {}", context));
	}
	// Only the first command may be a plain value; later stages receive input
	for (size_t i = 1; i < cmds.size(); ++i) {
		const std::vector<Node>& args = cmds[i].get_args();
		if (args.empty()) {
			continue;
		}
		switch (args.front().type()) {
		case NodeType::Bool:
		case NodeType::Dot:
		case NodeType::Nil:
		case NodeType::Number:
		case NodeType::String:
			error(ParseErrorKind::NonExecutableCommand,
				std::format("non executable command in pipeline stage {}", i + 1));
		default:
			break;
		}
	}
}

// Space-separated operands up to |, a right delimiter or a right paren
CommandNode Parser::command() {
	CommandNode cmd(tree_id_, peek_non_space_must("command"sv).pos());
	for (;;) {
		peek_non_space_must("operand"sv);
		if (std::optional<Node> node = operand()) {
			cmd.append(std::move(*node));
		}
		Token token = next_must("command"sv);
		switch (token.kind()) {
		case TokenKind::Space:
			continue;
		case TokenKind::Error:
			error(ParseErrorKind::LexError, std::string(token.value()));
		case TokenKind::RightDelim:
		case TokenKind::RightParen:
			tokens_.backup(std::move(token));
			break;
		case TokenKind::Pipe:
			break;
		default:
			error(ParseErrorKind::UnexpectedToken, std::format("unexpected {} in operand", token.to_string()));
		}
		break;
	}
	if (cmd.get_args().empty()) {
		error(ParseErrorKind::EmptyCommand, "empty command");
	}
	return cmd;
}

// A term, possibly followed by .Field accesses
std::optional<Node> Parser::operand() {
	std::optional<Node> node = term();
	if (!node) {
		return std::nullopt;
	}
	std::optional<Token> next = tokens_.next();
	if (!next) {
		error(ParseErrorKind::UnexpectedEnd, "unexpected end in operand");
	}
	if (!next->is(TokenKind::Field)) {
		tokens_.backup(std::move(*next));
		return node;
	}

	switch (node->type()) {
	case NodeType::Bool:
	case NodeType::String:
	case NodeType::Number:
	case NodeType::Nil:
	case NodeType::Dot:
		error(ParseErrorKind::UnexpectedToken, std::format("unexpected . after term \"{}\"", node->to_string()));
	default:
		break;
	}

	NodeType base_type = node->type();
	ChainNode chain(tree_id_, next->pos(), std::move(*node));
	chain.add(next->value());
	for (;;) {
		std::optional<Token> peeked = tokens_.peek();
		if (!peeked || !peeked->is(TokenKind::Field)) {
			break;
		}
		Token field = next_must("operand"sv);
		chain.add(field.value());
	}

	// Chains on fields and variables collapse back into a longer path
	switch (base_type) {
	case NodeType::Field: {
		std::string path = chain.to_string();
		active_tree().add_field(path);
		return FieldNode(tree_id_, chain.pos(), path);
	}
	case NodeType::Variable:
		return VariableNode(tree_id_, chain.pos(), chain.to_string());
	default:
		return Node(std::move(chain));
	}
}

std::optional<Node> Parser::term() {
	Token token = next_non_space_must("token"sv);
	switch (token.kind()) {
	case TokenKind::Error:
		error(ParseErrorKind::LexError, std::string(token.value()));
	case TokenKind::Identifier:
		if (!context_.hasFunction(token.value())) {
			error(ParseErrorKind::UndefinedFunction, std::format("function {} not defined", token.value()));
		}
		return IdentifierNode(tree_id_, token.pos(), token.value());
	case TokenKind::Dot:
		return DotNode(tree_id_, token.pos());
	case TokenKind::Nil:
		return NilNode(tree_id_, token.pos());
	case TokenKind::Variable:
		return use_var(token.pos(), token.value());
	case TokenKind::Field:
		active_tree().add_field(token.value());
		return FieldNode(tree_id_, token.pos(), token.value());
	case TokenKind::Bool:
		return BoolNode(tree_id_, token.pos(), token.value() == "true"sv);
	case TokenKind::CharConstant:
	case TokenKind::Number: {
		std::string message;
		std::optional<NumberValue> number = parse_number(token.value(), token.kind(), &message);
		if (!number) {
			error(ParseErrorKind::MalformedLiteral, std::move(message));
		}
		return NumberNode(tree_id_, token.pos(), token.value(), *number);
	}
	case TokenKind::LeftParen: {
		PipeNode pipe = pipeline("parenthesized pipeline"sv);
		Token next = next_must("parenthesized pipeline"sv);
		if (!next.is(TokenKind::RightParen)) {
			error(ParseErrorKind::UnclosedParen, std::format("unclosed right paren: unexpected {}", next.to_string()));
		}
		return Node(std::move(pipe));
	}
	case TokenKind::String:
	case TokenKind::RawString: {
		std::optional<std::string> text = unquote(token.value());
		if (!text) {
			error(ParseErrorKind::MalformedLiteral, std::format("unable to unquote string: {}", token.value()));
		}
		return StringNode(tree_id_, token.pos(), token.value(), std::move(*text));
	}
	default:
		tokens_.backup(std::move(token));
		return std::nullopt;
	}
}

// $ always resolves; anything else must be declared in an enclosing scope
VariableNode Parser::use_var(Pos pos, std::string_view name) {
	if (name == "$"sv) {
		return VariableNode(tree_id_, pos, name);
	}
	std::string_view base = name.substr(0, name.find('.'));
	if (!active_tree().has_var(base)) {
		error(ParseErrorKind::UndefinedVariable, std::format("undefined variable {}", name));
	}
	return VariableNode(tree_id_, pos, name);
}

} // namespace TmplCpp
