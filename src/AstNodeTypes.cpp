#include "AstNodeTypes.h"

#include "TemplateError.h"

namespace TmplCpp {

namespace {

std::vector<std::string> split_on_dot(std::string_view ident) {
	std::vector<std::string> parts;
	size_t start = 0;
	for (;;) {
		size_t dot = ident.find('.', start);
		if (dot == std::string_view::npos) {
			parts.emplace_back(ident.substr(start));
			return parts;
		}
		parts.emplace_back(ident.substr(start, dot - start));
		start = dot + 1;
	}
}

// Double-quoted form of a template name as it would be written in source
std::string quote_string(std::string_view text) {
	static constexpr char kHex[] = "0123456789abcdef";
	std::string result = "\"";
	for (char c : text) {
		unsigned char uc = static_cast<unsigned char>(c);
		switch (c) {
		case '"':  result += "\\\""; break;
		case '\\': result += "\\\\"; break;
		case '\n': result += "\\n"; break;
		case '\r': result += "\\r"; break;
		case '\t': result += "\\t"; break;
		default:
			if (uc < 0x20 || uc == 0x7f) {
				result += "\\x";
				result += kHex[uc >> 4];
				result += kHex[uc & 0xF];
			} else {
				result += c;
			}
			break;
		}
	}
	result += '"';
	return result;
}

bool is_blank(std::string_view text) {
	return text.find_first_not_of(" \t\r\n\v\f") == std::string_view::npos;
}

} // namespace

std::string_view node_type_name(NodeType type) {
	switch (type) {
	case NodeType::List:       return "list";
	case NodeType::Text:       return "text";
	case NodeType::Action:     return "action";
	case NodeType::If:         return "if";
	case NodeType::Range:      return "range";
	case NodeType::With:       return "with";
	case NodeType::Template:   return "template";
	case NodeType::End:        return "end";
	case NodeType::Else:       return "else";
	case NodeType::Pipe:       return "pipe";
	case NodeType::Command:    return "command";
	case NodeType::Field:      return "field";
	case NodeType::Variable:   return "variable";
	case NodeType::Chain:      return "chain";
	case NodeType::Identifier: return "identifier";
	case NodeType::Bool:       return "bool";
	case NodeType::Number:     return "number";
	case NodeType::Nil:        return "nil";
	case NodeType::Dot:        return "dot";
	case NodeType::String:     return "string";
	}
	return "unknown";
}

// ListNode

ListNode::ListNode(TreeId tree_id, Pos pos) : NodeBase(tree_id, pos) {}
ListNode::ListNode(ListNode&&) noexcept = default;
ListNode& ListNode::operator=(ListNode&&) noexcept = default;
ListNode::~ListNode() = default;

void ListNode::append(Node node) {
	nodes_.push_back(std::move(node));
}

bool ListNode::empty() const {
	return nodes_.empty();
}

std::string ListNode::to_string() const {
	std::string result;
	for (const Node& node : nodes_) {
		result += node.to_string();
	}
	return result;
}

// CommandNode

CommandNode::CommandNode(TreeId tree_id, Pos pos) : NodeBase(tree_id, pos) {}
CommandNode::CommandNode(CommandNode&&) noexcept = default;
CommandNode& CommandNode::operator=(CommandNode&&) noexcept = default;
CommandNode::~CommandNode() = default;

void CommandNode::append(Node arg) {
	args_.push_back(std::move(arg));
}

std::string CommandNode::to_string() const {
	std::string result;
	for (size_t i = 0; i < args_.size(); ++i) {
		if (i > 0) {
			result += ' ';
		}
		if (args_[i].is<PipeNode>()) {
			result += "(" + args_[i].to_string() + ")";
		} else {
			result += args_[i].to_string();
		}
	}
	return result;
}

// PipeNode

std::string PipeNode::to_string() const {
	std::string result;
	if (!decl_.empty()) {
		for (size_t i = 0; i < decl_.size(); ++i) {
			if (i > 0) {
				result += ", ";
			}
			result += decl_[i].to_string();
		}
		result += " := ";
	}
	for (size_t i = 0; i < cmds_.size(); ++i) {
		if (i > 0) {
			result += " | ";
		}
		result += cmds_[i].to_string();
	}
	return result;
}

// BranchNode

std::string BranchNode::to_string(std::string_view keyword) const {
	std::string result = "{{";
	result += keyword;
	result += ' ';
	result += pipe_.to_string();
	result += "}}";
	result += list_.to_string();
	if (else_list_) {
		result += "{{else}}";
		result += else_list_->to_string();
	}
	result += "{{end}}";
	return result;
}

// TemplateNode

std::string TemplateNode::to_string() const {
	std::string result = "{{template ";
	if (const std::string* name = std::get_if<std::string>(&name_)) {
		result += quote_string(*name);
	} else {
		result += "(" + std::get<PipeNode>(name_).to_string() + ")";
	}
	if (pipe_) {
		result += ' ';
		result += pipe_->to_string();
	}
	result += "}}";
	return result;
}

// FieldNode / VariableNode

FieldNode::FieldNode(TreeId tree_id, Pos pos, std::string_view ident)
	: NodeBase(tree_id, pos), ident_(split_on_dot(ident.starts_with('.') ? ident.substr(1) : ident)) {}

std::string FieldNode::to_string() const {
	std::string result;
	for (const std::string& part : ident_) {
		result += '.';
		result += part;
	}
	return result;
}

VariableNode::VariableNode(TreeId tree_id, Pos pos, std::string_view ident)
	: NodeBase(tree_id, pos), ident_(split_on_dot(ident)) {}

std::string VariableNode::to_string() const {
	std::string result;
	for (size_t i = 0; i < ident_.size(); ++i) {
		if (i > 0) {
			result += '.';
		}
		result += ident_[i];
	}
	return result;
}

// ChainNode

ChainNode::ChainNode(TreeId tree_id, Pos pos, Node node)
	: NodeBase(tree_id, pos), node_(std::make_unique<Node>(std::move(node))) {}
ChainNode::ChainNode(ChainNode&&) noexcept = default;
ChainNode& ChainNode::operator=(ChainNode&&) noexcept = default;
ChainNode::~ChainNode() = default;

void ChainNode::add(std::string_view field) {
	if (field.starts_with('.')) {
		field.remove_prefix(1);
	}
	fields_.emplace_back(field);
}

const Node& ChainNode::get_node() const {
	return *node_;
}

std::string ChainNode::to_string() const {
	std::string result;
	if (node_->is<PipeNode>()) {
		result = "(" + node_->to_string() + ")";
	} else {
		result = node_->to_string();
	}
	for (const std::string& field : fields_) {
		result += '.';
		result += field;
	}
	return result;
}

// Node

TreeId Node::tree_id() const {
	return std::visit([](const auto& node) { return node.tree_id(); }, node_);
}

Pos Node::pos() const {
	return std::visit([](const auto& node) { return node.pos(); }, node_);
}

std::string Node::to_string() const {
	return std::visit([](const auto& node) { return node.to_string(); }, node_);
}

bool is_empty_tree(const ListNode& list) {
	for (const Node& node : list.get_nodes()) {
		if (!is_empty_tree(node)) {
			return false;
		}
	}
	return true;
}

bool is_empty_tree(const Node& node) {
	switch (node.type()) {
	case NodeType::List:
		return is_empty_tree(node.as<ListNode>());
	case NodeType::Text:
		return is_blank(node.as<TextNode>().get_text());
	case NodeType::Action:
	case NodeType::If:
	case NodeType::Range:
	case NodeType::With:
	case NodeType::Template:
		return false;
	default:
		break;
	}
	throw TemplateError(ParseError{ParseErrorKind::InvalidNode, "", 0,
		"unknown node: " + std::string(node.type_name())});
}

} // namespace TmplCpp
