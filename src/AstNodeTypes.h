#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "LiteralUtils.h"

namespace TmplCpp {

using Pos = size_t;
using TreeId = size_t;

// Order matches the alternatives of Node::Variant
enum class NodeType : uint8_t {
	List,
	Text,
	Action,
	If,
	Range,
	With,
	Template,
	End,
	Else,
	Pipe,
	Command,
	Field,
	Variable,
	Chain,
	Identifier,
	Bool,
	Number,
	Nil,
	Dot,
	String,
};

std::string_view node_type_name(NodeType type);

class Node;

// Every node records the tree it was built for and the byte offset of the
// token that started it.
class NodeBase {
public:
	NodeBase(TreeId tree_id, Pos pos) : tree_id_(tree_id), pos_(pos) {}

	TreeId tree_id() const { return tree_id_; }
	Pos pos() const { return pos_; }

private:
	TreeId tree_id_;
	Pos pos_;
};

class ListNode : public NodeBase {
public:
	ListNode(TreeId tree_id, Pos pos);
	ListNode(ListNode&&) noexcept;
	ListNode& operator=(ListNode&&) noexcept;
	~ListNode();

	void append(Node node);
	const std::vector<Node>& get_nodes() const { return nodes_; }
	bool empty() const;

	std::string to_string() const;

private:
	std::vector<Node> nodes_;
};

class TextNode : public NodeBase {
public:
	TextNode(TreeId tree_id, Pos pos, std::string_view text)
		: NodeBase(tree_id, pos), text_(text) {}

	const std::string& get_text() const { return text_; }
	std::string to_string() const { return text_; }

private:
	std::string text_;
};

// $x or $x.Field1.Field2; the first element keeps its $
class VariableNode : public NodeBase {
public:
	VariableNode(TreeId tree_id, Pos pos, std::string_view ident);

	const std::vector<std::string>& get_ident() const { return ident_; }
	const std::string& get_name() const { return ident_.front(); }
	std::string to_string() const;

private:
	std::vector<std::string> ident_;
};

class CommandNode : public NodeBase {
public:
	CommandNode(TreeId tree_id, Pos pos);
	CommandNode(CommandNode&&) noexcept;
	CommandNode& operator=(CommandNode&&) noexcept;
	~CommandNode();

	void append(Node arg);
	const std::vector<Node>& get_args() const { return args_; }

	std::string to_string() const;

private:
	std::vector<Node> args_;
};

// Declared variables, then the commands separated by |
class PipeNode : public NodeBase {
public:
	PipeNode(TreeId tree_id, Pos pos, std::vector<VariableNode> decl)
		: NodeBase(tree_id, pos), decl_(std::move(decl)) {}

	void append(CommandNode command) { cmds_.push_back(std::move(command)); }

	const std::vector<VariableNode>& get_decl() const { return decl_; }
	const std::vector<CommandNode>& get_cmds() const { return cmds_; }

	std::string to_string() const;

private:
	std::vector<VariableNode> decl_;
	std::vector<CommandNode> cmds_;
};

class ActionNode : public NodeBase {
public:
	ActionNode(TreeId tree_id, Pos pos, PipeNode pipe)
		: NodeBase(tree_id, pos), pipe_(std::move(pipe)) {}

	const PipeNode& get_pipe() const { return pipe_; }
	std::string to_string() const { return "{{" + pipe_.to_string() + "}}"; }

private:
	PipeNode pipe_;
};

// Shared shape of if, range and with
class BranchNode : public NodeBase {
public:
	BranchNode(TreeId tree_id, Pos pos, PipeNode pipe, ListNode list, std::optional<ListNode> else_list)
		: NodeBase(tree_id, pos), pipe_(std::move(pipe)), list_(std::move(list)),
		  else_list_(std::move(else_list)) {}

	const PipeNode& get_pipe() const { return pipe_; }
	const ListNode& get_list() const { return list_; }
	const std::optional<ListNode>& get_else_list() const { return else_list_; }
	bool has_else() const { return else_list_.has_value(); }

protected:
	std::string to_string(std::string_view keyword) const;

private:
	PipeNode pipe_;
	ListNode list_;
	std::optional<ListNode> else_list_;
};

class IfNode : public BranchNode {
public:
	using BranchNode::BranchNode;
	std::string to_string() const { return BranchNode::to_string("if"); }
};

class RangeNode : public BranchNode {
public:
	using BranchNode::BranchNode;
	std::string to_string() const { return BranchNode::to_string("range"); }
};

class WithNode : public BranchNode {
public:
	using BranchNode::BranchNode;
	std::string to_string() const { return BranchNode::to_string("with"); }
};

// {{template "name" pipeline}}; the name is a pipeline only for dynamic
// template invocations
class TemplateNode : public NodeBase {
public:
	using Name = std::variant<std::string, PipeNode>;

	TemplateNode(TreeId tree_id, Pos pos, Name name, std::optional<PipeNode> pipe)
		: NodeBase(tree_id, pos), name_(std::move(name)), pipe_(std::move(pipe)) {}

	const Name& get_name() const { return name_; }
	bool is_dynamic() const { return std::holds_alternative<PipeNode>(name_); }
	const std::optional<PipeNode>& get_pipe() const { return pipe_; }

	std::string to_string() const;

private:
	Name name_;
	std::optional<PipeNode> pipe_;
};

class EndNode : public NodeBase {
public:
	using NodeBase::NodeBase;
	std::string to_string() const { return "{{end}}"; }
};

class ElseNode : public NodeBase {
public:
	using NodeBase::NodeBase;
	std::string to_string() const { return "{{else}}"; }
};

// .Field1.Field2
class FieldNode : public NodeBase {
public:
	FieldNode(TreeId tree_id, Pos pos, std::string_view ident);

	const std::vector<std::string>& get_ident() const { return ident_; }
	std::string to_string() const;

private:
	std::vector<std::string> ident_;
};

// A term followed by field accesses, e.g. (pipeline).Field or fn.Field
class ChainNode : public NodeBase {
public:
	ChainNode(TreeId tree_id, Pos pos, Node node);
	ChainNode(ChainNode&&) noexcept;
	ChainNode& operator=(ChainNode&&) noexcept;
	~ChainNode();

	// Accepts the field with or without its leading dot
	void add(std::string_view field);

	const Node& get_node() const;
	const std::vector<std::string>& get_fields() const { return fields_; }

	std::string to_string() const;

private:
	std::unique_ptr<Node> node_;
	std::vector<std::string> fields_;
};

class IdentifierNode : public NodeBase {
public:
	IdentifierNode(TreeId tree_id, Pos pos, std::string_view ident)
		: NodeBase(tree_id, pos), ident_(ident) {}

	const std::string& get_ident() const { return ident_; }
	std::string to_string() const { return ident_; }

private:
	std::string ident_;
};

class BoolNode : public NodeBase {
public:
	BoolNode(TreeId tree_id, Pos pos, bool value) : NodeBase(tree_id, pos), value_(value) {}

	bool get_value() const { return value_; }
	std::string to_string() const { return value_ ? "true" : "false"; }

private:
	bool value_;
};

class NumberNode : public NodeBase {
public:
	NumberNode(TreeId tree_id, Pos pos, std::string_view text, NumberValue value)
		: NodeBase(tree_id, pos), text_(text), value_(value) {}

	const std::string& get_text() const { return text_; }
	const NumberValue& get_value() const { return value_; }
	bool is_int() const { return value_.is_int; }
	bool is_uint() const { return value_.is_uint; }
	bool is_float() const { return value_.is_float; }

	std::string to_string() const { return text_; }

private:
	std::string text_;
	NumberValue value_;
};

class NilNode : public NodeBase {
public:
	using NodeBase::NodeBase;
	std::string to_string() const { return "nil"; }
};

class DotNode : public NodeBase {
public:
	using NodeBase::NodeBase;
	std::string to_string() const { return "."; }
};

class StringNode : public NodeBase {
public:
	StringNode(TreeId tree_id, Pos pos, std::string_view quoted, std::string text)
		: NodeBase(tree_id, pos), quoted_(quoted), text_(std::move(text)) {}

	// As written in the source, quotes included
	const std::string& get_quoted() const { return quoted_; }
	// Decoded value
	const std::string& get_text() const { return text_; }

	std::string to_string() const { return quoted_; }

private:
	std::string quoted_;
	std::string text_;
};

// Closed sum over the node kinds above. Owns its alternative; nodes are
// move-only.
class Node {
public:
	using Variant = std::variant<ListNode, TextNode, ActionNode, IfNode, RangeNode, WithNode,
		TemplateNode, EndNode, ElseNode, PipeNode, CommandNode, FieldNode, VariableNode,
		ChainNode, IdentifierNode, BoolNode, NumberNode, NilNode, DotNode, StringNode>;

	template <typename T>
		requires (!std::is_same_v<std::remove_cvref_t<T>, Node>)
	Node(T&& node) : node_(std::forward<T>(node)) {}

	template <typename T> bool is() const {
		return std::holds_alternative<T>(node_);
	}

	template <typename T> T& as() {
		return std::get<T>(node_);
	}

	template <typename T> const T& as() const {
		return std::get<T>(node_);
	}

	NodeType type() const { return static_cast<NodeType>(node_.index()); }
	std::string_view type_name() const { return node_type_name(type()); }

	TreeId tree_id() const;
	Pos pos() const;

	// Template source form of the node
	std::string to_string() const;

	const Variant& get_variant() const { return node_; }

private:
	Variant node_;
};

// True when the list holds nothing but whitespace text. Used to decide
// whether a tree may be redefined.
bool is_empty_tree(const ListNode& list);
bool is_empty_tree(const Node& node);

} // namespace TmplCpp
