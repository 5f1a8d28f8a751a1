#pragma once

#include <functional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

namespace TmplCpp {

using FunctionSet = std::set<std::string, std::less<>>;

// Settings shared by the lexer and parser for one parse
class ParseContext {
public:
	const std::string& getName() const {
		return name_;
	}

	void setName(std::string_view name) {
		name_ = std::string(name);
	}

	const FunctionSet& getFunctions() const {
		return functions_;
	}

	void setFunctions(FunctionSet functions) {
		functions_ = std::move(functions);
	}

	void addFunction(std::string_view name) {
		functions_.emplace(name);
	}

	bool hasFunction(std::string_view name) const {
		return functions_.find(name) != functions_.end();
	}

	std::string_view getLeftDelim() const {
		return leftDelim_;
	}

	std::string_view getRightDelim() const {
		return rightDelim_;
	}

	// Empty strings select the default {{ and }}
	void setDelims(std::string_view left, std::string_view right) {
		leftDelim_ = left.empty() ? "{{" : std::string(left);
		rightDelim_ = right.empty() ? "}}" : std::string(right);
	}

	// {{template (pipeline)}} with a computed name
	bool isDynamicTemplateEnabled() const {
		return dynamicTemplate_;
	}

	void setDynamicTemplateEnabled(bool enabled) {
		dynamicTemplate_ = enabled;
	}

private:
	std::string name_;
	FunctionSet functions_;
	std::string leftDelim_ = "{{";
	std::string rightDelim_ = "}}";
	bool dynamicTemplate_ = false;
};

} // namespace TmplCpp
