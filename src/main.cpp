#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "CommandLineParser.h"
#include "Lexer.h"
#include "Log.h"
#include "ParseContext.h"
#include "Parser.h"
#include "TemplateError.h"

using namespace TmplCpp;

namespace {

std::vector<std::string_view> splitList(std::string_view list, char separator) {
	std::vector<std::string_view> parts;
	size_t start = 0;
	while (start <= list.size()) {
		size_t end = list.find(separator, start);
		if (end == std::string_view::npos) {
			end = list.size();
		}
		if (end > start) {
			parts.push_back(list.substr(start, end - start));
		}
		start = end + 1;
	}
	return parts;
}

void printUsage() {
	TMPL_LOG(General, Info, "Usage: tmplparse [options] FILE... (or - for stdin)\n"
		"  --funcs=a,b,c          names of functions callable from actions\n"
		"  -f NAME                add a single function name\n"
		"  --delims=LEFT,RIGHT    action delimiters (default {{,}})\n"
		"  --dynamic-template     allow {{template (pipeline)}}\n"
		"  --fields               list the field paths each tree references\n"
		"  --log-level=LEVEL      error|warning|info|debug|trace, or CATEGORY:LEVEL\n"
		"  -v, --verbose          same as --log-level=info\n"
		"  -h, --help             show this message");
}

bool readInput(std::string_view arg, std::string& text) {
	if (arg == "-") {
		std::ostringstream buffer;
		buffer << std::cin.rdbuf();
		text = buffer.str();
		return true;
	}
	std::ifstream file{std::string(arg), std::ios::binary};
	if (!file) {
		return false;
	}
	text.assign(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
	return true;
}

void printTrees(const TreeSet& trees, bool showFields) {
	bool first = true;
	for (const auto& [name, tree] : trees) {
		if (!first) {
			std::cout << "\n";
		}
		first = false;
		std::cout << "tree \"" << name << "\" (id " << tree.get_id() << ")\n";
		if (tree.get_root()) {
			std::cout << tree.get_root()->to_string() << "\n";
		}
		if (showFields && !tree.get_fields().empty()) {
			std::cout << "fields:";
			for (const std::string& field : tree.get_fields()) {
				std::cout << " " << field;
			}
			std::cout << "\n";
		}
	}
}

} // namespace

int main(int argc, char *argv[]) {
	ParseContext context;
	CommandLineParser argsparser(argc, argv, context);

	// Helper functions for parsing log levels and categories
	auto parseLevel = [](std::string_view sv) -> LogLevel {
		if (sv == "error" || sv == "0") return LogLevel::Error;
		if (sv == "warning" || sv == "1") return LogLevel::Warning;
		if (sv == "info" || sv == "2") return LogLevel::Info;
		if (sv == "debug" || sv == "3") return LogLevel::Debug;
		if (sv == "trace" || sv == "4") return LogLevel::Trace;
		return LogLevel::Info; // default
	};

	auto parseCategory = [](std::string_view sv) -> LogCategory {
		if (sv == "General") return LogCategory::General;
		if (sv == "Lexer") return LogCategory::Lexer;
		if (sv == "Parser") return LogCategory::Parser;
		if (sv == "Scope") return LogCategory::Scope;
		if (sv == "Registry") return LogCategory::Registry;
		if (sv == "All") return LogCategory::All;
		return LogCategory::General; // default
	};

	if (argsparser.hasFlag("v") || argsparser.hasFlag("verbose")) {
		LogConfig::setLevel(LogLevel::Info);
	}

	// Handle log level setting from command line
	if (argsparser.hasOption("log-level")) {
		auto level_str = argsparser.optionValue("log-level");
		if (std::holds_alternative<std::string_view>(level_str)) {
			std::string_view level_sv = std::get<std::string_view>(level_str);
			size_t colon_pos = level_sv.find(':');
			if (colon_pos != std::string_view::npos) {
				// Category-specific: category:level
				std::string_view cat_sv = level_sv.substr(0, colon_pos);
				std::string_view lev_sv = level_sv.substr(colon_pos + 1);
				LogCategory cat = parseCategory(cat_sv);
				if ((static_cast<uint32_t>(cat) & TMPLCPP_LOG_CATEGORIES) != 0 || cat == LogCategory::General) {
					LogConfig::setLevel(cat, parseLevel(lev_sv));
				} else {
					TMPL_LOG(General, Error, "Cannot set log level for category ", cat_sv, ": category disabled at compile time");
				}
			} else {
				LogConfig::setLevel(parseLevel(level_sv));
			}
		}
	}

	if (argsparser.hasFlag("h") || argsparser.hasOption("help")) {
		printUsage();
		return 0;
	}

	if (argsparser.hasOption("funcs")) {
		auto funcs = argsparser.optionValue("funcs");
		if (std::holds_alternative<std::string_view>(funcs)) {
			for (std::string_view name : splitList(std::get<std::string_view>(funcs), ',')) {
				context.addFunction(name);
			}
		}
	}

	if (argsparser.hasOption("delims")) {
		auto delims = argsparser.optionValue("delims");
		std::vector<std::string_view> parts;
		if (std::holds_alternative<std::string_view>(delims)) {
			parts = splitList(std::get<std::string_view>(delims), ',');
		}
		if (parts.size() != 2) {
			TMPL_LOG(General, Error, "--delims expects LEFT,RIGHT");
			return 2;
		}
		context.setDelims(parts[0], parts[1]);
	}

	context.setDynamicTemplateEnabled(argsparser.hasFlag("dynamic-template"));
	bool showFields = argsparser.hasFlag("fields");

	if (argsparser.inputFileArgs().empty()) {
		printUsage();
		return 2;
	}

	for (std::string_view input : argsparser.inputFileArgs()) {
		std::string text;
		if (!readInput(input, text)) {
			TMPL_LOG(General, Error, "Cannot read ", input);
			return 2;
		}

		context.setName(input == "-" ? std::string("stdin") : std::filesystem::path(input).filename().string());
		TMPL_LOG(Parser, Info, "Parsing ", input, " as template ", context.getName());

		Lexer lexer(text, context.getLeftDelim(), context.getRightDelim());
		Parser parser(lexer, context);
		ParseResult result = parser.parse();
		if (result.is_error()) {
			const ParseError& error = result.error();
			TMPL_LOG(General, Error, result.error_message());
			std::string line_text = lexer.get_line_text(error.line);
			if (!line_text.empty()) {
				TMPL_LOG(General, Error, "    ", line_text);
			}
			TMPL_LOG(Parser, Info, "error kind: ", get_parse_error_kind_string(error.kind));
			return 1;
		}
		printTrees(result.trees(), showFields);
	}
	return 0;
}
