#pragma once

#include <map>
#include <string_view>
#include <variant>
#include <vector>

#include "ParseContext.h"

namespace TmplCpp {

// Splits argv into --long[=value] options, -x [value] short options and
// input files. "-f name" and "-fname" register a function directly.
class CommandLineParser {
public:
	CommandLineParser(int argc, char* argv[], ParseContext& context) {
		for (int i = 1; i < argc; i++) {
			std::string_view arg = argv[i];

			if (arg.size() >= 2 && arg[0] == '-') {
				if (arg.size() >= 3 && arg[1] == '-') {
					// Option with long name, e.g. --option=value
					auto equal_pos = arg.find('=');
					if (equal_pos == std::string_view::npos) {
						optionValues_[arg.substr(2)] = std::monostate{};
					}
					else {
						optionValues_[arg.substr(2, equal_pos - 2)] = arg.substr(equal_pos + 1);
					}
				}
				else {
					std::string_view option_part = arg.substr(1);

					if (option_part[0] == 'f') {
						if (option_part.size() == 1) {
							// Format: -f name
							if (i + 1 < argc) {
								context.addFunction(argv[++i]);
							}
						} else {
							// Format: -fname
							context.addFunction(option_part.substr(1));
						}
					}
					else if (isKnownFlag(option_part)) {
						optionValues_[option_part] = std::monostate{};
					}
					else if (i + 1 >= argc) {
						optionValues_[option_part] = std::monostate{};
					}
					else {
						optionValues_[option_part] = argv[++i];
					}
				}
			}
			else {
				// Plain arguments, and "-" for stdin
				inputFileArgs_.push_back(arg);
			}
		}
	}

	bool hasOption(std::string_view optionName) const {
		return optionValues_.count(optionName) > 0;
	}

	bool hasFlag(std::string_view flagName) const {
		auto it = optionValues_.find(flagName);
		return it != optionValues_.end() && std::holds_alternative<std::monostate>(it->second);
	}

	std::variant<std::monostate, std::string_view> optionValue(std::string_view optionName) const {
		auto it = optionValues_.find(optionName);
		if (it != optionValues_.end()) {
			return it->second;
		}
		return std::monostate{};
	}

	const std::vector<std::string_view>& inputFileArgs() const {
		return inputFileArgs_;
	}

private:
	// Short options that don't take a value
	static bool isKnownFlag(std::string_view flag) {
		return flag == "h" || flag == "v";
	}

	std::map<std::string_view, std::variant<std::monostate, std::string_view>, std::less<>> optionValues_;
	std::vector<std::string_view> inputFileArgs_;
};

} // namespace TmplCpp
