// ===== src/Log.h (header-only) =====

#pragma once
#include <cstdint>
#include <format>
#include <iostream>
#include <string_view>
#include <utility>

namespace TmplCpp {

// Log categories - each can be enabled/disabled independently
enum class LogCategory : uint32_t {
    None        = 0,
    General     = 1 << 0,   // User-facing messages (no prefix, always enabled in release)
    Lexer       = 1 << 1,   // Tokenizer state machine
    Parser      = 1 << 2,   // Grammar routines and token traffic
    Scope       = 1 << 3,   // Variable scope push/truncate
    Registry    = 1 << 4,   // Tree start/stop and tree set registration
    All         = 0xFFFFFFFF
};

inline LogCategory operator|(LogCategory a, LogCategory b) {
    return static_cast<LogCategory>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}
inline LogCategory operator&(LogCategory a, LogCategory b) {
    return static_cast<LogCategory>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

// Verbosity levels
enum class LogLevel : uint8_t {
    Error   = 0,  // Always shown (unless logging completely disabled)
    Warning = 1,  // Important warnings
    Info    = 2,  // High-level flow
    Debug   = 3,  // Detailed debugging
    Trace   = 4   // Very verbose tracing
};

// Compile-time configuration
// Set these via compiler flags: -DTMPLCPP_LOG_LEVEL=3 -DTMPLCPP_LOG_CATEGORIES=0xFF
#ifndef TMPLCPP_LOG_LEVEL
    #ifdef NDEBUG
        #define TMPLCPP_LOG_LEVEL 2   // Release: up to Info level (General category always enabled regardless of level)
    #else
        #define TMPLCPP_LOG_LEVEL 3   // Debug: up to Debug level
    #endif
#endif

#ifndef TMPLCPP_LOG_CATEGORIES
    #define TMPLCPP_LOG_CATEGORIES 0xFFFFFFFF  // All categories by default
#endif

// ANSI color codes for terminal output
namespace detail {
    constexpr const char* RESET   = "\033[0m";
    constexpr const char* RED     = "\033[31m";
    constexpr const char* YELLOW  = "\033[33m";
    constexpr const char* BLUE    = "\033[34m";
}

// Runtime filter (can be changed at runtime for enabled levels)
struct LogConfig {
    static inline LogLevel runtimeLevel = LogLevel::Warning;
    static inline LogCategory runtimeCategories = static_cast<LogCategory>(TMPLCPP_LOG_CATEGORIES);
    static inline std::ostream* output_stream = &std::cerr;  // Diagnostics stay off stdout, which carries tree dumps
    static inline bool use_colors = true;  // Enable/disable ANSI colors

    static void setLevel(LogLevel level) { runtimeLevel = level; }
    // Restrict runtime output to one category at the given level
    static void setLevel(LogCategory cat, LogLevel level) {
        runtimeCategories = cat;
        runtimeLevel = level;
    }
    static void setCategories(LogCategory cats) { runtimeCategories = cats; }
    static void enableCategory(LogCategory cat) {
        runtimeCategories = runtimeCategories | cat;
    }
    static void disableCategory(LogCategory cat) {
        runtimeCategories = static_cast<LogCategory>(
            static_cast<uint32_t>(runtimeCategories) & ~static_cast<uint32_t>(cat)
        );
    }
    static void setOutputStream(std::ostream* stream) { output_stream = stream; }
    static void setOutputToStdout() { output_stream = &std::cout; }
    static void setOutputToStderr() { output_stream = &std::cerr; }
    static void setUseColors(bool enable) { use_colors = enable; }
};

// Core logging function
template<LogLevel Level, LogCategory Category>
struct Logger {
    // General category is always enabled at compile time (user-facing messages)
    static constexpr bool enabled =
        (Category == LogCategory::General) ||
        ((static_cast<uint8_t>(Level) <= TMPLCPP_LOG_LEVEL) &&
         ((static_cast<uint32_t>(Category) & TMPLCPP_LOG_CATEGORIES) != 0));

    static bool runtime_enabled() {
        // General category is always enabled at runtime too
        return (Category == LogCategory::General) ||
            (static_cast<uint8_t>(Level) <= static_cast<uint8_t>(LogConfig::runtimeLevel) &&
             (static_cast<uint32_t>(Category) & static_cast<uint32_t>(LogConfig::runtimeCategories)) != 0);
    }

    template<typename... Args>
    static void log([[maybe_unused]] Args&&... args) {
        if constexpr (enabled) {
            if (runtime_enabled()) {
                // Errors always go to stderr
                std::ostream& out = (Level == LogLevel::Error) ? std::cerr : *LogConfig::output_stream;

                // General category: no prefix (user-facing messages)
                if constexpr (Category == LogCategory::General) {
                    (out << ... << args);
                    out << "\n";
                } else {
                    // Apply color based on log level
                    if (LogConfig::use_colors) {
                        out << colorCode();
                    }

                    // Print prefix
                    out << "[" << levelName() << "][" << categoryName() << "] ";
                    (out << ... << args);

                    // Reset color
                    if (LogConfig::use_colors) {
                        out << detail::RESET;
                    }
                    out << "\n";
                }
            }
        }
    }

    template<typename... Args>
    static void log_format([[maybe_unused]] std::format_string<Args...> fmt, [[maybe_unused]] Args&&... args) {
        if constexpr (enabled) {
            // Skip the formatting work entirely when filtered at runtime
            if (runtime_enabled()) {
                log(std::format(fmt, std::forward<Args>(args)...));
            }
        }
    }

    static constexpr const char* colorCode() {
        switch (Level) {
            case LogLevel::Error:   return detail::RED;
            case LogLevel::Warning: return detail::YELLOW;
            case LogLevel::Trace:   return detail::BLUE;
            default:                return "";  // No color for Info, Debug
        }
    }

    static constexpr std::string_view levelName() {
        switch (Level) {
            case LogLevel::Error:   return "ERROR";
            case LogLevel::Warning: return "WARN ";
            case LogLevel::Info:    return "INFO ";
            case LogLevel::Debug:   return "DEBUG";
            case LogLevel::Trace:   return "TRACE";
            default:                return "?????";
        }
    }

    static constexpr std::string_view categoryName() {
        switch (Category) {
            case LogCategory::None:     return "None";
            case LogCategory::General:  return "General";
            case LogCategory::Lexer:    return "Lexer";
            case LogCategory::Parser:   return "Parser";
            case LogCategory::Scope:    return "Scope";
            case LogCategory::Registry: return "Registry";
            case LogCategory::All:      return "All";
            default:                    return "Unknown";  // Multi-category bitmask
        }
    }
};

// Convenience macros - zero overhead when disabled at compile time
#define TMPL_LOG(cat, level, ...) ::TmplCpp::Logger<::TmplCpp::LogLevel::level, ::TmplCpp::LogCategory::cat>::log(__VA_ARGS__)
#define TMPL_LOG_FORMAT(cat, level, ...) ::TmplCpp::Logger<::TmplCpp::LogLevel::level, ::TmplCpp::LogCategory::cat>::log_format(__VA_ARGS__)

} // namespace TmplCpp
