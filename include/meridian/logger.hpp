#pragma once

#include <cctype>
#include <concepts>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace meridian {

// Log severity levels
enum class log_level : std::uint8_t {
    trace,
    debug,
    info,
    warning,
    error,
    critical
};

inline auto to_string(log_level level) -> std::string_view {
    switch (level) {
        case log_level::trace:    return "TRACE";
        case log_level::debug:    return "DEBUG";
        case log_level::info:     return "INFO";
        case log_level::warning:  return "WARNING";
        case log_level::error:    return "ERROR";
        case log_level::critical: return "CRITICAL";
    }
    return "UNKNOWN";
}

// Case-insensitive; accepts "warn" for warning
inline auto parse_log_level(std::string_view text) -> std::optional<log_level> {
    std::string lowered;
    for (char c : text) {
        lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }
    if (lowered == "warn") {
        return log_level::warning;
    }
    for (auto level : {log_level::trace, log_level::debug, log_level::info,
                       log_level::warning, log_level::error, log_level::critical}) {
        std::string name;
        for (char c : to_string(level)) {
            name.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        if (name == lowered) {
            return level;
        }
    }
    return std::nullopt;
}

// Structured key/value pairs attached to a log line
using log_fields = std::vector<std::pair<std::string_view, std::string_view>>;

// Diagnostic logger concept used by the generator and the simulation engine
template<typename L>
concept diagnostic_logger = requires(
    L logger,
    log_level level,
    std::string_view message,
    log_fields key_value_pairs
) {
    { logger.log(level, message) } -> std::same_as<void>;
    { logger.log(level, message, key_value_pairs) } -> std::same_as<void>;
    
    { logger.trace(message) } -> std::same_as<void>;
    { logger.debug(message) } -> std::same_as<void>;
    { logger.info(message) } -> std::same_as<void>;
    { logger.warning(message) } -> std::same_as<void>;
    { logger.error(message) } -> std::same_as<void>;
    { logger.critical(message) } -> std::same_as<void>;
};

} // namespace meridian
