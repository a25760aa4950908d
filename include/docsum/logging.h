#pragma once

#include <string>

namespace docsum {

enum class LogLevel {
    Error = 0,
    Warning = 1,
    Info = 2,
    Debug = 3
};

// Process-wide threshold; messages above it are dropped.
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses "error", "warning", "info", "debug" (case-insensitive).
// Throws std::invalid_argument for anything else.
LogLevel parse_log_level(const std::string& name);

// Writes "[component] message" to stderr when the level is enabled.
void log_message(LogLevel level, const std::string& component, const std::string& message);

inline void log_error(const std::string& component, const std::string& message) {
    log_message(LogLevel::Error, component, message);
}

inline void log_warning(const std::string& component, const std::string& message) {
    log_message(LogLevel::Warning, component, message);
}

inline void log_info(const std::string& component, const std::string& message) {
    log_message(LogLevel::Info, component, message);
}

inline void log_debug(const std::string& component, const std::string& message) {
    log_message(LogLevel::Debug, component, message);
}

} // namespace docsum
