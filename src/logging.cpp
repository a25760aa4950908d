#include "docsum/logging.h"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <mutex>
#include <stdexcept>

namespace docsum {

namespace {

std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
std::mutex g_output_mutex;

const char* level_tag(LogLevel level) {
    switch (level) {
        case LogLevel::Error: return "ERROR";
        case LogLevel::Warning: return "WARN";
        case LogLevel::Info: return "INFO";
        case LogLevel::Debug: return "DEBUG";
    }
    return "INFO";
}

} // namespace

void set_log_level(LogLevel level) {
    g_level = static_cast<int>(level);
}

LogLevel get_log_level() {
    return static_cast<LogLevel>(g_level.load());
}

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "error") return LogLevel::Error;
    if (lower == "warning" || lower == "warn") return LogLevel::Warning;
    if (lower == "info") return LogLevel::Info;
    if (lower == "debug") return LogLevel::Debug;
    throw std::invalid_argument("unknown log level: " + name);
}

void log_message(LogLevel level, const std::string& component, const std::string& message) {
    if (static_cast<int>(level) > g_level.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << level_tag(level) << " [" << component << "] " << message << std::endl;
}

} // namespace docsum
