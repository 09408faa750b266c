#pragma once

#include <string>

namespace dualstore {

enum class LogLevel {
    debug = 0,
    info,
    warn,
    error
};

// Minimum level written; lower levels are dropped
void set_log_level(LogLevel level);
LogLevel get_log_level();

// Parses "debug", "info", "warn"/"warning", "error". Unknown values give info.
LogLevel parse_log_level(const std::string& name);
const char* log_level_name(LogLevel level);

// debug/info go to stdout, warn/error to stderr
void log(LogLevel level, const std::string& component, const std::string& message);

inline void log_debug(const std::string& component, const std::string& message) {
    log(LogLevel::debug, component, message);
}

inline void log_info(const std::string& component, const std::string& message) {
    log(LogLevel::info, component, message);
}

inline void log_warn(const std::string& component, const std::string& message) {
    log(LogLevel::warn, component, message);
}

inline void log_error(const std::string& component, const std::string& message) {
    log(LogLevel::error, component, message);
}

} // namespace dualstore
