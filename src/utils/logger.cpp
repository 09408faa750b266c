#include "dualstore/utils/logger.hpp"
#include "dualstore/utils/string_utils.hpp"
#include <atomic>
#include <iostream>
#include <mutex>

namespace dualstore {

static std::atomic<LogLevel> g_log_level{LogLevel::info};
static std::mutex g_log_mutex;

void set_log_level(LogLevel level) {
    g_log_level = level;
}

LogLevel get_log_level() {
    return g_log_level;
}

LogLevel parse_log_level(const std::string& name) {
    std::string value = string_utils::to_lower(string_utils::trim(name));
    if (value == "debug") return LogLevel::debug;
    if (value == "warn" || value == "warning") return LogLevel::warn;
    if (value == "error") return LogLevel::error;
    return LogLevel::info;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::debug: return "debug";
        case LogLevel::info: return "info";
        case LogLevel::warn: return "warn";
        case LogLevel::error: return "error";
    }
    return "info";
}

void log(LogLevel level, const std::string& component, const std::string& message) {
    if (level < g_log_level.load()) {
        return;
    }

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ostream& out = level >= LogLevel::warn ? std::cerr : std::cout;
    out << "[" << log_level_name(level) << "] " << component << ": " << message << std::endl;
}

} // namespace dualstore
