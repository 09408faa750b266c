#include "dualstore/utils/string_utils.hpp"
#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace dualstore {
namespace string_utils {

std::string trim(const std::string& str) {
    return ltrim(rtrim(str));
}

std::string ltrim(const std::string& str) {
    auto it = std::find_if(str.begin(), str.end(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    return std::string(it, str.end());
}

std::string rtrim(const std::string& str) {
    auto it = std::find_if(str.rbegin(), str.rend(), [](unsigned char ch) {
        return !std::isspace(ch);
    });
    return std::string(str.begin(), it.base());
}

std::string to_lower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string to_upper(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::toupper);
    return result;
}

std::optional<bool> parse_bool(const std::string& value) {
    std::string v = to_lower(trim(value));
    if (v == "true" || v == "1" || v == "yes" || v == "on") {
        return true;
    }
    if (v == "false" || v == "0" || v == "no" || v == "off") {
        return false;
    }
    return std::nullopt;
}

std::optional<int64_t> parse_int(const std::string& value) {
    std::string v = trim(value);
    if (v.empty()) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        long long parsed = std::stoll(v, &consumed);
        if (consumed != v.size()) {
            return std::nullopt;
        }
        return static_cast<int64_t>(parsed);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

std::string format_percent(uint64_t part, uint64_t total) {
    if (total == 0) {
        return "0%";
    }
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2)
       << (static_cast<double>(part) / static_cast<double>(total) * 100.0) << "%";
    return ss.str();
}

} // namespace string_utils
} // namespace dualstore
