#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace dualstore {
namespace string_utils {

// Trim whitespace
std::string trim(const std::string& str);
std::string ltrim(const std::string& str);
std::string rtrim(const std::string& str);

// Case conversion
std::string to_lower(const std::string& str);
std::string to_upper(const std::string& str);

// "true", "1", "yes", "on" (any case) are true; "false", "0", "no", "off" are false
std::optional<bool> parse_bool(const std::string& value);

// Whole-string integer parse; nullopt on garbage or overflow
std::optional<int64_t> parse_int(const std::string& value);

// "87.50%" style percentage of part/total with two decimals; "0%" when total is 0
std::string format_percent(uint64_t part, uint64_t total);

} // namespace string_utils
} // namespace dualstore
