#pragma once

#include <dpp/dpp.h>
#include <map>
#include <string>

namespace dualstore {

// Guild languages offered by /language: code -> display name
extern const std::map<std::string, std::string> SUPPORTED_LANGUAGES;
extern const std::map<std::string, std::string> LANGUAGE_FLAGS;

// Snowflake utilities
std::string snowflake_to_string(dpp::snowflake id);
dpp::snowflake string_to_snowflake(const std::string& str);

// Response helpers
dpp::message error_embed(const std::string& title, const std::string& description);
dpp::message success_embed(const std::string& title, const std::string& description);
dpp::message info_embed(const std::string& title, const std::string& description);

} // namespace dualstore
