#include "dualstore/utils/common.hpp"
#include "dualstore/utils/string_utils.hpp"

namespace dualstore {

const std::map<std::string, std::string> SUPPORTED_LANGUAGES = {
    {"en", "English"}, {"es", "Español"}, {"fr", "Français"}, {"de", "Deutsch"},
    {"it", "Italiano"}, {"pt", "Português"}, {"ru", "Русский"}, {"ja", "日本語"},
    {"ko", "한국어"}, {"zh-CN", "中文"}, {"nl", "Nederlands"}, {"pl", "Polski"},
    {"tr", "Türkçe"}
};

const std::map<std::string, std::string> LANGUAGE_FLAGS = {
    {"en", "🇬🇧"}, {"es", "🇪🇸"}, {"fr", "🇫🇷"}, {"de", "🇩🇪"},
    {"it", "🇮🇹"}, {"pt", "🇵🇹"}, {"ru", "🇷🇺"}, {"ja", "🇯🇵"},
    {"ko", "🇰🇷"}, {"zh-CN", "🇨🇳"}, {"nl", "🇳🇱"}, {"pl", "🇵🇱"},
    {"tr", "🇹🇷"}
};

std::string snowflake_to_string(dpp::snowflake id) {
    return std::to_string(static_cast<uint64_t>(id));
}

dpp::snowflake string_to_snowflake(const std::string& str) {
    auto value = string_utils::parse_int(str);
    if (!value || *value < 0) {
        return 0;
    }
    return dpp::snowflake(static_cast<uint64_t>(*value));
}

dpp::message error_embed(const std::string& title, const std::string& description) {
    dpp::embed embed;
    embed.set_title("❌ " + title)
         .set_description(description)
         .set_color(0xff0000);
    return dpp::message().add_embed(embed);
}

dpp::message success_embed(const std::string& title, const std::string& description) {
    dpp::embed embed;
    embed.set_title("✅ " + title)
         .set_description(description)
         .set_color(0x00ff00);
    return dpp::message().add_embed(embed);
}

dpp::message info_embed(const std::string& title, const std::string& description) {
    dpp::embed embed;
    embed.set_title("ℹ️ " + title)
         .set_description(description)
         .set_color(0x0099ff);
    return dpp::message().add_embed(embed);
}

} // namespace dualstore
