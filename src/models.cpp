#include "dualstore/models.hpp"

namespace dualstore {

void to_json(json& j, const GuildSettings& s) {
    j = json{
        {"guild_id", s.guild_id},
        {"lang", s.lang},
        {"prefix", s.prefix},
        {"welcome_channel_id", s.welcome_channel_id ? json(*s.welcome_channel_id) : json(nullptr)},
        {"updated_at", s.updated_at}
    };
}

void from_json(const json& j, GuildSettings& s) {
    s.guild_id = j.at("guild_id").get<std::string>();
    s.lang = j.value("lang", std::string(DEFAULT_LANG));
    s.prefix = j.value("prefix", std::string(DEFAULT_PREFIX));
    if (j.contains("welcome_channel_id") && j["welcome_channel_id"].is_string()) {
        s.welcome_channel_id = j["welcome_channel_id"].get<std::string>();
    } else {
        s.welcome_channel_id.reset();
    }
    s.updated_at = j.value("updated_at", int64_t{0});
}

void to_json(json& j, const UserSettings& s) {
    j = json{
        {"user_id", s.user_id},
        {"dm_notifications", s.dm_notifications},
        {"level_up_messages", s.level_up_messages},
        {"timezone", s.timezone},
        {"updated_at", s.updated_at}
    };
}

void from_json(const json& j, UserSettings& s) {
    s.user_id = j.at("user_id").get<std::string>();
    s.dm_notifications = j.value("dm_notifications", true);
    s.level_up_messages = j.value("level_up_messages", true);
    s.timezone = j.value("timezone", std::string(DEFAULT_TIMEZONE));
    s.updated_at = j.value("updated_at", int64_t{0});
}

void to_json(json& j, const LevelRecord& r) {
    j = json{{"user_id", r.user_id}, {"xp", r.xp}, {"level", r.level}, {"updated_at", r.updated_at}};
}

void to_json(json& j, const LevelUpdate& u) {
    j = json{{"level_up", u.level_up}, {"level", u.level}, {"xp", u.xp}};
}

void to_json(json& j, const SyncQueueItem& item) {
    j = json{
        {"id", item.id},
        {"table_name", item.table_name},
        {"operation", item.operation},
        {"data", item.data},
        {"created_at", item.created_at},
        {"retries", item.retries},
        {"last_error", item.last_error ? json(*item.last_error) : json(nullptr)}
    };
}

} // namespace dualstore
