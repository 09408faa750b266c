#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace dualstore {

using json = nlohmann::json;

inline constexpr const char* DEFAULT_LANG = "en";
inline constexpr const char* DEFAULT_PREFIX = "r!";
inline constexpr const char* DEFAULT_TIMEZONE = "UTC";
inline constexpr int64_t XP_PER_LEVEL = 1000;

// ==================== Domain entities ====================

struct GuildSettings {
    std::string guild_id;
    std::string lang = DEFAULT_LANG;
    std::string prefix = DEFAULT_PREFIX;
    std::optional<std::string> welcome_channel_id;
    int64_t updated_at = 0;
};

struct UserSettings {
    std::string user_id;
    bool dm_notifications = true;
    bool level_up_messages = true;
    std::string timezone = DEFAULT_TIMEZONE;
    int64_t updated_at = 0;
};

struct EconomyRecord {
    std::string user_id;
    int64_t balance = 0;
    int64_t updated_at = 0;
};

struct LevelRecord {
    std::string user_id;
    int64_t xp = 0;
    int level = 1;
    int64_t updated_at = 0;
};

// Outcome of an add_xp call. `level` is the level after the call.
struct LevelUpdate {
    bool level_up = false;
    int level = 1;
    int64_t xp = 0;
};

// level = floor(xp / 1000) + 1
inline int level_for_xp(int64_t xp) {
    if (xp < 0) {
        return 1;
    }
    return static_cast<int>(xp / XP_PER_LEVEL) + 1;
}

// ==================== Sync queue ====================

namespace sync_table {
inline constexpr const char* GUILD_SETTINGS = "guild_settings";
inline constexpr const char* USER_SETTINGS = "user_settings";
inline constexpr const char* ECONOMY = "economy";
inline constexpr const char* LEVELS = "levels";
} // namespace sync_table

namespace sync_op {
inline constexpr const char* UPDATE = "UPDATE";
inline constexpr const char* ADD = "ADD";
inline constexpr const char* REMOVE = "REMOVE";
inline constexpr const char* ADD_XP = "ADD_XP";
} // namespace sync_op

struct SyncQueueItem {
    int64_t id = 0;
    std::string table_name;
    std::string operation;
    json data;
    int64_t created_at = 0;
    int retries = 0;
    std::optional<std::string> last_error;
};

// ==================== JSON ====================

void to_json(json& j, const GuildSettings& s);
void from_json(const json& j, GuildSettings& s);
void to_json(json& j, const UserSettings& s);
void from_json(const json& j, UserSettings& s);
void to_json(json& j, const LevelRecord& r);
void to_json(json& j, const LevelUpdate& u);
void to_json(json& j, const SyncQueueItem& item);

} // namespace dualstore
