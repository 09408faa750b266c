#pragma once

#include "dualstore/models.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace dualstore {

// The primary remote store, seen at the level of domain rows.
//
// Implementations throw (RemoteError or a driver exception derived from
// std::exception) on any failure. Calls may block; callers race them against
// deadlines on a worker pool, so implementations must be safe to call from
// several threads at once.
class RemoteDatabase {
public:
    virtual ~RemoteDatabase() = default;

    // Trivial round trip; throws when the store is unreachable
    virtual void ping() = 0;

    // ==================== Guild Settings ====================
    virtual std::optional<GuildSettings> fetch_guild_settings(const std::string& guild_id) = 0;
    virtual void upsert_guild_lang(const std::string& guild_id, const std::string& lang) = 0;
    virtual void upsert_guild_prefix(const std::string& guild_id, const std::string& prefix) = 0;
    virtual void upsert_welcome_channel(const std::string& guild_id,
                                        const std::optional<std::string>& channel_id) = 0;

    // ==================== User Settings ====================
    virtual std::optional<UserSettings> fetch_user_settings(const std::string& user_id) = 0;
    virtual void upsert_user_settings(const UserSettings& settings) = 0;

    // ==================== Economy ====================
    virtual std::optional<int64_t> fetch_balance(const std::string& user_id) = 0;
    // Returns the balance after the addition
    virtual int64_t add_balance(const std::string& user_id, int64_t amount) = 0;
    // Returns the balance after the debit, or nullopt when funds are short
    virtual std::optional<int64_t> remove_balance(const std::string& user_id, int64_t amount) = 0;

    // ==================== Levels ====================
    virtual std::optional<LevelRecord> fetch_level(const std::string& user_id) = 0;
    // Adds xp and returns the row as stored (level not yet bumped)
    virtual LevelRecord add_xp(const std::string& user_id, int64_t amount) = 0;
    virtual void set_level(const std::string& user_id, int level) = 0;

    // Release every connection
    virtual void close() = 0;
};

} // namespace dualstore
