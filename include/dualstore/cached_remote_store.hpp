#pragma once

#include "dualstore/bounded_cache.hpp"
#include "dualstore/config.hpp"
#include "dualstore/models.hpp"
#include "dualstore/remote_database.hpp"
#include "dualstore/utils/thread_pool.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace dualstore {

// Why a health check failed; diagnostics only
enum class RemoteFailure {
    none,
    connection_refused,
    timeout,
    host_unresolved,
    other
};

RemoteFailure classify_remote_failure(const std::string& message);
const char* remote_failure_name(RemoteFailure failure);

struct RemoteCacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t total = 0;
    double hit_rate = 0.0;  // percent
    std::map<std::string, CacheStats> caches;
};

void to_json(json& j, const RemoteCacheStats& stats);

// Read-through cached view of the remote database.
//
// Guild family keys: "lang:<id>", "prefix:<id>" (strings) and the composite
// "settings:<id>" (full row). Other families: "user:<id>", "balance:<id>",
// "xp:<id>". Writes touch the cache only after the remote call succeeded;
// prime_* seeds entries with values the caller already holds.
class CachedRemoteStore {
public:
    CachedRemoteStore(RemoteDatabase& remote, ThreadPool& pool, const CacheSettings& caches = CacheSettings{});
    ~CachedRemoteStore();

    // Disable copy
    CachedRemoteStore(const CachedRemoteStore&) = delete;
    CachedRemoteStore& operator=(const CachedRemoteStore&) = delete;

    // Races a ping against timeout; never throws
    bool check_health(std::chrono::milliseconds timeout);
    RemoteFailure last_failure() const { return last_failure_; }

    // ==================== Guild Settings ====================
    std::string get_guild_lang(const std::string& guild_id);
    std::string get_guild_prefix(const std::string& guild_id);
    GuildSettings get_guild_settings(const std::string& guild_id);
    std::optional<std::string> get_welcome_channel(const std::string& guild_id);

    void set_guild_lang(const std::string& guild_id, const std::string& lang);
    void set_guild_prefix(const std::string& guild_id, const std::string& prefix);
    void set_welcome_channel(const std::string& guild_id, const std::optional<std::string>& channel_id);

    // ==================== User Settings ====================
    UserSettings get_user_settings(const std::string& user_id);
    void set_user_settings(const UserSettings& settings);

    // ==================== Economy ====================
    int64_t get_balance(const std::string& user_id);
    int64_t add_money(const std::string& user_id, int64_t amount);
    std::optional<int64_t> remove_money(const std::string& user_id, int64_t amount);

    // ==================== Levels ====================
    LevelRecord get_level(const std::string& user_id);
    LevelUpdate add_xp(const std::string& user_id, int64_t amount);

    // ==================== Cache control ====================

    // No remote call; counts neither hit nor miss
    void prime_guild(const GuildSettings& settings);
    void prime_user_settings(const UserSettings& settings);
    void prime_balance(const std::string& user_id, int64_t balance);
    void prime_level(const LevelRecord& record);

    void invalidate_guild(const std::string& guild_id);
    void invalidate_user(const std::string& user_id);

    RemoteCacheStats stats() const;

    // Stops every cache timer and drops all entries
    void destroy();

private:
    using GuildValue = std::variant<std::string, GuildSettings>;

    std::optional<std::string> cached_guild_string(const std::string& key);
    void record_hit() { ++hits_; }
    void record_miss() { ++misses_; }

    RemoteDatabase& remote_;
    ThreadPool& pool_;

    BoundedCache<GuildValue> guild_cache_;
    BoundedCache<UserSettings> user_cache_;
    BoundedCache<int64_t> economy_cache_;
    BoundedCache<LevelRecord> level_cache_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<RemoteFailure> last_failure_{RemoteFailure::none};
};

} // namespace dualstore
