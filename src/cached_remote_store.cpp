#include "dualstore/cached_remote_store.hpp"
#include "dualstore/utils/logger.hpp"
#include "dualstore/utils/string_utils.hpp"

namespace dualstore {

namespace {

const char* LOG_COMPONENT = "database:remote";

std::string guild_key(const char* field, const std::string& guild_id) {
    return std::string(field) + ":" + guild_id;
}

} // namespace

RemoteFailure classify_remote_failure(const std::string& message) {
    std::string m = string_utils::to_lower(message);
    if (m.find("connection refused") != std::string::npos || m.find("econnrefused") != std::string::npos) {
        return RemoteFailure::connection_refused;
    }
    if (m.find("could not translate host name") != std::string::npos ||
        m.find("name or service not known") != std::string::npos ||
        m.find("enotfound") != std::string::npos) {
        return RemoteFailure::host_unresolved;
    }
    if (m.find("timeout") != std::string::npos || m.find("timed out") != std::string::npos ||
        m.find("etimedout") != std::string::npos) {
        return RemoteFailure::timeout;
    }
    return RemoteFailure::other;
}

const char* remote_failure_name(RemoteFailure failure) {
    switch (failure) {
        case RemoteFailure::none: return "none";
        case RemoteFailure::connection_refused: return "connection_refused";
        case RemoteFailure::timeout: return "timeout";
        case RemoteFailure::host_unresolved: return "host_unresolved";
        case RemoteFailure::other: return "other";
    }
    return "other";
}

void to_json(json& j, const RemoteCacheStats& stats) {
    j = json{
        {"hits", stats.hits},
        {"misses", stats.misses},
        {"total", stats.total},
        {"hit_rate", string_utils::format_percent(stats.hits, stats.total)},
        {"caches", json::object()}
    };
    for (const auto& [name, cache] : stats.caches) {
        j["caches"][name] = json{{"size", cache.size}, {"max_size", cache.max_size}, {"keys", cache.keys}};
    }
}

CachedRemoteStore::CachedRemoteStore(RemoteDatabase& remote, ThreadPool& pool, const CacheSettings& caches)
    : remote_(remote),
      pool_(pool),
      guild_cache_(caches.guild_settings.ttl, caches.guild_settings.max_size, caches.cleanup_interval, "guild_settings"),
      user_cache_(caches.user_settings.ttl, caches.user_settings.max_size, caches.cleanup_interval, "user_settings"),
      economy_cache_(caches.economy.ttl, caches.economy.max_size, caches.cleanup_interval, "economy"),
      level_cache_(caches.levels.ttl, caches.levels.max_size, caches.cleanup_interval, "levels") {}

CachedRemoteStore::~CachedRemoteStore() {
    destroy();
}

bool CachedRemoteStore::check_health(std::chrono::milliseconds timeout) {
    log_debug(LOG_COMPONENT, "Health check started (timeout: " + std::to_string(timeout.count()) + "ms)");
    auto start = std::chrono::steady_clock::now();

    try {
        // The health check can outlive this call, so it holds only the database
        run_with_timeout(pool_, [&remote = remote_]() { remote.ping(); }, timeout, "health check");

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        log_debug(LOG_COMPONENT, "Health check passed in " + std::to_string(elapsed) + "ms");
        last_failure_ = RemoteFailure::none;
        return true;
    } catch (const TimeoutError& e) {
        last_failure_ = RemoteFailure::timeout;
        log_debug(LOG_COMPONENT, std::string("Health check failed: ") + e.what() +
                  " (probable cause: PostgreSQL responding too slowly)");
    } catch (const std::exception& e) {
        RemoteFailure failure = classify_remote_failure(e.what());
        last_failure_ = failure;

        std::string cause;
        switch (failure) {
            case RemoteFailure::connection_refused:
                cause = "PostgreSQL is not running or the port is blocked";
                break;
            case RemoteFailure::timeout:
                cause = "slow network or a firewall dropping packets";
                break;
            case RemoteFailure::host_unresolved:
                cause = "host not found, check DB_HOST";
                break;
            default:
                cause = "unknown";
                break;
        }
        log_debug(LOG_COMPONENT, std::string("Health check failed: ") + e.what() +
                  " [" + remote_failure_name(failure) + ", probable cause: " + cause + "]");
    }
    return false;
}

// ==================== Guild Settings ====================

std::optional<std::string> CachedRemoteStore::cached_guild_string(const std::string& key) {
    auto cached = guild_cache_.get(key);
    if (cached) {
        if (auto* value = std::get_if<std::string>(&*cached)) {
            return *value;
        }
    }
    return std::nullopt;
}

std::string CachedRemoteStore::get_guild_lang(const std::string& guild_id) {
    std::string key = guild_key("lang", guild_id);
    if (auto cached = cached_guild_string(key)) {
        record_hit();
        return *cached;
    }

    record_miss();
    auto row = remote_.fetch_guild_settings(guild_id);
    std::string lang = row ? row->lang : DEFAULT_LANG;
    guild_cache_.set(key, lang);
    return lang;
}

std::string CachedRemoteStore::get_guild_prefix(const std::string& guild_id) {
    std::string key = guild_key("prefix", guild_id);
    if (auto cached = cached_guild_string(key)) {
        record_hit();
        return *cached;
    }

    record_miss();
    auto row = remote_.fetch_guild_settings(guild_id);
    std::string prefix = row ? row->prefix : DEFAULT_PREFIX;
    guild_cache_.set(key, prefix);
    return prefix;
}

GuildSettings CachedRemoteStore::get_guild_settings(const std::string& guild_id) {
    std::string key = guild_key("settings", guild_id);
    auto cached = guild_cache_.get(key);
    if (cached) {
        if (auto* settings = std::get_if<GuildSettings>(&*cached)) {
            record_hit();
            return *settings;
        }
    }

    record_miss();
    auto row = remote_.fetch_guild_settings(guild_id);
    GuildSettings settings;
    if (row) {
        settings = *row;
    } else {
        settings.guild_id = guild_id;
    }
    guild_cache_.set(key, settings);
    return settings;
}

std::optional<std::string> CachedRemoteStore::get_welcome_channel(const std::string& guild_id) {
    return get_guild_settings(guild_id).welcome_channel_id;
}

void CachedRemoteStore::set_guild_lang(const std::string& guild_id, const std::string& lang) {
    remote_.upsert_guild_lang(guild_id, lang);
    guild_cache_.set(guild_key("lang", guild_id), lang);
    guild_cache_.remove(guild_key("settings", guild_id));
}

void CachedRemoteStore::set_guild_prefix(const std::string& guild_id, const std::string& prefix) {
    remote_.upsert_guild_prefix(guild_id, prefix);
    guild_cache_.set(guild_key("prefix", guild_id), prefix);
    guild_cache_.remove(guild_key("settings", guild_id));
}

void CachedRemoteStore::set_welcome_channel(const std::string& guild_id,
                                            const std::optional<std::string>& channel_id) {
    remote_.upsert_welcome_channel(guild_id, channel_id);
    guild_cache_.remove(guild_key("settings", guild_id));
}

// ==================== User Settings ====================

UserSettings CachedRemoteStore::get_user_settings(const std::string& user_id) {
    std::string key = "user:" + user_id;
    if (auto cached = user_cache_.get(key)) {
        record_hit();
        return *cached;
    }

    record_miss();
    auto row = remote_.fetch_user_settings(user_id);
    UserSettings settings;
    if (row) {
        settings = *row;
    } else {
        settings.user_id = user_id;
    }
    user_cache_.set(key, settings);
    return settings;
}

void CachedRemoteStore::set_user_settings(const UserSettings& settings) {
    remote_.upsert_user_settings(settings);
    user_cache_.remove("user:" + settings.user_id);
}

// ==================== Economy ====================

int64_t CachedRemoteStore::get_balance(const std::string& user_id) {
    std::string key = "balance:" + user_id;
    if (auto cached = economy_cache_.get(key)) {
        record_hit();
        return *cached;
    }

    record_miss();
    int64_t balance = remote_.fetch_balance(user_id).value_or(0);
    economy_cache_.set(key, balance);
    return balance;
}

int64_t CachedRemoteStore::add_money(const std::string& user_id, int64_t amount) {
    int64_t balance = remote_.add_balance(user_id, amount);
    economy_cache_.set("balance:" + user_id, balance);
    return balance;
}

std::optional<int64_t> CachedRemoteStore::remove_money(const std::string& user_id, int64_t amount) {
    auto balance = remote_.remove_balance(user_id, amount);
    if (balance) {
        economy_cache_.set("balance:" + user_id, *balance);
    }
    return balance;
}

// ==================== Levels ====================

LevelRecord CachedRemoteStore::get_level(const std::string& user_id) {
    std::string key = "xp:" + user_id;
    if (auto cached = level_cache_.get(key)) {
        record_hit();
        return *cached;
    }

    record_miss();
    auto row = remote_.fetch_level(user_id);
    LevelRecord record;
    if (row) {
        record = *row;
    } else {
        record.user_id = user_id;
    }
    level_cache_.set(key, record);
    return record;
}

LevelUpdate CachedRemoteStore::add_xp(const std::string& user_id, int64_t amount) {
    LevelRecord record = remote_.add_xp(user_id, amount);
    int computed = level_for_xp(record.xp);

    LevelUpdate update;
    update.xp = record.xp;
    update.level = record.level;
    if (computed > record.level) {
        remote_.set_level(user_id, computed);
        record.level = computed;
        update.level_up = true;
        update.level = computed;
    }

    level_cache_.set("xp:" + user_id, record);
    return update;
}

// ==================== Cache control ====================

void CachedRemoteStore::prime_guild(const GuildSettings& settings) {
    guild_cache_.set(guild_key("lang", settings.guild_id), settings.lang);
    guild_cache_.set(guild_key("prefix", settings.guild_id), settings.prefix);
    guild_cache_.set(guild_key("settings", settings.guild_id), settings);
}

void CachedRemoteStore::prime_user_settings(const UserSettings& settings) {
    user_cache_.set("user:" + settings.user_id, settings);
}

void CachedRemoteStore::prime_balance(const std::string& user_id, int64_t balance) {
    economy_cache_.set("balance:" + user_id, balance);
}

void CachedRemoteStore::prime_level(const LevelRecord& record) {
    level_cache_.set("xp:" + record.user_id, record);
}

void CachedRemoteStore::invalidate_guild(const std::string& guild_id) {
    guild_cache_.remove(guild_key("settings", guild_id));
    guild_cache_.remove(guild_key("lang", guild_id));
    guild_cache_.remove(guild_key("prefix", guild_id));
}

void CachedRemoteStore::invalidate_user(const std::string& user_id) {
    user_cache_.remove("user:" + user_id);
    economy_cache_.remove("balance:" + user_id);
    level_cache_.remove("xp:" + user_id);
}

RemoteCacheStats CachedRemoteStore::stats() const {
    RemoteCacheStats result;
    result.hits = hits_.load();
    result.misses = misses_.load();
    result.total = result.hits + result.misses;
    result.hit_rate = result.total > 0
        ? static_cast<double>(result.hits) / static_cast<double>(result.total) * 100.0
        : 0.0;
    result.caches["guild_settings"] = guild_cache_.stats();
    result.caches["user_settings"] = user_cache_.stats();
    result.caches["economy"] = economy_cache_.stats();
    result.caches["levels"] = level_cache_.stats();
    return result;
}

void CachedRemoteStore::destroy() {
    guild_cache_.destroy();
    user_cache_.destroy();
    economy_cache_.destroy();
    level_cache_.destroy();
}

} // namespace dualstore
