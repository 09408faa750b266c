#include "dualstore/pg_database.hpp"
#include "dualstore/errors.hpp"
#include "dualstore/utils/logger.hpp"

namespace dualstore {

namespace {

const char* LOG_COMPONENT = "database:remote";

} // namespace

PgDatabase::PgDatabase(RemoteSettings settings)
    : settings_(std::move(settings)), conninfo_(settings_.connection_string()) {
    if (settings_.pool_size == 0) {
        settings_.pool_size = 1;
    }
}

PgDatabase::~PgDatabase() {
    close();
}

std::unique_ptr<pqxx::connection> PgDatabase::acquire() {
    std::unique_lock<std::mutex> lock(pool_mutex_);
    pool_cv_.wait(lock, [this] {
        return closed_ || !idle_.empty() || open_count_ < settings_.pool_size;
    });

    if (closed_) {
        throw RemoteError("connection pool is closed");
    }

    if (!idle_.empty()) {
        auto conn = std::move(idle_.back());
        idle_.pop_back();
        return conn;
    }

    // Reserve the slot, then connect without holding the lock
    ++open_count_;
    lock.unlock();
    try {
        auto conn = std::make_unique<pqxx::connection>(conninfo_);
        log_debug(LOG_COMPONENT, "PostgreSQL connection opened");
        return conn;
    } catch (const std::exception&) {
        lock.lock();
        --open_count_;
        lock.unlock();
        pool_cv_.notify_one();
        throw;
    }
}

void PgDatabase::release(std::unique_ptr<pqxx::connection> conn) {
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (conn && conn->is_open() && !closed_) {
            idle_.push_back(std::move(conn));
        } else {
            --open_count_;
        }
    }
    pool_cv_.notify_one();
}

void PgDatabase::with_transaction(const std::string& what, const Work& fn) {
    std::unique_ptr<pqxx::connection> conn;
    try {
        conn = acquire();
    } catch (const RemoteError&) {
        throw;
    } catch (const std::exception& e) {
        throw RemoteError(what + ": " + e.what());
    }

    try {
        pqxx::work txn(*conn);
        fn(txn);
        txn.commit();
    } catch (const pqxx::broken_connection& e) {
        conn.reset();
        release(nullptr);
        throw RemoteError(what + ": " + e.what());
    } catch (const std::exception& e) {
        release(std::move(conn));
        throw RemoteError(what + ": " + e.what());
    }

    release(std::move(conn));
}

void PgDatabase::ping() {
    with_transaction("ping", [](pqxx::work& txn) {
        txn.exec("SELECT 1");
    });
}

// ==================== Guild Settings ====================

std::optional<GuildSettings> PgDatabase::fetch_guild_settings(const std::string& guild_id) {
    std::optional<GuildSettings> settings;
    with_transaction("fetch_guild_settings", [&](pqxx::work& txn) {
        pqxx::result r = txn.exec_params(
            "SELECT lang, prefix, welcome_channel_id, "
            "EXTRACT(EPOCH FROM updated_at)::BIGINT "
            "FROM guild_settings WHERE guild_id = $1",
            guild_id);
        if (r.empty()) {
            return;
        }
        GuildSettings s;
        s.guild_id = guild_id;
        if (!r[0][0].is_null()) s.lang = r[0][0].as<std::string>();
        if (!r[0][1].is_null()) s.prefix = r[0][1].as<std::string>();
        if (!r[0][2].is_null()) s.welcome_channel_id = r[0][2].as<std::string>();
        if (!r[0][3].is_null()) s.updated_at = r[0][3].as<int64_t>();
        settings = s;
    });
    return settings;
}

void PgDatabase::upsert_guild_lang(const std::string& guild_id, const std::string& lang) {
    with_transaction("upsert_guild_lang", [&](pqxx::work& txn) {
        txn.exec_params(
            "INSERT INTO guild_settings (guild_id, lang, updated_at) "
            "VALUES ($1, $2, NOW()) "
            "ON CONFLICT (guild_id) "
            "DO UPDATE SET lang = $2, updated_at = NOW()",
            guild_id, lang);
    });
}

void PgDatabase::upsert_guild_prefix(const std::string& guild_id, const std::string& prefix) {
    with_transaction("upsert_guild_prefix", [&](pqxx::work& txn) {
        txn.exec_params(
            "INSERT INTO guild_settings (guild_id, prefix, updated_at) "
            "VALUES ($1, $2, NOW()) "
            "ON CONFLICT (guild_id) "
            "DO UPDATE SET prefix = $2, updated_at = NOW()",
            guild_id, prefix);
    });
}

void PgDatabase::upsert_welcome_channel(const std::string& guild_id,
                                        const std::optional<std::string>& channel_id) {
    with_transaction("upsert_welcome_channel", [&](pqxx::work& txn) {
        txn.exec_params(
            "INSERT INTO guild_settings (guild_id, welcome_channel_id, updated_at) "
            "VALUES ($1, $2, NOW()) "
            "ON CONFLICT (guild_id) "
            "DO UPDATE SET welcome_channel_id = $2, updated_at = NOW()",
            guild_id, channel_id);
    });
}

// ==================== User Settings ====================

std::optional<UserSettings> PgDatabase::fetch_user_settings(const std::string& user_id) {
    std::optional<UserSettings> settings;
    with_transaction("fetch_user_settings", [&](pqxx::work& txn) {
        pqxx::result r = txn.exec_params(
            "SELECT dm_notifications, level_up_messages, timezone "
            "FROM user_settings WHERE user_id = $1",
            user_id);
        if (r.empty()) {
            return;
        }
        UserSettings s;
        s.user_id = user_id;
        if (!r[0][0].is_null()) s.dm_notifications = r[0][0].as<bool>();
        if (!r[0][1].is_null()) s.level_up_messages = r[0][1].as<bool>();
        if (!r[0][2].is_null()) s.timezone = r[0][2].as<std::string>();
        settings = s;
    });
    return settings;
}

void PgDatabase::upsert_user_settings(const UserSettings& settings) {
    with_transaction("upsert_user_settings", [&](pqxx::work& txn) {
        txn.exec_params(
            "INSERT INTO user_settings (user_id, dm_notifications, level_up_messages, timezone, updated_at) "
            "VALUES ($1, $2, $3, $4, NOW()) "
            "ON CONFLICT (user_id) "
            "DO UPDATE SET dm_notifications = $2, level_up_messages = $3, timezone = $4, updated_at = NOW()",
            settings.user_id, settings.dm_notifications, settings.level_up_messages, settings.timezone);
    });
}

// ==================== Economy ====================

std::optional<int64_t> PgDatabase::fetch_balance(const std::string& user_id) {
    std::optional<int64_t> balance;
    with_transaction("fetch_balance", [&](pqxx::work& txn) {
        pqxx::result r = txn.exec_params("SELECT balance FROM economy WHERE user_id = $1", user_id);
        if (!r.empty() && !r[0][0].is_null()) {
            balance = r[0][0].as<int64_t>();
        }
    });
    return balance;
}

int64_t PgDatabase::add_balance(const std::string& user_id, int64_t amount) {
    int64_t balance = 0;
    with_transaction("add_balance", [&](pqxx::work& txn) {
        pqxx::result r = txn.exec_params(
            "INSERT INTO economy (user_id, balance, updated_at) "
            "VALUES ($1, $2, NOW()) "
            "ON CONFLICT (user_id) "
            "DO UPDATE SET balance = economy.balance + $2, updated_at = NOW() "
            "RETURNING balance",
            user_id, amount);
        balance = r[0][0].as<int64_t>();
    });
    return balance;
}

std::optional<int64_t> PgDatabase::remove_balance(const std::string& user_id, int64_t amount) {
    std::optional<int64_t> balance;
    with_transaction("remove_balance", [&](pqxx::work& txn) {
        pqxx::result r = txn.exec_params(
            "UPDATE economy SET balance = balance - $1, updated_at = NOW() "
            "WHERE user_id = $2 AND balance >= $1 "
            "RETURNING balance",
            amount, user_id);
        if (!r.empty()) {
            balance = r[0][0].as<int64_t>();
        }
    });
    return balance;
}

// ==================== Levels ====================

std::optional<LevelRecord> PgDatabase::fetch_level(const std::string& user_id) {
    std::optional<LevelRecord> record;
    with_transaction("fetch_level", [&](pqxx::work& txn) {
        pqxx::result r = txn.exec_params("SELECT xp, level FROM levels WHERE user_id = $1", user_id);
        if (r.empty()) {
            return;
        }
        LevelRecord rec;
        rec.user_id = user_id;
        rec.xp = r[0][0].as<int64_t>();
        rec.level = r[0][1].as<int>();
        record = rec;
    });
    return record;
}

LevelRecord PgDatabase::add_xp(const std::string& user_id, int64_t amount) {
    LevelRecord record;
    record.user_id = user_id;
    with_transaction("add_xp", [&](pqxx::work& txn) {
        pqxx::result r = txn.exec_params(
            "INSERT INTO levels (user_id, xp, level, updated_at) "
            "VALUES ($1, $2, 1, NOW()) "
            "ON CONFLICT (user_id) "
            "DO UPDATE SET xp = levels.xp + $2, updated_at = NOW() "
            "RETURNING xp, level",
            user_id, amount);
        record.xp = r[0][0].as<int64_t>();
        record.level = r[0][1].as<int>();
    });
    return record;
}

void PgDatabase::set_level(const std::string& user_id, int level) {
    with_transaction("set_level", [&](pqxx::work& txn) {
        txn.exec_params("UPDATE levels SET level = $1, updated_at = NOW() WHERE user_id = $2", level, user_id);
    });
}

void PgDatabase::close() {
    std::vector<std::unique_ptr<pqxx::connection>> to_close;
    {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (closed_) return;
        closed_ = true;
        to_close.swap(idle_);
        open_count_ -= to_close.size();
    }
    pool_cv_.notify_all();

    // Connections close on destruction
    to_close.clear();
    log_info(LOG_COMPONENT, "PostgreSQL pool closed");
}

} // namespace dualstore
