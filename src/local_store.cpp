#include "dualstore/local_store.hpp"
#include "dualstore/utils/logger.hpp"
#include <filesystem>
#include <type_traits>

namespace dualstore {

namespace {

const char* LOG_COMPONENT = "database:local";

int64_t unix_now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

// Owns one prepared statement
class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw StoreError(std::string("prepare failed: ") + sqlite3_errmsg(db_));
        }
    }

    ~Statement() {
        sqlite3_finalize(stmt_);
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    Statement& bind(int index, const std::string& value) {
        check(sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT));
        return *this;
    }

    Statement& bind(int index, int64_t value) {
        check(sqlite3_bind_int64(stmt_, index, value));
        return *this;
    }

    Statement& bind(int index, const std::optional<std::string>& value) {
        if (value) {
            return bind(index, *value);
        }
        check(sqlite3_bind_null(stmt_, index));
        return *this;
    }

    // True while a row is available
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw StoreError(std::string("step failed: ") + sqlite3_errmsg(db_));
    }

    void run() {
        while (step()) {}
    }

    int64_t column_int64(int col) const {
        return sqlite3_column_int64(stmt_, col);
    }

    std::optional<std::string> column_text(int col) const {
        if (sqlite3_column_type(stmt_, col) == SQLITE_NULL) {
            return std::nullopt;
        }
        return std::string(reinterpret_cast<const char*>(sqlite3_column_text(stmt_, col)));
    }

private:
    void check(int rc) {
        if (rc != SQLITE_OK) {
            throw StoreError(std::string("bind failed: ") + sqlite3_errmsg(db_));
        }
    }

    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace

LocalStore::LocalStore() {}

LocalStore::~LocalStore() {
    close();
}

void LocalStore::initialize(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(db_mutex_);

    if (db_) {
        throw StoreError("local store already initialized");
    }

    // Create data directory if it doesn't exist
    std::filesystem::path path(db_path);
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            throw StoreError("cannot create directory " + path.parent_path().string() + ": " + ec.message());
        }
    }

    int rc = sqlite3_open(db_path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw StoreError("cannot open database " + db_path + ": " + message);
    }

    try {
        // WAL mode for concurrent readers; the pragma also forces a header read,
        // so a corrupt file fails here
        exec_locked("PRAGMA foreign_keys = ON;");
        exec_locked("PRAGMA journal_mode = WAL;");
        create_tables();
    } catch (const StoreError&) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw;
    }

    log_info(LOG_COMPONENT, "SQLite backup initialized at " + db_path);
}

void LocalStore::close() {
    std::lock_guard<std::mutex> lock(db_mutex_);
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

bool LocalStore::is_open() const {
    std::lock_guard<std::mutex> lock(db_mutex_);
    return db_ != nullptr;
}

void LocalStore::ensure_open() const {
    if (!db_) {
        throw StoreError("local store is not open");
    }
}

void LocalStore::exec_locked(const char* sql) {
    char* error_msg = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &error_msg);
    if (rc != SQLITE_OK) {
        std::string message = error_msg ? error_msg : sqlite3_errmsg(db_);
        sqlite3_free(error_msg);
        throw StoreError("SQL error: " + message);
    }
}

void LocalStore::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS guild_settings (
            guild_id TEXT PRIMARY KEY,
            lang TEXT DEFAULT 'en',
            prefix TEXT DEFAULT 'r!',
            welcome_channel_id TEXT DEFAULT NULL,
            updated_at INTEGER DEFAULT (strftime('%s', 'now'))
        );

        CREATE TABLE IF NOT EXISTS user_settings (
            user_id TEXT PRIMARY KEY,
            dm_notifications INTEGER DEFAULT 1,
            level_up_messages INTEGER DEFAULT 1,
            timezone TEXT DEFAULT 'UTC',
            updated_at INTEGER DEFAULT (strftime('%s', 'now'))
        );

        CREATE TABLE IF NOT EXISTS economy (
            user_id TEXT PRIMARY KEY,
            balance INTEGER DEFAULT 0,
            updated_at INTEGER DEFAULT (strftime('%s', 'now'))
        );

        CREATE TABLE IF NOT EXISTS levels (
            user_id TEXT PRIMARY KEY,
            xp INTEGER DEFAULT 0,
            level INTEGER DEFAULT 1,
            updated_at INTEGER DEFAULT (strftime('%s', 'now'))
        );

        -- Outbound operations not yet confirmed by the remote store
        CREATE TABLE IF NOT EXISTS sync_queue (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            table_name TEXT NOT NULL,
            operation TEXT NOT NULL,
            data TEXT NOT NULL,
            created_at INTEGER DEFAULT (strftime('%s', 'now')),
            retries INTEGER DEFAULT 0,
            last_error TEXT
        );
        CREATE INDEX IF NOT EXISTS idx_sync_queue_created ON sync_queue(created_at);
    )";

    exec_locked(sql);
}

template<typename F>
auto LocalStore::in_transaction(F&& fn) -> decltype(fn()) {
    exec_locked("BEGIN IMMEDIATE;");
    try {
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            exec_locked("COMMIT;");
        } else {
            auto result = fn();
            exec_locked("COMMIT;");
            return result;
        }
    } catch (const std::exception&) {
        sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
        throw;
    }
}

void LocalStore::execute(const std::string& sql) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();
    exec_locked(sql.c_str());
}

// ==================== Guild Settings ====================

GuildSettings LocalStore::read_guild_locked(const std::string& guild_id) {
    Statement stmt(db_, "SELECT lang, prefix, welcome_channel_id, updated_at FROM guild_settings WHERE guild_id = ?");
    stmt.bind(1, guild_id);

    GuildSettings settings;
    settings.guild_id = guild_id;
    if (stmt.step()) {
        settings.lang = stmt.column_text(0).value_or(DEFAULT_LANG);
        settings.prefix = stmt.column_text(1).value_or(DEFAULT_PREFIX);
        settings.welcome_channel_id = stmt.column_text(2);
        settings.updated_at = stmt.column_int64(3);
    }
    return settings;
}

GuildSettings LocalStore::get_guild_settings(const std::string& guild_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();
    return read_guild_locked(guild_id);
}

std::string LocalStore::get_guild_lang(const std::string& guild_id) {
    return get_guild_settings(guild_id).lang;
}

std::string LocalStore::get_guild_prefix(const std::string& guild_id) {
    return get_guild_settings(guild_id).prefix;
}

std::optional<std::string> LocalStore::get_welcome_channel(const std::string& guild_id) {
    return get_guild_settings(guild_id).welcome_channel_id;
}

void LocalStore::set_guild_lang(const std::string& guild_id, const std::string& lang, bool enqueue) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    in_transaction([&]() {
        Statement stmt(db_, R"(
            INSERT INTO guild_settings (guild_id, lang, updated_at)
            VALUES (?, ?, strftime('%s', 'now'))
            ON CONFLICT(guild_id)
            DO UPDATE SET lang = excluded.lang, updated_at = excluded.updated_at
        )");
        stmt.bind(1, guild_id).bind(2, lang).run();

        if (enqueue) {
            enqueue_locked(sync_table::GUILD_SETTINGS, sync_op::UPDATE, {{"guild_id", guild_id}, {"lang", lang}});
        }
    });
}

void LocalStore::set_guild_prefix(const std::string& guild_id, const std::string& prefix, bool enqueue) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    in_transaction([&]() {
        Statement stmt(db_, R"(
            INSERT INTO guild_settings (guild_id, prefix, updated_at)
            VALUES (?, ?, strftime('%s', 'now'))
            ON CONFLICT(guild_id)
            DO UPDATE SET prefix = excluded.prefix, updated_at = excluded.updated_at
        )");
        stmt.bind(1, guild_id).bind(2, prefix).run();

        if (enqueue) {
            enqueue_locked(sync_table::GUILD_SETTINGS, sync_op::UPDATE, {{"guild_id", guild_id}, {"prefix", prefix}});
        }
    });
}

void LocalStore::set_welcome_channel(const std::string& guild_id, const std::optional<std::string>& channel_id,
                                     bool enqueue) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    in_transaction([&]() {
        Statement stmt(db_, R"(
            INSERT INTO guild_settings (guild_id, welcome_channel_id, updated_at)
            VALUES (?, ?, strftime('%s', 'now'))
            ON CONFLICT(guild_id)
            DO UPDATE SET welcome_channel_id = excluded.welcome_channel_id, updated_at = excluded.updated_at
        )");
        stmt.bind(1, guild_id).bind(2, channel_id).run();

        if (enqueue) {
            json data = {{"guild_id", guild_id}};
            data["welcome_channel_id"] = channel_id ? json(*channel_id) : json(nullptr);
            enqueue_locked(sync_table::GUILD_SETTINGS, sync_op::UPDATE, data);
        }
    });
}

// ==================== User Settings ====================

UserSettings LocalStore::get_user_settings(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    Statement stmt(db_, R"(
        SELECT dm_notifications, level_up_messages, timezone, updated_at
        FROM user_settings WHERE user_id = ?
    )");
    stmt.bind(1, user_id);

    UserSettings settings;
    settings.user_id = user_id;
    if (stmt.step()) {
        settings.dm_notifications = stmt.column_int64(0) != 0;
        settings.level_up_messages = stmt.column_int64(1) != 0;
        settings.timezone = stmt.column_text(2).value_or(DEFAULT_TIMEZONE);
        settings.updated_at = stmt.column_int64(3);
    }
    return settings;
}

void LocalStore::set_user_settings(const UserSettings& settings, bool enqueue) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    std::string timezone = settings.timezone.empty() ? DEFAULT_TIMEZONE : settings.timezone;

    in_transaction([&]() {
        Statement stmt(db_, R"(
            INSERT INTO user_settings (user_id, dm_notifications, level_up_messages, timezone, updated_at)
            VALUES (?, ?, ?, ?, strftime('%s', 'now'))
            ON CONFLICT(user_id)
            DO UPDATE SET
                dm_notifications = excluded.dm_notifications,
                level_up_messages = excluded.level_up_messages,
                timezone = excluded.timezone,
                updated_at = excluded.updated_at
        )");
        stmt.bind(1, settings.user_id)
            .bind(2, int64_t{settings.dm_notifications ? 1 : 0})
            .bind(3, int64_t{settings.level_up_messages ? 1 : 0})
            .bind(4, timezone)
            .run();

        if (enqueue) {
            enqueue_locked(sync_table::USER_SETTINGS, sync_op::UPDATE, {
                {"user_id", settings.user_id},
                {"dm_notifications", settings.dm_notifications},
                {"level_up_messages", settings.level_up_messages},
                {"timezone", timezone}
            });
        }
    });
}

// ==================== Economy ====================

int64_t LocalStore::read_balance_locked(const std::string& user_id) {
    Statement stmt(db_, "SELECT balance FROM economy WHERE user_id = ?");
    stmt.bind(1, user_id);
    return stmt.step() ? stmt.column_int64(0) : 0;
}

int64_t LocalStore::get_balance(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();
    return read_balance_locked(user_id);
}

int64_t LocalStore::add_money(const std::string& user_id, int64_t amount, bool enqueue) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    return in_transaction([&]() {
        Statement stmt(db_, R"(
            INSERT INTO economy (user_id, balance, updated_at)
            VALUES (?, ?, strftime('%s', 'now'))
            ON CONFLICT(user_id)
            DO UPDATE SET balance = balance + excluded.balance, updated_at = excluded.updated_at
        )");
        stmt.bind(1, user_id).bind(2, amount).run();

        if (enqueue) {
            enqueue_locked(sync_table::ECONOMY, sync_op::ADD, {{"user_id", user_id}, {"amount", amount}});
        }
        return read_balance_locked(user_id);
    });
}

std::optional<int64_t> LocalStore::remove_money(const std::string& user_id, int64_t amount, bool enqueue) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    return in_transaction([&]() -> std::optional<int64_t> {
        Statement stmt(db_, R"(
            UPDATE economy
            SET balance = balance - ?, updated_at = strftime('%s', 'now')
            WHERE user_id = ? AND balance >= ?
        )");
        stmt.bind(1, amount).bind(2, user_id).bind(3, amount).run();

        if (sqlite3_changes(db_) == 0) {
            return std::nullopt;
        }
        if (enqueue) {
            enqueue_locked(sync_table::ECONOMY, sync_op::REMOVE, {{"user_id", user_id}, {"amount", amount}});
        }
        return read_balance_locked(user_id);
    });
}

// ==================== Levels ====================

LevelRecord LocalStore::read_level_locked(const std::string& user_id) {
    Statement stmt(db_, "SELECT xp, level, updated_at FROM levels WHERE user_id = ?");
    stmt.bind(1, user_id);

    LevelRecord record;
    record.user_id = user_id;
    if (stmt.step()) {
        record.xp = stmt.column_int64(0);
        record.level = static_cast<int>(stmt.column_int64(1));
        record.updated_at = stmt.column_int64(2);
    }
    return record;
}

LevelRecord LocalStore::get_level(const std::string& user_id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();
    return read_level_locked(user_id);
}

LevelUpdate LocalStore::add_xp(const std::string& user_id, int64_t amount, bool enqueue) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    return in_transaction([&]() {
        Statement stmt(db_, R"(
            INSERT INTO levels (user_id, xp, level, updated_at)
            VALUES (?, ?, 1, strftime('%s', 'now'))
            ON CONFLICT(user_id)
            DO UPDATE SET xp = xp + excluded.xp, updated_at = excluded.updated_at
        )");
        stmt.bind(1, user_id).bind(2, amount).run();

        LevelRecord record = read_level_locked(user_id);
        int computed = level_for_xp(record.xp);

        LevelUpdate update;
        update.xp = record.xp;
        update.level = record.level;
        if (computed > record.level) {
            Statement bump(db_, "UPDATE levels SET level = ?, updated_at = strftime('%s', 'now') WHERE user_id = ?");
            bump.bind(1, int64_t{computed}).bind(2, user_id).run();
            update.level_up = true;
            update.level = computed;
        }

        if (enqueue) {
            enqueue_locked(sync_table::LEVELS, sync_op::ADD_XP, {{"user_id", user_id}, {"amount", amount}});
        }
        return update;
    });
}

// ==================== Sync Queue ====================

int64_t LocalStore::enqueue_locked(const std::string& table_name, const std::string& operation, const json& data) {
    Statement stmt(db_, "INSERT INTO sync_queue (table_name, operation, data, created_at) VALUES (?, ?, ?, ?)");
    stmt.bind(1, table_name).bind(2, operation).bind(3, data.dump()).bind(4, unix_now()).run();
    return sqlite3_last_insert_rowid(db_);
}

int64_t LocalStore::enqueue_sync(const std::string& table_name, const std::string& operation, const json& data) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();
    return enqueue_locked(table_name, operation, data);
}

std::vector<SyncQueueItem> LocalStore::get_sync_queue(int limit, int max_retries) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    Statement stmt(db_, R"(
        SELECT id, table_name, operation, data, created_at, retries, last_error
        FROM sync_queue
        WHERE retries < ?
        ORDER BY created_at ASC, id ASC
        LIMIT ?
    )");
    stmt.bind(1, int64_t{max_retries}).bind(2, int64_t{limit});

    std::vector<SyncQueueItem> items;
    while (stmt.step()) {
        SyncQueueItem item;
        item.id = stmt.column_int64(0);
        item.table_name = stmt.column_text(1).value_or("");
        item.operation = stmt.column_text(2).value_or("");
        std::string raw = stmt.column_text(3).value_or("{}");
        item.data = json::parse(raw, nullptr, false);
        if (item.data.is_discarded()) {
            log_warn(LOG_COMPONENT, "sync item " + std::to_string(item.id) + " has unreadable payload");
            item.data = json::object();
        }
        item.created_at = stmt.column_int64(4);
        item.retries = static_cast<int>(stmt.column_int64(5));
        item.last_error = stmt.column_text(6);
        items.push_back(std::move(item));
    }
    return items;
}

int64_t LocalStore::sync_queue_size(int max_retries) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    Statement stmt(db_, "SELECT COUNT(*) FROM sync_queue WHERE retries < ?");
    stmt.bind(1, int64_t{max_retries});
    return stmt.step() ? stmt.column_int64(0) : 0;
}

void LocalStore::mark_sync_success(int64_t id) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    Statement stmt(db_, "DELETE FROM sync_queue WHERE id = ?");
    stmt.bind(1, id).run();
}

void LocalStore::mark_sync_failed(int64_t id, const std::string& error) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    Statement stmt(db_, "UPDATE sync_queue SET retries = retries + 1, last_error = ? WHERE id = ?");
    stmt.bind(1, error).bind(2, id).run();
}

int LocalStore::clear_old_sync_queue(std::chrono::seconds max_age, int max_retries) {
    std::lock_guard<std::mutex> lock(db_mutex_);
    ensure_open();

    int64_t cutoff = unix_now() - max_age.count();
    Statement stmt(db_, "DELETE FROM sync_queue WHERE created_at < ? OR retries >= ?");
    stmt.bind(1, cutoff).bind(2, int64_t{max_retries}).run();
    return sqlite3_changes(db_);
}

} // namespace dualstore
