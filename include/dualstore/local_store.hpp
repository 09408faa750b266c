#pragma once

#include "dualstore/errors.hpp"
#include "dualstore/models.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <sqlite3.h>

namespace dualstore {

// Durable SQLite copy of every domain entity plus the outbound sync queue.
//
// Every mutating call takes `enqueue`: when true the mutation and its queue
// item are committed in the same transaction. All failures throw StoreError.
class LocalStore {
public:
    LocalStore();
    ~LocalStore();

    // Disable copy
    LocalStore(const LocalStore&) = delete;
    LocalStore& operator=(const LocalStore&) = delete;

    // Open (creating if needed) the database file and its tables
    void initialize(const std::string& db_path = "data/local-backup.db");
    void close();
    bool is_open() const;

    // ==================== Guild Settings ====================
    std::string get_guild_lang(const std::string& guild_id);
    std::string get_guild_prefix(const std::string& guild_id);
    std::optional<std::string> get_welcome_channel(const std::string& guild_id);
    GuildSettings get_guild_settings(const std::string& guild_id);

    void set_guild_lang(const std::string& guild_id, const std::string& lang, bool enqueue = true);
    void set_guild_prefix(const std::string& guild_id, const std::string& prefix, bool enqueue = true);
    void set_welcome_channel(const std::string& guild_id, const std::optional<std::string>& channel_id,
                             bool enqueue = true);

    // ==================== User Settings ====================
    UserSettings get_user_settings(const std::string& user_id);
    void set_user_settings(const UserSettings& settings, bool enqueue = true);

    // ==================== Economy ====================
    int64_t get_balance(const std::string& user_id);

    // Returns the new balance
    int64_t add_money(const std::string& user_id, int64_t amount, bool enqueue = true);

    // Debits only when the balance covers it. Returns the new balance, or
    // nullopt (and queues nothing) when funds are insufficient.
    std::optional<int64_t> remove_money(const std::string& user_id, int64_t amount, bool enqueue = true);

    // ==================== Levels ====================
    LevelRecord get_level(const std::string& user_id);
    LevelUpdate add_xp(const std::string& user_id, int64_t amount, bool enqueue = true);

    // ==================== Sync Queue ====================
    int64_t enqueue_sync(const std::string& table_name, const std::string& operation, const json& data);

    // Oldest drainable items (retries below max_retries)
    std::vector<SyncQueueItem> get_sync_queue(int limit = 100, int max_retries = 5);
    int64_t sync_queue_size(int max_retries = 5);

    void mark_sync_success(int64_t id);
    void mark_sync_failed(int64_t id, const std::string& error);

    // Deletes items older than max_age or with retries >= max_retries
    int clear_old_sync_queue(std::chrono::seconds max_age = std::chrono::hours(24 * 7),
                             int max_retries = 5);

    // ==================== Raw Query ====================
    void execute(const std::string& sql);

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex db_mutex_;

    void create_tables();
    void ensure_open() const;

    // Runs fn inside BEGIN IMMEDIATE / COMMIT, rolling back on exceptions.
    // db_mutex_ must be held.
    template<typename F>
    auto in_transaction(F&& fn) -> decltype(fn());

    void exec_locked(const char* sql);
    int64_t enqueue_locked(const std::string& table_name, const std::string& operation, const json& data);
    GuildSettings read_guild_locked(const std::string& guild_id);
    int64_t read_balance_locked(const std::string& user_id);
    LevelRecord read_level_locked(const std::string& user_id);
};

} // namespace dualstore
