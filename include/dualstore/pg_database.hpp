#pragma once

#include "dualstore/config.hpp"
#include "dualstore/remote_database.hpp"

#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <pqxx/pqxx>

namespace dualstore {

// PostgreSQL implementation of RemoteDatabase on libpqxx.
//
// Connections are opened lazily, up to settings.pool_size, and handed out one
// per call. A connection that breaks is dropped instead of returned.
class PgDatabase : public RemoteDatabase {
public:
    explicit PgDatabase(RemoteSettings settings);
    ~PgDatabase() override;

    // Disable copy
    PgDatabase(const PgDatabase&) = delete;
    PgDatabase& operator=(const PgDatabase&) = delete;

    void ping() override;

    std::optional<GuildSettings> fetch_guild_settings(const std::string& guild_id) override;
    void upsert_guild_lang(const std::string& guild_id, const std::string& lang) override;
    void upsert_guild_prefix(const std::string& guild_id, const std::string& prefix) override;
    void upsert_welcome_channel(const std::string& guild_id,
                                const std::optional<std::string>& channel_id) override;

    std::optional<UserSettings> fetch_user_settings(const std::string& user_id) override;
    void upsert_user_settings(const UserSettings& settings) override;

    std::optional<int64_t> fetch_balance(const std::string& user_id) override;
    int64_t add_balance(const std::string& user_id, int64_t amount) override;
    std::optional<int64_t> remove_balance(const std::string& user_id, int64_t amount) override;

    std::optional<LevelRecord> fetch_level(const std::string& user_id) override;
    LevelRecord add_xp(const std::string& user_id, int64_t amount) override;
    void set_level(const std::string& user_id, int level) override;

    void close() override;

private:
    using Work = std::function<void(pqxx::work&)>;

    // Checks out a connection, runs fn in a transaction and commits.
    // pqxx failures are rethrown as RemoteError.
    void with_transaction(const std::string& what, const Work& fn);

    std::unique_ptr<pqxx::connection> acquire();
    void release(std::unique_ptr<pqxx::connection> conn);

    RemoteSettings settings_;
    std::string conninfo_;

    mutable std::mutex pool_mutex_;
    std::condition_variable pool_cv_;
    std::vector<std::unique_ptr<pqxx::connection>> idle_;
    size_t open_count_ = 0;
    bool closed_ = false;
};

} // namespace dualstore
