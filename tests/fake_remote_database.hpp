#pragma once

#include "dualstore/errors.hpp"
#include "dualstore/remote_database.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <initializer_list>
#include <map>
#include <mutex>
#include <thread>

namespace dualstore {
namespace test {

// In-memory RemoteDatabase whose health, failures and latency are scriptable
class FakeRemoteDatabase : public RemoteDatabase {
public:
    std::atomic<bool> healthy{true};
    std::atomic<bool> fail_reads{false};
    std::atomic<bool> fail_writes{false};
    std::atomic<int> latency_ms{0};
    // The next N writes fail, then writes succeed again
    std::atomic<int> fail_next_writes{0};

    std::atomic<int> pings{0};
    std::atomic<int> fetches{0};
    std::atomic<int> writes{0};
    std::atomic<bool> closed{false};

    // Results for the next pings, consumed in order; `healthy` applies after
    void script_health(std::initializer_list<bool> results) {
        std::lock_guard<std::mutex> lock(mutex_);
        health_script_.assign(results.begin(), results.end());
    }

    void ping() override {
        ++pings;
        delay();
        bool ok = healthy.load();
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!health_script_.empty()) {
                ok = health_script_.front();
                health_script_.pop_front();
            }
        }
        if (!ok) {
            throw RemoteError("could not connect to server: Connection refused");
        }
    }

    std::optional<GuildSettings> fetch_guild_settings(const std::string& guild_id) override {
        begin_read();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = guilds_.find(guild_id);
        if (it == guilds_.end()) return std::nullopt;
        return it->second;
    }

    void upsert_guild_lang(const std::string& guild_id, const std::string& lang) override {
        begin_write();
        std::lock_guard<std::mutex> lock(mutex_);
        guild_row(guild_id).lang = lang;
    }

    void upsert_guild_prefix(const std::string& guild_id, const std::string& prefix) override {
        begin_write();
        std::lock_guard<std::mutex> lock(mutex_);
        guild_row(guild_id).prefix = prefix;
    }

    void upsert_welcome_channel(const std::string& guild_id,
                                const std::optional<std::string>& channel_id) override {
        begin_write();
        std::lock_guard<std::mutex> lock(mutex_);
        guild_row(guild_id).welcome_channel_id = channel_id;
    }

    std::optional<UserSettings> fetch_user_settings(const std::string& user_id) override {
        begin_read();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(user_id);
        if (it == users_.end()) return std::nullopt;
        return it->second;
    }

    void upsert_user_settings(const UserSettings& settings) override {
        begin_write();
        std::lock_guard<std::mutex> lock(mutex_);
        users_[settings.user_id] = settings;
    }

    std::optional<int64_t> fetch_balance(const std::string& user_id) override {
        begin_read();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = balances_.find(user_id);
        if (it == balances_.end()) return std::nullopt;
        return it->second;
    }

    int64_t add_balance(const std::string& user_id, int64_t amount) override {
        begin_write();
        std::lock_guard<std::mutex> lock(mutex_);
        return balances_[user_id] += amount;
    }

    std::optional<int64_t> remove_balance(const std::string& user_id, int64_t amount) override {
        begin_write();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = balances_.find(user_id);
        if (it == balances_.end() || it->second < amount) return std::nullopt;
        return it->second -= amount;
    }

    std::optional<LevelRecord> fetch_level(const std::string& user_id) override {
        begin_read();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = levels_.find(user_id);
        if (it == levels_.end()) return std::nullopt;
        return it->second;
    }

    LevelRecord add_xp(const std::string& user_id, int64_t amount) override {
        begin_write();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = levels_.find(user_id);
        if (it == levels_.end()) {
            LevelRecord record;
            record.user_id = user_id;
            it = levels_.emplace(user_id, record).first;
        }
        it->second.xp += amount;
        return it->second;
    }

    void set_level(const std::string& user_id, int level) override {
        begin_write();
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = levels_.find(user_id);
        if (it != levels_.end()) {
            it->second.level = level;
        }
    }

    void close() override {
        closed = true;
    }

    // ==================== Inspection (no counters, no failures) ====================

    std::optional<GuildSettings> guild(const std::string& guild_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = guilds_.find(guild_id);
        if (it == guilds_.end()) return std::nullopt;
        return it->second;
    }

    std::optional<UserSettings> user(const std::string& user_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = users_.find(user_id);
        if (it == users_.end()) return std::nullopt;
        return it->second;
    }

    int64_t balance(const std::string& user_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = balances_.find(user_id);
        return it == balances_.end() ? 0 : it->second;
    }

    LevelRecord level(const std::string& user_id) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = levels_.find(user_id);
        if (it == levels_.end()) {
            LevelRecord record;
            record.user_id = user_id;
            return record;
        }
        return it->second;
    }

    void seed_balance(const std::string& user_id, int64_t balance) {
        std::lock_guard<std::mutex> lock(mutex_);
        balances_[user_id] = balance;
    }

    void seed_guild(const GuildSettings& settings) {
        std::lock_guard<std::mutex> lock(mutex_);
        guilds_[settings.guild_id] = settings;
    }

private:
    void delay() {
        int ms = latency_ms.load();
        if (ms > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(ms));
        }
    }

    void begin_read() {
        ++fetches;
        delay();
        if (fail_reads || !healthy) {
            throw RemoteError("read failed: connection refused");
        }
    }

    void begin_write() {
        delay();
        if (fail_writes || !healthy) {
            throw RemoteError("write failed: connection refused");
        }
        int pending = fail_next_writes.load();
        while (pending > 0 && !fail_next_writes.compare_exchange_weak(pending, pending - 1)) {
        }
        if (pending > 0) {
            throw RemoteError("write failed: server closed the connection unexpectedly");
        }
        ++writes;
    }

    GuildSettings& guild_row(const std::string& guild_id) {
        auto it = guilds_.find(guild_id);
        if (it == guilds_.end()) {
            GuildSettings settings;
            settings.guild_id = guild_id;
            it = guilds_.emplace(guild_id, settings).first;
        }
        return it->second;
    }

    std::mutex mutex_;
    std::deque<bool> health_script_;
    std::map<std::string, GuildSettings> guilds_;
    std::map<std::string, UserSettings> users_;
    std::map<std::string, int64_t> balances_;
    std::map<std::string, LevelRecord> levels_;
};

} // namespace test
} // namespace dualstore
