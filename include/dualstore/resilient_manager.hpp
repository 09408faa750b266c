#pragma once

#include "dualstore/cached_remote_store.hpp"
#include "dualstore/config.hpp"
#include "dualstore/local_store.hpp"
#include "dualstore/models.hpp"
#include "dualstore/remote_database.hpp"
#include "dualstore/utils/periodic_timer.hpp"
#include "dualstore/utils/thread_pool.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace dualstore {

// Which store the manager currently treats as authoritative
enum class Mode {
    unknown,   // before initialize()
    disabled,  // remote forced off; local only, for good
    local,     // remote unreachable; writes are queued
    remote     // remote healthy; reads race it, writes go to both
};

const char* to_string(Mode mode);

struct SyncResult {
    int synced = 0;
    int failed = 0;
};

struct ManagerStats {
    Mode mode = Mode::unknown;
    bool available = false;
    std::optional<RemoteCacheStats> remote_cache;  // remote mode only
    int64_t sync_queue_size = 0;
};

void to_json(json& j, const ManagerStats& stats);

// Facade over the local SQLite store and the cached remote database.
//
// Every write lands locally first. While the remote is healthy it is written
// too; otherwise the mutation is queued and replayed by the sync worker once
// a reconnect succeeds. Reads prefer the remote under a short deadline and
// fall back to the local copy. In remote mode a write also seeds the remote
// cache with the local result, so a read right after it sees the new value
// whether or not the remote write has landed.
class ResilientManager {
public:
    // remote may be null, which behaves like a forced offline start
    ResilientManager(ResilienceSettings settings, std::unique_ptr<RemoteDatabase> remote);
    ~ResilientManager();

    // Disable copy
    ResilientManager(const ResilientManager&) = delete;
    ResilientManager& operator=(const ResilientManager&) = delete;

    // Opens the local store (throws StoreError, before any remote contact),
    // then pings the remote and picks the initial mode.
    void initialize();

    // Stops timers, drains once if remote, closes both stores. Safe to call twice.
    void shutdown();

    Mode mode() const { return mode_.load(); }
    bool is_available() const;

    // ==================== Guild Settings ====================
    std::string get_guild_lang(const std::string& guild_id);
    std::string get_guild_prefix(const std::string& guild_id);
    std::optional<std::string> get_welcome_channel(const std::string& guild_id);
    GuildSettings get_guild_settings(const std::string& guild_id);

    void set_guild_lang(const std::string& guild_id, const std::string& lang);
    void set_guild_prefix(const std::string& guild_id, const std::string& prefix);
    void set_welcome_channel(const std::string& guild_id, const std::optional<std::string>& channel_id);

    // ==================== User Settings ====================
    UserSettings get_user_settings(const std::string& user_id);
    void set_user_settings(const UserSettings& settings);

    // ==================== Economy ====================
    int64_t get_balance(const std::string& user_id);

    // Fire-and-forget towards the remote; returns the local balance
    int64_t add_money(const std::string& user_id, int64_t amount);
    std::optional<int64_t> remove_money(const std::string& user_id, int64_t amount);

    // Debits `from` and credits `to`. Refused unless both the balance
    // get_balance() reports and the local balance cover the amount.
    // Returns the payer's remaining balance.
    std::optional<int64_t> transfer_money(const std::string& from, const std::string& to, int64_t amount);

    // ==================== Levels ====================
    LevelRecord get_level(const std::string& user_id);
    LevelUpdate add_xp(const std::string& user_id, int64_t amount);

    // ==================== Sync / health ====================

    // Replays up to sync_batch queued mutations. No-op unless in remote mode.
    SyncResult sync_to_remote();

    // Periodic health check; drops to local mode on failure. Returns true
    // if the manager is still in remote mode afterwards.
    bool check_remote_health();

    // Scheduled reconnect; returns to remote mode and drains on success.
    // Returns true if the manager is in remote mode afterwards.
    bool attempt_reconnect();

    ManagerStats get_stats();

    // Direct access for maintenance and tests
    LocalStore& local_store() { return local_; }

private:
    enum class WriteKind { overwrite, additive };

    // Who drives a transition. Timer threads never block on state_mutex_
    // and never stop their own timer.
    enum class Caller { direct, health_timer, reconnect_timer };

    struct QueuedWrite {
        const char* table_name;
        const char* operation;
        json data;
    };

    template<typename T, typename RemoteRead, typename LocalRead>
    T read_with_fallback(const char* what, RemoteRead remote_read, LocalRead local_read);

    // Awaited remote write, raced against write_timeout
    void write_remote(const char* what, WriteKind kind, std::function<void()> fn, QueuedWrite queued);

    // Detached remote write on the pool
    void dispatch_remote(const char* what, std::function<void()> fn, QueuedWrite queued);

    void requeue(const char* what, const QueuedWrite& queued);
    void replay(const SyncQueueItem& item);

    bool run_health_check(Caller caller);
    bool run_reconnect(Caller caller);
    std::unique_lock<std::mutex> lock_state(Caller caller);

    // Callers hold state_mutex_
    void enter_remote_locked(Caller caller);
    void enter_local_locked(Caller caller);

    void reap_queue();

    ResilienceSettings settings_;
    std::unique_ptr<RemoteDatabase> remote_;
    LocalStore local_;
    ThreadPool pool_;
    std::unique_ptr<CachedRemoteStore> cache_;

    std::atomic<Mode> mode_{Mode::unknown};
    std::atomic<bool> shutting_down_{false};
    bool initialized_ = false;
    std::mutex state_mutex_;

    std::mutex sync_mutex_;
    int sync_cycles_ = 0;

    PeriodicTimer sync_timer_{"sync-worker"};
    PeriodicTimer health_timer_{"health-check"};
    PeriodicTimer reconnect_timer_{"reconnect"};
};

} // namespace dualstore
