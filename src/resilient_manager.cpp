#include "dualstore/resilient_manager.hpp"
#include "dualstore/errors.hpp"
#include "dualstore/utils/logger.hpp"

#include <set>

namespace dualstore {

namespace {

const char* LOG_COMPONENT = "database:resilient";

std::string describe_interval(std::chrono::milliseconds interval) {
    if (interval.count() % 60000 == 0) {
        return std::to_string(interval.count() / 60000) + " min";
    }
    if (interval.count() % 1000 == 0) {
        return std::to_string(interval.count() / 1000) + "s";
    }
    return std::to_string(interval.count()) + "ms";
}

std::optional<std::string> optional_string(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return std::nullopt;
}

// Identifies the remote row an item writes, e.g. "economy:123"
std::string sync_row_key(const SyncQueueItem& item) {
    const json& data = item.data;
    for (const char* field : {"guild_id", "user_id"}) {
        auto it = data.find(field);
        if (it != data.end() && it->is_string()) {
            return item.table_name + ":" + it->get<std::string>();
        }
    }
    return item.table_name + ":#" + std::to_string(item.id);
}

} // namespace

const char* to_string(Mode mode) {
    switch (mode) {
        case Mode::unknown: return "unknown";
        case Mode::disabled: return "disabled";
        case Mode::local: return "local";
        case Mode::remote: return "remote";
    }
    return "unknown";
}

void to_json(json& j, const ManagerStats& stats) {
    j = json{
        {"mode", to_string(stats.mode)},
        {"available", stats.available},
        {"sync_queue_size", stats.sync_queue_size}
    };
    if (stats.remote_cache) {
        j["remote_cache"] = *stats.remote_cache;
    }
}

ResilientManager::ResilientManager(ResilienceSettings settings, std::unique_ptr<RemoteDatabase> remote)
    : settings_(std::move(settings)),
      remote_(std::move(remote)),
      pool_(settings_.worker_threads) {
    if (remote_) {
        cache_ = std::make_unique<CachedRemoteStore>(*remote_, pool_, settings_.caches);
    }
}

ResilientManager::~ResilientManager() {
    shutdown();
}

void ResilientManager::initialize() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (shutting_down_) {
        throw StoreError("manager has been shut down");
    }
    if (initialized_) {
        log_warn(LOG_COMPONENT, "initialize() called twice, ignoring");
        return;
    }

    log_info(LOG_COMPONENT, "Initializing resilient data manager...");

    // Fatal: nothing below runs if the local store cannot open
    local_.initialize(settings_.local_db_path);
    initialized_ = true;
    reap_queue();

    if (settings_.force_offline || !remote_) {
        log_warn(LOG_COMPONENT, "Remote database disabled by configuration (DB_DISABLED)");
        mode_ = Mode::disabled;
        log_info(LOG_COMPONENT, "System ready - mode: DISABLED");
        return;
    }

    log_debug(LOG_COMPONENT, "Running initial health check (timeout: " +
              std::to_string(settings_.initial_health_timeout.count()) + "ms)...");

    if (cache_->check_health(settings_.initial_health_timeout)) {
        log_info(LOG_COMPONENT, "PostgreSQL connected - mode: REMOTE");
        enter_remote_locked(Caller::direct);
    } else {
        log_error(LOG_COMPONENT, std::string("Could not reach PostgreSQL (") +
                  remote_failure_name(cache_->last_failure()) + ")");
        log_warn(LOG_COMPONENT, "Fallback mode enabled - using local SQLite only");
        enter_local_locked(Caller::direct);
    }

    log_info(LOG_COMPONENT, std::string("System ready - mode: ") + to_string(mode_.load()));
}

void ResilientManager::shutdown() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (shutting_down_) {
            return;
        }
        shutting_down_ = true;
    }

    log_info(LOG_COMPONENT, "Shutting down resilient data manager...");

    sync_timer_.stop();
    health_timer_.stop();
    reconnect_timer_.stop();

    if (mode_ == Mode::remote) {
        try {
            SyncResult result = sync_to_remote();
            log_info(LOG_COMPONENT, "Final sync: " + std::to_string(result.synced) + " OK, " +
                     std::to_string(result.failed) + " failed");
        } catch (const std::exception& e) {
            log_error(LOG_COMPONENT, std::string("Final sync failed: ") + e.what());
        }
    }

    // Waits for detached remote writes; they may still touch both stores
    pool_.shutdown();

    if (cache_) {
        cache_->destroy();
    }
    local_.close();
    if (remote_) {
        remote_->close();
    }

    log_info(LOG_COMPONENT, "Shutdown complete");
}

bool ResilientManager::is_available() const {
    Mode mode = mode_.load();
    return mode != Mode::unknown && local_.is_open();
}

// ==================== Read / write plumbing ====================

template<typename T, typename RemoteRead, typename LocalRead>
T ResilientManager::read_with_fallback(const char* what, RemoteRead remote_read, LocalRead local_read) {
    if (mode_ == Mode::remote) {
        try {
            return run_with_timeout(pool_, std::move(remote_read), settings_.read_timeout, what);
        } catch (const std::exception& e) {
            log_debug(LOG_COMPONENT, std::string(what) + ": using local copy (" + e.what() + ")");
        }
    }
    return local_read();
}

void ResilientManager::write_remote(const char* what, WriteKind kind, std::function<void()> fn,
                                    QueuedWrite queued) {
    try {
        run_with_timeout(pool_, std::move(fn), settings_.write_timeout, what);
    } catch (const TimeoutError& e) {
        log_warn(LOG_COMPONENT, std::string(what) + ": " + e.what());
        // The write may still land; replaying an additive one could apply it twice
        if (kind == WriteKind::overwrite) {
            requeue(what, queued);
        }
    } catch (const std::exception& e) {
        log_warn(LOG_COMPONENT, std::string(what) + " failed on remote: " + e.what());
        requeue(what, queued);
    }
}

void ResilientManager::dispatch_remote(const char* what, std::function<void()> fn, QueuedWrite queued) {
    auto task = [this, what, fn = std::move(fn), queued]() {
        try {
            fn();
        } catch (const std::exception& e) {
            log_warn(LOG_COMPONENT, std::string(what) + " failed on remote: " + e.what());
            try {
                requeue(what, queued);
            } catch (const std::exception& store_error) {
                log_error(LOG_COMPONENT, std::string(what) + " could not be queued: " + store_error.what());
            }
        }
    };

    try {
        pool_.enqueue(std::move(task));
    } catch (const std::exception& e) {
        log_warn(LOG_COMPONENT, std::string(what) + " not dispatched: " + e.what());
        requeue(what, queued);
    }
}

void ResilientManager::requeue(const char* what, const QueuedWrite& queued) {
    if (!settings_.requeue_failed_remote_writes) {
        log_debug(LOG_COMPONENT, std::string(what) + " not queued (requeue disabled)");
        return;
    }
    int64_t id = local_.enqueue_sync(queued.table_name, queued.operation, queued.data);
    log_debug(LOG_COMPONENT, std::string(what) + " queued for sync (id: " + std::to_string(id) + ")");
}

// ==================== Guild Settings ====================

std::string ResilientManager::get_guild_lang(const std::string& guild_id) {
    return read_with_fallback<std::string>("get_guild_lang",
        [this, guild_id]() { return cache_->get_guild_lang(guild_id); },
        [this, &guild_id]() { return local_.get_guild_lang(guild_id); });
}

std::string ResilientManager::get_guild_prefix(const std::string& guild_id) {
    return read_with_fallback<std::string>("get_guild_prefix",
        [this, guild_id]() { return cache_->get_guild_prefix(guild_id); },
        [this, &guild_id]() { return local_.get_guild_prefix(guild_id); });
}

std::optional<std::string> ResilientManager::get_welcome_channel(const std::string& guild_id) {
    return read_with_fallback<std::optional<std::string>>("get_welcome_channel",
        [this, guild_id]() { return cache_->get_welcome_channel(guild_id); },
        [this, &guild_id]() { return local_.get_welcome_channel(guild_id); });
}

GuildSettings ResilientManager::get_guild_settings(const std::string& guild_id) {
    return read_with_fallback<GuildSettings>("get_guild_settings",
        [this, guild_id]() { return cache_->get_guild_settings(guild_id); },
        [this, &guild_id]() { return local_.get_guild_settings(guild_id); });
}

void ResilientManager::set_guild_lang(const std::string& guild_id, const std::string& lang) {
    Mode mode = mode_.load();
    local_.set_guild_lang(guild_id, lang, mode != Mode::remote);

    if (mode == Mode::remote) {
        cache_->prime_guild(local_.get_guild_settings(guild_id));
        write_remote("set_guild_lang", WriteKind::overwrite,
            [this, guild_id, lang]() { cache_->set_guild_lang(guild_id, lang); },
            {sync_table::GUILD_SETTINGS, sync_op::UPDATE, {{"guild_id", guild_id}, {"lang", lang}}});
    }
}

void ResilientManager::set_guild_prefix(const std::string& guild_id, const std::string& prefix) {
    Mode mode = mode_.load();
    local_.set_guild_prefix(guild_id, prefix, mode != Mode::remote);

    if (mode == Mode::remote) {
        cache_->prime_guild(local_.get_guild_settings(guild_id));
        write_remote("set_guild_prefix", WriteKind::overwrite,
            [this, guild_id, prefix]() { cache_->set_guild_prefix(guild_id, prefix); },
            {sync_table::GUILD_SETTINGS, sync_op::UPDATE, {{"guild_id", guild_id}, {"prefix", prefix}}});
    }
}

void ResilientManager::set_welcome_channel(const std::string& guild_id,
                                           const std::optional<std::string>& channel_id) {
    Mode mode = mode_.load();
    local_.set_welcome_channel(guild_id, channel_id, mode != Mode::remote);

    if (mode == Mode::remote) {
        cache_->prime_guild(local_.get_guild_settings(guild_id));
        json data = {{"guild_id", guild_id}};
        data["welcome_channel_id"] = channel_id ? json(*channel_id) : json(nullptr);
        write_remote("set_welcome_channel", WriteKind::overwrite,
            [this, guild_id, channel_id]() { cache_->set_welcome_channel(guild_id, channel_id); },
            {sync_table::GUILD_SETTINGS, sync_op::UPDATE, std::move(data)});
    }
}

// ==================== User Settings ====================

UserSettings ResilientManager::get_user_settings(const std::string& user_id) {
    return read_with_fallback<UserSettings>("get_user_settings",
        [this, user_id]() { return cache_->get_user_settings(user_id); },
        [this, &user_id]() { return local_.get_user_settings(user_id); });
}

void ResilientManager::set_user_settings(const UserSettings& settings) {
    Mode mode = mode_.load();
    local_.set_user_settings(settings, mode != Mode::remote);

    if (mode == Mode::remote) {
        cache_->prime_user_settings(local_.get_user_settings(settings.user_id));
        write_remote("set_user_settings", WriteKind::overwrite,
            [this, settings]() { cache_->set_user_settings(settings); },
            {sync_table::USER_SETTINGS, sync_op::UPDATE, json(settings)});
    }
}

// ==================== Economy ====================

int64_t ResilientManager::get_balance(const std::string& user_id) {
    return read_with_fallback<int64_t>("get_balance",
        [this, user_id]() { return cache_->get_balance(user_id); },
        [this, &user_id]() { return local_.get_balance(user_id); });
}

int64_t ResilientManager::add_money(const std::string& user_id, int64_t amount) {
    Mode mode = mode_.load();
    int64_t balance = local_.add_money(user_id, amount, mode != Mode::remote);

    if (mode == Mode::remote) {
        cache_->prime_balance(user_id, balance);
        dispatch_remote("add_money",
            [this, user_id, amount]() { cache_->add_money(user_id, amount); },
            {sync_table::ECONOMY, sync_op::ADD, {{"user_id", user_id}, {"amount", amount}}});
    }
    return balance;
}

std::optional<int64_t> ResilientManager::remove_money(const std::string& user_id, int64_t amount) {
    Mode mode = mode_.load();
    auto balance = local_.remove_money(user_id, amount, mode != Mode::remote);

    if (balance && mode == Mode::remote) {
        cache_->prime_balance(user_id, *balance);
        dispatch_remote("remove_money",
            [this, user_id, amount]() {
                if (!cache_->remove_money(user_id, amount)) {
                    log_warn(LOG_COMPONENT, "remove_money: remote balance of " + user_id +
                             " does not cover " + std::to_string(amount));
                }
            },
            {sync_table::ECONOMY, sync_op::REMOVE, {{"user_id", user_id}, {"amount", amount}}});
    }
    return balance;
}

std::optional<int64_t> ResilientManager::transfer_money(const std::string& from, const std::string& to,
                                                        int64_t amount) {
    if (amount <= 0 || get_balance(from) < amount) {
        return std::nullopt;
    }
    auto remaining = remove_money(from, amount);
    if (remaining) {
        add_money(to, amount);
    }
    return remaining;
}

// ==================== Levels ====================

LevelRecord ResilientManager::get_level(const std::string& user_id) {
    return read_with_fallback<LevelRecord>("get_level",
        [this, user_id]() { return cache_->get_level(user_id); },
        [this, &user_id]() { return local_.get_level(user_id); });
}

LevelUpdate ResilientManager::add_xp(const std::string& user_id, int64_t amount) {
    Mode mode = mode_.load();
    LevelUpdate update = local_.add_xp(user_id, amount, mode != Mode::remote);

    if (mode == Mode::remote) {
        LevelRecord record;
        record.user_id = user_id;
        record.xp = update.xp;
        record.level = update.level;
        cache_->prime_level(record);
        dispatch_remote("add_xp",
            [this, user_id, amount]() { cache_->add_xp(user_id, amount); },
            {sync_table::LEVELS, sync_op::ADD_XP, {{"user_id", user_id}, {"amount", amount}}});
    }
    return update;
}

// ==================== Sync worker ====================

void ResilientManager::replay(const SyncQueueItem& item) {
    const json& data = item.data;

    if (item.table_name == sync_table::GUILD_SETTINGS && item.operation == sync_op::UPDATE) {
        std::string guild_id = data.at("guild_id").get<std::string>();
        if (data.contains("lang")) {
            cache_->set_guild_lang(guild_id, data["lang"].get<std::string>());
        }
        if (data.contains("prefix")) {
            cache_->set_guild_prefix(guild_id, data["prefix"].get<std::string>());
        }
        if (data.contains("welcome_channel_id")) {
            cache_->set_welcome_channel(guild_id, optional_string(data["welcome_channel_id"]));
        }
    } else if (item.table_name == sync_table::USER_SETTINGS && item.operation == sync_op::UPDATE) {
        cache_->set_user_settings(data.get<UserSettings>());
    } else if (item.table_name == sync_table::ECONOMY && item.operation == sync_op::ADD) {
        cache_->add_money(data.at("user_id").get<std::string>(), data.at("amount").get<int64_t>());
    } else if (item.table_name == sync_table::ECONOMY && item.operation == sync_op::REMOVE) {
        std::string user_id = data.at("user_id").get<std::string>();
        int64_t amount = data.at("amount").get<int64_t>();
        if (!cache_->remove_money(user_id, amount)) {
            // Retrying cannot make the remote balance larger
            log_warn(LOG_COMPONENT, "Queued debit of " + std::to_string(amount) + " for " + user_id +
                     " exceeds the remote balance, dropping it");
        }
    } else if (item.table_name == sync_table::LEVELS && item.operation == sync_op::ADD_XP) {
        cache_->add_xp(data.at("user_id").get<std::string>(), data.at("amount").get<int64_t>());
    } else {
        throw StoreError("unsupported sync operation " + item.table_name + "." + item.operation);
    }
}

SyncResult ResilientManager::sync_to_remote() {
    SyncResult result;
    if (mode_ != Mode::remote) {
        log_debug(LOG_COMPONENT, "Sync skipped: mode is not remote");
        return result;
    }

    std::lock_guard<std::mutex> lock(sync_mutex_);

    auto queue = local_.get_sync_queue(settings_.sync_batch, settings_.max_retries);
    if (queue.empty()) {
        log_debug(LOG_COMPONENT, "Sync skipped: queue empty");
    } else {
        log_debug(LOG_COMPONENT, "Syncing " + std::to_string(queue.size()) + " pending operations...");
    }

    // Rows with a failed item in this batch; their later items wait so
    // replays never overtake each other
    std::set<std::string> held_rows;

    for (const auto& item : queue) {
        if (mode_ != Mode::remote) {
            log_debug(LOG_COMPONENT, "Sync interrupted: remote mode lost");
            break;
        }

        std::string row = sync_row_key(item);
        if (held_rows.count(row) > 0) {
            log_debug(LOG_COMPONENT, "Sync deferred for item " + std::to_string(item.id) +
                      ": earlier change to " + row + " failed");
            continue;
        }

        std::optional<std::string> error;
        try {
            run_with_timeout(pool_, [this, item]() { replay(item); }, settings_.write_timeout, "sync item");
        } catch (const std::exception& e) {
            error = e.what();
        }

        if (error) {
            held_rows.insert(row);
            local_.mark_sync_failed(item.id, *error);
            ++result.failed;
            log_debug(LOG_COMPONENT, "Sync failed for item " + std::to_string(item.id) + ": " + *error);
        } else {
            local_.mark_sync_success(item.id);
            ++result.synced;
            log_debug(LOG_COMPONENT, "Synced " + item.table_name + "." + item.operation +
                      " (id: " + std::to_string(item.id) + ")");
        }
    }

    if (result.synced > 0 || result.failed > 0) {
        log_info(LOG_COMPONENT, "Sync completed: " + std::to_string(result.synced) + " OK, " +
                 std::to_string(result.failed) + " failed");
    }

    if (++sync_cycles_ >= settings_.reap_every_syncs) {
        sync_cycles_ = 0;
        reap_queue();
    }

    return result;
}

void ResilientManager::reap_queue() {
    int cleaned = local_.clear_old_sync_queue(settings_.queue_retention, settings_.max_retries);
    if (cleaned > 0) {
        log_info(LOG_COMPONENT, "Removed " + std::to_string(cleaned) + " old sync queue entries");
    }
}

// ==================== Health / reconnect ====================

std::unique_lock<std::mutex> ResilientManager::lock_state(Caller caller) {
    if (caller == Caller::direct) {
        return std::unique_lock<std::mutex>(state_mutex_);
    }
    // A transition already in flight will stop or restart this timer
    return std::unique_lock<std::mutex>(state_mutex_, std::try_to_lock);
}

bool ResilientManager::check_remote_health() {
    return run_health_check(Caller::direct);
}

bool ResilientManager::attempt_reconnect() {
    return run_reconnect(Caller::direct);
}

bool ResilientManager::run_health_check(Caller caller) {
    if (shutting_down_ || mode_ != Mode::remote) {
        return false;
    }

    if (cache_->check_health(settings_.health_timeout)) {
        return true;
    }

    auto lock = lock_state(caller);
    if (!lock.owns_lock() || shutting_down_ || mode_ != Mode::remote) {
        return mode_ == Mode::remote;
    }

    log_warn(LOG_COMPONENT, std::string("PostgreSQL connection lost (") +
             remote_failure_name(cache_->last_failure()) + ") - switching to LOCAL mode");
    enter_local_locked(caller);
    return false;
}

bool ResilientManager::run_reconnect(Caller caller) {
    if (shutting_down_ || mode_ != Mode::local) {
        return mode_ == Mode::remote;
    }

    log_info(LOG_COMPONENT, "Attempting to reconnect to PostgreSQL...");
    if (!cache_->check_health(settings_.initial_health_timeout)) {
        log_debug(LOG_COMPONENT, "Reconnect failed, retrying in " + describe_interval(settings_.reconnect_interval));
        return false;
    }

    {
        auto lock = lock_state(caller);
        if (!lock.owns_lock() || shutting_down_ || mode_ != Mode::local) {
            return mode_ == Mode::remote;
        }
        log_info(LOG_COMPONENT, "PostgreSQL reconnected - restoring REMOTE mode");
        enter_remote_locked(caller);
    }

    int64_t pending = local_.sync_queue_size(settings_.max_retries);
    if (pending > 0) {
        log_info(LOG_COMPONENT, "Starting sync of " + std::to_string(pending) + " pending operations...");
        sync_to_remote();
    }
    return mode_ == Mode::remote;
}

void ResilientManager::enter_remote_locked(Caller caller) {
    mode_ = Mode::remote;

    if (caller != Caller::reconnect_timer) {
        reconnect_timer_.stop();
    }

    sync_timer_.start(settings_.sync_interval, [this]() {
        if (shutting_down_ || mode_ != Mode::remote) {
            return false;
        }
        sync_to_remote();
        return true;
    });
    health_timer_.start(settings_.health_check_interval, [this]() {
        return run_health_check(Caller::health_timer);
    });

    log_info(LOG_COMPONENT, "Sync worker started (every " + describe_interval(settings_.sync_interval) + ")");
    log_debug(LOG_COMPONENT, "Health check started (every " +
              describe_interval(settings_.health_check_interval) + ")");
}

void ResilientManager::enter_local_locked(Caller caller) {
    mode_ = Mode::local;

    sync_timer_.stop();
    if (caller != Caller::health_timer) {
        health_timer_.stop();
    }

    reconnect_timer_.start(settings_.reconnect_interval, [this]() {
        bool remote = run_reconnect(Caller::reconnect_timer);
        return !remote && !shutting_down_ && mode_ == Mode::local;
    });

    log_debug(LOG_COMPONENT, "Reconnect scheduled every " + describe_interval(settings_.reconnect_interval));
}

ManagerStats ResilientManager::get_stats() {
    ManagerStats stats;
    stats.mode = mode_.load();
    stats.available = is_available();
    if (stats.mode == Mode::remote && cache_) {
        stats.remote_cache = cache_->stats();
    }
    if (local_.is_open()) {
        stats.sync_queue_size = local_.sync_queue_size(settings_.max_retries);
    }
    return stats;
}

} // namespace dualstore
