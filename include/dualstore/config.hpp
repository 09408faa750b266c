#pragma once

#include "dualstore/utils/logger.hpp"

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace dualstore {

// TTL and capacity for one cache family
struct CacheLimits {
    std::chrono::milliseconds ttl;
    size_t max_size;
};

struct CacheSettings {
    CacheLimits guild_settings{std::chrono::minutes(30), 500};
    CacheLimits user_settings{std::chrono::minutes(30), 1000};
    CacheLimits economy{std::chrono::minutes(10), 2000};
    CacheLimits levels{std::chrono::minutes(5), 2000};
    std::chrono::milliseconds cleanup_interval{std::chrono::minutes(5)};
};

// Tunables of the resilient manager
struct ResilienceSettings {
    bool force_offline = false;
    std::string local_db_path = "data/local-backup.db";

    std::chrono::milliseconds initial_health_timeout{3000};
    std::chrono::milliseconds health_timeout{2000};
    std::chrono::milliseconds read_timeout{800};
    std::chrono::milliseconds write_timeout{1000};

    std::chrono::milliseconds sync_interval{std::chrono::seconds(60)};
    std::chrono::milliseconds health_check_interval{std::chrono::seconds(30)};
    std::chrono::milliseconds reconnect_interval{std::chrono::minutes(5)};

    int sync_batch = 100;
    std::chrono::seconds queue_retention{std::chrono::hours(24 * 7)};
    int max_retries = 5;
    // Drain cycles between two queue reaps
    int reap_every_syncs = 60;

    // Queue a mutation whose direct remote write failed while in remote mode
    bool requeue_failed_remote_writes = true;

    size_t worker_threads = 4;
    CacheSettings caches;
};

// PostgreSQL connection parameters
struct RemoteSettings {
    std::string host = "localhost";
    int port = 5432;
    std::string user;
    std::string password;
    std::string database;
    bool ssl = false;
    int connect_timeout_seconds = 3;
    size_t pool_size = 10;

    // Server-side statement cap; 0 keeps the server default
    int statement_timeout_ms = 0;

    // A silent peer is dropped after idle + interval * count seconds
    int keepalive_idle_seconds = 10;
    int keepalive_interval_seconds = 5;
    int keepalive_count = 3;

    // libpq key/value connection string
    std::string connection_string() const;
};

class Config {
public:
    Config();

    // Load configuration from a .env file. Keys missing from the file fall
    // back to the process environment. Returns false if the file could not
    // be read; defaults and environment values still apply then.
    bool load(const std::string& env_path = ".env");

    // Get configuration values
    std::string get_token() const { return token_; }
    const ResilienceSettings& get_resilience_settings() const { return resilience_; }
    const RemoteSettings& get_remote_settings() const { return remote_; }
    LogLevel get_log_level() const { return log_level_; }

    // Raw lookup (file first, then environment)
    std::optional<std::string> get(const std::string& key) const;

    // The bot needs a token; the store layer does not
    bool is_valid() const;

private:
    std::string token_;
    ResilienceSettings resilience_;
    RemoteSettings remote_;
    LogLevel log_level_ = LogLevel::info;

    std::map<std::string, std::string> env_values_;

    void apply_values();
    void read_millis(const std::string& key, std::chrono::milliseconds& target) const;
    void read_int(const std::string& key, int& target) const;
    void read_bool(const std::string& key, bool& target) const;
};

} // namespace dualstore
