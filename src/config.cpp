#include "dualstore/config.hpp"
#include "dualstore/utils/string_utils.hpp"
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace dualstore {

std::string RemoteSettings::connection_string() const {
    auto quote = [](const std::string& value) {
        std::string escaped;
        for (char c : value) {
            if (c == '\'' || c == '\\') {
                escaped += '\\';
            }
            escaped += c;
        }
        return "'" + escaped + "'";
    };

    std::ostringstream ss;
    ss << "host=" << quote(host) << " port=" << port;
    if (!user.empty()) ss << " user=" << quote(user);
    if (!password.empty()) ss << " password=" << quote(password);
    if (!database.empty()) ss << " dbname=" << quote(database);
    ss << " sslmode=" << (ssl ? "require" : "disable");
    ss << " connect_timeout=" << connect_timeout_seconds;
    ss << " keepalives=1 keepalives_idle=" << keepalive_idle_seconds
       << " keepalives_interval=" << keepalive_interval_seconds
       << " keepalives_count=" << keepalive_count;
    if (statement_timeout_ms > 0) {
        ss << " options=" << quote("-c statement_timeout=" + std::to_string(statement_timeout_ms));
    }
    return ss.str();
}

Config::Config() {}

bool Config::load(const std::string& env_path) {
    bool file_read = true;
    std::ifstream file(env_path);
    if (!file.is_open()) {
        log_warn("config", "Could not open .env file: " + env_path + ", using environment only");
        file_read = false;
    }

    std::string line;
    while (file_read && std::getline(file, line)) {
        // Skip empty lines and comments
        std::string trimmed = string_utils::trim(line);
        if (trimmed.empty() || trimmed[0] == '#') {
            continue;
        }

        // Find the = separator
        size_t pos = trimmed.find('=');
        if (pos == std::string::npos) {
            continue;
        }

        std::string key = string_utils::trim(trimmed.substr(0, pos));
        std::string value = string_utils::trim(trimmed.substr(pos + 1));

        // Remove quotes if present
        if (value.size() >= 2 && ((value.front() == '"' && value.back() == '"') ||
                                   (value.front() == '\'' && value.back() == '\''))) {
            value = value.substr(1, value.size() - 2);
        }

        env_values_[key] = value;
    }

    apply_values();
    return file_read;
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = env_values_.find(key);
    if (it != env_values_.end()) {
        return it->second;
    }
    const char* env = std::getenv(key.c_str());
    if (env != nullptr) {
        return std::string(env);
    }
    return std::nullopt;
}

void Config::read_millis(const std::string& key, std::chrono::milliseconds& target) const {
    auto value = get(key);
    if (!value) return;
    auto parsed = string_utils::parse_int(*value);
    if (parsed && *parsed >= 0) {
        target = std::chrono::milliseconds(*parsed);
    } else {
        log_warn("config", "Ignoring invalid value for " + key + ": " + *value);
    }
}

void Config::read_int(const std::string& key, int& target) const {
    auto value = get(key);
    if (!value) return;
    auto parsed = string_utils::parse_int(*value);
    if (parsed && *parsed >= 0) {
        target = static_cast<int>(*parsed);
    } else {
        log_warn("config", "Ignoring invalid value for " + key + ": " + *value);
    }
}

void Config::read_bool(const std::string& key, bool& target) const {
    auto value = get(key);
    if (!value) return;
    auto parsed = string_utils::parse_bool(*value);
    if (parsed) {
        target = *parsed;
    } else {
        log_warn("config", "Ignoring invalid value for " + key + ": " + *value);
    }
}

void Config::apply_values() {
    token_ = get("DISCORD_BOT_TOKEN").value_or("");

    if (auto level = get("LOG_LEVEL")) {
        log_level_ = parse_log_level(*level);
    }

    // Remote connection
    if (auto host = get("DB_HOST"); host && !host->empty()) remote_.host = *host;
    read_int("DB_PORT", remote_.port);
    remote_.user = get("DB_USER").value_or(remote_.user);
    remote_.password = get("DB_PASSWORD").value_or(remote_.password);
    remote_.database = get("DB_NAME").value_or(remote_.database);
    read_bool("DB_SSL", remote_.ssl);
    int pool_size = static_cast<int>(remote_.pool_size);
    read_int("DB_POOL_SIZE", pool_size);
    if (pool_size > 0) remote_.pool_size = static_cast<size_t>(pool_size);

    // Resilience
    read_bool("DB_DISABLED", resilience_.force_offline);
    if (auto path = get("LOCAL_DB_PATH"); path && !path->empty()) resilience_.local_db_path = *path;
    read_millis("DB_INITIAL_HEALTH_TIMEOUT_MS", resilience_.initial_health_timeout);
    read_millis("DB_HEALTH_TIMEOUT_MS", resilience_.health_timeout);
    read_millis("DB_READ_TIMEOUT_MS", resilience_.read_timeout);
    read_millis("DB_WRITE_TIMEOUT_MS", resilience_.write_timeout);
    read_millis("DB_SYNC_INTERVAL_MS", resilience_.sync_interval);
    read_millis("DB_HEALTH_CHECK_MS", resilience_.health_check_interval);
    read_millis("DB_RECONNECT_MS", resilience_.reconnect_interval);
    read_int("DB_SYNC_BATCH", resilience_.sync_batch);
    read_int("DB_QUEUE_MAX_RETRIES", resilience_.max_retries);
    read_bool("DB_REQUEUE_FAILED_WRITES", resilience_.requeue_failed_remote_writes);

    int retention_days = static_cast<int>(resilience_.queue_retention.count() / 86400);
    read_int("DB_QUEUE_RETENTION_DAYS", retention_days);
    resilience_.queue_retention = std::chrono::hours(24 * retention_days);

    // Server-side work never outlives the longest client deadline
    auto longest = std::max({resilience_.initial_health_timeout, resilience_.health_timeout,
                             resilience_.read_timeout, resilience_.write_timeout});
    remote_.statement_timeout_ms = static_cast<int>(longest.count());
    read_int("DB_STATEMENT_TIMEOUT_MS", remote_.statement_timeout_ms);

    int threads = static_cast<int>(resilience_.worker_threads);
    read_int("THREAD_POOL_SIZE", threads);
    if (threads > 0) resilience_.worker_threads = static_cast<size_t>(threads);
}

bool Config::is_valid() const {
    return !token_.empty();
}

} // namespace dualstore
