#pragma once

#include "dualstore/utils/logger.hpp"
#include "dualstore/utils/periodic_timer.hpp"

#include <chrono>
#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dualstore {

struct CacheStats {
    size_t size = 0;
    size_t max_size = 0;
    std::vector<std::string> keys;
};

// In-memory key/value cache with a TTL per entry and a hard capacity.
//
// Eviction is FIFO: when a new key arrives at capacity the oldest-inserted
// entry goes, regardless of how recently it was read. last_access is kept for
// debugging only. Expired entries are dropped lazily on get() and by a
// cleanup sweep that runs on its own timer.
template<typename V>
class BoundedCache {
public:
    using clock = std::chrono::steady_clock;

    BoundedCache(std::chrono::milliseconds ttl, size_t max_size,
                 std::chrono::milliseconds cleanup_interval = std::chrono::minutes(5),
                 std::string name = "cache")
        : ttl_(ttl), max_size_(max_size), name_(std::move(name)), cleanup_timer_(name_ + "-cleanup") {
        if (cleanup_interval.count() > 0) {
            cleanup_timer_.start(cleanup_interval, [this]() {
                cleanup();
                return true;
            });
        }
    }

    ~BoundedCache() {
        destroy();
    }

    // Disable copy
    BoundedCache(const BoundedCache&) = delete;
    BoundedCache& operator=(const BoundedCache&) = delete;

    void set(const std::string& key, V value, std::optional<std::chrono::milliseconds> ttl = std::nullopt) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (max_size_ == 0) {
            return;
        }

        auto now = clock::now();
        auto expires_at = now + (ttl ? *ttl : ttl_);

        auto it = entries_.find(key);
        if (it != entries_.end()) {
            it->second.value = std::move(value);
            it->second.expires_at = expires_at;
            it->second.last_access = now;
            return;
        }

        if (entries_.size() >= max_size_) {
            entries_.erase(insertion_order_.front());
            insertion_order_.pop_front();
        }

        insertion_order_.push_back(key);
        entries_.emplace(key, Entry{std::move(value), expires_at, now, std::prev(insertion_order_.end())});
    }

    std::optional<V> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            return std::nullopt;
        }

        auto now = clock::now();
        if (now > it->second.expires_at) {
            erase_locked(it);
            return std::nullopt;
        }

        it->second.last_access = now;
        return it->second.value;
    }

    void remove(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(key);
        if (it != entries_.end()) {
            erase_locked(it);
        }
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        insertion_order_.clear();
    }

    // Drops every expired entry; returns how many were removed
    size_t cleanup() {
        size_t cleaned = 0;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto now = clock::now();
            for (auto it = entries_.begin(); it != entries_.end();) {
                if (now > it->second.expires_at) {
                    insertion_order_.erase(it->second.order);
                    it = entries_.erase(it);
                    ++cleaned;
                } else {
                    ++it;
                }
            }
        }
        if (cleaned > 0) {
            log_debug("cache", name_ + " cleanup: " + std::to_string(cleaned) + " expired entries");
        }
        return cleaned;
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats result;
        result.size = entries_.size();
        result.max_size = max_size_;
        result.keys.assign(insertion_order_.begin(), insertion_order_.end());
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    // Stops the cleanup timer and drops all entries. Safe to call twice.
    void destroy() {
        cleanup_timer_.stop();
        clear();
    }

    const std::string& name() const { return name_; }

private:
    struct Entry {
        V value;
        clock::time_point expires_at;
        clock::time_point last_access;
        std::list<std::string>::iterator order;
    };

    using EntryMap = std::unordered_map<std::string, Entry>;

    void erase_locked(typename EntryMap::iterator it) {
        insertion_order_.erase(it->second.order);
        entries_.erase(it);
    }

    std::chrono::milliseconds ttl_;
    size_t max_size_;
    std::string name_;

    mutable std::mutex mutex_;
    EntryMap entries_;
    std::list<std::string> insertion_order_;

    PeriodicTimer cleanup_timer_;
};

} // namespace dualstore
