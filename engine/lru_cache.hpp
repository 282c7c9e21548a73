#pragma once

#include <unordered_map>
#include <list>
#include <mutex>
#include <optional>
#include <chrono>
#include <cstdint>
#include <algorithm>
#include <functional>
#include <string>

// Long keys are cut to this many characters in log lines
constexpr size_t MAX_LOGGED_KEY_LENGTH = 50;

inline std::string loggableKey(const std::string& key) {
    if (key.size() <= MAX_LOGGED_KEY_LENGTH) {
        return key;
    }
    return key.substr(0, MAX_LOGGED_KEY_LENGTH) + "...";
}

struct CacheStats {
    size_t size = 0;
    size_t capacity = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t total_requests = 0;
    double hit_rate_percent = 0.0;
    double uptime_seconds = 0.0;
};

// Thread-safe fixed-capacity LRU cache. Every operation, including the
// statistics read, runs under one per-instance mutex.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
private:
    size_t max_entries;
    mutable std::mutex cache_mutex;

    // List maintains the order (front = most recently used, back = least recently used)
    using CacheList = std::list<std::pair<Key, Value>>;
    CacheList cache_list;

    // Map for O(1) lookup: key -> iterator to list node
    std::unordered_map<Key, typename CacheList::iterator, Hash> cache_map;

    uint64_t hit_count = 0;
    uint64_t miss_count = 0;
    uint64_t total_requests = 0;
    std::chrono::steady_clock::time_point created_at;

    // Move an element to the front (mark as most recently used)
    void touch(typename CacheList::iterator it) {
        cache_list.splice(cache_list.begin(), cache_list, it);
    }

    // Evict the least recently used item
    void evict() {
        if (!cache_list.empty()) {
            cache_map.erase(cache_list.back().first);
            cache_list.pop_back();
        }
    }

public:
    explicit LruCache(size_t capacity = 1000)
        : max_entries(std::max<size_t>(capacity, 1)),
          created_at(std::chrono::steady_clock::now()) {
    }

    virtual ~LruCache() = default;

    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;

    // Returns the cached value and marks it most recently used
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(cache_mutex);
        ++total_requests;

        auto it = cache_map.find(key);
        if (it == cache_map.end()) {
            ++miss_count;
            return std::nullopt;
        }

        ++hit_count;
        touch(it->second);
        return it->second->second;
    }

    // Insert or overwrite; both bump recency
    void set(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(cache_mutex);

        auto it = cache_map.find(key);
        if (it != cache_map.end()) {
            it->second->second = value;
            touch(it->second);
            return;
        }

        if (cache_list.size() >= max_entries) {
            evict();
        }
        cache_list.emplace_front(key, value);
        cache_map[key] = cache_list.begin();
    }

    // Membership test only: no statistics, no recency change
    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(cache_mutex);
        return cache_map.find(key) != cache_map.end();
    }

    // Drops all entries and resets the hit/miss counters
    void clear() {
        std::lock_guard<std::mutex> lock(cache_mutex);
        cache_list.clear();
        cache_map.clear();
        hit_count = 0;
        miss_count = 0;
        total_requests = 0;
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(cache_mutex);

        CacheStats result;
        result.size = cache_list.size();
        result.capacity = max_entries;
        result.hits = hit_count;
        result.misses = miss_count;
        result.total_requests = total_requests;
        result.hit_rate_percent = static_cast<double>(hit_count) /
            static_cast<double>(std::max<uint64_t>(total_requests, 1)) * 100.0;
        result.uptime_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - created_at).count();
        return result;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(cache_mutex);
        return cache_list.size();
    }

    size_t capacity() const {
        return max_entries;
    }
};
