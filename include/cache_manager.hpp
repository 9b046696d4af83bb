#pragma once

#include <unordered_map>
#include <list>
#include <mutex>
#include <optional>
#include <chrono>
#include <string>

namespace web_archiver {

// Thread-safe LRU map. A zero TTL keeps entries until they are evicted by size.
template<typename Key, typename Value>
class LRUCache {
public:
    explicit LRUCache(size_t max_size, std::chrono::seconds ttl = std::chrono::seconds(0))
        : max_size_(max_size == 0 ? 1 : max_size), ttl_(ttl) {}

    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = find_live(key);
        if (it == cache_map_.end()) {
            return std::nullopt;
        }
        return it->second.value;
    }

    void set(const Key& key, const Value& value) {
        std::lock_guard<std::mutex> lock(mutex_);
        insert_locked(key, value);
    }

    // Atomic lookup-or-insert: `make` runs under the cache lock, keep it cheap.
    template<typename Factory>
    Value get_or_create(const Key& key, Factory make) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = find_live(key);
        if (it != cache_map_.end()) {
            return it->second.value;
        }
        Value value = make();
        insert_locked(key, value);
        return value;
    }

    void erase(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) return;
        cache_list_.erase(it->second.list_it);
        cache_map_.erase(it);
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_map_.clear();
        cache_list_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_map_.size();
    }

private:
    struct CacheEntry {
        Value value;
        typename std::list<Key>::iterator list_it;
        std::chrono::steady_clock::time_point expiry_time;
    };

    using MapIterator = typename std::unordered_map<Key, CacheEntry>::iterator;

    bool expires() const { return ttl_.count() > 0; }

    // Caller holds mutex_. Drops the entry if expired, otherwise marks it most recently used.
    MapIterator find_live(const Key& key) {
        auto it = cache_map_.find(key);
        if (it == cache_map_.end()) return it;

        if (expires() && std::chrono::steady_clock::now() > it->second.expiry_time) {
            cache_list_.erase(it->second.list_it);
            cache_map_.erase(it);
            return cache_map_.end();
        }

        cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
        return it;
    }

    void insert_locked(const Key& key, const Value& value) {
        auto expiry = std::chrono::steady_clock::now() + ttl_;

        auto it = cache_map_.find(key);
        if (it != cache_map_.end()) {
            it->second.value = value;
            it->second.expiry_time = expiry;
            cache_list_.splice(cache_list_.begin(), cache_list_, it->second.list_it);
            return;
        }

        if (cache_map_.size() >= max_size_) {
            // Evict LRU
            auto lru_key = cache_list_.back();
            cache_list_.pop_back();
            cache_map_.erase(lru_key);
        }

        cache_list_.push_front(key);
        cache_map_.emplace(key, CacheEntry{value, cache_list_.begin(), expiry});
    }

    size_t max_size_;
    std::chrono::seconds ttl_;
    std::list<Key> cache_list_;
    std::unordered_map<Key, CacheEntry> cache_map_;
    mutable std::mutex mutex_;
};

} // namespace web_archiver
