#pragma once

#include <cstddef>
#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <utility>

struct CacheStats {
    size_t accesses = 0;
    size_t hits = 0;
    size_t misses = 0;
    double hitRatio = 0.0;
};

// Thread-safe bounded map with least-recently-used eviction.
// Every operation holds the single internal mutex for its whole duration, so
// no caller can observe a half-updated list/index pair. The front of the list
// is the most recently used entry.
template <typename Key, typename Value, typename Hash = std::hash<Key>>
class LRUCache {
public:
    explicit LRUCache(long long maxSize) {
        if (maxSize <= 0) {
            throw std::invalid_argument("LRU cache max_size must be positive, got " + std::to_string(maxSize));
        }
        maxSize_ = static_cast<size_t>(maxSize);
    }

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    // Counts an access; a hit also promotes the key to most recently used
    std::optional<Value> get(const Key& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++accesses_;

        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }

        ++hits_;
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->second;
    }

    // Inserts or overwrites wholesale; evicts the least recently used entry
    // when the insert pushes the size past capacity
    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            entries_.splice(entries_.begin(), entries_, it->second);
            return;
        }

        entries_.emplace_front(key, std::move(value));
        index_[key] = entries_.begin();

        if (entries_.size() > maxSize_) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
    }

    bool contains(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    CacheStats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        CacheStats snapshot;
        snapshot.accesses = accesses_;
        snapshot.hits = hits_;
        snapshot.misses = misses_;
        snapshot.hitRatio = accesses_ > 0 ? static_cast<double>(hits_) / static_cast<double>(accesses_) : 0.0;
        return snapshot;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t capacity() const {
        return maxSize_;
    }

private:
    using Entry = std::pair<Key, Value>;

    size_t maxSize_ = 0;
    std::list<Entry> entries_;
    std::unordered_map<Key, typename std::list<Entry>::iterator, Hash> index_;
    size_t accesses_ = 0;
    size_t hits_ = 0;
    size_t misses_ = 0;
    mutable std::mutex mutex_;
};
