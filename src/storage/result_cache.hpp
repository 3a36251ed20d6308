// File: src/storage/result_cache.hpp
#pragma once

#include "core/types.hpp"
#include <atomic>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <vector>

namespace codedup {

/// Identity of a duplicate search result
struct CacheKey {
    float threshold{0.0f};
    SearchMode mode{SearchMode::FAST};
    bool include_trivial{false};
    size_t record_count{0};

    bool operator==(const CacheKey& other) const {
        return threshold == other.threshold &&
               mode == other.mode &&
               include_trivial == other.include_trivial &&
               record_count == other.record_count;
    }

    struct Hash {
        size_t operator()(const CacheKey& key) const {
            size_t seed = std::hash<float>{}(key.threshold);
            auto combine = [&seed](size_t value) {
                seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
            };
            combine(static_cast<size_t>(key.mode));
            combine(static_cast<size_t>(key.include_trivial));
            combine(key.record_count);
            return seed;
        }
    };
};

/// Memoized duplicate search results with timestamp invalidation
///
/// An entry carries the timestamp of the data it was computed from. Get()
/// returns it only while no record newer than that timestamp exists, i.e.
/// entry timestamp >= current_max. Stale entries stay in the map until they
/// are overwritten, evicted or cleared.
///
/// Least recently used entries are evicted once capacity is reached.
/// Thread-safe with mutex protection.
class ResultCache {
public:
    using Result = std::vector<DuplicatePair>;

    struct Stats {
        uint64_t hits{0};
        uint64_t misses{0};
        uint64_t stale_misses{0};
        uint64_t evictions{0};
        size_t size{0};
        size_t capacity{0};
    };

    /// @param capacity Maximum number of entries (minimum 1)
    explicit ResultCache(size_t capacity = 64)
        : capacity_(capacity) {
        if (capacity_ == 0) {
            capacity_ = 1;  // Minimum capacity
        }
    }

    /// Get a result computed from data at least as new as current_max
    /// @param key Query identity
    /// @param current_max Newest record timestamp of the data set now
    /// @return Cached result, or std::nullopt when absent or stale
    std::optional<Result> Get(const CacheKey& key, const Timestamp& current_max) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        const Entry& entry = map_it->second->second;
        if (entry.data_timestamp < current_max) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            stale_misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }

        hits_.fetch_add(1, std::memory_order_relaxed);

        // Move to front (most recently used)
        items_.splice(items_.begin(), items_, map_it->second);

        return entry.result;
    }

    /// Store a result
    /// @param key Query identity
    /// @param result Pairs found
    /// @param data_timestamp Newest record timestamp the result was computed from
    void Put(const CacheKey& key, const Result& result, const Timestamp& data_timestamp) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it != map_.end()) {
            map_it->second->second = Entry{result, data_timestamp};
            items_.splice(items_.begin(), items_, map_it->second);
            return;
        }

        if (items_.size() >= capacity_) {
            auto& lru = items_.back();
            map_.erase(lru.first);
            items_.pop_back();
            evictions_.fetch_add(1, std::memory_order_relaxed);
        }

        items_.emplace_front(key, Entry{result, data_timestamp});
        map_[key] = items_.begin();
    }

    /// Remove one entry
    /// @return true if removed, false if not found
    bool Remove(const CacheKey& key) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto map_it = map_.find(key);
        if (map_it == map_.end()) {
            return false;
        }

        items_.erase(map_it->second);
        map_.erase(map_it);
        return true;
    }

    /// Drop every entry; statistics are kept
    void Clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
        map_.clear();
    }

    /// Check whether an entry exists, stale or not
    bool Contains(const CacheKey& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    size_t Size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    size_t Capacity() const { return capacity_; }

    Stats GetStats() const {
        Stats stats;
        stats.hits = hits_.load(std::memory_order_relaxed);
        stats.misses = misses_.load(std::memory_order_relaxed);
        stats.stale_misses = stale_misses_.load(std::memory_order_relaxed);
        stats.evictions = evictions_.load(std::memory_order_relaxed);
        stats.size = Size();
        stats.capacity = capacity_;
        return stats;
    }

private:
    struct Entry {
        Result result;
        Timestamp data_timestamp;
    };

    using ListItem = std::pair<CacheKey, Entry>;
    using ListIterator = std::list<ListItem>::iterator;

    size_t capacity_;
    std::list<ListItem> items_;
    std::unordered_map<CacheKey, ListIterator, CacheKey::Hash> map_;
    mutable std::mutex mutex_;

    std::atomic<uint64_t> hits_{0};
    std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> stale_misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace codedup
