/** \file lru_cache.hpp
 *  \brief Thread-safe LRU cache with per-entry time-to-live
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace promptvec::cache {

/**
 * \brief Statistics for cache performance monitoring
 */
struct CacheStats {
    std::atomic<std::uint64_t> hits{0};
    std::atomic<std::uint64_t> misses{0};
    std::atomic<std::uint64_t> evictions{0};
    std::atomic<std::uint64_t> expirations{0};
    std::atomic<std::uint64_t> inserts{0};
    std::atomic<std::uint64_t> invalidations{0};

    CacheStats() = default;

    CacheStats(const CacheStats& other)
        : hits(other.hits.load())
        , misses(other.misses.load())
        , evictions(other.evictions.load())
        , expirations(other.expirations.load())
        , inserts(other.inserts.load())
        , invalidations(other.invalidations.load()) {}

    CacheStats& operator=(const CacheStats& other) {
        if (this != &other) {
            hits.store(other.hits.load());
            misses.store(other.misses.load());
            evictions.store(other.evictions.load());
            expirations.store(other.expirations.load());
            inserts.store(other.inserts.load());
            invalidations.store(other.invalidations.load());
        }
        return *this;
    }

    [[nodiscard]] auto hit_rate() const -> double {
        auto total = hits.load() + misses.load();
        return total > 0 ? static_cast<double>(hits.load()) / static_cast<double>(total) : 0.0;
    }

    void reset() {
        hits = 0;
        misses = 0;
        evictions = 0;
        expirations = 0;
        inserts = 0;
        invalidations = 0;
    }
};

/**
 * \brief Bounded LRU cache whose entries expire a fixed time after insertion.
 *
 * Capacity counts entries. An entry is never returned once its TTL has elapsed or
 * after clear(); expired entries are dropped lazily on access and on insert.
 * ClockT must provide now() returning a time_point comparable with ttl.
 */
template<typename K, typename V, typename Hash = std::hash<K>,
         typename ClockT = std::chrono::steady_clock>
class LruCache {
public:
    using KeyType = K;
    using ValueType = V;
    using TimePoint = typename ClockT::time_point;

    struct Entry {
        K key;
        V value;
        TimePoint inserted_at;
        std::uint64_t access_count{0};
    };

    using ListIterator = typename std::list<Entry>::iterator;

    LruCache(std::size_t max_entries, std::chrono::seconds ttl)
        : max_entries_(max_entries)
        , ttl_(ttl) {}

    // Non-copyable and non-movable due to mutex
    LruCache(const LruCache&) = delete;
    LruCache& operator=(const LruCache&) = delete;
    LruCache(LruCache&&) = delete;
    LruCache& operator=(LruCache&&) = delete;

    /**
     * \brief Get value from cache
     * \return Optional containing value if found and not expired
     */
    [[nodiscard]] auto get(const K& key) -> std::optional<V> {
        std::unique_lock lock(mutex_);

        auto it = index_.find(key);
        if (it == index_.end()) {
            stats_.misses.fetch_add(1);
            return std::nullopt;
        }

        auto list_it = it->second;
        if (is_expired(list_it->inserted_at)) {
            erase_entry(it);
            stats_.expirations.fetch_add(1);
            stats_.misses.fetch_add(1);
            return std::nullopt;
        }

        // Move to front (most recently used)
        if (list_it != lru_list_.begin()) {
            lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
        }
        list_it->access_count++;

        stats_.hits.fetch_add(1);
        return list_it->value;
    }

    /**
     * \brief Insert or replace value; the TTL restarts on replacement
     */
    auto put(const K& key, V value) -> void {
        std::unique_lock lock(mutex_);
        if (max_entries_ == 0) return;

        auto it = index_.find(key);
        if (it != index_.end()) {
            auto list_it = it->second;
            list_it->value = std::move(value);
            list_it->inserted_at = ClockT::now();
            if (list_it != lru_list_.begin()) {
                lru_list_.splice(lru_list_.begin(), lru_list_, list_it);
            }
        } else {
            make_space();
            lru_list_.emplace_front(Entry{key, std::move(value), ClockT::now(), 0});
            index_[key] = lru_list_.begin();
        }
        stats_.inserts.fetch_add(1);
    }

    auto remove(const K& key) -> bool {
        std::unique_lock lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        erase_entry(it);
        return true;
    }

    /**
     * \brief Drop every entry (explicit invalidation)
     */
    auto clear() -> void {
        std::unique_lock lock(mutex_);
        lru_list_.clear();
        index_.clear();
        stats_.invalidations.fetch_add(1);
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::shared_lock lock(mutex_);
        return index_.size();
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return max_entries_; }

    [[nodiscard]] auto stats() const -> CacheStats {
        return stats_;
    }

private:
    [[nodiscard]] auto is_expired(TimePoint inserted_at) const -> bool {
        return (ClockT::now() - inserted_at) >= ttl_;
    }

    auto make_space() -> void {
        // Expired entries go first, from the cold end.
        while (!lru_list_.empty() && is_expired(lru_list_.back().inserted_at)) {
            erase_entry(index_.find(lru_list_.back().key));
            stats_.expirations.fetch_add(1);
        }
        while (index_.size() >= max_entries_ && !lru_list_.empty()) {
            erase_entry(index_.find(lru_list_.back().key));
            stats_.evictions.fetch_add(1);
        }
    }

    auto erase_entry(typename std::unordered_map<K, ListIterator, Hash>::iterator it) -> void {
        lru_list_.erase(it->second);
        index_.erase(it);
    }

    mutable std::shared_mutex mutex_;
    std::list<Entry> lru_list_;
    std::unordered_map<K, ListIterator, Hash> index_;

    std::size_t max_entries_;
    std::chrono::seconds ttl_;

    mutable CacheStats stats_;
};

} // namespace promptvec::cache
