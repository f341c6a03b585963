#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <list>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

namespace prompter::cache {

/**
 * @brief Snapshot of an LRUCache
 */
struct LRUCacheStats {
    size_t size = 0;
    size_t capacity = 0;
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t evictions = 0;
    double hitRate = 0.0; ///< Percentage, 0 when nothing was looked up
    std::optional<std::chrono::system_clock::time_point> oldestEntry; ///< Earliest insertion
    std::optional<std::chrono::system_clock::time_point> newestEntry; ///< Latest insertion
};

/**
 * @brief Thread-safe bounded map with least-recently-used eviction
 *
 * Keys are strings. get() and set() both count as a touch; peek() does not.
 * Eviction removes the entry touched longest ago, which for never-read entries
 * is the one inserted first.
 */
template <typename V> class LRUCache {
public:
    using SizeEstimator = std::function<size_t(const V&)>;

    /**
     * @param capacity Maximum number of entries, must be positive
     * @param estimator Approximate byte size of one value for estimateMemoryUsage()
     */
    explicit LRUCache(size_t capacity, SizeEstimator estimator = {})
        : capacity_(capacity), estimator_(std::move(estimator)) {
        if (capacity_ == 0) {
            throw std::invalid_argument("LRUCache capacity must be positive");
        }
    }

    LRUCache(const LRUCache&) = delete;
    LRUCache& operator=(const LRUCache&) = delete;

    /**
     * @brief Look up a value and mark it most recently used
     * @return nullopt if absent
     */
    std::optional<V> get(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }
        ++hits_;
        it->second->lastAccess = Clock::now();
        moveToFront(it->second);
        return it->second->value;
    }

    /// Look up without touching recency or statistics
    std::optional<V> peek(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return std::nullopt;
        }
        return it->second->value;
    }

    /**
     * @brief Insert or replace a value and mark it most recently used
     *
     * Evicts the least recently used entry when the insert would exceed capacity.
     */
    void set(const std::string& key, V value) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto now = Clock::now();
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->value = std::move(value);
            it->second->lastAccess = now;
            moveToFront(it->second);
            return;
        }

        if (entries_.size() >= capacity_) {
            evictLRU();
        }

        entries_.push_front(Entry{key, std::move(value), now, std::chrono::system_clock::now()});
        index_[key] = entries_.begin();
    }

    bool contains(const std::string& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return index_.find(key) != index_.end();
    }

    /// @return true when an entry was removed
    bool erase(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            return false;
        }
        entries_.erase(it->second);
        index_.erase(it);
        return true;
    }

    /// Remove all entries and reset statistics
    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        index_.clear();
        hits_ = 0;
        misses_ = 0;
        evictions_ = 0;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return entries_.size();
    }

    size_t capacity() const noexcept { return capacity_; }

    /// Keys from least to most recently used
    std::vector<std::string> keys() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        out.reserve(entries_.size());
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            out.push_back(it->key);
        }
        return out;
    }

    /// Values from least to most recently used
    std::vector<V> values() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<V> out;
        out.reserve(entries_.size());
        for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
            out.push_back(it->value);
        }
        return out;
    }

    /// Up to n keys, least recently used first
    std::vector<std::string> leastRecentlyUsed(size_t n) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> out;
        for (auto it = entries_.rbegin(); it != entries_.rend() && out.size() < n; ++it) {
            out.push_back(it->key);
        }
        return out;
    }

    /**
     * @brief Remove entries not touched within maxAge
     * @return Number of entries removed
     */
    size_t evictOlderThan(std::chrono::milliseconds maxAge) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto cutoff = Clock::now() - maxAge;
        size_t removed = 0;
        // Least recently touched entries sit at the back
        while (!entries_.empty() && entries_.back().lastAccess < cutoff) {
            index_.erase(entries_.back().key);
            entries_.pop_back();
            ++removed;
        }
        return removed;
    }

    /// hits / (hits + misses) as a percentage
    double hitRate() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return hitRateLocked();
    }

    LRUCacheStats getStats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        LRUCacheStats stats;
        stats.size = entries_.size();
        stats.capacity = capacity_;
        stats.hits = hits_;
        stats.misses = misses_;
        stats.evictions = evictions_;
        stats.hitRate = hitRateLocked();
        for (const auto& e : entries_) {
            if (!stats.oldestEntry || e.insertedAt < *stats.oldestEntry) {
                stats.oldestEntry = e.insertedAt;
            }
            if (!stats.newestEntry || e.insertedAt > *stats.newestEntry) {
                stats.newestEntry = e.insertedAt;
            }
        }
        return stats;
    }

    void resetStats() {
        std::lock_guard<std::mutex> lock(mutex_);
        hits_ = 0;
        misses_ = 0;
        evictions_ = 0;
    }

    /**
     * @brief Approximate bytes held by keys and values
     *
     * Uses the estimator given at construction, sizeof(V) otherwise.
     */
    size_t estimateMemoryUsage() const {
        std::lock_guard<std::mutex> lock(mutex_);
        size_t total = 0;
        for (const auto& e : entries_) {
            total += e.key.size() + sizeof(Entry);
            total += estimator_ ? estimator_(e.value) : sizeof(V);
        }
        return total;
    }

private:
    using Clock = std::chrono::steady_clock;

    struct Entry {
        std::string key;
        V value;
        Clock::time_point lastAccess;
        std::chrono::system_clock::time_point insertedAt;
    };
    using ListIterator = typename std::list<Entry>::iterator;

    void moveToFront(ListIterator it) { entries_.splice(entries_.begin(), entries_, it); }

    void evictLRU() {
        if (entries_.empty()) {
            return;
        }
        index_.erase(entries_.back().key);
        entries_.pop_back();
        ++evictions_;
    }

    double hitRateLocked() const {
        auto total = hits_ + misses_;
        return total == 0 ? 0.0 : static_cast<double>(hits_) / static_cast<double>(total) * 100.0;
    }

    const size_t capacity_;
    SizeEstimator estimator_;

    mutable std::mutex mutex_;
    std::list<Entry> entries_; ///< Front is most recently used
    std::unordered_map<std::string, ListIterator> index_;

    uint64_t hits_ = 0;
    uint64_t misses_ = 0;
    uint64_t evictions_ = 0;
};

} // namespace prompter::cache
