//! # Query Cache
//!
//! Thread-safe memoization cache for query results.
//! Uses `std::shared_mutex` for concurrent read access.
//!
//! Every entry carries two revisions: the revision at which it was last
//! verified (`verified_at`) and the revision at which its output last
//! changed (`changed_at`). A stale entry whose dependencies have not changed
//! since it was verified is reused without recomputation.

#pragma once

#include "query/query_fingerprint.hpp"
#include "query/query_key.hpp"

#include <any>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace weave::query {

/// Monotonic counter bumped on every input change.
using Revision = uint64_t;

/// A single cache entry with result, output fingerprint, and dependencies.
struct CacheEntry {
    std::any result;
    Fingerprint output_fingerprint;
    std::vector<QueryKey> dependencies;
    Revision verified_at = 0;
    Revision changed_at = 0;
};

/// Thread-safe query cache with memoization.
class QueryCache {
public:
    /// Look up a cached result. Returns nullopt if not cached.
    template <typename R> std::optional<R> lookup(const QueryKey& key) const {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(key);
        if (it == entries_.end()) {
            misses_.fetch_add(1, std::memory_order_relaxed);
            return std::nullopt;
        }
        hits_.fetch_add(1, std::memory_order_relaxed);
        const auto* result = std::any_cast<R>(&it->second.result);
        if (!result) {
            return std::nullopt;
        }
        return *result;
    }

    /// Check if a key is cached.
    [[nodiscard]] bool contains(const QueryKey& key) const;

    /// Insert a result into the cache.
    template <typename R>
    void insert(const QueryKey& key, R result, Fingerprint output_fp, std::vector<QueryKey> deps,
                Revision changed_at = 0, Revision verified_at = 0) {
        CacheEntry entry;
        entry.result = std::move(result);
        entry.output_fingerprint = output_fp;
        entry.dependencies = std::move(deps);
        entry.changed_at = changed_at;
        entry.verified_at = verified_at;
        insert_entry(key, std::move(entry));
    }

    void insert_entry(const QueryKey& key, CacheEntry entry);

    /// Get the cache entry (for dependency/fingerprint inspection).
    [[nodiscard]] std::optional<CacheEntry> get_entry(const QueryKey& key) const;

    /// Like `get_entry`, but counts the lookup as a hit or a miss.
    [[nodiscard]] std::optional<CacheEntry> find(const QueryKey& key) const;

    /// Records that `key` was found up to date at `revision`.
    void mark_verified(const QueryKey& key, Revision revision);

    /// Invalidate a specific entry.
    void invalidate(const QueryKey& key);

    /// True if some cached entry lists `key` among its dependencies.
    [[nodiscard]] bool has_dependents(const QueryKey& key) const;

    /// Visits every entry under a shared lock.
    void for_each(const std::function<void(const QueryKey&, const CacheEntry&)>& visit) const;

    /// Removes the entries matching `pred`. Returns the number removed.
    size_t erase_if(const std::function<bool(const QueryKey&, const CacheEntry&)>& pred);

    /// Clear the entire cache.
    void clear();

    /// Cache statistics.
    struct Stats {
        size_t total_entries = 0;
        size_t hits = 0;
        size_t misses = 0;
    };

    /// Get cache statistics.
    [[nodiscard]] Stats get_stats() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<QueryKey, CacheEntry, QueryKeyHash, QueryKeyEqual> entries_;
    mutable std::atomic<size_t> hits_{0};
    mutable std::atomic<size_t> misses_{0};
};

} // namespace weave::query
