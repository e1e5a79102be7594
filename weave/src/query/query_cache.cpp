#include "query/query_cache.hpp"

namespace weave::query {

bool QueryCache::contains(const QueryKey& key) const {
    std::shared_lock lock(mutex_);
    return entries_.find(key) != entries_.end();
}

std::optional<CacheEntry> QueryCache::get_entry(const QueryKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<CacheEntry> QueryCache::find(const QueryKey& key) const {
    std::shared_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        return std::nullopt;
    }
    hits_.fetch_add(1, std::memory_order_relaxed);
    return it->second;
}

void QueryCache::insert_entry(const QueryKey& key, CacheEntry entry) {
    std::unique_lock lock(mutex_);
    entries_[key] = std::move(entry);
}

void QueryCache::mark_verified(const QueryKey& key, Revision revision) {
    std::unique_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        it->second.verified_at = revision;
    }
}

void QueryCache::invalidate(const QueryKey& key) {
    std::unique_lock lock(mutex_);
    entries_.erase(key);
}

bool QueryCache::has_dependents(const QueryKey& key) const {
    QueryKeyEqual equal;
    std::shared_lock lock(mutex_);
    for (const auto& [_, entry] : entries_) {
        for (const auto& dep : entry.dependencies) {
            if (equal(dep, key)) {
                return true;
            }
        }
    }
    return false;
}

void QueryCache::for_each(
    const std::function<void(const QueryKey&, const CacheEntry&)>& visit) const {
    std::shared_lock lock(mutex_);
    for (const auto& [key, entry] : entries_) {
        visit(key, entry);
    }
}

size_t QueryCache::erase_if(const std::function<bool(const QueryKey&, const CacheEntry&)>& pred) {
    std::unique_lock lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (pred(it->first, it->second)) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

void QueryCache::clear() {
    std::unique_lock lock(mutex_);
    entries_.clear();
    hits_.store(0, std::memory_order_relaxed);
    misses_.store(0, std::memory_order_relaxed);
}

QueryCache::Stats QueryCache::get_stats() const {
    std::shared_lock lock(mutex_);
    return {entries_.size(), hits_.load(std::memory_order_relaxed),
            misses_.load(std::memory_order_relaxed)};
}

} // namespace weave::query
