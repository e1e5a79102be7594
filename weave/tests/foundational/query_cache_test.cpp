// Query Cache tests
//
// Tests for the thread-safe memoization cache and its revision bookkeeping.

#include "query/query_cache.hpp"
#include "query/query_fingerprint.hpp"
#include "query/query_key.hpp"

#include <gtest/gtest.h>
#include <thread>
#include <vector>

using namespace weave::query;
using weave::fs::FileContent;
using weave::fs::FileSystemPath;
using weave::fs::MemoryFileSystem;

class QueryCacheTest : public ::testing::Test {
protected:
    QueryCache cache_;
    std::shared_ptr<MemoryFileSystem> memory_ = std::make_shared<MemoryFileSystem>("project");

    QueryKey make_key(const std::string& path) {
        return ReadFileKey{FileSystemPath{memory_, path}};
    }

    QueryKey make_source_key(const std::string& path) {
        return SourceAssetKey{FileSystemPath{memory_, path}};
    }

    Fingerprint make_fp(const std::string& s) {
        return fingerprint_string(s);
    }
};

// ============================================================================
// Insert + Lookup
// ============================================================================

TEST_F(QueryCacheTest, InsertAndLookup) {
    auto key = make_key("src/index.js");
    cache_.insert<FileContent>(key, FileContent::from("export {}"), make_fp("out"), {});

    auto cached = cache_.lookup<FileContent>(key);
    ASSERT_TRUE(cached.has_value());
    EXPECT_TRUE(cached->exists);
    EXPECT_EQ(cached->bytes, "export {}");
}

TEST_F(QueryCacheTest, LookupMissingReturnsNullopt) {
    auto cached = cache_.lookup<FileContent>(make_key("missing.js"));
    EXPECT_FALSE(cached.has_value());
}

TEST_F(QueryCacheTest, LookupWithWrongTypeReturnsNullopt) {
    auto key = make_key("src/index.js");
    cache_.insert<FileContent>(key, FileContent::from("x"), make_fp("out"), {});

    EXPECT_FALSE(cache_.lookup<std::string>(key).has_value());
}

TEST_F(QueryCacheTest, KeysOnDifferentFileSystemsAreDistinct) {
    auto other = std::make_shared<MemoryFileSystem>("output");
    QueryKey here = ReadFileKey{FileSystemPath{memory_, "a.js"}};
    QueryKey there = ReadFileKey{FileSystemPath{other, "a.js"}};

    cache_.insert<FileContent>(here, FileContent::from("here"), make_fp("out"), {});
    EXPECT_TRUE(cache_.contains(here));
    EXPECT_FALSE(cache_.contains(there));
}

// ============================================================================
// Invalidate
// ============================================================================

TEST_F(QueryCacheTest, InvalidateRemovesEntry) {
    auto key = make_key("a.js");
    cache_.insert<FileContent>(key, FileContent::from("a"), make_fp("out"), {});

    EXPECT_TRUE(cache_.contains(key));
    cache_.invalidate(key);
    EXPECT_FALSE(cache_.contains(key));
}

TEST_F(QueryCacheTest, HasDependentsFollowsRecordedEdges) {
    auto read = make_key("a.js");
    auto source = make_source_key("a.js");
    cache_.insert<int>(source, 1, {}, {read});

    EXPECT_TRUE(cache_.has_dependents(read));
    EXPECT_FALSE(cache_.has_dependents(source));
    EXPECT_FALSE(cache_.has_dependents(make_key("b.js")));
}

TEST_F(QueryCacheTest, EraseIfRemovesMatchingEntries) {
    cache_.insert<FileContent>(make_key("a.js"), FileContent::from("a"), make_fp("a"), {});
    cache_.insert<FileContent>(make_key("b.js"), FileContent::from("b"), make_fp("b"), {});
    cache_.insert<int>(make_source_key("a.js"), 1, {}, {});

    size_t removed = cache_.erase_if([](const QueryKey& key, const CacheEntry&) {
        return query_kind(key) == QueryKind::ReadFile;
    });

    EXPECT_EQ(removed, 2u);
    EXPECT_EQ(cache_.get_stats().total_entries, 1u);
    EXPECT_TRUE(cache_.contains(make_source_key("a.js")));
}

// ============================================================================
// Revisions
// ============================================================================

TEST_F(QueryCacheTest, InsertRecordsRevisions) {
    auto key = make_key("a.js");
    cache_.insert<FileContent>(key, FileContent::from("a"), make_fp("a"), {}, 3, 5);

    auto entry = cache_.get_entry(key);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->changed_at, 3u);
    EXPECT_EQ(entry->verified_at, 5u);
}

TEST_F(QueryCacheTest, MarkVerifiedKeepsResultAndChangedAt) {
    auto key = make_key("a.js");
    cache_.insert<FileContent>(key, FileContent::from("a"), make_fp("a"), {}, 1, 1);
    cache_.mark_verified(key, 4);
    cache_.mark_verified(make_key("missing.js"), 4);

    auto entry = cache_.get_entry(key);
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->changed_at, 1u);
    EXPECT_EQ(entry->verified_at, 4u);
    EXPECT_EQ(cache_.lookup<FileContent>(key)->bytes, "a");
    EXPECT_FALSE(cache_.contains(make_key("missing.js")));
}

// ============================================================================
// Clear
// ============================================================================

TEST_F(QueryCacheTest, ClearRemovesAll) {
    auto key1 = make_key("a.js");
    auto key2 = make_key("b.js");
    cache_.insert<FileContent>(key1, FileContent::from("a"), make_fp("out"), {});
    cache_.insert<FileContent>(key2, FileContent::from("b"), make_fp("out"), {});

    cache_.clear();
    EXPECT_FALSE(cache_.contains(key1));
    EXPECT_FALSE(cache_.contains(key2));
}

// ============================================================================
// Stats
// ============================================================================

TEST_F(QueryCacheTest, StatsTrackHitsAndMisses) {
    auto key = make_key("a.js");
    cache_.insert<FileContent>(key, FileContent::from("a"), make_fp("out"), {});

    // Miss
    cache_.lookup<FileContent>(make_key("missing.js"));
    // Hit
    cache_.lookup<FileContent>(key);

    auto stats = cache_.get_stats();
    EXPECT_EQ(stats.total_entries, 1u);
    EXPECT_GE(stats.hits, 1u);
    EXPECT_GE(stats.misses, 1u);
}

// ============================================================================
// Thread safety
// ============================================================================

TEST_F(QueryCacheTest, ConcurrentInserts) {
    constexpr int num_threads = 4;
    constexpr int inserts_per_thread = 50;

    std::vector<std::thread> threads;
    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([this, t]() {
            for (int i = 0; i < inserts_per_thread; ++i) {
                auto key = make_key("file_" + std::to_string(t) + "_" + std::to_string(i) + ".js");
                cache_.insert<FileContent>(key, FileContent::from("thread " + std::to_string(t)),
                                           make_fp("out"), {});
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    auto stats = cache_.get_stats();
    EXPECT_EQ(stats.total_entries, static_cast<size_t>(num_threads * inserts_per_thread));
}
