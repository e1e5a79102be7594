// Query Dependency Tracker tests
//
// Tests for dependency tracking between queries and cycle detection.

#include "query/query_deps.hpp"
#include "query/query_key.hpp"

#include <gtest/gtest.h>

using namespace weave::query;
using weave::fs::FileSystemPath;
using weave::fs::MemoryFileSystem;

class QueryDepsTest : public ::testing::Test {
protected:
    DependencyTracker tracker_;
    std::shared_ptr<MemoryFileSystem> memory_ = std::make_shared<MemoryFileSystem>("project");

    QueryKey make_key(const std::string& path) {
        return ReadFileKey{FileSystemPath{memory_, path}};
    }

    QueryKey make_source_key(const std::string& path) {
        return SourceAssetKey{FileSystemPath{memory_, path}};
    }
};

// ============================================================================
// Stack management
// ============================================================================

TEST_F(QueryDepsTest, InitialDepthIsZero) {
    EXPECT_EQ(tracker_.depth(), 0u);
}

TEST_F(QueryDepsTest, PushAndPopTrackDepth) {
    tracker_.push_active(make_key("a.js"));
    tracker_.push_active(make_key("b.js"));
    EXPECT_EQ(tracker_.depth(), 2u);

    tracker_.pop_active();
    EXPECT_EQ(tracker_.depth(), 1u);
    tracker_.pop_active();
    EXPECT_EQ(tracker_.depth(), 0u);
}

TEST_F(QueryDepsTest, PopOnEmptyStackIsHarmless) {
    tracker_.pop_active();
    EXPECT_EQ(tracker_.depth(), 0u);
}

// ============================================================================
// Dependency recording
// ============================================================================

TEST_F(QueryDepsTest, RecordDependency) {
    tracker_.push_active(make_source_key("a.js"));
    tracker_.record_dependency(make_key("a.js"));

    auto deps = tracker_.current_dependencies();
    ASSERT_EQ(deps.size(), 1u);
    EXPECT_EQ(deps[0], make_key("a.js"));
}

TEST_F(QueryDepsTest, DuplicateDependenciesAreRecordedOnce) {
    tracker_.push_active(make_source_key("a.js"));
    tracker_.record_dependency(make_key("a.js"));
    tracker_.record_dependency(make_key("a.js"));
    tracker_.record_dependency(make_key("b.js"));

    EXPECT_EQ(tracker_.current_dependencies().size(), 2u);
}

TEST_F(QueryDepsTest, DependenciesBelongToTopOfStack) {
    tracker_.push_active(make_source_key("outer.js"));
    tracker_.push_active(make_source_key("inner.js"));
    tracker_.record_dependency(make_key("inner.js"));
    tracker_.pop_active();

    EXPECT_TRUE(tracker_.current_dependencies().empty());
}

TEST_F(QueryDepsTest, RecordWithoutActiveQueryIsIgnored) {
    tracker_.record_dependency(make_key("a.js"));
    EXPECT_TRUE(tracker_.current_dependencies().empty());
}

// ============================================================================
// Cycle detection
// ============================================================================

TEST_F(QueryDepsTest, NoCycleForFreshKey) {
    tracker_.push_active(make_key("a.js"));
    EXPECT_FALSE(tracker_.detect_cycle(make_key("b.js")).has_value());
}

TEST_F(QueryDepsTest, CyclePathIsClosedByKey) {
    tracker_.push_active(make_key("a.js"));
    tracker_.push_active(make_key("b.js"));
    tracker_.push_active(make_key("c.js"));

    auto cycle = tracker_.detect_cycle(make_key("b.js"));
    ASSERT_TRUE(cycle.has_value());
    ASSERT_EQ(cycle->size(), 3u);
    EXPECT_EQ((*cycle)[0], make_key("b.js"));
    EXPECT_EQ((*cycle)[1], make_key("c.js"));
    EXPECT_EQ((*cycle)[2], make_key("b.js"));
}

TEST_F(QueryDepsTest, ClearResetsStack) {
    tracker_.push_active(make_key("a.js"));
    tracker_.clear();
    EXPECT_EQ(tracker_.depth(), 0u);
    EXPECT_FALSE(tracker_.detect_cycle(make_key("a.js")).has_value());
}
