// Back References tests
//
// Tests for back reference computation over aggregation trees and the
// top references report.

#include "analysis/back_references.hpp"
#include "graph/aggregated_graph.hpp"
#include "test_project.hpp"

#include <algorithm>
#include <random>
#include <sstream>

using namespace weave::analysis;
using weave::core::AssetPtr;
using weave::graph::aggregate;
using weave::test_support::GraphAsset;
using weave::test_support::ProjectTest;

class BackReferencesTest : public ProjectTest {
protected:
    static std::vector<std::string> referrers(const ReferencesList& list, const AssetPtr& asset) {
        std::vector<std::string> paths;
        auto it = list.referenced_by.find(asset);
        if (it == list.referenced_by.end()) {
            return paths;
        }
        for (const auto& referrer : it->second) {
            paths.push_back(referrer->path().path);
        }
        std::sort(paths.begin(), paths.end());
        return paths;
    }

    /// A list where `assets[i]` is referenced by `i + 1` distinct assets.
    ReferencesList ascending_list(const std::vector<AssetPtr>& assets) {
        ReferencesList list;
        for (size_t i = 0; i < assets.size(); ++i) {
            auto& referrers = list.referenced_by[assets[i]];
            for (size_t j = 0; j <= i; ++j) {
                referrers.insert(graph_asset("referrer" + std::to_string(i) + "_" +
                                             std::to_string(j) + ".js"));
            }
        }
        return list;
    }
};

// ============================================================================
// Computation
// ============================================================================

TEST_F(BackReferencesTest, LeafMapsReferencedAssetsToItself) {
    auto a = graph_asset("a.js");
    auto b = graph_asset("b.js");
    auto c = graph_asset("c.js");
    a->add_edge(b);
    a->add_edge(c);

    auto list = back_references(ctx_, ctx_.graph_nodes().leaf(a));
    EXPECT_EQ(list->referenced_by.size(), 2u);
    EXPECT_EQ(referrers(*list, b), std::vector<std::string>{"a.js"});
    EXPECT_EQ(referrers(*list, c), std::vector<std::string>{"a.js"});
}

TEST_F(BackReferencesTest, InnerNodesUnionChildren) {
    auto a = graph_asset("a.js");
    auto b = graph_asset("b.js");
    auto c = graph_asset("c.js");
    auto d = graph_asset("d.js");
    a->add_edge(b);
    a->add_edge(c);
    b->add_edge(d);
    c->add_edge(d);
    d->add_edge(a);

    auto list = back_references(ctx_, aggregate(ctx_, a));
    EXPECT_EQ(referrers(*list, d), (std::vector<std::string>{"b.js", "c.js"}));
    EXPECT_EQ(referrers(*list, b), std::vector<std::string>{"a.js"});
    EXPECT_EQ(referrers(*list, a), std::vector<std::string>{"d.js"});
}

TEST_F(BackReferencesTest, AssetWithoutReferencesContributesNothing) {
    auto a = graph_asset("a.js");
    auto list = back_references(ctx_, aggregate(ctx_, a));
    EXPECT_TRUE(list->referenced_by.empty());
}

TEST_F(BackReferencesTest, ResultsAreMemoizedPerNode) {
    auto a = graph_asset("a.js");
    a->add_edge(graph_asset("b.js"));
    auto root = aggregate(ctx_, a);
    EXPECT_EQ(back_references(ctx_, root), back_references(ctx_, root));
}

// ============================================================================
// Top References
// ============================================================================

TEST_F(BackReferencesTest, TopFiveOfSevenDistinctCounts) {
    std::vector<AssetPtr> assets;
    for (int i = 0; i < 7; ++i) {
        assets.push_back(graph_asset("lib" + std::to_string(i) + ".js"));
    }
    auto list = ascending_list(assets);

    auto top = top_references(list);
    ASSERT_EQ(top.size(), 5u);
    for (size_t i = 0; i < top.size(); ++i) {
        EXPECT_EQ(top[i].asset, assets[6 - i]);
        EXPECT_EQ(top[i].referenced_by.size(), 7 - i);
    }
}

TEST_F(BackReferencesTest, TopFiveIgnoresInsertionOrder) {
    std::vector<AssetPtr> assets;
    for (int i = 0; i < 7; ++i) {
        assets.push_back(graph_asset("lib" + std::to_string(i) + ".js"));
    }

    std::vector<size_t> reversed{6, 5, 4, 3, 2, 1, 0};
    std::vector<size_t> shuffled = reversed;
    std::shuffle(shuffled.begin(), shuffled.end(), std::mt19937(42));

    for (const auto& order : {reversed, shuffled}) {
        ReferencesList list;
        for (size_t i : order) {
            auto& referrers = list.referenced_by[assets[i]];
            for (size_t j = 0; j <= i; ++j) {
                referrers.insert(graph_asset("referrer" + std::to_string(i) + "_" +
                                             std::to_string(j) + ".js"));
            }
        }

        auto top = top_references(list);
        ASSERT_EQ(top.size(), 5u);
        for (size_t i = 0; i < top.size(); ++i) {
            EXPECT_EQ(top[i].asset, assets[6 - i]);
            EXPECT_EQ(top[i].referenced_by.size(), 7 - i);
        }
    }
}

TEST_F(BackReferencesTest, FewerEntriesThanRequested) {
    std::vector<AssetPtr> assets{graph_asset("a.js"), graph_asset("b.js")};
    auto top = top_references(ascending_list(assets), 5);
    ASSERT_EQ(top.size(), 2u);
    EXPECT_EQ(top[0].asset, assets[1]);
    EXPECT_EQ(top[1].asset, assets[0]);
}

TEST_F(BackReferencesTest, ZeroRequested) {
    std::vector<AssetPtr> assets{graph_asset("a.js")};
    EXPECT_TRUE(top_references(ascending_list(assets), 0).empty());
    EXPECT_TRUE(top_references(ReferencesList{}).empty());
}

TEST_F(BackReferencesTest, EqualCountsAreAllKept) {
    ReferencesList list;
    auto referrer = graph_asset("index.js");
    std::vector<AssetPtr> assets;
    for (int i = 0; i < 3; ++i) {
        assets.push_back(graph_asset("tie" + std::to_string(i) + ".js"));
        list.referenced_by[assets.back()].insert(referrer);
    }

    auto top = top_references(list, 3);
    ASSERT_EQ(top.size(), 3u);
    std::vector<std::string> paths;
    for (const auto& entry : top) {
        paths.push_back(entry.asset->path().path);
    }
    std::sort(paths.begin(), paths.end());
    EXPECT_EQ(paths, (std::vector<std::string>{"tie0.js", "tie1.js", "tie2.js"}));
}

// ============================================================================
// Printing
// ============================================================================

TEST_F(BackReferencesTest, PrintFormat) {
    auto shared = graph_asset("src/shared.js");
    auto list = ReferencesList{};
    list.referenced_by[shared] = {graph_asset("a.js"), graph_asset("b.js")};

    std::ostringstream out;
    print_references(top_references(list), out);
    EXPECT_EQ(out.str(), "TOP REFERENCES:\nsrc/shared.js -> 2 times referenced\n");
}

TEST_F(BackReferencesTest, PrintMostReferenced) {
    auto index = graph_asset("index.js");
    auto a = graph_asset("a.js");
    auto b = graph_asset("b.js");
    auto util = graph_asset("util.js");
    index->add_edge(a);
    index->add_edge(b);
    index->add_edge(util);
    a->add_edge(util);
    b->add_edge(util);

    std::ostringstream out;
    print_most_referenced(ctx_, index, out);

    auto text = out.str();
    EXPECT_EQ(text.rfind("TOP REFERENCES:\nutil.js -> 3 times referenced\n", 0), 0u);
    EXPECT_NE(text.find("a.js -> 1 times referenced\n"), std::string::npos);
    EXPECT_NE(text.find("b.js -> 1 times referenced\n"), std::string::npos);
    EXPECT_EQ(text.find("index.js ->"), std::string::npos);
}

TEST_F(BackReferencesTest, PrintNothingReferenced) {
    std::ostringstream out;
    print_most_referenced(ctx_, graph_asset("alone.js"), out);
    EXPECT_EQ(out.str(), "TOP REFERENCES:\n");
}
