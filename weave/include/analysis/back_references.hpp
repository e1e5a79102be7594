//! # Back References
//!
//! Which assets reference which, computed over an aggregation tree. A leaf
//! maps each asset its asset references to the leaf asset; an inner node
//! merges its children's maps by set union. Results are memoized per node,
//! so shared subtrees are computed once.
//!
//! ## Example
//!
//! ```cpp
//! auto list = analysis::back_references(ctx, graph::aggregate(ctx, entry));
//! for (const auto& entry : analysis::top_references(*list)) {
//!     // entry.asset is referenced by entry.referenced_by.size() assets
//! }
//! ```

#pragma once

#include "core/fwd.hpp"
#include "graph/aggregated_graph.hpp"

#include <iosfwd>
#include <memory>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace weave::query {
class QueryContext;
} // namespace weave::query

namespace weave::analysis {

struct ReferencesList {
    std::unordered_map<core::AssetPtr, std::unordered_set<core::AssetPtr>> referenced_by;
};

using ReferencesListPtr = std::shared_ptr<const ReferencesList>;

/// One row of a top-N report.
struct ReferenceEntry {
    core::AssetPtr asset;
    std::unordered_set<core::AssetPtr> referenced_by;
};

/// Back references below `node`. Memoized.
[[nodiscard]] ReferencesListPtr back_references(query::QueryContext& ctx,
                                                const graph::AggregatedGraphPtr& node);

/// Work behind the `back_references` query.
[[nodiscard]] ReferencesListPtr compute_back_references(query::QueryContext& ctx,
                                                        const graph::AggregatedGraphPtr& node);

/// The `n` entries referenced by the most assets, most referenced first.
/// Entries with equal counts keep the list's iteration order, which is not
/// stable across runs.
[[nodiscard]] std::vector<ReferenceEntry> top_references(const ReferencesList& list,
                                                         size_t n = 5);

/// Writes `TOP REFERENCES:` followed by one `<path> -> <N> times referenced`
/// line per entry.
void print_references(const std::vector<ReferenceEntry>& entries, std::ostream& out);

/// Aggregates `asset`, computes back references and prints the top five.
void print_most_referenced(query::QueryContext& ctx, const core::AssetPtr& asset,
                           std::ostream& out);

} // namespace weave::analysis
