#include "query/query_context.hpp"

#include "analysis/back_references.hpp"
#include "core/asset.hpp"
#include "graph/aggregated_graph.hpp"
#include "graph/dominators.hpp"
#include "log/log.hpp"
#include "modules/module_asset.hpp"

#include <algorithm>
#include <cstdint>
#include <functional>
#include <set>
#include <sstream>
#include <unordered_set>
#include <utility>

namespace weave::query {

// ============================================================================
// QueryKey utilities
// ============================================================================

QueryKind query_kind(const QueryKey& key) {
    return static_cast<QueryKind>(key.index());
}

const char* query_kind_name(QueryKind kind) {
    switch (kind) {
    case QueryKind::ReadFile:
        return "read_file";
    case QueryKind::SourceAsset:
        return "source";
    case QueryKind::Module:
        return "module";
    case QueryKind::Process:
        return "process";
    case QueryKind::Resolve:
        return "resolve";
    case QueryKind::ResolveAsset:
        return "resolve_asset";
    case QueryKind::ReferencedAssets:
        return "referenced_assets";
    case QueryKind::Rebase:
        return "rebase";
    case QueryKind::Aggregate:
        return "aggregate";
    case QueryKind::Dominators:
        return "dominators";
    case QueryKind::Dominated:
        return "dominated";
    case QueryKind::AggregateNode:
        return "aggregate_node";
    case QueryKind::BackReferences:
        return "back_references";
    case QueryKind::EmitAsset:
        return "emit_asset";
    case QueryKind::EmitRecursive:
        return "emit_recursive";
    case QueryKind::EmitAggregated:
        return "emit_aggregated";
    default:
        return "unknown";
    }
}

static std::string describe_asset(const core::AssetPtr& asset) {
    return asset ? asset->path().to_string() : "<null>";
}

std::string describe_key(const QueryKey& key) {
    std::ostringstream oss;
    oss << query_kind_name(query_kind(key)) << '(';
    std::visit(
        [&](const auto& k) {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, ReadFileKey> || std::is_same_v<T, SourceAssetKey>) {
                oss << k.path.to_string();
            } else if constexpr (std::is_same_v<T, ModuleKey>) {
                oss << describe_asset(k.source) << ", " << k.environment.to_string();
            } else if constexpr (std::is_same_v<T, ProcessKey>) {
                oss << describe_asset(k.asset) << " in " << k.context.context_path.to_string();
            } else if constexpr (std::is_same_v<T, ResolveKey>) {
                oss << "'" << k.request.to_string() << "' from " << k.context_path.to_string();
            } else if constexpr (std::is_same_v<T, ResolveAssetKey>) {
                oss << "'" << k.request.to_string() << "' from " << k.context_path.to_string()
                    << ", " << k.context.environment.to_string();
            } else if constexpr (std::is_same_v<T, RebaseKey>) {
                oss << describe_asset(k.source) << " -> " << k.output_dir.to_string();
            } else if constexpr (std::is_same_v<T, DominatorsKey>) {
                oss << describe_asset(k.root);
            } else if constexpr (std::is_same_v<T, DominatedKey> ||
                                 std::is_same_v<T, AggregateNodeKey>) {
                oss << describe_asset(k.asset) << " below " << describe_asset(k.root);
            } else if constexpr (std::is_same_v<T, BackReferencesKey>) {
                oss << "node@" << static_cast<const void*>(k.node.get());
            } else if constexpr (std::is_same_v<T, EmitAggregatedKey>) {
                oss << "node@" << static_cast<const void*>(k.node.get()) << ", "
                    << k.output_dir.to_string();
            } else {
                oss << describe_asset(k.asset);
            }
        },
        key);
    oss << ')';
    return oss.str();
}

namespace {

size_t hash_combine(size_t seed, size_t val) {
    return seed ^ (val + 0x9e3779b9 + (seed << 6) + (seed >> 2));
}

size_t hash_path(const fs::FileSystemPath& path) {
    return hash_combine(std::hash<const void*>{}(path.fs.get()), std::hash<std::string>{}(path.path));
}

template <typename T> size_t hash_ptr(const std::shared_ptr<T>& ptr) {
    return std::hash<const void*>{}(static_cast<const void*>(ptr.get()));
}

size_t hash_context(const ContextKey& k) {
    size_t h = hash_ptr(k.transitions);
    h = hash_combine(h, hash_path(k.context_path));
    h = hash_combine(h, k.environment.hash());
    h = hash_combine(h, hash_ptr(k.module_options_context));
    h = hash_combine(h, hash_ptr(k.transition));
    return h;
}

} // namespace

size_t QueryKeyHash::operator()(const QueryKey& key) const {
    size_t h = std::hash<size_t>{}(key.index());

    std::visit(
        [&](const auto& k) {
            using T = std::decay_t<decltype(k)>;
            if constexpr (std::is_same_v<T, ReadFileKey> || std::is_same_v<T, SourceAssetKey>) {
                h = hash_combine(h, hash_path(k.path));
            } else if constexpr (std::is_same_v<T, ModuleKey>) {
                h = hash_combine(h, hash_ptr(k.source));
                h = hash_combine(h, hash_ptr(k.transitions));
                h = hash_combine(h, k.environment.hash());
                h = hash_combine(h, hash_ptr(k.module_options_context));
            } else if constexpr (std::is_same_v<T, ProcessKey>) {
                h = hash_combine(h, hash_context(k.context));
                h = hash_combine(h, hash_ptr(k.asset));
            } else if constexpr (std::is_same_v<T, ResolveKey>) {
                h = hash_combine(h, hash_path(k.context_path));
                h = hash_combine(h, k.request.hash());
                h = hash_combine(h, k.options.hash());
            } else if constexpr (std::is_same_v<T, ResolveAssetKey>) {
                h = hash_combine(h, hash_context(k.context));
                h = hash_combine(h, hash_path(k.context_path));
                h = hash_combine(h, k.request.hash());
                h = hash_combine(h, k.options.hash());
            } else if constexpr (std::is_same_v<T, RebaseKey>) {
                h = hash_combine(h, hash_ptr(k.source));
                h = hash_combine(h, hash_path(k.input_dir));
                h = hash_combine(h, hash_path(k.output_dir));
            } else if constexpr (std::is_same_v<T, DominatorsKey>) {
                h = hash_combine(h, hash_ptr(k.root));
            } else if constexpr (std::is_same_v<T, DominatedKey> ||
                                 std::is_same_v<T, AggregateNodeKey>) {
                h = hash_combine(h, hash_ptr(k.root));
                h = hash_combine(h, hash_ptr(k.asset));
            } else if constexpr (std::is_same_v<T, BackReferencesKey>) {
                h = hash_combine(h, hash_ptr(k.node));
            } else if constexpr (std::is_same_v<T, EmitAggregatedKey>) {
                h = hash_combine(h, hash_ptr(k.node));
                h = hash_combine(h, hash_path(k.output_dir));
            } else {
                h = hash_combine(h, hash_ptr(k.asset));
            }
        },
        key);

    return h;
}

static std::string describe_cycle(const std::vector<QueryKey>& cycle) {
    std::string s = "query cycle: ";
    for (size_t i = 0; i < cycle.size(); ++i) {
        if (i > 0) {
            s += " -> ";
        }
        s += describe_key(cycle[i]);
    }
    return s;
}

QueryCycleError::QueryCycleError(std::vector<QueryKey> cycle)
    : std::runtime_error(describe_cycle(cycle)), cycle_(std::move(cycle)) {}

// ============================================================================
// QueryContext: construction and convenience methods
// ============================================================================

QueryContext::QueryContext(const QueryOptions& options,
                           std::shared_ptr<modules::ModuleAssetFactory> module_assets)
    : options_(options), module_assets_(std::move(module_assets)),
      graph_nodes_(std::make_unique<graph::NodeInterner>()) {
    if (options_.max_fan_out < 2) {
        throw std::invalid_argument("QueryOptions::max_fan_out must be at least 2");
    }
    if (!module_assets_) {
        module_assets_ = std::make_shared<modules::BasicModuleAssetFactory>();
    }
    providers_.register_core_providers();
}

QueryContext::~QueryContext() = default;

fs::FileContent QueryContext::read_file(const fs::FileSystemPath& path) {
    return force<fs::FileContent>(ReadFileKey{path});
}

core::AssetPtr QueryContext::source(const fs::FileSystemPath& path) {
    return force<core::AssetPtr>(SourceAssetKey{path});
}

core::AssetPtr
QueryContext::module(const core::AssetPtr& source, const core::TransitionsPtr& transitions,
                     const core::Environment& environment,
                     const module_options::ModuleOptionsContextPtr& module_options_context) {
    return force<core::AssetPtr>(
        ModuleKey{source, transitions, environment, module_options_context});
}

core::AssetPtr QueryContext::process(const ContextKey& context, const core::AssetPtr& asset) {
    return force<core::AssetPtr>(ProcessKey{context, asset});
}

core::ResolveResult QueryContext::resolve(const fs::FileSystemPath& context_path,
                                          const core::Request& request,
                                          const core::ResolveOptions& options) {
    return force<core::ResolveResult>(ResolveKey{context_path, request, options});
}

core::ResolveResult QueryContext::resolve_asset(const ContextKey& context,
                                                const fs::FileSystemPath& context_path,
                                                const core::Request& request,
                                                const core::ResolveOptions& options) {
    return force<core::ResolveResult>(ResolveAssetKey{context, context_path, request, options});
}

std::vector<core::AssetPtr> QueryContext::referenced_assets(const core::AssetPtr& asset) {
    return force<std::vector<core::AssetPtr>>(ReferencedAssetsKey{asset});
}

core::AssetPtr QueryContext::rebase(const core::AssetPtr& source,
                                    const fs::FileSystemPath& input_dir,
                                    const fs::FileSystemPath& output_dir) {
    return force<core::AssetPtr>(RebaseKey{source, input_dir, output_dir});
}

graph::AggregatedGraphPtr QueryContext::aggregate(const core::AssetPtr& asset) {
    return force<graph::AggregatedGraphPtr>(AggregateKey{asset});
}

graph::AssetDominatorsPtr QueryContext::dominators(const core::AssetPtr& root) {
    return force<graph::AssetDominatorsPtr>(DominatorsKey{root});
}

std::vector<core::AssetPtr> QueryContext::dominated(const core::AssetPtr& root,
                                                    const core::AssetPtr& asset) {
    return force<std::vector<core::AssetPtr>>(DominatedKey{root, asset});
}

graph::AggregatedGraphPtr QueryContext::aggregate_node(const core::AssetPtr& root,
                                                       const core::AssetPtr& asset) {
    return force<graph::AggregatedGraphPtr>(AggregateNodeKey{root, asset});
}

analysis::ReferencesListPtr QueryContext::back_references(const graph::AggregatedGraphPtr& node) {
    return force<analysis::ReferencesListPtr>(BackReferencesKey{node});
}

fs::Completion QueryContext::emit_asset(const core::AssetPtr& asset) {
    return force<fs::Completion>(EmitAssetKey{asset});
}

fs::Completion QueryContext::emit_recursive(const core::AssetPtr& asset) {
    return force<fs::Completion>(EmitRecursiveKey{asset});
}

fs::Completion QueryContext::emit_aggregated(const graph::AggregatedGraphPtr& node,
                                             const fs::FileSystemPath& output_dir) {
    return force<fs::Completion>(EmitAggregatedKey{node, output_dir});
}

// ============================================================================
// Execution
// ============================================================================

std::any QueryContext::fetch(const QueryKey& key) {
    std::optional<CacheEntry> entry;
    try {
        entry = update(key);
    } catch (...) {
        // A failed query is still an input of its caller
        deps_.record_dependency(key);
        throw;
    }
    deps_.record_dependency(key);
    if (!entry) {
        return {};
    }
    return std::move(entry->result);
}

std::optional<CacheEntry> QueryContext::update(const QueryKey& key) {
    auto entry = cache_.find(key);
    if (entry && entry->verified_at == revision_) {
        return entry;
    }

    auto kind = query_kind(key);
    const auto* provider = providers_.get_provider(kind);
    if (!provider) {
        throw std::logic_error(std::string("no provider registered for query ") +
                               query_kind_name(kind));
    }

    auto cycle = deps_.detect_cycle(key);
    if (cycle) {
        if (!provider->cycle_tolerant) {
            throw QueryCycleError(std::move(*cycle));
        }
        if (options_.trace_cycles) {
            WEAVE_LOG_DEBUG("query", "short-circuit re-entrant " << describe_key(key));
        }
        return std::nullopt;
    }

    // Cycle-tolerant results depend on where the cycle was entered, so they
    // are never reused across revisions
    if (entry && !provider->cycle_tolerant && try_mark_green(key, *entry)) {
        cache_.mark_verified(key, revision_);
        entry->verified_at = revision_;
        return entry;
    }
    return execute(key, *provider, entry);
}

bool QueryContext::try_mark_green(const QueryKey& key, const CacheEntry& entry) {
    for (const auto& dep : entry.dependencies) {
        std::optional<CacheEntry> current;
        try {
            current = update(dep);
        } catch (const fs::ReadError& e) {
            // Recompute so the dependent handles the failure itself
            WEAVE_LOG_DEBUG("query", describe_key(key) << " has an unreadable input: " << e.what());
            return false;
        }
        if (!current || current->changed_at > entry.verified_at) {
            return false;
        }
    }
    return true;
}

CacheEntry QueryContext::execute(const QueryKey& key, const ProviderEntry& provider,
                                 const std::optional<CacheEntry>& previous) {
    deps_.push_active(key);
    std::any raw_result;
    try {
        raw_result = provider.fn(*this, key);
    } catch (...) {
        deps_.pop_active();
        throw;
    }
    auto recorded_deps = deps_.current_dependencies();
    deps_.pop_active();
    ++computations_[static_cast<size_t>(query_kind(key))];

    if (options_.verbose) {
        WEAVE_LOG_INFO("query", "computed " << describe_key(key) << " (" << recorded_deps.size()
                                            << " deps)");
    }

    CacheEntry entry;
    auto output_fp = compute_output_fingerprint(key, raw_result);
    entry.output_fingerprint = output_fp.value_or(Fingerprint{});
    entry.dependencies = std::move(recorded_deps);
    entry.verified_at = revision_;
    if (output_fp && previous && previous->output_fingerprint == *output_fp &&
        previous->result.type() == raw_result.type()) {
        // Same output as before: keep the old object so dependents stay green
        entry.result = previous->result;
        entry.changed_at = previous->changed_at;
    } else {
        entry.result = std::move(raw_result);
        entry.changed_at = revision_;
    }
    cache_.insert_entry(key, entry);
    return entry;
}

// ============================================================================
// Invalidation
// ============================================================================

Revision QueryContext::start_revision() {
    collect_garbage();
    return ++revision_;
}

bool QueryContext::invalidate_file(const fs::FileSystemPath& path) {
    QueryKey key = ReadFileKey{path};
    auto entry = cache_.get_entry(key);
    if (!entry) {
        if (!cache_.has_dependents(key)) {
            // Never read in this session, so nothing can depend on it
            return false;
        }
        auto revision = start_revision();
        WEAVE_LOG_DEBUG("query", "retrying failed read of " << path.to_string() << " at revision "
                                                            << revision);
        return true;
    }

    fs::FileContent fresh;
    try {
        fresh = path.read();
    } catch (const fs::ReadError&) {
        start_revision();
        cache_.invalidate(key);
        return true;
    }

    auto output_fp = fingerprint_content(fresh);
    if (output_fp == entry->output_fingerprint) {
        WEAVE_LOG_DEBUG("query", "unchanged " << path.to_string() << ", keeping dependents");
        return false;
    }

    auto revision = start_revision();
    cache_.insert<fs::FileContent>(key, std::move(fresh), output_fp, {}, revision, revision);
    WEAVE_LOG_DEBUG("query", "changed " << path.to_string() << ", revision " << revision);
    return true;
}

// ============================================================================
// Garbage collection
// ============================================================================

size_t QueryContext::collect_garbage() {
    // (root, asset) pairs present in some cached dominator tree
    std::set<std::pair<const core::Asset*, const core::Asset*>> positions;
    std::vector<graph::AggregatedGraphPtr> trees;

    cache_.for_each([&](const QueryKey& key, const CacheEntry& entry) {
        switch (query_kind(key)) {
        case QueryKind::Dominators:
            if (const auto* dominators = std::any_cast<graph::AssetDominatorsPtr>(&entry.result)) {
                const auto* root = std::get<DominatorsKey>(key).root.get();
                for (const auto& asset : (*dominators)->graph.nodes) {
                    positions.emplace(root, asset.get());
                }
            }
            break;
        case QueryKind::Aggregate:
        case QueryKind::AggregateNode:
            if (const auto* tree = std::any_cast<graph::AggregatedGraphPtr>(&entry.result)) {
                trees.push_back(*tree);
            }
            break;
        default:
            break;
        }
    });

    std::unordered_set<const graph::AggregatedGraph*> live_nodes;
    std::vector<const graph::AggregatedGraph*> stack;
    for (const auto& tree : trees) {
        stack.push_back(tree.get());
    }
    while (!stack.empty()) {
        const auto* node = stack.back();
        stack.pop_back();
        if (!live_nodes.insert(node).second || node->is_leaf()) {
            continue;
        }
        for (const auto& child : node->children()) {
            stack.push_back(child.get());
        }
    }

    size_t removed = cache_.erase_if([&](const QueryKey& key, const CacheEntry&) {
        return std::visit(
            [&](const auto& k) {
                using T = std::decay_t<decltype(k)>;
                if constexpr (std::is_same_v<T, DominatedKey> ||
                              std::is_same_v<T, AggregateNodeKey>) {
                    return positions.count({k.root.get(), k.asset.get()}) == 0;
                } else if constexpr (std::is_same_v<T, BackReferencesKey> ||
                                     std::is_same_v<T, EmitAggregatedKey>) {
                    return live_nodes.count(k.node.get()) == 0;
                } else {
                    return false;
                }
            },
            key);
    });
    trees.clear();
    size_t swept = graph_nodes_->sweep();

    if (removed > 0 || swept > 0) {
        WEAVE_LOG_DEBUG("query", "collected " << removed << " cached results, " << swept
                                              << " aggregation nodes");
    }
    return removed;
}

// ============================================================================
// Fingerprint computation
// ============================================================================

namespace {

/// Accumulates object identities and bytes into one fingerprint.
class FingerprintBuilder {
public:
    void add(const void* ptr) {
        auto address = reinterpret_cast<uintptr_t>(ptr);
        bytes_.append(reinterpret_cast<const char*>(&address), sizeof(address));
    }

    void add(const std::string& text) {
        add_size(text.size());
        bytes_ += text;
    }

    void add_size(size_t value) {
        bytes_.append(reinterpret_cast<const char*>(&value), sizeof(value));
    }

    template <typename T> void add_all(const std::vector<std::shared_ptr<T>>& items) {
        add_size(items.size());
        for (const auto& item : items) {
            add(static_cast<const void*>(item.get()));
        }
    }

    [[nodiscard]] Fingerprint finish() const {
        return fingerprint_string(bytes_);
    }

private:
    std::string bytes_;
};

} // namespace

std::optional<Fingerprint>
QueryContext::compute_output_fingerprint(const QueryKey& key, const std::any& raw_result) const {
    FingerprintBuilder builder;
    switch (query_kind(key)) {
    case QueryKind::ReadFile:
        if (const auto* content = std::any_cast<fs::FileContent>(&raw_result)) {
            return fingerprint_content(*content);
        }
        break;
    case QueryKind::SourceAsset:
    case QueryKind::Module:
    case QueryKind::Process:
    case QueryKind::Rebase:
        if (const auto* asset = std::any_cast<core::AssetPtr>(&raw_result)) {
            builder.add(asset->get());
            return builder.finish();
        }
        break;
    case QueryKind::Resolve:
    case QueryKind::ResolveAsset:
        if (const auto* result = std::any_cast<core::ResolveResult>(&raw_result)) {
            builder.add_all(result->primary_assets());
            builder.add_all(result->references());
            return builder.finish();
        }
        break;
    case QueryKind::ReferencedAssets:
    case QueryKind::Dominated:
        if (const auto* assets = std::any_cast<std::vector<core::AssetPtr>>(&raw_result)) {
            builder.add_all(*assets);
            return builder.finish();
        }
        break;
    case QueryKind::Dominators:
        if (const auto* dominators = std::any_cast<graph::AssetDominatorsPtr>(&raw_result)) {
            builder.add_all((*dominators)->graph.nodes);
            for (size_t idom : (*dominators)->tree.idom) {
                builder.add_size(idom);
            }
            return builder.finish();
        }
        break;
    case QueryKind::Aggregate:
    case QueryKind::AggregateNode:
        if (const auto* node = std::any_cast<graph::AggregatedGraphPtr>(&raw_result)) {
            builder.add(node->get());
            return builder.finish();
        }
        break;
    case QueryKind::BackReferences:
        if (const auto* list = std::any_cast<analysis::ReferencesListPtr>(&raw_result)) {
            // Map order is unspecified, so sort each level by address
            std::vector<std::pair<const void*, std::vector<const void*>>> sorted;
            for (const auto& [asset, referrers] : (*list)->referenced_by) {
                std::vector<const void*> by;
                for (const auto& referrer : referrers) {
                    by.push_back(referrer.get());
                }
                std::sort(by.begin(), by.end(), std::less<const void*>{});
                sorted.emplace_back(asset.get(), std::move(by));
            }
            std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) {
                return std::less<const void*>{}(a.first, b.first);
            });
            for (const auto& [asset, by] : sorted) {
                builder.add(asset);
                builder.add_size(by.size());
                for (const auto* referrer : by) {
                    builder.add(referrer);
                }
            }
            return builder.finish();
        }
        break;
    case QueryKind::EmitAsset:
    case QueryKind::EmitRecursive:
    case QueryKind::EmitAggregated:
        if (const auto* completion = std::any_cast<fs::Completion>(&raw_result)) {
            builder.add_size(completion->success ? 1 : 0);
            builder.add(completion->error_message);
            return builder.finish();
        }
        break;
    default:
        break;
    }
    return std::nullopt;
}

} // namespace weave::query
