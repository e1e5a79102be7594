//! # Query Provider Registry
//!
//! Maps query kinds to their provider functions.
//! A provider function takes a QueryContext and QueryKey, executes the
//! computation, and returns the result as std::any.
//!
//! A provider registered as cycle tolerant is short-circuited instead of
//! failing when it re-enters itself with an equal key: the re-entrant call
//! returns a default-constructed result.

#pragma once

#include "query/query_key.hpp"

#include <any>
#include <array>
#include <functional>

namespace weave::query {

class QueryContext;

/// Type-erased provider function.
using ProviderFn = std::function<std::any(QueryContext&, const QueryKey&)>;

struct ProviderEntry {
    ProviderFn fn;
    bool cycle_tolerant = false;
};

/// Registry mapping query kinds to their provider functions.
class QueryProviderRegistry {
public:
    /// Register a provider for a query kind, replacing any previous one.
    void register_provider(QueryKind kind, ProviderFn provider, bool cycle_tolerant = false);

    /// Get the provider for a query kind. Returns nullptr if not registered.
    [[nodiscard]] const ProviderEntry* get_provider(QueryKind kind) const;

    /// Register all core providers (read_file, module, resolve, aggregate, ...)
    void register_core_providers();

private:
    std::array<ProviderEntry, static_cast<size_t>(QueryKind::COUNT)> providers_{};
};

} // namespace weave::query
