//! # Resolve Result
//!
//! The outcome of resolving one request: the primary assets it names plus
//! any references attached to the result (for example a TypeScript types
//! reference). An empty primary set means the request was unresolvable.

#pragma once

#include "core/fwd.hpp"

#include <vector>

namespace weave::core {

class ResolveResult {
public:
    ResolveResult() = default;

    [[nodiscard]] static ResolveResult unresolvable() {
        return {};
    }

    [[nodiscard]] static ResolveResult single(AssetPtr asset) {
        ResolveResult result;
        result.add_primary(std::move(asset));
        return result;
    }

    [[nodiscard]] const std::vector<AssetPtr>& primary_assets() const {
        return primary_;
    }

    [[nodiscard]] const std::vector<AssetReferencePtr>& references() const {
        return references_;
    }

    [[nodiscard]] bool is_unresolvable() const {
        return primary_.empty();
    }

    /// Adds a primary asset unless the same asset is already present.
    void add_primary(AssetPtr asset);

    /// Attaches a reference unless the same reference is already attached.
    void add_reference(AssetReferencePtr reference);

    /// Applies `fn` to every primary asset, keeping attached references.
    template <typename Fn> [[nodiscard]] ResolveResult map(Fn&& fn) const {
        ResolveResult result;
        for (const auto& asset : primary_) {
            result.add_primary(fn(asset));
        }
        result.references_ = references_;
        return result;
    }

private:
    std::vector<AssetPtr> primary_;
    std::vector<AssetReferencePtr> references_;
};

} // namespace weave::core
