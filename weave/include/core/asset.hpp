//! # Assets
//!
//! An asset is an immutable, content-addressable unit with a path, lazily
//! computed content and outgoing references. Assets are shared through
//! `AssetPtr`; identity is pointer identity, and the query engine makes sure
//! each logical asset is only created once per session.
//!
//! Asset methods that need other queries receive the session explicitly.

#pragma once

#include "core/fwd.hpp"
#include "core/resolve_result.hpp"
#include "fs/file_system.hpp"

#include <string>
#include <vector>

namespace weave::query {
class QueryContext;
} // namespace weave::query

namespace weave::core {

class Asset {
public:
    virtual ~Asset() = default;

    [[nodiscard]] virtual fs::FileSystemPath path() const = 0;

    [[nodiscard]] virtual fs::FileContent content(query::QueryContext& ctx) const = 0;

    /// Outgoing references. Defaults to none.
    [[nodiscard]] virtual std::vector<AssetReferencePtr> references(query::QueryContext& ctx) const;
};

class AssetReference {
public:
    virtual ~AssetReference() = default;

    [[nodiscard]] virtual ResolveResult resolve_reference(query::QueryContext& ctx) const = 0;

    /// Human-readable description for diagnostics.
    [[nodiscard]] virtual std::string to_string() const = 0;
};

/// A file read from a file system. Created once per path by the session.
class FileSource : public Asset {
public:
    explicit FileSource(fs::FileSystemPath path) : path_(std::move(path)) {}

    [[nodiscard]] fs::FileSystemPath path() const override {
        return path_;
    }
    [[nodiscard]] fs::FileContent content(query::QueryContext& ctx) const override;

private:
    fs::FileSystemPath path_;
};

/// A reference that always resolves to one fixed asset.
class SingleAssetReference : public AssetReference {
public:
    SingleAssetReference(AssetPtr asset, std::string description)
        : asset_(std::move(asset)), description_(std::move(description)) {}

    [[nodiscard]] ResolveResult resolve_reference(query::QueryContext& ctx) const override;
    [[nodiscard]] std::string to_string() const override {
        return description_;
    }

private:
    AssetPtr asset_;
    std::string description_;
};

/// Every asset `asset` references, in reference order, without duplicates.
/// References attached to resolve results are followed as well. Memoized
/// per asset.
[[nodiscard]] std::vector<AssetPtr> all_referenced_assets(query::QueryContext& ctx,
                                                          const AssetPtr& asset);

/// The uncached walk behind `all_referenced_assets`.
[[nodiscard]] std::vector<AssetPtr> collect_referenced_assets(query::QueryContext& ctx,
                                                              const AssetPtr& asset);

} // namespace weave::core
