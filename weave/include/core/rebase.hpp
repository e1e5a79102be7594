//! # Rebased Assets
//!
//! An asset moved from one directory tree into another. The content is the
//! source's content; the path is `output_dir` joined with the source path
//! relative to `input_dir`. References are rebased the same way, so rebasing
//! an entry asset rebases everything it reaches.
//!
//! Sources outside `input_dir` keep their original path.

#pragma once

#include "core/asset.hpp"

namespace weave::core {

class RebasedAsset : public Asset {
public:
    RebasedAsset(AssetPtr source, fs::FileSystemPath input_dir, fs::FileSystemPath output_dir);

    [[nodiscard]] fs::FileSystemPath path() const override;
    [[nodiscard]] fs::FileContent content(query::QueryContext& ctx) const override;
    [[nodiscard]] std::vector<AssetReferencePtr> references(query::QueryContext& ctx) const override;

    [[nodiscard]] const AssetPtr& source() const {
        return source_;
    }

private:
    AssetPtr source_;
    fs::FileSystemPath input_dir_;
    fs::FileSystemPath output_dir_;
};

/// Wraps a reference so every primary asset it resolves to is rebased.
class RebasedAssetReference : public AssetReference {
public:
    RebasedAssetReference(AssetReferencePtr reference, fs::FileSystemPath input_dir,
                          fs::FileSystemPath output_dir)
        : reference_(std::move(reference)), input_dir_(std::move(input_dir)),
          output_dir_(std::move(output_dir)) {}

    [[nodiscard]] ResolveResult resolve_reference(query::QueryContext& ctx) const override;
    [[nodiscard]] std::string to_string() const override;

private:
    AssetReferencePtr reference_;
    fs::FileSystemPath input_dir_;
    fs::FileSystemPath output_dir_;
};

/// `source` moved from `input_dir` into `output_dir`. Memoized, so each
/// source is rebased once per directory pair.
[[nodiscard]] AssetPtr rebase(query::QueryContext& ctx, const AssetPtr& source,
                              const fs::FileSystemPath& input_dir,
                              const fs::FileSystemPath& output_dir);

} // namespace weave::core
