// Shared fixtures for tests that build module graphs over an in-memory
// project.

#pragma once

#include "context/module_asset_context.hpp"
#include "core/asset.hpp"
#include "fs/file_system.hpp"
#include "query/query_context.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>

namespace weave::test_support {

/// Asset with a fixed, settable reference list. Used to build arbitrary
/// reference graphs (cycles, diamonds) without going through resolution.
class GraphAsset : public core::Asset {
public:
    explicit GraphAsset(fs::FileSystemPath path) : path_(std::move(path)) {}

    [[nodiscard]] fs::FileSystemPath path() const override {
        return path_;
    }
    [[nodiscard]] fs::FileContent content(query::QueryContext& /*ctx*/) const override {
        return fs::FileContent::from("// " + path_.path);
    }
    [[nodiscard]] std::vector<core::AssetReferencePtr>
    references(query::QueryContext& /*ctx*/) const override {
        std::vector<core::AssetReferencePtr> references;
        for (const auto& target : edges_) {
            references.push_back(std::make_shared<core::SingleAssetReference>(
                target, "edge to " + target->path().path));
        }
        return references;
    }

    /// Edges must be set before the asset is first queried.
    void add_edge(core::AssetPtr target) {
        edges_.push_back(std::move(target));
    }

private:
    fs::FileSystemPath path_;
    std::vector<core::AssetPtr> edges_;
};

class ProjectTest : public ::testing::Test {
protected:
    std::shared_ptr<fs::MemoryFileSystem> memory_ =
        std::make_shared<fs::MemoryFileSystem>("project");
    query::QueryContext ctx_;

    ProjectTest() : ctx_(query::QueryOptions{}) {}
    explicit ProjectTest(const query::QueryOptions& options) : ctx_(options) {}

    fs::FileSystemPath path(const std::string& p) const {
        return {memory_, p};
    }

    void file(const std::string& p, std::string content) {
        memory_->set_file(p, std::move(content));
    }

    core::AssetContextPtr
    context(const std::string& dir = "src", core::Environment environment = {},
            core::TransitionsPtr transitions = nullptr,
            module_options::ModuleOptionsContextPtr options = nullptr) {
        return weave::context::ModuleAssetContext::create(&ctx_, std::move(transitions), path(dir),
                                                          environment, std::move(options));
    }

    /// The module built for the file at `p` by a context in its directory.
    core::AssetPtr module_at(const std::string& p, core::Environment environment = {}) {
        auto source = ctx_.source(path(p));
        return context(path(p).parent().path, environment)->process(source);
    }

    std::shared_ptr<GraphAsset> graph_asset(const std::string& p) {
        return std::make_shared<GraphAsset>(path(p));
    }

    static std::vector<std::string> paths_of(const std::vector<core::AssetPtr>& assets) {
        std::vector<std::string> paths;
        for (const auto& asset : assets) {
            paths.push_back(asset->path().path);
        }
        return paths;
    }
};

} // namespace weave::test_support
