#include "core/resolve.hpp"

#include "core/issue.hpp"
#include "json/json.hpp"
#include "log/log.hpp"
#include "query/query_context.hpp"

#include <cstring>
#include <optional>
#include <string_view>

namespace weave::core {

ResolveResult resolve(query::QueryContext& ctx, const fs::FileSystemPath& context_path,
                      const Request& request, const ResolveOptions& options) {
    return ctx.resolve(context_path, request, options);
}

std::string types_package_name(const std::string& module) {
    if (module.starts_with("@")) {
        auto slash = module.find('/');
        if (slash != std::string::npos) {
            return "@types/" + module.substr(1, slash - 1) + "__" + module.substr(slash + 1);
        }
    }
    return "@types/" + module;
}

namespace {

/// One resolution. Checks candidate files through the session and stops at
/// the first hit.
class Resolver {
public:
    Resolver(query::QueryContext& ctx, const ResolveOptions& options)
        : ctx_(ctx), options_(options) {}

    std::optional<fs::FileSystemPath> resolve_path(const fs::FileSystemPath& path) {
        if (auto file = resolve_file(path)) {
            return file;
        }
        return resolve_directory(path);
    }

    std::optional<fs::FileSystemPath> resolve_module(const fs::FileSystemPath& context_path,
                                                     const Request& request) {
        fs::FileSystemPath dir = context_path;
        while (true) {
            for (const auto& modules_dir : options_.modules) {
                if (auto found = resolve_in_modules_dir(dir, modules_dir, request)) {
                    return found;
                }
            }
            if (dir.path.empty()) {
                return std::nullopt;
            }
            dir = dir.parent();
        }
    }

private:
    query::QueryContext& ctx_;
    const ResolveOptions& options_;

    bool exists(const fs::FileSystemPath& path) {
        if (path.path.empty()) {
            return false;
        }
        try {
            return ctx_.read_file(path).exists;
        } catch (const fs::ReadError&) {
            // Present but unreadable; whoever reads the content reports it
            return true;
        }
    }

    std::optional<fs::FileSystemPath> try_candidate(const fs::FileSystemPath& base,
                                            const std::string& suffix) {
        auto candidate = fs::FileSystemPath{base.fs, base.path + suffix};
        if (exists(candidate)) {
            WEAVE_LOG_TRACE("resolve", "hit " << candidate.to_string());
            return candidate;
        }
        return std::nullopt;
    }

    std::optional<fs::FileSystemPath> resolve_file(const fs::FileSystemPath& path) {
        if (path.path.empty()) {
            return std::nullopt;
        }

        if (options_.types) {
            // "./x.js" has its declarations in "./x.d.ts"
            for (const char* js_ext : {".js", ".mjs", ".cjs"}) {
                std::string_view view = path.path;
                if (view.ends_with(js_ext)) {
                    auto stem = fs::FileSystemPath{
                        path.fs, path.path.substr(0, path.path.size() - std::strlen(js_ext))};
                    if (auto found = try_candidate(stem, ".d.ts")) {
                        return found;
                    }
                }
            }
            if (path.path.ends_with(".d.ts") || path.path.ends_with(".ts") ||
                path.path.ends_with(".tsx")) {
                if (auto found = try_candidate(path, "")) {
                    return found;
                }
            }
        } else if (auto found = try_candidate(path, "")) {
            return found;
        }

        for (const auto& ext : options_.extensions) {
            if (auto found = try_candidate(path, ext)) {
                return found;
            }
        }
        return std::nullopt;
    }

    std::optional<fs::FileSystemPath> resolve_directory(const fs::FileSystemPath& dir) {
        if (auto manifest = dir.join("package.json")) {
            if (auto content = read_manifest(*manifest); content && content->exists) {
                if (auto entry = resolve_package_entry(dir, *manifest, content->bytes)) {
                    return entry;
                }
            }
        }

        if (auto index = dir.join(options_.index_stem)) {
            return resolve_file(*index);
        }
        return std::nullopt;
    }

    /// Nullopt, after reporting an issue, when the manifest cannot be read.
    std::optional<fs::FileContent> read_manifest(const fs::FileSystemPath& manifest) {
        try {
            return ctx_.read_file(manifest);
        } catch (const fs::ReadError& e) {
            ctx_.issues().report({IssueSeverity::Warning, IssueCodes::INVALID_PACKAGE_JSON,
                                  "resolve", manifest.to_string(), e.what()});
            return std::nullopt;
        }
    }

    std::optional<fs::FileSystemPath> resolve_package_entry(const fs::FileSystemPath& dir,
                                                            const fs::FileSystemPath& manifest,
                                                            const std::string& bytes) {
        auto parsed = json::parse_json(bytes);
        if (is_err(parsed)) {
            ctx_.issues().report({IssueSeverity::Warning, IssueCodes::INVALID_PACKAGE_JSON,
                                  "resolve", manifest.to_string(),
                                  "invalid package.json: " + unwrap_err(parsed).to_string()});
            return std::nullopt;
        }

        const auto& pkg = unwrap(parsed);
        std::vector<std::string> fields;
        if (options_.types) {
            fields = {"types", "typings"};
        } else {
            fields = {"main"};
        }

        for (const auto& field : fields) {
            auto entry = pkg.get_string(field);
            if (entry.empty()) {
                continue;
            }
            auto target = dir.join(entry);
            if (!target) {
                continue;
            }
            if (auto file = resolve_file(*target)) {
                return file;
            }
            if (auto index = target->join(options_.index_stem)) {
                if (auto file = resolve_file(*index)) {
                    return file;
                }
            }
        }
        return std::nullopt;
    }

    std::optional<fs::FileSystemPath> resolve_in_modules_dir(const fs::FileSystemPath& dir,
                                                             const std::string& modules_dir,
                                                             const Request& request) {
        std::vector<std::string> packages{request.module};
        if (options_.types) {
            packages.push_back(types_package_name(request.module));
        }

        for (const auto& package : packages) {
            auto package_dir = dir.join(modules_dir + "/" + package);
            if (!package_dir) {
                continue;
            }
            if (!request.path.empty()) {
                if (auto sub = package_dir->join(request.path)) {
                    if (auto found = resolve_path(*sub)) {
                        return found;
                    }
                }
                continue;
            }
            if (auto found = resolve_directory(*package_dir)) {
                return found;
            }
        }
        return std::nullopt;
    }
};

} // namespace

ResolveResult resolve_request(query::QueryContext& ctx, const fs::FileSystemPath& context_path,
                              const Request& request, const ResolveOptions& options) {
    if (request.is_malformed()) {
        return ResolveResult::unresolvable();
    }

    Resolver resolver(ctx, options);
    std::optional<fs::FileSystemPath> found;

    switch (request.kind) {
    case Request::Kind::Relative:
        if (auto path = context_path.join(request.path)) {
            found = resolver.resolve_path(*path);
        }
        break;
    case Request::Kind::Absolute:
        if (auto path = fs::FileSystemPath::root(context_path.fs).join(request.path)) {
            found = resolver.resolve_path(*path);
        }
        break;
    case Request::Kind::Module:
        found = resolver.resolve_module(context_path, request);
        break;
    case Request::Kind::Empty:
    case Request::Kind::Unknown:
        break;
    }

    if (!found) {
        WEAVE_LOG_DEBUG("resolve", "'" << request.to_string() << "' from "
                                       << context_path.to_string() << " is unresolvable");
        return ResolveResult::unresolvable();
    }
    WEAVE_LOG_TRACE("resolve", "'" << request.to_string() << "' -> " << found->to_string());
    return ResolveResult::single(ctx.source(*found));
}

} // namespace weave::core
