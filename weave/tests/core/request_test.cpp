// Request tests
//
// Tests for request parsing, environments and resolve options.

#include "core/environment.hpp"
#include "core/request.hpp"

#include <gtest/gtest.h>

using namespace weave::core;

// ============================================================================
// Request Parsing
// ============================================================================

TEST(RequestTest, Relative) {
    auto r = Request::parse("./util");
    EXPECT_EQ(r.kind, Request::Kind::Relative);
    EXPECT_EQ(r.path, "./util");
    EXPECT_EQ(Request::parse("..").kind, Request::Kind::Relative);
    EXPECT_EQ(Request::parse("../lib/a.js").kind, Request::Kind::Relative);
}

TEST(RequestTest, Absolute) {
    auto r = Request::parse("/src/index.js");
    EXPECT_EQ(r.kind, Request::Kind::Absolute);
    EXPECT_EQ(r.path, "src/index.js");
}

TEST(RequestTest, BareModule) {
    auto r = Request::parse("react");
    EXPECT_EQ(r.kind, Request::Kind::Module);
    EXPECT_EQ(r.module, "react");
    EXPECT_EQ(r.path, "");

    auto sub = Request::parse("react-dom/client");
    EXPECT_EQ(sub.module, "react-dom");
    EXPECT_EQ(sub.path, "client");
}

TEST(RequestTest, ScopedModule) {
    auto r = Request::parse("@babel/core/lib/index.js");
    EXPECT_EQ(r.kind, Request::Kind::Module);
    EXPECT_EQ(r.module, "@babel/core");
    EXPECT_EQ(r.path, "lib/index.js");

    EXPECT_EQ(Request::parse("@babel/core").path, "");
    EXPECT_EQ(Request::parse("@babel").kind, Request::Kind::Unknown);
    EXPECT_EQ(Request::parse("@babel/").kind, Request::Kind::Unknown);
}

TEST(RequestTest, MalformedRequests) {
    EXPECT_EQ(Request::parse("").kind, Request::Kind::Empty);
    EXPECT_EQ(Request::parse("node:fs").kind, Request::Kind::Unknown);
    EXPECT_EQ(Request::parse("https://cdn.example.com/x.js").kind, Request::Kind::Unknown);
    EXPECT_EQ(Request::parse(".\\win\\path").kind, Request::Kind::Unknown);
    EXPECT_EQ(Request::parse("has space").kind, Request::Kind::Unknown);

    EXPECT_TRUE(Request::parse("").is_malformed());
    EXPECT_TRUE(Request::parse("node:fs").is_malformed());
    EXPECT_FALSE(Request::parse("./a").is_malformed());
}

TEST(RequestTest, OriginalIsKept) {
    EXPECT_EQ(Request::parse("@scope/pkg/sub").to_string(), "@scope/pkg/sub");
    EXPECT_STREQ(request_kind_name(Request::Kind::Module), "module");
}

// ============================================================================
// Environment
// ============================================================================

TEST(EnvironmentTest, ToString) {
    Environment env;
    EXPECT_EQ(env.to_string(), "node/esm");

    env.module_system = ModuleSystem::CommonJs;
    EXPECT_EQ(env.with_target(ExecutionTarget::Browser).with_typescript().to_string(),
              "browser/cjs+ts");
    EXPECT_EQ(env.to_string(), "node/cjs");
}

TEST(EnvironmentTest, DerivedValuesCompareByValue) {
    Environment env;
    EXPECT_NE(env, env.with_typescript());
    EXPECT_EQ(env.with_typescript(), env.with_typescript());
    EXPECT_EQ(env.with_typescript().hash(), env.with_typescript().hash());
    EXPECT_TRUE(env.with_typescript().is_typescript_enabled());
}

// ============================================================================
// Resolve Options
// ============================================================================

TEST(ResolveOptionsTest, ExtensionsFollowModuleSystem) {
    Environment esm;
    Environment cjs;
    cjs.module_system = ModuleSystem::CommonJs;

    EXPECT_EQ(resolve_options(esm).extensions,
              (std::vector<std::string>{".mjs", ".js", ".cjs", ".json"}));
    EXPECT_EQ(resolve_options(cjs).extensions,
              (std::vector<std::string>{".js", ".cjs", ".mjs", ".json"}));
}

TEST(ResolveOptionsTest, TypescriptTriesTsFirst) {
    auto options = typescript_resolve_options(Environment{});
    ASSERT_GE(options.extensions.size(), 2u);
    EXPECT_EQ(options.extensions[0], ".ts");
    EXPECT_EQ(options.extensions[1], ".tsx");
    EXPECT_FALSE(options.types);
}

TEST(ResolveOptionsTest, TypesOptions) {
    auto options = types_resolve_options();
    EXPECT_TRUE(options.types);
    EXPECT_EQ(options.extensions, (std::vector<std::string>{".d.ts", ".ts", ".tsx"}));
    EXPECT_NE(options, resolve_options(Environment{}));
}
