//! # JSON Parser Tests
//!
//! Tests for the package manifest parser: values, nesting, member lookup
//! and error locations.

#include "common.hpp"

#include "json/json.hpp"
#include <gtest/gtest.h>
#include <string>

using namespace weave::json;
using weave::is_err;
using weave::is_ok;
using weave::unwrap;
using weave::unwrap_err;

// ============================================================================
// Values
// ============================================================================

TEST(JsonParserTest, Primitives) {
    auto t = parse_json("true");
    ASSERT_TRUE(is_ok(t));
    EXPECT_TRUE(unwrap(t).as_bool());

    auto n = parse_json("null");
    ASSERT_TRUE(is_ok(n));
    EXPECT_TRUE(unwrap(n).is_null());

    auto num = parse_json("-12.5e1");
    ASSERT_TRUE(is_ok(num));
    EXPECT_DOUBLE_EQ(unwrap(num).as_number(), -125.0);
}

TEST(JsonParserTest, StringEscapes) {
    auto result = parse_json(R"("a\"b\\c\/d\n\u00e9")");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).as_string(), "a\"b\\c/d\n\xC3\xA9");
}

TEST(JsonParserTest, PackageManifest) {
    auto result = parse_json(R"({
        "name": "left-pad",
        "version": "1.3.0",
        "main": "lib/index.js",
        "types": "index.d.ts",
        "files": ["lib", "index.d.ts"],
        "private": false
    })");
    ASSERT_TRUE(is_ok(result));
    const auto& pkg = unwrap(result);

    EXPECT_TRUE(pkg.is_object());
    EXPECT_EQ(pkg.get_string("main"), "lib/index.js");
    EXPECT_EQ(pkg.get_string("types"), "index.d.ts");
    ASSERT_NE(pkg.get("files"), nullptr);
    EXPECT_EQ(pkg.get("files")->as_array().size(), 2u);
    EXPECT_FALSE(pkg.get("private")->as_bool());
}

TEST(JsonParserTest, GetStringOfMissingOrNonStringMember) {
    auto result = parse_json(R"({"main": 42})");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).get_string("main"), "");
    EXPECT_EQ(unwrap(result).get_string("module"), "");
    EXPECT_EQ(unwrap(result).get("module"), nullptr);
}

TEST(JsonParserTest, GetOnNonObjectIsNull) {
    auto result = parse_json("[1, 2]");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).get("main"), nullptr);
}

TEST(JsonParserTest, CopiesShareNestedValues) {
    auto result = parse_json(R"({"a": {"b": [1]}})");
    ASSERT_TRUE(is_ok(result));
    JsonValue copy = unwrap(result);
    EXPECT_EQ(&copy.as_object(), &unwrap(result).as_object());
    const auto* b = copy.get("a")->get("b");
    ASSERT_NE(b, nullptr);
    EXPECT_EQ(&b->as_array(), &unwrap(result).get("a")->get("b")->as_array());
}

// ============================================================================
// Errors
// ============================================================================

TEST(JsonParserTest, TrailingCommaInObjectIsRejected) {
    auto result = parse_json("{\n  \"a\": 1,\n}");
    ASSERT_TRUE(is_err(result));
    const auto& error = unwrap_err(result);
    EXPECT_EQ(error.message, "Trailing comma in object");
    EXPECT_EQ(error.line, 3u);
    EXPECT_EQ(error.column, 1u);
    EXPECT_EQ(error.to_string(), "line 3, column 1: Trailing comma in object");
}

TEST(JsonParserTest, TrailingCommaInArrayIsRejected) {
    EXPECT_TRUE(is_err(parse_json("[1, 2, ]")));
}

TEST(JsonParserTest, TrailingCharactersAreRejected) {
    auto result = parse_json("{} x");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Unexpected trailing characters");
}

TEST(JsonParserTest, UnterminatedString) {
    auto result = parse_json(R"({"main": "lib)");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Unterminated string");
}

TEST(JsonParserTest, EmptyInput) {
    auto result = parse_json("   ");
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Unexpected end of input");
}

TEST(JsonParserTest, NestingLimit) {
    std::string deep(JsonParser::MAX_DEPTH + 1, '[');
    deep += std::string(JsonParser::MAX_DEPTH + 1, ']');
    auto result = parse_json(deep);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).message, "Nesting too deep");

    std::string ok(JsonParser::MAX_DEPTH, '[');
    ok += std::string(JsonParser::MAX_DEPTH, ']');
    EXPECT_TRUE(is_ok(parse_json(ok)));
}

TEST(JsonErrorTest, ToStringWithoutLocation) {
    EXPECT_EQ(JsonError::make("file not found").to_string(), "file not found");
}
