// Query Fingerprint tests
//
// Tests for the SHA-256 based fingerprints used for change detection.

#include "query/query_fingerprint.hpp"

#include <gtest/gtest.h>

using namespace weave::query;
using weave::fs::FileContent;

// ============================================================================
// fingerprint_string()
// ============================================================================

TEST(QueryFingerprint, StringProducesNonZero) {
    auto fp = fingerprint_string("hello world");
    EXPECT_FALSE(fp.is_zero());
}

TEST(QueryFingerprint, SameInputSameFingerprint) {
    EXPECT_EQ(fingerprint_string("test input"), fingerprint_string("test input"));
}

TEST(QueryFingerprint, DifferentInputDifferentFingerprint) {
    EXPECT_NE(fingerprint_string("input A"), fingerprint_string("input B"));
}

TEST(QueryFingerprint, EmptyStringIsSha256Prefix) {
    // SHA-256("") = e3b0c442 98fc1c14 9afbf4c8 996fb924 ...
    auto fp = fingerprint_string("");
    EXPECT_EQ(fp.high, 0xe3b0c44298fc1c14ULL);
    EXPECT_EQ(fp.low, 0x9afbf4c8996fb924ULL);
}

// ============================================================================
// fingerprint_bytes()
// ============================================================================

TEST(QueryFingerprint, BytesMatchesString) {
    std::string s = "hello";
    EXPECT_EQ(fingerprint_string(s), fingerprint_bytes(s.data(), s.size()));
}

// ============================================================================
// fingerprint_combine()
// ============================================================================

TEST(QueryFingerprint, CombineIsOrderDependent) {
    auto a = fingerprint_string("alpha");
    auto b = fingerprint_string("beta");
    EXPECT_NE(fingerprint_combine(a, b), fingerprint_combine(b, a));
}

TEST(QueryFingerprint, CombineIsDeterministic) {
    auto a = fingerprint_string("alpha");
    auto b = fingerprint_string("beta");
    EXPECT_EQ(fingerprint_combine(a, b), fingerprint_combine(a, b));
}

// ============================================================================
// fingerprint_content()
// ============================================================================

TEST(QueryFingerprint, MissingFileDiffersFromEmptyFile) {
    EXPECT_NE(fingerprint_content(FileContent::not_found()),
              fingerprint_content(FileContent::from("")));
}

TEST(QueryFingerprint, ContentFollowsBytes) {
    auto a = fingerprint_content(FileContent::from("a"));
    EXPECT_EQ(a, fingerprint_content(FileContent::from("a")));
    EXPECT_NE(a, fingerprint_content(FileContent::from("b")));
}

// ============================================================================
// to_hex()
// ============================================================================

TEST(QueryFingerprint, HexIs32Chars) {
    EXPECT_EQ(fingerprint_string("x").to_hex().size(), 32u);
}

TEST(QueryFingerprint, HexOfEmptyString) {
    EXPECT_EQ(fingerprint_string("").to_hex(), "e3b0c44298fc1c149afbf4c8996fb924");
}

TEST(QueryFingerprint, DefaultIsZero) {
    Fingerprint fp;
    EXPECT_TRUE(fp.is_zero());
    EXPECT_EQ(fp.to_hex(), std::string(32, '0'));
}
