//! # Query Fingerprinting
//!
//! 128-bit fingerprints for query outputs. The query context compares the
//! fingerprint of a file's new content against the cached one to decide
//! whether dependents must be invalidated.
//!
//! Fingerprints are the first 128 bits of a SHA-256 digest computed with
//! OpenSSL's EVP interface.

#pragma once

#include "fs/file_system.hpp"

#include <cstdint>
#include <string>

namespace weave::query {

/// 128-bit fingerprint for query outputs.
struct Fingerprint {
    uint64_t high = 0;
    uint64_t low = 0;

    bool operator==(const Fingerprint& other) const = default;
    bool operator!=(const Fingerprint& other) const = default;

    /// Returns true if this fingerprint has not been computed yet.
    [[nodiscard]] bool is_zero() const {
        return high == 0 && low == 0;
    }

    /// Returns a 32-character hex string representation.
    [[nodiscard]] std::string to_hex() const;
};

/// Compute a fingerprint from raw bytes.
[[nodiscard]] Fingerprint fingerprint_bytes(const void* data, size_t len);

/// Compute a fingerprint from a string.
[[nodiscard]] Fingerprint fingerprint_string(const std::string& str);

/// Combine two fingerprints into one. Order matters.
[[nodiscard]] Fingerprint fingerprint_combine(Fingerprint a, Fingerprint b);

/// Fingerprint of file content. A missing file and an empty file differ.
[[nodiscard]] Fingerprint fingerprint_content(const fs::FileContent& content);

} // namespace weave::query
