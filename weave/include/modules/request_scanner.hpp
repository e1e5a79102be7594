//! # Request Scanner
//!
//! Extracts import requests from source text with a keyword scanner that
//! runs in linear time. This is not a parser: requests inside comments and
//! strings are found too. It is enough to wire module assets into the graph.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace weave::modules {

/// Requests of `import ... from`, `export ... from`, side-effect `import`,
/// `import()` and `require()`, in source order, without duplicates.
[[nodiscard]] std::vector<std::string> scan_ecmascript_requests(std::string_view source);

/// Requests of `@import` rules, in source order, without duplicates. Bare
/// names are relative in CSS and come back as `./name`.
[[nodiscard]] std::vector<std::string> scan_css_requests(std::string_view source);

} // namespace weave::modules
