//! # JSON Reader
//!
//! A small JSON reader for the manifests the resolver consults
//! (`package.json`) and for validating JSON modules.
//!
//! ## Example
//!
//! ```cpp
//! auto result = parse_json(R"({"name": "pkg", "main": "lib/index.js"})");
//! if (is_ok(result)) {
//!     const auto* main = unwrap(result).get("main");
//!     if (main && main->is_string()) {
//!         use(main->as_string());
//!     }
//! }
//! ```

#pragma once

#include "common.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace weave::json {

// ============================================================================
// JsonError
// ============================================================================

/// An error encountered during JSON parsing, with its source location.
struct JsonError {
    std::string message;
    size_t line = 0;   ///< 1-based, 0 if unknown
    size_t column = 0; ///< 1-based, 0 if unknown

    static auto make(std::string msg, size_t line = 0, size_t column = 0) -> JsonError {
        return JsonError{std::move(msg), line, column};
    }

    /// `"line X, column Y: message"`, or just the message without location.
    [[nodiscard]] auto to_string() const -> std::string {
        if (line > 0 && column > 0) {
            return "line " + std::to_string(line) + ", column " + std::to_string(column) + ": " +
                   message;
        }
        return message;
    }
};

// ============================================================================
// JsonValue
// ============================================================================

struct JsonValue;

using JsonArray = std::vector<JsonValue>;
using JsonObject = std::map<std::string, JsonValue>;

/// A JSON value. Numbers are stored as doubles; arrays and objects are
/// shared so values copy cheaply.
struct JsonValue {
    using ValueVariant =
        std::variant<std::nullptr_t, bool, double, std::string, Rc<JsonArray>, Rc<JsonObject>>;

    ValueVariant data;

    JsonValue() : data(nullptr) {}
    explicit JsonValue(bool b) : data(b) {}
    explicit JsonValue(double d) : data(d) {}
    explicit JsonValue(std::string s) : data(std::move(s)) {}
    explicit JsonValue(JsonArray a) : data(make_rc<JsonArray>(std::move(a))) {}
    explicit JsonValue(JsonObject o) : data(make_rc<JsonObject>(std::move(o))) {}

    [[nodiscard]] auto is_null() const -> bool {
        return std::holds_alternative<std::nullptr_t>(data);
    }
    [[nodiscard]] auto is_bool() const -> bool {
        return std::holds_alternative<bool>(data);
    }
    [[nodiscard]] auto is_number() const -> bool {
        return std::holds_alternative<double>(data);
    }
    [[nodiscard]] auto is_string() const -> bool {
        return std::holds_alternative<std::string>(data);
    }
    [[nodiscard]] auto is_array() const -> bool {
        return std::holds_alternative<Rc<JsonArray>>(data);
    }
    [[nodiscard]] auto is_object() const -> bool {
        return std::holds_alternative<Rc<JsonObject>>(data);
    }

    /// Throws `std::bad_variant_access` on type mismatch.
    [[nodiscard]] auto as_bool() const -> bool {
        return std::get<bool>(data);
    }
    [[nodiscard]] auto as_number() const -> double {
        return std::get<double>(data);
    }
    [[nodiscard]] auto as_string() const -> const std::string& {
        return std::get<std::string>(data);
    }
    [[nodiscard]] auto as_array() const -> const JsonArray& {
        return *std::get<Rc<JsonArray>>(data);
    }
    [[nodiscard]] auto as_object() const -> const JsonObject& {
        return *std::get<Rc<JsonObject>>(data);
    }

    /// Member lookup. Returns nullptr if this is not an object or the key is
    /// missing.
    [[nodiscard]] auto get(const std::string& key) const -> const JsonValue*;

    /// String member, or "" when missing or not a string.
    [[nodiscard]] auto get_string(const std::string& key) const -> std::string;
};

// ============================================================================
// Parser
// ============================================================================

/// Recursive-descent JSON parser (RFC 8259, no extensions).
class JsonParser {
public:
    /// Nesting deeper than this is rejected.
    static constexpr size_t MAX_DEPTH = 256;

    explicit JsonParser(std::string_view input) : input_(input) {}

    [[nodiscard]] auto parse() -> Result<JsonValue, JsonError>;

private:
    std::string_view input_;
    size_t pos_ = 0;
    size_t line_ = 1;
    size_t column_ = 1;
    size_t depth_ = 0;

    [[nodiscard]] auto peek() const -> char;
    auto advance() -> char;
    void skip_whitespace();
    [[nodiscard]] auto make_error(const std::string& msg) const -> JsonError;

    auto parse_value() -> Result<JsonValue, JsonError>;
    auto parse_object() -> Result<JsonValue, JsonError>;
    auto parse_array() -> Result<JsonValue, JsonError>;
    auto parse_string() -> Result<std::string, JsonError>;
    auto parse_number() -> Result<JsonValue, JsonError>;
    auto parse_keyword() -> Result<JsonValue, JsonError>;
};

/// Parses a complete JSON document.
[[nodiscard]] auto parse_json(std::string_view input) -> Result<JsonValue, JsonError>;

} // namespace weave::json
