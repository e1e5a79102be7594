//! # Common Definitions
//!
//! Types and helpers shared by every weave component.
//!
//! ## Overview
//!
//! - **Result Type**: Value-or-error returns for recoverable failures
//! - **Shared Pointers**: `Rc` for the JSON tree's shared arrays and objects
//!
//! Recoverable failures (a missing file, a request that cannot be parsed)
//! travel as `Result<T, E>`. Broken configuration and programmer errors are
//! thrown as `std::runtime_error` subclasses.

#ifndef WEAVE_COMMON_HPP
#define WEAVE_COMMON_HPP

#include <memory>
#include <string>
#include <utility>
#include <variant>

namespace weave {

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<FileContent> content = fs.read("src/index.js");
/// if (is_ok(content)) {
///     use(unwrap(content));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value. Throws `std::bad_variant_access` on error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value. Throws `std::bad_variant_access` on success.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Shared Pointer Alias
// ============================================================================

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace weave

#endif // WEAVE_COMMON_HPP
