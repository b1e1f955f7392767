//! # Common Definitions
//!
//! Shared types and constants used by every cltk component.
//!
//! ## Overview
//!
//! - **Version Information**: Library version string
//! - **Result Type**: Value-or-error returns for code that must not throw
//!
//! ## Design Philosophy
//!
//! Conversions and lookups that can fail in ordinary use return a
//! `Result<T, E>`. Failures that end a lifecycle step are thrown as
//! `cltk::Error` (see `error.hpp`) and caught at the lifecycle boundary.

#ifndef CLTK_COMMON_HPP
#define CLTK_COMMON_HPP

#include <string>
#include <variant>

namespace cltk {

// ============================================================================
// Version Information
// ============================================================================

/// The library version string (e.g., "0.3.0").
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<int, std::string> parse_count(std::string_view s) {
///     // ... parsing logic ...
///     if (error) return std::string("invalid count");
///     return value;
/// }
///
/// auto result = parse_count("42");
/// if (is_ok(result)) {
///     int value = unwrap(result);
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

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

/// Extracts the success value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace cltk

#endif // CLTK_COMMON_HPP
