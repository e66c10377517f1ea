//! # Common Definitions
//!
//! Types shared by every domainfix component.
//!
//! ## Overview
//!
//! - **Version Information**: Tool version constants
//! - **Source Locations**: Types for tracking source code positions
//! - **Result Type**: Error handling without exceptions
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Host-level failures are returned via `Result<T, E>`
//! - **Views over owned text**: Tokens refer into a `Source` that outlives them

#ifndef DOMAINFIX_COMMON_HPP
#define DOMAINFIX_COMMON_HPP

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace domainfix {

// ============================================================================
// Version Information
// ============================================================================

/// The tool version string.
constexpr const char* VERSION = "0.3.0";

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// # Fields
///
/// - `file`: Path to the source file
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from file start
/// - `length`: Length of the source element in bytes
struct SourceLocation {
    std::string_view file;
    uint32_t line;
    uint32_t column;
    uint32_t offset;
    uint32_t length;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
struct SourceSpan {
    /// Start location of the span.
    SourceLocation start;

    /// End location of the span (the last byte, not one past it).
    SourceLocation end;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = Source::from_file("plugin.php");
/// if (is_err(result)) {
///     DOMAINFIX_LOG_ERROR("lint", unwrap_err(result));
///     return;
/// }
/// Source source = std::move(unwrap(result));
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

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

} // namespace domainfix

#endif // DOMAINFIX_COMMON_HPP
