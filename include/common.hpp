//! # Common Definitions
//!
//! This module provides common types and utilities used throughout the todo
//! engine. Every other component depends on it.
//!
//! ## Overview
//!
//! The common module includes:
//!
//! - **Version Information**: Program version constants
//! - **Source Locations**: Positions inside a todo document
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique ownership
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Fallible core operations return `Result<T, E>`
//! - **Explicit Ownership**: Trees own their children through values or `Box<T>`
//! - **Pure Core**: Lexing, parsing and printing perform no I/O

#ifndef TODO_COMMON_HPP
#define TODO_COMMON_HPP

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace todo {

// ============================================================================
// Version Information
// ============================================================================

/// The program version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Source Location Types
// ============================================================================

/// A position inside a todo document.
///
/// # Fields
///
/// - `line`: 1-based line number
/// - `column`: 1-based column number (in bytes)
/// - `offset`: 0-based byte offset from the start of the document
struct SourceLocation {
    /// Line number (1-based).
    uint32_t line = 1;

    /// Column number (1-based).
    uint32_t column = 1;

    /// Byte offset from start of document (0-based).
    uint32_t offset = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// Result<Config, std::string> load(const std::string& path) {
///     if (missing) return "cannot open " + path;
///     return config;
/// }
///
/// auto result = load("config.toml");
/// if (is_ok(result)) {
///     const Config& config = unwrap(result);
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
/// # Panics
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
///
/// # Panics
///
/// Throws `std::bad_variant_access` if the Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

/// Extracts the error value from a const Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace todo

#endif // TODO_COMMON_HPP
