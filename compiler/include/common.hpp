//! # Common Definitions
//!
//! This module provides the common types and utilities shared by every stage
//! of the Kindred compiler.
//!
//! ## Overview
//!
//! - **Version Information**: Compiler version constants
//! - **Source Locations**: Types for tracking source code positions
//! - **Node Identity**: The `NodeId` key used by every semantic side table
//! - **Result Type**: Error handling without exceptions
//! - **Smart Pointers**: Aliases for unique and shared pointers
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Fallible operations return `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership, `Rc<T>` for shared
//! - **No Global Options**: Configuration travels as values (see `driver/options.hpp`)

#ifndef KINDRED_COMMON_HPP
#define KINDRED_COMMON_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace kindred {

// ============================================================================
// Version Information
// ============================================================================

/// The compiler version string.
constexpr const char* VERSION = "0.1.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 1;
constexpr int VERSION_PATCH = 0;

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
    SourceLocation start;
    SourceLocation end;

    /// Merges two spans into one that covers both.
    ///
    /// The result spans from the start of `a` to the end of `b`.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;
};

// ============================================================================
// Node Identity
// ============================================================================

/// Identity of an AST node.
///
/// Assigned by the parser, unique within one `Program`. Semantic passes never
/// touch the tree itself; they key their results (bindings, types) by this id.
using NodeId = uint32_t;

/// Id that no parsed node carries.
constexpr NodeId INVALID_NODE_ID = 0;

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = Source::from_file(path);
/// if (is_err(result)) {
///     report(unwrap_err(result));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

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

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace kindred

#endif // KINDRED_COMMON_HPP
