//! # Semantic Types
//!
//! Kindred has five primitive types plus function types. `Unknown` stands in
//! for the type of an expression whose checking already failed; operations on
//! it report nothing, which keeps one mistake from cascading into many.

#ifndef KINDRED_TYPES_TYPE_HPP
#define KINDRED_TYPES_TYPE_HPP

#include "common.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kindred::types {

// Forward declarations
struct Type;
using TypePtr = std::shared_ptr<Type>;

// Primitive types
enum class PrimitiveKind {
    Int,   // 64-bit signed
    Float, // IEEE double
    Bool,
    Str,  // Immutable string literal
    Unit, // No value
};

struct PrimitiveType {
    PrimitiveKind kind;
};

// Function type: fn(A, B) -> R
struct FuncType {
    std::vector<TypePtr> params;
    TypePtr return_type;
};

// Type of an expression that failed to check
struct UnknownType {};

// Type variant
struct Type {
    std::variant<PrimitiveType, FuncType, UnknownType> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// Helper functions
[[nodiscard]] auto make_primitive(PrimitiveKind kind) -> TypePtr;
[[nodiscard]] auto make_int() -> TypePtr;
[[nodiscard]] auto make_float() -> TypePtr;
[[nodiscard]] auto make_bool() -> TypePtr;
[[nodiscard]] auto make_str() -> TypePtr;
[[nodiscard]] auto make_unit() -> TypePtr;
[[nodiscard]] auto make_unknown() -> TypePtr;
[[nodiscard]] auto make_func(std::vector<TypePtr> params, TypePtr ret) -> TypePtr;

/// Looks up a primitive by its source name (`Int`, `Float`, ...).
[[nodiscard]] auto primitive_from_name(const std::string& name) -> std::optional<PrimitiveKind>;
[[nodiscard]] auto primitive_kind_to_string(PrimitiveKind kind) -> std::string;

// Type comparison
[[nodiscard]] auto types_equal(const TypePtr& a, const TypePtr& b) -> bool;
[[nodiscard]] auto type_to_string(const TypePtr& type) -> std::string;

// Predicates
[[nodiscard]] auto is_primitive(const TypePtr& type, PrimitiveKind kind) -> bool;
[[nodiscard]] auto is_unknown(const TypePtr& type) -> bool;
[[nodiscard]] auto is_numeric(const TypePtr& type) -> bool;

} // namespace kindred::types

#endif // KINDRED_TYPES_TYPE_HPP
