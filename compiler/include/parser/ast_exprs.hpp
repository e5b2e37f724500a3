//! # Expression AST Nodes
//!
//! - **Literals**: `42`, `3.14`, `"hello"`, `true`
//! - **Identifiers**: `count`, `print_int`
//! - **Operators**: `-x`, `!done`, `a + b`, `a && b`
//! - **Calls**: `add(1, 2)`

#ifndef KINDRED_PARSER_AST_EXPRS_HPP
#define KINDRED_PARSER_AST_EXPRS_HPP

#include "lexer/token.hpp"
#include "parser/ast_common.hpp"

#include <stdexcept>

namespace kindred::parser {

// ============================================================================
// Literals and Identifiers
// ============================================================================

enum class LiteralKind { Int, Float, String, Bool };

/// Literal expression. `value` holds the decoded payload matching `kind`.
struct LiteralExpr {
    LiteralKind kind;
    lexer::TokenValue value;
};

/// Reference to a named symbol.
struct IdentExpr {
    std::string name;
};

// ============================================================================
// Operators
// ============================================================================

enum class UnaryOp {
    Neg, ///< `-x`
    Not, ///< `!x`
};

struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;
};

enum class BinaryOp {
    Add, ///< `+`
    Sub, ///< `-`
    Mul, ///< `*`
    Div, ///< `/`
    Mod, ///< `%`

    Eq, ///< `==`
    Ne, ///< `!=`
    Lt, ///< `<`
    Le, ///< `<=`
    Gt, ///< `>`
    Ge, ///< `>=`

    And, ///< `&&`, short-circuit
    Or,  ///< `||`, short-circuit
};

struct BinaryExpr {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
};

[[nodiscard]] auto unary_op_to_string(UnaryOp op) -> std::string_view;
[[nodiscard]] auto binary_op_to_string(BinaryOp op) -> std::string_view;

[[nodiscard]] inline auto is_arithmetic(BinaryOp op) -> bool {
    return op >= BinaryOp::Add && op <= BinaryOp::Mod;
}

[[nodiscard]] inline auto is_comparison(BinaryOp op) -> bool {
    return op >= BinaryOp::Eq && op <= BinaryOp::Ge;
}

[[nodiscard]] inline auto is_logical(BinaryOp op) -> bool {
    return op == BinaryOp::And || op == BinaryOp::Or;
}

// ============================================================================
// Calls
// ============================================================================

/// Call expression: `callee(args...)`.
///
/// The grammar allows any expression as callee; the type checker rejects
/// anything that is not a function symbol.
struct CallExpr {
    ExprPtr callee;
    std::vector<ExprPtr> args;
};

// ============================================================================
// Expression Wrapper
// ============================================================================

/// An expression node.
struct Expr {
    std::variant<LiteralExpr, IdentExpr, UnaryExpr, BinaryExpr, CallExpr> kind;
    SourceSpan span;
    NodeId id;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this expression as kind `T`. Throws `std::bad_variant_access` if wrong kind.
    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

} // namespace kindred::parser

#endif // KINDRED_PARSER_AST_EXPRS_HPP
