//! # Type Checker
//!
//! Infers a type for every expression and checks every use against the
//! operator and statement rules of the language. Works on the AST plus the
//! `Resolution` produced by name resolution; neither is modified.
//!
//! ## Operator Rules
//!
//! | Operators           | Operands                   | Result  |
//! |---------------------|----------------------------|---------|
//! | `+ - * /`           | two `Int` or two `Float`   | operand |
//! | `%`                 | two `Int`                  | `Int`   |
//! | `< <= > >=`         | two `Int` or two `Float`   | `Bool`  |
//! | `== !=`             | two `Int`, `Float`, `Bool` | `Bool`  |
//! | `&& \|\|`           | two `Bool`                 | `Bool`  |
//! | prefix `-`          | `Int` or `Float`           | operand |
//! | prefix `!`          | `Bool`                     | `Bool`  |
//!
//! An operand of type `Unknown` comes from an error that was already
//! reported, so nothing further is reported for it.

#ifndef KINDRED_TYPES_CHECKER_HPP
#define KINDRED_TYPES_CHECKER_HPP

#include "common.hpp"
#include "parser/ast.hpp"
#include "resolve/resolver.hpp"
#include "types/type.hpp"

#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kindred::types {

enum class TypeErrorKind {
    Mismatch,
    ArityMismatch,
    NotCallable,
    ImmutableAssignment,
    NotAValue,
    MissingReturn,
};

[[nodiscard]] auto type_error_kind_name(TypeErrorKind kind) -> std::string_view;

struct TypeError {
    TypeErrorKind kind;
    std::string message;
    SourceSpan span;
    TypePtr expected; ///< Set for `Mismatch`
    TypePtr found;    ///< Set for `Mismatch`
};

/// Types attached to the AST, keyed like the resolver's tables.
struct TypeTable {
    std::unordered_map<NodeId, TypePtr> expr_types;
    std::unordered_map<resolve::SymbolId, TypePtr> symbol_types;

    /// Type of an expression node, or null if it was never checked.
    [[nodiscard]] auto type_of_expr(NodeId node) const -> TypePtr;
    [[nodiscard]] auto type_of_symbol(resolve::SymbolId symbol) const -> TypePtr;
};

struct CheckResult {
    TypeTable types;
    std::vector<TypeError> errors;

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors.empty();
    }
};

class TypeChecker {
public:
    TypeChecker(const parser::Program& program, const resolve::Resolution& resolution);

    [[nodiscard]] auto check() -> CheckResult;

private:
    const parser::Program& program_;
    const resolve::Resolution& resolution_;
    TypeTable table_;
    std::vector<TypeError> errors_;
    TypePtr current_return_type_ = nullptr;

    /// Global initializers by symbol, for on-demand inference.
    std::unordered_map<resolve::SymbolId, const parser::VarDecl*> global_decls_;
    std::unordered_set<resolve::SymbolId> globals_in_progress_;

    // Declarations
    void check_global(const parser::VarDecl& var);
    void check_func_body(const parser::FuncDecl& func);

    // Statements
    void check_block(const parser::BlockStmt& block);
    void check_stmt(const parser::Stmt& stmt);
    void check_var_decl(const parser::VarDecl& var);
    void check_assign(const parser::AssignStmt& assign);
    void check_return(const parser::ReturnStmt& ret, const SourceSpan& span);

    /// Whether every path through `block` ends in `return`.
    [[nodiscard]] static auto always_returns(const parser::BlockStmt& block) -> bool;
    [[nodiscard]] static auto always_returns(const parser::Stmt& stmt) -> bool;

    // Expressions
    auto check_expr(const parser::Expr& expr) -> TypePtr;
    auto check_literal(const parser::LiteralExpr& lit) -> TypePtr;
    auto check_ident(const parser::Expr& expr) -> TypePtr;
    auto check_unary(const parser::UnaryExpr& unary) -> TypePtr;
    auto check_binary(const parser::BinaryExpr& binary) -> TypePtr;
    auto check_call(const parser::CallExpr& call, const SourceSpan& span) -> TypePtr;

    /// Checks `expr` and reports a `Mismatch` unless it has type `expected`.
    auto check_against(const parser::Expr& expr, const TypePtr& expected) -> TypePtr;

    /// Type of a variable symbol, inferring unannotated globals on demand.
    auto symbol_type(resolve::SymbolId id, const SourceSpan& use_span) -> TypePtr;

    auto record(const parser::Expr& expr, TypePtr type) -> TypePtr;

    void error(TypeErrorKind kind, std::string message, const SourceSpan& span);
    void mismatch(const TypePtr& expected, const TypePtr& found, const SourceSpan& span);
};

/// Convenience wrapper around `TypeChecker`.
[[nodiscard]] auto check(const parser::Program& program, const resolve::Resolution& resolution)
    -> CheckResult;

} // namespace kindred::types

#endif // KINDRED_TYPES_CHECKER_HPP
