//! # Statement AST Nodes
//!
//! | Statement    | Syntax                         |
//! |--------------|--------------------------------|
//! | `VarDecl`    | `let x: Int = 1;` `var y = 2;` |
//! | `AssignStmt` | `y = y + 1;`                   |
//! | `IfStmt`     | `if c { } else { }`            |
//! | `WhileStmt`  | `while c { }`                  |
//! | `ReturnStmt` | `return x;` `return;`          |
//! | `BlockStmt`  | `{ ... }`                      |
//! | `ExprStmt`   | `print_int(x);`                |

#ifndef KINDRED_PARSER_AST_STMTS_HPP
#define KINDRED_PARSER_AST_STMTS_HPP

#include "parser/ast_exprs.hpp"

namespace kindred::parser {

/// Variable declaration: `let` (immutable) or `var` (mutable).
///
/// Also used for globals. The initializer is mandatory; the annotation is
/// optional and inferred from the initializer when absent.
struct VarDecl {
    bool is_mutable;
    std::string name;
    SourceSpan name_span;
    std::optional<TypeAnnotation> type;
    ExprPtr init;
    NodeId id;
};

/// Assignment: `target = value;`. The target is always an `IdentExpr`.
struct AssignStmt {
    ExprPtr target;
    ExprPtr value;
};

/// A braced statement list. Introduces a scope.
struct BlockStmt {
    std::vector<StmtPtr> stmts;
    SourceSpan span;
};

/// `if cond { } else ...`. `else_branch` holds a `BlockStmt` or a nested `IfStmt`.
struct IfStmt {
    ExprPtr condition;
    BlockStmt then_block;
    std::optional<StmtPtr> else_branch;
};

struct WhileStmt {
    ExprPtr condition;
    BlockStmt body;
};

struct ReturnStmt {
    std::optional<ExprPtr> value;
};

/// Expression evaluated for its effect: `print_int(x);`.
struct ExprStmt {
    ExprPtr expr;
};

/// A statement node.
struct Stmt {
    std::variant<VarDecl, AssignStmt, IfStmt, WhileStmt, ReturnStmt, BlockStmt, ExprStmt> kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

} // namespace kindred::parser

#endif // KINDRED_PARSER_AST_STMTS_HPP
