//! # AST Common Types
//!
//! Forward declarations, pointer aliases and the type annotation node shared
//! by the AST headers:
//!
//! - `ast_common.hpp` - Forward declarations and pointer types (this file)
//! - `ast_exprs.hpp` - Expressions (`Expr`, `BinaryExpr`, `CallExpr`, ...)
//! - `ast_stmts.hpp` - Statements (`Stmt`, `VarDecl`, `IfStmt`, ...)
//! - `ast_decls.hpp` - Top-level declarations (`Decl`, `FuncDecl`)
//! - `ast.hpp` - `Program` and structural equality
//!
//! ## Ownership Model
//!
//! Child nodes are owned through `Box<T>`. Nodes are built once by the parser
//! and never modified afterwards; semantic passes key their results by the
//! `NodeId` each node carries.

#ifndef KINDRED_PARSER_AST_COMMON_HPP
#define KINDRED_PARSER_AST_COMMON_HPP

#include "common.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace kindred::parser {

// ============================================================================
// Forward Declarations
// ============================================================================

struct Expr;
struct Stmt;
struct Decl;

using ExprPtr = Box<Expr>;
using StmtPtr = Box<Stmt>;
using DeclPtr = Box<Decl>;

// ============================================================================
// Type Annotations
// ============================================================================

/// A written type: the `Int` in `let x: Int = 1;`.
///
/// Only named types exist, so an annotation is a single identifier that the
/// resolver binds to a type symbol.
struct TypeAnnotation {
    std::string name;
    SourceSpan span;
    NodeId id;
};

} // namespace kindred::parser

#endif // KINDRED_PARSER_AST_COMMON_HPP
