//! # Kindred AST
//!
//! Main AST header. Includes every node header and defines the root
//! `Program` plus structural comparison.
//!
//! ## Node Identity
//!
//! Expressions, variable and function declarations, parameters and type
//! annotations carry a `NodeId`, unique within one `Program`. Ids are
//! assigned in parse order starting at 1.
//!
//! ## Structural Equality
//!
//! `ast_equal` compares shape, names, operators and literal values. Spans
//! and ids are ignored, so a program and the re-parse of its pretty-printed
//! form compare equal.

#ifndef KINDRED_PARSER_AST_HPP
#define KINDRED_PARSER_AST_HPP

#include "parser/ast_common.hpp"
#include "parser/ast_decls.hpp"
#include "parser/ast_exprs.hpp"
#include "parser/ast_stmts.hpp"

namespace kindred::parser {

/// Root of one translation unit.
struct Program {
    std::string name;
    std::vector<DeclPtr> decls;
    NodeId next_node_id = 1; ///< One past the largest id in use
};

[[nodiscard]] auto ast_equal(const Expr& a, const Expr& b) -> bool;
[[nodiscard]] auto ast_equal(const Stmt& a, const Stmt& b) -> bool;
[[nodiscard]] auto ast_equal(const Decl& a, const Decl& b) -> bool;
[[nodiscard]] auto ast_equal(const Program& a, const Program& b) -> bool;

} // namespace kindred::parser

#endif // KINDRED_PARSER_AST_HPP
