//! # Declaration AST Nodes
//!
//! Top-level items: functions and global variables.
//!
//! ```kindred
//! let limit: Int = 10;
//!
//! fn add(a: Int, b: Int) -> Int {
//!     return a + b;
//! }
//! ```

#ifndef KINDRED_PARSER_AST_DECLS_HPP
#define KINDRED_PARSER_AST_DECLS_HPP

#include "parser/ast_stmts.hpp"

namespace kindred::parser {

/// Function parameter: `name: Type`. Parameters are immutable.
struct Param {
    std::string name;
    TypeAnnotation type;
    SourceSpan span;
    NodeId id;
};

/// Function declaration. A missing return type means `Unit`.
struct FuncDecl {
    std::string name;
    SourceSpan name_span;
    std::vector<Param> params;
    std::optional<TypeAnnotation> return_type;
    BlockStmt body;
    NodeId id;
    bool body_recovered = false; ///< A statement of the body was dropped by error recovery
};

/// A top-level declaration node.
struct Decl {
    std::variant<FuncDecl, VarDecl> kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

} // namespace kindred::parser

#endif // KINDRED_PARSER_AST_DECLS_HPP
