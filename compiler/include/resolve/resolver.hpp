//! # Name Resolution
//!
//! Binds every identifier and type annotation of a `Program` to a symbol.
//!
//! ## Passes
//!
//! 1. **Globals**: the global scope receives the builtin types (`Int`,
//!    `Float`, `Bool`, `Str`, `Unit`) and prelude functions, then every
//!    top-level function and variable. Signatures and global annotations are
//!    resolved once all top-level names exist, so items may refer to each
//!    other in any order.
//! 2. **Bodies**: functions open a scope holding their parameters and every
//!    block opens a child scope. A block announces its `let`/`var` names on
//!    entry; reaching such a name before its declaration (its own
//!    initializer included) is `UsedBeforeDeclaration`.
//!
//! The AST is never modified. Results go into a `Resolution` keyed by
//! `NodeId`:
//!
//! | Table          | Key                                       | Value        |
//! |----------------|-------------------------------------------|--------------|
//! | `bindings`     | `IdentExpr` or `TypeAnnotation` node      | used symbol  |
//! | `declarations` | `FuncDecl`, `VarDecl` or `Param` node     | new symbol   |

#ifndef KINDRED_RESOLVE_RESOLVER_HPP
#define KINDRED_RESOLVE_RESOLVER_HPP

#include "parser/ast.hpp"
#include "resolve/symbols.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace kindred::resolve {

enum class NameErrorKind {
    Undefined,
    DuplicateDeclaration,
    UsedBeforeDeclaration,
    NotAType,
};

[[nodiscard]] auto name_error_kind_name(NameErrorKind kind) -> std::string_view;

struct NameError {
    NameErrorKind kind;
    std::string name;
    std::string message;
    SourceSpan span;
};

/// Output of name resolution.
struct Resolution {
    SymbolTable symbols;
    std::unordered_map<NodeId, SymbolId> bindings;
    std::unordered_map<NodeId, SymbolId> declarations;
    std::vector<NameError> errors;

    /// Top-level functions in declaration order.
    std::vector<SymbolId> functions;
    /// Top-level variables in declaration order.
    std::vector<SymbolId> globals;

    [[nodiscard]] auto binding_of(NodeId node) const -> std::optional<SymbolId>;
    [[nodiscard]] auto declaration_of(NodeId node) const -> std::optional<SymbolId>;

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors.empty();
    }
};

/// Signature of a prelude function.
struct Builtin {
    const char* name;
    types::PrimitiveKind param;
};

/// `print_int`, `print_float`, `print_bool`, `print_str`.
[[nodiscard]] auto builtin_functions() -> const std::vector<Builtin>&;

class Resolver {
public:
    [[nodiscard]] auto resolve(const parser::Program& program) -> Resolution;

private:
    Resolution result_;
    Scope* current_ = nullptr;
    ScopeId next_scope_id_ = GLOBAL_SCOPE_ID;

    // Pass 1
    void declare_builtins();
    void hoist_decl(const parser::Decl& decl);
    void resolve_signature(const parser::Decl& decl);

    // Pass 2
    void resolve_func_body(const parser::FuncDecl& func);
    void resolve_block(const parser::BlockStmt& block);
    void resolve_stmt(const parser::Stmt& stmt);
    void resolve_local_var(const parser::VarDecl& var);
    void resolve_expr(const parser::Expr& expr);

    /// Binds a type annotation and returns the type it names, or `Unknown`.
    auto resolve_type(const parser::TypeAnnotation& annotation) -> types::TypePtr;

    /// Finds `name` for a value use, reporting when it is missing or not yet
    /// declared.
    auto lookup_value(const std::string& name, const SourceSpan& span)
        -> std::optional<SymbolId>;

    /// Creates a symbol and binds it in the current scope.
    auto declare(Symbol symbol, NodeId decl_node) -> SymbolId;

    void error(NameErrorKind kind, const std::string& name, std::string message,
               const SourceSpan& span);
};

/// Convenience wrapper around `Resolver`.
[[nodiscard]] auto resolve(const parser::Program& program) -> Resolution;

} // namespace kindred::resolve

#endif // KINDRED_RESOLVE_RESOLVER_HPP
