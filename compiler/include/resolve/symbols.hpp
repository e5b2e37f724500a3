//! # Symbols and Scopes
//!
//! A `Symbol` is one named entity: a variable, a function or a type. The
//! `SymbolTable` owns every symbol of a program and hands out dense ids.
//!
//! A `Scope` maps names to symbol ids for one lexical region. Scopes form a
//! chain through a non-owning parent pointer and live on the resolver's call
//! stack, so they exist only while their block is being walked. Symbols
//! outlive them and remember the `ScopeId` they were declared in.

#ifndef KINDRED_RESOLVE_SYMBOLS_HPP
#define KINDRED_RESOLVE_SYMBOLS_HPP

#include "common.hpp"
#include "types/type.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace kindred::resolve {

using SymbolId = uint32_t;
using ScopeId = uint32_t;

/// Scope id of the global scope.
constexpr ScopeId GLOBAL_SCOPE_ID = 0;

enum class SymbolKind {
    Variable,
    Function,
    Type,
};

/// Where a symbol lives at run time.
enum class StorageRole {
    Global,   ///< Top-level `let`/`var`, module storage
    Local,    ///< Block-level `let`/`var`, function slot
    Param,    ///< Function parameter
    Function, ///< User function
    Builtin,  ///< Prelude function
    TypeName, ///< Builtin type
};

[[nodiscard]] auto symbol_kind_to_string(SymbolKind kind) -> std::string_view;

struct Symbol {
    SymbolId id;
    std::string name;
    SymbolKind kind;
    /// Declared type. Null for a variable without annotation until the type
    /// checker infers it (the inferred type lives in its `TypeTable`).
    types::TypePtr type;
    ScopeId scope;
    StorageRole role;
    bool is_mutable;
    SourceSpan span;
    NodeId decl_node = INVALID_NODE_ID; ///< Declaring AST node, if any
};

class SymbolTable {
public:
    /// Stores `symbol` under the next id, which is written into it.
    auto add(Symbol symbol) -> SymbolId;

    [[nodiscard]] auto get(SymbolId id) const -> const Symbol&;
    [[nodiscard]] auto get_mut(SymbolId id) -> Symbol&;

    [[nodiscard]] auto size() const -> size_t {
        return symbols_.size();
    }

    [[nodiscard]] auto all() const -> const std::vector<Symbol>& {
        return symbols_;
    }

private:
    std::vector<Symbol> symbols_;
};

/// Lexical scope.
class Scope {
public:
    Scope(ScopeId id, Scope* parent) : id_(id), parent_(parent) {}

    /// Binds `name` here. Fails if this scope already binds it.
    [[nodiscard]] auto declare(const std::string& name, SymbolId symbol) -> bool;

    /// Looks up a symbol only in this scope (not parents).
    [[nodiscard]] auto lookup_local(const std::string& name) const -> std::optional<SymbolId>;

    /// Looks up a symbol in this scope or any parent scope.
    [[nodiscard]] auto lookup(const std::string& name) const -> std::optional<SymbolId>;

    /// Marks `name` as declared later in this scope.
    void add_pending(const std::string& name);

    [[nodiscard]] auto is_pending(const std::string& name) const -> bool;

    [[nodiscard]] auto id() const -> ScopeId {
        return id_;
    }

    [[nodiscard]] auto parent() const -> Scope* {
        return parent_;
    }

private:
    ScopeId id_;
    Scope* parent_;
    std::unordered_map<std::string, SymbolId> names_;
    std::unordered_set<std::string> pending_;
};

} // namespace kindred::resolve

#endif // KINDRED_RESOLVE_SYMBOLS_HPP
