//! # Symbol Table and Scopes
//!
//! - `add()`: Store a symbol, assigning the next dense id
//! - `declare()`: Bind a name in the current scope
//! - `lookup()`: Find a name in the current or parent scopes
//! - `lookup_local()`: Find a name only in the current scope

#include "resolve/symbols.hpp"

namespace kindred::resolve {

auto symbol_kind_to_string(SymbolKind kind) -> std::string_view {
    switch (kind) {
    case SymbolKind::Variable:
        return "variable";
    case SymbolKind::Function:
        return "function";
    case SymbolKind::Type:
        return "type";
    }
    return "symbol";
}

auto SymbolTable::add(Symbol symbol) -> SymbolId {
    auto id = static_cast<SymbolId>(symbols_.size());
    symbol.id = id;
    symbols_.push_back(std::move(symbol));
    return id;
}

auto SymbolTable::get(SymbolId id) const -> const Symbol& {
    return symbols_.at(id);
}

auto SymbolTable::get_mut(SymbolId id) -> Symbol& {
    return symbols_.at(id);
}

auto Scope::declare(const std::string& name, SymbolId symbol) -> bool {
    pending_.erase(name);
    return names_.emplace(name, symbol).second;
}

auto Scope::lookup_local(const std::string& name) const -> std::optional<SymbolId> {
    auto it = names_.find(name);
    if (it != names_.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Scope::lookup(const std::string& name) const -> std::optional<SymbolId> {
    for (const Scope* scope = this; scope; scope = scope->parent_) {
        if (auto found = scope->lookup_local(name)) {
            return found;
        }
    }
    return std::nullopt;
}

void Scope::add_pending(const std::string& name) {
    pending_.insert(name);
}

auto Scope::is_pending(const std::string& name) const -> bool {
    return pending_.count(name) > 0;
}

} // namespace kindred::resolve
