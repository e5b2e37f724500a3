//! # Resolver - Global Scope
//!
//! Pass 1: builtins, hoisting of top-level items, signatures. Also the
//! shared helpers used by both passes.

#include "log/log.hpp"
#include "resolve/resolver.hpp"

namespace kindred::resolve {

auto name_error_kind_name(NameErrorKind kind) -> std::string_view {
    switch (kind) {
    case NameErrorKind::Undefined:
        return "Undefined";
    case NameErrorKind::DuplicateDeclaration:
        return "DuplicateDeclaration";
    case NameErrorKind::UsedBeforeDeclaration:
        return "UsedBeforeDeclaration";
    case NameErrorKind::NotAType:
        return "NotAType";
    }
    return "Unknown";
}

auto Resolution::binding_of(NodeId node) const -> std::optional<SymbolId> {
    auto it = bindings.find(node);
    if (it != bindings.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto Resolution::declaration_of(NodeId node) const -> std::optional<SymbolId> {
    auto it = declarations.find(node);
    if (it != declarations.end()) {
        return it->second;
    }
    return std::nullopt;
}

auto builtin_functions() -> const std::vector<Builtin>& {
    static const std::vector<Builtin> builtins = {
        {"print_int", types::PrimitiveKind::Int},
        {"print_float", types::PrimitiveKind::Float},
        {"print_bool", types::PrimitiveKind::Bool},
        {"print_str", types::PrimitiveKind::Str},
    };
    return builtins;
}

auto resolve(const parser::Program& program) -> Resolution {
    Resolver resolver;
    return resolver.resolve(program);
}

// ============================================================================
// Entry Point
// ============================================================================

auto Resolver::resolve(const parser::Program& program) -> Resolution {
    result_ = Resolution{};
    next_scope_id_ = GLOBAL_SCOPE_ID;

    Scope global(next_scope_id_++, nullptr);
    current_ = &global;

    declare_builtins();
    for (const auto& decl : program.decls) {
        hoist_decl(*decl);
    }
    for (const auto& decl : program.decls) {
        resolve_signature(*decl);
    }

    for (const auto& decl : program.decls) {
        if (decl->is<parser::FuncDecl>()) {
            resolve_func_body(decl->as<parser::FuncDecl>());
        } else {
            resolve_expr(*decl->as<parser::VarDecl>().init);
        }
    }

    current_ = nullptr;
    KINDRED_LOG_DEBUG("resolve", "Resolved " << result_.symbols.size() << " symbols, "
                                             << result_.bindings.size() << " uses, "
                                             << result_.errors.size() << " errors");
    return std::move(result_);
}

// ============================================================================
// Pass 1: Global Scope
// ============================================================================

void Resolver::declare_builtins() {
    for (auto kind : {types::PrimitiveKind::Int, types::PrimitiveKind::Float,
                      types::PrimitiveKind::Bool, types::PrimitiveKind::Str,
                      types::PrimitiveKind::Unit}) {
        declare(Symbol{.id = 0,
                       .name = types::primitive_kind_to_string(kind),
                       .kind = SymbolKind::Type,
                       .type = types::make_primitive(kind),
                       .scope = GLOBAL_SCOPE_ID,
                       .role = StorageRole::TypeName,
                       .is_mutable = false,
                       .span = {}},
                INVALID_NODE_ID);
    }

    for (const auto& builtin : builtin_functions()) {
        declare(Symbol{.id = 0,
                       .name = builtin.name,
                       .kind = SymbolKind::Function,
                       .type = types::make_func({types::make_primitive(builtin.param)},
                                                types::make_unit()),
                       .scope = GLOBAL_SCOPE_ID,
                       .role = StorageRole::Builtin,
                       .is_mutable = false,
                       .span = {}},
                INVALID_NODE_ID);
    }
}

void Resolver::hoist_decl(const parser::Decl& decl) {
    if (decl.is<parser::FuncDecl>()) {
        const auto& func = decl.as<parser::FuncDecl>();
        auto id = declare(Symbol{.id = 0,
                                 .name = func.name,
                                 .kind = SymbolKind::Function,
                                 .type = nullptr,
                                 .scope = current_->id(),
                                 .role = StorageRole::Function,
                                 .is_mutable = false,
                                 .span = func.name_span},
                          func.id);
        result_.functions.push_back(id);
        return;
    }

    const auto& var = decl.as<parser::VarDecl>();
    auto id = declare(Symbol{.id = 0,
                             .name = var.name,
                             .kind = SymbolKind::Variable,
                             .type = nullptr,
                             .scope = current_->id(),
                             .role = StorageRole::Global,
                             .is_mutable = var.is_mutable,
                             .span = var.name_span},
                      var.id);
    result_.globals.push_back(id);
}

void Resolver::resolve_signature(const parser::Decl& decl) {
    if (decl.is<parser::VarDecl>()) {
        const auto& var = decl.as<parser::VarDecl>();
        if (var.type) {
            auto type = resolve_type(*var.type);
            result_.symbols.get_mut(result_.declarations.at(var.id)).type = std::move(type);
        }
        return;
    }

    const auto& func = decl.as<parser::FuncDecl>();
    std::vector<types::TypePtr> params;
    params.reserve(func.params.size());
    for (const auto& param : func.params) {
        params.push_back(resolve_type(param.type));
    }
    auto ret = func.return_type ? resolve_type(*func.return_type) : types::make_unit();
    result_.symbols.get_mut(result_.declarations.at(func.id)).type =
        types::make_func(std::move(params), std::move(ret));
}

// ============================================================================
// Helpers
// ============================================================================

auto Resolver::declare(Symbol symbol, NodeId decl_node) -> SymbolId {
    symbol.decl_node = decl_node;
    std::string name = symbol.name;
    SourceSpan span = symbol.span;
    auto id = result_.symbols.add(std::move(symbol));
    if (decl_node != INVALID_NODE_ID) {
        result_.declarations[decl_node] = id;
    }

    if (!current_->declare(name, id)) {
        const auto& existing = result_.symbols.get(*current_->lookup_local(name));
        std::string message = "`" + name + "` is already declared in this scope";
        if (existing.role == StorageRole::Builtin || existing.role == StorageRole::TypeName) {
            message = "`" + name + "` is a builtin " +
                      std::string(symbol_kind_to_string(existing.kind)) +
                      " and cannot be redeclared";
        }
        error(NameErrorKind::DuplicateDeclaration, name, std::move(message), span);
    }
    return id;
}

auto Resolver::resolve_type(const parser::TypeAnnotation& annotation) -> types::TypePtr {
    auto found = current_->lookup(annotation.name);
    if (!found) {
        error(NameErrorKind::Undefined, annotation.name,
              "undefined type `" + annotation.name + "`", annotation.span);
        return types::make_unknown();
    }

    result_.bindings[annotation.id] = *found;
    const auto& symbol = result_.symbols.get(*found);
    if (symbol.kind != SymbolKind::Type) {
        error(NameErrorKind::NotAType, annotation.name,
              "`" + annotation.name + "` is a " + std::string(symbol_kind_to_string(symbol.kind)) +
                  ", not a type",
              annotation.span);
        return types::make_unknown();
    }
    return symbol.type;
}

auto Resolver::lookup_value(const std::string& name, const SourceSpan& span)
    -> std::optional<SymbolId> {
    for (Scope* scope = current_; scope; scope = scope->parent()) {
        if (auto found = scope->lookup_local(name)) {
            return found;
        }
        if (scope->is_pending(name)) {
            error(NameErrorKind::UsedBeforeDeclaration, name,
                  "`" + name + "` is used before its declaration", span);
            return std::nullopt;
        }
    }

    error(NameErrorKind::Undefined, name, "undefined name `" + name + "`", span);
    return std::nullopt;
}

void Resolver::error(NameErrorKind kind, const std::string& name, std::string message,
                     const SourceSpan& span) {
    KINDRED_LOG_TRACE("resolve", name_error_kind_name(kind) << ": " << message);
    result_.errors.push_back(
        NameError{.kind = kind, .name = name, .message = std::move(message), .span = span});
}

} // namespace kindred::resolve
