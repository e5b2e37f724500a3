// Type checker core - entry point, declarations and error reporting
// Handles: check, check_global, check_func_body, symbol_type

#include "log/log.hpp"
#include "types/checker.hpp"

namespace kindred::types {

auto type_error_kind_name(TypeErrorKind kind) -> std::string_view {
    switch (kind) {
    case TypeErrorKind::Mismatch:
        return "Mismatch";
    case TypeErrorKind::ArityMismatch:
        return "ArityMismatch";
    case TypeErrorKind::NotCallable:
        return "NotCallable";
    case TypeErrorKind::ImmutableAssignment:
        return "ImmutableAssignment";
    case TypeErrorKind::NotAValue:
        return "NotAValue";
    case TypeErrorKind::MissingReturn:
        return "MissingReturn";
    }
    return "Unknown";
}

auto TypeTable::type_of_expr(NodeId node) const -> TypePtr {
    auto it = expr_types.find(node);
    return it != expr_types.end() ? it->second : nullptr;
}

auto TypeTable::type_of_symbol(resolve::SymbolId symbol) const -> TypePtr {
    auto it = symbol_types.find(symbol);
    return it != symbol_types.end() ? it->second : nullptr;
}

auto check(const parser::Program& program, const resolve::Resolution& resolution)
    -> CheckResult {
    TypeChecker checker(program, resolution);
    return checker.check();
}

TypeChecker::TypeChecker(const parser::Program& program, const resolve::Resolution& resolution)
    : program_(program), resolution_(resolution) {}

auto TypeChecker::check() -> CheckResult {
    table_ = TypeTable{};
    errors_.clear();
    global_decls_.clear();
    globals_in_progress_.clear();

    for (const auto& decl : program_.decls) {
        if (!decl->is<parser::VarDecl>()) {
            continue;
        }
        const auto& var = decl->as<parser::VarDecl>();
        if (auto id = resolution_.declaration_of(var.id)) {
            global_decls_[*id] = &var;
        }
    }

    // Globals first, in declaration order, so function bodies see their types.
    for (const auto& decl : program_.decls) {
        if (decl->is<parser::VarDecl>()) {
            check_global(decl->as<parser::VarDecl>());
        }
    }
    for (const auto& decl : program_.decls) {
        if (decl->is<parser::FuncDecl>()) {
            check_func_body(decl->as<parser::FuncDecl>());
        }
    }

    KINDRED_LOG_DEBUG("types", "Typed " << table_.expr_types.size() << " expressions, "
                                        << errors_.size() << " errors");
    return CheckResult{.types = std::move(table_), .errors = std::move(errors_)};
}

// ============================================================================
// Declarations
// ============================================================================

void TypeChecker::check_global(const parser::VarDecl& var) {
    auto id = resolution_.declaration_of(var.id);
    if (id && table_.symbol_types.count(*id) > 0) {
        // Already inferred on demand from an earlier use.
        return;
    }
    if (id) {
        globals_in_progress_.insert(*id);
    }
    check_var_decl(var);
    if (id) {
        globals_in_progress_.erase(*id);
    }
}

void TypeChecker::check_func_body(const parser::FuncDecl& func) {
    auto id = resolution_.declaration_of(func.id);
    if (!id) {
        return;
    }
    const auto& symbol = resolution_.symbols.get(*id);
    const auto& func_type = symbol.type->as<FuncType>();
    current_return_type_ = func_type.return_type;

    for (size_t i = 0; i < func.params.size(); ++i) {
        auto param_id = resolution_.declaration_of(func.params[i].id);
        if (!param_id) {
            continue;
        }
        const auto& type = func_type.params[i];
        if (is_primitive(type, PrimitiveKind::Unit)) {
            error(TypeErrorKind::NotAValue,
                  "parameter `" + func.params[i].name + "` cannot have type `Unit`",
                  func.params[i].type.span);
            table_.symbol_types[*param_id] = make_unknown();
        } else {
            table_.symbol_types[*param_id] = type;
        }
    }

    check_block(func.body);

    // A body that lost statements to parse recovery cannot be judged.
    if (!func.body_recovered && !is_unknown(current_return_type_) &&
        !is_primitive(current_return_type_, PrimitiveKind::Unit) && !always_returns(func.body)) {
        error(TypeErrorKind::MissingReturn,
              "function `" + func.name + "` returns `" + type_to_string(current_return_type_) +
                  "` but can reach the end of its body without returning",
              func.name_span);
    }
    current_return_type_ = nullptr;
}

// ============================================================================
// Symbols
// ============================================================================

auto TypeChecker::symbol_type(resolve::SymbolId id, const SourceSpan& use_span) -> TypePtr {
    if (auto known = table_.type_of_symbol(id)) {
        return known;
    }

    const auto& symbol = resolution_.symbols.get(id);
    if (symbol.role != resolve::StorageRole::Global) {
        return symbol.type ? symbol.type : make_unknown();
    }

    // A global used before its own declaration was checked.
    auto decl = global_decls_.find(id);
    if (decl == global_decls_.end()) {
        return symbol.type ? symbol.type : make_unknown();
    }
    if (globals_in_progress_.count(id) > 0) {
        if (symbol.type) {
            return symbol.type;
        }
        error(TypeErrorKind::NotAValue,
              "cannot infer the type of `" + symbol.name + "`: its initializer depends on itself",
              use_span);
        table_.symbol_types[id] = make_unknown();
        return table_.symbol_types[id];
    }

    auto saved_return = current_return_type_;
    current_return_type_ = nullptr;
    check_global(*decl->second);
    current_return_type_ = saved_return;

    auto inferred = table_.type_of_symbol(id);
    return inferred ? inferred : make_unknown();
}

auto TypeChecker::record(const parser::Expr& expr, TypePtr type) -> TypePtr {
    table_.expr_types[expr.id] = type;
    return type;
}

// ============================================================================
// Errors
// ============================================================================

void TypeChecker::error(TypeErrorKind kind, std::string message, const SourceSpan& span) {
    KINDRED_LOG_TRACE("types", type_error_kind_name(kind) << ": " << message);
    errors_.push_back(TypeError{.kind = kind,
                                .message = std::move(message),
                                .span = span,
                                .expected = nullptr,
                                .found = nullptr});
}

void TypeChecker::mismatch(const TypePtr& expected, const TypePtr& found,
                           const SourceSpan& span) {
    KINDRED_LOG_TRACE("types", "Mismatch: " << type_to_string(expected) << " vs "
                                            << type_to_string(found));
    errors_.push_back(TypeError{.kind = TypeErrorKind::Mismatch,
                                .message = "expected `" + type_to_string(expected) +
                                           "`, found `" + type_to_string(found) + "`",
                                .span = span,
                                .expected = expected,
                                .found = found});
}

} // namespace kindred::types
