//! # Resolver - Function Bodies
//!
//! Pass 2: walks statements and expressions with a chain of stack-allocated
//! scopes.

#include "resolve/resolver.hpp"

namespace kindred::resolve {

namespace {

/// Enters a child scope of `current` for the lifetime of the guard.
class ScopeGuard {
public:
    ScopeGuard(Scope*& current, ScopeId id) : current_(current), scope_(id, current) {
        current_ = &scope_;
    }

    ~ScopeGuard() {
        current_ = scope_.parent();
    }

    ScopeGuard(const ScopeGuard&) = delete;
    auto operator=(const ScopeGuard&) -> ScopeGuard& = delete;

    [[nodiscard]] auto scope() -> Scope& {
        return scope_;
    }

private:
    Scope*& current_;
    Scope scope_;
};

} // namespace

void Resolver::resolve_func_body(const parser::FuncDecl& func) {
    ScopeGuard params(current_, next_scope_id_++);

    for (const auto& param : func.params) {
        auto binding = result_.bindings.find(param.type.id);
        types::TypePtr type = types::make_unknown();
        if (binding != result_.bindings.end()) {
            const auto& type_symbol = result_.symbols.get(binding->second);
            if (type_symbol.kind == SymbolKind::Type) {
                type = type_symbol.type;
            }
        }
        declare(Symbol{.id = 0,
                       .name = param.name,
                       .kind = SymbolKind::Variable,
                       .type = std::move(type),
                       .scope = current_->id(),
                       .role = StorageRole::Param,
                       .is_mutable = false,
                       .span = param.span},
                param.id);
    }

    resolve_block(func.body);
}

void Resolver::resolve_block(const parser::BlockStmt& block) {
    ScopeGuard guard(current_, next_scope_id_++);

    for (const auto& stmt : block.stmts) {
        if (stmt->is<parser::VarDecl>()) {
            guard.scope().add_pending(stmt->as<parser::VarDecl>().name);
        }
    }

    for (const auto& stmt : block.stmts) {
        resolve_stmt(*stmt);
    }
}

void Resolver::resolve_stmt(const parser::Stmt& stmt) {
    std::visit(
        [this](const auto& node) {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, parser::VarDecl>) {
                resolve_local_var(node);
            } else if constexpr (std::is_same_v<T, parser::AssignStmt>) {
                resolve_expr(*node.target);
                resolve_expr(*node.value);
            } else if constexpr (std::is_same_v<T, parser::IfStmt>) {
                resolve_expr(*node.condition);
                resolve_block(node.then_block);
                if (node.else_branch) {
                    resolve_stmt(**node.else_branch);
                }
            } else if constexpr (std::is_same_v<T, parser::WhileStmt>) {
                resolve_expr(*node.condition);
                resolve_block(node.body);
            } else if constexpr (std::is_same_v<T, parser::ReturnStmt>) {
                if (node.value) {
                    resolve_expr(**node.value);
                }
            } else if constexpr (std::is_same_v<T, parser::BlockStmt>) {
                resolve_block(node);
            } else if constexpr (std::is_same_v<T, parser::ExprStmt>) {
                resolve_expr(*node.expr);
            }
        },
        stmt.kind);
}

void Resolver::resolve_local_var(const parser::VarDecl& var) {
    types::TypePtr type = var.type ? resolve_type(*var.type) : nullptr;

    // The name is still pending here, so `let x = x;` is reported.
    resolve_expr(*var.init);

    declare(Symbol{.id = 0,
                   .name = var.name,
                   .kind = SymbolKind::Variable,
                   .type = std::move(type),
                   .scope = current_->id(),
                   .role = StorageRole::Local,
                   .is_mutable = var.is_mutable,
                   .span = var.name_span},
            var.id);
}

void Resolver::resolve_expr(const parser::Expr& expr) {
    std::visit(
        [this, &expr](const auto& node) {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, parser::IdentExpr>) {
                if (auto found = lookup_value(node.name, expr.span)) {
                    result_.bindings[expr.id] = *found;
                }
            } else if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                resolve_expr(*node.operand);
            } else if constexpr (std::is_same_v<T, parser::BinaryExpr>) {
                resolve_expr(*node.left);
                resolve_expr(*node.right);
            } else if constexpr (std::is_same_v<T, parser::CallExpr>) {
                resolve_expr(*node.callee);
                for (const auto& arg : node.args) {
                    resolve_expr(*arg);
                }
            }
        },
        expr.kind);
}

} // namespace kindred::resolve
