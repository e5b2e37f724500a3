// Type checker statements - blocks, declarations, assignments, control flow
// Handles: check_block, check_stmt, check_var_decl, check_assign, check_return

#include "types/checker.hpp"

namespace kindred::types {

void TypeChecker::check_block(const parser::BlockStmt& block) {
    for (const auto& stmt : block.stmts) {
        check_stmt(*stmt);
    }
}

void TypeChecker::check_stmt(const parser::Stmt& stmt) {
    std::visit(
        [this, &stmt](const auto& node) {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, parser::VarDecl>) {
                check_var_decl(node);
            } else if constexpr (std::is_same_v<T, parser::AssignStmt>) {
                check_assign(node);
            } else if constexpr (std::is_same_v<T, parser::IfStmt>) {
                check_against(*node.condition, make_bool());
                check_block(node.then_block);
                if (node.else_branch) {
                    check_stmt(**node.else_branch);
                }
            } else if constexpr (std::is_same_v<T, parser::WhileStmt>) {
                check_against(*node.condition, make_bool());
                check_block(node.body);
            } else if constexpr (std::is_same_v<T, parser::ReturnStmt>) {
                check_return(node, stmt.span);
            } else if constexpr (std::is_same_v<T, parser::BlockStmt>) {
                check_block(node);
            } else if constexpr (std::is_same_v<T, parser::ExprStmt>) {
                check_expr(*node.expr);
            }
        },
        stmt.kind);
}

void TypeChecker::check_var_decl(const parser::VarDecl& var) {
    auto id = resolution_.declaration_of(var.id);

    TypePtr declared = nullptr;
    if (id) {
        declared = resolution_.symbols.get(*id).type;
    } else if (var.type) {
        // Duplicate or unresolved declaration: still check the initializer.
        declared = make_unknown();
    }

    TypePtr type;
    if (declared) {
        check_against(*var.init, declared);
        type = declared;
        if (is_primitive(declared, PrimitiveKind::Unit)) {
            error(TypeErrorKind::NotAValue, "variable `" + var.name + "` cannot have type `Unit`",
                  var.type ? var.type->span : var.name_span);
            type = make_unknown();
        }
    } else {
        type = check_expr(*var.init);
        if (is_primitive(type, PrimitiveKind::Unit)) {
            error(TypeErrorKind::NotAValue,
                  "cannot bind `" + var.name + "` to an expression that produces no value",
                  var.init->span);
            type = make_unknown();
        }
    }

    if (id) {
        table_.symbol_types[*id] = type;
    }
}

void TypeChecker::check_assign(const parser::AssignStmt& assign) {
    const auto& target = *assign.target;
    auto binding = resolution_.binding_of(target.id);
    if (!binding) {
        record(target, make_unknown());
        check_expr(*assign.value);
        return;
    }

    const auto& symbol = resolution_.symbols.get(*binding);
    if (symbol.kind != resolve::SymbolKind::Variable) {
        error(TypeErrorKind::ImmutableAssignment,
              "cannot assign to " + std::string(resolve::symbol_kind_to_string(symbol.kind)) +
                  " `" + symbol.name + "`",
              target.span);
        record(target, make_unknown());
        check_expr(*assign.value);
        return;
    }

    auto type = record(target, symbol_type(*binding, target.span));
    if (!symbol.is_mutable) {
        std::string what =
            symbol.role == resolve::StorageRole::Param ? "parameter" : "`let` binding";
        error(TypeErrorKind::ImmutableAssignment,
              "cannot assign twice to immutable " + what + " `" + symbol.name + "`", target.span);
    }
    check_against(*assign.value, type);
}

void TypeChecker::check_return(const parser::ReturnStmt& ret, const SourceSpan& span) {
    auto expected = current_return_type_ ? current_return_type_ : make_unknown();
    if (ret.value) {
        check_against(**ret.value, expected);
    } else if (!is_unknown(expected) && !is_primitive(expected, PrimitiveKind::Unit)) {
        mismatch(expected, make_unit(), span);
    }
}

// ============================================================================
// Return Analysis
// ============================================================================

auto TypeChecker::always_returns(const parser::BlockStmt& block) -> bool {
    for (const auto& stmt : block.stmts) {
        if (always_returns(*stmt)) {
            return true;
        }
    }
    return false;
}

auto TypeChecker::always_returns(const parser::Stmt& stmt) -> bool {
    if (stmt.is<parser::ReturnStmt>()) {
        return true;
    }
    if (stmt.is<parser::BlockStmt>()) {
        return always_returns(stmt.as<parser::BlockStmt>());
    }
    if (stmt.is<parser::IfStmt>()) {
        const auto& if_stmt = stmt.as<parser::IfStmt>();
        return if_stmt.else_branch && always_returns(if_stmt.then_block) &&
               always_returns(**if_stmt.else_branch);
    }
    // Loops may run zero times.
    return false;
}

} // namespace kindred::types
