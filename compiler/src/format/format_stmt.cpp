//! # Formatter - Statements
//!
//! One statement per line. `else if` chains stay on the closing-brace line.

#include "format/formatter.hpp"

namespace kindred::format {

void Formatter::format_block(const parser::BlockStmt& block) {
    emit("{\n");
    push_indent();
    for (const auto& stmt : block.stmts) {
        format_stmt(*stmt);
    }
    pop_indent();
    emit_indent();
    emit("}");
}

void Formatter::format_if(const parser::IfStmt& if_stmt) {
    emit("if " + expr_to_string(*if_stmt.condition) + " ");
    format_block(if_stmt.then_block);
    if (!if_stmt.else_branch) {
        return;
    }

    emit(" else ");
    const auto& else_stmt = **if_stmt.else_branch;
    if (else_stmt.is<parser::IfStmt>()) {
        format_if(else_stmt.as<parser::IfStmt>());
    } else {
        format_block(else_stmt.as<parser::BlockStmt>());
    }
}

void Formatter::format_stmt(const parser::Stmt& stmt) {
    emit_indent();
    std::visit(
        [this](const auto& node) {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, parser::VarDecl>) {
                format_var_decl(node);
            } else if constexpr (std::is_same_v<T, parser::AssignStmt>) {
                emit(expr_to_string(*node.target) + " = " + expr_to_string(*node.value) + ";");
            } else if constexpr (std::is_same_v<T, parser::IfStmt>) {
                format_if(node);
            } else if constexpr (std::is_same_v<T, parser::WhileStmt>) {
                emit("while " + expr_to_string(*node.condition) + " ");
                format_block(node.body);
            } else if constexpr (std::is_same_v<T, parser::ReturnStmt>) {
                emit(node.value ? "return " + expr_to_string(**node.value) + ";" : "return;");
            } else if constexpr (std::is_same_v<T, parser::BlockStmt>) {
                format_block(node);
            } else if constexpr (std::is_same_v<T, parser::ExprStmt>) {
                emit(expr_to_string(*node.expr) + ";");
            }
        },
        stmt.kind);
    emit_newline();
}

} // namespace kindred::format
