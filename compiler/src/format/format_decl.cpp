//! # Formatter - Declarations
//!
//! ```kindred
//! fn add(a: Int, b: Int) -> Int {
//!     return (a + b);
//! }
//!
//! let limit: Int = 10;
//! ```

#include "format/formatter.hpp"

namespace kindred::format {

void Formatter::format_decl(const parser::Decl& decl) {
    if (decl.is<parser::FuncDecl>()) {
        format_func_decl(decl.as<parser::FuncDecl>());
        return;
    }

    emit_indent();
    format_var_decl(decl.as<parser::VarDecl>());
    emit_newline();
}

void Formatter::format_func_decl(const parser::FuncDecl& func) {
    emit_indent();
    emit("fn " + func.name + "(");
    for (size_t i = 0; i < func.params.size(); ++i) {
        if (i > 0) {
            emit(", ");
        }
        emit(func.params[i].name + ": " + func.params[i].type.name);
    }
    emit(")");
    if (func.return_type) {
        emit(" -> " + func.return_type->name);
    }
    emit(" ");
    format_block(func.body);
    emit_newline();
}

void Formatter::format_var_decl(const parser::VarDecl& var) {
    emit(var.is_mutable ? "var " : "let ");
    emit(var.name);
    if (var.type) {
        emit(": " + var.type->name);
    }
    emit(" = " + expr_to_string(*var.init) + ";");
}

} // namespace kindred::format
