//! # Formatter Core Utilities
//!
//! | Method          | Description                              |
//! |-----------------|------------------------------------------|
//! | `format()`      | Format a complete program to a string    |
//! | `emit()`        | Write text to the output buffer          |
//! | `push_indent()` | Increase indentation level               |
//! | `pop_indent()`  | Decrease indentation level               |

#include "format/formatter.hpp"

namespace kindred::format {

Formatter::Formatter(FormatOptions options) : options_(options) {}

void Formatter::emit(const std::string& text) {
    output_ << text;
}

void Formatter::emit_newline() {
    output_ << "\n";
}

void Formatter::emit_indent() {
    output_ << indent_str();
}

void Formatter::push_indent() {
    ++indent_level_;
}

void Formatter::pop_indent() {
    if (indent_level_ > 0)
        --indent_level_;
}

auto Formatter::indent_str() const -> std::string {
    if (options_.use_tabs) {
        return std::string(indent_level_, '\t');
    }
    return std::string(indent_level_ * options_.indent_width, ' ');
}

auto Formatter::format(const parser::Program& program) -> std::string {
    output_.str("");
    indent_level_ = 0;

    for (size_t i = 0; i < program.decls.size(); ++i) {
        format_decl(*program.decls[i]);
        if (i + 1 < program.decls.size()) {
            emit_newline();
        }
    }

    return output_.str();
}

auto Formatter::format_expr(const parser::Expr& expr) -> std::string {
    return expr_to_string(expr);
}

} // namespace kindred::format
