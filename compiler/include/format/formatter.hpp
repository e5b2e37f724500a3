//! # Source Formatter
//!
//! Pretty-prints an AST back to Kindred source.
//!
//! Every unary and binary expression is wrapped in parentheses, so the output
//! does not depend on precedence and re-parses to a structurally equal tree.
//! String and float literals are written in a form the lexer decodes to the
//! same value.
//!
//! ```cpp
//! format::Formatter formatter;
//! std::string text = formatter.format(program);
//! ```

#ifndef KINDRED_FORMAT_FORMATTER_HPP
#define KINDRED_FORMAT_FORMATTER_HPP

#include "parser/ast.hpp"

#include <sstream>
#include <string>

namespace kindred::format {

struct FormatOptions {
    size_t indent_width = 4;
    bool use_tabs = false;
};

class Formatter {
public:
    explicit Formatter(FormatOptions options = {});

    [[nodiscard]] auto format(const parser::Program& program) -> std::string;

    /// Formats one expression on its own.
    [[nodiscard]] auto format_expr(const parser::Expr& expr) -> std::string;

    /// Literal text for a float, always containing `.` or an exponent.
    [[nodiscard]] static auto float_literal(double value) -> std::string;

    /// Quoted, escaped literal text for a string.
    [[nodiscard]] static auto string_literal(const std::string& value) -> std::string;

private:
    FormatOptions options_;
    std::ostringstream output_;
    size_t indent_level_ = 0;

    void emit(const std::string& text);
    void emit_newline();
    void emit_indent();
    void push_indent();
    void pop_indent();
    [[nodiscard]] auto indent_str() const -> std::string;

    void format_decl(const parser::Decl& decl);
    void format_func_decl(const parser::FuncDecl& func);

    /// Emits `let`/`var` without indentation or newline.
    void format_var_decl(const parser::VarDecl& var);

    void format_stmt(const parser::Stmt& stmt);

    /// Emits `{ ... }` starting at the current position; the closing brace
    /// is indented but not followed by a newline.
    void format_block(const parser::BlockStmt& block);
    void format_if(const parser::IfStmt& if_stmt);

    [[nodiscard]] auto expr_to_string(const parser::Expr& expr) -> std::string;
};

} // namespace kindred::format

#endif // KINDRED_FORMAT_FORMATTER_HPP
