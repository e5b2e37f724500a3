//! # Formatter - Expressions
//!
//! | Expression | Output            |
//! |------------|-------------------|
//! | Binary     | `(a + b)`         |
//! | Unary      | `(-x)`, `(!ok)`   |
//! | Call       | `f(a, b)`         |
//! | Float      | `1.0`, `2.5e-07`  |
//! | String     | `"a\n\"b\""`      |

#include "format/formatter.hpp"

#include <charconv>

namespace kindred::format {

auto Formatter::float_literal(double value) -> std::string {
    char buffer[64];
    auto [ptr, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
    std::string text(buffer, ec == std::errc() ? ptr : buffer);
    if (text.find_first_of(".e") == std::string::npos) {
        text += ".0";
    }
    return text;
}

auto Formatter::string_literal(const std::string& value) -> std::string {
    std::string text = "\"";
    for (char c : value) {
        switch (c) {
        case '\n':
            text += "\\n";
            break;
        case '\t':
            text += "\\t";
            break;
        case '\r':
            text += "\\r";
            break;
        case '\\':
            text += "\\\\";
            break;
        case '"':
            text += "\\\"";
            break;
        case '\0':
            text += "\\0";
            break;
        default:
            text += c;
        }
    }
    text += "\"";
    return text;
}

auto Formatter::expr_to_string(const parser::Expr& expr) -> std::string {
    return std::visit(
        [this](const auto& node) -> std::string {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, parser::LiteralExpr>) {
                switch (node.kind) {
                case parser::LiteralKind::Int:
                    return std::to_string(std::get<int64_t>(node.value));
                case parser::LiteralKind::Float:
                    return float_literal(std::get<double>(node.value));
                case parser::LiteralKind::String:
                    return string_literal(std::get<std::string>(node.value));
                case parser::LiteralKind::Bool:
                    return std::get<bool>(node.value) ? "true" : "false";
                }
                return "";
            } else if constexpr (std::is_same_v<T, parser::IdentExpr>) {
                return node.name;
            } else if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                return "(" + std::string(parser::unary_op_to_string(node.op)) +
                       expr_to_string(*node.operand) + ")";
            } else if constexpr (std::is_same_v<T, parser::BinaryExpr>) {
                return "(" + expr_to_string(*node.left) + " " +
                       std::string(parser::binary_op_to_string(node.op)) + " " +
                       expr_to_string(*node.right) + ")";
            } else if constexpr (std::is_same_v<T, parser::CallExpr>) {
                std::string text = expr_to_string(*node.callee) + "(";
                for (size_t i = 0; i < node.args.size(); ++i) {
                    if (i > 0) {
                        text += ", ";
                    }
                    text += expr_to_string(*node.args[i]);
                }
                return text + ")";
            }
        },
        expr.kind);
}

} // namespace kindred::format
