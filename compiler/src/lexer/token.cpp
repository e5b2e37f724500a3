//! # Token Utilities
//!
//! - `token_kind_to_string()`: display text for diagnostics and dumps
//! - `is_keyword()`, `starts_statement()`: classification helpers

#include "lexer/token.hpp"

namespace kindred::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of file";

    case TokenKind::IntLiteral:
        return "integer";
    case TokenKind::FloatLiteral:
        return "float";
    case TokenKind::StringLiteral:
        return "string";
    case TokenKind::BoolLiteral:
        return "bool";
    case TokenKind::Identifier:
        return "identifier";

    case TokenKind::KwFn:
        return "fn";
    case TokenKind::KwLet:
        return "let";
    case TokenKind::KwVar:
        return "var";
    case TokenKind::KwIf:
        return "if";
    case TokenKind::KwElse:
        return "else";
    case TokenKind::KwWhile:
        return "while";
    case TokenKind::KwFor:
        return "for";
    case TokenKind::KwReturn:
        return "return";

    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::Slash:
        return "/";
    case TokenKind::Percent:
        return "%";
    case TokenKind::Eq:
        return "==";
    case TokenKind::Ne:
        return "!=";
    case TokenKind::Lt:
        return "<";
    case TokenKind::Gt:
        return ">";
    case TokenKind::Le:
        return "<=";
    case TokenKind::Ge:
        return ">=";
    case TokenKind::AndAnd:
        return "&&";
    case TokenKind::OrOr:
        return "||";
    case TokenKind::Bang:
        return "!";
    case TokenKind::Assign:
        return "=";
    case TokenKind::Arrow:
        return "->";

    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::LBrace:
        return "{";
    case TokenKind::RBrace:
        return "}";
    case TokenKind::Comma:
        return ",";
    case TokenKind::Semi:
        return ";";
    case TokenKind::Colon:
        return ":";

    case TokenKind::Error:
        return "error";
    }
    return "unknown";
}

auto is_keyword(TokenKind kind) -> bool {
    return kind >= TokenKind::KwFn && kind <= TokenKind::KwReturn;
}

auto starts_statement(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::KwFn:
    case TokenKind::KwLet:
    case TokenKind::KwVar:
    case TokenKind::KwIf:
    case TokenKind::KwWhile:
    case TokenKind::KwFor:
    case TokenKind::KwReturn:
        return true;
    default:
        return false;
    }
}

} // namespace kindred::lexer
