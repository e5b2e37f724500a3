//! # Token Definitions
//!
//! Token kinds produced by the Kindred lexer.
//!
//! - **Literals**: integers, floats, strings, booleans
//! - **Keywords**: `fn`, `let`, `var`, `if`, `else`, `while`, `for`, `return`
//! - **Operators**: arithmetic, comparison, logical, assignment
//! - **Delimiters**: parentheses, braces, punctuation
//! - **Special**: end-of-file and error tokens

#ifndef KINDRED_LEXER_TOKEN_HPP
#define KINDRED_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>

namespace kindred::lexer {

/// All token kinds in Kindred.
enum class TokenKind : uint8_t {
    Eof, ///< End of input

    // ========================================================================
    // Literals
    // ========================================================================
    IntLiteral,    ///< `42`, `1_000`
    FloatLiteral,  ///< `3.14`, `1e10`, `2.5e-3`
    StringLiteral, ///< `"hello\n"`
    BoolLiteral,   ///< `true`, `false`

    Identifier,

    // ========================================================================
    // Keywords
    // ========================================================================
    KwFn,
    KwLet,
    KwVar,
    KwIf,
    KwElse,
    KwWhile,
    KwFor, ///< Reserved; no `for` statement exists yet
    KwReturn,

    // ========================================================================
    // Operators
    // ========================================================================
    Plus,
    Minus,
    Star,
    Slash,
    Percent,

    Eq, ///< `==`
    Ne, ///< `!=`
    Lt,
    Gt,
    Le,
    Ge,

    AndAnd, ///< `&&`
    OrOr,   ///< `||`
    Bang,   ///< `!`

    Assign, ///< `=`
    Arrow,  ///< `->`

    // ========================================================================
    // Delimiters
    // ========================================================================
    LParen,
    RParen,
    LBrace,
    RBrace,
    Comma,
    Semi,
    Colon,

    Error, ///< Lexical error; the matching `LexError` is in `Lexer::errors()`
};

[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

[[nodiscard]] auto is_keyword(TokenKind kind) -> bool;

/// Keywords that can begin a statement or item. Used for parser recovery.
[[nodiscard]] auto starts_statement(TokenKind kind) -> bool;

/// Literal payload of a token.
using TokenValue = std::variant<std::monostate, int64_t, double, std::string, bool>;

/// A lexical token.
///
/// `lexeme` views the `Source` the token was produced from, so a token must
/// not outlive its source.
struct Token {
    TokenKind kind;
    SourceSpan span;
    std::string_view lexeme;
    TokenValue value;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    [[nodiscard]] auto is_error() const -> bool {
        return kind == TokenKind::Error;
    }

    [[nodiscard]] auto int_value() const -> int64_t {
        return std::get<int64_t>(value);
    }

    [[nodiscard]] auto float_value() const -> double {
        return std::get<double>(value);
    }

    /// Decoded string contents (escapes applied, quotes removed).
    [[nodiscard]] auto string_value() const -> const std::string& {
        return std::get<std::string>(value);
    }

    [[nodiscard]] auto bool_value() const -> bool {
        return std::get<bool>(value);
    }
};

} // namespace kindred::lexer

#endif // KINDRED_LEXER_TOKEN_HPP
