//! # Lexer - Strings
//!
//! String literals are delimited by `"` and may not span lines.
//!
//! | Escape | Character       |
//! |--------|-----------------|
//! | `\n`   | Newline         |
//! | `\t`   | Tab             |
//! | `\r`   | Carriage return |
//! | `\\`   | Backslash       |
//! | `\"`   | Double quote    |
//! | `\0`   | Null            |
//!
//! Any other escape is reported as `InvalidEscape` and the escaped character
//! is kept as-is. A literal that reaches a newline or the end of input is
//! `UnterminatedString`; lexing resumes at that newline.

#include "lexer/lexer.hpp"

namespace kindred::lexer {

auto Lexer::lex_string() -> Token {
    advance(); // opening quote

    std::string value;
    while (!is_at_end() && peek() != '"' && peek() != '\n') {
        char c = advance();
        if (c != '\\') {
            value += c;
            continue;
        }

        if (is_at_end() || peek() == '\n') {
            break;
        }

        size_t escape_start = pos_ - 1;
        char escaped = advance();
        switch (escaped) {
        case 'n':
            value += '\n';
            break;
        case 't':
            value += '\t';
            break;
        case 'r':
            value += '\r';
            break;
        case '\\':
            value += '\\';
            break;
        case '"':
            value += '"';
            break;
        case '0':
            value += '\0';
            break;
        default: {
            size_t len = utf8_char_length(escaped);
            for (size_t i = 1; i < len && !is_at_end(); ++i) {
                advance();
            }
            auto text = source_.slice(escape_start, pos_);
            report_error(LexErrorKind::InvalidEscape,
                         "invalid escape sequence `" + std::string(text) + "`", escape_start,
                         pos_);
            value += text.substr(1);
            break;
        }
        }
    }

    if (is_at_end() || peek() != '"') {
        return make_error_token(LexErrorKind::UnterminatedString, "unterminated string literal");
    }

    advance(); // closing quote
    return make_token(TokenKind::StringLiteral, std::move(value));
}

} // namespace kindred::lexer
