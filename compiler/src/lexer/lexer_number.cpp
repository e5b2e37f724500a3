//! # Lexer - Numbers
//!
//! | Form     | Example            | Token          |
//! |----------|--------------------|----------------|
//! | Integer  | `42`, `1_000_000`  | `IntLiteral`   |
//! | Fraction | `3.14`             | `FloatLiteral` |
//! | Exponent | `1e10`, `2.5E-3`   | `FloatLiteral` |
//!
//! A `.` only belongs to the number when a digit follows it. Letters glued
//! to a number (`12abc`), an exponent without digits and integers beyond
//! the 64-bit signed range are `InvalidNumber` errors.

#include "lexer/lexer.hpp"

#include <cerrno>
#include <charconv>
#include <cstdlib>

namespace kindred::lexer {

static auto is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto Lexer::lex_number() -> Token {
    std::string digits;
    bool is_float = false;

    auto consume_digits = [&]() {
        while (!is_at_end() && (is_digit(peek()) || peek() == '_')) {
            char c = advance();
            if (c != '_') {
                digits += c;
            }
        }
    };

    consume_digits();

    if (peek() == '.' && is_digit(peek_next())) {
        is_float = true;
        digits += advance();
        consume_digits();
    }

    if (peek() == 'e' || peek() == 'E') {
        is_float = true;
        digits += advance();
        if (peek() == '+' || peek() == '-') {
            digits += advance();
        }
        if (!is_digit(peek())) {
            while (!is_at_end() && is_identifier_continue(peek())) {
                advance();
            }
            return make_error_token(LexErrorKind::InvalidNumber,
                                    "exponent has no digits in numeric literal `" +
                                        std::string(source_.slice(token_start_, pos_)) + "`");
        }
        consume_digits();
    }

    if (!is_at_end() && is_identifier_continue(peek())) {
        while (!is_at_end() && is_identifier_continue(peek())) {
            advance();
        }
        return make_error_token(LexErrorKind::InvalidNumber,
                                "invalid numeric literal `" +
                                    std::string(source_.slice(token_start_, pos_)) + "`");
    }

    if (is_float) {
        errno = 0;
        double value = std::strtod(digits.c_str(), nullptr);
        if (errno == ERANGE) {
            return make_error_token(LexErrorKind::InvalidNumber,
                                    "float literal out of range `" + digits + "`");
        }
        return make_token(TokenKind::FloatLiteral, value);
    }

    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        return make_error_token(LexErrorKind::InvalidNumber,
                                "integer literal out of range `" + digits + "`");
    }
    return make_token(TokenKind::IntLiteral, value);
}

} // namespace kindred::lexer
