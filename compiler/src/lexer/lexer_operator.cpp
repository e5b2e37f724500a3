//! # Lexer - Operators and Delimiters
//!
//! Two-character operators are matched before their one-character prefixes.
//! `&` and `|` exist only doubled.

#include "lexer/lexer.hpp"

namespace kindred::lexer {

auto Lexer::lex_operator() -> Token {
    char c = advance();

    auto pick = [&](char second, TokenKind two, TokenKind one) {
        if (peek() == second) {
            advance();
            return make_token(two);
        }
        return make_token(one);
    };

    switch (c) {
    case '+':
        return make_token(TokenKind::Plus);
    case '-':
        return pick('>', TokenKind::Arrow, TokenKind::Minus);
    case '*':
        return make_token(TokenKind::Star);
    case '/':
        return make_token(TokenKind::Slash);
    case '%':
        return make_token(TokenKind::Percent);
    case '=':
        return pick('=', TokenKind::Eq, TokenKind::Assign);
    case '!':
        return pick('=', TokenKind::Ne, TokenKind::Bang);
    case '<':
        return pick('=', TokenKind::Le, TokenKind::Lt);
    case '>':
        return pick('=', TokenKind::Ge, TokenKind::Gt);
    case '&':
        if (peek() == '&') {
            advance();
            return make_token(TokenKind::AndAnd);
        }
        return make_error_token(LexErrorKind::UnexpectedChar,
                                "unexpected character `&`, expected `&&`");
    case '|':
        if (peek() == '|') {
            advance();
            return make_token(TokenKind::OrOr);
        }
        return make_error_token(LexErrorKind::UnexpectedChar,
                                "unexpected character `|`, expected `||`");
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case '{':
        return make_token(TokenKind::LBrace);
    case '}':
        return make_token(TokenKind::RBrace);
    case ',':
        return make_token(TokenKind::Comma);
    case ';':
        return make_token(TokenKind::Semi);
    case ':':
        return make_token(TokenKind::Colon);
    default:
        break;
    }

    // Swallow the rest of a multi-byte character so the span covers all of it.
    size_t len = utf8_char_length(c);
    for (size_t i = 1; i < len && !is_at_end(); ++i) {
        advance();
    }
    return make_error_token(LexErrorKind::UnexpectedChar,
                            "unexpected character `" +
                                std::string(source_.slice(token_start_, pos_)) + "`");
}

} // namespace kindred::lexer
