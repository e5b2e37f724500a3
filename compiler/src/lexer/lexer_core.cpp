//! # Lexer Core
//!
//! - **Keyword table**: identifier text to token kind
//! - **Character access**: `peek()`, `advance()`, `is_at_end()`
//! - **Token creation**: `make_token()`, `make_error_token()`
//! - **Trivia**: whitespace, line comments, nested block comments
//! - **Dispatch**: `next_token()`, `peek_token()`, `tokenize()`

#include "lexer/lexer.hpp"

#include "log/log.hpp"

#include <unordered_map>

namespace kindred::lexer {

namespace {

const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    {"fn", TokenKind::KwFn},         {"let", TokenKind::KwLet},
    {"var", TokenKind::KwVar},       {"if", TokenKind::KwIf},
    {"else", TokenKind::KwElse},     {"while", TokenKind::KwWhile},
    {"for", TokenKind::KwFor},       {"return", TokenKind::KwReturn},
    {"true", TokenKind::BoolLiteral}, {"false", TokenKind::BoolLiteral},
};

} // anonymous namespace

auto lex_error_kind_name(LexErrorKind kind) -> std::string_view {
    switch (kind) {
    case LexErrorKind::UnterminatedString:
        return "UnterminatedString";
    case LexErrorKind::InvalidEscape:
        return "InvalidEscape";
    case LexErrorKind::UnexpectedChar:
        return "UnexpectedChar";
    case LexErrorKind::InvalidNumber:
        return "InvalidNumber";
    case LexErrorKind::UnterminatedComment:
        return "UnterminatedComment";
    }
    return "Unknown";
}

Lexer::Lexer(const Source& source) : source_(source) {}

// ============================================================================
// Character Access
// ============================================================================

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

// ============================================================================
// Token Creation
// ============================================================================

auto Lexer::make_token(TokenKind kind, TokenValue value) -> Token {
    return Token{.kind = kind,
                 .span = source_.span(token_start_, pos_),
                 .lexeme = source_.slice(token_start_, pos_),
                 .value = std::move(value)};
}

auto Lexer::make_error_token(LexErrorKind kind, const std::string& message) -> Token {
    report_error(kind, message, token_start_, pos_);
    return make_token(TokenKind::Error);
}

void Lexer::report_error(LexErrorKind kind, const std::string& message, size_t start,
                         size_t end) {
    auto span = source_.span(start, end);
    KINDRED_LOG_TRACE("lexer", lex_error_kind_name(kind) << " at " << span.start.line << ":"
                                                         << span.start.column << ": " << message);
    errors_.push_back(LexError{.kind = kind, .message = message, .span = span});
}

// ============================================================================
// Trivia
// ============================================================================

auto Lexer::skip_trivia() -> bool {
    while (!is_at_end()) {
        char c = peek();
        switch (c) {
        case ' ':
        case '\t':
        case '\r':
        case '\n':
            advance();
            break;
        case '/':
            if (peek_next() == '/') {
                skip_line_comment();
            } else if (peek_next() == '*') {
                if (!skip_block_comment()) {
                    return false;
                }
            } else {
                return true;
            }
            break;
        default:
            return true;
        }
    }
    return true;
}

void Lexer::skip_line_comment() {
    while (!is_at_end() && peek() != '\n') {
        advance();
    }
}

auto Lexer::skip_block_comment() -> bool {
    token_start_ = pos_;
    advance(); // /
    advance(); // *

    int depth = 1;
    while (!is_at_end() && depth > 0) {
        if (peek() == '/' && peek_next() == '*') {
            advance();
            advance();
            ++depth;
        } else if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            --depth;
        } else {
            advance();
        }
    }
    return depth == 0;
}

// ============================================================================
// Dispatch
// ============================================================================

auto Lexer::next_token() -> Token {
    if (peeked_) {
        Token tok = std::move(*peeked_);
        peeked_.reset();
        return tok;
    }
    return scan_token();
}

auto Lexer::peek_token() -> const Token& {
    if (!peeked_) {
        peeked_ = scan_token();
    }
    return *peeked_;
}

auto Lexer::tokenize() -> std::vector<Token> {
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(next_token());
        if (tokens.back().is_eof()) {
            break;
        }
    }
    KINDRED_LOG_DEBUG("lexer", "Lexed " << tokens.size() << " tokens from "
                                        << source_.filename() << " (" << errors_.size()
                                        << " errors)");
    return tokens;
}

auto Lexer::scan_token() -> Token {
    if (!skip_trivia()) {
        return make_error_token(LexErrorKind::UnterminatedComment,
                                "unterminated block comment");
    }

    token_start_ = pos_;
    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();
    if (is_identifier_start(c)) {
        return lex_identifier();
    }
    if (c >= '0' && c <= '9') {
        return lex_number();
    }
    if (c == '"') {
        return lex_string();
    }
    return lex_operator();
}

// ============================================================================
// Identifiers
// ============================================================================

auto Lexer::is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

auto Lexer::lookup_keyword(std::string_view ident) -> std::optional<TokenKind> {
    auto it = KEYWORDS.find(ident);
    if (it == KEYWORDS.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto Lexer::lex_identifier() -> Token {
    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }

    auto text = source_.slice(token_start_, pos_);
    auto keyword = lookup_keyword(text);
    if (!keyword) {
        return make_token(TokenKind::Identifier);
    }
    if (*keyword == TokenKind::BoolLiteral) {
        return make_token(TokenKind::BoolLiteral, text == "true");
    }
    return make_token(*keyword);
}

auto Lexer::utf8_char_length(char lead) -> size_t {
    auto byte = static_cast<unsigned char>(lead);
    if ((byte & 0x80) == 0)
        return 1;
    if ((byte & 0xE0) == 0xC0)
        return 2;
    if ((byte & 0xF0) == 0xE0)
        return 3;
    if ((byte & 0xF8) == 0xF0)
        return 4;
    return 1;
}

} // namespace kindred::lexer
