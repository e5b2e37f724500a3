//! # Lexer
//!
//! Converts Kindred source text into tokens.
//!
//! ## Pipeline Position
//!
//! ```text
//! Source Text → [Lexer] → Tokens → Parser → AST
//! ```
//!
//! ## Behavior
//!
//! - Whitespace, `//` line comments and nestable `/* */` block comments are skipped
//! - Maximal munch: `==` over `=`, `->` over `-`, `<=` over `<`
//! - Literal values are decoded into `Token::value`
//!
//! ## Error Recovery
//!
//! Lexing never stops at the first problem. A malformed token becomes an
//! `Error` token, the matching `LexError` is appended to `errors()`, and
//! scanning resumes right after the bad input. A bad escape inside an
//! otherwise well-formed string only records the error: the literal is still
//! produced with the escaped character kept verbatim.
//!
//! ## Example
//!
//! ```cpp
//! auto source = Source::from_string("x = 1 + 2;");
//! Lexer lexer(source);
//! while (!lexer.peek_token().is_eof()) {
//!     Token tok = lexer.next_token();
//! }
//! ```

#ifndef KINDRED_LEXER_LEXER_HPP
#define KINDRED_LEXER_LEXER_HPP

#include "common.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <string>
#include <vector>

namespace kindred::lexer {

/// Lexical error kinds.
enum class LexErrorKind {
    UnterminatedString,  ///< String runs into a newline or end of input
    InvalidEscape,       ///< Unknown `\x` escape inside a string
    UnexpectedChar,      ///< Character that starts no token
    InvalidNumber,       ///< Malformed or out-of-range numeric literal
    UnterminatedComment, ///< `/*` without matching `*/`
};

[[nodiscard]] auto lex_error_kind_name(LexErrorKind kind) -> std::string_view;

/// A lexical error with the span of the offending text.
struct LexError {
    LexErrorKind kind;
    std::string message;
    SourceSpan span;
};

/// Kindred lexer.
///
/// Holds a reference to the `Source`; the source must outlive the lexer and
/// every token it produces.
class Lexer {
public:
    explicit Lexer(const Source& source);

    /// Consumes and returns the next token. Returns `Eof` repeatedly at the end.
    [[nodiscard]] auto next_token() -> Token;

    /// Returns the next token without consuming it.
    [[nodiscard]] auto peek_token() -> const Token&;

    /// Lexes the remaining input, including the final `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

    [[nodiscard]] auto errors() const -> const std::vector<LexError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

    [[nodiscard]] auto source() const -> const Source& {
        return source_;
    }

private:
    const Source& source_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<LexError> errors_;
    std::optional<Token> peeked_;

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    [[nodiscard]] auto make_token(TokenKind kind, TokenValue value = std::monostate{}) -> Token;

    /// Records a `LexError` over the current token text and returns an `Error` token.
    [[nodiscard]] auto make_error_token(LexErrorKind kind, const std::string& message) -> Token;

    void report_error(LexErrorKind kind, const std::string& message, size_t start, size_t end);

    // ========================================================================
    // Trivia
    // ========================================================================

    /// Skips whitespace and comments. Returns false if a block comment was
    /// left open, with `token_start_` at its opening `/*`.
    [[nodiscard]] auto skip_trivia() -> bool;

    void skip_line_comment();

    [[nodiscard]] auto skip_block_comment() -> bool;

    // ========================================================================
    // Token Lexers
    // ========================================================================

    [[nodiscard]] auto scan_token() -> Token;
    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_string() -> Token;
    [[nodiscard]] auto lex_operator() -> Token;

    // ========================================================================
    // Helpers
    // ========================================================================

    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;
    [[nodiscard]] static auto lookup_keyword(std::string_view ident) -> std::optional<TokenKind>;

    /// Byte length of the UTF-8 sequence introduced by `lead`.
    [[nodiscard]] static auto utf8_char_length(char lead) -> size_t;
};

} // namespace kindred::lexer

#endif // KINDRED_LEXER_LEXER_HPP
