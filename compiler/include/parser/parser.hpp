//! # Parser
//!
//! Recursive descent for items and statements, precedence climbing for
//! expressions. Tokens are pulled from the `Lexer` on demand through its
//! `peek_token()`/`next_token()` pair; `Error` tokens are skipped because the
//! lexer has already recorded them.
//!
//! ## Error Recovery
//!
//! A failing production returns a `ParseError`. The enclosing loop records it
//! and resynchronizes:
//!
//! | Context   | Skips until                                        |
//! |-----------|----------------------------------------------------|
//! | Block     | `;` (consumed), a statement keyword, or `}`        |
//! | Top level | `fn`, `let` or `var` outside any braces            |
//!
//! Parsing always yields a `Program`, partial when errors occurred, plus the
//! ordered list of errors.

#ifndef KINDRED_PARSER_PARSER_HPP
#define KINDRED_PARSER_PARSER_HPP

#include "common.hpp"
#include "lexer/lexer.hpp"
#include "parser/ast.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace kindred::parser {

// Operator precedence levels (higher = tighter binding)
namespace precedence {
constexpr int NONE = 0;
constexpr int OR = 1;         // ||
constexpr int AND = 2;        // &&
constexpr int EQUALITY = 3;   // == !=
constexpr int COMPARISON = 4; // < <= > >=
constexpr int TERM = 5;       // + -
constexpr int FACTOR = 6;     // * / %
constexpr int UNARY = 7;      // - !
constexpr int CALL = 8;       // ()
} // namespace precedence

/// Deepest nesting of blocks and sub-expressions the parser accepts. Later
/// passes walk the tree recursively, so a taller tree is rejected here.
constexpr size_t MAX_NESTING_DEPTH = 1000;

struct ParseError {
    std::string message;
    SourceSpan span;
};

/// Output of `Parser::parse_program`.
struct ParseResult {
    Program program;
    std::vector<ParseError> errors;
};

class Parser {
public:
    explicit Parser(lexer::Lexer& lexer);

    /// Parses a whole translation unit, recovering from errors.
    [[nodiscard]] auto parse_program(const std::string& name) -> ParseResult;

    /// Parses one statement (for testing).
    [[nodiscard]] auto parse_stmt() -> Result<StmtPtr, ParseError>;

    /// Parses one expression (for testing).
    [[nodiscard]] auto parse_expr() -> Result<ExprPtr, ParseError>;

    [[nodiscard]] auto errors() const -> const std::vector<ParseError>& {
        return errors_;
    }

private:
    lexer::Lexer& lexer_;
    lexer::Token previous_;
    std::vector<ParseError> errors_;
    NodeId next_id_ = 1;
    size_t consumed_ = 0; ///< Tokens consumed so far; used to detect stalled recovery
    size_t depth_ = 0;    ///< Recursive productions currently open
    std::unordered_map<NodeId, size_t> heights_; ///< Expression tree heights by node

    /// Holds one level of `depth_` for the lifetime of a recursive production.
    class DepthGuard {
    public:
        explicit DepthGuard(size_t& depth) : depth_(depth) {
            ++depth_;
        }
        ~DepthGuard() {
            --depth_;
        }
        DepthGuard(const DepthGuard&) = delete;
        auto operator=(const DepthGuard&) -> DepthGuard& = delete;

    private:
        size_t& depth_;
    };

    [[nodiscard]] auto too_deep() const -> bool {
        return depth_ >= MAX_NESTING_DEPTH;
    }

    // ========================================================================
    // Token Access
    // ========================================================================

    [[nodiscard]] auto peek() -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token& {
        return previous_;
    }
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) -> bool;
    auto match(lexer::TokenKind kind) -> bool;
    auto expect(lexer::TokenKind kind, const std::string& what)
        -> Result<lexer::Token, ParseError>;

    [[nodiscard]] auto next_id() -> NodeId {
        return next_id_++;
    }

    [[nodiscard]] auto error_here(const std::string& message) -> ParseError;

    /// Token text for "found ..." messages.
    [[nodiscard]] static auto describe(const lexer::Token& token) -> std::string;

    // ========================================================================
    // Error Recovery
    // ========================================================================

    void synchronize_to_stmt();
    void synchronize_to_decl();

    /// Skips a balanced `{ ... }` group starting at the current `{`.
    void skip_braced_group();

    // ========================================================================
    // Declarations
    // ========================================================================

    [[nodiscard]] auto parse_decl() -> Result<DeclPtr, ParseError>;
    [[nodiscard]] auto parse_func_decl() -> Result<DeclPtr, ParseError>;
    [[nodiscard]] auto parse_param() -> Result<Param, ParseError>;
    [[nodiscard]] auto parse_type_annotation() -> Result<TypeAnnotation, ParseError>;

    // ========================================================================
    // Statements
    // ========================================================================

    [[nodiscard]] auto parse_var_decl() -> Result<StmtPtr, ParseError>;
    [[nodiscard]] auto parse_block() -> Result<BlockStmt, ParseError>;
    [[nodiscard]] auto parse_if_stmt() -> Result<StmtPtr, ParseError>;
    [[nodiscard]] auto parse_while_stmt() -> Result<StmtPtr, ParseError>;
    [[nodiscard]] auto parse_return_stmt() -> Result<StmtPtr, ParseError>;
    [[nodiscard]] auto parse_expr_or_assign_stmt() -> Result<StmtPtr, ParseError>;

    // ========================================================================
    // Expressions
    // ========================================================================

    [[nodiscard]] auto parse_binary(int min_prec) -> Result<ExprPtr, ParseError>;
    [[nodiscard]] auto parse_unary() -> Result<ExprPtr, ParseError>;
    [[nodiscard]] auto parse_postfix() -> Result<ExprPtr, ParseError>;
    [[nodiscard]] auto parse_primary() -> Result<ExprPtr, ParseError>;
    [[nodiscard]] auto parse_call_args() -> Result<std::vector<ExprPtr>, ParseError>;

    [[nodiscard]] static auto binary_precedence(lexer::TokenKind kind) -> int;
    [[nodiscard]] static auto token_to_binary_op(lexer::TokenKind kind) -> BinaryOp;

    [[nodiscard]] auto make_expr(decltype(Expr::kind) kind, SourceSpan span) -> ExprPtr;

    /// Height of an expression built by this parser; leaves are 1.
    [[nodiscard]] auto height_of(const Expr& expr) const -> size_t;
    [[nodiscard]] static auto too_tall_error(const SourceSpan& span) -> ParseError;
};

} // namespace kindred::parser

#endif // KINDRED_PARSER_PARSER_HPP
