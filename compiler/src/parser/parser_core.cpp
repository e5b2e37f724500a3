//! # Parser Core
//!
//! | Function                | Purpose                                   |
//! |-------------------------|-------------------------------------------|
//! | `peek()`                | Next token, lexer errors skipped          |
//! | `advance()`             | Consume the next token                    |
//! | `check()` / `match()`   | Test / conditionally consume a token kind |
//! | `expect()`              | Consume a required token or fail          |
//! | `synchronize_to_stmt()` | Recover inside a block                    |
//! | `synchronize_to_decl()` | Recover at top level                      |
//! | `parse_program()`       | Item loop with recovery                   |

#include "parser/parser.hpp"

#include "log/log.hpp"

#include <algorithm>

namespace kindred::parser {

Parser::Parser(lexer::Lexer& lexer)
    : lexer_(lexer),
      previous_{.kind = lexer::TokenKind::Eof, .span = {}, .lexeme = {}, .value = {}} {}

// ============================================================================
// Token Access
// ============================================================================

auto Parser::peek() -> const lexer::Token& {
    while (lexer_.peek_token().is_error()) {
        auto skipped = lexer_.next_token();
        KINDRED_LOG_TRACE("parser", "skipping lexer error token `" << skipped.lexeme << "`");
    }
    return lexer_.peek_token();
}

auto Parser::advance() -> const lexer::Token& {
    if (!peek().is_eof()) {
        previous_ = lexer_.next_token();
        ++consumed_;
    }
    return previous_;
}

auto Parser::is_at_end() -> bool {
    return peek().is_eof();
}

auto Parser::check(lexer::TokenKind kind) -> bool {
    return peek().kind == kind;
}

auto Parser::match(lexer::TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::describe(const lexer::Token& token) -> std::string {
    switch (token.kind) {
    case lexer::TokenKind::Eof:
        return "end of file";
    case lexer::TokenKind::Identifier:
    case lexer::TokenKind::IntLiteral:
    case lexer::TokenKind::FloatLiteral:
    case lexer::TokenKind::StringLiteral:
    case lexer::TokenKind::BoolLiteral:
        return "`" + std::string(token.lexeme) + "`";
    default:
        return "`" + std::string(lexer::token_kind_to_string(token.kind)) + "`";
    }
}

auto Parser::error_here(const std::string& message) -> ParseError {
    const auto& tok = peek();
    return ParseError{.message = message + ", found " + describe(tok), .span = tok.span};
}

auto Parser::expect(lexer::TokenKind kind, const std::string& what)
    -> Result<lexer::Token, ParseError> {
    if (check(kind)) {
        return advance();
    }
    return error_here("expected " + what);
}

auto Parser::make_expr(decltype(Expr::kind) kind, SourceSpan span) -> ExprPtr {
    size_t children = 0;
    if (const auto* unary = std::get_if<UnaryExpr>(&kind)) {
        children = height_of(*unary->operand);
    } else if (const auto* binary = std::get_if<BinaryExpr>(&kind)) {
        children = std::max(height_of(*binary->left), height_of(*binary->right));
    } else if (const auto* call = std::get_if<CallExpr>(&kind)) {
        children = height_of(*call->callee);
        for (const auto& arg : call->args) {
            children = std::max(children, height_of(*arg));
        }
    }

    auto expr = make_box<Expr>(Expr{.kind = std::move(kind), .span = span, .id = next_id()});
    heights_[expr->id] = children + 1;
    return expr;
}

auto Parser::height_of(const Expr& expr) const -> size_t {
    auto it = heights_.find(expr.id);
    return it != heights_.end() ? it->second : 1;
}

auto Parser::too_tall_error(const SourceSpan& span) -> ParseError {
    return ParseError{.message = "expression is nested more than " +
                                 std::to_string(MAX_NESTING_DEPTH) + " levels deep",
                      .span = span};
}

// ============================================================================
// Error Recovery
// ============================================================================

void Parser::skip_braced_group() {
    int depth = 0;
    while (!is_at_end()) {
        if (check(lexer::TokenKind::LBrace)) {
            ++depth;
        } else if (check(lexer::TokenKind::RBrace)) {
            --depth;
            if (depth <= 0) {
                advance();
                return;
            }
        }
        advance();
    }
}

void Parser::synchronize_to_stmt() {
    while (!is_at_end()) {
        if (check(lexer::TokenKind::Semi)) {
            advance();
            return;
        }
        if (check(lexer::TokenKind::RBrace) || lexer::starts_statement(peek().kind)) {
            return;
        }
        // A brace group ends the broken statement (`for i in xs { ... }`).
        if (check(lexer::TokenKind::LBrace)) {
            skip_braced_group();
            return;
        }
        advance();
    }
}

void Parser::synchronize_to_decl() {
    int depth = 0;
    while (!is_at_end()) {
        auto kind = peek().kind;
        if (depth == 0 && (kind == lexer::TokenKind::KwFn || kind == lexer::TokenKind::KwLet ||
                           kind == lexer::TokenKind::KwVar)) {
            return;
        }
        if (kind == lexer::TokenKind::LBrace) {
            ++depth;
        } else if (kind == lexer::TokenKind::RBrace && depth > 0) {
            --depth;
        }
        advance();
    }
}

// ============================================================================
// Program
// ============================================================================

auto Parser::parse_program(const std::string& name) -> ParseResult {
    ParseResult result;
    result.program.name = name;

    while (!is_at_end()) {
        size_t before = consumed_;
        auto decl = parse_decl();
        if (is_ok(decl)) {
            result.program.decls.push_back(std::move(unwrap(decl)));
            continue;
        }

        errors_.push_back(std::move(unwrap_err(decl)));
        synchronize_to_decl();
        if (consumed_ == before) {
            advance();
        }
    }

    result.program.next_node_id = next_id_;
    result.errors = errors_;

    KINDRED_LOG_DEBUG("parser", "Parsed " << result.program.decls.size() << " items from "
                                          << name << " (" << result.errors.size() << " errors)");
    return result;
}

} // namespace kindred::parser
