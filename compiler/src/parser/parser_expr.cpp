//! # Parser - Expressions
//!
//! Precedence climbing over binary operators; all binary operators are
//! left-associative.
//!
//! | Level | Operators          |
//! |-------|--------------------|
//! | 1     | `\|\|`             |
//! | 2     | `&&`               |
//! | 3     | `==` `!=`          |
//! | 4     | `<` `<=` `>` `>=`  |
//! | 5     | `+` `-`            |
//! | 6     | `*` `/` `%`        |
//! | 7     | prefix `-` `!`     |
//! | 8     | call `f(...)`      |

#include "parser/parser.hpp"

namespace kindred::parser {

auto Parser::parse_expr() -> Result<ExprPtr, ParseError> {
    return parse_binary(precedence::OR);
}

auto Parser::binary_precedence(lexer::TokenKind kind) -> int {
    switch (kind) {
    case lexer::TokenKind::OrOr:
        return precedence::OR;
    case lexer::TokenKind::AndAnd:
        return precedence::AND;
    case lexer::TokenKind::Eq:
    case lexer::TokenKind::Ne:
        return precedence::EQUALITY;
    case lexer::TokenKind::Lt:
    case lexer::TokenKind::Le:
    case lexer::TokenKind::Gt:
    case lexer::TokenKind::Ge:
        return precedence::COMPARISON;
    case lexer::TokenKind::Plus:
    case lexer::TokenKind::Minus:
        return precedence::TERM;
    case lexer::TokenKind::Star:
    case lexer::TokenKind::Slash:
    case lexer::TokenKind::Percent:
        return precedence::FACTOR;
    default:
        return precedence::NONE;
    }
}

auto Parser::token_to_binary_op(lexer::TokenKind kind) -> BinaryOp {
    switch (kind) {
    case lexer::TokenKind::OrOr:
        return BinaryOp::Or;
    case lexer::TokenKind::AndAnd:
        return BinaryOp::And;
    case lexer::TokenKind::Eq:
        return BinaryOp::Eq;
    case lexer::TokenKind::Ne:
        return BinaryOp::Ne;
    case lexer::TokenKind::Lt:
        return BinaryOp::Lt;
    case lexer::TokenKind::Le:
        return BinaryOp::Le;
    case lexer::TokenKind::Gt:
        return BinaryOp::Gt;
    case lexer::TokenKind::Ge:
        return BinaryOp::Ge;
    case lexer::TokenKind::Plus:
        return BinaryOp::Add;
    case lexer::TokenKind::Minus:
        return BinaryOp::Sub;
    case lexer::TokenKind::Star:
        return BinaryOp::Mul;
    case lexer::TokenKind::Slash:
        return BinaryOp::Div;
    default:
        return BinaryOp::Mod;
    }
}

auto Parser::parse_binary(int min_prec) -> Result<ExprPtr, ParseError> {
    auto left = parse_unary();
    if (is_err(left))
        return left;

    while (true) {
        int prec = binary_precedence(peek().kind);
        if (prec == precedence::NONE || prec < min_prec) {
            break;
        }

        auto op = token_to_binary_op(advance().kind);
        auto right = parse_binary(prec + 1);
        if (is_err(right))
            return right;

        auto span = SourceSpan::merge(unwrap(left)->span, unwrap(right)->span);
        auto expr = make_expr(BinaryExpr{.op = op,
                                         .left = std::move(unwrap(left)),
                                         .right = std::move(unwrap(right))},
                              span);
        // Left-deep chains grow without recursing here
        if (height_of(*expr) > MAX_NESTING_DEPTH) {
            return too_tall_error(previous().span);
        }
        left = std::move(expr);
    }

    return left;
}

auto Parser::parse_unary() -> Result<ExprPtr, ParseError> {
    if (too_deep()) {
        return too_tall_error(peek().span);
    }
    DepthGuard guard(depth_);

    if (check(lexer::TokenKind::Minus) || check(lexer::TokenKind::Bang)) {
        const auto& tok = advance();
        auto op = tok.is(lexer::TokenKind::Minus) ? UnaryOp::Neg : UnaryOp::Not;
        auto start_span = tok.span;

        auto operand = parse_unary();
        if (is_err(operand))
            return operand;

        auto span = SourceSpan::merge(start_span, unwrap(operand)->span);
        return make_expr(UnaryExpr{.op = op, .operand = std::move(unwrap(operand))}, span);
    }

    return parse_postfix();
}

auto Parser::parse_postfix() -> Result<ExprPtr, ParseError> {
    auto expr = parse_primary();
    if (is_err(expr))
        return expr;

    while (match(lexer::TokenKind::LParen)) {
        auto args = parse_call_args();
        if (is_err(args))
            return unwrap_err(args);

        auto span = SourceSpan::merge(unwrap(expr)->span, previous().span);
        auto call = make_expr(
            CallExpr{.callee = std::move(unwrap(expr)), .args = std::move(unwrap(args))}, span);
        if (height_of(*call) > MAX_NESTING_DEPTH) {
            return too_tall_error(previous().span);
        }
        expr = std::move(call);
    }

    return expr;
}

auto Parser::parse_call_args() -> Result<std::vector<ExprPtr>, ParseError> {
    std::vector<ExprPtr> args;
    if (!check(lexer::TokenKind::RParen)) {
        do {
            auto arg = parse_expr();
            if (is_err(arg))
                return unwrap_err(arg);
            args.push_back(std::move(unwrap(arg)));
        } while (match(lexer::TokenKind::Comma));
    }

    auto close = expect(lexer::TokenKind::RParen, "`)` after arguments");
    if (is_err(close))
        return unwrap_err(close);

    return args;
}

auto Parser::parse_primary() -> Result<ExprPtr, ParseError> {
    switch (peek().kind) {
    case lexer::TokenKind::IntLiteral: {
        const auto& tok = advance();
        return make_expr(LiteralExpr{.kind = LiteralKind::Int, .value = tok.value}, tok.span);
    }
    case lexer::TokenKind::FloatLiteral: {
        const auto& tok = advance();
        return make_expr(LiteralExpr{.kind = LiteralKind::Float, .value = tok.value}, tok.span);
    }
    case lexer::TokenKind::StringLiteral: {
        const auto& tok = advance();
        return make_expr(LiteralExpr{.kind = LiteralKind::String, .value = tok.value}, tok.span);
    }
    case lexer::TokenKind::BoolLiteral: {
        const auto& tok = advance();
        return make_expr(LiteralExpr{.kind = LiteralKind::Bool, .value = tok.value}, tok.span);
    }
    case lexer::TokenKind::Identifier: {
        const auto& tok = advance();
        return make_expr(IdentExpr{.name = std::string(tok.lexeme)}, tok.span);
    }
    case lexer::TokenKind::LParen: {
        advance();
        auto inner = parse_expr();
        if (is_err(inner))
            return inner;
        auto close = expect(lexer::TokenKind::RParen, "`)` to close parenthesized expression");
        if (is_err(close))
            return unwrap_err(close);
        return inner;
    }
    default:
        return error_here("expected expression");
    }
}

} // namespace kindred::parser
