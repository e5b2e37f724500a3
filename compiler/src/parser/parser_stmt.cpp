//! # Parser - Statements
//!
//! | Statement  | Syntax                      | Notes                       |
//! |------------|-----------------------------|-----------------------------|
//! | Let        | `let x: T = expr;`          | Immutable, type optional    |
//! | Var        | `var x = expr;`             | Mutable, type optional      |
//! | Assign     | `x = expr;`                 | Target must be a name       |
//! | If         | `if c { } else if d { }`    | Braces required             |
//! | While      | `while c { }`               |                             |
//! | Return     | `return expr;` / `return;`  |                             |
//! | Block      | `{ ... }`                   | New scope                   |
//! | Expression | `f(x);`                     |                             |
//!
//! Statement-level errors are recorded by `parse_block()`, which then
//! resynchronizes and keeps going, so one bad statement does not hide the
//! rest of the body.

#include "parser/parser.hpp"

namespace kindred::parser {

auto Parser::parse_stmt() -> Result<StmtPtr, ParseError> {
    switch (peek().kind) {
    case lexer::TokenKind::KwLet:
    case lexer::TokenKind::KwVar:
        return parse_var_decl();
    case lexer::TokenKind::KwIf:
        return parse_if_stmt();
    case lexer::TokenKind::KwWhile:
        return parse_while_stmt();
    case lexer::TokenKind::KwReturn:
        return parse_return_stmt();
    case lexer::TokenKind::LBrace: {
        auto block = parse_block();
        if (is_err(block))
            return unwrap_err(block);
        auto span = unwrap(block).span;
        return make_box<Stmt>(Stmt{.kind = std::move(unwrap(block)), .span = span});
    }
    case lexer::TokenKind::KwFor: {
        auto span = advance().span;
        return ParseError{.message = "`for` loops are not supported, use `while`", .span = span};
    }
    case lexer::TokenKind::KwFn: {
        auto span = advance().span;
        return ParseError{.message = "functions can only be declared at top level", .span = span};
    }
    default:
        return parse_expr_or_assign_stmt();
    }
}

auto Parser::parse_var_decl() -> Result<StmtPtr, ParseError> {
    const auto& kw = advance();
    bool is_mutable = kw.is(lexer::TokenKind::KwVar);
    auto start_span = kw.span;

    auto name = expect(lexer::TokenKind::Identifier, "a variable name");
    if (is_err(name))
        return unwrap_err(name);

    std::optional<TypeAnnotation> type;
    if (match(lexer::TokenKind::Colon)) {
        auto annotation = parse_type_annotation();
        if (is_err(annotation))
            return unwrap_err(annotation);
        type = std::move(unwrap(annotation));
    }

    auto assign = expect(lexer::TokenKind::Assign, "`=` and an initializer");
    if (is_err(assign))
        return unwrap_err(assign);

    auto init = parse_expr();
    if (is_err(init))
        return unwrap_err(init);

    auto semi = expect(lexer::TokenKind::Semi, "`;` after variable declaration");
    if (is_err(semi))
        return unwrap_err(semi);

    const auto& name_tok = unwrap(name);
    auto span = SourceSpan::merge(start_span, unwrap(semi).span);
    return make_box<Stmt>(Stmt{.kind = VarDecl{.is_mutable = is_mutable,
                                               .name = std::string(name_tok.lexeme),
                                               .name_span = name_tok.span,
                                               .type = std::move(type),
                                               .init = std::move(unwrap(init)),
                                               .id = next_id()},
                               .span = span});
}

auto Parser::parse_block() -> Result<BlockStmt, ParseError> {
    if (too_deep() && check(lexer::TokenKind::LBrace)) {
        auto error = ParseError{.message = "blocks are nested more than " +
                                           std::to_string(MAX_NESTING_DEPTH) + " levels deep",
                                .span = peek().span};
        skip_braced_group();
        return error;
    }
    DepthGuard guard(depth_);

    auto open = expect(lexer::TokenKind::LBrace, "`{`");
    if (is_err(open))
        return unwrap_err(open);

    BlockStmt block;
    while (!check(lexer::TokenKind::RBrace) && !is_at_end()) {
        size_t before = consumed_;
        auto stmt = parse_stmt();
        if (is_ok(stmt)) {
            block.stmts.push_back(std::move(unwrap(stmt)));
            continue;
        }

        errors_.push_back(std::move(unwrap_err(stmt)));
        synchronize_to_stmt();
        if (consumed_ == before) {
            advance();
        }
    }

    auto close = expect(lexer::TokenKind::RBrace, "`}` to close block");
    if (is_err(close))
        return unwrap_err(close);

    block.span = SourceSpan::merge(unwrap(open).span, unwrap(close).span);
    return block;
}

auto Parser::parse_if_stmt() -> Result<StmtPtr, ParseError> {
    auto start_span = advance().span; // if

    auto condition = parse_expr();
    if (is_err(condition))
        return unwrap_err(condition);

    auto then_block = parse_block();
    if (is_err(then_block))
        return unwrap_err(then_block);

    auto end_span = unwrap(then_block).span;
    std::optional<StmtPtr> else_branch;
    if (match(lexer::TokenKind::KwElse)) {
        if (check(lexer::TokenKind::KwIf)) {
            if (too_deep()) {
                return ParseError{.message = "`else if` chain is longer than " +
                                             std::to_string(MAX_NESTING_DEPTH) + " branches",
                                  .span = peek().span};
            }
            DepthGuard guard(depth_);
            auto nested = parse_if_stmt();
            if (is_err(nested))
                return unwrap_err(nested);
            end_span = unwrap(nested)->span;
            else_branch = std::move(unwrap(nested));
        } else {
            auto else_block = parse_block();
            if (is_err(else_block))
                return unwrap_err(else_block);
            end_span = unwrap(else_block).span;
            else_branch =
                make_box<Stmt>(Stmt{.kind = std::move(unwrap(else_block)), .span = end_span});
        }
    }

    return make_box<Stmt>(Stmt{.kind = IfStmt{.condition = std::move(unwrap(condition)),
                                              .then_block = std::move(unwrap(then_block)),
                                              .else_branch = std::move(else_branch)},
                               .span = SourceSpan::merge(start_span, end_span)});
}

auto Parser::parse_while_stmt() -> Result<StmtPtr, ParseError> {
    auto start_span = advance().span; // while

    auto condition = parse_expr();
    if (is_err(condition))
        return unwrap_err(condition);

    auto body = parse_block();
    if (is_err(body))
        return unwrap_err(body);

    auto span = SourceSpan::merge(start_span, unwrap(body).span);
    return make_box<Stmt>(Stmt{.kind = WhileStmt{.condition = std::move(unwrap(condition)),
                                                 .body = std::move(unwrap(body))},
                               .span = span});
}

auto Parser::parse_return_stmt() -> Result<StmtPtr, ParseError> {
    auto start_span = advance().span; // return

    std::optional<ExprPtr> value;
    if (!check(lexer::TokenKind::Semi)) {
        auto expr = parse_expr();
        if (is_err(expr))
            return unwrap_err(expr);
        value = std::move(unwrap(expr));
    }

    auto semi = expect(lexer::TokenKind::Semi, "`;` after return");
    if (is_err(semi))
        return unwrap_err(semi);

    return make_box<Stmt>(Stmt{.kind = ReturnStmt{.value = std::move(value)},
                               .span = SourceSpan::merge(start_span, unwrap(semi).span)});
}

auto Parser::parse_expr_or_assign_stmt() -> Result<StmtPtr, ParseError> {
    auto expr = parse_expr();
    if (is_err(expr))
        return unwrap_err(expr);

    auto& lhs = unwrap(expr);
    if (match(lexer::TokenKind::Assign)) {
        if (!lhs->is<IdentExpr>()) {
            return ParseError{.message = "invalid assignment target, expected a variable name",
                              .span = lhs->span};
        }

        auto value = parse_expr();
        if (is_err(value))
            return unwrap_err(value);

        auto semi = expect(lexer::TokenKind::Semi, "`;` after assignment");
        if (is_err(semi))
            return unwrap_err(semi);

        auto span = SourceSpan::merge(lhs->span, unwrap(semi).span);
        return make_box<Stmt>(
            Stmt{.kind = AssignStmt{.target = std::move(lhs), .value = std::move(unwrap(value))},
                 .span = span});
    }

    auto semi = expect(lexer::TokenKind::Semi, "`;` after expression");
    if (is_err(semi))
        return unwrap_err(semi);

    auto span = SourceSpan::merge(lhs->span, unwrap(semi).span);
    return make_box<Stmt>(Stmt{.kind = ExprStmt{.expr = std::move(lhs)}, .span = span});
}

} // namespace kindred::parser
