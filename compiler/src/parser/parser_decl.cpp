//! # Parser - Declarations
//!
//! | Item     | Syntax                                   |
//! |----------|------------------------------------------|
//! | Function | `fn name(a: Int, b: Int) -> Int { ... }` |
//! | Global   | `let name: Type = expr;` / `var ...`     |
//!
//! A function without `->` returns `Unit`.

#include "parser/parser.hpp"

namespace kindred::parser {

auto Parser::parse_decl() -> Result<DeclPtr, ParseError> {
    if (check(lexer::TokenKind::KwFn)) {
        return parse_func_decl();
    }

    if (check(lexer::TokenKind::KwLet) || check(lexer::TokenKind::KwVar)) {
        auto stmt = parse_var_decl();
        if (is_err(stmt))
            return unwrap_err(stmt);
        auto& node = *unwrap(stmt);
        return make_box<Decl>(
            Decl{.kind = std::get<VarDecl>(std::move(node.kind)), .span = node.span});
    }

    return error_here("expected `fn`, `let` or `var` at top level");
}

auto Parser::parse_type_annotation() -> Result<TypeAnnotation, ParseError> {
    auto name = expect(lexer::TokenKind::Identifier, "a type name");
    if (is_err(name))
        return unwrap_err(name);

    const auto& tok = unwrap(name);
    return TypeAnnotation{.name = std::string(tok.lexeme), .span = tok.span, .id = next_id()};
}

auto Parser::parse_param() -> Result<Param, ParseError> {
    auto name = expect(lexer::TokenKind::Identifier, "a parameter name");
    if (is_err(name))
        return unwrap_err(name);

    auto colon = expect(lexer::TokenKind::Colon, "`:` and a type after parameter name");
    if (is_err(colon))
        return unwrap_err(colon);

    auto type = parse_type_annotation();
    if (is_err(type))
        return unwrap_err(type);

    const auto& name_tok = unwrap(name);
    auto span = SourceSpan::merge(name_tok.span, unwrap(type).span);
    return Param{.name = std::string(name_tok.lexeme),
                 .type = std::move(unwrap(type)),
                 .span = span,
                 .id = next_id()};
}

auto Parser::parse_func_decl() -> Result<DeclPtr, ParseError> {
    auto start_span = advance().span; // fn

    auto name = expect(lexer::TokenKind::Identifier, "a function name");
    if (is_err(name))
        return unwrap_err(name);

    auto lparen = expect(lexer::TokenKind::LParen, "`(` after function name");
    if (is_err(lparen))
        return unwrap_err(lparen);

    std::vector<Param> params;
    if (!check(lexer::TokenKind::RParen)) {
        do {
            auto param = parse_param();
            if (is_err(param))
                return unwrap_err(param);
            params.push_back(std::move(unwrap(param)));
        } while (match(lexer::TokenKind::Comma));
    }

    auto rparen = expect(lexer::TokenKind::RParen, "`)` after parameters");
    if (is_err(rparen))
        return unwrap_err(rparen);

    std::optional<TypeAnnotation> return_type;
    if (match(lexer::TokenKind::Arrow)) {
        auto type = parse_type_annotation();
        if (is_err(type))
            return unwrap_err(type);
        return_type = std::move(unwrap(type));
    }

    size_t errors_before = errors_.size();
    auto body = parse_block();
    if (is_err(body))
        return unwrap_err(body);

    const auto& name_tok = unwrap(name);
    auto span = SourceSpan::merge(start_span, unwrap(body).span);
    return make_box<Decl>(Decl{.kind = FuncDecl{.name = std::string(name_tok.lexeme),
                                                .name_span = name_tok.span,
                                                .params = std::move(params),
                                                .return_type = std::move(return_type),
                                                .body = std::move(unwrap(body)),
                                                .id = next_id(),
                                                .body_recovered = errors_.size() > errors_before},
                               .span = span});
}

} // namespace kindred::parser
