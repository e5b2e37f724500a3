// Type checker expressions - literals, identifiers, operators and calls
// Handles: check_expr, check_against, check_binary, check_unary, check_call

#include "types/checker.hpp"

namespace kindred::types {

auto TypeChecker::check_expr(const parser::Expr& expr) -> TypePtr {
    return std::visit(
        [this, &expr](const auto& node) -> TypePtr {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, parser::LiteralExpr>) {
                return record(expr, check_literal(node));
            } else if constexpr (std::is_same_v<T, parser::IdentExpr>) {
                return record(expr, check_ident(expr));
            } else if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                return record(expr, check_unary(node));
            } else if constexpr (std::is_same_v<T, parser::BinaryExpr>) {
                return record(expr, check_binary(node));
            } else if constexpr (std::is_same_v<T, parser::CallExpr>) {
                return record(expr, check_call(node, expr.span));
            }
        },
        expr.kind);
}

auto TypeChecker::check_against(const parser::Expr& expr, const TypePtr& expected) -> TypePtr {
    auto found = check_expr(expr);
    if (!is_unknown(found) && !is_unknown(expected) && !types_equal(expected, found)) {
        mismatch(expected, found, expr.span);
    }
    return found;
}

auto TypeChecker::check_literal(const parser::LiteralExpr& lit) -> TypePtr {
    switch (lit.kind) {
    case parser::LiteralKind::Int:
        return make_int();
    case parser::LiteralKind::Float:
        return make_float();
    case parser::LiteralKind::String:
        return make_str();
    case parser::LiteralKind::Bool:
        return make_bool();
    }
    return make_unknown();
}

auto TypeChecker::check_ident(const parser::Expr& expr) -> TypePtr {
    auto binding = resolution_.binding_of(expr.id);
    if (!binding) {
        return make_unknown();
    }

    const auto& symbol = resolution_.symbols.get(*binding);
    if (symbol.kind != resolve::SymbolKind::Variable) {
        error(TypeErrorKind::NotAValue,
              std::string(resolve::symbol_kind_to_string(symbol.kind)) + " `" + symbol.name +
                  "` cannot be used as a value",
              expr.span);
        return make_unknown();
    }
    return symbol_type(*binding, expr.span);
}

auto TypeChecker::check_unary(const parser::UnaryExpr& unary) -> TypePtr {
    auto operand = check_expr(*unary.operand);
    if (is_unknown(operand)) {
        return make_unknown();
    }

    switch (unary.op) {
    case parser::UnaryOp::Neg:
        if (!is_numeric(operand)) {
            mismatch(make_int(), operand, unary.operand->span);
            return make_unknown();
        }
        return operand;
    case parser::UnaryOp::Not:
        if (!is_primitive(operand, PrimitiveKind::Bool)) {
            mismatch(make_bool(), operand, unary.operand->span);
        }
        return make_bool();
    }
    return make_unknown();
}

auto TypeChecker::check_binary(const parser::BinaryExpr& binary) -> TypePtr {
    auto left = check_expr(*binary.left);
    auto right = check_expr(*binary.right);

    if (parser::is_logical(binary.op)) {
        if (!is_unknown(left) && !is_primitive(left, PrimitiveKind::Bool)) {
            mismatch(make_bool(), left, binary.left->span);
        }
        if (!is_unknown(right) && !is_primitive(right, PrimitiveKind::Bool)) {
            mismatch(make_bool(), right, binary.right->span);
        }
        return make_bool();
    }

    bool comparison = parser::is_comparison(binary.op);
    auto result_for = [&](const TypePtr& operand) -> TypePtr {
        return comparison ? make_bool() : operand;
    };

    if (is_unknown(left) || is_unknown(right)) {
        return comparison ? make_bool() : make_unknown();
    }

    bool equality = binary.op == parser::BinaryOp::Eq || binary.op == parser::BinaryOp::Ne;
    bool left_ok = false;
    if (binary.op == parser::BinaryOp::Mod) {
        left_ok = is_primitive(left, PrimitiveKind::Int);
    } else if (equality) {
        left_ok = is_numeric(left) || is_primitive(left, PrimitiveKind::Bool);
    } else {
        left_ok = is_numeric(left);
    }

    if (!left_ok) {
        mismatch(make_int(), left, binary.left->span);
        return comparison ? make_bool() : make_unknown();
    }
    if (!types_equal(left, right)) {
        mismatch(left, right, binary.right->span);
        return comparison ? make_bool() : make_unknown();
    }
    return result_for(left);
}

auto TypeChecker::check_call(const parser::CallExpr& call, const SourceSpan& span) -> TypePtr {
    const auto& callee = *call.callee;
    TypePtr callee_type;

    if (callee.is<parser::IdentExpr>()) {
        auto binding = resolution_.binding_of(callee.id);
        if (!binding) {
            callee_type = make_unknown();
        } else {
            const auto& symbol = resolution_.symbols.get(*binding);
            if (symbol.kind == resolve::SymbolKind::Function) {
                callee_type = symbol.type;
            } else if (symbol.kind == resolve::SymbolKind::Variable) {
                callee_type = symbol_type(*binding, callee.span);
            } else {
                error(TypeErrorKind::NotCallable, "type `" + symbol.name + "` is not callable",
                      callee.span);
                callee_type = make_unknown();
                record(callee, callee_type);
                for (const auto& arg : call.args) {
                    check_expr(*arg);
                }
                return make_unknown();
            }
        }
        record(callee, callee_type);
    } else {
        callee_type = check_expr(callee);
    }

    if (is_unknown(callee_type) || !callee_type->is<FuncType>()) {
        if (!is_unknown(callee_type)) {
            error(TypeErrorKind::NotCallable,
                  "expression of type `" + type_to_string(callee_type) + "` is not callable",
                  callee.span);
        }
        for (const auto& arg : call.args) {
            check_expr(*arg);
        }
        return make_unknown();
    }

    const auto& func = callee_type->as<FuncType>();
    if (func.params.size() != call.args.size()) {
        error(TypeErrorKind::ArityMismatch,
              "expected " + std::to_string(func.params.size()) + " argument" +
                  (func.params.size() == 1 ? "" : "s") + ", found " +
                  std::to_string(call.args.size()),
              span);
        for (const auto& arg : call.args) {
            check_expr(*arg);
        }
        return func.return_type;
    }

    for (size_t i = 0; i < call.args.size(); ++i) {
        check_against(*call.args[i], func.params[i]);
    }
    return func.return_type;
}

} // namespace kindred::types
