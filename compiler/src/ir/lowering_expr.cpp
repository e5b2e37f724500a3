// IR Lowering - Expressions
//
// Each subexpression, literals included, produces a new temporary.

#include "ir/lowering.hpp"

namespace kindred::ir {

namespace {

auto convert_binop(parser::BinaryOp op) -> BinOp {
    switch (op) {
    case parser::BinaryOp::Add:
        return BinOp::Add;
    case parser::BinaryOp::Sub:
        return BinOp::Sub;
    case parser::BinaryOp::Mul:
        return BinOp::Mul;
    case parser::BinaryOp::Div:
        return BinOp::Div;
    case parser::BinaryOp::Mod:
        return BinOp::Mod;
    case parser::BinaryOp::Eq:
        return BinOp::Eq;
    case parser::BinaryOp::Ne:
        return BinOp::Ne;
    case parser::BinaryOp::Lt:
        return BinOp::Lt;
    case parser::BinaryOp::Le:
        return BinOp::Le;
    case parser::BinaryOp::Gt:
        return BinOp::Gt;
    case parser::BinaryOp::Ge:
        return BinOp::Ge;
    case parser::BinaryOp::And:
    case parser::BinaryOp::Or:
        break;
    }
    // Short-circuit operators never reach here.
    return BinOp::Eq;
}

} // namespace

auto IrBuilder::build_expr(const parser::Expr& expr) -> std::optional<Temp> {
    return std::visit(
        [this, &expr](const auto& node) -> std::optional<Temp> {
            using T = std::decay_t<decltype(node)>;

            if constexpr (std::is_same_v<T, parser::LiteralExpr>) {
                return build_literal(node, expr.span);
            } else if constexpr (std::is_same_v<T, parser::IdentExpr>) {
                return build_ident(expr);
            } else if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                return build_unary(node, expr.span);
            } else if constexpr (std::is_same_v<T, parser::BinaryExpr>) {
                return build_binary(node, expr.span);
            } else if constexpr (std::is_same_v<T, parser::CallExpr>) {
                return build_call(node, expr.span);
            }
        },
        expr.kind);
}

auto IrBuilder::build_value(const parser::Expr& expr) -> Temp {
    auto value = build_expr(expr);
    if (value) {
        return *value;
    }
    // A checked program never uses a Unit call as a value; keep the IR
    // well formed regardless.
    return emit(ConstantInst{ConstBool{false}}, IrType::Bool, expr.span);
}

auto IrBuilder::build_literal(const parser::LiteralExpr& lit, const SourceSpan& span) -> Temp {
    switch (lit.kind) {
    case parser::LiteralKind::Int:
        return emit(ConstantInst{ConstInt{std::get<int64_t>(lit.value)}}, IrType::Int, span);
    case parser::LiteralKind::Float:
        return emit(ConstantInst{ConstFloat{std::get<double>(lit.value)}}, IrType::Float, span);
    case parser::LiteralKind::String:
        return emit(ConstantInst{ConstString{std::get<std::string>(lit.value)}}, IrType::Str,
                    span);
    case parser::LiteralKind::Bool:
        return emit(ConstantInst{ConstBool{std::get<bool>(lit.value)}}, IrType::Bool, span);
    }
    return emit(ConstantInst{ConstBool{false}}, IrType::Bool, span);
}

auto IrBuilder::build_ident(const parser::Expr& expr) -> Temp {
    auto symbol = resolution_.binding_of(expr.id);
    auto type = expr_type(expr);
    if (!symbol) {
        return emit(ConstantInst{ConstBool{false}}, IrType::Bool, expr.span);
    }
    return emit(LoadInst{.place = place_of(*symbol), .type = type}, type, expr.span);
}

auto IrBuilder::build_unary(const parser::UnaryExpr& unary, const SourceSpan& span) -> Temp {
    auto operand = build_value(*unary.operand);
    UnaryOp op = unary.op == parser::UnaryOp::Neg ? UnaryOp::Neg : UnaryOp::Not;
    return emit(UnaryInst{.op = op, .operand = operand}, operand.type, span);
}

auto IrBuilder::build_binary(const parser::BinaryExpr& bin, const SourceSpan& span) -> Temp {
    if (bin.op == parser::BinaryOp::And || bin.op == parser::BinaryOp::Or) {
        return build_short_circuit(bin, span);
    }

    auto left = build_value(*bin.left);
    auto right = build_value(*bin.right);
    IrType result = parser::is_comparison(bin.op) ? IrType::Bool : left.type;
    return emit(BinaryInst{.op = convert_binop(bin.op),
                           .left = left,
                           .right = right,
                           .operand_type = left.type},
                result, span);
}

// Short-circuit AND: if left is false, skip right
// Short-circuit OR: if left is true, skip right
//
// On the edge that skips the right operand, the left value already equals
// the result, so the phi takes it directly.
auto IrBuilder::build_short_circuit(const parser::BinaryExpr& bin, const SourceSpan& span)
    -> Temp {
    bool is_and = bin.op == parser::BinaryOp::And;
    auto left = build_value(*bin.left);

    BlockId right_block = create_block(is_and ? "and.rhs" : "or.rhs");
    BlockId merge_block = create_block(is_and ? "and.end" : "or.end");

    BlockId left_block = ctx_.current_block;
    if (is_and) {
        terminate(CondBranchTerm{
            .condition = left, .true_block = right_block, .false_block = merge_block});
    } else {
        terminate(CondBranchTerm{
            .condition = left, .true_block = merge_block, .false_block = right_block});
    }

    switch_to_block(right_block);
    auto right = build_value(*bin.right);
    BlockId right_end_block = ctx_.current_block;
    terminate(BranchTerm{merge_block});

    switch_to_block(merge_block);
    PhiInst phi;
    phi.incoming = {{left, left_block}, {right, right_end_block}};
    return emit(std::move(phi), IrType::Bool, span);
}

auto IrBuilder::build_call(const parser::CallExpr& call, const SourceSpan& span)
    -> std::optional<Temp> {
    std::vector<Temp> args;
    args.reserve(call.args.size());
    for (const auto& arg : call.args) {
        args.push_back(build_value(*arg));
    }

    auto symbol = resolution_.binding_of(call.callee->id);
    if (!symbol) {
        return std::nullopt;
    }
    const auto& callee = resolution_.symbols.get(*symbol);
    auto return_type = to_ir_type(callee.type->as<types::FuncType>().return_type);

    CallInst inst{.callee = callee.name,
                  .is_builtin = callee.role == resolve::StorageRole::Builtin,
                  .args = std::move(args),
                  .return_type = return_type};
    if (return_type == IrType::Unit) {
        emit_void(std::move(inst), span);
        return std::nullopt;
    }
    return emit(std::move(inst), return_type, span);
}

} // namespace kindred::ir
