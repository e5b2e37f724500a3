//! # AST Utilities
//!
//! Operator spelling and structural equality. Every comparison visits the
//! full variant list, so a new node kind fails to compile here until it is
//! handled.

#include "parser/ast.hpp"

namespace kindred::parser {

auto unary_op_to_string(UnaryOp op) -> std::string_view {
    switch (op) {
    case UnaryOp::Neg:
        return "-";
    case UnaryOp::Not:
        return "!";
    }
    return "?";
}

auto binary_op_to_string(BinaryOp op) -> std::string_view {
    switch (op) {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::Mod:
        return "%";
    case BinaryOp::Eq:
        return "==";
    case BinaryOp::Ne:
        return "!=";
    case BinaryOp::Lt:
        return "<";
    case BinaryOp::Le:
        return "<=";
    case BinaryOp::Gt:
        return ">";
    case BinaryOp::Ge:
        return ">=";
    case BinaryOp::And:
        return "&&";
    case BinaryOp::Or:
        return "||";
    }
    return "?";
}

// ============================================================================
// Structural Equality
// ============================================================================

namespace {

auto annotation_equal(const std::optional<TypeAnnotation>& a,
                      const std::optional<TypeAnnotation>& b) -> bool {
    if (a.has_value() != b.has_value())
        return false;
    return !a || a->name == b->name;
}

auto block_equal(const BlockStmt& a, const BlockStmt& b) -> bool {
    if (a.stmts.size() != b.stmts.size())
        return false;
    for (size_t i = 0; i < a.stmts.size(); ++i) {
        if (!ast_equal(*a.stmts[i], *b.stmts[i]))
            return false;
    }
    return true;
}

auto var_decl_equal(const VarDecl& a, const VarDecl& b) -> bool {
    return a.is_mutable == b.is_mutable && a.name == b.name && annotation_equal(a.type, b.type) &&
           ast_equal(*a.init, *b.init);
}

auto func_decl_equal(const FuncDecl& a, const FuncDecl& b) -> bool {
    if (a.name != b.name || a.params.size() != b.params.size())
        return false;
    for (size_t i = 0; i < a.params.size(); ++i) {
        if (a.params[i].name != b.params[i].name ||
            a.params[i].type.name != b.params[i].type.name) {
            return false;
        }
    }
    return annotation_equal(a.return_type, b.return_type) && block_equal(a.body, b.body);
}

} // anonymous namespace

auto ast_equal(const Expr& a, const Expr& b) -> bool {
    if (a.kind.index() != b.kind.index())
        return false;

    return std::visit(
        [&b](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = std::get<T>(b.kind);

            if constexpr (std::is_same_v<T, LiteralExpr>) {
                return lhs.kind == rhs.kind && lhs.value == rhs.value;
            } else if constexpr (std::is_same_v<T, IdentExpr>) {
                return lhs.name == rhs.name;
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                return lhs.op == rhs.op && ast_equal(*lhs.operand, *rhs.operand);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                return lhs.op == rhs.op && ast_equal(*lhs.left, *rhs.left) &&
                       ast_equal(*lhs.right, *rhs.right);
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                if (lhs.args.size() != rhs.args.size() || !ast_equal(*lhs.callee, *rhs.callee))
                    return false;
                for (size_t i = 0; i < lhs.args.size(); ++i) {
                    if (!ast_equal(*lhs.args[i], *rhs.args[i]))
                        return false;
                }
                return true;
            }
        },
        a.kind);
}

auto ast_equal(const Stmt& a, const Stmt& b) -> bool {
    if (a.kind.index() != b.kind.index())
        return false;

    return std::visit(
        [&b](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = std::get<T>(b.kind);

            if constexpr (std::is_same_v<T, VarDecl>) {
                return var_decl_equal(lhs, rhs);
            } else if constexpr (std::is_same_v<T, AssignStmt>) {
                return ast_equal(*lhs.target, *rhs.target) && ast_equal(*lhs.value, *rhs.value);
            } else if constexpr (std::is_same_v<T, IfStmt>) {
                if (!ast_equal(*lhs.condition, *rhs.condition) ||
                    !block_equal(lhs.then_block, rhs.then_block) ||
                    lhs.else_branch.has_value() != rhs.else_branch.has_value()) {
                    return false;
                }
                return !lhs.else_branch || ast_equal(**lhs.else_branch, **rhs.else_branch);
            } else if constexpr (std::is_same_v<T, WhileStmt>) {
                return ast_equal(*lhs.condition, *rhs.condition) && block_equal(lhs.body, rhs.body);
            } else if constexpr (std::is_same_v<T, ReturnStmt>) {
                if (lhs.value.has_value() != rhs.value.has_value())
                    return false;
                return !lhs.value || ast_equal(**lhs.value, **rhs.value);
            } else if constexpr (std::is_same_v<T, BlockStmt>) {
                return block_equal(lhs, rhs);
            } else if constexpr (std::is_same_v<T, ExprStmt>) {
                return ast_equal(*lhs.expr, *rhs.expr);
            }
        },
        a.kind);
}

auto ast_equal(const Decl& a, const Decl& b) -> bool {
    if (a.is<FuncDecl>() && b.is<FuncDecl>()) {
        return func_decl_equal(a.as<FuncDecl>(), b.as<FuncDecl>());
    }
    if (a.is<VarDecl>() && b.is<VarDecl>()) {
        return var_decl_equal(a.as<VarDecl>(), b.as<VarDecl>());
    }
    return false;
}

auto ast_equal(const Program& a, const Program& b) -> bool {
    if (a.decls.size() != b.decls.size())
        return false;
    for (size_t i = 0; i < a.decls.size(); ++i) {
        if (!ast_equal(*a.decls[i], *b.decls[i]))
            return false;
    }
    return true;
}

} // namespace kindred::parser
