#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace kindred;
using namespace kindred::lexer;
using namespace kindred::parser;

class ParserTest : public ::testing::Test {
protected:
    std::unique_ptr<Source> source_;
    std::unique_ptr<Lexer> lexer_;

    auto make_parser(const std::string& code) -> Parser {
        source_ = std::make_unique<Source>(Source::from_string(code));
        lexer_ = std::make_unique<Lexer>(*source_);
        return Parser(*lexer_);
    }

    auto parse(const std::string& code) -> ParseResult {
        auto parser = make_parser(code);
        return parser.parse_program("test");
    }

    auto parse_stmt(const std::string& code) -> StmtPtr {
        auto parser = make_parser(code);
        auto result = parser.parse_stmt();
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
        return is_ok(result) ? std::move(unwrap(result)) : nullptr;
    }

    auto parse_expr(const std::string& code) -> ExprPtr {
        auto parser = make_parser(code);
        auto result = parser.parse_expr();
        EXPECT_TRUE(is_ok(result)) << (is_err(result) ? unwrap_err(result).message : "");
        return is_ok(result) ? std::move(unwrap(result)) : nullptr;
    }

    static auto int_value(const Expr& expr) -> int64_t {
        return std::get<int64_t>(expr.as<LiteralExpr>().value);
    }
};

// ============================================================================
// Statements
// ============================================================================

TEST_F(ParserTest, AssignmentOfSum) {
    auto stmt = parse_stmt("x = 1 + 2;");
    ASSERT_NE(stmt, nullptr);
    ASSERT_TRUE(stmt->is<AssignStmt>());

    const auto& assign = stmt->as<AssignStmt>();
    ASSERT_TRUE(assign.target->is<IdentExpr>());
    EXPECT_EQ(assign.target->as<IdentExpr>().name, "x");

    ASSERT_TRUE(assign.value->is<BinaryExpr>());
    const auto& sum = assign.value->as<BinaryExpr>();
    EXPECT_EQ(sum.op, BinaryOp::Add);
    EXPECT_EQ(int_value(*sum.left), 1);
    EXPECT_EQ(int_value(*sum.right), 2);
}

TEST_F(ParserTest, LetAndVarDeclarations) {
    auto let_stmt = parse_stmt("let a: Int = 5;");
    ASSERT_NE(let_stmt, nullptr);
    ASSERT_TRUE(let_stmt->is<VarDecl>());
    const auto& let_decl = let_stmt->as<VarDecl>();
    EXPECT_FALSE(let_decl.is_mutable);
    EXPECT_EQ(let_decl.name, "a");
    ASSERT_TRUE(let_decl.type.has_value());
    EXPECT_EQ(let_decl.type->name, "Int");

    auto var_stmt = parse_stmt("var b = 2.5;");
    ASSERT_NE(var_stmt, nullptr);
    const auto& var_decl = var_stmt->as<VarDecl>();
    EXPECT_TRUE(var_decl.is_mutable);
    EXPECT_FALSE(var_decl.type.has_value());
    EXPECT_TRUE(var_decl.init->is<LiteralExpr>());
}

TEST_F(ParserTest, IfElseChain) {
    auto stmt = parse_stmt("if a { x = 1; } else if b { x = 2; } else { x = 3; }");
    ASSERT_NE(stmt, nullptr);
    ASSERT_TRUE(stmt->is<IfStmt>());

    const auto& outer = stmt->as<IfStmt>();
    EXPECT_EQ(outer.then_block.stmts.size(), 1u);
    ASSERT_TRUE(outer.else_branch.has_value());
    ASSERT_TRUE((*outer.else_branch)->is<IfStmt>());

    const auto& inner = (*outer.else_branch)->as<IfStmt>();
    ASSERT_TRUE(inner.else_branch.has_value());
    EXPECT_TRUE((*inner.else_branch)->is<BlockStmt>());
}

TEST_F(ParserTest, WhileLoop) {
    auto stmt = parse_stmt("while i < 10 { i = i + 1; }");
    ASSERT_NE(stmt, nullptr);
    ASSERT_TRUE(stmt->is<WhileStmt>());
    const auto& loop = stmt->as<WhileStmt>();
    ASSERT_TRUE(loop.condition->is<BinaryExpr>());
    EXPECT_EQ(loop.condition->as<BinaryExpr>().op, BinaryOp::Lt);
    EXPECT_EQ(loop.body.stmts.size(), 1u);
}

TEST_F(ParserTest, ReturnWithAndWithoutValue) {
    auto with_value = parse_stmt("return 42;");
    ASSERT_NE(with_value, nullptr);
    ASSERT_TRUE(with_value->as<ReturnStmt>().value.has_value());

    auto bare = parse_stmt("return;");
    ASSERT_NE(bare, nullptr);
    EXPECT_FALSE(bare->as<ReturnStmt>().value.has_value());
}

TEST_F(ParserTest, CallStatement) {
    auto stmt = parse_stmt("print_int(1, 2);");
    ASSERT_NE(stmt, nullptr);
    ASSERT_TRUE(stmt->is<ExprStmt>());
    const auto& call = stmt->as<ExprStmt>().expr->as<CallExpr>();
    EXPECT_EQ(call.callee->as<IdentExpr>().name, "print_int");
    EXPECT_EQ(call.args.size(), 2u);
}

// ============================================================================
// Expressions
// ============================================================================

TEST_F(ParserTest, MultiplicationBindsTighterThanAddition) {
    auto expr = parse_expr("1 + 2 * 3");
    ASSERT_NE(expr, nullptr);
    const auto& add = expr->as<BinaryExpr>();
    EXPECT_EQ(add.op, BinaryOp::Add);
    EXPECT_EQ(int_value(*add.left), 1);
    EXPECT_EQ(add.right->as<BinaryExpr>().op, BinaryOp::Mul);
}

TEST_F(ParserTest, SubtractionIsLeftAssociative) {
    auto expr = parse_expr("10 - 4 - 3");
    ASSERT_NE(expr, nullptr);
    const auto& outer = expr->as<BinaryExpr>();
    EXPECT_EQ(outer.op, BinaryOp::Sub);
    ASSERT_TRUE(outer.left->is<BinaryExpr>());
    EXPECT_EQ(int_value(*outer.right), 3);
}

TEST_F(ParserTest, LogicalPrecedence) {
    auto expr = parse_expr("a || b && c == d");
    ASSERT_NE(expr, nullptr);
    const auto& or_expr = expr->as<BinaryExpr>();
    EXPECT_EQ(or_expr.op, BinaryOp::Or);
    const auto& and_expr = or_expr.right->as<BinaryExpr>();
    EXPECT_EQ(and_expr.op, BinaryOp::And);
    EXPECT_EQ(and_expr.right->as<BinaryExpr>().op, BinaryOp::Eq);
}

TEST_F(ParserTest, ParenthesesOverridePrecedence) {
    auto expr = parse_expr("(1 + 2) * 3");
    ASSERT_NE(expr, nullptr);
    const auto& mul = expr->as<BinaryExpr>();
    EXPECT_EQ(mul.op, BinaryOp::Mul);
    EXPECT_EQ(mul.left->as<BinaryExpr>().op, BinaryOp::Add);
}

TEST_F(ParserTest, NestedUnary) {
    auto expr = parse_expr("!-x");
    ASSERT_NE(expr, nullptr);
    const auto& not_expr = expr->as<UnaryExpr>();
    EXPECT_EQ(not_expr.op, UnaryOp::Not);
    EXPECT_EQ(not_expr.operand->as<UnaryExpr>().op, UnaryOp::Neg);
}

TEST_F(ParserTest, NodeIdsAreUnique) {
    auto result = parse("fn f(a: Int) -> Int { return a + 1; }\nlet g = f(2);");
    ASSERT_TRUE(result.errors.empty());
    const auto& func = result.program.decls[0]->as<FuncDecl>();
    const auto& global = result.program.decls[1]->as<VarDecl>();
    EXPECT_NE(func.id, global.id);
    EXPECT_NE(func.params[0].id, func.id);
    EXPECT_NE(global.init->id, global.id);
    EXPECT_GT(result.program.next_node_id, global.id);
}

// ============================================================================
// Programs
// ============================================================================

TEST_F(ParserTest, FunctionDeclaration) {
    auto result = parse("fn add(a: Int, b: Int) -> Int {\n    return a + b;\n}\n");
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.program.decls.size(), 1u);

    const auto& func = result.program.decls[0]->as<FuncDecl>();
    EXPECT_EQ(func.name, "add");
    ASSERT_EQ(func.params.size(), 2u);
    EXPECT_EQ(func.params[1].name, "b");
    EXPECT_EQ(func.params[1].type.name, "Int");
    ASSERT_TRUE(func.return_type.has_value());
    EXPECT_EQ(func.return_type->name, "Int");
    EXPECT_EQ(func.body.stmts.size(), 1u);
}

TEST_F(ParserTest, FunctionWithoutReturnType) {
    auto result = parse("fn main() { print_int(1); }");
    ASSERT_TRUE(result.errors.empty());
    const auto& func = result.program.decls[0]->as<FuncDecl>();
    EXPECT_TRUE(func.params.empty());
    EXPECT_FALSE(func.return_type.has_value());
}

TEST_F(ParserTest, GlobalsAndFunctionsInOrder) {
    auto result = parse("let limit = 10;\nfn main() {}\nvar count: Int = 0;");
    ASSERT_TRUE(result.errors.empty());
    ASSERT_EQ(result.program.decls.size(), 3u);
    EXPECT_TRUE(result.program.decls[0]->is<VarDecl>());
    EXPECT_TRUE(result.program.decls[1]->is<FuncDecl>());
    EXPECT_TRUE(result.program.decls[2]->as<VarDecl>().is_mutable);
    EXPECT_EQ(result.program.name, "test");
}

// ============================================================================
// Errors and Recovery
// ============================================================================

TEST_F(ParserTest, MissingSemicolon) {
    auto result = parse("fn main() { let x = 1 }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].message.find("`;`"), std::string::npos);
}

TEST_F(ParserTest, RecoversAndReportsEveryStatementError) {
    auto result = parse("fn main() {\n"
                        "    let = 1;\n"
                        "    let y = 2;\n"
                        "    x = ;\n"
                        "    print_int(y);\n"
                        "}\n");
    EXPECT_EQ(result.errors.size(), 2u);
    ASSERT_EQ(result.program.decls.size(), 1u);

    // The valid statements survive recovery.
    const auto& body = result.program.decls[0]->as<FuncDecl>().body;
    EXPECT_EQ(body.stmts.size(), 2u);
    EXPECT_EQ(result.errors[0].span.start.line, 2u);
    EXPECT_EQ(result.errors[1].span.start.line, 4u);
}

TEST_F(ParserTest, RecoversAtNextTopLevelDeclaration) {
    auto result = parse("fn broken( { }\nfn ok() {}\nlet z = 3;");
    EXPECT_GE(result.errors.size(), 1u);
    bool found_ok = false;
    for (const auto& decl : result.program.decls) {
        if (decl->is<FuncDecl>() && decl->as<FuncDecl>().name == "ok") {
            found_ok = true;
        }
    }
    EXPECT_TRUE(found_ok);
    EXPECT_TRUE(result.program.decls.back()->is<VarDecl>());
}

TEST_F(ParserTest, ForLoopIsRejected) {
    auto result = parse("fn main() {\n    for i in xs { print_int(i); }\n    let a = 1;\n}");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].message.find("`for`"), std::string::npos);
    const auto& body = result.program.decls[0]->as<FuncDecl>().body;
    ASSERT_EQ(body.stmts.size(), 1u);
    EXPECT_TRUE(body.stmts[0]->is<VarDecl>());
}

TEST_F(ParserTest, NestedFunctionIsRejected) {
    auto result = parse("fn main() { fn inner() {} }");
    EXPECT_GE(result.errors.size(), 1u);
}

TEST_F(ParserTest, StrayTopLevelTokens) {
    auto result = parse("42;\nfn main() {}");
    ASSERT_GE(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].message.find("top level"), std::string::npos);
    ASSERT_EQ(result.program.decls.size(), 1u);
    EXPECT_EQ(result.program.decls[0]->as<FuncDecl>().name, "main");
}

TEST_F(ParserTest, MissingInitializer) {
    auto result = parse("let x: Int;");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].message.find("initializer"), std::string::npos);
}

TEST_F(ParserTest, LexErrorTokensAreSkipped) {
    auto result = parse("fn main() { let a = 1 @ ; }");
    EXPECT_TRUE(result.errors.empty());
    EXPECT_EQ(lexer_->errors().size(), 1u);
}

TEST_F(ParserTest, UnclosedBlockAtEndOfFile) {
    auto result = parse("fn main() {\n    let a = 1;\n");
    ASSERT_GE(result.errors.size(), 1u);
    EXPECT_NE(result.errors.back().message.find("end of file"), std::string::npos);
}

TEST_F(ParserTest, RecoveryMarksFunctionBody) {
    auto result = parse("fn broken() -> Int { return 1 }\nfn fine() -> Int { return 2; }");
    ASSERT_EQ(result.errors.size(), 1u);
    ASSERT_EQ(result.program.decls.size(), 2u);
    EXPECT_TRUE(result.program.decls[0]->as<FuncDecl>().body_recovered);
    EXPECT_FALSE(result.program.decls[1]->as<FuncDecl>().body_recovered);
}

// ============================================================================
// Nesting Limits
// ============================================================================

namespace {

auto sum_of_ones(size_t terms) -> std::string {
    std::string expr = "1";
    for (size_t i = 1; i < terms; ++i) {
        expr += " + 1";
    }
    return expr;
}

auto parenthesized(size_t depth) -> std::string {
    return std::string(depth, '(') + "1" + std::string(depth, ')');
}

} // namespace

TEST_F(ParserTest, LongOperatorChainAtLimitParses) {
    auto expr = parse_expr(sum_of_ones(MAX_NESTING_DEPTH));
    ASSERT_NE(expr, nullptr);
    EXPECT_TRUE(expr->is<BinaryExpr>());
}

TEST_F(ParserTest, LongOperatorChainIsRejected) {
    auto result = parse("fn main() -> Int {\n    let x = " + sum_of_ones(20000) +
                        ";\n    let y = 2;\n    return 0;\n}");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].message.find("levels deep"), std::string::npos);
    EXPECT_EQ(result.errors[0].span.start.line, 2u);

    const auto& body = result.program.decls[0]->as<FuncDecl>().body;
    ASSERT_EQ(body.stmts.size(), 2u);
    EXPECT_EQ(body.stmts[0]->as<VarDecl>().name, "y");
}

TEST_F(ParserTest, DeepParenthesesAreRejected) {
    auto result = parse("fn main() { let x = " + parenthesized(5000) + "; let y = 2; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].message.find("levels deep"), std::string::npos);
    EXPECT_EQ(result.program.decls[0]->as<FuncDecl>().body.stmts.size(), 1u);
}

TEST_F(ParserTest, ModerateParenthesesParse) {
    auto expr = parse_expr(parenthesized(500));
    ASSERT_NE(expr, nullptr);
    EXPECT_EQ(int_value(*expr), 1);
}

TEST_F(ParserTest, DeepUnaryChainIsRejected) {
    auto result = parse("fn main() { let x = " + std::string(5000, '!') + "true; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].message.find("levels deep"), std::string::npos);
}

TEST_F(ParserTest, DeepBlocksAreRejected) {
    auto result = parse("fn main() " + std::string(5000, '{') + std::string(5000, '}') +
                        "\nfn after() {}");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_NE(result.errors[0].message.find("blocks are nested"), std::string::npos);
    ASSERT_EQ(result.program.decls.size(), 2u);
    EXPECT_EQ(result.program.decls[1]->as<FuncDecl>().name, "after");
}
