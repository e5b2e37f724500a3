#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "resolve/resolver.hpp"
#include "types/checker.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace kindred;
using namespace kindred::types;

class TypeCheckerTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;
    parser::Program program_;
    resolve::Resolution resolution_;

    auto check(const std::string& code) -> CheckResult {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code));
        lexer::Lexer lexer(*source_);
        parser::Parser parser(lexer);
        auto parsed = parser.parse_program("test");
        EXPECT_TRUE(parsed.errors.empty());
        program_ = std::move(parsed.program);
        resolution_ = resolve::resolve(program_);
        EXPECT_TRUE(resolution_.errors.empty());
        return types::check(program_, resolution_);
    }

    static auto kinds(const CheckResult& result) -> std::vector<TypeErrorKind> {
        std::vector<TypeErrorKind> out;
        for (const auto& error : result.errors) {
            out.push_back(error.kind);
        }
        return out;
    }
};

// ============================================================================
// Well-Typed Programs
// ============================================================================

TEST_F(TypeCheckerTest, ArithmeticAndComparisons) {
    auto result = check("fn main() -> Int {\n"
                        "    let a = 1 + 2 * 3;\n"
                        "    let f = 1.5 / 2.0;\n"
                        "    let b = a < 10 && f >= 0.5 || !(a == 7);\n"
                        "    let e = true != false;\n"
                        "    if b { return a % 4; }\n"
                        "    return -a;\n"
                        "}");
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(TypeCheckerTest, InfersLocalTypes) {
    auto result = check("fn main() { let s = \"hi\"; print_str(s); }");
    ASSERT_TRUE(result.errors.empty());

    const auto& body = program_.decls[0]->as<parser::FuncDecl>().body;
    const auto& var = body.stmts[0]->as<parser::VarDecl>();
    auto symbol = resolution_.declaration_of(var.id);
    ASSERT_TRUE(symbol.has_value());
    EXPECT_TRUE(is_primitive(result.types.type_of_symbol(*symbol), PrimitiveKind::Str));
    EXPECT_TRUE(is_primitive(result.types.type_of_expr(var.init->id), PrimitiveKind::Str));
}

TEST_F(TypeCheckerTest, GlobalForwardReferenceIsInferred) {
    auto result = check("let a = b + 1;\nlet b = 41;\nfn main() -> Int { return a; }");
    EXPECT_TRUE(result.errors.empty());
    auto a = resolution_.globals[0];
    EXPECT_TRUE(is_primitive(result.types.type_of_symbol(a), PrimitiveKind::Int));
}

TEST_F(TypeCheckerTest, BranchesThatAllReturn) {
    auto result = check("fn sign(x: Int) -> Int {\n"
                        "    if x > 0 { return 1; }\n"
                        "    else if x < 0 { return -1; }\n"
                        "    else { return 0; }\n"
                        "}");
    EXPECT_TRUE(result.errors.empty());
}

TEST_F(TypeCheckerTest, UnitFunctionNeedsNoReturn) {
    auto result = check("fn log(x: Int) { print_int(x); }\nfn main() { log(1); return; }");
    EXPECT_TRUE(result.errors.empty());
}

// ============================================================================
// Mismatch
// ============================================================================

TEST_F(TypeCheckerTest, InitializerMismatch) {
    auto result = check("fn main() { var x: Int = true; }");
    ASSERT_EQ(result.errors.size(), 1u);
    const auto& error = result.errors[0];
    EXPECT_EQ(error.kind, TypeErrorKind::Mismatch);
    EXPECT_TRUE(is_primitive(error.expected, PrimitiveKind::Int));
    EXPECT_TRUE(is_primitive(error.found, PrimitiveKind::Bool));
    // The span covers the initializer `true`
    EXPECT_EQ(error.span.start.column, 26u);
    EXPECT_EQ(error.span.start.length, 4u);
}

TEST_F(TypeCheckerTest, NoImplicitNumericConversion) {
    auto result = check("fn main() { let a = 1 + 2.0; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::Mismatch);
    EXPECT_TRUE(is_primitive(result.errors[0].expected, PrimitiveKind::Int));
    EXPECT_TRUE(is_primitive(result.errors[0].found, PrimitiveKind::Float));
}

TEST_F(TypeCheckerTest, ConditionMustBeBool) {
    auto result = check("fn main() { if 1 { } while \"s\" { } }");
    EXPECT_EQ(kinds(result),
              (std::vector<TypeErrorKind>{TypeErrorKind::Mismatch, TypeErrorKind::Mismatch}));
}

TEST_F(TypeCheckerTest, ModuloRequiresInt) {
    auto result = check("fn main() { let a = 1.0 % 2.0; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::Mismatch);
}

TEST_F(TypeCheckerTest, StringsHaveNoOperators) {
    auto result = check("fn main() { let a = \"a\" + \"b\"; let b = \"a\" == \"a\"; }");
    EXPECT_EQ(result.errors.size(), 2u);
}

TEST_F(TypeCheckerTest, ReturnValueMismatch) {
    auto result = check("fn f() -> Int { return 1.0; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::Mismatch);
}

TEST_F(TypeCheckerTest, BareReturnInValueFunction) {
    auto result = check("fn f() -> Int { return; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::Mismatch);
    EXPECT_TRUE(is_primitive(result.errors[0].found, PrimitiveKind::Unit));
}

TEST_F(TypeCheckerTest, ArgumentMismatch) {
    auto result = check("fn main() { print_int(\"nope\"); }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::Mismatch);
    EXPECT_TRUE(is_primitive(result.errors[0].expected, PrimitiveKind::Int));
}

// ============================================================================
// Calls
// ============================================================================

TEST_F(TypeCheckerTest, ArityMismatch) {
    auto result = check("fn add(a: Int, b: Int) -> Int { return a + b; }\n"
                        "fn main() { let x = add(1); }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::ArityMismatch);
    EXPECT_NE(result.errors[0].message.find("expected 2 arguments, found 1"), std::string::npos);
}

TEST_F(TypeCheckerTest, CallingAVariable) {
    auto result = check("fn main() { let f = 1; f(2); }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::NotCallable);
}

TEST_F(TypeCheckerTest, CallingAType) {
    auto result = check("fn main() { Int(2); }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::NotCallable);
}

TEST_F(TypeCheckerTest, UnitCallHasNoValue) {
    auto result = check("fn main() { let x = print_int(1); }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::NotAValue);
}

// ============================================================================
// Values and Assignment
// ============================================================================

TEST_F(TypeCheckerTest, AssignToLet) {
    auto result = check("fn main() { let x = 1; x = 2; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::ImmutableAssignment);
}

TEST_F(TypeCheckerTest, AssignToParameter) {
    auto result = check("fn f(p: Int) { p = 2; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::ImmutableAssignment);
    EXPECT_NE(result.errors[0].message.find("parameter"), std::string::npos);
}

TEST_F(TypeCheckerTest, AssignToFunction) {
    auto result = check("fn g() {}\nfn main() { g = 1; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::ImmutableAssignment);
}

TEST_F(TypeCheckerTest, AssignToVarWithWrongType) {
    auto result = check("var total = 0;\nfn main() { total = total + 1; total = 1.5; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::Mismatch);
}

TEST_F(TypeCheckerTest, FunctionUsedAsValue) {
    auto result = check("fn g() {}\nfn main() { let h = g; }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::NotAValue);
}

TEST_F(TypeCheckerTest, UnitTypedVariable) {
    auto result = check("fn main() { let u: Unit = 1; }");
    EXPECT_EQ(kinds(result),
              (std::vector<TypeErrorKind>{TypeErrorKind::Mismatch, TypeErrorKind::NotAValue}));
}

TEST_F(TypeCheckerTest, UnitTypedParameter) {
    auto result = check("fn f(u: Unit) {}");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::NotAValue);
}

TEST_F(TypeCheckerTest, CyclicGlobalInitializers) {
    auto result = check("let a = b;\nlet b = a;");
    ASSERT_GE(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::NotAValue);
}

// ============================================================================
// Return Analysis
// ============================================================================

TEST_F(TypeCheckerTest, MissingReturn) {
    auto result = check("fn f(x: Int) -> Int { if x > 0 { return 1; } }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::MissingReturn);
}

TEST_F(TypeCheckerTest, ReturnInsideLoopIsNotEnough) {
    auto result = check("fn f() -> Int { while true { return 1; } }");
    ASSERT_EQ(result.errors.size(), 1u);
    EXPECT_EQ(result.errors[0].kind, TypeErrorKind::MissingReturn);
}

TEST_F(TypeCheckerTest, ReturnInNestedBlockCounts) {
    auto result = check("fn f() -> Int { { return 1; } }");
    EXPECT_TRUE(result.errors.empty());
}

// ============================================================================
// Accumulation
// ============================================================================

TEST_F(TypeCheckerTest, ReportsEveryError) {
    auto result = check("fn main() {\n"
                        "    let a: Int = 1.0;\n"
                        "    let b: Bool = 2;\n"
                        "    print_str(3);\n"
                        "}");
    EXPECT_EQ(result.errors.size(), 3u);
    EXPECT_EQ(result.errors[0].span.start.line, 2u);
    EXPECT_EQ(result.errors[2].span.start.line, 4u);
}

TEST_F(TypeCheckerTest, NoCascadeFromUnknown) {
    auto result = check("fn main() { let x = 1 + true; let y = x * 2; let z = y - 1; }");
    EXPECT_EQ(result.errors.size(), 1u);
}

TEST_F(TypeCheckerTest, ErrorKindNames) {
    EXPECT_EQ(type_error_kind_name(TypeErrorKind::Mismatch), "Mismatch");
    EXPECT_EQ(type_error_kind_name(TypeErrorKind::MissingReturn), "MissingReturn");
}
