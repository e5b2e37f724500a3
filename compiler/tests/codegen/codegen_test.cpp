#include "codegen/ir_codegen.hpp"
#include "ir/lowering.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "resolve/resolver.hpp"
#include "types/checker.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace kindred;
using namespace kindred::codegen;

class CodegenTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;

    auto lower(const std::string& code) -> ir::Module {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code));
        lexer::Lexer lexer(*source_);
        parser::Parser parser(lexer);
        auto parsed = parser.parse_program("test");
        EXPECT_TRUE(parsed.errors.empty());
        auto resolution = resolve::resolve(parsed.program);
        EXPECT_TRUE(resolution.errors.empty());
        auto checked = types::check(parsed.program, resolution);
        EXPECT_TRUE(checked.errors.empty());
        return ir::lower(parsed.program, resolution, checked.types);
    }

    auto generate(const std::string& code) -> std::string {
        IrCodegen gen;
        auto result = gen.generate(lower(code));
        if (is_err(result)) {
            ADD_FAILURE() << "Codegen error: " << unwrap_err(result).message;
            return "";
        }
        return unwrap(result);
    }

    auto generate_error(const std::string& code) -> CodegenError {
        IrCodegen gen;
        auto result = gen.generate(lower(code));
        EXPECT_TRUE(is_err(result));
        if (is_ok(result)) {
            return CodegenError{.kind = CodegenErrorKind::MissingEntryPoint, .message = ""};
        }
        return unwrap_err(result);
    }

    static auto contains(const std::string& ir, const std::string& needle) -> bool {
        return ir.find(needle) != std::string::npos;
    }
};

// ============================================================================
// Entry Point
// ============================================================================

TEST_F(CodegenTest, UnitMainExitsWithZero) {
    std::string ir = generate("fn main() {}");
    EXPECT_TRUE(contains(ir, "define internal void @kin_main() {")) << ir;
    EXPECT_TRUE(contains(ir, "define i32 @main() {")) << ir;
    EXPECT_TRUE(contains(ir, "    call void @kindred.init()\n"
                             "    call void @kin_main()\n"
                             "    ret i32 0\n"))
        << ir;
}

TEST_F(CodegenTest, IntMainBecomesExitStatus) {
    std::string ir = generate("fn main() -> Int { return 3; }");
    EXPECT_TRUE(contains(ir, "define internal i64 @kin_main() {")) << ir;
    EXPECT_TRUE(contains(ir, "%status = call i64 @kin_main()")) << ir;
    EXPECT_TRUE(contains(ir, "%code = trunc i64 %status to i32")) << ir;
    EXPECT_TRUE(contains(ir, "ret i32 %code")) << ir;
}

TEST_F(CodegenTest, InitFunctionPrecedesUserFunctions) {
    std::string ir = generate("fn helper() {}\nfn main() {}");
    auto init = ir.find("define internal void @kindred.init()");
    auto helper = ir.find("define internal void @kin_helper()");
    auto main = ir.find("define internal void @kin_main()");
    ASSERT_NE(init, std::string::npos);
    ASSERT_NE(helper, std::string::npos);
    ASSERT_NE(main, std::string::npos);
    EXPECT_LT(init, helper);
    EXPECT_LT(helper, main);
}

TEST_F(CodegenTest, MissingMain) {
    auto error = generate_error("fn helper() {}");
    EXPECT_EQ(error.kind, CodegenErrorKind::MissingEntryPoint);
    EXPECT_EQ(codegen_error_kind_name(error.kind), "MissingEntryPoint");
}

TEST_F(CodegenTest, MainWithParameters) {
    auto error = generate_error("fn main(x: Int) {}");
    EXPECT_EQ(error.kind, CodegenErrorKind::InvalidEntrySignature);
    EXPECT_NE(error.message.find("parameters"), std::string::npos);
}

TEST_F(CodegenTest, MainReturningFloat) {
    auto error = generate_error("fn main() -> Float { return 1.0; }");
    EXPECT_EQ(error.kind, CodegenErrorKind::InvalidEntrySignature);
    EXPECT_NE(error.message.find("`Float`"), std::string::npos);
}

// ============================================================================
// Storage
// ============================================================================

TEST_F(CodegenTest, SlotsAreAllocatedInEntryBlock) {
    std::string ir = generate("fn add(a: Int, b: Int) -> Int { let s = a + b; return s; }\n"
                              "fn main() {}");
    EXPECT_TRUE(contains(ir, "define internal i64 @kin_add(i64 %t0, i64 %t1) {\n"
                             "entry:\n"
                             "    %a.addr0 = alloca i64\n"
                             "    %b.addr1 = alloca i64\n"
                             "    %s.addr2 = alloca i64\n"
                             "    store i64 %t0, i64* %a.addr0\n"))
        << ir;
    EXPECT_TRUE(contains(ir, "%t4 = add i64 %t2, %t3")) << ir;
}

TEST_F(CodegenTest, GlobalsAreZeroInitializedAndStoredByInit) {
    std::string ir = generate("var count = 7;\nlet ratio = 0.5;\nlet on = true;\nfn main() {}");
    EXPECT_TRUE(contains(ir, "@kin.global.count = internal global i64 0")) << ir;
    EXPECT_TRUE(contains(ir, "@kin.global.ratio = internal global double 0.0")) << ir;
    EXPECT_TRUE(contains(ir, "@kin.global.on = internal global i1 false")) << ir;
    EXPECT_TRUE(contains(ir, "store i64 %t0, i64* @kin.global.count")) << ir;
}

TEST_F(CodegenTest, StringConstantsAreSharedAndNumberedByFirstUse) {
    std::string ir = generate("fn main() {\n"
                              "    print_str(\"hello\");\n"
                              "    print_str(\"bye\\n\");\n"
                              "    print_str(\"hello\");\n"
                              "}");
    EXPECT_TRUE(contains(ir, "@.str.0 = private unnamed_addr constant [6 x i8] c\"hello\\00\""))
        << ir;
    EXPECT_TRUE(contains(ir, "@.str.1 = private unnamed_addr constant [5 x i8] c\"bye\\0A\\00\""))
        << ir;
    EXPECT_FALSE(contains(ir, "@.str.2")) << ir;
}

// ============================================================================
// Instructions
// ============================================================================

TEST_F(CodegenTest, IntegerArithmeticIsSigned) {
    std::string ir = generate("fn f(a: Int, b: Int) -> Bool { return a / b < a % b; }\n"
                              "fn main() {}");
    EXPECT_TRUE(contains(ir, "sdiv i64")) << ir;
    EXPECT_TRUE(contains(ir, "srem i64")) << ir;
    EXPECT_TRUE(contains(ir, "icmp slt i64")) << ir;
}

TEST_F(CodegenTest, FloatComparisons) {
    std::string ir = generate("fn f(a: Float, b: Float) -> Bool { return a != b || a <= b; }\n"
                              "fn main() {}");
    EXPECT_TRUE(contains(ir, "fcmp une double")) << ir;
    EXPECT_TRUE(contains(ir, "fcmp ole double")) << ir;
}

TEST_F(CodegenTest, UnaryOperators) {
    std::string ir = generate("fn f(a: Int, x: Float, c: Bool) {\n"
                              "    print_int(-a);\n"
                              "    print_float(-x);\n"
                              "    print_bool(!c);\n"
                              "}\n"
                              "fn main() {}");
    EXPECT_TRUE(contains(ir, "= sub i64 0, %t")) << ir;
    EXPECT_TRUE(contains(ir, "= fneg double %t")) << ir;
    EXPECT_TRUE(contains(ir, "= xor i1 %t")) << ir;
}

TEST_F(CodegenTest, FloatConstantsUseHexBits) {
    std::string ir = generate("fn main() { print_float(1.5); }");
    EXPECT_TRUE(contains(ir, "fadd double 0x3FF8000000000000, -0.0")) << ir;
}

TEST_F(CodegenTest, ShortCircuitPhi) {
    std::string ir = generate("fn both(a: Bool, b: Bool) -> Bool { return a && b; }\n"
                              "fn main() {}");
    EXPECT_TRUE(contains(ir, "br i1 %t2, label %and.rhs.1, label %and.end.2")) << ir;
    EXPECT_TRUE(contains(ir, "%t4 = phi i1 [ %t2, %entry ], [ %t3, %and.rhs.1 ]")) << ir;
}

TEST_F(CodegenTest, FallthroughOfValueFunctionIsUnreachable) {
    std::string ir = generate("fn pick(c: Bool) -> Int { if c { return 1; } else { return 2; } }\n"
                              "fn main() {}");
    EXPECT_TRUE(contains(ir, "if.end.3:\n    unreachable\n")) << ir;
}

// ============================================================================
// Builtins
// ============================================================================

TEST_F(CodegenTest, OnlyUsedBuiltinsAreDefined) {
    std::string ir = generate("fn main() { print_int(1); }");
    EXPECT_TRUE(contains(ir, "declare i32 @printf(i8*, ...)")) << ir;
    EXPECT_TRUE(contains(ir, "define internal void @kindred.print_int(i64 %value)")) << ir;
    EXPECT_TRUE(contains(ir, "call void @kindred.print_int(i64 %t0)")) << ir;
    EXPECT_FALSE(contains(ir, "@kindred.print_float")) << ir;
    EXPECT_FALSE(contains(ir, "@kindred.print_str")) << ir;
}

TEST_F(CodegenTest, NoBuiltinsNoPrintf) {
    std::string ir = generate("fn main() -> Int { return 0; }");
    EXPECT_FALSE(contains(ir, "@printf")) << ir;
}

TEST_F(CodegenTest, UserFunctionNamedLikeCRuntimeIsPrefixed) {
    std::string ir = generate("fn printf() {}\nfn main() { printf(); }");
    EXPECT_TRUE(contains(ir, "define internal void @kin_printf()")) << ir;
    EXPECT_TRUE(contains(ir, "call void @kin_printf()")) << ir;
}

// ============================================================================
// Output Properties
// ============================================================================

TEST_F(CodegenTest, OutputIsDeterministic) {
    std::string code = "let greeting = \"hi\";\n"
                       "var n = 2;\n"
                       "fn square(x: Int) -> Int { return x * x; }\n"
                       "fn main() -> Int {\n"
                       "    print_str(greeting);\n"
                       "    while n < 100 { n = square(n); }\n"
                       "    print_bool(n > 10 && n < 1000);\n"
                       "    return n % 256;\n"
                       "}";
    EXPECT_EQ(generate(code), generate(code));
}

TEST_F(CodegenTest, GeneratorCanBeReused) {
    IrCodegen gen;
    auto first = gen.generate(lower("fn main() { print_str(\"a\"); }"));
    auto second = gen.generate(lower("fn main() { print_str(\"b\"); }"));
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));
    EXPECT_TRUE(contains(unwrap(second), "c\"b\\00\""));
    EXPECT_FALSE(contains(unwrap(second), "c\"a\\00\""));
}

TEST_F(CodegenTest, CommentsCanBeDisabled) {
    IrCodegen gen(CodegenOptions{.emit_comments = false, .target_triple = "x86_64-pc-linux-gnu"});
    auto result = gen.generate(lower("fn main() {}"));
    ASSERT_TRUE(is_ok(result));
    const auto& ir = unwrap(result);
    EXPECT_TRUE(contains(ir, "target triple = \"x86_64-pc-linux-gnu\"")) << ir;
    EXPECT_FALSE(contains(ir, "; fn main")) << ir;
}

TEST_F(CodegenTest, IdentifierQuoting) {
    EXPECT_EQ(llvm_identifier("kin_main"), "kin_main");
    EXPECT_EQ(llvm_identifier("x.addr0"), "x.addr0");
    EXPECT_EQ(llvm_identifier("9lives"), "\"9lives\"");
    EXPECT_EQ(llvm_identifier("a b"), "\"a b\"");
}
