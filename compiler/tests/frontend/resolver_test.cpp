#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "resolve/resolver.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace kindred;
using namespace kindred::resolve;

class ResolverTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;
    parser::Program program_;

    auto resolve(const std::string& code) -> Resolution {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code));
        lexer::Lexer lexer(*source_);
        parser::Parser parser(lexer);
        auto parsed = parser.parse_program("test");
        EXPECT_TRUE(parsed.errors.empty());
        program_ = std::move(parsed.program);
        return resolve::resolve(program_);
    }

    static auto count_kind(const Resolution& resolution, NameErrorKind kind) -> size_t {
        size_t n = 0;
        for (const auto& error : resolution.errors) {
            if (error.kind == kind) {
                ++n;
            }
        }
        return n;
    }
};

// ============================================================================
// Successful Resolution
// ============================================================================

TEST_F(ResolverTest, ForwardReferenceToLaterFunction) {
    auto resolution = resolve("fn main() -> Int { return helper(); }\n"
                              "fn helper() -> Int { return 1; }");
    EXPECT_TRUE(resolution.errors.empty());
    ASSERT_EQ(resolution.functions.size(), 2u);
}

TEST_F(ResolverTest, MutualRecursion) {
    auto resolution = resolve("fn even(n: Int) -> Bool { if n == 0 { return true; } "
                              "return odd(n - 1); }\n"
                              "fn odd(n: Int) -> Bool { if n == 0 { return false; } "
                              "return even(n - 1); }");
    EXPECT_TRUE(resolution.errors.empty());
}

TEST_F(ResolverTest, GlobalsUsableFromFunctionsDeclaredEarlier) {
    auto resolution = resolve("fn main() -> Int { return limit; }\nlet limit = 3;");
    EXPECT_TRUE(resolution.errors.empty());
    ASSERT_EQ(resolution.globals.size(), 1u);

    const auto& symbol = resolution.symbols.get(resolution.globals[0]);
    EXPECT_EQ(symbol.name, "limit");
    EXPECT_EQ(symbol.role, StorageRole::Global);
}

TEST_F(ResolverTest, IdentifierBindsToInnermostDeclaration) {
    auto resolution = resolve("let x = 1;\n"
                              "fn main() { let x = 2; { let x = true; print_bool(x); } }");
    EXPECT_TRUE(resolution.errors.empty());

    // The `x` passed to print_bool is the innermost, block-local one.
    const auto& body = program_.decls[1]->as<parser::FuncDecl>().body;
    const auto& inner = body.stmts[1]->as<parser::BlockStmt>();
    const auto& call = inner.stmts[1]->as<parser::ExprStmt>().expr->as<parser::CallExpr>();
    auto bound = resolution.binding_of(call.args[0]->id);
    ASSERT_TRUE(bound.has_value());

    auto declared = resolution.declaration_of(inner.stmts[0]->as<parser::VarDecl>().id);
    ASSERT_TRUE(declared.has_value());
    EXPECT_EQ(*bound, *declared);
    EXPECT_EQ(resolution.symbols.get(*bound).role, StorageRole::Local);
}

TEST_F(ResolverTest, ParametersAreBound) {
    auto resolution = resolve("fn id(v: Float) -> Float { return v; }");
    EXPECT_TRUE(resolution.errors.empty());

    const auto& func = program_.decls[0]->as<parser::FuncDecl>();
    auto param = resolution.declaration_of(func.params[0].id);
    ASSERT_TRUE(param.has_value());
    const auto& symbol = resolution.symbols.get(*param);
    EXPECT_EQ(symbol.role, StorageRole::Param);
    EXPECT_FALSE(symbol.is_mutable);
    EXPECT_TRUE(types::is_primitive(symbol.type, types::PrimitiveKind::Float));
}

TEST_F(ResolverTest, BuiltinsArePredeclared) {
    auto resolution = resolve("fn main() { print_int(1); print_float(1.0); print_bool(true); "
                              "print_str(\"s\"); }");
    EXPECT_TRUE(resolution.errors.empty());
    EXPECT_EQ(builtin_functions().size(), 4u);
}

TEST_F(ResolverTest, FunctionSignatureTypes) {
    auto resolution = resolve("fn f(a: Int, b: Bool) -> Str { return \"x\"; }");
    ASSERT_TRUE(resolution.errors.empty());
    const auto& symbol = resolution.symbols.get(resolution.functions[0]);
    ASSERT_TRUE(symbol.type->is<types::FuncType>());
    EXPECT_EQ(types::type_to_string(symbol.type), "fn(Int, Bool) -> Str");
}

// ============================================================================
// Name Errors
// ============================================================================

TEST_F(ResolverTest, UndefinedName) {
    auto resolution = resolve("fn main() { print_int(missing); }");
    ASSERT_EQ(resolution.errors.size(), 1u);
    EXPECT_EQ(resolution.errors[0].kind, NameErrorKind::Undefined);
    EXPECT_EQ(resolution.errors[0].name, "missing");
    EXPECT_EQ(resolution.errors[0].span.start.column, 23u);
}

TEST_F(ResolverTest, UsedBeforeDeclarationInBlock) {
    auto resolution = resolve("fn main() { print_int(y); let y = 1; }");
    ASSERT_EQ(resolution.errors.size(), 1u);
    EXPECT_EQ(resolution.errors[0].kind, NameErrorKind::UsedBeforeDeclaration);
    EXPECT_EQ(resolution.errors[0].name, "y");
}

TEST_F(ResolverTest, SelfReferentialInitializer) {
    auto resolution = resolve("fn main() { let z = z + 1; }");
    ASSERT_EQ(resolution.errors.size(), 1u);
    EXPECT_EQ(resolution.errors[0].kind, NameErrorKind::UsedBeforeDeclaration);
}

TEST_F(ResolverTest, LaterLocalShadowsOuterNameForWholeBlock) {
    auto resolution = resolve("let a = 1;\nfn main() { print_int(a); let a = 2; }");
    EXPECT_EQ(count_kind(resolution, NameErrorKind::UsedBeforeDeclaration), 1u);
}

TEST_F(ResolverTest, DuplicateDeclarations) {
    auto resolution = resolve("fn f() {}\nfn f() {}\nfn main() { let a = 1; let a = 2; }");
    EXPECT_EQ(count_kind(resolution, NameErrorKind::DuplicateDeclaration), 2u);
}

TEST_F(ResolverTest, DuplicateParameter) {
    auto resolution = resolve("fn f(a: Int, a: Int) {}");
    ASSERT_EQ(resolution.errors.size(), 1u);
    EXPECT_EQ(resolution.errors[0].kind, NameErrorKind::DuplicateDeclaration);
}

TEST_F(ResolverTest, ShadowingBuiltinAtTopLevel) {
    auto resolution = resolve("fn print_int(v: Int) {}\nlet Int = 3;");
    ASSERT_EQ(resolution.errors.size(), 2u);
    EXPECT_EQ(resolution.errors[0].kind, NameErrorKind::DuplicateDeclaration);
    EXPECT_NE(resolution.errors[0].message.find("builtin"), std::string::npos);
    EXPECT_EQ(resolution.errors[1].kind, NameErrorKind::DuplicateDeclaration);
}

TEST_F(ResolverTest, NotAType) {
    auto resolution = resolve("let count = 1;\nfn f(a: count) {}");
    ASSERT_EQ(resolution.errors.size(), 1u);
    EXPECT_EQ(resolution.errors[0].kind, NameErrorKind::NotAType);
    EXPECT_EQ(resolution.errors[0].name, "count");
}

TEST_F(ResolverTest, UnknownTypeName) {
    auto resolution = resolve("fn f() -> Integer { return 1; }");
    ASSERT_EQ(resolution.errors.size(), 1u);
    EXPECT_EQ(resolution.errors[0].kind, NameErrorKind::Undefined);
    EXPECT_EQ(resolution.errors[0].name, "Integer");
}

TEST_F(ResolverTest, ErrorsAccumulate) {
    auto resolution = resolve("fn main() { print_int(a); print_int(b); let c: Nope = 1; }");
    EXPECT_EQ(resolution.errors.size(), 3u);
}

TEST_F(ResolverTest, ErrorKindNames) {
    EXPECT_EQ(name_error_kind_name(NameErrorKind::UsedBeforeDeclaration),
              "UsedBeforeDeclaration");
    EXPECT_EQ(name_error_kind_name(NameErrorKind::NotAType), "NotAType");
}
