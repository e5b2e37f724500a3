#include "format/formatter.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace kindred;
using namespace kindred::lexer;
using namespace kindred::parser;
using namespace kindred::format;

class FormatterTest : public ::testing::Test {
protected:
    FormatOptions options_;
    std::vector<std::unique_ptr<Source>> sources_;

    auto parse(const std::string& code) -> Program {
        sources_.push_back(std::make_unique<Source>(Source::from_string(code)));
        Lexer lexer(*sources_.back());
        Parser parser(lexer);
        auto result = parser.parse_program("test");
        EXPECT_TRUE(result.errors.empty()) << "parse failed for:\n" << code;
        return std::move(result.program);
    }

    auto format(const std::string& code) -> std::string {
        auto program = parse(code);
        Formatter formatter(options_);
        return formatter.format(program);
    }

    // Format, re-parse, and compare the trees
    auto round_trip(const std::string& code) -> bool {
        auto original = parse(code);
        Formatter formatter(options_);
        auto formatted = formatter.format(original);
        auto reparsed = parse(formatted);
        return ast_equal(original, reparsed);
    }
};

// ============================================================================
// Layout
// ============================================================================

TEST_F(FormatterTest, FunctionLayout) {
    EXPECT_EQ(format("fn add(a:Int,b:Int)->Int{return a+b;}"),
              "fn add(a: Int, b: Int) -> Int {\n"
              "    return (a + b);\n"
              "}\n");
}

TEST_F(FormatterTest, GlobalsAndBlankLineBetweenDecls) {
    EXPECT_EQ(format("let a = 1; var b: Bool = true;"), "let a = 1;\n"
                                                         "\n"
                                                         "var b: Bool = true;\n");
}

TEST_F(FormatterTest, IfElseChainLayout) {
    EXPECT_EQ(format("fn f(x: Int) { if x > 0 { print_int(1); } else if x < 0 { "
                     "print_int(2); } else { return; } }"),
              "fn f(x: Int) {\n"
              "    if (x > 0) {\n"
              "        print_int(1);\n"
              "    } else if (x < 0) {\n"
              "        print_int(2);\n"
              "    } else {\n"
              "        return;\n"
              "    }\n"
              "}\n");
}

TEST_F(FormatterTest, TabIndentation) {
    options_.use_tabs = true;
    EXPECT_EQ(format("fn main() { while true { } }"), "fn main() {\n"
                                                      "\twhile true {\n"
                                                      "\t}\n"
                                                      "}\n");
}

// ============================================================================
// Literals
// ============================================================================

TEST_F(FormatterTest, FloatLiteralAlwaysHasPoint) {
    EXPECT_EQ(Formatter::float_literal(2.0), "2.0");
    EXPECT_EQ(Formatter::float_literal(0.5), "0.5");
    auto big = Formatter::float_literal(1e300);
    EXPECT_NE(big.find_first_of(".e"), std::string::npos);
}

TEST_F(FormatterTest, StringLiteralEscapes) {
    EXPECT_EQ(Formatter::string_literal("a\"b\\c\n"), "\"a\\\"b\\\\c\\n\"");
    EXPECT_EQ(Formatter::string_literal("tab\there"), "\"tab\\there\"");
}

// ============================================================================
// Round Trips
// ============================================================================

TEST_F(FormatterTest, RoundTripPrecedence) {
    EXPECT_TRUE(round_trip("fn main() { let a = 1 + 2 * 3 - -4 / (5 % 2); }"));
    EXPECT_TRUE(round_trip("fn main() { let b = !true || false && 1 <= 2; }"));
}

TEST_F(FormatterTest, RoundTripLiterals) {
    EXPECT_TRUE(round_trip("let s = \"quote \\\" tab \\t nul \\0 end\";"));
    EXPECT_TRUE(round_trip("let f = 0.1;"));
    EXPECT_TRUE(round_trip("let g = 12345.678e-9;"));
}

TEST_F(FormatterTest, RoundTripControlFlow) {
    EXPECT_TRUE(round_trip("fn fib(n: Int) -> Int {\n"
                           "    if n < 2 { return n; }\n"
                           "    var a = 0;\n"
                           "    var b = 1;\n"
                           "    var i = 1;\n"
                           "    while i < n { let t = a + b; a = b; b = t; i = i + 1; }\n"
                           "    { print_int(b); }\n"
                           "    return b;\n"
                           "}\n"
                           "fn main() -> Int { return fib(10); }\n"));
}

TEST_F(FormatterTest, FormattingIsIdempotent) {
    auto once = format("fn main(){let x=1;if x==1{print_int(x);}else{print_str(\"no\");}}");
    auto twice = format(once);
    EXPECT_EQ(once, twice);
}

TEST_F(FormatterTest, AstEqualDetectsDifferences) {
    auto a = parse("let x = 1 + 2;");
    auto b = parse("let x = 1 - 2;");
    auto c = parse("let x = 1 + 2;");
    EXPECT_FALSE(ast_equal(a, b));
    EXPECT_TRUE(ast_equal(a, c));
}
