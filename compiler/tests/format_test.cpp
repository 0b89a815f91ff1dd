#include "format/formatter.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <vector>

using namespace yuho;
using namespace yuho::lexer;
using namespace yuho::parser;
using namespace yuho::format;

class FormatterTest : public ::testing::Test {
protected:
    FormatOptions options_;
    // Every parsed source stays alive for the lifetime of the test
    std::vector<std::unique_ptr<Source>> sources_;

    auto parse(const std::string& code) -> std::optional<Program> {
        sources_.push_back(std::make_unique<Source>(Source::from_string(code)));
        Lexer lexer(*sources_.back());
        auto tokens = lexer.tokenize();
        if (is_err(tokens)) {
            return std::nullopt;
        }
        Parser parser(std::move(unwrap(tokens)));
        auto result = parser.parse_program("test");
        if (is_err(result)) {
            return std::nullopt;
        }
        return std::move(unwrap(result));
    }

    // Parse and format, return formatted string
    auto format(const std::string& code) -> std::string {
        auto program = parse(code);
        if (!program) {
            return "PARSE_ERROR";
        }
        Formatter formatter(options_);
        return formatter.format(*program);
    }

    // Formatting the output again changes nothing, and the reparsed tree
    // has the same structure as the original
    void expect_stable(const std::string& code) {
        auto original = parse(code);
        ASSERT_TRUE(original.has_value()) << "input does not parse:\n" << code;

        Formatter formatter(options_);
        auto once = formatter.format(*original);
        auto reparsed = parse(once);
        ASSERT_TRUE(reparsed.has_value()) << "formatted output does not parse:\n" << once;

        EXPECT_EQ(dump_ast(*original), dump_ast(*reparsed));
        EXPECT_EQ(formatter.format(*reparsed), once);
    }
};

// ============================================================================
// Declarations
// ============================================================================

TEST_F(FormatterTest, VariableDeclaration) {
    EXPECT_EQ(format("int   x:=42 ;"), "int x := 42;\n");
}

TEST_F(FormatterTest, StructDropsTrailingComma) {
    std::string input = "struct Person { string name, int age, }";
    std::string expected = R"(struct Person {
    string name,
    int age
}
)";
    EXPECT_EQ(format(input), expected);
}

TEST_F(FormatterTest, EmptyEnum) {
    EXPECT_EQ(format("enum Nothing { }"), "enum Nothing {}\n");
}

TEST_F(FormatterTest, FunctionWithBody) {
    std::string input = "fn fine(money base):money{money doubled:=base*2;return doubled;}";
    std::string expected = R"(fn fine(money base): money {
    money doubled := base * 2;
    return doubled;
}
)";
    EXPECT_EQ(format(input), expected);
}

TEST_F(FormatterTest, BlankLineBetweenBlocks) {
    std::string input = "int a := 1; int b := 2; enum E { X } int c := 3;";
    std::string expected = R"(int a := 1;
int b := 2;

enum E {
    X
}

int c := 3;
)";
    EXPECT_EQ(format(input), expected);
}

TEST_F(FormatterTest, StatuteWithTitle) {
    std::string input = "statute 415 \"Cheating\" { bool deceived := TRUE; }";
    std::string expected = R"(statute 415 "Cheating" {
    bool deceived := TRUE;
}
)";
    EXPECT_EQ(format(input), expected);
}

TEST_F(FormatterTest, Referencing) {
    EXPECT_EQ(format("export referencing A,B from penal . code"),
              "export referencing A, B from penal.code;\n");
}

TEST_F(FormatterTest, TabIndentation) {
    options_.use_tabs = true;
    EXPECT_EQ(format("scope s { int x := 1; }"), "scope s {\n\tint x := 1;\n}\n");
}

// ============================================================================
// Expressions
// ============================================================================

TEST_F(FormatterTest, RedundantParenthesesRemoved) {
    EXPECT_EQ(format("int x := (a * b) + (c);"), "int x := a * b + c;\n");
}

TEST_F(FormatterTest, RequiredParenthesesKept) {
    EXPECT_EQ(format("int x := (a + b) * c;"), "int x := (a + b) * c;\n");
    EXPECT_EQ(format("int y := a - (b - c);"), "int y := a - (b - c);\n");
    EXPECT_EQ(format("bool z := !(a && b);"), "bool z := !(a && b);\n");
}

TEST_F(FormatterTest, MatchLayout) {
    std::string input = "match { case TRUE := consequence 1; case _ := pass; }";
    std::string expected = R"(match {
    case TRUE := consequence 1;
    case _ := pass;
}
)";
    EXPECT_EQ(format(input), expected);
}

TEST_F(FormatterTest, MatchScrutineeWithStructLiteral) {
    std::string input = "match (P { a := 1 }) { case P { a: 1 } := pass; }";
    std::string expected = R"(match (P { a := 1 }) {
    case P { a: 1 } := pass;
}
)";
    EXPECT_EQ(format(input), expected);
}

// ============================================================================
// Stability
// ============================================================================

TEST_F(FormatterTest, StableOnStatute) {
    expect_stable(R"(
referencing Person from common;

statute 415 "Cheating" {
    struct Cheating {
        Person accused,
        bool deceived,
        money || string gain,
    }

    fn liable(Cheating c) : bool {
        return c.deceived && !(c.gain == $0);
    }

    match c.deceived {
        case TRUE if c.gain > $1,000.00 := consequence "imprisonment";
        case TRUE := consequence "fine";
        case _ := pass;
    }
}
)");
}

TEST_F(FormatterTest, StableOnLiterals) {
    expect_stable(R"(
date filed := 2024-03-01;
duration term := 2 years 6 months;
percent rate := 12.5%;
money cap := SGD1,500.00;
string note := "line\nbreak \"quoted\"";
float ratio := -0.25;
)");
}

TEST_F(FormatterTest, StableOnNestedMatch) {
    expect_stable(R"(
fn grade(int score) : string {
    return match {
        case TRUE if score xor 1 > 0 := consequence match score {
            case 1 := consequence "low";
            case _ := consequence "other";
        };
        case _ := consequence "none";
    };
}
)");
}
