#include "lexer/lexer.hpp"
#include "lexer/source.hpp"
#include "parser/parser.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace yuho;
using namespace yuho::parser;

class ParserTest : public ::testing::Test {
protected:
    std::unique_ptr<lexer::Source> source_;

    auto tokens_for(const std::string& code) -> std::vector<lexer::Token> {
        source_ = std::make_unique<lexer::Source>(lexer::Source::from_string(code));
        lexer::Lexer lex(*source_);
        auto tokens = lex.tokenize();
        EXPECT_TRUE(is_ok(tokens)) << "unexpected lex error in: " << code;
        if (is_err(tokens)) {
            return {};
        }
        return std::move(unwrap(tokens));
    }

    auto parse(const std::string& code) -> Program {
        Parser parser(tokens_for(code));
        auto result = parser.parse_program("test");
        if (is_err(result)) {
            for (const auto& error : unwrap_err(result)) {
                ADD_FAILURE() << error.code << ": " << error.message;
            }
            return Program{};
        }
        return std::move(unwrap(result));
    }

    auto parse_errors(const std::string& code) -> std::vector<ParseError> {
        Parser parser(tokens_for(code));
        auto result = parser.parse_program("test");
        EXPECT_TRUE(is_err(result)) << "expected parse errors in: " << code;
        if (is_ok(result)) {
            return {};
        }
        return unwrap_err(result);
    }

    auto expr_dump(const std::string& code) -> std::string {
        Parser parser(tokens_for(code));
        auto result = parser.parse_expr();
        EXPECT_TRUE(is_ok(result)) << "failed to parse expression: " << code;
        if (is_err(result)) {
            return "";
        }
        return dump_expr(*unwrap(result));
    }
};

// ============================================================================
// Variables
// ============================================================================

TEST_F(ParserTest, VariableDeclaration) {
    auto program = parse("int x := 42;");
    ASSERT_EQ(program.items.size(), 1u);
    ASSERT_TRUE(program.items[0]->is<VarDecl>());

    const auto& var = program.items[0]->as<VarDecl>();
    EXPECT_EQ(var.name, "x");
    ASSERT_TRUE(var.type->is<PrimitiveType>());
    EXPECT_EQ(var.type->as<PrimitiveType>().kind, PrimitiveKind::Int);
    ASSERT_TRUE(var.init.has_value());
    ASSERT_TRUE((*var.init)->is<LiteralExpr>());
    EXPECT_EQ((*var.init)->as<LiteralExpr>().token.int_value(), 42);

    EXPECT_EQ(var.name_span.start.column, 5u);
    EXPECT_EQ(var.span.start.column, 1u);
    EXPECT_EQ(var.span.end.column, 12u);
}

TEST_F(ParserTest, DeclarationWithoutInitializer) {
    auto program = parse("money fine;");
    ASSERT_EQ(program.items.size(), 1u);
    const auto& var = program.items[0]->as<VarDecl>();
    EXPECT_EQ(var.name, "fine");
    EXPECT_FALSE(var.init.has_value());
}

TEST_F(ParserTest, UnionTypedDeclaration) {
    auto program = parse("int || string code := 7;");
    ASSERT_EQ(program.items.size(), 1u);
    const auto& var = program.items[0]->as<VarDecl>();
    ASSERT_TRUE(var.type->is<UnionType>());
    EXPECT_EQ(var.type->as<UnionType>().members.size(), 2u);
}

TEST_F(ParserTest, NamedTypeDeclaration) {
    auto program = parse("Person p := Person { name := \"Tan\", age := 30 };");
    ASSERT_EQ(program.items.size(), 1u);
    const auto& var = program.items[0]->as<VarDecl>();
    ASSERT_TRUE(var.type->is<NamedType>());
    EXPECT_EQ(var.type->as<NamedType>().name, "Person");

    ASSERT_TRUE(var.init.has_value());
    ASSERT_TRUE((*var.init)->is<StructExpr>());
    const auto& literal = (*var.init)->as<StructExpr>();
    EXPECT_EQ(literal.name, "Person");
    ASSERT_EQ(literal.fields.size(), 2u);
    EXPECT_EQ(literal.fields[0].name, "name");
    EXPECT_EQ(literal.fields[1].name, "age");
}

// ============================================================================
// Structs and Enums
// ============================================================================

TEST_F(ParserTest, StructDeclaration) {
    auto program = parse(R"(
struct Offence {
    string name,
    int severity,
    bool || string status,
}
)");
    ASSERT_EQ(program.items.size(), 1u);
    ASSERT_TRUE(program.items[0]->is<StructDecl>());

    const auto& decl = program.items[0]->as<StructDecl>();
    EXPECT_EQ(decl.name, "Offence");
    ASSERT_EQ(decl.fields.size(), 3u);
    EXPECT_EQ(decl.fields[0].name, "name");
    EXPECT_EQ(decl.fields[1].name, "severity");
    EXPECT_TRUE(decl.fields[2].type->is<UnionType>());
}

TEST_F(ParserTest, EnumDeclaration) {
    auto program = parse("enum Verdict { Guilty, NotGuilty, Acquitted }");
    ASSERT_EQ(program.items.size(), 1u);
    const auto& decl = program.items[0]->as<EnumDecl>();
    EXPECT_EQ(decl.name, "Verdict");
    ASSERT_EQ(decl.variants.size(), 3u);
    EXPECT_EQ(decl.variants[2].name, "Acquitted");
}

// ============================================================================
// Functions
// ============================================================================

TEST_F(ParserTest, FunctionDeclaration) {
    auto program = parse(R"(
fn penalty(int severity, money base) : money {
    money extra := base * 2;
    return extra;
}
)");
    ASSERT_EQ(program.items.size(), 1u);
    ASSERT_TRUE(program.items[0]->is<FuncDecl>());

    const auto& func = program.items[0]->as<FuncDecl>();
    EXPECT_EQ(func.name, "penalty");
    ASSERT_EQ(func.params.size(), 2u);
    EXPECT_EQ(func.params[0].name, "severity");
    EXPECT_EQ(func.params[1].name, "base");
    ASSERT_TRUE(func.return_type.has_value());
    EXPECT_EQ((*func.return_type)->as<PrimitiveType>().kind, PrimitiveKind::Money);

    ASSERT_EQ(func.body.size(), 2u);
    EXPECT_TRUE(func.body[0]->is<VarDecl>());
    ASSERT_TRUE(func.body[1]->is<ReturnStmt>());
    EXPECT_TRUE(func.body[1]->as<ReturnStmt>().value.has_value());
}

TEST_F(ParserTest, FunctionWithoutReturnType) {
    auto program = parse("fn noop() { pass; }");
    const auto& func = program.items[0]->as<FuncDecl>();
    EXPECT_TRUE(func.params.empty());
    EXPECT_FALSE(func.return_type.has_value());
    ASSERT_EQ(func.body.size(), 1u);
    EXPECT_TRUE(func.body[0]->is<PassStmt>());
}

// ============================================================================
// Match
// ============================================================================

TEST_F(ParserTest, MatchWithoutScrutinee) {
    auto program = parse(R"(
match {
    case TRUE := consequence 1;
    case _ := consequence 0;
}
)");
    ASSERT_EQ(program.items.size(), 1u);
    ASSERT_TRUE(program.items[0]->is<ExprDecl>());

    const auto& expr = *program.items[0]->as<ExprDecl>().expr;
    ASSERT_TRUE(expr.is<MatchExpr>());
    const auto& m = expr.as<MatchExpr>();
    EXPECT_FALSE(m.scrutinee.has_value());
    ASSERT_EQ(m.arms.size(), 2u);

    ASSERT_TRUE(m.arms[0].pattern->is<LiteralPattern>());
    EXPECT_TRUE(m.arms[0].pattern->as<LiteralPattern>().literal.bool_value());
    ASSERT_TRUE(m.arms[0].consequence.has_value());
    EXPECT_EQ((*m.arms[0].consequence)->as<LiteralExpr>().token.int_value(), 1);

    EXPECT_TRUE(m.arms[1].pattern->is<WildcardPattern>());
    ASSERT_TRUE(m.arms[1].consequence.has_value());
    EXPECT_EQ((*m.arms[1].consequence)->as<LiteralExpr>().token.int_value(), 0);
}

TEST_F(ParserTest, MatchArmForms) {
    auto program = parse(R"(
match verdict {
    case Verdict.Guilty if severity > 3 := consequence "prison";
    case Offence { severity: 1, name } := pass;
    case -1 := consequence "invalid";
    case other := pass;
}
)");
    const auto& m = program.items[0]->as<ExprDecl>().expr->as<MatchExpr>();
    ASSERT_TRUE(m.scrutinee.has_value());
    EXPECT_EQ((*m.scrutinee)->as<IdentExpr>().name, "verdict");
    ASSERT_EQ(m.arms.size(), 4u);

    const auto& qualified = m.arms[0].pattern->as<QualifiedPattern>();
    EXPECT_EQ(qualified.type_name, "Verdict");
    EXPECT_EQ(qualified.variant, "Guilty");
    EXPECT_TRUE(m.arms[0].guard.has_value());

    const auto& destructure = m.arms[1].pattern->as<StructPattern>();
    EXPECT_EQ(destructure.name, "Offence");
    ASSERT_EQ(destructure.fields.size(), 2u);
    EXPECT_TRUE(destructure.fields[0].pattern.has_value());
    EXPECT_FALSE(destructure.fields[1].pattern.has_value());
    EXPECT_FALSE(m.arms[1].consequence.has_value());

    EXPECT_TRUE(m.arms[2].pattern->as<LiteralPattern>().negated);
    EXPECT_EQ(m.arms[3].pattern->as<IdentPattern>().name, "other");
}

TEST_F(ParserTest, StatementMatchEndsAtBrace) {
    auto program = parse(R"(
match { case _ := pass; }
-x;
)");
    ASSERT_EQ(program.items.size(), 2u);
    EXPECT_TRUE(program.items[0]->as<ExprDecl>().expr->is<MatchExpr>());
    EXPECT_TRUE(program.items[1]->as<ExprDecl>().expr->is<UnaryExpr>());
}

// ============================================================================
// Scopes and Imports
// ============================================================================

TEST_F(ParserTest, ScopeAndStatuteBlocks) {
    auto program = parse(R"(
scope cheating {
    struct Deception { bool dishonest }
}
statute 415 "Cheating" {
    int max_years := 10;
}
)");
    ASSERT_EQ(program.items.size(), 2u);

    const auto& scope = program.items[0]->as<ScopeDecl>();
    EXPECT_EQ(scope.kind, ScopeKind::Scope);
    EXPECT_EQ(scope.name, "cheating");
    ASSERT_EQ(scope.items.size(), 1u);
    EXPECT_TRUE(scope.items[0]->is<StructDecl>());

    const auto& statute = program.items[1]->as<ScopeDecl>();
    EXPECT_EQ(statute.kind, ScopeKind::Statute);
    EXPECT_EQ(statute.name, "415");
    EXPECT_EQ(statute.name_token, lexer::TokenKind::IntLiteral);
    ASSERT_TRUE(statute.title.has_value());
    EXPECT_EQ(*statute.title, "Cheating");
}

TEST_F(ParserTest, ReferencingDeclaration) {
    auto program = parse("referencing Offence, Verdict from penal.code;\n"
                         "export referencing Person from common;");
    ASSERT_EQ(program.items.size(), 2u);

    const auto& import = program.items[0]->as<ReferencingDecl>();
    ASSERT_EQ(import.names.size(), 2u);
    EXPECT_EQ(import.names[0].name, "Offence");
    EXPECT_EQ(import.names[1].name, "Verdict");
    EXPECT_EQ(import.module_name(), "penal.code");
    EXPECT_FALSE(import.is_export);

    const auto& reexport = program.items[1]->as<ReferencingDecl>();
    EXPECT_TRUE(reexport.is_export);
    EXPECT_EQ(reexport.module_name(), "common");
}

TEST_F(ParserTest, ReferencingInsideScopeIsRejected) {
    auto errors = parse_errors("scope s { referencing A from b; }");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, "P001");
}

// ============================================================================
// Expressions
// ============================================================================

TEST_F(ParserTest, ArithmeticPrecedence) {
    EXPECT_EQ(expr_dump("a + b * c"), "(+ a (* b c))");
    EXPECT_EQ(expr_dump("(a + b) * c"), "(* (+ a b) c)");
    EXPECT_EQ(expr_dump("a - b - c"), "(- (- a b) c)");
}

TEST_F(ParserTest, LogicalPrecedence) {
    EXPECT_EQ(expr_dump("a || b && c"), "(|| a (&& b c))");
    EXPECT_EQ(expr_dump("a xor b || c"), "(|| (xor a b) c)");
    EXPECT_EQ(expr_dump("age >= 18 && !exempt"), "(&& (>= age (lit INTEGER 18)) (! exempt))");
}

TEST_F(ParserTest, PostfixExpressions) {
    EXPECT_EQ(expr_dump("person.age"), "(. person age)");
    EXPECT_EQ(expr_dump("fine(1, x)"), "(call fine (lit INTEGER 1) x)");
}

// ============================================================================
// Errors and Recovery
// ============================================================================

TEST_F(ParserTest, MissingSemicolon) {
    auto errors = parse_errors("int x := 42\nint y := 1;");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, "P002");
    EXPECT_EQ(errors[0].expected, "';'");
    EXPECT_EQ(errors[0].span.start.line, 1u);
    EXPECT_EQ(errors[0].span.start.column, 12u);
}

TEST_F(ParserTest, MissingExpression) {
    auto errors = parse_errors("int x := ;");
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors[0].code, "P004");
    EXPECT_EQ(errors[0].found, "';'");
}

TEST_F(ParserTest, MissingType) {
    auto errors = parse_errors("struct S { 42 x }");
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors[0].code, "P005");
}

TEST_F(ParserTest, UnclosedBlockReportsEndOfInput) {
    auto errors = parse_errors("enum Verdict { Guilty");
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors.back().code, "P003");
    EXPECT_EQ(errors.back().found, "end of input");
}

TEST_F(ParserTest, RecoveringKeepsLaterItems) {
    Parser parser(tokens_for(R"(
int x := ;
struct Person { string name }
int y := 2;
)"));
    auto outcome = parser.parse_program_recovering("test");

    ASSERT_EQ(outcome.errors.size(), 1u);
    EXPECT_EQ(outcome.errors[0].code, "P004");
    ASSERT_EQ(outcome.program.items.size(), 2u);
    EXPECT_TRUE(outcome.program.items[0]->is<StructDecl>());
    EXPECT_EQ(outcome.program.items[1]->as<VarDecl>().name, "y");
}

TEST_F(ParserTest, RecoveryInsideMatchKeepsArms) {
    Parser parser(tokens_for(R"(
match {
    case := consequence 1;
    case _ := consequence 0;
}
)"));
    auto outcome = parser.parse_program_recovering("test");

    ASSERT_FALSE(outcome.errors.empty());
    EXPECT_EQ(outcome.errors[0].code, "P006");
    ASSERT_EQ(outcome.program.items.size(), 1u);
    const auto& m = outcome.program.items[0]->as<ExprDecl>().expr->as<MatchExpr>();
    ASSERT_EQ(m.arms.size(), 1u);
    EXPECT_TRUE(m.arms[0].pattern->is<WildcardPattern>());
}

TEST_F(ParserTest, ErrorConvertsToDiagnostic) {
    auto errors = parse_errors("int x := 42");
    ASSERT_EQ(errors.size(), 1u);

    auto diag = errors[0].to_diagnostic();
    EXPECT_EQ(diag.severity, DiagnosticSeverity::Error);
    EXPECT_EQ(diag.code, "P002");
    ASSERT_EQ(diag.labels.size(), 1u);
    EXPECT_EQ(diag.labels[0].message, "expected ';'");
    EXPECT_TRUE(diag.labels[0].is_primary);
}

// ============================================================================
// Nesting Limit
// ============================================================================

TEST_F(ParserTest, DeeplyNestedParenthesesAreAnError) {
    const size_t levels = 20000;
    auto code = "int x := " + std::string(levels, '(') + "1" + std::string(levels, ')') +
                ";\nint y := 2;";
    Parser parser(tokens_for(code));
    auto outcome = parser.parse_program_recovering("test");

    ASSERT_EQ(outcome.errors.size(), 1u);
    EXPECT_EQ(outcome.errors[0].code, "P007");
    EXPECT_EQ(outcome.errors[0].found, "'('");
    EXPECT_EQ(outcome.errors[0].span.start.column, 9u + Parser::MAX_NESTING_DEPTH + 1);
    ASSERT_EQ(outcome.program.items.size(), 1u);
    EXPECT_EQ(outcome.program.items[0]->as<VarDecl>().name, "y");
}

TEST_F(ParserTest, DeeplyNestedPrefixOperatorsAreAnError) {
    auto errors = parse_errors("int x := " + std::string(20000, '-') + "1;");
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].code, "P007");
    EXPECT_EQ(errors[0].to_diagnostic().notes.size(), 1u);
}

TEST_F(ParserTest, DeeplyNestedStructPatternIsAnError) {
    std::string code;
    for (int i = 0; i < 300; ++i) {
        code += "A { f: ";
    }
    code += "_";
    for (int i = 0; i < 300; ++i) {
        code += " }";
    }
    Parser parser(tokens_for(code));
    auto result = parser.parse_pattern();
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result).code, "P007");
}

TEST_F(ParserTest, NestingWithinLimitParses) {
    const size_t levels = 200;
    auto program =
        parse("int x := " + std::string(levels, '(') + "1" + std::string(levels, ')') + ";");
    ASSERT_EQ(program.items.size(), 1u);

    // The limit is per parse, not cumulative
    auto again = parse("int a := ((1));\nint b := ((2));");
    EXPECT_EQ(again.items.size(), 2u);
}
