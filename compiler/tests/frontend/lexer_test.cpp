#include "lexer/lexer.hpp"
#include "lexer/source.hpp"

#include <gtest/gtest.h>
#include <memory>

using namespace yuho;
using namespace yuho::lexer;

class LexerTest : public ::testing::Test {
protected:
    // Keep source alive so Token.lexeme (string_view) remains valid
    std::unique_ptr<Source> source_;

    auto lex(const std::string& code) -> std::vector<Token> {
        source_ = std::make_unique<Source>(Source::from_string(code));
        Lexer lexer(*source_);
        auto result = lexer.tokenize();
        EXPECT_TRUE(is_ok(result)) << "unexpected lex error in: " << code;
        if (is_err(result)) {
            return {};
        }
        return std::move(unwrap(result));
    }

    auto lex_one(const std::string& code) -> Token {
        auto tokens = lex(code);
        EXPECT_GE(tokens.size(), 2u);
        return tokens.empty() ? Token{.kind = TokenKind::Eof, .span = {}, .lexeme = {}, .value = {}}
                              : tokens[0];
    }

    auto lex_error(const std::string& code) -> LexError {
        source_ = std::make_unique<Source>(Source::from_string(code));
        Lexer lexer(*source_);
        auto result = lexer.tokenize();
        EXPECT_TRUE(is_err(result)) << "expected a lex error in: " << code;
        if (is_ok(result)) {
            return LexError{};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Basic Declarations
// ============================================================================

TEST_F(LexerTest, VariableDeclarationCategories) {
    auto tokens = lex("int x := 42;");
    ASSERT_EQ(tokens.size(), 6u);

    std::vector<std::string_view> categories;
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
        categories.push_back(token_category_to_string(tokens[i].category()));
    }
    EXPECT_EQ(categories, (std::vector<std::string_view>{"TYPE", "IDENTIFIER", "OPERATOR",
                                                         "INTEGER", "PUNCTUATION"}));

    EXPECT_EQ(tokens[0].kind, TokenKind::KwInt);
    EXPECT_EQ(tokens[1].lexeme, "x");
    EXPECT_EQ(tokens[2].kind, TokenKind::Assign);
    EXPECT_EQ(tokens[3].int_value(), 42);
    EXPECT_EQ(tokens[4].kind, TokenKind::Semi);
    EXPECT_TRUE(tokens[5].is_eof());
}

TEST_F(LexerTest, SpansAreOneBased) {
    auto tokens = lex("int x\n  := 42;");
    EXPECT_EQ(tokens[1].span.start.line, 1u);
    EXPECT_EQ(tokens[1].span.start.column, 5u);
    EXPECT_EQ(tokens[2].span.start.line, 2u);
    EXPECT_EQ(tokens[2].span.start.column, 3u);
    EXPECT_EQ(tokens[2].span.end.length, 2u);
}

TEST_F(LexerTest, KeywordsAndAliases) {
    EXPECT_EQ(lex_one("struct").kind, TokenKind::KwStruct);
    EXPECT_EQ(lex_one("fn").kind, TokenKind::KwFn);
    EXPECT_EQ(lex_one("func").kind, TokenKind::KwFn);
    EXPECT_EQ(lex_one("referencing").kind, TokenKind::KwReferencing);
    EXPECT_EQ(lex_one("consequence").kind, TokenKind::KwConsequence);
    EXPECT_EQ(lex_one("xor").kind, TokenKind::KwXor);
    EXPECT_EQ(lex_one("boolean").kind, TokenKind::KwBool);
    EXPECT_EQ(lex_one("_").kind, TokenKind::Underscore);
    EXPECT_EQ(lex_one("_fine").kind, TokenKind::Identifier);
}

TEST_F(LexerTest, BooleanLiterals) {
    auto t = lex_one("TRUE");
    EXPECT_EQ(t.kind, TokenKind::BoolLiteral);
    EXPECT_TRUE(t.bool_value());
    EXPECT_FALSE(lex_one("false").bool_value());
}

TEST_F(LexerTest, CommentsAreDiscarded) {
    auto tokens = lex("int /* a /* nested */ comment */ x // trailing\n;");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::KwInt);
    EXPECT_EQ(tokens[1].kind, TokenKind::Identifier);
    EXPECT_EQ(tokens[2].kind, TokenKind::Semi);
}

TEST_F(LexerTest, KeepCommentsOption) {
    source_ = std::make_unique<Source>(Source::from_string("x // note"));
    Lexer lexer(*source_, LexerOptions{.keep_comments = true});
    auto tokens = lexer.tokenize_all();
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].kind, TokenKind::Comment);
    EXPECT_EQ(tokens[1].lexeme, "// note");
}

TEST_F(LexerTest, LazyStreamIsRestartable) {
    source_ = std::make_unique<Source>(Source::from_string("a b"));
    Lexer lexer(*source_);
    EXPECT_EQ(lexer.next_token().lexeme, "a");
    EXPECT_EQ(lexer.next_token().lexeme, "b");
    EXPECT_TRUE(lexer.next_token().is_eof());
    EXPECT_TRUE(lexer.next_token().is_eof());
    lexer.reset();
    EXPECT_EQ(lexer.next_token().lexeme, "a");
}

// ============================================================================
// Operators
// ============================================================================

TEST_F(LexerTest, Operators) {
    auto tokens = lex(":= == != <= >= && || ! % . :");
    std::vector<TokenKind> kinds;
    for (const auto& t : tokens) {
        kinds.push_back(t.kind);
    }
    EXPECT_EQ(kinds, (std::vector<TokenKind>{TokenKind::Assign, TokenKind::Eq, TokenKind::Ne,
                                             TokenKind::Le, TokenKind::Ge, TokenKind::AndAnd,
                                             TokenKind::OrOr, TokenKind::Bang, TokenKind::Percent,
                                             TokenKind::Dot, TokenKind::Colon, TokenKind::Eof}));
}

TEST_F(LexerTest, RemainderIsNotPercentage) {
    auto tokens = lex("10%3");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::IntLiteral);
    EXPECT_EQ(tokens[1].kind, TokenKind::Percent);
    EXPECT_EQ(tokens[2].kind, TokenKind::IntLiteral);
}

// ============================================================================
// Legal-Domain Literals
// ============================================================================

TEST_F(LexerTest, MoneyIsOneToken) {
    for (const std::string text : {"$1.00", "$12.50", "$999.99", "$1,000.00", "$12,345,678.90"}) {
        auto tokens = lex(text);
        ASSERT_EQ(tokens.size(), 2u) << text;
        EXPECT_EQ(tokens[0].kind, TokenKind::MoneyLiteral) << text;
        EXPECT_EQ(tokens[0].lexeme, text);
    }
}

TEST_F(LexerTest, MoneyValue) {
    auto t = lex_one("$1,000.50");
    EXPECT_EQ(t.money_value().minor_units, 100050);
    EXPECT_EQ(t.money_value().currency, "$");

    auto sgd = lex_one("SGD500");
    EXPECT_EQ(sgd.kind, TokenKind::MoneyLiteral);
    EXPECT_EQ(sgd.money_value().currency, "SGD");
    EXPECT_EQ(sgd.money_value().minor_units, 50000);
}

TEST_F(LexerTest, CurrencyCodeWithoutDigitsIsIdentifier) {
    auto t = lex_one("SGD");
    EXPECT_EQ(t.kind, TokenKind::Identifier);
}

TEST_F(LexerTest, PercentLiteral) {
    auto t = lex_one("15%");
    EXPECT_EQ(t.kind, TokenKind::PercentLiteral);
    EXPECT_DOUBLE_EQ(t.percent_value(), 15.0);
    EXPECT_DOUBLE_EQ(lex_one("2.5%").percent_value(), 2.5);
}

TEST_F(LexerTest, IsoDateLiteral) {
    auto tokens = lex("2024-02-29");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::DateLiteral);
    EXPECT_EQ(tokens[0].date_value(), (DateValue{.year = 2024, .month = 2, .day = 29}));
}

TEST_F(LexerTest, DurationIsGreedy) {
    auto tokens = lex("3 years, 2 months 5 days;");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::DurationLiteral);
    const auto& d = tokens[0].duration_value();
    EXPECT_EQ(d.years, 3);
    EXPECT_EQ(d.months, 2);
    EXPECT_EQ(d.days, 5);
    EXPECT_EQ(tokens[1].kind, TokenKind::Semi);
}

TEST_F(LexerTest, DurationStopsAtIncompleteGroup) {
    auto tokens = lex("1 year, 2");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].kind, TokenKind::DurationLiteral);
    EXPECT_EQ(tokens[0].lexeme, "1 year");
    EXPECT_EQ(tokens[1].kind, TokenKind::Comma);
    EXPECT_EQ(tokens[2].kind, TokenKind::IntLiteral);
}

TEST_F(LexerTest, FloatLiteral) {
    auto t = lex_one("3.75");
    EXPECT_EQ(t.kind, TokenKind::FloatLiteral);
    EXPECT_DOUBLE_EQ(t.float_value(), 3.75);
}

// ============================================================================
// Strings
// ============================================================================

TEST_F(LexerTest, StringEscapes) {
    auto t = lex_one(R"("a\tb\n\"q\" \\ \x41 é \u{1F600} \0")");
    EXPECT_EQ(t.kind, TokenKind::StringLiteral);
    EXPECT_EQ(t.string_value(), std::string("a\tb\n\"q\" \\ A \xC3\xA9 \xF0\x9F\x98\x80 ") +
                                    std::string(1, '\0'));
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(LexerTest, UnterminatedStringReportsOpeningQuote) {
    auto error = lex_error("int x;\nstring s := \"never closed");
    EXPECT_EQ(error.code, "L002");
    EXPECT_EQ(error.span.start.line, 2u);
    EXPECT_EQ(error.span.start.column, 13u);
}

TEST_F(LexerTest, UnterminatedBlockCommentReportsOpening) {
    auto error = lex_error("x /* open /* nested */");
    EXPECT_EQ(error.code, "L012");
    EXPECT_EQ(error.span.start.column, 3u);
}

TEST_F(LexerTest, InvalidEscape) {
    auto error = lex_error(R"("bad \q escape")");
    EXPECT_EQ(error.code, "L004");
}

TEST_F(LexerTest, NonIsoDateIsRejected) {
    auto error = lex_error("31-01-2024");
    EXPECT_EQ(error.code, "L005");
}

TEST_F(LexerTest, InvalidCalendarDate) {
    EXPECT_EQ(lex_error("2023-02-29").code, "L005");
    EXPECT_EQ(lex_error("2024-13-01").code, "L005");
}

TEST_F(LexerTest, MalformedMoneyGrouping) {
    EXPECT_EQ(lex_error("$1,00.00").code, "L003");
    EXPECT_EQ(lex_error("$5.5").code, "L003");
}

TEST_F(LexerTest, UnexpectedCharacter) {
    auto error = lex_error("int x := 4 @ 2;");
    EXPECT_EQ(error.code, "L001");
    ASSERT_TRUE(error.unexpected_char.has_value());
    EXPECT_EQ(*error.unexpected_char, U'@');
}

TEST_F(LexerTest, TokenizeAllKeepsGoing) {
    source_ = std::make_unique<Source>(Source::from_string("a @ b # c"));
    Lexer lexer(*source_);
    auto tokens = lexer.tokenize_all();
    EXPECT_EQ(lexer.errors().size(), 2u);
    EXPECT_EQ(tokens.back().kind, TokenKind::Eof);
    EXPECT_EQ(tokens[1].kind, TokenKind::Error);
}
