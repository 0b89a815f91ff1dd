#include "diagnostic.hpp"

#include <algorithm>
#include <gtest/gtest.h>
#include <sstream>

using namespace yuho;
using namespace yuho::cli;

class DiagnosticEmitterTest : public ::testing::Test {
protected:
    std::ostringstream out_;
    DiagnosticEmitter emitter_{out_};

    Rc<lexer::Source> penal_ =
        make_rc<lexer::Source>("penal.yh", "money fine := $100;\nmoney fine := $200;\n");

    void SetUp() override {
        emitter_.add_source(penal_);
    }

    /// Span over the second `fine`, line 2 columns 7 to 10.
    auto second_fine() const -> SourceSpan {
        return penal_->span(26, 30);
    }

    auto first_fine() const -> SourceSpan {
        return penal_->span(6, 10);
    }

    auto duplicate_fine() const -> Diagnostic {
        auto diag = make_error(DiagnosticKind::DuplicateDeclaration,
                               ErrorCodes::DUPLICATE_DECLARATION, "duplicate declaration `fine`",
                               second_fine());
        diag.labels.push_back(DiagnosticLabel{
            .span = first_fine(), .message = "`fine` first declared here", .is_primary = false});
        diag.help.push_back("rename or remove one of the declarations");
        return diag;
    }
};

// ============================================================================
// Text Format
// ============================================================================

TEST_F(DiagnosticEmitterTest, HeaderAndLocation) {
    emitter_.emit(make_error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
                             "expected `money`, found `int`", second_fine()));

    auto text = out_.str();
    EXPECT_EQ(text.rfind("error[T001]: expected `money`, found `int`\n", 0), 0u);
    EXPECT_NE(text.find("  --> penal.yh:2:7\n"), std::string::npos);
    EXPECT_NE(text.find("   2 | money fine := $200;\n"), std::string::npos);
    EXPECT_NE(text.find("     |       ^^^^\n"), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, NoColorsOnStringStream) {
    emitter_.emit(duplicate_fine());
    EXPECT_EQ(out_.str().find('\033'), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, SecondaryLabelAndHelp) {
    emitter_.emit(duplicate_fine());

    auto text = out_.str();
    EXPECT_NE(text.find("   1 | money fine := $100;\n"), std::string::npos);
    EXPECT_NE(text.find("     |       ---- `fine` first declared here\n"), std::string::npos);
    EXPECT_NE(text.find("     |       ^^^^\n"), std::string::npos);
    EXPECT_NE(text.find("  = help: rename or remove one of the declarations\n"),
              std::string::npos);
    // Line 1 is rendered before line 2
    EXPECT_LT(text.find("   1 |"), text.find("   2 |"));
}

TEST_F(DiagnosticEmitterTest, WarningWithNote) {
    auto diag = make_warning(DiagnosticKind::InexhaustiveMatch, ErrorCodes::INEXHAUSTIVE_MATCH,
                             "non-exhaustive match", first_fine());
    diag.notes.push_back("`FALSE` not covered");
    emitter_.emit(diag);

    auto text = out_.str();
    EXPECT_EQ(text.rfind("warning[W002]: non-exhaustive match\n", 0), 0u);
    EXPECT_NE(text.find("  = note: `FALSE` not covered\n"), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, UnknownSourceShowsLocationOnly) {
    auto other = make_rc<lexer::Source>("other.yh", "struct A {}\n");
    emitter_.emit(make_error(DiagnosticKind::ParseError, ErrorCodes::PARSE_UNEXPECTED_TOKEN,
                             "unexpected token", other->span(0, 6)));

    auto text = out_.str();
    EXPECT_NE(text.find("  --> other.yh:1:1\n"), std::string::npos);
    EXPECT_EQ(text.find(" | "), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, LabelInAnotherFile) {
    auto other = make_rc<lexer::Source>("other.yh", "struct Shared {}\n");
    emitter_.add_source(other);

    auto diag = duplicate_fine();
    diag.labels.clear();
    diag.labels.push_back(DiagnosticLabel{
        .span = other->span(7, 13), .message = "also exported here", .is_primary = false});
    emitter_.emit(diag);

    auto text = out_.str();
    EXPECT_NE(text.find("  ::: other.yh:1:8\n"), std::string::npos);
    EXPECT_NE(text.find("   1 | struct Shared {}\n"), std::string::npos);
    EXPECT_NE(text.find("------ also exported here"), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, RegisteredContent) {
    emitter_.set_source_content("inline.yh", "int x := TRUE;\n");
    Diagnostic diag;
    diag.code = ErrorCodes::TYPE_MISMATCH;
    diag.message = "mismatch";
    diag.file = "inline.yh";
    diag.primary_span.start = SourceLocation{.line = 1, .column = 10};
    diag.primary_span.end = SourceLocation{.line = 1, .column = 13};
    emitter_.emit(diag);

    auto text = out_.str();
    EXPECT_NE(text.find("  --> inline.yh:1:10\n"), std::string::npos);
    EXPECT_NE(text.find("   1 | int x := TRUE;\n"), std::string::npos);
    EXPECT_NE(text.find("     |          ^^^^\n"), std::string::npos);
}

// ============================================================================
// Counts and Summary
// ============================================================================

TEST_F(DiagnosticEmitterTest, CountsBySeverity) {
    emitter_.emit_all({duplicate_fine(), duplicate_fine(),
                       make_warning(DiagnosticKind::UnreachableArm, ErrorCodes::UNREACHABLE_ARM,
                                    "unreachable arm", first_fine())});
    EXPECT_EQ(emitter_.error_count(), 2u);
    EXPECT_EQ(emitter_.warning_count(), 1u);

    emitter_.reset_counts();
    EXPECT_EQ(emitter_.error_count(), 0u);
    EXPECT_EQ(emitter_.warning_count(), 0u);
}

TEST_F(DiagnosticEmitterTest, Summary) {
    emitter_.emit_all({duplicate_fine(), duplicate_fine(),
                       make_warning(DiagnosticKind::UnreachableArm, ErrorCodes::UNREACHABLE_ARM,
                                    "unreachable arm", first_fine())});
    out_.str("");
    emitter_.emit_summary();
    EXPECT_EQ(out_.str(),
              "warning: 1 warning emitted\nerror: aborting due to 2 previous errors\n");
}

TEST_F(DiagnosticEmitterTest, SummaryEmptyWhenClean) {
    emitter_.emit_summary();
    EXPECT_TRUE(out_.str().empty());
}

// ============================================================================
// JSON Format
// ============================================================================

TEST_F(DiagnosticEmitterTest, JsonOneObjectPerLine) {
    emitter_.set_format(DiagnosticFormat::JSON);
    emitter_.emit(duplicate_fine());
    emitter_.emit(duplicate_fine());

    auto text = out_.str();
    ASSERT_FALSE(text.empty());
    EXPECT_EQ(std::count(text.begin(), text.end(), '\n'), 2);
    EXPECT_EQ(text.rfind("{\"severity\":\"error\",\"kind\":\"DuplicateDeclarationError\","
                         "\"code\":\"T003\",\"message\":\"duplicate declaration `fine`\","
                         "\"file\":\"penal.yh\",",
                         0),
              0u);
    EXPECT_NE(text.find("\"start\":{\"line\":2,\"column\":7}"), std::string::npos);
    EXPECT_NE(text.find("\"is_primary\":false"), std::string::npos);
    EXPECT_NE(text.find("\"help\":[\"rename or remove one of the declarations\"]}"),
              std::string::npos);
}

TEST_F(DiagnosticEmitterTest, JsonEscapesMessage) {
    emitter_.set_format(DiagnosticFormat::JSON);
    emitter_.emit(make_error(DiagnosticKind::LexError, ErrorCodes::LEX_UNTERMINATED_STRING,
                             "unterminated \"string\"\n", first_fine()));
    EXPECT_NE(out_.str().find(R"("message":"unterminated \"string\"\n")"), std::string::npos);
}

TEST_F(DiagnosticEmitterTest, JsonHasNoSummary) {
    emitter_.set_format(DiagnosticFormat::JSON);
    emitter_.emit(duplicate_fine());
    out_.str("");
    emitter_.emit_summary();
    EXPECT_TRUE(out_.str().empty());
}

TEST(EscapeJsonTest, ControlCharacters) {
    EXPECT_EQ(escape_json("a\tb"), "a\\tb");
    EXPECT_EQ(escape_json(std::string("x\x01y")), "x\\u0001y");
    EXPECT_EQ(escape_json("back\\slash"), "back\\\\slash");
}
