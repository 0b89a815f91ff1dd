#include "types/checker.hpp"

#include <algorithm>
#include <gtest/gtest.h>

using namespace yuho;
using namespace yuho::types;

class CheckerTest : public ::testing::Test {
protected:
    MemorySourceLoader loader_;
    // Diagnostic spans point into the program's sources
    ResolvedProgram program_;

    auto check(const std::string& code, AnalyzerOptions options = {.warning_policy = false})
        -> std::vector<Diagnostic> {
        loader_.add("main.yh", code);
        ModuleResolver resolver(loader_);
        auto resolved = resolver.resolve("main.yh");
        if (is_err(resolved)) {
            ADD_FAILURE() << "resolution failed: " << unwrap_err(resolved).message;
            return {};
        }
        program_ = std::move(unwrap(resolved));
        SemanticAnalyzer analyzer(options);
        return analyzer.analyze(program_);
    }

    static auto codes(const std::vector<Diagnostic>& diags) -> std::vector<std::string> {
        std::vector<std::string> result;
        for (const auto& diag : diags) {
            result.push_back(diag.code);
        }
        return result;
    }
};

// ============================================================================
// Valid Programs
// ============================================================================

TEST_F(CheckerTest, MatchOnTrueIsClean) {
    auto diags = check(R"(
match {
    case TRUE := consequence 1;
    case _ := consequence 0;
}
)");
    EXPECT_TRUE(diags.empty()) << diags.front().message;
}

TEST_F(CheckerTest, StatuteProgramIsClean) {
    auto diags = check(R"(
struct Accused {
    string name,
    bool deceived,
    money gain,
}

enum Verdict { Guilty, NotGuilty }

fn assess(Accused a) : Verdict {
    match a.deceived && a.gain > $0 {
        case TRUE := consequence Verdict.Guilty;
        case FALSE := consequence Verdict.NotGuilty;
    }
}

fn sentence(Verdict v, int years) : duration {
    match v {
        case Verdict.Guilty := consequence 1 year * years;
        case NotGuilty := consequence 0 days;
    }
}

Accused tan := Accused { name := "Tan", deceived := TRUE, gain := $500 };
float ratio := 1;
date filed := 2024-03-01 + 30 days;
)");
    for (const auto& diag : diags) {
        ADD_FAILURE() << diag.code << ": " << diag.message;
    }
}

TEST_F(CheckerTest, StructPatternBindsFields) {
    auto diags = check(R"(
struct Person { string name, int age }
fn describe(Person p) : string {
    match p {
        case Person { name } := consequence name;
    }
}
)");
    EXPECT_TRUE(diags.empty()) << diags.front().message;
}

TEST_F(CheckerTest, ScopeMemberAccess) {
    auto diags = check(R"(
scope cheating {
    int max_years := 10;
}
int limit := cheating.max_years;
)");
    EXPECT_TRUE(diags.empty()) << diags.front().message;
}

TEST_F(CheckerTest, ImportedStructLiteral) {
    loader_.add("common.yh", "struct Person { string name }");
    auto diags = check(R"(
referencing Person from common;
Person p := Person { name := "Tan" };
)");
    EXPECT_TRUE(diags.empty()) << diags.front().message;
}

TEST_F(CheckerTest, CheckRecordsDiagnosticsOnProgram) {
    loader_.add("main.yh", "int a := \"x\";");
    ModuleResolver resolver(loader_);
    auto resolved = resolver.resolve("main.yh");
    ASSERT_TRUE(is_ok(resolved));
    auto& program = unwrap(resolved);
    EXPECT_TRUE(program.diagnostics.empty());

    SemanticAnalyzer analyzer(AnalyzerOptions{.warning_policy = false});
    const auto& diags = analyzer.check(program);
    EXPECT_EQ(&diags, &program.diagnostics);
    ASSERT_EQ(program.diagnostics.size(), 1u);
    EXPECT_EQ(program.diagnostics[0].code, "T001");
}

TEST_F(CheckerTest, SameFileNameInDifferentDirectories) {
    loader_.add("p/x.yh", "referencing U from util;\nstruct X { U u }");
    loader_.add("q/y.yh", "referencing W from util;\nstruct Y { W w }");
    loader_.add("p/util.yh", "struct U {}\nint v := 1;");
    loader_.add("q/util.yh", "struct W {}\nstring v := \"s\";\nstring w := v;");
    auto diags = check("referencing X from p.x;\nreferencing Y from q.y;");
    EXPECT_TRUE(diags.empty()) << diags.front().message;
}

// ============================================================================
// Duplicates
// ============================================================================

TEST_F(CheckerTest, DuplicateFieldReportedOnce) {
    auto diags = check("struct S { int a, string a }");
    ASSERT_EQ(diags.size(), 1u);

    const auto& diag = diags[0];
    EXPECT_EQ(diag.code, "T003");
    EXPECT_EQ(diag.severity, DiagnosticSeverity::Error);
    EXPECT_EQ(diag.primary_span.start.column, 26u);
    ASSERT_EQ(diag.labels.size(), 1u);
    EXPECT_EQ(diag.labels[0].span.start.column, 16u);
    EXPECT_FALSE(diag.labels[0].is_primary);
}

TEST_F(CheckerTest, DuplicateTopLevelDeclaration) {
    auto diags = check("int a := 1;\nstring a := \"x\";");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T003");
    EXPECT_EQ(diags[0].primary_span.start.line, 2u);
    ASSERT_EQ(diags[0].labels.size(), 1u);
    EXPECT_EQ(diags[0].labels[0].span.start.line, 1u);
}

TEST_F(CheckerTest, DuplicateEnumVariant) {
    auto diags = check("enum Verdict { Guilty, Guilty }");
    EXPECT_EQ(codes(diags), (std::vector<std::string>{"T003"}));
}

TEST_F(CheckerTest, SameNameInDifferentScopes) {
    auto diags = check("scope a { int x := 1; }\nscope b { int x := 2; }");
    EXPECT_TRUE(diags.empty()) << diags.front().message;
}

// ============================================================================
// Type Mismatches
// ============================================================================

TEST_F(CheckerTest, InitializerMismatch) {
    auto diags = check("int x := \"hello\";");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T001");
    EXPECT_EQ(diags[0].message,
              "mismatched types: `x` is declared `int` but initialized with `string`");
    ASSERT_EQ(diags[0].labels.size(), 1u);
    EXPECT_EQ(diags[0].labels[0].message, "expected due to this type");
}

TEST_F(CheckerTest, OperatorMismatch) {
    auto diags = check("money fine := $100 + 5;");
    ASSERT_FALSE(diags.empty());
    EXPECT_EQ(diags[0].code, "T001");
    EXPECT_EQ(diags[0].message, "cannot apply `+` to `money` and `int`");
}

TEST_F(CheckerTest, MissingStructField) {
    auto diags = check("struct P { string name, int age }\nP p := P { name := \"x\" };");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T001");
    EXPECT_EQ(diags[0].message, "missing field(s) in `P` literal: `age`");
}

TEST_F(CheckerTest, MissingReturn) {
    auto diags = check("fn f() : int { pass; }");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T001");
    EXPECT_NE(diags[0].message.find("missing return"), std::string::npos);
    EXPECT_EQ(diags[0].primary_span.start.column, 4u);
}

TEST_F(CheckerTest, ReturnValueFromPassFunction) {
    auto diags = check("fn f() { return 1; }");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T001");
    ASSERT_EQ(diags[0].help.size(), 1u);
    EXPECT_EQ(diags[0].help[0], "declare the result type: `fn f(...): int`");
}

TEST_F(CheckerTest, NonBoolGuard) {
    auto diags = check("match { case _ if 1 := pass; }");
    auto found = codes(diags);
    EXPECT_NE(std::find(found.begin(), found.end(), "T001"), found.end());
}

// ============================================================================
// Unresolved Names
// ============================================================================

TEST_F(CheckerTest, UnresolvedValueSuggestsName) {
    auto diags = check("int total := 1;\nint x := totl + 1;");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T002");
    EXPECT_EQ(diags[0].message, "cannot find value `totl` in this scope");
    ASSERT_EQ(diags[0].help.size(), 1u);
    EXPECT_EQ(diags[0].help[0], "did you mean `total`?");
}

TEST_F(CheckerTest, UnresolvedTypeSuggestsName) {
    auto diags = check("struct Person {}\nPersn p;");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T002");
    ASSERT_EQ(diags[0].help.size(), 1u);
    EXPECT_EQ(diags[0].help[0], "did you mean `Person`?");
}

TEST_F(CheckerTest, ExportedButNotImported) {
    loader_.add("other.yh", "struct A {}\nstruct Offence {}");
    auto diags = check("referencing A from other;\nOffence o;");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T002");
    ASSERT_EQ(diags[0].help.size(), 1u);
    EXPECT_EQ(diags[0].help[0], "add `referencing Offence from other`");
}

TEST_F(CheckerTest, UnknownEnumVariant) {
    auto diags = check("enum Verdict { Guilty }\nVerdict v := Verdict.Guilt;");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T002");
    EXPECT_EQ(diags[0].help[0], "did you mean `Guilty`?");
}

// ============================================================================
// Calls
// ============================================================================

TEST_F(CheckerTest, ArgumentCountMismatch) {
    auto diags = check("fn f(int a) : int { return a; }\nint y := f(1, 2);");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T004");
    EXPECT_EQ(diags[0].message, "this function takes 1 argument but 2 were supplied");
    ASSERT_EQ(diags[0].notes.size(), 1u);
    EXPECT_EQ(diags[0].notes[0], "signature: fn(int): int");
}

TEST_F(CheckerTest, ArgumentTypeMismatch) {
    auto diags = check("fn f(money a) : money { return a; }\nmoney y := f(\"ten\");");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T001");
    EXPECT_EQ(diags[0].message, "mismatched argument 1: expected `money`, found `string`");
}

// ============================================================================
// Cycles
// ============================================================================

TEST_F(CheckerTest, CyclicVariables) {
    auto diags = check("int a := b + 1;\nint b := a;");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "T005");
    EXPECT_EQ(diags[0].message, "cyclic definition: main.a -> main.b -> main.a");
    ASSERT_EQ(diags[0].labels.size(), 1u);
    EXPECT_EQ(diags[0].labels[0].span.start.line, 2u);
}

TEST_F(CheckerTest, ForwardReferenceIsNotCycle) {
    auto diags = check("int a := b + 1;\nint b := 2;");
    EXPECT_TRUE(diags.empty()) << diags.front().message;
}

// ============================================================================
// Match Warnings
// ============================================================================

TEST_F(CheckerTest, UnreachableArmAfterWildcard) {
    auto diags = check("match { case _ := pass; case TRUE := pass; }");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "W001");
    EXPECT_EQ(diags[0].severity, DiagnosticSeverity::Warning);
    ASSERT_EQ(diags[0].labels.size(), 1u);
    EXPECT_EQ(diags[0].labels[0].message, "this arm matches any value");
}

TEST_F(CheckerTest, BoolMatchMissingFalse) {
    auto diags = check("match { case TRUE := consequence 1; }");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "W002");
    EXPECT_EQ(diags[0].message, "non-exhaustive match: `FALSE` not covered");
}

TEST_F(CheckerTest, GuardedArmDoesNotCover) {
    auto diags = check(R"(
bool b := TRUE;
match b {
    case TRUE := pass;
    case FALSE if b := pass;
}
)");
    EXPECT_EQ(codes(diags), (std::vector<std::string>{"W002"}));
}

TEST_F(CheckerTest, EnumMatchMissingVariant) {
    auto diags = check(R"(
enum Verdict { Guilty, NotGuilty, Acquitted }
fn f(Verdict v) : int {
    match v {
        case Verdict.Guilty := consequence 1;
        case NotGuilty := consequence 2;
    }
}
)");
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "W002");
    EXPECT_EQ(diags[0].message, "non-exhaustive match: `Verdict.Acquitted` not covered");
}

TEST_F(CheckerTest, IntMatchNeedsWildcard) {
    auto diags = check("int n := 3;\nmatch n { case 1 := pass; case 2 := pass; }");
    EXPECT_EQ(codes(diags), (std::vector<std::string>{"W002"}));
}

// ============================================================================
// Warning Policy
// ============================================================================

class CheckerPolicyTest : public CheckerTest {
protected:
    void TearDown() override {
        CompilerOptions::warning_level = WarningLevel::Default;
        CompilerOptions::warnings_as_errors = false;
    }
};

TEST_F(CheckerPolicyTest, WarningsAsErrors) {
    CompilerOptions::warnings_as_errors = true;
    auto diags = check("match { case TRUE := pass; }", AnalyzerOptions{});
    ASSERT_EQ(diags.size(), 1u);
    EXPECT_EQ(diags[0].code, "W002");
    EXPECT_EQ(diags[0].severity, DiagnosticSeverity::Error);
    EXPECT_TRUE(has_errors(diags));
}

TEST_F(CheckerPolicyTest, WarningsSuppressed) {
    CompilerOptions::warning_level = WarningLevel::None;
    auto diags = check("match { case TRUE := pass; }\nint x := \"s\";", AnalyzerOptions{});
    EXPECT_EQ(codes(diags), (std::vector<std::string>{"T001"}));
}
