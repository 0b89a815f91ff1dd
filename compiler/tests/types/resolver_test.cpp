#include "types/resolver.hpp"

#include <gtest/gtest.h>

using namespace yuho;
using namespace yuho::types;

class ResolverTest : public ::testing::Test {
protected:
    MemorySourceLoader loader_;

    auto resolve(const std::string& entry, ResolverOptions options = {})
        -> Result<ResolvedProgram, ResolveError> {
        ModuleResolver resolver(loader_, std::move(options));
        return resolver.resolve(entry);
    }

    auto resolve_ok(const std::string& entry, ResolverOptions options = {}) -> ResolvedProgram {
        auto result = resolve(entry, std::move(options));
        if (is_err(result)) {
            ADD_FAILURE() << "resolution failed: " << unwrap_err(result).message;
            return ResolvedProgram{};
        }
        return std::move(unwrap(result));
    }

    auto resolve_err(const std::string& entry, ResolverOptions options = {}) -> ResolveError {
        auto result = resolve(entry, std::move(options));
        EXPECT_TRUE(is_err(result)) << "expected resolution of " << entry << " to fail";
        if (is_ok(result)) {
            return ResolveError{};
        }
        return unwrap_err(result);
    }
};

// ============================================================================
// Successful Resolution
// ============================================================================

TEST_F(ResolverTest, SingleModule) {
    loader_.add("main.yh", "struct Person { string name }\nint limit := 3;");

    auto program = resolve_ok("main.yh");
    ASSERT_EQ(program.modules.size(), 1u);
    ASSERT_NE(program.entry, nullptr);
    EXPECT_EQ(program.entry->name, "main");

    const auto* person = program.symbols.lookup_qualified("main.Person");
    ASSERT_NE(person, nullptr);
    EXPECT_EQ(person->kind, SymbolKind::Struct);
    ASSERT_NE(program.symbols.lookup_qualified("main.limit"), nullptr);

    // Variables are declared but not exported
    EXPECT_NE(program.symbols.lookup("Person"), nullptr);
    EXPECT_EQ(program.symbols.lookup("limit"), nullptr);
}

TEST_F(ResolverTest, ImportBindsQualifiedName) {
    loader_.add("a.yh", "referencing Bar from b;\nBar x;");
    loader_.add("b.yh", "struct Bar {}");

    auto program = resolve_ok("a.yh");
    ASSERT_EQ(program.modules.size(), 2u);
    EXPECT_EQ(program.modules[0]->path, "b.yh");
    EXPECT_EQ(program.modules[1]->path, "a.yh");
    EXPECT_EQ(program.entry->imported.at("Bar"), "b.Bar");

    ASSERT_EQ(program.entry->imports.size(), 1u);
    EXPECT_EQ(program.entry->imports[0].resolved_path, "b.yh");

    const auto* x = program.symbols.lookup_qualified("a.x");
    ASSERT_NE(x, nullptr);
    ASSERT_TRUE(x->type && x->type->is<NamedType>());
    EXPECT_EQ(x->type->as<NamedType>().module, "b");
}

TEST_F(ResolverTest, DottedModuleInSubdirectory) {
    loader_.add("src/main.yh", "referencing Offence from penal.code;");
    loader_.add("src/penal/code.yh", "struct Offence {}");

    auto program = resolve_ok("src/main.yh");
    ASSERT_EQ(program.modules.size(), 2u);
    EXPECT_EQ(program.modules[0]->path, "src/penal/code.yh");
    EXPECT_NE(program.symbols.lookup_qualified("penal.code.Offence"), nullptr);
}

TEST_F(ResolverTest, DirectoryModuleFile) {
    loader_.add("main.yh", "referencing Person from common;");
    loader_.add("common/mod.yh", "struct Person {}");

    auto program = resolve_ok("main.yh");
    EXPECT_EQ(program.modules[0]->path, "common/mod.yh");
}

TEST_F(ResolverTest, SearchPathsAfterImporterDirectory) {
    loader_.add("app/main.yh", "referencing Person from common;");
    loader_.add("lib/common.yh", "struct Person {}");

    auto error = resolve_err("app/main.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::ModuleNotFound);

    auto program = resolve_ok("app/main.yh", ResolverOptions{.search_paths = {"lib"}});
    EXPECT_EQ(program.modules[0]->path, "lib/common.yh");
}

TEST_F(ResolverTest, DiamondImportsLoadOnce) {
    loader_.add("top.yh", "referencing Left from left;\nreferencing Right from right;");
    loader_.add("left.yh", "referencing Base from base;\nstruct Left { Base b }");
    loader_.add("right.yh", "referencing Base from base;\nstruct Right { Base b }");
    loader_.add("base.yh", "struct Base {}");

    auto program = resolve_ok("top.yh");
    ASSERT_EQ(program.modules.size(), 4u);
    EXPECT_EQ(program.modules[0]->path, "base.yh");
    EXPECT_EQ(program.modules[3]->path, "top.yh");
    EXPECT_EQ(program.find_module("base.yh"), program.modules[0]);
}

TEST_F(ResolverTest, ReexportIsVisibleToImporter) {
    loader_.add("main.yh", "referencing Person from facade;");
    loader_.add("facade.yh", "export referencing Person from common;");
    loader_.add("common.yh", "struct Person {}");

    auto program = resolve_ok("main.yh");
    EXPECT_EQ(program.entry->imported.at("Person"), "common.Person");
}

TEST_F(ResolverTest, ResolutionIsRepeatable) {
    loader_.add("a.yh", "referencing Bar from b;\nfn f(Bar x) : int { return 1; }");
    loader_.add("b.yh", "struct Bar { int v }\nint twice := 2 * 2;");

    ModuleResolver resolver(loader_);
    auto first = resolver.resolve("a.yh");
    auto second = resolver.resolve("a.yh");
    ASSERT_TRUE(is_ok(first));
    ASSERT_TRUE(is_ok(second));
    EXPECT_TRUE(unwrap(first).symbols == unwrap(second).symbols);
    EXPECT_EQ(unwrap(first).modules.size(), unwrap(second).modules.size());
}

TEST_F(ResolverTest, CandidatePathsOrder) {
    ModuleResolver resolver(loader_, ResolverOptions{.search_paths = {"lib", "vendor"}});
    auto candidates = resolver.candidate_paths("src", "penal.code");
    EXPECT_EQ(candidates,
              (std::vector<std::string>{"src/penal/code.yh", "src/penal/code/mod.yh",
                                        "lib/penal/code.yh", "lib/penal/code/mod.yh",
                                        "vendor/penal/code.yh", "vendor/penal/code/mod.yh"}));
}

TEST_F(ResolverTest, SameFileNameInDifferentDirectories) {
    loader_.add("main.yh", "referencing X from p.x;\nreferencing Y from q.y;");
    loader_.add("p/x.yh", "referencing U from util;\nstruct X { U u }");
    loader_.add("q/y.yh", "referencing W from util;\nstruct Y { W w }");
    loader_.add("p/util.yh", "struct U {}\nint v := 1;");
    loader_.add("q/util.yh", "struct W {}\nstring v := \"s\";\nstring w := v;");

    auto program = resolve_ok("main.yh");
    ASSERT_EQ(program.modules.size(), 5u);
    EXPECT_EQ(program.find_module("p/util.yh")->name, "p.util");
    EXPECT_EQ(program.find_module("q/util.yh")->name, "q.util");
    // The importer keeps the spelling it wrote
    EXPECT_EQ(program.find_module("q/y.yh")->imports[0].module_name, "util");

    const auto* p_v = program.symbols.lookup_qualified("p.util.v");
    const auto* q_v = program.symbols.lookup_qualified("q.util.v");
    ASSERT_NE(p_v, nullptr);
    ASSERT_NE(q_v, nullptr);
    EXPECT_EQ(p_v->file, "p/util.yh");
    EXPECT_EQ(q_v->file, "q/util.yh");
    EXPECT_EQ(type_to_string(q_v->type), "string");
    EXPECT_EQ(program.symbols.references("q.util.w"), (std::vector<std::string>{"q.util.v"}));
    EXPECT_EQ(program.find_module("p/x.yh")->imported.at("U"), "p.util.U");
}

TEST_F(ResolverTest, TakenModuleNameFallsBackToPath) {
    loader_.add("app/main.yh", "referencing A from util;\nreferencing Y from q.y;");
    loader_.add("app/util.yh", "struct A {}\nint v := 1;");
    loader_.add("app/q/y.yh", "referencing B from util;\nstruct Y { B b }");
    loader_.add("lib/util.yh", "struct B {}\nstring v := \"s\";");

    auto program = resolve_ok("app/main.yh", ResolverOptions{.search_paths = {"lib"}});
    EXPECT_EQ(program.find_module("app/util.yh")->name, "util");
    EXPECT_EQ(program.find_module("lib/util.yh")->name, "lib/util");

    const auto* v = program.symbols.lookup_qualified("lib/util.v");
    ASSERT_NE(v, nullptr);
    EXPECT_EQ(v->file, "lib/util.yh");
    EXPECT_EQ(program.symbols.lookup_qualified("util.v")->file, "app/util.yh");
}

// ============================================================================
// Errors
// ============================================================================

TEST_F(ResolverTest, CircularImport) {
    loader_.add("a.yh", "referencing Bar from b;\nstruct Foo {}");
    loader_.add("b.yh", "referencing Foo from a;\nstruct Bar {}");

    auto error = resolve_err("a.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::CircularImport);
    EXPECT_EQ(error.cycle, (std::vector<std::string>{"a.yh", "b.yh"}));
    EXPECT_EQ(error.file, "b.yh");

    auto diag = error.to_diagnostic();
    EXPECT_EQ(diag.code, "R002");
    ASSERT_FALSE(diag.notes.empty());
    EXPECT_EQ(diag.notes[0], "import cycle: a.yh -> b.yh -> a.yh");
}

TEST_F(ResolverTest, CircularImportFromEitherEntry) {
    loader_.add("a.yh", "referencing Bar from b;\nstruct Foo {}");
    loader_.add("b.yh", "referencing Foo from a;\nstruct Bar {}");

    auto error = resolve_err("b.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::CircularImport);
    EXPECT_EQ(error.cycle, (std::vector<std::string>{"b.yh", "a.yh"}));
    EXPECT_EQ(error.file, "a.yh");
    EXPECT_EQ(error.to_diagnostic().notes[0], "import cycle: b.yh -> a.yh -> b.yh");
}

TEST_F(ResolverTest, SelfImportIsCircular) {
    loader_.add("a.yh", "referencing Foo from a;\nstruct Foo {}");

    auto error = resolve_err("a.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::CircularImport);
    EXPECT_EQ(error.cycle, (std::vector<std::string>{"a.yh"}));
}

TEST_F(ResolverTest, MissingSymbol) {
    loader_.add("a.yh", "referencing Baz from b;");
    loader_.add("b.yh", "struct Bar {}");

    auto error = resolve_err("a.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::MissingSymbol);
    EXPECT_EQ(error.symbol, "Baz");
    EXPECT_EQ(error.module, "b");
    EXPECT_EQ(error.available, (std::vector<std::string>{"Bar"}));
    EXPECT_EQ(error.span.start.line, 1u);
    EXPECT_EQ(error.span.start.column, 13u);
    EXPECT_EQ(error.to_diagnostic().code, "R003");
}

TEST_F(ResolverTest, ModuleNotFoundListsSearchedPaths) {
    loader_.add("main.yh", "referencing X from missing;");

    auto error = resolve_err("main.yh", ResolverOptions{.search_paths = {"lib"}});
    EXPECT_EQ(error.kind, ResolveErrorKind::ModuleNotFound);
    EXPECT_EQ(error.module, "missing");
    EXPECT_EQ(error.searched_paths,
              (std::vector<std::string>{"missing.yh", "missing/mod.yh", "lib/missing.yh",
                                        "lib/missing/mod.yh"}));
    ASSERT_NE(error.source, nullptr);

    auto diag = error.to_diagnostic();
    EXPECT_EQ(diag.code, "R001");
    EXPECT_EQ(diag.notes.size(), 4u);
    EXPECT_FALSE(diag.help.empty());
}

TEST_F(ResolverTest, DuplicateExportAcrossModules) {
    loader_.add("main.yh", "referencing A from one;\nreferencing B from two;");
    loader_.add("one.yh", "struct A {}\nstruct Shared {}");
    loader_.add("two.yh", "struct B {}\nenum Shared { X }");

    auto error = resolve_err("main.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::DuplicateExport);
    EXPECT_EQ(error.symbol, "Shared");
    EXPECT_EQ(error.other_module, "one");
    EXPECT_EQ(error.module, "two");
    EXPECT_EQ(error.to_diagnostic().code, "R004");
}

TEST_F(ResolverTest, ReexportConflictsWithLocal) {
    loader_.add("main.yh", "struct Person {}\nexport referencing Person from common;");
    loader_.add("common.yh", "struct Person {}");

    auto error = resolve_err("main.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::DuplicateExport);
    EXPECT_EQ(error.symbol, "Person");
}

TEST_F(ResolverTest, ScopeClashesWithSubmodule) {
    loader_.add("a.yh", "referencing D from a.b;\nscope b { int limit := 1; }");
    loader_.add("a/b.yh", "struct D {}\nint limit := 2;");

    auto error = resolve_err("a.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::DuplicateExport);
    EXPECT_EQ(error.symbol, "a.b.limit");
    EXPECT_EQ(error.file, "a.yh");
    EXPECT_EQ(error.other_module, "a.b");
    EXPECT_EQ(error.span.start.line, 2u);
    EXPECT_EQ(error.message, "`a.b.limit` is declared in both `a/b.yh` and `a.yh`");
}

TEST_F(ResolverTest, SyntaxErrorInDependency) {
    loader_.add("main.yh", "referencing A from broken;");
    loader_.add("broken.yh", "struct A { int }");

    auto error = resolve_err("main.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::Syntax);
    EXPECT_EQ(error.file, "broken.yh");
    auto diags = error.to_diagnostics();
    ASSERT_FALSE(diags.empty());
    EXPECT_EQ(diags[0].code, "P001");
}

TEST_F(ResolverTest, MissingEntryFile) {
    auto error = resolve_err("nowhere.yh");
    EXPECT_EQ(error.kind, ResolveErrorKind::FileRead);
    EXPECT_EQ(error.to_diagnostic().code, "R005");
}

TEST_F(ResolverTest, ErrorLeavesResolverReusable) {
    loader_.add("bad.yh", "referencing X from missing;");
    loader_.add("good.yh", "struct Fine {}");

    ModuleResolver resolver(loader_);
    EXPECT_TRUE(is_err(resolver.resolve("bad.yh")));
    auto good = resolver.resolve("good.yh");
    ASSERT_TRUE(is_ok(good));
    EXPECT_EQ(unwrap(good).modules.size(), 1u);
}
