//! # Module Resolver
//!
//! Loads an entry file and everything it references into a
//! `ResolvedProgram`.
//!
//! ## Algorithm
//!
//! 1. Parse the entry file into a `Module`.
//! 2. For each `referencing` item locate the target file: `a.b` is tried as
//!    `a/b.yh` then `a/b/mod.yh`, first next to the importing file, then in
//!    each search path.
//! 3. A target already on the resolution stack is a circular import.
//! 4. Targets are resolved recursively and memoized by normalized path.
//! 5. Every imported name must be exported by its target.
//! 6. All modules are merged into one `SymbolTable`; two modules exporting
//!    the same name is an error, as is one qualified name declared by two
//!    files.
//!
//! ## Module Names
//!
//! A module is named after its file, not after the importer's spelling:
//! the path relative to the entry file's directory (or, outside it, to the
//! search path it was found in) with `/` turned into `.` and a trailing
//! `.yh` or `/mod.yh` dropped. `p/util.yh` and `q/util.yh` are therefore
//! `p.util` and `q.util` even when both are imported as `util`. A file whose
//! derived name is already taken by another file is named by its path
//! without the extension.
//!
//! Resolution is atomic: the first error aborts the call and no partial
//! program is returned. Each `resolve` call starts from empty state, so one
//! resolver may be reused but not shared between threads.
//!
//! ## Example
//!
//! ```cpp
//! MemorySourceLoader loader;
//! loader.add("a.yh", "referencing Bar from b");
//! loader.add("b.yh", "struct Bar {}");
//! ModuleResolver resolver(loader);
//! auto program = resolver.resolve("a.yh");
//! ```

#ifndef YUHO_TYPES_RESOLVER_HPP
#define YUHO_TYPES_RESOLVER_HPP

#include "common/diagnostic.hpp"
#include "types/module.hpp"

#include <map>
#include <string>
#include <vector>

namespace yuho::types {

// ============================================================================
// Source Loading
// ============================================================================

/// Why a file could not be read.
struct ReadError {
    std::string path;
    std::string message;
};

/// File-reading capability injected into the resolver.
class SourceLoader {
public:
    virtual ~SourceLoader() = default;

    [[nodiscard]] virtual auto exists(const std::string& path) const -> bool = 0;
    [[nodiscard]] virtual auto read(const std::string& path) const
        -> Result<std::string, ReadError> = 0;
};

/// Reads from the real file system.
class FileSystemSourceLoader final : public SourceLoader {
public:
    [[nodiscard]] auto exists(const std::string& path) const -> bool override;
    [[nodiscard]] auto read(const std::string& path) const
        -> Result<std::string, ReadError> override;
};

/// Serves files from memory; paths are normalized on insert and lookup.
class MemorySourceLoader final : public SourceLoader {
public:
    void add(const std::string& path, std::string content);

    [[nodiscard]] auto exists(const std::string& path) const -> bool override;
    [[nodiscard]] auto read(const std::string& path) const
        -> Result<std::string, ReadError> override;

private:
    std::map<std::string, std::string> files_;
};

/// Lexical normalization with `/` separators: `./a/../b.yh` -> `b.yh`.
[[nodiscard]] auto normalize_path(const std::string& path) -> std::string;

// ============================================================================
// Errors and Results
// ============================================================================

enum class ResolveErrorKind {
    ModuleNotFound,
    CircularImport,
    MissingSymbol,
    DuplicateExport,
    FileRead,
    Syntax,
};

[[nodiscard]] auto resolve_error_kind_to_string(ResolveErrorKind kind) -> std::string_view;

/// Why a resolve call failed. Only the fields relevant to `kind` are set.
struct ResolveError {
    ResolveErrorKind kind = ResolveErrorKind::ModuleNotFound;
    std::string message{};
    std::string file{}; ///< File the error is reported in
    SourceSpan span{};

    std::string module{};                      ///< Target module name
    std::string symbol{};                      ///< MissingSymbol, DuplicateExport
    std::vector<std::string> searched_paths{}; ///< ModuleNotFound
    std::vector<std::string> cycle{};          ///< CircularImport, as file paths
    std::vector<std::string> available{};      ///< MissingSymbol, sorted
    std::string other_module{};                ///< DuplicateExport
    std::vector<Diagnostic> diagnostics{};     ///< Syntax

    /// Keeps the reporting file's text alive for rendering `span`.
    Rc<lexer::Source> source{};

    [[nodiscard]] auto to_diagnostic() const -> Diagnostic;

    /// The wrapped Lex/Parse diagnostics for Syntax, otherwise one entry.
    [[nodiscard]] auto to_diagnostics() const -> std::vector<Diagnostic>;
};

/// The resolved program: every module (dependencies first, entry last), the
/// merged symbol table and, once analyzed, the semantic diagnostics.
struct ResolvedProgram {
    std::vector<Rc<Module>> modules;
    Rc<Module> entry;
    SymbolTable symbols;
    std::vector<Diagnostic> diagnostics; ///< Set by `SemanticAnalyzer::check`

    [[nodiscard]] auto find_module(const std::string& path) const -> Rc<Module>;
};

struct ResolverOptions {
    std::vector<std::string> search_paths;
};

// ============================================================================
// Resolver
// ============================================================================

class ModuleResolver {
public:
    explicit ModuleResolver(const SourceLoader& loader, ResolverOptions options = {});

    [[nodiscard]] auto resolve(const std::string& entry_path)
        -> Result<ResolvedProgram, ResolveError>;

    /// Candidate files for `module_name` imported from `from_dir`, in search
    /// order.
    [[nodiscard]] auto candidate_paths(const std::string& from_dir,
                                       const std::string& module_name) const
        -> std::vector<std::string>;

private:
    const SourceLoader& loader_;
    ResolverOptions options_;

    // Per-call state, reset by every resolve()
    std::map<std::string, Rc<Module>> resolved_;
    std::vector<std::string> stack_;
    std::vector<Rc<Module>> order_;
    std::string root_;                          // Directory of the entry file
    std::map<std::string, std::string> names_;  // Module name -> path

    void reset();

    auto module_name_for(const std::string& path) -> std::string;

    auto resolve_module(const std::string& path, const std::string& name)
        -> Result<Rc<Module>, ResolveError>;
    auto load_module(const std::string& path, const std::string& name)
        -> Result<Rc<Module>, ResolveError>;
    auto resolve_import(Module& module, const parser::ReferencingDecl& ref)
        -> Result<ImportRef, ResolveError>;
    auto locate(const Module& importer, const parser::ReferencingDecl& ref)
        -> Result<std::string, ResolveError>;

    void collect_local_exports(Module& module);
    auto build_symbol_table() -> Result<SymbolTable, ResolveError>;
};

} // namespace yuho::types

#endif // YUHO_TYPES_RESOLVER_HPP
