#ifndef YUHO_TYPES_MODULE_HPP
#define YUHO_TYPES_MODULE_HPP

#include "lexer/source.hpp"
#include "parser/ast.hpp"
#include "types/type.hpp"

#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace yuho::types {

// What a symbol declares
enum class SymbolKind {
    Struct,
    Enum,
    Function,
    Scope,
    Variable,
};

[[nodiscard]] auto symbol_kind_to_string(SymbolKind kind) -> std::string_view;

// One `referencing X, Y from a.b` of a module, with its target located
struct ImportRef {
    std::vector<std::string> names{};
    std::string module_name;   // As written: "a.b"
    std::string resolved_path; // Normalized path of the target file
    bool is_export = false;    // `export referencing`
    SourceSpan span;           // The module path in the importing file
};

// A name a module makes visible to importers
struct ExportEntry {
    std::string name;
    std::string origin_module; // Module that defines the symbol
    std::string origin_path;
    SymbolKind kind = SymbolKind::Struct;
    bool is_reexport = false;
    SourceSpan span;

    [[nodiscard]] auto qualified_name() const -> std::string {
        return origin_module + "." + name;
    }
};

// Represents one parsed source file
struct Module {
    std::string name; // Dotted name derived from the file path, unique per file
    std::string path; // Normalized file path
    Rc<lexer::Source> source;
    parser::Program program;

    std::vector<ExportEntry> exports;
    std::vector<ImportRef> imports;

    // Imported local name -> qualified name of the origin symbol
    std::map<std::string, std::string> imported;

    [[nodiscard]] auto find_export(const std::string& name) const -> const ExportEntry*;

    // Sorted export names, used for "available" lists
    [[nodiscard]] auto export_names() const -> std::vector<std::string>;

    // Directory relative imports are searched from ("" for the working dir)
    [[nodiscard]] auto directory() const -> std::string;
};

// A declaration known to the program
struct Symbol {
    std::string name;
    std::string qualified_name; // module.Name or module.Scope.Name
    std::string module;
    std::string file;
    SymbolKind kind = SymbolKind::Struct;
    const parser::Decl* decl = nullptr; // Owned by the module's Program
    TypePtr type;
    SourceSpan span;
    bool exported = false;
};

// Called for each type name that resolves nowhere
using UnresolvedTypeHandler = std::function<void(const parser::NamedType&)>;

// Every declaration of a resolved program under its qualified name, the
// unqualified index of exported names, and the name-reference graph.
//
// Lookups never return pointers into the AST's identifier nodes; identifiers
// stay keys, and edges of the reference graph are qualified names.
class SymbolTable {
public:
    SymbolTable() = default;

    // Registration. `insert` returns false if the qualified name is taken.
    auto insert(Symbol symbol) -> bool;
    void set_type(const std::string& qualified_name, TypePtr type);

    // Adds `name` to the exported index. Returns the qualified name already
    // registered under `name` when it differs.
    auto add_export(const std::string& name, const std::string& qualified_name)
        -> std::optional<std::string>;

    // Lookup
    [[nodiscard]] auto lookup_qualified(const std::string& qualified_name) const -> const Symbol*;
    [[nodiscard]] auto lookup(const std::string& name) const -> const Symbol*;

    // Resolves `name` as seen from inside `scope_path` of `module`: the
    // innermost enclosing scope block first, then the module top level,
    // then the module's imports.
    [[nodiscard]] auto lookup_in_scope(const Module& module,
                                       const std::vector<std::string>& scope_path,
                                       const std::string& name) const -> const Symbol*;

    // Converts a source annotation into a semantic type. Names are resolved
    // with `lookup_in_scope`; a name that is not a struct or enum becomes
    // Unknown and is passed to `on_unresolved`.
    [[nodiscard]] auto resolve_annotation(const parser::Type& type, const Module& module,
                                          const std::vector<std::string>& scope_path,
                                          const UnresolvedTypeHandler& on_unresolved = nullptr) const
        -> TypePtr;

    // Name-reference graph (edges = identifier lookups)
    void add_reference(const std::string& from, const std::string& to);
    [[nodiscard]] auto references(const std::string& from) const -> std::vector<std::string>;

    // Groups of `kind` symbols that reach each other through the graph
    // (strongly connected components with a cycle), each sorted by qualified
    // name. Edges through other kinds are ignored.
    [[nodiscard]] auto find_cycles(SymbolKind kind) const -> std::vector<std::vector<std::string>>;

    [[nodiscard]] auto symbols() const -> const std::map<std::string, Symbol>& {
        return symbols_;
    }
    [[nodiscard]] auto exported() const -> const std::map<std::string, std::string>& {
        return exported_;
    }
    [[nodiscard]] auto size() const -> size_t {
        return symbols_.size();
    }

    // Structural comparison: names, kinds, types, exports and edges.
    // Declaration pointers are not compared.
    [[nodiscard]] auto operator==(const SymbolTable& other) const -> bool;

private:
    std::map<std::string, Symbol> symbols_;
    std::map<std::string, std::string> exported_; // name -> qualified name
    std::map<std::string, std::set<std::string>> edges_;
};

} // namespace yuho::types

#endif // YUHO_TYPES_MODULE_HPP
