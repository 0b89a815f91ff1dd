//! # Declaration AST Nodes
//!
//! Items: the things a module or a scope block is made of.
//!
//! ## Declaration Types
//!
//! - **Records**: `struct Person { string name, int age }`
//! - **Enumerations**: `enum Verdict { Guilty, NotGuilty }`
//! - **Functions**: `fn fine(int count): money { ... }`
//! - **Scope blocks**: `scope cheating { ... }`, `statute 415 "Cheating" { ... }`
//! - **Imports**: `referencing Person, Verdict from common.types`
//! - **Constants**: `int max_term := 10;`
//! - **Top-level expressions**: `match { ... }`
//!
//! ## Exports
//!
//! Every top-level struct, enum, function and scope is exported.
//! `export referencing A from b` re-exports `A` from this module.

#ifndef YUHO_PARSER_AST_DECLS_HPP
#define YUHO_PARSER_AST_DECLS_HPP

#include "ast_common.hpp"
#include "ast_exprs.hpp"
#include "ast_patterns.hpp"
#include "ast_stmts.hpp"
#include "ast_types.hpp"

namespace yuho::parser {

// ============================================================================
// Structs and Enums
// ============================================================================

/// One `type name` field of a struct.
struct StructField {
    TypePtr type;
    std::string name;
    SourceSpan name_span;
    SourceSpan span;
};

/// Struct declaration. Duplicate field names are accepted here and reported
/// by the analyzer.
struct StructDecl {
    std::string name;
    std::vector<StructField> fields;
    SourceSpan name_span;
    SourceSpan span;
};

struct EnumVariant {
    std::string name;
    SourceSpan span;
};

/// Enum declaration: a closed set of named variants.
struct EnumDecl {
    std::string name;
    std::vector<EnumVariant> variants;
    SourceSpan name_span;
    SourceSpan span;
};

// ============================================================================
// Functions
// ============================================================================

/// One `type name` parameter.
struct FuncParam {
    TypePtr type;
    std::string name;
    SourceSpan name_span;
    SourceSpan span;
};

/// Function declaration: `fn name(type a, ...): ret { body }`.
struct FuncDecl {
    std::string name;
    std::vector<FuncParam> params;
    std::optional<TypePtr> return_type;
    std::vector<StmtPtr> body;
    SourceSpan name_span;
    SourceSpan span;
};

// ============================================================================
// Scope Blocks
// ============================================================================

enum class ScopeKind {
    Scope,   ///< `scope name { ... }`
    Statute, ///< `statute 415 "Cheating" { ... }`
};

/// A named grouping of items.
///
/// A statute may be named by an identifier, a section number or a string;
/// `name_token` records which, so the printer can reproduce it.
struct ScopeDecl {
    ScopeKind kind = ScopeKind::Scope;
    std::string name;
    lexer::TokenKind name_token = lexer::TokenKind::Identifier;
    std::optional<std::string> title;
    std::vector<DeclPtr> items;
    SourceSpan name_span;
    SourceSpan span;
};

// ============================================================================
// Imports
// ============================================================================

struct ImportedName {
    std::string name;
    SourceSpan span;
};

/// `[export] referencing A, B from path.to.module`.
///
/// A plain node: the parser never touches the file system.
struct ReferencingDecl {
    std::vector<ImportedName> names;
    std::vector<std::string> module_path;
    bool is_export = false;
    SourceSpan module_span;
    SourceSpan span;

    /// Dotted module name: `path.to.module`.
    [[nodiscard]] auto module_name() const -> std::string;
};

// ============================================================================
// Top-Level Expressions
// ============================================================================

/// An expression at item level, typically a free-standing `match`.
struct ExprDecl {
    ExprPtr expr;
    SourceSpan span;
};

// ============================================================================
// Declaration Variant
// ============================================================================

/// A declaration (item).
struct Decl {
    std::variant<StructDecl, EnumDecl, FuncDecl, ScopeDecl, ReferencingDecl, VarDecl, ExprDecl>
        kind;
    SourceSpan span;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        if (!is<T>()) {
            throw std::bad_variant_access();
        }
        return std::get<T>(kind);
    }
};

/// The name a declaration introduces, or `std::nullopt` for imports and
/// top-level expressions.
[[nodiscard]] auto decl_name(const Decl& decl) -> std::optional<std::string>;

/// The span of the name a declaration introduces (the whole span if none).
[[nodiscard]] auto decl_name_span(const Decl& decl) -> SourceSpan;

/// A parsed source file.
struct Program {
    std::string name;
    std::vector<DeclPtr> items;
    SourceSpan span;
};

} // namespace yuho::parser

#endif // YUHO_PARSER_AST_DECLS_HPP
