//! # Type Annotation AST Nodes
//!
//! Type annotations as written in source, before any resolution.
//!
//! | Syntax              | Node            |
//! |---------------------|-----------------|
//! | `int`, `money`, ... | `PrimitiveType` |
//! | `Person`            | `NamedType`     |
//! | `int \|\| string`   | `UnionType`     |
//!
//! A `NamedType` only records the name; whether it denotes a struct or an
//! enum is decided by the semantic analyzer.

#ifndef YUHO_PARSER_AST_TYPES_HPP
#define YUHO_PARSER_AST_TYPES_HPP

#include "ast_common.hpp"

namespace yuho::parser {

/// The built-in scalar types of the language.
enum class PrimitiveKind {
    Int,
    Float,
    Bool,
    String,
    Money,
    Date,
    Duration,
    Percent,
};

/// Canonical source spelling of a primitive (`int`, `bool`, ...).
[[nodiscard]] auto primitive_kind_to_string(PrimitiveKind kind) -> std::string_view;

/// A built-in type keyword.
struct PrimitiveType {
    PrimitiveKind kind;
    SourceSpan span;
};

/// A user-defined type referenced by name.
struct NamedType {
    std::string name;
    SourceSpan span;
};

/// A union of two or more member types: `int || string`.
struct UnionType {
    std::vector<TypePtr> members;
    SourceSpan span;
};

/// A type annotation.
struct Type {
    std::variant<PrimitiveType, NamedType, UnionType> kind;
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

} // namespace yuho::parser

#endif // YUHO_PARSER_AST_TYPES_HPP
