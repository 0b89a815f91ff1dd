//! # Pattern AST Nodes
//!
//! Patterns appear on the left of a match arm: `case <pattern> := ...`.
//!
//! | Pattern            | Example                  | Matches                        |
//! |--------------------|--------------------------|--------------------------------|
//! | `WildcardPattern`  | `_`                      | Anything                       |
//! | `LiteralPattern`   | `TRUE`, `42`, `-1`, `$5` | An equal constant              |
//! | `IdentPattern`     | `amount`                 | Anything, binding it by name   |
//! | `QualifiedPattern` | `Verdict.Guilty`         | One enum variant               |
//! | `StructPattern`    | `Offence { severity }`   | A struct, destructuring fields |
//!
//! A bare identifier that names a variant of the scrutinee's enum is treated
//! as that variant by the analyzer, not as a binding.

#ifndef YUHO_PARSER_AST_PATTERNS_HPP
#define YUHO_PARSER_AST_PATTERNS_HPP

#include "ast_common.hpp"

namespace yuho::parser {

/// Wildcard pattern: `_`.
struct WildcardPattern {
    SourceSpan span;
};

/// Literal pattern. `negated` is set for `-1` and `-2.5`.
struct LiteralPattern {
    lexer::Token literal;
    bool negated = false;
    SourceSpan span;
};

/// Binding pattern: `amount`.
struct IdentPattern {
    std::string name;
    SourceSpan span;
};

/// Enum variant pattern: `Verdict.Guilty`.
struct QualifiedPattern {
    std::string type_name;
    std::string variant;
    SourceSpan span;
};

/// One field of a struct pattern; `Offence { severity }` binds the field
/// to a name of the same spelling.
struct FieldPattern {
    std::string name;
    std::optional<PatternPtr> pattern;
    SourceSpan span;
};

/// Struct destructuring pattern: `Offence { severity: 3, kind }`.
struct StructPattern {
    std::string name;
    std::vector<FieldPattern> fields;
    SourceSpan span;
};

/// A pattern.
struct Pattern {
    std::variant<WildcardPattern, LiteralPattern, IdentPattern, QualifiedPattern, StructPattern>
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

} // namespace yuho::parser

#endif // YUHO_PARSER_AST_PATTERNS_HPP
