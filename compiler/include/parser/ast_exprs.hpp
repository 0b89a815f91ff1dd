//! # Expression AST Nodes
//!
//! Value-producing constructs.
//!
//! ## Expression Categories
//!
//! - **Literals**: `42`, `3.5`, `"theft"`, `TRUE`, `$1,000.00`, `15%`,
//!   `2024-01-31`, `3 years, 2 months`
//! - **Identifiers**: `offender`, `Verdict`
//! - **Operators**: `-x`, `!guilty`, `a + b`, `p && q`, `p xor q`
//! - **Postfix**: `f(a, b)`, `person.age`, `items[0]`
//! - **Struct literals**: `Person { name := "A", age := 30 }`
//! - **Match-case**: `match x { case 1 := consequence "one"; case _ := pass; }`
//!
//! Parentheses are not represented; the pretty printer re-inserts them from
//! operator precedence.

#ifndef YUHO_PARSER_AST_EXPRS_HPP
#define YUHO_PARSER_AST_EXPRS_HPP

#include "ast_common.hpp"
#include "ast_patterns.hpp"
#include "ast_types.hpp"

namespace yuho::parser {

// ============================================================================
// Literals and Identifiers
// ============================================================================

/// Literal expression. The token carries both the kind and the decoded value.
struct LiteralExpr {
    lexer::Token token;
    SourceSpan span;
};

/// Identifier reference. Resolved by name, never by pointer.
struct IdentExpr {
    std::string name;
    SourceSpan span;
};

// ============================================================================
// Operators
// ============================================================================

enum class UnaryOp {
    Neg, ///< `-x`
    Not, ///< `!x`
};

/// Unary expression: `-amount`, `!guilty`.
struct UnaryExpr {
    UnaryOp op;
    ExprPtr operand;
    SourceSpan span;
};

enum class BinaryOp {
    // Arithmetic
    Add, ///< `+`
    Sub, ///< `-`
    Mul, ///< `*`
    Div, ///< `/`
    Mod, ///< `%`

    // Comparison
    Eq, ///< `==`
    Ne, ///< `!=`
    Lt, ///< `<`
    Le, ///< `<=`
    Gt, ///< `>`
    Ge, ///< `>=`

    // Logical
    And, ///< `&&`
    Or,  ///< `||` inclusive or
    Xor, ///< `xor` exclusive or
};

[[nodiscard]] auto unary_op_to_string(UnaryOp op) -> std::string_view;
[[nodiscard]] auto binary_op_to_string(BinaryOp op) -> std::string_view;

/// Binary expression: `fine * 2`, `age >= 18 && !exempt`.
struct BinaryExpr {
    BinaryOp op;
    ExprPtr left;
    ExprPtr right;
    SourceSpan span;
};

// ============================================================================
// Postfix Expressions
// ============================================================================

/// Function call: `penalty(offence, 2)`.
struct CallExpr {
    ExprPtr callee;
    std::vector<ExprPtr> args;
    SourceSpan span;
};

/// Field access `person.age`, also `Verdict.Guilty` for enum variants.
struct FieldExpr {
    ExprPtr object;
    std::string field;
    SourceSpan field_span;
    SourceSpan span;
};

/// Index expression: `items[0]`.
struct IndexExpr {
    ExprPtr object;
    ExprPtr index;
    SourceSpan span;
};

// ============================================================================
// Struct Literals
// ============================================================================

/// One `name := value` entry of a struct literal.
struct StructFieldInit {
    std::string name;
    ExprPtr value;
    SourceSpan span;
};

/// Struct literal: `Person { name := "A", age := 30 }`.
struct StructExpr {
    std::string name;
    std::vector<StructFieldInit> fields;
    SourceSpan name_span;
    SourceSpan span;
};

// ============================================================================
// Match-Case
// ============================================================================

/// One arm: `case <pattern> [if <guard>] := consequence <expr>` or
/// `case <pattern> := pass`.
struct MatchArm {
    PatternPtr pattern;
    std::optional<ExprPtr> guard;
    std::optional<ExprPtr> consequence; ///< `std::nullopt` for `pass`.
    SourceSpan span;
};

/// Match expression. Without a scrutinee (`match { ... }`) the arms are
/// matched against the Boolean value TRUE.
struct MatchExpr {
    std::optional<ExprPtr> scrutinee;
    std::vector<MatchArm> arms;
    SourceSpan span;
};

// ============================================================================
// Expression Variant
// ============================================================================

/// An expression.
struct Expr {
    std::variant<LiteralExpr, IdentExpr, UnaryExpr, BinaryExpr, CallExpr, FieldExpr, IndexExpr,
                 StructExpr, MatchExpr>
        kind;
    SourceSpan span;

    /// Checks if this expression is of kind `T`.
    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    /// Gets this expression as kind `T`. Throws `std::bad_variant_access` if wrong kind.
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

#endif // YUHO_PARSER_AST_EXPRS_HPP
