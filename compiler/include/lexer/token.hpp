//! # Token Definitions
//!
//! Token kinds and literal payloads produced by the Yuho lexer.
//!
//! ## Overview
//!
//! | Group        | Examples                                              |
//! |--------------|-------------------------------------------------------|
//! | Literals     | `42`, `3.5`, `"text"`, `TRUE`                         |
//! | Legal values | `$1,000.00`, `15%`, `2024-01-31`, `3 years, 2 months` |
//! | Keywords     | `struct`, `scope`, `match`, `case`, `referencing`     |
//! | Type names   | `int`, `money`, `date`, `duration`, `percent`         |
//! | Operators    | `:=`, `==`, `&&`, `\|\|`, `xor`                        |
//!
//! Fine-grained `TokenKind`s are grouped into the coarse `TokenCategory`
//! used by highlighting tools and test expectations
//! (`int x := 42;` is TYPE, IDENTIFIER, OPERATOR, INTEGER, PUNCTUATION).

#ifndef YUHO_LEXER_TOKEN_HPP
#define YUHO_LEXER_TOKEN_HPP

#include "common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <variant>

namespace yuho::lexer {

/// All token kinds in Yuho.
enum class TokenKind : uint8_t {
    // ========================================================================
    // Special
    // ========================================================================
    Eof,     ///< End of input
    Error,   ///< Malformed input; the error is recorded by the lexer
    Comment, ///< `// ...` or `/* ... */`, only with `keep_comments`

    // ========================================================================
    // Literals
    // ========================================================================
    IntLiteral,      ///< `42`
    FloatLiteral,    ///< `3.14`
    StringLiteral,   ///< `"text"`
    BoolLiteral,     ///< `TRUE`, `FALSE`, `true`, `false`
    MoneyLiteral,    ///< `$1,000.50`, `SGD500`
    PercentLiteral,  ///< `15%`, `2.5%`
    DateLiteral,     ///< `2024-01-31`
    DurationLiteral, ///< `3 years, 2 months`

    // ========================================================================
    // Identifiers
    // ========================================================================
    Identifier, ///< `penalty`, `Offence`
    Underscore, ///< `_` wildcard

    // ========================================================================
    // Keywords
    // ========================================================================
    KwStruct,      ///< `struct`
    KwEnum,        ///< `enum`
    KwFn,          ///< `fn` / `func`
    KwScope,       ///< `scope`
    KwStatute,     ///< `statute`
    KwMatch,       ///< `match`
    KwCase,        ///< `case`
    KwConsequence, ///< `consequence`
    KwPass,        ///< `pass`
    KwReferencing, ///< `referencing` / `import`
    KwFrom,        ///< `from`
    KwExport,      ///< `export`
    KwReturn,      ///< `return`
    KwIf,          ///< `if` (match guard)
    KwWhere,       ///< `where` (match guard)
    KwXor,         ///< `xor` exclusive-or

    // ========================================================================
    // Type Keywords
    // ========================================================================
    KwInt,      ///< `int` / `integer`
    KwFloat,    ///< `float`
    KwBool,     ///< `bool` / `boolean`
    KwString,   ///< `string`
    KwMoney,    ///< `money`
    KwDate,     ///< `date`
    KwDuration, ///< `duration`
    KwPercent,  ///< `percent`

    // ========================================================================
    // Operators
    // ========================================================================
    Assign,  ///< `:=`
    Eq,      ///< `==`
    Ne,      ///< `!=`
    Lt,      ///< `<`
    Le,      ///< `<=`
    Gt,      ///< `>`
    Ge,      ///< `>=`
    Plus,    ///< `+`
    Minus,   ///< `-`
    Star,    ///< `*`
    Slash,   ///< `/`
    Percent, ///< `%` remainder
    Bang,    ///< `!`
    AndAnd,  ///< `&&`
    OrOr,    ///< `||`
    Dot,     ///< `.`
    Colon,   ///< `:`

    // ========================================================================
    // Delimiters
    // ========================================================================
    LParen,   ///< `(`
    RParen,   ///< `)`
    LBrace,   ///< `{`
    RBrace,   ///< `}`
    LBracket, ///< `[`
    RBracket, ///< `]`
    Comma,    ///< `,`
    Semi,     ///< `;`
};

/// Coarse token classification.
enum class TokenCategory : uint8_t {
    Identifier,
    Keyword,
    Type,
    Integer,
    Float,
    String,
    Boolean,
    Money,
    Percent,
    Date,
    Duration,
    Operator,
    Punctuation,
    Comment,
    EndOfInput,
    Error,
};

// ============================================================================
// Token Utilities
// ============================================================================

/// Display text of a kind: the symbol for operators (`:=`), the word for
/// keywords (`struct`), a description for literals (`money literal`).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

[[nodiscard]] auto token_category(TokenKind kind) -> TokenCategory;

/// Upper-case category name: `TYPE`, `IDENTIFIER`, `INTEGER`, ...
[[nodiscard]] auto token_category_to_string(TokenCategory category) -> std::string_view;

[[nodiscard]] auto is_keyword(TokenKind kind) -> bool;
[[nodiscard]] auto is_type_keyword(TokenKind kind) -> bool;
[[nodiscard]] auto is_literal(TokenKind kind) -> bool;
[[nodiscard]] auto is_operator(TokenKind kind) -> bool;

// ============================================================================
// Literal Value Types
// ============================================================================

struct IntValue {
    int64_t value;
};

struct FloatValue {
    double value;
};

/// String literal with escapes processed.
struct StringValue {
    std::string value;
};

/// Money in minor units (cents) so arithmetic in later stages stays exact.
struct MoneyValue {
    int64_t minor_units;
    std::string currency; ///< Prefix as written: `$`, `£`, `SGD`, ...

    [[nodiscard]] auto operator==(const MoneyValue& other) const -> bool = default;
};

/// A percentage as written: `15%` is 15.0.
struct PercentValue {
    double value;
};

/// A validated calendar date.
struct DateValue {
    int32_t year;
    uint8_t month;
    uint8_t day;

    [[nodiscard]] auto operator==(const DateValue& other) const -> bool = default;
};

/// Sum of the components of a duration literal.
struct DurationValue {
    int64_t years = 0;
    int64_t months = 0;
    int64_t weeks = 0;
    int64_t days = 0;
    int64_t hours = 0;
    int64_t minutes = 0;
    int64_t seconds = 0;

    [[nodiscard]] auto operator==(const DurationValue& other) const -> bool = default;
};

// ============================================================================
// Token
// ============================================================================

/// A lexical token.
///
/// For `int x := 42;` the lexer produces `KwInt`, `Identifier`, `Assign`,
/// `IntLiteral` (value `IntValue{42}`) and `Semi`, then `Eof`.
///
/// `lexeme` views the owning `Source`.
struct Token {
    TokenKind kind;
    SourceSpan span;
    std::string_view lexeme;

    /// Literal payload; `std::monostate` for everything but literals.
    std::variant<std::monostate, IntValue, FloatValue, StringValue, bool, MoneyValue, PercentValue,
                 DateValue, DurationValue>
        value;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    [[nodiscard]] auto is_error() const -> bool {
        return kind == TokenKind::Error;
    }

    [[nodiscard]] auto category() const -> TokenCategory {
        return token_category(kind);
    }

    // Value accessors throw std::bad_variant_access on the wrong kind.
    [[nodiscard]] auto int_value() const -> int64_t;
    [[nodiscard]] auto float_value() const -> double;
    [[nodiscard]] auto string_value() const -> const std::string&;
    [[nodiscard]] auto bool_value() const -> bool;
    [[nodiscard]] auto money_value() const -> const MoneyValue&;
    [[nodiscard]] auto percent_value() const -> double;
    [[nodiscard]] auto date_value() const -> const DateValue&;
    [[nodiscard]] auto duration_value() const -> const DurationValue&;
};

} // namespace yuho::lexer

#endif // YUHO_LEXER_TOKEN_HPP
