//! # Parser
//!
//! Recursive-descent parser turning a token stream into a `Program`.
//! Expressions use precedence climbing (Pratt parsing).
//!
//! ## Operator Precedence (lowest to highest)
//!
//! | Level        | Operators                  |
//! |--------------|----------------------------|
//! | `OR`         | `\|\|` `xor`               |
//! | `AND`        | `&&`                       |
//! | `EQUALITY`   | `==` `!=`                  |
//! | `RELATIONAL` | `<` `<=` `>` `>=`          |
//! | `TERM`       | `+` `-`                    |
//! | `FACTOR`     | `*` `/` `%`                |
//! | `UNARY`      | prefix `!` `-`             |
//! | `POSTFIX`    | `.field` `[index]` `(args)`|
//!
//! All binary operators are left-associative.
//!
//! ## Error Recovery
//!
//! Errors are collected rather than thrown. A missing `;` is recorded and
//! parsing continues as if it were present. Other errors skip ahead to the
//! next `;`, `}` or item keyword. Errors inside a struct, enum, match,
//! function body or scope block are recovered locally, so the enclosing item
//! survives.
//!
//! Expressions, patterns and scope blocks nest at most `MAX_NESTING_DEPTH`
//! levels deep. Deeper input is a P007 error rather than unbounded
//! recursion.
//!
//! `parse_program` fails if any error was recorded; `parse_program_recovering`
//! always returns the best-effort program together with the errors.
//!
//! The parser owns its cursor state and performs no I/O: `referencing`
//! items are plain nodes handed to the module resolver.

#ifndef YUHO_PARSER_PARSER_HPP
#define YUHO_PARSER_PARSER_HPP

#include "common.hpp"
#include "common/diagnostic.hpp"
#include "lexer/lexer.hpp"
#include "parser/ast.hpp"

#include <vector>

namespace yuho::parser {

// Operator precedence levels (higher = tighter binding)
namespace precedence {
constexpr int NONE = 0;
constexpr int OR = 1;         // ||, xor
constexpr int AND = 2;        // &&
constexpr int EQUALITY = 3;   // ==, !=
constexpr int RELATIONAL = 4; // <, <=, >, >=
constexpr int TERM = 5;       // +, -
constexpr int FACTOR = 6;     // *, /, %
constexpr int UNARY = 7;      // -, !
constexpr int POSTFIX = 8;    // (), [], .
} // namespace precedence

/// Binding strength of a binary operator, shared with the pretty printer.
[[nodiscard]] auto binary_precedence(BinaryOp op) -> int;

// Parser error
struct ParseError {
    std::string message;
    std::string code;     ///< P001 ... P007
    std::string expected; ///< What the grammar wanted, e.g. "';'"
    std::string found;    ///< What was there, e.g. "'}'" or "end of input"
    SourceSpan span;
    std::vector<std::string> notes;

    [[nodiscard]] auto to_diagnostic() const -> Diagnostic;
};

/// A program plus the errors recorded while parsing it.
struct ParseOutcome {
    Program program;
    std::vector<ParseError> errors;
};

// Parser for Yuho source code
class Parser {
public:
    static constexpr size_t MAX_NESTING_DEPTH = 256;

    /// Comment tokens are dropped; an end-of-input token is appended if missing.
    explicit Parser(std::vector<lexer::Token> tokens);

    // Parse entire file; fails if any error was recorded
    [[nodiscard]] auto parse_program(const std::string& name)
        -> Result<Program, std::vector<ParseError>>;

    // Parse entire file, keeping whatever parsed
    [[nodiscard]] auto parse_program_recovering(const std::string& name) -> ParseOutcome;

    // Parse single item (for testing)
    [[nodiscard]] auto parse_decl() -> Result<DeclPtr, ParseError>;

    // Parse single expression (for testing)
    [[nodiscard]] auto parse_expr() -> Result<ExprPtr, ParseError>;

    // Parse single statement (for testing)
    [[nodiscard]] auto parse_stmt() -> Result<StmtPtr, ParseError>;

    [[nodiscard]] auto parse_type() -> Result<TypePtr, ParseError>;
    [[nodiscard]] auto parse_pattern() -> Result<PatternPtr, ParseError>;

    // Get all errors
    [[nodiscard]] auto errors() const -> const std::vector<ParseError>& {
        return errors_;
    }

    // Check if any errors occurred
    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

private:
    std::vector<lexer::Token> tokens_;
    size_t pos_ = 0;
    std::vector<ParseError> errors_;
    bool allow_struct_literal_ = true;
    size_t depth_ = 0;

    // Holds one nesting level for the duration of a recursive parse call
    class NestingGuard {
    public:
        explicit NestingGuard(size_t& depth) : level_(depth) {
            ++level_;
        }
        ~NestingGuard() {
            --level_;
        }
        NestingGuard(const NestingGuard&) = delete;
        auto operator=(const NestingGuard&) -> NestingGuard& = delete;

    private:
        size_t& level_;
    };

    // Token access
    [[nodiscard]] auto peek() const -> const lexer::Token&;
    [[nodiscard]] auto peek_next() const -> const lexer::Token&;
    [[nodiscard]] auto peek_at(size_t offset) const -> const lexer::Token&;
    [[nodiscard]] auto previous() const -> const lexer::Token&;
    auto advance() -> const lexer::Token&;
    [[nodiscard]] auto is_at_end() const -> bool;
    [[nodiscard]] auto check(lexer::TokenKind kind) const -> bool;
    [[nodiscard]] auto check_next(lexer::TokenKind kind) const -> bool;
    auto match(lexer::TokenKind kind) -> bool;
    auto expect(lexer::TokenKind kind, const std::string& expected)
        -> Result<lexer::Token, ParseError>;

    // Error handling
    [[nodiscard]] auto error_here(const char* code, const std::string& expected) const
        -> ParseError;
    [[nodiscard]] auto nesting_error(const std::string& what) const -> ParseError;
    void report_error(ParseError error);
    void expect_terminator(const std::string& after);
    void synchronize();
    void synchronize_to_brace();
    void synchronize_to_arm();
    [[nodiscard]] static auto describe(const lexer::Token& token) -> std::string;
    [[nodiscard]] static auto starts_item(lexer::TokenKind kind) -> bool;

    // Program and block structure
    auto parse_items_until_eof(const std::string& name) -> Program;
    auto parse_item(bool top_level) -> Result<DeclPtr, ParseError>;

    // Declaration parsing
    auto parse_struct_decl() -> Result<DeclPtr, ParseError>;
    auto parse_enum_decl() -> Result<DeclPtr, ParseError>;
    auto parse_func_decl() -> Result<DeclPtr, ParseError>;
    auto parse_func_params() -> Result<std::vector<FuncParam>, ParseError>;
    auto parse_scope_decl() -> Result<DeclPtr, ParseError>;
    auto parse_referencing_decl() -> Result<DeclPtr, ParseError>;
    auto parse_var_decl() -> Result<VarDecl, ParseError>;
    [[nodiscard]] auto looks_like_var_decl() const -> bool;

    // Statement parsing
    auto parse_block() -> Result<std::vector<StmtPtr>, ParseError>;
    auto parse_return_stmt() -> Result<StmtPtr, ParseError>;

    // Expression parsing (Pratt parser)
    auto parse_expr_with_precedence(int min_precedence) -> Result<ExprPtr, ParseError>;
    auto parse_prefix_expr() -> Result<ExprPtr, ParseError>;
    auto parse_primary_expr() -> Result<ExprPtr, ParseError>;
    auto parse_postfix_expr(ExprPtr left) -> Result<ExprPtr, ParseError>;
    auto parse_call_args() -> Result<std::vector<ExprPtr>, ParseError>;
    auto parse_struct_expr() -> Result<ExprPtr, ParseError>;
    auto parse_match_expr() -> Result<ExprPtr, ParseError>;
    auto parse_match_arm() -> Result<MatchArm, ParseError>;
    [[nodiscard]] auto looks_like_struct_literal() const -> bool;

    // Pattern parsing
    auto parse_struct_pattern(std::string name, SourceSpan start) -> Result<PatternPtr, ParseError>;

    // Precedence
    [[nodiscard]] static auto get_precedence(lexer::TokenKind kind) -> int;
    [[nodiscard]] static auto token_to_binary_op(lexer::TokenKind kind) -> std::optional<BinaryOp>;
    [[nodiscard]] static auto token_to_unary_op(lexer::TokenKind kind) -> std::optional<UnaryOp>;
    [[nodiscard]] static auto token_to_primitive(lexer::TokenKind kind)
        -> std::optional<PrimitiveKind>;
};

} // namespace yuho::parser

#endif // YUHO_PARSER_PARSER_HPP
