//! # Abstract Syntax Tree (AST)
//!
//! The tree produced by the parser and consumed by the pretty printer, the
//! module resolver and the semantic analyzer.
//!
//! ## Architecture
//!
//! Each node category is a closed `std::variant`, dispatched with
//! `std::visit` or the `is<T>()` / `as<T>()` helpers:
//!
//! - **Types**: Type annotations (`Type`)
//! - **Patterns**: Match-case patterns (`Pattern`)
//! - **Expressions**: Value-producing constructs (`Expr`)
//! - **Statements**: Function body statements (`Stmt`)
//! - **Declarations**: Items of a module or scope block (`Decl`)
//!
//! ## Source Spans
//!
//! Every node carries a `SourceSpan` covering its children's spans.
//!
//! ## Traversal
//!
//! `for_each_expr` walks every expression below a node in pre-order;
//! `collect_identifiers` gathers the names an expression refers to. Both
//! serve the resolver (reference graph) and the analyzer.

#ifndef YUHO_PARSER_AST_HPP
#define YUHO_PARSER_AST_HPP

#include "ast_common.hpp"
#include "ast_decls.hpp"
#include "ast_exprs.hpp"
#include "ast_patterns.hpp"
#include "ast_stmts.hpp"
#include "ast_types.hpp"

#include <functional>

namespace yuho::parser {

// ============================================================================
// AST Utilities
// ============================================================================

/// Creates a literal expression from a token.
auto make_literal_expr(lexer::Token token) -> ExprPtr;

/// Creates an identifier expression.
auto make_ident_expr(std::string name, SourceSpan span) -> ExprPtr;

/// Creates a binary expression spanning both operands.
auto make_binary_expr(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr;

/// Creates a unary expression.
auto make_unary_expr(UnaryOp op, ExprPtr operand, SourceSpan span) -> ExprPtr;

/// Creates a named type.
auto make_named_type(std::string name, SourceSpan span) -> TypePtr;

/// Creates a wildcard pattern.
auto make_wildcard_pattern(SourceSpan span) -> PatternPtr;

// ============================================================================
// Traversal
// ============================================================================

using ExprVisitor = std::function<void(const Expr&)>;

/// Visits `expr` and every expression nested in it, parents first.
/// Patterns are not expressions and are not visited.
void for_each_expr(const Expr& expr, const ExprVisitor& visit);

void for_each_expr(const Stmt& stmt, const ExprVisitor& visit);

/// Visits every expression of a declaration, descending into function
/// bodies and scope blocks.
void for_each_expr(const Decl& decl, const ExprVisitor& visit);

/// Names of all identifier expressions below `expr`, in source order,
/// without duplicates. For `Enum.Variant` only the base `Enum` is listed.
[[nodiscard]] auto collect_identifiers(const Expr& expr) -> std::vector<std::string>;

/// Same as above over a whole declaration.
[[nodiscard]] auto collect_identifiers(const Decl& decl) -> std::vector<std::string>;

// ============================================================================
// Structural Dump
// ============================================================================

/// S-expression rendering of a program that ignores spans.
///
/// Two programs are structurally equal exactly when their dumps are equal;
/// round-trip tests and `yuhoc parse --ast` use it.
[[nodiscard]] auto dump_ast(const Program& program) -> std::string;

[[nodiscard]] auto dump_expr(const Expr& expr) -> std::string;

} // namespace yuho::parser

#endif // YUHO_PARSER_AST_HPP
