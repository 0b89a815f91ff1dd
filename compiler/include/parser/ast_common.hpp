//! # AST Common Types
//!
//! Forward declarations and owning pointer aliases shared by the AST headers.
//!
//! ## Architecture
//!
//! The AST is split into themed headers:
//!
//! - `ast_common.hpp` - Forward declarations and pointer types (this file)
//! - `ast_types.hpp` - Type annotations (`int`, `Person`, `int || string`)
//! - `ast_patterns.hpp` - Match-case patterns (`_`, `TRUE`, `Color.Red`)
//! - `ast_exprs.hpp` - Expressions (`BinaryExpr`, `MatchExpr`, ...)
//! - `ast_stmts.hpp` - Statements inside function bodies
//! - `ast_decls.hpp` - Items (`StructDecl`, `ScopeDecl`, `ReferencingDecl`, ...)
//! - `ast.hpp` - Main header that includes all of the above
//!
//! ## Ownership Model
//!
//! Every child is owned through `Box<T>`, so the AST is a strict tree.
//! Identifiers are stored as names and resolved through the symbol table,
//! never as pointers to the declaration they name.

#ifndef YUHO_PARSER_AST_COMMON_HPP
#define YUHO_PARSER_AST_COMMON_HPP

#include "common.hpp"
#include "lexer/token.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace yuho::parser {

// ============================================================================
// Forward Declarations
// ============================================================================

struct Expr;
struct Stmt;
struct Decl;
struct Pattern;
struct Type;

// ============================================================================
// Pointer Type Aliases
// ============================================================================

/// Owned pointer to an expression node.
using ExprPtr = Box<Expr>;

/// Owned pointer to a statement node.
using StmtPtr = Box<Stmt>;

/// Owned pointer to a declaration node.
using DeclPtr = Box<Decl>;

/// Owned pointer to a pattern node.
using PatternPtr = Box<Pattern>;

/// Owned pointer to a type annotation node.
using TypePtr = Box<Type>;

} // namespace yuho::parser

#endif // YUHO_PARSER_AST_COMMON_HPP
