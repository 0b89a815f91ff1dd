//! # Statement AST Nodes
//!
//! Statements make up function bodies.
//!
//! | Statement    | Example                      |
//! |--------------|------------------------------|
//! | `VarDecl`    | `money fine := $500.00;`     |
//! | `ReturnStmt` | `return fine * 2;`           |
//! | `PassStmt`   | `pass;`                      |
//! | `ExprStmt`   | `match x { ... }`, `f(x);`   |
//!
//! `VarDecl` is shared with the item level, where it declares a module or
//! scope constant.

#ifndef YUHO_PARSER_AST_STMTS_HPP
#define YUHO_PARSER_AST_STMTS_HPP

#include "ast_common.hpp"
#include "ast_exprs.hpp"
#include "ast_types.hpp"

namespace yuho::parser {

/// Typed variable declaration: `int x := 42;` or `string name;`.
struct VarDecl {
    TypePtr type;
    std::string name;
    std::optional<ExprPtr> init;
    SourceSpan name_span;
    SourceSpan span;
};

/// `return <expr>;` or `return;`.
struct ReturnStmt {
    std::optional<ExprPtr> value;
    SourceSpan span;
};

/// `pass;`, an explicit no-op.
struct PassStmt {
    SourceSpan span;
};

/// Expression evaluated as a statement.
struct ExprStmt {
    ExprPtr expr;
    SourceSpan span;
};

/// A statement.
struct Stmt {
    std::variant<VarDecl, ReturnStmt, PassStmt, ExprStmt> kind;
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

#endif // YUHO_PARSER_AST_STMTS_HPP
