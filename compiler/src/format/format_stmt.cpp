//! # Statement Formatting
//!
//! | Statement    | Output              |
//! |--------------|---------------------|
//! | `VarDecl`    | `type name := e;`   |
//! | `ReturnStmt` | `return e;`         |
//! | `PassStmt`   | `pass;`             |
//! | `ExprStmt`   | `e;` (no `;` after a match) |

#include "format/formatter.hpp"

namespace yuho::format {

void Formatter::format_stmt(const parser::Stmt& stmt) {
    if (stmt.is<parser::VarDecl>()) {
        format_var_decl(stmt.as<parser::VarDecl>());
    } else if (stmt.is<parser::ReturnStmt>()) {
        const auto& ret = stmt.as<parser::ReturnStmt>();
        emit_line(ret.value ? "return " + format_expr(**ret.value) + ";" : "return;");
    } else if (stmt.is<parser::PassStmt>()) {
        emit_line("pass;");
    } else if (stmt.is<parser::ExprStmt>()) {
        const auto& expr = *stmt.as<parser::ExprStmt>().expr;
        emit_line(format_expr(expr) + (expr.is<parser::MatchExpr>() ? "" : ";"));
    }
}

} // namespace yuho::format
