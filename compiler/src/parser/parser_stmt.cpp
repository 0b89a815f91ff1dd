//! # Parser - Statements
//!
//! Function bodies.
//!
//! | Form              | Statement    |
//! |-------------------|--------------|
//! | `type name := e;` | `VarDecl`    |
//! | `return e;`       | `ReturnStmt` |
//! | `pass;`           | `PassStmt`   |
//! | `match ... { }`   | `ExprStmt`   |
//! | `e;`              | `ExprStmt`   |

#include "parser/parser.hpp"

namespace yuho::parser {

using lexer::TokenKind;

auto Parser::parse_stmt() -> Result<StmtPtr, ParseError> {
    if (check(TokenKind::KwReturn)) {
        return parse_return_stmt();
    }

    if (check(TokenKind::KwPass)) {
        auto span = advance().span;
        expect_terminator("'pass'");
        span = SourceSpan::merge(span, previous().span);
        return make_box<Stmt>(Stmt{.kind = PassStmt{.span = span}, .span = span});
    }

    if (looks_like_var_decl()) {
        auto var = parse_var_decl();
        if (is_err(var))
            return unwrap_err(var);
        auto span = unwrap(var).span;
        return make_box<Stmt>(Stmt{.kind = std::move(unwrap(var)), .span = span});
    }

    // Same rule as at item level: a match statement ends at its `}`.
    auto start_span = peek().span;
    bool is_match = check(TokenKind::KwMatch);
    auto expr = is_match ? parse_match_expr() : parse_expr();
    if (is_err(expr))
        return unwrap_err(expr);

    if (is_match) {
        match(TokenKind::Semi);
    } else {
        expect_terminator("expression");
    }

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Stmt>(
        Stmt{.kind = ExprStmt{.expr = std::move(unwrap(expr)), .span = span}, .span = span});
}

auto Parser::parse_return_stmt() -> Result<StmtPtr, ParseError> {
    auto start_span = advance().span; // return

    std::optional<ExprPtr> value;
    if (!check(TokenKind::Semi) && !check(TokenKind::RBrace)) {
        auto expr = parse_expr();
        if (is_err(expr))
            return unwrap_err(expr);
        value = std::move(unwrap(expr));
    }
    expect_terminator("'return'");

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Stmt>(
        Stmt{.kind = ReturnStmt{.value = std::move(value), .span = span}, .span = span});
}

auto Parser::parse_block() -> Result<std::vector<StmtPtr>, ParseError> {
    auto open = expect(TokenKind::LBrace, "'{' to open function body");
    if (is_err(open))
        return unwrap_err(open);

    std::vector<StmtPtr> stmts;
    while (!check(TokenKind::RBrace) && !is_at_end()) {
        size_t before = pos_;
        auto stmt = parse_stmt();
        if (is_ok(stmt)) {
            stmts.push_back(std::move(unwrap(stmt)));
            continue;
        }
        report_error(std::move(unwrap_err(stmt)));
        synchronize();
        if (pos_ == before && !check(TokenKind::RBrace)) {
            advance();
        }
    }

    auto close = expect(TokenKind::RBrace, "'}' to close function body");
    if (is_err(close))
        return unwrap_err(close);
    return stmts;
}

} // namespace yuho::parser
