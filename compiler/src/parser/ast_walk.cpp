//! # AST Traversal
//!
//! Pre-order expression walks shared by the resolver and the analyzer.

#include "parser/ast.hpp"

#include <algorithm>

namespace yuho::parser {

void for_each_expr(const Expr& expr, const ExprVisitor& visit) {
    visit(expr);
    std::visit(
        [&visit](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, UnaryExpr>) {
                for_each_expr(*e.operand, visit);
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                for_each_expr(*e.left, visit);
                for_each_expr(*e.right, visit);
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                for_each_expr(*e.callee, visit);
                for (const auto& arg : e.args) {
                    for_each_expr(*arg, visit);
                }
            } else if constexpr (std::is_same_v<T, FieldExpr>) {
                for_each_expr(*e.object, visit);
            } else if constexpr (std::is_same_v<T, IndexExpr>) {
                for_each_expr(*e.object, visit);
                for_each_expr(*e.index, visit);
            } else if constexpr (std::is_same_v<T, StructExpr>) {
                for (const auto& field : e.fields) {
                    for_each_expr(*field.value, visit);
                }
            } else if constexpr (std::is_same_v<T, MatchExpr>) {
                if (e.scrutinee) {
                    for_each_expr(**e.scrutinee, visit);
                }
                for (const auto& arm : e.arms) {
                    if (arm.guard) {
                        for_each_expr(**arm.guard, visit);
                    }
                    if (arm.consequence) {
                        for_each_expr(**arm.consequence, visit);
                    }
                }
            }
        },
        expr.kind);
}

void for_each_expr(const Stmt& stmt, const ExprVisitor& visit) {
    std::visit(
        [&visit](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, VarDecl>) {
                if (s.init) {
                    for_each_expr(**s.init, visit);
                }
            } else if constexpr (std::is_same_v<T, ReturnStmt>) {
                if (s.value) {
                    for_each_expr(**s.value, visit);
                }
            } else if constexpr (std::is_same_v<T, ExprStmt>) {
                for_each_expr(*s.expr, visit);
            }
        },
        stmt.kind);
}

void for_each_expr(const Decl& decl, const ExprVisitor& visit) {
    std::visit(
        [&visit](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, FuncDecl>) {
                for (const auto& stmt : d.body) {
                    for_each_expr(*stmt, visit);
                }
            } else if constexpr (std::is_same_v<T, ScopeDecl>) {
                for (const auto& item : d.items) {
                    for_each_expr(*item, visit);
                }
            } else if constexpr (std::is_same_v<T, VarDecl>) {
                if (d.init) {
                    for_each_expr(**d.init, visit);
                }
            } else if constexpr (std::is_same_v<T, ExprDecl>) {
                for_each_expr(*d.expr, visit);
            }
        },
        decl.kind);
}

namespace {

auto identifier_collector(std::vector<std::string>& names) -> ExprVisitor {
    return [&names](const Expr& e) {
        const std::string* name = nullptr;
        if (e.is<IdentExpr>()) {
            name = &e.as<IdentExpr>().name;
        } else if (e.is<StructExpr>()) {
            name = &e.as<StructExpr>().name;
        }
        if (name && std::find(names.begin(), names.end(), *name) == names.end()) {
            names.push_back(*name);
        }
    };
}

} // namespace

auto collect_identifiers(const Expr& expr) -> std::vector<std::string> {
    std::vector<std::string> names;
    for_each_expr(expr, identifier_collector(names));
    return names;
}

auto collect_identifiers(const Decl& decl) -> std::vector<std::string> {
    std::vector<std::string> names;
    for_each_expr(decl, identifier_collector(names));
    return names;
}

} // namespace yuho::parser
