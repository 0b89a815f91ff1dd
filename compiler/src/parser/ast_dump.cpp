//! # AST Structural Dump
//!
//! Renders an AST as a single-line-per-item S-expression, leaving out every
//! source span. Used for structural comparison in round-trip tests and for
//! `yuhoc parse --ast`.
//!
//! ## Output Format
//!
//! ```text
//! (var int x (lit INTEGER 42))
//! (expr (match _ (arm (lit BOOLEAN TRUE) _ (lit INTEGER 1)) (arm _ _ (lit INTEGER 0))))
//! ```
//!
//! An absent optional child prints as `_`.

#include "parser/ast.hpp"

#include <sstream>

namespace yuho::parser {

namespace {

void dump(std::ostringstream& out, const Type& type);
void dump(std::ostringstream& out, const Pattern& pattern);
void dump(std::ostringstream& out, const Expr& expr);
void dump(std::ostringstream& out, const Stmt& stmt);
void dump(std::ostringstream& out, const Decl& decl);

void dump_literal(std::ostringstream& out, const lexer::Token& token) {
    out << "(lit " << lexer::token_category_to_string(token.category()) << " " << token.lexeme
        << ")";
}

void dump(std::ostringstream& out, const Type& type) {
    std::visit(
        [&out](const auto& t) {
            using T = std::decay_t<decltype(t)>;
            if constexpr (std::is_same_v<T, PrimitiveType>) {
                out << primitive_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, NamedType>) {
                out << t.name;
            } else {
                out << "(union";
                for (const auto& member : t.members) {
                    out << " ";
                    dump(out, *member);
                }
                out << ")";
            }
        },
        type.kind);
}

void dump(std::ostringstream& out, const Pattern& pattern) {
    std::visit(
        [&out](const auto& p) {
            using T = std::decay_t<decltype(p)>;
            if constexpr (std::is_same_v<T, WildcardPattern>) {
                out << "_";
            } else if constexpr (std::is_same_v<T, LiteralPattern>) {
                if (p.negated) {
                    out << "(neg ";
                    dump_literal(out, p.literal);
                    out << ")";
                } else {
                    dump_literal(out, p.literal);
                }
            } else if constexpr (std::is_same_v<T, IdentPattern>) {
                out << "(bind " << p.name << ")";
            } else if constexpr (std::is_same_v<T, QualifiedPattern>) {
                out << "(variant " << p.type_name << " " << p.variant << ")";
            } else {
                out << "(struct-pat " << p.name;
                for (const auto& field : p.fields) {
                    out << " (" << field.name;
                    if (field.pattern) {
                        out << " ";
                        dump(out, **field.pattern);
                    }
                    out << ")";
                }
                out << ")";
            }
        },
        pattern.kind);
}

void dump_optional(std::ostringstream& out, const std::optional<ExprPtr>& expr) {
    if (expr) {
        dump(out, **expr);
    } else {
        out << "_";
    }
}

void dump(std::ostringstream& out, const Expr& expr) {
    std::visit(
        [&out](const auto& e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, LiteralExpr>) {
                dump_literal(out, e.token);
            } else if constexpr (std::is_same_v<T, IdentExpr>) {
                out << e.name;
            } else if constexpr (std::is_same_v<T, UnaryExpr>) {
                out << "(" << unary_op_to_string(e.op) << " ";
                dump(out, *e.operand);
                out << ")";
            } else if constexpr (std::is_same_v<T, BinaryExpr>) {
                out << "(" << binary_op_to_string(e.op) << " ";
                dump(out, *e.left);
                out << " ";
                dump(out, *e.right);
                out << ")";
            } else if constexpr (std::is_same_v<T, CallExpr>) {
                out << "(call ";
                dump(out, *e.callee);
                for (const auto& arg : e.args) {
                    out << " ";
                    dump(out, *arg);
                }
                out << ")";
            } else if constexpr (std::is_same_v<T, FieldExpr>) {
                out << "(. ";
                dump(out, *e.object);
                out << " " << e.field << ")";
            } else if constexpr (std::is_same_v<T, IndexExpr>) {
                out << "(index ";
                dump(out, *e.object);
                out << " ";
                dump(out, *e.index);
                out << ")";
            } else if constexpr (std::is_same_v<T, StructExpr>) {
                out << "(new " << e.name;
                for (const auto& field : e.fields) {
                    out << " (" << field.name << " ";
                    dump(out, *field.value);
                    out << ")";
                }
                out << ")";
            } else {
                out << "(match ";
                dump_optional(out, e.scrutinee);
                for (const auto& arm : e.arms) {
                    out << " (arm ";
                    dump(out, *arm.pattern);
                    out << " ";
                    dump_optional(out, arm.guard);
                    out << " ";
                    if (arm.consequence) {
                        dump(out, **arm.consequence);
                    } else {
                        out << "pass";
                    }
                    out << ")";
                }
                out << ")";
            }
        },
        expr.kind);
}

void dump_var(std::ostringstream& out, const VarDecl& var) {
    out << "(var ";
    dump(out, *var.type);
    out << " " << var.name << " ";
    dump_optional(out, var.init);
    out << ")";
}

void dump(std::ostringstream& out, const Stmt& stmt) {
    std::visit(
        [&out](const auto& s) {
            using T = std::decay_t<decltype(s)>;
            if constexpr (std::is_same_v<T, VarDecl>) {
                dump_var(out, s);
            } else if constexpr (std::is_same_v<T, ReturnStmt>) {
                out << "(return ";
                dump_optional(out, s.value);
                out << ")";
            } else if constexpr (std::is_same_v<T, PassStmt>) {
                out << "(pass)";
            } else {
                out << "(expr ";
                dump(out, *s.expr);
                out << ")";
            }
        },
        stmt.kind);
}

void dump(std::ostringstream& out, const Decl& decl) {
    std::visit(
        [&out](const auto& d) {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, StructDecl>) {
                out << "(struct " << d.name;
                for (const auto& field : d.fields) {
                    out << " (";
                    dump(out, *field.type);
                    out << " " << field.name << ")";
                }
                out << ")";
            } else if constexpr (std::is_same_v<T, EnumDecl>) {
                out << "(enum " << d.name;
                for (const auto& variant : d.variants) {
                    out << " " << variant.name;
                }
                out << ")";
            } else if constexpr (std::is_same_v<T, FuncDecl>) {
                out << "(fn " << d.name << " (";
                for (size_t i = 0; i < d.params.size(); ++i) {
                    if (i > 0) {
                        out << " ";
                    }
                    out << "(";
                    dump(out, *d.params[i].type);
                    out << " " << d.params[i].name << ")";
                }
                out << ") ";
                if (d.return_type) {
                    dump(out, **d.return_type);
                } else {
                    out << "_";
                }
                for (const auto& stmt : d.body) {
                    out << " ";
                    dump(out, *stmt);
                }
                out << ")";
            } else if constexpr (std::is_same_v<T, ScopeDecl>) {
                out << (d.kind == ScopeKind::Statute ? "(statute " : "(scope ") << d.name;
                if (d.title) {
                    out << " \"" << *d.title << "\"";
                }
                for (const auto& item : d.items) {
                    out << " ";
                    dump(out, *item);
                }
                out << ")";
            } else if constexpr (std::is_same_v<T, ReferencingDecl>) {
                out << (d.is_export ? "(export-referencing" : "(referencing");
                for (const auto& name : d.names) {
                    out << " " << name.name;
                }
                out << " from " << d.module_name() << ")";
            } else if constexpr (std::is_same_v<T, VarDecl>) {
                dump_var(out, d);
            } else {
                out << "(expr ";
                dump(out, *d.expr);
                out << ")";
            }
        },
        decl.kind);
}

} // namespace

auto dump_ast(const Program& program) -> std::string {
    std::ostringstream out;
    for (const auto& item : program.items) {
        dump(out, *item);
        out << "\n";
    }
    return out.str();
}

auto dump_expr(const Expr& expr) -> std::string {
    std::ostringstream out;
    dump(out, expr);
    return out.str();
}

} // namespace yuho::parser
