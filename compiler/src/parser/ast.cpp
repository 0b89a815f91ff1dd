//! # AST Factory Functions and Helpers
//!
//! | Function                | Creates / Returns              |
//! |-------------------------|--------------------------------|
//! | `make_literal_expr`     | Literal from token             |
//! | `make_ident_expr`       | Identifier expression          |
//! | `make_binary_expr`      | Binary operation               |
//! | `make_unary_expr`       | Unary operation                |
//! | `make_named_type`       | Named type (e.g., `Person`)    |
//! | `make_wildcard_pattern` | Wildcard `_` pattern           |
//! | `decl_name`             | Name introduced by an item     |
//!
//! These functions wrap node construction in `Box<T>` for proper ownership.

#include "parser/ast.hpp"

namespace yuho::parser {

auto make_literal_expr(lexer::Token token) -> ExprPtr {
    auto span = token.span;
    return make_box<Expr>(
        Expr{.kind = LiteralExpr{.token = std::move(token), .span = span}, .span = span});
}

auto make_ident_expr(std::string name, SourceSpan span) -> ExprPtr {
    return make_box<Expr>(
        Expr{.kind = IdentExpr{.name = std::move(name), .span = span}, .span = span});
}

auto make_binary_expr(BinaryOp op, ExprPtr left, ExprPtr right) -> ExprPtr {
    auto span = SourceSpan::merge(left->span, right->span);
    return make_box<Expr>(Expr{
        .kind =
            BinaryExpr{.op = op, .left = std::move(left), .right = std::move(right), .span = span},
        .span = span});
}

auto make_unary_expr(UnaryOp op, ExprPtr operand, SourceSpan span) -> ExprPtr {
    return make_box<Expr>(Expr{
        .kind = UnaryExpr{.op = op, .operand = std::move(operand), .span = span}, .span = span});
}

auto make_named_type(std::string name, SourceSpan span) -> TypePtr {
    return make_box<Type>(
        Type{.kind = NamedType{.name = std::move(name), .span = span}, .span = span});
}

auto make_wildcard_pattern(SourceSpan span) -> PatternPtr {
    return make_box<Pattern>(Pattern{.kind = WildcardPattern{.span = span}, .span = span});
}

// ============================================================================
// Operator and Type Names
// ============================================================================

auto primitive_kind_to_string(PrimitiveKind kind) -> std::string_view {
    switch (kind) {
    case PrimitiveKind::Int:
        return "int";
    case PrimitiveKind::Float:
        return "float";
    case PrimitiveKind::Bool:
        return "bool";
    case PrimitiveKind::String:
        return "string";
    case PrimitiveKind::Money:
        return "money";
    case PrimitiveKind::Date:
        return "date";
    case PrimitiveKind::Duration:
        return "duration";
    case PrimitiveKind::Percent:
        return "percent";
    }
    return "?";
}

auto unary_op_to_string(UnaryOp op) -> std::string_view {
    return op == UnaryOp::Neg ? "-" : "!";
}

auto binary_op_to_string(BinaryOp op) -> std::string_view {
    switch (op) {
    case BinaryOp::Add:
        return "+";
    case BinaryOp::Sub:
        return "-";
    case BinaryOp::Mul:
        return "*";
    case BinaryOp::Div:
        return "/";
    case BinaryOp::Mod:
        return "%";
    case BinaryOp::Eq:
        return "==";
    case BinaryOp::Ne:
        return "!=";
    case BinaryOp::Lt:
        return "<";
    case BinaryOp::Le:
        return "<=";
    case BinaryOp::Gt:
        return ">";
    case BinaryOp::Ge:
        return ">=";
    case BinaryOp::And:
        return "&&";
    case BinaryOp::Or:
        return "||";
    case BinaryOp::Xor:
        return "xor";
    }
    return "?";
}

// ============================================================================
// Declaration Helpers
// ============================================================================

auto ReferencingDecl::module_name() const -> std::string {
    std::string result;
    for (size_t i = 0; i < module_path.size(); ++i) {
        if (i > 0) {
            result += '.';
        }
        result += module_path[i];
    }
    return result;
}

auto decl_name(const Decl& decl) -> std::optional<std::string> {
    return std::visit(
        [](const auto& d) -> std::optional<std::string> {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, ReferencingDecl> || std::is_same_v<T, ExprDecl>) {
                return std::nullopt;
            } else {
                return d.name;
            }
        },
        decl.kind);
}

auto decl_name_span(const Decl& decl) -> SourceSpan {
    return std::visit(
        [&decl](const auto& d) -> SourceSpan {
            using T = std::decay_t<decltype(d)>;
            if constexpr (std::is_same_v<T, ReferencingDecl> || std::is_same_v<T, ExprDecl>) {
                return decl.span;
            } else {
                return d.name_span;
            }
        },
        decl.kind);
}

} // namespace yuho::parser
