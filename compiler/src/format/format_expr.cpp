//! # Expression Formatting
//!
//! | Category     | Expressions                                   |
//! |--------------|-----------------------------------------------|
//! | Literals     | Printed exactly as written (`$1,000.00`, `15%`) |
//! | Operators    | Binary with spaces (`a + b`), unary (`-x`, `!p`) |
//! | Access       | Field (`x.y`), Index (`x[i]`), Call (`f(a)`)  |
//! | Constructors | `Person { name := "A", age := 30 }`           |
//! | Match-case   | One arm per line, closing brace aligned       |
//!
//! ## Parenthesization
//!
//! A binary operand is wrapped when it binds looser than its parent, or as
//! tightly on the right-hand side (all operators are left-associative). A
//! match in leading position is wrapped so it is not read as a statement,
//! and a scrutinee holding a struct literal is wrapped so its braces are
//! not taken for the match body.

#include "format/formatter.hpp"
#include "parser/parser.hpp"

namespace yuho::format {

auto Formatter::format_expr(const parser::Expr& expr) -> std::string {
    if (expr.is<parser::LiteralExpr>()) {
        return format_literal(expr.as<parser::LiteralExpr>());
    } else if (expr.is<parser::IdentExpr>()) {
        return expr.as<parser::IdentExpr>().name;
    } else if (expr.is<parser::BinaryExpr>()) {
        return format_binary(expr.as<parser::BinaryExpr>());
    } else if (expr.is<parser::UnaryExpr>()) {
        return format_unary(expr.as<parser::UnaryExpr>());
    } else if (expr.is<parser::CallExpr>()) {
        return format_call(expr.as<parser::CallExpr>());
    } else if (expr.is<parser::FieldExpr>()) {
        return format_field(expr.as<parser::FieldExpr>());
    } else if (expr.is<parser::IndexExpr>()) {
        return format_index(expr.as<parser::IndexExpr>());
    } else if (expr.is<parser::StructExpr>()) {
        return format_struct_expr(expr.as<parser::StructExpr>());
    } else if (expr.is<parser::MatchExpr>()) {
        return format_match(expr.as<parser::MatchExpr>());
    }
    return "";
}

auto Formatter::format_literal(const parser::LiteralExpr& lit) -> std::string {
    return std::string(lit.token.lexeme);
}

auto Formatter::needs_parens(const parser::Expr& expr, const parser::BinaryExpr& parent,
                             bool is_right) -> bool {
    if (expr.is<parser::MatchExpr>()) {
        return !is_right;
    }
    if (!expr.is<parser::BinaryExpr>()) {
        return false;
    }
    int child_prec = parser::binary_precedence(expr.as<parser::BinaryExpr>().op);
    int parent_prec = parser::binary_precedence(parent.op);
    return child_prec < parent_prec || (is_right && child_prec == parent_prec);
}

auto Formatter::format_binary(const parser::BinaryExpr& bin) -> std::string {
    std::string left = format_expr(*bin.left);
    if (needs_parens(*bin.left, bin, false)) {
        left = "(" + left + ")";
    }
    std::string right = format_expr(*bin.right);
    if (needs_parens(*bin.right, bin, true)) {
        right = "(" + right + ")";
    }
    return left + " " + std::string(parser::binary_op_to_string(bin.op)) + " " + right;
}

auto Formatter::format_unary(const parser::UnaryExpr& unary) -> std::string {
    std::string operand = format_expr(*unary.operand);
    if (unary.operand->is<parser::BinaryExpr>()) {
        operand = "(" + operand + ")";
    }
    return std::string(parser::unary_op_to_string(unary.op)) + operand;
}

auto Formatter::format_operand(const parser::Expr& expr) -> std::string {
    std::string text = format_expr(expr);
    if (expr.is<parser::BinaryExpr>() || expr.is<parser::UnaryExpr>() ||
        expr.is<parser::MatchExpr>()) {
        return "(" + text + ")";
    }
    return text;
}

auto Formatter::format_call(const parser::CallExpr& call) -> std::string {
    std::string result = format_operand(*call.callee) + "(";
    for (size_t i = 0; i < call.args.size(); ++i) {
        if (i > 0)
            result += ", ";
        result += format_expr(*call.args[i]);
    }
    return result + ")";
}

auto Formatter::format_field(const parser::FieldExpr& field) -> std::string {
    return format_operand(*field.object) + "." + field.field;
}

auto Formatter::format_index(const parser::IndexExpr& index) -> std::string {
    return format_operand(*index.object) + "[" + format_expr(*index.index) + "]";
}

auto Formatter::format_struct_expr(const parser::StructExpr& s) -> std::string {
    if (s.fields.empty()) {
        return s.name + " {}";
    }
    std::string result = s.name + " { ";
    for (size_t i = 0; i < s.fields.size(); ++i) {
        if (i > 0)
            result += ", ";
        result += s.fields[i].name + " := " + format_expr(*s.fields[i].value);
    }
    return result + " }";
}

auto Formatter::format_match(const parser::MatchExpr& match) -> std::string {
    std::string result = "match ";
    if (match.scrutinee) {
        const auto& scrutinee = **match.scrutinee;
        bool has_struct_literal = false;
        parser::for_each_expr(scrutinee, [&has_struct_literal](const parser::Expr& e) {
            has_struct_literal = has_struct_literal || e.is<parser::StructExpr>();
        });
        std::string text = format_expr(scrutinee);
        result += has_struct_literal ? "(" + text + ") " : text + " ";
    }

    if (match.arms.empty()) {
        return result + "{}";
    }
    result += "{\n";

    push_indent();
    for (const auto& arm : match.arms) {
        result += indent_str() + "case " + format_pattern(*arm.pattern);
        if (arm.guard) {
            result += " if " + format_expr(**arm.guard);
        }
        result += " := ";
        result += arm.consequence ? "consequence " + format_expr(**arm.consequence) : "pass";
        result += ";\n";
    }
    pop_indent();

    return result + indent_str() + "}";
}

} // namespace yuho::format
