//! # Declaration Formatting
//!
//! | Declaration | Keyword       | Example                                 |
//! |-------------|---------------|-----------------------------------------|
//! | Struct      | `struct`      | `struct Person { string name, int age }`|
//! | Enum        | `enum`        | `enum Verdict { Guilty, NotGuilty }`    |
//! | Function    | `fn`          | `fn fine(int n): money { ... }`         |
//! | Scope       | `scope`       | `scope theft { ... }`                   |
//! | Statute     | `statute`     | `statute 415 "Cheating" { ... }`        |
//! | Import      | `referencing` | `referencing A, B from lib.common;`     |
//! | Variable    | type keyword  | `int x := 42;`                          |
//!
//! Block-shaped items (struct, enum, function, scope) are separated from
//! their neighbours by a blank line.

#include "format/formatter.hpp"

namespace yuho::format {

namespace {

auto is_block_item(const parser::Decl& decl) -> bool {
    return decl.is<parser::StructDecl>() || decl.is<parser::EnumDecl>() ||
           decl.is<parser::FuncDecl>() || decl.is<parser::ScopeDecl>();
}

} // namespace

void Formatter::format_items(const std::vector<parser::DeclPtr>& items) {
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0 && (is_block_item(*items[i]) || is_block_item(*items[i - 1]))) {
            emit_newline();
        }
        format_decl(*items[i]);
    }
}

void Formatter::format_decl(const parser::Decl& decl) {
    if (decl.is<parser::StructDecl>()) {
        format_struct_decl(decl.as<parser::StructDecl>());
    } else if (decl.is<parser::EnumDecl>()) {
        format_enum_decl(decl.as<parser::EnumDecl>());
    } else if (decl.is<parser::FuncDecl>()) {
        format_func_decl(decl.as<parser::FuncDecl>());
    } else if (decl.is<parser::ScopeDecl>()) {
        format_scope_decl(decl.as<parser::ScopeDecl>());
    } else if (decl.is<parser::ReferencingDecl>()) {
        format_referencing_decl(decl.as<parser::ReferencingDecl>());
    } else if (decl.is<parser::VarDecl>()) {
        format_var_decl(decl.as<parser::VarDecl>());
    } else if (decl.is<parser::ExprDecl>()) {
        const auto& expr = *decl.as<parser::ExprDecl>().expr;
        emit_line(format_expr(expr) + (expr.is<parser::MatchExpr>() ? "" : ";"));
    }
}

void Formatter::format_struct_decl(const parser::StructDecl& s) {
    if (s.fields.empty()) {
        emit_line("struct " + s.name + " {}");
        return;
    }
    emit_line("struct " + s.name + " {");
    push_indent();
    for (size_t i = 0; i < s.fields.size(); ++i) {
        const auto& field = s.fields[i];
        emit_line(format_type(*field.type) + " " + field.name +
                  (i + 1 < s.fields.size() ? "," : ""));
    }
    pop_indent();
    emit_line("}");
}

void Formatter::format_enum_decl(const parser::EnumDecl& e) {
    if (e.variants.empty()) {
        emit_line("enum " + e.name + " {}");
        return;
    }
    emit_line("enum " + e.name + " {");
    push_indent();
    for (size_t i = 0; i < e.variants.size(); ++i) {
        emit_line(e.variants[i].name + (i + 1 < e.variants.size() ? "," : ""));
    }
    pop_indent();
    emit_line("}");
}

void Formatter::format_func_decl(const parser::FuncDecl& func) {
    std::string header = "fn " + func.name + "(";
    for (size_t i = 0; i < func.params.size(); ++i) {
        if (i > 0)
            header += ", ";
        header += format_type(*func.params[i].type) + " " + func.params[i].name;
    }
    header += ")";
    if (func.return_type) {
        header += ": " + format_type(**func.return_type);
    }

    if (func.body.empty()) {
        emit_line(header + " {}");
        return;
    }
    emit_line(header + " {");
    push_indent();
    for (const auto& stmt : func.body) {
        format_stmt(*stmt);
    }
    pop_indent();
    emit_line("}");
}

void Formatter::format_scope_decl(const parser::ScopeDecl& scope) {
    std::string header;
    if (scope.kind == parser::ScopeKind::Statute) {
        header = "statute ";
        header += scope.name_token == lexer::TokenKind::StringLiteral ? quote_string(scope.name)
                                                                      : scope.name;
        if (scope.title) {
            header += " " + quote_string(*scope.title);
        }
    } else {
        header = "scope " + scope.name;
    }

    if (scope.items.empty()) {
        emit_line(header + " {}");
        return;
    }
    emit_line(header + " {");
    push_indent();
    format_items(scope.items);
    pop_indent();
    emit_line("}");
}

void Formatter::format_referencing_decl(const parser::ReferencingDecl& ref) {
    std::string line = ref.is_export ? "export referencing " : "referencing ";
    for (size_t i = 0; i < ref.names.size(); ++i) {
        if (i > 0)
            line += ", ";
        line += ref.names[i].name;
    }
    line += " from " + ref.module_name() + ";";
    emit_line(line);
}

void Formatter::format_var_decl(const parser::VarDecl& var) {
    std::string line = format_type(*var.type) + " " + var.name;
    if (var.init) {
        line += " := " + format_expr(**var.init);
    }
    emit_line(line + ";");
}

} // namespace yuho::format
