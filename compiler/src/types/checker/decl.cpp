// Semantic analyzer - declarations and statements
// Handles: structs, enums, functions, variables, return checking

#include "types/checker.hpp"

namespace yuho::types {

void SemanticAnalyzer::check_struct_decl(const parser::StructDecl& decl) {
    std::map<std::string, SourceSpan> seen;
    for (const auto& field : decl.fields) {
        auto [it, inserted] = seen.emplace(field.name, field.name_span);
        if (!inserted) {
            report_duplicate("field", field.name, it->second, field.name_span);
        }
        (void)resolve_annotation(*field.type);
    }
}

void SemanticAnalyzer::check_enum_decl(const parser::EnumDecl& decl) {
    std::map<std::string, SourceSpan> seen;
    for (const auto& variant : decl.variants) {
        auto [it, inserted] = seen.emplace(variant.name, variant.span);
        if (!inserted) {
            report_duplicate("variant", variant.name, it->second, variant.span);
        }
    }
}

void SemanticAnalyzer::check_func_decl(const parser::FuncDecl& func) {
    current_func_ = &func;
    current_return_type_ = func.return_type ? resolve_annotation(**func.return_type) : make_pass();

    push_scope();
    std::map<std::string, SourceSpan> seen;
    for (const auto& param : func.params) {
        auto type = resolve_annotation(*param.type);
        auto [it, inserted] = seen.emplace(param.name, param.name_span);
        if (!inserted) {
            report_duplicate("parameter", param.name, it->second, param.name_span);
            continue;
        }
        declare_local(param.name, std::move(type), param.name_span);
    }

    for (const auto& stmt : func.body) {
        check_stmt(*stmt);
    }
    check_missing_return(func);
    pop_scope();

    current_func_ = nullptr;
    current_return_type_ = nullptr;
}

void SemanticAnalyzer::check_global_var(const parser::VarDecl& var) {
    auto declared = resolve_annotation(*var.type);
    if (!var.init) {
        return;
    }
    const auto& init = **var.init;
    auto actual = check_expr(init);
    if (!is_assignable(declared, actual)) {
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "mismatched types: `" + var.name + "` is declared `" + type_to_string(declared) +
                  "` but initialized with `" + type_to_string(actual) + "`",
              init.span);
        last().labels.push_back(DiagnosticLabel{
            .span = var.type->span, .message = "expected due to this type", .is_primary = false});
    }
}

// ============================================================================
// Statements
// ============================================================================

void SemanticAnalyzer::check_stmt(const parser::Stmt& stmt) {
    std::visit(
        [this](const auto& s) {
            using T = std::decay_t<decltype(s)>;

            if constexpr (std::is_same_v<T, parser::VarDecl>) {
                check_var_decl(s);
            } else if constexpr (std::is_same_v<T, parser::ReturnStmt>) {
                check_return(s);
            } else if constexpr (std::is_same_v<T, parser::ExprStmt>) {
                (void)check_expr(*s.expr);
            }
            // PassStmt: nothing to check
        },
        stmt.kind);
}

void SemanticAnalyzer::check_var_decl(const parser::VarDecl& var) {
    auto declared = resolve_annotation(*var.type);
    if (var.init) {
        const auto& init = **var.init;
        auto actual = check_expr(init);
        if (!is_assignable(declared, actual)) {
            error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
                  "mismatched types: expected `" + type_to_string(declared) + "`, found `" +
                      type_to_string(actual) + "`",
                  init.span);
            last().labels.push_back(DiagnosticLabel{.span = var.type->span,
                                                    .message = "expected due to this type",
                                                    .is_primary = false});
        }
    }
    declare_local(var.name, std::move(declared), var.name_span);
}

void SemanticAnalyzer::check_return(const parser::ReturnStmt& ret) {
    if (!current_func_) {
        return;
    }

    bool returns_nothing = is_primitive(current_return_type_, PrimitiveKind::Pass);
    if (!ret.value) {
        if (!returns_nothing) {
            error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
                  "function `" + current_func_->name + "` must return a value of type `" +
                      type_to_string(current_return_type_) + "`",
                  ret.span);
        }
        return;
    }

    const auto& value = **ret.value;
    auto actual = check_expr(value);
    if (returns_nothing) {
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "function `" + current_func_->name + "` has no return type but returns a value",
              value.span);
        last().help.push_back("declare the result type: `fn " + current_func_->name + "(...): " +
                              type_to_string(actual) + "`");
        return;
    }
    if (!is_assignable(current_return_type_, actual)) {
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "mismatched return type: expected `" + type_to_string(current_return_type_) +
                  "`, found `" + type_to_string(actual) + "`",
              value.span);
    }
}

void SemanticAnalyzer::check_missing_return(const parser::FuncDecl& func) {
    if (is_primitive(current_return_type_, PrimitiveKind::Pass)) {
        return;
    }

    for (const auto& stmt : func.body) {
        if (stmt->is<parser::ReturnStmt>()) {
            return;
        }
    }

    // A trailing match yields the function's result
    if (!func.body.empty() && func.body.back()->is<parser::ExprStmt>()) {
        const auto& tail = *func.body.back()->as<parser::ExprStmt>().expr;
        if (tail.is<parser::MatchExpr>()) {
            return;
        }
    }

    error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
          "missing return in function `" + func.name + "`: expected a value of type `" +
              type_to_string(current_return_type_) + "`",
          func.name_span);
    last().help.push_back("add `return <expr>;` or end the body with a `match`");
}

} // namespace yuho::types
