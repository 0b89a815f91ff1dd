// Semantic analyzer - expression checking
// Handles: literals, identifiers, operators, calls, field access, struct literals

#include "types/checker.hpp"

#include <algorithm>

namespace yuho::types {

auto SemanticAnalyzer::check_expr(const parser::Expr& expr) -> TypePtr {
    return std::visit(
        [this](const auto& e) -> TypePtr {
            using T = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<T, parser::LiteralExpr>) {
                return check_literal(e);
            } else if constexpr (std::is_same_v<T, parser::IdentExpr>) {
                return check_ident(e);
            } else if constexpr (std::is_same_v<T, parser::BinaryExpr>) {
                return check_binary(e);
            } else if constexpr (std::is_same_v<T, parser::UnaryExpr>) {
                return check_unary(e);
            } else if constexpr (std::is_same_v<T, parser::CallExpr>) {
                return check_call(e);
            } else if constexpr (std::is_same_v<T, parser::FieldExpr>) {
                return check_field(e);
            } else if constexpr (std::is_same_v<T, parser::IndexExpr>) {
                return check_index(e);
            } else if constexpr (std::is_same_v<T, parser::StructExpr>) {
                return check_struct_expr(e);
            } else if constexpr (std::is_same_v<T, parser::MatchExpr>) {
                return check_match(e);
            } else {
                return make_unknown();
            }
        },
        expr.kind);
}

auto SemanticAnalyzer::check_literal(const parser::LiteralExpr& lit) -> TypePtr {
    using lexer::TokenKind;
    switch (lit.token.kind) {
    case TokenKind::IntLiteral:
        return make_int();
    case TokenKind::FloatLiteral:
        return make_float();
    case TokenKind::StringLiteral:
        return make_string();
    case TokenKind::BoolLiteral:
        return make_bool();
    case TokenKind::MoneyLiteral:
        return make_money();
    case TokenKind::PercentLiteral:
        return make_percent();
    case TokenKind::DateLiteral:
        return make_date();
    case TokenKind::DurationLiteral:
        return make_duration();
    default:
        return make_unknown();
    }
}

auto SemanticAnalyzer::check_ident(const parser::IdentExpr& ident) -> TypePtr {
    if (const auto* local = lookup_local(ident.name)) {
        return local->type ? local->type : make_unknown();
    }

    const auto* symbol = lookup_symbol(ident.name);
    if (!symbol) {
        report_unresolved("value", ident.name, ident.span, visible_names());
        return make_unknown();
    }

    switch (symbol->kind) {
    case SymbolKind::Variable:
    case SymbolKind::Function:
        return symbol->type ? symbol->type : make_unknown();
    case SymbolKind::Struct:
    case SymbolKind::Enum:
    case SymbolKind::Scope:
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "expected a value, found " + std::string(symbol_kind_to_string(symbol->kind)) +
                  " `" + ident.name + "`",
              ident.span);
        if (symbol->kind == SymbolKind::Enum) {
            last().help.push_back("name a variant: `" + ident.name + ".<Variant>`");
        }
        return make_unknown();
    }
    return make_unknown();
}

auto SemanticAnalyzer::check_binary(const parser::BinaryExpr& binary) -> TypePtr {
    auto left = check_expr(*binary.left);
    auto right = check_expr(*binary.right);

    auto result = binary_result_type(binary.op, left, right);
    if (result) {
        return result;
    }

    auto op = std::string(parser::binary_op_to_string(binary.op));
    error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
          "cannot apply `" + op + "` to `" + type_to_string(left) + "` and `" +
              type_to_string(right) + "`",
          binary.span);
    last().labels.push_back(DiagnosticLabel{
        .span = binary.left->span, .message = type_to_string(left), .is_primary = false});
    last().labels.push_back(DiagnosticLabel{
        .span = binary.right->span, .message = type_to_string(right), .is_primary = false});
    return make_unknown();
}

auto SemanticAnalyzer::check_unary(const parser::UnaryExpr& unary) -> TypePtr {
    auto operand = check_expr(*unary.operand);

    auto result = unary_result_type(unary.op, operand);
    if (result) {
        return result;
    }

    error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
          "cannot apply unary `" + std::string(parser::unary_op_to_string(unary.op)) + "` to `" +
              type_to_string(operand) + "`",
          unary.span);
    return make_unknown();
}

auto SemanticAnalyzer::check_call(const parser::CallExpr& call) -> TypePtr {
    auto callee = check_expr(*call.callee);

    std::vector<TypePtr> args;
    for (const auto& arg : call.args) {
        args.push_back(check_expr(*arg));
    }

    if (is_unknown(callee)) {
        return make_unknown();
    }
    if (!callee->is<FuncType>()) {
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "`" + type_to_string(callee) + "` is not a function", call.callee->span);
        return make_unknown();
    }

    const auto& func = callee->as<FuncType>();
    if (func.params.size() != args.size()) {
        error(DiagnosticKind::TypeError, ErrorCodes::ARG_COUNT_MISMATCH,
              "this function takes " + std::to_string(func.params.size()) + " argument" +
                  (func.params.size() == 1 ? "" : "s") + " but " + std::to_string(args.size()) +
                  (args.size() == 1 ? " was" : " were") + " supplied",
              call.span);
        last().notes.push_back("signature: " + type_to_string(callee));
        return func.return_type;
    }

    for (size_t i = 0; i < args.size(); ++i) {
        if (!is_assignable(func.params[i], args[i])) {
            error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
                  "mismatched argument " + std::to_string(i + 1) + ": expected `" +
                      type_to_string(func.params[i]) + "`, found `" + type_to_string(args[i]) +
                      "`",
                  call.args[i]->span);
        }
    }
    return func.return_type;
}

auto SemanticAnalyzer::check_field(const parser::FieldExpr& field) -> TypePtr {
    // `Enum.Variant` and `Scope.member` name symbols, not values
    if (field.object->is<parser::IdentExpr>()) {
        const auto& base = field.object->as<parser::IdentExpr>().name;
        const auto* symbol = lookup_local(base) ? nullptr : lookup_symbol(base);

        if (symbol && symbol->kind == SymbolKind::Enum) {
            auto it = enums_.find(symbol->qualified_name);
            if (it == enums_.end()) {
                return make_unknown();
            }
            const auto& variants = it->second.variants;
            if (std::find(variants.begin(), variants.end(), field.field) != variants.end()) {
                return symbol->type;
            }
            error(DiagnosticKind::UnresolvedReference, ErrorCodes::UNRESOLVED_REFERENCE,
                  "no variant `" + field.field + "` in enum `" + base + "`", field.field_span);
            auto hint = did_you_mean(find_similar_candidates(field.field, variants));
            if (!hint.empty()) {
                last().help.push_back(hint);
            }
            return make_unknown();
        }

        if (symbol && symbol->kind == SymbolKind::Scope) {
            const auto* member = table().lookup_qualified(symbol->qualified_name + "." + field.field);
            if (!member) {
                error(DiagnosticKind::UnresolvedReference, ErrorCodes::UNRESOLVED_REFERENCE,
                      "cannot find `" + field.field + "` in scope `" + base + "`",
                      field.field_span);
                return make_unknown();
            }
            if (member->kind == SymbolKind::Variable || member->kind == SymbolKind::Function) {
                return member->type ? member->type : make_unknown();
            }
            return make_unknown();
        }
    }

    auto object = check_expr(*field.object);
    if (is_unknown(object)) {
        return make_unknown();
    }

    const auto* info = find_struct(object);
    if (!info) {
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "type `" + type_to_string(object) + "` has no fields", field.field_span);
        return make_unknown();
    }

    std::vector<std::string> names;
    for (const auto& [name, type] : info->fields) {
        if (name == field.field) {
            return type ? type : make_unknown();
        }
        names.push_back(name);
    }

    error(DiagnosticKind::UnresolvedReference, ErrorCodes::UNRESOLVED_REFERENCE,
          "no field `" + field.field + "` on struct `" + type_to_string(object) + "`",
          field.field_span);
    auto hint = did_you_mean(find_similar_candidates(field.field, names));
    if (!hint.empty()) {
        last().help.push_back(hint);
    }
    return make_unknown();
}

auto SemanticAnalyzer::check_index(const parser::IndexExpr& index) -> TypePtr {
    auto object = check_expr(*index.object);
    (void)check_expr(*index.index);
    if (!is_unknown(object)) {
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "type `" + type_to_string(object) + "` cannot be indexed", index.span);
    }
    return make_unknown();
}

auto SemanticAnalyzer::check_struct_expr(const parser::StructExpr& expr) -> TypePtr {
    const auto* symbol = lookup_symbol(expr.name);
    const StructInfo* info = nullptr;
    if (symbol && symbol->kind == SymbolKind::Struct) {
        info = find_struct(symbol->type);
    } else if (symbol) {
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "`" + expr.name + "` is a " + std::string(symbol_kind_to_string(symbol->kind)) +
                  ", not a struct",
              expr.name_span);
    } else {
        std::vector<std::string> structs;
        for (const auto& name : visible_type_names()) {
            const auto* candidate = lookup_symbol(name);
            if (candidate && candidate->kind == SymbolKind::Struct) {
                structs.push_back(name);
            }
        }
        report_unresolved("struct", expr.name, expr.name_span, structs);
    }

    std::map<std::string, SourceSpan> seen;
    for (const auto& init : expr.fields) {
        auto actual = check_expr(*init.value);

        auto [it, inserted] = seen.emplace(init.name, init.span);
        if (!inserted) {
            report_duplicate("field initializer", init.name, it->second, init.span);
            continue;
        }
        if (!info) {
            continue;
        }

        auto declared = std::find_if(info->fields.begin(), info->fields.end(),
                                     [&](const auto& f) { return f.first == init.name; });
        if (declared == info->fields.end()) {
            std::vector<std::string> names;
            for (const auto& f : info->fields) {
                names.push_back(f.first);
            }
            error(DiagnosticKind::UnresolvedReference, ErrorCodes::UNRESOLVED_REFERENCE,
                  "struct `" + expr.name + "` has no field `" + init.name + "`", init.span);
            auto hint = did_you_mean(find_similar_candidates(init.name, names));
            if (!hint.empty()) {
                last().help.push_back(hint);
            }
            continue;
        }
        if (!is_assignable(declared->second, actual)) {
            error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
                  "mismatched types for field `" + init.name + "`: expected `" +
                      type_to_string(declared->second) + "`, found `" + type_to_string(actual) +
                      "`",
                  init.value->span);
        }
    }

    if (!info) {
        return make_unknown();
    }

    std::string missing;
    for (const auto& [name, type] : info->fields) {
        if (seen.count(name) == 0) {
            missing += (missing.empty() ? "`" : ", `") + name + "`";
        }
    }
    if (!missing.empty()) {
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "missing field(s) in `" + expr.name + "` literal: " + missing, expr.span);
    }
    return symbol->type;
}

} // namespace yuho::types
