// Semantic analyzer - match-case checking
// Handles: pattern typing, bindings, guards, unreachable arms, exhaustiveness
//
// An arm without a guard whose pattern accepts every value (`_`, a binding,
// or a struct pattern whose fields are all irrefutable) ends the reachable
// arms; every later arm gets W001. Without such an arm a Boolean scrutinee
// needs TRUE and FALSE, an enum every variant, and anything else is W002.

#include "types/checker.hpp"

#include <algorithm>

namespace yuho::types {

namespace {

auto literal_type(const lexer::Token& token) -> TypePtr {
    using lexer::TokenKind;
    switch (token.kind) {
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

} // namespace

auto SemanticAnalyzer::check_match(const parser::MatchExpr& match) -> TypePtr {
    auto scrutinee = match.scrutinee ? check_expr(**match.scrutinee) : make_bool();

    Coverage coverage;
    std::optional<SourceSpan> catch_all;
    std::vector<TypePtr> results;

    for (const auto& arm : match.arms) {
        if (catch_all) {
            warning(DiagnosticKind::UnreachableArm, ErrorCodes::UNREACHABLE_ARM,
                    "unreachable match arm", arm.span);
            last().labels.push_back(DiagnosticLabel{
                .span = *catch_all, .message = "this arm matches any value", .is_primary = false});
        }

        push_scope();
        Coverage arm_coverage;
        bool irrefutable = check_pattern(*arm.pattern, scrutinee, arm_coverage);

        if (arm.guard) {
            const auto& guard = **arm.guard;
            auto type = check_expr(guard);
            if (!is_unknown(type) && !is_bool(type)) {
                error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
                      "match guard must be `bool`, found `" + type_to_string(type) + "`",
                      guard.span);
            }
        }

        if (arm.consequence) {
            results.push_back(check_expr(**arm.consequence));
        }
        pop_scope();

        if (arm.guard) {
            continue;
        }
        coverage.has_true = coverage.has_true || arm_coverage.has_true;
        coverage.has_false = coverage.has_false || arm_coverage.has_false;
        coverage.variants.insert(coverage.variants.end(), arm_coverage.variants.begin(),
                                 arm_coverage.variants.end());
        if (irrefutable && !catch_all) {
            catch_all = arm.span;
        }
    }

    if (!catch_all) {
        check_exhaustive(match, scrutinee, coverage);
    }

    if (results.empty()) {
        return make_pass();
    }
    return make_union(std::move(results));
}

auto SemanticAnalyzer::check_pattern(const parser::Pattern& pattern, const TypePtr& expected,
                                     Coverage& coverage) -> bool {
    auto mismatch = [&](const TypePtr& found, SourceSpan span) {
        error(DiagnosticKind::TypeError, ErrorCodes::TYPE_MISMATCH,
              "mismatched pattern: expected `" + type_to_string(expected) + "`, found `" +
                  type_to_string(found) + "`",
              span);
    };

    return std::visit(
        [&](const auto& p) -> bool {
            using T = std::decay_t<decltype(p)>;

            if constexpr (std::is_same_v<T, parser::WildcardPattern>) {
                return true;
            } else if constexpr (std::is_same_v<T, parser::LiteralPattern>) {
                auto type = literal_type(p.literal);
                if (!is_assignable(expected, type)) {
                    mismatch(type, p.span);
                    return false;
                }
                if (p.literal.kind == lexer::TokenKind::BoolLiteral) {
                    (p.literal.bool_value() ? coverage.has_true : coverage.has_false) = true;
                }
                return false;
            } else if constexpr (std::is_same_v<T, parser::IdentPattern>) {
                // A bare variant name of the scrutinee's enum, otherwise a binding
                if (const auto* info = find_enum(expected)) {
                    const auto& variants = info->variants;
                    if (std::find(variants.begin(), variants.end(), p.name) != variants.end()) {
                        coverage.variants.push_back(p.name);
                        return false;
                    }
                }
                declare_local(p.name, expected, p.span);
                return true;
            } else if constexpr (std::is_same_v<T, parser::QualifiedPattern>) {
                const auto* symbol = lookup_symbol(p.type_name);
                if (!symbol || symbol->kind != SymbolKind::Enum) {
                    report_unresolved("enum", p.type_name, p.span, visible_type_names());
                    return false;
                }
                const auto* info = find_enum(symbol->type);
                if (info && std::find(info->variants.begin(), info->variants.end(), p.variant) ==
                                info->variants.end()) {
                    error(DiagnosticKind::UnresolvedReference, ErrorCodes::UNRESOLVED_REFERENCE,
                          "no variant `" + p.variant + "` in enum `" + p.type_name + "`", p.span);
                    auto hint = did_you_mean(find_similar_candidates(p.variant, info->variants));
                    if (!hint.empty()) {
                        last().help.push_back(hint);
                    }
                    return false;
                }
                if (!is_assignable(expected, symbol->type)) {
                    mismatch(symbol->type, p.span);
                    return false;
                }
                coverage.variants.push_back(p.variant);
                return false;
            } else if constexpr (std::is_same_v<T, parser::StructPattern>) {
                const auto* symbol = lookup_symbol(p.name);
                if (!symbol || symbol->kind != SymbolKind::Struct) {
                    report_unresolved("struct", p.name, p.span, visible_type_names());
                    return false;
                }
                bool matches_type = types_equal(expected, symbol->type) || is_unknown(expected);
                if (!matches_type && !is_assignable(expected, symbol->type)) {
                    mismatch(symbol->type, p.span);
                    return false;
                }

                const auto* info = find_struct(symbol->type);
                bool irrefutable = matches_type;
                for (const auto& field : p.fields) {
                    TypePtr field_type;
                    if (info) {
                        for (const auto& [name, type] : info->fields) {
                            if (name == field.name) {
                                field_type = type;
                            }
                        }
                    }
                    if (!field_type) {
                        error(DiagnosticKind::UnresolvedReference,
                              ErrorCodes::UNRESOLVED_REFERENCE,
                              "struct `" + p.name + "` has no field `" + field.name + "`",
                              field.span);
                        irrefutable = false;
                        continue;
                    }
                    if (field.pattern) {
                        Coverage nested;
                        irrefutable = check_pattern(**field.pattern, field_type, nested) &&
                                      irrefutable;
                    } else {
                        declare_local(field.name, field_type, field.span);
                    }
                }
                return irrefutable;
            } else {
                return false;
            }
        },
        pattern.kind);
}

void SemanticAnalyzer::check_exhaustive(const parser::MatchExpr& match, const TypePtr& scrutinee,
                                        const Coverage& coverage) {
    if (is_unknown(scrutinee)) {
        return;
    }

    std::vector<std::string> missing;
    if (is_bool(scrutinee)) {
        if (!coverage.has_true) {
            missing.push_back("TRUE");
        }
        if (!coverage.has_false) {
            missing.push_back("FALSE");
        }
    } else if (const auto* info = find_enum(scrutinee)) {
        for (const auto& variant : info->variants) {
            if (std::find(coverage.variants.begin(), coverage.variants.end(), variant) ==
                coverage.variants.end()) {
                missing.push_back(type_to_string(scrutinee) + "." + variant);
            }
        }
    } else {
        warning(DiagnosticKind::InexhaustiveMatch, ErrorCodes::INEXHAUSTIVE_MATCH,
                "non-exhaustive match on `" + type_to_string(scrutinee) + "`", match.span);
        last().help.push_back("add a `case _ := ...` arm");
        return;
    }

    if (missing.empty()) {
        return;
    }

    std::string listed;
    for (const auto& name : missing) {
        listed += (listed.empty() ? "`" : ", `") + name + "`";
    }
    warning(DiagnosticKind::InexhaustiveMatch, ErrorCodes::INEXHAUSTIVE_MATCH,
            "non-exhaustive match: " + listed + " not covered", match.span);
    last().help.push_back("add arms for the missing cases or a `case _ := ...` arm");
}

} // namespace yuho::types
