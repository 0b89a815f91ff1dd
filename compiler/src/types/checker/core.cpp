// Semantic analyzer core - program walk, reporting and name resolution
// Handles: analyze, check, collect_type_info, check_module, check_items, check_cycles

#include "log/log.hpp"
#include "types/checker.hpp"

#include <algorithm>
#include <set>

namespace yuho::types {

namespace {

auto prefix_of(const Module& module, const std::vector<std::string>& scope_path, size_t depth)
    -> std::string {
    std::string prefix = module.name;
    for (size_t i = 0; i < depth; ++i) {
        prefix += "." + scope_path[i];
    }
    return prefix;
}

} // namespace

SemanticAnalyzer::SemanticAnalyzer(AnalyzerOptions options) : options_(options) {}

auto SemanticAnalyzer::analyze(const ResolvedProgram& program) -> std::vector<Diagnostic> {
    program_ = &program;
    diagnostics_.clear();
    structs_.clear();
    enums_.clear();

    // First pass: struct fields and enum variants of every module
    for (const auto& module : program.modules) {
        scope_path_.clear();
        collect_type_info(*module, module->program.items);
    }

    for (const auto& module : program.modules) {
        check_module(*module);
    }
    check_cycles();

    if (options_.warning_policy) {
        apply_warning_policy(diagnostics_);
    }

    YUHO_LOG_DEBUG("checker", program.modules.size() << " modules checked, "
                                                     << diagnostics_.size() << " diagnostics");

    program_ = nullptr;
    module_ = nullptr;
    scope_path_.clear();
    locals_.clear();
    return std::move(diagnostics_);
}

auto SemanticAnalyzer::check(ResolvedProgram& program) -> const std::vector<Diagnostic>& {
    program.diagnostics = analyze(program);
    return program.diagnostics;
}

// ============================================================================
// Reporting
// ============================================================================

void SemanticAnalyzer::error(DiagnosticKind kind, const char* code, std::string message,
                             SourceSpan span) {
    diagnostics_.push_back(make_error(kind, code, std::move(message), span));
}

void SemanticAnalyzer::warning(DiagnosticKind kind, const char* code, std::string message,
                               SourceSpan span) {
    diagnostics_.push_back(make_warning(kind, code, std::move(message), span));
}

auto SemanticAnalyzer::last() -> Diagnostic& {
    return diagnostics_.back();
}

void SemanticAnalyzer::report_duplicate(const std::string& what, const std::string& name,
                                        SourceSpan first, SourceSpan second) {
    error(DiagnosticKind::DuplicateDeclaration, ErrorCodes::DUPLICATE_DECLARATION,
          "duplicate " + what + " `" + name + "`", second);
    last().labels.push_back(DiagnosticLabel{
        .span = first, .message = "`" + name + "` first declared here", .is_primary = false});
}

void SemanticAnalyzer::report_unresolved(const std::string& what, const std::string& name,
                                         SourceSpan span,
                                         const std::vector<std::string>& candidates) {
    error(DiagnosticKind::UnresolvedReference, ErrorCodes::UNRESOLVED_REFERENCE,
          "cannot find " + what + " `" + name + "` in this scope", span);

    // Exported elsewhere but never referenced
    if (const auto* exported = table().lookup(name);
        exported && module_ && exported->module != module_->name) {
        last().notes.push_back("`" + name + "` is exported by module `" + exported->module + "`");
        last().help.push_back("add `referencing " + name + " from " + exported->module + "`");
        return;
    }

    auto hint = did_you_mean(find_similar_candidates(name, candidates));
    if (!hint.empty()) {
        last().help.push_back(hint);
    }
}

// ============================================================================
// Declaration Registration
// ============================================================================

void SemanticAnalyzer::collect_type_info(const Module& module,
                                         const std::vector<parser::DeclPtr>& items) {
    auto prefix = prefix_of(module, scope_path_, scope_path_.size());

    for (const auto& item : items) {
        if (item->is<parser::StructDecl>()) {
            const auto& decl = item->as<parser::StructDecl>();
            auto qualified = prefix + "." + decl.name;
            const auto* symbol = table().lookup_qualified(qualified);
            if (!symbol || symbol->decl != item.get()) {
                continue;
            }
            StructInfo info{.decl = &decl, .fields = {}};
            for (const auto& field : decl.fields) {
                auto taken = std::any_of(info.fields.begin(), info.fields.end(),
                                         [&](const auto& f) { return f.first == field.name; });
                if (!taken) {
                    info.fields.emplace_back(
                        field.name, table().resolve_annotation(*field.type, module, scope_path_));
                }
            }
            structs_[qualified] = std::move(info);
        } else if (item->is<parser::EnumDecl>()) {
            const auto& decl = item->as<parser::EnumDecl>();
            auto qualified = prefix + "." + decl.name;
            const auto* symbol = table().lookup_qualified(qualified);
            if (!symbol || symbol->decl != item.get()) {
                continue;
            }
            EnumInfo info{.decl = &decl, .variants = {}};
            for (const auto& variant : decl.variants) {
                if (std::find(info.variants.begin(), info.variants.end(), variant.name) ==
                    info.variants.end()) {
                    info.variants.push_back(variant.name);
                }
            }
            enums_[qualified] = std::move(info);
        } else if (item->is<parser::ScopeDecl>()) {
            const auto& scope = item->as<parser::ScopeDecl>();
            scope_path_.push_back(scope.name);
            collect_type_info(module, scope.items);
            scope_path_.pop_back();
        }
    }
}

// ============================================================================
// Module Walk
// ============================================================================

void SemanticAnalyzer::check_module(const Module& module) {
    YUHO_LOG_DEBUG("checker", "checking module " << module.name << " (" << module.path << ")");
    module_ = &module;
    scope_path_.clear();
    locals_.clear();
    check_items(module.program.items);
}

void SemanticAnalyzer::check_items(const std::vector<parser::DeclPtr>& items) {
    std::map<std::string, SourceSpan> seen;
    for (const auto& item : items) {
        if (item->is<parser::ReferencingDecl>() || item->is<parser::ExprDecl>()) {
            continue;
        }
        auto name = parser::decl_name(*item);
        if (!name) {
            continue;
        }
        auto span = parser::decl_name_span(*item);
        auto [it, inserted] = seen.emplace(*name, span);
        if (!inserted) {
            report_duplicate("declaration", *name, it->second, span);
        }
    }

    for (const auto& item : items) {
        std::visit(
            [this](const auto& decl) {
                using T = std::decay_t<decltype(decl)>;

                if constexpr (std::is_same_v<T, parser::StructDecl>) {
                    check_struct_decl(decl);
                } else if constexpr (std::is_same_v<T, parser::EnumDecl>) {
                    check_enum_decl(decl);
                } else if constexpr (std::is_same_v<T, parser::FuncDecl>) {
                    check_func_decl(decl);
                } else if constexpr (std::is_same_v<T, parser::ScopeDecl>) {
                    scope_path_.push_back(decl.name);
                    check_items(decl.items);
                    scope_path_.pop_back();
                } else if constexpr (std::is_same_v<T, parser::VarDecl>) {
                    check_global_var(decl);
                } else if constexpr (std::is_same_v<T, parser::ExprDecl>) {
                    (void)check_expr(*decl.expr);
                }
                // ReferencingDecl: handled by the resolver
            },
            item->kind);
    }
}

void SemanticAnalyzer::check_cycles() {
    for (const auto& cycle : table().find_cycles(SymbolKind::Variable)) {
        const auto* head = table().lookup_qualified(cycle.front());
        if (!head) {
            continue;
        }

        std::string chain;
        for (const auto& name : cycle) {
            chain += name + " -> ";
        }
        chain += cycle.front();

        error(DiagnosticKind::CyclicDefinition, ErrorCodes::CYCLIC_DEFINITION,
              "cyclic definition: " + chain, head->span);
        for (size_t i = 1; i < cycle.size(); ++i) {
            if (const auto* member = table().lookup_qualified(cycle[i])) {
                last().labels.push_back(DiagnosticLabel{
                    .span = member->span,
                    .message = "`" + member->name + "` depends on the cycle here",
                    .is_primary = false});
            }
        }
        last().help.push_back("break the cycle by giving one variable a literal value");
    }
}

// ============================================================================
// Name Resolution
// ============================================================================

auto SemanticAnalyzer::resolve_annotation(const parser::Type& type) -> TypePtr {
    return table().resolve_annotation(type, *module_, scope_path_,
                                      [this](const parser::NamedType& named) {
                                          report_unresolved("type", named.name, named.span,
                                                            visible_type_names());
                                      });
}

auto SemanticAnalyzer::lookup_local(const std::string& name) const -> const Local* {
    for (auto it = locals_.rbegin(); it != locals_.rend(); ++it) {
        auto found = it->find(name);
        if (found != it->end()) {
            return &found->second;
        }
    }
    return nullptr;
}

auto SemanticAnalyzer::lookup_symbol(const std::string& name) const -> const Symbol* {
    return table().lookup_in_scope(*module_, scope_path_, name);
}

auto SemanticAnalyzer::find_struct(const TypePtr& type) const -> const StructInfo* {
    if (!type || !type->is<NamedType>()) {
        return nullptr;
    }
    const auto& named = type->as<NamedType>();
    auto it = structs_.find(named.module + "." + named.name);
    return it != structs_.end() ? &it->second : nullptr;
}

auto SemanticAnalyzer::find_enum(const TypePtr& type) const -> const EnumInfo* {
    if (!type || !type->is<NamedType>()) {
        return nullptr;
    }
    const auto& named = type->as<NamedType>();
    auto it = enums_.find(named.module + "." + named.name);
    return it != enums_.end() ? &it->second : nullptr;
}

auto SemanticAnalyzer::visible_names() const -> std::vector<std::string> {
    std::set<std::string> names;
    for (const auto& scope : locals_) {
        for (const auto& [name, local] : scope) {
            names.insert(name);
        }
    }

    for (size_t depth = 0; depth <= scope_path_.size(); ++depth) {
        auto prefix = prefix_of(*module_, scope_path_, depth) + ".";
        for (auto it = table().symbols().lower_bound(prefix);
             it != table().symbols().end() && it->first.compare(0, prefix.size(), prefix) == 0;
             ++it) {
            auto rest = it->first.substr(prefix.size());
            if (rest == it->second.name) {
                names.insert(rest);
            }
        }
    }

    for (const auto& [name, qualified] : module_->imported) {
        names.insert(name);
    }
    return {names.begin(), names.end()};
}

auto SemanticAnalyzer::visible_type_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    for (const auto& name : visible_names()) {
        const auto* symbol = lookup_symbol(name);
        if (symbol && (symbol->kind == SymbolKind::Struct || symbol->kind == SymbolKind::Enum)) {
            names.push_back(name);
        }
    }
    return names;
}

void SemanticAnalyzer::push_scope() {
    locals_.emplace_back();
}

void SemanticAnalyzer::pop_scope() {
    locals_.pop_back();
}

void SemanticAnalyzer::declare_local(const std::string& name, TypePtr type, SourceSpan span) {
    auto& scope = locals_.back();
    auto it = scope.find(name);
    if (it != scope.end()) {
        report_duplicate("local variable", name, it->second.span, span);
        return;
    }
    scope.emplace(name, Local{.type = std::move(type), .span = span});
}

} // namespace yuho::types
