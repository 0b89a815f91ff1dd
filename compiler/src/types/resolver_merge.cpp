//! # Module Resolver - Merging
//!
//! Export collection, the global symbol table and error rendering.
//!
//! ## Merge Passes
//!
//! | Pass | Work                                                      |
//! |------|-----------------------------------------------------------|
//! | 1    | Register declarations; a name taken by another file fails |
//! | 2    | Index exports; distinct modules sharing a name fail       |
//! | 3    | Compute function and variable types from annotations      |
//! | 4    | Add name-reference edges from initializers and bodies     |
//!
//! Types are computed after registration so that annotations may name a
//! struct declared later in the file or in another module.

#include "log/log.hpp"
#include "types/resolver.hpp"

#include <optional>
#include <set>

namespace yuho::types {

namespace {

auto scope_prefix(const Module& module, const std::vector<std::string>& scope_path)
    -> std::string {
    std::string prefix = module.name;
    for (const auto& scope : scope_path) {
        prefix += "." + scope;
    }
    return prefix;
}

auto qualify(const Module& module, const std::vector<std::string>& scope_path,
             const std::string& name) -> std::string {
    return scope_prefix(module, scope_path) + "." + name;
}

auto symbol_kind_of(const parser::Decl& decl) -> std::optional<SymbolKind> {
    if (decl.is<parser::StructDecl>())
        return SymbolKind::Struct;
    if (decl.is<parser::EnumDecl>())
        return SymbolKind::Enum;
    if (decl.is<parser::FuncDecl>())
        return SymbolKind::Function;
    if (decl.is<parser::ScopeDecl>())
        return SymbolKind::Scope;
    if (decl.is<parser::VarDecl>())
        return SymbolKind::Variable;
    return std::nullopt;
}

auto register_decls(SymbolTable& table, const Module& module,
                    std::vector<std::string>& scope_path,
                    const std::vector<parser::DeclPtr>& items) -> std::optional<ResolveError> {
    for (const auto& item : items) {
        auto kind = symbol_kind_of(*item);
        auto name = parser::decl_name(*item);
        if (!kind || !name) {
            continue;
        }

        auto qualified = qualify(module, scope_path, *name);
        auto span = parser::decl_name_span(*item);
        Symbol symbol{.name = *name,
                      .qualified_name = qualified,
                      .module = module.name,
                      .file = module.path,
                      .kind = *kind,
                      .decl = item.get(),
                      .type = nullptr,
                      .span = span};
        if (*kind == SymbolKind::Struct) {
            symbol.type = make_named(*name, scope_prefix(module, scope_path), NamedKind::Struct);
        } else if (*kind == SymbolKind::Enum) {
            symbol.type = make_named(*name, scope_prefix(module, scope_path), NamedKind::Enum);
        }

        // Within one file a repeated name keeps its first declaration and the
        // analyzer reports it. Across files the name would be ambiguous.
        if (!table.insert(std::move(symbol))) {
            const auto* existing = table.lookup_qualified(qualified);
            if (existing && existing->file != module.path) {
                return ResolveError{.kind = ResolveErrorKind::DuplicateExport,
                                    .message = "`" + qualified + "` is declared in both `" +
                                               existing->file + "` and `" + module.path + "`",
                                    .file = module.path,
                                    .span = span,
                                    .module = module.name,
                                    .symbol = qualified,
                                    .other_module = existing->module,
                                    .source = module.source};
            }
        }

        if (item->is<parser::ScopeDecl>()) {
            scope_path.push_back(*name);
            auto clash =
                register_decls(table, module, scope_path, item->as<parser::ScopeDecl>().items);
            scope_path.pop_back();
            if (clash) {
                return clash;
            }
        }
    }
    return std::nullopt;
}

void assign_types(SymbolTable& table, const Module& module, std::vector<std::string>& scope_path,
                  const std::vector<parser::DeclPtr>& items) {
    for (const auto& item : items) {
        if (item->is<parser::FuncDecl>()) {
            const auto& func = item->as<parser::FuncDecl>();
            auto qualified = qualify(module, scope_path, func.name);
            const auto* existing = table.lookup_qualified(qualified);
            if (!existing || existing->decl != item.get()) {
                continue;
            }
            std::vector<TypePtr> params;
            for (const auto& param : func.params) {
                params.push_back(table.resolve_annotation(*param.type, module, scope_path));
            }
            auto ret = func.return_type
                           ? table.resolve_annotation(**func.return_type, module, scope_path)
                           : make_pass();
            table.set_type(qualified, make_func(std::move(params), std::move(ret)));
        } else if (item->is<parser::VarDecl>()) {
            const auto& var = item->as<parser::VarDecl>();
            auto qualified = qualify(module, scope_path, var.name);
            const auto* existing = table.lookup_qualified(qualified);
            if (!existing || existing->decl != item.get()) {
                continue;
            }
            table.set_type(qualified, table.resolve_annotation(*var.type, module, scope_path));
        } else if (item->is<parser::ScopeDecl>()) {
            const auto& scope = item->as<parser::ScopeDecl>();
            scope_path.push_back(scope.name);
            assign_types(table, module, scope_path, scope.items);
            scope_path.pop_back();
        }
    }
}

void add_edges(SymbolTable& table, const Module& module, std::vector<std::string>& scope_path,
               const std::vector<parser::DeclPtr>& items) {
    for (const auto& item : items) {
        if (item->is<parser::VarDecl>()) {
            const auto& var = item->as<parser::VarDecl>();
            if (!var.init) {
                continue;
            }
            auto from = qualify(module, scope_path, var.name);
            for (const auto& name : parser::collect_identifiers(**var.init)) {
                if (const auto* target = table.lookup_in_scope(module, scope_path, name)) {
                    table.add_reference(from, target->qualified_name);
                }
            }
        } else if (item->is<parser::FuncDecl>()) {
            const auto& func = item->as<parser::FuncDecl>();
            std::set<std::string> shadowed;
            for (const auto& param : func.params) {
                shadowed.insert(param.name);
            }
            for (const auto& stmt : func.body) {
                if (stmt->is<parser::VarDecl>()) {
                    shadowed.insert(stmt->as<parser::VarDecl>().name);
                }
            }
            auto from = qualify(module, scope_path, func.name);
            for (const auto& name : parser::collect_identifiers(*item)) {
                if (shadowed.count(name) > 0) {
                    continue;
                }
                if (const auto* target = table.lookup_in_scope(module, scope_path, name)) {
                    table.add_reference(from, target->qualified_name);
                }
            }
        } else if (item->is<parser::ScopeDecl>()) {
            const auto& scope = item->as<parser::ScopeDecl>();
            scope_path.push_back(scope.name);
            add_edges(table, module, scope_path, scope.items);
            scope_path.pop_back();
        }
    }
}

} // namespace

void ModuleResolver::collect_local_exports(Module& module) {
    for (const auto& item : module.program.items) {
        auto kind = symbol_kind_of(*item);
        auto name = parser::decl_name(*item);
        if (!kind || !name || *kind == SymbolKind::Variable || module.find_export(*name)) {
            continue;
        }
        module.exports.push_back(ExportEntry{.name = *name,
                                             .origin_module = module.name,
                                             .origin_path = module.path,
                                             .kind = *kind,
                                             .is_reexport = false,
                                             .span = parser::decl_name_span(*item)});
    }
}

auto ModuleResolver::build_symbol_table() -> Result<SymbolTable, ResolveError> {
    SymbolTable table;
    std::vector<std::string> scope_path;

    for (const auto& module : order_) {
        if (auto clash = register_decls(table, *module, scope_path, module->program.items)) {
            return std::move(*clash);
        }
    }

    for (const auto& module : order_) {
        for (const auto& entry : module->exports) {
            if (entry.is_reexport) {
                continue;
            }
            auto conflict = table.add_export(entry.name, entry.qualified_name());
            if (!conflict) {
                continue;
            }
            const auto* other = table.lookup_qualified(*conflict);
            auto other_module = other ? other->module : *conflict;
            return ResolveError{.kind = ResolveErrorKind::DuplicateExport,
                                .message = "`" + entry.name + "` is exported by both `" +
                                           other_module + "` and `" + module->name + "`",
                                .file = module->path,
                                .span = entry.span,
                                .module = module->name,
                                .symbol = entry.name,
                                .other_module = other_module,
                                .source = module->source};
        }
    }

    for (const auto& module : order_) {
        assign_types(table, *module, scope_path, module->program.items);
    }
    for (const auto& module : order_) {
        add_edges(table, *module, scope_path, module->program.items);
    }

    YUHO_LOG_TRACE("resolver", table.exported().size() << " exported names");
    return table;
}

// ============================================================================
// Results and Errors
// ============================================================================

auto ResolvedProgram::find_module(const std::string& path) const -> Rc<Module> {
    auto normal = normalize_path(path);
    for (const auto& module : modules) {
        if (module->path == normal) {
            return module;
        }
    }
    return nullptr;
}

auto resolve_error_kind_to_string(ResolveErrorKind kind) -> std::string_view {
    switch (kind) {
    case ResolveErrorKind::ModuleNotFound:
        return "ModuleNotFound";
    case ResolveErrorKind::CircularImport:
        return "CircularImport";
    case ResolveErrorKind::MissingSymbol:
        return "MissingSymbol";
    case ResolveErrorKind::DuplicateExport:
        return "DuplicateExport";
    case ResolveErrorKind::FileRead:
        return "FileRead";
    case ResolveErrorKind::Syntax:
        return "Syntax";
    }
    return "ResolveError";
}

auto ResolveError::to_diagnostic() const -> Diagnostic {
    if (kind == ResolveErrorKind::Syntax && !diagnostics.empty()) {
        return diagnostics.front();
    }

    const char* code = ErrorCodes::RESOLVE_MODULE_NOT_FOUND;
    switch (kind) {
    case ResolveErrorKind::ModuleNotFound:
        code = ErrorCodes::RESOLVE_MODULE_NOT_FOUND;
        break;
    case ResolveErrorKind::CircularImport:
        code = ErrorCodes::RESOLVE_CIRCULAR_IMPORT;
        break;
    case ResolveErrorKind::MissingSymbol:
        code = ErrorCodes::RESOLVE_MISSING_SYMBOL;
        break;
    case ResolveErrorKind::DuplicateExport:
        code = ErrorCodes::RESOLVE_DUPLICATE_EXPORT;
        break;
    case ResolveErrorKind::FileRead:
    case ResolveErrorKind::Syntax:
        code = ErrorCodes::RESOLVE_FILE_READ;
        break;
    }

    auto diag = make_error(DiagnosticKind::ResolveError, code, message, span);
    if (diag.file.empty()) {
        diag.file = file;
    }

    switch (kind) {
    case ResolveErrorKind::ModuleNotFound:
        for (const auto& path : searched_paths) {
            diag.notes.push_back("searched `" + path + "`");
        }
        diag.help.push_back("check the module name, or add a search path with `-I <dir>`");
        break;
    case ResolveErrorKind::CircularImport: {
        std::string chain;
        for (const auto& path : cycle) {
            chain += path + " -> ";
        }
        if (!cycle.empty()) {
            chain += cycle.front();
        }
        diag.notes.push_back("import cycle: " + chain);
        break;
    }
    case ResolveErrorKind::MissingSymbol: {
        if (available.empty()) {
            diag.notes.push_back("module `" + module + "` exports nothing");
        } else {
            std::string names;
            for (size_t i = 0; i < available.size(); ++i) {
                names += (i > 0 ? ", " : "") + available[i];
            }
            diag.notes.push_back("module `" + module + "` exports: " + names);
        }
        auto hint = did_you_mean(find_similar_candidates(symbol, available));
        if (!hint.empty()) {
            diag.help.push_back(hint);
        }
        break;
    }
    case ResolveErrorKind::DuplicateExport:
        diag.notes.push_back("`" + symbol + "` is also exported by module `" + other_module + "`");
        break;
    default:
        break;
    }
    return diag;
}

auto ResolveError::to_diagnostics() const -> std::vector<Diagnostic> {
    if (kind == ResolveErrorKind::Syntax && !diagnostics.empty()) {
        return diagnostics;
    }
    return {to_diagnostic()};
}

} // namespace yuho::types
