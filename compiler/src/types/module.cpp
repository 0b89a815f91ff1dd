//! # Modules and the Symbol Table
//!
//! `Module` accessors and the merged `SymbolTable`.
//!
//! ## Qualified Names
//!
//! | Declaration                   | Qualified name        |
//! |-------------------------------|-----------------------|
//! | `struct Person` in `penal`    | `penal.Person`        |
//! | `fn f` in statute `299`       | `penal.299.f`         |
//! | module `lib.defs`, `enum Age` | `lib.defs.Age`        |
//!
//! ## Reference Graph
//!
//! Edges go from a declaration to every symbol its initializer or body names.
//! Cycles are found per symbol kind with Tarjan's algorithm, so a function
//! that calls itself is never reported while two variables defined through
//! each other are.

#include "types/module.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>

namespace yuho::types {

auto symbol_kind_to_string(SymbolKind kind) -> std::string_view {
    switch (kind) {
    case SymbolKind::Struct:
        return "struct";
    case SymbolKind::Enum:
        return "enum";
    case SymbolKind::Function:
        return "function";
    case SymbolKind::Scope:
        return "scope";
    case SymbolKind::Variable:
        return "variable";
    }
    return "symbol";
}

// ============================================================================
// Module
// ============================================================================

auto Module::find_export(const std::string& export_name) const -> const ExportEntry* {
    for (const auto& entry : exports) {
        if (entry.name == export_name) {
            return &entry;
        }
    }
    return nullptr;
}

auto Module::export_names() const -> std::vector<std::string> {
    std::vector<std::string> names;
    names.reserve(exports.size());
    for (const auto& entry : exports) {
        names.push_back(entry.name);
    }
    std::sort(names.begin(), names.end());
    names.erase(std::unique(names.begin(), names.end()), names.end());
    return names;
}

auto Module::directory() const -> std::string {
    return std::filesystem::path(path).parent_path().generic_string();
}

// ============================================================================
// Registration
// ============================================================================

auto SymbolTable::insert(Symbol symbol) -> bool {
    auto key = symbol.qualified_name;
    return symbols_.emplace(std::move(key), std::move(symbol)).second;
}

void SymbolTable::set_type(const std::string& qualified_name, TypePtr type) {
    auto it = symbols_.find(qualified_name);
    if (it != symbols_.end()) {
        it->second.type = std::move(type);
    }
}

auto SymbolTable::add_export(const std::string& name, const std::string& qualified_name)
    -> std::optional<std::string> {
    auto [it, inserted] = exported_.emplace(name, qualified_name);
    if (!inserted && it->second != qualified_name) {
        return it->second;
    }
    auto sym = symbols_.find(qualified_name);
    if (sym != symbols_.end()) {
        sym->second.exported = true;
    }
    return std::nullopt;
}

// ============================================================================
// Lookup
// ============================================================================

auto SymbolTable::lookup_qualified(const std::string& qualified_name) const -> const Symbol* {
    auto it = symbols_.find(qualified_name);
    return it != symbols_.end() ? &it->second : nullptr;
}

auto SymbolTable::lookup(const std::string& name) const -> const Symbol* {
    auto it = exported_.find(name);
    if (it == exported_.end()) {
        return nullptr;
    }
    return lookup_qualified(it->second);
}

auto SymbolTable::lookup_in_scope(const Module& module, const std::vector<std::string>& scope_path,
                                  const std::string& name) const -> const Symbol* {
    for (size_t depth = scope_path.size() + 1; depth-- > 0;) {
        std::string qualified = module.name;
        for (size_t i = 0; i < depth; ++i) {
            qualified += "." + scope_path[i];
        }
        qualified += "." + name;
        if (const auto* symbol = lookup_qualified(qualified)) {
            return symbol;
        }
    }

    auto it = module.imported.find(name);
    if (it != module.imported.end()) {
        return lookup_qualified(it->second);
    }
    return nullptr;
}

auto SymbolTable::resolve_annotation(const parser::Type& type, const Module& module,
                                     const std::vector<std::string>& scope_path,
                                     const UnresolvedTypeHandler& on_unresolved) const -> TypePtr {
    return std::visit(
        [&](const auto& t) -> TypePtr {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, parser::PrimitiveType>) {
                return from_syntax(t.kind);
            } else if constexpr (std::is_same_v<T, parser::NamedType>) {
                const auto* symbol = lookup_in_scope(module, scope_path, t.name);
                if (symbol &&
                    (symbol->kind == SymbolKind::Struct || symbol->kind == SymbolKind::Enum)) {
                    return symbol->type ? symbol->type : make_unknown();
                }
                if (on_unresolved) {
                    on_unresolved(t);
                }
                return make_unknown();
            } else {
                std::vector<TypePtr> members;
                for (const auto& member : t.members) {
                    members.push_back(
                        resolve_annotation(*member, module, scope_path, on_unresolved));
                }
                return make_union(std::move(members));
            }
        },
        type.kind);
}

// ============================================================================
// Reference Graph
// ============================================================================

void SymbolTable::add_reference(const std::string& from, const std::string& to) {
    edges_[from].insert(to);
}

auto SymbolTable::references(const std::string& from) const -> std::vector<std::string> {
    auto it = edges_.find(from);
    if (it == edges_.end()) {
        return {};
    }
    return {it->second.begin(), it->second.end()};
}

auto SymbolTable::find_cycles(SymbolKind kind) const -> std::vector<std::vector<std::string>> {
    auto has_kind = [&](const std::string& name) {
        const auto* symbol = lookup_qualified(name);
        return symbol && symbol->kind == kind;
    };

    // Tarjan's strongly connected components over the `kind` subgraph
    std::map<std::string, size_t> index;
    std::map<std::string, size_t> lowlink;
    std::set<std::string> on_stack;
    std::vector<std::string> stack;
    std::vector<std::vector<std::string>> cycles;
    size_t next_index = 0;

    std::function<void(const std::string&)> connect = [&](const std::string& v) {
        index[v] = lowlink[v] = next_index++;
        stack.push_back(v);
        on_stack.insert(v);

        for (const auto& w : references(v)) {
            if (!has_kind(w)) {
                continue;
            }
            if (index.find(w) == index.end()) {
                connect(w);
                lowlink[v] = std::min(lowlink[v], lowlink[w]);
            } else if (on_stack.count(w) > 0) {
                lowlink[v] = std::min(lowlink[v], index[w]);
            }
        }

        if (lowlink[v] != index[v]) {
            return;
        }

        std::vector<std::string> component;
        std::string w;
        do {
            w = stack.back();
            stack.pop_back();
            on_stack.erase(w);
            component.push_back(w);
        } while (w != v);

        auto self_loop = edges_.count(v) > 0 && edges_.at(v).count(v) > 0;
        if (component.size() > 1 || self_loop) {
            std::sort(component.begin(), component.end());
            cycles.push_back(std::move(component));
        }
    };

    for (const auto& [name, symbol] : symbols_) {
        if (symbol.kind == kind && index.find(name) == index.end()) {
            connect(name);
        }
    }

    std::sort(cycles.begin(), cycles.end());
    return cycles;
}

auto SymbolTable::operator==(const SymbolTable& other) const -> bool {
    if (exported_ != other.exported_ || edges_ != other.edges_ ||
        symbols_.size() != other.symbols_.size()) {
        return false;
    }
    for (const auto& [name, symbol] : symbols_) {
        const auto* theirs = other.lookup_qualified(name);
        if (!theirs || theirs->kind != symbol.kind || theirs->module != symbol.module ||
            theirs->file != symbol.file || theirs->exported != symbol.exported ||
            !types_equal(theirs->type, symbol.type)) {
            return false;
        }
    }
    return true;
}

} // namespace yuho::types
