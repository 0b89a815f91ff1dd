//! # Module Resolver - Loading
//!
//! Locates, loads and parses modules, following `referencing` items
//! depth-first.
//!
//! ## State
//!
//! | Member      | Holds                                           |
//! |-------------|-------------------------------------------------|
//! | `stack_`    | Paths being resolved, outermost first           |
//! | `resolved_` | Fully resolved modules by normalized path       |
//! | `order_`    | Resolved modules, dependencies before importers |
//! | `names_`    | Module names handed out, with the file each names |
//!
//! All of them are cleared on entry to and exit from `resolve()`.

#include "lexer/lexer.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"
#include "types/resolver.hpp"

#include <algorithm>
#include <filesystem>
#include <optional>

namespace yuho::types {

namespace {

auto join(const std::vector<std::string>& parts, std::string_view sep) -> std::string {
    std::string out;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += parts[i];
    }
    return out;
}

auto join_path(const std::string& dir, const std::string& rel) -> std::string {
    if (dir.empty()) {
        return normalize_path(rel);
    }
    return normalize_path((std::filesystem::path(dir) / rel).generic_string());
}

/// `path` relative to `dir` when it lies inside it.
auto relative_to(const std::string& dir, const std::string& path) -> std::optional<std::string> {
    if (dir.empty()) {
        if (path == ".." || path.rfind("../", 0) == 0 || (!path.empty() && path[0] == '/')) {
            return std::nullopt;
        }
        return path;
    }
    if (path.size() > dir.size() + 1 && path.compare(0, dir.size(), dir) == 0 &&
        path[dir.size()] == '/') {
        return path.substr(dir.size() + 1);
    }
    return std::nullopt;
}

auto strip_suffix(std::string& text, std::string_view suffix) -> bool {
    if (text.size() <= suffix.size() ||
        text.compare(text.size() - suffix.size(), suffix.size(), suffix) != 0) {
        return false;
    }
    text.erase(text.size() - suffix.size());
    return true;
}

/// `penal/code.yh` -> `penal.code`, `common/mod.yh` -> `common`.
auto dotted_name(std::string rel) -> std::string {
    strip_suffix(rel, ".yh");
    strip_suffix(rel, "/mod");
    std::replace(rel.begin(), rel.end(), '/', '.');
    return rel;
}

} // namespace

ModuleResolver::ModuleResolver(const SourceLoader& loader, ResolverOptions options)
    : loader_(loader), options_(std::move(options)) {}

void ModuleResolver::reset() {
    resolved_.clear();
    stack_.clear();
    order_.clear();
    root_.clear();
    names_.clear();
}

auto ModuleResolver::module_name_for(const std::string& path) -> std::string {
    auto rel = relative_to(root_, path);
    for (auto it = options_.search_paths.begin(); !rel && it != options_.search_paths.end();
         ++it) {
        rel = relative_to(normalize_path(*it), path);
    }

    auto name = dotted_name(rel ? *rel : path);
    auto [owner, inserted] = names_.emplace(name, path);
    if (inserted || owner->second == path) {
        return name;
    }

    auto fallback = path;
    strip_suffix(fallback, ".yh");
    YUHO_LOG_DEBUG("resolver", "module name `" << name << "` already names " << owner->second
                                               << ", using `" << fallback << "` for " << path);
    names_.emplace(fallback, path);
    return fallback;
}

auto ModuleResolver::resolve(const std::string& entry_path)
    -> Result<ResolvedProgram, ResolveError> {
    reset();

    auto path = normalize_path(entry_path);
    root_ = std::filesystem::path(path).parent_path().generic_string();
    auto name = module_name_for(path);
    YUHO_LOG_DEBUG("resolver", "resolving entry " << path);

    if (!loader_.exists(path)) {
        return ResolveError{.kind = ResolveErrorKind::FileRead,
                            .message = "cannot read entry file `" + path + "`: no such file",
                            .file = path,
                            .module = name};
    }

    auto entry = resolve_module(path, name);
    if (is_err(entry)) {
        auto error = std::move(unwrap_err(entry));
        reset();
        YUHO_LOG_DEBUG("resolver", "resolution failed: " << error.message);
        return error;
    }

    auto table = build_symbol_table();
    if (is_err(table)) {
        auto error = std::move(unwrap_err(table));
        reset();
        YUHO_LOG_DEBUG("resolver", "resolution failed: " << error.message);
        return error;
    }

    ResolvedProgram program{.modules = std::move(order_),
                            .entry = unwrap(entry),
                            .symbols = std::move(unwrap(table)),
                            .diagnostics = {}};
    reset();

    YUHO_LOG_DEBUG("resolver", "resolved " << program.modules.size() << " modules, "
                                           << program.symbols.size() << " symbols");
    return program;
}

auto ModuleResolver::candidate_paths(const std::string& from_dir,
                                     const std::string& module_name) const
    -> std::vector<std::string> {
    std::string rel = module_name;
    std::replace(rel.begin(), rel.end(), '.', '/');

    std::vector<std::string> dirs{from_dir};
    dirs.insert(dirs.end(), options_.search_paths.begin(), options_.search_paths.end());

    std::vector<std::string> candidates;
    for (const auto& dir : dirs) {
        for (auto candidate : {join_path(dir, rel + ".yh"), join_path(dir, rel + "/mod.yh")}) {
            if (std::find(candidates.begin(), candidates.end(), candidate) == candidates.end()) {
                candidates.push_back(std::move(candidate));
            }
        }
    }
    return candidates;
}

// ============================================================================
// Recursive Resolution
// ============================================================================

auto ModuleResolver::resolve_module(const std::string& path, const std::string& name)
    -> Result<Rc<Module>, ResolveError> {
    auto cached = resolved_.find(path);
    if (cached != resolved_.end()) {
        YUHO_LOG_TRACE("resolver", "cache hit " << path);
        return cached->second;
    }

    auto loaded = load_module(path, name);
    if (is_err(loaded))
        return unwrap_err(loaded);
    auto module = unwrap(loaded);

    stack_.push_back(path);
    collect_local_exports(*module);

    for (const auto& item : module->program.items) {
        if (!item->is<parser::ReferencingDecl>()) {
            continue;
        }
        auto import = resolve_import(*module, item->as<parser::ReferencingDecl>());
        if (is_err(import))
            return unwrap_err(import);
        module->imports.push_back(std::move(unwrap(import)));
    }

    stack_.pop_back();
    resolved_[path] = module;
    order_.push_back(module);
    return module;
}

auto ModuleResolver::load_module(const std::string& path, const std::string& name)
    -> Result<Rc<Module>, ResolveError> {
    auto content = loader_.read(path);
    if (is_err(content)) {
        const auto& read_error = unwrap_err(content);
        return ResolveError{.kind = ResolveErrorKind::FileRead,
                            .message = "cannot read `" + path + "`: " + read_error.message,
                            .file = path,
                            .module = name};
    }

    auto source = make_rc<lexer::Source>(path, std::move(unwrap(content)));

    lexer::Lexer lexer(*source);
    auto tokens = lexer.tokenize();
    if (is_err(tokens)) {
        const auto& lex_error = unwrap_err(tokens);
        return ResolveError{.kind = ResolveErrorKind::Syntax,
                            .message = "module `" + name + "` could not be tokenized",
                            .file = path,
                            .span = lex_error.span,
                            .module = name,
                            .diagnostics = {lex_error.to_diagnostic()},
                            .source = source};
    }

    parser::Parser parser(std::move(unwrap(tokens)));
    auto program = parser.parse_program(name);
    if (is_err(program)) {
        const auto& parse_errors = unwrap_err(program);
        std::vector<Diagnostic> diagnostics;
        for (const auto& error : parse_errors) {
            diagnostics.push_back(error.to_diagnostic());
        }
        return ResolveError{.kind = ResolveErrorKind::Syntax,
                            .message = "module `" + name + "` has " +
                                       std::to_string(parse_errors.size()) + " syntax error(s)",
                            .file = path,
                            .span = parse_errors.front().span,
                            .module = name,
                            .diagnostics = std::move(diagnostics),
                            .source = source};
    }

    auto module = make_rc<Module>();
    module->name = name;
    module->path = path;
    module->source = std::move(source);
    module->program = std::move(unwrap(program));

    YUHO_LOG_DEBUG("resolver", "loaded module " << name << " (" << path << "), "
                                                << module->program.items.size() << " items");
    return module;
}

auto ModuleResolver::locate(const Module& importer, const parser::ReferencingDecl& ref)
    -> Result<std::string, ResolveError> {
    auto module_name = ref.module_name();
    auto candidates = candidate_paths(importer.directory(), module_name);

    for (const auto& candidate : candidates) {
        YUHO_LOG_TRACE("resolver", "trying " << candidate);
        if (loader_.exists(candidate)) {
            return candidate;
        }
    }

    return ResolveError{.kind = ResolveErrorKind::ModuleNotFound,
                        .message = "module `" + module_name + "` not found",
                        .file = importer.path,
                        .span = ref.module_span,
                        .module = module_name,
                        .searched_paths = std::move(candidates),
                        .source = importer.source};
}

auto ModuleResolver::resolve_import(Module& module, const parser::ReferencingDecl& ref)
    -> Result<ImportRef, ResolveError> {
    auto located = locate(module, ref);
    if (is_err(located))
        return unwrap_err(located);
    auto target_path = unwrap(located);
    auto target_name = ref.module_name();

    auto on_stack = std::find(stack_.begin(), stack_.end(), target_path);
    if (on_stack != stack_.end()) {
        std::vector<std::string> cycle(on_stack, stack_.end());
        auto shown = cycle;
        shown.push_back(target_path);
        return ResolveError{.kind = ResolveErrorKind::CircularImport,
                            .message = "circular import: " + join(shown, " -> "),
                            .file = module.path,
                            .span = ref.module_span,
                            .module = target_name,
                            .cycle = std::move(cycle),
                            .source = module.source};
    }

    auto resolved = resolve_module(target_path, module_name_for(target_path));
    if (is_err(resolved))
        return unwrap_err(resolved);
    const auto& target = *unwrap(resolved);

    ImportRef import{.module_name = target_name,
                     .resolved_path = target_path,
                     .is_export = ref.is_export,
                     .span = ref.module_span};

    for (const auto& imported : ref.names) {
        const auto* entry = target.find_export(imported.name);
        if (!entry) {
            return ResolveError{.kind = ResolveErrorKind::MissingSymbol,
                                .message = "`" + imported.name + "` is not exported by module `" +
                                           target_name + "`",
                                .file = module.path,
                                .span = imported.span,
                                .module = target_name,
                                .symbol = imported.name,
                                .available = target.export_names(),
                                .source = module.source};
        }

        import.names.push_back(imported.name);
        module.imported[imported.name] = entry->qualified_name();

        if (!ref.is_export) {
            continue;
        }
        if (const auto* local = module.find_export(imported.name);
            local && local->qualified_name() != entry->qualified_name()) {
            return ResolveError{.kind = ResolveErrorKind::DuplicateExport,
                                .message = "`" + imported.name + "` is exported by both `" +
                                           module.name + "` and `" + entry->origin_module + "`",
                                .file = module.path,
                                .span = imported.span,
                                .module = module.name,
                                .symbol = imported.name,
                                .other_module = entry->origin_module,
                                .source = module.source};
        }
        module.exports.push_back(ExportEntry{.name = imported.name,
                                             .origin_module = entry->origin_module,
                                             .origin_path = entry->origin_path,
                                             .kind = entry->kind,
                                             .is_reexport = true,
                                             .span = imported.span});
    }

    return import;
}

} // namespace yuho::types
