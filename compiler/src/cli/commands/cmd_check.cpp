//! # Check Command
//!
//! ```bash
//! yuhoc check penal.yh                 # text diagnostics on stderr
//! yuhoc check -I stdlib penal.yh       # extra module search path
//! yuhoc check --json -Werror penal.yh  # JSON lines, warnings fail
//! ```
//!
//! Returns 1 when resolution fails or any Error diagnostic remains after
//! the warning policy has been applied.

#include "cmd_check.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "log/log.hpp"
#include "types/checker.hpp"
#include "types/resolver.hpp"

namespace yuho::cli {

namespace {

/// Emits `diagnostics`, stopping after `max_errors` errors when non-zero.
void emit_limited(DiagnosticEmitter& emitter, const std::vector<Diagnostic>& diagnostics,
                  int max_errors) {
    size_t suppressed = 0;
    for (const auto& diagnostic : diagnostics) {
        if (max_errors > 0 && diagnostic.is_error() &&
            emitter.error_count() >= static_cast<size_t>(max_errors)) {
            ++suppressed;
            continue;
        }
        emitter.emit(diagnostic);
    }
    if (suppressed > 0) {
        YUHO_LOG_WARN("cli", suppressed << " further error(s) not shown (max_errors = "
                                        << max_errors << ")");
    }
}

} // namespace

int run_check(const std::string& path, const CheckCommandOptions& options) {
    // Command-line flags win over yuho.toml and the environment
    if (options.json) {
        CompilerOptions::diagnostic_format = DiagnosticFormat::JSON;
    }
    if (options.warnings_as_errors) {
        CompilerOptions::warnings_as_errors = true;
    }
    if (options.no_warnings) {
        CompilerOptions::warning_level = WarningLevel::None;
    }
    auto search_paths = options.include_dirs;
    search_paths.insert(search_paths.end(), CompilerOptions::search_paths.begin(),
                        CompilerOptions::search_paths.end());
    CompilerOptions::search_paths = search_paths;

    auto& emitter = get_diagnostic_emitter();
    emitter.set_format(CompilerOptions::diagnostic_format);

    types::FileSystemSourceLoader loader;
    types::ModuleResolver resolver(loader, types::ResolverOptions{.search_paths = search_paths});

    auto resolved = resolver.resolve(path);
    if (is_err(resolved)) {
        const auto& error = unwrap_err(resolved);
        YUHO_LOG_DEBUG("cli", "resolution failed: "
                                  << types::resolve_error_kind_to_string(error.kind));
        emitter.add_source(error.source);
        emit_limited(emitter, error.to_diagnostics(), options.max_errors);
        emitter.emit_summary();
        return EXIT_ERROR;
    }

    auto& program = unwrap(resolved);
    for (const auto& module : program.modules) {
        emitter.add_source(module->source);
    }
    YUHO_LOG_INFO("cli", "resolved " << program.modules.size() << " modules, "
                                     << program.symbols.size() << " symbols");

    types::SemanticAnalyzer analyzer;
    const auto& diagnostics = analyzer.check(program);
    emit_limited(emitter, diagnostics, options.max_errors);
    emitter.emit_summary();

    return has_errors(diagnostics) ? EXIT_ERROR : EXIT_OK;
}

} // namespace yuho::cli
