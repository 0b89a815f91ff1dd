//! # Debug Commands
//!
//! Implements `yuhoc tokens` and `yuhoc parse`.
//!
//! ## Usage
//!
//! ```bash
//! yuhoc tokens penal.yh          # 1:1  TYPE        int     `int`
//! yuhoc parse penal.yh           # canonical source
//! yuhoc parse --ast penal.yh     # syntax tree dump
//! yuhoc parse --recover bad.yh   # best-effort program plus all errors
//! ```

#include "cmd_debug.hpp"

#include "cli/diagnostic.hpp"
#include "cli/utils.hpp"
#include "common.hpp"
#include "format/formatter.hpp"
#include "lexer/lexer.hpp"
#include "lexer/source.hpp"
#include "log/log.hpp"
#include "parser/parser.hpp"

#include <filesystem>
#include <iomanip>

namespace fs = std::filesystem;

namespace yuho::cli {

namespace {

/// Loads `path` and registers it with the emitter. Null when unreadable.
auto load_source(const std::string& path) -> Rc<lexer::Source> {
    auto content = read_file(path);
    if (is_err(content)) {
        const auto& error = unwrap_err(content);
        std::cerr << "error: cannot read `" << error.path << "`: " << error.message << "\n";
        return nullptr;
    }
    auto source = make_rc<lexer::Source>(path, std::move(unwrap(content)));
    auto& diag = get_diagnostic_emitter();
    diag.set_format(CompilerOptions::diagnostic_format);
    diag.add_source(source);
    return source;
}

} // namespace

int run_tokens(const std::string& path, std::ostream& out) {
    auto source = load_source(path);
    if (!source) {
        return EXIT_ERROR;
    }

    lexer::Lexer lex(*source);
    auto tokens = lex.tokenize_all();

    for (const auto& token : tokens) {
        if (token.is_eof()) {
            break;
        }
        std::string position =
            std::to_string(token.span.start.line) + ":" + std::to_string(token.span.start.column);
        out << std::left << std::setw(8) << position << std::setw(12)
            << lexer::token_category_to_string(token.category()) << std::setw(16)
            << lexer::token_kind_to_string(token.kind) << "`" << token.lexeme << "`\n";
    }

    auto& diag = get_diagnostic_emitter();
    for (const auto& error : lex.errors()) {
        diag.emit(error.to_diagnostic());
    }

    YUHO_LOG_INFO("lexer", "lexed " << tokens.size() << " tokens from " << path);
    return lex.has_errors() ? EXIT_ERROR : EXIT_OK;
}

int run_parse(const std::string& path, const ParseCommandOptions& options, std::ostream& out) {
    auto source = load_source(path);
    if (!source) {
        return EXIT_ERROR;
    }
    auto& diag = get_diagnostic_emitter();

    lexer::Lexer lex(*source);
    auto tokens = lex.tokenize();
    if (is_err(tokens)) {
        diag.emit(unwrap_err(tokens).to_diagnostic());
        return EXIT_ERROR;
    }

    parser::Parser parser(std::move(unwrap(tokens)));
    auto module_name = fs::path(path).stem().string();

    parser::ParseOutcome outcome;
    if (options.recover) {
        outcome = parser.parse_program_recovering(module_name);
    } else {
        auto result = parser.parse_program(module_name);
        if (is_err(result)) {
            for (const auto& error : unwrap_err(result)) {
                diag.emit(error.to_diagnostic());
            }
            return EXIT_ERROR;
        }
        outcome.program = std::move(unwrap(result));
    }

    if (options.dump_ast) {
        out << parser::dump_ast(outcome.program);
    } else {
        format::Formatter formatter;
        out << formatter.format(outcome.program);
    }

    for (const auto& error : outcome.errors) {
        diag.emit(error.to_diagnostic());
    }

    YUHO_LOG_INFO("parser", "parsed " << outcome.program.items.size() << " items from " << path);
    return outcome.errors.empty() ? EXIT_OK : EXIT_ERROR;
}

} // namespace yuho::cli
