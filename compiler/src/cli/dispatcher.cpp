//! # CLI Command Dispatcher
//!
//! Parses the command line of `yuhoc` and routes to the command handlers.
//!
//! ## Architecture
//!
//! ```text
//! yuho_main()
//!   ├─ --help, -h     → print_usage()
//!   ├─ --version, -V  → print_version()
//!   ├─ tokens         → run_tokens()
//!   ├─ parse          → run_parse()
//!   └─ check          → run_check()
//! ```
//!
//! ## Setup Order
//!
//! 1. Log flags are extracted from anywhere on the command line.
//! 2. `yuho.toml` is discovered next to the input file (or in the working
//!    directory) and applied to `CompilerOptions`.
//! 3. The logger is initialized from the flags, `YUHO_LOG` and `[log]`.
//! 4. Command flags override whatever the file set.
//!
//! ## Return Codes
//!
//! | Code | Meaning                                  |
//! |------|------------------------------------------|
//! | 0    | Success                                  |
//! | 1    | Fatal error or any Error diagnostic      |
//! | 2    | Usage error                              |

#include "commands/cmd_check.hpp"
#include "commands/cmd_debug.hpp"
#include "common.hpp"
#include "log/log.hpp"
#include "project_config.hpp"
#include "utils.hpp"

#include <charconv>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

namespace yuho::cli {

namespace {

int usage_error(const std::string& message) {
    std::cerr << "error: " << message << "\n";
    std::cerr << "Run 'yuhoc --help' for usage information.\n";
    return EXIT_USAGE;
}

} // namespace

int yuho_main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        if (!log::is_log_option(argv[i])) {
            args.emplace_back(argv[i]);
        }
    }

    if (args.empty()) {
        print_usage(std::cerr);
        return EXIT_USAGE;
    }

    const std::string& command = args[0];

    if (command == "--help" || command == "-h") {
        print_usage();
        return EXIT_OK;
    }

    if (command == "--version" || command == "-V") {
        print_version();
        return EXIT_OK;
    }

    if (command != "tokens" && command != "parse" && command != "check") {
        return usage_error("unknown command '" + command + "'");
    }

    // Command flags and the input file
    ParseCommandOptions parse_options;
    CheckCommandOptions check_options;
    std::string file;

    for (size_t i = 1; i < args.size(); ++i) {
        const std::string& arg = args[i];

        if (arg == "--help" || arg == "-h") {
            print_usage();
            return EXIT_OK;
        } else if (command == "parse" && arg == "--recover") {
            parse_options.recover = true;
        } else if (command == "parse" && arg == "--ast") {
            parse_options.dump_ast = true;
        } else if (command == "check" && (arg == "--json" || arg == "--error-format=json")) {
            check_options.json = true;
        } else if (command == "check" && arg == "-Werror") {
            check_options.warnings_as_errors = true;
        } else if (command == "check" && arg == "-Wnone") {
            check_options.no_warnings = true;
        } else if (command == "check" && arg.rfind("--max-errors=", 0) == 0) {
            auto value = std::string_view(arg).substr(13);
            auto [end, ec] =
                std::from_chars(value.data(), value.data() + value.size(), check_options.max_errors);
            if (ec != std::errc() || end != value.data() + value.size() ||
                check_options.max_errors < 0) {
                return usage_error("--max-errors expects a non-negative integer");
            }
        } else if (command == "check" && arg == "-I") {
            if (i + 1 >= args.size()) {
                return usage_error("-I requires a directory");
            }
            check_options.include_dirs.push_back(args[++i]);
        } else if (command == "check" && arg.rfind("-I", 0) == 0) {
            check_options.include_dirs.push_back(arg.substr(2));
        } else if (!arg.empty() && arg[0] == '-') {
            return usage_error("unknown option '" + arg + "' for '" + command + "'");
        } else if (!file.empty()) {
            return usage_error("expected one input file, found '" + file + "' and '" + arg + "'");
        } else {
            file = arg;
        }
    }

    // Project configuration
    auto entry_dir = file.empty() ? fs::path() : fs::path(file).parent_path();
    auto discovered = ProjectConfig::discover(entry_dir);
    if (is_err(discovered)) {
        std::cerr << "error: " << unwrap_err(discovered) << "\n";
        return EXIT_ERROR;
    }
    const auto& config = unwrap(discovered);

    log::Logger::init(merge_log_config(config, log::parse_log_options(argc, argv)));
    apply_project_config(config);
    CompilerOptions::verbose = log::Logger::instance().level() <= log::LogLevel::Debug;

    if (file.empty() && command == "check" && !config.project.entry.empty()) {
        file = (config.base_dir() / config.project.entry).generic_string();
        YUHO_LOG_INFO("cli", "checking project entry " << file);
    }
    if (file.empty()) {
        return usage_error("'" + command + "' requires an input file");
    }

    YUHO_LOG_DEBUG("cli", "command " << command << " on " << file);

    if (command == "tokens") {
        return run_tokens(file);
    }
    if (command == "parse") {
        return run_parse(file, parse_options);
    }

    if (check_options.max_errors == 0) {
        check_options.max_errors = config.check.max_errors;
    }
    return run_check(file, check_options);
}

} // namespace yuho::cli

// Entry point wrapper (outside namespace)
int yuho_main(int argc, char* argv[]) {
    return yuho::cli::yuho_main(argc, argv);
}
