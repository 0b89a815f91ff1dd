//! # Log Initialization from CLI
//!
//! Builds a `LogConfig` from command-line flags and the `YUHO_LOG`
//! environment variable.
//!
//! | Flag                  | Effect                               |
//! |-----------------------|--------------------------------------|
//! | `--log-level=<lvl>`   | Global level                         |
//! | `--log-filter=<spec>` | Per-module levels                    |
//! | `--log-file=<path>`   | Additional file sink                 |
//! | `--log-format=json`   | JSON lines instead of text           |
//! | `-v` / `-vv` / `-vvv` | Info / Debug / Trace                 |
//! | `-q`, `--quiet`       | Errors only                          |

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace yuho::log {

namespace {

/// Returns the number of `v`s in `-v`, `-vv`, ... or 0 if `arg` is not one.
auto verbosity_count(std::string_view arg) -> int {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return 0;
    }
    for (size_t i = 1; i < arg.size(); ++i) {
        if (arg[i] != 'v') {
            return 0;
        }
    }
    return static_cast<int>(arg.size() - 1);
}

} // namespace

auto is_log_option(std::string_view arg) -> bool {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || verbosity_count(arg) > 0;
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12), LogLevel::Warn);
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(arg.substr(11));
        } else if (arg.starts_with("--log-format=")) {
            auto fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            v_count = std::max(v_count, 1);
        } else {
            v_count = std::max(v_count, verbosity_count(arg));
        }
    }

    if (!has_cli_level && v_count > 0) {
        config.level = v_count >= 3   ? LogLevel::Trace
                       : v_count == 2 ? LogLevel::Debug
                                      : LogLevel::Info;
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("YUHO_LOG");
        std::string_view env = env_log != nullptr ? env_log : "";
        if (!env.empty()) {
            // "module=level,..." or "a,b" is a filter; a single word is a level.
            if (env.find('=') != std::string_view::npos ||
                env.find(',') != std::string_view::npos) {
                config.filter_spec = std::string(env);
                has_cli_filter = true;
            } else {
                config.level = parse_level(env, LogLevel::Warn);
                has_cli_level = true;
            }
        }
    }

    config.explicit_level = has_cli_level || has_cli_filter;
    return config;
}

} // namespace yuho::log
