//! # Project Configuration
//!
//! Loads `yuho.toml` and merges it with the environment and the command line.
//!
//! ## Sections
//!
//! | Section      | Type               | Keys                                          |
//! |--------------|--------------------|-----------------------------------------------|
//! | `[project]`  | `ProjectInfo`      | `name`, `entry`                               |
//! | `[resolver]` | `ResolverSettings` | `search_paths`                                |
//! | `[check]`    | `CheckSettings`    | `warnings_as_errors`, `diagnostic_format`, `warnings`, `max_errors` |
//! | `[log]`      | `LogSettings`      | `level`, `filter`, `file`                     |
//!
//! ## Priority
//!
//! Command-line flags > environment (`YUHO_PATH`, `YUHO_LOG`) > `yuho.toml`
//! > built-in defaults.
//!
//! ## TOML Parser
//!
//! `SimpleTomlParser` handles the subset of TOML the file needs: sections,
//! strings, integers, booleans and string arrays. Unknown sections and keys
//! are errors, reported with their line number.

#pragma once
#include "common.hpp"
#include "log/log.hpp"

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace yuho::cli {

/// File name looked up next to the entry file, then in the working directory.
constexpr const char* PROJECT_FILE = "yuho.toml";

/// Environment variable with extra search paths, separated by `:`.
constexpr const char* SEARCH_PATH_ENV = "YUHO_PATH";

struct ProjectInfo {
    std::string name;
    std::string entry;
};

struct ResolverSettings {
    std::vector<std::string> search_paths;
};

struct CheckSettings {
    bool warnings_as_errors = false;
    DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;
    WarningLevel warnings = WarningLevel::Default;
    int max_errors = 0; // 0 = no limit
};

struct LogSettings {
    std::string level;
    std::string filter;
    std::string file;
};

/// Contents of one `yuho.toml`.
struct ProjectConfig {
    ProjectInfo project;
    ResolverSettings resolver;
    CheckSettings check;
    LogSettings log;

    /// The file this was loaded from; empty for defaults.
    std::string path;

    /// Directory that relative paths in the file are resolved against.
    [[nodiscard]] auto base_dir() const -> fs::path {
        return path.empty() ? fs::path() : fs::path(path).parent_path();
    }

    /// Reads and parses `path`.
    static auto load(const fs::path& path) -> Result<ProjectConfig, std::string>;

    /// Looks for `yuho.toml` in `entry_dir`, then in the working directory.
    /// Returns defaults when neither has one.
    static auto discover(const fs::path& entry_dir) -> Result<ProjectConfig, std::string>;
};

/**
 * Parser for the TOML subset used by `yuho.toml`:
 * - Sections: [section]
 * - Key-value pairs: key = "value"
 * - Numbers: key = 123
 * - Booleans: key = true
 * - Arrays: key = ["value1", "value2"]
 * - Comments: # ...
 */
class SimpleTomlParser {
public:
    explicit SimpleTomlParser(const std::string& content);

    /**
     * Parse TOML content into a project configuration
     */
    auto parse() -> Result<ProjectConfig, std::string>;

    /**
     * Get error message if parsing failed
     */
    std::string get_error() const {
        return error_message_;
    }

private:
    std::string content_;
    std::string error_message_;
    size_t pos_ = 0;
    int line_ = 1;

    // Helper methods
    void skip_whitespace();
    void skip_inline_whitespace();
    void skip_comment();
    // Blank lines and whole-line comments
    void skip_trivia();
    bool is_eof() const {
        return pos_ >= content_.size();
    }
    char peek() const {
        return is_eof() ? '\0' : content_[pos_];
    }
    char advance();

    std::string parse_identifier();
    std::string parse_string();
    int parse_number();
    bool parse_boolean();
    std::vector<std::string> parse_string_array();

    // Reads `key = value` lines until the next section header, calling
    // `on_key` with the cursor on the value. `on_key` returns false for an
    // unknown key.
    bool parse_section_body(const std::string& section,
                            const std::function<bool(const std::string&)>& on_key);
    bool expect_line_end();

    bool parse_project_section(ProjectInfo& info);
    bool parse_resolver_section(ResolverSettings& settings);
    bool parse_check_section(CheckSettings& settings);
    bool parse_log_section(LogSettings& settings);

    void set_error(const std::string& message);
    bool failed() const {
        return !error_message_.empty();
    }
};

/// Splits a `YUHO_PATH` style list on `:`, dropping empty entries.
[[nodiscard]] auto split_search_paths(std::string_view list) -> std::vector<std::string>;

/// Copies the `[check]` settings into `CompilerOptions` and replaces its
/// search paths with the `YUHO_PATH` entries followed by the file's own
/// (relative to the file). Command-line `-I` paths are prepended later.
void apply_project_config(const ProjectConfig& config);

/// Fills the level, filter and file of `cli` from `[log]` unless the command
/// line or `YUHO_LOG` already chose them.
[[nodiscard]] auto merge_log_config(const ProjectConfig& config, log::LogConfig cli)
    -> log::LogConfig;

} // namespace yuho::cli
