#include "project_config.hpp"

#include <cctype>
#include <cstdlib>
#include <fstream>

namespace yuho::cli {

// ============================================================================
// ProjectConfig
// ============================================================================

auto ProjectConfig::load(const fs::path& path) -> Result<ProjectConfig, std::string> {
    std::ifstream file(path);
    if (!file) {
        return "cannot read " + path.generic_string();
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

    SimpleTomlParser parser(content);
    auto result = parser.parse();
    if (is_err(result))
        return path.generic_string() + ":" + unwrap_err(result);

    auto config = std::move(unwrap(result));
    config.path = path.generic_string();
    YUHO_LOG_DEBUG("config", "loaded " << config.path);
    return config;
}

auto ProjectConfig::discover(const fs::path& entry_dir) -> Result<ProjectConfig, std::string> {
    std::error_code ec;
    for (const auto& dir : {entry_dir, fs::current_path(ec)}) {
        auto candidate = (dir.empty() ? fs::path(".") : dir) / PROJECT_FILE;
        YUHO_LOG_TRACE("config", "looking for " << candidate.generic_string());
        if (fs::exists(candidate, ec)) {
            return load(candidate);
        }
    }
    return ProjectConfig{};
}

// ============================================================================
// SimpleTomlParser
// ============================================================================

SimpleTomlParser::SimpleTomlParser(const std::string& content)
    : content_(content), pos_(0), line_(1) {}

void SimpleTomlParser::skip_whitespace() {
    while (!is_eof() && std::isspace(static_cast<unsigned char>(peek()))) {
        if (peek() == '\n')
            line_++;
        advance();
    }
}

void SimpleTomlParser::skip_inline_whitespace() {
    while (!is_eof() && (peek() == ' ' || peek() == '\t' || peek() == '\r')) {
        advance();
    }
}

void SimpleTomlParser::skip_comment() {
    if (peek() == '#') {
        while (!is_eof() && peek() != '\n') {
            advance();
        }
    }
}

void SimpleTomlParser::skip_trivia() {
    skip_whitespace();
    while (peek() == '#') {
        skip_comment();
        skip_whitespace();
    }
}

char SimpleTomlParser::advance() {
    if (is_eof())
        return '\0';
    return content_[pos_++];
}

std::string SimpleTomlParser::parse_identifier() {
    std::string result;
    while (!is_eof() && (std::isalnum(static_cast<unsigned char>(peek())) || peek() == '_' ||
                         peek() == '-')) {
        result += advance();
    }
    return result;
}

std::string SimpleTomlParser::parse_string() {
    if (peek() != '"') {
        set_error("expected a string");
        return "";
    }
    advance(); // Skip opening quote

    std::string result;
    while (!is_eof() && peek() != '"' && peek() != '\n') {
        if (peek() == '\\') {
            advance();
            if (is_eof())
                break;
            char escaped = advance();
            switch (escaped) {
            case 'n':
                result += '\n';
                break;
            case 't':
                result += '\t';
                break;
            case '\\':
                result += '\\';
                break;
            case '"':
                result += '"';
                break;
            default:
                set_error(std::string("invalid escape '\\") + escaped + "'");
                return "";
            }
        } else {
            result += advance();
        }
    }

    if (peek() != '"') {
        set_error("unterminated string");
        return "";
    }
    advance(); // Skip closing quote

    return result;
}

int SimpleTomlParser::parse_number() {
    bool negative = false;
    if (peek() == '-') {
        negative = true;
        advance();
    }
    if (!std::isdigit(static_cast<unsigned char>(peek()))) {
        set_error("expected an integer");
        return 0;
    }

    long value = 0;
    while (!is_eof() && (std::isdigit(static_cast<unsigned char>(peek())) || peek() == '_')) {
        char c = advance();
        if (c == '_')
            continue;
        value = value * 10 + (c - '0');
        if (value > 1'000'000'000) {
            set_error("integer out of range");
            return 0;
        }
    }
    return static_cast<int>(negative ? -value : value);
}

bool SimpleTomlParser::parse_boolean() {
    std::string value = parse_identifier();
    if (value != "true" && value != "false") {
        set_error("expected 'true' or 'false'");
        return false;
    }
    return value == "true";
}

std::vector<std::string> SimpleTomlParser::parse_string_array() {
    std::vector<std::string> result;

    if (peek() != '[') {
        set_error("expected an array");
        return result;
    }
    advance(); // Skip '['

    skip_whitespace();
    while (!is_eof() && peek() != ']') {
        skip_trivia();
        if (peek() == ']')
            break;

        if (peek() != '"') {
            set_error("expected a string in array");
            return result;
        }
        result.push_back(parse_string());
        if (failed())
            return result;

        skip_trivia();
        if (peek() == ',') {
            advance();
            skip_whitespace();
        } else if (peek() != ']') {
            set_error("expected ',' or ']' in array");
            return result;
        }
    }

    if (peek() != ']') {
        set_error("expected closing bracket");
        return result;
    }
    advance(); // Skip ']'

    return result;
}

void SimpleTomlParser::set_error(const std::string& message) {
    // Keep the first error
    if (error_message_.empty()) {
        error_message_ = std::to_string(line_) + ": " + message;
    }
}

bool SimpleTomlParser::expect_line_end() {
    skip_inline_whitespace();
    skip_comment();
    if (!is_eof() && peek() != '\n') {
        set_error("unexpected trailing characters");
        return false;
    }
    return true;
}

bool SimpleTomlParser::parse_section_body(
    const std::string& section, const std::function<bool(const std::string&)>& on_key) {
    skip_trivia();

    while (!is_eof() && peek() != '[') {
        skip_trivia();

        if (peek() == '[' || is_eof())
            break;

        std::string key = parse_identifier();
        if (key.empty()) {
            set_error("expected a key");
            return false;
        }
        skip_inline_whitespace();

        if (peek() != '=') {
            set_error("expected '=' after key '" + key + "'");
            return false;
        }
        advance();
        skip_inline_whitespace();

        if (!on_key(key)) {
            set_error("unknown key '" + key + "' in [" + section + "]");
            return false;
        }
        if (failed() || !expect_line_end())
            return false;
    }

    return true;
}

bool SimpleTomlParser::parse_project_section(ProjectInfo& info) {
    return parse_section_body("project", [&](const std::string& key) {
        if (key == "name") {
            info.name = parse_string();
        } else if (key == "entry") {
            info.entry = parse_string();
        } else {
            return false;
        }
        return true;
    });
}

bool SimpleTomlParser::parse_resolver_section(ResolverSettings& settings) {
    return parse_section_body("resolver", [&](const std::string& key) {
        if (key == "search_paths") {
            settings.search_paths = parse_string_array();
        } else {
            return false;
        }
        return true;
    });
}

bool SimpleTomlParser::parse_check_section(CheckSettings& settings) {
    return parse_section_body("check", [&](const std::string& key) {
        if (key == "warnings_as_errors") {
            settings.warnings_as_errors = parse_boolean();
        } else if (key == "diagnostic_format") {
            auto format = parse_string();
            if (format == "text") {
                settings.diagnostic_format = DiagnosticFormat::Text;
            } else if (format == "json") {
                settings.diagnostic_format = DiagnosticFormat::JSON;
            } else if (!failed()) {
                set_error("diagnostic_format must be \"text\" or \"json\"");
            }
        } else if (key == "warnings") {
            auto level = parse_string();
            if (level == "none") {
                settings.warnings = WarningLevel::None;
            } else if (level == "default") {
                settings.warnings = WarningLevel::Default;
            } else if (level == "all") {
                settings.warnings = WarningLevel::All;
            } else if (!failed()) {
                set_error("warnings must be \"none\", \"default\" or \"all\"");
            }
        } else if (key == "max_errors") {
            settings.max_errors = parse_number();
            if (settings.max_errors < 0 && !failed()) {
                set_error("max_errors must not be negative");
            }
        } else {
            return false;
        }
        return true;
    });
}

bool SimpleTomlParser::parse_log_section(LogSettings& settings) {
    return parse_section_body("log", [&](const std::string& key) {
        if (key == "level") {
            settings.level = parse_string();
        } else if (key == "filter") {
            settings.filter = parse_string();
        } else if (key == "file") {
            settings.file = parse_string();
        } else {
            return false;
        }
        return true;
    });
}

auto SimpleTomlParser::parse() -> Result<ProjectConfig, std::string> {
    ProjectConfig config;

    while (!is_eof() && !failed()) {
        skip_trivia();

        if (is_eof())
            break;

        if (peek() != '[') {
            set_error("expected a [section] header");
            break;
        }
        advance(); // Skip '['

        std::string section = parse_identifier();
        if (peek() != ']') {
            set_error("expected ']' after section name");
            break;
        }
        advance(); // Skip ']'
        if (!expect_line_end())
            break;

        if (section == "project") {
            parse_project_section(config.project);
        } else if (section == "resolver") {
            parse_resolver_section(config.resolver);
        } else if (section == "check") {
            parse_check_section(config.check);
        } else if (section == "log") {
            parse_log_section(config.log);
        } else {
            set_error("unknown section [" + section + "]");
        }
    }

    if (failed()) {
        return error_message_;
    }
    return config;
}

// ============================================================================
// Merging
// ============================================================================

auto split_search_paths(std::string_view list) -> std::vector<std::string> {
    std::vector<std::string> paths;
    size_t start = 0;
    while (start <= list.size()) {
        auto end = list.find(':', start);
        if (end == std::string_view::npos) {
            end = list.size();
        }
        if (end > start) {
            paths.emplace_back(list.substr(start, end - start));
        }
        start = end + 1;
    }
    return paths;
}

void apply_project_config(const ProjectConfig& config) {
    CompilerOptions::warnings_as_errors = config.check.warnings_as_errors;
    CompilerOptions::diagnostic_format = config.check.diagnostic_format;
    CompilerOptions::warning_level = config.check.warnings;

    std::vector<std::string> paths;
    if (const char* env = std::getenv(SEARCH_PATH_ENV)) {
        paths = split_search_paths(env);
    }
    for (const auto& path : config.resolver.search_paths) {
        fs::path p(path);
        paths.push_back(p.is_absolute() ? p.generic_string()
                                        : (config.base_dir() / p).generic_string());
    }
    CompilerOptions::search_paths = std::move(paths);
}

auto merge_log_config(const ProjectConfig& config, log::LogConfig cli) -> log::LogConfig {
    if (!cli.explicit_level) {
        if (!config.log.level.empty()) {
            cli.level = log::parse_level(config.log.level, cli.level);
        }
        if (!config.log.filter.empty()) {
            cli.filter_spec = config.log.filter;
        }
    }
    if (cli.log_file.empty() && !config.log.file.empty()) {
        fs::path file(config.log.file);
        cli.log_file =
            file.is_absolute() ? file.generic_string() : (config.base_dir() / file).generic_string();
    }
    return cli;
}

} // namespace yuho::cli
