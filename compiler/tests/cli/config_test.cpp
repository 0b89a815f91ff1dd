#include "project_config.hpp"

#include <cstdlib>
#include <fstream>
#include <gtest/gtest.h>

using namespace yuho;
using namespace yuho::cli;

class ProjectConfigTest : public ::testing::Test {
protected:
    fs::path dir_;

    void SetUp() override {
        dir_ = fs::temp_directory_path() /
               ("yuho_config_test_" +
                std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()));
        fs::remove_all(dir_);
        fs::create_directories(dir_);
        unsetenv(SEARCH_PATH_ENV);
    }

    void TearDown() override {
        fs::remove_all(dir_);
        unsetenv(SEARCH_PATH_ENV);
        CompilerOptions::warnings_as_errors = false;
        CompilerOptions::diagnostic_format = DiagnosticFormat::Text;
        CompilerOptions::warning_level = WarningLevel::Default;
        CompilerOptions::search_paths.clear();
    }

    static auto parse(const std::string& content) -> Result<ProjectConfig, std::string> {
        SimpleTomlParser parser(content);
        return parser.parse();
    }

    static auto parse_ok(const std::string& content) -> ProjectConfig {
        auto result = parse(content);
        if (is_err(result)) {
            ADD_FAILURE() << "parse failed: " << unwrap_err(result);
            return ProjectConfig{};
        }
        return std::move(unwrap(result));
    }

    static auto parse_error(const std::string& content) -> std::string {
        auto result = parse(content);
        EXPECT_TRUE(is_err(result)) << "expected an error for:\n" << content;
        return is_err(result) ? unwrap_err(result) : std::string();
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream out(path);
        out << content;
    }
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ProjectConfigTest, EmptyFileGivesDefaults) {
    auto config = parse_ok("# nothing here\n\n");
    EXPECT_TRUE(config.project.name.empty());
    EXPECT_TRUE(config.resolver.search_paths.empty());
    EXPECT_FALSE(config.check.warnings_as_errors);
    EXPECT_EQ(config.check.max_errors, 0);
}

TEST_F(ProjectConfigTest, AllSections) {
    auto config = parse_ok(R"(
# Penal code models
[project]
name = "penal-code"
entry = "src/main.yh"   # entry module

[resolver]
search_paths = [
    "lib",
    "vendor/statutes", # shared
]

[check]
warnings_as_errors = true
diagnostic_format = "json"
warnings = "all"
max_errors = 1_000

[log]
level = "debug"
filter = "resolver=trace"
file = "yuho.log"
)");

    EXPECT_EQ(config.project.name, "penal-code");
    EXPECT_EQ(config.project.entry, "src/main.yh");
    EXPECT_EQ(config.resolver.search_paths,
              (std::vector<std::string>{"lib", "vendor/statutes"}));
    EXPECT_TRUE(config.check.warnings_as_errors);
    EXPECT_EQ(config.check.diagnostic_format, DiagnosticFormat::JSON);
    EXPECT_EQ(config.check.warnings, WarningLevel::All);
    EXPECT_EQ(config.check.max_errors, 1000);
    EXPECT_EQ(config.log.level, "debug");
    EXPECT_EQ(config.log.filter, "resolver=trace");
    EXPECT_EQ(config.log.file, "yuho.log");
}

TEST_F(ProjectConfigTest, StringEscapes) {
    auto config = parse_ok("[project]\nname = \"a \\\"quoted\\\" name\"\n");
    EXPECT_EQ(config.project.name, "a \"quoted\" name");
}

TEST_F(ProjectConfigTest, UnknownSection) {
    EXPECT_EQ(parse_error("[project]\nname = \"x\"\n[extra]\n"), "3: unknown section [extra]");
}

TEST_F(ProjectConfigTest, UnknownKey) {
    EXPECT_EQ(parse_error("[log]\ncolour = \"red\"\n"), "2: unknown key 'colour' in [log]");
}

TEST_F(ProjectConfigTest, InvalidDiagnosticFormat) {
    EXPECT_EQ(parse_error("[check]\ndiagnostic_format = \"xml\"\n"),
              "2: diagnostic_format must be \"text\" or \"json\"");
}

TEST_F(ProjectConfigTest, InvalidWarningLevel) {
    EXPECT_EQ(parse_error("[check]\nwarnings = \"loud\"\n"),
              "2: warnings must be \"none\", \"default\" or \"all\"");
}

TEST_F(ProjectConfigTest, NegativeMaxErrors) {
    EXPECT_EQ(parse_error("[check]\nmax_errors = -1\n"), "2: max_errors must not be negative");
}

TEST_F(ProjectConfigTest, MalformedValues) {
    EXPECT_EQ(parse_error("[check]\nwarnings_as_errors = yes\n"),
              "2: expected 'true' or 'false'");
    EXPECT_EQ(parse_error("[project]\nname = \"open\n"), "2: unterminated string");
    EXPECT_EQ(parse_error("[project]\nname \"x\"\n"), "2: expected '=' after key 'name'");
    EXPECT_EQ(parse_error("[project]\nname = \"x\" extra\n"), "2: unexpected trailing characters");
    EXPECT_EQ(parse_error("name = \"x\"\n"), "1: expected a [section] header");
}

// ============================================================================
// Loading
// ============================================================================

TEST_F(ProjectConfigTest, LoadRecordsPath) {
    auto path = dir_ / PROJECT_FILE;
    write_file(path, "[project]\nname = \"demo\"\n");

    auto result = ProjectConfig::load(path);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).project.name, "demo");
    EXPECT_EQ(unwrap(result).path, path.generic_string());
    EXPECT_EQ(unwrap(result).base_dir().generic_string(), dir_.generic_string());
}

TEST_F(ProjectConfigTest, LoadErrorNamesFile) {
    auto path = dir_ / PROJECT_FILE;
    write_file(path, "[bogus]\n");

    auto result = ProjectConfig::load(path);
    ASSERT_TRUE(is_err(result));
    EXPECT_EQ(unwrap_err(result), path.generic_string() + ":1: unknown section [bogus]");
}

TEST_F(ProjectConfigTest, LoadMissingFile) {
    auto result = ProjectConfig::load(dir_ / "absent.toml");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("cannot read"), std::string::npos);
}

TEST_F(ProjectConfigTest, DiscoverNextToEntry) {
    write_file(dir_ / PROJECT_FILE, "[project]\nname = \"found\"\n");

    auto result = ProjectConfig::discover(dir_);
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).project.name, "found");
}

// ============================================================================
// Merging
// ============================================================================

TEST_F(ProjectConfigTest, SplitSearchPaths) {
    EXPECT_EQ(split_search_paths("a:b::c:"), (std::vector<std::string>{"a", "b", "c"}));
    EXPECT_TRUE(split_search_paths("").empty());
}

TEST_F(ProjectConfigTest, ApplyOrdersEnvironmentBeforeFile) {
    setenv(SEARCH_PATH_ENV, "/opt/yuho/lib:/usr/share/yuho", 1);

    ProjectConfig config;
    config.path = "proj/yuho.toml";
    config.resolver.search_paths = {"lib", "/abs/statutes"};
    config.check.warnings_as_errors = true;
    config.check.warnings = WarningLevel::None;
    apply_project_config(config);

    EXPECT_EQ(CompilerOptions::search_paths,
              (std::vector<std::string>{"/opt/yuho/lib", "/usr/share/yuho", "proj/lib",
                                        "/abs/statutes"}));
    EXPECT_TRUE(CompilerOptions::warnings_as_errors);
    EXPECT_EQ(CompilerOptions::warning_level, WarningLevel::None);
}

TEST_F(ProjectConfigTest, MergeLogUsesFileWhenNotExplicit) {
    ProjectConfig config;
    config.path = "proj/yuho.toml";
    config.log.level = "debug";
    config.log.filter = "checker=trace";
    config.log.file = "logs/yuho.log";

    auto merged = merge_log_config(config, log::LogConfig{});
    EXPECT_EQ(merged.level, log::LogLevel::Debug);
    EXPECT_EQ(merged.filter_spec, "checker=trace");
    EXPECT_EQ(merged.log_file, "proj/logs/yuho.log");
}

TEST_F(ProjectConfigTest, MergeLogKeepsExplicitChoice) {
    ProjectConfig config;
    config.log.level = "trace";
    config.log.file = "file.log";

    log::LogConfig cli;
    cli.level = log::LogLevel::Error;
    cli.explicit_level = true;
    cli.log_file = "cli.log";

    auto merged = merge_log_config(config, cli);
    EXPECT_EQ(merged.level, log::LogLevel::Error);
    EXPECT_EQ(merged.log_file, "cli.log");
}
