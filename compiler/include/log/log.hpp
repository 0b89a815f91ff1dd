//! # Yuho Logging
//!
//! Structured, module-tagged logging for the front end.
//!
//! - Levels Trace through Fatal, plus Off
//! - Per-module filtering (`"resolver=debug,*=warn"`)
//! - Console, file, capture and null sinks
//! - Thread-safe dispatch, compile-time elision via `YUHO_MIN_LOG_LEVEL`
//!
//! Module tags used by the pipeline:
//!
//! | Tag        | Component                      |
//! |------------|--------------------------------|
//! | `lexer`    | Tokenization                   |
//! | `parser`   | AST construction               |
//! | `resolver` | Module loading and merging     |
//! | `checker`  | Semantic analysis              |
//! | `config`   | `yuho.toml` loading            |
//! | `cli`      | Command dispatch               |
//!
//! ## Usage
//!
//! ```cpp
//! YUHO_LOG_DEBUG("resolver", "loading " << path);
//! YUHO_LOG_WARN("config", "unknown key '" << key << "'");
//! ```
//!
//! Diagnostics about the user's program never go through the logger; they
//! are rendered by the diagnostic emitter.

#ifndef YUHO_LOG_HPP
#define YUHO_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace yuho::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name of a level ("TRACE", "DEBUG", ...).
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a level name, ignoring case. Unknown names yield `fallback`.
[[nodiscard]] auto parse_level(std::string_view s, LogLevel fallback = LogLevel::Info)
    -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "resolver")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One JSON object per line
};

/// Writes `record` to `out` in the given format, newline-terminated.
void write_record(std::ostream& out, const LogRecord& record, LogFormat format,
                  bool colors = false);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract destination for log records.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, coloured when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

    [[nodiscard]] auto colors_enabled() const -> bool {
        return colors_enabled_;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends to a file. Flushes after every Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Keeps rendered lines in memory. Used by tests and by tools that surface
/// the log next to their own output.
class CaptureSink : public LogSink {
public:
    explicit CaptureSink(LogFormat format = LogFormat::Text) : format_(format) {}

    void write(const LogRecord& record) override;
    void flush() override {}

    /// Returns a copy of the captured lines (without trailing newlines).
    [[nodiscard]] auto lines() const -> std::vector<std::string>;

    /// Returns true if any captured line contains `needle`.
    [[nodiscard]] auto contains(std::string_view needle) const -> bool;

    void clear();

private:
    LogFormat format_;
    mutable std::mutex mutex_;
    std::vector<std::string> lines_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based level filter.
///
/// Parses specifications like `"resolver=trace,checker=debug,*=warn"`. A bare
/// module name without `=level` enables everything for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// The most verbose level any module (or the default) accepts.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
    bool explicit_level = false;        ///< Level came from the command line or YUHO_LOG
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Auto-initializes with a Warn-level console sink on first use.
class Logger {
public:
    /// Replaces sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before formatting the message.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(const LogRecord& record);
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Records logged afterwards are dropped.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Returns the current local time as "HH:MM:SS.mmm".
[[nodiscard]] auto get_timestamp() -> std::string;

/// Returns milliseconds since epoch.
[[nodiscard]] inline auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Option Parsing
// ============================================================================

/// Extracts `--log-level=`, `--log-filter=`, `--log-file=`, `--log-format=`,
/// `-v/-vv/-vvv`, `--verbose` and `-q` from argv, falling back to the
/// `YUHO_LOG` environment variable when no level or filter was given.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// Returns true if `arg` is consumed by `parse_log_options`.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef YUHO_MIN_LOG_LEVEL
#define YUHO_MIN_LOG_LEVEL 0
#endif

#define YUHO_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= YUHO_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::yuho::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define YUHO_LOG_TRACE(module, msg) YUHO_LOG_IMPL(::yuho::log::LogLevel::Trace, module, msg)
#define YUHO_LOG_DEBUG(module, msg) YUHO_LOG_IMPL(::yuho::log::LogLevel::Debug, module, msg)
#define YUHO_LOG_INFO(module, msg) YUHO_LOG_IMPL(::yuho::log::LogLevel::Info, module, msg)
#define YUHO_LOG_WARN(module, msg) YUHO_LOG_IMPL(::yuho::log::LogLevel::Warn, module, msg)
#define YUHO_LOG_ERROR(module, msg) YUHO_LOG_IMPL(::yuho::log::LogLevel::Error, module, msg)
#define YUHO_LOG_FATAL(module, msg) YUHO_LOG_IMPL(::yuho::log::LogLevel::Fatal, module, msg)

} // namespace yuho::log

#endif // YUHO_LOG_HPP
