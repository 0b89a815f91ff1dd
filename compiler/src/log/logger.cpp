//! # Logger Implementation
//!
//! Record rendering, the sinks, the module filter and the Logger singleton.

#include "log/log.hpp"

#include "common/diagnostic.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstdio>
#include <ctime>

#include <unistd.h>

namespace yuho::log {

// ============================================================================
// Levels
// ============================================================================

namespace {

struct LevelStyle {
    const char* name;
    const char* color;
};

// Indexed by LogLevel
constexpr LevelStyle LEVEL_STYLES[] = {
    {"TRACE", "\033[90m"}, {"DEBUG", "\033[36m"}, {"INFO", "\033[32m"},   {"WARN", "\033[33m"},
    {"ERROR", "\033[31m"}, {"FATAL", "\033[1;31m"}, {"OFF", ""},
};

auto style_of(LogLevel level) -> const LevelStyle& {
    return LEVEL_STYLES[static_cast<int>(level)];
}

auto equals_upper(std::string_view text, std::string_view upper) -> bool {
    return text.size() == upper.size() &&
           std::equal(text.begin(), text.end(), upper.begin(), [](char a, char b) {
               return std::toupper(static_cast<unsigned char>(a)) == b;
           });
}

auto detect_terminal_colors() -> bool {
    if (isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    if (term == nullptr) {
        return false;
    }
    if (std::getenv("NO_COLOR") != nullptr) {
        return false;
    }
    return std::string_view(term) != "dumb";
}

} // namespace

auto level_name(LogLevel level) -> const char* {
    return style_of(level).name;
}

auto parse_level(std::string_view s, LogLevel fallback) -> LogLevel {
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        if (equals_upper(s, LEVEL_STYLES[i].name)) {
            return static_cast<LogLevel>(i);
        }
    }
    return equals_upper(s, "WARNING") ? LogLevel::Warn : fallback;
}

auto get_timestamp() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;

    std::tm local{};
    localtime_r(&seconds, &local);

    char buf[16];
    auto n = std::strftime(buf, sizeof(buf), "%H:%M:%S", &local);
    std::snprintf(buf + n, sizeof(buf) - n, ".%03d", static_cast<int>(millis));
    return buf;
}

// ============================================================================
// Record Rendering
// ============================================================================

void write_record(std::ostream& out, const LogRecord& record, LogFormat format, bool colors) {
    if (format == LogFormat::JSON) {
        out << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
            << "\",\"module\":\"" << escape_json(record.module) << "\",\"msg\":\""
            << escape_json(record.message) << "\"}\n";
        return;
    }

    out << get_timestamp() << ' ';
    if (colors) {
        out << style_of(record.level).color;
    }
    out << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        out << "\033[0m";
    }
    out << " [" << record.module << "] " << record.message << '\n';
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    // Render into a buffer so concurrent writers never interleave mid-line.
    std::ostringstream oss;
    write_record(oss, record, format_, colors_enabled_);
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    write_record(file_, record, format_);
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// CaptureSink
// ============================================================================

void CaptureSink::write(const LogRecord& record) {
    std::ostringstream oss;
    write_record(oss, record, format_);
    auto line = oss.str();
    if (!line.empty() && line.back() == '\n') {
        line.pop_back();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.push_back(std::move(line));
}

auto CaptureSink::lines() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return lines_;
}

auto CaptureSink::contains(std::string_view needle) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(lines_.begin(), lines_.end(), [needle](const std::string& line) {
        return line.find(needle) != std::string::npos;
    });
}

void CaptureSink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    lines_.clear();
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto entry = spec.substr(pos, comma - pos);
        while (!entry.empty() && entry.front() == ' ') {
            entry.remove_prefix(1);
        }
        while (!entry.empty() && entry.back() == ' ') {
            entry.remove_suffix(1);
        }

        size_t eq = entry.find('=');
        if (eq != std::string_view::npos) {
            auto mod = entry.substr(0, eq);
            auto lvl = parse_level(entry.substr(eq + 1));
            if (mod == "*") {
                default_level_ = lvl;
            } else {
                module_levels_[std::string(mod)] = lvl;
            }
        } else if (!entry.empty()) {
            module_levels_[std::string(entry)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        min = std::min(min, level);
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    logger.level_ = config.level;

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // A filter without "*=level" keeps the configured level as default.
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        logger.level_ = logger.filter_.min_level();
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    if (level < level_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{.level = level,
                  .module = module,
                  .message = message,
                  .file = file,
                  .line = line,
                  .timestamp_ms = epoch_ms()});
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    level_ = filter_.min_level();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace yuho::log
