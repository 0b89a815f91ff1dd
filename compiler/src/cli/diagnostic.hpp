//! # Diagnostic Rendering
//!
//! Renders `yuho::Diagnostic` values for the terminal or for editors.
//!
//! ## Text Format
//!
//! ```text
//! error[T003]: duplicate field `fine`
//!   --> penal.yh:4:5
//!      |
//!    2 |     money fine;
//!      |           ---- `fine` first declared here
//!    4 |     money fine;
//!      |           ^^^^
//!      |
//!   = help: rename or remove one of the declarations
//! ```
//!
//! Primary spans are underlined with `^^^`, secondary labels with `---`.
//! Labels that point into another file get their own `-->` block.
//!
//! ## JSON Format
//!
//! With `CompilerOptions::diagnostic_format == DiagnosticFormat::JSON` every
//! diagnostic is one JSON object per line, carrying severity, code, message,
//! span, labels, notes and help.

#pragma once
#include "common.hpp"
#include "common/diagnostic.hpp"
#include "lexer/source.hpp"

#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace yuho::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightGreen = "\033[92m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
    static constexpr const char* BrightCyan = "\033[96m";
};

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    // Configuration
    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }

    void set_format(DiagnosticFormat format) {
        format_ = format;
    }

    /// Registers file text so snippets can be shown for spans in `path`.
    void set_source_content(const std::string& path, const std::string& content);

    /// Registers an already loaded source under its own filename.
    void add_source(Rc<lexer::Source> source);

    // Emit diagnostics
    void emit(const Diagnostic& diag);
    void emit_all(const std::vector<Diagnostic>& diagnostics);

    /// Prints the `error: aborting due to N previous errors` style summary
    /// (text format only).
    void emit_summary();

    // Statistics
    size_t error_count() const {
        return error_count_;
    }
    size_t warning_count() const {
        return warning_count_;
    }
    void reset_counts() {
        error_count_ = 0;
        warning_count_ = 0;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    DiagnosticFormat format_;
    std::unordered_map<std::string, Rc<lexer::Source>> sources_; // path -> source
    size_t error_count_ = 0;
    size_t warning_count_ = 0;

    // Color helpers
    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    // Formatting helpers
    void emit_header(const Diagnostic& diag);
    void emit_source_snippet(const Diagnostic& diag);
    void emit_foreign_labels(const std::vector<const DiagnosticLabel*>& labels, int line_width);
    void emit_labeled_line(const std::string& file_path, uint32_t line,
                           const std::vector<DiagnosticLabel>& labels, int line_width);
    void emit_notes(const std::vector<std::string>& notes);
    void emit_help(const std::vector<std::string>& help);

    // JSON output
    void emit_json(const Diagnostic& diag);
    void emit_json_span(const SourceSpan& span);

    std::string get_source_line(const std::string& path, uint32_t line) const;
    const char* severity_color(DiagnosticSeverity sev) const;
};

// ============================================================================
// Global Diagnostic Emitter
// ============================================================================

// Get the global diagnostic emitter (stderr)
DiagnosticEmitter& get_diagnostic_emitter();

// Check if terminal supports colors
bool terminal_supports_colors();

} // namespace yuho::cli
