#include "diagnostic.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <iomanip>
#include <set>
#include <sstream>

#include <unistd.h>

namespace yuho::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    // stderr must be a terminal and TERM must name a real one
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// Global Emitter
// ============================================================================

DiagnosticEmitter& get_diagnostic_emitter() {
    static DiagnosticEmitter emitter(std::cerr);
    return emitter;
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out)
    : out_(out), format_(CompilerOptions::diagnostic_format) {
    use_colors_ = &out == &std::cerr && terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    sources_[path] = make_rc<lexer::Source>(path, content);
}

void DiagnosticEmitter::add_source(Rc<lexer::Source> source) {
    if (!source) {
        return;
    }
    auto path = std::string(source->filename());
    sources_[path] = std::move(source);
}

std::string DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) const {
    auto it = sources_.find(path);
    if (it == sources_.end())
        return "";
    return std::string(it->second->line(line));
}

const char* DiagnosticEmitter::severity_color(DiagnosticSeverity sev) const {
    switch (sev) {
    case DiagnosticSeverity::Error:
        return Colors::BrightRed;
    case DiagnosticSeverity::Warning:
        return Colors::BrightYellow;
    case DiagnosticSeverity::Note:
        return Colors::BrightCyan;
    case DiagnosticSeverity::Help:
        return Colors::BrightGreen;
    }
    return Colors::Reset;
}

void DiagnosticEmitter::emit_header(const Diagnostic& diag) {
    // Format: error[T001]: message
    out_ << color(Colors::Bold) << color(severity_color(diag.severity))
         << severity_to_string(diag.severity);

    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }

    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_labeled_line(const std::string& file_path, uint32_t line,
                                          const std::vector<DiagnosticLabel>& labels,
                                          int line_width) {
    std::string source_line = get_source_line(file_path, line);

    std::vector<const DiagnosticLabel*> line_labels;
    for (const auto& label : labels) {
        if (label.span.start.line == line) {
            line_labels.push_back(&label);
        }
    }
    std::sort(line_labels.begin(), line_labels.end(),
              [](const DiagnosticLabel* a, const DiagnosticLabel* b) {
                  return a->span.start.column < b->span.start.column;
              });

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << line << " | "
         << color(Colors::Reset) << source_line << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset);

    // `end` is the last covered byte, so a span on one line covers
    // columns [start.column, end.column]
    size_t current_pos = 0;
    for (const auto* label : line_labels) {
        uint32_t start_col = label->span.start.column > 0 ? label->span.start.column - 1 : 0;
        uint32_t end_col = label->span.end.line == line && label->span.end.column > start_col
                               ? label->span.end.column
                               : (label->span.end.line > line
                                      ? static_cast<uint32_t>(source_line.length())
                                      : start_col + 1);
        end_col = std::max(end_col, start_col + 1);

        while (current_pos < start_col) {
            out_ << ' ';
            current_pos++;
        }

        const char* label_color = label->is_primary ? Colors::BrightRed : Colors::BrightBlue;
        char underline_char = label->is_primary ? '^' : '-';

        out_ << color(label_color);
        while (current_pos < end_col) {
            out_ << underline_char;
            current_pos++;
        }
        out_ << color(Colors::Reset);
    }

    // The rightmost label with a message gets it inline
    const DiagnosticLabel* inline_label = nullptr;
    for (auto it = line_labels.rbegin(); it != line_labels.rend(); ++it) {
        if (!(*it)->message.empty()) {
            inline_label = *it;
            break;
        }
    }
    if (inline_label) {
        const char* label_color = inline_label->is_primary ? Colors::BrightRed : Colors::BrightBlue;
        out_ << " " << color(label_color) << inline_label->message << color(Colors::Reset);
    }
    out_ << "\n";

    for (const auto* label : line_labels) {
        if (label == inline_label || label->message.empty()) {
            continue;
        }
        uint32_t start_col = label->span.start.column > 0 ? label->span.start.column - 1 : 0;

        out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
             << color(Colors::Reset) << std::string(start_col, ' ') << color(Colors::BrightBlue)
             << "|" << color(Colors::Reset) << "\n";

        out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
             << color(Colors::Reset) << std::string(start_col, ' ')
             << color(label->is_primary ? Colors::BrightRed : Colors::BrightBlue)
             << label->message << color(Colors::Reset) << "\n";
    }
}

void DiagnosticEmitter::emit_source_snippet(const Diagnostic& diag) {
    const auto& span = diag.primary_span;
    std::string file_path = diag.file.empty() ? std::string(span.start.file) : diag.file;
    if (file_path.empty() && span.start.line == 0) {
        return;
    }

    // Location line: --> file:line:column
    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << file_path << ":"
         << span.start.line << ":" << span.start.column << "\n";

    if (sources_.find(file_path) == sources_.end()) {
        return;
    }

    // Labels in this file render inline; the rest get their own block
    std::vector<DiagnosticLabel> all_labels;
    std::vector<const DiagnosticLabel*> foreign;
    bool has_primary = false;
    for (const auto& label : diag.labels) {
        if (std::string(label.span.start.file) != file_path) {
            foreign.push_back(&label);
            continue;
        }
        has_primary = has_primary || label.is_primary;
        all_labels.push_back(label);
    }
    if (!has_primary) {
        all_labels.insert(all_labels.begin(),
                          DiagnosticLabel{.span = span, .message = "", .is_primary = true});
    }

    std::set<uint32_t> lines_to_show;
    uint32_t max_line = span.start.line;
    for (const auto& label : all_labels) {
        lines_to_show.insert(label.span.start.line);
        max_line = std::max(max_line, label.span.start.line);
    }
    for (const auto* label : foreign) {
        max_line = std::max(max_line, label->span.start.line);
    }
    int line_width = static_cast<int>(std::to_string(max_line).length());
    line_width = std::max(line_width, 4);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";

    uint32_t prev_line = 0;
    for (uint32_t line : lines_to_show) {
        if (prev_line > 0 && line > prev_line + 1) {
            out_ << color(Colors::BrightBlue) << std::setw(line_width - 1) << "" << "..."
                 << color(Colors::Reset) << "\n";
        }
        emit_labeled_line(file_path, line, all_labels, line_width);
        prev_line = line;
    }

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";

    emit_foreign_labels(foreign, line_width);
}

void DiagnosticEmitter::emit_foreign_labels(const std::vector<const DiagnosticLabel*>& labels,
                                            int line_width) {
    for (const auto* label : labels) {
        std::string file_path(label->span.start.file);

        out_ << color(Colors::BrightBlue) << "  ::: " << color(Colors::Reset) << file_path << ":"
             << label->span.start.line << ":" << label->span.start.column << "\n";

        if (sources_.find(file_path) == sources_.end()) {
            continue;
        }

        out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |"
             << color(Colors::Reset) << "\n";
        emit_labeled_line(file_path, label->span.start.line, {*label}, line_width);
        out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |"
             << color(Colors::Reset) << "\n";
    }
}

void DiagnosticEmitter::emit_notes(const std::vector<std::string>& notes) {
    for (const auto& note : notes) {
        out_ << color(Colors::BrightCyan) << "  = note" << color(Colors::Reset) << ": " << note
             << "\n";
    }
}

void DiagnosticEmitter::emit_help(const std::vector<std::string>& help) {
    for (const auto& h : help) {
        out_ << color(Colors::BrightGreen) << "  = help" << color(Colors::Reset) << ": " << h
             << "\n";
    }
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        error_count_++;
    } else if (diag.severity == DiagnosticSeverity::Warning) {
        warning_count_++;
    }

    if (format_ == DiagnosticFormat::JSON) {
        emit_json(diag);
        return;
    }

    emit_header(diag);
    emit_source_snippet(diag);
    emit_notes(diag.notes);
    emit_help(diag.help);
    out_ << "\n";
}

void DiagnosticEmitter::emit_all(const std::vector<Diagnostic>& diagnostics) {
    for (const auto& diag : diagnostics) {
        emit(diag);
    }
}

void DiagnosticEmitter::emit_summary() {
    if (format_ == DiagnosticFormat::JSON) {
        return;
    }
    if (warning_count_ > 0) {
        out_ << color(Colors::Bold) << color(Colors::BrightYellow) << "warning"
             << color(Colors::Reset) << color(Colors::Bold) << ": " << warning_count_
             << (warning_count_ == 1 ? " warning" : " warnings") << " emitted"
             << color(Colors::Reset) << "\n";
    }
    if (error_count_ > 0) {
        out_ << color(Colors::Bold) << color(Colors::BrightRed) << "error" << color(Colors::Reset)
             << color(Colors::Bold) << ": aborting due to " << error_count_
             << (error_count_ == 1 ? " previous error" : " previous errors")
             << color(Colors::Reset) << "\n";
    }
}

// ============================================================================
// JSON Output
// ============================================================================

namespace {

// Writes `["a","b"]`
void write_json_strings(std::ostream& out, const std::vector<std::string>& items) {
    out << '[';
    for (size_t i = 0; i < items.size(); ++i) {
        out << (i > 0 ? ",\"" : "\"") << escape_json(items[i]) << '"';
    }
    out << ']';
}

} // namespace

void DiagnosticEmitter::emit_json_span(const SourceSpan& span) {
    out_ << "{\"file\":\"" << escape_json(span.start.file) << "\",\"start\":{\"line\":"
         << span.start.line << ",\"column\":" << span.start.column
         << "},\"end\":{\"line\":" << span.end.line << ",\"column\":" << span.end.column
         << "}}";
}

void DiagnosticEmitter::emit_json(const Diagnostic& diag) {
    out_ << "{\"severity\":\"" << severity_to_string(diag.severity) << "\",\"kind\":\""
         << diagnostic_kind_to_string(diag.kind) << "\",\"code\":\"" << escape_json(diag.code)
         << "\",\"message\":\"" << escape_json(diag.message) << "\",\"file\":\""
         << escape_json(diag.file) << "\",\"span\":";
    emit_json_span(diag.primary_span);

    out_ << ",\"labels\":[";
    for (size_t i = 0; i < diag.labels.size(); ++i) {
        const auto& label = diag.labels[i];
        out_ << (i > 0 ? "," : "") << "{\"message\":\"" << escape_json(label.message)
             << "\",\"is_primary\":" << (label.is_primary ? "true" : "false") << ",\"span\":";
        emit_json_span(label.span);
        out_ << '}';
    }
    out_ << "],\"notes\":";
    write_json_strings(out_, diag.notes);
    out_ << ",\"help\":";
    write_json_strings(out_, diag.help);
    out_ << "}\n";
}

} // namespace yuho::cli
