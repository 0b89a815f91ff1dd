//! # Formatter Core Utilities
//!
//! ## Functions
//!
//! | Method          | Description                              |
//! |-----------------|------------------------------------------|
//! | `format()`      | Format complete program to string        |
//! | `emit()`        | Write text to output buffer              |
//! | `emit_line()`   | Write indented line with newline         |
//! | `push_indent()` | Increase indentation level               |
//! | `pop_indent()`  | Decrease indentation level               |
//! | `indent_str()`  | Get current indentation string           |
//! | `quote_string()`| Re-escape a decoded string literal       |

#include "format/formatter.hpp"

#include <cstdio>

namespace yuho::format {

Formatter::Formatter(FormatOptions options) : options_(std::move(options)) {}

void Formatter::emit(const std::string& text) {
    output_ << text;
}

void Formatter::emit_line(const std::string& text) {
    emit_indent();
    output_ << text << "\n";
}

void Formatter::emit_newline() {
    output_ << "\n";
}

void Formatter::emit_indent() {
    output_ << indent_str();
}

void Formatter::push_indent() {
    ++indent_level_;
}

void Formatter::pop_indent() {
    if (indent_level_ > 0)
        --indent_level_;
}

auto Formatter::indent_str() const -> std::string {
    return indent_str(indent_level_);
}

auto Formatter::indent_str(int level) const -> std::string {
    if (options_.use_tabs) {
        return std::string(static_cast<size_t>(level), '\t');
    }
    return std::string(static_cast<size_t>(level * options_.indent_width), ' ');
}

auto Formatter::format(const parser::Program& program) -> std::string {
    output_.str("");
    indent_level_ = 0;
    format_items(program.items);
    return output_.str();
}

auto quote_string(std::string_view text) -> std::string {
    std::string out = "\"";
    for (char c : text) {
        switch (c) {
        case '\\':
            out += "\\\\";
            break;
        case '"':
            out += "\\\"";
            break;
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        case '\r':
            out += "\\r";
            break;
        case '\b':
            out += "\\b";
            break;
        case '\0':
            out += "\\0";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                char buf[8];
                std::snprintf(buf, sizeof(buf), "\\x%02X", static_cast<unsigned char>(c));
                out += buf;
            } else {
                out += c;
            }
        }
    }
    out += "\"";
    return out;
}

} // namespace yuho::format
