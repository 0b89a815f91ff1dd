//! # Source File Management
//!
//! A loaded `.yh` file with a line index for offset to line/column lookup.
//!
//! ## Example
//!
//! ```cpp
//! auto source = Source::from_string("int x := 42;", "<test>");
//! SourceLocation loc = source.location(4); // line 1, column 5
//! std::string_view line = source.line(1);  // "int x := 42;"
//! ```
//!
//! Tokens and AST spans hold views into a `Source`, so whoever keeps the
//! AST keeps the `Source` alive (modules hold it in an `Rc`).

#ifndef YUHO_LEXER_SOURCE_HPP
#define YUHO_LEXER_SOURCE_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace yuho::lexer {

/// Owns the text of one source file.
///
/// The line index is built once on construction; `location()` is a binary
/// search over it.
class Source {
public:
    Source(std::string filename, std::string content);

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at `offset`, or '\0' past the end.
    [[nodiscard]] auto at(size_t offset) const -> char {
        return offset < content_.size() ? content_[offset] : '\0';
    }

    /// Returns the bytes in `[start, end)`, clamped to the content.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Builds the span covering `[start, end)`.
    [[nodiscard]] auto span(size_t start, size_t end) const -> SourceSpan;

    /// Returns line `line_num` (1-based) without its terminator.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t {
        return static_cast<uint32_t>(line_offsets_.size());
    }

    /// Loads a file from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Wraps in-memory text; `name` is used in diagnostics.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.
};

} // namespace yuho::lexer

#endif // YUHO_LEXER_SOURCE_HPP
