//! # Common Definitions
//!
//! Shared vocabulary for every stage of the Yuho front end: version
//! constants, global checker options, source positions, the `Result` error
//! type and the owning pointer aliases.
//!
//! ## Overview
//!
//! | Item             | Purpose                                             |
//! |------------------|-----------------------------------------------------|
//! | `VERSION`        | Front-end version reported by `yuhoc --version`     |
//! | `CompilerOptions`| Process-wide diagnostic settings                    |
//! | `SourceLocation` | A single position inside a `.yh` file               |
//! | `SourceSpan`     | A region covered by a token or AST node             |
//! | `Result<T, E>`   | Success-or-error return without exceptions          |
//! | `Box` / `Rc`     | Unique and shared ownership                         |
//!
//! ## Conventions
//!
//! - **No Exceptions**: fallible operations return `Result<T, E>`
//! - **Tree Ownership**: AST children are held in `Box<T>`
//! - **Shared Semantics**: types, modules and sources are held in `Rc<T>`

#ifndef YUHO_COMMON_HPP
#define YUHO_COMMON_HPP

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace yuho {

// ============================================================================
// Version Information
// ============================================================================

/// The front-end version string.
constexpr const char* VERSION = "0.3.0";

constexpr int VERSION_MAJOR = 0;
constexpr int VERSION_MINOR = 3;
constexpr int VERSION_PATCH = 0;

/// File extension of Yuho source files.
constexpr std::string_view SOURCE_EXTENSION = ".yh";

// ============================================================================
// Compiler Configuration
// ============================================================================

/// Which warnings the semantic analyzer reports.
enum class WarningLevel {
    None = 0, ///< Suppress all warnings
    Default,  ///< Unreachable and inexhaustive match warnings
    All       ///< Everything, including stylistic notes
};

/// Output format for diagnostics.
enum class DiagnosticFormat {
    Text, ///< Human-readable text output (default)
    JSON  ///< Machine-readable JSON output for editor integration
};

/// Global front-end configuration.
///
/// Set from the command line or from `yuho.toml` before a `check` run.
///
/// # Example
///
/// ```cpp
/// CompilerOptions::warnings_as_errors = true;
/// CompilerOptions::diagnostic_format = DiagnosticFormat::JSON;
/// ```
struct CompilerOptions {
    /// Enable verbose/debug output to stderr.
    static inline bool verbose = false;

    /// Warning level for diagnostics.
    static inline WarningLevel warning_level = WarningLevel::Default;

    /// Treat warnings as errors (`-Werror`).
    static inline bool warnings_as_errors = false;

    /// Output format for diagnostics.
    static inline DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;

    /// Extra module search paths, in lookup order (after the importing
    /// file's own directory).
    static inline std::vector<std::string> search_paths;
};

// ============================================================================
// Debug Macros
// ============================================================================

/// Outputs a debug message to stderr if verbose mode is enabled.
#define YUHO_DEBUG(msg)                                                                            \
    do {                                                                                           \
        if (::yuho::CompilerOptions::verbose) {                                                    \
            std::cerr << msg;                                                                      \
        }                                                                                          \
    } while (0)

#define YUHO_DEBUG_LN(msg)                                                                         \
    do {                                                                                           \
        if (::yuho::CompilerOptions::verbose) {                                                    \
            std::cerr << msg << "\n";                                                              \
        }                                                                                          \
    } while (0)

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// # Fields
///
/// - `file`: Path of the source file (a view into the owning `Source`)
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from file start
/// - `length`: Length of the source element in bytes
struct SourceLocation {
    std::string_view file;
    uint32_t line = 0;
    uint32_t column = 0;
    uint32_t offset = 0;
    uint32_t length = 0;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
///
/// `end` is the location of the last byte covered; its `length` field holds
/// the byte length of the whole span.
struct SourceSpan {
    SourceLocation start;
    SourceLocation end;

    /// Merges two spans into one that covers both.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        SourceSpan result{a.start, b.end};
        if (b.end.offset >= a.start.offset) {
            result.end.length = b.end.offset - a.start.offset + 1;
        }
        return result;
    }

    /// Returns true if `inner` lies within this span (same file).
    [[nodiscard]] auto contains(const SourceSpan& inner) const -> bool {
        return inner.start.offset >= start.offset && inner.end.offset <= end.offset;
    }

    [[nodiscard]] auto operator==(const SourceSpan& other) const -> bool = default;
};

// ============================================================================
// Result Type
// ============================================================================

/// A type that represents either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = lexer.tokenize();
/// if (is_err(result)) {
///     report(unwrap_err(result));
/// }
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Reference-counted shared pointer.
template <typename T> using Rc = std::shared_ptr<T>;

template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

template <typename T, typename... Args> [[nodiscard]] auto make_rc(Args&&... args) -> Rc<T> {
    return std::make_shared<T>(std::forward<Args>(args)...);
}

} // namespace yuho

#endif // YUHO_COMMON_HPP
