//! # Diagnostics
//!
//! The diagnostic model shared by every pipeline stage. Stages produce
//! `Diagnostic` values; the command-line emitter renders them.
//!
//! ## Error Code Categories
//!
//! | Prefix | Category          | Example                          |
//! |--------|-------------------|----------------------------------|
//! | L      | Lexer             | L002 - Unterminated string       |
//! | P      | Parser            | P002 - Missing terminator        |
//! | R      | Module resolution | R002 - Circular import           |
//! | T      | Semantic analysis | T001 - Type mismatch             |
//! | W      | Warnings          | W001 - Unreachable match arm     |
//!
//! ## Suggestions
//!
//! `find_similar_candidates` ranks names by case-insensitive Levenshtein
//! distance and feeds the "did you mean" help lines.

#ifndef YUHO_COMMON_DIAGNOSTIC_HPP
#define YUHO_COMMON_DIAGNOSTIC_HPP

#include "common.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace yuho {

// ============================================================================
// Error Codes
// ============================================================================

namespace ErrorCodes {
// Lexer errors (L000-L099)
constexpr const char* LEX_INVALID_CHAR = "L001";
constexpr const char* LEX_UNTERMINATED_STRING = "L002";
constexpr const char* LEX_INVALID_NUMBER = "L003";
constexpr const char* LEX_INVALID_ESCAPE = "L004";
constexpr const char* LEX_INVALID_DATE = "L005";
constexpr const char* LEX_INVALID_DURATION = "L006";
constexpr const char* LEX_UNTERMINATED_COMMENT = "L012";

// Parser errors (P000-P099)
constexpr const char* PARSE_UNEXPECTED_TOKEN = "P001";
constexpr const char* PARSE_MISSING_TERMINATOR = "P002";
constexpr const char* PARSE_MISSING_BRACE = "P003";
constexpr const char* PARSE_EXPECTED_EXPR = "P004";
constexpr const char* PARSE_EXPECTED_TYPE = "P005";
constexpr const char* PARSE_EXPECTED_PATTERN = "P006";
constexpr const char* PARSE_NESTING_TOO_DEEP = "P007";

// Resolver errors (R000-R099)
constexpr const char* RESOLVE_MODULE_NOT_FOUND = "R001";
constexpr const char* RESOLVE_CIRCULAR_IMPORT = "R002";
constexpr const char* RESOLVE_MISSING_SYMBOL = "R003";
constexpr const char* RESOLVE_DUPLICATE_EXPORT = "R004";
constexpr const char* RESOLVE_FILE_READ = "R005";

// Semantic errors (T000-T099)
constexpr const char* TYPE_MISMATCH = "T001";
constexpr const char* UNRESOLVED_REFERENCE = "T002";
constexpr const char* DUPLICATE_DECLARATION = "T003";
constexpr const char* ARG_COUNT_MISMATCH = "T004";
constexpr const char* CYCLIC_DEFINITION = "T005";

// Warnings (W000-W099)
constexpr const char* UNREACHABLE_ARM = "W001";
constexpr const char* INEXHAUSTIVE_MATCH = "W002";
} // namespace ErrorCodes

// ============================================================================
// Diagnostic Model
// ============================================================================

enum class DiagnosticSeverity {
    Error,
    Warning,
    Note,
    Help,
};

/// What produced a diagnostic. Tools filter on this rather than on codes.
enum class DiagnosticKind {
    LexError,
    ParseError,
    ResolveError,
    TypeError,
    UnresolvedReference,
    DuplicateDeclaration,
    CyclicDefinition,
    UnreachableArm,
    InexhaustiveMatch,
};

[[nodiscard]] auto severity_to_string(DiagnosticSeverity severity) -> std::string_view;
[[nodiscard]] auto diagnostic_kind_to_string(DiagnosticKind kind) -> std::string_view;

/// A secondary (or explicit primary) span attached to a diagnostic.
struct DiagnosticLabel {
    SourceSpan span;
    std::string message;
    bool is_primary = false; ///< Primary labels render with `^^^`, secondary with `---`.
};

struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    DiagnosticKind kind = DiagnosticKind::TypeError;
    std::string code;    ///< Error code, e.g. "T001"
    std::string message; ///< Main message
    std::string file;    ///< Owning copy of the primary span's file path
    SourceSpan primary_span;
    std::vector<DiagnosticLabel> labels;
    std::vector<std::string> notes;
    std::vector<std::string> help;

    [[nodiscard]] auto is_error() const -> bool {
        return severity == DiagnosticSeverity::Error;
    }

    [[nodiscard]] auto is_warning() const -> bool {
        return severity == DiagnosticSeverity::Warning;
    }

    [[nodiscard]] auto operator==(const Diagnostic& other) const -> bool;
};

/// Builds an Error diagnostic with `file` filled from the span.
[[nodiscard]] auto make_error(DiagnosticKind kind, const char* code, std::string message,
                              const SourceSpan& span) -> Diagnostic;

/// Builds a Warning diagnostic with `file` filled from the span.
[[nodiscard]] auto make_warning(DiagnosticKind kind, const char* code, std::string message,
                                const SourceSpan& span) -> Diagnostic;

/// Returns true if any diagnostic has Error severity.
[[nodiscard]] auto has_errors(const std::vector<Diagnostic>& diagnostics) -> bool;

/// Escapes `text` for use inside a JSON string literal (quotes not included).
[[nodiscard]] auto escape_json(std::string_view text) -> std::string;

/// Applies `CompilerOptions::warning_level` and `warnings_as_errors`:
/// drops warnings under `WarningLevel::None`, promotes them under `-Werror`.
void apply_warning_policy(std::vector<Diagnostic>& diagnostics);

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

/// Case-insensitive Levenshtein (edit) distance.
[[nodiscard]] auto levenshtein_distance(std::string_view s1, std::string_view s2) -> size_t;

/// Candidates within `max_distance` of `input`, closest first, ties in
/// alphabetical order.
[[nodiscard]] auto find_similar_candidates(std::string_view input,
                                           const std::vector<std::string>& candidates,
                                           size_t max_results = 3, size_t max_distance = 2)
    -> std::vector<std::string>;

/// Renders candidates as "did you mean `a`, `b`?" or an empty string.
[[nodiscard]] auto did_you_mean(const std::vector<std::string>& suggestions) -> std::string;

} // namespace yuho

#endif // YUHO_COMMON_DIAGNOSTIC_HPP
