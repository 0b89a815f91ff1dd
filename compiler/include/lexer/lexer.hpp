//! # Yuho Lexer
//!
//! Converts source text into tokens.
//!
//! ## Features
//!
//! - **Legal-domain literals**: money (`$1,000.00`, `SGD500`), percentages
//!   (`15%`), ISO dates (`2024-01-31`) and durations (`3 years, 2 months`)
//! - **Longest match**: each of those is one token, never a run of integers
//!   and operators
//! - **Escapes**: `\\ \" \' \n \t \r \b \0 \xNN \uNNNN \u{N..}`
//! - **Nested block comments**: `/* a /* b */ c */`
//!
//! ## Token Stream
//!
//! `next_token()` is lazy: it yields one token per call and `Eof` forever
//! after the end. `reset()` restarts from the beginning. `tokenize()`
//! materializes the whole stream and stops at the first error.
//!
//! ## Errors
//!
//! `next_token()` returns a `TokenKind::Error` token for malformed input and
//! records a `LexError`; `errors()` lists them. Unterminated strings and
//! block comments are reported at their opening position.
//!
//! ## Example
//!
//! ```cpp
//! auto source = Source::from_string("int x := 42;");
//! Lexer lexer(source);
//! auto result = lexer.tokenize();
//! if (is_ok(result)) {
//!     for (const auto& tok : unwrap(result)) { ... }
//! }
//! ```

#ifndef YUHO_LEXER_LEXER_HPP
#define YUHO_LEXER_LEXER_HPP

#include "common.hpp"
#include "common/diagnostic.hpp"
#include "lexer/source.hpp"
#include "lexer/token.hpp"

#include <optional>
#include <vector>

namespace yuho::lexer {

/// A malformed token.
struct LexError {
    std::string message;                    ///< Human-readable description
    SourceSpan span;                        ///< Starts at the offending position
    std::string code;                       ///< Error code (`L001`, ...)
    std::optional<char32_t> unexpected_char; ///< The character that could not be lexed

    /// Converts to a diagnostic for rendering.
    [[nodiscard]] auto to_diagnostic() const -> Diagnostic;
};

struct LexerOptions {
    /// Emit `Comment` tokens instead of discarding comments.
    bool keep_comments = false;
};

/// Lexical analyzer for Yuho source code.
///
/// The source must outlive the lexer and every token it produced.
class Lexer {
public:
    explicit Lexer(const Source& source, LexerOptions options = {});

    /// Returns the next token; `Eof` at the end of input.
    [[nodiscard]] auto next_token() -> Token;

    /// Lexes the whole source. The vector ends with `Eof`.
    ///
    /// Fails with the first error encountered.
    [[nodiscard]] auto tokenize() -> Result<std::vector<Token>, LexError>;

    /// Lexes the whole source keeping `Error` tokens in place, for tools
    /// that render partially broken input.
    [[nodiscard]] auto tokenize_all() -> std::vector<Token>;

    /// Restarts lexing from the beginning and clears recorded errors.
    void reset();

    [[nodiscard]] auto errors() const -> const std::vector<LexError>& {
        return errors_;
    }

    [[nodiscard]] auto has_errors() const -> bool {
        return !errors_.empty();
    }

    /// Looks up a keyword (including type keywords and boolean literals).
    [[nodiscard]] static auto lookup_keyword(std::string_view ident) -> std::optional<TokenKind>;

private:
    // ========================================================================
    // State
    // ========================================================================

    const Source& source_;
    LexerOptions options_;
    size_t pos_ = 0;
    size_t token_start_ = 0;
    std::vector<LexError> errors_;

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_next() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    [[nodiscard]] auto make_token(TokenKind kind) -> Token;

    /// Records an error spanning the current token and returns an `Error`
    /// token for it.
    [[nodiscard]] auto make_error_token(const std::string& message, const char* code,
                                        std::optional<char32_t> unexpected = std::nullopt)
        -> Token;

    void report_error(const std::string& message, const char* code, size_t start, size_t end,
                      std::optional<char32_t> unexpected = std::nullopt);

    // ========================================================================
    // Whitespace and Comments
    // ========================================================================

    void skip_whitespace();

    /// Lexes a `//` or `/* */` comment starting at the current position.
    /// Returns an `Error` token for an unterminated block comment.
    [[nodiscard]] auto lex_comment() -> Token;

    // ========================================================================
    // Token Lexers
    // ========================================================================

    [[nodiscard]] auto lex_identifier() -> Token;
    [[nodiscard]] auto lex_number() -> Token;
    [[nodiscard]] auto lex_string() -> Token;
    [[nodiscard]] auto lex_operator() -> Token;

    // ========================================================================
    // Legal-Domain Literals
    // ========================================================================

    /// Byte length of a currency symbol at `pos_` (`$`, `£`, `€`, `¥`, `₹`),
    /// or 0.
    [[nodiscard]] auto currency_symbol_length() const -> size_t;

    /// Lexes the amount after a currency prefix that has been consumed.
    [[nodiscard]] auto lex_money(std::string currency) -> Token;

    /// Tries `YYYY-MM-DD` (and rejects `DD-MM-YYYY`) at the token start.
    [[nodiscard]] auto try_lex_date() -> std::optional<Token>;

    /// Tries `INT UNIT (,? INT UNIT)*` starting with the integer just lexed.
    [[nodiscard]] auto try_lex_duration(int64_t first_amount) -> std::optional<Token>;

    // ========================================================================
    // Escape Sequences
    // ========================================================================

    /// Parses the escape after a consumed backslash.
    [[nodiscard]] auto parse_escape_sequence() -> Result<char32_t, std::string>;

    [[nodiscard]] auto parse_hex_digits(size_t count) -> std::optional<uint32_t>;

    // ========================================================================
    // Character Classes
    // ========================================================================

    [[nodiscard]] static auto is_identifier_start(char c) -> bool;
    [[nodiscard]] static auto is_identifier_continue(char c) -> bool;
    [[nodiscard]] static auto is_digit(char c) -> bool;

    /// Decodes the UTF-8 sequence at `pos_` without consuming it.
    [[nodiscard]] auto decode_utf8() const -> std::pair<char32_t, size_t>;

    static void append_utf8(std::string& out, char32_t cp);
};

} // namespace yuho::lexer

#endif // YUHO_LEXER_LEXER_HPP
