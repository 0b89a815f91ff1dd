//! # Lexer Core
//!
//! Keyword table, character access, token creation, comments and the
//! whole-stream entry points.
//!
//! ## Keyword Categories
//!
//! | Category     | Keywords                                               |
//! |--------------|--------------------------------------------------------|
//! | Declarations | `struct`, `enum`, `fn`/`func`, `scope`, `statute`      |
//! | Imports      | `referencing`/`import`, `from`, `export`               |
//! | Matching     | `match`, `case`, `consequence`, `pass`, `if`, `where`  |
//! | Types        | `int`, `float`, `bool`, `string`, `money`, `date`, ... |
//! | Booleans     | `TRUE`, `FALSE`, `true`, `false`                       |

#include "lexer/lexer.hpp"
#include "log/log.hpp"

#include <unordered_map>

namespace yuho::lexer {

namespace {

const std::unordered_map<std::string_view, TokenKind> KEYWORDS = {
    // Declarations
    {"struct", TokenKind::KwStruct},
    {"enum", TokenKind::KwEnum},
    {"fn", TokenKind::KwFn},
    {"func", TokenKind::KwFn},
    {"scope", TokenKind::KwScope},
    {"statute", TokenKind::KwStatute},

    // Imports
    {"referencing", TokenKind::KwReferencing},
    {"import", TokenKind::KwReferencing},
    {"from", TokenKind::KwFrom},
    {"export", TokenKind::KwExport},

    // Matching and control
    {"match", TokenKind::KwMatch},
    {"case", TokenKind::KwCase},
    {"consequence", TokenKind::KwConsequence},
    {"pass", TokenKind::KwPass},
    {"return", TokenKind::KwReturn},
    {"if", TokenKind::KwIf},
    {"where", TokenKind::KwWhere},
    {"xor", TokenKind::KwXor},

    // Types
    {"int", TokenKind::KwInt},
    {"integer", TokenKind::KwInt},
    {"float", TokenKind::KwFloat},
    {"bool", TokenKind::KwBool},
    {"boolean", TokenKind::KwBool},
    {"string", TokenKind::KwString},
    {"money", TokenKind::KwMoney},
    {"date", TokenKind::KwDate},
    {"duration", TokenKind::KwDuration},
    {"percent", TokenKind::KwPercent},

    // Booleans (become BoolLiteral)
    {"TRUE", TokenKind::BoolLiteral},
    {"FALSE", TokenKind::BoolLiteral},
    {"true", TokenKind::BoolLiteral},
    {"false", TokenKind::BoolLiteral},
};

} // namespace

auto Lexer::lookup_keyword(std::string_view ident) -> std::optional<TokenKind> {
    auto it = KEYWORDS.find(ident);
    if (it == KEYWORDS.end()) {
        return std::nullopt;
    }
    return it->second;
}

auto LexError::to_diagnostic() const -> Diagnostic {
    return make_error(DiagnosticKind::LexError, code.c_str(), message, span);
}

Lexer::Lexer(const Source& source, LexerOptions options) : source_(source), options_(options) {}

// ============================================================================
// Character Access
// ============================================================================

auto Lexer::peek() const -> char {
    return source_.at(pos_);
}

auto Lexer::peek_next() const -> char {
    return source_.at(pos_ + 1);
}

auto Lexer::peek_n(size_t n) const -> char {
    return source_.at(pos_ + n);
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_end() const -> bool {
    return pos_ >= source_.length();
}

// ============================================================================
// Token Creation
// ============================================================================

auto Lexer::make_token(TokenKind kind) -> Token {
    return Token{.kind = kind,
                 .span = source_.span(token_start_, pos_),
                 .lexeme = source_.slice(token_start_, pos_),
                 .value = std::monostate{}};
}

auto Lexer::make_error_token(const std::string& message, const char* code,
                             std::optional<char32_t> unexpected) -> Token {
    report_error(message, code, token_start_, pos_, unexpected);
    return Token{.kind = TokenKind::Error,
                 .span = source_.span(token_start_, pos_),
                 .lexeme = source_.slice(token_start_, pos_),
                 .value = std::monostate{}};
}

void Lexer::report_error(const std::string& message, const char* code, size_t start, size_t end,
                         std::optional<char32_t> unexpected) {
    YUHO_LOG_TRACE("lexer", source_.filename() << ": " << code << " " << message);
    errors_.push_back(LexError{.message = message,
                               .span = source_.span(start, end),
                               .code = code,
                               .unexpected_char = unexpected});
}

// ============================================================================
// Whitespace and Comments
// ============================================================================

void Lexer::skip_whitespace() {
    while (!is_at_end()) {
        char c = peek();
        if (c == ' ' || c == '\t' || c == '\r' || c == '\n') {
            advance();
        } else {
            return;
        }
    }
}

auto Lexer::lex_comment() -> Token {
    token_start_ = pos_;
    advance(); // '/'

    if (advance() == '/') {
        while (!is_at_end() && peek() != '\n') {
            advance();
        }
        return make_token(TokenKind::Comment);
    }

    int depth = 1;
    while (!is_at_end() && depth > 0) {
        if (peek() == '/' && peek_next() == '*') {
            advance();
            advance();
            ++depth;
        } else if (peek() == '*' && peek_next() == '/') {
            advance();
            advance();
            --depth;
        } else {
            advance();
        }
    }

    if (depth > 0) {
        // Reported at the opening `/*`, not at end of input.
        report_error("unterminated block comment", ErrorCodes::LEX_UNTERMINATED_COMMENT,
                     token_start_, token_start_ + 2);
        return Token{.kind = TokenKind::Error,
                     .span = source_.span(token_start_, token_start_ + 2),
                     .lexeme = source_.slice(token_start_, pos_),
                     .value = std::monostate{}};
    }
    return make_token(TokenKind::Comment);
}

// ============================================================================
// Stream Entry Points
// ============================================================================

auto Lexer::next_token() -> Token {
    for (;;) {
        skip_whitespace();
        if (peek() == '/' && (peek_next() == '/' || peek_next() == '*')) {
            auto comment = lex_comment();
            if (options_.keep_comments || comment.is_error()) {
                return comment;
            }
            continue;
        }
        break;
    }

    token_start_ = pos_;
    if (is_at_end()) {
        return make_token(TokenKind::Eof);
    }

    char c = peek();

    if (size_t len = currency_symbol_length(); len > 0) {
        std::string currency(source_.slice(pos_, pos_ + len));
        pos_ += len;
        if (!is_digit(peek())) {
            return make_error_token("expected an amount after currency symbol '" + currency + "'",
                                    ErrorCodes::LEX_INVALID_NUMBER);
        }
        return lex_money(std::move(currency));
    }

    if (is_identifier_start(c)) {
        return lex_identifier();
    }

    if (is_digit(c)) {
        return lex_number();
    }

    if (c == '"') {
        return lex_string();
    }

    return lex_operator();
}

auto Lexer::tokenize() -> Result<std::vector<Token>, LexError> {
    reset();
    std::vector<Token> tokens;
    for (;;) {
        auto token = next_token();
        if (token.is_error()) {
            return errors_.back();
        }
        bool eof = token.is_eof();
        tokens.push_back(std::move(token));
        if (eof) {
            break;
        }
    }
    YUHO_LOG_DEBUG("lexer", source_.filename() << ": " << tokens.size() << " tokens");
    return tokens;
}

auto Lexer::tokenize_all() -> std::vector<Token> {
    reset();
    std::vector<Token> tokens;
    for (;;) {
        auto token = next_token();
        bool eof = token.is_eof();
        tokens.push_back(std::move(token));
        if (eof) {
            break;
        }
    }
    return tokens;
}

void Lexer::reset() {
    pos_ = 0;
    token_start_ = 0;
    errors_.clear();
}

} // namespace yuho::lexer
