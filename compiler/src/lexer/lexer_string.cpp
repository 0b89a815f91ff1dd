//! # Lexer - Strings
//!
//! Double-quoted string literals. Strings may span lines.
//!
//! ## Escape Sequences
//!
//! | Escape       | Meaning                         |
//! |--------------|---------------------------------|
//! | `\\`         | Backslash                       |
//! | `\"` `\'`    | Quotes                          |
//! | `\n` `\t` `\r` `\b` `\0` | Control characters  |
//! | `\xNN`       | Byte value, two hex digits      |
//! | `\uNNNN`     | Code point, four hex digits     |
//! | `\u{N...}`   | Code point, one to six digits   |
//!
//! Any other escape is an error. An unterminated string is reported at its
//! opening quote.

#include "lexer/lexer.hpp"

namespace yuho::lexer {

namespace {

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9')
        return c - '0';
    if (c >= 'a' && c <= 'f')
        return c - 'a' + 10;
    if (c >= 'A' && c <= 'F')
        return c - 'A' + 10;
    return -1;
}

auto is_valid_scalar(uint32_t cp) -> bool {
    return cp <= 0x10FFFF && (cp < 0xD800 || cp > 0xDFFF);
}

} // namespace

auto Lexer::lex_string() -> Token {
    advance(); // opening quote

    std::string value;
    bool had_escape_error = false;

    while (!is_at_end() && peek() != '"') {
        if (peek() != '\\') {
            value += advance();
            continue;
        }

        size_t escape_start = pos_;
        advance(); // backslash
        auto escaped = parse_escape_sequence();
        if (is_err(escaped)) {
            report_error(unwrap_err(escaped), ErrorCodes::LEX_INVALID_ESCAPE, escape_start, pos_);
            had_escape_error = true;
            continue;
        }
        append_utf8(value, unwrap(escaped));
    }

    if (is_at_end()) {
        report_error("unterminated string literal", ErrorCodes::LEX_UNTERMINATED_STRING,
                     token_start_, token_start_ + 1, U'"');
        return Token{.kind = TokenKind::Error,
                     .span = source_.span(token_start_, token_start_ + 1),
                     .lexeme = source_.slice(token_start_, pos_),
                     .value = std::monostate{}};
    }

    advance(); // closing quote

    if (had_escape_error) {
        // The escape error is already recorded; tokenize() surfaces it.
        return Token{.kind = TokenKind::Error,
                     .span = source_.span(token_start_, pos_),
                     .lexeme = source_.slice(token_start_, pos_),
                     .value = std::monostate{}};
    }

    auto token = make_token(TokenKind::StringLiteral);
    token.value = StringValue{std::move(value)};
    return token;
}

auto Lexer::parse_escape_sequence() -> Result<char32_t, std::string> {
    if (is_at_end()) {
        return std::string("incomplete escape sequence at end of input");
    }

    char c = advance();
    switch (c) {
    case '\\':
        return U'\\';
    case '"':
        return U'"';
    case '\'':
        return U'\'';
    case 'n':
        return U'\n';
    case 't':
        return U'\t';
    case 'r':
        return U'\r';
    case 'b':
        return U'\b';
    case '0':
        return U'\0';
    case 'x': {
        auto value = parse_hex_digits(2);
        if (!value) {
            return std::string("'\\x' must be followed by exactly two hex digits");
        }
        return static_cast<char32_t>(*value);
    }
    case 'u': {
        if (peek() == '{') {
            advance();
            size_t digits = 0;
            uint32_t value = 0;
            while (!is_at_end() && peek() != '}' && digits < 7) {
                int h = hex_value(peek());
                if (h < 0) {
                    return std::string("invalid hex digit in unicode escape");
                }
                value = value * 16 + static_cast<uint32_t>(h);
                advance();
                ++digits;
            }
            if (peek() != '}' || digits == 0 || digits > 6) {
                return std::string("unicode escape must be '\\u{' followed by 1 to 6 hex digits "
                                   "and '}'");
            }
            advance();
            if (!is_valid_scalar(value)) {
                return std::string("unicode escape is not a valid code point");
            }
            return static_cast<char32_t>(value);
        }
        auto value = parse_hex_digits(4);
        if (!value) {
            return std::string("'\\u' must be followed by four hex digits or '{...}'");
        }
        if (!is_valid_scalar(*value)) {
            return std::string("unicode escape is not a valid code point");
        }
        return static_cast<char32_t>(*value);
    }
    default:
        return "unknown escape sequence '\\" + std::string(1, c) + "'";
    }
}

auto Lexer::parse_hex_digits(size_t count) -> std::optional<uint32_t> {
    uint32_t value = 0;
    for (size_t i = 0; i < count; ++i) {
        int h = hex_value(peek());
        if (h < 0) {
            return std::nullopt;
        }
        value = value * 16 + static_cast<uint32_t>(h);
        advance();
    }
    return value;
}

} // namespace yuho::lexer
