//! # Lexer - Identifiers
//!
//! Identifiers, keywords, the `_` wildcard, ISO currency-code prefixes and
//! the character-class helpers.
//!
//! Identifiers are ASCII: `[A-Za-z_][A-Za-z0-9_]*`. An upper-case ISO 4217
//! code immediately followed by a digit (`SGD500`) starts a money literal.

#include "lexer/lexer.hpp"

#include <array>

namespace yuho::lexer {

namespace {

constexpr std::array<std::string_view, 14> CURRENCY_CODES = {
    "SGD", "USD", "EUR", "GBP", "JPY", "INR", "AUD", "CAD", "CNY", "HKD", "MYR", "CHF", "NZD", "IDR",
};

auto is_currency_code(std::string_view text) -> bool {
    for (auto code : CURRENCY_CODES) {
        if (code == text) {
            return true;
        }
    }
    return false;
}

} // namespace

auto Lexer::is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_';
}

auto Lexer::is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || is_digit(c);
}

auto Lexer::is_digit(char c) -> bool {
    return c >= '0' && c <= '9';
}

auto Lexer::lex_identifier() -> Token {
    // `SGD1,000.00`: the code is a prefix only when a digit follows directly.
    if (pos_ + 3 < source_.length() && is_digit(peek_n(3)) &&
        is_currency_code(source_.slice(pos_, pos_ + 3))) {
        std::string currency(source_.slice(pos_, pos_ + 3));
        pos_ += 3;
        return lex_money(std::move(currency));
    }

    while (!is_at_end() && is_identifier_continue(peek())) {
        advance();
    }

    auto text = source_.slice(token_start_, pos_);
    if (text == "_") {
        return make_token(TokenKind::Underscore);
    }

    if (auto kw = lookup_keyword(text)) {
        auto token = make_token(*kw);
        if (*kw == TokenKind::BoolLiteral) {
            token.value = (text == "TRUE" || text == "true");
        }
        return token;
    }

    return make_token(TokenKind::Identifier);
}

// ============================================================================
// UTF-8 Helpers
// ============================================================================

auto Lexer::decode_utf8() const -> std::pair<char32_t, size_t> {
    auto byte = static_cast<unsigned char>(peek());
    if (byte < 0x80) {
        return {byte, 1};
    }

    size_t len = 0;
    char32_t cp = 0;
    if ((byte & 0xE0) == 0xC0) {
        len = 2;
        cp = byte & 0x1F;
    } else if ((byte & 0xF0) == 0xE0) {
        len = 3;
        cp = byte & 0x0F;
    } else if ((byte & 0xF8) == 0xF0) {
        len = 4;
        cp = byte & 0x07;
    } else {
        return {0xFFFD, 1};
    }

    for (size_t i = 1; i < len; ++i) {
        auto cont = static_cast<unsigned char>(peek_n(i));
        if ((cont & 0xC0) != 0x80) {
            return {0xFFFD, i};
        }
        cp = (cp << 6) | (cont & 0x3F);
    }
    return {cp, len};
}

void Lexer::append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

auto Lexer::currency_symbol_length() const -> size_t {
    char c = peek();
    if (c == '$') {
        return 1;
    }
    if (static_cast<unsigned char>(c) < 0x80) {
        return 0;
    }
    auto [cp, len] = decode_utf8();
    switch (cp) {
    case U'£':
    case U'€':
    case U'¥':
    case U'₹':
        return len;
    default:
        return 0;
    }
}

} // namespace yuho::lexer
