//! # Lexer - Operators
//!
//! Operators and delimiters.
//!
//! | Category    | Tokens                           |
//! |-------------|----------------------------------|
//! | Assignment  | `:=`                             |
//! | Comparison  | `==` `!=` `<` `<=` `>` `>=`      |
//! | Arithmetic  | `+` `-` `*` `/` `%`              |
//! | Logical     | `!` `&&` `\|\|`                   |
//! | Access      | `.` `:`                          |
//! | Delimiters  | `( ) { } [ ] , ;`                |
//!
//! A lone `=` is rejected with a hint, since Yuho binds with `:=`.

#include "lexer/lexer.hpp"

namespace yuho::lexer {

auto Lexer::lex_operator() -> Token {
    char c = advance();

    switch (c) {
    case '(':
        return make_token(TokenKind::LParen);
    case ')':
        return make_token(TokenKind::RParen);
    case '{':
        return make_token(TokenKind::LBrace);
    case '}':
        return make_token(TokenKind::RBrace);
    case '[':
        return make_token(TokenKind::LBracket);
    case ']':
        return make_token(TokenKind::RBracket);
    case ',':
        return make_token(TokenKind::Comma);
    case ';':
        return make_token(TokenKind::Semi);
    case '.':
        return make_token(TokenKind::Dot);
    case '+':
        return make_token(TokenKind::Plus);
    case '-':
        return make_token(TokenKind::Minus);
    case '*':
        return make_token(TokenKind::Star);
    case '/':
        return make_token(TokenKind::Slash);
    case '%':
        return make_token(TokenKind::Percent);

    case ':':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::Assign);
        }
        return make_token(TokenKind::Colon);

    case '=':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::Eq);
        }
        return make_error_token("unexpected '='; use ':=' to bind or '==' to compare",
                                ErrorCodes::LEX_INVALID_CHAR, U'=');

    case '!':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::Ne);
        }
        return make_token(TokenKind::Bang);

    case '<':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::Le);
        }
        return make_token(TokenKind::Lt);

    case '>':
        if (peek() == '=') {
            advance();
            return make_token(TokenKind::Ge);
        }
        return make_token(TokenKind::Gt);

    case '&':
        if (peek() == '&') {
            advance();
            return make_token(TokenKind::AndAnd);
        }
        return make_error_token("unexpected '&'; logical and is '&&'",
                                ErrorCodes::LEX_INVALID_CHAR, U'&');

    case '|':
        if (peek() == '|') {
            advance();
            return make_token(TokenKind::OrOr);
        }
        return make_error_token("unexpected '|'; logical or is '||'",
                                ErrorCodes::LEX_INVALID_CHAR, U'|');

    default:
        break;
    }

    // Unknown character: consume the whole UTF-8 sequence so the error span
    // covers one character.
    pos_ = token_start_;
    auto [cp, len] = decode_utf8();
    pos_ += len;

    std::string shown(source_.slice(token_start_, pos_));
    return make_error_token("unexpected character '" + shown + "'", ErrorCodes::LEX_INVALID_CHAR,
                            cp);
}

} // namespace yuho::lexer
