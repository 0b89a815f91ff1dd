//! # Parser - Patterns
//!
//! | Syntax                     | Pattern            |
//! |----------------------------|--------------------|
//! | `_`                        | `WildcardPattern`  |
//! | `TRUE`, `42`, `"x"`, `$5`  | `LiteralPattern`   |
//! | `-1`, `-2.5`               | `LiteralPattern` (negated) |
//! | `name`                     | `IdentPattern`     |
//! | `Verdict.Guilty`           | `QualifiedPattern` |
//! | `Offence { severity: 3 }`  | `StructPattern`    |

#include "parser/parser.hpp"

namespace yuho::parser {

using lexer::TokenKind;

auto Parser::parse_pattern() -> Result<PatternPtr, ParseError> {
    NestingGuard guard(depth_);
    if (depth_ > MAX_NESTING_DEPTH) {
        return nesting_error("pattern");
    }

    if (check(TokenKind::Underscore)) {
        return make_wildcard_pattern(advance().span);
    }

    if (lexer::is_literal(peek().kind)) {
        const auto& tok = advance();
        return make_box<Pattern>(Pattern{
            .kind = LiteralPattern{.literal = tok, .negated = false, .span = tok.span},
            .span = tok.span});
    }

    if (check(TokenKind::Minus) &&
        peek_next().is_one_of({TokenKind::IntLiteral, TokenKind::FloatLiteral,
                               TokenKind::MoneyLiteral, TokenKind::PercentLiteral})) {
        auto start_span = advance().span;
        const auto& tok = advance();
        auto span = SourceSpan::merge(start_span, tok.span);
        return make_box<Pattern>(
            Pattern{.kind = LiteralPattern{.literal = tok, .negated = true, .span = span},
                    .span = span});
    }

    if (check(TokenKind::Identifier)) {
        const auto& name_tok = advance();
        auto name = std::string(name_tok.lexeme);

        if (check(TokenKind::Dot) && check_next(TokenKind::Identifier)) {
            advance(); // .
            const auto& variant = advance();
            auto span = SourceSpan::merge(name_tok.span, variant.span);
            return make_box<Pattern>(Pattern{.kind = QualifiedPattern{.type_name = std::move(name),
                                                                      .variant = std::string(
                                                                          variant.lexeme),
                                                                      .span = span},
                                             .span = span});
        }

        if (check(TokenKind::LBrace)) {
            return parse_struct_pattern(std::move(name), name_tok.span);
        }

        return make_box<Pattern>(
            Pattern{.kind = IdentPattern{.name = std::move(name), .span = name_tok.span},
                    .span = name_tok.span});
    }

    return error_here(ErrorCodes::PARSE_EXPECTED_PATTERN, "pattern");
}

auto Parser::parse_struct_pattern(std::string name, SourceSpan start)
    -> Result<PatternPtr, ParseError> {
    advance(); // {

    std::vector<FieldPattern> fields;
    while (!check(TokenKind::RBrace) && !is_at_end()) {
        auto field = expect(TokenKind::Identifier, "field name in pattern");
        if (is_err(field))
            return unwrap_err(field);
        auto field_span = unwrap(field).span;

        std::optional<PatternPtr> sub;
        if (match(TokenKind::Colon)) {
            auto pattern = parse_pattern();
            if (is_err(pattern))
                return unwrap_err(pattern);
            sub = std::move(unwrap(pattern));
        }
        fields.push_back(FieldPattern{.name = std::string(unwrap(field).lexeme),
                                      .pattern = std::move(sub),
                                      .span = SourceSpan::merge(field_span, previous().span)});
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    auto close = expect(TokenKind::RBrace, "'}' to close struct pattern");
    if (is_err(close))
        return unwrap_err(close);

    auto span = SourceSpan::merge(start, previous().span);
    return make_box<Pattern>(Pattern{
        .kind = StructPattern{.name = std::move(name), .fields = std::move(fields), .span = span},
        .span = span});
}

} // namespace yuho::parser
