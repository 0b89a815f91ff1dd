//! # Parser - Types
//!
//! | Syntax                 | Type            |
//! |------------------------|-----------------|
//! | `int`, `integer`       | `PrimitiveType` |
//! | `Person`               | `NamedType`     |
//! | `int \|\| string`      | `UnionType`     |

#include "parser/parser.hpp"

namespace yuho::parser {

using lexer::TokenKind;

auto Parser::token_to_primitive(TokenKind kind) -> std::optional<PrimitiveKind> {
    switch (kind) {
    case TokenKind::KwInt:
        return PrimitiveKind::Int;
    case TokenKind::KwFloat:
        return PrimitiveKind::Float;
    case TokenKind::KwBool:
        return PrimitiveKind::Bool;
    case TokenKind::KwString:
        return PrimitiveKind::String;
    case TokenKind::KwMoney:
        return PrimitiveKind::Money;
    case TokenKind::KwDate:
        return PrimitiveKind::Date;
    case TokenKind::KwDuration:
        return PrimitiveKind::Duration;
    case TokenKind::KwPercent:
        return PrimitiveKind::Percent;
    default:
        return std::nullopt;
    }
}

auto Parser::parse_type() -> Result<TypePtr, ParseError> {
    auto parse_single = [this]() -> Result<TypePtr, ParseError> {
        if (auto prim = token_to_primitive(peek().kind)) {
            auto span = advance().span;
            return make_box<Type>(
                Type{.kind = PrimitiveType{.kind = *prim, .span = span}, .span = span});
        }
        if (check(TokenKind::Identifier)) {
            const auto& tok = advance();
            return make_named_type(std::string(tok.lexeme), tok.span);
        }
        return error_here(ErrorCodes::PARSE_EXPECTED_TYPE, "type");
    };

    auto first = parse_single();
    if (is_err(first) || !check(TokenKind::OrOr))
        return first;

    std::vector<TypePtr> members;
    members.push_back(std::move(unwrap(first)));
    while (match(TokenKind::OrOr)) {
        auto member = parse_single();
        if (is_err(member))
            return unwrap_err(member);
        members.push_back(std::move(unwrap(member)));
    }

    auto span = SourceSpan::merge(members.front()->span, members.back()->span);
    return make_box<Type>(
        Type{.kind = UnionType{.members = std::move(members), .span = span}, .span = span});
}

} // namespace yuho::parser
