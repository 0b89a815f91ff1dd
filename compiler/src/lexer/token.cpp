//! # Token Utilities
//!
//! Display names, categories and typed value accessors for tokens.

#include "lexer/token.hpp"

namespace yuho::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "end of input";
    case TokenKind::Error:
        return "error";
    case TokenKind::Comment:
        return "comment";

    case TokenKind::IntLiteral:
        return "integer literal";
    case TokenKind::FloatLiteral:
        return "float literal";
    case TokenKind::StringLiteral:
        return "string literal";
    case TokenKind::BoolLiteral:
        return "boolean literal";
    case TokenKind::MoneyLiteral:
        return "money literal";
    case TokenKind::PercentLiteral:
        return "percent literal";
    case TokenKind::DateLiteral:
        return "date literal";
    case TokenKind::DurationLiteral:
        return "duration literal";

    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::Underscore:
        return "_";

    case TokenKind::KwStruct:
        return "struct";
    case TokenKind::KwEnum:
        return "enum";
    case TokenKind::KwFn:
        return "fn";
    case TokenKind::KwScope:
        return "scope";
    case TokenKind::KwStatute:
        return "statute";
    case TokenKind::KwMatch:
        return "match";
    case TokenKind::KwCase:
        return "case";
    case TokenKind::KwConsequence:
        return "consequence";
    case TokenKind::KwPass:
        return "pass";
    case TokenKind::KwReferencing:
        return "referencing";
    case TokenKind::KwFrom:
        return "from";
    case TokenKind::KwExport:
        return "export";
    case TokenKind::KwReturn:
        return "return";
    case TokenKind::KwIf:
        return "if";
    case TokenKind::KwWhere:
        return "where";
    case TokenKind::KwXor:
        return "xor";

    case TokenKind::KwInt:
        return "int";
    case TokenKind::KwFloat:
        return "float";
    case TokenKind::KwBool:
        return "bool";
    case TokenKind::KwString:
        return "string";
    case TokenKind::KwMoney:
        return "money";
    case TokenKind::KwDate:
        return "date";
    case TokenKind::KwDuration:
        return "duration";
    case TokenKind::KwPercent:
        return "percent";

    case TokenKind::Assign:
        return ":=";
    case TokenKind::Eq:
        return "==";
    case TokenKind::Ne:
        return "!=";
    case TokenKind::Lt:
        return "<";
    case TokenKind::Le:
        return "<=";
    case TokenKind::Gt:
        return ">";
    case TokenKind::Ge:
        return ">=";
    case TokenKind::Plus:
        return "+";
    case TokenKind::Minus:
        return "-";
    case TokenKind::Star:
        return "*";
    case TokenKind::Slash:
        return "/";
    case TokenKind::Percent:
        return "%";
    case TokenKind::Bang:
        return "!";
    case TokenKind::AndAnd:
        return "&&";
    case TokenKind::OrOr:
        return "||";
    case TokenKind::Dot:
        return ".";
    case TokenKind::Colon:
        return ":";

    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::LBrace:
        return "{";
    case TokenKind::RBrace:
        return "}";
    case TokenKind::LBracket:
        return "[";
    case TokenKind::RBracket:
        return "]";
    case TokenKind::Comma:
        return ",";
    case TokenKind::Semi:
        return ";";
    }
    return "unknown";
}

auto token_category(TokenKind kind) -> TokenCategory {
    switch (kind) {
    case TokenKind::Eof:
        return TokenCategory::EndOfInput;
    case TokenKind::Error:
        return TokenCategory::Error;
    case TokenKind::Comment:
        return TokenCategory::Comment;
    case TokenKind::IntLiteral:
        return TokenCategory::Integer;
    case TokenKind::FloatLiteral:
        return TokenCategory::Float;
    case TokenKind::StringLiteral:
        return TokenCategory::String;
    case TokenKind::BoolLiteral:
        return TokenCategory::Boolean;
    case TokenKind::MoneyLiteral:
        return TokenCategory::Money;
    case TokenKind::PercentLiteral:
        return TokenCategory::Percent;
    case TokenKind::DateLiteral:
        return TokenCategory::Date;
    case TokenKind::DurationLiteral:
        return TokenCategory::Duration;
    case TokenKind::Identifier:
        return TokenCategory::Identifier;
    case TokenKind::Underscore:
        return TokenCategory::Punctuation;
    default:
        break;
    }
    if (is_type_keyword(kind)) {
        return TokenCategory::Type;
    }
    if (is_keyword(kind)) {
        return TokenCategory::Keyword;
    }
    if (is_operator(kind)) {
        return TokenCategory::Operator;
    }
    return TokenCategory::Punctuation;
}

auto token_category_to_string(TokenCategory category) -> std::string_view {
    switch (category) {
    case TokenCategory::Identifier:
        return "IDENTIFIER";
    case TokenCategory::Keyword:
        return "KEYWORD";
    case TokenCategory::Type:
        return "TYPE";
    case TokenCategory::Integer:
        return "INTEGER";
    case TokenCategory::Float:
        return "FLOAT";
    case TokenCategory::String:
        return "STRING";
    case TokenCategory::Boolean:
        return "BOOLEAN";
    case TokenCategory::Money:
        return "MONEY";
    case TokenCategory::Percent:
        return "PERCENT";
    case TokenCategory::Date:
        return "DATE";
    case TokenCategory::Duration:
        return "DURATION";
    case TokenCategory::Operator:
        return "OPERATOR";
    case TokenCategory::Punctuation:
        return "PUNCTUATION";
    case TokenCategory::Comment:
        return "COMMENT";
    case TokenCategory::EndOfInput:
        return "EOF";
    case TokenCategory::Error:
        return "ERROR";
    }
    return "UNKNOWN";
}

auto is_keyword(TokenKind kind) -> bool {
    return kind >= TokenKind::KwStruct && kind <= TokenKind::KwPercent;
}

auto is_type_keyword(TokenKind kind) -> bool {
    return kind >= TokenKind::KwInt && kind <= TokenKind::KwPercent;
}

auto is_literal(TokenKind kind) -> bool {
    return kind >= TokenKind::IntLiteral && kind <= TokenKind::DurationLiteral;
}

auto is_operator(TokenKind kind) -> bool {
    return kind >= TokenKind::Assign && kind <= TokenKind::Colon;
}

auto Token::int_value() const -> int64_t {
    return std::get<IntValue>(value).value;
}

auto Token::float_value() const -> double {
    return std::get<FloatValue>(value).value;
}

auto Token::string_value() const -> const std::string& {
    return std::get<StringValue>(value).value;
}

auto Token::bool_value() const -> bool {
    return std::get<bool>(value);
}

auto Token::money_value() const -> const MoneyValue& {
    return std::get<MoneyValue>(value);
}

auto Token::percent_value() const -> double {
    return std::get<PercentValue>(value).value;
}

auto Token::date_value() const -> const DateValue& {
    return std::get<DateValue>(value);
}

auto Token::duration_value() const -> const DurationValue& {
    return std::get<DurationValue>(value);
}

} // namespace yuho::lexer
