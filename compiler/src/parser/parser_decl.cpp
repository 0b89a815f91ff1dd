//! # Parser - Declarations
//!
//! Items of a module or a scope block.
//!
//! ## Declaration Types
//!
//! | Keyword          | Declaration   | Example                                |
//! |------------------|---------------|----------------------------------------|
//! | `struct`         | Struct        | `struct Person { string name, int age }` |
//! | `enum`           | Enum          | `enum Verdict { Guilty, NotGuilty }`   |
//! | `fn` / `func`    | Function      | `fn fine(int n): money { ... }`        |
//! | `scope`          | Scope block   | `scope theft { ... }`                  |
//! | `statute`        | Statute block | `statute 415 "Cheating" { ... }`       |
//! | `referencing`    | Import        | `referencing Person from common.types` |
//! | type keyword     | Variable      | `int max_term := 10;`                  |
//!
//! Any other item is an expression terminated by `;` (or, for `match`, by
//! its closing brace).
//!
//! ## Variable vs Expression
//!
//! A variable declaration starts with a type: a type keyword, or a name (or
//! a `||` union of names) directly followed by another identifier. This is
//! decided by lookahead without backtracking.

#include "parser/parser.hpp"

namespace yuho::parser {

using lexer::TokenKind;

// ============================================================================
// Item Dispatch
// ============================================================================

auto Parser::parse_item(bool top_level) -> Result<DeclPtr, ParseError> {
    switch (peek().kind) {
    case TokenKind::KwStruct:
        return parse_struct_decl();
    case TokenKind::KwEnum:
        return parse_enum_decl();
    case TokenKind::KwFn:
        return parse_func_decl();
    case TokenKind::KwScope:
    case TokenKind::KwStatute:
        return parse_scope_decl();
    case TokenKind::KwExport:
    case TokenKind::KwReferencing: {
        auto start_span = peek().span;
        auto decl = parse_referencing_decl();
        if (is_ok(decl) && !top_level) {
            report_error(ParseError{
                .message = "'referencing' is only allowed at module level",
                .code = ErrorCodes::PARSE_UNEXPECTED_TOKEN,
                .expected = "an item",
                .found = "'referencing'",
                .span = start_span,
                .notes = {"move the import to the top of the file"}});
        }
        return decl;
    }
    default:
        break;
    }

    if (looks_like_var_decl()) {
        auto var = parse_var_decl();
        if (is_err(var))
            return unwrap_err(var);
        auto span = unwrap(var).span;
        return make_box<Decl>(Decl{.kind = std::move(unwrap(var)), .span = span});
    }

    // A statement-level match ends at its closing brace, so a following
    // `-x;` or `(a);` starts a new item instead of continuing the expression.
    auto start_span = peek().span;
    bool is_match = check(TokenKind::KwMatch);
    auto expr = is_match ? parse_match_expr() : parse_expr();
    if (is_err(expr))
        return unwrap_err(expr);

    if (is_match) {
        match(TokenKind::Semi);
    } else {
        expect_terminator("expression");
    }

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Decl>(
        Decl{.kind = ExprDecl{.expr = std::move(unwrap(expr)), .span = span}, .span = span});
}

// ============================================================================
// Structs and Enums
// ============================================================================

auto Parser::parse_struct_decl() -> Result<DeclPtr, ParseError> {
    auto start_span = advance().span; // struct

    auto name_result = expect(TokenKind::Identifier, "struct name");
    if (is_err(name_result))
        return unwrap_err(name_result);
    const auto& name_tok = unwrap(name_result);

    auto brace = expect(TokenKind::LBrace, "'{' after struct name");
    if (is_err(brace))
        return unwrap_err(brace);

    std::vector<StructField> fields;
    while (!check(TokenKind::RBrace) && !is_at_end()) {
        auto field_start = peek().span;
        auto type = parse_type();
        if (is_err(type)) {
            report_error(std::move(unwrap_err(type)));
            synchronize_to_brace();
            break;
        }
        auto field_name = expect(TokenKind::Identifier, "field name");
        if (is_err(field_name)) {
            report_error(std::move(unwrap_err(field_name)));
            synchronize_to_brace();
            break;
        }
        fields.push_back(StructField{.type = std::move(unwrap(type)),
                                     .name = std::string(unwrap(field_name).lexeme),
                                     .name_span = unwrap(field_name).span,
                                     .span = SourceSpan::merge(field_start, previous().span)});
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    if (!check(TokenKind::RBrace) && !is_at_end()) {
        report_error(error_here(ErrorCodes::PARSE_MISSING_BRACE, "',' or '}' in struct body"));
        synchronize_to_brace();
    }
    auto close = expect(TokenKind::RBrace, "'}' to close struct");
    if (is_err(close))
        return unwrap_err(close);
    match(TokenKind::Semi);

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Decl>(Decl{.kind = StructDecl{.name = std::string(name_tok.lexeme),
                                                  .fields = std::move(fields),
                                                  .name_span = name_tok.span,
                                                  .span = span},
                               .span = span});
}

auto Parser::parse_enum_decl() -> Result<DeclPtr, ParseError> {
    auto start_span = advance().span; // enum

    auto name_result = expect(TokenKind::Identifier, "enum name");
    if (is_err(name_result))
        return unwrap_err(name_result);
    const auto& name_tok = unwrap(name_result);

    auto brace = expect(TokenKind::LBrace, "'{' after enum name");
    if (is_err(brace))
        return unwrap_err(brace);

    std::vector<EnumVariant> variants;
    while (check(TokenKind::Identifier)) {
        const auto& variant = advance();
        variants.push_back(EnumVariant{.name = std::string(variant.lexeme), .span = variant.span});
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    if (!check(TokenKind::RBrace) && !is_at_end()) {
        report_error(error_here(ErrorCodes::PARSE_MISSING_BRACE, "variant name or '}'"));
        synchronize_to_brace();
    }
    auto close = expect(TokenKind::RBrace, "'}' to close enum");
    if (is_err(close))
        return unwrap_err(close);
    match(TokenKind::Semi);

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Decl>(Decl{.kind = EnumDecl{.name = std::string(name_tok.lexeme),
                                                .variants = std::move(variants),
                                                .name_span = name_tok.span,
                                                .span = span},
                               .span = span});
}

// ============================================================================
// Functions
// ============================================================================

auto Parser::parse_func_decl() -> Result<DeclPtr, ParseError> {
    auto start_span = advance().span; // fn / func

    auto name_result = expect(TokenKind::Identifier, "function name");
    if (is_err(name_result))
        return unwrap_err(name_result);
    const auto& name_tok = unwrap(name_result);

    auto paren = expect(TokenKind::LParen, "'(' after function name");
    if (is_err(paren))
        return unwrap_err(paren);

    auto params = parse_func_params();
    if (is_err(params))
        return unwrap_err(params);

    std::optional<TypePtr> return_type;
    if (match(TokenKind::Colon)) {
        auto type = parse_type();
        if (is_err(type))
            return unwrap_err(type);
        return_type = std::move(unwrap(type));
    }

    auto body = parse_block();
    if (is_err(body))
        return unwrap_err(body);

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Decl>(Decl{.kind = FuncDecl{.name = std::string(name_tok.lexeme),
                                                .params = std::move(unwrap(params)),
                                                .return_type = std::move(return_type),
                                                .body = std::move(unwrap(body)),
                                                .name_span = name_tok.span,
                                                .span = span},
                               .span = span});
}

auto Parser::parse_func_params() -> Result<std::vector<FuncParam>, ParseError> {
    std::vector<FuncParam> params;

    while (!check(TokenKind::RParen) && !is_at_end()) {
        auto param_start = peek().span;
        auto type = parse_type();
        if (is_err(type))
            return unwrap_err(type);
        auto name = expect(TokenKind::Identifier, "parameter name");
        if (is_err(name))
            return unwrap_err(name);
        params.push_back(FuncParam{.type = std::move(unwrap(type)),
                                   .name = std::string(unwrap(name).lexeme),
                                   .name_span = unwrap(name).span,
                                   .span = SourceSpan::merge(param_start, previous().span)});
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    auto close = expect(TokenKind::RParen, "')' after parameters");
    if (is_err(close))
        return unwrap_err(close);
    return params;
}

// ============================================================================
// Scope Blocks
// ============================================================================

auto Parser::parse_scope_decl() -> Result<DeclPtr, ParseError> {
    NestingGuard guard(depth_);
    if (depth_ > MAX_NESTING_DEPTH) {
        return nesting_error("scope block");
    }

    bool is_statute = check(TokenKind::KwStatute);
    auto start_span = advance().span;

    std::string name;
    SourceSpan name_span;
    auto name_kind = peek().kind;
    if (check(TokenKind::Identifier) ||
        (is_statute && (check(TokenKind::IntLiteral) || check(TokenKind::StringLiteral)))) {
        const auto& tok = advance();
        name = tok.is(TokenKind::StringLiteral) ? tok.string_value() : std::string(tok.lexeme);
        name_span = tok.span;
    } else {
        return error_here(ErrorCodes::PARSE_UNEXPECTED_TOKEN,
                          is_statute ? "statute name or section number" : "scope name");
    }

    std::optional<std::string> title;
    if (is_statute && check(TokenKind::StringLiteral)) {
        title = advance().string_value();
    }

    auto brace = expect(TokenKind::LBrace, is_statute ? "'{' to open statute" : "'{' to open scope");
    if (is_err(brace))
        return unwrap_err(brace);

    std::vector<DeclPtr> items;
    while (!check(TokenKind::RBrace) && !is_at_end()) {
        size_t before = pos_;
        auto item = parse_item(false);
        if (is_ok(item)) {
            items.push_back(std::move(unwrap(item)));
            continue;
        }
        report_error(std::move(unwrap_err(item)));
        synchronize();
        if (pos_ == before && !check(TokenKind::RBrace)) {
            advance();
        }
    }

    auto close = expect(TokenKind::RBrace, "'}' to close block");
    if (is_err(close))
        return unwrap_err(close);
    match(TokenKind::Semi);

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Decl>(
        Decl{.kind = ScopeDecl{.kind = is_statute ? ScopeKind::Statute : ScopeKind::Scope,
                               .name = std::move(name),
                               .name_token = name_kind,
                               .title = std::move(title),
                               .items = std::move(items),
                               .name_span = name_span,
                               .span = span},
             .span = span});
}

// ============================================================================
// Imports
// ============================================================================

auto Parser::parse_referencing_decl() -> Result<DeclPtr, ParseError> {
    auto start_span = peek().span;
    bool is_export = match(TokenKind::KwExport);

    auto kw = expect(TokenKind::KwReferencing, "'referencing' after 'export'");
    if (is_err(kw))
        return unwrap_err(kw);

    std::vector<ImportedName> names;
    do {
        auto name = expect(TokenKind::Identifier, "name to import");
        if (is_err(name))
            return unwrap_err(name);
        names.push_back(
            ImportedName{.name = std::string(unwrap(name).lexeme), .span = unwrap(name).span});
    } while (match(TokenKind::Comma));

    auto from = expect(TokenKind::KwFrom, "'from' after imported names");
    if (is_err(from))
        return unwrap_err(from);

    std::vector<std::string> path;
    auto first = expect(TokenKind::Identifier, "module name");
    if (is_err(first))
        return unwrap_err(first);
    auto module_start = unwrap(first).span;
    path.emplace_back(unwrap(first).lexeme);
    while (match(TokenKind::Dot)) {
        auto segment = expect(TokenKind::Identifier, "module name after '.'");
        if (is_err(segment))
            return unwrap_err(segment);
        path.emplace_back(unwrap(segment).lexeme);
    }
    auto module_span = SourceSpan::merge(module_start, previous().span);
    match(TokenKind::Semi);

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Decl>(Decl{.kind = ReferencingDecl{.names = std::move(names),
                                                       .module_path = std::move(path),
                                                       .is_export = is_export,
                                                       .module_span = module_span,
                                                       .span = span},
                               .span = span});
}

// ============================================================================
// Variables
// ============================================================================

auto Parser::looks_like_var_decl() const -> bool {
    auto is_type_start = [](TokenKind kind) {
        return lexer::is_type_keyword(kind) || kind == TokenKind::Identifier;
    };

    if (lexer::is_type_keyword(peek().kind)) {
        return true;
    }
    if (!check(TokenKind::Identifier)) {
        return false;
    }
    size_t i = 1;
    while (peek_at(i).is(TokenKind::OrOr) && is_type_start(peek_at(i + 1).kind)) {
        i += 2;
    }
    return peek_at(i).is(TokenKind::Identifier);
}

auto Parser::parse_var_decl() -> Result<VarDecl, ParseError> {
    auto start_span = peek().span;

    auto type = parse_type();
    if (is_err(type))
        return unwrap_err(type);

    auto name = expect(TokenKind::Identifier, "variable name");
    if (is_err(name))
        return unwrap_err(name);
    auto name_str = std::string(unwrap(name).lexeme);
    auto name_span = unwrap(name).span;

    std::optional<ExprPtr> init;
    if (match(TokenKind::Assign)) {
        auto value = parse_expr();
        if (is_err(value))
            return unwrap_err(value);
        init = std::move(unwrap(value));
    }

    expect_terminator("declaration of '" + name_str + "'");

    return VarDecl{.type = std::move(unwrap(type)),
                   .name = std::move(name_str),
                   .init = std::move(init),
                   .name_span = name_span,
                   .span = SourceSpan::merge(start_span, previous().span)};
}

} // namespace yuho::parser
