//! # Parser - Expressions
//!
//! Precedence climbing for binary operators, then prefix, primary and
//! postfix forms.
//!
//! ## Struct Literals vs. Match Bodies
//!
//! `Name { field := ... }` is only read as a struct literal when the brace is
//! followed by `field :=` or directly by `}`, and never while parsing a match
//! scrutinee, so `match offence { case ... }` keeps its body. Parentheses
//! re-enable struct literals inside a scrutinee.
//!
//! ## Match-Case
//!
//! ```yuho
//! match (offence.kind) {
//!     case Kind.Theft if value > $500.00 := consequence "aggravated";
//!     case Kind.Theft := consequence "simple";
//!     case _ := pass;
//! }
//! ```
//!
//! Each arm ends with `;`, or directly with the closing `}`. A malformed arm
//! is recorded and skipped up to the next `case`.

#include "parser/parser.hpp"

namespace yuho::parser {

using lexer::TokenKind;

auto Parser::parse_expr() -> Result<ExprPtr, ParseError> {
    return parse_expr_with_precedence(precedence::NONE);
}

auto Parser::parse_expr_with_precedence(int min_precedence) -> Result<ExprPtr, ParseError> {
    auto left_result = parse_prefix_expr();
    if (is_err(left_result))
        return left_result;
    auto left = std::move(unwrap(left_result));

    while (true) {
        auto op = token_to_binary_op(peek().kind);
        int prec = get_precedence(peek().kind);
        if (!op || prec < min_precedence) {
            break;
        }
        advance();

        // Left-associative: the right operand binds strictly tighter.
        auto right = parse_expr_with_precedence(prec + 1);
        if (is_err(right))
            return right;
        left = make_binary_expr(*op, std::move(left), std::move(unwrap(right)));
    }

    return left;
}

auto Parser::parse_prefix_expr() -> Result<ExprPtr, ParseError> {
    NestingGuard guard(depth_);
    if (depth_ > MAX_NESTING_DEPTH) {
        return nesting_error("expression");
    }

    if (auto op = token_to_unary_op(peek().kind)) {
        auto start_span = advance().span;
        auto operand = parse_prefix_expr();
        if (is_err(operand))
            return operand;
        auto span = SourceSpan::merge(start_span, unwrap(operand)->span);
        return make_unary_expr(*op, std::move(unwrap(operand)), span);
    }

    auto primary = parse_primary_expr();
    if (is_err(primary))
        return primary;
    return parse_postfix_expr(std::move(unwrap(primary)));
}

auto Parser::parse_primary_expr() -> Result<ExprPtr, ParseError> {
    if (lexer::is_literal(peek().kind)) {
        return make_literal_expr(advance());
    }

    if (check(TokenKind::Identifier)) {
        if (allow_struct_literal_ && looks_like_struct_literal()) {
            return parse_struct_expr();
        }
        const auto& tok = advance();
        return make_ident_expr(std::string(tok.lexeme), tok.span);
    }

    if (check(TokenKind::LParen)) {
        advance();
        bool saved = allow_struct_literal_;
        allow_struct_literal_ = true;
        auto inner = parse_expr();
        allow_struct_literal_ = saved;
        if (is_err(inner))
            return inner;
        auto close = expect(TokenKind::RParen, "')'");
        if (is_err(close))
            return unwrap_err(close);
        return inner;
    }

    if (check(TokenKind::KwMatch)) {
        return parse_match_expr();
    }

    return error_here(ErrorCodes::PARSE_EXPECTED_EXPR, "expression");
}

auto Parser::parse_postfix_expr(ExprPtr left) -> Result<ExprPtr, ParseError> {
    while (true) {
        if (match(TokenKind::Dot)) {
            auto field = expect(TokenKind::Identifier, "field name after '.'");
            if (is_err(field))
                return unwrap_err(field);
            auto span = SourceSpan::merge(left->span, unwrap(field).span);
            left = make_box<Expr>(Expr{.kind = FieldExpr{.object = std::move(left),
                                                         .field = std::string(unwrap(field).lexeme),
                                                         .field_span = unwrap(field).span,
                                                         .span = span},
                                       .span = span});
        } else if (check(TokenKind::LParen)) {
            auto args = parse_call_args();
            if (is_err(args))
                return unwrap_err(args);
            auto span = SourceSpan::merge(left->span, previous().span);
            left = make_box<Expr>(Expr{.kind = CallExpr{.callee = std::move(left),
                                                        .args = std::move(unwrap(args)),
                                                        .span = span},
                                       .span = span});
        } else if (match(TokenKind::LBracket)) {
            auto index = parse_expr();
            if (is_err(index))
                return index;
            auto close = expect(TokenKind::RBracket, "']'");
            if (is_err(close))
                return unwrap_err(close);
            auto span = SourceSpan::merge(left->span, previous().span);
            left = make_box<Expr>(Expr{.kind = IndexExpr{.object = std::move(left),
                                                         .index = std::move(unwrap(index)),
                                                         .span = span},
                                       .span = span});
        } else {
            break;
        }
    }
    return left;
}

auto Parser::parse_call_args() -> Result<std::vector<ExprPtr>, ParseError> {
    advance(); // (

    bool saved = allow_struct_literal_;
    allow_struct_literal_ = true;

    std::vector<ExprPtr> args;
    while (!check(TokenKind::RParen) && !is_at_end()) {
        auto arg = parse_expr();
        if (is_err(arg)) {
            allow_struct_literal_ = saved;
            return unwrap_err(arg);
        }
        args.push_back(std::move(unwrap(arg)));
        if (!match(TokenKind::Comma)) {
            break;
        }
    }
    allow_struct_literal_ = saved;

    auto close = expect(TokenKind::RParen, "')' after arguments");
    if (is_err(close))
        return unwrap_err(close);
    return args;
}

// ============================================================================
// Struct Literals
// ============================================================================

auto Parser::looks_like_struct_literal() const -> bool {
    if (!check_next(TokenKind::LBrace)) {
        return false;
    }
    const auto& after = peek_at(2);
    return after.is(TokenKind::RBrace) ||
           (after.is(TokenKind::Identifier) && peek_at(3).is(TokenKind::Assign));
}

auto Parser::parse_struct_expr() -> Result<ExprPtr, ParseError> {
    const auto& name_tok = advance();
    advance(); // {

    std::vector<StructFieldInit> fields;
    while (!check(TokenKind::RBrace) && !is_at_end()) {
        auto field = expect(TokenKind::Identifier, "field name");
        if (is_err(field))
            return unwrap_err(field);
        auto field_span = unwrap(field).span;

        auto assign = expect(TokenKind::Assign, "':=' after field name");
        if (is_err(assign))
            return unwrap_err(assign);

        auto value = parse_expr();
        if (is_err(value))
            return value;

        fields.push_back(StructFieldInit{.name = std::string(unwrap(field).lexeme),
                                         .value = std::move(unwrap(value)),
                                         .span = SourceSpan::merge(field_span, previous().span)});
        if (!match(TokenKind::Comma)) {
            break;
        }
    }

    auto close = expect(TokenKind::RBrace, "'}' to close struct literal");
    if (is_err(close))
        return unwrap_err(close);

    auto span = SourceSpan::merge(name_tok.span, previous().span);
    return make_box<Expr>(Expr{.kind = StructExpr{.name = std::string(name_tok.lexeme),
                                                  .fields = std::move(fields),
                                                  .name_span = name_tok.span,
                                                  .span = span},
                               .span = span});
}

// ============================================================================
// Match-Case
// ============================================================================

auto Parser::parse_match_expr() -> Result<ExprPtr, ParseError> {
    auto start_span = advance().span; // match

    std::optional<ExprPtr> scrutinee;
    if (!check(TokenKind::LBrace)) {
        bool saved = allow_struct_literal_;
        allow_struct_literal_ = false;
        auto value = parse_expr();
        allow_struct_literal_ = saved;
        if (is_err(value))
            return value;
        scrutinee = std::move(unwrap(value));
    }

    auto open = expect(TokenKind::LBrace, "'{' to open match body");
    if (is_err(open))
        return unwrap_err(open);

    bool saved = allow_struct_literal_;
    allow_struct_literal_ = true;

    std::vector<MatchArm> arms;
    while (!check(TokenKind::RBrace) && !is_at_end()) {
        if (!check(TokenKind::KwCase)) {
            report_error(error_here(ErrorCodes::PARSE_UNEXPECTED_TOKEN, "'case' or '}'"));
            synchronize_to_arm();
            continue;
        }
        auto arm = parse_match_arm();
        if (is_err(arm)) {
            report_error(std::move(unwrap_err(arm)));
            synchronize_to_arm();
            continue;
        }
        arms.push_back(std::move(unwrap(arm)));
    }
    allow_struct_literal_ = saved;

    auto close = expect(TokenKind::RBrace, "'}' to close match");
    if (is_err(close))
        return unwrap_err(close);

    auto span = SourceSpan::merge(start_span, previous().span);
    return make_box<Expr>(Expr{
        .kind = MatchExpr{.scrutinee = std::move(scrutinee), .arms = std::move(arms), .span = span},
        .span = span});
}

auto Parser::parse_match_arm() -> Result<MatchArm, ParseError> {
    auto start_span = advance().span; // case

    auto pattern = parse_pattern();
    if (is_err(pattern))
        return unwrap_err(pattern);

    std::optional<ExprPtr> guard;
    if (match(TokenKind::KwIf) || match(TokenKind::KwWhere)) {
        auto cond = parse_expr();
        if (is_err(cond))
            return unwrap_err(cond);
        guard = std::move(unwrap(cond));
    }

    auto assign = expect(TokenKind::Assign, "':=' after case pattern");
    if (is_err(assign))
        return unwrap_err(assign);

    std::optional<ExprPtr> consequence;
    if (!match(TokenKind::KwPass)) {
        auto kw = expect(TokenKind::KwConsequence, "'consequence' or 'pass'");
        if (is_err(kw))
            return unwrap_err(kw);
        auto value = parse_expr();
        if (is_err(value))
            return unwrap_err(value);
        consequence = std::move(unwrap(value));
    }

    if (!check(TokenKind::RBrace)) {
        expect_terminator("match arm");
    }

    return MatchArm{.pattern = std::move(unwrap(pattern)),
                    .guard = std::move(guard),
                    .consequence = std::move(consequence),
                    .span = SourceSpan::merge(start_span, previous().span)};
}

} // namespace yuho::parser
