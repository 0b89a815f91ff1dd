//! # Parser Core
//!
//! Token navigation, error recovery, program parsing and operator tables.
//!
//! ## Token Navigation
//!
//! | Method        | Description                           |
//! |---------------|---------------------------------------|
//! | `peek()`      | Look at current token                 |
//! | `peek_next()` | Look at next token                    |
//! | `advance()`   | Consume and return current token      |
//! | `previous()`  | Get last consumed token               |
//! | `match()`     | Consume token if it matches           |
//! | `check()`     | Check current token without consuming |
//! | `expect()`    | Require specific token or error       |
//!
//! ## Error Recovery
//!
//! | Method                   | Strategy                              |
//! |--------------------------|---------------------------------------|
//! | `expect_terminator()`    | Record a missing `;`, carry on        |
//! | `synchronize()`          | Skip past `;`, or to `}` / item start |
//! | `synchronize_to_brace()` | Skip to the matching `}`              |
//! | `synchronize_to_arm()`   | Skip to the next `case` or `}`        |

#include "parser/parser.hpp"
#include "log/log.hpp"

namespace yuho::parser {

using lexer::TokenKind;

Parser::Parser(std::vector<lexer::Token> tokens) {
    tokens_.reserve(tokens.size() + 1);
    for (auto& token : tokens) {
        if (!token.is(TokenKind::Comment)) {
            tokens_.push_back(std::move(token));
        }
    }
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        SourceSpan end_span = tokens_.empty() ? SourceSpan{} : tokens_.back().span;
        tokens_.push_back(lexer::Token{.kind = TokenKind::Eof,
                                       .span = end_span,
                                       .lexeme = {},
                                       .value = std::monostate{}});
    }
}

auto ParseError::to_diagnostic() const -> Diagnostic {
    auto diag = make_error(DiagnosticKind::ParseError, code.c_str(), message, span);
    if (!expected.empty()) {
        diag.labels.push_back(
            DiagnosticLabel{.span = span, .message = "expected " + expected, .is_primary = true});
    }
    diag.notes = notes;
    return diag;
}

// ============================================================================
// Token Navigation
// ============================================================================

auto Parser::peek() const -> const lexer::Token& {
    if (pos_ >= tokens_.size()) {
        return tokens_.back(); // Eof
    }
    return tokens_[pos_];
}

auto Parser::peek_next() const -> const lexer::Token& {
    return peek_at(1);
}

auto Parser::peek_at(size_t offset) const -> const lexer::Token& {
    if (pos_ + offset >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[pos_ + offset];
}

auto Parser::previous() const -> const lexer::Token& {
    if (pos_ == 0) {
        return tokens_[0];
    }
    return tokens_[pos_ - 1];
}

auto Parser::advance() -> const lexer::Token& {
    if (!is_at_end()) {
        ++pos_;
    }
    return previous();
}

auto Parser::is_at_end() const -> bool {
    return peek().is_eof();
}

auto Parser::check(TokenKind kind) const -> bool {
    return peek().kind == kind;
}

auto Parser::check_next(TokenKind kind) const -> bool {
    return peek_next().kind == kind;
}

auto Parser::match(TokenKind kind) -> bool {
    if (check(kind)) {
        advance();
        return true;
    }
    return false;
}

auto Parser::expect(TokenKind kind, const std::string& expected)
    -> Result<lexer::Token, ParseError> {
    if (check(kind)) {
        return advance();
    }
    const char* code = kind == TokenKind::RBrace ? ErrorCodes::PARSE_MISSING_BRACE
                                                 : ErrorCodes::PARSE_UNEXPECTED_TOKEN;
    return error_here(code, expected);
}

// ============================================================================
// Error Handling
// ============================================================================

auto Parser::describe(const lexer::Token& token) -> std::string {
    if (token.is_eof()) {
        return "end of input";
    }
    return "'" + std::string(token.lexeme) + "'";
}

auto Parser::error_here(const char* code, const std::string& expected) const -> ParseError {
    auto found = describe(peek());
    return ParseError{.message = "expected " + expected + ", found " + found,
                      .code = code,
                      .expected = expected,
                      .found = found,
                      .span = peek().span,
                      .notes = {}};
}

auto Parser::nesting_error(const std::string& what) const -> ParseError {
    return ParseError{.message = what + " nested too deeply",
                      .code = ErrorCodes::PARSE_NESTING_TOO_DEEP,
                      .expected = "",
                      .found = describe(peek()),
                      .span = peek().span,
                      .notes = {"at most " + std::to_string(MAX_NESTING_DEPTH) +
                                " levels of nesting are supported"}};
}

void Parser::report_error(ParseError error) {
    YUHO_LOG_TRACE("parser", error.code << " " << error.message);
    errors_.push_back(std::move(error));
}

void Parser::expect_terminator(const std::string& after) {
    if (match(TokenKind::Semi)) {
        return;
    }
    // Point just past the previous token, where the `;` belongs.
    auto span = previous().span;
    span.end.offset += 1;
    span.end.column += 1;
    span.end.length = 1;
    span.start = span.end;
    report_error(ParseError{.message = "expected ';' after " + after,
                            .code = ErrorCodes::PARSE_MISSING_TERMINATOR,
                            .expected = "';'",
                            .found = describe(peek()),
                            .span = span,
                            .notes = {}});
}

auto Parser::starts_item(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::KwStruct:
    case TokenKind::KwEnum:
    case TokenKind::KwFn:
    case TokenKind::KwScope:
    case TokenKind::KwStatute:
    case TokenKind::KwReferencing:
    case TokenKind::KwExport:
    case TokenKind::KwReturn:
        return true;
    default:
        return lexer::is_type_keyword(kind);
    }
}

void Parser::synchronize() {
    while (!is_at_end()) {
        if (match(TokenKind::Semi)) {
            return;
        }
        if (check(TokenKind::RBrace) || starts_item(peek().kind)) {
            return;
        }
        advance();
    }
}

void Parser::synchronize_to_brace() {
    int brace_depth = 1;
    while (!is_at_end() && brace_depth > 0) {
        if (check(TokenKind::LBrace)) {
            brace_depth++;
        } else if (check(TokenKind::RBrace)) {
            brace_depth--;
            if (brace_depth == 0) {
                return; // Don't consume the closing brace
            }
        }
        advance();
    }
}

void Parser::synchronize_to_arm() {
    int brace_depth = 0;
    while (!is_at_end()) {
        if (brace_depth == 0 && (check(TokenKind::KwCase) || check(TokenKind::RBrace))) {
            return;
        }
        if (check(TokenKind::LBrace)) {
            brace_depth++;
        } else if (check(TokenKind::RBrace)) {
            brace_depth--;
        }
        advance();
    }
}

// ============================================================================
// Program Parsing
// ============================================================================

auto Parser::parse_items_until_eof(const std::string& name) -> Program {
    std::vector<DeclPtr> items;
    auto start_span = peek().span;

    while (!is_at_end()) {
        size_t before = pos_;
        auto item = parse_item(true);
        if (is_ok(item)) {
            items.push_back(std::move(unwrap(item)));
            continue;
        }
        report_error(std::move(unwrap_err(item)));
        synchronize();
        if (pos_ == before) {
            advance();
        }
    }

    auto end_span = previous().span;
    YUHO_LOG_DEBUG("parser",
                   name << ": " << items.size() << " items, " << errors_.size() << " errors");
    return Program{.name = name,
                   .items = std::move(items),
                   .span = SourceSpan::merge(start_span, end_span)};
}

auto Parser::parse_program(const std::string& name) -> Result<Program, std::vector<ParseError>> {
    auto program = parse_items_until_eof(name);
    if (has_errors()) {
        return errors_;
    }
    return program;
}

auto Parser::parse_program_recovering(const std::string& name) -> ParseOutcome {
    auto program = parse_items_until_eof(name);
    return ParseOutcome{.program = std::move(program), .errors = errors_};
}

auto Parser::parse_decl() -> Result<DeclPtr, ParseError> {
    return parse_item(true);
}

// ============================================================================
// Operator Helpers
// ============================================================================

auto Parser::get_precedence(TokenKind kind) -> int {
    switch (kind) {
    case TokenKind::OrOr:
    case TokenKind::KwXor:
        return precedence::OR;

    case TokenKind::AndAnd:
        return precedence::AND;

    case TokenKind::Eq:
    case TokenKind::Ne:
        return precedence::EQUALITY;

    case TokenKind::Lt:
    case TokenKind::Le:
    case TokenKind::Gt:
    case TokenKind::Ge:
        return precedence::RELATIONAL;

    case TokenKind::Plus:
    case TokenKind::Minus:
        return precedence::TERM;

    case TokenKind::Star:
    case TokenKind::Slash:
    case TokenKind::Percent:
        return precedence::FACTOR;

    case TokenKind::Dot:
    case TokenKind::LParen:
    case TokenKind::LBracket:
        return precedence::POSTFIX;

    default:
        return precedence::NONE;
    }
}

auto Parser::token_to_binary_op(TokenKind kind) -> std::optional<BinaryOp> {
    switch (kind) {
    case TokenKind::Plus:
        return BinaryOp::Add;
    case TokenKind::Minus:
        return BinaryOp::Sub;
    case TokenKind::Star:
        return BinaryOp::Mul;
    case TokenKind::Slash:
        return BinaryOp::Div;
    case TokenKind::Percent:
        return BinaryOp::Mod;
    case TokenKind::Eq:
        return BinaryOp::Eq;
    case TokenKind::Ne:
        return BinaryOp::Ne;
    case TokenKind::Lt:
        return BinaryOp::Lt;
    case TokenKind::Le:
        return BinaryOp::Le;
    case TokenKind::Gt:
        return BinaryOp::Gt;
    case TokenKind::Ge:
        return BinaryOp::Ge;
    case TokenKind::AndAnd:
        return BinaryOp::And;
    case TokenKind::OrOr:
        return BinaryOp::Or;
    case TokenKind::KwXor:
        return BinaryOp::Xor;
    default:
        return std::nullopt;
    }
}

auto Parser::token_to_unary_op(TokenKind kind) -> std::optional<UnaryOp> {
    switch (kind) {
    case TokenKind::Minus:
        return UnaryOp::Neg;
    case TokenKind::Bang:
        return UnaryOp::Not;
    default:
        return std::nullopt;
    }
}

auto binary_precedence(BinaryOp op) -> int {
    switch (op) {
    case BinaryOp::Or:
    case BinaryOp::Xor:
        return precedence::OR;
    case BinaryOp::And:
        return precedence::AND;
    case BinaryOp::Eq:
    case BinaryOp::Ne:
        return precedence::EQUALITY;
    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
        return precedence::RELATIONAL;
    case BinaryOp::Add:
    case BinaryOp::Sub:
        return precedence::TERM;
    case BinaryOp::Mul:
    case BinaryOp::Div:
    case BinaryOp::Mod:
        return precedence::FACTOR;
    }
    return precedence::NONE;
}

} // namespace yuho::parser
