//! # Source Formatter
//!
//! Prints a parsed `Program` back as canonical Yuho source: 4-space
//! indentation, one item or statement per line, every declaration and arm
//! terminated by `;`, no trailing commas.
//!
//! Parentheses are emitted only where operator precedence requires them,
//! so formatting is idempotent: re-parsing the output and formatting it
//! again yields the same text.
//!
//! ## Usage
//!
//! ```cpp
//! format::Formatter formatter;
//! std::cout << formatter.format(program);
//! ```

#ifndef YUHO_FORMAT_FORMATTER_HPP
#define YUHO_FORMAT_FORMATTER_HPP

#include "common.hpp"
#include "parser/ast.hpp"

#include <sstream>
#include <string>

namespace yuho::format {

// Formatter options
struct FormatOptions {
    int indent_width = 4;  // Spaces per indent level
    bool use_tabs = false; // Use tabs instead of spaces
};

// Yuho source code formatter
class Formatter {
public:
    explicit Formatter(FormatOptions options = {});

    // Format a complete program
    auto format(const parser::Program& program) -> std::string;

    // Format a single expression at the current indentation
    auto format_expr(const parser::Expr& expr) -> std::string;

private:
    FormatOptions options_;
    std::stringstream output_;
    int indent_level_ = 0;

    // Indentation helpers
    void emit(const std::string& text);
    void emit_line(const std::string& text);
    void emit_newline();
    void emit_indent();
    void push_indent();
    void pop_indent();
    auto indent_str() const -> std::string;
    auto indent_str(int level) const -> std::string;

    // Declaration formatting
    void format_decl(const parser::Decl& decl);
    void format_struct_decl(const parser::StructDecl& s);
    void format_enum_decl(const parser::EnumDecl& e);
    void format_func_decl(const parser::FuncDecl& func);
    void format_scope_decl(const parser::ScopeDecl& scope);
    void format_referencing_decl(const parser::ReferencingDecl& ref);
    void format_var_decl(const parser::VarDecl& var);
    void format_items(const std::vector<parser::DeclPtr>& items);

    // Statement formatting
    void format_stmt(const parser::Stmt& stmt);

    // Expression formatting
    auto format_literal(const parser::LiteralExpr& lit) -> std::string;
    auto format_binary(const parser::BinaryExpr& bin) -> std::string;
    auto format_unary(const parser::UnaryExpr& unary) -> std::string;
    auto format_call(const parser::CallExpr& call) -> std::string;
    auto format_field(const parser::FieldExpr& field) -> std::string;
    auto format_index(const parser::IndexExpr& index) -> std::string;
    auto format_struct_expr(const parser::StructExpr& s) -> std::string;
    auto format_match(const parser::MatchExpr& match) -> std::string;
    auto format_operand(const parser::Expr& expr) -> std::string;

    // Type and pattern formatting
    auto format_type(const parser::Type& type) -> std::string;
    auto format_pattern(const parser::Pattern& pattern) -> std::string;

    // Operator helpers
    static auto needs_parens(const parser::Expr& expr, const parser::BinaryExpr& parent,
                             bool is_right) -> bool;
};

/// Quotes and escapes a decoded string for output as a string literal.
[[nodiscard]] auto quote_string(std::string_view text) -> std::string;

} // namespace yuho::format

#endif // YUHO_FORMAT_FORMATTER_HPP
