#ifndef YUHO_TYPES_CHECKER_HPP
#define YUHO_TYPES_CHECKER_HPP

#include "common.hpp"
#include "common/diagnostic.hpp"
#include "parser/ast.hpp"
#include "types/resolver.hpp"
#include "types/type.hpp"

#include <map>
#include <string>
#include <vector>

namespace yuho::types {

struct AnalyzerOptions {
    // Apply CompilerOptions::warning_level / warnings_as_errors to the result
    bool warning_policy = true;
};

// Validates a resolved program. Every problem becomes a Diagnostic and
// analysis always runs to the end; an empty result means the program is valid.
class SemanticAnalyzer {
public:
    explicit SemanticAnalyzer(AnalyzerOptions options = {});

    [[nodiscard]] auto analyze(const ResolvedProgram& program) -> std::vector<Diagnostic>;

    // Analyzes `program` and records the result in `program.diagnostics`
    auto check(ResolvedProgram& program) -> const std::vector<Diagnostic>&;

private:
    struct Local {
        TypePtr type;
        SourceSpan span;
    };

    struct StructInfo {
        const parser::StructDecl* decl = nullptr;
        std::vector<std::pair<std::string, TypePtr>> fields;
    };

    struct EnumInfo {
        const parser::EnumDecl* decl = nullptr;
        std::vector<std::string> variants;
    };

    AnalyzerOptions options_;

    // Per-analysis state
    const ResolvedProgram* program_ = nullptr;
    const Module* module_ = nullptr;
    std::vector<std::string> scope_path_;
    std::vector<std::map<std::string, Local>> locals_;
    std::map<std::string, StructInfo> structs_; // by qualified name
    std::map<std::string, EnumInfo> enums_;
    const parser::FuncDecl* current_func_ = nullptr;
    TypePtr current_return_type_;
    std::vector<Diagnostic> diagnostics_;

    [[nodiscard]] auto table() const -> const SymbolTable& {
        return program_->symbols;
    }

    // Reporting
    void error(DiagnosticKind kind, const char* code, std::string message, SourceSpan span);
    void warning(DiagnosticKind kind, const char* code, std::string message, SourceSpan span);
    void report_duplicate(const std::string& what, const std::string& name, SourceSpan first,
                          SourceSpan second);
    void report_unresolved(const std::string& what, const std::string& name, SourceSpan span,
                           const std::vector<std::string>& candidates);
    [[nodiscard]] auto last() -> Diagnostic&;

    // Declaration registration (first pass)
    void collect_type_info(const Module& module, const std::vector<parser::DeclPtr>& items);

    // Declaration checking
    void check_module(const Module& module);
    void check_items(const std::vector<parser::DeclPtr>& items);
    void check_struct_decl(const parser::StructDecl& decl);
    void check_enum_decl(const parser::EnumDecl& decl);
    void check_func_decl(const parser::FuncDecl& func);
    void check_global_var(const parser::VarDecl& var);
    void check_cycles();

    // Statements
    void check_stmt(const parser::Stmt& stmt);
    void check_var_decl(const parser::VarDecl& var);
    void check_return(const parser::ReturnStmt& ret);
    void check_missing_return(const parser::FuncDecl& func);

    // Expression checking
    auto check_expr(const parser::Expr& expr) -> TypePtr;
    auto check_literal(const parser::LiteralExpr& lit) -> TypePtr;
    auto check_ident(const parser::IdentExpr& ident) -> TypePtr;
    auto check_binary(const parser::BinaryExpr& binary) -> TypePtr;
    auto check_unary(const parser::UnaryExpr& unary) -> TypePtr;
    auto check_call(const parser::CallExpr& call) -> TypePtr;
    auto check_field(const parser::FieldExpr& field) -> TypePtr;
    auto check_index(const parser::IndexExpr& index) -> TypePtr;
    auto check_struct_expr(const parser::StructExpr& expr) -> TypePtr;
    auto check_match(const parser::MatchExpr& match) -> TypePtr;

    // Patterns. Returns whether the pattern matches every value of `expected`;
    // bindings are added to the innermost local scope.
    struct Coverage {
        bool has_true = false;
        bool has_false = false;
        std::vector<std::string> variants;
    };
    auto check_pattern(const parser::Pattern& pattern, const TypePtr& expected,
                       Coverage& coverage) -> bool;
    void check_exhaustive(const parser::MatchExpr& match, const TypePtr& scrutinee,
                          const Coverage& coverage);

    // Name resolution
    auto resolve_annotation(const parser::Type& type) -> TypePtr;
    auto lookup_local(const std::string& name) const -> const Local*;
    auto lookup_symbol(const std::string& name) const -> const Symbol*;
    auto find_struct(const TypePtr& type) const -> const StructInfo*;
    auto find_enum(const TypePtr& type) const -> const EnumInfo*;
    auto visible_names() const -> std::vector<std::string>;
    auto visible_type_names() const -> std::vector<std::string>;
    void push_scope();
    void pop_scope();
    void declare_local(const std::string& name, TypePtr type, SourceSpan span);
};

} // namespace yuho::types

#endif // YUHO_TYPES_CHECKER_HPP
