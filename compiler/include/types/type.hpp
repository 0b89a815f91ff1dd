#ifndef YUHO_TYPES_TYPE_HPP
#define YUHO_TYPES_TYPE_HPP

#include "common.hpp"
#include "parser/ast.hpp"

#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace yuho::types {

// Forward declarations
struct Type;
using TypePtr = std::shared_ptr<Type>;

// Primitive types
enum class PrimitiveKind {
    Int,
    Float,
    String,
    Bool,
    Money,
    Date,
    Duration,
    Percent,
    // Internal helpers
    Pass,    // function without a result, `pass` consequence
    Unknown, // could not be determined; compatible with everything
};

// Primitive type
struct PrimitiveType {
    PrimitiveKind kind;
};

// What a named type refers to
enum class NamedKind {
    Struct,
    Enum,
};

// Named type (user-defined struct or enum). `module` is the qualified name of
// the defining module or scope block, so `module + "." + name` is the symbol's
// qualified name and two modules may each own a `Person` without the types
// being equal.
struct NamedType {
    std::string name;
    std::string module;
    NamedKind named_kind = NamedKind::Struct;
};

// Union type: A || B. Members are flattened, unique and sorted.
struct UnionType {
    std::vector<TypePtr> members;
};

// Function type: fn(A, B): R
struct FuncType {
    std::vector<TypePtr> params;
    TypePtr return_type;
};

// Type variant
struct Type {
    std::variant<PrimitiveType, NamedType, UnionType, FuncType> kind;

    template <typename T> [[nodiscard]] auto is() const -> bool {
        return std::holds_alternative<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() -> T& {
        return std::get<T>(kind);
    }

    template <typename T> [[nodiscard]] auto as() const -> const T& {
        return std::get<T>(kind);
    }
};

// Helper functions
[[nodiscard]] auto make_primitive(PrimitiveKind kind) -> TypePtr;
[[nodiscard]] auto make_int() -> TypePtr;
[[nodiscard]] auto make_float() -> TypePtr;
[[nodiscard]] auto make_string() -> TypePtr;
[[nodiscard]] auto make_bool() -> TypePtr;
[[nodiscard]] auto make_money() -> TypePtr;
[[nodiscard]] auto make_date() -> TypePtr;
[[nodiscard]] auto make_duration() -> TypePtr;
[[nodiscard]] auto make_percent() -> TypePtr;
[[nodiscard]] auto make_pass() -> TypePtr;
[[nodiscard]] auto make_unknown() -> TypePtr;
[[nodiscard]] auto make_named(std::string name, std::string module,
                              NamedKind kind = NamedKind::Struct) -> TypePtr;
[[nodiscard]] auto make_func(std::vector<TypePtr> params, TypePtr ret) -> TypePtr;

// Builds a normalized union: nested unions are flattened, duplicates removed
// and members sorted by display name. One member collapses to that member;
// an Unknown member makes the whole union Unknown.
[[nodiscard]] auto make_union(std::vector<TypePtr> members) -> TypePtr;

// Maps a syntactic primitive to its semantic counterpart
[[nodiscard]] auto from_syntax(parser::PrimitiveKind kind) -> TypePtr;

// Type queries
[[nodiscard]] auto is_primitive(const TypePtr& type, PrimitiveKind kind) -> bool;
[[nodiscard]] auto is_unknown(const TypePtr& type) -> bool;
[[nodiscard]] auto is_numeric(const TypePtr& type) -> bool;
[[nodiscard]] auto is_bool(const TypePtr& type) -> bool;

// Type comparison
[[nodiscard]] auto types_equal(const TypePtr& a, const TypePtr& b) -> bool;
[[nodiscard]] auto type_to_string(const TypePtr& type) -> std::string;

// Whether a value of `source` may be stored where `target` is expected.
// Identical types, Int into Float, every member of a union source, and a
// source into a union target that contains it.
[[nodiscard]] auto is_assignable(const TypePtr& target, const TypePtr& source) -> bool;

// Operator typing. nullptr means the operands are not accepted.
[[nodiscard]] auto binary_result_type(parser::BinaryOp op, const TypePtr& left,
                                      const TypePtr& right) -> TypePtr;
[[nodiscard]] auto unary_result_type(parser::UnaryOp op, const TypePtr& operand) -> TypePtr;

// Helper to convert primitive kind to string name
[[nodiscard]] auto primitive_kind_to_string(PrimitiveKind kind) -> std::string;

} // namespace yuho::types

#endif // YUHO_TYPES_TYPE_HPP
