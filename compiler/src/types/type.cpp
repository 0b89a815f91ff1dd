//! # Type Implementation
//!
//! Type construction, comparison and display.
//!
//! ## Type Factory Functions
//!
//! | Function          | Creates                               |
//! |-------------------|---------------------------------------|
//! | `make_primitive`  | int, float, money, date, ...          |
//! | `make_int`, etc.  | Convenience for each primitive        |
//! | `make_named`      | User-defined struct/enum types        |
//! | `make_union`      | Normalized `A \|\| B` unions          |
//! | `make_func`       | Function signatures                   |
//!
//! ## Type Comparison
//!
//! `types_equal()` is structural. Named types compare by name and defining
//! module. Unions are normalized on construction, so comparing members in
//! order is enough.

#include "types/type.hpp"

#include <algorithm>
#include <sstream>

namespace yuho::types {

auto make_primitive(PrimitiveKind kind) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = PrimitiveType{kind};
    return type;
}

auto make_int() -> TypePtr {
    return make_primitive(PrimitiveKind::Int);
}

auto make_float() -> TypePtr {
    return make_primitive(PrimitiveKind::Float);
}

auto make_string() -> TypePtr {
    return make_primitive(PrimitiveKind::String);
}

auto make_bool() -> TypePtr {
    return make_primitive(PrimitiveKind::Bool);
}

auto make_money() -> TypePtr {
    return make_primitive(PrimitiveKind::Money);
}

auto make_date() -> TypePtr {
    return make_primitive(PrimitiveKind::Date);
}

auto make_duration() -> TypePtr {
    return make_primitive(PrimitiveKind::Duration);
}

auto make_percent() -> TypePtr {
    return make_primitive(PrimitiveKind::Percent);
}

auto make_pass() -> TypePtr {
    return make_primitive(PrimitiveKind::Pass);
}

auto make_unknown() -> TypePtr {
    return make_primitive(PrimitiveKind::Unknown);
}

auto make_named(std::string name, std::string module, NamedKind kind) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = NamedType{.name = std::move(name), .module = std::move(module), .named_kind = kind};
    return type;
}

auto make_func(std::vector<TypePtr> params, TypePtr ret) -> TypePtr {
    auto type = std::make_shared<Type>();
    type->kind = FuncType{.params = std::move(params), .return_type = std::move(ret)};
    return type;
}

auto make_union(std::vector<TypePtr> members) -> TypePtr {
    std::vector<TypePtr> flat;
    for (auto& member : members) {
        if (!member) {
            continue;
        }
        if (is_unknown(member)) {
            return make_unknown();
        }
        if (member->is<UnionType>()) {
            for (const auto& inner : member->as<UnionType>().members) {
                flat.push_back(inner);
            }
        } else {
            flat.push_back(std::move(member));
        }
    }

    if (flat.empty()) {
        return make_unknown();
    }

    std::vector<TypePtr> unique;
    for (auto& member : flat) {
        bool seen = std::any_of(unique.begin(), unique.end(),
                                [&](const TypePtr& u) { return types_equal(u, member); });
        if (!seen) {
            unique.push_back(std::move(member));
        }
    }

    if (unique.size() == 1) {
        return unique.front();
    }

    std::stable_sort(unique.begin(), unique.end(), [](const TypePtr& a, const TypePtr& b) {
        return type_to_string(a) < type_to_string(b);
    });

    auto type = std::make_shared<Type>();
    type->kind = UnionType{std::move(unique)};
    return type;
}

auto from_syntax(parser::PrimitiveKind kind) -> TypePtr {
    switch (kind) {
    case parser::PrimitiveKind::Int:
        return make_int();
    case parser::PrimitiveKind::Float:
        return make_float();
    case parser::PrimitiveKind::Bool:
        return make_bool();
    case parser::PrimitiveKind::String:
        return make_string();
    case parser::PrimitiveKind::Money:
        return make_money();
    case parser::PrimitiveKind::Date:
        return make_date();
    case parser::PrimitiveKind::Duration:
        return make_duration();
    case parser::PrimitiveKind::Percent:
        return make_percent();
    }
    return make_unknown();
}

// ============================================================================
// Queries
// ============================================================================

auto is_primitive(const TypePtr& type, PrimitiveKind kind) -> bool {
    return type && type->is<PrimitiveType>() && type->as<PrimitiveType>().kind == kind;
}

auto is_unknown(const TypePtr& type) -> bool {
    return !type || is_primitive(type, PrimitiveKind::Unknown);
}

auto is_numeric(const TypePtr& type) -> bool {
    return is_primitive(type, PrimitiveKind::Int) || is_primitive(type, PrimitiveKind::Float);
}

auto is_bool(const TypePtr& type) -> bool {
    return is_primitive(type, PrimitiveKind::Bool);
}

// ============================================================================
// Comparison
// ============================================================================

auto types_equal(const TypePtr& a, const TypePtr& b) -> bool {
    if (!a || !b) {
        return a == b;
    }
    if (a.get() == b.get()) {
        return true;
    }
    if (a->kind.index() != b->kind.index()) {
        return false;
    }

    return std::visit(
        [&b](const auto& lhs) -> bool {
            using T = std::decay_t<decltype(lhs)>;
            const auto& rhs = b->as<T>();

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return lhs.kind == rhs.kind;
            } else if constexpr (std::is_same_v<T, NamedType>) {
                return lhs.name == rhs.name && lhs.module == rhs.module;
            } else if constexpr (std::is_same_v<T, UnionType>) {
                if (lhs.members.size() != rhs.members.size()) {
                    return false;
                }
                for (size_t i = 0; i < lhs.members.size(); ++i) {
                    if (!types_equal(lhs.members[i], rhs.members[i])) {
                        return false;
                    }
                }
                return true;
            } else if constexpr (std::is_same_v<T, FuncType>) {
                if (lhs.params.size() != rhs.params.size()) {
                    return false;
                }
                for (size_t i = 0; i < lhs.params.size(); ++i) {
                    if (!types_equal(lhs.params[i], rhs.params[i])) {
                        return false;
                    }
                }
                return types_equal(lhs.return_type, rhs.return_type);
            } else {
                return false;
            }
        },
        a->kind);
}

auto is_assignable(const TypePtr& target, const TypePtr& source) -> bool {
    if (is_unknown(target) || is_unknown(source)) {
        return true;
    }
    if (types_equal(target, source)) {
        return true;
    }
    if (is_primitive(target, PrimitiveKind::Float) && is_primitive(source, PrimitiveKind::Int)) {
        return true;
    }
    if (source->is<UnionType>()) {
        const auto& members = source->as<UnionType>().members;
        return std::all_of(members.begin(), members.end(),
                           [&](const TypePtr& m) { return is_assignable(target, m); });
    }
    if (target->is<UnionType>()) {
        const auto& members = target->as<UnionType>().members;
        return std::any_of(members.begin(), members.end(),
                           [&](const TypePtr& m) { return is_assignable(m, source); });
    }
    return false;
}

// ============================================================================
// Display
// ============================================================================

auto primitive_kind_to_string(PrimitiveKind kind) -> std::string {
    switch (kind) {
    case PrimitiveKind::Int:
        return "int";
    case PrimitiveKind::Float:
        return "float";
    case PrimitiveKind::String:
        return "string";
    case PrimitiveKind::Bool:
        return "bool";
    case PrimitiveKind::Money:
        return "money";
    case PrimitiveKind::Date:
        return "date";
    case PrimitiveKind::Duration:
        return "duration";
    case PrimitiveKind::Percent:
        return "percent";
    case PrimitiveKind::Pass:
        return "pass";
    case PrimitiveKind::Unknown:
        return "{unknown}";
    }
    return "?";
}

auto type_to_string(const TypePtr& type) -> std::string {
    if (!type) {
        return "{unknown}";
    }

    return std::visit(
        [](const auto& t) -> std::string {
            using T = std::decay_t<decltype(t)>;

            if constexpr (std::is_same_v<T, PrimitiveType>) {
                return primitive_kind_to_string(t.kind);
            } else if constexpr (std::is_same_v<T, NamedType>) {
                return t.name;
            } else if constexpr (std::is_same_v<T, UnionType>) {
                std::ostringstream oss;
                for (size_t i = 0; i < t.members.size(); ++i) {
                    if (i > 0) {
                        oss << " || ";
                    }
                    oss << type_to_string(t.members[i]);
                }
                return oss.str();
            } else if constexpr (std::is_same_v<T, FuncType>) {
                std::ostringstream oss;
                oss << "fn(";
                for (size_t i = 0; i < t.params.size(); ++i) {
                    if (i > 0) {
                        oss << ", ";
                    }
                    oss << type_to_string(t.params[i]);
                }
                oss << ")";
                if (!is_primitive(t.return_type, PrimitiveKind::Pass)) {
                    oss << ": " << type_to_string(t.return_type);
                }
                return oss.str();
            } else {
                return "?";
            }
        },
        type->kind);
}

} // namespace yuho::types
