//! # Type and Pattern Formatting
//!
//! | Node               | Output                    |
//! |--------------------|---------------------------|
//! | `PrimitiveType`    | `int`, `money`, ...       |
//! | `NamedType`        | `Person`                  |
//! | `UnionType`        | `int \|\| string`         |
//! | `LiteralPattern`   | `TRUE`, `-1`              |
//! | `QualifiedPattern` | `Verdict.Guilty`          |
//! | `StructPattern`    | `Offence { severity: 3 }` |

#include "format/formatter.hpp"

namespace yuho::format {

auto Formatter::format_type(const parser::Type& type) -> std::string {
    if (type.is<parser::PrimitiveType>()) {
        return std::string(parser::primitive_kind_to_string(type.as<parser::PrimitiveType>().kind));
    } else if (type.is<parser::NamedType>()) {
        return type.as<parser::NamedType>().name;
    }

    const auto& members = type.as<parser::UnionType>().members;
    std::string result;
    for (size_t i = 0; i < members.size(); ++i) {
        if (i > 0)
            result += " || ";
        result += format_type(*members[i]);
    }
    return result;
}

auto Formatter::format_pattern(const parser::Pattern& pattern) -> std::string {
    if (pattern.is<parser::WildcardPattern>()) {
        return "_";
    } else if (pattern.is<parser::LiteralPattern>()) {
        const auto& lit = pattern.as<parser::LiteralPattern>();
        return (lit.negated ? "-" : "") + std::string(lit.literal.lexeme);
    } else if (pattern.is<parser::IdentPattern>()) {
        return pattern.as<parser::IdentPattern>().name;
    } else if (pattern.is<parser::QualifiedPattern>()) {
        const auto& q = pattern.as<parser::QualifiedPattern>();
        return q.type_name + "." + q.variant;
    }

    const auto& s = pattern.as<parser::StructPattern>();
    if (s.fields.empty()) {
        return s.name + " {}";
    }
    std::string result = s.name + " { ";
    for (size_t i = 0; i < s.fields.size(); ++i) {
        if (i > 0)
            result += ", ";
        result += s.fields[i].name;
        if (s.fields[i].pattern) {
            result += ": " + format_pattern(**s.fields[i].pattern);
        }
    }
    return result + " }";
}

} // namespace yuho::format
