//! # Operator Typing
//!
//! Result types of the binary and unary operators over the legal-domain
//! primitives. Anything not listed is rejected (`nullptr`).
//!
//! | Op          | Operands                                   | Result   |
//! |-------------|--------------------------------------------|----------|
//! | `+ -`       | numeric                                    | int/float|
//! | `+ -`       | money/money, percent/percent, dur/dur      | same     |
//! | `+ -`       | date, duration                             | date     |
//! | `-`         | date, date                                 | duration |
//! | `+`         | string, string                             | string   |
//! | `*`         | money x int/float/percent (either order)   | money    |
//! | `*`         | percent x int/float (either order)         | percent  |
//! | `*`         | duration x int (either order)              | duration |
//! | `/`         | money / int/float                          | money    |
//! | `/`         | money / money                              | float    |
//! | `%`         | int, int                                   | int      |
//! | `&& \|\| xor` | bool, bool                               | bool     |
//! | `== !=`     | assignable either way                      | bool     |
//! | `< <= > >=` | same orderable type, numeric mixes         | bool     |
//!
//! An Unknown operand yields Unknown so one error does not cascade.

#include "types/type.hpp"

namespace yuho::types {

namespace {

auto kind_of(const TypePtr& type) -> std::optional<PrimitiveKind> {
    if (type && type->is<PrimitiveType>()) {
        return type->as<PrimitiveType>().kind;
    }
    return std::nullopt;
}

auto numeric_result(const TypePtr& left, const TypePtr& right) -> TypePtr {
    if (is_primitive(left, PrimitiveKind::Int) && is_primitive(right, PrimitiveKind::Int)) {
        return make_int();
    }
    return make_float();
}

auto is_orderable(PrimitiveKind kind) -> bool {
    switch (kind) {
    case PrimitiveKind::Int:
    case PrimitiveKind::Float:
    case PrimitiveKind::String:
    case PrimitiveKind::Money:
    case PrimitiveKind::Date:
    case PrimitiveKind::Duration:
    case PrimitiveKind::Percent:
        return true;
    default:
        return false;
    }
}

auto additive(parser::BinaryOp op, PrimitiveKind l, PrimitiveKind r) -> TypePtr {
    using K = PrimitiveKind;
    if (l == r) {
        switch (l) {
        case K::Money:
        case K::Percent:
        case K::Duration:
            return make_primitive(l);
        case K::String:
            return op == parser::BinaryOp::Add ? make_string() : nullptr;
        case K::Date:
            return op == parser::BinaryOp::Sub ? make_duration() : nullptr;
        default:
            return nullptr;
        }
    }
    if (l == K::Date && r == K::Duration) {
        return make_date();
    }
    return nullptr;
}

auto multiplicative(PrimitiveKind l, PrimitiveKind r) -> TypePtr {
    using K = PrimitiveKind;
    auto scalar = [](K k) { return k == K::Int || k == K::Float; };

    for (auto [a, b] : {std::pair{l, r}, std::pair{r, l}}) {
        if (a == K::Money && (scalar(b) || b == K::Percent)) {
            return make_money();
        }
        if (a == K::Percent && scalar(b)) {
            return make_percent();
        }
        if (a == K::Duration && b == K::Int) {
            return make_duration();
        }
    }
    return nullptr;
}

auto division(PrimitiveKind l, PrimitiveKind r) -> TypePtr {
    using K = PrimitiveKind;
    if (l == K::Money && (r == K::Int || r == K::Float)) {
        return make_money();
    }
    if (l == K::Money && r == K::Money) {
        return make_float();
    }
    return nullptr;
}

} // namespace

auto binary_result_type(parser::BinaryOp op, const TypePtr& left, const TypePtr& right)
    -> TypePtr {
    using parser::BinaryOp;

    if (is_unknown(left) || is_unknown(right)) {
        switch (op) {
        case BinaryOp::Eq:
        case BinaryOp::Ne:
        case BinaryOp::Lt:
        case BinaryOp::Le:
        case BinaryOp::Gt:
        case BinaryOp::Ge:
        case BinaryOp::And:
        case BinaryOp::Or:
        case BinaryOp::Xor:
            return make_bool();
        default:
            return make_unknown();
        }
    }

    switch (op) {
    case BinaryOp::Eq:
    case BinaryOp::Ne:
        if (is_assignable(left, right) || is_assignable(right, left)) {
            return make_bool();
        }
        return nullptr;

    case BinaryOp::And:
    case BinaryOp::Or:
    case BinaryOp::Xor:
        return is_bool(left) && is_bool(right) ? make_bool() : nullptr;

    default:
        break;
    }

    auto l = kind_of(left);
    auto r = kind_of(right);
    if (!l || !r) {
        return nullptr;
    }

    switch (op) {
    case BinaryOp::Add:
    case BinaryOp::Sub:
        if (is_numeric(left) && is_numeric(right)) {
            return numeric_result(left, right);
        }
        return additive(op, *l, *r);

    case BinaryOp::Mul:
        if (is_numeric(left) && is_numeric(right)) {
            return numeric_result(left, right);
        }
        return multiplicative(*l, *r);

    case BinaryOp::Div:
        if (is_numeric(left) && is_numeric(right)) {
            return numeric_result(left, right);
        }
        return division(*l, *r);

    case BinaryOp::Mod:
        return *l == PrimitiveKind::Int && *r == PrimitiveKind::Int ? make_int() : nullptr;

    case BinaryOp::Lt:
    case BinaryOp::Le:
    case BinaryOp::Gt:
    case BinaryOp::Ge:
        if (is_numeric(left) && is_numeric(right)) {
            return make_bool();
        }
        return *l == *r && is_orderable(*l) ? make_bool() : nullptr;

    default:
        return nullptr;
    }
}

auto unary_result_type(parser::UnaryOp op, const TypePtr& operand) -> TypePtr {
    if (is_unknown(operand)) {
        return op == parser::UnaryOp::Not ? make_bool() : make_unknown();
    }

    if (op == parser::UnaryOp::Not) {
        return is_bool(operand) ? make_bool() : nullptr;
    }

    auto k = kind_of(operand);
    if (!k) {
        return nullptr;
    }
    switch (*k) {
    case PrimitiveKind::Int:
    case PrimitiveKind::Float:
    case PrimitiveKind::Money:
    case PrimitiveKind::Percent:
    case PrimitiveKind::Duration:
        return make_primitive(*k);
    default:
        return nullptr;
    }
}

} // namespace yuho::types
