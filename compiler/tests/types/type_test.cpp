#include "types/type.hpp"

#include <gtest/gtest.h>

using namespace yuho;
using namespace yuho::types;
using parser::BinaryOp;
using parser::UnaryOp;

class TypeTest : public ::testing::Test {
protected:
    static auto binary(BinaryOp op, TypePtr left, TypePtr right) -> std::string {
        auto result = binary_result_type(op, left, right);
        return result ? type_to_string(result) : "rejected";
    }
};

// ============================================================================
// Construction and Display
// ============================================================================

TEST_F(TypeTest, PrimitiveNames) {
    EXPECT_EQ(type_to_string(make_int()), "int");
    EXPECT_EQ(type_to_string(make_money()), "money");
    EXPECT_EQ(type_to_string(make_duration()), "duration");
    EXPECT_EQ(type_to_string(make_unknown()), "{unknown}");
}

TEST_F(TypeTest, FunctionDisplay) {
    EXPECT_EQ(type_to_string(make_func({make_int(), make_money()}, make_bool())),
              "fn(int, money): bool");
    EXPECT_EQ(type_to_string(make_func({}, make_pass())), "fn()");
}

TEST_F(TypeTest, FromSyntax) {
    EXPECT_TRUE(is_primitive(from_syntax(parser::PrimitiveKind::Percent), PrimitiveKind::Percent));
    EXPECT_TRUE(is_primitive(from_syntax(parser::PrimitiveKind::Date), PrimitiveKind::Date));
}

// ============================================================================
// Unions
// ============================================================================

TEST_F(TypeTest, UnionIsSortedAndUnique) {
    auto u = make_union({make_string(), make_int(), make_string()});
    ASSERT_TRUE(u->is<UnionType>());
    EXPECT_EQ(u->as<UnionType>().members.size(), 2u);
    EXPECT_EQ(type_to_string(u), "int || string");
}

TEST_F(TypeTest, UnionFlattensNested) {
    auto inner = make_union({make_bool(), make_money()});
    auto outer = make_union({make_int(), inner});
    EXPECT_EQ(type_to_string(outer), "bool || int || money");
}

TEST_F(TypeTest, UnionOrderDoesNotMatter) {
    auto a = make_union({make_date(), make_int()});
    auto b = make_union({make_int(), make_date()});
    EXPECT_TRUE(types_equal(a, b));
}

TEST_F(TypeTest, SingleMemberCollapses) {
    auto u = make_union({make_int(), make_int()});
    EXPECT_TRUE(is_primitive(u, PrimitiveKind::Int));
}

TEST_F(TypeTest, UnknownMemberPoisonsUnion) {
    EXPECT_TRUE(is_unknown(make_union({make_int(), make_unknown()})));
}

// ============================================================================
// Named Types
// ============================================================================

TEST_F(TypeTest, NamedTypesCompareByModule) {
    auto a = make_named("Person", "common");
    auto b = make_named("Person", "common");
    auto c = make_named("Person", "penal.code");
    EXPECT_TRUE(types_equal(a, b));
    EXPECT_FALSE(types_equal(a, c));
    EXPECT_EQ(type_to_string(c), "Person");
}

// ============================================================================
// Assignability
// ============================================================================

TEST_F(TypeTest, IdentityAndWidening) {
    EXPECT_TRUE(is_assignable(make_money(), make_money()));
    EXPECT_TRUE(is_assignable(make_float(), make_int()));
    EXPECT_FALSE(is_assignable(make_int(), make_float()));
    EXPECT_FALSE(is_assignable(make_money(), make_int()));
}

TEST_F(TypeTest, MemberIntoUnion) {
    auto u = make_union({make_int(), make_string()});
    EXPECT_TRUE(is_assignable(u, make_string()));
    EXPECT_FALSE(is_assignable(u, make_bool()));
}

TEST_F(TypeTest, UnionIntoMember) {
    auto u = make_union({make_int(), make_string()});
    EXPECT_FALSE(is_assignable(make_int(), u));
    EXPECT_TRUE(is_assignable(make_union({make_int(), make_string(), make_bool()}), u));
}

TEST_F(TypeTest, UnknownIsCompatible) {
    EXPECT_TRUE(is_assignable(make_int(), make_unknown()));
    EXPECT_TRUE(is_assignable(make_unknown(), make_named("X", "m")));
}

// ============================================================================
// Operators
// ============================================================================

TEST_F(TypeTest, NumericArithmetic) {
    EXPECT_EQ(binary(BinaryOp::Add, make_int(), make_int()), "int");
    EXPECT_EQ(binary(BinaryOp::Mul, make_int(), make_float()), "float");
    EXPECT_EQ(binary(BinaryOp::Mod, make_int(), make_int()), "int");
    EXPECT_EQ(binary(BinaryOp::Mod, make_float(), make_int()), "rejected");
}

TEST_F(TypeTest, MoneyArithmetic) {
    EXPECT_EQ(binary(BinaryOp::Add, make_money(), make_money()), "money");
    EXPECT_EQ(binary(BinaryOp::Add, make_money(), make_int()), "rejected");
    EXPECT_EQ(binary(BinaryOp::Mul, make_int(), make_money()), "money");
    EXPECT_EQ(binary(BinaryOp::Mul, make_money(), make_percent()), "money");
    EXPECT_EQ(binary(BinaryOp::Mul, make_money(), make_money()), "rejected");
    EXPECT_EQ(binary(BinaryOp::Div, make_money(), make_int()), "money");
    EXPECT_EQ(binary(BinaryOp::Div, make_money(), make_money()), "float");
}

TEST_F(TypeTest, DateArithmetic) {
    EXPECT_EQ(binary(BinaryOp::Add, make_date(), make_duration()), "date");
    EXPECT_EQ(binary(BinaryOp::Sub, make_date(), make_date()), "duration");
    EXPECT_EQ(binary(BinaryOp::Add, make_date(), make_date()), "rejected");
    EXPECT_EQ(binary(BinaryOp::Mul, make_duration(), make_int()), "duration");
}

TEST_F(TypeTest, StringConcatenation) {
    EXPECT_EQ(binary(BinaryOp::Add, make_string(), make_string()), "string");
    EXPECT_EQ(binary(BinaryOp::Sub, make_string(), make_string()), "rejected");
}

TEST_F(TypeTest, LogicalOperators) {
    EXPECT_EQ(binary(BinaryOp::And, make_bool(), make_bool()), "bool");
    EXPECT_EQ(binary(BinaryOp::Xor, make_bool(), make_bool()), "bool");
    EXPECT_EQ(binary(BinaryOp::Or, make_bool(), make_int()), "rejected");
}

TEST_F(TypeTest, Comparisons) {
    EXPECT_EQ(binary(BinaryOp::Lt, make_int(), make_float()), "bool");
    EXPECT_EQ(binary(BinaryOp::Ge, make_date(), make_date()), "bool");
    EXPECT_EQ(binary(BinaryOp::Lt, make_bool(), make_bool()), "rejected");
    EXPECT_EQ(binary(BinaryOp::Lt, make_money(), make_int()), "rejected");
    EXPECT_EQ(binary(BinaryOp::Eq, make_union({make_int(), make_string()}), make_string()),
              "bool");
    EXPECT_EQ(binary(BinaryOp::Eq, make_money(), make_string()), "rejected");
}

TEST_F(TypeTest, UnknownOperandDoesNotCascade) {
    EXPECT_EQ(binary(BinaryOp::Add, make_unknown(), make_money()), "{unknown}");
    EXPECT_EQ(binary(BinaryOp::Lt, make_unknown(), make_money()), "bool");
}

TEST_F(TypeTest, UnaryOperators) {
    EXPECT_TRUE(is_bool(unary_result_type(UnaryOp::Not, make_bool())));
    EXPECT_EQ(unary_result_type(UnaryOp::Not, make_int()), nullptr);
    EXPECT_TRUE(is_primitive(unary_result_type(UnaryOp::Neg, make_money()), PrimitiveKind::Money));
    EXPECT_EQ(unary_result_type(UnaryOp::Neg, make_date()), nullptr);
}
