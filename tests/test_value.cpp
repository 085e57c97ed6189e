/**
 * @file test_value.cpp
 * @brief Unit tests for the Value tree (GoogleTest)
 *
 * @copyright (c) 2026. MIT License.
 */

#include <gtest/gtest.h>

#include "jsonsql/Clock.hpp"
#include "jsonsql/Value.hpp"

#include <chrono>
#include <stdexcept>
#include <variant>

using namespace jsonsql;

TEST(Value, DefaultIsNull) {
    Value v;
    EXPECT_TRUE(v.is_null());
    EXPECT_EQ(v.type(), Type::Null);
}

TEST(Value, FactoriesSetType) {
    EXPECT_EQ(Value::object({}).type(), Type::Object);
    EXPECT_EQ(Value::array({}).type(), Type::Array);
    EXPECT_EQ(Value::string("s").type(), Type::String);
    EXPECT_EQ(Value::raw_string("s").type(), Type::String);
    EXPECT_EQ(Value::date({2020, 1, 1}).type(), Type::Date);
    EXPECT_EQ(Value::datetime({}).type(), Type::DateTime);
    EXPECT_EQ(Value::time(TimePoint{}).type(), Type::Time);
    EXPECT_EQ(Value::blob("b").type(), Type::Blob);
    EXPECT_EQ(Value::bit("b").type(), Type::Bit);
    EXPECT_EQ(Value::number("1").type(), Type::Number);
    EXPECT_EQ(Value::boolean(true).type(), Type::Boolean);
    EXPECT_EQ(Value::null().type(), Type::Null);
}

TEST(Value, TypeNames) {
    EXPECT_STREQ(type_name(Type::Object), "object");
    EXPECT_STREQ(type_name(Type::DateTime), "datetime");
    EXPECT_STREQ(type_name(Type::Bit), "bit");
    EXPECT_STREQ(type_name(Type::Null), "null");
}

TEST(Value, IsContainer) {
    EXPECT_TRUE(Value::object({}).is_container());
    EXPECT_TRUE(Value::array({}).is_container());
    EXPECT_FALSE(Value::string("x").is_container());
}

TEST(Value, BooleanIsTwoStateEnum) {
    EXPECT_EQ(Value::boolean(true).as<Boolean>(), Boolean::True);
    EXPECT_EQ(Value::boolean(false).as<Boolean>(), Boolean::False);
    EXPECT_NE(Value::boolean(true), Value::boolean(false));
}

TEST(Value, TypeFidelityInEquality) {
    // Same text, different JSON types
    EXPECT_NE(Value::string("5"), Value::number("5"));
    EXPECT_NE(Value::string("ab"), Value::blob("ab"));
    EXPECT_NE(Value::blob("ab"), Value::bit("ab"));
}

TEST(Value, RawStringEqualsString) {
    EXPECT_EQ(Value::raw_string("x"), Value::string("x"));
    EXPECT_TRUE(Value::raw_string("x").as<String>().raw);
}

TEST(Value, WrongAccessorThrows) {
    EXPECT_THROW(Value::number("1").as<String>(), std::bad_variant_access);
}

TEST(Value, TimeOfDayAnchorsToClockMidnight) {
    using namespace std::chrono;
    FixedClock clock(TimePoint(hours(24 * 100 + 7)));
    Value v = Value::time_of_day(hours(3), clock);
    EXPECT_EQ(v.as<Time>().at, TimePoint(hours(24 * 100 + 3)));
}

TEST(Value, StructuralEqualityOfContainers) {
    Value a = Value::object({{"k", Value::array({Value::number("1")})}});
    Value b = Value::object({{"k", Value::array({Value::number("1")})}});
    Value c = Value::object({{"k", Value::array({Value::number("2")})}});
    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
}
