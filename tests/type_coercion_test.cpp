#include <gtest/gtest.h>

#include <limits>

#include <meridian/dispatch/type_coercion.hpp>

using namespace meridian;

namespace {
    enum class Status { draft, published };
}

TEST(TypeCoercionTest, IntegerUsesLeadingDigits) {
    const auto p = param::integer("n");
    EXPECT_EQ(std::get<std::int64_t>(coercion::coerce(p, "42")), 42);
    EXPECT_EQ(std::get<std::int64_t>(coercion::coerce(p, "42abc")), 42);
    EXPECT_EQ(std::get<std::int64_t>(coercion::coerce(p, "abc")), 0);
    EXPECT_EQ(std::get<std::int64_t>(coercion::coerce(p, "")), 0);
    EXPECT_EQ(std::get<std::int64_t>(coercion::coerce(p, "-7")), -7);
}

TEST(TypeCoercionTest, OutOfRangeIntegerClampsInsteadOfBecomingZero) {
    const auto p = param::integer("id");
    EXPECT_EQ(std::get<std::int64_t>(coercion::coerce(p, "99999999999999999999")), std::numeric_limits<std::int64_t>::max());
    EXPECT_EQ(std::get<std::int64_t>(coercion::coerce(p, "-99999999999999999999")), std::numeric_limits<std::int64_t>::min());
    EXPECT_EQ(std::get<std::int64_t>(coercion::coerce(p, "0")), 0);
}

TEST(TypeCoercionTest, EmptyStringIsNullForNullableNumbers) {
    EXPECT_TRUE(std::holds_alternative<std::monostate>(coercion::coerce(param::integer("n").or_null(), "")));
    EXPECT_TRUE(std::holds_alternative<std::monostate>(coercion::coerce(param::floating("f").or_null(), "")));
}

TEST(TypeCoercionTest, FloatingUsesLeadingNumber) {
    const auto p = param::floating("f");
    EXPECT_DOUBLE_EQ(std::get<double>(coercion::coerce(p, "2.5")), 2.5);
    EXPECT_DOUBLE_EQ(std::get<double>(coercion::coerce(p, "1.5kg")), 1.5);
    EXPECT_DOUBLE_EQ(std::get<double>(coercion::coerce(p, "")), 0.0);
}

TEST(TypeCoercionTest, BooleanMapping) {
    const auto p = param::boolean("b");
    for (const char* truthy : {"true", "1", "yes", "on", "TRUE", "On"}) {
        EXPECT_TRUE(std::get<bool>(coercion::coerce(p, truthy))) << truthy;
    }
    for (const char* falsy : {"false", "0", "no", "off", ""}) {
        EXPECT_FALSE(std::get<bool>(coercion::coerce(p, falsy))) << falsy;
    }
    EXPECT_TRUE(std::get<bool>(coercion::coerce(p, "maybe")));
}

TEST(TypeCoercionTest, StringAndMixedPassThrough) {
    EXPECT_EQ(std::get<std::string>(coercion::coerce(param::string("s"), "007")), "007");
    EXPECT_EQ(std::get<std::string>(coercion::coerce(param::mixed("m"), "x y")), "x y");
}

TEST(TypeCoercionTest, ArrayWrapsScalarsAndKeepsLists) {
    const auto p = param::array("tags");
    EXPECT_EQ(std::get<std::vector<std::string>>(coercion::coerce(p, "a")), std::vector<std::string>{"a"});

    const std::vector<std::string> many{"a", "b"};
    EXPECT_EQ(std::get<std::vector<std::string>>(coercion::coerce(p, many)), many);
}

TEST(TypeCoercionTest, MultiValueScalarTakesFirst) {
    const std::vector<std::string> values{"3", "4"};
    EXPECT_EQ(std::get<std::int64_t>(coercion::coerce(param::integer("n"), values)), 3);
}

TEST(TypeCoercionTest, EnumerationLooksUpByValueAndFallsBackToRaw) {
    const auto p = param::enumeration<Status>("status", {{"draft", Status::draft}, {"published", Status::published}});

    const auto found = coercion::coerce(p, "published");
    const auto* object = std::get_if<ObjectArg>(&found);
    ASSERT_NE(object, nullptr);
    EXPECT_EQ(std::any_cast<Status>(object->value), Status::published);

    EXPECT_EQ(std::get<std::string>(coercion::coerce(p, "archived")), "archived");
}
