// SPDX-License-Identifier: MIT

// tests/pg/numeric_test.cpp
#include <gtest/gtest.h>

#include <cstdint>
#include <limits>

#include "pg_typemap/pg/numeric.hpp"

using namespace pg_typemap::pg;

TEST(NumericTest, ParseInteger) {
    auto n = Numeric::parse("42");
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->unscaled, 42);
    EXPECT_EQ(n->scale, 0);
}

TEST(NumericTest, ParseFraction) {
    auto n = Numeric::parse("-1.50");
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->unscaled, -150);
    EXPECT_EQ(n->scale, 2);
}

TEST(NumericTest, ParseLeadingPoint) {
    auto n = Numeric::parse(".5");
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->unscaled, 5);
    EXPECT_EQ(n->scale, 1);
}

TEST(NumericTest, ParseRejectsMalformed) {
    EXPECT_FALSE(Numeric::parse("").has_value());
    EXPECT_FALSE(Numeric::parse("-").has_value());
    EXPECT_FALSE(Numeric::parse(".").has_value());
    EXPECT_FALSE(Numeric::parse("1.2.3").has_value());
    EXPECT_FALSE(Numeric::parse("12a").has_value());
    EXPECT_FALSE(Numeric::parse("1e5").has_value());
}

TEST(NumericTest, ParseRejectsOverflow) {
    EXPECT_FALSE(Numeric::parse("99999999999999999999").has_value());
}

TEST(NumericTest, ToStringKeepsTrailingZeros) {
    EXPECT_EQ((Numeric{150, 2}).to_string(), "1.50");
    EXPECT_EQ((Numeric{-5, 3}).to_string(), "-0.005");
    EXPECT_EQ((Numeric{7, 0}).to_string(), "7");
    EXPECT_EQ((Numeric{0, 1}).to_string(), "0.0");
}

TEST(NumericTest, ToStringMinValue) {
    Numeric n{std::numeric_limits<int64_t>::min(), 0};
    EXPECT_EQ(n.to_string(), "-9223372036854775808");
}

TEST(NumericTest, Normalized) {
    EXPECT_EQ((Numeric{100, 2}).normalized(), (Numeric{1, 0}));
    EXPECT_EQ((Numeric{120, 2}).normalized(), (Numeric{12, 1}));
    EXPECT_EQ((Numeric{0, 3}).normalized(), (Numeric{0, 0}));
    EXPECT_EQ((Numeric{100, 0}).normalized(), (Numeric{1, -2}));
    EXPECT_EQ((Numeric{-3500, 1}).normalized(), (Numeric{-35, -1}));
}

TEST(NumericTest, ToStringNegativeScale) {
    EXPECT_EQ((Numeric{1, -2}).to_string(), "100");
    EXPECT_EQ((Numeric{-42, -3}).to_string(), "-42000");
    EXPECT_EQ((Numeric{0, -5}).to_string(), "0");
}

TEST(NumericTest, OperatorEqualsIsRepresentational) {
    EXPECT_NE(*Numeric::parse("1.00"), *Numeric::parse("1.0"));
}

TEST(NumericComparerTest, TrailingZerosIgnored) {
    const auto& c = NumericComparer::instance();
    EXPECT_TRUE(c->equals(*Numeric::parse("1.00"), *Numeric::parse("1.0")));
    EXPECT_TRUE(c->equals(*Numeric::parse("0.000"), *Numeric::parse("0")));
    EXPECT_FALSE(c->equals(*Numeric::parse("1.01"), *Numeric::parse("1.1")));
}

TEST(NumericComparerTest, NegativeScaleComparesByValue) {
    const auto& c = NumericComparer::instance();
    EXPECT_TRUE(c->equals(Numeric{1, -2}, *Numeric::parse("100.0")));
    EXPECT_EQ(c->hash(Numeric{1, -2}), c->hash(Numeric{100, 0}));
    EXPECT_FALSE(c->equals(Numeric{1, -2}, Numeric{1, 0}));
}

TEST(NumericComparerTest, HashConsistentWithEquals) {
    const auto& c = NumericComparer::instance();
    EXPECT_EQ(c->hash(*Numeric::parse("2.50")), c->hash(*Numeric::parse("2.5")));
}

TEST(NumericComparerTest, SharedInstance) {
    EXPECT_EQ(NumericComparer::instance().get(), NumericComparer::instance().get());
}
