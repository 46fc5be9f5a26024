#include <gtest/gtest.h>

#include "expression.hpp"

using namespace ashface;

namespace {

TEST(Expression, NamesAreFileStems) {
    EXPECT_STREQ(to_string(Expression::Neutral), "neutral");
    EXPECT_STREQ(to_string(Expression::Happy), "happy");
    EXPECT_STREQ(to_string(Expression::Sad), "sad");
    EXPECT_STREQ(to_string(Expression::Listening), "listening");
    EXPECT_STREQ(to_string(Expression::Speaking), "speaking");
    EXPECT_STREQ(to_string(Expression::Thinking), "thinking");
    EXPECT_STREQ(to_string(Expression::Error), "error");
}

TEST(Expression, ParseRoundTripsEveryName) {
    for (Expression e : kAllExpressions) {
        auto parsed = expression_from_name(to_string(e));
        ASSERT_TRUE(parsed.has_value());
        EXPECT_EQ(*parsed, e);
    }
}

TEST(Expression, UnknownNamesRejected) {
    EXPECT_FALSE(expression_from_name("").has_value());
    EXPECT_FALSE(expression_from_name("angry").has_value());
    EXPECT_FALSE(expression_from_name("Happy").has_value());
}

TEST(Expression, SevenInEnumOrder) {
    EXPECT_EQ(kExpressionCount, 7u);
    for (size_t i = 0; i < kAllExpressions.size(); ++i) EXPECT_EQ(index_of(kAllExpressions[i]), i);
}

} // namespace
