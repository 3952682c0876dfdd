#include <gtest/gtest.h>
#include "utils/common.hpp"

TEST(parse_bool, true_values) {
    EXPECT_TRUE(parse_bool("1"));
    EXPECT_TRUE(parse_bool("true"));
    EXPECT_TRUE(parse_bool("yes"));
}

TEST(parse_bool, false_values) {
    EXPECT_FALSE(parse_bool("0"));
    EXPECT_FALSE(parse_bool("false"));
    EXPECT_FALSE(parse_bool("no"));
}

TEST(parse_bool, invalid) {
    EXPECT_THROW(parse_bool("maybe"), std::runtime_error);
    EXPECT_THROW(parse_bool(""), std::runtime_error);
}

TEST(parse_int, valid) {
    EXPECT_EQ(42, parse_int("42"));
    EXPECT_EQ(-1, parse_int("-1"));
}

TEST(parse_int, rejects_garbage) {
    EXPECT_THROW(parse_int("12ms"), std::runtime_error);
    EXPECT_THROW(parse_int("abc"), std::runtime_error);
    EXPECT_THROW(parse_int(""), std::runtime_error);
    EXPECT_THROW(parse_int("99999999999999999999999"), std::runtime_error);
}
