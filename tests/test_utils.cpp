#include <gtest/gtest.h>

#include "common/utils.hpp"

#include <stdexcept>

namespace {

TEST(UtilsTest, ParseU64AcceptsDigitsOnly) {
    EXPECT_EQ(utils::parse_u64("0"), 0u);
    EXPECT_EQ(utils::parse_u64(" 2222 "), 2222u);
    EXPECT_EQ(utils::parse_u64("18446744073709551615"), 18446744073709551615ULL);
    EXPECT_THROW(utils::parse_u64(""), std::invalid_argument);
    EXPECT_THROW(utils::parse_u64("-1"), std::invalid_argument);
    EXPECT_THROW(utils::parse_u64("12abc"), std::invalid_argument);
}

TEST(UtilsTest, ParseU64OverflowIsInvalidArgument) {
    EXPECT_THROW(utils::parse_u64("18446744073709551616"), std::invalid_argument);
    EXPECT_THROW(utils::parse_u64("99999999999999999999999999"), std::invalid_argument);
}

TEST(UtilsTest, ValidatePort) {
    EXPECT_FALSE(utils::validate_port(0));
    EXPECT_TRUE(utils::validate_port(1));
    EXPECT_TRUE(utils::validate_port(65535));
    EXPECT_FALSE(utils::validate_port(65536));
}

} // namespace
