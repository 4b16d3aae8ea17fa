#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "lockwarden/core/HexCodec.hpp"

using lockwarden::core::fromHex;
using lockwarden::core::fromHexInto;
using lockwarden::core::toHex;

TEST(HexCodec, EncodesLowercase)
{
    const std::vector<std::uint8_t> bytes{ 0x00U, 0x0AU, 0xBCU, 0xFFU };
    EXPECT_EQ(toHex(bytes), "000abcff");
    EXPECT_EQ(toHex(std::span<const std::uint8_t>{}), "");
}

TEST(HexCodec, DecodesEitherCase)
{
    const auto lower{ fromHex("deadbeef") };
    const auto upper{ fromHex("DEADBEEF") };

    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(upper.has_value());
    EXPECT_EQ(*lower, (std::vector<std::uint8_t>{ 0xDEU, 0xADU, 0xBEU, 0xEFU }));
    EXPECT_EQ(*lower, *upper);
}

TEST(HexCodec, RejectsOddLengthAndForeignDigits)
{
    EXPECT_FALSE(fromHex("abc").has_value());
    EXPECT_FALSE(fromHex("0g").has_value());
    EXPECT_FALSE(fromHex("12 4").has_value());
    EXPECT_TRUE(fromHex("").has_value());
}

TEST(HexCodec, DecodeIntoRequiresExactWidth)
{
    std::array<std::uint8_t, 4> out{};
    EXPECT_TRUE(fromHexInto("01020304", out));
    EXPECT_EQ(out, (std::array<std::uint8_t, 4>{ 1U, 2U, 3U, 4U }));

    EXPECT_FALSE(fromHexInto("010203", out));
    EXPECT_FALSE(fromHexInto("0102030405", out));
    EXPECT_FALSE(fromHexInto("0102030x", out));
}
