#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "lockwarden/security/SecureEquals.hpp"
#include "lockwarden/security/SecureRandom.hpp"

namespace
{

using namespace lockwarden::security;

TEST(SecureEquals, DifferentLengthsAreUnequal)
{
    const std::vector<std::uint8_t> a(10U, 1U);
    const std::vector<std::uint8_t> b(5U, 1U);
    EXPECT_FALSE(secureEquals(std::span{ a }, std::span{ b }));
}

TEST(SecureEquals, ComparesContent)
{
    const std::vector<std::byte> a(16U, std::byte{ 1 });
    std::vector<std::byte> b(16U, std::byte{ 1 });
    EXPECT_TRUE(secureEquals(std::span{ a }, std::span{ b }));

    b.back() = std::byte{ 2 };
    EXPECT_FALSE(secureEquals(std::span{ a }, std::span{ b }));
}

TEST(SecureEquals, EmptyInputsAreEqual)
{
    EXPECT_TRUE(secureEquals(std::span<const std::byte>{}, std::span<const std::byte>{}));
}

TEST(SecureEquals, ComparesTypedCodes)
{
    EXPECT_TRUE(secureEquals(std::string_view{ "287082" }, std::string_view{ "287082" }));
    EXPECT_FALSE(secureEquals(std::string_view{ "287082" }, std::string_view{ "287083" }));
    EXPECT_FALSE(secureEquals(std::string_view{ "287082" }, std::string_view{ "28708" }));
}

TEST(SecureEquals, DetectsDifferenceInEveryBit)
{
    const std::array<std::uint8_t, 4U> a{};
    for (unsigned bit{}; bit < 8U; ++bit)
    {
        std::array<std::uint8_t, 4U> b{};
        b[3] = static_cast<std::uint8_t>(1U << bit);
        EXPECT_FALSE(secureEquals(std::span{ a }, std::span{ b })) << "bit " << bit;
    }
}

TEST(SecureRandom, FillsEmptyAndNonEmptySpans)
{
    EXPECT_TRUE(secureRandomFill(std::span<std::uint8_t>{}));

    std::array<std::uint8_t, 64U> bytes{};
    ASSERT_TRUE(secureRandomFill(std::span{ bytes }));

    // 64 zero bytes from a working CSPRNG is not a realistic outcome.
    bool anyNonZero{ false };
    for (const auto b : bytes)
    {
        anyNonZero = anyNonZero || (b != 0U);
    }
    EXPECT_TRUE(anyNonZero);
}

TEST(SecureRandom, BoundedRejectsZero)
{
    std::uint64_t out{};
    EXPECT_FALSE(secureRandomBounded(0U, out));
}

TEST(SecureRandom, BoundedOneIsAlwaysZero)
{
    std::uint64_t out{ 55U };
    EXPECT_TRUE(secureRandomBounded(1U, out));
    EXPECT_EQ(out, 0U);
}

TEST(SecureRandom, BoundedStaysInRange)
{
    constexpr std::uint64_t kMaxExcl{ 10U };
    for (int i{}; i < 32; ++i)
    {
        std::uint64_t out{};
        ASSERT_TRUE(secureRandomBounded(kMaxExcl, out));
        EXPECT_LT(out, kMaxExcl);
    }
}

TEST(SecureRandom, StringDrawsOnlyFromAlphabet)
{
    constexpr std::string_view kAlphabet{ "AB7" };
    std::string out(256U, '\0');
    ASSERT_TRUE(secureRandomString(kAlphabet, std::span<char>{ out }));

    EXPECT_EQ(out.find_first_not_of(kAlphabet), std::string::npos);
    // 256 draws from three symbols all landing on one is not a realistic outcome.
    EXPECT_NE(out.find('A'), std::string::npos);
    EXPECT_NE(out.find('B'), std::string::npos);
    EXPECT_NE(out.find('7'), std::string::npos);
}

TEST(SecureRandom, StringRejectsEmptyAlphabet)
{
    std::array<char, 4U> out{};
    EXPECT_FALSE(secureRandomString(std::string_view{}, std::span{ out }));
}

} // namespace
