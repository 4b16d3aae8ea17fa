#include <gtest/gtest.h>

#include <cstddef>
#include <set>
#include <string>
#include <string_view>

#include "lockwarden/security/PasswordGenerator.hpp"

namespace
{

using namespace lockwarden::security;

[[nodiscard]] std::string generated(const PasswordOptions& options = {})
{
    const auto password{ generatePassword(options) };
    if (!password.has_value())
    {
        ADD_FAILURE() << "CSPRNG unavailable";
        return {};
    }
    return std::string{ asStringView(*password) };
}

[[nodiscard]] bool containsAny(std::string_view password, std::string_view characters)
{
    return password.find_first_of(characters) != std::string_view::npos;
}

[[nodiscard]] bool onlyFrom(std::string_view password, std::string_view characters)
{
    return password.find_first_not_of(characters) == std::string_view::npos;
}

[[nodiscard]] bool isStrong(std::string_view password)
{
    return password.size() >= 12U && containsAny(password, g_kLowerCharacters) &&
           containsAny(password, g_kUpperCharacters) && containsAny(password, g_kDigitCharacters) &&
           containsAny(password, g_kSymbolCharacters);
}

TEST(PasswordGenerator, DefaultsAreSixteenCharactersOfEveryClass)
{
    for (int i = 0; i < 100; ++i)
    {
        const auto password{ generated() };
        EXPECT_EQ(password.size(), g_kDefaultPasswordLength);
        EXPECT_TRUE(isStrong(password)) << password;
    }
}

TEST(PasswordGenerator, EveryEnabledClassIsRepresented)
{
    const PasswordOptions options{ .length = 4 };
    for (int i = 0; i < 200; ++i)
    {
        const auto password{ generated(options) };
        ASSERT_EQ(password.size(), 4U);
        EXPECT_TRUE(containsAny(password, g_kLowerCharacters)) << password;
        EXPECT_TRUE(containsAny(password, g_kUpperCharacters)) << password;
        EXPECT_TRUE(containsAny(password, g_kDigitCharacters)) << password;
        EXPECT_TRUE(containsAny(password, g_kSymbolCharacters)) << password;
    }
}

TEST(PasswordGenerator, RespectsDisabledClasses)
{
    const auto upperOnly{ generated({ .length = 20, .lower = false, .digits = false, .symbols = false }) };
    EXPECT_EQ(upperOnly.size(), 20U);
    EXPECT_TRUE(onlyFrom(upperOnly, g_kUpperCharacters)) << upperOnly;

    const auto digitsOnly{ generated({ .length = 12, .lower = false, .upper = false, .symbols = false }) };
    EXPECT_TRUE(onlyFrom(digitsOnly, g_kDigitCharacters)) << digitsOnly;

    const auto symbolsOnly{ generated({ .length = 12, .lower = false, .upper = false, .digits = false }) };
    EXPECT_TRUE(onlyFrom(symbolsOnly, g_kSymbolCharacters)) << symbolsOnly;

    const auto letters{ generated({ .length = 16, .digits = false, .symbols = false }) };
    EXPECT_TRUE(onlyFrom(letters, std::string{ g_kLowerCharacters } + std::string{ g_kUpperCharacters }));
    EXPECT_TRUE(containsAny(letters, g_kLowerCharacters));
    EXPECT_TRUE(containsAny(letters, g_kUpperCharacters));
}

TEST(PasswordGenerator, NoClassesYieldsEmpty)
{
    const auto password{ generatePassword({ .lower = false, .upper = false, .digits = false, .symbols = false }) };
    ASSERT_TRUE(password.has_value());
    EXPECT_TRUE(password->empty());
}

TEST(PasswordGenerator, LengthIsClamped)
{
    EXPECT_EQ(generated({ .length = 0 }).size(), 1U);
    EXPECT_EQ(generated({ .length = g_kMaxPasswordLength + 1U }).size(), g_kMaxPasswordLength);
}

TEST(PasswordGenerator, ShortPasswordsDrawFromEnabledClasses)
{
    for (int i = 0; i < 50; ++i)
    {
        const auto password{ generated({ .length = 2, .upper = false, .symbols = false }) };
        ASSERT_EQ(password.size(), 2U);
        EXPECT_TRUE(onlyFrom(password, std::string{ g_kLowerCharacters } + std::string{ g_kDigitCharacters }));
    }
}

TEST(PasswordGenerator, OutputsDiffer)
{
    std::set<std::string> seen;
    for (int i = 0; i < 20; ++i)
    {
        seen.insert(generated());
    }
    EXPECT_EQ(seen.size(), 20U);
}

} // namespace
