#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <string>
#include <string_view>
#include <vector>

#include "lockwarden/security/ScopeWipe.hpp"
#include "lockwarden/security/SecureBuffer.hpp"
#include "lockwarden/security/SecureString.hpp"
#include "lockwarden/security/ZeroAllocator.hpp"

using lockwarden::security::SecureBuffer;
using lockwarden::security::SecureString;
using lockwarden::security::ZeroAllocator;

TEST(SecureString, FromStringViewCopiesBytes)
{
    constexpr std::string_view input{ "correct horse battery staple" };
    const SecureString s{ lockwarden::security::secureStringFrom(input) };

    EXPECT_EQ(lockwarden::security::asStringView(s), input);
    EXPECT_EQ(lockwarden::security::asBytes(s).size(), input.size());
}

TEST(SecureString, EmptyViewIsSafe)
{
    const SecureString s{};
    EXPECT_TRUE(lockwarden::security::asStringView(s).empty());
}

TEST(SecureString, PreservesHighBytes)
{
    constexpr char raw[]{ '\x00', '\x7F', static_cast<char>(0x80), static_cast<char>(0xFF) };
    const SecureString s{ lockwarden::security::secureStringFrom(std::string_view{ raw, sizeof(raw) }) };

    ASSERT_EQ(s.size(), sizeof(raw));
    for (std::size_t i{}; i < s.size(); ++i)
    {
        EXPECT_EQ(s[i], raw[i]);
    }
}

TEST(SecureString, ReleaseEmptiesAndDropsCapacity)
{
    SecureString s{ lockwarden::security::secureStringFrom("hunter2") };
    lockwarden::security::secureRelease(s);

    EXPECT_TRUE(s.empty());
    EXPECT_EQ(s.capacity(), 0U);
}

TEST(SecureString, ScopeWipeZerosInPlace)
{
    SecureString s{ lockwarden::security::secureStringFrom("passphrase") };
    {
        const auto guard{ lockwarden::security::scopeWipe(s) };
    }

    ASSERT_EQ(s.size(), 10U);
    for (const char c : s)
    {
        EXPECT_EQ(c, '\0');
    }
}

TEST(SecureBuffer, WritableBytesAliasStorage)
{
    SecureBuffer buffer(4U, 0x11U);
    auto bytes{ lockwarden::security::asWritableBytes(buffer) };
    bytes[2] = std::byte{ 0x7F };

    EXPECT_EQ(buffer[2], 0x7FU);
    EXPECT_EQ(lockwarden::security::asBytes(buffer).size(), buffer.size());
}

TEST(SecureBuffer, ReleaseEmptiesAndDropsCapacity)
{
    SecureBuffer buffer{};
    buffer.reserve(128U);
    buffer.resize(64U, 0xA5U);

    lockwarden::security::secureRelease(buffer);

    EXPECT_TRUE(buffer.empty());
    EXPECT_EQ(buffer.capacity(), 0U);
}

TEST(ZeroAllocator, GrowsLikeStdAllocator)
{
    std::vector<int, ZeroAllocator<int>> values{};
    for (int i{}; i < 1000; ++i)
    {
        values.push_back(i);
    }

    ASSERT_EQ(values.size(), 1000U);
    EXPECT_EQ(values.front(), 0);
    EXPECT_EQ(values.back(), 999);
}

TEST(ZeroAllocator, AllInstancesCompareEqual)
{
    const ZeroAllocator<int> a{};
    const ZeroAllocator<double> rebound{ a };

    EXPECT_TRUE(a == rebound);
    EXPECT_FALSE(a != ZeroAllocator<int>{});
}

TEST(ZeroAllocator, ZeroCountYieldsNull)
{
    ZeroAllocator<int> alloc{};
    EXPECT_EQ(alloc.allocate(0U), nullptr);
    alloc.deallocate(nullptr, 0U);
}

TEST(ZeroAllocator, OverflowingCountThrows)
{
    ZeroAllocator<std::uint64_t> alloc{};
    EXPECT_THROW({ [[maybe_unused]] auto* p = alloc.allocate(std::numeric_limits<std::size_t>::max()); },
                 std::bad_array_new_length);
}

TEST(ZeroAllocator, HoldsNonTrivialElements)
{
    std::vector<std::string, ZeroAllocator<std::string>> names{};
    names.emplace_back("github.com");
    names.emplace_back("a title long enough to leave the small string buffer");
    EXPECT_EQ(names.size(), 2U);
    EXPECT_EQ(names[0], "github.com");
}
