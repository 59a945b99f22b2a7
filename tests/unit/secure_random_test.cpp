#include "keyward/security/SecureRandom.hpp"
#include <array>
#include <gtest/gtest.h>
#include <set>

TEST(SecureRandom, FillEmptyIsNoOp)
{
    std::array<std::uint8_t, 0> bytes{};
    EXPECT_TRUE(keyward::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, FillNonEmptyReturnsTrue)
{
    constexpr std::size_t kBytesLen{ 32U };
    std::array<std::uint8_t, kBytesLen> bytes{};
    EXPECT_TRUE(keyward::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, TwoFillsDiffer)
{
    std::array<std::uint8_t, 16> a{};
    std::array<std::uint8_t, 16> b{};
    ASSERT_TRUE(keyward::security::secureRandomFill(std::span{ a }));
    ASSERT_TRUE(keyward::security::secureRandomFill(std::span{ b }));
    EXPECT_NE(a, b);
}

TEST(SecureRandom, Uint64ReturnsTrue)
{
    std::uint64_t value{};
    EXPECT_TRUE(keyward::security::secureRandomUint64(value));
}

TEST(SecureRandom, BoundedRejectsZero)
{
    std::uint64_t out{};
    EXPECT_FALSE(keyward::security::secureRandomBounded(0U, out));
}

TEST(SecureRandom, BoundedOneAlwaysReturnsZero)
{
    constexpr std::uint64_t kSentinel{ 123U };
    std::uint64_t out{ kSentinel };
    EXPECT_TRUE(keyward::security::secureRandomBounded(1U, out));
    EXPECT_EQ(out, 0U);
}

TEST(SecureRandom, BoundedValueIsWithinRange)
{
    std::uint64_t out{};
    constexpr std::uint64_t kMaxExcl{ 10U };
    constexpr int kTrials{ 16 };
    for (int i{}; i < kTrials; ++i)
    {
        ASSERT_TRUE(keyward::security::secureRandomBounded(kMaxExcl, out));
        EXPECT_LT(out, kMaxExcl);
    }
}

TEST(SecureRandom, IndexEventuallyCoversSmallRange)
{
    constexpr std::size_t kSize{ 4U };
    std::set<std::size_t> seen{};
    for (int i{}; i < 512 && seen.size() < kSize; ++i)
    {
        std::size_t index{};
        ASSERT_TRUE(keyward::security::secureRandomIndex(kSize, index));
        ASSERT_LT(index, kSize);
        seen.insert(index);
    }
    EXPECT_EQ(seen.size(), kSize);
}
