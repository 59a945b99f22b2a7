#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <stdexcept>
#include <utility>

#include "keyward/security/ScopeWipe.hpp"

namespace
{

using keyward::security::SecureBuffer;
using keyward::security::SecureString;

[[nodiscard]] bool allZero(const SecureBuffer& b)
{
    return std::all_of(b.begin(), b.end(), [](std::uint8_t v) { return v == 0U; });
}

[[nodiscard]] bool allZero(const SecureString& s)
{
    return std::all_of(s.begin(), s.end(), [](char c) { return c == '\0'; });
}

// Derives nothing; only models a function that bails out early with a key on the stack.
std::optional<int> useKeyThenFail(SecureBuffer& key, bool fail)
{
    auto guard = keyward::security::scopeWipe(key);
    if (fail)
    {
        return std::nullopt;
    }
    return static_cast<int>(key.size());
}

void useKeyThenThrow(SecureBuffer& key)
{
    auto guard = keyward::security::scopeWipe(key);
    throw std::runtime_error{ "backend failure" };
}

} // namespace

TEST(ScopeWipe, WipesPassphraseWhenScopeEnds)
{
    auto pass{ keyward::security::secureStringFrom("correct horse") };
    const char* data{ pass.data() };

    {
        auto guard = keyward::security::scopeWipe(pass);
        EXPECT_EQ(keyward::security::asStringView(pass), "correct horse");
    }

    ASSERT_EQ(pass.data(), data);
    EXPECT_EQ(pass.size(), 13U);
    EXPECT_TRUE(allZero(pass));
}

TEST(ScopeWipe, WipesOnEveryReturnPath)
{
    SecureBuffer early(32U, 0x7EU);
    EXPECT_FALSE(useKeyThenFail(early, true).has_value());
    EXPECT_TRUE(allZero(early));

    SecureBuffer normal(32U, 0x7EU);
    EXPECT_EQ(useKeyThenFail(normal, false), 32);
    EXPECT_TRUE(allZero(normal));
}

TEST(ScopeWipe, WipesDuringUnwind)
{
    SecureBuffer key(32U, 0x42U);

    EXPECT_THROW(useKeyThenThrow(key), std::runtime_error);
    EXPECT_TRUE(allZero(key));
}

TEST(ScopeWipe, ReleaseKeepsContents)
{
    auto secret{ keyward::security::secureStringFrom("handed to caller") };

    {
        auto guard = keyward::security::scopeWipe(secret);
        guard.release();
    }

    EXPECT_EQ(keyward::security::asStringView(secret), "handed to caller");
}

TEST(ScopeWipe, MovedGuardWipesOnce)
{
    SecureBuffer key(16U, 0xA5U);

    {
        auto outer = keyward::security::scopeWipe(key);
        {
            auto inner = std::move(outer);
        }
        EXPECT_TRUE(allZero(key));
        key.assign(16U, 0xA5U);
    }

    // The moved-from guard no longer owns the range.
    EXPECT_EQ(key.front(), 0xA5U);
}

TEST(ScopeWipe, MoveAssignmentWipesPreviousRange)
{
    SecureBuffer oldKey(16U, 0x11U);
    SecureBuffer newKey(16U, 0x22U);

    {
        auto guard = keyward::security::scopeWipe(oldKey);
        guard = keyward::security::scopeWipe(newKey);

        EXPECT_TRUE(allZero(oldKey));
        EXPECT_EQ(newKey.front(), 0x22U);
    }

    EXPECT_TRUE(allZero(newKey));
}

TEST(ScopeWipe, AcceptsRawByteArrays)
{
    std::array<std::uint8_t, 12> nonce{};
    nonce.fill(0x9CU);

    {
        auto guard = keyward::security::scopeWipe(std::span{ nonce });
    }

    EXPECT_TRUE(std::all_of(nonce.begin(), nonce.end(), [](std::uint8_t v) { return v == 0U; }));
}
