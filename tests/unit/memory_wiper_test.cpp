#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>

#include "keyward/crypto/KdfParams.hpp"
#include "keyward/security/MemoryWiper.hpp"
#include "keyward/security/SecureMemory.hpp"

namespace
{

template <typename T>
concept Wipeable = requires(T buffer) { keyward::security::secureWipe(buffer); };

// Read-only views and owning types cannot be wiped in place.
static_assert(!Wipeable<std::span<const std::uint8_t>>);
static_assert(!Wipeable<std::span<std::string>>);
static_assert(!Wipeable<std::span<std::unique_ptr<int>>>);
static_assert(Wipeable<std::span<std::uint8_t>>);
// Fixed-extent spans must be spelled as dynamic ones at the call site.
static_assert(!Wipeable<std::span<std::uint8_t, 8>>);

// Shaped like the key a session keeps between unlock and lock.
struct CachedKey
{
    std::array<std::uint8_t, 32> key{};
    std::array<std::uint8_t, 16> salt{};
    std::uint32_t iterations{};
};

[[nodiscard]] bool allZero(std::span<const std::byte> bytes)
{
    return std::all_of(bytes.begin(), bytes.end(), [](std::byte b) { return b == std::byte{}; });
}

} // namespace

TEST(MemoryWiper, ClearsDerivedKeyBuffer)
{
    keyward::security::SecureBuffer key(32U, 0xC3U);

    keyward::security::secureWipe(std::span{ key });

    EXPECT_EQ(key.size(), 32U);
    EXPECT_TRUE(allZero(std::as_bytes(std::span{ key })));
}

TEST(MemoryWiper, ClearsOnlyTheGivenRange)
{
    auto passphrase{ keyward::security::secureStringFrom("prefix:hunter2") };

    keyward::security::secureWipe(std::span{ passphrase }.subspan(7U));

    EXPECT_EQ(keyward::security::asStringView(passphrase).substr(0U, 7U), "prefix:");
    EXPECT_TRUE(allZero(std::as_bytes(std::span{ passphrase }.subspan(7U))));
}

TEST(MemoryWiper, ClearsWideElements)
{
    std::array<std::uint32_t, 8> words{};
    words.fill(0xDEADBEEFU);

    keyward::security::secureWipe(std::span<std::uint32_t>{ words });

    EXPECT_TRUE(allZero(std::as_bytes(std::span{ words })));
}

TEST(MemoryWiper, ClearsWholeObject)
{
    CachedKey cached{};
    cached.key.fill(0x5AU);
    cached.salt.fill(0x11U);
    cached.iterations = 3U;

    keyward::security::secureWipeObject(cached);

    EXPECT_TRUE(allZero(std::as_bytes(std::span{ cached.key })));
    EXPECT_TRUE(allZero(std::as_bytes(std::span{ cached.salt })));
    EXPECT_EQ(cached.iterations, 0U);
}

TEST(MemoryWiper, ClearsKdfParameters)
{
    keyward::crypto::Argon2idParams params{ .iterations = 3U, .memoryKiB = 65536U, .parallelism = 1U };

    keyward::security::secureWipeObject(params);

    EXPECT_EQ(params.iterations, 0U);
    EXPECT_EQ(params.memoryKiB, 0U);
    EXPECT_EQ(params.parallelism, 0U);
}

TEST(MemoryWiper, EmptyRangeIsAccepted)
{
    keyward::security::SecureString empty{};
    keyward::security::secureWipe(std::span{ empty });
    keyward::security::secureWipe(std::span<std::byte>{});
    EXPECT_TRUE(empty.empty());
}
