#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>
#include <stdexcept>
#include <string_view>

#include "keyward/crypto/KeyDerivation.hpp"
#include "keyward/security/SecureMemory.hpp"

namespace
{

constexpr std::size_t g_invalidSaltBytes{ keyward::crypto::g_kdfSaltBytes - 1U };

constexpr keyward::crypto::Argon2idParams g_kFastTestParams{ .iterations = 1U, .memoryKiB = 8U, .parallelism = 1U };
constexpr keyward::crypto::Argon2idParams g_kDefaultTestParams{ .iterations = 3U,
                                                               .memoryKiB = 64U * 1024U,
                                                               .parallelism = 1U };

constexpr std::string_view g_kPassphrase{ "correct horse battery staple" };

using Salt = std::array<std::uint8_t, keyward::crypto::g_kdfSaltBytes>;

std::span<const std::byte> asBytes(std::string_view s)
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

bool sameKey(const keyward::security::SecureBuffer& a, const keyward::security::SecureBuffer& b)
{
    return keyward::security::secureEquals(a, b);
}

} // namespace

TEST(KeyDerivation, RejectsEmptyPassphrase)
{
    const Salt salt{};
    EXPECT_THROW((void)keyward::crypto::deriveKeyArgon2id(std::span<const std::byte>{}, salt, g_kFastTestParams),
                 std::invalid_argument);
}

TEST(KeyDerivation, RejectsWrongSaltSize)
{
    const std::array<std::uint8_t, g_invalidSaltBytes> salt{};
    EXPECT_THROW((void)keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), salt, g_kFastTestParams),
                 std::invalid_argument);
}

TEST(KeyDerivation, RejectsParametersOutsideBounds)
{
    const Salt salt{};
    const auto derive = [&](keyward::crypto::Argon2idParams p)
    { return keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), salt, p); };

    EXPECT_THROW((void)derive({ .iterations = 0U, .memoryKiB = 8U, .parallelism = 1U }), std::invalid_argument);
    EXPECT_THROW((void)derive({ .iterations = 11U, .memoryKiB = 8U, .parallelism = 1U }), std::invalid_argument);
    EXPECT_THROW((void)derive({ .iterations = 1U, .memoryKiB = 7U, .parallelism = 1U }), std::invalid_argument);
    EXPECT_THROW((void)derive({ .iterations = 1U, .memoryKiB = 1024U * 1024U + 4U, .parallelism = 1U }),
                 std::invalid_argument);
    EXPECT_THROW((void)derive({ .iterations = 1U, .memoryKiB = 8U, .parallelism = 0U }), std::invalid_argument);
}

TEST(KeyDerivation, RejectsMemoryTooSmallOrUnevenForParallelism)
{
    const Salt salt{};
    EXPECT_THROW((void)keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), salt,
                                                          { .iterations = 1U, .memoryKiB = 8U, .parallelism = 2U }),
                 std::invalid_argument);
    EXPECT_THROW((void)keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), salt,
                                                          { .iterations = 1U, .memoryKiB = 20U, .parallelism = 2U }),
                 std::invalid_argument);
}

TEST(KeyDerivation, Produces32ByteKeyAndIsDeterministic)
{
    Salt salt{};
    salt[0] = 0x01U;
    salt[1] = 0x02U;
    salt[2] = 0x03U;

    const auto a = keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), salt, g_kFastTestParams);
    const auto b = keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), salt, g_kFastTestParams);

    ASSERT_EQ(a.size(), keyward::crypto::g_derivedKeyBytes);
    ASSERT_EQ(b.size(), keyward::crypto::g_derivedKeyBytes);
    EXPECT_TRUE(sameKey(a, b));
}

TEST(KeyDerivation, EveryInputChangesTheKey)
{
    Salt saltA{};
    Salt saltB{};
    saltA[0] = 0x01U;
    saltB[0] = 0x02U;

    const auto base = keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), saltA, g_kFastTestParams);

    EXPECT_FALSE(sameKey(base, keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), saltB, g_kFastTestParams)));
    EXPECT_FALSE(sameKey(base, keyward::crypto::deriveKeyArgon2id(asBytes("correct horse battery stapler"), saltA,
                                                                  g_kFastTestParams)));
    EXPECT_FALSE(sameKey(base, keyward::crypto::deriveKeyArgon2id(
                                   asBytes(g_kPassphrase), saltA, { .iterations = 2U, .memoryKiB = 8U, .parallelism = 1U })));
    EXPECT_FALSE(sameKey(
        base, keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), saltA,
                                                 { .iterations = 1U, .memoryKiB = 16U, .parallelism = 1U })));
}

TEST(KeyDerivation, DifferentParallelismProducesDifferentKey)
{
    Salt salt{};
    salt[0] = 0x01U;

    constexpr keyward::crypto::Argon2idParams kP1{ .iterations = 1U, .memoryKiB = 16U, .parallelism = 1U };
    constexpr keyward::crypto::Argon2idParams kP2{ .iterations = 1U, .memoryKiB = 16U, .parallelism = 2U };

    const auto a = keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), salt, kP1);
    const auto b = keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), salt, kP2);
    EXPECT_FALSE(sameKey(a, b));
}

TEST(KeyDerivation, DefaultParamsDerives32ByteKey)
{
    if (std::getenv("KEYW_RUN_SLOW_TESTS") == nullptr)
    {
        GTEST_SKIP() << "Set KEYW_RUN_SLOW_TESTS=1 to run slow KDF tests.";
    }

    Salt salt{};
    salt[0] = 0x10U;
    salt[1] = 0x20U;
    salt[2] = 0x30U;

    const auto key = keyward::crypto::deriveKeyArgon2id(asBytes(g_kPassphrase), salt, g_kDefaultTestParams);
    ASSERT_EQ(key.size(), keyward::crypto::g_derivedKeyBytes);
}
