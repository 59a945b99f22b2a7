#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <span>

#include "keyward/core/VaultFileFormat.hpp"

namespace
{

using keyward::core::EncodedVaultHeader;
using keyward::core::VaultFileHeader;

constexpr std::size_t g_suiteOffset{ 5 };
constexpr std::size_t g_schemaOffset{ 6 };
constexpr std::size_t g_reservedOffset{ 7 };
constexpr std::size_t g_iterationsOffset{ 8 };
constexpr std::size_t g_saltOffset{ 20 };
constexpr std::size_t g_nonceOffset{ 36 };

VaultFileHeader sampleHeader()
{
    VaultFileHeader h{};
    h.cipherSuite = keyward::crypto::CipherSuite::ChaCha20Poly1305;
    h.kdf = { .iterations = 3U, .memoryKiB = 65536U, .parallelism = 1U };
    for (std::size_t i{}; i < h.salt.size(); ++i)
    {
        h.salt[i] = static_cast<std::uint8_t>(i + 1U);
    }
    for (std::size_t i{}; i < h.nonce.size(); ++i)
    {
        h.nonce[i] = static_cast<std::uint8_t>(0xF0U + i);
    }
    return h;
}

} // namespace

TEST(VaultFileFormat, HeaderLayoutIsFixed)
{
    const EncodedVaultHeader bytes{ keyward::core::encodeVaultHeader(sampleHeader()) };

    EXPECT_EQ(bytes[0], std::byte{ 'K' });
    EXPECT_EQ(bytes[3], std::byte{ 'F' });
    EXPECT_EQ(bytes[keyward::core::g_vaultVersionOffset], std::byte{ 1 });
    EXPECT_EQ(bytes[g_suiteOffset], std::byte{ 2 });
    EXPECT_EQ(bytes[g_schemaOffset], std::byte{ 1 });
    EXPECT_EQ(bytes[g_reservedOffset], std::byte{ 0 });
    EXPECT_EQ(bytes[g_iterationsOffset], std::byte{ 3 });
    EXPECT_EQ(bytes[g_saltOffset], std::byte{ 1 });
    EXPECT_EQ(bytes[g_nonceOffset], std::byte{ 0xF0 });
    EXPECT_EQ(bytes[keyward::core::g_vaultHeaderBytes - 1U], std::byte{ 0xFB });
}

TEST(VaultFileFormat, DecodeReturnsEncodedFields)
{
    const VaultFileHeader in{ sampleHeader() };
    const auto decoded{ keyward::core::decodeVaultHeader(keyward::core::encodeVaultHeader(in)) };

    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->formatVersion, keyward::core::g_vaultFormatVersionV1);
    EXPECT_EQ(decoded->cipherSuite, keyward::crypto::CipherSuite::ChaCha20Poly1305);
    EXPECT_EQ(decoded->kdf, in.kdf);
    EXPECT_EQ(decoded->salt, in.salt);
    EXPECT_EQ(decoded->nonce, in.nonce);
}

TEST(VaultFileFormat, RejectsShortBuffer)
{
    const EncodedVaultHeader bytes{ keyward::core::encodeVaultHeader(sampleHeader()) };
    EXPECT_FALSE(keyward::core::decodeVaultHeader(std::span{ bytes }.first(keyward::core::g_vaultHeaderBytes - 1U))
                     .has_value());
}

TEST(VaultFileFormat, RejectsEachMalformedField)
{
    const EncodedVaultHeader good{ keyward::core::encodeVaultHeader(sampleHeader()) };

    const auto rejectedWith = [&good](std::size_t offset, std::byte value)
    {
        EncodedVaultHeader bad{ good };
        bad[offset] = value;
        return !keyward::core::decodeVaultHeader(bad).has_value();
    };

    EXPECT_TRUE(rejectedWith(0U, std::byte{ 'X' }));
    EXPECT_TRUE(rejectedWith(keyward::core::g_vaultVersionOffset, std::byte{ 2 }));
    EXPECT_TRUE(rejectedWith(keyward::core::g_vaultVersionOffset, std::byte{ 0 }));
    EXPECT_TRUE(rejectedWith(g_suiteOffset, std::byte{ 0 }));
    EXPECT_TRUE(rejectedWith(g_suiteOffset, std::byte{ 3 }));
    EXPECT_TRUE(rejectedWith(g_schemaOffset, std::byte{ 9 }));
    EXPECT_TRUE(rejectedWith(g_reservedOffset, std::byte{ 1 }));
    EXPECT_TRUE(rejectedWith(g_iterationsOffset, std::byte{ 0 }));
    EXPECT_TRUE(rejectedWith(g_iterationsOffset, std::byte{ 0xFF }));
}

TEST(VaultFileFormat, SaltAndNonceAreOpaque)
{
    const EncodedVaultHeader good{ keyward::core::encodeVaultHeader(sampleHeader()) };
    EncodedVaultHeader other{ good };
    other[g_saltOffset] = std::byte{ 0xAA };
    other[g_nonceOffset] = std::byte{ 0x00 };
    EXPECT_TRUE(keyward::core::decodeVaultHeader(other).has_value());
}
