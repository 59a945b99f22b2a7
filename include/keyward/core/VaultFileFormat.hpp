#ifndef INCLUDE_KEYWARD_CORE_VAULTFILEFORMAT_HPP
#define INCLUDE_KEYWARD_CORE_VAULTFILEFORMAT_HPP

#include "keyward/crypto/ICryptoProvider.hpp"
#include "keyward/crypto/KdfParams.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace keyward::core
{

constexpr std::uint8_t g_vaultFormatVersionV1{ 1U };
constexpr std::uint8_t g_vaultBodySchemaIdV1{ 1U };

// magic(4) version(1) suite(1) schema(1) reserved(1) iterations(4) memoryKiB(4) lanes(4) salt(16) nonce(12)
constexpr std::size_t g_vaultHeaderBytes{ 48 };
constexpr std::size_t g_vaultVersionOffset{ 4 };
constexpr std::size_t g_vaultMinFileBytes{ g_vaultHeaderBytes + keyward::crypto::g_aeadTagBytes };

struct VaultFileHeader final
{
    std::uint8_t formatVersion{ g_vaultFormatVersionV1 };
    keyward::crypto::CipherSuite cipherSuite{ keyward::crypto::CipherSuite::Aes256Gcm };
    std::uint8_t bodySchema{ g_vaultBodySchemaIdV1 };
    keyward::crypto::Argon2idParams kdf{};
    std::array<std::uint8_t, keyward::crypto::g_kdfSaltBytes> salt{};
    std::array<std::uint8_t, keyward::crypto::g_aeadNonceBytes> nonce{};
};

using EncodedVaultHeader = std::array<std::byte, g_vaultHeaderBytes>;

// The encoded header is also the AEAD associated data.
[[nodiscard]] EncodedVaultHeader encodeVaultHeader(const VaultFileHeader& header) noexcept;

// Fails closed: std::nullopt for a short buffer, wrong magic, unknown version, schema or suite,
// a nonzero reserved byte, or KDF parameters outside the accepted range.
[[nodiscard]] std::optional<VaultFileHeader> decodeVaultHeader(std::span<const std::byte> bytes) noexcept;

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_VAULTFILEFORMAT_HPP
