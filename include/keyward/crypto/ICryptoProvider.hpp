#ifndef INCLUDE_KEYWARD_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_KEYWARD_CRYPTO_ICRYPTOPROVIDER_HPP

#include "keyward/crypto/KdfParams.hpp"
#include "keyward/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace keyward::crypto
{

constexpr std::size_t g_aeadKeyBytes{ 32 };
constexpr std::size_t g_aeadNonceBytes{ 12 };
constexpr std::size_t g_aeadTagBytes{ 16 };

enum class CipherSuite : std::uint8_t
{
    Aes256Gcm = 1U,
    ChaCha20Poly1305 = 2U,
};

[[nodiscard]] constexpr bool isKnownCipherSuite(std::uint8_t raw) noexcept
{
    return raw == static_cast<std::uint8_t>(CipherSuite::Aes256Gcm) ||
           raw == static_cast<std::uint8_t>(CipherSuite::ChaCha20Poly1305);
}

[[nodiscard]] constexpr std::string_view cipherSuiteName(CipherSuite suite) noexcept
{
    switch (suite)
    {
    case CipherSuite::Aes256Gcm:
        return "AES-256-GCM";
    case CipherSuite::ChaCha20Poly1305:
        return "ChaCha20-Poly1305";
    }
    return "unknown";
}

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    [[nodiscard]] virtual CipherSuite cipherSuite() const noexcept = 0;

    // Argon2id v1.3. Throws std::invalid_argument for an empty passphrase, a wrong salt size or
    // parameters outside isAcceptable(); std::runtime_error on backend failure.
    [[nodiscard]] virtual keyward::security::SecureBuffer deriveKey(std::span<const std::byte> passphrase,
                                                                    std::span<const std::uint8_t> salt,
                                                                    const Argon2idParams& params) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // Returns ciphertext followed by the 16-byte tag. The caller owns nonce uniqueness.
    [[nodiscard]] virtual std::vector<std::uint8_t> seal(std::span<const std::uint8_t> key,
                                                         std::span<const std::uint8_t> nonce,
                                                         std::span<const std::byte> plainText,
                                                         std::span<const std::byte> associatedData) = 0;

    // Returns std::nullopt when the tag does not verify. Malformed arguments throw std::invalid_argument.
    [[nodiscard]] virtual std::optional<keyward::security::SecureBuffer>
    open(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce, std::span<const std::uint8_t> sealed,
         std::span<const std::byte> associatedData) = 0;
};

} // namespace keyward::crypto

#endif // INCLUDE_KEYWARD_CRYPTO_ICRYPTOPROVIDER_HPP
