#include "keyward/crypto/KeyDerivation.hpp"
#include "keyward/crypto/providers/NativeProviderFactory.hpp"
#include "keyward/security/MemoryWiper.hpp"
#include "keyward/security/SecureRandom.hpp"
#include "monocypher.h"
#include <stdexcept>

namespace keyward::crypto::providers
{
namespace
{

void requireExactSize(std::size_t actual, std::size_t expected, const char* what)
{
    if (actual != expected)
    {
        throw std::invalid_argument(what);
    }
}

[[nodiscard]] const std::uint8_t* asU8(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const std::uint8_t*>(s.data());
}

// Clears the monocypher context (it holds key schedule material) on scope exit.
class AeadContext final
{
public:
    AeadContext(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce) noexcept
    {
        crypto_aead_init_ietf(&m_ctx, key.data(), nonce.data());
    }
    AeadContext(const AeadContext&) = delete;
    AeadContext& operator=(const AeadContext&) = delete;
    AeadContext(AeadContext&&) = delete;
    AeadContext& operator=(AeadContext&&) = delete;
    ~AeadContext() noexcept
    {
        keyward::security::secureWipeObject(m_ctx);
    }

    [[nodiscard]] crypto_aead_ctx* get() noexcept
    {
        return &m_ctx;
    }

private:
    crypto_aead_ctx m_ctx{};
};

class NativeCryptoProvider final : public keyward::crypto::ICryptoProvider
{
public:
    [[nodiscard]] keyward::crypto::CipherSuite cipherSuite() const noexcept override
    {
        return keyward::crypto::CipherSuite::ChaCha20Poly1305;
    }

    [[nodiscard]] keyward::security::SecureBuffer deriveKey(std::span<const std::byte> passphrase,
                                                            std::span<const std::uint8_t> salt,
                                                            const keyward::crypto::Argon2idParams& params) const override
    {
        return keyward::crypto::deriveKeyArgon2id(passphrase, salt, params);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return keyward::security::secureRandomFill(out);
    }

    [[nodiscard]] std::vector<std::uint8_t> seal(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce,
                                                 std::span<const std::byte> plainText,
                                                 std::span<const std::byte> associatedData) override
    {
        requireExactSize(key.size(), keyward::crypto::g_aeadKeyBytes, "seal: key");
        requireExactSize(nonce.size(), keyward::crypto::g_aeadNonceBytes, "seal: nonce");

        std::vector<std::uint8_t> sealed(plainText.size() + keyward::crypto::g_aeadTagBytes);
        AeadContext ctx{ key, nonce };
        crypto_aead_write(ctx.get(), sealed.data(), sealed.data() + plainText.size(), asU8(associatedData),
                          associatedData.size(), asU8(plainText), plainText.size());
        return sealed;
    }

    [[nodiscard]] std::optional<keyward::security::SecureBuffer> open(std::span<const std::uint8_t> key,
                                                                      std::span<const std::uint8_t> nonce,
                                                                      std::span<const std::uint8_t> sealed,
                                                                      std::span<const std::byte> associatedData) override
    {
        requireExactSize(key.size(), keyward::crypto::g_aeadKeyBytes, "open: key");
        requireExactSize(nonce.size(), keyward::crypto::g_aeadNonceBytes, "open: nonce");
        if (sealed.size() < keyward::crypto::g_aeadTagBytes)
        {
            throw std::invalid_argument("open: sealed buffer shorter than tag");
        }

        const std::size_t cipherBytes{ sealed.size() - keyward::crypto::g_aeadTagBytes };
        keyward::security::SecureBuffer plainText(cipherBytes);

        AeadContext ctx{ key, nonce };
        // crypto_aead_read compares the tag in constant time and leaves the output untouched on mismatch.
        const int rc{ crypto_aead_read(ctx.get(), plainText.data(), sealed.data() + cipherBytes, asU8(associatedData),
                                       associatedData.size(), sealed.data(), cipherBytes) };
        if (rc != 0)
        {
            keyward::security::secureRelease(plainText);
            return std::nullopt;
        }
        return plainText;
    }
};

} // namespace

std::unique_ptr<keyward::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace keyward::crypto::providers
