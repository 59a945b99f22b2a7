#include "keyward/crypto/KeyDerivation.hpp"
#include "keyward/crypto/providers/OpenSslProviderFactory.hpp"
#include "keyward/security/SecureRandom.hpp"
#include <array>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <stdexcept>

namespace keyward::crypto::providers
{
namespace
{

constexpr const char* g_kdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kdfParamThreads{ "threads" };
constexpr const char* g_kdfParamArgon2Version{ "version" };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

void requireExactSize(std::size_t actual, std::size_t expected, const char* what)
{
    if (actual != expected)
    {
        throw std::invalid_argument(what);
    }
}

void requireIntSized(std::size_t size, const char* what)
{
    if (size > static_cast<std::size_t>(std::numeric_limits<int>::max()))
    {
        throw std::invalid_argument(what);
    }
}

[[nodiscard]] EvpKdfPtr fetchArgon2idKdf() noexcept
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr), &EVP_KDF_free };
}

[[nodiscard]] EvpCipherCtxPtr newAesGcmContext(bool encrypt, std::span<const std::uint8_t> key,
                                               std::span<const std::uint8_t> nonce)
{
    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("aes-256-gcm: EVP_CIPHER_CTX_new failed");
    }

    const int enc{ encrypt ? 1 : 0 };
    if (EVP_CipherInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1)
    {
        throw std::runtime_error("aes-256-gcm: cipher init failed");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(nonce.size()), nullptr) != 1)
    {
        throw std::runtime_error("aes-256-gcm: set ivlen failed");
    }
    if (EVP_CipherInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data(), enc) != 1)
    {
        throw std::runtime_error("aes-256-gcm: set key/nonce failed");
    }
    return ctx;
}

class OpenSslCryptoProvider final : public keyward::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider() : m_argon2idKdf{ fetchArgon2idKdf() }
    {
    }

    [[nodiscard]] keyward::crypto::CipherSuite cipherSuite() const noexcept override
    {
        return keyward::crypto::CipherSuite::Aes256Gcm;
    }

    [[nodiscard]] keyward::security::SecureBuffer deriveKey(std::span<const std::byte> passphrase,
                                                            std::span<const std::uint8_t> salt,
                                                            const keyward::crypto::Argon2idParams& params) const override
    {
        if (!m_argon2idKdf)
        {
            return keyward::crypto::deriveKeyArgon2id(passphrase, salt, params);
        }
        keyward::crypto::requireKdfInputs(passphrase, salt, params);

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_argon2idKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iterations{ params.iterations };
        std::uint32_t memcostKiB{ params.memoryKiB };
        std::uint32_t lanes{ params.parallelism };
        std::uint32_t threads{ 1U };
        std::uint32_t version{ keyward::crypto::g_argon2VersionV13 };

        // OSSL_PARAM takes non-const pointers; copy the inputs instead of casting constness away.
        keyward::security::SecureBuffer passCopy(passphrase.size());
        std::memcpy(passCopy.data(), passphrase.data(), passphrase.size());
        std::array<std::uint8_t, keyward::crypto::g_kdfSaltBytes> saltCopy{};
        std::memcpy(saltCopy.data(), salt.data(), saltCopy.size());

        OSSL_PARAM ossl[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passCopy.data(), passCopy.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iterations),
            OSSL_PARAM_construct_uint32(g_kdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        keyward::security::SecureBuffer key(keyward::crypto::g_derivedKeyBytes);
        if (EVP_KDF_derive(ctx.get(), key.data(), key.size(), ossl) <= 0)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_derive failed");
        }
        return key;
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
        requireIntSized(plainText.size(), "seal: plainText too large");
        requireIntSized(associatedData.size(), "seal: associatedData too large");

        auto ctx{ newAesGcmContext(true, key, nonce) };

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (!associatedData.empty() &&
            EVP_EncryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("seal: add aad failed");
        }

        std::vector<std::uint8_t> sealed(plainText.size() + keyward::crypto::g_aeadTagBytes);
        int outLen{ 0 };
        const auto* ptPtr{ reinterpret_cast<const unsigned char*>(plainText.data()) };
        if (!plainText.empty() &&
            EVP_EncryptUpdate(ctx.get(), sealed.data(), &outLen, ptPtr, static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error("seal: encrypt update failed");
        }

        int finalLen{ 0 };
        if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + outLen, &finalLen) != 1)
        {
            throw std::runtime_error("seal: encrypt final failed");
        }
        if (static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen) != plainText.size())
        {
            throw std::runtime_error("seal: unexpected output length");
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(keyward::crypto::g_aeadTagBytes),
                                sealed.data() + plainText.size()) != 1)
        {
            throw std::runtime_error("seal: get tag failed");
        }
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
        requireIntSized(sealed.size(), "open: sealed buffer too large");
        requireIntSized(associatedData.size(), "open: associatedData too large");

        const std::size_t cipherBytes{ sealed.size() - keyward::crypto::g_aeadTagBytes };
        auto ctx{ newAesGcmContext(false, key, nonce) };

        int len{ 0 };
        const auto* adPtr{ reinterpret_cast<const unsigned char*>(associatedData.data()) };
        if (!associatedData.empty() &&
            EVP_DecryptUpdate(ctx.get(), nullptr, &len, adPtr, static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error("open: add aad failed");
        }

        // One spare byte keeps data() non-null for an empty body.
        keyward::security::SecureBuffer plainText(cipherBytes + 1U);
        int outLen{ 0 };
        if (cipherBytes != 0U &&
            EVP_DecryptUpdate(ctx.get(), plainText.data(), &outLen, sealed.data(), static_cast<int>(cipherBytes)) != 1)
        {
            keyward::security::secureRelease(plainText);
            return std::nullopt;
        }

        std::array<std::uint8_t, keyward::crypto::g_aeadTagBytes> tag{};
        std::memcpy(tag.data(), sealed.data() + cipherBytes, tag.size());
        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1)
        {
            throw std::runtime_error("open: set tag failed");
        }

        // GCM final verifies the tag with CRYPTO_memcmp.
        int finalLen{ 0 };
        if (EVP_DecryptFinal_ex(ctx.get(), plainText.data() + outLen, &finalLen) != 1)
        {
            keyward::security::secureRelease(plainText);
            return std::nullopt;
        }

        keyward::security::secureResize(plainText, static_cast<std::size_t>(outLen) + static_cast<std::size_t>(finalLen));
        return plainText;
    }

private:
    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
};

} // namespace

std::unique_ptr<keyward::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

bool openSslHasArgon2id() noexcept
{
    return static_cast<bool>(fetchArgon2idKdf());
}

} // namespace keyward::crypto::providers
