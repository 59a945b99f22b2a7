#ifndef INCLUDE_KEYWARD_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_KEYWARD_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "keyward/crypto/ICryptoProvider.hpp"
#include <memory>

namespace keyward::crypto::providers
{

// OpenSSL EVP: AES-256-GCM. Argon2id comes from EVP_KDF when the loaded OpenSSL offers it
// and from the monocypher implementation otherwise; both yield the same key.
[[nodiscard]] std::unique_ptr<keyward::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

// True when the linked OpenSSL exposes an ARGON2ID KDF.
[[nodiscard]] bool openSslHasArgon2id() noexcept;

} // namespace keyward::crypto::providers

#endif // INCLUDE_KEYWARD_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
