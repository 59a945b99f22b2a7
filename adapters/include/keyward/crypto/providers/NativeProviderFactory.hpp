#ifndef INCLUDE_KEYWARD_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
#define INCLUDE_KEYWARD_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP

#include "keyward/crypto/ICryptoProvider.hpp"
#include <memory>

namespace keyward::crypto::providers
{

// Monocypher: Argon2id + ChaCha20-Poly1305 (IETF, 96-bit nonce).
[[nodiscard]] std::unique_ptr<keyward::crypto::ICryptoProvider> makeNativeCryptoProvider();

} // namespace keyward::crypto::providers

#endif // INCLUDE_KEYWARD_CRYPTO_PROVIDERS_NATIVEPROVIDERFACTORY_HPP
