#ifndef INTERNAL_INCLUDE_KEYWARD_CRYPTO_KEYDERIVATION_HPP
#define INTERNAL_INCLUDE_KEYWARD_CRYPTO_KEYDERIVATION_HPP

#include "keyward/crypto/KdfParams.hpp"
#include "keyward/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace keyward::crypto
{

void requireKdfInputs(std::span<const std::byte> passphrase, std::span<const std::uint8_t> salt,
                      const Argon2idParams& params);

// Monocypher Argon2id, one lane per requested degree of parallelism (computed sequentially).
[[nodiscard]] keyward::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> passphrase,
                                                                std::span<const std::uint8_t> salt,
                                                                const Argon2idParams& params);

} // namespace keyward::crypto

#endif // INTERNAL_INCLUDE_KEYWARD_CRYPTO_KEYDERIVATION_HPP
