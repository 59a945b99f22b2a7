#include "keyward/crypto/KeyDerivation.hpp"

#include "keyward/security/ZeroAllocator.hpp"
#include "monocypher.h"

#include <limits>
#include <new>
#include <stdexcept>
#include <vector>

namespace keyward::crypto
{

void requireKdfInputs(std::span<const std::byte> passphrase, std::span<const std::uint8_t> salt,
                      const Argon2idParams& params)
{
    if (passphrase.empty())
    {
        throw std::invalid_argument("deriveKey: empty passphrase");
    }
    if (passphrase.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKey: passphrase too large");
    }
    if (salt.size() != g_kdfSaltBytes)
    {
        throw std::invalid_argument("deriveKey: invalid salt size");
    }
    if (!isAcceptable(params))
    {
        throw std::invalid_argument("deriveKey: Argon2id parameters out of range");
    }
}

keyward::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> passphrase,
                                                  std::span<const std::uint8_t> salt, const Argon2idParams& params)
{
    requireKdfInputs(passphrase, salt, params);

    constexpr std::size_t kU64WordsPerKiB{ 1024U / sizeof(std::uint64_t) };
    const std::size_t workWords{ static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB };
    std::vector<std::uint64_t, keyward::security::ZeroAllocator<std::uint64_t>> workArea(workWords);

    keyward::security::SecureBuffer key(g_derivedKeyBytes);

    const crypto_argon2_config config{
        .algorithm = CRYPTO_ARGON2_ID,
        .nb_blocks = params.memoryKiB,
        .nb_passes = params.iterations,
        .nb_lanes = params.parallelism,
    };
    const crypto_argon2_inputs inputs{
        .pass = reinterpret_cast<const std::uint8_t*>(passphrase.data()),
        .salt = salt.data(),
        .pass_size = static_cast<std::uint32_t>(passphrase.size()),
        .salt_size = static_cast<std::uint32_t>(salt.size()),
    };

    crypto_argon2(key.data(), static_cast<std::uint32_t>(key.size()), workArea.data(), config, inputs,
                  crypto_argon2_no_extras);
    return key;
}

} // namespace keyward::crypto
