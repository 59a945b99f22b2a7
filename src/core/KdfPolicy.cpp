#include "keyward/core/KdfPolicy.hpp"

namespace keyward::core
{

keyward::crypto::Argon2idParams defaultArgon2idParams() noexcept
{
    constexpr std::uint32_t kDefaultIterations{ 3U };
    constexpr std::uint32_t kDefaultMemoryMiB{ 64U };
    constexpr std::uint32_t kKiBPerMiB{ 1024U };
    constexpr std::uint32_t kDefaultParallelism{ 1U };

    return keyward::crypto::Argon2idParams{
        .iterations = kDefaultIterations,
        .memoryKiB = kDefaultMemoryMiB * kKiBPerMiB,
        .parallelism = kDefaultParallelism,
    };
}

keyward::crypto::Argon2idParams minimalArgon2idParams() noexcept
{
    return keyward::crypto::Argon2idParams{ .iterations = 1U, .memoryKiB = 8U, .parallelism = 1U };
}

} // namespace keyward::core
