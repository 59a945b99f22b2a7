#ifndef INCLUDE_KEYWARD_CRYPTO_KDFPARAMS_HPP
#define INCLUDE_KEYWARD_CRYPTO_KDFPARAMS_HPP

#include <cstddef>
#include <cstdint>

namespace keyward::crypto
{

constexpr std::size_t g_kdfSaltBytes{ 16 };
constexpr std::size_t g_derivedKeyBytes{ 32 };

// Argon2 v1.3 (0x13); monocypher implements only this revision.
constexpr std::uint32_t g_argon2VersionV13{ 0x13 };

constexpr std::uint32_t g_argon2MaxIterations{ 10U };
constexpr std::uint32_t g_argon2MaxParallelism{ 16U };
constexpr std::uint32_t g_argon2MaxMemoryKiB{ 1024U * 1024U };

struct Argon2idParams final
{
    std::uint32_t iterations{};
    std::uint32_t memoryKiB{};
    std::uint32_t parallelism{};

    friend bool operator==(const Argon2idParams&, const Argon2idParams&) = default;
};

// Bounds shared by every backend. Parameters read back from a vault file are checked against these
// before any derivation, so a tampered header cannot request unbounded memory.
[[nodiscard]] constexpr bool isAcceptable(const Argon2idParams& p) noexcept
{
    if (p.iterations == 0U || p.iterations > g_argon2MaxIterations)
    {
        return false;
    }
    if (p.parallelism == 0U || p.parallelism > g_argon2MaxParallelism)
    {
        return false;
    }
    if (p.memoryKiB < (8U * p.parallelism) || p.memoryKiB > g_argon2MaxMemoryKiB)
    {
        return false;
    }
    return (p.memoryKiB % (4U * p.parallelism)) == 0U;
}

} // namespace keyward::crypto

#endif // INCLUDE_KEYWARD_CRYPTO_KDFPARAMS_HPP
