#include "keyward/security/SecureRandom.hpp"
#include "keyward/security/MemoryWiper.hpp"
#include <array>
#include <cerrno>
#include <cstring>
#include <limits>

#if defined(__linux__)
#include <sys/random.h>
#else
#error Unsupported platform
#endif

namespace keyward::security
{

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    std::uint8_t* cursor{ out.data() };
    std::size_t remaining{ out.size() };

    while (remaining > 0U)
    {
        const ssize_t got{ ::getrandom(cursor, remaining, 0) };
        if (got < 0)
        {
            if (errno == EINTR)
            {
                continue;
            }
            return false;
        }
        if (got == 0 || static_cast<std::size_t>(got) > remaining)
        {
            return false;
        }
        cursor += got;
        remaining -= static_cast<std::size_t>(got);
    }
    return true;
}

bool secureRandomUint64(std::uint64_t& out) noexcept
{
    std::array<std::uint8_t, sizeof(std::uint64_t)> raw{};
    if (!secureRandomFill(std::span{ raw }))
    {
        return false;
    }
    std::memcpy(&out, raw.data(), raw.size());
    secureWipe(std::span<std::uint8_t>{ raw });
    return true;
}

bool secureRandomBounded(std::uint64_t maxExcl, std::uint64_t& out) noexcept
{
    if (maxExcl == 0U)
    {
        return false;
    }
    if (maxExcl == 1U)
    {
        out = 0U;
        return true;
    }

    // Largest multiple of maxExcl that fits; candidates at or above it would bias the modulo.
    const std::uint64_t limit{ (std::numeric_limits<std::uint64_t>::max() / maxExcl) * maxExcl };

    constexpr std::size_t kMaxAttempts{ 128U };
    for (std::size_t attempt{}; attempt < kMaxAttempts; ++attempt)
    {
        std::uint64_t candidate{};
        if (!secureRandomUint64(candidate))
        {
            return false;
        }
        if (candidate < limit)
        {
            out = candidate % maxExcl;
            return true;
        }
    }
    return false;
}

} // namespace keyward::security
