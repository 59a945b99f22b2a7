#ifndef INCLUDE_KEYWARD_SECURITY_SECUREMEMORY_HPP
#define INCLUDE_KEYWARD_SECURITY_SECUREMEMORY_HPP

#include "keyward/security/MemoryWiper.hpp"
#include "keyward/security/ZeroAllocator.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace keyward::security
{

using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;
using SecureString = std::vector<char, ZeroAllocator<char>>;

template <class C>
concept SecureContainer = std::same_as<C, SecureBuffer> || std::same_as<C, SecureString>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline SecureString secureStringFrom(std::span<const std::byte> bytes)
{
    SecureString out{};
    out.reserve(bytes.size());
    for (const std::byte b : bytes)
    {
        out.push_back(static_cast<char>(std::to_integer<unsigned char>(b)));
    }
    return out;
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

template <SecureContainer C> [[nodiscard]] std::span<const std::byte> asBytes(const C& c) noexcept
{
    return std::as_bytes(std::span{ c });
}

template <SecureContainer C> [[nodiscard]] std::span<std::byte> asWritableBytes(C& c) noexcept
{
    return std::as_writable_bytes(std::span{ c });
}

template <SecureContainer C> void secureResize(C& c, std::size_t newSize)
{
    if (newSize < c.size())
    {
        secureWipe(asWritableBytes(c).subspan(newSize));
    }
    c.resize(newSize);
}

template <SecureContainer C> void secureClear(C& c) noexcept
{
    secureWipe(asWritableBytes(c));
    c.clear();
}

// Wipes the contents and gives the allocation back, leaving an empty container with no capacity.
template <SecureContainer C> void secureRelease(C& c) noexcept
{
    secureWipe(asWritableBytes(c));
    C empty{};
    c.swap(empty);
}

// Constant-time comparison; only the length is allowed to short-circuit.
[[nodiscard]] inline bool secureEquals(std::span<const std::byte> a, std::span<const std::byte> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile unsigned char diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= static_cast<unsigned char>(std::to_integer<unsigned char>(a[i]) ^ std::to_integer<unsigned char>(b[i]));
    }
    return diff == 0U;
}

template <SecureContainer C> [[nodiscard]] bool secureEquals(const C& a, const C& b) noexcept
{
    return secureEquals(asBytes(a), asBytes(b));
}

} // namespace keyward::security

#endif // INCLUDE_KEYWARD_SECURITY_SECUREMEMORY_HPP
