#ifndef INCLUDE_KEYWARD_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_KEYWARD_SECURITY_SCOPEWIPE_HPP

#include "keyward/security/MemoryWiper.hpp"
#include "keyward/security/SecureMemory.hpp"
#include <cstddef>
#include <span>

namespace keyward::security
{

// Wipes a byte range when the guard leaves scope, on every return and unwind path.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> bytes) noexcept : m_bytes{ bytes }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;

    ScopeWipe(ScopeWipe&& other) noexcept : m_bytes{ other.m_bytes }
    {
        other.m_bytes = {};
    }

    ScopeWipe& operator=(ScopeWipe&& other) noexcept
    {
        if (this != &other)
        {
            secureWipe(m_bytes);
            m_bytes = other.m_bytes;
            other.m_bytes = {};
        }
        return *this;
    }

    ~ScopeWipe() noexcept
    {
        secureWipe(m_bytes);
    }

    // Hands ownership of the range back to the caller; nothing is wiped afterwards.
    void release() noexcept
    {
        m_bytes = {};
    }

private:
    std::span<std::byte> m_bytes;
};

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::byte> bytes) noexcept
{
    return ScopeWipe{ bytes };
}

[[nodiscard]] inline ScopeWipe scopeWipe(std::span<std::uint8_t> bytes) noexcept
{
    return ScopeWipe{ std::as_writable_bytes(bytes) };
}

// The guard captures the current storage; resizing the container afterwards invalidates it.
template <SecureContainer C> [[nodiscard]] ScopeWipe scopeWipe(C& c) noexcept
{
    return ScopeWipe{ asWritableBytes(c) };
}

} // namespace keyward::security

#endif // INCLUDE_KEYWARD_SECURITY_SCOPEWIPE_HPP
