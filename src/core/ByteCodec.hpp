#ifndef KEYWARD_SRC_CORE_BYTECODEC_HPP
#define KEYWARD_SRC_CORE_BYTECODEC_HPP

#include "keyward/security/SecureMemory.hpp"
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>

namespace keyward::core::detail
{

constexpr std::uint32_t g_bitsPerByte{ 8U };

template <std::unsigned_integral T> void storeLE(std::span<std::byte, sizeof(T)> out, T v) noexcept
{
    for (std::size_t i{}; i < sizeof(T); ++i)
    {
        out[i] = static_cast<std::byte>((v >> (i * g_bitsPerByte)) & T{ 0xFFU });
    }
}

template <std::unsigned_integral T> [[nodiscard]] T loadLE(std::span<const std::byte, sizeof(T)> in) noexcept
{
    T v{};
    for (std::size_t i{}; i < sizeof(T); ++i)
    {
        v |= static_cast<T>(static_cast<T>(std::to_integer<std::uint8_t>(in[i])) << (i * g_bitsPerByte));
    }
    return v;
}

// Appends little-endian fields to a wiping buffer; the serialized body contains secrets.
class ByteWriter final
{
public:
    template <std::unsigned_integral T> void put(T v)
    {
        const std::size_t at{ m_out.size() };
        m_out.resize(at + sizeof(T));
        storeLE<T>(std::span<std::byte, sizeof(T)>{ reinterpret_cast<std::byte*>(m_out.data() + at), sizeof(T) }, v);
    }

    void putBytes(std::span<const std::byte> bytes)
    {
        const auto* p{ reinterpret_cast<const std::uint8_t*>(bytes.data()) };
        m_out.insert(m_out.end(), p, p + bytes.size());
    }

    // Lengths and counts are stored as u32. Throws std::length_error for anything larger
    // instead of writing a truncated prefix.
    [[nodiscard]] static std::uint32_t checkedU32(std::size_t n)
    {
        if (n > std::numeric_limits<std::uint32_t>::max())
        {
            throw std::length_error("body field exceeds the u32 length prefix");
        }
        return static_cast<std::uint32_t>(n);
    }

    void putCount(std::size_t n)
    {
        put<std::uint32_t>(checkedU32(n));
    }

    // u32 length prefix followed by the raw bytes.
    void putString(std::string_view s)
    {
        putCount(s.size());
        putBytes(std::as_bytes(std::span<const char>{ s.data(), s.size() }));
    }

    [[nodiscard]] keyward::security::SecureBuffer take() noexcept
    {
        keyward::security::SecureBuffer out{};
        out.swap(m_out);
        return out;
    }

private:
    keyward::security::SecureBuffer m_out;
};

// Bounds-checked reader. Every accessor returns false once the input is exhausted and leaves the
// reader in a failed state, so callers may chain reads and check once.
class ByteReader final
{
public:
    explicit ByteReader(std::span<const std::byte> in) noexcept : m_in{ in }
    {
    }

    template <std::unsigned_integral T> [[nodiscard]] bool get(T& v) noexcept
    {
        if (!require(sizeof(T)))
        {
            return false;
        }
        v = loadLE<T>(m_in.subspan(m_offset).template first<sizeof(T)>());
        m_offset += sizeof(T);
        return true;
    }

    [[nodiscard]] bool getBytes(std::size_t n, std::span<const std::byte>& out) noexcept
    {
        if (!require(n))
        {
            return false;
        }
        out = m_in.subspan(m_offset, n);
        m_offset += n;
        return true;
    }

    [[nodiscard]] bool getString(std::string& out)
    {
        std::span<const std::byte> raw{};
        if (!getPrefixed(raw))
        {
            return false;
        }
        out.assign(reinterpret_cast<const char*>(raw.data()), raw.size());
        return true;
    }

    [[nodiscard]] bool getSecret(keyward::security::SecureString& out)
    {
        std::span<const std::byte> raw{};
        if (!getPrefixed(raw))
        {
            return false;
        }
        out = keyward::security::secureStringFrom(raw);
        return true;
    }

    [[nodiscard]] bool atEnd() const noexcept
    {
        return !m_failed && m_offset == m_in.size();
    }

    [[nodiscard]] std::size_t remaining() const noexcept
    {
        return m_in.size() - m_offset;
    }

private:
    std::span<const std::byte> m_in;
    std::size_t m_offset{};
    bool m_failed{ false };

    [[nodiscard]] bool require(std::size_t n) noexcept
    {
        if (m_failed || n > remaining())
        {
            m_failed = true;
            return false;
        }
        return true;
    }

    [[nodiscard]] bool getPrefixed(std::span<const std::byte>& out) noexcept
    {
        std::uint32_t len{};
        return get(len) && getBytes(len, out);
    }
};

} // namespace keyward::core::detail

#endif // KEYWARD_SRC_CORE_BYTECODEC_HPP
