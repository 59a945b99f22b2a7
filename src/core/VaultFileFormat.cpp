#include "keyward/core/VaultFileFormat.hpp"
#include "ByteCodec.hpp"

#include <algorithm>
#include <cstring>

namespace keyward::core
{
namespace
{

constexpr std::array<std::byte, 4> g_vaultMagic{ std::byte{ 'K' }, std::byte{ 'W' }, std::byte{ 'V' },
                                                 std::byte{ 'F' } };

template <std::unsigned_integral T> void putAt(EncodedVaultHeader& out, std::size_t& offset, T v) noexcept
{
    detail::storeLE<T>(std::span<std::byte, sizeof(T)>{ out.data() + offset, sizeof(T) }, v);
    offset += sizeof(T);
}

template <std::size_t N>
void putRaw(EncodedVaultHeader& out, std::size_t& offset, const std::array<std::uint8_t, N>& raw) noexcept
{
    std::memcpy(out.data() + offset, raw.data(), N);
    offset += N;
}

template <std::size_t N>
[[nodiscard]] bool getRaw(detail::ByteReader& r, std::array<std::uint8_t, N>& raw) noexcept
{
    std::span<const std::byte> bytes{};
    if (!r.getBytes(N, bytes))
    {
        return false;
    }
    std::memcpy(raw.data(), bytes.data(), N);
    return true;
}

} // namespace

EncodedVaultHeader encodeVaultHeader(const VaultFileHeader& header) noexcept
{
    EncodedVaultHeader out{};
    std::size_t offset{};
    std::copy(g_vaultMagic.begin(), g_vaultMagic.end(), out.begin());
    offset += g_vaultMagic.size();

    putAt<std::uint8_t>(out, offset, header.formatVersion);
    putAt<std::uint8_t>(out, offset, static_cast<std::uint8_t>(header.cipherSuite));
    putAt<std::uint8_t>(out, offset, header.bodySchema);
    putAt<std::uint8_t>(out, offset, 0U);
    putAt<std::uint32_t>(out, offset, header.kdf.iterations);
    putAt<std::uint32_t>(out, offset, header.kdf.memoryKiB);
    putAt<std::uint32_t>(out, offset, header.kdf.parallelism);
    putRaw(out, offset, header.salt);
    putRaw(out, offset, header.nonce);
    return out;
}

std::optional<VaultFileHeader> decodeVaultHeader(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() < g_vaultHeaderBytes)
    {
        return std::nullopt;
    }
    detail::ByteReader r{ bytes.first(g_vaultHeaderBytes) };

    std::span<const std::byte> magic{};
    if (!r.getBytes(g_vaultMagic.size(), magic) || !std::equal(magic.begin(), magic.end(), g_vaultMagic.begin()))
    {
        return std::nullopt;
    }

    VaultFileHeader header{};
    std::uint8_t suite{};
    std::uint8_t reserved{};
    if (!r.get(header.formatVersion) || !r.get(suite) || !r.get(header.bodySchema) || !r.get(reserved))
    {
        return std::nullopt;
    }
    if (header.formatVersion != g_vaultFormatVersionV1 || header.bodySchema != g_vaultBodySchemaIdV1 ||
        !keyward::crypto::isKnownCipherSuite(suite) || reserved != 0U)
    {
        return std::nullopt;
    }
    header.cipherSuite = static_cast<keyward::crypto::CipherSuite>(suite);

    if (!r.get(header.kdf.iterations) || !r.get(header.kdf.memoryKiB) || !r.get(header.kdf.parallelism) ||
        !keyward::crypto::isAcceptable(header.kdf))
    {
        return std::nullopt;
    }
    if (!getRaw(r, header.salt) || !getRaw(r, header.nonce) || !r.atEnd())
    {
        return std::nullopt;
    }
    return header;
}

} // namespace keyward::core
