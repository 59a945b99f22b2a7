#include "keyward/core/VaultBodyCodec.hpp"
#include "ByteCodec.hpp"

#include <array>
#include <cstring>

namespace keyward::core
{
namespace
{

constexpr std::array<char, 6> g_bodyMagic{ 'K', 'W', 'B', 'O', 'D', 'Y' };

constexpr std::uint8_t g_hasUrl{ 0x01U };
constexpr std::uint8_t g_hasUsername{ 0x02U };
constexpr std::uint8_t g_hasNotes{ 0x04U };
constexpr std::uint8_t g_knownPresenceBits{ g_hasUrl | g_hasUsername | g_hasNotes };

// Lower bound for one encoded account, used to reject absurd counts before allocating.
constexpr std::size_t g_minAccountBytes{ 8U + 8U + 8U + 1U + 4U + 4U + 1U + 4U + 4U };

void putAccount(detail::ByteWriter& w, const Account& a)
{
    w.put<std::uint64_t>(a.id);
    w.put<std::uint64_t>(a.createdAtUnixSeconds);
    w.put<std::uint64_t>(a.modifiedAtUnixSeconds);
    w.put<std::uint8_t>(static_cast<std::uint8_t>(a.category.kind));
    w.putString(a.category.kind == CategoryKind::Other ? std::string_view{ a.category.otherLabel }
                                                       : std::string_view{});
    w.putString(a.name);

    std::uint8_t presence{};
    presence |= a.url ? g_hasUrl : 0U;
    presence |= a.username ? g_hasUsername : 0U;
    presence |= a.notes ? g_hasNotes : 0U;
    w.put<std::uint8_t>(presence);
    if (a.url)
    {
        w.putString(*a.url);
    }
    if (a.username)
    {
        w.putString(*a.username);
    }
    if (a.notes)
    {
        w.putString(*a.notes);
    }

    w.putString(keyward::security::asStringView(a.secret));

    w.putCount(a.tags.size());
    for (const auto& tag : a.tags)
    {
        w.putString(tag);
    }
}

[[nodiscard]] bool getOptionalString(detail::ByteReader& r, bool present, std::optional<std::string>& out)
{
    if (!present)
    {
        out.reset();
        return true;
    }
    std::string s{};
    if (!r.getString(s))
    {
        return false;
    }
    out = std::move(s);
    return true;
}

[[nodiscard]] bool getAccount(detail::ByteReader& r, Account& a)
{
    std::uint8_t kind{};
    std::string otherLabel{};
    if (!r.get(a.id) || !r.get(a.createdAtUnixSeconds) || !r.get(a.modifiedAtUnixSeconds) || !r.get(kind) ||
        !r.getString(otherLabel) || !r.getString(a.name))
    {
        return false;
    }
    if (kind > static_cast<std::uint8_t>(CategoryKind::Other))
    {
        return false;
    }
    a.category.kind = static_cast<CategoryKind>(kind);
    if (a.category.kind == CategoryKind::Other)
    {
        a.category.otherLabel = std::move(otherLabel);
    }
    else if (!otherLabel.empty())
    {
        return false;
    }

    std::uint8_t presence{};
    if (!r.get(presence) || (presence & ~g_knownPresenceBits) != 0U)
    {
        return false;
    }
    if (!getOptionalString(r, (presence & g_hasUrl) != 0U, a.url) ||
        !getOptionalString(r, (presence & g_hasUsername) != 0U, a.username) ||
        !getOptionalString(r, (presence & g_hasNotes) != 0U, a.notes))
    {
        return false;
    }

    if (!r.getSecret(a.secret))
    {
        return false;
    }

    std::uint32_t tagCount{};
    if (!r.get(tagCount) || tagCount > r.remaining() / sizeof(std::uint32_t))
    {
        return false;
    }
    for (std::uint32_t i{}; i < tagCount; ++i)
    {
        std::string tag{};
        if (!r.getString(tag) || !a.tags.insert(std::move(tag)).second)
        {
            return false;
        }
    }
    return a.modifiedAtUnixSeconds >= a.createdAtUnixSeconds;
}

} // namespace

keyward::security::SecureBuffer encodeVaultBody(const VaultBody& body)
{
    detail::ByteWriter w{};
    w.putBytes(std::as_bytes(std::span{ g_bodyMagic }));
    w.put<std::uint32_t>(body.schemaVersion());
    w.put<std::uint64_t>(body.createdAtUnixSeconds());
    w.put<std::uint64_t>(body.nextId());
    w.put<std::uint32_t>(body.settings().autoLockSeconds);
    w.putCount(body.accounts().size());
    for (const auto& a : body.accounts())
    {
        putAccount(w, a);
    }
    return w.take();
}

std::optional<VaultBody> decodeVaultBody(std::span<const std::byte> plain)
{
    detail::ByteReader r{ plain };

    std::span<const std::byte> magic{};
    if (!r.getBytes(g_bodyMagic.size(), magic) || std::memcmp(magic.data(), g_bodyMagic.data(), magic.size()) != 0)
    {
        return std::nullopt;
    }

    std::uint32_t schema{};
    std::uint64_t createdAt{};
    AccountId nextId{};
    VaultSettings settings{};
    std::uint32_t count{};
    if (!r.get(schema) || schema != g_vaultBodySchemaV1 || !r.get(createdAt) || !r.get(nextId) ||
        !r.get(settings.autoLockSeconds) || !r.get(count))
    {
        return std::nullopt;
    }
    if (count > r.remaining() / g_minAccountBytes)
    {
        return std::nullopt;
    }

    std::vector<Account> accounts{};
    accounts.reserve(count);
    for (std::uint32_t i{}; i < count; ++i)
    {
        Account a{};
        if (!getAccount(r, a))
        {
            return std::nullopt;
        }
        accounts.push_back(std::move(a));
    }

    if (!r.atEnd())
    {
        return std::nullopt;
    }
    return VaultBody::restore(createdAt, nextId, settings, std::move(accounts));
}

} // namespace keyward::core
