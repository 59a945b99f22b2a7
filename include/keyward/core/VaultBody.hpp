#ifndef INCLUDE_KEYWARD_CORE_VAULTBODY_HPP
#define INCLUDE_KEYWARD_CORE_VAULTBODY_HPP

#include "keyward/core/Account.hpp"
#include "keyward/core/VaultError.hpp"
#include <cstdint>
#include <functional>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::core
{

constexpr std::uint32_t g_vaultBodySchemaV1{ 1U };
constexpr std::uint32_t g_defaultAutoLockSeconds{ 15U * 60U };
// The identifier counter stops here; the last identifier handed out is g_maxNextId - 1.
constexpr AccountId g_maxNextId{ std::numeric_limits<AccountId>::max() };

struct VaultSettings final
{
    // Idle time before an unlocked session locks itself; 0 disables.
    std::uint32_t autoLockSeconds{ g_defaultAutoLockSeconds };

    friend bool operator==(const VaultSettings&, const VaultSettings&) = default;
};

struct AccountFilter final
{
    // Case-insensitive substring over name, url, username and notes.
    std::optional<std::string> text;
    std::optional<Category> category;
    std::optional<std::string> tag;
};

[[nodiscard]] std::uint64_t unixSecondsNow() noexcept;

// The decrypted vault contents. No I/O and no knowledge of encryption.
//
// Identifiers come from a counter that only grows and is persisted with the body,
// so an identifier is never handed out twice for the lifetime of a vault.
class VaultBody final
{
public:
    using NowProvider = std::function<std::uint64_t()>;

    explicit VaultBody(NowProvider now = unixSecondsNow);

    // Rebuilds a body from decoded fields. Returns std::nullopt if the records break an invariant
    // (duplicate or out-of-range identifier, empty name or secret).
    [[nodiscard]] static std::optional<VaultBody> restore(std::uint64_t createdAtUnixSeconds, AccountId nextId,
                                                          VaultSettings settings, std::vector<Account> accounts,
                                                          NowProvider now = unixSecondsNow);

    [[nodiscard]] VaultResult<Account> create(AccountFields fields);
    [[nodiscard]] VaultResult<Account> update(AccountId id, AccountPatch patch);
    [[nodiscard]] bool remove(AccountId id) noexcept;

    // Adds a record from another vault under a fresh identifier, keeping its timestamps.
    [[nodiscard]] VaultResult<Account> adopt(const Account& foreign);
    void clear() noexcept;

    [[nodiscard]] const Account* find(AccountId id) const noexcept;
    [[nodiscard]] const std::vector<Account>& accounts() const noexcept;
    [[nodiscard]] std::vector<const Account*> select(const AccountFilter& filter) const;

    [[nodiscard]] std::uint32_t schemaVersion() const noexcept;
    [[nodiscard]] std::uint64_t createdAtUnixSeconds() const noexcept;
    [[nodiscard]] AccountId nextId() const noexcept;

    [[nodiscard]] const VaultSettings& settings() const noexcept;
    void setSettings(VaultSettings settings) noexcept;

private:
    NowProvider m_now;
    std::uint64_t m_createdAt{};
    AccountId m_nextId{ 1U };
    VaultSettings m_settings{};
    std::vector<Account> m_accounts;

    [[nodiscard]] std::vector<Account>::iterator locate(AccountId id) noexcept;
};

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_VAULTBODY_HPP
