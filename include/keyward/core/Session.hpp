#ifndef INCLUDE_KEYWARD_CORE_SESSION_HPP
#define INCLUDE_KEYWARD_CORE_SESSION_HPP

#include "keyward/core/VaultStore.hpp"
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <mutex>
#include <optional>
#include <variant>
#include <vector>

namespace keyward::core
{

enum class SessionState : std::uint8_t
{
    Locked,
    Unlocked,
};

enum class ImportMode : std::uint8_t
{
    Merge,
    Replace,
};

struct SessionOptions final
{
    // Consecutive wrong passphrases before unlock is refused for lockoutDuration; 0 disables.
    std::uint32_t maxFailedAttempts{ 5U };
    std::chrono::seconds lockoutDuration{ 30 };
};

// The single owner of an unlocked vault. Every public call takes the same mutex, so mutations,
// reads and persists never overlap.
//
// lock() writes pending changes first and stays unlocked if that write fails. discardAndLock()
// and the destructor drop pending changes and never touch disk.
class Session final
{
public:
    using Clock = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using NowProvider = std::function<TimePoint()>;

    Session(VaultStore& store, std::filesystem::path vaultPath, SessionOptions options = {},
            NowProvider nowProvider = Clock::now);

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;
    Session(Session&&) = delete;
    Session& operator=(Session&&) = delete;
    ~Session() noexcept;

    [[nodiscard]] const std::filesystem::path& vaultPath() const noexcept;
    [[nodiscard]] SessionState state() const;
    [[nodiscard]] bool isDirty() const;

    // Creates the vault file. The session stays locked.
    [[nodiscard]] VaultResult<std::monostate> initialize(keyward::security::SecureString passphrase);

    [[nodiscard]] VaultResult<std::monostate> unlock(const keyward::security::SecureString& passphrase);
    [[nodiscard]] VaultResult<std::monostate> lock();
    void discardAndLock() noexcept;
    [[nodiscard]] VaultResult<std::monostate> save();

    [[nodiscard]] VaultResult<Account> add(AccountFields fields);
    [[nodiscard]] VaultResult<Account> edit(AccountId id, AccountPatch patch);
    [[nodiscard]] VaultResult<std::monostate> remove(AccountId id);

    [[nodiscard]] VaultResult<std::vector<Account>> list(const AccountFilter& filter = {});
    [[nodiscard]] VaultResult<Account> get(AccountId id);

    // Confirms the passphrase against the loaded file without changing any state.
    [[nodiscard]] VaultResult<std::monostate> verify(const keyward::security::SecureString& passphrase);

    [[nodiscard]] VaultResult<std::monostate> exportTo(const std::filesystem::path& target,
                                                       const keyward::security::SecureString& exportPassphrase);

    // Returns the number of records brought in.
    [[nodiscard]] VaultResult<std::size_t> importFrom(const std::filesystem::path& source,
                                                      const keyward::security::SecureString& importPassphrase,
                                                      ImportMode mode = ImportMode::Merge);

    // Verifies the passphrase, deletes the vault with its backups and locks.
    [[nodiscard]] VaultResult<std::monostate> reset(const keyward::security::SecureString& passphrase);

    [[nodiscard]] VaultResult<VaultSettings> settings();
    [[nodiscard]] VaultResult<std::monostate> setAutoLock(std::uint32_t seconds);

    // Records user activity for the idle timer.
    void touch();

    // Zero when unlock attempts are allowed.
    [[nodiscard]] std::chrono::seconds lockoutRemaining() const;

private:
    VaultStore* m_store{ nullptr };
    std::filesystem::path m_path;
    SessionOptions m_options{};
    NowProvider m_now;

    mutable std::mutex m_mutex;
    std::optional<UnlockedVault> m_vault;
    bool m_dirty{ false };
    TimePoint m_lastActivity{};
    std::uint32_t m_failedAttempts{};
    std::optional<TimePoint> m_lockedOutUntil;

    [[nodiscard]] VaultResult<std::monostate> requireUnlockedLocked();
    [[nodiscard]] VaultResult<std::monostate> saveLocked();
    [[nodiscard]] VaultResult<std::monostate> lockLocked();
    void discardLocked() noexcept;
    [[nodiscard]] bool lockoutActiveLocked() const;
    void recordAuthResultLocked(const VaultResult<std::monostate>& result);
};

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_SESSION_HPP
