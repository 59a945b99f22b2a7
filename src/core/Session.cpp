#include "keyward/core/Session.hpp"
#include "keyward/log/Log.hpp"

namespace keyward::core
{
namespace
{

constexpr std::string_view g_component{ "session" };

template <class T> [[nodiscard]] VaultError errorOf(const VaultResult<T>& r) noexcept
{
    return std::get<VaultError>(r);
}

} // namespace

Session::Session(VaultStore& store, std::filesystem::path vaultPath, SessionOptions options, NowProvider nowProvider)
    : m_store(&store), m_path(std::move(vaultPath)), m_options(options), m_now(std::move(nowProvider))
{
    m_lastActivity = m_now();
}

Session::~Session() noexcept
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    discardLocked();
}

const std::filesystem::path& Session::vaultPath() const noexcept
{
    return m_path;
}

SessionState Session::state() const
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    return m_vault ? SessionState::Unlocked : SessionState::Locked;
}

bool Session::isDirty() const
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    return m_dirty;
}

VaultResult<std::monostate> Session::initialize(keyward::security::SecureString passphrase)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    auto created{ m_store->initialize(m_path, std::move(passphrase)) };
    if (isError(created))
    {
        return errorOf(created);
    }
    return std::monostate{};
}

VaultResult<std::monostate> Session::unlock(const keyward::security::SecureString& passphrase)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    if (lockoutActiveLocked())
    {
        return VaultError::TooManyAttempts;
    }

    // Already open: treat as re-authentication and keep the loaded state.
    if (m_vault)
    {
        auto checked{ m_store->verify(m_vault->sealed, passphrase) };
        recordAuthResultLocked(checked);
        if (!isError(checked))
        {
            m_lastActivity = m_now();
        }
        return checked;
    }

    auto opened{ m_store->unlock(m_path, passphrase) };
    if (isError(opened))
    {
        const VaultResult<std::monostate> failed{ errorOf(opened) };
        recordAuthResultLocked(failed);
        return failed;
    }

    m_vault.emplace(std::move(std::get<UnlockedVault>(opened)));
    m_dirty = false;
    m_lastActivity = m_now();
    recordAuthResultLocked(std::monostate{});
    return std::monostate{};
}

VaultResult<std::monostate> Session::lock()
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    return lockLocked();
}

void Session::discardAndLock() noexcept
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    if (m_vault && m_dirty)
    {
        keyward::log::info(g_component, "discarding unsaved changes");
    }
    discardLocked();
}

VaultResult<std::monostate> Session::save()
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return ready;
    }
    return saveLocked();
}

VaultResult<Account> Session::add(AccountFields fields)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return errorOf(ready);
    }

    auto created{ m_vault->body.create(std::move(fields)) };
    if (!isError(created))
    {
        m_dirty = true;
        keyward::log::debug(g_component, "account added: ", std::get<Account>(created).id);
    }
    return created;
}

VaultResult<Account> Session::edit(AccountId id, AccountPatch patch)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return errorOf(ready);
    }

    auto updated{ m_vault->body.update(id, std::move(patch)) };
    if (!isError(updated))
    {
        m_dirty = true;
        keyward::log::debug(g_component, "account edited: ", id);
    }
    return updated;
}

VaultResult<std::monostate> Session::remove(AccountId id)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return ready;
    }

    if (!m_vault->body.remove(id))
    {
        return VaultError::NotFound;
    }
    m_dirty = true;
    keyward::log::debug(g_component, "account removed: ", id);
    return std::monostate{};
}

VaultResult<std::vector<Account>> Session::list(const AccountFilter& filter)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return errorOf(ready);
    }

    std::vector<Account> out{};
    for (const Account* a : m_vault->body.select(filter))
    {
        out.push_back(*a);
    }
    return out;
}

VaultResult<Account> Session::get(AccountId id)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return errorOf(ready);
    }

    const Account* found{ m_vault->body.find(id) };
    if (found == nullptr)
    {
        return VaultError::NotFound;
    }
    return *found;
}

VaultResult<std::monostate> Session::verify(const keyward::security::SecureString& passphrase)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    if (lockoutActiveLocked())
    {
        return VaultError::TooManyAttempts;
    }
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return ready;
    }

    auto checked{ m_store->verify(m_vault->sealed, passphrase) };
    recordAuthResultLocked(checked);
    return checked;
}

VaultResult<std::monostate> Session::exportTo(const std::filesystem::path& target,
                                              const keyward::security::SecureString& exportPassphrase)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return ready;
    }
    return m_store->exportTo(target, m_vault->body, exportPassphrase);
}

VaultResult<std::size_t> Session::importFrom(const std::filesystem::path& source,
                                             const keyward::security::SecureString& importPassphrase, ImportMode mode)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return errorOf(ready);
    }

    auto imported{ m_store->importFrom(source, importPassphrase) };
    if (isError(imported))
    {
        return errorOf(imported);
    }

    // Applied to a copy so a rejected record leaves the loaded body untouched.
    VaultBody next{ m_vault->body };
    if (mode == ImportMode::Replace)
    {
        next.clear();
    }
    std::size_t count{};
    for (const Account& a : std::get<VaultBody>(imported).accounts())
    {
        auto adopted{ next.adopt(a) };
        if (isError(adopted))
        {
            return errorOf(adopted);
        }
        ++count;
    }

    m_vault->body = std::move(next);
    m_dirty = true;
    keyward::log::info(g_component, "imported ", count, " accounts from ", source);
    return count;
}

VaultResult<std::monostate> Session::reset(const keyward::security::SecureString& passphrase)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    if (lockoutActiveLocked())
    {
        return VaultError::TooManyAttempts;
    }

    VaultResult<std::monostate> checked{ std::monostate{} };
    if (m_vault)
    {
        checked = m_store->verify(m_vault->sealed, passphrase);
    }
    else
    {
        auto opened{ m_store->unlock(m_path, passphrase) };
        if (isError(opened))
        {
            checked = errorOf(opened);
        }
    }
    recordAuthResultLocked(checked);
    if (isError(checked))
    {
        return checked;
    }

    auto removed{ m_store->destroy(m_path) };
    if (isError(removed))
    {
        return removed;
    }
    discardLocked();
    keyward::log::info(g_component, "vault reset: ", m_path);
    return std::monostate{};
}

VaultResult<VaultSettings> Session::settings()
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return errorOf(ready);
    }
    return m_vault->body.settings();
}

VaultResult<std::monostate> Session::setAutoLock(std::uint32_t seconds)
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    const auto ready{ requireUnlockedLocked() };
    if (isError(ready))
    {
        return ready;
    }

    auto next{ m_vault->body.settings() };
    if (next.autoLockSeconds != seconds)
    {
        next.autoLockSeconds = seconds;
        m_vault->body.setSettings(next);
        m_dirty = true;
    }
    return std::monostate{};
}

void Session::touch()
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    m_lastActivity = m_now();
}

std::chrono::seconds Session::lockoutRemaining() const
{
    const std::lock_guard<std::mutex> guard{ m_mutex };
    if (!lockoutActiveLocked())
    {
        return std::chrono::seconds{ 0 };
    }
    return std::chrono::ceil<std::chrono::seconds>(*m_lockedOutUntil - m_now());
}

VaultResult<std::monostate> Session::requireUnlockedLocked()
{
    if (!m_vault)
    {
        return VaultError::VaultLocked;
    }

    const TimePoint now{ m_now() };
    const std::chrono::seconds idleLimit{ m_vault->body.settings().autoLockSeconds };
    if (idleLimit.count() > 0 && (now - m_lastActivity) > idleLimit)
    {
        keyward::log::info(g_component, "idle timeout reached, locking");
        const auto locked{ lockLocked() };
        if (isError(locked))
        {
            return locked;
        }
        return VaultError::VaultLocked;
    }

    m_lastActivity = now;
    return std::monostate{};
}

VaultResult<std::monostate> Session::saveLocked()
{
    auto sealed{ m_store->persist(m_path, m_vault->key, m_vault->body) };
    if (isError(sealed))
    {
        return errorOf(sealed);
    }
    m_vault->sealed = std::move(std::get<SealedVault>(sealed));
    m_dirty = false;
    return std::monostate{};
}

VaultResult<std::monostate> Session::lockLocked()
{
    if (!m_vault)
    {
        return std::monostate{};
    }
    if (m_dirty)
    {
        const auto saved{ saveLocked() };
        if (isError(saved))
        {
            keyward::log::error(g_component, "lock aborted, pending changes could not be saved: ",
                                errorName(errorOf(saved)));
            return saved;
        }
    }
    discardLocked();
    keyward::log::info(g_component, "vault locked");
    return std::monostate{};
}

void Session::discardLocked() noexcept
{
    if (m_vault)
    {
        m_vault->key.wipe();
        m_vault->body.clear();
        m_vault.reset();
    }
    m_dirty = false;
}

bool Session::lockoutActiveLocked() const
{
    return m_lockedOutUntil && m_now() < *m_lockedOutUntil;
}

void Session::recordAuthResultLocked(const VaultResult<std::monostate>& result)
{
    if (!isError(result))
    {
        m_failedAttempts = 0U;
        m_lockedOutUntil.reset();
        return;
    }
    if (errorOf(result) != VaultError::WrongPassphrase || m_options.maxFailedAttempts == 0U)
    {
        return;
    }

    ++m_failedAttempts;
    if (m_failedAttempts >= m_options.maxFailedAttempts)
    {
        m_lockedOutUntil = m_now() + m_options.lockoutDuration;
        m_failedAttempts = 0U;
        keyward::log::warning(g_component, "too many failed attempts, refusing unlock for ",
                              m_options.lockoutDuration.count(), "s");
    }
}

} // namespace keyward::core
