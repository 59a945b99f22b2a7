#ifndef INCLUDE_KEYWARD_CORE_VAULTSTORE_HPP
#define INCLUDE_KEYWARD_CORE_VAULTSTORE_HPP

#include "keyward/core/KdfPolicy.hpp"
#include "keyward/core/VaultBody.hpp"
#include "keyward/core/VaultError.hpp"
#include "keyward/core/VaultFileFormat.hpp"
#include "keyward/crypto/ICryptoProvider.hpp"
#include "keyward/security/SecureMemory.hpp"
#include "keyward/storage/IVaultFileRepository.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <utility>
#include <variant>
#include <vector>

namespace keyward::core
{

constexpr std::size_t g_defaultMaxBackups{ 10 };

struct StoreOptions final
{
    keyward::crypto::Argon2idParams kdf{ defaultArgon2idParams() };
    // Copies kept under <vault-dir>/backups; 0 disables backups.
    std::size_t maxBackups{ g_defaultMaxBackups };
};

// The derived key together with the parameters it was derived from. The salt is fixed for the
// lifetime of a vault, so every persist reuses it with a fresh nonce.
class VaultKey final
{
public:
    VaultKey() = default;
    VaultKey(const VaultKey&) = delete;
    VaultKey& operator=(const VaultKey&) = delete;
    VaultKey(VaultKey&& other) noexcept
        : m_suite(other.m_suite), m_kdf(other.m_kdf), m_salt(other.m_salt), m_key{}
    {
        m_key.swap(other.m_key);
        keyward::security::secureWipeObject(other.m_salt);
    }

    VaultKey& operator=(VaultKey&& other) noexcept
    {
        if (this == &other)
        {
            return *this;
        }

        keyward::security::secureRelease(m_key);
        m_key.swap(other.m_key);
        m_suite = other.m_suite;
        m_kdf = other.m_kdf;
        m_salt = other.m_salt;
        keyward::security::secureWipeObject(other.m_salt);
        return *this;
    }

    ~VaultKey() noexcept
    {
        wipe();
    }

    VaultKey(keyward::crypto::CipherSuite suite, keyward::crypto::Argon2idParams kdf,
             const std::array<std::uint8_t, keyward::crypto::g_kdfSaltBytes>& salt,
             keyward::security::SecureBuffer key) noexcept
        : m_suite(suite), m_kdf(kdf), m_salt(salt), m_key(std::move(key))
    {
    }

    [[nodiscard]] bool empty() const noexcept
    {
        return m_key.empty();
    }
    [[nodiscard]] keyward::crypto::CipherSuite cipherSuite() const noexcept
    {
        return m_suite;
    }
    [[nodiscard]] const keyward::crypto::Argon2idParams& kdf() const noexcept
    {
        return m_kdf;
    }
    [[nodiscard]] const std::array<std::uint8_t, keyward::crypto::g_kdfSaltBytes>& salt() const noexcept
    {
        return m_salt;
    }
    [[nodiscard]] const keyward::security::SecureBuffer& key() const noexcept
    {
        return m_key;
    }

    void wipe() noexcept
    {
        keyward::security::secureRelease(m_key);
        keyward::security::secureWipeObject(m_salt);
    }

private:
    keyward::crypto::CipherSuite m_suite{ keyward::crypto::CipherSuite::Aes256Gcm };
    keyward::crypto::Argon2idParams m_kdf{};
    std::array<std::uint8_t, keyward::crypto::g_kdfSaltBytes> m_salt{};
    keyward::security::SecureBuffer m_key;
};

// A vault file as it was last read or written: the decoded header and the complete file bytes.
struct SealedVault final
{
    VaultFileHeader header{};
    std::vector<std::uint8_t> bytes;
};

struct UnlockedVault final
{
    VaultKey key;
    VaultBody body;
    SealedVault sealed;
};

// Readable without the passphrase.
struct VaultFileInfo final
{
    VaultFileHeader header{};
    std::uintmax_t sizeBytes{};
    std::filesystem::file_time_type modified{};
    std::filesystem::perms permissions{ std::filesystem::perms::none };
    std::size_t backupCount{};
};

// Owns the on-disk vault format: derives keys, seals and opens bodies, and writes files atomically.
// Every operation returns a VaultError instead of throwing.
class VaultStore final
{
public:
    VaultStore(keyward::crypto::ICryptoProvider& crypto, keyward::storage::IVaultFileRepository& files,
               StoreOptions options = {}) noexcept;

    [[nodiscard]] bool exists(const std::filesystem::path& path) const noexcept;

    // Creates a vault holding an empty body. The passphrase and the derived key are wiped before returning.
    [[nodiscard]] VaultResult<SealedVault> initialize(const std::filesystem::path& path,
                                                      keyward::security::SecureString passphrase) noexcept;

    [[nodiscard]] VaultResult<UnlockedVault> unlock(const std::filesystem::path& path,
                                                    const keyward::security::SecureString& passphrase) noexcept;

    // Seals the body under a new nonce, backs up the current file and replaces it through a rename.
    // On failure the file on disk is unchanged.
    [[nodiscard]] VaultResult<SealedVault> persist(const std::filesystem::path& path, const VaultKey& key,
                                                   const VaultBody& body) noexcept;

    // Checks a passphrase against an already loaded file without touching disk.
    [[nodiscard]] VaultResult<std::monostate> verify(const SealedVault& sealed,
                                                     const keyward::security::SecureString& passphrase) noexcept;

    // Writes the body to a new vault file sealed under a separate passphrase with its own salt.
    [[nodiscard]] VaultResult<std::monostate> exportTo(const std::filesystem::path& target, const VaultBody& body,
                                                       const keyward::security::SecureString& passphrase) noexcept;

    [[nodiscard]] VaultResult<VaultBody> importFrom(const std::filesystem::path& source,
                                                    const keyward::security::SecureString& passphrase) noexcept;

    // Deletes the vault and its backups.
    [[nodiscard]] VaultResult<std::monostate> destroy(const std::filesystem::path& path) noexcept;

    [[nodiscard]] VaultResult<VaultFileInfo> inspect(const std::filesystem::path& path) const noexcept;

    [[nodiscard]] const StoreOptions& options() const noexcept
    {
        return m_options;
    }

private:
    keyward::crypto::ICryptoProvider* m_crypto{ nullptr };
    keyward::storage::IVaultFileRepository* m_files{ nullptr };
    StoreOptions m_options{};

    [[nodiscard]] VaultResult<VaultKey> deriveFreshKey(const keyward::security::SecureString& passphrase) noexcept;
    [[nodiscard]] VaultResult<SealedVault> seal(const VaultKey& key, const VaultBody& body) noexcept;
    [[nodiscard]] VaultResult<SealedVault> read(const std::filesystem::path& path) const noexcept;
    [[nodiscard]] VaultResult<UnlockedVault> open(SealedVault sealed,
                                                  const keyward::security::SecureString& passphrase) noexcept;
    [[nodiscard]] VaultResult<std::monostate> write(const std::filesystem::path& path, const SealedVault& sealed,
                                                    bool backupExisting) noexcept;
};

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_VAULTSTORE_HPP
