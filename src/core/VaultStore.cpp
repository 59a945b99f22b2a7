#include "keyward/core/VaultStore.hpp"
#include "keyward/core/VaultBodyCodec.hpp"
#include "keyward/log/Log.hpp"
#include "keyward/security/ScopeWipe.hpp"
#include "keyward/storage/StorageErrors.hpp"
#include <algorithm>
#include <exception>
#include <iterator>
#include <stdexcept>

namespace keyward::core
{
namespace
{

constexpr std::string_view g_component{ "store" };

template <class T> [[nodiscard]] VaultError errorOf(const VaultResult<T>& r) noexcept
{
    return std::get<VaultError>(r);
}

[[nodiscard]] std::span<const std::byte> headerBytes(const std::vector<std::uint8_t>& file) noexcept
{
    return std::as_bytes(std::span<const std::uint8_t>{ file.data(), g_vaultHeaderBytes });
}

[[nodiscard]] std::span<const std::uint8_t> payloadBytes(const std::vector<std::uint8_t>& file) noexcept
{
    return std::span<const std::uint8_t>{ file }.subspan(g_vaultHeaderBytes);
}

} // namespace

VaultStore::VaultStore(keyward::crypto::ICryptoProvider& crypto, keyward::storage::IVaultFileRepository& files,
                       StoreOptions options) noexcept
    : m_crypto(&crypto), m_files(&files), m_options(options)
{
}

bool VaultStore::exists(const std::filesystem::path& path) const noexcept
{
    try
    {
        return m_files->exists(path);
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "exists check failed for ", path, ": ", e.what());
        return false;
    }
}

VaultResult<VaultKey> VaultStore::deriveFreshKey(const keyward::security::SecureString& passphrase) noexcept
{
    if (passphrase.empty() || !keyward::crypto::isAcceptable(m_options.kdf))
    {
        return VaultError::InvalidOptions;
    }

    std::array<std::uint8_t, keyward::crypto::g_kdfSaltBytes> salt{};
    auto saltWipe{ keyward::security::scopeWipe(std::span<std::uint8_t>{ salt }) };
    if (!m_crypto->randomBytes(std::span<std::uint8_t>{ salt }))
    {
        keyward::log::error(g_component, "salt generation failed");
        return VaultError::RandomFailed;
    }

    try
    {
        auto key{ m_crypto->deriveKey(keyward::security::asBytes(passphrase), salt, m_options.kdf) };
        return VaultKey{ m_crypto->cipherSuite(), m_options.kdf, salt, std::move(key) };
    }
    catch (const std::invalid_argument& e)
    {
        keyward::log::error(g_component, "key derivation rejected its input: ", e.what());
        return VaultError::InvalidOptions;
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "key derivation failed: ", e.what());
        return VaultError::CryptoError;
    }
}

VaultResult<SealedVault> VaultStore::seal(const VaultKey& key, const VaultBody& body) noexcept
{
    if (key.empty() || key.cipherSuite() != m_crypto->cipherSuite())
    {
        return VaultError::CryptoError;
    }

    SealedVault out{};
    out.header.cipherSuite = key.cipherSuite();
    out.header.kdf = key.kdf();
    out.header.salt = key.salt();
    if (!m_crypto->randomBytes(std::span<std::uint8_t>{ out.header.nonce }))
    {
        keyward::log::error(g_component, "nonce generation failed");
        return VaultError::RandomFailed;
    }

    try
    {
        const auto header{ encodeVaultHeader(out.header) };
        auto plain{ encodeVaultBody(body) };
        auto plainWipe{ keyward::security::scopeWipe(plain) };
        const auto sealed{ m_crypto->seal(key.key(), out.header.nonce, keyward::security::asBytes(plain),
                                          std::span<const std::byte>{ header }) };

        out.bytes.reserve(header.size() + sealed.size());
        std::transform(header.begin(), header.end(), std::back_inserter(out.bytes),
                       [](std::byte b) { return std::to_integer<std::uint8_t>(b); });
        out.bytes.insert(out.bytes.end(), sealed.begin(), sealed.end());
    }
    catch (const std::length_error& e)
    {
        keyward::log::error(g_component, "body not encodable: ", e.what());
        return VaultError::InvalidRecord;
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "sealing failed: ", e.what());
        return VaultError::CryptoError;
    }
    return out;
}

VaultResult<SealedVault> VaultStore::read(const std::filesystem::path& path) const noexcept
{
    SealedVault out{};
    try
    {
        out.bytes = m_files->readFile(path);
    }
    catch (const keyward::storage::VaultNotFound&)
    {
        return VaultError::NotFound;
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "read failed for ", path, ": ", e.what());
        return VaultError::IoError;
    }

    if (out.bytes.size() < g_vaultMinFileBytes)
    {
        keyward::log::warning(g_component, "vault file too short: ", path, " (", out.bytes.size(), " bytes)");
        return VaultError::CorruptFile;
    }

    const auto header{ decodeVaultHeader(headerBytes(out.bytes)) };
    if (!header)
    {
        keyward::log::warning(g_component, "vault header rejected: ", path);
        return VaultError::CorruptFile;
    }
    out.header = *header;
    return out;
}

VaultResult<UnlockedVault> VaultStore::open(SealedVault sealed,
                                            const keyward::security::SecureString& passphrase) noexcept
{
    if (sealed.header.cipherSuite != m_crypto->cipherSuite())
    {
        keyward::log::warning(g_component, "vault is sealed with ", keyward::crypto::cipherSuiteName(sealed.header.cipherSuite),
                              " but the active provider uses ", keyward::crypto::cipherSuiteName(m_crypto->cipherSuite()));
        return VaultError::CorruptFile;
    }
    if (passphrase.empty())
    {
        return VaultError::WrongPassphrase;
    }

    keyward::security::SecureBuffer key{};
    try
    {
        key = m_crypto->deriveKey(keyward::security::asBytes(passphrase), sealed.header.salt, sealed.header.kdf);
    }
    catch (const std::invalid_argument& e)
    {
        keyward::log::warning(g_component, "stored KDF parameters rejected: ", e.what());
        return VaultError::CorruptFile;
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "key derivation failed: ", e.what());
        return VaultError::CryptoError;
    }
    auto keyWipe{ keyward::security::scopeWipe(key) };

    std::optional<keyward::security::SecureBuffer> plain{};
    try
    {
        plain = m_crypto->open(key, sealed.header.nonce, payloadBytes(sealed.bytes), headerBytes(sealed.bytes));
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "decryption failed: ", e.what());
        return VaultError::CryptoError;
    }
    if (!plain)
    {
        return VaultError::WrongPassphrase;
    }
    auto plainWipe{ keyward::security::scopeWipe(*plain) };

    std::optional<VaultBody> body{};
    try
    {
        body = decodeVaultBody(keyward::security::asBytes(*plain));
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "body decoding failed: ", e.what());
        return VaultError::CorruptFile;
    }
    if (!body)
    {
        keyward::log::warning(g_component, "authenticated body failed structural checks");
        return VaultError::CorruptFile;
    }

    keyWipe.release();
    VaultKey vaultKey{ sealed.header.cipherSuite, sealed.header.kdf, sealed.header.salt, std::move(key) };
    return UnlockedVault{ std::move(vaultKey), std::move(*body), std::move(sealed) };
}

VaultResult<std::monostate> VaultStore::write(const std::filesystem::path& path, const SealedVault& sealed,
                                              bool backupExisting) noexcept
{
    std::filesystem::path temp{};
    try
    {
        if (backupExisting && m_options.maxBackups > 0U && m_files->exists(path))
        {
            const auto copy{ m_files->backup(path, m_options.maxBackups) };
            keyward::log::debug(g_component, "backup written: ", copy);
        }
        temp = m_files->writeTemp(path, sealed.bytes);
        m_files->commit(temp, path);
    }
    catch (const std::exception& e)
    {
        if (!temp.empty())
        {
            m_files->discard(temp);
        }
        keyward::log::error(g_component, "write failed for ", path, ": ", e.what());
        return VaultError::IoError;
    }
    return std::monostate{};
}

VaultResult<SealedVault> VaultStore::initialize(const std::filesystem::path& path,
                                                keyward::security::SecureString passphrase) noexcept
{
    auto passphraseWipe{ keyward::security::scopeWipe(passphrase) };

    try
    {
        if (m_files->exists(path))
        {
            return VaultError::AlreadyExists;
        }
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "exists check failed for ", path, ": ", e.what());
        return VaultError::IoError;
    }

    auto keyOrErr{ deriveFreshKey(passphrase) };
    if (isError(keyOrErr))
    {
        return errorOf(keyOrErr);
    }
    VaultKey key{ std::move(std::get<VaultKey>(keyOrErr)) };
    keyward::security::secureWipe(keyward::security::asWritableBytes(passphrase));

    const VaultBody body{};
    auto sealedOrErr{ seal(key, body) };
    key.wipe();
    if (isError(sealedOrErr))
    {
        return errorOf(sealedOrErr);
    }

    auto& sealed{ std::get<SealedVault>(sealedOrErr) };
    const auto written{ write(path, sealed, false) };
    if (isError(written))
    {
        return errorOf(written);
    }

    keyward::log::info(g_component, "vault initialized: ", path, " (", keyward::crypto::cipherSuiteName(sealed.header.cipherSuite), ")");
    return std::move(sealed);
}

VaultResult<UnlockedVault> VaultStore::unlock(const std::filesystem::path& path,
                                              const keyward::security::SecureString& passphrase) noexcept
{
    auto sealedOrErr{ read(path) };
    if (isError(sealedOrErr))
    {
        return errorOf(sealedOrErr);
    }

    auto opened{ open(std::move(std::get<SealedVault>(sealedOrErr)), passphrase) };
    if (isError(opened))
    {
        keyward::log::warning(g_component, "unlock failed for ", path, ": ", errorName(errorOf(opened)));
        return opened;
    }
    keyward::log::info(g_component, "vault unlocked: ", path, " (",
                       std::get<UnlockedVault>(opened).body.accounts().size(), " accounts)");
    return opened;
}

VaultResult<SealedVault> VaultStore::persist(const std::filesystem::path& path, const VaultKey& key,
                                             const VaultBody& body) noexcept
{
    auto sealedOrErr{ seal(key, body) };
    if (isError(sealedOrErr))
    {
        return sealedOrErr;
    }

    const auto written{ write(path, std::get<SealedVault>(sealedOrErr), true) };
    if (isError(written))
    {
        return errorOf(written);
    }
    keyward::log::info(g_component, "vault persisted: ", path, " (", body.accounts().size(), " accounts)");
    return sealedOrErr;
}

VaultResult<std::monostate> VaultStore::verify(const SealedVault& sealed,
                                               const keyward::security::SecureString& passphrase) noexcept
{
    auto copy{ sealed };
    auto opened{ open(std::move(copy), passphrase) };
    if (isError(opened))
    {
        return errorOf(opened);
    }
    return std::monostate{};
}

VaultResult<std::monostate> VaultStore::exportTo(const std::filesystem::path& target, const VaultBody& body,
                                                 const keyward::security::SecureString& passphrase) noexcept
{
    try
    {
        if (m_files->exists(target))
        {
            return VaultError::AlreadyExists;
        }
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "exists check failed for ", target, ": ", e.what());
        return VaultError::IoError;
    }

    auto keyOrErr{ deriveFreshKey(passphrase) };
    if (isError(keyOrErr))
    {
        return errorOf(keyOrErr);
    }
    const VaultKey key{ std::move(std::get<VaultKey>(keyOrErr)) };

    const auto sealedOrErr{ seal(key, body) };
    if (isError(sealedOrErr))
    {
        return errorOf(sealedOrErr);
    }
    const auto written{ write(target, std::get<SealedVault>(sealedOrErr), false) };
    if (isError(written))
    {
        return written;
    }
    keyward::log::info(g_component, "vault exported: ", target, " (", body.accounts().size(), " accounts)");
    return std::monostate{};
}

VaultResult<VaultBody> VaultStore::importFrom(const std::filesystem::path& source,
                                              const keyward::security::SecureString& passphrase) noexcept
{
    auto sealedOrErr{ read(source) };
    if (isError(sealedOrErr))
    {
        return errorOf(sealedOrErr);
    }
    auto opened{ open(std::move(std::get<SealedVault>(sealedOrErr)), passphrase) };
    if (isError(opened))
    {
        keyward::log::warning(g_component, "import failed for ", source, ": ", errorName(errorOf(opened)));
        return errorOf(opened);
    }
    return std::move(std::get<UnlockedVault>(opened).body);
}

VaultResult<std::monostate> VaultStore::destroy(const std::filesystem::path& path) noexcept
{
    try
    {
        m_files->remove(path);
    }
    catch (const keyward::storage::VaultNotFound&)
    {
        return VaultError::NotFound;
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "removal failed for ", path, ": ", e.what());
        return VaultError::IoError;
    }
    keyward::log::info(g_component, "vault removed: ", path);
    return std::monostate{};
}

VaultResult<VaultFileInfo> VaultStore::inspect(const std::filesystem::path& path) const noexcept
{
    auto sealedOrErr{ read(path) };
    if (isError(sealedOrErr))
    {
        return errorOf(sealedOrErr);
    }

    VaultFileInfo info{};
    info.header = std::get<SealedVault>(sealedOrErr).header;
    try
    {
        const auto st{ m_files->stat(path) };
        info.sizeBytes = st.sizeBytes;
        info.modified = st.modified;
        info.permissions = st.permissions;
        info.backupCount = m_files->listBackups(path).size();
    }
    catch (const keyward::storage::VaultNotFound&)
    {
        return VaultError::NotFound;
    }
    catch (const std::exception& e)
    {
        keyward::log::error(g_component, "stat failed for ", path, ": ", e.what());
        return VaultError::IoError;
    }
    return info;
}

} // namespace keyward::core
