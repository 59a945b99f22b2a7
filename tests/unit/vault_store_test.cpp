#include <gtest/gtest.h>

#include <filesystem>
#include <functional>
#include <memory>
#include <set>
#include <string>
#include <variant>
#include <vector>

#include "keyward/core/VaultStore.hpp"
#include "keyward/crypto/providers/NativeProviderFactory.hpp"
#include "keyward/storage/posix/PosixFileRepositoryFactory.hpp"
#include "test_utils/TestUtils.hpp"

#if defined(KEYW_ENABLE_OPENSSL)
#include "keyward/crypto/providers/OpenSslProviderFactory.hpp"
#endif

namespace
{

namespace fs = std::filesystem;
using keyward::core::AccountFields;
using keyward::core::SealedVault;
using keyward::core::UnlockedVault;
using keyward::core::VaultError;
using keyward::core::VaultStore;
using keyward::security::secureStringFrom;

using ProviderFactory = std::function<std::unique_ptr<keyward::crypto::ICryptoProvider>()>;

struct ProviderCase final
{
    const char* name;
    ProviderFactory make;
};

std::vector<ProviderCase> providerCases()
{
    std::vector<ProviderCase> out{ { "Native", &keyward::crypto::providers::makeNativeCryptoProvider } };
#if defined(KEYW_ENABLE_OPENSSL)
    out.push_back({ "OpenSsl", &keyward::crypto::providers::makeOpenSslCryptoProvider });
#endif
    return out;
}

template <class T> const T& ok(const keyward::core::VaultResult<T>& r)
{
    EXPECT_FALSE(keyward::core::isError(r)) << keyward::core::errorName(std::get<VaultError>(r));
    return std::get<T>(r);
}

template <class T> VaultError err(const keyward::core::VaultResult<T>& r)
{
    EXPECT_TRUE(keyward::core::isError(r));
    return std::get<VaultError>(r);
}

class VaultStoreTest : public ::testing::TestWithParam<ProviderCase>
{
protected:
    keyward::test_utils::TempDir m_tmp{ "store_" };
    std::unique_ptr<keyward::crypto::ICryptoProvider> m_inner{ GetParam().make() };
    keyward::test_utils::RecordingCryptoProvider m_crypto{ *m_inner };
    std::unique_ptr<keyward::storage::IVaultFileRepository> m_files{
        keyward::storage::posix::makePosixFileRepository()
    };
    VaultStore m_store{ m_crypto, *m_files, { .kdf = keyward::test_utils::fastKdfParams(), .maxBackups = 3U } };
    fs::path m_path{ m_tmp / "vaults" / "default.vault" };

    void SetUp() override
    {
        ASSERT_TRUE(m_tmp.valid());
    }

    void initialize(std::string_view passphrase)
    {
        ASSERT_FALSE(keyward::core::isError(m_store.initialize(m_path, secureStringFrom(passphrase))));
    }
};

} // namespace

TEST_P(VaultStoreTest, InitializeThenUnlockYieldsEmptyVaultAndRejectsWrongPassphrase)
{
    initialize("Tr0ub4dor&3");

    const auto unlocked{ m_store.unlock(m_path, secureStringFrom("Tr0ub4dor&3")) };
    EXPECT_TRUE(ok(unlocked).body.accounts().empty());
    EXPECT_EQ(ok(unlocked).key.cipherSuite(), m_inner->cipherSuite());

    EXPECT_EQ(err(m_store.unlock(m_path, secureStringFrom("wrong"))), VaultError::WrongPassphrase);
    EXPECT_EQ(err(m_store.unlock(m_path, secureStringFrom(""))), VaultError::WrongPassphrase);
}

TEST_P(VaultStoreTest, InitializeRefusesExistingFileAndEmptyPassphrase)
{
    initialize("first");
    const auto before{ keyward::test_utils::readAll(m_path) };

    EXPECT_EQ(err(m_store.initialize(m_path, secureStringFrom("second"))), VaultError::AlreadyExists);
    EXPECT_EQ(keyward::test_utils::readAll(m_path), before);

    EXPECT_EQ(err(m_store.initialize(m_tmp / "other.vault", secureStringFrom(""))), VaultError::InvalidOptions);
    EXPECT_FALSE(m_store.exists(m_tmp / "other.vault"));
}

TEST_P(VaultStoreTest, UnlockMissingFileIsNotFound)
{
    EXPECT_EQ(err(m_store.unlock(m_tmp / "missing.vault", secureStringFrom("x"))), VaultError::NotFound);
}

TEST_P(VaultStoreTest, PersistedAccountSurvivesUnlockWithSameIdentifier)
{
    initialize("Tr0ub4dor&3");
    auto unlocked{ m_store.unlock(m_path, secureStringFrom("Tr0ub4dor&3")) };
    auto& v{ std::get<UnlockedVault>(unlocked) };

    AccountFields f{};
    f.name = "GitHub";
    f.secret = secureStringFrom("abc123");
    const auto id{ ok(v.body.create(std::move(f))).id };
    (void)ok(m_store.persist(m_path, v.key, v.body));

    const auto again{ m_store.unlock(m_path, secureStringFrom("Tr0ub4dor&3")) };
    const auto& accounts{ ok(again).body.accounts() };
    ASSERT_EQ(accounts.size(), 1U);
    EXPECT_EQ(accounts.front().name, "GitHub");
    EXPECT_EQ(keyward::security::asStringView(accounts.front().secret), "abc123");
    EXPECT_EQ(accounts.front().id, id);
}

TEST_P(VaultStoreTest, CorruptVersionByteIsCorruptFile)
{
    initialize("Tr0ub4dor&3");
    auto bytes{ keyward::test_utils::readAll(m_path) };
    bytes[keyward::core::g_vaultVersionOffset] = 0x7FU;
    keyward::test_utils::writeAll(m_path, bytes);

    EXPECT_EQ(err(m_store.unlock(m_path, secureStringFrom("Tr0ub4dor&3"))), VaultError::CorruptFile);
}

TEST_P(VaultStoreTest, TruncatedOrTamperedFiles)
{
    initialize("pw");
    const auto good{ keyward::test_utils::readAll(m_path) };

    keyward::test_utils::writeAll(m_path, std::span{ good }.first(keyward::core::g_vaultMinFileBytes - 1U));
    EXPECT_EQ(err(m_store.unlock(m_path, secureStringFrom("pw"))), VaultError::CorruptFile);

    // Header bytes are authenticated: a flipped salt byte still parses but fails the tag.
    auto saltFlip{ good };
    saltFlip[20] ^= 0x01U;
    keyward::test_utils::writeAll(m_path, saltFlip);
    EXPECT_EQ(err(m_store.unlock(m_path, secureStringFrom("pw"))), VaultError::WrongPassphrase);

    auto bodyFlip{ good };
    bodyFlip.back() ^= 0x01U;
    keyward::test_utils::writeAll(m_path, bodyFlip);
    EXPECT_EQ(err(m_store.unlock(m_path, secureStringFrom("pw"))), VaultError::WrongPassphrase);
}

TEST_P(VaultStoreTest, EveryPersistUsesFreshNonceAndKeepsSalt)
{
    initialize("pw");
    auto unlocked{ m_store.unlock(m_path, secureStringFrom("pw")) };
    auto& v{ std::get<UnlockedVault>(unlocked) };

    for (int i{}; i < 4; ++i)
    {
        const auto sealed{ m_store.persist(m_path, v.key, v.body) };
        EXPECT_EQ(ok(sealed).header.salt, v.key.salt());
    }

    const auto& nonces{ m_crypto.nonces() };
    ASSERT_EQ(nonces.size(), 5U);
    const std::set<std::vector<std::uint8_t>> distinct{ nonces.begin(), nonces.end() };
    EXPECT_EQ(distinct.size(), nonces.size());
}

TEST_P(VaultStoreTest, FilesAreOwnerReadWriteOnly)
{
    initialize("pw");
    const auto perms{ fs::status(m_path).permissions() & fs::perms::all };
    EXPECT_EQ(perms, fs::perms::owner_read | fs::perms::owner_write);

    const auto info{ m_store.inspect(m_path) };
    EXPECT_EQ(ok(info).permissions & fs::perms::all, perms);
    EXPECT_EQ(ok(info).header.kdf, keyward::test_utils::fastKdfParams());
    EXPECT_EQ(ok(info).backupCount, 0U);
}

TEST_P(VaultStoreTest, PersistKeepsBoundedBackupsOfPreviousVersions)
{
    initialize("pw");
    auto unlocked{ m_store.unlock(m_path, secureStringFrom("pw")) };
    auto& v{ std::get<UnlockedVault>(unlocked) };

    const auto firstVersion{ keyward::test_utils::readAll(m_path) };
    (void)ok(m_store.persist(m_path, v.key, v.body));
    const auto backups{ m_files->listBackups(m_path) };
    ASSERT_EQ(backups.size(), 1U);
    EXPECT_EQ(keyward::test_utils::readAll(backups.front()), firstVersion);

    for (int i{}; i < 5; ++i)
    {
        (void)ok(m_store.persist(m_path, v.key, v.body));
    }
    EXPECT_EQ(m_files->listBackups(m_path).size(), 3U);
    EXPECT_EQ(ok(m_store.inspect(m_path)).backupCount, 3U);
}

TEST_P(VaultStoreTest, VerifyChecksPassphraseAgainstLoadedFile)
{
    initialize("pw");
    const auto unlocked{ m_store.unlock(m_path, secureStringFrom("pw")) };
    const SealedVault& sealed{ ok(unlocked).sealed };

    EXPECT_FALSE(keyward::core::isError(m_store.verify(sealed, secureStringFrom("pw"))));
    EXPECT_EQ(err(m_store.verify(sealed, secureStringFrom("pW"))), VaultError::WrongPassphrase);
}

TEST_P(VaultStoreTest, ExportUsesSeparatePassphraseAndImportReadsItBack)
{
    initialize("pw");
    auto unlocked{ m_store.unlock(m_path, secureStringFrom("pw")) };
    auto& v{ std::get<UnlockedVault>(unlocked) };
    AccountFields f{};
    f.name = "Bank";
    f.secret = secureStringFrom("1234");
    (void)ok(v.body.create(std::move(f)));

    const fs::path exported{ m_tmp / "transfer.vault" };
    EXPECT_FALSE(keyward::core::isError(m_store.exportTo(exported, v.body, secureStringFrom("transfer"))));
    EXPECT_EQ(err(m_store.exportTo(exported, v.body, secureStringFrom("transfer"))), VaultError::AlreadyExists);

    EXPECT_EQ(err(m_store.importFrom(exported, secureStringFrom("pw"))), VaultError::WrongPassphrase);
    const auto imported{ m_store.importFrom(exported, secureStringFrom("transfer")) };
    ASSERT_EQ(ok(imported).accounts().size(), 1U);
    EXPECT_EQ(ok(imported).accounts().front().name, "Bank");

    EXPECT_NE(ok(m_store.inspect(exported)).header.salt, ok(m_store.inspect(m_path)).header.salt);
}

TEST_P(VaultStoreTest, DestroyRemovesVaultAndBackups)
{
    initialize("pw");
    auto unlocked{ m_store.unlock(m_path, secureStringFrom("pw")) };
    auto& v{ std::get<UnlockedVault>(unlocked) };
    (void)ok(m_store.persist(m_path, v.key, v.body));

    EXPECT_FALSE(keyward::core::isError(m_store.destroy(m_path)));
    EXPECT_FALSE(m_store.exists(m_path));
    EXPECT_TRUE(m_files->listBackups(m_path).empty());
    EXPECT_EQ(err(m_store.destroy(m_path)), VaultError::NotFound);
    EXPECT_EQ(err(m_store.inspect(m_path)), VaultError::NotFound);
}

INSTANTIATE_TEST_SUITE_P(Providers, VaultStoreTest, ::testing::ValuesIn(providerCases()),
                         [](const ::testing::TestParamInfo<ProviderCase>& info) { return std::string{ info.param.name }; });

TEST(VaultStoreSuite, FileFromOtherSuiteIsCorruptFile)
{
#if defined(KEYW_ENABLE_OPENSSL)
    keyward::test_utils::TempDir tmp{ "store_" };
    ASSERT_TRUE(tmp.valid());
    auto files{ keyward::storage::posix::makePosixFileRepository() };
    auto native{ keyward::crypto::providers::makeNativeCryptoProvider() };
    auto openssl{ keyward::crypto::providers::makeOpenSslCryptoProvider() };
    VaultStore nativeStore{ *native, *files, { .kdf = keyward::test_utils::fastKdfParams() } };
    VaultStore opensslStore{ *openssl, *files, { .kdf = keyward::test_utils::fastKdfParams() } };

    const fs::path path{ tmp / "default.vault" };
    ASSERT_FALSE(keyward::core::isError(nativeStore.initialize(path, secureStringFrom("pw"))));
    EXPECT_EQ(err(opensslStore.unlock(path, secureStringFrom("pw"))), VaultError::CorruptFile);
#else
    GTEST_SKIP() << "Built without the OpenSSL provider.";
#endif
}
