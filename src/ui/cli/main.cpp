#include "ConsoleUtils.hpp"
#include "InteractiveShell.hpp"
#include "SignalWatcher.hpp"
#include "keyward/core/KdfPolicy.hpp"
#include "keyward/core/VaultLocation.hpp"
#include "keyward/core/VaultStore.hpp"
#include "keyward/crypto/providers/NativeProviderFactory.hpp"
#include "keyward/log/Log.hpp"
#include "keyward/storage/posix/PosixFileRepositoryFactory.hpp"

#include <CLI/CLI.hpp>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#if defined(KEYW_ENABLE_OPENSSL)
#include "keyward/crypto/providers/OpenSslProviderFactory.hpp"
#endif

namespace
{

[[nodiscard]] std::unique_ptr<keyward::crypto::ICryptoProvider> makeProvider(const std::string& name)
{
#if defined(KEYW_ENABLE_OPENSSL)
    if (name == "openssl")
    {
        return keyward::crypto::providers::makeOpenSslCryptoProvider();
    }
#endif
    if (name == "native")
    {
        return keyward::crypto::providers::makeNativeCryptoProvider();
    }
    return nullptr;
}

[[nodiscard]] std::string defaultProviderName()
{
#if defined(KEYW_ENABLE_OPENSSL)
    return "openssl";
#else
    return "native";
#endif
}

} // namespace

int main(int argc, char** argv)
{
    CLI::App app{ "Keyward - local encrypted secrets vault" };

    std::string vaultName{ keyward::core::g_defaultVaultName };
    std::string vaultDirArg;
    std::string providerName{ defaultProviderName() };
    std::string logLevelArg;

    app.add_option("--vault", vaultName, "Vault name inside the vault directory")->capture_default_str();
    app.add_option("--vault-dir", vaultDirArg, "Directory holding vault files (default: $KEYW_VAULT_DIR or "
                                               "$XDG_CONFIG_HOME/keyward/vaults)");
    app.add_option("--provider", providerName, "Crypto backend: native (ChaCha20-Poly1305) or openssl (AES-256-GCM)")
        ->capture_default_str();
    app.add_option("--log-level", logLevelArg, "debug, info, warning, error or off (default: $KEYW_LOG_LEVEL or warning)");

    CLI11_PARSE(app, argc, argv);

    try
    {
        if (logLevelArg.empty())
        {
            logLevelArg = keyward::core::processEnv("KEYW_LOG_LEVEL").value_or("");
        }
        if (!logLevelArg.empty())
        {
            const auto level{ keyward::log::parseLevel(logLevelArg) };
            if (!level)
            {
                std::cerr << "unknown log level: " << logLevelArg << '\n';
                return 2;
            }
            keyward::log::setLevel(*level);
        }

        const auto hardening{ keyward::ui::cli::hardenProcess() };
        if (hardening.memory == keyward::ui::cli::MemoryLock::None)
        {
            keyward::log::warning("cli", "process memory is not pinned; secrets may reach swap");
        }
        if (!hardening.coreDumpsDisabled)
        {
            keyward::log::warning("cli", "core dumps remain enabled");
        }
        const keyward::ui::cli::SavedTerminal terminal{};

        std::filesystem::path vaultDir{ vaultDirArg };
        if (vaultDir.empty())
        {
            const auto resolved{ keyward::core::defaultVaultDirectory() };
            if (!resolved)
            {
                std::cerr << "cannot resolve a vault directory; set HOME, XDG_CONFIG_HOME or use --vault-dir\n";
                return 2;
            }
            vaultDir = *resolved;
        }

        auto crypto{ makeProvider(providerName) };
        if (!crypto)
        {
            std::cerr << "unknown or unavailable provider: " << providerName << '\n';
            return 2;
        }
        auto files{ keyward::storage::posix::makePosixFileRepository() };
        keyward::core::VaultStore store{ *crypto, *files };

        keyward::ui::cli::InteractiveShell shell{
            store,     vaultDir,  vaultName,
            std::cin,  std::cout, [](const std::string& prompt) { return keyward::ui::cli::readPassword(prompt); }
        };
        // The process ends from the signal thread; the main thread may be blocked reading input.
        const keyward::ui::cli::SignalWatcher signals{ [&shell, &terminal](int sig) {
            shell.lockNow();
            terminal.restore();
            std::cerr << "\nInterrupted. Vault locked, unsaved changes discarded.\n" << std::flush;
            std::_Exit(128 + sig);
        } };
        return shell.run();
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
