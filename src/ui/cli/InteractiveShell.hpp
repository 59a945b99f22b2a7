#ifndef KEYWARD_UI_CLI_INTERACTIVESHELL_HPP
#define KEYWARD_UI_CLI_INTERACTIVESHELL_HPP

#include "keyward/core/Session.hpp"
#include "keyward/core/VaultStore.hpp"
#include "keyward/security/SecureMemory.hpp"

#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace keyward::ui::cli
{

// In tests: returns a pre-determined string.
using PasswordReader = std::function<keyward::security::SecureString(const std::string&)>;

class InteractiveShell final
{
public:
    InteractiveShell(keyward::core::VaultStore& store, std::filesystem::path vaultDir, std::string vaultName,
                     std::istream& in, std::ostream& out, PasswordReader pwdReader,
                     keyward::core::SessionOptions sessionOptions = {});

    int run();

    // Runs one command line; exposed for scripted use.
    void processLine(const std::string& line);

    // Drops unsaved changes and wipes the key of the selected vault. Callable from any thread.
    void lockNow() noexcept;

    [[nodiscard]] bool running() const noexcept
    {
        return m_running;
    }

private:
    struct AccountArgs
    {
        std::string name;
        std::string category;
        std::optional<std::string> url;
        std::optional<std::string> username;
        std::optional<std::string> notes;
        std::vector<std::string> tags;
        bool clearTags{ false };
        bool newSecret{ false };
        std::size_t generateLength{};
    };

    struct GenArgs
    {
        std::size_t length{ 16 };
        bool noLower{ false };
        bool noUpper{ false };
        bool noDigits{ false };
        bool noSpecial{ false };
        bool allowSimilar{ false };
        bool excludeAmbiguous{ false };
    };

    keyward::core::VaultStore& m_store;
    std::filesystem::path m_vaultDir;
    std::string m_vaultName;
    std::istream& m_in;
    std::ostream& m_out;
    PasswordReader m_pwdReader;
    keyward::core::SessionOptions m_sessionOptions;
    std::mutex m_sessionSwap; // guards replacing m_session against lockNow
    std::unique_ptr<keyward::core::Session> m_session;
    bool m_running{ true };

    [[nodiscard]] bool selectVault(const std::string& name);
    [[nodiscard]] std::optional<keyward::security::SecureString> readConfirmedPassphrase(const std::string& what);
    [[nodiscard]] std::optional<keyward::security::SecureString> secretFor(const AccountArgs& args);
    void reportError(keyward::core::VaultError e);
    void printAccount(const keyward::core::Account& a, bool reveal);

    void doExit(bool discard);
    void doStatus();
    void doInit();
    void doUnlock();
    void doLock(bool discard);
    void doSave();
    void doList(const std::optional<std::string>& search, const std::optional<std::string>& category,
                const std::optional<std::string>& tag);
    void doShow(std::uint64_t id, bool reveal);
    void doAdd(const AccountArgs& args);
    void doEdit(std::uint64_t id, const AccountArgs& args);
    void doRm(std::uint64_t id);
    void doGen(const GenArgs& args);
    void doStrength();
    void doVerify();
    void doExport(const std::string& path);
    void doImport(const std::string& path, bool replace);
    void doReset();
    void doInfo();
    void doVaults();
    void doUse(const std::string& name);
    void doAutoLock(std::uint32_t seconds);
};

} // namespace keyward::ui::cli

#endif // KEYWARD_UI_CLI_INTERACTIVESHELL_HPP
