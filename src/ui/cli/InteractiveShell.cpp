#include "InteractiveShell.hpp"
#include "Tokenizer.hpp"
#include "keyward/core/PasswordGenerator.hpp"
#include "keyward/core/VaultLocation.hpp"
#include "keyward/security/ScopeWipe.hpp"

#include <CLI/CLI.hpp>
#include <ctime>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <vector>

namespace keyward::ui::cli
{
namespace
{

[[nodiscard]] std::string formatTime(std::uint64_t unixSeconds)
{
    const auto t{ static_cast<std::time_t>(unixSeconds) };
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr)
    {
        return std::to_string(unixSeconds);
    }
    std::ostringstream out;
    out << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

[[nodiscard]] std::string joinTags(const keyward::core::TagSet& tags)
{
    std::string out{};
    for (const auto& t : tags)
    {
        if (!out.empty())
        {
            out += ", ";
        }
        out += t;
    }
    return out;
}

[[nodiscard]] keyward::core::TagSet toTagSet(const std::vector<std::string>& tags)
{
    return keyward::core::TagSet{ tags.begin(), tags.end() };
}

} // namespace

InteractiveShell::InteractiveShell(keyward::core::VaultStore& store, std::filesystem::path vaultDir,
                                   std::string vaultName, std::istream& in, std::ostream& out,
                                   PasswordReader pwdReader, keyward::core::SessionOptions sessionOptions)
    : m_store(store), m_vaultDir(std::move(vaultDir)), m_vaultName(std::move(vaultName)), m_in(in), m_out(out),
      m_pwdReader(std::move(pwdReader)), m_sessionOptions(sessionOptions)
{
    if (!selectVault(m_vaultName))
    {
        m_out << "Error: Invalid vault name '" << m_vaultName << "', using '" << keyward::core::g_defaultVaultName
              << "'.\n";
        (void)selectVault(std::string{ keyward::core::g_defaultVaultName });
    }
}

int InteractiveShell::run()
{
    m_out << "Keyward Shell (CLI11 Powered)\n";
    m_out << "Type 'help' for available commands.\n";

    std::string line;
    while (m_running && m_in.good())
    {
        if (m_session->state() == keyward::core::SessionState::Unlocked)
        {
            m_out << "keyward(" << m_vaultName << (m_session->isDirty() ? "*" : "") << ")> ";
        }
        else
        {
            m_out << "keyward> ";
        }

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (line.empty())
        {
            continue;
        }

        processLine(line);
    }

    if (m_session->isDirty())
    {
        m_out << "Unsaved changes discarded.\n";
    }
    m_session->discardAndLock();
    return 0;
}

void InteractiveShell::processLine(const std::string& line)
{
    std::vector<std::string> userArgs;
    try
    {
        userArgs = Tokenizer::tokenize(line);
    }
    catch (const TokenizeError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
        return;
    }

    if (userArgs.empty())
    {
        return;
    }

    // 'help' prints the root help instead of the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("keyward");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "Keyward Shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });

    bool discardFlag{ false };
    auto* subExit = app.add_subcommand("exit", "Exit the shell")->alias("quit");
    subExit->add_flag("--discard", discardFlag, "Drop unsaved changes");
    subExit->callback([&]() { doExit(discardFlag); });

    app.add_subcommand("status", "Show the session state")->callback([this]() { doStatus(); });
    app.add_subcommand("init", "Create the selected vault")->callback([this]() { doInit(); });
    app.add_subcommand("unlock", "Unlock the selected vault")->callback([this]() { doUnlock(); });

    auto* subLock = app.add_subcommand("lock", "Save pending changes and lock");
    subLock->add_flag("--discard", discardFlag, "Drop unsaved changes instead of saving");
    subLock->callback([&]() { doLock(discardFlag); });

    app.add_subcommand("save", "Write pending changes")->callback([this]() { doSave(); });

    // LS
    std::string searchArg;
    std::string categoryArg;
    std::string tagArg;
    auto* subLs = app.add_subcommand("ls", "List accounts");
    auto* optSearch = subLs->add_option("--search,-s", searchArg, "Match name, url, username or notes");
    auto* optCategory = subLs->add_option("--category,-c", categoryArg, "Only this category");
    auto* optTag = subLs->add_option("--tag,-t", tagArg, "Only accounts with this tag");
    subLs->callback(
        [&]()
        {
            doList(optSearch->count() > 0 ? std::optional<std::string>{ searchArg } : std::nullopt,
                   optCategory->count() > 0 ? std::optional<std::string>{ categoryArg } : std::nullopt,
                   optTag->count() > 0 ? std::optional<std::string>{ tagArg } : std::nullopt);
        });

    // SHOW
    std::uint64_t idArg{};
    bool revealFlag{ false };
    auto* subShow = app.add_subcommand("show", "Show one account");
    subShow->add_option("id", idArg, "Account id")->required();
    subShow->add_flag("--reveal", revealFlag, "Print the secret");
    subShow->callback([&]() { doShow(idArg, revealFlag); });

    // ADD / EDIT share their field options.
    AccountArgs accountArgs{};
    std::string urlArg;
    std::string usernameArg;
    std::string notesArg;
    const auto addFieldOptions = [&](CLI::App* sub)
    {
        auto* optUrl = sub->add_option("--url", urlArg, "Website");
        auto* optUser = sub->add_option("--username,-u", usernameArg, "Login name");
        auto* optNotes = sub->add_option("--notes", notesArg, "Free text");
        sub->add_option("--category,-c", accountArgs.category, "social, banking, work, personal or a custom label");
        sub->add_option("--tag,-t", accountArgs.tags, "Tag (repeatable)");
        sub->add_option("--generate,-g", accountArgs.generateLength, "Generate a secret of this length");
        return [&accountArgs, &urlArg, &usernameArg, &notesArg, optUrl, optUser, optNotes]()
        {
            if (optUrl->count() > 0)
            {
                accountArgs.url = urlArg;
            }
            if (optUser->count() > 0)
            {
                accountArgs.username = usernameArg;
            }
            if (optNotes->count() > 0)
            {
                accountArgs.notes = notesArg;
            }
        };
    };

    auto* subAdd = app.add_subcommand("add", "Add an account (prompts for the secret)");
    subAdd->add_option("name", accountArgs.name, "Display name")->required();
    const auto collectAdd = addFieldOptions(subAdd);
    subAdd->callback(
        [&]()
        {
            collectAdd();
            doAdd(accountArgs);
        });

    auto* subEdit = app.add_subcommand("edit", "Change fields of an account");
    subEdit->add_option("id", idArg, "Account id")->required();
    auto* optName = subEdit->add_option("--name,-n", accountArgs.name, "New display name");
    subEdit->add_flag("--secret", accountArgs.newSecret, "Prompt for a new secret");
    subEdit->add_flag("--clear-tags", accountArgs.clearTags, "Remove all tags");
    const auto collectEdit = addFieldOptions(subEdit);
    subEdit->callback(
        [&]()
        {
            collectEdit();
            if (optName->count() == 0)
            {
                accountArgs.name.clear();
            }
            doEdit(idArg, accountArgs);
        });

    auto* subRm = app.add_subcommand("rm", "Delete an account");
    subRm->add_option("id", idArg, "Account id")->required();
    subRm->callback([&]() { doRm(idArg); });

    // GEN
    GenArgs genArgs{};
    auto* subGen = app.add_subcommand("gen", "Generate a password");
    subGen->add_option("--length,-l", genArgs.length, "Length (4-128)");
    subGen->add_flag("--no-lower", genArgs.noLower, "Leave out a-z");
    subGen->add_flag("--no-upper", genArgs.noUpper, "Leave out A-Z");
    subGen->add_flag("--no-digits", genArgs.noDigits, "Leave out 0-9");
    subGen->add_flag("--no-special", genArgs.noSpecial, "Leave out symbols");
    subGen->add_flag("--allow-similar", genArgs.allowSimilar, "Keep i l 1 L o 0 O");
    subGen->add_flag("--exclude-ambiguous", genArgs.excludeAmbiguous, "Drop brackets, quotes and slashes");
    subGen->callback([&]() { doGen(genArgs); });

    app.add_subcommand("strength", "Rate a password (prompts)")->callback([this]() { doStrength(); });
    app.add_subcommand("verify", "Check the master passphrase")->callback([this]() { doVerify(); });

    std::string pathArg;
    auto* subExport = app.add_subcommand("export", "Write the vault to a new file under another passphrase");
    subExport->add_option("path", pathArg, "Target file")->required();
    subExport->callback([&]() { doExport(pathArg); });

    bool replaceFlag{ false };
    auto* subImport = app.add_subcommand("import", "Merge accounts from an exported file");
    subImport->add_option("path", pathArg, "Source file")->required();
    subImport->add_flag("--replace", replaceFlag, "Drop current accounts first");
    subImport->callback([&]() { doImport(pathArg, replaceFlag); });

    app.add_subcommand("reset", "Delete the vault and its backups")->callback([this]() { doReset(); });
    app.add_subcommand("info", "Show vault file details")->callback([this]() { doInfo(); });
    app.add_subcommand("vaults", "List vaults in the vault directory")->callback([this]() { doVaults(); });

    std::string nameArg;
    auto* subUse = app.add_subcommand("use", "Switch to another vault");
    subUse->add_option("name", nameArg, "Vault name")->required();
    subUse->callback([&]() { doUse(nameArg); });

    std::uint32_t secondsArg{};
    auto* subAutoLock = app.add_subcommand("autolock", "Idle seconds before locking (0 disables)");
    subAutoLock->add_option("seconds", secondsArg, "Seconds")->required();
    subAutoLock->callback([&]() { doAutoLock(secondsArg); });

    // --- Parsing Execution ---
    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
}

void InteractiveShell::lockNow() noexcept
{
    const std::lock_guard<std::mutex> guard{ m_sessionSwap };
    if (m_session)
    {
        m_session->discardAndLock();
    }
}

// --- Helpers ---

bool InteractiveShell::selectVault(const std::string& name)
{
    auto path{ keyward::core::vaultPathFor(m_vaultDir, name) };
    if (keyward::core::isError(path))
    {
        return false;
    }
    auto next{ std::make_unique<keyward::core::Session>(m_store, std::get<std::filesystem::path>(path),
                                                        m_sessionOptions) };
    const std::lock_guard<std::mutex> guard{ m_sessionSwap };
    m_session = std::move(next);
    m_vaultName = name;
    return true;
}

std::optional<keyward::security::SecureString> InteractiveShell::readConfirmedPassphrase(const std::string& what)
{
    auto p1 = m_pwdReader("New " + what + ": ");
    auto wipeP1 = keyward::security::scopeWipe(p1);

    auto p2 = m_pwdReader("Confirm " + what + ": ");
    auto wipeP2 = keyward::security::scopeWipe(p2);

    if (p1.empty())
    {
        m_out << "Error: Passphrase must not be empty.\n";
        return std::nullopt;
    }
    if (!keyward::security::secureEquals(p1, p2))
    {
        m_out << "Error: Passphrases do not match.\n";
        return std::nullopt;
    }
    // The buffer moves into the result; only the confirmation copy is wiped here.
    wipeP1.release();
    return std::move(p1);
}

std::optional<keyward::security::SecureString> InteractiveShell::secretFor(const AccountArgs& args)
{
    if (args.generateLength > 0U)
    {
        keyward::core::PasswordOptions options{};
        options.length = args.generateLength;
        auto generated{ keyward::core::generatePassword(options) };
        if (keyward::core::isError(generated))
        {
            reportError(std::get<keyward::core::VaultError>(generated));
            return std::nullopt;
        }
        m_out << "Generated a " << args.generateLength << "-character secret.\n";
        return std::move(std::get<keyward::security::SecureString>(generated));
    }

    auto secret = m_pwdReader("Secret: ");
    if (secret.empty())
    {
        m_out << "Error: Secret must not be empty.\n";
        return std::nullopt;
    }
    const auto score{ keyward::core::estimateStrength(keyward::security::asStringView(secret)) };
    m_out << "Strength: " << keyward::core::strengthLabel(score) << " (" << static_cast<unsigned>(score) << "/100)\n";
    return secret;
}

void InteractiveShell::reportError(keyward::core::VaultError e)
{
    m_out << "Error: " << keyward::core::describe(e);
    if (e == keyward::core::VaultError::TooManyAttempts)
    {
        m_out << " (" << m_session->lockoutRemaining().count() << "s)";
    }
    m_out << ".\n";
}

void InteractiveShell::printAccount(const keyward::core::Account& a, bool reveal)
{
    m_out << "id:       " << a.id << "\n";
    m_out << "name:     " << a.name << "\n";
    m_out << "category: " << keyward::core::categoryName(a.category) << "\n";
    if (a.url)
    {
        m_out << "url:      " << *a.url << "\n";
    }
    if (a.username)
    {
        m_out << "username: " << *a.username << "\n";
    }
    m_out << "secret:   " << (reveal ? keyward::security::asStringView(a.secret) : std::string_view{ "********" })
          << "\n";
    if (a.notes)
    {
        m_out << "notes:    " << *a.notes << "\n";
    }
    if (!a.tags.empty())
    {
        m_out << "tags:     " << joinTags(a.tags) << "\n";
    }
    m_out << "created:  " << formatTime(a.createdAtUnixSeconds) << "\n";
    m_out << "modified: " << formatTime(a.modifiedAtUnixSeconds) << "\n";
}

// --- Handlers ---

void InteractiveShell::doExit(bool discard)
{
    if (m_session->isDirty() && !discard)
    {
        m_out << "Error: Unsaved changes. Run 'save' first or 'exit --discard'.\n";
        return;
    }
    m_session->discardAndLock();
    m_running = false;
}

void InteractiveShell::doStatus()
{
    m_out << "vault:  " << m_vaultName << " (" << m_session->vaultPath().string() << ")\n";
    const bool unlocked{ m_session->state() == keyward::core::SessionState::Unlocked };
    m_out << "state:  " << (unlocked ? "unlocked" : "locked") << (m_session->isDirty() ? ", unsaved changes" : "")
          << "\n";
    const auto wait{ m_session->lockoutRemaining() };
    if (wait.count() > 0)
    {
        m_out << "unlock blocked for " << wait.count() << "s\n";
    }
}

void InteractiveShell::doInit()
{
    if (m_store.exists(m_session->vaultPath()))
    {
        m_out << "Error: Vault already exists at " << m_session->vaultPath().string() << "\n";
        return;
    }

    auto pass = readConfirmedPassphrase("master passphrase");
    if (!pass)
    {
        return;
    }
    auto wipePass = keyward::security::scopeWipe(*pass);

    auto created = m_session->initialize(*pass);
    if (keyward::core::isError(created))
    {
        reportError(std::get<keyward::core::VaultError>(created));
        return;
    }
    m_out << "Vault created.\n";

    auto opened = m_session->unlock(*pass);
    if (keyward::core::isError(opened))
    {
        reportError(std::get<keyward::core::VaultError>(opened));
        return;
    }
    m_out << "Vault unlocked.\n";
}

void InteractiveShell::doUnlock()
{
    if (!m_store.exists(m_session->vaultPath()))
    {
        m_out << "Error: Vault does not exist at " << m_session->vaultPath().string() << "\n";
        return;
    }

    auto pass = m_pwdReader("Master passphrase: ");
    auto wipePass = keyward::security::scopeWipe(pass);

    auto result = m_session->unlock(pass);
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }
    m_out << "Vault unlocked.\n";
}

void InteractiveShell::doLock(bool discard)
{
    if (discard)
    {
        m_session->discardAndLock();
        m_out << "Vault locked, changes discarded.\n";
        return;
    }

    auto result = m_session->lock();
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        m_out << "Vault is still unlocked. Use 'lock --discard' to drop the changes.\n";
        return;
    }
    m_out << "Vault locked.\n";
}

void InteractiveShell::doSave()
{
    auto result = m_session->save();
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }
    m_out << "Vault saved.\n";
}

void InteractiveShell::doList(const std::optional<std::string>& search, const std::optional<std::string>& category,
                              const std::optional<std::string>& tag)
{
    keyward::core::AccountFilter filter{};
    filter.text = search;
    if (category)
    {
        filter.category = keyward::core::parseCategory(*category);
    }
    filter.tag = tag;

    auto result = m_session->list(filter);
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }

    const auto& accounts = std::get<std::vector<keyward::core::Account>>(result);
    if (accounts.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& a : accounts)
    {
        m_out << std::setw(4) << a.id << "  " << a.name << "  [" << keyward::core::categoryName(a.category) << "]";
        if (a.username)
        {
            m_out << "  " << *a.username;
        }
        m_out << "\n";
    }
}

void InteractiveShell::doShow(std::uint64_t id, bool reveal)
{
    auto result = m_session->get(id);
    if (auto* account = std::get_if<keyward::core::Account>(&result))
    {
        printAccount(*account, reveal);
        return;
    }
    reportError(std::get<keyward::core::VaultError>(result));
}

void InteractiveShell::doAdd(const AccountArgs& args)
{
    if (m_session->state() != keyward::core::SessionState::Unlocked)
    {
        reportError(keyward::core::VaultError::VaultLocked);
        return;
    }

    auto secret = secretFor(args);
    if (!secret)
    {
        return;
    }

    keyward::core::AccountFields fields{};
    fields.name = args.name;
    if (!args.category.empty())
    {
        fields.category = keyward::core::parseCategory(args.category);
    }
    fields.url = args.url;
    fields.username = args.username;
    fields.notes = args.notes;
    fields.tags = toTagSet(args.tags);
    fields.secret = std::move(*secret);

    auto result = m_session->add(std::move(fields));
    if (auto* account = std::get_if<keyward::core::Account>(&result))
    {
        m_out << "Account " << account->id << " added. Run 'save' to write it.\n";
        return;
    }
    reportError(std::get<keyward::core::VaultError>(result));
}

void InteractiveShell::doEdit(std::uint64_t id, const AccountArgs& args)
{
    if (m_session->state() != keyward::core::SessionState::Unlocked)
    {
        reportError(keyward::core::VaultError::VaultLocked);
        return;
    }

    keyward::core::AccountPatch patch{};
    if (!args.name.empty())
    {
        patch.name = args.name;
    }
    if (!args.category.empty())
    {
        patch.category = keyward::core::parseCategory(args.category);
    }
    patch.url = args.url;
    patch.username = args.username;
    patch.notes = args.notes;
    if (args.clearTags || !args.tags.empty())
    {
        patch.tags = toTagSet(args.tags);
    }
    if (args.newSecret || args.generateLength > 0U)
    {
        auto secret = secretFor(args);
        if (!secret)
        {
            return;
        }
        patch.secret = std::move(*secret);
    }

    auto result = m_session->edit(id, std::move(patch));
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }
    m_out << "Account " << id << " updated. Run 'save' to write it.\n";
}

void InteractiveShell::doRm(std::uint64_t id)
{
    auto result = m_session->remove(id);
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }
    m_out << "Account " << id << " removed. Run 'save' to write it.\n";
}

void InteractiveShell::doGen(const GenArgs& args)
{
    keyward::core::PasswordOptions options{};
    options.length = args.length;
    options.lowercase = !args.noLower;
    options.uppercase = !args.noUpper;
    options.digits = !args.noDigits;
    options.special = !args.noSpecial;
    options.excludeSimilar = !args.allowSimilar;
    options.excludeAmbiguous = args.excludeAmbiguous;

    auto result = keyward::core::generatePassword(options);
    if (auto* password = std::get_if<keyward::security::SecureString>(&result))
    {
        auto wipe = keyward::security::scopeWipe(*password);
        const auto view{ keyward::security::asStringView(*password) };
        const auto score{ keyward::core::estimateStrength(view) };
        m_out << view << "\n";
        m_out << "Strength: " << keyward::core::strengthLabel(score) << " (" << static_cast<unsigned>(score)
              << "/100)\n";
        return;
    }
    reportError(std::get<keyward::core::VaultError>(result));
}

void InteractiveShell::doStrength()
{
    auto pass = m_pwdReader("Password: ");
    auto wipePass = keyward::security::scopeWipe(pass);
    const auto score{ keyward::core::estimateStrength(keyward::security::asStringView(pass)) };
    m_out << "Strength: " << keyward::core::strengthLabel(score) << " (" << static_cast<unsigned>(score) << "/100)\n";
}

void InteractiveShell::doVerify()
{
    auto pass = m_pwdReader("Master passphrase: ");
    auto wipePass = keyward::security::scopeWipe(pass);

    auto result = m_session->verify(pass);
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }
    m_out << "Passphrase verified.\n";
}

void InteractiveShell::doExport(const std::string& path)
{
    if (m_session->state() != keyward::core::SessionState::Unlocked)
    {
        reportError(keyward::core::VaultError::VaultLocked);
        return;
    }

    auto pass = readConfirmedPassphrase("export passphrase");
    if (!pass)
    {
        return;
    }
    auto wipePass = keyward::security::scopeWipe(*pass);

    auto result = m_session->exportTo(path, *pass);
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }
    m_out << "Exported to " << path << "\n";
}

void InteractiveShell::doImport(const std::string& path, bool replace)
{
    if (m_session->state() != keyward::core::SessionState::Unlocked)
    {
        reportError(keyward::core::VaultError::VaultLocked);
        return;
    }

    auto pass = m_pwdReader("Import passphrase: ");
    auto wipePass = keyward::security::scopeWipe(pass);

    auto result = m_session->importFrom(path, pass,
                                        replace ? keyward::core::ImportMode::Replace : keyward::core::ImportMode::Merge);
    if (auto* count = std::get_if<std::size_t>(&result))
    {
        m_out << "Imported " << *count << " accounts. Run 'save' to write them.\n";
        return;
    }
    reportError(std::get<keyward::core::VaultError>(result));
}

void InteractiveShell::doReset()
{
    auto pass = m_pwdReader("Master passphrase: ");
    auto wipePass = keyward::security::scopeWipe(pass);

    m_out << "Type '" << m_vaultName << "' to delete this vault and its backups: ";
    std::string confirm;
    if (!std::getline(m_in, confirm) || confirm != m_vaultName)
    {
        m_out << "Reset cancelled.\n";
        return;
    }

    auto result = m_session->reset(pass);
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }
    m_out << "Vault deleted.\n";
}

void InteractiveShell::doInfo()
{
    auto result = m_store.inspect(m_session->vaultPath());
    if (auto* info = std::get_if<keyward::core::VaultFileInfo>(&result))
    {
        const auto& h = info->header;
        m_out << "path:     " << m_session->vaultPath().string() << "\n";
        m_out << "format:   v" << static_cast<unsigned>(h.formatVersion) << ", body schema "
              << static_cast<unsigned>(h.bodySchema) << "\n";
        m_out << "cipher:   " << keyward::crypto::cipherSuiteName(h.cipherSuite) << "\n";
        m_out << "argon2id: t=" << h.kdf.iterations << " m=" << h.kdf.memoryKiB << "KiB p=" << h.kdf.parallelism
              << "\n";
        m_out << "size:     " << info->sizeBytes << " bytes\n";
        m_out << "backups:  " << info->backupCount << "\n";
        return;
    }
    reportError(std::get<keyward::core::VaultError>(result));
}

void InteractiveShell::doVaults()
{
    auto result = keyward::core::listVaults(m_vaultDir);
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }

    const auto& names = std::get<std::vector<std::string>>(result);
    if (names.empty())
    {
        m_out << "(no vaults in " << m_vaultDir.string() << ")\n";
        return;
    }
    for (const auto& n : names)
    {
        m_out << (n == m_vaultName ? " * " : " - ") << n << "\n";
    }
}

void InteractiveShell::doUse(const std::string& name)
{
    if (!keyward::core::isValidVaultName(name))
    {
        reportError(keyward::core::VaultError::InvalidOptions);
        return;
    }

    auto locked = m_session->lock();
    if (keyward::core::isError(locked))
    {
        reportError(std::get<keyward::core::VaultError>(locked));
        return;
    }
    if (!selectVault(name))
    {
        reportError(keyward::core::VaultError::InvalidOptions);
        return;
    }
    m_out << "Selected vault '" << name << "'.\n";
}

void InteractiveShell::doAutoLock(std::uint32_t seconds)
{
    auto result = m_session->setAutoLock(seconds);
    if (keyward::core::isError(result))
    {
        reportError(std::get<keyward::core::VaultError>(result));
        return;
    }
    if (seconds == 0U)
    {
        m_out << "Auto-lock disabled. Run 'save' to keep the setting.\n";
    }
    else
    {
        m_out << "Auto-lock after " << seconds << "s idle. Run 'save' to keep the setting.\n";
    }
}

} // namespace keyward::ui::cli
