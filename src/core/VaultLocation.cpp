#include "keyward/core/VaultLocation.hpp"
#include "keyward/log/Log.hpp"
#include <algorithm>
#include <cstdlib>
#include <system_error>

namespace keyward::core
{

std::optional<std::string> processEnv(const char* name)
{
    // NOLINTNEXTLINE(concurrency-mt-unsafe)
    const char* value{ std::getenv(name) };
    if (value == nullptr)
    {
        return std::nullopt;
    }
    return std::string{ value };
}

std::optional<std::filesystem::path> configRoot(const EnvLookup& env)
{
    if (const auto xdg{ env("XDG_CONFIG_HOME") }; xdg && !xdg->empty())
    {
        const std::filesystem::path root{ *xdg };
        if (root.is_absolute())
        {
            return root;
        }
    }
    if (const auto home{ env("HOME") }; home && !home->empty())
    {
        return std::filesystem::path{ *home } / ".config";
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> defaultVaultDirectory(const EnvLookup& env)
{
    if (const auto dir{ env("KEYW_VAULT_DIR") }; dir && !dir->empty())
    {
        return std::filesystem::path{ *dir };
    }
    const auto root{ configRoot(env) };
    if (!root)
    {
        return std::nullopt;
    }
    return *root / "keyward" / "vaults";
}

bool isValidVaultName(std::string_view name) noexcept
{
    if (name.empty() || name.front() == '.')
    {
        return false;
    }
    return std::none_of(name.begin(), name.end(), [](char c) { return c == '/' || c == '\\' || c == '\0'; });
}

VaultResult<std::filesystem::path> vaultPathFor(const std::filesystem::path& dir, std::string_view name)
{
    if (!isValidVaultName(name))
    {
        return VaultError::InvalidOptions;
    }
    return dir / (std::string{ name } + std::string{ g_vaultFileExtension });
}

VaultResult<std::vector<std::string>> listVaults(const std::filesystem::path& dir) noexcept
{
    try
    {
        std::vector<std::string> out{};
        std::error_code ec{};
        if (!std::filesystem::is_directory(dir, ec))
        {
            return out;
        }
        for (const auto& entry : std::filesystem::directory_iterator{ dir })
        {
            const auto& p{ entry.path() };
            if (entry.is_regular_file() && p.extension() == g_vaultFileExtension &&
                isValidVaultName(p.stem().string()))
            {
                out.push_back(p.stem().string());
            }
        }
        std::sort(out.begin(), out.end());
        return out;
    }
    catch (const std::exception& e)
    {
        keyward::log::error("config", "listing vaults in ", dir, " failed: ", e.what());
        return VaultError::IoError;
    }
}

} // namespace keyward::core
