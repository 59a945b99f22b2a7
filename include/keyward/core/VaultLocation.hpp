#ifndef INCLUDE_KEYWARD_CORE_VAULTLOCATION_HPP
#define INCLUDE_KEYWARD_CORE_VAULTLOCATION_HPP

#include "keyward/core/VaultError.hpp"
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace keyward::core
{

constexpr std::string_view g_defaultVaultName{ "default" };
constexpr std::string_view g_vaultFileExtension{ ".vault" };

// Environment lookup, replaceable in tests. Returns std::nullopt for an unset variable.
using EnvLookup = std::function<std::optional<std::string>(const char* name)>;

[[nodiscard]] std::optional<std::string> processEnv(const char* name);

// $XDG_CONFIG_HOME when set and absolute, otherwise $HOME/.config. std::nullopt when neither is usable.
[[nodiscard]] std::optional<std::filesystem::path> configRoot(const EnvLookup& env = processEnv);

// $KEYW_VAULT_DIR, or <config-root>/keyward/vaults.
[[nodiscard]] std::optional<std::filesystem::path> defaultVaultDirectory(const EnvLookup& env = processEnv);

[[nodiscard]] bool isValidVaultName(std::string_view name) noexcept;

// <dir>/<name>.vault. InvalidOptions for a name that is not a plain file stem.
[[nodiscard]] VaultResult<std::filesystem::path> vaultPathFor(const std::filesystem::path& dir, std::string_view name);

// Sorted stems of the *.vault files directly inside dir; empty when dir does not exist.
[[nodiscard]] VaultResult<std::vector<std::string>> listVaults(const std::filesystem::path& dir) noexcept;

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_VAULTLOCATION_HPP
