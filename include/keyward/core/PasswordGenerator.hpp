#ifndef INCLUDE_KEYWARD_CORE_PASSWORDGENERATOR_HPP
#define INCLUDE_KEYWARD_CORE_PASSWORDGENERATOR_HPP

#include "keyward/core/VaultError.hpp"
#include "keyward/security/SecureMemory.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <string>
#include <string_view>

namespace keyward::core
{

constexpr std::size_t g_minPasswordLength{ 4 };
constexpr std::size_t g_maxPasswordLength{ 128 };
constexpr std::size_t g_defaultPasswordLength{ 16 };

constexpr std::string_view g_lowercaseChars{ "abcdefghijklmnopqrstuvwxyz" };
constexpr std::string_view g_uppercaseChars{ "ABCDEFGHIJKLMNOPQRSTUVWXYZ" };
constexpr std::string_view g_digitChars{ "0123456789" };
constexpr std::string_view g_specialChars{ "!@#$%^&*()_+-=[]{}|;:,.<>?" };

// Visually confusable glyphs.
constexpr std::string_view g_similarChars{ "il1LoO0" };
// Characters that are awkward to read out or type: brackets, quotes, slashes and separators.
constexpr std::string_view g_ambiguousChars{ "{}[]()/\\'\"`~,;:.<>" };

struct PasswordOptions final
{
    std::size_t length{ g_defaultPasswordLength };
    bool lowercase{ true };
    bool uppercase{ true };
    bool digits{ true };
    bool special{ true };
    bool excludeSimilar{ true };
    bool excludeAmbiguous{ false };
};

// Returns a uniform index in [0, size) through `out`; false on failure.
using RandomIndexSource = std::function<bool(std::size_t size, std::size_t& out)>;

// The enabled classes minus the excluded tables, in class order without duplicates.
[[nodiscard]] std::string effectiveCharset(const PasswordOptions& options);

// Each character is drawn independently and uniformly from effectiveCharset(). No class is forced,
// so a short password may miss an enabled class.
// Errors: InvalidOptions (length outside [4, 128] or empty charset), RandomFailed.
[[nodiscard]] VaultResult<keyward::security::SecureString> generatePassword(const PasswordOptions& options);
[[nodiscard]] VaultResult<keyward::security::SecureString> generatePassword(const PasswordOptions& options,
                                                                            const RandomIndexSource& random);

// Heuristic score in [0, 100].
[[nodiscard]] std::uint8_t estimateStrength(std::string_view password);

// "Very Weak", "Weak", "Fair", "Good", "Strong" or "Very Strong".
[[nodiscard]] std::string_view strengthLabel(std::uint8_t score) noexcept;

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_PASSWORDGENERATOR_HPP
