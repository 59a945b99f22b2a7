#include "keyward/core/PasswordGenerator.hpp"
#include "keyward/log/Log.hpp"
#include "keyward/security/SecureRandom.hpp"
#include <algorithm>
#include <array>
#include <cctype>

namespace keyward::core
{
namespace
{

constexpr std::array<std::string_view, 4> g_keyboardRuns{ "qwertyuiop", "asdfghjkl", "zxcvbnm", "1234567890" };

constexpr std::array<std::string_view, 15> g_commonPasswords{
    "password", "123456", "123456789", "qwerty",    "abc123", "password123", "admin",  "letmein",
    "welcome",  "monkey", "1234567890", "password1", "qwerty123", "dragon", "master",
};

[[nodiscard]] bool contains(std::string_view set, char c) noexcept
{
    return set.find(c) != std::string_view::npos;
}

[[nodiscard]] std::uint32_t lengthBonus(std::size_t length) noexcept
{
    if (length < 8U)
    {
        return 10U;
    }
    if (length < 12U)
    {
        return 20U;
    }
    if (length < 16U)
    {
        return 30U;
    }
    if (length < 20U)
    {
        return 40U;
    }
    if (length < 24U)
    {
        return 50U;
    }
    return 60U;
}

[[nodiscard]] bool hasRepeatingPattern(std::string_view password) noexcept
{
    for (std::size_t i{}; i + 2U < password.size(); ++i)
    {
        if (password[i] == password[i + 1U] && password[i + 1U] == password[i + 2U])
        {
            return true;
        }
    }

    for (std::size_t i{}; i + 2U < password.size(); ++i)
    {
        const auto triple{ password.substr(i, 3U) };
        for (const auto run : g_keyboardRuns)
        {
            if (run.find(triple) != std::string_view::npos)
            {
                return true;
            }
        }
    }
    return false;
}

[[nodiscard]] bool isCommonPassword(std::string_view password)
{
    std::string lowered{ password };
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const bool common{ std::find(g_commonPasswords.begin(), g_commonPasswords.end(), lowered) !=
                       g_commonPasswords.end() };
    keyward::security::secureWipe(std::span<char>{ lowered.data(), lowered.size() });
    return common;
}

} // namespace

std::string effectiveCharset(const PasswordOptions& options)
{
    std::string charset{};
    const auto append = [&charset, &options](std::string_view chars)
    {
        for (const char c : chars)
        {
            if (options.excludeSimilar && contains(g_similarChars, c))
            {
                continue;
            }
            if (options.excludeAmbiguous && contains(g_ambiguousChars, c))
            {
                continue;
            }
            if (charset.find(c) == std::string::npos)
            {
                charset.push_back(c);
            }
        }
    };

    if (options.lowercase)
    {
        append(g_lowercaseChars);
    }
    if (options.uppercase)
    {
        append(g_uppercaseChars);
    }
    if (options.digits)
    {
        append(g_digitChars);
    }
    if (options.special)
    {
        append(g_specialChars);
    }
    return charset;
}

VaultResult<keyward::security::SecureString> generatePassword(const PasswordOptions& options)
{
    return generatePassword(options, [](std::size_t size, std::size_t& out)
                            { return keyward::security::secureRandomIndex(size, out); });
}

VaultResult<keyward::security::SecureString> generatePassword(const PasswordOptions& options,
                                                              const RandomIndexSource& random)
{
    if (options.length < g_minPasswordLength || options.length > g_maxPasswordLength)
    {
        return VaultError::InvalidOptions;
    }
    const std::string charset{ effectiveCharset(options) };
    if (charset.empty())
    {
        return VaultError::InvalidOptions;
    }

    keyward::security::SecureString out{};
    out.reserve(options.length);
    for (std::size_t i{}; i < options.length; ++i)
    {
        std::size_t index{};
        if (!random(charset.size(), index) || index >= charset.size())
        {
            keyward::log::error("generator", "random source failed");
            return VaultError::RandomFailed;
        }
        out.push_back(charset[index]);
    }
    return out;
}

std::uint8_t estimateStrength(std::string_view password)
{
    if (password.empty())
    {
        return 0U;
    }

    std::uint32_t score{ lengthBonus(password.size()) };

    const auto any = [password](auto pred)
    { return std::any_of(password.begin(), password.end(), [&pred](char c) { return pred(static_cast<unsigned char>(c)); }); };
    score += any([](unsigned char c) { return std::isupper(c) != 0; }) ? 10U : 0U;
    score += any([](unsigned char c) { return std::islower(c) != 0; }) ? 10U : 0U;
    score += any([](unsigned char c) { return std::isdigit(c) != 0; }) ? 10U : 0U;
    score += any([](unsigned char c) { return contains(g_specialChars, static_cast<char>(c)); }) ? 10U : 0U;

    if (hasRepeatingPattern(password))
    {
        score = score > 20U ? score - 20U : 0U;
    }
    if (isCommonPassword(password))
    {
        score = score > 30U ? score - 30U : 0U;
    }
    return static_cast<std::uint8_t>(std::min<std::uint32_t>(score, 100U));
}

std::string_view strengthLabel(std::uint8_t score) noexcept
{
    if (score <= 20U)
    {
        return "Very Weak";
    }
    if (score <= 40U)
    {
        return "Weak";
    }
    if (score <= 60U)
    {
        return "Fair";
    }
    if (score <= 80U)
    {
        return "Good";
    }
    if (score <= 90U)
    {
        return "Strong";
    }
    return "Very Strong";
}

} // namespace keyward::core
