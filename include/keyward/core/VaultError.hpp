#ifndef INCLUDE_KEYWARD_CORE_VAULTERROR_HPP
#define INCLUDE_KEYWARD_CORE_VAULTERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace keyward::core
{

enum class VaultError : std::uint8_t
{
    WrongPassphrase,
    CorruptFile,
    NotFound,
    AlreadyExists,
    InvalidOptions,
    IoError,
    InvalidRecord,
    VaultLocked,
    TooManyAttempts,
    RandomFailed,
    CryptoError,
    IdsExhausted,
};

template <class T> using VaultResult = std::variant<T, VaultError>;

template <class T> [[nodiscard]] bool isError(const VaultResult<T>& r) noexcept
{
    return std::holds_alternative<VaultError>(r);
}

// Short user-facing message; never includes secrets or paths.
[[nodiscard]] std::string_view describe(VaultError e) noexcept;

// Stable identifier for logs ("WrongPassphrase", ...).
[[nodiscard]] std::string_view errorName(VaultError e) noexcept;

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_VAULTERROR_HPP
