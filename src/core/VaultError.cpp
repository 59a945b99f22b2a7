#include "keyward/core/VaultError.hpp"

namespace keyward::core
{

std::string_view describe(VaultError e) noexcept
{
    switch (e)
    {
    case VaultError::WrongPassphrase:
        return "wrong passphrase";
    case VaultError::CorruptFile:
        return "vault file is damaged or in an unsupported format";
    case VaultError::NotFound:
        return "no vault or record found";
    case VaultError::AlreadyExists:
        return "a file already exists at that location";
    case VaultError::InvalidOptions:
        return "invalid options";
    case VaultError::IoError:
        return "file system error";
    case VaultError::InvalidRecord:
        return "record needs a name, a secret and a non-empty custom category label";
    case VaultError::VaultLocked:
        return "vault is locked";
    case VaultError::TooManyAttempts:
        return "too many failed attempts, try again later";
    case VaultError::RandomFailed:
        return "secure random source unavailable";
    case VaultError::CryptoError:
        return "cryptographic backend failure";
    case VaultError::IdsExhausted:
        return "no account identifiers left in this vault";
    }
    return "unknown error";
}

std::string_view errorName(VaultError e) noexcept
{
    switch (e)
    {
    case VaultError::WrongPassphrase:
        return "WrongPassphrase";
    case VaultError::CorruptFile:
        return "CorruptFile";
    case VaultError::NotFound:
        return "NotFound";
    case VaultError::AlreadyExists:
        return "AlreadyExists";
    case VaultError::InvalidOptions:
        return "InvalidOptions";
    case VaultError::IoError:
        return "IoError";
    case VaultError::InvalidRecord:
        return "InvalidRecord";
    case VaultError::VaultLocked:
        return "VaultLocked";
    case VaultError::TooManyAttempts:
        return "TooManyAttempts";
    case VaultError::RandomFailed:
        return "RandomFailed";
    case VaultError::CryptoError:
        return "CryptoError";
    case VaultError::IdsExhausted:
        return "IdsExhausted";
    }
    return "Unknown";
}

} // namespace keyward::core
