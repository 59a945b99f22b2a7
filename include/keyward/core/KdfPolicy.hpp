#ifndef INCLUDE_KEYWARD_CORE_KDFPOLICY_HPP
#define INCLUDE_KEYWARD_CORE_KDFPOLICY_HPP

#include "keyward/crypto/KdfParams.hpp"

namespace keyward::core
{

// 3 passes over 64 MiB with one lane: a few hundred milliseconds on commodity hardware.
[[nodiscard]] keyward::crypto::Argon2idParams defaultArgon2idParams() noexcept;

// Cheap parameters for tests and tooling only (1 pass, 8 KiB).
[[nodiscard]] keyward::crypto::Argon2idParams minimalArgon2idParams() noexcept;

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_KDFPOLICY_HPP
