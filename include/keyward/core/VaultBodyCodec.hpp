#ifndef INCLUDE_KEYWARD_CORE_VAULTBODYCODEC_HPP
#define INCLUDE_KEYWARD_CORE_VAULTBODYCODEC_HPP

#include "keyward/core/VaultBody.hpp"
#include "keyward/security/SecureMemory.hpp"
#include <cstddef>
#include <optional>
#include <span>

namespace keyward::core
{

// Plaintext layout (little-endian; strings are u32 length + bytes):
//   "KWBODY" | schema:u32 | createdAt:u64 | nextId:u64 | autoLockSeconds:u32 | count:u32 | account*
//   account: id:u64 | createdAt:u64 | modifiedAt:u64 | categoryKind:u8 | otherLabel | name |
//            presence:u8 (1 url, 2 username, 4 notes) | [url] | [username] | [notes] | secret |
//            tagCount:u32 | tag*
// Throws std::length_error if a string or count does not fit its u32 prefix.
[[nodiscard]] keyward::security::SecureBuffer encodeVaultBody(const VaultBody& body);

// std::nullopt on any structural problem: bad magic, unknown schema, overrun, trailing bytes,
// or records that violate the model invariants.
[[nodiscard]] std::optional<VaultBody> decodeVaultBody(std::span<const std::byte> plain);

} // namespace keyward::core

#endif // INCLUDE_KEYWARD_CORE_VAULTBODYCODEC_HPP
