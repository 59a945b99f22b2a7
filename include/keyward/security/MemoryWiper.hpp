#ifndef INCLUDE_KEYWARD_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_KEYWARD_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace keyward::security
{

// Overwrites the bytes in a way the optimizer may not elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

template <typename T>
    requires(std::is_trivially_copyable_v<T>)
void secureWipeObject(T& object) noexcept
{
    secureWipe(std::as_writable_bytes(std::span<T, 1>{ &object, 1 }));
}

} // namespace keyward::security

#endif // INCLUDE_KEYWARD_SECURITY_MEMORYWIPER_HPP
