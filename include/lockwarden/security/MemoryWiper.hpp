#ifndef INCLUDE_LOCKWARDEN_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_LOCKWARDEN_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <string>
#include <type_traits>

namespace lockwarden::security
{

// explicit_bzero: the stores survive dead-store elimination even when the memory is freed right after.
void secureWipe(void* data, std::size_t size) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> values) noexcept
{
    secureWipe(static_cast<void*>(values.data()), values.size_bytes());
}

// Zeroes the characters in place; size and capacity are left alone.
void secureWipe(std::string& text) noexcept;

} // namespace lockwarden::security

#endif // INCLUDE_LOCKWARDEN_SECURITY_MEMORYWIPER_HPP
