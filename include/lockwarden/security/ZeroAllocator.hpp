#ifndef INCLUDE_LOCKWARDEN_SECURITY_ZEROALLOCATOR_HPP
#define INCLUDE_LOCKWARDEN_SECURITY_ZEROALLOCATOR_HPP

#include "lockwarden/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>
#include <vector>

namespace lockwarden::security
{

// Every block is wiped as it goes back to the heap, including the spare capacity a vector
// leaves behind when it grows.
template <class T> class ZeroAllocator
{
public:
    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;

    constexpr ZeroAllocator() noexcept = default;

    template <class U> constexpr ZeroAllocator(const ZeroAllocator<U>& /*unused*/) noexcept
    {
    }

    [[nodiscard]] static constexpr std::size_t max_size() noexcept
    {
        return std::numeric_limits<std::size_t>::max() / sizeof(T);
    }

    [[nodiscard]] T* allocate(std::size_t count)
    {
        if (count > max_size())
        {
            throw std::bad_array_new_length{};
        }
        if (count == 0U)
        {
            return nullptr;
        }
        return static_cast<T*>(::operator new(count * sizeof(T), std::align_val_t{ alignof(T) }));
    }

    void deallocate(T* block, std::size_t count) noexcept
    {
        if (block == nullptr)
        {
            return;
        }
        secureWipe(static_cast<void*>(block), count * sizeof(T));
        ::operator delete(block, std::align_val_t{ alignof(T) });
    }
};

template <class T, class U>
[[nodiscard]] constexpr bool operator==(const ZeroAllocator<T>& /*unused*/, const ZeroAllocator<U>& /*unused*/) noexcept
{
    return true;
}

template <class T> using ZeroVector = std::vector<T, ZeroAllocator<T>>;

template <class T> [[nodiscard]] std::span<const std::byte> asBytes(const ZeroVector<T>& values) noexcept
{
    return std::as_bytes(std::span<const T>{ values.data(), values.size() });
}

template <class T> [[nodiscard]] std::span<std::byte> asWritableBytes(ZeroVector<T>& values) noexcept
{
    return std::as_writable_bytes(std::span<T>{ values.data(), values.size() });
}

// Leaves the vector empty with no capacity; the old block is wiped on its way out.
template <class T> void secureRelease(ZeroVector<T>& values) noexcept
{
    ZeroVector<T> released{};
    values.swap(released);
}

} // namespace lockwarden::security

#endif // INCLUDE_LOCKWARDEN_SECURITY_ZEROALLOCATOR_HPP
