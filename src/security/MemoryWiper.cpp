#include "lockwarden/security/MemoryWiper.hpp"

#if defined(__linux__)
#include <string.h>
#else
#error Unsupported platform
#endif

namespace lockwarden::security
{

void secureWipe(void* data, std::size_t size) noexcept
{
    if (data == nullptr || size == 0U)
    {
        return;
    }
    ::explicit_bzero(data, size);
}

void secureWipe(std::string& text) noexcept
{
    secureWipe(static_cast<void*>(text.data()), text.size());
}

} // namespace lockwarden::security
