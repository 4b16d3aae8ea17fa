#ifndef INCLUDE_LOCKWARDEN_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_LOCKWARDEN_SECURITY_SECUREBUFFER_HPP

#include "lockwarden/security/ZeroAllocator.hpp"
#include <cstdint>

namespace lockwarden::security
{

// Derived keys, verifiers and serialized vault plaintext.
using SecureBuffer = ZeroVector<std::uint8_t>;

} // namespace lockwarden::security

#endif // INCLUDE_LOCKWARDEN_SECURITY_SECUREBUFFER_HPP
