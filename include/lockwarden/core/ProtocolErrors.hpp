#ifndef INCLUDE_LOCKWARDEN_CORE_PROTOCOLERRORS_HPP
#define INCLUDE_LOCKWARDEN_CORE_PROTOCOLERRORS_HPP

#include <chrono>
#include <string>

namespace lockwarden::core
{

// No account under that username.
struct NotFound final
{
};

// Wrong secret or wrong second-factor code.
struct InvalidCredentials final
{
};

struct UsernameTaken final
{
};

// The request was refused before anything was sent.
struct RejectedInput final
{
    std::string detail;
};

struct RateLimited final
{
    std::chrono::seconds retryAfter{};
    std::string detail;
};

// Transport-level failure, distinct from every protocol outcome.
struct NetworkError final
{
    std::string detail;
};

// Wrong secret or corrupted sealed vault; the two are indistinguishable.
struct DecryptionFailure final
{
};

// Secret accepted; a second-factor code must follow.
struct MfaRequired final
{
};

// The remote authority answered with something this client does not understand.
struct ProtocolError final
{
    std::string detail;
};

// A newer attempt started before this one finished; its result was discarded.
struct Superseded final
{
};

// The session is not in a state that allows the operation.
struct NotPermitted final
{
};

} // namespace lockwarden::core

#endif // INCLUDE_LOCKWARDEN_CORE_PROTOCOLERRORS_HPP
