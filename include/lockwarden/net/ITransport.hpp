#ifndef INCLUDE_LOCKWARDEN_NET_ITRANSPORT_HPP
#define INCLUDE_LOCKWARDEN_NET_ITRANSPORT_HPP

#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>

namespace lockwarden::net
{

enum class HttpMethod : std::uint8_t
{
    Get,
    Post,
};

struct HttpRequest final
{
    HttpMethod method{ HttpMethod::Get };
    std::string url;
    std::string body;          // JSON, empty for GET
    std::string authorization; // bearer token as a plain header value, empty when absent
};

struct HttpResponse final
{
    int status{};
    std::string body;
    std::map<std::string, std::string> headers; // lowercase names
};

// Connection refused, timeout, TLS failure... anything before an HTTP status exists.
class TransportError final : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class ITransport
{
public:
    ITransport() = default;
    ITransport(const ITransport&) = delete;
    ITransport& operator=(const ITransport&) = delete;
    ITransport(ITransport&&) = delete;
    ITransport& operator=(ITransport&&) = delete;
    virtual ~ITransport() = default;

    // Must be safe to call from several threads. Throws TransportError.
    [[nodiscard]] virtual HttpResponse send(const HttpRequest& request) = 0;
};

} // namespace lockwarden::net

#endif // INCLUDE_LOCKWARDEN_NET_ITRANSPORT_HPP
