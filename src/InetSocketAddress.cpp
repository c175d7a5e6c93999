#include "nativeudp/InetSocketAddress.hpp"

#include <stdexcept>

using namespace nativeudp;

InetSocketAddress::InetSocketAddress(const std::string_view host, const Port port, const int family)
{
    const int flags = host.empty() ? AI_PASSIVE | AI_NUMERICSERV : AI_NUMERICSERV;

    const auto result = internal::resolveAddress(host, port, family == AF_UNSPEC && host.empty() ? AF_INET : family,
                                                 SOCK_DGRAM, IPPROTO_UDP, flags);
    for (const addrinfo* p = result.get(); p != nullptr; p = p->ai_next)
    {
        if ((p->ai_family == AF_INET || p->ai_family == AF_INET6) && p->ai_addrlen <= sizeof(_storage))
        {
            std::memcpy(&_storage, p->ai_addr, p->ai_addrlen);
            _length = p->ai_addrlen;
            return;
        }
    }
    throw SocketException("No usable address for host '" + std::string(host) + "'");
}

InetSocketAddress::InetSocketAddress(const ::sockaddr* addr, const socklen_t len)
{
    if (addr == nullptr)
        throw std::invalid_argument("addr must not be null");
    if (len == 0 || len > sizeof(_storage))
        throw std::invalid_argument("invalid socket address length: " + std::to_string(len));

    std::memcpy(&_storage, addr, len);
    _length = len;
}

InetSocketAddress InetSocketAddress::loopback(const Port port, const int family)
{
    if (family == AF_INET6)
    {
        sockaddr_in6 sa6{};
        sa6.sin6_family = AF_INET6;
        sa6.sin6_port = htons(port);
        sa6.sin6_addr = in6addr_loopback;
        return {reinterpret_cast<const ::sockaddr*>(&sa6), sizeof(sa6)};
    }
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    sa.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    return {reinterpret_cast<const ::sockaddr*>(&sa), sizeof(sa)};
}

InetSocketAddress InetSocketAddress::any(const Port port, const int family)
{
    if (family == AF_INET6)
    {
        sockaddr_in6 sa6{};
        sa6.sin6_family = AF_INET6;
        sa6.sin6_port = htons(port);
        sa6.sin6_addr = in6addr_any;
        return {reinterpret_cast<const ::sockaddr*>(&sa6), sizeof(sa6)};
    }
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    sa.sin_port = htons(port);
    sa.sin_addr.s_addr = htonl(INADDR_ANY);
    return {reinterpret_cast<const ::sockaddr*>(&sa), sizeof(sa)};
}

std::string InetSocketAddress::ip() const
{
    if (!isInet())
        throw SocketException("ip() called on a non-inet address");
    return ipFromSockaddr(sockaddr());
}

Port InetSocketAddress::port() const noexcept
{
    if (!isInet())
        return 0;
    return portFromSockaddr(sockaddr());
}

std::string InetSocketAddress::toString() const
{
    switch (family())
    {
        case AF_INET:
            return ip() + ":" + std::to_string(port());
        case AF_INET6:
        {
            // Mapped addresses print as plain IPv4, so keep brackets only for real IPv6 text.
            const std::string text = ip();
            if (text.find(':') == std::string::npos)
                return text + ":" + std::to_string(port());
            return "[" + text + "]:" + std::to_string(port());
        }
        case AF_UNSPEC:
            return "unspecified";
        default:
            return "family(" + std::to_string(family()) + ")";
    }
}

bool nativeudp::operator==(const InetSocketAddress& lhs, const InetSocketAddress& rhs) noexcept
{
    if (lhs.family() != rhs.family())
        return false;

    switch (lhs.family())
    {
        case AF_UNSPEC:
            return true;
        case AF_INET:
        {
            const auto* a = reinterpret_cast<const sockaddr_in*>(lhs.sockaddr());
            const auto* b = reinterpret_cast<const sockaddr_in*>(rhs.sockaddr());
            return a->sin_port == b->sin_port && a->sin_addr.s_addr == b->sin_addr.s_addr;
        }
        case AF_INET6:
        {
            const auto* a = reinterpret_cast<const sockaddr_in6*>(lhs.sockaddr());
            const auto* b = reinterpret_cast<const sockaddr_in6*>(rhs.sockaddr());
            return a->sin6_port == b->sin6_port && a->sin6_scope_id == b->sin6_scope_id &&
                   std::memcmp(&a->sin6_addr, &b->sin6_addr, sizeof(in6_addr)) == 0;
        }
        default:
            return lhs.length() == rhs.length() && std::memcmp(lhs.sockaddr(), rhs.sockaddr(), lhs.length()) == 0;
    }
}

std::string nativeudp::ipFromSockaddr(const ::sockaddr* addr, const bool convertIPv4Mapped)
{
    char buf[INET6_ADDRSTRLEN] = {};

    if (addr->sa_family == AF_INET)
    {
        const auto* sa = reinterpret_cast<const sockaddr_in*>(addr);
        if (!inet_ntop(AF_INET, &sa->sin_addr, buf, sizeof(buf)))
        {
            const int error = GetSocketError();
            throw SocketException(error, SocketErrorMessage(error));
        }
    }
    else if (addr->sa_family == AF_INET6)
    {
        const auto* sa6 = reinterpret_cast<const sockaddr_in6*>(addr);

        if (convertIPv4Mapped && IN6_IS_ADDR_V4MAPPED(&sa6->sin6_addr))
        {
            const uint8_t* b = &sa6->sin6_addr.s6_addr[12];
            return std::to_string(b[0]) + '.' + std::to_string(b[1]) + '.' + std::to_string(b[2]) + '.' +
                   std::to_string(b[3]);
        }

        if (!inet_ntop(AF_INET6, &sa6->sin6_addr, buf, sizeof(buf)))
        {
            const int error = GetSocketError();
            throw SocketException(error, SocketErrorMessage(error));
        }
    }
    else
    {
        throw SocketException("Unsupported address family in ipFromSockaddr");
    }

    return {buf};
}

Port nativeudp::portFromSockaddr(const ::sockaddr* addr)
{
    switch (addr->sa_family)
    {
        case AF_INET:
            return ntohs(reinterpret_cast<const sockaddr_in*>(addr)->sin_port);

        case AF_INET6:
            return ntohs(reinterpret_cast<const sockaddr_in6*>(addr)->sin6_port);

        default:
            throw SocketException("Unsupported address family in portFromSockaddr");
    }
}
