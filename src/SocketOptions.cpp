// SocketOptions.cpp

#include "nativeudp/SocketOptions.hpp"
#include "nativeudp/NativeIoException.hpp"
#include "nativeudp/UnsupportedOperationException.hpp"

#include <climits>
#include <stdexcept>
#include <string>

namespace nativeudp
{

namespace
{

void setFlag(SocketOptions& opts, const int level, const int optName, const bool enable)
{
    opts.setOption(level, optName, enable ? 1 : 0);
}

bool getFlag(const SocketOptions& opts, const int level, const int optName)
{
    return opts.getOption(level, optName) != 0;
}

int checkedBufferSize(const std::size_t size, const char* name)
{
    if (size == 0 || size > static_cast<std::size_t>(INT_MAX))
        throw std::invalid_argument(std::string(name) + ": " + std::to_string(size) + " (expected: 1.." +
                                    std::to_string(INT_MAX) + ")");
    return static_cast<int>(size);
}

} // namespace

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setOption(const int level, const int optName, const int value)
{
    setOption(level, optName, static_cast<const void*>(&value), static_cast<socklen_t>(sizeof(value)));
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setOption(const int level, const int optName, const void* value, const socklen_t len)
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("setOption() failed: socket not open.");

    if (!value || len == 0)
        throw SocketException("setOption() failed: null buffer or zero length.");

    if (::setsockopt(_sockFd, level, optName, value, len) < 0)
        throw NativeIoException("setsockopt", GetSocketError());
}

int SocketOptions::getOption(const int level, const int optName) const
{
    int value = 0;
    socklen_t len = sizeof(value);

    getOption(level, optName, &value, &len);
    return value;
}

void SocketOptions::getOption(const int level, const int optName, void* result, socklen_t* len) const
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("getOption() failed: socket not open.");

    if (!result || !len || *len == 0)
        throw SocketException("getOption() failed: invalid buffer or length.");

    if (::getsockopt(_sockFd, level, optName, result, len) < 0)
        throw NativeIoException("getsockopt", GetSocketError());
}

void SocketOptions::setReuseAddress(const bool on)
{
    setFlag(*this, SOL_SOCKET, SO_REUSEADDR, on);
}

bool SocketOptions::getReuseAddress() const
{
    return getFlag(*this, SOL_SOCKET, SO_REUSEADDR);
}

#if defined(SO_REUSEPORT)

void SocketOptions::setReusePort(const bool enable)
{
    setFlag(*this, SOL_SOCKET, SO_REUSEPORT, enable);
}

bool SocketOptions::getReusePort() const
{
    return getFlag(*this, SOL_SOCKET, SO_REUSEPORT);
}

#endif

void SocketOptions::setReceiveBufferSize(const std::size_t size)
{
    setOption(SOL_SOCKET, SO_RCVBUF, checkedBufferSize(size, "receiveBufferSize"));
}

int SocketOptions::getReceiveBufferSize() const
{
    return getOption(SOL_SOCKET, SO_RCVBUF);
}

void SocketOptions::setSendBufferSize(const std::size_t size)
{
    setOption(SOL_SOCKET, SO_SNDBUF, checkedBufferSize(size, "sendBufferSize"));
}

int SocketOptions::getSendBufferSize() const
{
    return getOption(SOL_SOCKET, SO_SNDBUF);
}

void SocketOptions::setBroadcast(const bool on)
{
    setFlag(*this, SOL_SOCKET, SO_BROADCAST, on);
}

bool SocketOptions::getBroadcast() const
{
    return getFlag(*this, SOL_SOCKET, SO_BROADCAST);
}

int SocketOptions::socketFamily() const
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("socketFamily() failed: socket is not open.");
#ifdef SO_DOMAIN
    return getOption(SOL_SOCKET, SO_DOMAIN);
#else
    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(_sockFd, reinterpret_cast<sockaddr*>(&ss), &len) == SOCKET_ERROR)
        throw NativeIoException("getsockname", GetSocketError());
    return ss.ss_family;
#endif
}

void SocketOptions::setIPv6Only(const bool enable)
{
    if (socketFamily() != AF_INET6)
        throw SocketException("setIPv6Only() failed: socket is not IPv6");

    setFlag(*this, IPPROTO_IPV6, IPV6_V6ONLY, enable);
}

bool SocketOptions::getIPv6Only() const
{
    if (socketFamily() != AF_INET6)
        throw SocketException("getIPv6Only() failed: socket is not IPv6");

    return getFlag(*this, IPPROTO_IPV6, IPV6_V6ONLY);
}

// NOLINTNEXTLINE(readability-make-member-function-const) - changes socket state
void SocketOptions::setNonBlocking(const bool nonBlocking)
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("setNonBlocking() failed: socket is not open.");

    const int flags = ::fcntl(_sockFd, F_GETFL, 0);
    if (flags < 0)
        throw NativeIoException("fcntl", errno);

    const int newFlags = nonBlocking ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
    if (::fcntl(_sockFd, F_SETFL, newFlags) < 0)
        throw NativeIoException("fcntl", errno);
}

bool SocketOptions::getNonBlocking() const
{
    if (_sockFd == INVALID_SOCKET)
        throw SocketException("getNonBlocking() failed: socket is not open.");

    const int flags = ::fcntl(_sockFd, F_GETFL, 0);
    if (flags < 0)
        throw NativeIoException("fcntl", errno);

    return (flags & O_NONBLOCK) != 0;
}

void SocketOptions::setSegmentSize(const int segmentSize)
{
    if (segmentSize < 0 || segmentSize > 0xFFFF)
        throw SocketException("setSegmentSize() failed: segment size must be in [0,65535].");
#ifdef UDP_SEGMENT
    setOption(IPPROTO_UDP, UDP_SEGMENT, segmentSize);
#else
    throw UnsupportedOperationException("UDP_SEGMENT is not available on this platform");
#endif
}

int SocketOptions::getSegmentSize() const
{
#ifdef UDP_SEGMENT
    return getOption(IPPROTO_UDP, UDP_SEGMENT);
#else
    throw UnsupportedOperationException("UDP_SEGMENT is not available on this platform");
#endif
}

void SocketOptions::setReceivePacketInfo(const bool enable)
{
    const int v = enable ? 1 : 0;
    if (socketFamily() == AF_INET6)
    {
        setOption(IPPROTO_IPV6, IPV6_RECVPKTINFO, v);
        // Dual-stack sockets receive IPv4 traffic too; ignore failure when IPV6_V6ONLY is set.
        if (::setsockopt(_sockFd, IPPROTO_IP, IP_PKTINFO, &v, sizeof(v)) < 0)
        {
            const int error = GetSocketError();
            if (!getIPv6Only())
                throw NativeIoException("setsockopt", error);
        }
    }
    else
    {
        setOption(IPPROTO_IP, IP_PKTINFO, v);
    }
}

} // namespace nativeudp
