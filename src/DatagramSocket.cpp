#include "nativeudp/DatagramSocket.hpp"
#include "nativeudp/Log.hpp"
#include "nativeudp/NativeIoException.hpp"
#include "nativeudp/UnsupportedOperationException.hpp"

#include <stdexcept>

using namespace nativeudp;

namespace
{

union alignas(cmsghdr) RecvControl
{
    char pktinfo4[CMSG_SPACE(sizeof(in_pktinfo))];
    char pktinfo6[CMSG_SPACE(sizeof(in6_pktinfo))];
};

// Fill `out` with `addr` in the socket's own family. IPv4 recipients of a dual-stack socket
// become IPv4-mapped IPv6 addresses.
socklen_t toNative(const InetSocketAddress& addr, const int socketFamily, sockaddr_storage& out)
{
    if (addr.family() == socketFamily)
    {
        std::memcpy(&out, addr.sockaddr(), addr.length());
        return addr.length();
    }

    if (socketFamily == AF_INET6 && addr.family() == AF_INET)
    {
        const auto* sa = reinterpret_cast<const sockaddr_in*>(addr.sockaddr());
        sockaddr_in6 mapped{};
        mapped.sin6_family = AF_INET6;
        mapped.sin6_port = sa->sin_port;
        mapped.sin6_addr.s6_addr[10] = 0xff;
        mapped.sin6_addr.s6_addr[11] = 0xff;
        std::memcpy(&mapped.sin6_addr.s6_addr[12], &sa->sin_addr.s_addr, sizeof(sa->sin_addr.s_addr));
        std::memcpy(&out, &mapped, sizeof(mapped));
        return sizeof(mapped);
    }

    throw SocketException("address " + addr.toString() + " does not match the socket's address family");
}

// Reverse of toNative(): IPv4-mapped IPv6 addresses are reported as plain IPv4.
InetSocketAddress fromNative(const sockaddr_storage& addr, const socklen_t len)
{
    if (addr.ss_family == AF_INET6)
    {
        const auto& sa6 = reinterpret_cast<const sockaddr_in6&>(addr);
        if (IN6_IS_ADDR_V4MAPPED(&sa6.sin6_addr))
        {
            sockaddr_in sa{};
            sa.sin_family = AF_INET;
            sa.sin_port = sa6.sin6_port;
            std::memcpy(&sa.sin_addr.s_addr, sa6.sin6_addr.s6_addr + 12, sizeof(sa.sin_addr.s_addr));
            return {reinterpret_cast<const sockaddr*>(&sa), sizeof(sa)};
        }
    }
    return {reinterpret_cast<const sockaddr*>(&addr), len};
}

std::optional<InetSocketAddress> localFromControl(msghdr& hdr, const Port localPort)
{
    for (cmsghdr* cm = CMSG_FIRSTHDR(&hdr); cm != nullptr; cm = CMSG_NXTHDR(&hdr, cm))
    {
        if (cm->cmsg_level == IPPROTO_IP && cm->cmsg_type == IP_PKTINFO)
        {
            in_pktinfo info{};
            std::memcpy(&info, CMSG_DATA(cm), sizeof(info));
            sockaddr_storage ss{};
            auto& sa = reinterpret_cast<sockaddr_in&>(ss);
            sa.sin_family = AF_INET;
            sa.sin_port = htons(localPort);
            sa.sin_addr = info.ipi_addr;
            return fromNative(ss, sizeof(sockaddr_in));
        }
        if (cm->cmsg_level == IPPROTO_IPV6 && cm->cmsg_type == IPV6_PKTINFO)
        {
            in6_pktinfo info{};
            std::memcpy(&info, CMSG_DATA(cm), sizeof(info));
            sockaddr_storage ss{};
            auto& sa6 = reinterpret_cast<sockaddr_in6&>(ss);
            sa6.sin6_family = AF_INET6;
            sa6.sin6_port = htons(localPort);
            sa6.sin6_addr = info.ipi6_addr;
            if (IN6_IS_ADDR_LINKLOCAL(&info.ipi6_addr))
                sa6.sin6_scope_id = info.ipi6_ifindex;
            return fromNative(ss, sizeof(sockaddr_in6));
        }
    }
    return std::nullopt;
}

void* toPointer(const std::uintptr_t address)
{
    return reinterpret_cast<void*>(address);
}

std::size_t checkedLength(const int length)
{
    if (length < 0)
        throw std::invalid_argument("length: " + std::to_string(length) + " (expected: >= 0)");
    return static_cast<std::size_t>(length);
}

} // namespace

DatagramSocket::DatagramSocket(const DatagramSocketOptions& options)
    : SocketOptions(INVALID_SOCKET), _family(options.family)
{
    if (_family != AF_INET && _family != AF_INET6)
        throw std::invalid_argument("DatagramSocket: family must be AF_INET or AF_INET6");

    setSocketFd(::socket(_family, SOCK_DGRAM, IPPROTO_UDP));
    if (getSocketFd() == INVALID_SOCKET)
        throw NativeIoException("socket", GetSocketError());

    try
    {
        setNonBlocking(true);

        if (_family == AF_INET6)
            setIPv6Only(options.ipv6Only);
        if (options.reuseAddress)
            setReuseAddress(true);
#if defined(SO_REUSEPORT)
        if (options.reusePort)
            setReusePort(true);
#endif
        if (options.broadcast)
            setBroadcast(true);
        if (options.receiveBufferSize)
            setReceiveBufferSize(static_cast<std::size_t>(*options.receiveBufferSize));
        if (options.sendBufferSize)
            setSendBufferSize(static_cast<std::size_t>(*options.sendBufferSize));
        if (options.receivePacketInfo)
            setReceivePacketInfo(true);
    }
    catch (const SocketException&)
    {
        cleanupAndRethrow();
    }

    Log::debug("socket", "created fd " + std::to_string(getSocketFd()) +
                             (_family == AF_INET6 ? " (AF_INET6)" : " (AF_INET)"));
}

DatagramSocket::~DatagramSocket() noexcept
{
    const SOCKET fd = getSocketFd();
    if (fd != INVALID_SOCKET && !internal::tryCloseNoexcept(fd))
        Log::warn("socket", "close() failed for fd " + std::to_string(fd) + ": " + SocketErrorMessage(errno));
}

DatagramSocket::DatagramSocket(DatagramSocket&& other) noexcept
    : SocketOptions(other.getSocketFd()), _family(other._family), _localPort(other._localPort),
      _isBound(other._isBound), _isConnected(other._isConnected)
{
    other.setSocketFd(INVALID_SOCKET);
    other._isBound = false;
    other._isConnected = false;
}

DatagramSocket& DatagramSocket::operator=(DatagramSocket&& other) noexcept
{
    if (this != &other)
    {
        cleanup();
        setSocketFd(other.getSocketFd());
        _family = other._family;
        _localPort = other._localPort;
        _isBound = other._isBound;
        _isConnected = other._isConnected;
        other.setSocketFd(INVALID_SOCKET);
        other._isBound = false;
        other._isConnected = false;
    }
    return *this;
}

void DatagramSocket::cleanup() noexcept
{
    internal::tryCloseNoexcept(getSocketFd());
    setSocketFd(INVALID_SOCKET);
    _isBound = false;
    _isConnected = false;
}

void DatagramSocket::cleanupAndRethrow()
{
    cleanup();
    throw;
}

void DatagramSocket::close()
{
    const SOCKET fd = getSocketFd();
    if (fd == INVALID_SOCKET)
        return;

    setSocketFd(INVALID_SOCKET);
    _isBound = false;
    _isConnected = false;

    if (CloseSocket(fd) != 0)
        throw NativeIoException("close", GetSocketError());

    Log::debug("socket", "closed fd " + std::to_string(fd));
}

void DatagramSocket::bind(const InetSocketAddress& local)
{
    if (!isOpen())
        throw SocketException("DatagramSocket::bind(): socket is closed");
    if (_isBound)
        throw SocketException("DatagramSocket::bind(): socket is already bound");

    sockaddr_storage ss{};
    const socklen_t len = toNative(local, _family, ss);
    if (::bind(getSocketFd(), reinterpret_cast<const sockaddr*>(&ss), len) == SOCKET_ERROR)
        throw NativeIoException("bind", GetSocketError());

    _isBound = true;
    _localPort = localAddress().port();
    Log::debug("socket", "fd " + std::to_string(getSocketFd()) + " bound to " + localAddress().toString());
}

void DatagramSocket::connect(const InetSocketAddress& remote)
{
    if (!isOpen())
        throw SocketException("DatagramSocket::connect(): socket is closed");

    sockaddr_storage ss{};
    const socklen_t len = toNative(remote, _family, ss);
    int rc;
    do
    {
        rc = ::connect(getSocketFd(), reinterpret_cast<const sockaddr*>(&ss), len);
    } while (rc == SOCKET_ERROR && errno == EINTR);

    if (rc == SOCKET_ERROR)
        throw NativeIoException("connect", GetSocketError());

    // connect() on an unbound datagram socket binds an ephemeral port.
    _isBound = true;
    _isConnected = true;
    _localPort = localAddress().port();
}

void DatagramSocket::disconnect()
{
    if (!_isConnected)
        return;

    sockaddr_storage nullAddr{};
    nullAddr.ss_family = AF_UNSPEC;

    if (::connect(getSocketFd(), reinterpret_cast<const sockaddr*>(&nullAddr), sizeof(nullAddr)) == SOCKET_ERROR)
    {
        // Some kernels dissolve the association but still report EAFNOSUPPORT.
        if (const int error = GetSocketError(); error != EAFNOSUPPORT)
            throw NativeIoException("connect", error);
    }

    _isConnected = false;
}

InetSocketAddress DatagramSocket::localAddress() const
{
    if (!isOpen())
        return {};

    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getsockname(getSocketFd(), reinterpret_cast<sockaddr*>(&ss), &len) == SOCKET_ERROR)
        throw NativeIoException("getsockname", GetSocketError());
    return fromNative(ss, len);
}

std::optional<InetSocketAddress> DatagramSocket::remoteAddress() const
{
    if (!isOpen() || !_isConnected)
        return std::nullopt;

    sockaddr_storage ss{};
    socklen_t len = sizeof(ss);
    if (::getpeername(getSocketFd(), reinterpret_cast<sockaddr*>(&ss), &len) == SOCKET_ERROR)
    {
        const int error = GetSocketError();
        if (error == ENOTCONN)
            return std::nullopt;
        throw NativeIoException("getpeername", error);
    }
    return fromNative(ss, len);
}

int DatagramSocket::recvInto(void* data, const std::size_t len)
{
    ssize_t n;
    do
    {
        n = ::recv(getSocketFd(), data, len, 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0)
    {
        const int error = GetSocketError();
        if (internal::isWouldBlock(error))
            return 0;
        throw NativeIoException("recv", error);
    }
    return static_cast<int>(n);
}

int DatagramSocket::readAddress(const std::uintptr_t address, const int length)
{
    return recvInto(toPointer(address), checkedLength(length));
}

int DatagramSocket::read(const std::span<std::byte> dst)
{
    return recvInto(dst.data(), dst.size());
}

std::optional<DatagramSocketAddress> DatagramSocket::recvMsgInto(void* data, const std::size_t len)
{
    sockaddr_storage peer{};
    RecvControl control{};
    iovec iov{};
    iov.iov_base = data;
    iov.iov_len = len;

    msghdr hdr{};
    hdr.msg_name = &peer;
    hdr.msg_namelen = sizeof(peer);
    hdr.msg_iov = &iov;
    hdr.msg_iovlen = 1;
    hdr.msg_control = &control;
    hdr.msg_controllen = sizeof(control);

    ssize_t n;
    do
    {
        n = ::recvmsg(getSocketFd(), &hdr, 0);
    } while (n < 0 && errno == EINTR);

    if (n < 0)
    {
        const int error = GetSocketError();
        if (internal::isWouldBlock(error))
            return std::nullopt;
        throw NativeIoException("recvmsg", error);
    }

    if (hdr.msg_flags & MSG_TRUNC)
        Log::debug("socket", "datagram truncated to " + std::to_string(len) + " bytes");

    return DatagramSocketAddress(fromNative(peer, hdr.msg_namelen), static_cast<int>(n),
                                 localFromControl(hdr, _localPort));
}

std::optional<DatagramSocketAddress> DatagramSocket::recvFromAddress(const std::uintptr_t address, const int length)
{
    return recvMsgInto(toPointer(address), checkedLength(length));
}

std::optional<DatagramSocketAddress> DatagramSocket::recvFrom(const std::span<std::byte> dst)
{
    return recvMsgInto(dst.data(), dst.size());
}

long DatagramSocket::sendMsg(const iovec* iov, const std::size_t iovCount, const InetSocketAddress* recipient,
                             const int segmentSize)
{
    msghdr hdr{};
    sockaddr_storage dst{};
    if (recipient != nullptr)
    {
        hdr.msg_name = &dst;
        hdr.msg_namelen = toNative(*recipient, _family, dst);
    }
    hdr.msg_iov = const_cast<iovec*>(iov);
    hdr.msg_iovlen = iovCount;

    alignas(cmsghdr) char control[CMSG_SPACE(sizeof(std::uint16_t))] = {};
    if (segmentSize > 0)
    {
#ifdef UDP_SEGMENT
        if (segmentSize > 0xFFFF)
            throw std::invalid_argument("segmentSize: " + std::to_string(segmentSize) + " (expected: <= 65535)");

        hdr.msg_control = control;
        hdr.msg_controllen = sizeof(control);
        cmsghdr* cm = CMSG_FIRSTHDR(&hdr);
        cm->cmsg_level = IPPROTO_UDP;
        cm->cmsg_type = UDP_SEGMENT;
        cm->cmsg_len = CMSG_LEN(sizeof(std::uint16_t));
        const auto gso = static_cast<std::uint16_t>(segmentSize);
        std::memcpy(CMSG_DATA(cm), &gso, sizeof(gso));
#else
        throw UnsupportedOperationException("UDP_SEGMENT is not available on this platform");
#endif
    }

    ssize_t n;
    do
    {
        n = ::sendmsg(getSocketFd(), &hdr, MSG_NOSIGNAL);
    } while (n < 0 && errno == EINTR);

    if (n < 0)
    {
        const int error = GetSocketError();
        if (internal::isWouldBlock(error))
            return 0;
        throw NativeIoException("sendmsg", error);
    }
    return static_cast<long>(n);
}

int DatagramSocket::writeAddress(const std::uintptr_t address, const int length, const int segmentSize)
{
    const iovec iov{toPointer(address), checkedLength(length)};
    return static_cast<int>(sendMsg(&iov, 1, nullptr, segmentSize));
}

int DatagramSocket::write(const std::span<const std::byte> src, const int segmentSize)
{
    const iovec iov{const_cast<std::byte*>(src.data()), src.size()};
    return static_cast<int>(sendMsg(&iov, 1, nullptr, segmentSize));
}

int DatagramSocket::sendToAddress(const std::uintptr_t address, const int length, const InetSocketAddress& recipient,
                                  const int segmentSize)
{
    const iovec iov{toPointer(address), checkedLength(length)};
    return static_cast<int>(sendMsg(&iov, 1, &recipient, segmentSize));
}

int DatagramSocket::sendTo(const std::span<const std::byte> src, const InetSocketAddress& recipient,
                           const int segmentSize)
{
    const iovec iov{const_cast<std::byte*>(src.data()), src.size()};
    return static_cast<int>(sendMsg(&iov, 1, &recipient, segmentSize));
}

long DatagramSocket::writev(const IovArray& iov, const int segmentSize)
{
    return sendMsg(iov.data(), static_cast<std::size_t>(iov.count()), nullptr, segmentSize);
}

long DatagramSocket::sendToAddresses(const IovArray& iov, const InetSocketAddress& recipient, const int segmentSize)
{
    return sendMsg(iov.data(), static_cast<std::size_t>(iov.count()), &recipient, segmentSize);
}
