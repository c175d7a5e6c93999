/**
 * @file InetSocketAddress.hpp
 * @brief IP socket address value types.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "common.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace nativeudp
{

/**
 * @class InetSocketAddress
 * @ingroup udp
 * @brief An IP address and port, stored as a native `sockaddr_storage`.
 *
 * Value type: cheap to copy, comparable, and directly usable with native calls through
 * `sockaddr()` / `length()`. A default-constructed address is *unspecified*
 * (`family() == AF_UNSPEC`, `isInet() == false`); it is what a recipient-less message or
 * an unbound socket reports.
 *
 * Only `AF_INET` and `AF_INET6` addresses are "inet" addresses. Anything else (for example a
 * Unix-domain address obtained from a raw `sockaddr`) can be stored, but is rejected by the
 * outbound filter of `DatagramChannel`.
 *
 * @code
 * InetSocketAddress a("127.0.0.1", 9000);
 * InetSocketAddress b("::1", 9000);
 * std::cout << a.toString() << ' ' << b.toString() << '\n'; // 127.0.0.1:9000 [::1]:9000
 * @endcode
 */
class InetSocketAddress
{
  public:
    /**
     * @brief Constructs an unspecified address.
     */
    InetSocketAddress() noexcept = default;

    /**
     * @brief Resolves @p host and binds it to @p port.
     *
     * Numeric addresses are parsed without any lookup; names are resolved with `getaddrinfo()`
     * and the first candidate is kept. An empty @p host yields the IPv4 wildcard address.
     *
     * @param host Hostname, dotted IPv4 or IPv6 literal (without brackets).
     * @param port Port in host byte order.
     * @param family `AF_INET`, `AF_INET6` or `AF_UNSPEC` (default) to restrict resolution.
     *
     * @throws SocketException if resolution fails.
     */
    InetSocketAddress(std::string_view host, Port port, int family = AF_UNSPEC);

    /**
     * @brief Copies a native address.
     *
     * @param addr Pointer to a socket address of @p len bytes.
     * @param len Length of @p addr; must not exceed `sizeof(sockaddr_storage)`.
     *
     * @throws std::invalid_argument if @p addr is null or @p len is out of range.
     */
    InetSocketAddress(const ::sockaddr* addr, socklen_t len);

    /**
     * @brief The loopback address of the given family with @p port.
     */
    [[nodiscard]] static InetSocketAddress loopback(Port port, int family = AF_INET);

    /**
     * @brief The wildcard ("any") address of the given family with @p port.
     */
    [[nodiscard]] static InetSocketAddress any(Port port, int family = AF_INET);

    [[nodiscard]] int family() const noexcept { return _storage.ss_family; }

    /**
     * @brief `true` for `AF_INET` and `AF_INET6` addresses.
     */
    [[nodiscard]] bool isInet() const noexcept { return family() == AF_INET || family() == AF_INET6; }

    [[nodiscard]] bool isUnspecified() const noexcept { return family() == AF_UNSPEC; }

    /**
     * @brief Numeric IP text (`"127.0.0.1"`, `"::1"`). IPv4-mapped IPv6 is shown as IPv4.
     * @throws SocketException if the address is not an inet address.
     */
    [[nodiscard]] std::string ip() const;

    /**
     * @brief Port in host byte order, 0 for non-inet addresses.
     */
    [[nodiscard]] Port port() const noexcept;

    /**
     * @brief `"ip:port"` for IPv4, `"[ip]:port"` for IPv6, `"unspecified"` otherwise.
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] const ::sockaddr* sockaddr() const noexcept
    {
        return reinterpret_cast<const ::sockaddr*>(&_storage);
    }

    [[nodiscard]] socklen_t length() const noexcept { return _length; }

    /**
     * @brief Byte-wise equality of family, IP and port.
     */
    friend bool operator==(const InetSocketAddress& lhs, const InetSocketAddress& rhs) noexcept;

  private:
    sockaddr_storage _storage{};
    socklen_t _length = 0;
};

bool operator==(const InetSocketAddress& lhs, const InetSocketAddress& rhs) noexcept;

/**
 * @class DatagramSocketAddress
 * @ingroup udp
 * @brief Sender of a received datagram, plus how many bytes arrived and where.
 *
 * Returned by `DatagramIo::recvFromAddress()` and `DatagramIo::recvFrom()`. The base address
 * is the remote sender. `localAddress()` is the destination address reported by the kernel
 * through `IP_PKTINFO` / `IPV6_PKTINFO` control messages; it is absent when the socket does
 * not request packet info or the platform does not provide it.
 */
class DatagramSocketAddress : public InetSocketAddress
{
  public:
    DatagramSocketAddress(const InetSocketAddress& sender, const int receivedAmount,
                          std::optional<InetSocketAddress> localAddress = std::nullopt)
        : InetSocketAddress(sender), _receivedAmount(receivedAmount), _localAddress(std::move(localAddress))
    {
    }

    /**
     * @brief Number of payload bytes received; may be 0 for an empty datagram.
     */
    [[nodiscard]] int receivedAmount() const noexcept { return _receivedAmount; }

    [[nodiscard]] const std::optional<InetSocketAddress>& localAddress() const noexcept { return _localAddress; }

  private:
    int _receivedAmount;
    std::optional<InetSocketAddress> _localAddress;
};

/**
 * @brief Extracts the numeric IP text from a native address.
 * @ingroup core
 *
 * @param addr AF_INET or AF_INET6 address.
 * @param convertIPv4Mapped Render `::ffff:a.b.c.d` as `a.b.c.d`.
 * @throws SocketException for any other family or if `inet_ntop()` fails.
 */
std::string ipFromSockaddr(const ::sockaddr* addr, bool convertIPv4Mapped = true);

/**
 * @brief Extracts the port (host byte order) from a native address.
 * @ingroup core
 * @throws SocketException for non-inet families.
 */
Port portFromSockaddr(const ::sockaddr* addr);

} // namespace nativeudp
