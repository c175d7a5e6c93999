/**
 * @file SocketOptions.hpp
 * @brief Socket option access shared by native datagram sockets.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 *
 * `SocketOptions` is a non-owning view over a socket descriptor that exposes the
 * `setsockopt()`/`getsockopt()` tunables relevant to datagram transport: buffer sizes,
 * address reuse, broadcast, dual-stack control, non-blocking mode, segmentation offload and
 * destination address reporting.
 */

#pragma once

#include "common.hpp"

namespace nativeudp
{

/**
 * @class SocketOptions
 * @ingroup socketopts
 * @brief Public base class for raw socket option access via `setsockopt()` and `getsockopt()`.
 *
 * Inherited by `DatagramSocket`, which keeps the descriptor in sync through `setSocketFd()`.
 * This class does not own the descriptor and never closes it.
 *
 * Every setter and getter throws `NativeIoException` when the underlying native call fails,
 * and `SocketException` when the socket is not open.
 *
 * @note Not thread-safe.
 */
class SocketOptions
{
  public:
    /**
     * @param[in] sock A socket descriptor, or `INVALID_SOCKET` if not yet created.
     */
    explicit SocketOptions(const SOCKET sock) noexcept : _sockFd(sock) {}

    virtual ~SocketOptions() = default;

    /**
     * @brief Native descriptor, for event-loop registration and introspection only.
     *
     * Do not close it or change its options behind the owning object's back.
     */
    [[nodiscard]] SOCKET getSocketFd() const noexcept { return _sockFd; }

    /**
     * @brief Sets an integer socket option.
     *
     * @code
     * sock.setOption(SOL_SOCKET, SO_PRIORITY, 6);
     * @endcode
     */
    void setOption(int level, int optName, int value);

    /**
     * @brief Sets a socket option from an arbitrary buffer.
     * @throws SocketException if @p value is null or @p len is 0.
     */
    void setOption(int level, int optName, const void* value, socklen_t len);

    [[nodiscard]] int getOption(int level, int optName) const;

    void getOption(int level, int optName, void* result, socklen_t* len) const;

    void setReuseAddress(bool on);
    [[nodiscard]] bool getReuseAddress() const;

#if defined(SO_REUSEPORT)
    /**
     * @brief Let several sockets bind the same address and port; the kernel load-balances
     * incoming datagrams between them.
     */
    void setReusePort(bool enable);
    [[nodiscard]] bool getReusePort() const;
#endif

    /**
     * @brief `SO_RCVBUF`. The kernel may double or clamp the requested value.
     */
    void setReceiveBufferSize(std::size_t size);
    [[nodiscard]] int getReceiveBufferSize() const;

    void setSendBufferSize(std::size_t size);
    [[nodiscard]] int getSendBufferSize() const;

    void setBroadcast(bool on);
    [[nodiscard]] bool getBroadcast() const;

    /**
     * @brief `IPV6_V6ONLY`; only valid on `AF_INET6` sockets, before bind.
     * @throws SocketException if the socket is not IPv6.
     */
    void setIPv6Only(bool enable);
    [[nodiscard]] bool getIPv6Only() const;

    void setNonBlocking(bool nonBlocking);
    [[nodiscard]] bool getNonBlocking() const;

    /**
     * @brief Socket-wide generic segmentation offload (`UDP_SEGMENT`).
     *
     * Every send larger than @p segmentSize is split by the kernel into datagrams of that size.
     * 0 disables it. Per-send segmentation through `SegmentedDatagramPacket` overrides this value.
     *
     * @throws UnsupportedOperationException if the platform has no `UDP_SEGMENT`.
     */
    void setSegmentSize(int segmentSize);
    [[nodiscard]] int getSegmentSize() const;

    /**
     * @brief Request `IP_PKTINFO` / `IPV6_RECVPKTINFO` control messages on receive.
     *
     * Applied to the protocol levels the socket's family supports (both on a dual-stack socket).
     */
    void setReceivePacketInfo(bool enable);

  protected:
    /**
     * @brief Updates the descriptor used for option calls.
     */
    void setSocketFd(const SOCKET sock) noexcept { _sockFd = sock; }

    /**
     * @brief Address family the socket was created with (`SO_DOMAIN`).
     */
    [[nodiscard]] int socketFamily() const;

  private:
    SOCKET _sockFd = INVALID_SOCKET; ///< Underlying socket file descriptor
};

} // namespace nativeudp
