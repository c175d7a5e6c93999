/**
 * @file DatagramSocket.hpp
 * @brief Non-blocking POSIX UDP socket with GSO and destination-address reporting.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "DatagramChannelConfig.hpp"
#include "DatagramIo.hpp"
#include "SocketOptions.hpp"
#include "common.hpp"

#include <optional>

namespace nativeudp
{

/**
 * @class DatagramSocket
 * @ingroup udp
 * @brief POSIX implementation of `DatagramIo`.
 *
 * The socket is created non-blocking in the constructor and stays non-blocking for its whole
 * life; all I/O methods return immediately. Native call mapping:
 *
 * | Operation                         | Native call                                          |
 * |-----------------------------------|------------------------------------------------------|
 * | `read` / `readAddress`            | `recv()`                                             |
 * | `recvFrom` / `recvFromAddress`    | `recvmsg()` with `IP_PKTINFO`/`IPV6_PKTINFO` cmsgs    |
 * | `write` / `writeAddress`          | `sendmsg()` without `msg_name`                       |
 * | `sendTo` / `sendToAddress`        | `sendmsg()` with `msg_name`                          |
 * | `writev` / `sendToAddresses`      | `sendmsg()` over the whole iovec array               |
 * | `disconnect`                      | `connect(AF_UNSPEC)`                                 |
 *
 * A positive `segmentSize` adds a `UDP_SEGMENT` control message to the `sendmsg()` call.
 *
 * `EINTR` is retried, `EAGAIN`/`EWOULDBLOCK` is "no progress", everything else throws
 * `NativeIoException`. Sends use `MSG_NOSIGNAL`.
 *
 * An `AF_INET6` socket is dual-stack unless `DatagramSocketOptions::ipv6Only` is set: IPv4
 * recipients are sent to as IPv4-mapped addresses, and IPv4-mapped senders are reported as
 * plain IPv4 addresses.
 *
 * @code
 * DatagramSocket server;
 * server.bind(InetSocketAddress::loopback(0));
 * DatagramSocket client;
 * const std::string_view msg = "ping";
 * client.sendTo(std::as_bytes(std::span(msg)), server.localAddress(), 0);
 * @endcode
 */
class DatagramSocket final : public DatagramIo, public SocketOptions
{
  public:
    /**
     * @brief Creates an unbound, non-blocking UDP socket.
     *
     * @throws NativeIoException if the socket cannot be created or an option cannot be applied.
     */
    explicit DatagramSocket(const DatagramSocketOptions& options = {});

    /**
     * @brief Closes the socket; close errors are ignored.
     */
    ~DatagramSocket() noexcept override;

    DatagramSocket(const DatagramSocket&) = delete;
    DatagramSocket& operator=(const DatagramSocket&) = delete;

    DatagramSocket(DatagramSocket&& other) noexcept;
    DatagramSocket& operator=(DatagramSocket&& other) noexcept;

    [[nodiscard]] int readAddress(std::uintptr_t address, int length) override;
    [[nodiscard]] int read(std::span<std::byte> dst) override;

    [[nodiscard]] std::optional<DatagramSocketAddress> recvFromAddress(std::uintptr_t address, int length) override;
    [[nodiscard]] std::optional<DatagramSocketAddress> recvFrom(std::span<std::byte> dst) override;

    [[nodiscard]] int writeAddress(std::uintptr_t address, int length, int segmentSize) override;
    [[nodiscard]] int write(std::span<const std::byte> src, int segmentSize) override;
    [[nodiscard]] int sendToAddress(std::uintptr_t address, int length, const InetSocketAddress& recipient,
                                    int segmentSize) override;
    [[nodiscard]] int sendTo(std::span<const std::byte> src, const InetSocketAddress& recipient,
                             int segmentSize) override;

    [[nodiscard]] long writev(const IovArray& iov, int segmentSize) override;
    [[nodiscard]] long sendToAddresses(const IovArray& iov, const InetSocketAddress& recipient,
                                       int segmentSize) override;

    /**
     * @throws SocketException if the socket is closed or already bound.
     * @throws NativeIoException if `bind()` fails.
     */
    void bind(const InetSocketAddress& local) override;

    /**
     * @brief Associates the socket with @p remote; binds an ephemeral port first if needed.
     */
    void connect(const InetSocketAddress& remote) override;

    /**
     * @brief Dissolves the peer association. No-op when not connected.
     */
    void disconnect() override;

    /**
     * @brief Closes the descriptor. Idempotent.
     * @throws NativeIoException if `close()` fails.
     */
    void close() override;

    [[nodiscard]] bool isOpen() const noexcept override { return getSocketFd() != INVALID_SOCKET; }
    [[nodiscard]] bool isBound() const noexcept { return _isBound; }
    [[nodiscard]] bool isConnected() const noexcept { return _isConnected; }

    /**
     * @brief `getsockname()`; unspecified if the socket is closed.
     */
    [[nodiscard]] InetSocketAddress localAddress() const override;

    /**
     * @brief `getpeername()`; `std::nullopt` if not connected.
     */
    [[nodiscard]] std::optional<InetSocketAddress> remoteAddress() const override;

    [[nodiscard]] SOCKET fd() const noexcept override { return getSocketFd(); }

    [[nodiscard]] int family() const noexcept { return _family; }

  private:
    void cleanup() noexcept;
    [[noreturn]] void cleanupAndRethrow();

    [[nodiscard]] int recvInto(void* data, std::size_t len);
    [[nodiscard]] std::optional<DatagramSocketAddress> recvMsgInto(void* data, std::size_t len);
    [[nodiscard]] long sendMsg(const iovec* iov, std::size_t iovCount, const InetSocketAddress* recipient,
                               int segmentSize);

    int _family = AF_INET;
    Port _localPort = 0; ///< Cached after bind/connect; completes kernel-reported destinations
    bool _isBound = false;
    bool _isConnected = false;
};

} // namespace nativeudp
