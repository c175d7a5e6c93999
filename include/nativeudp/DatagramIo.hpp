/**
 * @file DatagramIo.hpp
 * @brief Capability interface over the native non-blocking datagram calls.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "BufferView.hpp"
#include "InetSocketAddress.hpp"
#include "common.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace nativeudp
{

/**
 * @class DatagramIo
 * @ingroup udp
 * @brief The native operations a `DatagramChannel` needs, implemented once per platform.
 *
 * Every operation is non-blocking:
 * - writes and connected reads return the number of bytes transferred, 0 when the call would
 *   block (send buffer full, no datagram queued);
 * - receives with address return `std::nullopt` when no datagram is queued;
 * - genuine failures throw `NativeIoException` carrying `errno` and the failing call.
 *
 * Memory is passed either as a native address plus length (the fast path for `Direct` buffer
 * components) or as a span. A `segmentSize` greater than 0 requests generic segmentation
 * offload for that single send.
 *
 * `DatagramSocket` is the POSIX implementation; tests substitute an in-memory fake.
 */
class DatagramIo
{
  public:
    virtual ~DatagramIo() = default;

    /// @name Connected receive
    /// @{
    [[nodiscard]] virtual int readAddress(std::uintptr_t address, int length) = 0;
    [[nodiscard]] virtual int read(std::span<std::byte> dst) = 0;
    /// @}

    /// @name Unconnected receive
    /// @{
    /**
     * @brief Receive one datagram into native memory and report its sender.
     * @return Sender, byte count and (if available) the local destination address, or
     *         `std::nullopt` if nothing was queued.
     */
    [[nodiscard]] virtual std::optional<DatagramSocketAddress> recvFromAddress(std::uintptr_t address, int length) = 0;
    [[nodiscard]] virtual std::optional<DatagramSocketAddress> recvFrom(std::span<std::byte> dst) = 0;
    /// @}

    /// @name Single-region send
    /// @{
    [[nodiscard]] virtual int writeAddress(std::uintptr_t address, int length, int segmentSize) = 0;
    [[nodiscard]] virtual int write(std::span<const std::byte> src, int segmentSize) = 0;
    [[nodiscard]] virtual int sendToAddress(std::uintptr_t address, int length, const InetSocketAddress& recipient,
                                            int segmentSize) = 0;
    [[nodiscard]] virtual int sendTo(std::span<const std::byte> src, const InetSocketAddress& recipient,
                                     int segmentSize) = 0;
    /// @}

    /// @name Vectorized send
    /// @{
    /**
     * @brief One gather send of every region in @p iov to the connected peer.
     *
     * A datagram socket sends the gathered regions as a single datagram (or a single GSO
     * super-datagram), so a positive result means everything was sent.
     */
    [[nodiscard]] virtual long writev(const IovArray& iov, int segmentSize) = 0;
    [[nodiscard]] virtual long sendToAddresses(const IovArray& iov, const InetSocketAddress& recipient,
                                               int segmentSize) = 0;
    /// @}

    /// @name Lifecycle
    /// @{
    virtual void bind(const InetSocketAddress& local) = 0;
    virtual void connect(const InetSocketAddress& remote) = 0;
    virtual void disconnect() = 0;
    virtual void close() = 0;
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;
    [[nodiscard]] virtual InetSocketAddress localAddress() const = 0;
    [[nodiscard]] virtual std::optional<InetSocketAddress> remoteAddress() const = 0;

    /**
     * @brief Native descriptor for readiness registration, `INVALID_SOCKET` if there is none.
     */
    [[nodiscard]] virtual SOCKET fd() const noexcept = 0;
    /// @}
};

} // namespace nativeudp
