/**
 * @file SegmentedDatagramPacket.hpp
 * @brief Datagram packet sent with generic segmentation offload.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "DatagramPacket.hpp"

#include <stdexcept>
#include <string>

namespace nativeudp
{

/**
 * @class SegmentedDatagramPacket
 * @ingroup udp
 * @brief A `DatagramPacket` whose payload the kernel splits into fixed-size datagrams.
 *
 * The whole payload is handed to a single native send together with a `UDP_SEGMENT`
 * control message carrying `segmentSize()`. The kernel (or the NIC) emits
 * `ceil(payload / segmentSize)` datagrams; every one but the last carries exactly
 * `segmentSize()` bytes.
 *
 * @code
 * // 9000 bytes leave as six 1500-byte datagrams.
 * SegmentedDatagramPacket p(alloc.copyOf(payload9000), 1500, InetSocketAddress("10.0.0.2", 4433));
 * channel.writeAndFlush(std::move(p));
 * @endcode
 *
 * @note Requires Linux 4.18+ with `UDP_SEGMENT`; see `GsoSupported`.
 */
class SegmentedDatagramPacket : public DatagramPacket
{
  public:
    /**
     * @param content     Payload to segment.
     * @param segmentSize Size of each emitted datagram, strictly positive.
     * @param recipient   Destination.
     * @param sender      Sender (optional).
     *
     * @throws std::invalid_argument if @p segmentSize is not positive.
     */
    SegmentedDatagramPacket(Buffer&& content, const int segmentSize, std::optional<InetSocketAddress> recipient,
                            std::optional<InetSocketAddress> sender = std::nullopt)
        : DatagramPacket(std::move(content), std::move(recipient), std::move(sender)),
          _segmentSize(checkPositive(segmentSize))
    {
    }

    [[nodiscard]] int segmentSize() const noexcept { return _segmentSize; }

    /**
     * @brief A new segmented packet with @p content and this packet's segment size and addresses.
     */
    [[nodiscard]] SegmentedDatagramPacket replace(Buffer&& content) const
    {
        return SegmentedDatagramPacket(std::move(content), _segmentSize, recipient(), sender());
    }

    SegmentedDatagramPacket& touch(const std::string_view hint)
    {
        DatagramPacket::touch(hint);
        return *this;
    }

  private:
    static int checkPositive(const int segmentSize)
    {
        if (segmentSize <= 0)
            throw std::invalid_argument("segmentSize: " + std::to_string(segmentSize) + " (expected: > 0)");
        return segmentSize;
    }

    int _segmentSize;
};

} // namespace nativeudp
