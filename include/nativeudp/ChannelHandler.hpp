/**
 * @file ChannelHandler.hpp
 * @brief Receiver of inbound datagrams and read-burst events.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "DatagramPacket.hpp"

#include <exception>

namespace nativeudp
{

/**
 * @class ChannelHandler
 * @ingroup udp
 * @brief Downstream consumer of a `DatagramChannel`.
 *
 * For every read burst the channel calls, in this order:
 * - `onPacket()` zero or more times, once per received datagram;
 * - `onReadComplete()` exactly once;
 * - `onError()` at most once, if the burst stopped on an exception.
 *
 * All callbacks run on the channel's event-loop thread. The handler may write to the channel
 * from inside a callback.
 */
class ChannelHandler
{
  public:
    virtual ~ChannelHandler() = default;

    /**
     * @brief A datagram was received.
     *
     * The packet (and its buffer) is owned by the handler from here on. For inbound packets
     * `recipient()` is the local address the datagram arrived on and `sender()` the peer.
     */
    virtual void onPacket(DatagramPacket packet) = 0;

    /**
     * @brief The current read burst is over.
     */
    virtual void onReadComplete() {}

    /**
     * @brief The read burst stopped on @p error.
     *
     * Receives `PortUnreachableException` for an ICMP port-unreachable on a connected channel,
     * `NativeIoException` for other native failures, or whatever a previous callback threw.
     */
    virtual void onError(std::exception_ptr error) = 0;
};

} // namespace nativeudp
