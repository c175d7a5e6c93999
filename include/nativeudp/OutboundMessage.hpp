/**
 * @file OutboundMessage.hpp
 * @brief The closed set of message shapes a datagram channel accepts for writing.
 */

#pragma once

#include "Buffer.hpp"
#include "DatagramPacket.hpp"
#include "SegmentedDatagramPacket.hpp"

#include <variant>

namespace nativeudp
{

/**
 * @typedef OutboundMessage
 * @ingroup udp
 * @brief A message handed to `DatagramChannel::write()`.
 *
 * | Alternative               | Sent as                                              |
 * |---------------------------|------------------------------------------------------|
 * | `std::monostate`          | never; rejected by the outbound filter               |
 * | `Buffer`                  | connected send                                       |
 * | `DatagramPacket`          | addressed send to `recipient()`                      |
 * | `SegmentedDatagramPacket` | addressed send with GSO                              |
 * | `AddressedEnvelope`       | addressed send, or connected send without recipient  |
 */
using OutboundMessage = std::variant<std::monostate, Buffer, DatagramPacket, SegmentedDatagramPacket, AddressedEnvelope>;

} // namespace nativeudp
