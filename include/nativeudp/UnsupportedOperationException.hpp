/**
 * @file UnsupportedOperationException.hpp
 * @brief Exception for operations and message shapes this transport does not support.
 */

#pragma once

#include <stdexcept>
#include <string>

namespace nativeudp
{

/**
 * @class UnsupportedOperationException
 * @ingroup exceptions
 * @brief The requested operation or message shape is not supported.
 *
 * Raised for multicast group management (reported through a failed `std::future`), for
 * outbound messages that are neither a buffer, a datagram packet nor an addressed envelope
 * with an internet recipient, and for segmented sends on platforms without `UDP_SEGMENT`.
 *
 * Never retried and never partial. Derives from `std::logic_error`: the caller asked for
 * something the transport cannot do, no native call failed.
 */
class UnsupportedOperationException final : public std::logic_error
{
  public:
    explicit UnsupportedOperationException(const std::string& message) : std::logic_error(message) {}
};

} // namespace nativeudp
