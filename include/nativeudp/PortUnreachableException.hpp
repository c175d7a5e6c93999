/**
 * @file PortUnreachableException.hpp
 * @brief Exception signalling that the connected peer's port is unreachable.
 */

#pragma once

#include "SocketException.hpp"

#include <exception>
#include <string>

namespace nativeudp
{

/**
 * @class PortUnreachableException
 * @ingroup exceptions
 * @brief The connected peer rejected a datagram (ICMP port unreachable).
 *
 * Raised by the read loop of a connected `DatagramChannel` when the native receive fails
 * with `ECONNREFUSED`. The message is the native exception's message and the native
 * exception is kept as nested cause.
 *
 * The condition terminates the current read burst only; the channel stays open and the
 * handler decides whether to close it.
 */
class PortUnreachableException final : public SocketException
{
  public:
    /**
     * @param code    The native error code (normally `ECONNREFUSED`).
     * @param message Message of the native failure.
     * @param cause   The native exception being translated.
     */
    PortUnreachableException(const int code, const std::string& message, std::exception_ptr cause)
        : SocketException(code, message, std::move(cause))
    {
    }
};

} // namespace nativeudp
