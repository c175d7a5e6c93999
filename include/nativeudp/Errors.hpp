/**
 * @file Errors.hpp
 * @brief Translation of native socket errors into the transport's exception taxonomy.
 */

#pragma once

#include "NativeIoException.hpp"

#include <exception>

namespace nativeudp
{

/**
 * @brief Translate a native failure observed while reading from a connected socket.
 * @ingroup exceptions
 *
 * A connected datagram socket reports an ICMP port-unreachable reply from its peer as
 * `ECONNREFUSED` on a later receive. That code becomes a `PortUnreachableException` whose
 * message is the native message and whose nested cause is @p error itself. Every other code
 * is returned unchanged as the original `NativeIoException`.
 *
 * Only meaningful for connected reads: an unconnected socket never sees `ECONNREFUSED`
 * on receive, and send-side failures are reported as they are.
 *
 * @param error The native failure.
 * @return An exception pointer ready for `std::rethrow_exception()`.
 *
 * @code
 * try {
 *     n = socket.read(dst, len);
 * } catch (const NativeIoException& e) {
 *     std::rethrow_exception(translateConnectedReadError(e));
 * }
 * @endcode
 */
[[nodiscard]] std::exception_ptr translateConnectedReadError(const NativeIoException& error);

} // namespace nativeudp
