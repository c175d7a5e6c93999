/**
 * @file NativeIoException.hpp
 * @brief Exception raised when a native socket call fails.
 */

#pragma once

#include "common.hpp"
#include "SocketException.hpp"

#include <string>
#include <string_view>

namespace nativeudp
{

/**
 * @class NativeIoException
 * @ingroup exceptions
 * @brief A native socket call (`recvmsg`, `sendmsg`, `writev`, `bind`, ...) failed.
 *
 * Carries the `errno` value observed right after the call and the name of the call.
 * Would-block conditions (`EAGAIN`/`EWOULDBLOCK`) and `EINTR` never produce this exception;
 * they are handled by the socket layer as "no progress".
 *
 * On a connected datagram socket the kernel reports ICMP port-unreachable messages as
 * `ECONNREFUSED` on the next receive; the read loop translates that case into
 * `PortUnreachableException` (see `translateConnectedReadError()`).
 */
class NativeIoException : public SocketException
{
  public:
    /**
     * @brief Construct from the failing call and its `errno` value.
     * @param call  Name of the system call, without parentheses.
     * @param error The `errno` value.
     */
    NativeIoException(const std::string_view call, const int error)
        : SocketException(error, internal::nativeErrorMessage(call, error)), _call(call)
    {
    }

    /**
     * @brief Name of the system call that failed.
     */
    [[nodiscard]] const std::string& call() const noexcept { return _call; }

  private:
    std::string _call;
};

} // namespace nativeudp
