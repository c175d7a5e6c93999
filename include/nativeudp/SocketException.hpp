/**
 * @file SocketException.hpp
 * @brief Base exception class for native socket errors in nativeudp.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include <exception>
#include <sstream>
#include <stdexcept>
#include <string>

namespace nativeudp
{

/**
 * @class SocketException
 * @ingroup exceptions
 * @brief Root of the transport's fault taxonomy.
 *
 * Every genuine fault raised by a native socket call, a channel state transition or the
 * event loop is a `SocketException` or one of its subclasses:
 *
 * | Type                         | Raised when                                             |
 * |------------------------------|---------------------------------------------------------|
 * | `SocketException`            | state violations (closed channel, unbound socket, ...)  |
 * | `NativeIoException`          | a native call (`recvmsg`, `sendmsg`, ...) fails         |
 * | `PortUnreachableException`   | `ECONNREFUSED` is observed on a connected read          |
 *
 * Flow-control conditions (no datagram queued, socket send buffer full, zero-byte burst) are
 * never reported through exceptions; they are sentinel return values.
 *
 * The exception stores the platform error code (0 if none) and, optionally, a nested
 * `std::exception_ptr` naming the underlying cause.
 *
 * ### Example
 * @code
 * try {
 *     channel.connect(InetSocketAddress("127.0.0.1", 9));
 * } catch (const nativeudp::SocketException& ex) {
 *     std::cerr << "socket error " << ex.getErrorCode() << ": " << ex.what() << '\n';
 *     try {
 *         if (ex.getNestedException())
 *             std::rethrow_exception(ex.getNestedException());
 *     } catch (const std::exception& cause) {
 *         std::cerr << "caused by: " << cause.what() << '\n';
 *     }
 * }
 * @endcode
 */
class SocketException : public std::runtime_error
{
  public:
    /**
     * @brief Constructs a SocketException with a message and no error code.
     *
     * Used for state violations that do not originate from a system call.
     *
     * @param message Human-readable description of the failure.
     */
    explicit SocketException(const std::string& message = "SocketException")
        : std::runtime_error(message), _errorCode(0)
    {
    }

    /**
     * @brief Constructs a SocketException with an error code and message.
     *
     * The code is appended to the message, producing e.g. `"bind() failed (error code 98)"`.
     *
     * @param code    The `errno` (or `EAI_*`) value reported by the system.
     * @param message Description of the failure context.
     */
    explicit SocketException(const int code, const std::string& message = "SocketException")
        : std::runtime_error(buildErrorMessage(message, code)), _errorCode(code)
    {
    }

    /**
     * @brief Constructs a SocketException with an error code, message and nested cause.
     *
     * Used when a lower-level failure is re-expressed as a more specific condition
     * (see `PortUnreachableException`). The message is taken verbatim.
     *
     * @param code    Error code of the underlying failure.
     * @param message Message, usually the cause's `what()`.
     * @param nested  The original exception.
     */
    SocketException(const int code, const std::string& message, std::exception_ptr nested)
        : std::runtime_error(message), _errorCode(code), _nested(std::move(nested))
    {
    }

    /**
     * @brief Constructs a SocketException with a message and a nested exception.
     *
     * @param message Description of the higher-level failure.
     * @param nested  Exception pointer for the original cause.
     */
    SocketException(const std::string& message, std::exception_ptr nested)
        : std::runtime_error(message), _errorCode(0), _nested(std::move(nested))
    {
    }

    ~SocketException() override = default;

    /**
     * @brief Platform error code associated with this exception, or 0.
     */
    [[nodiscard]] int getErrorCode() const noexcept { return _errorCode; }

    /**
     * @brief The nested cause captured at construction time, or `nullptr`.
     */
    [[nodiscard]] std::exception_ptr getNestedException() const noexcept { return _nested; }

  private:
    int _errorCode;             ///< errno / EAI_* code, 0 if not applicable.
    std::exception_ptr _nested; ///< Underlying cause, if any.

    static std::string buildErrorMessage(const std::string& msg, const int code)
    {
        std::ostringstream oss;
        oss << msg << " (error code " << code << ")";
        return oss.str();
    }
};

} // namespace nativeudp
