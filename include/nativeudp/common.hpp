/**
 * @file common.hpp
 * @brief Common platform includes, type aliases and internal helpers for nativeudp.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "SocketException.hpp"

#include <cstddef> // std::size_t
#include <cstdint>
#include <source_location>
#include <span>
#include <string>
#include <string_view>
#include <utility> // std::pair

#ifdef __GNUC__
#define QUOTE(s) #s
#define DIAGNOSTIC_PUSH() _Pragma("GCC diagnostic push")
#define DIAGNOSTIC_IGNORE(warning) _Pragma(QUOTE(GCC diagnostic ignored warning))
#define DIAGNOSTIC_POP() _Pragma("GCC diagnostic pop")
#else
#define DIAGNOSTIC_PUSH()
#define DIAGNOSTIC_IGNORE(warning)
#define DIAGNOSTIC_POP()
#endif

#include <cstring> // Use std::memset()
#include <exception>
#include <limits>
#include <memory>
#include <vector>

#ifdef _WIN32
#error "nativeudp targets POSIX systems (epoll/kqueue style readiness, sendmsg/recvmsg)"
#endif

#include <arpa/inet.h>   //inet_ntop, inet_pton
#include <cerrno>        //errno
#include <climits>       //IOV_MAX (via limits.h)
#include <fcntl.h>       //fcntl
#include <netdb.h>       //addrinfo
#include <netinet/in.h>  //sockaddr_in, sockaddr_in6, IP_PKTINFO
#include <netinet/udp.h> //UDP_SEGMENT (Linux)
#include <sys/socket.h>  //socket, sendmsg, recvmsg
#include <sys/types.h>   //ssize_t
#include <sys/uio.h>     //writev, iovec
#include <unistd.h>      //close

/**
 * @defgroup nativeudp nativeudp: event-driven native datagram transport
 * @brief All classes and functions of the nativeudp library.
 *
 * nativeudp binds a non-blocking UDP socket to a readiness notification mechanism (epoll)
 * and drives sends and receives over directly addressable buffers, including scatter/gather
 * writes and generic segmentation offload (GSO).
 *
 * Example usage:
 * @code
 * #include <nativeudp/DatagramChannel.hpp>
 * #include <nativeudp/EventLoop.hpp>
 * @endcode
 */

/**
 * @defgroup core Core Utilities and Types
 * @ingroup nativeudp
 * @brief Type aliases, platform abstractions and helpers used across the library.
 */

/**
 * @defgroup internal Internal Helpers
 * @ingroup nativeudp
 * @brief Implementation-only utilities for internal use.
 *
 * @warning Do not rely on this module from user code. It is subject to change without notice.
 */

/**
 * @defgroup buffers Buffers and Allocation
 * @ingroup nativeudp
 * @brief Payload buffers, allocators and receive-size heuristics.
 */

/**
 * @defgroup udp Datagram Transport
 * @ingroup nativeudp
 * @brief Packets, native sockets, channels and the event loop.
 */

/**
 * @defgroup exceptions Exception Classes
 * @ingroup nativeudp
 * @brief Exception types used in nativeudp for error handling.
 */

/**
 * @defgroup socketopts Socket Options
 * @ingroup nativeudp
 * @brief Low-level socket configuration exposed through `SocketOptions`.
 */

/**
 * @namespace nativeudp
 * @brief Event-driven datagram transport over native non-blocking sockets.
 *
 * Features:
 * - Exception-based error handling for genuine faults (SocketException and subclasses)
 * - Return-value signalling for flow control (would-block, short writes, empty bursts)
 * - Move-only buffers with explicit ownership transfer
 * - IPv4 and dual-stack IPv6
 *
 * @note Nothing in this namespace is thread-safe unless explicitly stated.
 *       A channel and its socket belong to one event-loop thread.
 */
namespace nativeudp
{

using SOCKET = int;
constexpr SOCKET INVALID_SOCKET = -1;
constexpr int SOCKET_ERROR = -1;

inline int GetSocketError()
{
    return errno;
}

inline int CloseSocket(const SOCKET fd)
{
    return ::close(fd);
}

/**
 * @brief Returns a human-readable error message for a socket error code.
 * @ingroup core
 *
 * If @p gaiStrerror is `true`, the code is treated as a `getaddrinfo()`/`getnameinfo()`
 * (`EAI_*`) code and rendered with `gai_strerror()`. Otherwise the code is an `errno`
 * value, rendered through `std::system_category()` with `strerror()` as fallback.
 *
 * @param error The error code.
 * @param gaiStrerror Whether @p error is an `EAI_*` resolver code.
 * @return Descriptive message; empty for error code 0.
 */
std::string SocketErrorMessage(int error, bool gaiStrerror = false);

/**
 * @typedef Port
 * @brief Type alias representing a UDP port number.
 * @ingroup core
 */
using Port = std::uint16_t;

/**
 * @brief Default receive buffer guess (in bytes) for datagram channels.
 * @ingroup core
 *
 * Used by `FixedRecvBufferAllocator` and as the initial guess of
 * `AdaptiveRecvBufferAllocator`. Large enough for typical MTU-sized datagrams
 * without over-allocating per read.
 */
inline constexpr std::size_t DefaultDatagramReceiveSize = 2048;

/**
 * @brief Maximum number of regions accepted by a single vectorized native call.
 * @ingroup core
 *
 * Mirrors the platform `IOV_MAX`; falls back to the POSIX minimum guarantee (1024 on Linux)
 * when the macro is unavailable.
 */
#ifdef IOV_MAX
inline constexpr int MaxIovecCount = IOV_MAX;
#else
inline constexpr int MaxIovecCount = 1024;
#endif

/**
 * @brief Whether generic segmentation offload (`UDP_SEGMENT`) is known at compile time.
 * @ingroup core
 *
 * When `false`, sends that request a segment size fail with `UnsupportedOperationException`.
 */
#ifdef UDP_SEGMENT
inline constexpr bool GsoSupported = true;
#else
inline constexpr bool GsoSupported = false;
#endif

} // namespace nativeudp

namespace nativeudp::internal
{

/**
 * @struct AddrinfoDeleter
 * @brief Custom deleter for `addrinfo*` pointers to support RAII-style cleanup.
 * @ingroup internal
 */
struct AddrinfoDeleter
{
    /**
     * @brief Deletes an `addrinfo*` by calling `freeaddrinfo()`.
     * @param[in] p Pointer to an `addrinfo` structure to be deallocated.
     */
    void operator()(addrinfo* p) const noexcept
    {
        if (p)
            freeaddrinfo(p);
    }
};

/**
 * @typedef AddrinfoPtr
 * @brief Smart pointer that manages `addrinfo*` resources using `AddrinfoDeleter`.
 * @ingroup internal
 */
using AddrinfoPtr = std::unique_ptr<addrinfo, AddrinfoDeleter>;

/**
 * @brief Resolves a host and port into a list of socket address structures.
 * @ingroup internal
 *
 * Thin RAII wrapper over `::getaddrinfo()`. The caller controls family, socket type,
 * protocol and `AI_*` flags. An empty @p host combined with `AI_PASSIVE` yields the
 * family-appropriate wildcard address.
 *
 * @param[in] host     Hostname or numeric address; empty for wildcard/loopback.
 * @param[in] port     Port number, converted to a numeric service string.
 * @param[in] family   `AF_INET`, `AF_INET6` or `AF_UNSPEC`.
 * @param[in] socktype Socket type, normally `SOCK_DGRAM`.
 * @param[in] protocol Protocol, normally `IPPROTO_UDP`.
 * @param[in] flags    Bitmask of `AI_*` flags.
 * @return A linked list of candidates, released automatically.
 *
 * @throws SocketException if `getaddrinfo()` fails (code and `gai_strerror()` message).
 */
[[nodiscard]] inline AddrinfoPtr resolveAddress(const std::string_view host, const Port port, const int family,
                                                const int socktype, const int protocol, const int flags = 0)
{
    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = socktype;
    hints.ai_protocol = protocol;
    hints.ai_flags = flags;

    const std::string hostStr(host);
    const std::string portStr = std::to_string(port);
    addrinfo* raw = nullptr;

    if (const int ret = ::getaddrinfo(hostStr.empty() ? nullptr : hostStr.c_str(), portStr.c_str(), &hints, &raw);
        ret != 0)
    {
        throw SocketException(ret, SocketErrorMessage(ret, true));
    }

    return AddrinfoPtr{raw};
}

/**
 * @brief Attempts to close a socket descriptor without throwing exceptions.
 * @ingroup internal
 *
 * Intended for destructors and cleanup paths where a close failure must not propagate.
 *
 * @param[in] fd Descriptor to close; `INVALID_SOCKET` is a no-op.
 * @return `true` if the descriptor was invalid or closed successfully, `false` otherwise.
 */
inline bool tryCloseNoexcept(const SOCKET fd) noexcept
{
    if (fd == INVALID_SOCKET)
        return true;
    return CloseSocket(fd) == 0;
}

/**
 * @brief Builds the message for a failed native call, with optional source-location context.
 * @ingroup internal
 *
 * The message has the form `"<call>() failed: <strerror text>"`. When the build-time switch
 * `NATIVEUDP_INCLUDE_ERROR_CONTEXT` is enabled, `" [at file:line function]"` is appended.
 *
 * @param[in] call  Name of the failing system call (e.g. `"recvmsg"`).
 * @param[in] error The `errno` value observed.
 * @param[in] loc   Call-site information; defaults to the caller.
 */
[[nodiscard]] inline std::string nativeErrorMessage(const std::string_view call, const int error,
                                                    const std::source_location& loc = std::source_location::current())
{
    std::string msg(call);
    msg.append("() failed: ").append(SocketErrorMessage(error));
#if NATIVEUDP_INCLUDE_ERROR_CONTEXT
    msg.append(" [at ")
        .append(loc.file_name())
        .append(":")
        .append(std::to_string(loc.line()))
        .append(" ")
        .append(loc.function_name())
        .append("]");
#else
    (void) loc;
#endif
    return msg;
}

/**
 * @brief Returns whether an `errno` value means "try again later" on a non-blocking socket.
 * @ingroup internal
 */
[[nodiscard]] constexpr bool isWouldBlock(const int error) noexcept
{
    return error == EAGAIN || error == EWOULDBLOCK;
}

} // namespace nativeudp::internal
