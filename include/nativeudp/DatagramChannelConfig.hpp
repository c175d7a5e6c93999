/**
 * @file DatagramChannelConfig.hpp
 * @brief Option structs for datagram channels and their native sockets.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "BufferAllocator.hpp"
#include "RecvBufferAllocator.hpp"
#include "common.hpp"

#include <climits>
#include <functional>
#include <memory>
#include <optional>

namespace nativeudp
{

/**
 * @struct DatagramSocketOptions
 * @ingroup socketopts
 * @brief Options applied when a `DatagramSocket` is created.
 *
 * Unset optional fields leave the kernel default untouched.
 *
 * @code
 * DatagramSocketOptions opts;
 * opts.family = AF_INET6;
 * opts.reuseAddress = true;
 * opts.receiveBufferSize = 4 * 1024 * 1024;
 * DatagramSocket sock(opts);
 * @endcode
 */
struct DatagramSocketOptions
{
    /**
     * @brief `AF_INET`, or `AF_INET6` for a dual-stack socket (IPv4-mapped peers accepted).
     */
    int family = AF_INET;

    bool reuseAddress = false;
    bool reusePort = false;
    bool broadcast = false;

    /**
     * @brief Restrict an `AF_INET6` socket to IPv6 peers. Ignored for `AF_INET`.
     */
    bool ipv6Only = false;

    /**
     * @brief Ask the kernel for the destination address of every received datagram
     * (`IP_PKTINFO` / `IPV6_RECVPKTINFO`).
     */
    bool receivePacketInfo = true;

    std::optional<int> receiveBufferSize; ///< SO_RCVBUF in bytes
    std::optional<int> sendBufferSize;    ///< SO_SNDBUF in bytes
};

/**
 * @struct DatagramChannelConfig
 * @ingroup udp
 * @brief Runtime configuration of a `DatagramChannel`.
 *
 * All fields may be changed between event-loop iterations from the loop thread.
 */
struct DatagramChannelConfig
{
    /**
     * @brief Allocator for receive buffers and for copies made by the outbound filter.
     *
     * Should produce `MemoryKind::Direct` memory so native calls can address it directly.
     */
    std::shared_ptr<BufferAllocator> bufferAllocator = std::make_shared<BufferAllocator>(MemoryKind::Direct);

    /**
     * @brief Sizing heuristic for receive buffers.
     */
    std::shared_ptr<RecvBufferAllocator> recvBufferAllocator = std::make_shared<FixedRecvBufferAllocator>();

    /**
     * @brief Re-arm reading automatically after every burst.
     */
    bool autoRead = true;

    /**
     * @brief Treat the channel as active as soon as it is open and registered, before any bind.
     */
    bool activeOnOpen = false;

    /**
     * @brief Native attempts per message before `flush()` gives up and waits for writability.
     */
    int writeSpinCount = 16;

    /**
     * @brief Upper bound on messages written by one `flush()`.
     */
    int maxMessagesPerWrite = INT_MAX;

    /**
     * @brief Back-pressure hook: while it returns `true`, readiness notifications do not read.
     */
    std::function<bool()> readSuspended;
};

} // namespace nativeudp
