/**
 * @file DatagramChannel.hpp
 * @brief Event-driven UDP channel: outbound filter, write engine, send queue and read loop.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "BufferView.hpp"
#include "ChannelHandler.hpp"
#include "ChannelRegistration.hpp"
#include "DatagramChannelConfig.hpp"
#include "DatagramIo.hpp"
#include "OutboundMessage.hpp"
#include "RecvBufferAllocator.hpp"

#include <deque>
#include <future>
#include <memory>
#include <optional>
#include <string_view>

namespace nativeudp
{

/**
 * @class DatagramChannel
 * @ingroup udp
 * @brief A UDP endpoint driven by readiness notifications from an `EventLoop`.
 *
 * The channel owns a `DatagramIo` (normally a `DatagramSocket`) and moves datagrams between it
 * and a `ChannelHandler`:
 *
 * - **Outbound**: `write()` runs every message through `filterOutboundMessage()` and queues it;
 *   `flush()` hands queued messages to `writeMessage()` until the socket pushes back. A message
 *   that cannot be sent yet stays at the head of the queue and write interest is registered.
 * - **Inbound**: on readability the loop calls `readReady()`, which receives datagrams in a
 *   bounded burst and delivers each one to `ChannelHandler::onPacket()`.
 *
 * Every method must be called on the event-loop thread the channel is registered with; debug
 * builds assert it. A channel that is not registered can be driven from any single thread,
 * which is how the unit tests use it.
 *
 * ### Outbound message shapes
 * | Shape                     | Destination                      | Segmentation     |
 * |---------------------------|----------------------------------|------------------|
 * | `Buffer`                  | connected peer                   | none             |
 * | `DatagramPacket`          | `recipient()`                    | none             |
 * | `SegmentedDatagramPacket` | `recipient()`                    | `segmentSize()`  |
 * | `AddressedEnvelope`       | `recipient()` or connected peer  | none             |
 *
 * @code
 * class Echo : public ChannelHandler
 * {
 *   public:
 *     DatagramChannel* channel = nullptr;
 *     void onPacket(DatagramPacket packet) override
 *     {
 *         auto to = packet.sender();
 *         (void) channel->write(DatagramPacket(std::move(packet.content()), to));
 *     }
 *     void onReadComplete() override { channel->flush(); }
 *     void onError(std::exception_ptr) override {}
 * };
 *
 * auto echo = std::make_shared<Echo>();
 * DatagramChannel channel(std::make_unique<DatagramSocket>(), echo);
 * echo->channel = &channel;
 * channel.bind(InetSocketAddress::loopback(9000));
 * EventLoop loop;
 * loop.registerChannel(channel);
 * while (true)
 *     loop.runOnce(1000);
 * @endcode
 */
class DatagramChannel
{
  public:
    /**
     * @throws std::invalid_argument if @p io or @p handler is null, or @p config is unusable
     *         (null allocators, non-positive spin or per-write message counts).
     */
    DatagramChannel(std::unique_ptr<DatagramIo> io, std::shared_ptr<ChannelHandler> handler,
                    DatagramChannelConfig config = {});

    /**
     * @brief Closes the channel; pending writes fail.
     */
    ~DatagramChannel() noexcept;

    DatagramChannel(const DatagramChannel&) = delete;
    DatagramChannel& operator=(const DatagramChannel&) = delete;
    DatagramChannel(DatagramChannel&&) = delete;
    DatagramChannel& operator=(DatagramChannel&&) = delete;

    /**
     * @brief Live configuration.
     *
     * Allocators may be swapped between read bursts; they must stay non-null. Use
     * `setAutoRead()` rather than writing `autoRead` directly so read interest follows.
     */
    [[nodiscard]] DatagramChannelConfig& config() noexcept { return _config; }
    [[nodiscard]] const DatagramChannelConfig& config() const noexcept { return _config; }

    void setAutoRead(bool autoRead);

    /// @name Lifecycle
    /// @{
    void bind(const InetSocketAddress& local);

    /**
     * @brief Fix the peer. Binds to @p local first when given.
     */
    void connect(const InetSocketAddress& remote, const std::optional<InetSocketAddress>& local = std::nullopt);

    void disconnect();

    /**
     * @brief Cancels the registration, fails queued writes and closes the socket. Idempotent.
     */
    void close();

    [[nodiscard]] bool isOpen() const noexcept { return _io->isOpen(); }

    /**
     * @brief Open, and either bound/connected or (with `activeOnOpen`) registered.
     */
    [[nodiscard]] bool isActive() const noexcept;

    [[nodiscard]] bool isConnected() const noexcept { return _connected; }

    [[nodiscard]] bool isRegistered() const noexcept { return _registration != nullptr; }

    /**
     * @brief Cached local address; queried from the socket on first use after bind/connect.
     */
    [[nodiscard]] std::optional<InetSocketAddress> localAddress();

    /**
     * @brief Cached peer address while connected, `std::nullopt` otherwise.
     */
    [[nodiscard]] std::optional<InetSocketAddress> remoteAddress();
    /// @}

    /// @name Outbound
    /// @{
    /**
     * @brief Filter and queue @p msg. Nothing is sent until `flush()`.
     *
     * The returned future completes when the message has been handed to the kernel, and fails
     * with the filter's exception, the native send error, or `SocketException` if the channel is
     * (or becomes) closed first.
     */
    [[nodiscard]] std::future<void> write(OutboundMessage msg);

    /**
     * @brief Send queued messages until the queue is empty, the socket pushes back or
     *        `maxMessagesPerWrite` messages were handled.
     */
    void flush();

    [[nodiscard]] std::future<void> writeAndFlush(OutboundMessage msg);

    [[nodiscard]] std::size_t pendingWrites() const noexcept { return _pending.size(); }

    /**
     * @brief Attempt one native send of @p msg.
     *
     * @return `true` if the message is consumed (sent, or empty), `false` if the socket accepted
     *         nothing and the message must be retried.
     * @throws NativeIoException on a native send failure.
     * @throws UnsupportedOperationException for `std::monostate`.
     */
    [[nodiscard]] bool writeMessage(OutboundMessage& msg);

    /**
     * @brief Validate @p msg and make its payload safe for a deferred native send.
     *
     * A payload with memory that is not `Direct`, or with more regions than one vectorized call
     * accepts, is copied into a fresh direct buffer; addressing and segment size are kept and the
     * original payload is released. Otherwise @p msg is returned unchanged.
     *
     * @throws UnsupportedOperationException for `std::monostate`, a packet without an internet
     *         recipient, or an envelope addressed to a non-internet address.
     */
    [[nodiscard]] OutboundMessage filterOutboundMessage(OutboundMessage&& msg);
    /// @}

    /// @name Inbound
    /// @{
    /**
     * @brief Request a read burst. Needed only when auto-read is off.
     */
    void read();

    /**
     * @brief Run one read burst with the channel's own receive-buffer handle.
     */
    void readReady();

    /**
     * @brief Run one read burst sized and bounded by @p handle.
     */
    void readReady(RecvBufferAllocator::Handle& handle);
    /// @}

    /// @name Multicast
    /// Multicast group management is not supported. Every call validates its arguments and
    /// returns a future already failed with `UnsupportedOperationException`.
    /// @{
    [[nodiscard]] std::future<void> joinGroup(std::string_view multicastAddress);
    [[nodiscard]] std::future<void> joinGroup(std::string_view multicastAddress, std::string_view networkInterface,
                                              std::string_view source);
    [[nodiscard]] std::future<void> leaveGroup(std::string_view multicastAddress);
    [[nodiscard]] std::future<void> leaveGroup(std::string_view multicastAddress, std::string_view networkInterface,
                                               std::string_view source);
    [[nodiscard]] std::future<void> block(std::string_view multicastAddress, std::string_view networkInterface,
                                          std::string_view sourceToBlock);
    [[nodiscard]] std::future<void> block(std::string_view multicastAddress, std::string_view sourceToBlock);
    /// @}

    /**
     * @brief Attach to (or, with `nullptr`, detach from) an event loop.
     *
     * Called by `EventLoop`. When attached with auto-read on, a read is requested immediately.
     */
    void setRegistration(ChannelRegistration* registration);

    [[nodiscard]] SOCKET fd() const noexcept { return _io->fd(); }

  private:
    struct PendingWrite
    {
        OutboundMessage message;
        std::promise<void> promise;
    };

    void assertInEventLoop() const;

    [[nodiscard]] bool shouldBreakReadReady() const;
    void readReadyBefore() noexcept;
    void readReadyFinally();
    void readIfIsAutoRead();

    [[nodiscard]] int doReadBytes(Buffer& data);
    [[nodiscard]] std::optional<DatagramSocketAddress> doReceive(Buffer& data);

    [[nodiscard]] Buffer newDirectBuffer(Buffer& src);
    [[nodiscard]] BufferAllocator& directAllocator();
    [[nodiscard]] RecvBufferAllocator::Handle& recvHandle();

    void setReadInterest(bool enable);
    void setWriteInterest(bool enable);
    void failPendingWrites(const std::exception_ptr& error);
    void resetCachedAddresses() noexcept;

    std::unique_ptr<DatagramIo> _io;
    std::shared_ptr<ChannelHandler> _handler;
    DatagramChannelConfig _config;
    ChannelRegistration* _registration = nullptr;

    std::unique_ptr<RecvBufferAllocator::Handle> _recvHandle;
    std::shared_ptr<RecvBufferAllocator> _recvHandleSource; ///< Allocator `_recvHandle` was made by
    std::unique_ptr<BufferAllocator> _directFallback;      ///< Used when the configured allocator is not direct

    IovArray _iov;
    std::deque<PendingWrite> _pending;

    std::optional<InetSocketAddress> _localAddress;
    std::optional<InetSocketAddress> _remoteAddress;

    bool _active = false;
    bool _connected = false;
    bool _readPending = false;
    int _burstPackets = 0;
};

} // namespace nativeudp
