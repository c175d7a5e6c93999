/**
 * @file DatagramPacket.hpp
 * @brief Addressed datagram payloads.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "Buffer.hpp"
#include "InetSocketAddress.hpp"

#include <optional>
#include <string_view>

namespace nativeudp
{

/**
 * @class DatagramPacket
 * @ingroup udp
 * @brief A datagram payload together with its addressing.
 *
 * A packet owns its payload `Buffer`; it is move-only.
 *
 * - Outbound: `recipient()` is the destination. A packet without a recipient cannot be
 *   written; use a plain `Buffer` on a connected channel instead.
 * - Inbound: `recipient()` is the local address the datagram arrived at and `sender()` is
 *   the remote address it came from.
 *
 * @code
 * DatagramPacket p(alloc.copyOf(bytes), InetSocketAddress("127.0.0.1", 9000));
 * channel.writeAndFlush(std::move(p));
 * @endcode
 */
class DatagramPacket
{
  public:
    /**
     * @param content   Payload; ownership is transferred to the packet.
     * @param recipient Destination (outbound) or local address (inbound).
     * @param sender    Remote sender (inbound only).
     */
    explicit DatagramPacket(Buffer&& content, std::optional<InetSocketAddress> recipient = std::nullopt,
                            std::optional<InetSocketAddress> sender = std::nullopt)
        : _content(std::move(content)), _recipient(std::move(recipient)), _sender(std::move(sender))
    {
    }

    DatagramPacket(const DatagramPacket&) = delete;
    DatagramPacket& operator=(const DatagramPacket&) = delete;
    DatagramPacket(DatagramPacket&&) noexcept = default;
    DatagramPacket& operator=(DatagramPacket&&) noexcept = default;
    ~DatagramPacket() = default;

    [[nodiscard]] Buffer& content() noexcept { return _content; }
    [[nodiscard]] const Buffer& content() const noexcept { return _content; }

    [[nodiscard]] const std::optional<InetSocketAddress>& recipient() const noexcept { return _recipient; }
    [[nodiscard]] const std::optional<InetSocketAddress>& sender() const noexcept { return _sender; }

    /**
     * @brief A new packet with @p content and this packet's addresses.
     *
     * This packet keeps its own payload; the caller decides when to release it.
     */
    [[nodiscard]] DatagramPacket replace(Buffer&& content) const
    {
        return DatagramPacket(std::move(content), _recipient, _sender);
    }

    /**
     * @brief Record a diagnostic hint on the payload.
     */
    DatagramPacket& touch(const std::string_view hint)
    {
        _content.touch(hint);
        return *this;
    }

  private:
    Buffer _content;
    std::optional<InetSocketAddress> _recipient;
    std::optional<InetSocketAddress> _sender;
};

/**
 * @class AddressedEnvelope
 * @ingroup udp
 * @brief A payload with an optional recipient.
 *
 * The generic outbound shape: without a recipient it behaves like a plain `Buffer` and needs
 * a connected channel.
 */
class AddressedEnvelope
{
  public:
    explicit AddressedEnvelope(Buffer&& content, std::optional<InetSocketAddress> recipient = std::nullopt)
        : _content(std::move(content)), _recipient(std::move(recipient))
    {
    }

    AddressedEnvelope(AddressedEnvelope&&) noexcept = default;
    AddressedEnvelope& operator=(AddressedEnvelope&&) noexcept = default;

    [[nodiscard]] Buffer& content() noexcept { return _content; }
    [[nodiscard]] const Buffer& content() const noexcept { return _content; }
    [[nodiscard]] const std::optional<InetSocketAddress>& recipient() const noexcept { return _recipient; }

  private:
    Buffer _content;
    std::optional<InetSocketAddress> _recipient;
};

} // namespace nativeudp
