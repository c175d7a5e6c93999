/**
 * @file ChannelRegistration.hpp
 * @brief Link between a channel and the event loop it is registered with.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

namespace nativeudp
{

/**
 * @class ChannelRegistration
 * @ingroup udp
 * @brief Readiness-interest control handed to a channel by its event loop.
 *
 * `EventLoop` implements it for epoll; tests use a recording fake.
 */
class ChannelRegistration
{
  public:
    virtual ~ChannelRegistration() = default;

    /// Enable or disable readable notifications for the channel's socket.
    virtual void setReadInterest(bool enable) = 0;

    /// Enable or disable writable notifications for the channel's socket.
    virtual void setWriteInterest(bool enable) = 0;

    /**
     * @brief Stop watching the channel. Called by the channel before its socket is closed.
     */
    virtual void cancel() = 0;

    /**
     * @brief True when the calling thread is the loop's thread.
     */
    [[nodiscard]] virtual bool inEventLoop() const = 0;
};

} // namespace nativeudp
