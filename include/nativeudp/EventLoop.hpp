/**
 * @file EventLoop.hpp
 * @brief Minimal single-threaded epoll reactor for datagram channels.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "ChannelRegistration.hpp"
#include "common.hpp"

#include <cstdint>
#include <memory>
#include <thread>
#include <unordered_map>
#include <vector>

#include <sys/epoll.h>

namespace nativeudp
{

class DatagramChannel;

/**
 * @class EventLoop
 * @ingroup udp
 * @brief Waits for socket readiness and dispatches it to registered channels.
 *
 * | Event                 | Dispatch                                 |
 * |-----------------------|------------------------------------------|
 * | `EPOLLIN`             | `DatagramChannel::readReady()`           |
 * | `EPOLLERR`/`EPOLLHUP` | `DatagramChannel::readReady()`           |
 * | `EPOLLOUT`            | `DatagramChannel::flush()`               |
 *
 * A pending socket error is reported as `EPOLLERR`; running a read burst makes the receive
 * call pick it up and hand it to `ChannelHandler::onError()`.
 *
 * The loop does not own channels. A channel must be deregistered (or closed) before it is
 * destroyed, and the loop must outlive every channel still registered with it.
 *
 * All methods must be called from one thread: the thread that last called `runOnce()`, or
 * the constructing thread before the first call.
 */
class EventLoop
{
  public:
    /**
     * @param[in] maxEvents Upper bound on readiness events handled per `runOnce()`.
     * @throws NativeIoException if the epoll instance cannot be created.
     */
    explicit EventLoop(int maxEvents = 64);

    /**
     * @brief Detaches every registered channel and closes the epoll instance.
     */
    ~EventLoop() noexcept;

    EventLoop(const EventLoop&) = delete;
    EventLoop& operator=(const EventLoop&) = delete;

    /**
     * @brief Start watching @p channel. Read interest is enabled when auto-read is on.
     *
     * @throws SocketException if the channel is closed or already registered.
     * @throws NativeIoException if `epoll_ctl()` fails.
     */
    void registerChannel(DatagramChannel& channel);

    /**
     * @brief Stop watching @p channel. No-op if it is not registered here.
     */
    void deregisterChannel(DatagramChannel& channel);

    /**
     * @brief Wait up to @p timeoutMillis (-1: forever) and dispatch what became ready.
     *
     * Exceptions escaping a channel callback are logged and do not stop the dispatch of the
     * remaining events.
     *
     * @return Number of readiness events dispatched; 0 on timeout or `EINTR`.
     * @throws NativeIoException if `epoll_wait()` fails.
     */
    int runOnce(int timeoutMillis);

    [[nodiscard]] bool inEventLoop() const noexcept { return std::this_thread::get_id() == _thread; }

    [[nodiscard]] std::size_t channelCount() const noexcept { return _registrations.size(); }

  private:
    class Registration;

    void remove(std::uint64_t id) noexcept;
    [[nodiscard]] Registration* find(std::uint64_t id) noexcept;
    void dispatch(std::uint64_t id, std::uint32_t events);

    int _epollFd = -1;
    std::thread::id _thread;
    std::uint64_t _nextId = 1;
    std::unordered_map<std::uint64_t, std::unique_ptr<Registration>> _registrations;
    std::vector<epoll_event> _events;
};

} // namespace nativeudp
