#include "nativeudp/EventLoop.hpp"
#include "nativeudp/DatagramChannel.hpp"
#include "nativeudp/Log.hpp"
#include "nativeudp/NativeIoException.hpp"

#include <algorithm>

using namespace nativeudp;

namespace
{
constexpr std::string_view LogTag = "EventLoop";
} // namespace

class EventLoop::Registration final : public ChannelRegistration
{
  public:
    Registration(EventLoop& loop, DatagramChannel& channel, const std::uint64_t id) noexcept
        : _loop(loop), _channel(channel), _id(id), _fd(channel.fd())
    {
    }

    void setReadInterest(const bool enable) override { update(EPOLLIN, enable); }

    void setWriteInterest(const bool enable) override { update(EPOLLOUT, enable); }

    void cancel() override { _loop.remove(_id); }

    [[nodiscard]] bool inEventLoop() const override { return _loop.inEventLoop(); }

    [[nodiscard]] DatagramChannel& channel() const noexcept { return _channel; }
    [[nodiscard]] SOCKET fd() const noexcept { return _fd; }
    [[nodiscard]] std::uint32_t events() const noexcept { return _events; }

  private:
    void update(const std::uint32_t flag, const bool enable)
    {
        const std::uint32_t events = enable ? (_events | flag) : (_events & ~flag);
        if (events == _events)
            return;

        epoll_event ev{};
        ev.events = events;
        ev.data.u64 = _id;
        if (::epoll_ctl(_loop._epollFd, EPOLL_CTL_MOD, _fd, &ev) < 0)
            throw NativeIoException("epoll_ctl", errno);
        _events = events;
    }

    EventLoop& _loop;
    DatagramChannel& _channel;
    std::uint64_t _id;
    SOCKET _fd;
    std::uint32_t _events = 0;
};

EventLoop::EventLoop(const int maxEvents)
    : _thread(std::this_thread::get_id()), _events(static_cast<std::size_t>(std::max(maxEvents, 1)))
{
    _epollFd = ::epoll_create1(EPOLL_CLOEXEC);
    if (_epollFd < 0)
        throw NativeIoException("epoll_create1", errno);
}

EventLoop::~EventLoop() noexcept
{
    for (auto& [id, registration] : _registrations)
        registration->channel().setRegistration(nullptr);
    _registrations.clear();

    if (::close(_epollFd) != 0)
        Log::warn(LogTag, "closing the epoll instance failed: " + SocketErrorMessage(errno));
}

void EventLoop::registerChannel(DatagramChannel& channel)
{
    if (!channel.isOpen())
        throw SocketException("registerChannel() failed: channel is closed.");
    if (channel.isRegistered())
        throw SocketException("registerChannel() failed: channel is already registered.");

    const std::uint64_t id = _nextId++;
    auto registration = std::make_unique<Registration>(*this, channel, id);

    // No interest yet: the channel enables what it needs once attached.
    epoll_event ev{};
    ev.data.u64 = id;
    if (::epoll_ctl(_epollFd, EPOLL_CTL_ADD, registration->fd(), &ev) < 0)
        throw NativeIoException("epoll_ctl", errno);

    Registration* raw = registration.get();
    _registrations.emplace(id, std::move(registration));
    try
    {
        channel.setRegistration(raw);
    }
    catch (const SocketException&)
    {
        channel.setRegistration(nullptr);
        remove(id);
        throw;
    }
    Log::debug(LogTag, "registered fd " + std::to_string(raw->fd()));
}

void EventLoop::deregisterChannel(DatagramChannel& channel)
{
    const auto it = std::find_if(_registrations.begin(), _registrations.end(),
                                 [&](const auto& entry) { return &entry.second->channel() == &channel; });
    if (it == _registrations.end())
        return;

    const std::uint64_t id = it->first;
    channel.setRegistration(nullptr);
    remove(id);
}

void EventLoop::remove(const std::uint64_t id) noexcept
{
    const auto it = _registrations.find(id);
    if (it == _registrations.end())
        return;

    // The descriptor may already be closed; the kernel then dropped it from the set itself.
    if (::epoll_ctl(_epollFd, EPOLL_CTL_DEL, it->second->fd(), nullptr) < 0 && errno != EBADF && errno != ENOENT)
        Log::warn(LogTag, "epoll_ctl(EPOLL_CTL_DEL) failed: " + SocketErrorMessage(errno));
    _registrations.erase(it);
}

EventLoop::Registration* EventLoop::find(const std::uint64_t id) noexcept
{
    const auto it = _registrations.find(id);
    return it == _registrations.end() ? nullptr : it->second.get();
}

int EventLoop::runOnce(const int timeoutMillis)
{
    _thread = std::this_thread::get_id();

    const int n = ::epoll_wait(_epollFd, _events.data(), static_cast<int>(_events.size()), timeoutMillis);
    if (n < 0)
    {
        if (errno == EINTR)
            return 0;
        throw NativeIoException("epoll_wait", errno);
    }

    for (int i = 0; i < n; ++i)
    {
        const epoll_event& ev = _events[static_cast<std::size_t>(i)];
        try
        {
            dispatch(ev.data.u64, ev.events);
        }
        catch (const std::exception& e)
        {
            Log::error(LogTag, std::string("channel callback failed: ") + e.what());
        }
    }
    return n;
}

void EventLoop::dispatch(const std::uint64_t id, const std::uint32_t events)
{
    // Look the registration up again before every step: a callback may close or deregister
    // the channel, which destroys its registration.
    if (Registration* reg = find(id); reg != nullptr && (events & (EPOLLIN | EPOLLERR | EPOLLHUP)) != 0)
        reg->channel().readReady();

    if (Registration* reg = find(id); reg != nullptr && (events & EPOLLOUT) != 0)
        reg->channel().flush();
}
