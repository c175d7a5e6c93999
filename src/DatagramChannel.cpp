#include "nativeudp/DatagramChannel.hpp"
#include "nativeudp/Errors.hpp"
#include "nativeudp/Log.hpp"
#include "nativeudp/NativeIoException.hpp"
#include "nativeudp/UnsupportedOperationException.hpp"

#include <algorithm>
#include <cassert>
#include <climits>
#include <stdexcept>

using namespace nativeudp;

namespace
{

constexpr std::string_view LogTag = "DatagramChannel";

constexpr std::string_view ExpectedTypes =
    " (expected: DatagramPacket, SegmentedDatagramPacket, AddressedEnvelope<Buffer, InetSocketAddress>, Buffer)";

std::string_view messageTypeName(const OutboundMessage& msg) noexcept
{
    switch (msg.index())
    {
    case 1:
        return "Buffer";
    case 2:
        return "DatagramPacket";
    case 3:
        return "SegmentedDatagramPacket";
    case 4:
        return "AddressedEnvelope";
    default:
        return "empty message";
    }
}

/// Payload, destination and segmentation of an outbound message.
struct OutboundParts
{
    Buffer* data = nullptr;
    const InetSocketAddress* recipient = nullptr;
    int segmentSize = 0;
};

const InetSocketAddress* recipientOf(const std::optional<InetSocketAddress>& recipient) noexcept
{
    return recipient ? &*recipient : nullptr;
}

OutboundParts unpack(OutboundMessage& msg)
{
    if (auto* packet = std::get_if<SegmentedDatagramPacket>(&msg))
        return {&packet->content(), recipientOf(packet->recipient()), packet->segmentSize()};
    if (auto* packet = std::get_if<DatagramPacket>(&msg))
        return {&packet->content(), recipientOf(packet->recipient()), 0};
    if (auto* envelope = std::get_if<AddressedEnvelope>(&msg))
        return {&envelope->content(), recipientOf(envelope->recipient()), 0};
    if (auto* buffer = std::get_if<Buffer>(&msg))
        return {buffer, nullptr, 0};

    throw UnsupportedOperationException(std::string("unsupported message type: ") +
                                        std::string(messageTypeName(msg)) + std::string(ExpectedTypes));
}

bool isBufferCopyNeededForWrite(const Buffer& buf) noexcept
{
    return !buf.isDirect() || buf.countReadableComponents() > MaxIovecCount;
}

bool isInetRecipient(const std::optional<InetSocketAddress>& recipient) noexcept
{
    return recipient && recipient->isInet();
}

int toInt(const std::size_t n) noexcept
{
    return static_cast<int>(std::min<std::size_t>(n, INT_MAX));
}

void requireNonEmpty(const std::string_view value, const char* name)
{
    if (value.empty())
        throw std::invalid_argument(std::string(name) + " must not be empty");
}

std::future<void> multicastNotSupported()
{
    std::promise<void> promise;
    promise.set_exception(std::make_exception_ptr(UnsupportedOperationException("Multicast not supported")));
    return promise.get_future();
}

} // namespace

DatagramChannel::DatagramChannel(std::unique_ptr<DatagramIo> io, std::shared_ptr<ChannelHandler> handler,
                                 DatagramChannelConfig config)
    : _io(std::move(io)), _handler(std::move(handler)), _config(std::move(config))
{
    if (!_io)
        throw std::invalid_argument("io must not be null");
    if (!_handler)
        throw std::invalid_argument("handler must not be null");
    if (!_config.bufferAllocator || !_config.recvBufferAllocator)
        throw std::invalid_argument("config allocators must not be null");
    if (_config.writeSpinCount <= 0)
        throw std::invalid_argument("writeSpinCount: " + std::to_string(_config.writeSpinCount) + " (expected: > 0)");
    if (_config.maxMessagesPerWrite <= 0)
        throw std::invalid_argument("maxMessagesPerWrite: " + std::to_string(_config.maxMessagesPerWrite) +
                                    " (expected: > 0)");
}

DatagramChannel::~DatagramChannel() noexcept
{
    try
    {
        close();
    }
    catch (const std::exception& e)
    {
        Log::warn(LogTag, std::string("close on destruction failed: ") + e.what());
    }
}

void DatagramChannel::assertInEventLoop() const
{
    assert(_registration == nullptr || _registration->inEventLoop());
}

void DatagramChannel::setAutoRead(const bool autoRead)
{
    assertInEventLoop();
    const bool wasAutoRead = _config.autoRead;
    _config.autoRead = autoRead;
    if (autoRead && !wasAutoRead)
        read();
    else if (!autoRead && wasAutoRead)
    {
        _readPending = false;
        setReadInterest(false);
    }
}

void DatagramChannel::bind(const InetSocketAddress& local)
{
    assertInEventLoop();
    _io->bind(local);
    _active = true;
    resetCachedAddresses();
    Log::debug(LogTag, "bound to " + localAddress().value_or(InetSocketAddress()).toString());
}

void DatagramChannel::connect(const InetSocketAddress& remote, const std::optional<InetSocketAddress>& local)
{
    assertInEventLoop();
    if (local)
        _io->bind(*local);
    _io->connect(remote);
    _connected = true;
    _active = true;
    resetCachedAddresses();
    Log::debug(LogTag, "connected to " + remote.toString());
}

void DatagramChannel::disconnect()
{
    assertInEventLoop();
    _io->disconnect();
    _connected = false;
    _active = false;
    resetCachedAddresses();
}

void DatagramChannel::close()
{
    if (!_io->isOpen())
        return;

    _connected = false;
    _active = false;
    _readPending = false;
    failPendingWrites(std::make_exception_ptr(SocketException("channel closed")));
    if (_registration != nullptr)
    {
        ChannelRegistration* registration = _registration;
        _registration = nullptr;
        registration->cancel();
    }
    resetCachedAddresses();
    _io->close();
    Log::debug(LogTag, "closed");
}

bool DatagramChannel::isActive() const noexcept
{
    return _io->isOpen() && ((_config.activeOnOpen && isRegistered()) || _active);
}

std::optional<InetSocketAddress> DatagramChannel::localAddress()
{
    if (!_localAddress && _io->isOpen())
    {
        InetSocketAddress local = _io->localAddress();
        if (!local.isUnspecified())
            _localAddress = std::move(local);
    }
    return _localAddress;
}

std::optional<InetSocketAddress> DatagramChannel::remoteAddress()
{
    if (!_remoteAddress && _connected)
        _remoteAddress = _io->remoteAddress();
    return _remoteAddress;
}

void DatagramChannel::resetCachedAddresses() noexcept
{
    _localAddress.reset();
    _remoteAddress.reset();
}

void DatagramChannel::setRegistration(ChannelRegistration* registration)
{
    _registration = registration;
    if (_registration != nullptr && _config.autoRead)
        read();
}

void DatagramChannel::setReadInterest(const bool enable)
{
    if (_registration != nullptr)
        _registration->setReadInterest(enable);
}

void DatagramChannel::setWriteInterest(const bool enable)
{
    if (_registration != nullptr)
        _registration->setWriteInterest(enable);
}

// ---------------------------------------------------------------------------------------------
// Outbound
// ---------------------------------------------------------------------------------------------

std::future<void> DatagramChannel::write(OutboundMessage msg)
{
    assertInEventLoop();
    std::promise<void> promise;
    auto future = promise.get_future();

    if (!_io->isOpen())
    {
        promise.set_exception(std::make_exception_ptr(SocketException("write() failed: channel is closed.")));
        return future;
    }

    OutboundMessage filtered;
    try
    {
        filtered = filterOutboundMessage(std::move(msg));
    }
    catch (const std::exception&)
    {
        promise.set_exception(std::current_exception());
        return future;
    }

    _pending.push_back(PendingWrite{std::move(filtered), std::move(promise)});
    return future;
}

std::future<void> DatagramChannel::writeAndFlush(OutboundMessage msg)
{
    auto future = write(std::move(msg));
    flush();
    return future;
}

void DatagramChannel::flush()
{
    assertInEventLoop();
    int maxMessagesPerWrite = _config.maxMessagesPerWrite;
    while (maxMessagesPerWrite > 0 && !_pending.empty())
    {
        PendingWrite& head = _pending.front();
        try
        {
            bool done = false;
            for (int i = _config.writeSpinCount; i > 0; --i)
            {
                if (writeMessage(head.message))
                {
                    done = true;
                    break;
                }
            }

            if (!done)
                break;

            head.promise.set_value();
        }
        catch (const std::exception& e)
        {
            // The message can never be sent; fail it and move on to the next one.
            Log::warn(LogTag, std::string("dropping outbound message: ") + e.what());
            head.promise.set_exception(std::current_exception());
        }
        _pending.pop_front();
        --maxMessagesPerWrite;
    }

    setWriteInterest(!_pending.empty());
}

void DatagramChannel::failPendingWrites(const std::exception_ptr& error)
{
    while (!_pending.empty())
    {
        _pending.front().promise.set_exception(error);
        _pending.pop_front();
    }
}

bool DatagramChannel::writeMessage(OutboundMessage& msg)
{
    const OutboundParts out = unpack(msg);
    Buffer& data = *out.data;

    const std::size_t initialReadableBytes = data.readableBytes();
    if (initialReadableBytes == 0)
        return true;

    if (data.countReadableComponents() > 1)
    {
        _iov.clear();
        if (!_iov.addReadable(data))
            throw SocketException("writeMessage() failed: payload does not fit in one vectorized send.");

        const long writtenBytes = out.recipient == nullptr
                                      ? _io->writev(_iov, out.segmentSize)
                                      : _io->sendToAddresses(_iov, *out.recipient, out.segmentSize);
        return writtenBytes > 0;
    }

    data.forEachReadable(
        [&](int, Buffer::ReadableComponent& c)
        {
            const std::uintptr_t address = c.readableNativeAddress();
            int written;
            if (out.recipient == nullptr)
            {
                written = address != 0 ? _io->writeAddress(address, toInt(c.readableBytes()), out.segmentSize)
                                       : _io->write(c.readableView(), out.segmentSize);
            }
            else
            {
                written = address != 0 ? _io->sendToAddress(address, toInt(c.readableBytes()), *out.recipient,
                                                            out.segmentSize)
                                       : _io->sendTo(c.readableView(), *out.recipient, out.segmentSize);
            }
            if (written > 0)
                c.skipReadableBytes(static_cast<std::size_t>(written));
            return false;
        });
    // Linux never reports a short datagram write: sendmsg() takes the whole datagram or fails.
    // A remainder left here would go out as a separate datagram on the next attempt.
    return data.readableBytes() == 0;
}

OutboundMessage DatagramChannel::filterOutboundMessage(OutboundMessage&& msg)
{
    if (auto* buf = std::get_if<Buffer>(&msg))
    {
        if (!isBufferCopyNeededForWrite(*buf))
            return std::move(msg);
        OutboundMessage filtered(newDirectBuffer(*buf));
        buf->close();
        return filtered;
    }

    if (auto* packet = std::get_if<SegmentedDatagramPacket>(&msg); packet && isInetRecipient(packet->recipient()))
    {
        if (!isBufferCopyNeededForWrite(packet->content()))
            return std::move(msg);
        OutboundMessage filtered(packet->replace(newDirectBuffer(packet->content())));
        packet->content().close();
        return filtered;
    }

    if (auto* packet = std::get_if<DatagramPacket>(&msg); packet && isInetRecipient(packet->recipient()))
    {
        if (!isBufferCopyNeededForWrite(packet->content()))
            return std::move(msg);
        OutboundMessage filtered(packet->replace(newDirectBuffer(packet->content())));
        packet->content().close();
        return filtered;
    }

    if (auto* envelope = std::get_if<AddressedEnvelope>(&msg);
        envelope && (!envelope->recipient() || envelope->recipient()->isInet()))
    {
        if (!isBufferCopyNeededForWrite(envelope->content()))
            return std::move(msg);
        OutboundMessage filtered(AddressedEnvelope(newDirectBuffer(envelope->content()), envelope->recipient()));
        // Only released once the copy exists; a failed copy leaves the caller's envelope intact.
        envelope->content().close();
        return filtered;
    }

    throw UnsupportedOperationException(std::string("unsupported message type: ") +
                                        std::string(messageTypeName(msg)) + std::string(ExpectedTypes));
}

Buffer DatagramChannel::newDirectBuffer(Buffer& src)
{
    Buffer copy = directAllocator().allocate(src.readableBytes());
    src.forEachReadable(
        [&](int, Buffer::ReadableComponent& c)
        {
            copy.writeBytes(c.readableView());
            return true;
        });
    if (!src.touchHint().empty())
        copy.touch(src.touchHint());
    return copy;
}

BufferAllocator& DatagramChannel::directAllocator()
{
    if (_config.bufferAllocator->kind() == MemoryKind::Direct)
        return *_config.bufferAllocator;
    if (!_directFallback)
        _directFallback = std::make_unique<BufferAllocator>(MemoryKind::Direct);
    return *_directFallback;
}

// ---------------------------------------------------------------------------------------------
// Inbound
// ---------------------------------------------------------------------------------------------

void DatagramChannel::read()
{
    assertInEventLoop();
    if (!_io->isOpen())
        return;
    _readPending = true;
    setReadInterest(true);
}

void DatagramChannel::readIfIsAutoRead()
{
    if (_config.autoRead)
        read();
}

bool DatagramChannel::shouldBreakReadReady() const
{
    return !_io->isOpen() || (_config.readSuspended && _config.readSuspended());
}

void DatagramChannel::readReadyBefore() noexcept
{
    _burstPackets = 0;
}

void DatagramChannel::readReadyFinally()
{
    if (!_readPending && !_config.autoRead)
        setReadInterest(false);
    if (Log::enabled(LogLevel::Debug))
        Log::debug(LogTag, "read burst delivered " + std::to_string(_burstPackets) + " packet(s)");
}

RecvBufferAllocator::Handle& DatagramChannel::recvHandle()
{
    if (!_recvHandle || _recvHandleSource != _config.recvBufferAllocator)
    {
        _recvHandle = _config.recvBufferAllocator->newHandle();
        _recvHandleSource = _config.recvBufferAllocator;
    }
    return *_recvHandle;
}

void DatagramChannel::readReady()
{
    readReady(recvHandle());
}

int DatagramChannel::doReadBytes(Buffer& data)
{
    int bytesRead = 0;
    data.forEachWritable(
        [&](int, Buffer::WritableComponent& c)
        {
            const std::uintptr_t address = c.writableNativeAddress();
            bytesRead = address != 0 ? _io->readAddress(address, toInt(c.writableBytes())) : _io->read(c.writableView());
            if (bytesRead > 0)
                c.skipWritableBytes(static_cast<std::size_t>(bytesRead));
            return false;
        });
    return bytesRead;
}

std::optional<DatagramSocketAddress> DatagramChannel::doReceive(Buffer& data)
{
    std::optional<DatagramSocketAddress> sender;
    data.forEachWritable(
        [&](int, Buffer::WritableComponent& c)
        {
            const std::uintptr_t address = c.writableNativeAddress();
            sender = address != 0 ? _io->recvFromAddress(address, toInt(c.writableBytes()))
                                  : _io->recvFrom(c.writableView());
            return false;
        });
    return sender;
}

void DatagramChannel::readReady(RecvBufferAllocator::Handle& handle)
{
    assertInEventLoop();
    if (shouldBreakReadReady())
    {
        setReadInterest(false);
        return;
    }

    BufferAllocator& allocator = *_config.bufferAllocator;
    handle.reset(_config);
    readReadyBefore();

    try
    {
        std::exception_ptr error;
        Buffer data;
        try
        {
            const bool connected = isConnected();
            do
            {
                data = handle.allocate(allocator);
                handle.attemptedBytesRead(toInt(data.writableBytes()));

                std::optional<DatagramPacket> packet;
                if (connected)
                {
                    try
                    {
                        handle.lastBytesRead(doReadBytes(data));
                    }
                    catch (const NativeIoException& e)
                    {
                        std::rethrow_exception(translateConnectedReadError(e));
                    }
                    if (handle.lastBytesRead() <= 0)
                    {
                        data.close();
                        break;
                    }
                    packet.emplace(std::move(data), localAddress(), remoteAddress());
                }
                else
                {
                    std::optional<DatagramSocketAddress> sender = doReceive(data);
                    if (!sender)
                    {
                        handle.lastBytesRead(-1);
                        data.close();
                        break;
                    }
                    std::optional<InetSocketAddress> local = sender->localAddress();
                    if (!local)
                        local = localAddress();
                    handle.lastBytesRead(sender->receivedAmount());
                    data.skipWritableBytes(static_cast<std::size_t>(handle.lastBytesRead()));
                    packet.emplace(std::move(data), std::move(local), InetSocketAddress(*sender));
                }

                handle.incMessagesRead(1);
                _readPending = false;
                ++_burstPackets;
                _handler->onPacket(std::move(*packet));
            } while (_io->isOpen() && handle.continueReading([] { return true; }));
        }
        catch (...)
        {
            data.close();
            error = std::current_exception();
            Log::debug(LogTag, "read burst ended by an exception after " + std::to_string(_burstPackets) +
                                   " packet(s)");
        }

        handle.readComplete();
        _handler->onReadComplete();

        if (error)
            _handler->onError(error);
        else
            readIfIsAutoRead();
    }
    catch (...)
    {
        readReadyFinally();
        throw;
    }
    readReadyFinally();
}

// ---------------------------------------------------------------------------------------------
// Multicast
// ---------------------------------------------------------------------------------------------

std::future<void> DatagramChannel::joinGroup(const std::string_view multicastAddress)
{
    requireNonEmpty(multicastAddress, "multicastAddress");
    return multicastNotSupported();
}

std::future<void> DatagramChannel::joinGroup(const std::string_view multicastAddress,
                                             const std::string_view networkInterface, std::string_view)
{
    requireNonEmpty(multicastAddress, "multicastAddress");
    requireNonEmpty(networkInterface, "networkInterface");
    return multicastNotSupported();
}

std::future<void> DatagramChannel::leaveGroup(const std::string_view multicastAddress)
{
    requireNonEmpty(multicastAddress, "multicastAddress");
    return multicastNotSupported();
}

std::future<void> DatagramChannel::leaveGroup(const std::string_view multicastAddress,
                                              const std::string_view networkInterface, std::string_view)
{
    requireNonEmpty(multicastAddress, "multicastAddress");
    requireNonEmpty(networkInterface, "networkInterface");
    return multicastNotSupported();
}

std::future<void> DatagramChannel::block(const std::string_view multicastAddress,
                                         const std::string_view networkInterface, const std::string_view sourceToBlock)
{
    requireNonEmpty(multicastAddress, "multicastAddress");
    requireNonEmpty(sourceToBlock, "sourceToBlock");
    requireNonEmpty(networkInterface, "networkInterface");
    return multicastNotSupported();
}

std::future<void> DatagramChannel::block(const std::string_view multicastAddress, const std::string_view sourceToBlock)
{
    requireNonEmpty(multicastAddress, "multicastAddress");
    requireNonEmpty(sourceToBlock, "sourceToBlock");
    return multicastNotSupported();
}
