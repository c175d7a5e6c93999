// GoogleTest loopback tests for DatagramSocket, DatagramChannel and EventLoop
#include "nativeudp/DatagramChannel.hpp"
#include "nativeudp/DatagramSocket.hpp"
#include "nativeudp/EventLoop.hpp"
#include "nativeudp/NativeIoException.hpp"
#include "nativeudp/PortUnreachableException.hpp"
#include <gtest/gtest.h>
#include <poll.h>
#include <string>
#include <vector>

using namespace nativeudp;

namespace
{

std::span<const std::byte> view(const std::string_view text)
{
    return std::as_bytes(std::span(text.data(), text.size()));
}

bool waitReadable(const DatagramSocket& s, const int timeoutMillis = 1000)
{
    pollfd pfd{};
    pfd.fd = s.fd();
    pfd.events = POLLIN;
    return ::poll(&pfd, 1, timeoutMillis) == 1;
}

DatagramSocket boundLoopback(const int family = AF_INET)
{
    DatagramSocketOptions opts;
    opts.family = family;
    DatagramSocket s(opts);
    s.bind(InetSocketAddress::loopback(0, family));
    return s;
}

class CollectingHandler final : public ChannelHandler
{
  public:
    std::vector<DatagramPacket> packets;
    std::vector<std::exception_ptr> errors;
    int readCompletes = 0;

    void onPacket(DatagramPacket packet) override { packets.push_back(std::move(packet)); }
    void onReadComplete() override { ++readCompletes; }
    void onError(const std::exception_ptr error) override { errors.push_back(error); }
};

} // namespace

TEST(SocketTest, SendToAndRecvFromReportsBothAddresses)
{
    DatagramSocket server = boundLoopback();
    DatagramSocket client = boundLoopback();

    ASSERT_EQ(client.sendTo(view("ping"), server.localAddress(), 0), 4);
    ASSERT_TRUE(waitReadable(server));

    std::vector<std::byte> buf(64);
    const auto from = server.recvFrom(buf);
    ASSERT_TRUE(from.has_value());
    EXPECT_EQ(from->receivedAmount(), 4);
    EXPECT_EQ(from->port(), client.localAddress().port());
    EXPECT_EQ(from->ip(), "127.0.0.1");
    ASSERT_TRUE(from->localAddress().has_value());
    EXPECT_EQ(from->localAddress()->ip(), "127.0.0.1");
    EXPECT_EQ(from->localAddress()->port(), server.localAddress().port());
}

TEST(SocketTest, EmptyQueueIsNotAnError)
{
    DatagramSocket s = boundLoopback();
    std::vector<std::byte> buf(16);
    EXPECT_FALSE(s.recvFrom(buf).has_value());
    EXPECT_EQ(s.read(buf), 0);
}

TEST(SocketTest, ConnectedWriteAndRead)
{
    DatagramSocket server = boundLoopback();
    DatagramSocket client;
    client.connect(server.localAddress());
    EXPECT_TRUE(client.isConnected());
    ASSERT_TRUE(client.remoteAddress().has_value());
    EXPECT_EQ(client.remoteAddress()->port(), server.localAddress().port());

    ASSERT_EQ(client.write(view("hello"), 0), 5);
    ASSERT_TRUE(waitReadable(server));
    std::vector<std::byte> buf(16);
    const auto from = server.recvFrom(buf);
    ASSERT_TRUE(from.has_value());
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(buf.data()), 5), "hello");

    client.disconnect();
    EXPECT_FALSE(client.isConnected());
    EXPECT_FALSE(client.remoteAddress().has_value());
}

TEST(SocketTest, VectorizedSendIsOneDatagram)
{
    DatagramSocket server = boundLoopback();
    DatagramSocket client;

    const std::string a = "abc";
    const std::string b = "defgh";
    IovArray iov;
    ASSERT_TRUE(iov.add(a.data(), a.size()));
    ASSERT_TRUE(iov.add(b.data(), b.size()));
    EXPECT_EQ(client.sendToAddresses(iov, server.localAddress(), 0), 8);

    ASSERT_TRUE(waitReadable(server));
    std::vector<std::byte> buf(64);
    const auto from = server.recvFrom(buf);
    ASSERT_TRUE(from.has_value());
    EXPECT_EQ(from->receivedAmount(), 8);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(buf.data()), 8), "abcdefgh");
}

TEST(SocketTest, SegmentedSendSplitsIntoDatagrams)
{
    if (!GsoSupported)
        GTEST_SKIP() << "UDP_SEGMENT not available";

    DatagramSocket server = boundLoopback();
    DatagramSocket client;
    const std::string payload(3000, 'g');
    try
    {
        ASSERT_EQ(client.sendTo(view(payload), server.localAddress(), 1000), 3000);
    }
    catch (const NativeIoException& e)
    {
        GTEST_SKIP() << "kernel rejected UDP_SEGMENT: " << e.what();
    }

    std::vector<std::byte> buf(4096);
    for (int i = 0; i < 3; ++i)
    {
        ASSERT_TRUE(waitReadable(server));
        const auto from = server.recvFrom(buf);
        ASSERT_TRUE(from.has_value());
        EXPECT_EQ(from->receivedAmount(), 1000);
    }
    EXPECT_FALSE(server.recvFrom(buf).has_value());
}

TEST(SocketTest, SocketWideSegmentSizeRoundTrips)
{
    if (!GsoSupported)
        GTEST_SKIP() << "UDP_SEGMENT not available";

    DatagramSocket s;
    try
    {
        s.setSegmentSize(1200);
    }
    catch (const NativeIoException& e)
    {
        GTEST_SKIP() << "kernel rejected UDP_SEGMENT: " << e.what();
    }
    EXPECT_EQ(s.getSegmentSize(), 1200);

    s.setSegmentSize(0);
    EXPECT_EQ(s.getSegmentSize(), 0);
    EXPECT_THROW(s.setSegmentSize(0x10000), SocketException);
    EXPECT_THROW(s.setSegmentSize(-1), SocketException);
}

TEST(SocketTest, DualStackReceivesIPv4AsPlainAddress)
{
    DatagramSocketOptions opts;
    opts.family = AF_INET6;
    std::optional<DatagramSocket> server;
    try
    {
        server.emplace(opts);
        server->bind(InetSocketAddress::any(0, AF_INET6));
    }
    catch (const NativeIoException& e)
    {
        GTEST_SKIP() << "IPv6 unavailable: " << e.what();
    }
    EXPECT_FALSE(server->getIPv6Only());

    DatagramSocket client;
    const auto target = InetSocketAddress::loopback(server->localAddress().port());
    ASSERT_EQ(client.sendTo(view("v4"), target, 0), 2);
    ASSERT_TRUE(waitReadable(*server));

    std::vector<std::byte> buf(16);
    const auto from = server->recvFrom(buf);
    ASSERT_TRUE(from.has_value());
    EXPECT_EQ(from->family(), AF_INET);
    EXPECT_EQ(from->ip(), "127.0.0.1");
}

TEST(SocketTest, OptionsAreApplied)
{
    DatagramSocketOptions opts;
    opts.reuseAddress = true;
    opts.broadcast = true;
    opts.receiveBufferSize = 256 * 1024;
    DatagramSocket s(opts);

    EXPECT_TRUE(s.getReuseAddress());
    EXPECT_TRUE(s.getBroadcast());
    EXPECT_TRUE(s.getNonBlocking());
    // Linux doubles the requested size for bookkeeping.
    EXPECT_GE(s.getReceiveBufferSize(), 256 * 1024);
}

TEST(SocketTest, RejectsOutOfRangeBufferSize)
{
    DatagramSocket s;
    EXPECT_THROW(s.setSendBufferSize(0), std::invalid_argument);
    EXPECT_THROW(s.setReceiveBufferSize(static_cast<std::size_t>(INT_MAX) + 1), std::invalid_argument);
}

TEST(SocketTest, RejectsUnknownFamily)
{
    DatagramSocketOptions opts;
    opts.family = AF_UNIX;
    EXPECT_THROW(DatagramSocket{opts}, std::invalid_argument);
}

TEST(SocketTest, BindTwiceThrows)
{
    DatagramSocket s = boundLoopback();
    EXPECT_THROW(s.bind(InetSocketAddress::loopback(0)), SocketException);
}

TEST(SocketTest, CloseIsIdempotent)
{
    DatagramSocket s = boundLoopback();
    s.close();
    EXPECT_FALSE(s.isOpen());
    EXPECT_NO_THROW(s.close());
    EXPECT_TRUE(s.localAddress().isUnspecified());
}

TEST(ChannelLoopbackTest, ConnectedReadReportsPortUnreachable)
{
    // Reserve a port, then free it so nothing listens there.
    InetSocketAddress dead;
    {
        DatagramSocket reserved = boundLoopback();
        dead = reserved.localAddress();
    }

    auto handler = std::make_shared<CollectingHandler>();
    DatagramChannel channel(std::make_unique<DatagramSocket>(), handler);
    channel.connect(dead);

    OutboundMessage msg = channel.config().bufferAllocator->copyOf(view("anyone?"));
    ASSERT_TRUE(channel.writeMessage(msg));

    for (int i = 0; i < 50 && handler->errors.empty(); ++i)
    {
        pollfd pfd{};
        pfd.fd = channel.fd();
        pfd.events = POLLIN;
        ::poll(&pfd, 1, 20);
        channel.readReady();
    }

    ASSERT_FALSE(handler->errors.empty());
    EXPECT_THROW(std::rethrow_exception(handler->errors.front()), PortUnreachableException);
    EXPECT_TRUE(handler->packets.empty());
}

TEST(ChannelLoopbackTest, EventLoopEchoRoundTrip)
{
    class EchoHandler final : public ChannelHandler
    {
      public:
        DatagramChannel* channel = nullptr;
        std::vector<std::future<void>> replies;
        int echoed = 0;

        void onPacket(DatagramPacket packet) override
        {
            const auto sender = packet.sender();
            replies.push_back(channel->write(DatagramPacket(std::move(packet.content()), sender)));
            ++echoed;
        }
        void onReadComplete() override { channel->flush(); }
        void onError(const std::exception_ptr error) override { std::rethrow_exception(error); }
    };

    EventLoop loop;
    auto echo = std::make_shared<EchoHandler>();
    DatagramChannel server(std::make_unique<DatagramSocket>(), echo);
    echo->channel = &server;
    server.bind(InetSocketAddress::loopback(0));
    loop.registerChannel(server);
    EXPECT_EQ(loop.channelCount(), 1u);

    DatagramSocket client = boundLoopback();
    ASSERT_EQ(client.sendTo(view("echo me"), *server.localAddress(), 0), 7);

    std::vector<std::byte> buf(64);
    std::optional<DatagramSocketAddress> reply;
    for (int i = 0; i < 50 && !reply; ++i)
    {
        loop.runOnce(20);
        reply = client.recvFrom(buf);
    }

    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(echo->echoed, 1);
    ASSERT_EQ(echo->replies.size(), 1u);
    EXPECT_NO_THROW(echo->replies[0].get());
    EXPECT_EQ(reply->receivedAmount(), 7);
    EXPECT_EQ(std::string(reinterpret_cast<const char*>(buf.data()), 7), "echo me");
    EXPECT_EQ(reply->port(), server.localAddress()->port());

    loop.deregisterChannel(server);
    EXPECT_EQ(loop.channelCount(), 0u);
    EXPECT_FALSE(server.isRegistered());
}

TEST(ChannelLoopbackTest, RegisteringClosedChannelThrows)
{
    EventLoop loop;
    DatagramChannel channel(std::make_unique<DatagramSocket>(), std::make_shared<CollectingHandler>());
    channel.close();
    EXPECT_THROW(loop.registerChannel(channel), SocketException);
}
