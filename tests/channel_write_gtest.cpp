// GoogleTest unit tests for the outbound path of DatagramChannel: filter, write engine and send queue
#include "FakeDatagramIo.hpp"
#include "nativeudp/DatagramChannel.hpp"
#include "nativeudp/NativeIoException.hpp"
#include "nativeudp/UnsupportedOperationException.hpp"
#include <chrono>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace nativeudp;
using namespace nativeudp::fakes;

namespace
{

class ChannelWriteTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        auto fake = std::make_unique<FakeDatagramIo>();
        io = fake.get();
        DatagramChannelConfig config;
        config.bufferAllocator = alloc;
        channel = std::make_unique<DatagramChannel>(std::move(fake), handler, config);
        channel->setRegistration(&registration);
    }

    void TearDown() override { channel->setRegistration(nullptr); }

    Buffer payload(const std::string& text) const
    {
        Buffer b = alloc->allocate(text.size());
        b.writeBytes(text);
        return b;
    }

    Buffer composite(const std::vector<std::string>& parts) const
    {
        std::vector<Buffer> buffers;
        for (const auto& p : parts)
            buffers.push_back(payload(p));
        return Buffer::compose(std::move(buffers));
    }

    std::shared_ptr<BufferAllocator> alloc = std::make_shared<BufferAllocator>(MemoryKind::Direct);
    std::shared_ptr<RecordingHandler> handler = std::make_shared<RecordingHandler>();
    RecordingRegistration registration;
    FakeDatagramIo* io = nullptr;
    std::unique_ptr<DatagramChannel> channel;
    const InetSocketAddress peer = InetSocketAddress::loopback(7000);
};

bool isReady(const std::future<void>& f)
{
    return f.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

} // namespace

TEST_F(ChannelWriteTest, EmptyPayloadIsConsumedWithoutNativeCall)
{
    OutboundMessage msg = DatagramPacket(alloc->allocate(0), peer);
    EXPECT_TRUE(channel->writeMessage(msg));
    OutboundMessage plain = alloc->allocate(32);
    EXPECT_TRUE(channel->writeMessage(plain));
    EXPECT_TRUE(io->sends.empty());
}

TEST_F(ChannelWriteTest, SingleDirectRegionUsesAddressCall)
{
    OutboundMessage msg = DatagramPacket(payload("hello"), peer);
    EXPECT_TRUE(channel->writeMessage(msg));

    ASSERT_EQ(io->sends.size(), 1u);
    const SendCall& call = io->sends[0];
    EXPECT_EQ(call.kind, SendKind::SendToAddress);
    ASSERT_EQ(call.regions.size(), 1u);
    EXPECT_EQ(call.totalBytes(), 5u);
    ASSERT_TRUE(call.recipient.has_value());
    EXPECT_EQ(*call.recipient, peer);
    EXPECT_EQ(call.segmentSize, 0);
    EXPECT_EQ(std::get<DatagramPacket>(msg).content().readableBytes(), 0u);
}

TEST_F(ChannelWriteTest, SingleHeapRegionUsesSpanCall)
{
    BufferAllocator heap(MemoryKind::Heap);
    Buffer b = heap.allocate(3);
    b.writeBytes("abc");
    OutboundMessage msg = std::move(b);
    EXPECT_TRUE(channel->writeMessage(msg));

    ASSERT_EQ(io->sends.size(), 1u);
    EXPECT_EQ(io->sends[0].kind, SendKind::Write);
    EXPECT_FALSE(io->sends[0].recipient.has_value());
}

TEST_F(ChannelWriteTest, EnvelopeWithoutRecipientGoesToConnectedPeer)
{
    OutboundMessage msg = AddressedEnvelope(payload("x"));
    EXPECT_TRUE(channel->writeMessage(msg));
    ASSERT_EQ(io->sends.size(), 1u);
    EXPECT_EQ(io->sends[0].kind, SendKind::WriteAddress);
}

TEST_F(ChannelWriteTest, MultipleRegionsAreAlwaysVectorized)
{
    OutboundMessage addressed = DatagramPacket(composite({"ab", "cd", "ef"}), peer);
    EXPECT_TRUE(channel->writeMessage(addressed));
    OutboundMessage connected = composite({"12", "34"});
    EXPECT_TRUE(channel->writeMessage(connected));

    ASSERT_EQ(io->sends.size(), 2u);
    EXPECT_EQ(io->sends[0].kind, SendKind::SendToAddresses);
    EXPECT_EQ(io->sends[0].regions.size(), 3u);
    EXPECT_EQ(*io->sends[0].recipient, peer);
    EXPECT_EQ(io->sends[1].kind, SendKind::Writev);
    EXPECT_EQ(io->sends[1].regions.size(), 2u);
}

TEST_F(ChannelWriteTest, VectorizedPositiveResultMeansConsumed)
{
    io->vectorResult = 1;
    OutboundMessage msg = composite({"abc", "def"});
    EXPECT_TRUE(channel->writeMessage(msg));

    io->vectorResult = 0;
    OutboundMessage blocked = composite({"abc", "def"});
    EXPECT_FALSE(channel->writeMessage(blocked));
}

TEST_F(ChannelWriteTest, ShortWriteIsNotConsumed)
{
    io->acceptLimit = 3;
    OutboundMessage msg = DatagramPacket(payload("0123456789"), peer);
    EXPECT_FALSE(channel->writeMessage(msg));
    EXPECT_EQ(std::get<DatagramPacket>(msg).content().readableBytes(), 7u);
}

TEST_F(ChannelWriteTest, WouldBlockIsNotConsumed)
{
    io->acceptLimit = 0;
    OutboundMessage msg = payload("data");
    EXPECT_FALSE(channel->writeMessage(msg));
    EXPECT_EQ(std::get<Buffer>(msg).readableBytes(), 4u);
}

TEST_F(ChannelWriteTest, SegmentedPacketIsOneCallWithSegmentSize)
{
    Buffer b = alloc->allocate(9000);
    b.writeBytes(std::string(9000, 'g'));
    OutboundMessage msg = SegmentedDatagramPacket(std::move(b), 1500, peer);
    EXPECT_TRUE(channel->writeMessage(msg));

    ASSERT_EQ(io->sends.size(), 1u);
    EXPECT_EQ(io->sends[0].kind, SendKind::SendToAddress);
    EXPECT_EQ(io->sends[0].totalBytes(), 9000u);
    EXPECT_EQ(io->sends[0].segmentSize, 1500);
}

TEST_F(ChannelWriteTest, SegmentedCompositeIsOneVectorizedCall)
{
    OutboundMessage msg =
        SegmentedDatagramPacket(composite({std::string(4500, 'a'), std::string(4500, 'b')}), 1500, peer);
    EXPECT_TRUE(channel->writeMessage(msg));

    ASSERT_EQ(io->sends.size(), 1u);
    EXPECT_EQ(io->sends[0].kind, SendKind::SendToAddresses);
    EXPECT_EQ(io->sends[0].totalBytes(), 9000u);
    EXPECT_EQ(io->sends[0].segmentSize, 1500);
}

TEST_F(ChannelWriteTest, NativeFailurePropagates)
{
    io->sendError = std::make_exception_ptr(NativeIoException("sendmsg", EMSGSIZE));
    OutboundMessage msg = DatagramPacket(payload("big"), peer);
    EXPECT_THROW((void) channel->writeMessage(msg), NativeIoException);
}

TEST_F(ChannelWriteTest, FilterPassesDirectPayloadThrough)
{
    Buffer b = payload("direct");
    const std::size_t allocatedBefore = alloc->allocatedBuffers();

    OutboundMessage out = channel->filterOutboundMessage(DatagramPacket(std::move(b), peer));
    ASSERT_TRUE(std::holds_alternative<DatagramPacket>(out));
    EXPECT_EQ(alloc->allocatedBuffers(), allocatedBefore);
    EXPECT_EQ(std::get<DatagramPacket>(out).content().toString(), "direct");
}

TEST_F(ChannelWriteTest, FilterCopiesHeapPayloadIntoDirectMemory)
{
    BufferAllocator heap(MemoryKind::Heap);
    Buffer b = heap.allocate(4);
    b.writeBytes("heap");
    b.touch("caller");

    OutboundMessage out = channel->filterOutboundMessage(SegmentedDatagramPacket(std::move(b), 2, peer));
    ASSERT_TRUE(std::holds_alternative<SegmentedDatagramPacket>(out));
    const auto& packet = std::get<SegmentedDatagramPacket>(out);
    EXPECT_TRUE(packet.content().isDirect());
    EXPECT_EQ(packet.content().toString(), "heap");
    EXPECT_EQ(packet.segmentSize(), 2);
    EXPECT_EQ(*packet.recipient(), peer);
    EXPECT_EQ(heap.outstandingBuffers(), 0u);
}

TEST_F(ChannelWriteTest, FilterCopiesBorrowedEnvelope)
{
    const std::string text = "caller memory";
    Buffer borrowed = alloc->wrap(std::as_bytes(std::span(text)));

    OutboundMessage out = channel->filterOutboundMessage(AddressedEnvelope(std::move(borrowed), peer));
    ASSERT_TRUE(std::holds_alternative<AddressedEnvelope>(out));
    const auto& envelope = std::get<AddressedEnvelope>(out);
    EXPECT_TRUE(envelope.content().isDirect());
    EXPECT_EQ(envelope.content().toString(), text);
    // The borrowed view and nothing else has been released.
    EXPECT_EQ(alloc->releasedBuffers(), 1u);
    EXPECT_EQ(alloc->outstandingBuffers(), 1u);
}

TEST_F(ChannelWriteTest, FilterFallsBackToDirectAllocatorForHeapConfig)
{
    auto fake = std::make_unique<FakeDatagramIo>();
    DatagramChannelConfig config;
    config.bufferAllocator = std::make_shared<BufferAllocator>(MemoryKind::Heap);
    DatagramChannel heapChannel(std::move(fake), handler, config);

    Buffer b = config.bufferAllocator->allocate(2);
    b.writeBytes("hi");
    OutboundMessage out = heapChannel.filterOutboundMessage(std::move(b));
    EXPECT_TRUE(std::get<Buffer>(out).isDirect());
}

TEST_F(ChannelWriteTest, FilterRejectsUnsupportedShapes)
{
    EXPECT_THROW((void) channel->filterOutboundMessage(OutboundMessage{}), UnsupportedOperationException);
    EXPECT_THROW((void) channel->filterOutboundMessage(DatagramPacket(payload("no recipient"))),
                 UnsupportedOperationException);
    EXPECT_THROW((void) channel->filterOutboundMessage(AddressedEnvelope(payload("x"), InetSocketAddress())),
                 UnsupportedOperationException);

    try
    {
        (void) channel->filterOutboundMessage(OutboundMessage{});
    }
    catch (const UnsupportedOperationException& e)
    {
        EXPECT_NE(std::string(e.what()).find("expected: DatagramPacket"), std::string::npos);
    }
}

TEST_F(ChannelWriteTest, FlushSendsQueuedMessagesAndCompletesFutures)
{
    auto first = channel->write(DatagramPacket(payload("one"), peer));
    auto second = channel->write(payload("two"));
    EXPECT_EQ(channel->pendingWrites(), 2u);
    EXPECT_TRUE(io->sends.empty());

    channel->flush();
    EXPECT_EQ(io->sends.size(), 2u);
    EXPECT_EQ(channel->pendingWrites(), 0u);
    ASSERT_TRUE(isReady(first));
    EXPECT_NO_THROW(first.get());
    EXPECT_NO_THROW(second.get());
    EXPECT_FALSE(registration.writeInterest);
    EXPECT_EQ(alloc->outstandingBuffers(), 0u);
}

TEST_F(ChannelWriteTest, BackPressureKeepsHeadAndRegistersWriteInterest)
{
    io->acceptLimit = 0;
    auto f = channel->writeAndFlush(DatagramPacket(payload("later"), peer));
    EXPECT_FALSE(isReady(f));
    EXPECT_EQ(channel->pendingWrites(), 1u);
    EXPECT_TRUE(registration.writeInterest);
    // writeSpinCount attempts, all refused.
    EXPECT_EQ(io->sends.size(), 16u);

    io->acceptLimit = -1;
    channel->flush();
    EXPECT_TRUE(isReady(f));
    EXPECT_EQ(channel->pendingWrites(), 0u);
    EXPECT_FALSE(registration.writeInterest);
}

TEST_F(ChannelWriteTest, FailedSendFailsOnlyThatMessage)
{
    io->sendError = std::make_exception_ptr(NativeIoException("sendmsg", EMSGSIZE));
    auto bad = channel->write(DatagramPacket(payload("too big"), peer));
    channel->flush();
    EXPECT_THROW(bad.get(), NativeIoException);

    io->sendError = nullptr;
    auto good = channel->writeAndFlush(DatagramPacket(payload("fine"), peer));
    EXPECT_NO_THROW(good.get());
}

TEST_F(ChannelWriteTest, MaxMessagesPerWriteBoundsOneFlush)
{
    channel->config().maxMessagesPerWrite = 2;
    for (int i = 0; i < 3; ++i)
        (void) channel->write(payload("m"));
    channel->flush();
    EXPECT_EQ(io->sends.size(), 2u);
    EXPECT_EQ(channel->pendingWrites(), 1u);
    EXPECT_TRUE(registration.writeInterest);
}

TEST_F(ChannelWriteTest, WriteToUnsupportedShapeFailsFuture)
{
    auto f = channel->write(OutboundMessage{});
    EXPECT_THROW(f.get(), UnsupportedOperationException);
    EXPECT_EQ(channel->pendingWrites(), 0u);
}

TEST_F(ChannelWriteTest, CloseFailsPendingWrites)
{
    io->acceptLimit = 0;
    auto f = channel->writeAndFlush(payload("stuck"));
    channel->close();
    EXPECT_THROW(f.get(), SocketException);
    EXPECT_EQ(registration.cancels, 1);
    EXPECT_EQ(alloc->outstandingBuffers(), 0u);

    auto afterClose = channel->write(payload("late"));
    EXPECT_THROW(afterClose.get(), SocketException);
}

TEST_F(ChannelWriteTest, MulticastIsNotSupported)
{
    EXPECT_THROW(channel->joinGroup("239.1.2.3").get(), UnsupportedOperationException);
    EXPECT_THROW(channel->joinGroup("239.1.2.3", "eth0", "").get(), UnsupportedOperationException);
    EXPECT_THROW(channel->leaveGroup("239.1.2.3").get(), UnsupportedOperationException);
    EXPECT_THROW(channel->leaveGroup("239.1.2.3", "eth0", "10.0.0.1").get(), UnsupportedOperationException);
    EXPECT_THROW(channel->block("239.1.2.3", "eth0", "10.0.0.1").get(), UnsupportedOperationException);
    EXPECT_THROW(channel->block("239.1.2.3", "10.0.0.1").get(), UnsupportedOperationException);

    try
    {
        channel->joinGroup("239.1.2.3").get();
    }
    catch (const UnsupportedOperationException& e)
    {
        EXPECT_STREQ(e.what(), "Multicast not supported");
    }
    EXPECT_TRUE(io->sends.empty());
    EXPECT_TRUE(channel->isOpen());
    EXPECT_FALSE(channel->isConnected());
}

TEST_F(ChannelWriteTest, MulticastRejectsMissingArguments)
{
    EXPECT_THROW((void) channel->joinGroup(""), std::invalid_argument);
    EXPECT_THROW((void) channel->joinGroup("239.1.2.3", "", ""), std::invalid_argument);
    EXPECT_THROW((void) channel->leaveGroup(""), std::invalid_argument);
    EXPECT_THROW((void) channel->block("239.1.2.3", "eth0", ""), std::invalid_argument);
    EXPECT_THROW((void) channel->block("", "10.0.0.1"), std::invalid_argument);
}
