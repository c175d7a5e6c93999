// GoogleTest unit tests for receive-buffer sizing and read-burst bounds
#include "nativeudp/DatagramChannelConfig.hpp"
#include "nativeudp/RecvBufferAllocator.hpp"
#include <gtest/gtest.h>

using namespace nativeudp;

TEST(FixedRecvBufferAllocatorTest, AllocatesConfiguredSize)
{
    const FixedRecvBufferAllocator fixed(512);
    const auto handle = fixed.newHandle();
    BufferAllocator alloc;
    DatagramChannelConfig config;
    handle->reset(config);
    EXPECT_EQ(handle->guess(), 512);
    EXPECT_EQ(handle->allocate(alloc).writableBytes(), 512u);
}

TEST(FixedRecvBufferAllocatorTest, DatagramDefaultIs2048)
{
    EXPECT_EQ(FixedRecvBufferAllocator().bufferSize(), 2048);
    EXPECT_THROW(FixedRecvBufferAllocator(0), std::invalid_argument);
}

TEST(MaxMessagesRecvBufferAllocatorTest, BurstStopsAtMessageLimit)
{
    FixedRecvBufferAllocator fixed;
    fixed.maxMessagesPerRead(3);
    const auto handle = fixed.newHandle();
    DatagramChannelConfig config;
    handle->reset(config);

    int reads = 0;
    do
    {
        handle->lastBytesRead(10);
        handle->incMessagesRead(1);
        ++reads;
    } while (handle->continueReading([] { return true; }));
    EXPECT_EQ(reads, 3);
}

TEST(MaxMessagesRecvBufferAllocatorTest, BurstStopsOnEmptyRead)
{
    const FixedRecvBufferAllocator fixed;
    const auto handle = fixed.newHandle();
    DatagramChannelConfig config;
    handle->reset(config);

    handle->lastBytesRead(0);
    EXPECT_FALSE(handle->continueReading([] { return true; }));
    handle->lastBytesRead(-1);
    EXPECT_FALSE(handle->continueReading([] { return true; }));
}

TEST(MaxMessagesRecvBufferAllocatorTest, BurstStopsWhenAutoReadIsOff)
{
    const FixedRecvBufferAllocator fixed;
    const auto handle = fixed.newHandle();
    DatagramChannelConfig config;
    config.autoRead = false;
    handle->reset(config);
    handle->lastBytesRead(100);
    handle->incMessagesRead(1);
    EXPECT_FALSE(handle->continueReading([] { return true; }));
}

TEST(MaxMessagesRecvBufferAllocatorTest, PredicateIsRespectedUnlessDisabled)
{
    FixedRecvBufferAllocator fixed;
    const auto handle = fixed.newHandle();
    DatagramChannelConfig config;
    handle->reset(config);
    handle->lastBytesRead(100);
    EXPECT_FALSE(handle->continueReading([] { return false; }));

    fixed.respectMaybeMoreData(false);
    EXPECT_TRUE(handle->continueReading([] { return false; }));
}

TEST(MaxMessagesRecvBufferAllocatorTest, RejectsNonPositiveLimit)
{
    FixedRecvBufferAllocator fixed;
    EXPECT_THROW(fixed.maxMessagesPerRead(0), std::invalid_argument);
    EXPECT_EQ(fixed.maxMessagesPerRead(), MaxMessagesRecvBufferAllocator::DefaultMaxMessagesPerRead);
}

TEST(AdaptiveRecvBufferAllocatorTest, SizeTableShape)
{
    const auto& table = AdaptiveRecvBufferAllocator::sizeTable();
    EXPECT_EQ(table.front(), 16);
    EXPECT_EQ(table[30], 496);
    EXPECT_EQ(table[31], 512);
    EXPECT_EQ(table[32], 1024);
    EXPECT_EQ(table.back(), 1 << 30);
    EXPECT_EQ(AdaptiveRecvBufferAllocator::sizeTableIndex(2048), 33);
    EXPECT_EQ(AdaptiveRecvBufferAllocator::sizeTableIndex(17), 1);
}

TEST(AdaptiveRecvBufferAllocatorTest, GrowsAfterFullRead)
{
    const AdaptiveRecvBufferAllocator adaptive;
    const auto handle = adaptive.newHandle();
    DatagramChannelConfig config;
    handle->reset(config);
    EXPECT_EQ(handle->guess(), 2048);

    handle->attemptedBytesRead(2048);
    handle->lastBytesRead(2048);
    EXPECT_EQ(handle->guess(), 32768);
}

TEST(AdaptiveRecvBufferAllocatorTest, GrowthIsCappedAtMaximum)
{
    const AdaptiveRecvBufferAllocator adaptive(64, 2048, 4096);
    const auto handle = adaptive.newHandle();
    DatagramChannelConfig config;
    handle->reset(config);
    handle->attemptedBytesRead(2048);
    handle->lastBytesRead(2048);
    EXPECT_EQ(handle->guess(), 4096);
}

TEST(AdaptiveRecvBufferAllocatorTest, ShrinksOnlyAfterTwoSmallBursts)
{
    const AdaptiveRecvBufferAllocator adaptive;
    const auto handle = adaptive.newHandle();
    DatagramChannelConfig config;

    for (int burst = 0; burst < 2; ++burst)
    {
        handle->reset(config);
        handle->attemptedBytesRead(handle->guess());
        handle->lastBytesRead(100);
        handle->readComplete();
        if (burst == 0)
            EXPECT_EQ(handle->guess(), 2048);
    }
    EXPECT_EQ(handle->guess(), 1024);
}

TEST(AdaptiveRecvBufferAllocatorTest, RejectsInvertedBounds)
{
    EXPECT_THROW(AdaptiveRecvBufferAllocator(0, 64, 128), std::invalid_argument);
    EXPECT_THROW(AdaptiveRecvBufferAllocator(128, 64, 256), std::invalid_argument);
    EXPECT_THROW(AdaptiveRecvBufferAllocator(64, 256, 128), std::invalid_argument);
}
