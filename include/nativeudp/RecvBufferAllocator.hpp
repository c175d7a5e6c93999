/**
 * @file RecvBufferAllocator.hpp
 * @brief Receive buffer sizing heuristics used by the read loop.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "Buffer.hpp"
#include "BufferAllocator.hpp"

#include <climits>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace nativeudp
{

struct DatagramChannelConfig;

/**
 * @class RecvBufferAllocator
 * @ingroup buffers
 * @brief Factory of per-channel `Handle`s that size receive buffers and bound read bursts.
 *
 * The read loop drives a handle in a fixed order for every readiness notification:
 *
 * @code
 * handle.reset(config);
 * do {
 *     Buffer buf = handle.allocate(alloc);           // exactly once per iteration
 *     handle.attemptedBytesRead(buf.writableBytes());
 *     ... native receive ...
 *     handle.lastBytesRead(n);                       // before continueReading()
 *     handle.incMessagesRead(1);
 * } while (handle.continueReading(always));
 * handle.readComplete();
 * @endcode
 *
 * A non-positive `lastBytesRead()` ends the burst.
 */
class RecvBufferAllocator
{
  public:
    /**
     * @brief Per-channel sizing state. Not thread-safe; owned by one channel.
     */
    class Handle
    {
      public:
        virtual ~Handle() = default;

        /**
         * @brief Start a new burst. @p config must outlive the burst.
         */
        virtual void reset(const DatagramChannelConfig& config) = 0;

        /**
         * @brief Allocate a receive buffer of `guess()` bytes from @p alloc.
         */
        [[nodiscard]] virtual Buffer allocate(BufferAllocator& alloc) = 0;

        /**
         * @brief The capacity the next receive buffer should have.
         */
        [[nodiscard]] virtual int guess() const = 0;

        virtual void incMessagesRead(int numMessages) = 0;

        /**
         * @brief Record the byte count of the last read; non-positive means "nothing read".
         */
        virtual void lastBytesRead(int bytes) = 0;
        [[nodiscard]] virtual int lastBytesRead() const = 0;

        virtual void attemptedBytesRead(int bytes) = 0;
        [[nodiscard]] virtual int attemptedBytesRead() const = 0;

        /**
         * @brief Whether the read loop should attempt another read in this burst.
         * @param maybeMoreData Hint from the caller that more data may be queued.
         */
        [[nodiscard]] virtual bool continueReading(const std::function<bool()>& maybeMoreData) = 0;

        /**
         * @brief The burst is over; update the sizing statistics.
         */
        virtual void readComplete() = 0;
    };

    virtual ~RecvBufferAllocator() = default;

    /**
     * @brief Create a fresh handle. The handle refers to this allocator, which must outlive it.
     */
    [[nodiscard]] virtual std::unique_ptr<Handle> newHandle() const = 0;
};

/**
 * @class MaxMessagesRecvBufferAllocator
 * @ingroup buffers
 * @brief Base allocator that bounds each burst by a message count.
 *
 * A burst continues while auto-read is enabled, the caller's "maybe more data" hint holds
 * (unless `respectMaybeMoreData()` is disabled), fewer than `maxMessagesPerRead()` datagrams
 * were read, and the last read returned a positive byte count.
 */
class MaxMessagesRecvBufferAllocator : public RecvBufferAllocator
{
  public:
    /**
     * @brief Datagram default for messages per read burst.
     */
    static constexpr int DefaultMaxMessagesPerRead = 16;

    explicit MaxMessagesRecvBufferAllocator(int maxMessagesPerRead = DefaultMaxMessagesPerRead);

    [[nodiscard]] int maxMessagesPerRead() const noexcept { return _maxMessagesPerRead; }

    /**
     * @throws std::invalid_argument if @p maxMessagesPerRead is not positive.
     */
    MaxMessagesRecvBufferAllocator& maxMessagesPerRead(int maxMessagesPerRead);

    [[nodiscard]] bool respectMaybeMoreData() const noexcept { return _respectMaybeMoreData; }

    MaxMessagesRecvBufferAllocator& respectMaybeMoreData(const bool respect) noexcept
    {
        _respectMaybeMoreData = respect;
        return *this;
    }

  protected:
    /**
     * @brief Common bookkeeping: message and byte totals, continuation rule.
     *
     * Subclasses provide `guess()` and may refine `lastBytesRead()` / `readComplete()`.
     */
    class MaxMessageHandle : public Handle
    {
      public:
        explicit MaxMessageHandle(const MaxMessagesRecvBufferAllocator& parent) noexcept : _parent(parent) {}

        void reset(const DatagramChannelConfig& config) override;
        [[nodiscard]] Buffer allocate(BufferAllocator& alloc) override;
        void incMessagesRead(const int numMessages) override { _totalMessages += numMessages; }
        void lastBytesRead(int bytes) override;
        [[nodiscard]] int lastBytesRead() const override { return _lastBytesRead; }
        void attemptedBytesRead(const int bytes) override { _attemptedBytesRead = bytes; }
        [[nodiscard]] int attemptedBytesRead() const override { return _attemptedBytesRead; }
        [[nodiscard]] bool continueReading(const std::function<bool()>& maybeMoreData) override;
        void readComplete() override {}

      protected:
        [[nodiscard]] int totalBytesRead() const noexcept { return _totalBytesRead < 0 ? INT_MAX : _totalBytesRead; }

      private:
        const MaxMessagesRecvBufferAllocator& _parent;
        const DatagramChannelConfig* _config = nullptr;
        int _maxMessagePerRead = 0;
        int _totalMessages = 0;
        int _totalBytesRead = 0;
        int _attemptedBytesRead = 0;
        int _lastBytesRead = 0;
    };

  private:
    int _maxMessagesPerRead;
    bool _respectMaybeMoreData = true;
};

/**
 * @class FixedRecvBufferAllocator
 * @ingroup buffers
 * @brief Always guesses the same buffer size.
 *
 * The default for datagram channels, with `DefaultDatagramReceiveSize` (2048) bytes.
 */
class FixedRecvBufferAllocator final : public MaxMessagesRecvBufferAllocator
{
  public:
    /**
     * @throws std::invalid_argument if @p bufferSize is not positive.
     */
    explicit FixedRecvBufferAllocator(int bufferSize = static_cast<int>(DefaultDatagramReceiveSize));

    [[nodiscard]] int bufferSize() const noexcept { return _bufferSize; }

    [[nodiscard]] std::unique_ptr<Handle> newHandle() const override;

  private:
    class HandleImpl;

    int _bufferSize;
};

/**
 * @class AdaptiveRecvBufferAllocator
 * @ingroup buffers
 * @brief Grows the guess quickly after full reads and shrinks it slowly after small bursts.
 *
 * Sizes come from a table of 16-byte steps up to 496 followed by powers of two. A read that
 * fills the whole attempted buffer, or a burst whose total reaches the current guess, moves
 * four table steps up. A burst total at or below the previous step moves one step down, but
 * only on the second consecutive occurrence.
 */
class AdaptiveRecvBufferAllocator final : public MaxMessagesRecvBufferAllocator
{
  public:
    static constexpr int DefaultMinimum = 64;
    static constexpr int DefaultInitial = 2048;
    static constexpr int DefaultMaximum = 65536;

    /**
     * @throws std::invalid_argument if @p minimum is not positive, or
     *         `minimum <= initial <= maximum` does not hold.
     */
    explicit AdaptiveRecvBufferAllocator(int minimum = DefaultMinimum, int initial = DefaultInitial,
                                         int maximum = DefaultMaximum);

    [[nodiscard]] std::unique_ptr<Handle> newHandle() const override;

    /**
     * @brief The size table shared by all adaptive allocators.
     */
    [[nodiscard]] static const std::vector<int>& sizeTable();

    /**
     * @brief Index of the smallest table entry that is `>= size` (last index if none).
     */
    [[nodiscard]] static int sizeTableIndex(int size);

  private:
    class HandleImpl;

    int _minIndex;
    int _maxIndex;
    int _initialIndex;
};

} // namespace nativeudp
