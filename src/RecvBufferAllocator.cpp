#include "nativeudp/RecvBufferAllocator.hpp"
#include "nativeudp/DatagramChannelConfig.hpp"

#include <algorithm>
#include <stdexcept>
#include <string>

using namespace nativeudp;

MaxMessagesRecvBufferAllocator::MaxMessagesRecvBufferAllocator(const int maxMessagesPerRead) : _maxMessagesPerRead(0)
{
    this->maxMessagesPerRead(maxMessagesPerRead);
}

MaxMessagesRecvBufferAllocator& MaxMessagesRecvBufferAllocator::maxMessagesPerRead(const int maxMessagesPerRead)
{
    if (maxMessagesPerRead <= 0)
        throw std::invalid_argument("maxMessagesPerRead: " + std::to_string(maxMessagesPerRead) + " (expected: > 0)");
    _maxMessagesPerRead = maxMessagesPerRead;
    return *this;
}

void MaxMessagesRecvBufferAllocator::MaxMessageHandle::reset(const DatagramChannelConfig& config)
{
    _config = &config;
    _maxMessagePerRead = _parent.maxMessagesPerRead();
    _totalMessages = 0;
    _totalBytesRead = 0;
}

Buffer MaxMessagesRecvBufferAllocator::MaxMessageHandle::allocate(BufferAllocator& alloc)
{
    return alloc.allocate(static_cast<std::size_t>(guess()));
}

void MaxMessagesRecvBufferAllocator::MaxMessageHandle::lastBytesRead(const int bytes)
{
    _lastBytesRead = bytes;
    if (bytes > 0)
        _totalBytesRead = bytes > INT_MAX - _totalBytesRead ? INT_MAX : _totalBytesRead + bytes;
}

bool MaxMessagesRecvBufferAllocator::MaxMessageHandle::continueReading(const std::function<bool()>& maybeMoreData)
{
    const bool autoRead = _config == nullptr || _config->autoRead;
    return autoRead && (!_parent.respectMaybeMoreData() || !maybeMoreData || maybeMoreData()) &&
           _totalMessages < _maxMessagePerRead && _lastBytesRead > 0;
}

class FixedRecvBufferAllocator::HandleImpl final : public MaxMessageHandle
{
  public:
    explicit HandleImpl(const FixedRecvBufferAllocator& parent) noexcept
        : MaxMessageHandle(parent), _bufferSize(parent.bufferSize())
    {
    }

    [[nodiscard]] int guess() const override { return _bufferSize; }

  private:
    int _bufferSize;
};

FixedRecvBufferAllocator::FixedRecvBufferAllocator(const int bufferSize) : _bufferSize(bufferSize)
{
    if (bufferSize <= 0)
        throw std::invalid_argument("bufferSize: " + std::to_string(bufferSize) + " (expected: > 0)");
}

std::unique_ptr<RecvBufferAllocator::Handle> FixedRecvBufferAllocator::newHandle() const
{
    return std::make_unique<HandleImpl>(*this);
}

namespace
{

constexpr int IndexIncrement = 4;
constexpr int IndexDecrement = 1;

std::vector<int> buildSizeTable()
{
    std::vector<int> table;
    for (int i = 16; i < 512; i += 16)
        table.push_back(i);

    // Powers of two up to 2^30; stop before the shift overflows.
    for (int i = 512;; i <<= 1)
    {
        table.push_back(i);
        if (i > (INT_MAX >> 1))
            break;
    }
    return table;
}

} // namespace

const std::vector<int>& AdaptiveRecvBufferAllocator::sizeTable()
{
    static const std::vector<int> table = buildSizeTable();
    return table;
}

int AdaptiveRecvBufferAllocator::sizeTableIndex(const int size)
{
    const auto& table = sizeTable();
    const auto it = std::lower_bound(table.begin(), table.end(), size);
    if (it == table.end())
        return static_cast<int>(table.size()) - 1;
    return static_cast<int>(it - table.begin());
}

class AdaptiveRecvBufferAllocator::HandleImpl final : public MaxMessageHandle
{
  public:
    explicit HandleImpl(const AdaptiveRecvBufferAllocator& parent) noexcept
        : MaxMessageHandle(parent), _minIndex(parent._minIndex), _maxIndex(parent._maxIndex),
          _index(parent._initialIndex), _nextReceiveBufferSize(sizeTable()[static_cast<std::size_t>(_index)])
    {
    }

    using MaxMessageHandle::lastBytesRead;

    void lastBytesRead(const int bytes) override
    {
        // A read that filled the whole buffer suggests the datagram may have been larger.
        if (bytes == attemptedBytesRead())
            record(bytes);
        MaxMessageHandle::lastBytesRead(bytes);
    }

    [[nodiscard]] int guess() const override { return _nextReceiveBufferSize; }

    void readComplete() override { record(totalBytesRead()); }

  private:
    void record(const int actualReadBytes)
    {
        const auto& table = sizeTable();
        if (actualReadBytes <= table[static_cast<std::size_t>(std::max(0, _index - IndexDecrement))])
        {
            if (_decreaseNow)
            {
                _index = std::max(_index - IndexDecrement, _minIndex);
                _nextReceiveBufferSize = table[static_cast<std::size_t>(_index)];
                _decreaseNow = false;
            }
            else
            {
                _decreaseNow = true;
            }
        }
        else if (actualReadBytes >= _nextReceiveBufferSize)
        {
            _index = std::min(_index + IndexIncrement, _maxIndex);
            _nextReceiveBufferSize = table[static_cast<std::size_t>(_index)];
            _decreaseNow = false;
        }
    }

    int _minIndex;
    int _maxIndex;
    int _index;
    int _nextReceiveBufferSize;
    bool _decreaseNow = false;
};

AdaptiveRecvBufferAllocator::AdaptiveRecvBufferAllocator(const int minimum, const int initial, const int maximum)
{
    if (minimum <= 0)
        throw std::invalid_argument("minimum: " + std::to_string(minimum) + " (expected: > 0)");
    if (initial < minimum)
        throw std::invalid_argument("initial: " + std::to_string(initial) + " (expected: >= " +
                                    std::to_string(minimum) + ")");
    if (maximum < initial)
        throw std::invalid_argument("maximum: " + std::to_string(maximum) + " (expected: >= " +
                                    std::to_string(initial) + ")");

    const auto& table = sizeTable();

    int minIndex = sizeTableIndex(minimum);
    if (table[static_cast<std::size_t>(minIndex)] < minimum)
        ++minIndex;
    _minIndex = minIndex;

    int maxIndex = sizeTableIndex(maximum);
    if (table[static_cast<std::size_t>(maxIndex)] > maximum)
        --maxIndex;
    _maxIndex = maxIndex;

    _initialIndex = std::clamp(sizeTableIndex(initial), _minIndex, _maxIndex);
}

std::unique_ptr<RecvBufferAllocator::Handle> AdaptiveRecvBufferAllocator::newHandle() const
{
    return std::make_unique<HandleImpl>(*this);
}
