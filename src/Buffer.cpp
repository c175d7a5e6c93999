#include "nativeudp/Buffer.hpp"

#include <algorithm>
#include <stdexcept>

using namespace nativeudp;

Buffer::Component::Component(Component&& other) noexcept
    : owned(std::move(other.owned)), memory(other.memory), capacity(other.capacity),
      readerOffset(other.readerOffset), writerOffset(other.writerOffset), kind(other.kind),
      tracker(std::move(other.tracker))
{
    other.memory = nullptr;
    other.capacity = other.readerOffset = other.writerOffset = 0;
}

Buffer::Component& Buffer::Component::operator=(Component&& other) noexcept
{
    if (this != &other)
    {
        release();
        owned = std::move(other.owned);
        memory = other.memory;
        capacity = other.capacity;
        readerOffset = other.readerOffset;
        writerOffset = other.writerOffset;
        kind = other.kind;
        tracker = std::move(other.tracker);
        other.memory = nullptr;
        other.capacity = other.readerOffset = other.writerOffset = 0;
    }
    return *this;
}

void Buffer::Component::release() noexcept
{
    if (tracker)
    {
        tracker->released.fetch_add(1, std::memory_order_relaxed);
        tracker.reset();
    }
    owned.reset();
    memory = nullptr;
    capacity = readerOffset = writerOffset = 0;
}

void Buffer::ReadableComponent::skipReadableBytes(const std::size_t n)
{
    if (n > readableBytes())
        throw std::out_of_range("cannot skip " + std::to_string(n) + " readable bytes, only " +
                                std::to_string(readableBytes()) + " available");
    _c->readerOffset += n;
}

void Buffer::WritableComponent::skipWritableBytes(const std::size_t n)
{
    if (n > writableBytes())
        throw std::out_of_range("cannot skip " + std::to_string(n) + " writable bytes, only " +
                                std::to_string(writableBytes()) + " available");
    _c->writerOffset += n;
}

Buffer::Buffer(Component&& component) : _open(true)
{
    _components.push_back(std::move(component));
}

Buffer::Buffer(Buffer&& other) noexcept
    : _components(std::move(other._components)), _touchHint(std::move(other._touchHint)), _open(other._open)
{
    other._components.clear();
    other._open = false;
}

Buffer& Buffer::operator=(Buffer&& other) noexcept
{
    if (this != &other)
    {
        close();
        _components = std::move(other._components);
        _touchHint = std::move(other._touchHint);
        _open = other._open;
        other._components.clear();
        other._open = false;
    }
    return *this;
}

Buffer Buffer::compose(std::vector<Buffer>&& parts)
{
    Buffer result;
    result._open = true;
    for (auto& part : parts)
    {
        if (!part._open)
            continue;
        for (auto& c : part._components)
            result._components.push_back(std::move(c));
        part._components.clear();
        part._open = false;
    }
    parts.clear();
    return result;
}

std::size_t Buffer::readableBytes() const noexcept
{
    std::size_t total = 0;
    for (const auto& c : _components)
        total += c.writerOffset - c.readerOffset;
    return total;
}

std::size_t Buffer::writableBytes() const noexcept
{
    std::size_t total = 0;
    for (const auto& c : _components)
    {
        if (c.kind != MemoryKind::Borrowed)
            total += c.capacity - c.writerOffset;
    }
    return total;
}

std::size_t Buffer::capacity() const noexcept
{
    std::size_t total = 0;
    for (const auto& c : _components)
        total += c.capacity;
    return total;
}

void Buffer::ensureAccessible() const
{
    if (!_open)
        throw std::logic_error("buffer is closed");
}

Buffer& Buffer::skipReadableBytes(std::size_t n)
{
    ensureAccessible();
    if (n > readableBytes())
        throw std::out_of_range("cannot skip " + std::to_string(n) + " readable bytes, only " +
                                std::to_string(readableBytes()) + " available");
    for (auto& c : _components)
    {
        if (n == 0)
            break;
        const std::size_t step = std::min(n, c.writerOffset - c.readerOffset);
        c.readerOffset += step;
        n -= step;
    }
    return *this;
}

Buffer& Buffer::skipWritableBytes(std::size_t n)
{
    ensureAccessible();
    if (n > writableBytes())
        throw std::out_of_range("cannot skip " + std::to_string(n) + " writable bytes, only " +
                                std::to_string(writableBytes()) + " available");
    for (auto& c : _components)
    {
        if (n == 0)
            break;
        if (c.kind == MemoryKind::Borrowed)
            continue;
        const std::size_t step = std::min(n, c.capacity - c.writerOffset);
        c.writerOffset += step;
        n -= step;
    }
    return *this;
}

Buffer& Buffer::writeBytes(std::span<const std::byte> data)
{
    ensureAccessible();
    if (data.size() > writableBytes())
        throw std::out_of_range("cannot write " + std::to_string(data.size()) + " bytes, only " +
                                std::to_string(writableBytes()) + " writable");
    for (auto& c : _components)
    {
        if (data.empty())
            break;
        if (c.kind == MemoryKind::Borrowed)
            continue;
        const std::size_t step = std::min(data.size(), c.capacity - c.writerOffset);
        if (step == 0)
            continue;
        std::memcpy(c.memory + c.writerOffset, data.data(), step);
        c.writerOffset += step;
        data = data.subspan(step);
    }
    return *this;
}

std::vector<std::byte> Buffer::readBytes()
{
    ensureAccessible();
    std::vector<std::byte> out;
    out.reserve(readableBytes());
    for (auto& c : _components)
    {
        out.insert(out.end(), c.memory + c.readerOffset, c.memory + c.writerOffset);
        c.readerOffset = c.writerOffset;
    }
    return out;
}

std::string Buffer::toString() const
{
    std::string out;
    out.reserve(readableBytes());
    for (const auto& c : _components)
        out.append(reinterpret_cast<const char*>(c.memory + c.readerOffset), c.writerOffset - c.readerOffset);
    return out;
}

int Buffer::countReadableComponents() const noexcept
{
    return static_cast<int>(std::count_if(_components.begin(), _components.end(),
                                          [](const Component& c) { return c.writerOffset > c.readerOffset; }));
}

int Buffer::countWritableComponents() const noexcept
{
    return static_cast<int>(std::count_if(_components.begin(), _components.end(), [](const Component& c)
                                          { return c.kind != MemoryKind::Borrowed && c.capacity > c.writerOffset; }));
}

bool Buffer::isDirect() const noexcept
{
    return std::all_of(_components.begin(), _components.end(),
                       [](const Component& c) { return c.kind == MemoryKind::Direct; });
}

void Buffer::close() noexcept
{
    for (auto& c : _components)
        c.release();
    _components.clear();
    _open = false;
}
