#include "nativeudp/BufferAllocator.hpp"

#include <stdexcept>

using namespace nativeudp;

BufferAllocator::BufferAllocator(const MemoryKind kind)
    : _kind(kind), _tracker(std::make_shared<internal::AllocationTracker>())
{
    if (kind == MemoryKind::Borrowed)
        throw std::invalid_argument("a BufferAllocator cannot allocate Borrowed memory");
}

Buffer BufferAllocator::makeOwned(const std::size_t size, const MemoryKind kind)
{
    Buffer::Component c;
    c.owned = std::make_unique<std::byte[]>(size);
    c.memory = c.owned.get();
    c.capacity = size;
    c.kind = kind;
    c.tracker = _tracker;
    _tracker->allocated.fetch_add(1, std::memory_order_relaxed);
    return Buffer(std::move(c));
}

Buffer BufferAllocator::allocate(const std::size_t size)
{
    return makeOwned(size, _kind);
}

Buffer BufferAllocator::copyOf(const std::span<const std::byte> data)
{
    Buffer buf = allocate(data.size());
    buf.writeBytes(data);
    return buf;
}

Buffer BufferAllocator::wrap(const std::span<const std::byte> data)
{
    Buffer::Component c;
    // Borrowed components are never handed out through writable views.
    c.memory = const_cast<std::byte*>(data.data());
    c.capacity = data.size();
    c.writerOffset = data.size();
    c.kind = MemoryKind::Borrowed;
    c.tracker = _tracker;
    _tracker->allocated.fetch_add(1, std::memory_order_relaxed);
    return Buffer(std::move(c));
}

std::size_t BufferAllocator::allocatedBuffers() const noexcept
{
    return _tracker->allocated.load(std::memory_order_relaxed);
}

std::size_t BufferAllocator::releasedBuffers() const noexcept
{
    return _tracker->released.load(std::memory_order_relaxed);
}

std::size_t BufferAllocator::outstandingBuffers() const noexcept
{
    return allocatedBuffers() - releasedBuffers();
}
