/**
 * @file BufferAllocator.hpp
 * @brief Buffer factory with release accounting.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "Buffer.hpp"

#include <cstddef>
#include <memory>
#include <span>

namespace nativeudp
{

/**
 * @class BufferAllocator
 * @ingroup buffers
 * @brief Allocates buffers of one memory kind and counts every allocation and release.
 *
 * The counters live in a tracker shared with the buffers, so a buffer that outlives its
 * allocator still reports its release. `outstandingBuffers()` is therefore an exact leak
 * detector: after a workload finishes it must return to its starting value.
 *
 * `allocate()` is virtual so tests and embedders can inject failures or pooling.
 *
 * @code
 * BufferAllocator direct;                      // MemoryKind::Direct
 * BufferAllocator heap(MemoryKind::Heap);
 * Buffer a = direct.allocate(2048);
 * a.writeBytes("ping");
 * const std::string text = a.toString();
 * Buffer b = heap.copyOf(std::as_bytes(std::span(text)));
 * a.close();
 * assert(direct.outstandingBuffers() == 0);
 * @endcode
 */
class BufferAllocator
{
  public:
    /**
     * @param kind `Direct` or `Heap`.
     * @throws std::invalid_argument if @p kind is `Borrowed`.
     */
    explicit BufferAllocator(MemoryKind kind = MemoryKind::Direct);

    virtual ~BufferAllocator() = default;

    BufferAllocator(const BufferAllocator&) = delete;
    BufferAllocator& operator=(const BufferAllocator&) = delete;

    /**
     * @brief Allocate an empty buffer of @p size bytes capacity.
     *
     * @throws std::bad_alloc if memory cannot be obtained.
     */
    [[nodiscard]] virtual Buffer allocate(std::size_t size);

    /**
     * @brief Allocate a buffer holding a copy of @p data, fully readable.
     */
    [[nodiscard]] Buffer copyOf(std::span<const std::byte> data);

    /**
     * @brief Wrap caller memory in a read-only `Borrowed` buffer, fully readable.
     *
     * The caller must keep @p data alive and unchanged for as long as the buffer is used.
     */
    [[nodiscard]] Buffer wrap(std::span<const std::byte> data);

    [[nodiscard]] MemoryKind kind() const noexcept { return _kind; }

    [[nodiscard]] std::size_t allocatedBuffers() const noexcept;
    [[nodiscard]] std::size_t releasedBuffers() const noexcept;

    /**
     * @brief Allocations not yet released.
     */
    [[nodiscard]] std::size_t outstandingBuffers() const noexcept;

  protected:
    /**
     * @brief Build a buffer over freshly owned memory of @p kind, accounted to this allocator.
     */
    [[nodiscard]] Buffer makeOwned(std::size_t size, MemoryKind kind);

  private:
    MemoryKind _kind;
    std::shared_ptr<internal::AllocationTracker> _tracker;
};

} // namespace nativeudp
