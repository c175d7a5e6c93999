/**
 * @file Buffer.hpp
 * @brief Move-only payload buffer with reader/writer cursors and memory components.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "common.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace nativeudp
{

/**
 * @enum MemoryKind
 * @ingroup buffers
 * @brief Where a buffer component's bytes live and how native calls may reach them.
 */
enum class MemoryKind : std::uint8_t
{
    Direct,  ///< Owned, stable address. Exposes a native address for zero-copy syscalls.
    Heap,    ///< Owned, reachable only through spans. Native address is 0.
    Borrowed ///< Read-only view of caller memory. Native address is 0, never writable.
};

namespace internal
{

/**
 * @brief Allocation counters shared by an allocator and every buffer it produced.
 * @ingroup internal
 */
struct AllocationTracker
{
    std::atomic<std::size_t> allocated{0};
    std::atomic<std::size_t> released{0};
};

} // namespace internal

class BufferAllocator;

/**
 * @class Buffer
 * @ingroup buffers
 * @brief A move-only byte buffer made of one or more memory components.
 *
 * Each component has a capacity, a reader offset and a writer offset with
 * `0 <= reader <= writer <= capacity`. Bytes between the reader and the writer offsets are
 * *readable*; bytes between the writer offset and the capacity are *writable*. A buffer
 * produced by `BufferAllocator::allocate()` has exactly one component; `compose()` joins
 * several buffers into one composite buffer.
 *
 * ### Ownership
 * A `Buffer` owns its memory. Moving transfers ownership and leaves the source closed.
 * `close()` (or the destructor) returns every component to its allocator's accounting
 * exactly once. Borrowed components do not own bytes, but are still accounted so that a
 * leaked wrapper is visible in `BufferAllocator::outstandingBuffers()`.
 *
 * ### Components
 * `forEachReadable()` / `forEachWritable()` visit the components that currently have
 * readable / writable bytes. Through the visitor a caller obtains spans, the native address
 * (for `Direct` memory) and can advance the component's cursor directly.
 *
 * @code
 * Buffer buf = allocator.allocate(1500);
 * buf.writeBytes(std::as_bytes(std::span(std::string_view("hello"))));
 * buf.forEachReadable([](int, Buffer::ReadableComponent& c) {
 *     std::cout << c.readableBytes() << " bytes at 0x" << std::hex << c.readableNativeAddress() << '\n';
 *     return true;
 * });
 * @endcode
 */
class Buffer
{
    struct Component
    {
        std::unique_ptr<std::byte[]> owned;
        std::byte* memory = nullptr;
        std::size_t capacity = 0;
        std::size_t readerOffset = 0;
        std::size_t writerOffset = 0;
        MemoryKind kind = MemoryKind::Heap;
        std::shared_ptr<internal::AllocationTracker> tracker;

        Component() = default;
        Component(const Component&) = delete;
        Component& operator=(const Component&) = delete;
        Component(Component&& other) noexcept;
        Component& operator=(Component&& other) noexcept;
        ~Component() { release(); }

        void release() noexcept;
    };

  public:
    /**
     * @brief Cursor-level access to one component's readable bytes.
     */
    class ReadableComponent
    {
      public:
        /**
         * @brief Address of the first readable byte, or 0 unless the memory is `Direct`.
         */
        [[nodiscard]] std::uintptr_t readableNativeAddress() const noexcept
        {
            return _c->kind == MemoryKind::Direct ? reinterpret_cast<std::uintptr_t>(_c->memory + _c->readerOffset)
                                                  : 0;
        }

        [[nodiscard]] std::span<const std::byte> readableView() const noexcept
        {
            return {_c->memory + _c->readerOffset, _c->writerOffset - _c->readerOffset};
        }

        [[nodiscard]] std::size_t readableBytes() const noexcept { return _c->writerOffset - _c->readerOffset; }

        [[nodiscard]] MemoryKind kind() const noexcept { return _c->kind; }

        /**
         * @brief Advance this component's reader offset.
         * @throws std::out_of_range if @p n exceeds the readable bytes.
         */
        void skipReadableBytes(std::size_t n);

      private:
        friend class Buffer;
        explicit ReadableComponent(Component& c) noexcept : _c(&c) {}
        Component* _c;
    };

    /**
     * @brief Cursor-level access to one component's writable bytes.
     */
    class WritableComponent
    {
      public:
        /**
         * @brief Address of the first writable byte, or 0 unless the memory is `Direct`.
         */
        [[nodiscard]] std::uintptr_t writableNativeAddress() const noexcept
        {
            return _c->kind == MemoryKind::Direct ? reinterpret_cast<std::uintptr_t>(_c->memory + _c->writerOffset)
                                                  : 0;
        }

        [[nodiscard]] std::span<std::byte> writableView() const noexcept
        {
            return {_c->memory + _c->writerOffset, _c->capacity - _c->writerOffset};
        }

        [[nodiscard]] std::size_t writableBytes() const noexcept { return _c->capacity - _c->writerOffset; }

        [[nodiscard]] MemoryKind kind() const noexcept { return _c->kind; }

        /**
         * @brief Advance this component's writer offset.
         * @throws std::out_of_range if @p n exceeds the writable bytes.
         */
        void skipWritableBytes(std::size_t n);

      private:
        friend class Buffer;
        explicit WritableComponent(Component& c) noexcept : _c(&c) {}
        Component* _c;
    };

    /**
     * @brief Constructs a closed, empty buffer.
     */
    Buffer() noexcept = default;

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;

    Buffer(Buffer&& other) noexcept;
    Buffer& operator=(Buffer&& other) noexcept;

    ~Buffer() = default;

    /**
     * @brief Joins @p parts into a single composite buffer, in order.
     *
     * The parts are consumed (left closed). Closed parts contribute nothing.
     */
    [[nodiscard]] static Buffer compose(std::vector<Buffer>&& parts);

    [[nodiscard]] std::size_t readableBytes() const noexcept;
    [[nodiscard]] std::size_t writableBytes() const noexcept;
    [[nodiscard]] std::size_t capacity() const noexcept;

    /**
     * @brief Consume @p n readable bytes, component by component.
     * @throws std::out_of_range if @p n exceeds `readableBytes()`.
     */
    Buffer& skipReadableBytes(std::size_t n);

    /**
     * @brief Mark @p n writable bytes as written, component by component.
     * @throws std::out_of_range if @p n exceeds `writableBytes()`.
     */
    Buffer& skipWritableBytes(std::size_t n);

    /**
     * @brief Append @p data at the writer offset.
     * @throws std::out_of_range if @p data does not fit in `writableBytes()`.
     */
    Buffer& writeBytes(std::span<const std::byte> data);

    Buffer& writeBytes(const std::string_view text) { return writeBytes(std::as_bytes(std::span(text))); }

    /**
     * @brief Copy out and consume all readable bytes.
     */
    [[nodiscard]] std::vector<std::byte> readBytes();

    /**
     * @brief Copy the readable bytes into a string without consuming them.
     */
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] int countReadableComponents() const noexcept;
    [[nodiscard]] int countWritableComponents() const noexcept;

    /**
     * @brief Visit each component that has readable bytes.
     *
     * @p fn is called as `fn(int index, ReadableComponent&) -> bool`; returning `false` stops
     * the iteration.
     *
     * @return The number of components visited, negated if @p fn stopped the iteration.
     */
    template <typename Fn> int forEachReadable(Fn&& fn)
    {
        int index = 0;
        for (auto& c : _components)
        {
            if (c.writerOffset == c.readerOffset)
                continue;
            ReadableComponent rc(c);
            const int current = index++;
            if (!fn(current, rc))
                return -index;
        }
        return index;
    }

    /**
     * @brief Visit each component that has writable bytes.
     * @see forEachReadable()
     */
    template <typename Fn> int forEachWritable(Fn&& fn)
    {
        int index = 0;
        for (auto& c : _components)
        {
            if (c.kind == MemoryKind::Borrowed || c.writerOffset == c.capacity)
                continue;
            WritableComponent wc(c);
            const int current = index++;
            if (!fn(current, wc))
                return -index;
        }
        return index;
    }

    /**
     * @brief `true` when every component is `Direct` memory.
     */
    [[nodiscard]] bool isDirect() const noexcept;

    /**
     * @brief Release the buffer's memory. Idempotent.
     */
    void close() noexcept;

    /**
     * @brief `true` until the buffer is closed or moved from.
     */
    [[nodiscard]] bool isAccessible() const noexcept { return _open; }

    /**
     * @brief Record a diagnostic ownership hint. No semantic effect.
     */
    Buffer& touch(std::string_view hint)
    {
        _touchHint.assign(hint);
        return *this;
    }

    [[nodiscard]] const std::string& touchHint() const noexcept { return _touchHint; }

  private:
    friend class BufferAllocator;

    explicit Buffer(Component&& component);

    void ensureAccessible() const;

    std::vector<Component> _components;
    std::string _touchHint;
    bool _open = false;
};

} // namespace nativeudp
