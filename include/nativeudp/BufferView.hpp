/**
 * @file BufferView.hpp
 * @brief Raw memory regions and the reusable iovec array used for scatter/gather sends.
 * @author nativeudp contributors
 * @date 2026
 * @version 1.0
 */

#pragma once

#include "common.hpp"

#include <climits>
#include <span>
#include <vector>

namespace nativeudp
{

class Buffer;

/**
 * @brief Represents a raw readable memory region for scatter/gather I/O.
 * @ingroup buffers
 *
 * ### Example Usage
 * @code{.cpp}
 * std::array<std::byte, 4> header;
 * std::array<std::byte, 128> payload;
 * std::array<nativeudp::BufferView, 2> views = {
 *     nativeudp::BufferView{header.data(), header.size()},
 *     nativeudp::BufferView{payload.data(), payload.size()}
 * };
 * @endcode
 */
struct BufferView
{
    const void* data{}; ///< Pointer to the first byte of the region
    std::size_t size{}; ///< Size in bytes of the region
};

/**
 * @class IovArray
 * @ingroup buffers
 * @brief Reusable array of `iovec` entries for one vectorized native call.
 *
 * A `DatagramChannel` owns one `IovArray` and clears it before each gather send, so steady
 * state sends do not allocate. The array enforces the native limits of a single call:
 * at most `MaxIovecCount` (`IOV_MAX`) regions, and at most `maxBytes` total bytes
 * (defaults to `SSIZE_MAX`, the largest count a send call can report).
 *
 * Empty regions are accepted and skipped.
 */
class IovArray
{
  public:
    explicit IovArray(const std::size_t maxBytes = SSIZE_MAX) : _maxBytes(maxBytes) {}

    /**
     * @brief Remove all regions; keeps the allocated capacity.
     */
    void clear() noexcept
    {
        _entries.clear();
        _size = 0;
    }

    /**
     * @brief Append a region.
     * @return `false` if the region would exceed the count or byte limit; the array is unchanged.
     */
    [[nodiscard]] bool add(const void* data, std::size_t len);

    [[nodiscard]] bool add(const BufferView view) { return add(view.data, view.size); }

    /**
     * @brief Append every readable component of @p buf.
     * @return `false` if not all components fit; the regions that did fit stay in the array.
     */
    [[nodiscard]] bool addReadable(Buffer& buf);

    [[nodiscard]] int count() const noexcept { return static_cast<int>(_entries.size()); }

    /**
     * @brief Total bytes across all regions.
     */
    [[nodiscard]] std::size_t size() const noexcept { return _size; }

    [[nodiscard]] std::size_t maxBytes() const noexcept { return _maxBytes; }

    [[nodiscard]] const iovec* data() const noexcept { return _entries.data(); }

    [[nodiscard]] std::span<const iovec> entries() const noexcept { return _entries; }

  private:
    std::vector<iovec> _entries;
    std::size_t _size = 0;
    std::size_t _maxBytes;
};

} // namespace nativeudp
