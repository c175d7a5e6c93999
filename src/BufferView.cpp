#include "nativeudp/BufferView.hpp"
#include "nativeudp/Buffer.hpp"

using namespace nativeudp;

bool IovArray::add(const void* data, const std::size_t len)
{
    if (len == 0)
        return true;
    if (_entries.size() >= static_cast<std::size_t>(MaxIovecCount))
        return false;
    if (len > _maxBytes - _size && !_entries.empty())
        return false;

    iovec v{};
    v.iov_base = const_cast<void*>(data);
    v.iov_len = len;
    _entries.push_back(v);
    _size += len;
    return true;
}

bool IovArray::addReadable(Buffer& buf)
{
    bool ok = true;
    buf.forEachReadable(
        [&](int, Buffer::ReadableComponent& c)
        {
            const auto view = c.readableView();
            ok = add(view.data(), view.size());
            return ok;
        });
    return ok;
}
