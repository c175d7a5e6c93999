#include "nativeudp/common.hpp"

#include <system_error>

using namespace nativeudp;

std::string nativeudp::SocketErrorMessage(int error, const bool gaiStrerror /* = false */)
{
    // 0 means "no error" in both errno and EAI_* spaces.
    if (error == 0)
        return {};

    if (gaiStrerror)
    {
        // EAI_* codes are negative on glibc; gai_strerror() expects them as returned.
        if (const char* m = ::gai_strerror(error); m && *m)
            return {m};
    }

    // Some APIs return negative errno-like values; normalize to positive for lookups.
    if (error < 0)
        error = -error;

    std::string m = std::system_category().message(error);
    if (!m.empty())
        return m;

    if (const char* s = ::strerror(error); s && *s)
        return {s};

    return "Unknown error " + std::to_string(error);
}
