#include "nativeudp/Errors.hpp"
#include "nativeudp/PortUnreachableException.hpp"

using namespace nativeudp;

std::exception_ptr nativeudp::translateConnectedReadError(const NativeIoException& error)
{
    if (error.getErrorCode() == ECONNREFUSED)
    {
        return std::make_exception_ptr(
            PortUnreachableException(error.getErrorCode(), error.what(), std::make_exception_ptr(error)));
    }
    return std::make_exception_ptr(error);
}
