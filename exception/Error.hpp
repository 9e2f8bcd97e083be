#pragma once
#include <string.h>

#include <cerrno>
#include <sstream>
#include <stdexcept>
#include <string>

namespace Exception {
    inline std::string strerror(int e)
    {
        char sBuffer[256];
#if (_POSIX_C_SOURCE >= 200112L) && !_GNU_SOURCE
        if (0 == strerror_r(e, sBuffer, sizeof(sBuffer)))
            return std::string(sBuffer);
        return "unknown error";
#else
        return strerror_r(e, sBuffer, sizeof(sBuffer));
#endif
    }

    // tag type T makes distinct exception class per component
    template <class T, class B = std::runtime_error>
    struct Error : public B
    {
        Error(const std::string& aMessage)
        : B(aMessage)
        {}
    };

    struct ErrnoError : std::runtime_error
    {
        const int m_Errno;

        static std::string format(const std::string& aMsg, int aErrno)
        {
            std::stringstream sBuffer;
            sBuffer << aMsg << ": " << strerror(aErrno) << " (" << aErrno << ")";
            return sBuffer.str();
        }

        ErrnoError(const std::string& aMsg, int aErrno = errno)
        : std::runtime_error(format(aMsg, aErrno))
        , m_Errno(aErrno)
        {}
    };
} // namespace Exception
