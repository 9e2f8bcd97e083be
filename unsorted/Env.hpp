#pragma once

#include <stdlib.h>

#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>

namespace Util {

    inline std::string getEnv(const char* aName)
    {
        std::string sTmp;
        if (auto sPtr = getenv(aName); sPtr != nullptr)
            sTmp.assign(sPtr);
        return sTmp;
    }

    // duration as integer with optional suffix: ms, s, m, h.
    // no suffix means milliseconds. result must fit milliseconds::max()
    inline std::chrono::milliseconds parseDuration(std::string_view aStr)
    {
        constexpr uint64_t MAX = std::chrono::milliseconds::max().count();

        size_t   sPos   = 0;
        uint64_t sValue = 0;
        for (; sPos < aStr.size() and aStr[sPos] >= '0' and aStr[sPos] <= '9'; sPos++) {
            const uint64_t sDigit = aStr[sPos] - '0';
            if (sValue > (MAX - sDigit) / 10)
                throw std::invalid_argument("duration out of range: " + std::string(aStr));
            sValue = sValue * 10 + sDigit;
        }
        if (sPos == 0)
            throw std::invalid_argument("bad duration: " + std::string(aStr));

        const auto sSuffix = aStr.substr(sPos);
        uint64_t   sScale  = 0;
        if (sSuffix.empty() or sSuffix == "ms")
            sScale = 1;
        else if (sSuffix == "s")
            sScale = 1000;
        else if (sSuffix == "m")
            sScale = 60 * 1000;
        else if (sSuffix == "h")
            sScale = 60 * 60 * 1000;
        else
            throw std::invalid_argument("bad duration suffix: " + std::string(aStr));

        if (sValue > MAX / sScale)
            throw std::invalid_argument("duration out of range: " + std::string(aStr));
        return std::chrono::milliseconds(std::chrono::milliseconds::rep(sValue * sScale));
    }

    inline std::chrono::milliseconds getDuration(const char* aName, std::chrono::milliseconds aDefault)
    {
        if (auto sPtr = getenv(aName); sPtr != nullptr and *sPtr != '\0')
            return parseDuration(sPtr);
        return aDefault;
    }

} // namespace Util
