#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>

namespace relaysync
{
namespace internal
{
inline std::string toHex(const uint8_t* bytes, size_t length)
{
    std::stringstream ss;
    for (size_t i = 0; i < length; i++)
    {
        ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(bytes[i]);
    }

    return ss.str();
};

/**
 * @brief Decodes exactly `length` bytes from a hex string.
 * @returns False if the string has the wrong length or holds a non-hex character.
 */
inline bool fromHex(const std::string& hex, uint8_t* bytes, size_t length)
{
    if (hex.size() != length * 2)
    {
        return false;
    }

    auto nibble = [](char c) -> int
    {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    for (size_t i = 0; i < length; i++)
    {
        int high = nibble(hex[2 * i]);
        int low = nibble(hex[2 * i + 1]);
        if (high < 0 || low < 0)
        {
            return false;
        }

        bytes[i] = static_cast<uint8_t>((high << 4) | low);
    }

    return true;
};
} // namespace internal
} // namespace relaysync
