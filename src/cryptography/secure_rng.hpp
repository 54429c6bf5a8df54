#pragma once

#include <cstdint>
#include <vector>

namespace relaysync
{
namespace cryptography
{
class SecureRng
{
public:
    /**
     * @brief Fills the given buffer with secure random bytes.
     * @param buffer The buffer to fill with random bytes.
     * @param length The number of bytes to fill.
     * @throws `std::runtime_error` if the system RNG fails.
     */
    static void fill(void* buffer, size_t length);

    /**
     * @brief Fills the given vector with secure random bytes.
     */
    static inline void fill(std::vector<uint8_t>& buffer)
    {
        fill(buffer.data(), buffer.size());
    };

    /**
     * @brief Draws a uniformly distributed integer in `[0, bound)`.
     * @throws `std::invalid_argument` if the bound is zero.
     */
    static uint32_t uniform(uint32_t bound);

    /**
     * @brief Securely zeroes out the given buffer.
     */
    static void zero(void* buffer, size_t length);

    static inline void zero(std::vector<uint8_t>& buffer)
    {
        zero(buffer.data(), buffer.size());
    };
};
} // namespace cryptography
} // namespace relaysync
