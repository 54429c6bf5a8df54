#include <limits>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <plog/Log.h>

#include "secure_rng.hpp"

using namespace relaysync::cryptography;
using namespace std;

void SecureRng::fill(void* buffer, size_t length)
{
    if (RAND_bytes(static_cast<uint8_t*>(buffer), static_cast<int>(length)) != 1)
    {
        PLOG_ERROR << "Failed to generate random bytes";
        throw runtime_error("SecureRng::fill: The system RNG failed.");
    }
};

uint32_t SecureRng::uniform(uint32_t bound)
{
    if (bound == 0)
    {
        throw invalid_argument("SecureRng::uniform: The bound must be positive.");
    }

    // Reject draws from the incomplete final block to avoid modulo bias.
    const uint32_t limit = numeric_limits<uint32_t>::max() - (numeric_limits<uint32_t>::max() % bound);
    uint32_t value;
    do
    {
        fill(&value, sizeof(value));
    } while (value >= limit);

    return value % bound;
};

void SecureRng::zero(void* buffer, size_t length)
{
    OPENSSL_cleanse(buffer, length);
};
