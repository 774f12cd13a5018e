#include <stdexcept>

#include <plog/Log.h>

#include <openssl/crypto.h>
#include <openssl/rand.h>

#include "secure_rng.hpp"
#include "../internal/openssl_logger.hpp"

using namespace std;
using namespace nostd::cryptography;

void SecureRng::fill(void* buffer, size_t length)
{
    if (RAND_bytes(static_cast<uint8_t*>(buffer), static_cast<int>(length)) != 1)
    {
        NOSTD_LOG_OPENSSL_ERROR("RAND_bytes");
        throw runtime_error("SecureRng::fill: Failed to generate random bytes.");
    }
};

void SecureRng::zero(void* buffer, size_t length)
{
    OPENSSL_cleanse(buffer, length);
};
