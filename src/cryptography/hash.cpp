#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/sha.h>

#include "nostd/cryptography/hash.hpp"
#include "../internal/openssl_logger.hpp"

using namespace std;
using namespace nostd;

data::Digest cryptography::sha256(const void* data, size_t length)
{
    static_assert(SHA256_DIGEST_LENGTH == sizeof(data::Digest), "SHA-256 digests are 32 bytes.");

    data::Digest digest;
    if (EVP_Digest(data, length, digest.data(), nullptr, EVP_sha256(), nullptr) != 1)
    {
        // Only reachable if the OpenSSL provider is broken or out of memory.
        NOSTD_LOG_OPENSSL_ERROR("EVP_Digest");
        throw runtime_error("sha256: The digest could not be computed.");
    }

    return digest;
};
