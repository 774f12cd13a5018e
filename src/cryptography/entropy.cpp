#include <cstring>

#include "nostd/cryptography/entropy.hpp"
#include "secure_rng.hpp"

using namespace std;
using namespace nostd::cryptography;

void SecureEntropySource::fill(uint8_t* buffer, size_t length)
{
    SecureRng::fill(buffer, length);
};

void ZeroEntropySource::fill(uint8_t* buffer, size_t length)
{
    memset(buffer, 0, length);
};
