#pragma once

#include <cstddef>
#include <cstdint>

namespace nostd
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
     * @throws `std::runtime_error` if the OpenSSL CSPRNG fails.
     */
    static void fill(void* buffer, std::size_t length);

    /*
     * @brief Securely zeroes out the given buffer.
     * @param buffer A pointer to the buffer to zero out.
     * @param length The number of bytes to zero out.
     */
    static void zero(void* buffer, std::size_t length);

    /*
     * @brief Securely zeroes out a fixed-size key or secret.
     */
    template <typename Array>
    static void zero(Array& buffer)
    {
        zero(buffer.data(), buffer.size() * sizeof(buffer[0]));
    }
};

} // namespace cryptography
} // namespace nostd
