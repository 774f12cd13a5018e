#pragma once

#include <cstddef>
#include <cstdint>

namespace nostd
{
namespace cryptography
{
/**
 * @brief A source of bytes for signing auxiliary randomness and NIP-04 initialization vectors.
 * @remark Injected wherever randomness is consumed so tests can supply fixed values.
 */
class IEntropySource
{
public:
    virtual ~IEntropySource() = default;

    /**
     * @brief Fills the buffer with `length` bytes.
     * @throws `std::runtime_error` if the source cannot produce the bytes.
     */
    virtual void fill(uint8_t* buffer, std::size_t length) = 0;
};

/**
 * @brief Draws bytes from the OpenSSL CSPRNG.
 */
class SecureEntropySource : public IEntropySource
{
public:
    void fill(uint8_t* buffer, std::size_t length) override;
};

/**
 * @brief Produces zero bytes.
 * @remark Used as BIP-340 auxiliary randomness this makes signing deterministic: the same digest
 * and key always yield the same signature.  Never use it to generate NIP-04 IVs.
 */
class ZeroEntropySource : public IEntropySource
{
public:
    void fill(uint8_t* buffer, std::size_t length) override;
};
} // namespace cryptography
} // namespace nostd
