#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string_view>

#include <etl/string.h>

#include "nostd/config.hpp"
#include "nostd/cryptography/entropy.hpp"
#include "nostd/data/data.hpp"

namespace nostd
{
namespace cryptography
{
using SharedSecret = std::array<uint8_t, 32>;
using Iv = std::array<uint8_t, config::AES_BLOCK_SIZE>;

///< A decrypted NIP-04 message.  Holds anything a maximum-length ciphertext can unpad to.
using Plaintext = etl::string<config::MAX_DM_CIPHERTEXT_LENGTH - 1>;

/**
 * @brief The NIP-04 encrypted direct message scheme.
 * @remark The AES-256 key is the x-coordinate of the ECDH shared point, used as-is with no
 * further key derivation.  Content is AES-256-CBC encrypted with PKCS#7 padding and carried as
 * `base64(ciphertext)?iv=base64(iv)`.
 */
class Nip04Cipher
{
public:
    /**
     * @brief Creates a cipher that draws IVs from the OpenSSL CSPRNG.
     */
    Nip04Cipher();

    /**
     * @brief Creates a cipher that draws IVs from the given source.
     */
    explicit Nip04Cipher(std::shared_ptr<IEntropySource> ivSource);

    /**
     * @brief Derives the key shared between a local private key and a remote public key.
     * @param privateKey The local secret scalar.
     * @param publicKey The remote x-only public key.  It is lifted to the curve point with even y.
     * @returns The x-coordinate of `privateKey * publicKey`.
     * @throws `KeyError` if the private key is not a valid scalar or the public key is not on
     * the curve.
     * @remark `sharedSecret(a, B) == sharedSecret(b, A)` for any two key pairs.
     */
    static SharedSecret sharedSecret(const data::PrivateKey& privateKey, const data::PublicKey& publicKey);

    /**
     * @brief Encrypts a plaintext with AES-256-CBC and PKCS#7 padding.
     * @param ciphertext The output buffer.
     * @param capacity The size of `ciphertext` in bytes.
     * @returns The number of ciphertext bytes written, always a multiple of 16.
     * @throws `LengthError` if the plaintext is longer than `config::MAX_DM_PLAINTEXT_LENGTH`.
     * @throws `BufferTooSmall` if the padded ciphertext does not fit in `capacity` bytes.
     */
    static std::size_t encryptBlocks(
        std::string_view plaintext,
        const SharedSecret& secret,
        const Iv& iv,
        uint8_t* ciphertext,
        std::size_t capacity);

    /**
     * @brief Writes the NIP-04 wire string `base64(ciphertext)?iv=base64(iv)`.
     * @returns The number of characters written.  No terminator is written.
     * @throws `BufferTooSmall` if the wire string does not fit in `capacity` bytes.
     */
    static std::size_t encodeWire(
        const uint8_t* ciphertext,
        std::size_t length,
        const Iv& iv,
        char* output,
        std::size_t capacity);

    /**
     * @brief Encrypts a plaintext into event content using the given IV.
     * @throws `LengthError` if the plaintext is longer than `config::MAX_DM_PLAINTEXT_LENGTH`.
     */
    static data::Content encrypt(std::string_view plaintext, const SharedSecret& secret, const Iv& iv);

    /**
     * @brief Encrypts a plaintext into event content using a fresh IV from the cipher's source.
     * @throws `LengthError` if the plaintext is longer than `config::MAX_DM_PLAINTEXT_LENGTH`.
     */
    data::Content encrypt(std::string_view plaintext, const SharedSecret& secret) const;

    /**
     * @brief Decrypts a NIP-04 wire string.
     * @throws `EncodingError` if the `?iv=` delimiter is missing, either half is not canonical
     * base64, the IV is not 16 bytes, or the ciphertext is empty, not a whole number of blocks, or
     * longer than any message this library can produce.
     * @throws `PaddingError` if the decrypted padding is inconsistent.
     * @remark The padding check runs over the whole final block without early exit, so its
     * timing does not depend on which padding byte is wrong.
     */
    static Plaintext decrypt(std::string_view wire, const SharedSecret& secret);

private:
    std::shared_ptr<IEntropySource> _ivSource;
};
} // namespace cryptography
} // namespace nostd
