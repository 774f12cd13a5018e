#include <cstring>
#include <memory>
#include <sstream>
#include <stdexcept>

#include <plog/Log.h>

#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>

#include "nostd/cryptography/nip04.hpp"
#include "nostd/errors.hpp"
#include "secure_rng.hpp"
#include "../internal/bounded_writer.hpp"
#include "../internal/openssl_logger.hpp"

using namespace std;
using namespace nostd;
using namespace nostd::cryptography;

#pragma region Local Statics

namespace
{
struct BnCtxDeleter { void operator()(BN_CTX* ctx) const { BN_CTX_free(ctx); } };
struct BnDeleter { void operator()(BIGNUM* bn) const { BN_free(bn); } };
struct SecretBnDeleter { void operator()(BIGNUM* bn) const { BN_clear_free(bn); } };
struct EcGroupDeleter { void operator()(EC_GROUP* group) const { EC_GROUP_free(group); } };
struct EcPointDeleter { void operator()(EC_POINT* point) const { EC_POINT_clear_free(point); } };
struct CipherCtxDeleter { void operator()(EVP_CIPHER_CTX* ctx) const { EVP_CIPHER_CTX_free(ctx); } };

using BnCtxPtr = unique_ptr<BN_CTX, BnCtxDeleter>;
using BnPtr = unique_ptr<BIGNUM, BnDeleter>;
using SecretBnPtr = unique_ptr<BIGNUM, SecretBnDeleter>;
using EcGroupPtr = unique_ptr<EC_GROUP, EcGroupDeleter>;
using EcPointPtr = unique_ptr<EC_POINT, EcPointDeleter>;
using CipherCtxPtr = unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

constexpr string_view IV_DELIMITER = "?iv=";

constexpr size_t MAX_CIPHERTEXT_BASE64_LENGTH =
    config::base64Length(config::MAX_DM_CIPHERTEXT_LENGTH);

constexpr size_t IV_BASE64_LENGTH = config::base64Length(config::AES_BLOCK_SIZE);

/**
 * @brief Raises a `std::runtime_error` for an OpenSSL failure that no input can cause.
 */
[[noreturn]] void throwInternalError(const char* operation)
{
    NOSTD_LOG_OPENSSL_ERROR(operation);
    throw runtime_error(string("Nip04Cipher: ") + operation + " failed.");
}

/**
 * @brief Creates a cipher context for AES-256-CBC with the given key and IV.
 * @remark Padding is handled by OpenSSL when encrypting and checked by hand when decrypting.
 */
CipherCtxPtr initAesCbc(const SharedSecret& secret, const Iv& iv, bool encrypt)
{
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx)
    {
        throwInternalError("EVP_CIPHER_CTX_new");
    }

    int initResult = EVP_CipherInit_ex(
        ctx.get(),
        EVP_aes_256_cbc(),
        nullptr,
        secret.data(),
        iv.data(),
        encrypt ? 1 : 0);
    if (initResult != 1)
    {
        throwInternalError("EVP_CipherInit_ex");
    }

    if (!encrypt && EVP_CIPHER_CTX_set_padding(ctx.get(), 0) != 1)
    {
        throwInternalError("EVP_CIPHER_CTX_set_padding");
    }

    return ctx;
}

/**
 * @brief Decodes padded base64 into `output`.
 * @returns The number of decoded bytes.
 * @throws `EncodingError` if the input is empty, not a multiple of four characters, contains
 * characters outside the base64 alphabet, or has '=' anywhere but the trailing padding.
 */
size_t decodeBase64(string_view input, uint8_t* output, size_t capacity)
{
    if (input.empty() || input.size() % 4 != 0 || (input.size() / 4) * 3 > capacity)
    {
        throw EncodingError("Nip04Cipher::decrypt: The message is not valid NIP-04 content.");
    }

    // OpenSSL decodes '=' as zero bits wherever it appears.
    size_t firstPad = input.find('=');
    if (firstPad != string_view::npos
        && (firstPad < input.size() - 2 || input.find_first_not_of('=', firstPad) != string_view::npos))
    {
        throw EncodingError("Nip04Cipher::decrypt: The message is not valid NIP-04 content.");
    }

    int decoded = EVP_DecodeBlock(
        output,
        reinterpret_cast<const uint8_t*>(input.data()),
        static_cast<int>(input.size()));
    if (decoded < 0)
    {
        throw EncodingError("Nip04Cipher::decrypt: The message is not valid NIP-04 content.");
    }

    // EVP_DecodeBlock counts the bytes encoded by '=' padding characters as output.
    size_t padding = 0;
    if (input[input.size() - 1] == '=')
    {
        padding++;
        if (input[input.size() - 2] == '=')
        {
            padding++;
        }
    }

    return static_cast<size_t>(decoded) - padding;
}

/**
 * @brief Returns 1 if `x` is nonzero and 0 otherwise, without branching.
 */
inline uint32_t ctIsNonZero(uint32_t x)
{
    return (x | (0u - x)) >> 31;
}

/**
 * @brief Returns 1 if `a < b` and 0 otherwise, without branching.  Both must be below 2^31.
 */
inline uint32_t ctLessThan(uint32_t a, uint32_t b)
{
    return (a - b) >> 31;
}
} // namespace

#pragma endregion

Nip04Cipher::Nip04Cipher() : _ivSource(make_shared<SecureEntropySource>())
{
};

Nip04Cipher::Nip04Cipher(shared_ptr<IEntropySource> ivSource) : _ivSource(move(ivSource))
{
    if (!this->_ivSource)
    {
        throw invalid_argument("Nip04Cipher::Nip04Cipher: An IV source is required.");
    }
};

SharedSecret Nip04Cipher::sharedSecret(const data::PrivateKey& privateKey, const data::PublicKey& publicKey)
{
    EcGroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1));
    BnCtxPtr bnCtx(BN_CTX_new());
    if (!group || !bnCtx)
    {
        throwInternalError("EC_GROUP_new_by_curve_name");
    }

    SecretBnPtr scalar(BN_bin2bn(privateKey.data(), static_cast<int>(privateKey.size()), nullptr));
    if (!scalar)
    {
        throwInternalError("BN_bin2bn");
    }
    BN_set_flags(scalar.get(), BN_FLG_CONSTTIME);

    const BIGNUM* order = EC_GROUP_get0_order(group.get());
    if (BN_is_zero(scalar.get()) || BN_cmp(scalar.get(), order) >= 0)
    {
        PLOG_ERROR << "Nip04Cipher::sharedSecret: The private key is not a valid secp256k1 scalar.";
        throw KeyError("Nip04Cipher::sharedSecret: The private key is not a valid secp256k1 scalar.");
    }

    // x-only keys denote the point with even y, i.e. the compressed encoding with prefix 0x02.
    uint8_t compressed[33];
    compressed[0] = 0x02;
    memcpy(compressed + 1, publicKey.data(), publicKey.size());

    EcPointPtr peer(EC_POINT_new(group.get()));
    EcPointPtr shared(EC_POINT_new(group.get()));
    BnPtr sharedX(BN_new());
    if (!peer || !shared || !sharedX)
    {
        throwInternalError("EC_POINT_new");
    }

    if (EC_POINT_oct2point(group.get(), peer.get(), compressed, sizeof(compressed), bnCtx.get()) != 1)
    {
        PLOG_ERROR << "Nip04Cipher::sharedSecret: The public key is not a point on secp256k1.";
        throw KeyError("Nip04Cipher::sharedSecret: The public key is not a point on secp256k1.");
    }

    if (EC_POINT_mul(group.get(), shared.get(), nullptr, peer.get(), scalar.get(), bnCtx.get()) != 1)
    {
        throwInternalError("EC_POINT_mul");
    }

    if (EC_POINT_get_affine_coordinates(group.get(), shared.get(), sharedX.get(), nullptr, bnCtx.get()) != 1)
    {
        throwInternalError("EC_POINT_get_affine_coordinates");
    }

    SharedSecret secret;
    if (BN_bn2binpad(sharedX.get(), secret.data(), static_cast<int>(secret.size())) != static_cast<int>(secret.size()))
    {
        throwInternalError("BN_bn2binpad");
    }

    BN_clear(sharedX.get());
    return secret;
};

size_t Nip04Cipher::encryptBlocks(
    string_view plaintext,
    const SharedSecret& secret,
    const Iv& iv,
    uint8_t* ciphertext,
    size_t capacity)
{
    if (plaintext.size() > config::MAX_DM_PLAINTEXT_LENGTH)
    {
        ostringstream oss;
        oss << "Nip04Cipher::encryptBlocks: The plaintext exceeds the maximum of "
            << config::MAX_DM_PLAINTEXT_LENGTH << " bytes.";
        PLOG_ERROR << oss.str();
        throw LengthError(oss.str());
    }

    // PKCS#7 always adds between 1 and 16 bytes of padding.
    const size_t paddedLength = (plaintext.size() / config::AES_BLOCK_SIZE + 1) * config::AES_BLOCK_SIZE;
    if (paddedLength > capacity)
    {
        PLOG_ERROR << "Nip04Cipher::encryptBlocks: The ciphertext buffer is too small.";
        throw BufferTooSmall("Nip04Cipher::encryptBlocks: The ciphertext buffer is too small.", paddedLength);
    }

    CipherCtxPtr ctx = initAesCbc(secret, iv, true);

    int updateLength = 0;
    int updateResult = EVP_EncryptUpdate(
        ctx.get(),
        ciphertext,
        &updateLength,
        reinterpret_cast<const uint8_t*>(plaintext.data()),
        static_cast<int>(plaintext.size()));
    if (updateResult != 1)
    {
        throwInternalError("EVP_EncryptUpdate");
    }

    int finalLength = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + updateLength, &finalLength) != 1)
    {
        throwInternalError("EVP_EncryptFinal_ex");
    }

    return static_cast<size_t>(updateLength + finalLength);
};

size_t Nip04Cipher::encodeWire(
    const uint8_t* ciphertext,
    size_t length,
    const Iv& iv,
    char* output,
    size_t capacity)
{
    if (length > config::MAX_DM_CIPHERTEXT_LENGTH)
    {
        throw LengthError("Nip04Cipher::encodeWire: The ciphertext exceeds the maximum message size.");
    }

    // EVP_EncodeBlock appends a terminator, so leave room for it.
    uint8_t encoded[MAX_CIPHERTEXT_BASE64_LENGTH + 1];
    int encodedLength = EVP_EncodeBlock(encoded, ciphertext, static_cast<int>(length));

    uint8_t encodedIv[IV_BASE64_LENGTH + 1];
    int encodedIvLength = EVP_EncodeBlock(encodedIv, iv.data(), static_cast<int>(iv.size()));

    internal::BoundedWriter writer(output, capacity, "Nip04Cipher::encodeWire");
    writer.write(string_view(reinterpret_cast<const char*>(encoded), encodedLength));
    writer.write(IV_DELIMITER);
    writer.write(string_view(reinterpret_cast<const char*>(encodedIv), encodedIvLength));

    return writer.size();
};

data::Content Nip04Cipher::encrypt(string_view plaintext, const SharedSecret& secret, const Iv& iv)
{
    uint8_t ciphertext[config::MAX_DM_CIPHERTEXT_LENGTH];
    size_t ciphertextLength = Nip04Cipher::encryptBlocks(plaintext, secret, iv, ciphertext, sizeof(ciphertext));

    char wire[config::MAX_DM_WIRE_LENGTH];
    size_t wireLength = Nip04Cipher::encodeWire(ciphertext, ciphertextLength, iv, wire, sizeof(wire));

    return data::Content(wire, wireLength);
};

data::Content Nip04Cipher::encrypt(string_view plaintext, const SharedSecret& secret) const
{
    // A fresh, unpredictable IV is required for every message.
    Iv iv;
    this->_ivSource->fill(iv.data(), iv.size());

    return Nip04Cipher::encrypt(plaintext, secret, iv);
};

Plaintext Nip04Cipher::decrypt(string_view wire, const SharedSecret& secret)
{
    size_t delimiter = wire.find(IV_DELIMITER);
    if (delimiter == string_view::npos)
    {
        PLOG_DEBUG << "Nip04Cipher::decrypt: The message has no IV delimiter.";
        throw EncodingError("Nip04Cipher::decrypt: The message is not valid NIP-04 content.");
    }

    string_view encodedCiphertext = wire.substr(0, delimiter);
    string_view encodedIv = wire.substr(delimiter + IV_DELIMITER.size());

    if (encodedCiphertext.size() > MAX_CIPHERTEXT_BASE64_LENGTH)
    {
        PLOG_DEBUG << "Nip04Cipher::decrypt: The ciphertext exceeds the maximum message size.";
        throw EncodingError("Nip04Cipher::decrypt: The message is not valid NIP-04 content.");
    }

    // Sized for the decoder, which writes three bytes per four characters before trimming '='.
    uint8_t ivBuffer[(IV_BASE64_LENGTH / 4) * 3];
    if (encodedIv.size() != IV_BASE64_LENGTH
        || decodeBase64(encodedIv, ivBuffer, sizeof(ivBuffer)) != config::AES_BLOCK_SIZE)
    {
        throw EncodingError("Nip04Cipher::decrypt: The message is not valid NIP-04 content.");
    }

    Iv iv;
    memcpy(iv.data(), ivBuffer, iv.size());

    uint8_t ciphertext[(MAX_CIPHERTEXT_BASE64_LENGTH / 4) * 3];
    size_t ciphertextLength = decodeBase64(encodedCiphertext, ciphertext, sizeof(ciphertext));
    if (ciphertextLength == 0 || ciphertextLength % config::AES_BLOCK_SIZE != 0)
    {
        throw EncodingError("Nip04Cipher::decrypt: The message is not valid NIP-04 content.");
    }

    CipherCtxPtr ctx = initAesCbc(secret, iv, false);

    uint8_t padded[sizeof(ciphertext)];
    int updateLength = 0;
    if (EVP_DecryptUpdate(ctx.get(), padded, &updateLength, ciphertext, static_cast<int>(ciphertextLength)) != 1)
    {
        throwInternalError("EVP_DecryptUpdate");
    }

    int finalLength = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), padded + updateLength, &finalLength) != 1)
    {
        throwInternalError("EVP_DecryptFinal_ex");
    }

    const size_t paddedLength = static_cast<size_t>(updateLength + finalLength);

    // Check the whole final block in one pass.  Every byte is visited regardless of where the
    // padding goes wrong, and the verdict is a single branch at the end.
    const uint8_t* lastBlock = padded + paddedLength - config::AES_BLOCK_SIZE;
    const uint32_t padLength = lastBlock[config::AES_BLOCK_SIZE - 1];

    uint32_t bad = ctIsNonZero(padLength) ^ 1u;
    bad |= ctLessThan(config::AES_BLOCK_SIZE, padLength);
    for (uint32_t i = 0; i < config::AES_BLOCK_SIZE; i++)
    {
        // Byte i belongs to the padding when (15 - i) < padLength.
        uint32_t inPadding = ctLessThan(config::AES_BLOCK_SIZE - 1 - i, padLength);
        bad |= inPadding & ctIsNonZero(lastBlock[i] ^ padLength);
    }

    if (bad != 0)
    {
        SecureRng::zero(padded, sizeof(padded));
        throw PaddingError("Nip04Cipher::decrypt: The message is not valid NIP-04 content.");
    }

    Plaintext plaintext(reinterpret_cast<const char*>(padded), paddedLength - padLength);
    SecureRng::zero(padded, sizeof(padded));

    return plaintext;
};
