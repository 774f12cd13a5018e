#include <array>
#include <cstring>
#include <memory>
#include <stdexcept>

#include "nostd/errors.hpp"
#include "nostd/signer/noscrypt_signer.hpp"
#include "../cryptography/secure_rng.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;
using namespace nostd;
using namespace nostd::cryptography;
using namespace nostd::data;
using namespace nostd::signer;

#pragma region Local Statics

/**
 * @brief Tears down and frees a context created by `initNoscryptContext`.
 */
static void destroyNoscryptContext(NCContext* ctx)
{
    NCDestroyContext(ctx);
    operator delete(ctx);
}

/**
 * @brief Allocates a noscrypt context, whose size is only known at run time, and randomises it.
 * @throws `std::runtime_error` if noscrypt rejects the initialization.
 */
static shared_ptr<NCContext> initNoscryptContext()
{
    auto* ctx = static_cast<NCContext*>(operator new(NCGetContextStructSize()));

    array<uint8_t, NC_CONTEXT_ENTROPY_SIZE> randomEntropy;
    SecureRng::fill(randomEntropy.data(), randomEntropy.size());

    NCResult initResult = NCInitContext(ctx, randomEntropy.data());
    SecureRng::zero(randomEntropy);

    if (initResult != NC_SUCCESS)
    {
        // An uninitialized context must not reach NCDestroyContext.
        operator delete(ctx);
        NOSTD_LOG_NC_ERROR("NCInitContext", initResult);
        throw runtime_error("NoscryptSigner: Failed to initialize the noscrypt context.");
    }

    return shared_ptr<NCContext>(ctx, destroyNoscryptContext);
};

#pragma endregion

#pragma region Constructors

NoscryptSigner::NoscryptSigner(shared_ptr<plog::IAppender> appender)
    : NoscryptSigner(appender, make_shared<ZeroEntropySource>())
{
};

NoscryptSigner::NoscryptSigner(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IEntropySource> auxSource)
{
    plog::init(plog::debug, appender.get());

    if (auxSource == nullptr)
    {
        throw invalid_argument("NoscryptSigner::NoscryptSigner: An entropy source is required.");
    }

    this->_noscryptContext = initNoscryptContext();
    this->_auxSource = auxSource;
};

#pragma endregion

#pragma region Public Interface

PublicKey NoscryptSigner::derivePublicKey(const PrivateKey& privateKey) const
{
    NCSecretKey secretKey;
    this->_loadSecretKey(privateKey, secretKey);

    NCPublicKey ncPubkey;
    NCResult result = NCGetPublicKey(this->_noscryptContext.get(), &secretKey, &ncPubkey);
    SecureRng::zero(&secretKey, sizeof(NCSecretKey));

    if (result != NC_SUCCESS)
    {
        NOSTD_LOG_NC_ERROR("NCGetPublicKey", result);
        throw KeyError("NoscryptSigner::derivePublicKey: Failed to derive the public key.");
    }

    PublicKey pubkey;
    memcpy(pubkey.data(), ncPubkey.key, pubkey.size());

    return pubkey;
};

Signature NoscryptSigner::sign(const Digest& digest, const PrivateKey& privateKey) const
{
    NCSecretKey secretKey;
    this->_loadSecretKey(privateKey, secretKey);

    array<uint8_t, 32> auxRandom;
    this->_auxSource->fill(auxRandom.data(), auxRandom.size());

    Signature sig;
    NCResult result = NCSignDigest(
        this->_noscryptContext.get(),
        &secretKey,
        auxRandom.data(),
        digest.data(),
        sig.data());

    SecureRng::zero(&secretKey, sizeof(NCSecretKey));
    SecureRng::zero(auxRandom);

    if (result != NC_SUCCESS)
    {
        NOSTD_LOG_NC_ERROR("NCSignDigest", result);
        throw KeyError("NoscryptSigner::sign: Failed to sign the digest.");
    }

    return sig;
};

bool NoscryptSigner::verify(const Digest& digest, const PublicKey& pubkey, const Signature& sig) const
{
    NCPublicKey ncPubkey;
    memcpy(ncPubkey.key, pubkey.data(), pubkey.size());

    NCResult result = NCVerifyDigest(this->_noscryptContext.get(), &ncPubkey, digest.data(), sig.data());
    if (result != NC_SUCCESS)
    {
        PLOG_DEBUG << "NoscryptSigner::verify: Signature verification failed.";
        return false;
    }

    return true;
};

#pragma endregion

#pragma region Private Methods

void NoscryptSigner::_loadSecretKey(const PrivateKey& privateKey, NCSecretKey& secretKey) const
{
    memcpy(secretKey.key, privateKey.data(), privateKey.size());

    NCResult result = NCValidateSecretKey(this->_noscryptContext.get(), &secretKey);
    if (result != NC_SUCCESS)
    {
        SecureRng::zero(&secretKey, sizeof(NCSecretKey));
        NOSTD_LOG_NC_ERROR("NCValidateSecretKey", result);
        throw KeyError("NoscryptSigner::_loadSecretKey: The private key is not a valid secp256k1 key.");
    }
};

#pragma endregion
