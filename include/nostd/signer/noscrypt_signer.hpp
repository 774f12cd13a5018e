#pragma once

#include <memory>

#include <plog/Init.h>
#include <plog/Log.h>
#include <noscrypt.h>

#include "nostd/cryptography/entropy.hpp"
#include "nostd/signer/signer.hpp"

namespace nostd
{
namespace signer
{
/**
 * @brief A signer backed by the noscrypt library.
 * @remark The noscrypt context is created and randomised when the signer is constructed and is
 * destroyed with it.  The signer holds no key material between calls, so one instance may be
 * shared by any number of builders.
 */
class NoscryptSigner : public ISigner
{
public:
    /**
     * @brief Creates a signer that signs deterministically (all-zero auxiliary randomness).
     * @throws `std::runtime_error` if the noscrypt context cannot be initialized.
     */
    NoscryptSigner(std::shared_ptr<plog::IAppender> appender);

    /**
     * @brief Creates a signer that draws BIP-340 auxiliary randomness from the given source.
     * @throws `std::runtime_error` if the noscrypt context cannot be initialized.
     */
    NoscryptSigner(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<cryptography::IEntropySource> auxSource);

    NoscryptSigner(const NoscryptSigner&) = delete;
    NoscryptSigner& operator=(const NoscryptSigner&) = delete;

    data::PublicKey derivePublicKey(const data::PrivateKey& privateKey) const override;

    data::Signature sign(const data::Digest& digest, const data::PrivateKey& privateKey) const override;

    bool verify(
        const data::Digest& digest,
        const data::PublicKey& pubkey,
        const data::Signature& sig) const override;

private:
    ///< Destroyed and freed together with the signer.
    std::shared_ptr<NCContext> _noscryptContext;

    ///< Source of the 32 auxiliary bytes mixed into each BIP-340 nonce.
    std::shared_ptr<cryptography::IEntropySource> _auxSource;

    /**
     * @brief Copies and validates a private key into noscrypt's key structure.
     * @throws `KeyError` if noscrypt rejects the key.
     */
    void _loadSecretKey(const data::PrivateKey& privateKey, NCSecretKey& secretKey) const;
};
} // namespace signer
} // namespace nostd
