#pragma once

#include "nostd/data/data.hpp"

namespace nostd
{
namespace signer
{
/**
 * @brief An interface for the secp256k1 key operations used to sign Nostr events.
 */
class ISigner
{
public:
    virtual ~ISigner() = default;

    /**
     * @brief Derives the x-only public key of a private key.
     * @throws `KeyError` if the private key is zero or not less than the curve order.
     */
    virtual data::PublicKey derivePublicKey(const data::PrivateKey& privateKey) const = 0;

    /**
     * @brief Produces a BIP-340 Schnorr signature over a 32-byte digest.
     * @throws `KeyError` if the private key is invalid.
     */
    virtual data::Signature sign(const data::Digest& digest, const data::PrivateKey& privateKey) const = 0;

    /**
     * @brief Checks a BIP-340 Schnorr signature.
     * @returns True only if the signature is valid for the digest and public key.  Malformed
     * keys or signatures yield false, never an exception.
     */
    virtual bool verify(
        const data::Digest& digest,
        const data::PublicKey& pubkey,
        const data::Signature& sig) const = 0;
};
} // namespace signer
} // namespace nostd
