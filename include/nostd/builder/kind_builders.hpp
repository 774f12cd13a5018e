#pragma once

#include <cstdint>
#include <memory>
#include <string_view>

#include "nostd/builder/event_builder.hpp"
#include "nostd/cryptography/nip04.hpp"

namespace nostd
{
namespace builder
{
/**
 * @brief Starts a kind 1 short text note.
 * @returns A builder in the `Empty` state.
 */
EventBuilder shortNote(
    std::shared_ptr<signer::ISigner> signer,
    const data::PrivateKey& privateKey,
    uint64_t createdAt);

/**
 * @brief Starts a kind 5732 IOT payload event.
 * @returns A builder in the `Empty` state.
 */
EventBuilder iotPayload(
    std::shared_ptr<signer::ISigner> signer,
    const data::PrivateKey& privateKey,
    uint64_t createdAt);

/**
 * @brief Creates a NIP-42 authentication event answering a relay challenge.
 * @param challenge The challenge from the relay's `AUTH` message (see `data::AuthMessage`).
 * @returns A builder in the `ContentSet` state, holding the `challenge` and `relay` tags and
 * empty content.
 * @throws `CapacityError` if the relay URL or challenge is too long for a tag.
 */
EventBuilder authChallenge(
    std::shared_ptr<signer::ISigner> signer,
    const data::PrivateKey& privateKey,
    uint64_t createdAt,
    std::string_view relayUrl,
    std::string_view challenge);

/**
 * @brief Creates a NIP-04 direct message.
 * @param recipient The recipient's public key.  It is added as a `p` tag.
 * @param plaintext The message to encrypt.
 * @param iv The AES initialization vector.  It must be unpredictable and never reused.
 * @returns A builder in the `ContentSet` state.
 * @throws `KeyError` if either key is invalid.
 * @throws `LengthError` if the plaintext is longer than `config::MAX_DM_PLAINTEXT_LENGTH`.
 */
EventBuilder directMessage(
    std::shared_ptr<signer::ISigner> signer,
    const data::PrivateKey& privateKey,
    uint64_t createdAt,
    const data::PublicKey& recipient,
    std::string_view plaintext,
    const cryptography::Iv& iv);

/**
 * @brief Creates a NIP-04 direct message with an IV drawn from the cipher's entropy source.
 * @see directMessage
 */
EventBuilder directMessage(
    std::shared_ptr<signer::ISigner> signer,
    const cryptography::Nip04Cipher& cipher,
    const data::PrivateKey& privateKey,
    uint64_t createdAt,
    const data::PublicKey& recipient,
    std::string_view plaintext);

/**
 * @brief Decrypts a received or sent direct message.
 * @param event A kind 4 event.
 * @param privateKey The reader's private key.  The reader may be the recipient or the author.
 * @remark When the reader wrote the event, the peer key is taken from its `p` tag; otherwise the
 * peer is the event author.
 * @throws `std::invalid_argument` if the event is not a direct message.
 * @throws `EncodingError` if the event has no valid `p` tag or its content is malformed.
 * @throws `CodecError` if the content cannot be decrypted.
 */
cryptography::Plaintext openDirectMessage(
    const data::Event& event,
    const data::PrivateKey& privateKey,
    const signer::ISigner& signer);
} // namespace builder
} // namespace nostd
