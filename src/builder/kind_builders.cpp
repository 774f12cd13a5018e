#include <stdexcept>
#include <string_view>

#include <plog/Log.h>

#include "nostd/builder/kind_builders.hpp"
#include "nostd/data/hex.hpp"
#include "nostd/errors.hpp"
#include "../cryptography/secure_rng.hpp"

using namespace std;
using namespace nostd;
using namespace nostd::cryptography;
using namespace nostd::data;

namespace
{
/**
 * @brief Tags the recipient and sets the encrypted content of a direct message.
 */
builder::EventBuilder finishDirectMessage(
    shared_ptr<signer::ISigner> signer,
    const PrivateKey& privateKey,
    uint64_t createdAt,
    const PublicKey& recipient,
    const Content& ciphertext)
{
    builder::EventBuilder builder(signer, privateKey, kinds::DIRECT_MESSAGE, createdAt);

    auto recipientHex = toHex(recipient);
    builder.addTag({ "p", string_view(recipientHex.data(), recipientHex.size()) });
    builder.content(string_view(ciphertext.data(), ciphertext.size()));

    return builder;
}

PublicKey peerOf(const Event& event, const PublicKey& reader)
{
    if (reader != event.pubkey())
    {
        return event.pubkey();
    }

    // The reader wrote this message, so the peer is the tagged recipient.
    const Tag* recipientTag = event.tags().findFirst("p");
    if (recipientTag == nullptr || recipientTag->size() < 2)
    {
        PLOG_ERROR << "openDirectMessage: The direct message has no recipient tag.";
        throw EncodingError("openDirectMessage: The direct message has no recipient tag.");
    }

    const TagElement& value = (*recipientTag)[1];
    try
    {
        return fromHex<32>(string_view(value.data(), value.size()));
    }
    catch (const invalid_argument& e)
    {
        PLOG_ERROR << "openDirectMessage: The recipient tag is not a hex public key: " << e.what();
        throw EncodingError("openDirectMessage: The recipient tag is not a hex public key.");
    }
}
} // namespace

namespace nostd
{
namespace builder
{
EventBuilder shortNote(shared_ptr<signer::ISigner> signer, const PrivateKey& privateKey, uint64_t createdAt)
{
    return EventBuilder(signer, privateKey, kinds::SHORT_NOTE, createdAt);
};

EventBuilder iotPayload(shared_ptr<signer::ISigner> signer, const PrivateKey& privateKey, uint64_t createdAt)
{
    return EventBuilder(signer, privateKey, kinds::IOT, createdAt);
};

EventBuilder authChallenge(
    shared_ptr<signer::ISigner> signer,
    const PrivateKey& privateKey,
    uint64_t createdAt,
    string_view relayUrl,
    string_view challenge)
{
    EventBuilder builder(signer, privateKey, kinds::AUTH, createdAt);

    builder.addTag({ "challenge", challenge });
    builder.addTag({ "relay", relayUrl });
    builder.content("");

    return builder;
};

EventBuilder directMessage(
    shared_ptr<signer::ISigner> signer,
    const PrivateKey& privateKey,
    uint64_t createdAt,
    const PublicKey& recipient,
    string_view plaintext,
    const Iv& iv)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey, recipient);

    Content ciphertext;
    try
    {
        ciphertext = Nip04Cipher::encrypt(plaintext, secret, iv);
    }
    catch (const exception&)
    {
        SecureRng::zero(secret);
        throw;
    }
    SecureRng::zero(secret);

    return finishDirectMessage(signer, privateKey, createdAt, recipient, ciphertext);
};

EventBuilder directMessage(
    shared_ptr<signer::ISigner> signer,
    const Nip04Cipher& cipher,
    const PrivateKey& privateKey,
    uint64_t createdAt,
    const PublicKey& recipient,
    string_view plaintext)
{
    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey, recipient);

    Content ciphertext;
    try
    {
        ciphertext = cipher.encrypt(plaintext, secret);
    }
    catch (const exception&)
    {
        SecureRng::zero(secret);
        throw;
    }
    SecureRng::zero(secret);

    return finishDirectMessage(signer, privateKey, createdAt, recipient, ciphertext);
};

Plaintext openDirectMessage(const Event& event, const PrivateKey& privateKey, const signer::ISigner& signer)
{
    if (event.kind() != kinds::DIRECT_MESSAGE)
    {
        throw invalid_argument("openDirectMessage: The event is not a direct message.");
    }

    PublicKey reader = signer.derivePublicKey(privateKey);
    PublicKey peer = peerOf(event, reader);

    SharedSecret secret = Nip04Cipher::sharedSecret(privateKey, peer);

    Plaintext plaintext;
    try
    {
        plaintext = Nip04Cipher::decrypt(string_view(event.content().data(), event.content().size()), secret);
    }
    catch (const exception&)
    {
        SecureRng::zero(secret);
        throw;
    }
    SecureRng::zero(secret);

    return plaintext;
};
} // namespace builder
} // namespace nostd
