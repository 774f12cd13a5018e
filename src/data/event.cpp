#include <array>
#include <stdexcept>
#include <string>

#include <plog/Log.h>

#include "nostd/cryptography/hash.hpp"
#include "nostd/data/data.hpp"
#include "nostd/data/hex.hpp"
#include "nostd/data/serializer.hpp"
#include "nostd/errors.hpp"
#include "nostd/signer/signer.hpp"

using namespace nlohmann;
using namespace nostd;
using namespace nostd::data;
using namespace std;

Event::Event(PublicKey pubkey, uint64_t createdAt, Kind kind, TagStore tags, Content content)
    : _pubkey(pubkey),
      _createdAt(createdAt),
      _kind(kind),
      _tags(move(tags)),
      _content(move(content))
{
};

Event::Event(
    PublicKey pubkey,
    uint64_t createdAt,
    Kind kind,
    TagStore tags,
    Content content,
    EventId id,
    Signature sig)
    : _pubkey(pubkey),
      _createdAt(createdAt),
      _kind(kind),
      _tags(move(tags)),
      _content(move(content)),
      _id(id),
      _sig(sig)
{
};

Digest Event::computeDigest() const
{
    array<char, config::SERIALIZATION_BUFFER_SIZE> buffer;
    size_t length = serializeCanonical(*this, buffer.data(), buffer.size());

    return cryptography::sha256(buffer.data(), length);
};

bool Event::verify(const signer::ISigner& signer) const
{
    if (!this->isSigned())
    {
        PLOG_DEBUG << "Event::verify: The event is not signed.";
        return false;
    }

    // The stored id is only a claim; it must match the data actually held.
    Digest digest;
    try
    {
        digest = this->computeDigest();
    }
    catch (const BufferTooSmall& e)
    {
        PLOG_DEBUG << "Event::verify: " << e.what();
        return false;
    }

    if (digest != *this->_id)
    {
        PLOG_DEBUG << "Event::verify: The event id does not match the event data.";
        return false;
    }

    return signer.verify(digest, this->_pubkey, *this->_sig);
};

bool Event::operator==(const Event& other) const
{
    if (!this->_id.has_value())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the left-side argument is undefined.");
    }
    if (!other._id.has_value())
    {
        throw invalid_argument("Event::operator==: Cannot check equality, the right-side argument is undefined.");
    }

    return *this->_id == *other._id;
};

void adl_serializer<TagStore>::to_json(json& j, const TagStore& tags)
{
    j = json::array();
    for (const Tag& tag : tags)
    {
        json elements = json::array();
        for (const TagElement& element : tag)
        {
            elements.push_back(string(element.data(), element.size()));
        }
        j.push_back(elements);
    }
}

void adl_serializer<Event>::to_json(json& j, const Event& event)
{
    // Serialize the event to a JSON object.
    j = {
        { "pubkey", string(toHex(event.pubkey()).c_str()) },
        { "created_at", event.createdAt() },
        { "kind", event.kind() },
        { "tags", event.tags() },
        { "content", string(event.content().data(), event.content().size()) },
    };

    if (event.id().has_value())
    {
        j["id"] = string(toHex(*event.id()).c_str());
    }
    if (event.sig().has_value())
    {
        j["sig"] = string(toHex(*event.sig()).c_str());
    }
}
