#include <sstream>
#include <stdexcept>
#include <utility>

#include <plog/Log.h>

#include "nostd/builder/event_builder.hpp"
#include "nostd/cryptography/hash.hpp"
#include "nostd/data/serializer.hpp"
#include "nostd/errors.hpp"
#include "../cryptography/secure_rng.hpp"

using namespace std;
using namespace nostd;
using namespace nostd::builder;
using namespace nostd::data;

namespace
{
bool hasValue(const Tag* tag)
{
    return tag != nullptr && tag->size() >= 2 && !(*tag)[1].empty();
}
} // namespace

namespace nostd
{
namespace builder
{
const char* toString(BuildState state)
{
    switch (state)
    {
    case BuildState::Empty:
        return "Empty";
    case BuildState::TagsSet:
        return "TagsSet";
    case BuildState::ContentSet:
        return "ContentSet";
    case BuildState::Serialized:
        return "Serialized";
    case BuildState::Hashed:
        return "Hashed";
    case BuildState::Signed:
        return "Signed";
    case BuildState::Consumed:
        return "Consumed";
    }

    return "Unknown";
};
} // namespace builder
} // namespace nostd

#pragma region Constructors and Destructors

EventBuilder::EventBuilder(
    shared_ptr<signer::ISigner> signer,
    const PrivateKey& privateKey,
    Kind kind,
    uint64_t createdAt)
    : _signer(signer),
      _privateKey(privateKey),
      _kind(kind),
      _createdAt(createdAt),
      _pubkey{}
{
    if (this->_signer == nullptr)
    {
        cryptography::SecureRng::zero(this->_privateKey);
        throw invalid_argument("EventBuilder::EventBuilder: A signer is required.");
    }
};

EventBuilder::EventBuilder(EventBuilder&& other)
    : _signer(move(other._signer)),
      _privateKey(other._privateKey),
      _kind(other._kind),
      _createdAt(other._createdAt),
      _pubkey(other._pubkey),
      _tags(move(other._tags)),
      _content(move(other._content)),
      _state(move(other._state))
{
    cryptography::SecureRng::zero(other._privateKey);
    other._state = state::Consumed{};
};

EventBuilder::~EventBuilder()
{
    cryptography::SecureRng::zero(this->_privateKey);
};

#pragma endregion

#pragma region Transitions

EventBuilder& EventBuilder::addTag(initializer_list<string_view> tag)
{
    if (!holds_alternative<state::Empty>(this->_state)
        && !holds_alternative<state::TagsSet>(this->_state))
    {
        this->_outOfSequence("addTag");
    }

    this->_tags.add(tag);
    this->_state = state::TagsSet{};

    return *this;
};

EventBuilder& EventBuilder::content(string_view content)
{
    if (!holds_alternative<state::Empty>(this->_state)
        && !holds_alternative<state::TagsSet>(this->_state))
    {
        this->_outOfSequence("content");
    }

    this->_content = makeContent(content);
    this->_state = state::ContentSet{};

    return *this;
};

EventBuilder& EventBuilder::serialize()
{
    if (!holds_alternative<state::ContentSet>(this->_state))
    {
        this->_outOfSequence("serialize");
    }

    this->_checkKindShape();
    this->_pubkey = this->_signer->derivePublicKey(this->_privateKey);

    state::Serialized serialized;
    serialized.length = serializeCanonical(
        this->_pubkey,
        this->_createdAt,
        this->_kind,
        this->_tags,
        string_view(this->_content.data(), this->_content.size()),
        serialized.buffer.data(),
        serialized.buffer.size());

    this->_state = serialized;
    PLOG_DEBUG << "EventBuilder::serialize: Serialized kind " << this->_kind << " event to "
               << serialized.length << " bytes.";

    return *this;
};

EventBuilder& EventBuilder::hash()
{
    const auto* serialized = get_if<state::Serialized>(&this->_state);
    if (serialized == nullptr)
    {
        this->_outOfSequence("hash");
    }

    Digest digest = cryptography::sha256(serialized->buffer.data(), serialized->length);
    this->_state = state::Hashed{ digest };

    return *this;
};

EventBuilder& EventBuilder::sign()
{
    const auto* hashed = get_if<state::Hashed>(&this->_state);
    if (hashed == nullptr)
    {
        this->_outOfSequence("sign");
    }

    Digest digest = hashed->digest;
    Signature sig = this->_signer->sign(digest, this->_privateKey);

    this->_state = state::Signed{
        Event(this->_pubkey, this->_createdAt, this->_kind, this->_tags, this->_content, digest, sig)
    };
    PLOG_DEBUG << "EventBuilder::sign: Signed kind " << this->_kind << " event.";

    return *this;
};

Event EventBuilder::build() &&
{
    auto* signedState = get_if<state::Signed>(&this->_state);
    if (signedState == nullptr)
    {
        this->_outOfSequence("build");
    }

    Event event = move(signedState->event);
    this->_state = state::Consumed{};

    return event;
};

Event EventBuilder::finish() &&
{
    this->serialize().hash().sign();

    return move(*this).build();
};

#pragma endregion

#pragma region Queries

BuildState EventBuilder::state() const
{
    return static_cast<BuildState>(this->_state.index());
};

string_view EventBuilder::serialized() const
{
    const auto* serialized = get_if<state::Serialized>(&this->_state);
    if (serialized == nullptr)
    {
        this->_outOfSequence("serialized");
    }

    return string_view(serialized->buffer.data(), serialized->length);
};

const Digest& EventBuilder::digest() const
{
    const auto* hashed = get_if<state::Hashed>(&this->_state);
    if (hashed == nullptr)
    {
        this->_outOfSequence("digest");
    }

    return hashed->digest;
};

#pragma endregion

#pragma region Private Methods

void EventBuilder::_outOfSequence(const char* operation) const
{
    ostringstream oss;
    oss << "EventBuilder::" << operation << ": Not allowed in the "
        << toString(this->state()) << " state.";
    PLOG_ERROR << oss.str();
    throw SequenceError(oss.str());
};

void EventBuilder::_checkKindShape() const
{
    switch (this->_kind)
    {
    case kinds::AUTH:
        if (!hasValue(this->_tags.findFirst("challenge")) || !hasValue(this->_tags.findFirst("relay")))
        {
            throw invalid_argument(
                "EventBuilder::serialize: An auth event requires challenge and relay tags.");
        }
        break;

    case kinds::DIRECT_MESSAGE:
        if (!hasValue(this->_tags.findFirst("p")))
        {
            throw invalid_argument("EventBuilder::serialize: A direct message requires a p tag.");
        }
        if (string_view(this->_content.data(), this->_content.size()).find("?iv=") == string_view::npos)
        {
            throw invalid_argument(
                "EventBuilder::serialize: Direct message content must be NIP-04 ciphertext.");
        }
        break;

    default:
        break;
    }
};

#pragma endregion
