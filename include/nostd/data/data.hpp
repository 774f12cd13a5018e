#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>

#include <etl/string.h>
#include <etl/vector.h>
#include <nlohmann/json.hpp>

#include "nostd/config.hpp"

namespace nostd
{
namespace signer
{
class ISigner;
} // namespace signer

namespace data
{
using PrivateKey = std::array<uint8_t, 32>; ///< Raw secp256k1 secret scalar.
using PublicKey = std::array<uint8_t, 32>; ///< BIP-340 x-only public key.
using Digest = std::array<uint8_t, 32>; ///< SHA-256 digest.
using EventId = Digest; ///< The SHA-256 digest of an event's canonical serialization.
using Signature = std::array<uint8_t, 64>; ///< BIP-340 Schnorr signature.
using Kind = uint16_t;

namespace kinds
{
constexpr Kind SHORT_NOTE = 1;
constexpr Kind DIRECT_MESSAGE = 4; // NIP-04
constexpr Kind IOT = 5732;
constexpr Kind AUTH = 22242; // NIP-42
} // namespace kinds

/**
 * @brief The semantic class of an event kind, as defined by NIP-01.
 */
enum class KindClass
{
    ShortNote,
    DirectMessage,
    Iot,
    Auth,
    Regular, ///< 1000 <= kind < 10000
    Replaceable, ///< 10000 <= kind < 20000
    Ephemeral, ///< 20000 <= kind < 30000
    ParameterizedReplaceable, ///< 30000 <= kind < 40000
    Custom
};

KindClass classifyKind(Kind kind);

using TagElement = etl::string<config::MAX_TAG_ELEMENT_LENGTH>;

/**
 * @brief A single tag.  The first element is the tag name, the remaining elements are values.
 */
using Tag = etl::vector<TagElement, config::MAX_TAG_ELEMENTS>;

using Content = etl::string<config::MAX_CONTENT_LENGTH>;

/**
 * @brief Copies a string into a bounded content buffer.
 * @throws `CapacityError` if the string is longer than `config::MAX_CONTENT_LENGTH`.
 */
Content makeContent(std::string_view content);

/**
 * @brief A bounded, ordered collection of event tags.
 * @remark Tag order is part of an event's canonical serialization, so tags are always iterated in
 * insertion order.  A failed `add` leaves the store unchanged.
 */
class TagStore
{
public:
    using const_iterator = etl::vector<Tag, config::MAX_TAGS>::const_iterator;

    /**
     * @brief Appends a tag.
     * @param tag The tag name followed by its values.
     * @throws `CapacityError` if the store is full, the tag is empty or has too many elements, or
     * any element is too long.
     */
    void add(std::initializer_list<std::string_view> tag);

    /**
     * @brief Appends a tag given as an array of elements.
     * @throws `CapacityError` under the same conditions as the initializer-list overload.
     */
    void add(const std::string_view* elements, std::size_t count);

    std::size_t size() const { return this->_tags.size(); }
    bool empty() const { return this->_tags.empty(); }
    bool full() const { return this->_tags.full(); }

    const Tag& operator[](std::size_t index) const { return this->_tags[index]; }
    const_iterator begin() const { return this->_tags.begin(); }
    const_iterator end() const { return this->_tags.end(); }

    /**
     * @brief Finds the first tag with the given name.
     * @returns A pointer to the tag, or `nullptr` if no tag has that name.
     */
    const Tag* findFirst(std::string_view name) const;

    /**
     * @brief Finds every tag with the given name, in insertion order.
     */
    etl::vector<const Tag*, config::MAX_TAGS> findAll(std::string_view name) const;

    bool operator==(const TagStore& other) const;
    bool operator!=(const TagStore& other) const { return !(*this == other); }

private:
    etl::vector<Tag, config::MAX_TAGS> _tags;
};

/**
 * @brief A Nostr event.
 * @remark All fields are fixed at construction; there are no setters.  An event produced by
 * `builder::EventBuilder` therefore always carries an id and signature computed from the fields
 * it holds.  Events assembled from received fields are not trusted: `verify` recomputes the id
 * before checking the signature.
 */
class Event
{
public:
    /**
     * @brief Creates an unsigned event.  `id` and `sig` are absent.
     */
    Event(PublicKey pubkey, uint64_t createdAt, Kind kind, TagStore tags, Content content);

    /**
     * @brief Creates an event from fields decoded by a transport collaborator.
     */
    Event(
        PublicKey pubkey,
        uint64_t createdAt,
        Kind kind,
        TagStore tags,
        Content content,
        EventId id,
        Signature sig);

    const PublicKey& pubkey() const { return this->_pubkey; }
    uint64_t createdAt() const { return this->_createdAt; }
    Kind kind() const { return this->_kind; }
    const TagStore& tags() const { return this->_tags; }
    const Content& content() const { return this->_content; }
    const std::optional<EventId>& id() const { return this->_id; }
    const std::optional<Signature>& sig() const { return this->_sig; }

    bool isSigned() const { return this->_id.has_value() && this->_sig.has_value(); }

    /**
     * @brief Computes the SHA-256 digest of the event's canonical serialization.
     */
    Digest computeDigest() const;

    /**
     * @brief Checks that the stored id matches the event data and that the signature is valid
     * for that id and the event's public key.
     * @returns False if the event is unsigned, the id is stale, or the signature is invalid.
     */
    bool verify(const signer::ISigner& signer) const;

    /**
     * @brief Compares two events for equality.
     * @remark Two events are considered equal if they have the same ID, since the ID is uniquely
     * generated from the event data.  If the `id` field is absent for either event, the comparison
     * function will throw an exception.
     */
    bool operator==(const Event& other) const;

private:
    PublicKey _pubkey;
    uint64_t _createdAt;
    Kind _kind;
    TagStore _tags;
    Content _content;
    std::optional<EventId> _id;
    std::optional<Signature> _sig;
};

/**
 * @brief A bounded set of filters for querying Nostr relays.
 * @remark At least one of the id, author, kind, or reference lists must be set for the filters to
 * be valid.  `since`, `until`, and `limit` are optional.
 */
class Filters
{
public:
    template <typename T>
    using List = etl::vector<T, config::MAX_FILTER_VALUES>;

    /**
     * @throws `CapacityError` if the list already holds `config::MAX_FILTER_VALUES` values.
     */
    void addId(const EventId& id);
    void addAuthor(const PublicKey& author);
    void addKind(Kind kind);
    void addReferencedEvent(const EventId& id); ///< Matched against `e` tags.
    void addReferencedPubkey(const PublicKey& pubkey); ///< Matched against `p` tags.

    /**
     * @brief Configures the filters to match NIP-04 direct messages addressed to `recipient`.
     */
    void forDirectMessagesTo(const PublicKey& recipient);

    std::optional<uint64_t> since; ///< Unix timestamp.  Matching events must be newer than this.
    std::optional<uint64_t> until; ///< Unix timestamp.  Matching events must be older than this.
    std::optional<uint32_t> limit; ///< The maximum number of events the relay should return.

    const List<EventId>& ids() const { return this->_ids; }
    const List<PublicKey>& authors() const { return this->_authors; }
    const List<Kind>& kinds() const { return this->_kinds; }
    const List<EventId>& referencedEvents() const { return this->_referencedEvents; }
    const List<PublicKey>& referencedPubkeys() const { return this->_referencedPubkeys; }

    /**
     * @brief Validates the filters.
     * @throws `std::invalid_argument` if no id, author, kind, or reference is set, or if `since`
     * is later than `until`.
     */
    void validate() const;

private:
    List<EventId> _ids;
    List<PublicKey> _authors;
    List<Kind> _kinds;
    List<EventId> _referencedEvents;
    List<PublicKey> _referencedPubkeys;
};
} // namespace data
} // namespace nostd

namespace nlohmann
{
/**
 * @brief JSON conversions for hosts that can afford nlohmann's allocating representation.
 * @remark The fixed-buffer emitters in `nostd/data/serializer.hpp` produce the same bytes as
 * `json(event).dump()`.
 */
template <>
struct adl_serializer<nostd::data::Event>
{
    static void to_json(json& j, const nostd::data::Event& event);
};

template <>
struct adl_serializer<nostd::data::TagStore>
{
    static void to_json(json& j, const nostd::data::TagStore& tags);
};

template <>
struct adl_serializer<nostd::data::Filters>
{
    static void to_json(json& j, const nostd::data::Filters& filters);
};
} // namespace nlohmann
