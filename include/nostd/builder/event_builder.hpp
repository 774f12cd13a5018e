#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <memory>
#include <string_view>
#include <variant>

#include "nostd/config.hpp"
#include "nostd/data/data.hpp"
#include "nostd/signer/signer.hpp"

namespace nostd
{
namespace builder
{
/**
 * @brief The stages an event passes through on its way to being signed.
 */
enum class BuildState
{
    Empty,
    TagsSet,
    ContentSet,
    Serialized,
    Hashed,
    Signed,
    Consumed ///< `build` has moved the signed event out.
};

const char* toString(BuildState state);

namespace state
{
struct Empty {};
struct TagsSet {};
struct ContentSet {};

struct Serialized
{
    std::array<char, config::SERIALIZATION_BUFFER_SIZE> buffer;
    std::size_t length;
};

struct Hashed
{
    data::Digest digest;
};

struct Signed
{
    data::Event event;
};

struct Consumed {};
} // namespace state

/**
 * @brief Builds a single signed event.
 * @remark The builder is a state machine: `addTag` and `content` fill in the event, then
 * `serialize`, `hash`, and `sign` advance it one stage each, and `build` hands the finished event
 * to the caller.  Each stage carries only the data that is valid at that point, so a stale id or
 * signature cannot be observed.  A call made in the wrong state throws `SequenceError`; the
 * builder is single use and cannot be restarted once consumed.
 * @remark Each builder owns its buffers exclusively.  A builder must not be used from more than
 * one thread at a time, but separate builders are independent.
 */
class EventBuilder
{
public:
    /**
     * @param signer The signature engine used to derive the public key and sign.
     * @param privateKey The author's private key.  The builder keeps a copy and wipes it on
     * destruction.
     * @param kind The event kind.
     * @param createdAt Unix timestamp of the event creation.
     * @remark No cryptographic work happens here; an invalid key is reported by `serialize`.
     */
    EventBuilder(
        std::shared_ptr<signer::ISigner> signer,
        const data::PrivateKey& privateKey,
        data::Kind kind,
        uint64_t createdAt);

    ~EventBuilder();

    /**
     * @remark The moved-from builder is left in the `Consumed` state.
     */
    EventBuilder(EventBuilder&& other);
    EventBuilder& operator=(EventBuilder&& other) = delete;
    EventBuilder(const EventBuilder&) = delete;
    EventBuilder& operator=(const EventBuilder&) = delete;

    /**
     * @brief Appends a tag.  Valid in the `Empty` and `TagsSet` states.
     * @throws `SequenceError` if called in any other state.
     * @throws `CapacityError` if the tag does not fit; the builder is left unchanged.
     */
    EventBuilder& addTag(std::initializer_list<std::string_view> tag);

    /**
     * @brief Sets the event content.  Valid in the `Empty` and `TagsSet` states.
     * @throws `SequenceError` if called in any other state.
     * @throws `CapacityError` if the content is longer than `config::MAX_CONTENT_LENGTH`.
     */
    EventBuilder& content(std::string_view content);

    /**
     * @brief Derives the author's public key and writes the canonical serialization into the
     * builder's buffer.  Valid in the `ContentSet` state.
     * @throws `SequenceError` if called in any other state.
     * @throws `KeyError` if the private key is invalid.
     * @throws `std::invalid_argument` if the tags or content do not have the shape the kind
     * requires.
     */
    EventBuilder& serialize();

    /**
     * @brief Hashes the serialized bytes into the event id.  Valid in the `Serialized` state.
     * @throws `SequenceError` if called in any other state.
     */
    EventBuilder& hash();

    /**
     * @brief Signs the event id.  Valid in the `Hashed` state.
     * @throws `SequenceError` if called in any other state.
     * @throws `KeyError` if the private key is invalid.
     */
    EventBuilder& sign();

    /**
     * @brief Moves the signed event out of the builder, leaving it consumed.
     * @throws `SequenceError` if the event is not signed yet.
     */
    data::Event build() &&;

    /**
     * @brief Runs `serialize`, `hash`, `sign`, and `build` in order.
     */
    data::Event finish() &&;

    BuildState state() const;

    data::Kind kind() const { return this->_kind; }

    /**
     * @brief The canonical serialization.  Valid in the `Serialized` state.
     * @throws `SequenceError` if called in any other state.
     */
    std::string_view serialized() const;

    /**
     * @brief The event id.  Valid in the `Hashed` state.
     * @throws `SequenceError` if called in any other state.
     */
    const data::Digest& digest() const;

private:
    std::shared_ptr<signer::ISigner> _signer;
    data::PrivateKey _privateKey;
    data::Kind _kind;
    uint64_t _createdAt;
    data::PublicKey _pubkey;
    data::TagStore _tags;
    data::Content _content;

    std::variant<
        state::Empty,
        state::TagsSet,
        state::ContentSet,
        state::Serialized,
        state::Hashed,
        state::Signed,
        state::Consumed> _state;

    /**
     * @brief Throws a `SequenceError` naming the attempted operation and the current state.
     */
    [[noreturn]] void _outOfSequence(const char* operation) const;

    /**
     * @brief Enforces the tag and content rules of kinds with a fixed shape.
     * @throws `std::invalid_argument` if the event does not have the required shape.
     */
    void _checkKindShape() const;
};
} // namespace builder
} // namespace nostd
