#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "nostd/data/data.hpp"

namespace nostd
{
namespace data
{
/**
 * @brief The client-to-relay message types that carry a signed event.
 */
enum class ClientMessage
{
    Event, ///< `["EVENT",<event>]`, NIP-01.
    Auth ///< `["AUTH",<event>]`, NIP-42.
};

/**
 * @brief Writes the canonical serialization of event data, the preimage of the event id.
 * @param buffer The output buffer.  No terminator is written.
 * @param capacity The size of `buffer` in bytes.
 * @returns The number of bytes written.
 * @throws `BufferTooSmall` if the serialization does not fit in `capacity` bytes.
 * @remark The output is the NIP-01 array
 * `[0,"<pubkey>",<created_at>,<kind>,<tags>,"<content>"]` with no whitespace, lowercase hex for
 * the public key, and only the NIP-01 escapes applied to strings.  Peers rebuild these exact
 * bytes to check the id, so any deviation makes the event invalid.
 */
std::size_t serializeCanonical(
    const PublicKey& pubkey,
    uint64_t createdAt,
    Kind kind,
    const TagStore& tags,
    std::string_view content,
    char* buffer,
    std::size_t capacity);

/**
 * @brief Writes the canonical serialization of an event.
 * @see serializeCanonical
 */
std::size_t serializeCanonical(const Event& event, char* buffer, std::size_t capacity);

/**
 * @brief Writes a signed event as a JSON object with its keys in lexicographic order.
 * @returns The number of bytes written.
 * @throws `SequenceError` if the event has no id or signature.
 * @throws `BufferTooSmall` if the object does not fit in `capacity` bytes.
 */
std::size_t serializeEvent(const Event& event, char* buffer, std::size_t capacity);

/**
 * @brief Frames a signed event as a client message ready to send to a relay.
 * @throws `SequenceError` if the event has no id or signature.
 * @throws `BufferTooSmall` if the message does not fit in `capacity` bytes.
 */
std::size_t serializeClientMessage(
    ClientMessage type,
    const Event& event,
    char* buffer,
    std::size_t capacity);

/**
 * @brief Writes a `REQ` message opening a subscription.
 * @param subscriptionId A string of 1 to 64 characters that is unique per relay connection.
 * @throws `std::invalid_argument` if the subscription id or the filters are invalid.
 * @throws `BufferTooSmall` if the message does not fit in `capacity` bytes.
 */
std::size_t serializeRequest(
    std::string_view subscriptionId,
    const Filters& filters,
    char* buffer,
    std::size_t capacity);

/**
 * @brief Writes a `CLOSE` message ending a subscription.
 * @throws `std::invalid_argument` if the subscription id is invalid.
 * @throws `BufferTooSmall` if the message does not fit in `capacity` bytes.
 */
std::size_t serializeClose(std::string_view subscriptionId, char* buffer, std::size_t capacity);
} // namespace data
} // namespace nostd
