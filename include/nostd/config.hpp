#pragma once

#include <cstddef>

/*
 * Compile-time capacity limits.  Every buffer in the library is sized from these values, so they
 * may be tuned per deployment by defining the macros before including any library header (the
 * CMake build passes the `NOSTD_*` cache variables as compile definitions).
 */

#ifndef NOSTD_MAX_TAGS
#define NOSTD_MAX_TAGS 5
#endif

#ifndef NOSTD_MAX_TAG_ELEMENTS
#define NOSTD_MAX_TAG_ELEMENTS 4
#endif

#ifndef NOSTD_MAX_TAG_ELEMENT_LENGTH
#define NOSTD_MAX_TAG_ELEMENT_LENGTH 100
#endif

#ifndef NOSTD_MAX_CONTENT_LENGTH
#define NOSTD_MAX_CONTENT_LENGTH 400
#endif

#ifndef NOSTD_MAX_DM_PLAINTEXT_LENGTH
#define NOSTD_MAX_DM_PLAINTEXT_LENGTH 256
#endif

#ifndef NOSTD_MAX_FILTER_VALUES
#define NOSTD_MAX_FILTER_VALUES 5
#endif

#ifndef NOSTD_MAX_CHALLENGE_LENGTH
#define NOSTD_MAX_CHALLENGE_LENGTH 64
#endif

#ifndef NOSTD_MAX_RELAY_MESSAGE_LENGTH
#define NOSTD_MAX_RELAY_MESSAGE_LENGTH 180
#endif

namespace nostd
{
namespace config
{
///< The maximum number of tags an event may carry.
constexpr std::size_t MAX_TAGS = NOSTD_MAX_TAGS;

///< The maximum number of strings in a single tag, including the tag name.
constexpr std::size_t MAX_TAG_ELEMENTS = NOSTD_MAX_TAG_ELEMENTS;

///< The maximum length, in bytes, of a single tag string.
constexpr std::size_t MAX_TAG_ELEMENT_LENGTH = NOSTD_MAX_TAG_ELEMENT_LENGTH;

///< The maximum length, in bytes, of event content.
constexpr std::size_t MAX_CONTENT_LENGTH = NOSTD_MAX_CONTENT_LENGTH;

///< The maximum length, in bytes, of a NIP-04 plaintext before padding.
constexpr std::size_t MAX_DM_PLAINTEXT_LENGTH = NOSTD_MAX_DM_PLAINTEXT_LENGTH;

///< The maximum number of values in each list of a subscription filter.
constexpr std::size_t MAX_FILTER_VALUES = NOSTD_MAX_FILTER_VALUES;

/**
 * @brief The length of the longest canonical serialization an in-bounds event can produce.
 * @remark Every tag string and the content may escape each byte to two characters.  The fixed
 * part covers `[0,`, the quoted hex pubkey, a 20 digit timestamp, a 5 digit kind, and the
 * separators between them.
 */
constexpr std::size_t MAX_CANONICAL_EVENT_LENGTH =
    2 + MAX_TAGS * (MAX_TAG_ELEMENTS * (2 * MAX_TAG_ELEMENT_LENGTH + 3) + 2)
    + 2 * MAX_CONTENT_LENGTH + 2
    + 128;

///< The size of the buffer an event builder serializes into.
#ifdef NOSTD_SERIALIZATION_BUFFER_SIZE
constexpr std::size_t SERIALIZATION_BUFFER_SIZE = NOSTD_SERIALIZATION_BUFFER_SIZE;
#else
constexpr std::size_t SERIALIZATION_BUFFER_SIZE = MAX_CANONICAL_EVENT_LENGTH;
#endif

///< The longest NIP-42 challenge accepted from a relay.
constexpr std::size_t MAX_CHALLENGE_LENGTH = NOSTD_MAX_CHALLENGE_LENGTH;

///< The longest human-readable text accepted in a relay `OK`, `NOTICE`, or `CLOSED` message.
constexpr std::size_t MAX_RELAY_MESSAGE_LENGTH = NOSTD_MAX_RELAY_MESSAGE_LENGTH;

///< The longest subscription id sent in, or accepted from, a relay message.
constexpr std::size_t MAX_SUBSCRIPTION_ID_LENGTH = 64;

///< The AES block size used by NIP-04.
constexpr std::size_t AES_BLOCK_SIZE = 16;

/**
 * @brief Computes the length of a padded base64 encoding.
 * @param n The number of bytes to encode.
 */
constexpr std::size_t base64Length(std::size_t n)
{
    return ((n + 2) / 3) * 4;
}

///< The largest PKCS#7 padded ciphertext a NIP-04 plaintext may produce.
constexpr std::size_t MAX_DM_CIPHERTEXT_LENGTH =
    (MAX_DM_PLAINTEXT_LENGTH / AES_BLOCK_SIZE + 1) * AES_BLOCK_SIZE;

///< The length of the NIP-04 wire string for the largest allowed plaintext.
constexpr std::size_t MAX_DM_WIRE_LENGTH =
    base64Length(MAX_DM_CIPHERTEXT_LENGTH) + 4 + base64Length(AES_BLOCK_SIZE);

static_assert(MAX_TAGS > 0, "At least one tag must be allowed.");
static_assert(MAX_TAG_ELEMENTS >= 2, "A tag needs room for a name and a value.");
static_assert(MAX_TAG_ELEMENT_LENGTH >= 64, "A tag value must be able to hold a hex key.");
static_assert(
    MAX_CHALLENGE_LENGTH <= MAX_TAG_ELEMENT_LENGTH,
    "A relay challenge must fit in the challenge tag of an auth event.");
static_assert(
    MAX_DM_WIRE_LENGTH <= MAX_CONTENT_LENGTH,
    "The largest NIP-04 message must fit in event content.");
static_assert(
    SERIALIZATION_BUFFER_SIZE >= MAX_CANONICAL_EVENT_LENGTH,
    "The serialization buffer cannot hold the largest event the tag and content bounds allow.");
} // namespace config
} // namespace nostd
