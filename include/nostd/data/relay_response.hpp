#pragma once

#include <cstdint>
#include <string_view>

#include <etl/string.h>

#include "nostd/config.hpp"
#include "nostd/data/data.hpp"

namespace nostd
{
namespace data
{
/**
 * @brief The kinds of message a relay sends to a client, as defined by NIP-01 and NIP-42.
 */
enum class RelayMessageType
{
    Auth,
    Closed,
    Count,
    Eose,
    Event,
    Notice,
    Ok
};

const char* toString(RelayMessageType type);

/**
 * @brief Reads the label of a relay message.
 * @throws `std::invalid_argument` if the message is not a JSON array starting with a known label.
 * @remark `EVENT` messages are classified but not parsed; their payload is untrusted event JSON.
 */
RelayMessageType classifyRelayMessage(std::string_view message);

using SubscriptionId = etl::string<config::MAX_SUBSCRIPTION_ID_LENGTH>;
using RelayText = etl::string<config::MAX_RELAY_MESSAGE_LENGTH>;

/**
 * @brief A NIP-42 `["AUTH", <challenge>]` message.
 * @remark The challenge is answered by building an auth event with `builder::authChallenge`.
 */
struct AuthMessage
{
    etl::string<config::MAX_CHALLENGE_LENGTH> challenge;

    /**
     * @throws `std::invalid_argument` if the message is malformed or is not an `AUTH` message.
     * @throws `CapacityError` if the challenge is longer than `config::MAX_CHALLENGE_LENGTH`.
     */
    static AuthMessage fromString(std::string_view message);
};

/**
 * @brief A `["CLOSED", <subscription id>, <message>]` message.
 */
struct ClosedMessage
{
    SubscriptionId subscriptionId;
    RelayText message;

    static ClosedMessage fromString(std::string_view message);
};

/**
 * @brief A NIP-45 `["COUNT", <subscription id>, {"count": <n>}]` message.
 */
struct CountMessage
{
    SubscriptionId subscriptionId;
    uint64_t count;

    static CountMessage fromString(std::string_view message);
};

/**
 * @brief An `["EOSE", <subscription id>]` message, sent once stored events have been delivered.
 */
struct EoseMessage
{
    SubscriptionId subscriptionId;

    static EoseMessage fromString(std::string_view message);
};

/**
 * @brief A `["NOTICE", <message>]` message.
 */
struct NoticeMessage
{
    RelayText message;

    static NoticeMessage fromString(std::string_view message);
};

/**
 * @brief An `["OK", <event id>, <accepted>, <message>]` message answering a published event.
 * @remark Relays that omit the trailing message are accepted; `info` is then empty.
 */
struct OkMessage
{
    EventId eventId;
    bool accepted;
    RelayText info;

    /**
     * @throws `std::invalid_argument` if the message is malformed, is not an `OK` message, or the
     * event id is not 64 hex digits.
     * @throws `CapacityError` if the info text is longer than `config::MAX_RELAY_MESSAGE_LENGTH`.
     */
    static OkMessage fromString(std::string_view message);
};
} // namespace data
} // namespace nostd
