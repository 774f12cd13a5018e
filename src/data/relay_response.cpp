#include <sstream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include "nostd/data/hex.hpp"
#include "nostd/data/relay_response.hpp"
#include "nostd/errors.hpp"

using namespace nlohmann;
using namespace nostd;
using namespace nostd::data;
using namespace std;

namespace
{
#pragma region Helpers

struct Label
{
    const char* name;
    RelayMessageType type;
};

constexpr Label LABELS[] = {
    { "AUTH", RelayMessageType::Auth },
    { "CLOSED", RelayMessageType::Closed },
    { "COUNT", RelayMessageType::Count },
    { "EOSE", RelayMessageType::Eose },
    { "EVENT", RelayMessageType::Event },
    { "NOTICE", RelayMessageType::Notice },
    { "OK", RelayMessageType::Ok },
};

[[noreturn]] void malformed(const char* context, const string& reason)
{
    ostringstream oss;
    oss << context << ": " << reason;
    PLOG_ERROR << oss.str();
    throw invalid_argument(oss.str());
}

json parseFrame(string_view message, const char* context)
{
    json frame;
    try
    {
        frame = json::parse(message.begin(), message.end());
    }
    catch (const json::exception& je)
    {
        PLOG_ERROR << "JSON handling exception: " << je.what();
        malformed(context, "The message is not valid JSON.");
    }

    if (!frame.is_array() || frame.empty() || !frame[0].is_string())
    {
        malformed(context, "The message is not a labelled JSON array.");
    }

    return frame;
}

RelayMessageType labelOf(const json& frame, const char* context)
{
    const string& name = frame[0].get_ref<const string&>();
    for (const Label& label : LABELS)
    {
        if (name == label.name)
        {
            return label.type;
        }
    }

    malformed(context, "Unknown relay message label \"" + name + "\".");
}

/**
 * @brief Parses a frame and checks its label and minimum length.
 */
json expectFrame(string_view message, RelayMessageType type, size_t minElements, const char* context)
{
    json frame = parseFrame(message, context);
    if (labelOf(frame, context) != type)
    {
        malformed(context, string("Expected a ") + toString(type) + " message.");
    }
    if (frame.size() < minElements)
    {
        malformed(context, string("A ") + toString(type) + " message needs at least "
            + to_string(minElements) + " elements.");
    }

    return frame;
}

template <size_t N>
etl::string<N> boundedString(const json& value, const char* field, const char* context)
{
    if (!value.is_string())
    {
        malformed(context, string("The ") + field + " must be a string.");
    }

    const string& text = value.get_ref<const string&>();
    if (text.size() > N)
    {
        ostringstream oss;
        oss << context << ": The " << field << " is " << text.size()
            << " bytes, exceeding the maximum of " << N << ".";
        PLOG_ERROR << oss.str();
        throw CapacityError(oss.str());
    }

    return etl::string<N>(text.data(), text.size());
}

#pragma endregion
} // namespace

namespace nostd
{
namespace data
{
const char* toString(RelayMessageType type)
{
    for (const Label& label : LABELS)
    {
        if (label.type == type)
        {
            return label.name;
        }
    }

    return "UNKNOWN";
};

RelayMessageType classifyRelayMessage(string_view message)
{
    json frame = parseFrame(message, "classifyRelayMessage");

    return labelOf(frame, "classifyRelayMessage");
};

AuthMessage AuthMessage::fromString(string_view message)
{
    json frame = expectFrame(message, RelayMessageType::Auth, 2, "AuthMessage::fromString");

    AuthMessage auth;
    auth.challenge = boundedString<config::MAX_CHALLENGE_LENGTH>(
        frame[1], "challenge", "AuthMessage::fromString");

    return auth;
};

ClosedMessage ClosedMessage::fromString(string_view message)
{
    json frame = expectFrame(message, RelayMessageType::Closed, 3, "ClosedMessage::fromString");

    ClosedMessage closed;
    closed.subscriptionId = boundedString<config::MAX_SUBSCRIPTION_ID_LENGTH>(
        frame[1], "subscription id", "ClosedMessage::fromString");
    closed.message = boundedString<config::MAX_RELAY_MESSAGE_LENGTH>(
        frame[2], "message", "ClosedMessage::fromString");

    return closed;
};

CountMessage CountMessage::fromString(string_view message)
{
    json frame = expectFrame(message, RelayMessageType::Count, 3, "CountMessage::fromString");

    CountMessage count;
    count.subscriptionId = boundedString<config::MAX_SUBSCRIPTION_ID_LENGTH>(
        frame[1], "subscription id", "CountMessage::fromString");

    const json& result = frame[2];
    if (!result.is_object() || !result.contains("count") || !result["count"].is_number_unsigned())
    {
        malformed("CountMessage::fromString", "The count must be a non-negative integer.");
    }
    count.count = result["count"].get<uint64_t>();

    return count;
};

EoseMessage EoseMessage::fromString(string_view message)
{
    json frame = expectFrame(message, RelayMessageType::Eose, 2, "EoseMessage::fromString");

    EoseMessage eose;
    eose.subscriptionId = boundedString<config::MAX_SUBSCRIPTION_ID_LENGTH>(
        frame[1], "subscription id", "EoseMessage::fromString");

    return eose;
};

NoticeMessage NoticeMessage::fromString(string_view message)
{
    json frame = expectFrame(message, RelayMessageType::Notice, 2, "NoticeMessage::fromString");

    NoticeMessage notice;
    notice.message = boundedString<config::MAX_RELAY_MESSAGE_LENGTH>(
        frame[1], "message", "NoticeMessage::fromString");

    return notice;
};

OkMessage OkMessage::fromString(string_view message)
{
    json frame = expectFrame(message, RelayMessageType::Ok, 3, "OkMessage::fromString");

    if (!frame[1].is_string())
    {
        malformed("OkMessage::fromString", "The event id must be a string.");
    }
    if (!frame[2].is_boolean())
    {
        malformed("OkMessage::fromString", "The acceptance flag must be a boolean.");
    }

    OkMessage ok;
    ok.eventId = fromHex<32>(frame[1].get_ref<const string&>());
    ok.accepted = frame[2].get<bool>();
    if (frame.size() > 3)
    {
        ok.info = boundedString<config::MAX_RELAY_MESSAGE_LENGTH>(
            frame[3], "message", "OkMessage::fromString");
    }

    return ok;
};
} // namespace data
} // namespace nostd
