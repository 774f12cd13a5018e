#include <sstream>
#include <stdexcept>

#include <plog/Log.h>

#include "internal/bounded_writer.hpp"
#include "nostd/data/serializer.hpp"
#include "nostd/errors.hpp"

using namespace nostd;
using namespace nostd::data;
using namespace nostd::internal;
using namespace std;

namespace
{
#pragma region Helpers

void writeTags(BoundedWriter& writer, const TagStore& tags)
{
    writer.put('[');
    for (size_t i = 0; i < tags.size(); i++)
    {
        if (i > 0)
        {
            writer.put(',');
        }

        const Tag& tag = tags[i];
        writer.put('[');
        for (size_t j = 0; j < tag.size(); j++)
        {
            if (j > 0)
            {
                writer.put(',');
            }
            writer.writeQuoted(string_view(tag[j].data(), tag[j].size()));
        }
        writer.put(']');
    }
    writer.put(']');
}

void requireSigned(const Event& event, const char* context)
{
    if (!event.isSigned())
    {
        ostringstream oss;
        oss << context << ": The event has not been signed.";
        PLOG_ERROR << oss.str();
        throw SequenceError(oss.str());
    }
}

void writeEventObject(BoundedWriter& writer, const Event& event)
{
    // Keys are emitted in lexicographic order to match nlohmann's object ordering.
    writer.write("{\"content\":");
    writer.writeQuoted(string_view(event.content().data(), event.content().size()));
    writer.write(",\"created_at\":");
    writer.writeDecimal(event.createdAt());
    writer.write(",\"id\":");
    writer.writeQuotedHex(event.id()->data(), event.id()->size());
    writer.write(",\"kind\":");
    writer.writeDecimal(event.kind());
    writer.write(",\"pubkey\":");
    writer.writeQuotedHex(event.pubkey().data(), event.pubkey().size());
    writer.write(",\"sig\":");
    writer.writeQuotedHex(event.sig()->data(), event.sig()->size());
    writer.write(",\"tags\":");
    writeTags(writer, event.tags());
    writer.put('}');
}

template <typename T>
void writeHexList(BoundedWriter& writer, const char* key, const Filters::List<T>& values, bool& first)
{
    if (values.empty())
    {
        return;
    }

    if (!first)
    {
        writer.put(',');
    }
    first = false;

    writer.writeQuoted(key);
    writer.write(":[");
    for (size_t i = 0; i < values.size(); i++)
    {
        if (i > 0)
        {
            writer.put(',');
        }
        writer.writeQuotedHex(values[i].data(), values[i].size());
    }
    writer.put(']');
}

void writeNumber(BoundedWriter& writer, const char* key, uint64_t value, bool& first)
{
    if (!first)
    {
        writer.put(',');
    }
    first = false;

    writer.writeQuoted(key);
    writer.put(':');
    writer.writeDecimal(value);
}

void writeFilters(BoundedWriter& writer, const Filters& filters)
{
    bool first = true;

    writer.put('{');
    writeHexList(writer, "#e", filters.referencedEvents(), first);
    writeHexList(writer, "#p", filters.referencedPubkeys(), first);
    writeHexList(writer, "authors", filters.authors(), first);
    writeHexList(writer, "ids", filters.ids(), first);

    if (!filters.kinds().empty())
    {
        if (!first)
        {
            writer.put(',');
        }
        first = false;

        writer.write("\"kinds\":[");
        for (size_t i = 0; i < filters.kinds().size(); i++)
        {
            if (i > 0)
            {
                writer.put(',');
            }
            writer.writeDecimal(filters.kinds()[i]);
        }
        writer.put(']');
    }

    if (filters.limit.has_value())
    {
        writeNumber(writer, "limit", *filters.limit, first);
    }
    if (filters.since.has_value())
    {
        writeNumber(writer, "since", *filters.since, first);
    }
    if (filters.until.has_value())
    {
        writeNumber(writer, "until", *filters.until, first);
    }
    writer.put('}');
}

void validateSubscriptionId(string_view subscriptionId, const char* context)
{
    if (subscriptionId.empty() || subscriptionId.size() > config::MAX_SUBSCRIPTION_ID_LENGTH)
    {
        ostringstream oss;
        oss << context << ": The subscription id must be between 1 and "
            << config::MAX_SUBSCRIPTION_ID_LENGTH << " characters long.";
        PLOG_ERROR << oss.str();
        throw invalid_argument(oss.str());
    }
}

#pragma endregion
} // namespace

namespace nostd
{
namespace data
{
size_t serializeCanonical(
    const PublicKey& pubkey,
    uint64_t createdAt,
    Kind kind,
    const TagStore& tags,
    string_view content,
    char* buffer,
    size_t capacity)
{
    BoundedWriter writer(buffer, capacity, "serializeCanonical");

    writer.write("[0,");
    writer.writeQuotedHex(pubkey.data(), pubkey.size());
    writer.put(',');
    writer.writeDecimal(createdAt);
    writer.put(',');
    writer.writeDecimal(kind);
    writer.put(',');
    writeTags(writer, tags);
    writer.put(',');
    writer.writeQuoted(content);
    writer.put(']');

    return writer.size();
};

size_t serializeCanonical(const Event& event, char* buffer, size_t capacity)
{
    return serializeCanonical(
        event.pubkey(),
        event.createdAt(),
        event.kind(),
        event.tags(),
        string_view(event.content().data(), event.content().size()),
        buffer,
        capacity);
};

size_t serializeEvent(const Event& event, char* buffer, size_t capacity)
{
    requireSigned(event, "serializeEvent");

    BoundedWriter writer(buffer, capacity, "serializeEvent");
    writeEventObject(writer, event);

    return writer.size();
};

size_t serializeClientMessage(ClientMessage type, const Event& event, char* buffer, size_t capacity)
{
    requireSigned(event, "serializeClientMessage");

    BoundedWriter writer(buffer, capacity, "serializeClientMessage");
    switch (type)
    {
    case ClientMessage::Event:
        writer.write("[\"EVENT\",");
        break;
    case ClientMessage::Auth:
        writer.write("[\"AUTH\",");
        break;
    }
    writeEventObject(writer, event);
    writer.put(']');

    return writer.size();
};

size_t serializeRequest(string_view subscriptionId, const Filters& filters, char* buffer, size_t capacity)
{
    validateSubscriptionId(subscriptionId, "serializeRequest");
    filters.validate();

    BoundedWriter writer(buffer, capacity, "serializeRequest");
    writer.write("[\"REQ\",");
    writer.writeQuoted(subscriptionId);
    writer.put(',');
    writeFilters(writer, filters);
    writer.put(']');

    return writer.size();
};

size_t serializeClose(string_view subscriptionId, char* buffer, size_t capacity)
{
    validateSubscriptionId(subscriptionId, "serializeClose");

    BoundedWriter writer(buffer, capacity, "serializeClose");
    writer.write("[\"CLOSE\",");
    writer.writeQuoted(subscriptionId);
    writer.put(']');

    return writer.size();
};
} // namespace data
} // namespace nostd
