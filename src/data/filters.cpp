#include <sstream>
#include <stdexcept>
#include <string>

#include <plog/Log.h>

#include "nostd/data/data.hpp"
#include "nostd/data/hex.hpp"
#include "nostd/errors.hpp"

using namespace nlohmann;
using namespace nostd;
using namespace nostd::data;
using namespace std;

namespace
{
template <typename T>
void pushBounded(Filters::List<T>& list, const T& value, const char* field)
{
    if (list.full())
    {
        ostringstream oss;
        oss << "Filters: The " << field << " list may hold at most " << config::MAX_FILTER_VALUES
            << " values.";
        PLOG_ERROR << oss.str();
        throw CapacityError(oss.str());
    }

    list.push_back(value);
}

template <typename T>
json hexList(const Filters::List<T>& list)
{
    json values = json::array();
    for (const auto& value : list)
    {
        values.push_back(string(toHex(value).c_str()));
    }

    return values;
}
} // namespace

void Filters::addId(const EventId& id)
{
    pushBounded(this->_ids, id, "ids");
};

void Filters::addAuthor(const PublicKey& author)
{
    pushBounded(this->_authors, author, "authors");
};

void Filters::addKind(Kind kind)
{
    pushBounded(this->_kinds, kind, "kinds");
};

void Filters::addReferencedEvent(const EventId& id)
{
    pushBounded(this->_referencedEvents, id, "#e");
};

void Filters::addReferencedPubkey(const PublicKey& pubkey)
{
    pushBounded(this->_referencedPubkeys, pubkey, "#p");
};

void Filters::forDirectMessagesTo(const PublicKey& recipient)
{
    this->addReferencedPubkey(recipient);
    this->addKind(kinds::DIRECT_MESSAGE);
};

void Filters::validate() const
{
    bool hasIds = !this->_ids.empty();
    bool hasAuthors = !this->_authors.empty();
    bool hasKinds = !this->_kinds.empty();
    bool hasReferences = !this->_referencedEvents.empty() || !this->_referencedPubkeys.empty();

    bool hasFilter = hasIds || hasAuthors || hasKinds || hasReferences;
    if (!hasFilter)
    {
        throw invalid_argument("Filters::validate: At least one filter must be set.");
    }

    if (this->since.has_value() && this->until.has_value() && *this->since > *this->until)
    {
        throw invalid_argument("Filters::validate: The since timestamp must not be later than until.");
    }
};

void adl_serializer<Filters>::to_json(json& j, const Filters& filters)
{
    j = json::object();

    if (!filters.ids().empty())
    {
        j["ids"] = hexList(filters.ids());
    }
    if (!filters.authors().empty())
    {
        j["authors"] = hexList(filters.authors());
    }
    if (!filters.kinds().empty())
    {
        json kindValues = json::array();
        for (Kind kind : filters.kinds())
        {
            kindValues.push_back(kind);
        }
        j["kinds"] = kindValues;
    }
    if (!filters.referencedEvents().empty())
    {
        j["#e"] = hexList(filters.referencedEvents());
    }
    if (!filters.referencedPubkeys().empty())
    {
        j["#p"] = hexList(filters.referencedPubkeys());
    }
    if (filters.since.has_value())
    {
        j["since"] = *filters.since;
    }
    if (filters.until.has_value())
    {
        j["until"] = *filters.until;
    }
    if (filters.limit.has_value())
    {
        j["limit"] = *filters.limit;
    }
}
