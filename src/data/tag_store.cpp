#include <sstream>

#include <plog/Log.h>

#include "nostd/data/data.hpp"
#include "nostd/errors.hpp"

using namespace std;
using namespace nostd;
using namespace nostd::data;

Content data::makeContent(string_view content)
{
    if (content.size() > config::MAX_CONTENT_LENGTH)
    {
        ostringstream oss;
        oss << "makeContent: The content is " << content.size() << " bytes, exceeding the maximum of "
            << config::MAX_CONTENT_LENGTH << ".";
        PLOG_ERROR << oss.str();
        throw CapacityError(oss.str());
    }

    return Content(content.data(), content.size());
};

void TagStore::add(initializer_list<string_view> tag)
{
    this->add(tag.begin(), tag.size());
};

void TagStore::add(const string_view* elements, size_t count)
{
    // Validate everything before touching the store so a rejected tag leaves no trace.
    if (this->_tags.full())
    {
        ostringstream oss;
        oss << "TagStore::add: An event may have at most " << config::MAX_TAGS << " tags.";
        PLOG_ERROR << oss.str();
        throw CapacityError(oss.str());
    }

    if (count == 0)
    {
        throw CapacityError("TagStore::add: A tag must have at least a name.");
    }

    if (count > config::MAX_TAG_ELEMENTS)
    {
        ostringstream oss;
        oss << "TagStore::add: A tag may have at most " << config::MAX_TAG_ELEMENTS << " elements.";
        PLOG_ERROR << oss.str();
        throw CapacityError(oss.str());
    }

    for (size_t i = 0; i < count; i++)
    {
        if (elements[i].size() > config::MAX_TAG_ELEMENT_LENGTH)
        {
            ostringstream oss;
            oss << "TagStore::add: Tag element " << i << " is " << elements[i].size()
                << " bytes, exceeding the maximum of " << config::MAX_TAG_ELEMENT_LENGTH << ".";
            PLOG_ERROR << oss.str();
            throw CapacityError(oss.str());
        }
    }

    Tag tag;
    for (size_t i = 0; i < count; i++)
    {
        tag.push_back(TagElement(elements[i].data(), elements[i].size()));
    }

    this->_tags.push_back(tag);
};

const Tag* TagStore::findFirst(string_view name) const
{
    for (const Tag& tag : this->_tags)
    {
        if (string_view(tag[0].data(), tag[0].size()) == name)
        {
            return &tag;
        }
    }

    return nullptr;
};

etl::vector<const Tag*, config::MAX_TAGS> TagStore::findAll(string_view name) const
{
    etl::vector<const Tag*, config::MAX_TAGS> matches;
    for (const Tag& tag : this->_tags)
    {
        if (string_view(tag[0].data(), tag[0].size()) == name)
        {
            matches.push_back(&tag);
        }
    }

    return matches;
};

bool TagStore::operator==(const TagStore& other) const
{
    return this->_tags == other._tags;
};
