#include <string>
#include <string_view>

#include <gtest/gtest.h>

#include "nostd/data/data.hpp"
#include "nostd/errors.hpp"

using namespace nostd;
using namespace nostd::data;
using namespace std;
using namespace ::testing;

namespace nostd_test
{
static string str(const TagElement& element)
{
    return string(element.data(), element.size());
}

TEST(TagStoreTest, Preserves_Insertion_Order)
{
    TagStore tags;
    tags.add({ "e", "5c83da77af1dec6d7289834998ad7aafbd9e2191396d75ec3cc27f5a77226f36", "wss://nostr.example.com" });
    tags.add({ "p", "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca" });
    tags.add({ "l", "bitcoin" });

    ASSERT_EQ(tags.size(), 3u);
    ASSERT_EQ(str(tags[0][0]), "e");
    ASSERT_EQ(str(tags[0][2]), "wss://nostr.example.com");
    ASSERT_EQ(str(tags[1][0]), "p");
    ASSERT_EQ(str(tags[2][1]), "bitcoin");
}

TEST(TagStoreTest, Rejects_Tag_When_Full)
{
    TagStore tags;
    for (size_t i = 0; i < config::MAX_TAGS; i++)
    {
        tags.add({ "t", "value" });
    }

    ASSERT_TRUE(tags.full());
    ASSERT_THROW(tags.add({ "t", "overflow" }), CapacityError);
    ASSERT_EQ(tags.size(), config::MAX_TAGS);
}

TEST(TagStoreTest, Rejects_Tag_With_Too_Many_Elements)
{
    TagStore tags;

    ASSERT_THROW(tags.add({ "a", "b", "c", "d", "e" }), CapacityError);
    ASSERT_TRUE(tags.empty());
}

TEST(TagStoreTest, Rejects_Empty_Tag)
{
    TagStore tags;

    ASSERT_THROW(tags.add(nullptr, 0), CapacityError);
    ASSERT_TRUE(tags.empty());
}

TEST(TagStoreTest, Rejects_Overlong_Element_Without_Partial_Insert)
{
    TagStore tags;
    tags.add({ "l", "bitcoin" });

    string overlong(config::MAX_TAG_ELEMENT_LENGTH + 1, 'x');
    ASSERT_THROW(tags.add({ "r", "ok", overlong }), CapacityError);

    ASSERT_EQ(tags.size(), 1u);
    ASSERT_EQ(str(tags[0][0]), "l");
}

TEST(TagStoreTest, Accepts_Element_Of_Maximum_Length)
{
    TagStore tags;
    string longest(config::MAX_TAG_ELEMENT_LENGTH, 'x');

    tags.add({ "r", longest });

    ASSERT_EQ(tags[0][1].size(), config::MAX_TAG_ELEMENT_LENGTH);
}

TEST(TagStoreTest, Finds_Tags_By_Name)
{
    TagStore tags;
    tags.add({ "l", "labeled", "another label" });
    tags.add({ "p", "test_pubkey" });
    tags.add({ "l", "ignore the other label" });

    const Tag* first = tags.findFirst("l");
    ASSERT_NE(first, nullptr);
    ASSERT_EQ(str((*first)[1]), "labeled");
    ASSERT_EQ(str((*first)[2]), "another label");

    auto labels = tags.findAll("l");
    ASSERT_EQ(labels.size(), 2u);
    ASSERT_EQ(str((*labels[1])[1]), "ignore the other label");

    ASSERT_EQ(tags.findFirst("e"), nullptr);
    ASSERT_TRUE(tags.findAll("e").empty());
}

TEST(TagStoreTest, Compares_By_Content_And_Order)
{
    TagStore a;
    a.add({ "p", "one" });
    a.add({ "e", "two" });

    TagStore b;
    b.add({ "p", "one" });
    b.add({ "e", "two" });

    TagStore c;
    c.add({ "e", "two" });
    c.add({ "p", "one" });

    ASSERT_TRUE(a == b);
    ASSERT_TRUE(a != c);
}

TEST(ContentTest, Rejects_Overlong_Content)
{
    string longest(config::MAX_CONTENT_LENGTH, 'c');
    string overlong(config::MAX_CONTENT_LENGTH + 1, 'c');

    ASSERT_EQ(makeContent(longest).size(), config::MAX_CONTENT_LENGTH);
    ASSERT_THROW(makeContent(overlong), CapacityError);
}

TEST(KindTest, Classifies_Kinds)
{
    ASSERT_EQ(classifyKind(kinds::SHORT_NOTE), KindClass::ShortNote);
    ASSERT_EQ(classifyKind(kinds::DIRECT_MESSAGE), KindClass::DirectMessage);
    ASSERT_EQ(classifyKind(kinds::IOT), KindClass::Iot);
    ASSERT_EQ(classifyKind(kinds::AUTH), KindClass::Auth);
    ASSERT_EQ(classifyKind(1984), KindClass::Regular);
    ASSERT_EQ(classifyKind(10002), KindClass::Replaceable);
    ASSERT_EQ(classifyKind(20001), KindClass::Ephemeral);
    ASSERT_EQ(classifyKind(30023), KindClass::ParameterizedReplaceable);
    ASSERT_EQ(classifyKind(7), KindClass::Custom);
}
} // namespace nostd_test
