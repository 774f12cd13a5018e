#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "nostd/data/data.hpp"
#include "nostd/signer/noscrypt_signer.hpp"
#include "test_fixtures.hpp"

using namespace nostd;
using namespace nostd::data;
using namespace std;
using namespace ::testing;

using nlohmann::json;

namespace nostd_test
{
class EventTest : public testing::Test
{
public:
    inline static const string KNOWN_ID = "b515da91ac5df638fae0a6e658e03acc1dda6152dd2107d02d5702ccfcf927e8";
    inline static const string KNOWN_SIG =
        "89a4f1ad4b65371e6c3167ea8cb13e73cf64dd5ee71224b1edd8c32ad817af23"
        "12202cadb2f22f35d599793e8b1c66b3979d4030f1e7a252098da4a4e0c48fab";

    static Event testEvent()
    {
        TagStore tags;
        tags.add({ "e", "5c83da77af1dec6d7289834998ad7aafbd9e2191396d75ec3cc27f5a77226f36", "wss://gitcitadel.nostr1.com" });
        tags.add({ "p", "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca" });

        return Event(publicKey(), 1627846261, kinds::SHORT_NOTE, tags, makeContent("Hello, World!"));
    }

    static Event receivedNote(string_view id, string_view content = "esptest")
    {
        return Event(
            publicKey(),
            1686880020,
            kinds::SHORT_NOTE,
            TagStore(),
            makeContent(content),
            fromHex<32>(id),
            fromHex<64>(KNOWN_SIG));
    }

protected:
    shared_ptr<signer::NoscryptSigner> signer;

    void SetUp() override
    {
        this->signer = make_shared<signer::NoscryptSigner>(testAppender());
    }
};

TEST_F(EventTest, Equivalent_Events_Have_Same_Digest)
{
    auto event1 = testEvent();
    auto event2 = testEvent();

    ASSERT_EQ(event1.computeDigest(), event2.computeDigest());
}

TEST_F(EventTest, Different_Content_Changes_Digest)
{
    auto event1 = testEvent();
    Event event2(event1.pubkey(), event1.createdAt(), event1.kind(), event1.tags(), makeContent("Hello, World?"));

    ASSERT_NE(event1.computeDigest(), event2.computeDigest());
}

TEST_F(EventTest, Unsigned_Event_Has_No_Id_Or_Signature)
{
    auto event = testEvent();

    ASSERT_FALSE(event.isSigned());
    ASSERT_FALSE(event.id().has_value());
    ASSERT_FALSE(event.sig().has_value());
    ASSERT_FALSE(event.verify(*signer));
}

TEST_F(EventTest, Verifies_Received_Event)
{
    auto event = receivedNote(KNOWN_ID);

    ASSERT_TRUE(event.isSigned());
    ASSERT_TRUE(event.verify(*signer));
}

TEST_F(EventTest, Rejects_Event_With_Wrong_Id)
{
    auto event = receivedNote("c515da91ac5df638fae0a6e658e03acc1dda6152dd2107d02d5702ccfcf927e8");

    ASSERT_FALSE(event.verify(*signer));
}

TEST_F(EventTest, Rejects_Event_With_Altered_Content)
{
    auto event = receivedNote(KNOWN_ID, "esptest!");

    ASSERT_FALSE(event.verify(*signer));
}

TEST_F(EventTest, Largest_Received_Event_Is_Checked_Without_Throwing)
{
    string element(config::MAX_TAG_ELEMENT_LENGTH, '"');
    TagStore tags;
    for (size_t i = 0; i < config::MAX_TAGS; i++)
    {
        tags.add({ element, element, element, element });
    }
    Event event(
        publicKey(),
        UINT64_MAX,
        kinds::SHORT_NOTE,
        tags,
        makeContent(string(config::MAX_CONTENT_LENGTH, '\t')),
        fromHex<32>(KNOWN_ID),
        fromHex<64>(KNOWN_SIG));

    ASSERT_NO_THROW(event.computeDigest());
    ASSERT_FALSE(event.verify(*signer));
}

TEST_F(EventTest, Events_With_Same_Id_Are_Equal)
{
    auto event1 = receivedNote(KNOWN_ID);
    auto event2 = receivedNote(KNOWN_ID);
    auto event3 = receivedNote("c515da91ac5df638fae0a6e658e03acc1dda6152dd2107d02d5702ccfcf927e8");

    ASSERT_TRUE(event1 == event2);
    ASSERT_FALSE(event1 == event3);
}

TEST_F(EventTest, Equality_Requires_Ids)
{
    auto unsignedEvent = testEvent();
    auto signedEvent = receivedNote(KNOWN_ID);

    ASSERT_THROW(unsignedEvent == signedEvent, invalid_argument);
    ASSERT_THROW(signedEvent == unsignedEvent, invalid_argument);
}

TEST_F(EventTest, Converts_To_Json)
{
    auto event = receivedNote(KNOWN_ID);

    json j = event;

    ASSERT_EQ(
        j.dump(),
        R"({"content":"esptest","created_at":1686880020,"id":")" + KNOWN_ID
            + R"(","kind":1,"pubkey":"098ef66bce60dd4cf10b4ae5949d1ec6dd777ddeb4bc49b47f97275a127a63cf","sig":")"
            + KNOWN_SIG + R"(","tags":[]})");
}

TEST_F(EventTest, Unsigned_Json_Omits_Id_And_Signature)
{
    json j = testEvent();

    ASSERT_FALSE(j.contains("id"));
    ASSERT_FALSE(j.contains("sig"));
    ASSERT_EQ(j["tags"][1][0], "p");
}
} // namespace nostd_test
