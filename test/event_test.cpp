#include <stdexcept>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include "relaysync/data/data.hpp"
#include "test_helpers.hpp"

using namespace relaysync::data;
using namespace relaysync_test;
using namespace std;
using namespace ::testing;

using nlohmann::json;

shared_ptr<Event> testEvent()
{
    auto event = make_shared<Event>();

    event->pubkey = "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca";
    event->createdAt = 1627846261;
    event->kind = 1;
    event->tags = {
        { "e", "5c83da77af1dec6d7289834998ad7aafbd9e2191396d75ec3cc27f5a77226f36", "wss://relay.example.com" },
        { "p", "" },
        { "p", "13a0c4fe8a7fbb5a4a2f2d5b6c3e5e4b4b56f1f4fd3a7a0b3f6f2b4c0e4d8a11" },
        { "p", "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca" }
    };
    event->content = "Hello, World!";

    return event;
}

TEST(EventTest, Equivalent_Events_Have_Same_ID)
{
    auto event1 = testEvent();
    auto event2 = testEvent();

    event1->serialize();
    event2->serialize();

    ASSERT_EQ(event1->id, event2->id);
    ASSERT_TRUE(*event1 == *event2);
}

TEST(EventTest, Serialize_GeneratesLowercaseHexId)
{
    auto event = testEvent();
    event->serialize();

    ASSERT_EQ(event->id.size(), 64);
    ASSERT_EQ(event->id.find_first_not_of("0123456789abcdef"), string::npos);
}

TEST(EventTest, Serialize_ChangesId_WhenContentChanges)
{
    auto event1 = testEvent();
    auto event2 = testEvent();
    event2->content = "Goodbye, World!";

    event1->serialize();
    event2->serialize();

    ASSERT_NE(event1->id, event2->id);
}

TEST(EventTest, Serialize_Throws_WhenPubkeyIsMissing)
{
    auto event = testEvent();
    event->pubkey.clear();

    ASSERT_THROW(event->serialize(), invalid_argument);
}

TEST(EventTest, Serialize_Throws_WhenKindIsOutOfRange)
{
    auto event = testEvent();
    event->kind = 70000;

    ASSERT_THROW(event->serialize(), invalid_argument);
}

TEST(EventTest, Serialize_SetsCreatedAt_WhenUnset)
{
    auto event = testEvent();
    event->createdAt = 0;

    time_t before = time(nullptr);
    event->serialize();

    ASSERT_GE(event->createdAt, before);
}

TEST(EventTest, FromString_ReadsEveryField)
{
    auto event = testEvent();
    event->sig = string(128, 'a');
    string serialized = event->serialize();

    Event parsed = Event::fromString(serialized);

    ASSERT_EQ(parsed.id, event->id);
    ASSERT_EQ(parsed.pubkey, event->pubkey);
    ASSERT_EQ(parsed.createdAt, event->createdAt);
    ASSERT_EQ(parsed.kind, event->kind);
    ASSERT_EQ(parsed.tags, event->tags);
    ASSERT_EQ(parsed.content, event->content);
    ASSERT_EQ(parsed.sig, event->sig);
}

TEST(EventTest, FromJson_AcceptsUnsignedRumor)
{
    json rumor = {
        { "pubkey", ALICE },
        { "created_at", 1700000000 },
        { "kind", 14 },
        { "tags", json::array({ json::array({ "p", BOB }) }) },
        { "content", "hi" }
    };

    Event parsed = Event::fromJson(rumor);

    ASSERT_TRUE(parsed.id.empty());
    ASSERT_TRUE(parsed.sig.empty());
    ASSERT_EQ(parsed.firstTagValue("p"), BOB);
}

TEST(EventTest, FromString_Throws_WhenJsonIsMalformed)
{
    ASSERT_THROW(Event::fromString("{\"pubkey\": 5"), json::exception);
    ASSERT_THROW(Event::fromString("{\"pubkey\": \"abc\"}"), json::exception);
}

TEST(EventTest, FirstTagValue_SkipsEmptyValues)
{
    auto event = testEvent();

    ASSERT_EQ(event->firstTagValue("p"), "13a0c4fe8a7fbb5a4a2f2d5b6c3e5e4b4b56f1f4fd3a7a0b3f6f2b4c0e4d8a11");
    ASSERT_EQ(event->firstTagValue("q"), "");
}

TEST(EventTest, TaggedValues_ReturnsEveryValue)
{
    auto event = testEvent();

    ASSERT_EQ(event->taggedValues("p").size(), 3);
    ASSERT_TRUE(event->hasTag("p", "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca"));
    ASSERT_FALSE(event->hasTag("e", "f7234bd4c1394dda46d09f35bd384dd30cc552ad5541990f98844fb06676e9ca"));
}

TEST(EventTest, Equality_Throws_WhenIdIsEmpty)
{
    auto event1 = testEvent();
    auto event2 = testEvent();

    ASSERT_THROW((void)(*event1 == *event2), invalid_argument);
}

TEST(EventKindTest, KindOf_MapsUnknownNumbers_ToUnknown)
{
    ASSERT_EQ(kindOf(4), EventKind::EncryptedDirectMessage);
    ASSERT_EQ(kindOf(1059), EventKind::GiftWrap);
    ASSERT_EQ(kindOf(9736), EventKind::TipDisclosure);
    ASSERT_EQ(kindOf(30023), EventKind::Unknown);
    ASSERT_EQ(kindOf(-1), EventKind::Unknown);
}

TEST(EventKindTest, KindNumber_Throws_ForUnknownKind)
{
    ASSERT_EQ(kindNumber(EventKind::Seal), 13);
    ASSERT_THROW(kindNumber(EventKind::Unknown), invalid_argument);
}

TEST(EventKindTest, IsValidPublicKey_RequiresLowercaseHex)
{
    ASSERT_TRUE(isValidPublicKey(ALICE));
    ASSERT_FALSE(isValidPublicKey(string(63, 'a')));
    ASSERT_FALSE(isValidPublicKey(string(64, 'A')));
    ASSERT_FALSE(isValidPublicKey(string(64, 'g')));
}

TEST(FiltersTest, Serialize_OmitsUnsetFields)
{
    Filters filters;
    filters.kinds = { 4 };
    filters.tags["p"] = { BOB };
    filters.limit = 10;

    json request = json::parse(filters.serialize("sub"));

    ASSERT_EQ(request[0], "REQ");
    ASSERT_EQ(request[1], "sub");
    json filter = request[2];
    ASSERT_EQ(filter["kinds"], json::array({ 4 }));
    ASSERT_EQ(filter["#p"], json::array({ BOB }));
    ASSERT_EQ(filter["limit"], 10);
    ASSERT_FALSE(filter.contains("ids"));
    ASSERT_FALSE(filter.contains("authors"));
    ASSERT_FALSE(filter.contains("since"));
    ASSERT_FALSE(filter.contains("until"));
}

TEST(FiltersTest, Validate_Throws_WithoutLimit)
{
    Filters filters;
    filters.kinds = { 1 };

    ASSERT_THROW(filters.validate(), invalid_argument);
}

TEST(FiltersTest, Validate_Throws_WithoutAnyCriteria)
{
    Filters filters;
    filters.limit = 10;
    filters.since = 100;

    ASSERT_THROW(filters.validate(), invalid_argument);
}

TEST(FiltersTest, Validate_Throws_WhenSinceIsAfterUntil)
{
    Filters filters;
    filters.kinds = { 1 };
    filters.limit = 10;
    filters.since = 200;
    filters.until = 100;

    ASSERT_THROW(filters.validate(), invalid_argument);
}

TEST(FiltersTest, SerializeMany_SendsEveryFilterInOneRequest)
{
    auto sent = make_shared<Filters>();
    sent->kinds = { 4 };
    sent->authors = { ALICE };
    sent->limit = 500;

    auto received = make_shared<Filters>();
    received->kinds = { 4 };
    received->tags["p"] = { ALICE };
    received->limit = 500;

    json request = json::parse(Filters::serialize("sub", { sent, received }));

    ASSERT_EQ(request.size(), 4);
    ASSERT_EQ(request[2]["authors"], json::array({ ALICE }));
    ASSERT_EQ(request[3]["#p"], json::array({ ALICE }));
}

TEST(FiltersTest, SerializeMany_Throws_ForEmptyList)
{
    ASSERT_THROW(Filters::serialize("sub", {}), invalid_argument);
}
