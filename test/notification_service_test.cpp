#include <chrono>
#include <mutex>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "relaysync/notifications/notification_service.hpp"
#include "relaysync/storage/persistence.hpp"
#include "relaysync/storage/watermark_store.hpp"
#include "test_helpers.hpp"

using namespace relaysync::config;
using namespace relaysync::data;
using namespace relaysync::notifications;
using namespace relaysync::service;
using namespace relaysync::storage;
using namespace relaysync_test;
using namespace std;
using namespace ::testing;

namespace relaysync_test
{
class NotificationServiceTest : public testing::Test
{
public:
    inline static const string RELAY = "wss://relay.damus.io";
    inline static const string NOTE_ID = hexId(0x1000);

    static ClientConfig getTestConfig()
    {
        ClientConfig config;
        config.readRelays = { RELAY };
        config.notificationTimeout = chrono::milliseconds(100);
        config.profileTimeout = chrono::milliseconds(100);

        return config;
    };

protected:
    shared_ptr<NiceMock<MockRelayPool>> mockPool;
    shared_ptr<RelayFanout> fanout;
    shared_ptr<FakeKeyStore> aliceKeys;
    shared_ptr<InMemoryPersistence> persistence;
    shared_ptr<NotificationAggregator> aggregator;
    shared_ptr<ProfileCache> profiles;

    mutex requestMutex;
    vector<vector<shared_ptr<Filters>>> requests;

    vector<shared_ptr<Event>> interactions;
    vector<shared_ptr<Event>> metadata;
    vector<shared_ptr<Event>> notes;

    void SetUp() override
    {
        mockPool = make_shared<NiceMock<MockRelayPool>>();
        fanout = make_shared<RelayFanout>(testAppender(), mockPool);
        aliceKeys = make_shared<FakeKeyStore>(ALICE);
        persistence = make_shared<InMemoryPersistence>();

        auto watermarks = make_shared<WatermarkStore>(persistence);
        auto baseline = make_shared<FollowerBaseline>(testAppender(), persistence, ALICE);
        aggregator = make_shared<NotificationAggregator>(testAppender(), ALICE, baseline, watermarks);
        profiles = make_shared<ProfileCache>();

        ON_CALL(*mockPool, openRelayConnections(_))
            .WillByDefault(Invoke([](vector<string> relays) { return relays; }));

        // Each query is answered from the matching fixture list, according to what it asks for.
        ON_CALL(*mockPool, subscribe(_, _, _, _, _))
            .WillByDefault(Invoke([this](
                vector<string> relays,
                vector<shared_ptr<Filters>> filters,
                EventHandler onEvent,
                EoseHandler onEose,
                CloseHandler onClose)
            {
                {
                    lock_guard<mutex> lock(this->requestMutex);
                    this->requests.push_back(filters);
                }

                const vector<shared_ptr<Event>>* answer = &this->interactions;
                if (!filters.front()->ids.empty())
                {
                    answer = &this->notes;
                }
                else if (filters.front()->kinds == vector<int>({ 0 }))
                {
                    answer = &this->metadata;
                }

                for (const auto& relay : relays)
                {
                    for (const auto& event : *answer)
                    {
                        onEvent(relay, event);
                    }
                    onEose(relay);
                }

                return "query-" + to_string(this->requests.size());
            }));
    };

    unique_ptr<NotificationService> makeService(ClientConfig config = getTestConfig())
    {
        return make_unique<NotificationService>(
            testAppender(),
            config,
            mockPool,
            fanout,
            aliceKeys,
            aggregator,
            profiles);
    };
};

TEST_F(NotificationServiceTest, Constructor_Throws_WithoutDependencies)
{
    ASSERT_THROW(
        NotificationService(testAppender(), getTestConfig(), mockPool, fanout, aliceKeys, nullptr, profiles),
        invalid_argument);
};

TEST_F(NotificationServiceTest, FetchNotifications_DecoratesFeed_WithProfilesAndNotes)
{
    interactions = {
        makeEvent(hexId(1), BOB, 1, 200, { { "e", NOTE_ID }, { "p", ALICE } }, "great"),
        makeEvent(hexId(2), CAROL, 7, 100, { { "e", hexId(0x2000) }, { "p", ALICE } }, "+")
    };
    metadata = { makeEvent(hexId(10), BOB, 0, 50, {}, "{\"name\":\"bob\"}") };
    notes = { makeEvent(NOTE_ID, ALICE, 1, 10, {}, "my post") };

    auto items = makeService()->fetchNotifications();

    ASSERT_EQ(items.size(), 2);
    ASSERT_EQ(items[0].actorPubkey, BOB);
    ASSERT_NE(items[0].profile, nullptr);
    ASSERT_EQ(items[0].profile->name, "bob");
    ASSERT_NE(items[0].targetNote, nullptr);
    ASSERT_EQ(items[1].profile, nullptr);
    ASSERT_TRUE(items[1].targetMissing);

    ASSERT_EQ(requests.size(), 3);
    ASSERT_EQ(requests[1].front()->authors.size(), 2);
    ASSERT_EQ(requests[2].front()->ids.size(), 2);
};

TEST_F(NotificationServiceTest, FetchNotifications_SkipsProfileQuery_WhenProfilesAreCached)
{
    interactions = { makeEvent(hexId(1), BOB, 1, 200, { { "e", NOTE_ID }, { "p", ALICE } }, "great") };
    profiles->ingest(*makeEvent(hexId(10), BOB, 0, 50, {}, "{\"name\":\"bob\"}"));

    auto items = makeService()->fetchNotifications();

    ASSERT_EQ(requests.size(), 2);
    ASSERT_EQ(items[0].profile->name, "bob");
};

TEST_F(NotificationServiceTest, FetchNotifications_QueriesOnlyEnabledTypes)
{
    ClientConfig config = getTestConfig();
    config.enabledNotifications = { NotificationType::Like, NotificationType::Zap };

    makeService(config)->fetchNotifications();

    ASSERT_FALSE(requests.empty());
    ASSERT_EQ(requests[0].size(), 2);
    ASSERT_EQ(requests[0][0]->kinds, vector<int>({ 7 }));
    ASSERT_EQ(requests[0][1]->kinds, vector<int>({ 9735 }));
};

TEST_F(NotificationServiceTest, FetchNotifications_SkipsRelays_WhenEveryTypeIsDisabled)
{
    EXPECT_CALL(*mockPool, subscribe(_, _, _, _, _)).Times(0);
    EXPECT_CALL(*mockPool, openRelayConnections(_)).Times(0);

    ClientConfig config = getTestConfig();
    config.enabledNotifications.clear();

    ASSERT_TRUE(makeService(config)->fetchNotifications().empty());
};

TEST_F(NotificationServiceTest, FetchNotifications_Throws_WithoutIdentity)
{
    aliceKeys = make_shared<FakeKeyStore>("");

    ASSERT_THROW(makeService()->fetchNotifications(), logic_error);
};

TEST_F(NotificationServiceTest, FetchNotifications_Throws_ForAnotherIdentity)
{
    aliceKeys = make_shared<FakeKeyStore>(BOB);

    ASSERT_THROW(makeService()->fetchNotifications(), logic_error);
};

TEST_F(NotificationServiceTest, FetchNotifications_Throws_WithoutRelays)
{
    ClientConfig config = getTestConfig();
    config.readRelays.clear();

    ASSERT_THROW(makeService(config)->fetchNotifications(), logic_error);
};
} // namespace relaysync_test
