#include <chrono>
#include <mutex>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "relaysync/messaging/envelope_builder.hpp"
#include "relaysync/messaging/messaging_service.hpp"
#include "relaysync/storage/persistence.hpp"
#include "relaysync/storage/watermark_store.hpp"
#include "test_helpers.hpp"

using namespace relaysync::config;
using namespace relaysync::data;
using namespace relaysync::messaging;
using namespace relaysync::service;
using namespace relaysync::storage;
using namespace relaysync_test;
using namespace std;
using namespace ::testing;

namespace relaysync_test
{
class MessagingServiceTest : public testing::Test
{
public:
    inline static const string READ_RELAY = "wss://relay.damus.io";
    inline static const string WRAPPED_RELAY = "wss://inbox.nostr.wine";

    static ClientConfig getTestConfig()
    {
        ClientConfig config;
        config.readRelays = { READ_RELAY };
        config.wrappedRelay = WRAPPED_RELAY;
        config.backlogTimeout = chrono::milliseconds(100);
        config.messageLookbackSeconds = 1000;
        config.messageQueryLimit = 50;
        config.wrappedWindowLimit = 20;

        return config;
    };

    static tuple<vector<string>, vector<string>> accepted(vector<string> relays)
    {
        return make_tuple(relays, vector<string>());
    };

    static tuple<vector<string>, vector<string>> rejected(vector<string> relays)
    {
        return make_tuple(vector<string>(), relays);
    };

protected:
    shared_ptr<NiceMock<MockRelayPool>> mockPool;
    shared_ptr<RelayFanout> fanout;
    shared_ptr<FakeKeyStore> aliceKeys;
    shared_ptr<FakeKeyStore> bobKeys;
    shared_ptr<FakeKeyStore> carolKeys;
    shared_ptr<ConversationStore> store;

    mutex handlerMutex;
    EventHandler eventHandler;

    void SetUp() override
    {
        mockPool = make_shared<NiceMock<MockRelayPool>>();
        fanout = make_shared<RelayFanout>(testAppender(), mockPool);
        aliceKeys = make_shared<FakeKeyStore>(ALICE);
        bobKeys = make_shared<FakeKeyStore>(BOB);
        carolKeys = make_shared<FakeKeyStore>(CAROL);
        store = make_shared<ConversationStore>(
            testAppender(),
            make_shared<WatermarkStore>(make_shared<InMemoryPersistence>()));

        ON_CALL(*mockPool, openRelayConnections(_))
            .WillByDefault(Invoke([](vector<string> relays) { return relays; }));
    };

    unique_ptr<MessagingService> makeService(ClientConfig config = getTestConfig())
    {
        return make_unique<MessagingService>(testAppender(), config, mockPool, fanout, aliceKeys, store);
    };

    /**
     * @brief Makes every relay answer a subscription with the given backlog, then end it.
     */
    void serveBacklog(vector<shared_ptr<Event>> backlog)
    {
        ON_CALL(*mockPool, subscribe(_, _, _, _, _))
            .WillByDefault(Invoke([this, backlog](
                vector<string> relays,
                vector<shared_ptr<Filters>> filters,
                EventHandler onEvent,
                EoseHandler onEose,
                CloseHandler onClose)
            {
                {
                    lock_guard<mutex> lock(this->handlerMutex);
                    this->eventHandler = onEvent;
                }

                for (const auto& relay : relays)
                {
                    for (const auto& event : backlog)
                    {
                        onEvent(relay, event);
                    }
                    onEose(relay);
                }

                return string("messages");
            }));
    };

    void sendLiveEvent(shared_ptr<Event> event)
    {
        EventHandler handler;
        {
            lock_guard<mutex> lock(this->handlerMutex);
            handler = this->eventHandler;
        }
        handler(READ_RELAY, event);
    };
};

TEST_F(MessagingServiceTest, Constructor_Throws_WithoutDependencies)
{
    ASSERT_THROW(
        MessagingService(testAppender(), getTestConfig(), nullptr, fanout, aliceKeys, store),
        invalid_argument);
    ASSERT_THROW(
        MessagingService(testAppender(), getTestConfig(), mockPool, fanout, nullptr, store),
        invalid_argument);
};

TEST_F(MessagingServiceTest, BuildFilters_QueriesBothSchemes)
{
    auto service = makeService();

    auto filters = service->buildFilters(ALICE, 5000);

    ASSERT_EQ(filters.size(), 4);

    ASSERT_EQ(filters[0]->kinds, vector<int>({ 4 }));
    ASSERT_EQ(filters[0]->authors, vector<string>({ ALICE }));
    ASSERT_EQ(filters[0]->limit, 50);

    ASSERT_EQ(filters[1]->kinds, vector<int>({ 4 }));
    ASSERT_EQ(filters[1]->tags.at("p"), vector<string>({ ALICE }));

    ASSERT_EQ(filters[2]->kinds, vector<int>({ 1059 }));
    ASSERT_EQ(filters[2]->tags.at("p"), vector<string>({ ALICE }));
    ASSERT_EQ(filters[2]->limit, 50);

    ASSERT_EQ(filters[3]->kinds, vector<int>({ 1059 }));
    ASSERT_TRUE(filters[3]->tags.empty());
    ASSERT_EQ(filters[3]->since, 4000);
    ASSERT_EQ(filters[3]->limit, 20);
};

TEST_F(MessagingServiceTest, LoadConversations_SubscribesToReadAndWrappedRelays)
{
    EXPECT_CALL(*mockPool, subscribe(ElementsAre(READ_RELAY, WRAPPED_RELAY), SizeIs(4), _, _, _))
        .WillOnce(Return(string("messages")));

    auto service = makeService();
    service->loadConversations();
};

TEST_F(MessagingServiceTest, LoadConversations_IngestsDecryptableBacklog)
{
    EnvelopeBuilder bob(testAppender(), bobKeys);
    EnvelopeBuilder carol(testAppender(), carolKeys);
    EnvelopeBuilder alice(testAppender(), aliceKeys);

    auto legacyFromBob = bob.buildLegacy(ALICE, "legacy hello");
    auto wrappedFromBob = bob.buildWrapped(ALICE, "wrapped hello");
    auto legacyToBob = alice.buildLegacy(BOB, "legacy reply");
    auto carolToBob = carol.buildLegacy(BOB, "not for alice");

    serveBacklog({ legacyFromBob, wrappedFromBob.recipientCopy, wrappedFromBob.senderCopy, legacyToBob, carolToBob });

    auto service = makeService();
    service->loadConversations();

    ASSERT_EQ(store->size(), 1);
    auto conversation = store->conversation(BOB);
    ASSERT_TRUE(conversation.has_value());
    ASSERT_EQ(conversation->messages.size(), 3);
    ASSERT_EQ(conversation->unreadCount, 2);
};

TEST_F(MessagingServiceTest, LoadConversations_IngestsLiveMessages_AfterBacklog)
{
    serveBacklog({});

    auto service = makeService();
    service->loadConversations();
    ASSERT_EQ(store->size(), 0);

    EnvelopeBuilder bob(testAppender(), bobKeys);
    auto envelope = bob.buildWrapped(ALICE, "live hello");
    sendLiveEvent(envelope.recipientCopy);
    sendLiveEvent(envelope.recipientCopy);

    auto conversation = store->conversation(BOB);
    ASSERT_TRUE(conversation.has_value());
    ASSERT_EQ(conversation->messages.size(), 1);
    ASSERT_EQ(conversation->messages[0].content, "live hello");
    ASSERT_EQ(conversation->messages[0].scheme, Scheme::Wrapped);
};

TEST_F(MessagingServiceTest, LoadConversations_ClosesPreviousSubscription)
{
    serveBacklog({});
    EXPECT_CALL(*mockPool, closeSubscription("messages")).Times(2);

    auto service = makeService();
    service->loadConversations();
    service->loadConversations();
    service->close();
};

TEST_F(MessagingServiceTest, LoadConversations_Throws_WithoutIdentity)
{
    auto service = make_unique<MessagingService>(
        testAppender(),
        getTestConfig(),
        mockPool,
        fanout,
        make_shared<FakeKeyStore>(""),
        store);

    ASSERT_THROW(service->loadConversations(), logic_error);
};

TEST_F(MessagingServiceTest, LoadConversations_Throws_WithoutRelays)
{
    ClientConfig config = getTestConfig();
    config.readRelays.clear();
    config.wrappedRelay.clear();

    auto service = makeService(config);

    ASSERT_THROW(service->loadConversations(), logic_error);
};

TEST_F(MessagingServiceTest, SendMessage_UsesWrappedScheme_WhenRelaysAcceptBothCopies)
{
    ClientConfig config = getTestConfig();
    config.useWrappedScheme = true;

    EXPECT_CALL(*mockPool, publishEvent(ElementsAre(READ_RELAY, WRAPPED_RELAY), _))
        .Times(2)
        .WillRepeatedly(Invoke([](vector<string> relays, shared_ptr<Event> event)
        {
            return accepted(relays);
        }));

    auto service = makeService(config);
    SendResult result = service->sendMessage(BOB, "wrapped hello");

    ASSERT_EQ(result.scheme, Scheme::Wrapped);
    ASSERT_TRUE(result.message.has_value());
    ASSERT_TRUE(result.message->sent);
    ASSERT_EQ(result.message->peerPubkey, BOB);
    ASSERT_EQ(result.message->content, "wrapped hello");

    auto conversation = store->conversation(BOB);
    ASSERT_EQ(conversation->messages.size(), 1);
    ASSERT_EQ(conversation->unreadCount, 0);
};

TEST_F(MessagingServiceTest, SendMessage_FallsBackToLegacy_WhenWrappedPublishFails)
{
    ClientConfig config = getTestConfig();
    config.useWrappedScheme = true;

    ON_CALL(*mockPool, publishEvent(_, _))
        .WillByDefault(Invoke([](vector<string> relays, shared_ptr<Event> event)
        {
            return event->kind == 1059 ? rejected(relays) : accepted(relays);
        }));

    auto service = makeService(config);
    SendResult result = service->sendMessage(BOB, "fallback hello");

    ASSERT_EQ(result.scheme, Scheme::Legacy);
    ASSERT_EQ(result.message->scheme, Scheme::Legacy);
    ASSERT_EQ(result.message->content, "fallback hello");
    ASSERT_EQ(store->conversation(BOB)->messages.size(), 1);
};

TEST_F(MessagingServiceTest, SendMessage_FallsBackToLegacy_WhenSenderCopyIsRejected)
{
    ClientConfig config = getTestConfig();
    config.useWrappedScheme = true;

    int wrapCount = 0;
    ON_CALL(*mockPool, publishEvent(_, _))
        .WillByDefault(Invoke([&wrapCount](vector<string> relays, shared_ptr<Event> event)
        {
            if (event->kind == 1059)
            {
                return ++wrapCount == 1 ? accepted(relays) : rejected(relays);
            }
            return accepted(relays);
        }));

    auto service = makeService(config);
    SendResult result = service->sendMessage(BOB, "fallback hello");

    ASSERT_EQ(result.scheme, Scheme::Legacy);
    ASSERT_EQ(wrapCount, 2);
};

TEST_F(MessagingServiceTest, SendMessage_UsesLegacyScheme_WhenWrappedSchemeIsDisabled)
{
    EXPECT_CALL(*mockPool, publishEvent(ElementsAre(READ_RELAY), Pointee(Field(&Event::kind, 4))))
        .WillOnce(Invoke([](vector<string> relays, shared_ptr<Event> event)
        {
            return accepted(relays);
        }));

    auto service = makeService();
    SendResult result = service->sendMessage(BOB, "legacy hello");

    ASSERT_EQ(result.scheme, Scheme::Legacy);
    ASSERT_EQ(toString(result.scheme), "legacy");
};

TEST_F(MessagingServiceTest, SendMessage_PublishesToWriteRelays)
{
    ClientConfig config = getTestConfig();
    config.writeRelays = { "wss://nos.lol" };

    EXPECT_CALL(*mockPool, publishEvent(ElementsAre("wss://nos.lol"), _))
        .WillOnce(Invoke([](vector<string> relays, shared_ptr<Event> event)
        {
            return accepted(relays);
        }));

    auto service = makeService(config);
    service->sendMessage(BOB, "legacy hello");
};

TEST_F(MessagingServiceTest, SendMessage_Throws_WhenNoRelayAccepts)
{
    ClientConfig config = getTestConfig();
    config.useWrappedScheme = true;

    ON_CALL(*mockPool, publishEvent(_, _))
        .WillByDefault(Invoke([](vector<string> relays, shared_ptr<Event> event)
        {
            return rejected(relays);
        }));

    auto service = makeService(config);

    ASSERT_THROW(service->sendMessage(BOB, "lost hello"), SendError);
    ASSERT_EQ(store->size(), 0);
};

TEST_F(MessagingServiceTest, SendMessage_Throws_WhenSigningFails)
{
    aliceKeys->failSigning = true;
    EXPECT_CALL(*mockPool, publishEvent(_, _)).Times(0);

    auto service = makeService();

    ASSERT_THROW(service->sendMessage(BOB, "unsigned hello"), SendError);
};

TEST_F(MessagingServiceTest, SendMessage_Throws_ForInvalidArguments)
{
    EXPECT_CALL(*mockPool, publishEvent(_, _)).Times(0);

    auto service = makeService();

    ASSERT_THROW(service->sendMessage("not-a-key", "hello"), invalid_argument);
    ASSERT_THROW(service->sendMessage(BOB, ""), invalid_argument);
    ASSERT_THROW(service->sendMessage(BOB, "  \n\t"), invalid_argument);
};

TEST_F(MessagingServiceTest, SendMessage_Throws_WithoutRelays)
{
    ClientConfig config = getTestConfig();
    config.readRelays.clear();

    auto service = makeService(config);

    ASSERT_THROW(service->sendMessage(BOB, "hello"), logic_error);
};
} // namespace relaysync_test
