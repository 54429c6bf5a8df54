#include <algorithm>
#include <cctype>

#include "relaysync/messaging/messaging_service.hpp"
#include "../internal/logging.hpp"

using namespace relaysync::config;
using namespace relaysync::data;
using namespace relaysync::internal;
using namespace relaysync::messaging;
using namespace relaysync::service;
using namespace relaysync::signer;
using namespace std;

MessagingService::MessagingService(
    shared_ptr<plog::IAppender> appender,
    ClientConfig config,
    shared_ptr<IRelayPool> pool,
    shared_ptr<RelayFanout> fanout,
    shared_ptr<IKeyStore> keyStore,
    shared_ptr<ConversationStore> store)
: _config(move(config)),
  _pool(pool),
  _fanout(fanout),
  _keyStore(keyStore),
  _store(store),
  _decryptor(make_shared<EnvelopeDecryptor>(appender, keyStore)),
  _builder(appender, keyStore)
{
    initLogging(appender, this->_config.logSeverity);

    if (this->_pool == nullptr || this->_fanout == nullptr || this->_store == nullptr)
    {
        throw invalid_argument("MessagingService: A relay pool, fan-out, and conversation store are required.");
    }
};

MessagingService::~MessagingService()
{
    this->close();
};

void MessagingService::loadConversations()
{
    vector<string> relays = this->_config.subscriptionRelays();
    string localPubkey = this->_requireIdentity(relays, "load conversations");

    this->close();

    vector<string> connectedRelays = this->_pool->openRelayConnections(relays);
    if (connectedRelays.empty())
    {
        PLOG_WARNING << "No relay could be reached; conversations will load empty.";
    }

    auto filters = this->buildFilters(localPubkey, time(nullptr));

    // The handlers hold their own references, so they stay valid if the service goes away mid-delivery.
    auto decryptor = this->_decryptor;
    auto store = this->_store;

    FanoutHandlers handlers;
    handlers.onBacklogComplete = [decryptor, store](vector<shared_ptr<Event>> events)
    {
        vector<NormalizedMessage> messages;
        size_t skipped = 0;
        for (const auto& event : events)
        {
            auto message = EnvelopeDecryptor::message(decryptor->decrypt(event));
            if (message.has_value())
            {
                messages.push_back(move(*message));
            }
            else
            {
                skipped++;
            }
        }

        PLOG_INFO << "Decrypted " << messages.size() << " of " << events.size() << " message events; "
            << skipped << " were not for the local identity.";

        store->ingestBatch(messages);
    };
    handlers.onEvent = [decryptor, store](shared_ptr<Event> event)
    {
        DecryptResult result = decryptor->decrypt(event);
        if (const NormalizedMessage* message = get_if<NormalizedMessage>(&result))
        {
            store->ingestOne(*message);
        }
        else
        {
            PLOG_VERBOSE << "Skipping live event " << event->id << ": " << get<NotApplicable>(result).reason;
        }
    };

    auto subscription = this->_fanout->fanoutSubscribe(relays, filters, handlers, this->_config.backlogTimeout);

    lock_guard<mutex> lock(this->_propertyMutex);
    this->_subscription = subscription;
};

void MessagingService::close()
{
    shared_ptr<FanoutSubscription> subscription;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        subscription.swap(this->_subscription);
    }

    if (subscription != nullptr)
    {
        subscription->close();
    }
};

SendResult MessagingService::sendMessage(const string& peerPubkey, const string& content)
{
    vector<string> relays = this->_config.publishRelays();
    this->_requireIdentity(relays, "send a message");

    if (!isValidPublicKey(peerPubkey))
    {
        throw invalid_argument("MessagingService::sendMessage: The peer must be a 64-character hex public key.");
    }

    bool isBlank = all_of(content.begin(), content.end(), [](unsigned char c) { return isspace(c) != 0; });
    if (isBlank)
    {
        throw invalid_argument("MessagingService::sendMessage: The message content must not be blank.");
    }

    if (this->_config.useWrappedScheme)
    {
        vector<string> wrappedRelays = relays;
        const string& wrappedRelay = this->_config.wrappedRelay;
        if (!wrappedRelay.empty() && find(wrappedRelays.begin(), wrappedRelays.end(), wrappedRelay) == wrappedRelays.end())
        {
            wrappedRelays.push_back(wrappedRelay);
        }

        this->_pool->openRelayConnections(wrappedRelays);

        auto result = this->_sendWrapped(wrappedRelays, peerPubkey, content);
        if (result.has_value())
        {
            return *result;
        }

        PLOG_WARNING << "Wrapped send to " << peerPubkey << " failed; falling back to the legacy scheme.";
    }
    else
    {
        this->_pool->openRelayConnections(relays);
    }

    return this->_sendLegacy(relays, peerPubkey, content);
};

vector<shared_ptr<Filters>> MessagingService::buildFilters(const string& localPubkey, time_t now) const
{
    auto sentLegacy = make_shared<Filters>();
    sentLegacy->kinds.push_back(kindNumber(EventKind::EncryptedDirectMessage));
    sentLegacy->authors.push_back(localPubkey);
    sentLegacy->limit = this->_config.messageQueryLimit;

    auto receivedLegacy = make_shared<Filters>();
    receivedLegacy->kinds.push_back(kindNumber(EventKind::EncryptedDirectMessage));
    receivedLegacy->tags["p"] = { localPubkey };
    receivedLegacy->limit = this->_config.messageQueryLimit;

    auto taggedWraps = make_shared<Filters>();
    taggedWraps->kinds.push_back(kindNumber(EventKind::GiftWrap));
    taggedWraps->tags["p"] = { localPubkey };
    taggedWraps->limit = this->_config.messageQueryLimit;

    auto recentWraps = make_shared<Filters>();
    recentWraps->kinds.push_back(kindNumber(EventKind::GiftWrap));
    recentWraps->since = now - this->_config.messageLookbackSeconds;
    recentWraps->limit = this->_config.wrappedWindowLimit;

    return { sentLegacy, receivedLegacy, taggedWraps, recentWraps };
};

string MessagingService::_requireIdentity(const vector<string>& relays, const string& operation) const
{
    string localPubkey = this->_keyStore == nullptr ? string() : this->_keyStore->localIdentity();
    if (localPubkey.empty())
    {
        throw logic_error("MessagingService: Cannot " + operation + " without a local identity.");
    }

    if (relays.empty())
    {
        throw logic_error("MessagingService: Cannot " + operation + " without any configured relays.");
    }

    return localPubkey;
};

optional<SendResult> MessagingService::_sendWrapped(
    const vector<string>& relays,
    const string& peerPubkey,
    const string& content)
{
    WrappedEnvelope envelope = this->_builder.buildWrapped(peerPubkey, content);
    if (envelope.recipientCopy == nullptr || envelope.senderCopy == nullptr)
    {
        return nullopt;
    }

    auto [recipientSuccesses, recipientFailures] = this->_pool->publishEvent(relays, envelope.recipientCopy);
    if (recipientSuccesses.empty())
    {
        PLOG_WARNING << "No relay accepted the recipient copy of a wrapped message ("
            << recipientFailures.size() << " failures).";
        return nullopt;
    }

    auto [senderSuccesses, senderFailures] = this->_pool->publishEvent(relays, envelope.senderCopy);
    if (senderSuccesses.empty())
    {
        PLOG_WARNING << "No relay accepted the sender copy of a wrapped message ("
            << senderFailures.size() << " failures).";
        return nullopt;
    }

    PLOG_INFO << "Sent a wrapped message to " << peerPubkey << " via " << recipientSuccesses.size() << " relays.";

    return SendResult{ Scheme::Wrapped, this->_commit(envelope.senderCopy) };
};

SendResult MessagingService::_sendLegacy(
    const vector<string>& relays,
    const string& peerPubkey,
    const string& content)
{
    auto event = this->_builder.buildLegacy(peerPubkey, content);
    if (event == nullptr)
    {
        throw SendError("MessagingService::sendMessage: The message could not be encrypted or signed.");
    }

    auto [successes, failures] = this->_pool->publishEvent(relays, event);
    if (successes.empty())
    {
        PLOG_ERROR << "No relay accepted message " << event->id << " (" << failures.size() << " failures).";
        throw SendError("MessagingService::sendMessage: No relay accepted the message.");
    }

    PLOG_INFO << "Sent a legacy message to " << peerPubkey << " via " << successes.size() << " relays.";

    return SendResult{ Scheme::Legacy, this->_commit(event) };
};

optional<NormalizedMessage> MessagingService::_commit(shared_ptr<Event> publishedEvent)
{
    // The committed message comes from the published event itself, so it matches what a later
    // reload will decrypt.
    auto message = EnvelopeDecryptor::message(this->_decryptor->decrypt(publishedEvent));
    if (!message.has_value())
    {
        PLOG_ERROR << "Published event " << publishedEvent->id << " could not be read back.";
        return nullopt;
    }

    this->_store->ingestOne(*message);

    return message;
};
