#include <algorithm>
#include <random>
#include <stdexcept>
#include <thread>

#include <nlohmann/json.hpp>
#include <uuid_v4.h>

#include "relaysync/service/relay_pool.hpp"
#include "../internal/logging.hpp"

using namespace nlohmann;
using namespace relaysync::data;
using namespace relaysync::service;
using namespace std;

RelayPool::RelayPool(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<client::IWebSocketClient> client,
    chrono::milliseconds publishTimeout)
: _client(client), _publishTimeout(publishTimeout)
{
    internal::initLogging(appender);

    if (this->_client == nullptr)
    {
        throw invalid_argument("RelayPool::RelayPool: A WebSocket client is required.");
    }

    this->_client->start();
};

RelayPool::~RelayPool()
{
    this->closeRelayConnections();
    this->_client->stop();
};

vector<string> RelayPool::activeRelays() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_activeRelays;
};

vector<string> RelayPool::subscriptionIds() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    vector<string> ids;
    for (const auto& [subscriptionId, subscription] : this->_subscriptions)
    {
        ids.push_back(subscriptionId);
    }

    return ids;
};

vector<string> RelayPool::openRelayConnections(vector<string> relays)
{
    PLOG_INFO << "Attempting to connect to Nostr relays.";

    vector<string> unconnectedRelays;
    for (const string& relay : relays)
    {
        if (!this->_isActive(relay)
            && find(unconnectedRelays.begin(), unconnectedRelays.end(), relay) == unconnectedRelays.end())
        {
            unconnectedRelays.push_back(relay);
        }
    }

    vector<thread> connectionThreads;
    for (const string& relay : unconnectedRelays)
    {
        thread connectionThread([this, relay]() {
            this->_connect(relay);
        });
        connectionThreads.push_back(move(connectionThread));
    }

    for (thread& connectionThread : connectionThreads)
    {
        connectionThread.join();
    }

    vector<string> connectedRelays;
    for (const string& relay : relays)
    {
        if (this->_isActive(relay)
            && find(connectedRelays.begin(), connectedRelays.end(), relay) == connectedRelays.end())
        {
            connectedRelays.push_back(relay);
        }
    }

    PLOG_INFO << "Connected to " << connectedRelays.size() << "/" << relays.size() << " target relays.";

    return connectedRelays;
};

void RelayPool::closeRelayConnections()
{
    unique_lock<mutex> lock(this->_propertyMutex);
    vector<string> relays = move(this->_activeRelays);
    this->_activeRelays.clear();
    lock.unlock();

    if (relays.empty())
    {
        PLOG_VERBOSE << "No active relay connections to close.";
        return;
    }

    PLOG_INFO << "Disconnecting from Nostr relays.";
    for (const string& relay : relays)
    {
        this->_client->closeConnection(relay);
        this->_onDisconnect(relay);
    }
};

tuple<vector<string>, vector<string>> RelayPool::publishEvent(vector<string> relays, shared_ptr<Event> event)
{
    if (event == nullptr || event->id.empty() || event->sig.empty())
    {
        throw invalid_argument("RelayPool::publishEvent: Only signed events can be published.");
    }

    vector<string> successfulRelays;
    vector<string> failedRelays;

    json message = json::array({ "EVENT", *event });
    string payload = message.dump();

    vector<tuple<string, future<bool>>> publishFutures;
    for (const string& relay : relays)
    {
        if (!this->_isActive(relay))
        {
            PLOG_WARNING << "Cannot publish event " << event->id << " to unconnected relay " << relay;
            failedRelays.push_back(relay);
            continue;
        }

        // Register before sending, since the OK message may arrive before `send` returns.
        auto publishPromise = make_shared<promise<bool>>();
        string key = _publishKey(relay, event->id);
        {
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_pendingPublishes[key] = publishPromise;
        }

        auto [uri, success] = this->_client->send(payload, relay);
        if (!success)
        {
            PLOG_WARNING << "Failed to send event " << event->id << " to relay " << relay;
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_pendingPublishes.erase(key);
            failedRelays.push_back(relay);
            continue;
        }

        publishFutures.push_back(make_tuple(relay, publishPromise->get_future()));
    }

    auto deadline = chrono::steady_clock::now() + this->_publishTimeout;
    for (auto& [relay, publishFuture] : publishFutures)
    {
        if (publishFuture.wait_until(deadline) != future_status::ready)
        {
            PLOG_WARNING << "Relay " << relay << " did not acknowledge event " << event->id << " in time.";
            lock_guard<mutex> lock(this->_propertyMutex);
            this->_pendingPublishes.erase(_publishKey(relay, event->id));
            failedRelays.push_back(relay);
            continue;
        }

        if (publishFuture.get())
        {
            successfulRelays.push_back(relay);
        }
        else
        {
            failedRelays.push_back(relay);
        }
    }

    PLOG_INFO << "Published event " << event->id << " to " << successfulRelays.size() << "/" << relays.size() << " target relays.";

    return make_tuple(successfulRelays, failedRelays);
};

string RelayPool::subscribe(
    vector<string> relays,
    vector<shared_ptr<Filters>> filters,
    EventHandler eventHandler,
    EoseHandler eoseHandler,
    CloseHandler closeHandler)
{
    string subscriptionId = this->_generateSubscriptionId();
    string request;

    try
    {
        request = Filters::serialize(subscriptionId, filters);
    }
    catch (const invalid_argument& e)
    {
        PLOG_ERROR << "Failed to serialize filters - invalid object: " << e.what();
        throw;
    }

    auto subscription = make_shared<Subscription>();
    subscription->eventHandler = eventHandler;
    subscription->eoseHandler = eoseHandler;
    subscription->closeHandler = closeHandler;

    vector<string> targetRelays;
    for (const string& relay : relays)
    {
        if (find(targetRelays.begin(), targetRelays.end(), relay) == targetRelays.end())
        {
            targetRelays.push_back(relay);
        }
    }
    subscription->relays = targetRelays;

    // Responses are routed by subscription ID, so the subscription is known before any request goes out.
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        this->_subscriptions[subscriptionId] = subscription;
    }

    vector<string> failedRelays;
    for (const string& relay : targetRelays)
    {
        if (!this->_isActive(relay))
        {
            PLOG_WARNING << "Relay " << relay << " is not connected.";
            failedRelays.push_back(relay);
            continue;
        }

        auto [uri, success] = this->_client->send(request, relay);
        if (success)
        {
            PLOG_VERBOSE << "Sent subscription " << subscriptionId << " to relay " << relay;
        }
        else
        {
            PLOG_WARNING << "Failed to send subscription " << subscriptionId << " to relay " << relay;
            failedRelays.push_back(relay);
        }
    }

    for (const string& relay : failedRelays)
    {
        if (this->_endSubscription(subscriptionId, relay) && closeHandler)
        {
            closeHandler(relay, "error: the subscription could not be sent");
        }
    }

    PLOG_INFO << "Opened subscription " << subscriptionId << " on " << (targetRelays.size() - failedRelays.size()) << "/" << targetRelays.size() << " relays.";

    return subscriptionId;
};

tuple<vector<string>, vector<string>> RelayPool::closeSubscription(string subscriptionId)
{
    vector<string> successfulRelays;
    vector<string> failedRelays;

    unique_lock<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        PLOG_VERBOSE << "Subscription " << subscriptionId << " not found.";
        return make_tuple(successfulRelays, failedRelays);
    }

    vector<string> subscriptionRelays = it->second->relays;
    this->_subscriptions.erase(it);
    lock.unlock();

    string request = this->_generateCloseRequest(subscriptionId);
    for (const string& relay : subscriptionRelays)
    {
        if (!this->_isActive(relay))
        {
            failedRelays.push_back(relay);
            continue;
        }

        auto [uri, success] = this->_client->send(request, relay);
        if (success)
        {
            successfulRelays.push_back(relay);
        }
        else
        {
            PLOG_WARNING << "Failed to send close request to relay " << relay;
            failedRelays.push_back(relay);
        }
    }

    PLOG_INFO << "Sent CLOSE request for subscription " << subscriptionId << " to " << successfulRelays.size() << "/" << subscriptionRelays.size() << " relays.";

    return make_tuple(successfulRelays, failedRelays);
};

bool RelayPool::_isActive(const string& relay) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return find(this->_activeRelays.begin(), this->_activeRelays.end(), relay) != this->_activeRelays.end();
};

void RelayPool::_connect(string relay)
{
    PLOG_VERBOSE << "Connecting to relay " << relay;
    this->_client->openConnection(relay);

    bool isConnected = this->_client->isConnected(relay);
    if (!isConnected)
    {
        PLOG_ERROR << "Failed to connect to relay " << relay;
        return;
    }

    this->_client->receive(relay, [this, relay](const string& message)
    {
        this->_onMessage(relay, message);
    });
    this->_client->onDisconnect(relay, [this](const string& uri)
    {
        this->_onDisconnect(uri);
    });

    lock_guard<mutex> lock(this->_propertyMutex);
    this->_activeRelays.push_back(relay);
    PLOG_VERBOSE << "Connected to relay " << relay;
};

string RelayPool::_generateSubscriptionId() const
{
    UUIDv4::UUIDGenerator<std::mt19937_64> uuidGenerator;
    UUIDv4::UUID uuid = uuidGenerator.getUUID();
    return uuid.str();
};

string RelayPool::_generateCloseRequest(const string& subscriptionId) const
{
    json jarr = json::array({ "CLOSE", subscriptionId });
    return jarr.dump();
};

string RelayPool::_publishKey(const string& relay, const string& eventId)
{
    return relay + "|" + eventId;
};

shared_ptr<RelayPool::Subscription> RelayPool::_findSubscription(const string& subscriptionId, const string& relay)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        return nullptr;
    }

    const auto& relays = it->second->relays;
    if (find(relays.begin(), relays.end(), relay) == relays.end())
    {
        return nullptr;
    }

    return it->second;
};

bool RelayPool::_endSubscription(const string& subscriptionId, const string& relay)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    auto it = this->_subscriptions.find(subscriptionId);
    if (it == this->_subscriptions.end())
    {
        return false;
    }

    auto& relays = it->second->relays;
    auto relayIt = find(relays.begin(), relays.end(), relay);
    if (relayIt == relays.end())
    {
        return false;
    }

    relays.erase(relayIt);
    return true;
};

void RelayPool::_onMessage(const string& relay, const string& message)
{
    try
    {
        json jMessage = json::parse(message);
        string messageType = jMessage.at(0).get<string>();
        if (messageType == "EVENT")
        {
            string subscriptionId = jMessage.at(1).get<string>();
            auto subscription = this->_findSubscription(subscriptionId, relay);
            if (subscription == nullptr)
            {
                PLOG_VERBOSE << "Dropping event for closed subscription " << subscriptionId << " from relay " << relay;
                return;
            }

            auto event = make_shared<Event>(Event::fromJson(jMessage.at(2)));
            if (subscription->eventHandler)
            {
                subscription->eventHandler(relay, event);
            }
        }
        else if (messageType == "EOSE")
        {
            string subscriptionId = jMessage.at(1).get<string>();
            auto subscription = this->_findSubscription(subscriptionId, relay);
            if (subscription != nullptr && subscription->eoseHandler)
            {
                subscription->eoseHandler(relay);
            }
        }
        else if (messageType == "CLOSED")
        {
            string subscriptionId = jMessage.at(1).get<string>();
            string reason = jMessage.size() > 2 ? jMessage.at(2).get<string>() : string();
            auto subscription = this->_findSubscription(subscriptionId, relay);
            if (subscription != nullptr && this->_endSubscription(subscriptionId, relay))
            {
                PLOG_WARNING << "Relay " << relay << " closed subscription " << subscriptionId << ": " << reason;
                if (subscription->closeHandler)
                {
                    subscription->closeHandler(relay, reason);
                }
            }
        }
        else if (messageType == "OK")
        {
            string eventId = jMessage.at(1).get<string>();
            bool isAccepted = jMessage.at(2).get<bool>();
            string reason = jMessage.size() > 3 ? jMessage.at(3).get<string>() : string();
            this->_onAcceptance(relay, eventId, isAccepted, reason);
        }
        else if (messageType == "NOTICE")
        {
            PLOG_INFO << "Notice from relay " << relay << ": " << jMessage.at(1).get<string>();
        }
        else
        {
            PLOG_VERBOSE << "Ignoring " << messageType << " message from relay " << relay;
        }
    }
    catch (const json::exception& je)
    {
        PLOG_WARNING << "Ignoring malformed message from relay " << relay << ": " << je.what();
    }
};

void RelayPool::_onAcceptance(const string& relay, const string& eventId, bool isAccepted, const string& reason)
{
    shared_ptr<promise<bool>> publishPromise;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto it = this->_pendingPublishes.find(_publishKey(relay, eventId));
        if (it == this->_pendingPublishes.end())
        {
            PLOG_VERBOSE << "Ignoring unexpected OK for event " << eventId << " from relay " << relay;
            return;
        }

        publishPromise = it->second;
        this->_pendingPublishes.erase(it);
    }

    if (isAccepted)
    {
        PLOG_INFO << "Relay " << relay << " accepted event: " << eventId;
    }
    else
    {
        PLOG_WARNING << "Relay " << relay << " rejected event " << eventId << ": " << reason;
    }

    publishPromise->set_value(isAccepted);
};

void RelayPool::_onDisconnect(const string& relay)
{
    vector<shared_ptr<Subscription>> endedSubscriptions;
    vector<shared_ptr<promise<bool>>> abandonedPublishes;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        auto relayIt = find(this->_activeRelays.begin(), this->_activeRelays.end(), relay);
        if (relayIt != this->_activeRelays.end())
        {
            this->_activeRelays.erase(relayIt);
        }

        for (auto& [subscriptionId, subscription] : this->_subscriptions)
        {
            auto it = find(subscription->relays.begin(), subscription->relays.end(), relay);
            if (it != subscription->relays.end())
            {
                subscription->relays.erase(it);
                endedSubscriptions.push_back(subscription);
            }
        }

        string prefix = _publishKey(relay, string());
        for (auto it = this->_pendingPublishes.begin(); it != this->_pendingPublishes.end();)
        {
            if (it->first.rfind(prefix, 0) == 0)
            {
                abandonedPublishes.push_back(it->second);
                it = this->_pendingPublishes.erase(it);
            }
            else
            {
                ++it;
            }
        }
    }

    for (auto& publishPromise : abandonedPublishes)
    {
        publishPromise->set_value(false);
    }

    for (auto& subscription : endedSubscriptions)
    {
        if (subscription->closeHandler)
        {
            subscription->closeHandler(relay, "error: connection closed");
        }
    }
};
