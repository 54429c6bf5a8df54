#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <tuple>
#include <unordered_map>
#include <vector>

#include <plog/Log.h>

#include "relaysync/client/web_socket_client.hpp"
#include "relaysync/data/data.hpp"

namespace relaysync
{
namespace service
{
/**
 * @brief Invoked with the relay URI and each event a relay sends for a subscription.
 */
typedef std::function<void(const std::string&, std::shared_ptr<data::Event>)> EventHandler;

/**
 * @brief Invoked with the relay URI when a relay has sent all of its stored events.
 */
typedef std::function<void(const std::string&)> EoseHandler;

/**
 * @brief Invoked with the relay URI and a reason when a relay ends a subscription, or the
 * subscription could not be opened on that relay.
 */
typedef std::function<void(const std::string&, const std::string&)> CloseHandler;

/**
 * @brief An interface for a set of relay connections speaking the NIP-01 protocol.
 */
class IRelayPool
{
public:
    virtual ~IRelayPool() = default;

    /**
     * @brief Opens connections to the given relays.
     * @returns The subset of the given relays to which a connection is open.
     */
    virtual std::vector<std::string> openRelayConnections(std::vector<std::string> relays) = 0;

    /**
     * @brief Closes all open relay connections.
     */
    virtual void closeRelayConnections() = 0;

    /**
     * @brief Publishes a signed event to the given relays.
     * @returns A tuple of `std::vector<std::string>` objects, of the form `<successes, failures>`,
     * indicating which relays accepted the event, and which rejected it, failed to receive it, or
     * did not answer in time.
     * @throws `std::invalid_argument` if the event is unsigned.
     */
    virtual std::tuple<std::vector<std::string>, std::vector<std::string>> publishEvent(
        std::vector<std::string> relays,
        std::shared_ptr<data::Event> event) = 0;

    /**
     * @brief Opens a subscription with the given filter sets on the given relays.
     * @param eventHandler Invoked for each event received on the subscription.
     * @param eoseHandler Invoked once per relay when it has sent all of its stored events.
     * @param closeHandler Invoked once per relay that ends the subscription, drops its
     * connection, or could not be sent the request.  The relay sends nothing further.
     * @returns The ID of the subscription.
     * @throws `std::invalid_argument` if the filters are invalid.
     * @remark Handlers may be invoked before this method returns, and are invoked on the
     * transport's threads otherwise.
     */
    virtual std::string subscribe(
        std::vector<std::string> relays,
        std::vector<std::shared_ptr<data::Filters>> filters,
        EventHandler eventHandler,
        EoseHandler eoseHandler,
        CloseHandler closeHandler) = 0;

    /**
     * @brief Closes the subscription with the given ID on every relay it is open on.
     * @returns A tuple of `std::vector<std::string>` objects, of the form `<successes, failures>`,
     * indicating to which relays the CLOSE message was sent.
     * @remark Messages arriving for the subscription after this method returns are dropped.
     */
    virtual std::tuple<std::vector<std::string>, std::vector<std::string>> closeSubscription(
        std::string subscriptionId) = 0;
};

class RelayPool : public IRelayPool
{
public:
    RelayPool(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<client::IWebSocketClient> client,
        std::chrono::milliseconds publishTimeout = std::chrono::milliseconds(5000));

    ~RelayPool() override;

    std::vector<std::string> activeRelays() const;

    std::vector<std::string> subscriptionIds() const;

    std::vector<std::string> openRelayConnections(std::vector<std::string> relays) override;

    void closeRelayConnections() override;

    std::tuple<std::vector<std::string>, std::vector<std::string>> publishEvent(
        std::vector<std::string> relays,
        std::shared_ptr<data::Event> event) override;

    std::string subscribe(
        std::vector<std::string> relays,
        std::vector<std::shared_ptr<data::Filters>> filters,
        EventHandler eventHandler,
        EoseHandler eoseHandler,
        CloseHandler closeHandler) override;

    std::tuple<std::vector<std::string>, std::vector<std::string>> closeSubscription(
        std::string subscriptionId) override;

private:
    struct Subscription
    {
        std::vector<std::string> relays; ///< Relays on which the subscription is still open.
        EventHandler eventHandler;
        EoseHandler eoseHandler;
        CloseHandler closeHandler;
    };

    ///< The WebSocket client used to communicate with relays.
    std::shared_ptr<client::IWebSocketClient> _client;

    ///< How long `publishEvent` waits for each relay's OK message.
    std::chrono::milliseconds _publishTimeout;

    ///< A mutex to protect the instance properties.
    mutable std::mutex _propertyMutex;

    ///< The set of relays to which the pool is currently connected.
    std::vector<std::string> _activeRelays;

    ///< Open subscriptions, keyed by subscription ID.
    std::unordered_map<std::string, std::shared_ptr<Subscription>> _subscriptions;

    ///< Publishes awaiting an OK message, keyed by relay and event ID.
    std::unordered_map<std::string, std::shared_ptr<std::promise<bool>>> _pendingPublishes;

    bool _isActive(const std::string& relay) const;

    void _connect(std::string relay);

    std::string _generateSubscriptionId() const;

    std::string _generateCloseRequest(const std::string& subscriptionId) const;

    static std::string _publishKey(const std::string& relay, const std::string& eventId);

    std::shared_ptr<Subscription> _findSubscription(const std::string& subscriptionId, const std::string& relay);

    bool _endSubscription(const std::string& subscriptionId, const std::string& relay);

    void _onMessage(const std::string& relay, const std::string& message);

    void _onAcceptance(const std::string& relay, const std::string& eventId, bool isAccepted, const std::string& reason);

    void _onDisconnect(const std::string& relay);
};
} // namespace service
} // namespace relaysync
