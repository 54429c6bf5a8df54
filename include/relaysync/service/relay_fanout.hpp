#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <plog/Log.h>

#include "relaysync/data/data.hpp"
#include "relaysync/service/event_deduper.hpp"
#include "relaysync/service/relay_pool.hpp"

namespace relaysync
{
namespace service
{
/**
 * @brief Callbacks of a fan-out subscription.
 * @remark Calls to the handlers of one subscription never overlap.  `onBacklogComplete` is
 * always invoked before the first `onEvent`.
 */
struct FanoutHandlers
{
    ///< Receives the deduplicated backlog, once, when every relay has ended it or the timeout elapsed.
    std::function<void(std::vector<std::shared_ptr<data::Event>>)> onBacklogComplete;

    ///< Receives each new event that arrives after the backlog is complete.
    std::function<void(std::shared_ptr<data::Event>)> onEvent;
};

/**
 * @brief A handle to a subscription fanned out over several relays.
 * @remark Dropping the last reference does not close the relay subscription; call `close`.
 */
class FanoutSubscription : public std::enable_shared_from_this<FanoutSubscription>
{
public:
    ~FanoutSubscription();

    /**
     * @brief Stops delivery to the handlers and releases the relay subscription.
     * @remark Events still in flight are dropped.  Safe to call more than once, and from within
     * a handler.
     */
    void close();

    bool isClosed() const;

    bool isBacklogComplete() const;

    /**
     * @brief Gets the relays that have ended their backlog, by EOSE or by error, in the order
     * they did so.
     */
    std::vector<std::string> endedRelays() const;

    std::string subscriptionId() const;

private:
    friend class RelayFanout;

    FanoutSubscription(
        std::shared_ptr<IRelayPool> pool,
        std::vector<std::string> relays,
        FanoutHandlers handlers);

    std::shared_ptr<IRelayPool> _pool;

    FanoutHandlers _handlers;

    ///< Admits each event once across every relay of the subscription.
    EventDeduper _deduper;

    mutable std::mutex _propertyMutex;

    ///< Serializes handler calls.  Always acquired before `_propertyMutex`.
    std::mutex _deliveryMutex;

    std::condition_variable _timerCondition;

    std::thread _timerThread;

    std::string _subscriptionId;

    size_t _relayCount;

    ///< Relays that have not yet ended their backlog.
    std::set<std::string> _pendingRelays;

    ///< Relays whose subscription ended in error.  Their events are dropped.
    std::set<std::string> _failedRelays;

    std::vector<std::string> _endedRelays;

    std::vector<std::shared_ptr<data::Event>> _backlog;

    bool _isBacklogComplete = false;

    bool _isClosed = false;

    void _attach(const std::string& subscriptionId);

    void _startTimer(std::chrono::milliseconds timeout);

    void _onEvent(const std::string& relay, std::shared_ptr<data::Event> event);

    void _onRelayEnded(const std::string& relay, bool isFailure);

    void _completeBacklog(const std::string& cause);
};

/**
 * @brief Runs one logical query or subscription against many relays at once.
 * @remark Every relay gets the same filter sets.  Results are merged and deduplicated, and the
 * backlog is bounded: it is complete when every relay has sent EOSE or failed, or when the
 * timeout elapses, whichever comes first.  Slow, absent, or failing relays only shrink the
 * result; they never fail the operation.
 */
class RelayFanout
{
public:
    RelayFanout(std::shared_ptr<plog::IAppender> appender, std::shared_ptr<IRelayPool> pool);

    /**
     * @brief Fetches the stored events matching the filters from every given relay.
     * @returns The deduplicated events received before the backlog completed.
     * @throws `std::invalid_argument` if the filters are invalid.
     * @remark Blocks for at most `timeout`.  The subscription is closed before returning.
     */
    std::vector<std::shared_ptr<data::Event>> fanoutQuery(
        std::vector<std::string> relays,
        std::vector<std::shared_ptr<data::Filters>> filters,
        std::chrono::milliseconds timeout);

    /**
     * @brief Subscribes to the filters on every given relay, delivering the backlog as one batch
     * and every later event individually.
     * @returns A handle to the subscription.
     * @throws `std::invalid_argument` if the filters are invalid.
     * @remark When no relay can be reached, `onBacklogComplete` may be invoked with an empty
     * batch before this method returns.
     */
    std::shared_ptr<FanoutSubscription> fanoutSubscribe(
        std::vector<std::string> relays,
        std::vector<std::shared_ptr<data::Filters>> filters,
        FanoutHandlers handlers,
        std::chrono::milliseconds timeout);

private:
    std::shared_ptr<IRelayPool> _pool;
};
} // namespace service
} // namespace relaysync
