#include <algorithm>
#include <future>
#include <stdexcept>

#include "relaysync/service/relay_fanout.hpp"
#include "../internal/logging.hpp"

using namespace relaysync::data;
using namespace relaysync::service;
using namespace std;

#pragma region FanoutSubscription

FanoutSubscription::FanoutSubscription(
    shared_ptr<IRelayPool> pool,
    vector<string> relays,
    FanoutHandlers handlers)
: _pool(pool), _handlers(move(handlers)), _relayCount(relays.size())
{
    this->_pendingRelays.insert(relays.begin(), relays.end());
};

FanoutSubscription::~FanoutSubscription()
{
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        this->_isClosed = true;
    }
    this->_timerCondition.notify_all();

    if (this->_timerThread.joinable())
    {
        // The timer thread may hold the last reference, in which case it is already returning.
        if (this->_timerThread.get_id() == this_thread::get_id())
        {
            this->_timerThread.detach();
        }
        else
        {
            this->_timerThread.join();
        }
    }
};

void FanoutSubscription::close()
{
    string subscriptionId;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (this->_isClosed)
        {
            return;
        }

        this->_isClosed = true;
        this->_backlog.clear();
        subscriptionId = this->_subscriptionId;
    }
    this->_timerCondition.notify_all();

    // A close requested before the pool assigned an ID is finished by `_attach`.
    if (!subscriptionId.empty())
    {
        this->_pool->closeSubscription(subscriptionId);
        PLOG_VERBOSE << "Closed fan-out subscription " << subscriptionId;
    }
};

bool FanoutSubscription::isClosed() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_isClosed;
};

bool FanoutSubscription::isBacklogComplete() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_isBacklogComplete;
};

vector<string> FanoutSubscription::endedRelays() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_endedRelays;
};

string FanoutSubscription::subscriptionId() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_subscriptionId;
};

void FanoutSubscription::_attach(const string& subscriptionId)
{
    bool isClosed;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        this->_subscriptionId = subscriptionId;
        isClosed = this->_isClosed;
    }

    if (isClosed)
    {
        this->_pool->closeSubscription(subscriptionId);
    }
};

void FanoutSubscription::_startTimer(chrono::milliseconds timeout)
{
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (this->_isBacklogComplete || this->_isClosed)
        {
            return;
        }
    }

    auto deadline = chrono::steady_clock::now() + timeout;
    weak_ptr<FanoutSubscription> weakSelf = this->shared_from_this();
    this->_timerThread = thread([this, weakSelf, deadline]()
    {
        {
            unique_lock<mutex> lock(this->_propertyMutex);
            bool isSettled = this->_timerCondition.wait_until(lock, deadline, [this]()
            {
                return this->_isBacklogComplete || this->_isClosed;
            });

            if (isSettled)
            {
                return;
            }
        }

        // Handlers may drop the last outside reference, so completion runs with one held here.
        if (auto self = weakSelf.lock())
        {
            self->_completeBacklog("timeout");
        }
    });
};

void FanoutSubscription::_onEvent(const string& relay, shared_ptr<Event> event)
{
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (this->_isClosed || this->_failedRelays.count(relay) > 0)
        {
            return;
        }

        if (!this->_deduper.admit(*event))
        {
            PLOG_VERBOSE << "Dropping duplicate event " << event->id << " from relay " << relay;
            return;
        }

        if (!this->_isBacklogComplete)
        {
            this->_backlog.push_back(event);
            return;
        }
    }

    lock_guard<mutex> deliveryLock(this->_deliveryMutex);
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (this->_isClosed)
        {
            return;
        }
    }

    if (this->_handlers.onEvent)
    {
        this->_handlers.onEvent(event);
    }
};

void FanoutSubscription::_onRelayEnded(const string& relay, bool isFailure)
{
    bool isComplete;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (isFailure)
        {
            this->_failedRelays.insert(relay);
        }

        if (this->_pendingRelays.erase(relay) == 0)
        {
            return;
        }

        this->_endedRelays.push_back(relay);
        isComplete = this->_pendingRelays.empty();
    }

    if (isComplete)
    {
        this->_completeBacklog("all relays ended");
    }
};

void FanoutSubscription::_completeBacklog(const string& cause)
{
    lock_guard<mutex> deliveryLock(this->_deliveryMutex);

    vector<shared_ptr<Event>> backlog;
    size_t endedCount;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        if (this->_isBacklogComplete || this->_isClosed)
        {
            return;
        }

        this->_isBacklogComplete = true;
        backlog.swap(this->_backlog);
        endedCount = this->_endedRelays.size();
    }
    this->_timerCondition.notify_all();

    PLOG_INFO << "Backlog complete (" << cause << ") with " << backlog.size() << " events; "
        << endedCount << "/" << this->_relayCount << " relays ended.";

    if (this->_handlers.onBacklogComplete)
    {
        this->_handlers.onBacklogComplete(move(backlog));
    }
};

#pragma endregion

#pragma region RelayFanout

RelayFanout::RelayFanout(shared_ptr<plog::IAppender> appender, shared_ptr<IRelayPool> pool)
: _pool(pool)
{
    internal::initLogging(appender);

    if (this->_pool == nullptr)
    {
        throw invalid_argument("RelayFanout::RelayFanout: A relay pool is required.");
    }
};

vector<shared_ptr<Event>> RelayFanout::fanoutQuery(
    vector<string> relays,
    vector<shared_ptr<Filters>> filters,
    chrono::milliseconds timeout)
{
    auto resultPromise = make_shared<promise<vector<shared_ptr<Event>>>>();
    future<vector<shared_ptr<Event>>> resultFuture = resultPromise->get_future();

    FanoutHandlers handlers;
    handlers.onBacklogComplete = [resultPromise](vector<shared_ptr<Event>> events)
    {
        resultPromise->set_value(move(events));
    };

    auto subscription = this->fanoutSubscribe(relays, filters, handlers, timeout);
    vector<shared_ptr<Event>> events = resultFuture.get();
    subscription->close();

    return events;
};

shared_ptr<FanoutSubscription> RelayFanout::fanoutSubscribe(
    vector<string> relays,
    vector<shared_ptr<Filters>> filters,
    FanoutHandlers handlers,
    chrono::milliseconds timeout)
{
    vector<string> uniqueRelays;
    for (const string& relay : relays)
    {
        if (find(uniqueRelays.begin(), uniqueRelays.end(), relay) == uniqueRelays.end())
        {
            uniqueRelays.push_back(relay);
        }
    }

    // Validate up front, so an invalid request never reaches the pool.
    for (const auto& filter : filters)
    {
        if (filter == nullptr)
        {
            throw invalid_argument("RelayFanout::fanoutSubscribe: Filter sets must not be null.");
        }
        filter->validate();
    }

    auto subscription = shared_ptr<FanoutSubscription>(
        new FanoutSubscription(this->_pool, uniqueRelays, move(handlers)));

    if (uniqueRelays.empty())
    {
        PLOG_WARNING << "Fan-out requested with no relays.";
        subscription->_completeBacklog("no relays");
        return subscription;
    }

    // The pool must not keep the subscription alive, so its callbacks hold weak references.
    weak_ptr<FanoutSubscription> weakSubscription = subscription;
    string subscriptionId = this->_pool->subscribe(
        uniqueRelays,
        filters,
        [weakSubscription](const string& relay, shared_ptr<Event> event)
        {
            if (auto subscription = weakSubscription.lock())
            {
                subscription->_onEvent(relay, event);
            }
        },
        [weakSubscription](const string& relay)
        {
            if (auto subscription = weakSubscription.lock())
            {
                subscription->_onRelayEnded(relay, false);
            }
        },
        [weakSubscription](const string& relay, const string& reason)
        {
            if (auto subscription = weakSubscription.lock())
            {
                PLOG_WARNING << "Relay " << relay << " ended the subscription: " << reason;
                subscription->_onRelayEnded(relay, true);
            }
        });

    subscription->_attach(subscriptionId);
    subscription->_startTimer(timeout);

    return subscription;
};

#pragma endregion
