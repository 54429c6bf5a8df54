#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

#include "relaysync/notifications/follower_baseline.hpp"
#include "../internal/logging.hpp"

using namespace nlohmann;
using namespace relaysync::internal;
using namespace relaysync::notifications;
using namespace relaysync::storage;
using namespace std;

FollowerBaseline::FollowerBaseline(
    shared_ptr<plog::IAppender> appender,
    shared_ptr<IPersistence> persistence,
    string ownerPubkey,
    time_t recentWindowSeconds,
    time_t initialBackdateSeconds,
    Clock clock)
: _persistence(persistence),
  _ownerPubkey(move(ownerPubkey)),
  _recentWindowSeconds(recentWindowSeconds),
  _initialBackdateSeconds(initialBackdateSeconds),
  _clock(clock ? clock : Clock([]() { return time(nullptr); }))
{
    initLogging(appender);

    if (this->_persistence == nullptr)
    {
        throw invalid_argument("FollowerBaseline: A persistence store is required.");
    }

    if (this->_ownerPubkey.empty())
    {
        throw invalid_argument("FollowerBaseline: An owner public key is required.");
    }

    this->_load();
};

BaselineResult FollowerBaseline::process(const set<string>& observed)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    time_t now = this->_clock();
    BaselineResult result;

    if (this->_state == BaselineState::Uninitialized)
    {
        this->_initialize(observed, now);
        result.isFirstRun = true;

        PLOG_INFO << "Created a follower baseline with " << this->_followers.size() << " followers.";
        return result;
    }

    time_t windowStart = now - this->_recentWindowSeconds;
    for (const auto& [pubkey, firstObserved] : this->_followers)
    {
        if (firstObserved >= windowStart)
        {
            result.recentFollowers[pubkey] = firstObserved;
        }
    }

    for (const string& pubkey : observed)
    {
        if (this->_followers.count(pubkey) == 0)
        {
            result.newFollowers[pubkey] = now;
        }
    }

    for (const auto& [pubkey, discovered] : result.newFollowers)
    {
        this->_followers[pubkey] = discovered;
    }

    this->_lastUpdated = now;
    this->_save();

    PLOG_INFO << "Follower baseline: " << result.newFollowers.size() << " new, "
        << result.recentFollowers.size() << " recent, " << this->_followers.size() << " known.";

    return result;
};

void FollowerBaseline::reset(const set<string>& observed)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_initialize(observed, this->_clock());
};

BaselineState FollowerBaseline::state() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_state;
};

bool FollowerBaseline::isKnownFollower(const string& pubkey) const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_followers.count(pubkey) > 0;
};

size_t FollowerBaseline::followerCount() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_followers.size();
};

string FollowerBaseline::storageKey(const string& ownerPubkey)
{
    return "follower-baseline:" + ownerPubkey;
};

void FollowerBaseline::_load()
{
    optional<string> stored = this->_persistence->get(storageKey(this->_ownerPubkey));
    if (!stored.has_value())
    {
        PLOG_DEBUG << "No follower baseline stored for " << this->_ownerPubkey;
        return;
    }

    map<string, time_t> followers;
    time_t created;
    time_t lastUpdated;
    try
    {
        json snapshot = json::parse(*stored);
        if (snapshot.at("version").get<int>() != SNAPSHOT_VERSION)
        {
            PLOG_WARNING << "Ignoring a follower baseline with unsupported version " << snapshot.at("version");
            return;
        }

        created = snapshot.at("created").get<time_t>();
        lastUpdated = snapshot.at("lastUpdated").get<time_t>();
        followers = snapshot.at("followers").get<map<string, time_t>>();
    }
    catch (const json::exception& e)
    {
        PLOG_WARNING << "Ignoring an unreadable follower baseline: " << e.what();
        return;
    }

    this->_followers = move(followers);
    this->_created = created;
    this->_lastUpdated = lastUpdated;

    this->_state = BaselineState::Tracking;

    time_t now = this->_clock();
    if (this->_isSuspicious(now))
    {
        PLOG_WARNING << "Follower baseline records " << this->_followers.size()
            << " followers all discovered within one hour; backdating them out of the recent window.";

        // Known followers are kept so none of them is ever reported as new again.
        time_t backdated = now - this->_initialBackdateSeconds;
        for (auto& [pubkey, firstObserved] : this->_followers)
        {
            firstObserved = backdated;
        }

        this->_lastUpdated = now;
        this->_save();
    }
};

bool FollowerBaseline::_isSuspicious(time_t now) const
{
    if (this->_followers.size() <= SUSPICIOUS_FOLLOWER_COUNT)
    {
        return false;
    }

    auto [earliest, latest] = minmax_element(
        this->_followers.begin(),
        this->_followers.end(),
        [](const pair<const string, time_t>& lhs, const pair<const string, time_t>& rhs)
        {
            return lhs.second < rhs.second;
        });

    return latest->second - earliest->second < SUSPICIOUS_SPREAD_SECONDS
        && earliest->second >= now - this->_recentWindowSeconds;
};

void FollowerBaseline::_initialize(const set<string>& observed, time_t now)
{
    // Existing followers are backdated out of the recent window, so none is ever reported.
    time_t backdated = now - this->_initialBackdateSeconds;

    this->_followers.clear();
    for (const string& pubkey : observed)
    {
        this->_followers[pubkey] = backdated;
    }

    this->_created = now;
    this->_lastUpdated = now;
    this->_state = BaselineState::Tracking;
    this->_save();
};

void FollowerBaseline::_save()
{
    json snapshot = {
        { "version", SNAPSHOT_VERSION },
        { "created", this->_created },
        { "lastUpdated", this->_lastUpdated },
        { "followers", this->_followers },
    };

    try
    {
        this->_persistence->set(storageKey(this->_ownerPubkey), snapshot.dump());
    }
    catch (const runtime_error& e)
    {
        // The in-memory baseline stays current, so this session still reports each follower once.
        PLOG_ERROR << "Failed to store the follower baseline: " << e.what();
    }
};
