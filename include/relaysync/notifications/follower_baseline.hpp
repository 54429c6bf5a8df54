#pragma once

#include <ctime>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>

#include <plog/Log.h>

#include "relaysync/storage/persistence.hpp"

namespace relaysync
{
namespace notifications
{
enum class BaselineState
{
    Uninitialized, ///< No valid snapshot has been stored for the owner.
    Tracking ///< A snapshot exists, and new followers are diffed against it.
};

/**
 * @brief The followers surfaced by one baseline run.
 */
struct BaselineResult
{
    std::map<std::string, std::time_t> newFollowers; ///< First seen on this run, with the discovery time.
    std::map<std::string, std::time_t> recentFollowers; ///< Seen before, first observed within the window.
    bool isFirstRun = false; ///< The run created the baseline and so reported nothing.
};

/**
 * @brief A persisted snapshot of the follower set, used to report each new follower once.
 * @remark Follow lists carry no per-follower timestamp, so each follower is stamped with the local
 * time at which it was first observed.  Known followers are never removed, so a follower who
 * leaves and returns is not reported again.
 */
class FollowerBaseline
{
public:
    typedef std::function<std::time_t()> Clock;

    static constexpr int SNAPSHOT_VERSION = 1;

    ///< A snapshot with more followers than this, all observed within one hour inside the recent
    ///< window, was written without backdating.  Its followers are kept and backdated on load.
    static constexpr size_t SUSPICIOUS_FOLLOWER_COUNT = 5;
    static constexpr std::time_t SUSPICIOUS_SPREAD_SECONDS = 60 * 60;

    /**
     * @param persistence The store holding the snapshot.
     * @param ownerPubkey The identity whose followers are tracked.
     * @param recentWindowSeconds How long after first observation a follower counts as recent.
     * @param initialBackdateSeconds The age given to followers recorded by the first run.  It
     * should exceed the recent window, so those followers are never shown as recent.
     * @param clock The source of the current time.
     * @throws `std::invalid_argument` if the persistence is null or the owner is empty.
     */
    FollowerBaseline(
        std::shared_ptr<plog::IAppender> appender,
        std::shared_ptr<storage::IPersistence> persistence,
        std::string ownerPubkey,
        std::time_t recentWindowSeconds = 7 * 24 * 60 * 60,
        std::time_t initialBackdateSeconds = 30 * 24 * 60 * 60,
        Clock clock = Clock());

    /**
     * @brief Diffs the observed followers against the baseline and records the new ones.
     * @param observed The public keys of everyone currently following the owner.
     * @returns The new and recent followers.  Both are empty on the first run.
     */
    BaselineResult process(const std::set<std::string>& observed);

    /**
     * @brief Discards the baseline and records the given followers as a first run would.
     */
    void reset(const std::set<std::string>& observed);

    BaselineState state() const;

    bool isKnownFollower(const std::string& pubkey) const;

    size_t followerCount() const;

    /**
     * @brief Gets the persistence key of the snapshot for the given owner.
     */
    static std::string storageKey(const std::string& ownerPubkey);

private:
    std::shared_ptr<storage::IPersistence> _persistence;

    std::string _ownerPubkey;

    std::time_t _recentWindowSeconds;

    std::time_t _initialBackdateSeconds;

    Clock _clock;

    mutable std::mutex _propertyMutex;

    BaselineState _state = BaselineState::Uninitialized;

    std::time_t _created = 0;

    std::time_t _lastUpdated = 0;

    ///< Known followers mapped to the time they were first observed.
    std::map<std::string, std::time_t> _followers;

    void _load();

    bool _isSuspicious(std::time_t now) const;

    void _initialize(const std::set<std::string>& observed, std::time_t now);

    void _save();
};
} // namespace notifications
} // namespace relaysync
