#pragma once

#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <plog/Log.h>

#include "relaysync/data/data.hpp"
#include "relaysync/data/profile.hpp"
#include "relaysync/notifications/follower_baseline.hpp"
#include "relaysync/notifications/notification_type.hpp"
#include "relaysync/storage/watermark_store.hpp"

namespace relaysync
{
namespace notifications
{
/**
 * @brief One row of the notification feed, for one interaction event.
 */
struct NotificationItem
{
    std::string id; ///< The interaction event ID, or `follow-<pubkey>` for a follow with no known event.
    NotificationType type = NotificationType::Reply;
    std::time_t timestamp = 0; ///< Event time, or the local discovery time for follows.
    std::string actorPubkey; ///< Who interacted.  For tips, the disclosed sender.
    std::optional<std::string> targetNoteId; ///< The note interacted with.  Never set for follows.
    std::string contentExcerpt; ///< A short rendering of the interaction.
    std::string message; ///< The memo attached to a tip.
    std::shared_ptr<const data::Profile> profile; ///< The actor's cached profile, if known.
    std::shared_ptr<const data::Event> targetNote; ///< The resolved target note, if fetched.
    bool targetMissing = false; ///< The target note was looked up and no relay had it.
};

enum class NotificationView
{
    All,
    Mentions ///< Replies that mention someone.
};

/**
 * @brief Turns interaction events into a flat feed with one item per event, newest first.
 * @remark Follow events are not shown directly.  Their authors are diffed against the follower
 * baseline, and only new and recent followers become items.  All methods are thread-safe.
 */
class NotificationAggregator
{
public:
    ///< Replies are cut to this many characters.
    static constexpr size_t REPLY_EXCERPT_LENGTH = 150;

    /**
     * @param localPubkey The identity whose notifications are aggregated.
     * @param baseline The follower baseline of the same identity.
     * @param watermarks The store holding the notifications watermark.
     * @param maxItems The most interaction items kept, newest first.  Follow items are not counted.
     * @throws `std::invalid_argument` if a dependency is null or the identity is empty.
     */
    NotificationAggregator(
        std::shared_ptr<plog::IAppender> appender,
        std::string localPubkey,
        std::shared_ptr<FollowerBaseline> baseline,
        std::shared_ptr<storage::WatermarkStore> watermarks,
        size_t maxItems = 100);

    /**
     * @brief Builds the feed from a batch of interaction events, replacing the previous feed.
     * @param events Events from the notification queries, possibly duplicated.
     * @param enabledTypes The notification types to surface.  Other events are dropped.
     * @returns The new feed, sorted by timestamp descending.
     */
    std::vector<NotificationItem> ingest(
        const std::vector<std::shared_ptr<data::Event>>& events,
        const std::set<NotificationType>& enabledTypes);

    /**
     * @brief Builds one filter set per enabled notification type.
     * @returns The filters.  Empty if no type is enabled.
     */
    static std::vector<std::shared_ptr<data::Filters>> buildFilters(
        const std::string& localPubkey,
        const std::set<NotificationType>& enabledTypes,
        int limit);

    /**
     * @brief Counts the items newer than the notifications watermark.
     */
    size_t unreadCount() const;

    /**
     * @brief Advances the notifications watermark to the newest item.
     */
    void markAllRead();

    std::vector<NotificationItem> items() const;

    std::vector<NotificationItem> filtered(NotificationView view) const;

    /**
     * @brief Gets the distinct actors of the current feed.
     */
    std::vector<std::string> actorPubkeys() const;

    /**
     * @brief Gets the distinct target note IDs of the current feed.
     */
    std::vector<std::string> targetNoteIds() const;

    /**
     * @brief Decorates each item with its actor's profile, where the cache has one.
     */
    void attachProfiles(const data::ProfileCache& profiles);

    /**
     * @brief Decorates each item with its target note.
     * @param notes The notes found by a lookup of `targetNoteIds`.  Items whose note is absent
     * are marked as missing.
     */
    void attachTargetNotes(const std::vector<std::shared_ptr<data::Event>>& notes);

    std::string localPubkey() const;

private:
    std::string _localPubkey;

    std::shared_ptr<FollowerBaseline> _baseline;

    std::shared_ptr<storage::WatermarkStore> _watermarks;

    size_t _maxItems;

    mutable std::mutex _propertyMutex;

    std::vector<NotificationItem> _items;

    /**
     * @brief Maps an interaction event to a feed item.
     * @returns The item, or `std::nullopt` if the event is not a usable interaction.
     */
    std::optional<NotificationItem> _toItem(const data::Event& event, NotificationType type) const;

    static std::optional<NotificationType> _typeOf(data::EventKind kind);

    static std::string _excerpt(const std::string& content, size_t maxCharacters);

    static bool _isNewerFirst(const NotificationItem& lhs, const NotificationItem& rhs);
};
} // namespace notifications
} // namespace relaysync
