#pragma once

#include <set>
#include <string>

namespace relaysync
{
namespace notifications
{
/**
 * @brief The kinds of interaction surfaced in the notification feed.
 */
enum class NotificationType
{
    Reply,
    Like,
    Repost,
    Zap,
    Tip,
    Follow
};

/**
 * @brief Gets the configuration name of a notification type, e.g. `"reply"`.
 */
std::string toString(NotificationType type);

/**
 * @brief Parses a notification type from its configuration name.
 * @throws `std::invalid_argument` if the name is not recognized.
 */
NotificationType notificationTypeFromString(const std::string& name);

/**
 * @brief Gets the set of every notification type.
 */
std::set<NotificationType> allNotificationTypes();
} // namespace notifications
} // namespace relaysync
