#include <stdexcept>

#include "relaysync/notifications/notification_type.hpp"

using namespace std;

namespace relaysync
{
namespace notifications
{
string toString(NotificationType type)
{
    switch (type)
    {
    case NotificationType::Reply:
        return "reply";
    case NotificationType::Like:
        return "like";
    case NotificationType::Repost:
        return "repost";
    case NotificationType::Zap:
        return "zap";
    case NotificationType::Tip:
        return "tip";
    case NotificationType::Follow:
        return "follow";
    }

    return "unknown";
};

NotificationType notificationTypeFromString(const string& name)
{
    for (NotificationType type : allNotificationTypes())
    {
        if (toString(type) == name)
        {
            return type;
        }
    }

    throw invalid_argument("notificationTypeFromString: Unknown notification type '" + name + "'.");
};

set<NotificationType> allNotificationTypes()
{
    return {
        NotificationType::Reply,
        NotificationType::Like,
        NotificationType::Repost,
        NotificationType::Zap,
        NotificationType::Tip,
        NotificationType::Follow
    };
};
} // namespace notifications
} // namespace relaysync
