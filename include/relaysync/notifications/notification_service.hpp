#pragma once

#include <memory>
#include <string>
#include <vector>

#include <plog/Log.h>

#include "relaysync/config/client_config.hpp"
#include "relaysync/data/profile.hpp"
#include "relaysync/notifications/notification_aggregator.hpp"
#include "relaysync/service/relay_fanout.hpp"
#include "relaysync/service/relay_pool.hpp"
#include "relaysync/signer/key_store.hpp"

namespace relaysync
{
namespace notifications
{
/**
 * @brief Fetches the local identity's notifications and decorates them with profiles and notes.
 */
class NotificationService
{
public:
    NotificationService(
        std::shared_ptr<plog::IAppender> appender,
        config::ClientConfig config,
        std::shared_ptr<service::IRelayPool> pool,
        std::shared_ptr<service::RelayFanout> fanout,
        std::shared_ptr<signer::IKeyStore> keyStore,
        std::shared_ptr<NotificationAggregator> aggregator,
        std::shared_ptr<data::ProfileCache> profiles);

    /**
     * @brief Queries the configured relays for interactions and rebuilds the notification feed.
     * @returns The decorated feed, newest first.
     * @throws `std::logic_error` if no identity is loaded, no relays are configured, or the
     * aggregator belongs to a different identity.
     * @remark Each query is bounded by its configured timeout, so slow relays shrink the feed
     * rather than failing the fetch.
     */
    std::vector<NotificationItem> fetchNotifications();

private:
    config::ClientConfig _config;

    std::shared_ptr<service::IRelayPool> _pool;

    std::shared_ptr<service::RelayFanout> _fanout;

    std::shared_ptr<signer::IKeyStore> _keyStore;

    std::shared_ptr<NotificationAggregator> _aggregator;

    std::shared_ptr<data::ProfileCache> _profiles;

    void _fetchProfiles(const std::vector<std::string>& relays);

    void _fetchTargetNotes(const std::vector<std::string>& relays);
};
} // namespace notifications
} // namespace relaysync
