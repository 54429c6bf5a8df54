#include <stdexcept>

#include "relaysync/notifications/notification_service.hpp"
#include "../internal/logging.hpp"

using namespace relaysync::config;
using namespace relaysync::data;
using namespace relaysync::internal;
using namespace relaysync::notifications;
using namespace relaysync::service;
using namespace relaysync::signer;
using namespace std;

NotificationService::NotificationService(
    shared_ptr<plog::IAppender> appender,
    ClientConfig config,
    shared_ptr<IRelayPool> pool,
    shared_ptr<RelayFanout> fanout,
    shared_ptr<IKeyStore> keyStore,
    shared_ptr<NotificationAggregator> aggregator,
    shared_ptr<ProfileCache> profiles)
: _config(move(config)),
  _pool(pool),
  _fanout(fanout),
  _keyStore(keyStore),
  _aggregator(aggregator),
  _profiles(profiles)
{
    initLogging(appender, this->_config.logSeverity);

    if (this->_pool == nullptr || this->_fanout == nullptr || this->_keyStore == nullptr
        || this->_aggregator == nullptr || this->_profiles == nullptr)
    {
        throw invalid_argument("NotificationService: Every dependency is required.");
    }
};

vector<NotificationItem> NotificationService::fetchNotifications()
{
    string localPubkey = this->_keyStore->localIdentity();
    if (localPubkey.empty())
    {
        throw logic_error("NotificationService: Cannot fetch notifications without a local identity.");
    }

    if (localPubkey != this->_aggregator->localPubkey())
    {
        throw logic_error("NotificationService: The notification feed belongs to a different identity.");
    }

    vector<string> relays = this->_config.subscriptionRelays();
    if (relays.empty())
    {
        throw logic_error("NotificationService: Cannot fetch notifications without any configured relays.");
    }

    const auto& enabledTypes = this->_config.enabledNotifications;
    auto filters = NotificationAggregator::buildFilters(
        localPubkey,
        enabledTypes,
        this->_config.notificationQueryLimit);

    if (filters.empty())
    {
        PLOG_INFO << "Every notification type is disabled; skipping the relay query.";
        return this->_aggregator->ingest({}, enabledTypes);
    }

    this->_pool->openRelayConnections(relays);

    auto events = this->_fanout->fanoutQuery(relays, filters, this->_config.notificationTimeout);
    this->_aggregator->ingest(events, enabledTypes);

    this->_fetchProfiles(relays);
    this->_fetchTargetNotes(relays);

    return this->_aggregator->items();
};

void NotificationService::_fetchProfiles(const vector<string>& relays)
{
    vector<string> missing = this->_profiles->missing(this->_aggregator->actorPubkeys());
    if (!missing.empty())
    {
        auto filter = make_shared<Filters>();
        filter->kinds.push_back(kindNumber(EventKind::Metadata));
        filter->authors = missing;
        filter->limit = static_cast<int>(missing.size());

        auto profileEvents = this->_fanout->fanoutQuery(relays, { filter }, this->_config.profileTimeout);
        for (const auto& event : profileEvents)
        {
            this->_profiles->ingest(*event);
        }

        PLOG_DEBUG << "Fetched " << profileEvents.size() << " profiles for " << missing.size() << " actors.";
    }

    this->_aggregator->attachProfiles(*this->_profiles);
};

void NotificationService::_fetchTargetNotes(const vector<string>& relays)
{
    vector<string> noteIds = this->_aggregator->targetNoteIds();
    if (noteIds.empty())
    {
        return;
    }

    auto filter = make_shared<Filters>();
    filter->ids = noteIds;
    filter->limit = static_cast<int>(noteIds.size());

    auto notes = this->_fanout->fanoutQuery(relays, { filter }, this->_config.profileTimeout);
    this->_aggregator->attachTargetNotes(notes);

    PLOG_DEBUG << "Resolved " << notes.size() << " of " << noteIds.size() << " target notes.";
};
