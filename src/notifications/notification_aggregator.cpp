#include <algorithm>
#include <map>
#include <stdexcept>
#include <unordered_map>
#include <unordered_set>

#include "relaysync/notifications/notification_aggregator.hpp"
#include "../internal/logging.hpp"

using namespace relaysync::data;
using namespace relaysync::internal;
using namespace relaysync::notifications;
using namespace relaysync::storage;
using namespace std;

NotificationAggregator::NotificationAggregator(
    shared_ptr<plog::IAppender> appender,
    string localPubkey,
    shared_ptr<FollowerBaseline> baseline,
    shared_ptr<WatermarkStore> watermarks,
    size_t maxItems)
: _localPubkey(move(localPubkey)), _baseline(baseline), _watermarks(watermarks), _maxItems(maxItems)
{
    initLogging(appender);

    if (this->_localPubkey.empty())
    {
        throw invalid_argument("NotificationAggregator: A local public key is required.");
    }

    if (this->_baseline == nullptr || this->_watermarks == nullptr)
    {
        throw invalid_argument("NotificationAggregator: A follower baseline and watermark store are required.");
    }
};

vector<NotificationItem> NotificationAggregator::ingest(
    const vector<shared_ptr<Event>>& events,
    const set<NotificationType>& enabledTypes)
{
    unordered_set<string> seenIds;
    vector<NotificationItem> interactions;

    // Follow lists are replaceable, so only the newest list of each follower matters.
    map<string, shared_ptr<Event>> followEvents;

    for (const auto& event : events)
    {
        if (event == nullptr || event->id.empty() || !seenIds.insert(event->id).second)
        {
            continue;
        }

        if (event->pubkey == this->_localPubkey)
        {
            continue;
        }

        auto type = _typeOf(kindOf(event->kind));
        if (!type.has_value() || enabledTypes.count(*type) == 0)
        {
            continue;
        }

        if (*type == NotificationType::Follow)
        {
            if (!event->hasTag("p", this->_localPubkey))
            {
                continue;
            }

            auto existing = followEvents.find(event->pubkey);
            if (existing == followEvents.end() || existing->second->createdAt < event->createdAt)
            {
                followEvents[event->pubkey] = event;
            }
            continue;
        }

        auto item = this->_toItem(*event, *type);
        if (item.has_value())
        {
            interactions.push_back(move(*item));
        }
    }

    sort(interactions.begin(), interactions.end(), _isNewerFirst);
    if (interactions.size() > this->_maxItems)
    {
        interactions.resize(this->_maxItems);
    }

    vector<NotificationItem> feed = move(interactions);

    if (!followEvents.empty())
    {
        set<string> observed;
        for (const auto& entry : followEvents)
        {
            observed.insert(entry.first);
        }

        BaselineResult baseline = this->_baseline->process(observed);

        auto addFollow = [&feed, &followEvents](const string& pubkey, time_t discovered)
        {
            NotificationItem item;
            auto followEvent = followEvents.find(pubkey);
            item.id = followEvent != followEvents.end() ? followEvent->second->id : "follow-" + pubkey;
            item.type = NotificationType::Follow;
            item.timestamp = discovered;
            item.actorPubkey = pubkey;
            item.contentExcerpt = "followed you";
            feed.push_back(move(item));
        };

        for (const auto& [pubkey, discovered] : baseline.newFollowers)
        {
            addFollow(pubkey, discovered);
        }
        for (const auto& [pubkey, firstObserved] : baseline.recentFollowers)
        {
            addFollow(pubkey, firstObserved);
        }

        sort(feed.begin(), feed.end(), _isNewerFirst);
    }

    PLOG_INFO << "Built a notification feed of " << feed.size() << " items from " << events.size() << " events.";

    lock_guard<mutex> lock(this->_propertyMutex);
    this->_items = feed;

    return feed;
};

vector<shared_ptr<Filters>> NotificationAggregator::buildFilters(
    const string& localPubkey,
    const set<NotificationType>& enabledTypes,
    int limit)
{
    vector<shared_ptr<Filters>> filters;
    for (NotificationType type : enabledTypes)
    {
        EventKind kind;
        switch (type)
        {
        case NotificationType::Reply:
            kind = EventKind::TextNote;
            break;
        case NotificationType::Like:
            kind = EventKind::Reaction;
            break;
        case NotificationType::Repost:
            kind = EventKind::Repost;
            break;
        case NotificationType::Zap:
            kind = EventKind::ZapReceipt;
            break;
        case NotificationType::Tip:
            kind = EventKind::TipDisclosure;
            break;
        case NotificationType::Follow:
            kind = EventKind::ContactList;
            break;
        default:
            continue;
        }

        auto filter = make_shared<Filters>();
        filter->kinds.push_back(kindNumber(kind));
        filter->tags["p"] = { localPubkey };
        filter->limit = limit;
        filters.push_back(filter);
    }

    return filters;
};

size_t NotificationAggregator::unreadCount() const
{
    time_t watermark = this->_watermarks->get(WatermarkStore::NOTIFICATIONS);

    lock_guard<mutex> lock(this->_propertyMutex);
    return count_if(this->_items.begin(), this->_items.end(), [watermark](const NotificationItem& item)
    {
        return item.timestamp > watermark;
    });
};

void NotificationAggregator::markAllRead()
{
    time_t newest = 0;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        for (const auto& item : this->_items)
        {
            newest = max(newest, item.timestamp);
        }
    }

    if (newest > 0)
    {
        this->_watermarks->advance(WatermarkStore::NOTIFICATIONS, newest);
    }
};

vector<NotificationItem> NotificationAggregator::items() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_items;
};

vector<NotificationItem> NotificationAggregator::filtered(NotificationView view) const
{
    vector<NotificationItem> items = this->items();
    if (view == NotificationView::All)
    {
        return items;
    }

    vector<NotificationItem> mentions;
    copy_if(items.begin(), items.end(), back_inserter(mentions), [](const NotificationItem& item)
    {
        return item.type == NotificationType::Reply && item.contentExcerpt.find('@') != string::npos;
    });

    return mentions;
};

vector<string> NotificationAggregator::actorPubkeys() const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    vector<string> actors;
    for (const auto& item : this->_items)
    {
        if (find(actors.begin(), actors.end(), item.actorPubkey) == actors.end())
        {
            actors.push_back(item.actorPubkey);
        }
    }

    return actors;
};

vector<string> NotificationAggregator::targetNoteIds() const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    vector<string> noteIds;
    for (const auto& item : this->_items)
    {
        if (item.targetNoteId.has_value()
            && find(noteIds.begin(), noteIds.end(), *item.targetNoteId) == noteIds.end())
        {
            noteIds.push_back(*item.targetNoteId);
        }
    }

    return noteIds;
};

void NotificationAggregator::attachProfiles(const ProfileCache& profiles)
{
    lock_guard<mutex> lock(this->_propertyMutex);
    for (auto& item : this->_items)
    {
        item.profile = profiles.find(item.actorPubkey);
    }
};

void NotificationAggregator::attachTargetNotes(const vector<shared_ptr<Event>>& notes)
{
    unordered_map<string, shared_ptr<Event>> notesById;
    for (const auto& note : notes)
    {
        if (note != nullptr)
        {
            notesById[note->id] = note;
        }
    }

    lock_guard<mutex> lock(this->_propertyMutex);
    for (auto& item : this->_items)
    {
        if (item.type == NotificationType::Follow || !item.targetNoteId.has_value())
        {
            continue;
        }

        auto it = notesById.find(*item.targetNoteId);
        item.targetNote = it != notesById.end() ? it->second : nullptr;
        item.targetMissing = it == notesById.end();
    }
};

string NotificationAggregator::localPubkey() const
{
    return this->_localPubkey;
};

optional<NotificationItem> NotificationAggregator::_toItem(const Event& event, NotificationType type) const
{
    NotificationItem item;
    item.id = event.id;
    item.type = type;
    item.timestamp = event.createdAt;
    item.actorPubkey = event.pubkey;

    string targetNoteId = event.firstTagValue("e");
    if (!targetNoteId.empty())
    {
        item.targetNoteId = targetNoteId;
    }
    else if (type != NotificationType::Tip)
    {
        PLOG_DEBUG << "Dropping " << toString(type) << " " << event.id << " with no note reference";
        return nullopt;
    }

    switch (type)
    {
    case NotificationType::Reply:
        item.contentExcerpt = _excerpt(event.content, REPLY_EXCERPT_LENGTH);
        break;

    case NotificationType::Like:
        item.contentExcerpt = event.content.empty() ? "❤️" : event.content;
        break;

    case NotificationType::Repost:
        break;

    case NotificationType::Zap:
        item.contentExcerpt = "Lightning Zap";
        break;

    case NotificationType::Tip:
    {
        // The payer is named in the P tag, which outranks the event author.
        string sender = event.firstTagValue("P");
        if (!sender.empty())
        {
            item.actorPubkey = sender;
        }

        string amount = event.firstTagValue("amount");
        item.contentExcerpt = (amount.empty() ? "?" : amount) + " XMR";
        item.message = event.content;
        break;
    }

    default:
        return nullopt;
    }

    return item;
};

optional<NotificationType> NotificationAggregator::_typeOf(EventKind kind)
{
    switch (kind)
    {
    case EventKind::TextNote:
        return NotificationType::Reply;
    case EventKind::Reaction:
        return NotificationType::Like;
    case EventKind::Repost:
        return NotificationType::Repost;
    case EventKind::ZapReceipt:
        return NotificationType::Zap;
    case EventKind::TipDisclosure:
        return NotificationType::Tip;
    case EventKind::ContactList:
        return NotificationType::Follow;
    default:
        return nullopt;
    }
};

string NotificationAggregator::_excerpt(const string& content, size_t maxCharacters)
{
    // Count UTF-8 lead bytes, so a multi-byte character is never split.
    size_t characters = 0;
    for (size_t i = 0; i < content.size(); i++)
    {
        if ((static_cast<unsigned char>(content[i]) & 0xC0) != 0x80)
        {
            if (characters == maxCharacters)
            {
                return content.substr(0, i) + "...";
            }
            characters++;
        }
    }

    return content;
};

bool NotificationAggregator::_isNewerFirst(const NotificationItem& lhs, const NotificationItem& rhs)
{
    if (lhs.timestamp != rhs.timestamp)
    {
        return lhs.timestamp > rhs.timestamp;
    }

    return lhs.id < rhs.id;
};
