#include <algorithm>
#include <stdexcept>

#include "relaysync/messaging/conversation_store.hpp"
#include "../internal/logging.hpp"

using namespace relaysync::data;
using namespace relaysync::internal;
using namespace relaysync::messaging;
using namespace relaysync::storage;
using namespace std;

const NormalizedMessage* Conversation::lastMessage() const
{
    return this->messages.empty() ? nullptr : &this->messages.back();
};

ConversationStore::ConversationStore(shared_ptr<plog::IAppender> appender, shared_ptr<WatermarkStore> watermarks)
{
    initLogging(appender);

    if (watermarks == nullptr)
    {
        throw invalid_argument("ConversationStore: A watermark store is required.");
    }

    this->_watermarks = watermarks;
};

void ConversationStore::ingestBatch(const vector<NormalizedMessage>& messages)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    map<string, Conversation> rebuilt;
    for (const auto& peer : this->_startedPeers)
    {
        rebuilt[peer].peerPubkey = peer;
    }

    for (const auto& message : messages)
    {
        if (message.peerPubkey.empty())
        {
            continue;
        }

        Conversation& conversation = rebuilt[message.peerPubkey];
        conversation.peerPubkey = message.peerPubkey;

        auto duplicate = find_if(
            conversation.messages.begin(),
            conversation.messages.end(),
            [&message](const NormalizedMessage& existing) { return existing.id == message.id; });
        if (duplicate == conversation.messages.end())
        {
            conversation.messages.push_back(message);
        }
    }

    for (auto& [peer, conversation] : rebuilt)
    {
        sort(conversation.messages.begin(), conversation.messages.end(), _isOrderedBefore);

        time_t watermark = this->_effectiveWatermark(peer);
        conversation.unreadCount = count_if(
            conversation.messages.begin(),
            conversation.messages.end(),
            [watermark](const NormalizedMessage& message) { return !message.sent && message.timestamp > watermark; });
    }

    this->_conversations = move(rebuilt);

    PLOG_INFO << "Loaded " << messages.size() << " messages into " << this->_conversations.size() << " conversations";
};

bool ConversationStore::ingestOne(const NormalizedMessage& message)
{
    if (message.peerPubkey.empty())
    {
        return false;
    }

    lock_guard<mutex> lock(this->_propertyMutex);

    Conversation& conversation = this->_conversations[message.peerPubkey];
    conversation.peerPubkey = message.peerPubkey;

    for (const auto& existing : conversation.messages)
    {
        if (existing.id == message.id)
        {
            return false;
        }
    }

    auto position = upper_bound(
        conversation.messages.begin(),
        conversation.messages.end(),
        message,
        _isOrderedBefore);
    conversation.messages.insert(position, message);

    bool isSelected = this->_currentPeer.has_value() && *this->_currentPeer == message.peerPubkey;
    if (!message.sent && !isSelected && message.timestamp > this->_effectiveWatermark(message.peerPubkey))
    {
        conversation.unreadCount++;
    }

    PLOG_DEBUG << "Added " << (message.sent ? "sent" : "received") << " " << toString(message.scheme)
        << " message " << message.id << " to the conversation with " << message.peerPubkey;

    return true;
};

void ConversationStore::selectConversation(const string& peerPubkey)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    this->_currentPeer = peerPubkey;

    auto it = this->_conversations.find(peerPubkey);
    if (it != this->_conversations.end())
    {
        it->second.unreadCount = 0;
    }
};

void ConversationStore::startConversation(const string& peerPubkey)
{
    if (!isValidPublicKey(peerPubkey))
    {
        throw invalid_argument("ConversationStore::startConversation: The peer must be a 64-character hex public key.");
    }

    lock_guard<mutex> lock(this->_propertyMutex);

    this->_startedPeers.insert(peerPubkey);

    Conversation& conversation = this->_conversations[peerPubkey];
    conversation.peerPubkey = peerPubkey;
    conversation.unreadCount = 0;

    this->_currentPeer = peerPubkey;
};

void ConversationStore::clearSelection()
{
    lock_guard<mutex> lock(this->_propertyMutex);
    this->_currentPeer.reset();
};

optional<string> ConversationStore::currentConversation() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_currentPeer;
};

void ConversationStore::markRead(const string& peerPubkey)
{
    lock_guard<mutex> lock(this->_propertyMutex);

    auto it = this->_conversations.find(peerPubkey);
    if (it == this->_conversations.end())
    {
        return;
    }

    const NormalizedMessage* last = it->second.lastMessage();
    if (last != nullptr)
    {
        this->_watermarks->advance(WatermarkStore::peerKey(peerPubkey), last->timestamp);
    }

    it->second.unreadCount = 0;
};

optional<Conversation> ConversationStore::conversation(const string& peerPubkey) const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    auto it = this->_conversations.find(peerPubkey);
    if (it == this->_conversations.end())
    {
        return nullopt;
    }

    return it->second;
};

vector<Conversation> ConversationStore::conversations() const
{
    vector<Conversation> snapshot;
    {
        lock_guard<mutex> lock(this->_propertyMutex);
        for (const auto& entry : this->_conversations)
        {
            snapshot.push_back(entry.second);
        }
    }

    stable_sort(snapshot.begin(), snapshot.end(), [](const Conversation& lhs, const Conversation& rhs)
    {
        const NormalizedMessage* lhsLast = lhs.lastMessage();
        const NormalizedMessage* rhsLast = rhs.lastMessage();
        if (lhsLast == nullptr || rhsLast == nullptr)
        {
            return lhsLast != nullptr && rhsLast == nullptr;
        }

        return lhsLast->timestamp > rhsLast->timestamp;
    });

    return snapshot;
};

size_t ConversationStore::totalUnread() const
{
    lock_guard<mutex> lock(this->_propertyMutex);

    size_t total = 0;
    for (const auto& entry : this->_conversations)
    {
        total += entry.second.unreadCount;
    }

    return total;
};

size_t ConversationStore::size() const
{
    lock_guard<mutex> lock(this->_propertyMutex);
    return this->_conversations.size();
};

time_t ConversationStore::_effectiveWatermark(const string& peerPubkey) const
{
    return max(
        this->_watermarks->get(WatermarkStore::MESSAGES),
        this->_watermarks->get(WatermarkStore::peerKey(peerPubkey)));
};

bool ConversationStore::_isOrderedBefore(const NormalizedMessage& lhs, const NormalizedMessage& rhs)
{
    if (lhs.timestamp != rhs.timestamp)
    {
        return lhs.timestamp < rhs.timestamp;
    }

    return lhs.id < rhs.id;
};
