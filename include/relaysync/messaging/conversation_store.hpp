#pragma once

#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <plog/Log.h>

#include "relaysync/messaging/envelope_decryptor.hpp"
#include "relaysync/storage/watermark_store.hpp"

namespace relaysync
{
namespace messaging
{
/**
 * @brief A thread of direct messages with one peer.
 */
struct Conversation
{
    std::string peerPubkey;
    std::vector<NormalizedMessage> messages; ///< Ordered by timestamp, then by ID.  Unique by ID.
    size_t unreadCount = 0;

    /**
     * @brief Gets the newest message of the thread.
     * @returns A pointer into `messages`, or `nullptr` if the thread is empty.
     */
    const NormalizedMessage* lastMessage() const;
};

/**
 * @brief Folds normalized messages into per-peer conversations and keeps their unread counts.
 * @remark Unread accounting compares received messages against durable watermarks.  The
 * effective watermark of a peer is the newer of the global messages watermark and the peer's
 * own.  All methods are thread-safe, and readers receive copies.
 */
class ConversationStore
{
public:
    ConversationStore(std::shared_ptr<plog::IAppender> appender, std::shared_ptr<storage::WatermarkStore> watermarks);

    /**
     * @brief Rebuilds every conversation from a complete batch of messages.
     * @remark Unread counts are recomputed from the watermarks alone, the selected conversation
     * included.  Conversations started with `startConversation` survive even when the batch holds
     * none of their messages.
     */
    void ingestBatch(const std::vector<NormalizedMessage>& messages);

    /**
     * @brief Adds a single live message to its conversation.
     * @returns True if the message was added, false if the conversation already holds it.
     * @remark A received message newer than the watermark counts as unread unless its
     * conversation is the selected one.
     */
    bool ingestOne(const NormalizedMessage& message);

    /**
     * @brief Marks the given conversation as the one the user is viewing.
     * @remark Its unread count is cleared for display only; the watermark is left alone, so a
     * later `ingestBatch` counts the messages as unread again.  Use `markRead` to acknowledge them.
     */
    void selectConversation(const std::string& peerPubkey);

    /**
     * @brief Creates an empty conversation with the given peer, if none exists, and selects it.
     * @throws `std::invalid_argument` if the public key is not 64 lowercase hex characters.
     */
    void startConversation(const std::string& peerPubkey);

    void clearSelection();

    std::optional<std::string> currentConversation() const;

    /**
     * @brief Durably acknowledges every message of the given conversation.
     * @remark Advances the peer's watermark to its newest message and clears its unread count.
     */
    void markRead(const std::string& peerPubkey);

    std::optional<Conversation> conversation(const std::string& peerPubkey) const;

    /**
     * @brief Gets every conversation, most recently active first.
     * @remark Conversations without messages come last.
     */
    std::vector<Conversation> conversations() const;

    size_t totalUnread() const;

    size_t size() const;

private:
    std::shared_ptr<storage::WatermarkStore> _watermarks;

    mutable std::mutex _propertyMutex;

    std::map<std::string, Conversation> _conversations;

    ///< Peers of conversations opened by the user rather than by a message.
    std::set<std::string> _startedPeers;

    std::optional<std::string> _currentPeer;

    std::time_t _effectiveWatermark(const std::string& peerPubkey) const;

    static bool _isOrderedBefore(const NormalizedMessage& lhs, const NormalizedMessage& rhs);
};
} // namespace messaging
} // namespace relaysync
