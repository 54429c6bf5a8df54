#pragma once

#include <ctime>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <plog/Log.h>

#include "relaysync/config/client_config.hpp"
#include "relaysync/messaging/conversation_store.hpp"
#include "relaysync/messaging/envelope_builder.hpp"
#include "relaysync/messaging/envelope_decryptor.hpp"
#include "relaysync/service/relay_fanout.hpp"
#include "relaysync/service/relay_pool.hpp"
#include "relaysync/signer/key_store.hpp"

namespace relaysync
{
namespace messaging
{
/**
 * @brief Thrown when a message could not be published with any scheme.
 * @remark Nothing is added to the conversation store when this is thrown.
 */
class SendError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The outcome of a successful send.
 */
struct SendResult
{
    Scheme scheme; ///< The scheme the message was actually delivered with.
    std::optional<NormalizedMessage> message; ///< The message as committed to the store.
};

/**
 * @brief Loads and follows the local identity's direct messages, and sends new ones.
 */
class MessagingService
{
public:
    MessagingService(
        std::shared_ptr<plog::IAppender> appender,
        config::ClientConfig config,
        std::shared_ptr<service::IRelayPool> pool,
        std::shared_ptr<service::RelayFanout> fanout,
        std::shared_ptr<signer::IKeyStore> keyStore,
        std::shared_ptr<ConversationStore> store);

    ~MessagingService();

    /**
     * @brief Loads every conversation from the configured relays and keeps following new messages.
     * @remark The backlog replaces the store's conversations in one batch; later messages are
     * added one at a time.  Any previous live subscription is closed first.
     * @throws `std::logic_error` if no identity is loaded or no relays are configured.
     */
    void loadConversations();

    /**
     * @brief Stops following new messages.
     */
    void close();

    /**
     * @brief Encrypts and publishes a message to the given peer.
     * @returns The scheme used and the committed message.
     * @throws `std::logic_error` if no identity is loaded or no relays are configured.
     * @throws `std::invalid_argument` if the peer key is malformed or the content is blank.
     * @throws `SendError` if no relay accepted the message with either scheme.
     * @remark When the wrapped scheme is enabled it is tried first, and both copies must reach at
     * least one relay each.  Otherwise, or when it fails, the legacy scheme is used.
     */
    SendResult sendMessage(const std::string& peerPubkey, const std::string& content);

    /**
     * @brief Builds the message queries for the given identity.
     * @remark Sent and received legacy messages, wraps tagged to the identity, and every wrap in
     * the lookback window, since some relays do not index wraps by recipient.
     */
    std::vector<std::shared_ptr<data::Filters>> buildFilters(const std::string& localPubkey, std::time_t now) const;

private:
    config::ClientConfig _config;

    std::shared_ptr<service::IRelayPool> _pool;

    std::shared_ptr<service::RelayFanout> _fanout;

    std::shared_ptr<signer::IKeyStore> _keyStore;

    std::shared_ptr<ConversationStore> _store;

    std::shared_ptr<EnvelopeDecryptor> _decryptor;

    EnvelopeBuilder _builder;

    std::mutex _propertyMutex;

    std::shared_ptr<service::FanoutSubscription> _subscription;

    /**
     * @throws `std::logic_error` if no identity is loaded or the relay list is empty.
     */
    std::string _requireIdentity(const std::vector<std::string>& relays, const std::string& operation) const;

    /**
     * @returns The send result, or `std::nullopt` if either copy could not be built or published.
     */
    std::optional<SendResult> _sendWrapped(
        const std::vector<std::string>& relays,
        const std::string& peerPubkey,
        const std::string& content);

    /**
     * @throws `SendError` if the message could not be built or no relay accepted it.
     */
    SendResult _sendLegacy(
        const std::vector<std::string>& relays,
        const std::string& peerPubkey,
        const std::string& content);

    std::optional<NormalizedMessage> _commit(std::shared_ptr<data::Event> publishedEvent);
};
} // namespace messaging
} // namespace relaysync
