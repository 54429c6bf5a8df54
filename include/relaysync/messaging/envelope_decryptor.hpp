#pragma once

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <variant>

#include <plog/Log.h>

#include "relaysync/data/data.hpp"
#include "relaysync/signer/key_store.hpp"

namespace relaysync
{
namespace messaging
{
/**
 * @brief The direct message envelopes the client can read and write.
 */
enum class Scheme
{
    Legacy, ///< NIP-04 kind 4 events.  Sender, recipient, and time are public.
    Wrapped ///< NIP-17 rumors sealed and gift-wrapped per NIP-59.  Only the recipient sees the metadata.
};

std::string toString(Scheme scheme);

/**
 * @brief A decrypted direct message, independent of the envelope it arrived in.
 */
struct NormalizedMessage
{
    std::string id; ///< ID of the event the message arrived in.  For wrapped messages, the gift wrap.
    std::string peerPubkey; ///< The other party of the conversation.
    std::string content; ///< Plaintext.
    std::time_t timestamp = 0; ///< The authoritative send time.  For wrapped messages, the rumor's time.
    bool sent = false; ///< True if the local identity wrote the message.
    Scheme scheme = Scheme::Legacy;
    std::shared_ptr<const data::Event> rawEvent; ///< The event the message was decrypted from.
};

/**
 * @brief The outcome of an event that is not a message for the local identity.
 */
struct NotApplicable
{
    std::string reason; ///< A short description, for logging only.
};

typedef std::variant<NormalizedMessage, NotApplicable> DecryptResult;

/**
 * @brief Turns encrypted direct message events into normalized messages.
 * @remark Events addressed to someone else are routine when scanning broad relay queries.  They,
 * and malformed envelopes, yield `NotApplicable` rather than an error.
 */
class EnvelopeDecryptor
{
public:
    EnvelopeDecryptor(std::shared_ptr<plog::IAppender> appender, std::shared_ptr<signer::IKeyStore> keyStore);

    /**
     * @brief Decrypts the given event with the local identity.
     * @returns The normalized message, or `NotApplicable` if the event is not a direct message
     * the local identity can read.
     */
    DecryptResult decrypt(std::shared_ptr<const data::Event> event) const;

    /**
     * @brief Gets the message from a decrypt result, if any.
     */
    static std::optional<NormalizedMessage> message(const DecryptResult& result);

private:
    std::shared_ptr<signer::IKeyStore> _keyStore;

    DecryptResult _decryptLegacy(std::shared_ptr<const data::Event> event, const std::string& localPubkey) const;

    DecryptResult _decryptWrapped(std::shared_ptr<const data::Event> event, const std::string& localPubkey) const;

    /**
     * @brief Decrypts a NIP-44 payload and parses the event inside it.
     * @returns The inner event, or `std::nullopt` if the payload cannot be decrypted or parsed.
     */
    std::optional<data::Event> _openLayer(const std::string& senderPubkey, const std::string& payload) const;
};
} // namespace messaging
} // namespace relaysync
