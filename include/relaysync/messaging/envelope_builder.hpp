#pragma once

#include <ctime>
#include <memory>
#include <string>

#include <plog/Log.h>

#include "relaysync/data/data.hpp"
#include "relaysync/signer/key_store.hpp"

namespace relaysync
{
namespace messaging
{
/**
 * @brief The two gift wraps published for one wrapped message.
 */
struct WrappedEnvelope
{
    std::shared_ptr<data::Event> recipientCopy; ///< Readable only by the peer.
    std::shared_ptr<data::Event> senderCopy; ///< Readable only by the local identity; the sender's durable record.
};

/**
 * @brief Builds signed outgoing direct message events for either scheme.
 */
class EnvelopeBuilder
{
public:
    ///< Gift wraps and seals are backdated by up to this many seconds to hide the send time.
    static constexpr std::time_t MAX_TIMESTAMP_JITTER = 2 * 24 * 60 * 60;

    EnvelopeBuilder(std::shared_ptr<plog::IAppender> appender, std::shared_ptr<signer::IKeyStore> keyStore);

    /**
     * @brief Builds a NIP-04 kind 4 message to the given peer.
     * @returns The signed event, or `nullptr` if it could not be encrypted or signed.
     */
    std::shared_ptr<data::Event> buildLegacy(const std::string& peerPubkey, const std::string& plaintext) const;

    /**
     * @brief Builds the gift-wrapped copies of a NIP-17 message to the given peer.
     * @returns Both copies, or an envelope with null copies if either could not be built.
     * @remark Both copies hold the same rumor, so the peer and the sender recover the same
     * content and send time.
     */
    WrappedEnvelope buildWrapped(const std::string& peerPubkey, const std::string& plaintext) const;

private:
    std::shared_ptr<signer::IKeyStore> _keyStore;

    /**
     * @brief Seals the rumor for the given recipient and wraps the seal with a one-time key.
     * @returns The signed gift wrap, or `nullptr` on failure.
     */
    std::shared_ptr<data::Event> _sealAndWrap(const std::string& rumorJson, const std::string& recipientPubkey) const;

    static std::time_t _jitteredTimestamp();
};
} // namespace messaging
} // namespace relaysync
