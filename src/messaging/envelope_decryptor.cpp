#include <nlohmann/json.hpp>

#include "relaysync/messaging/envelope_decryptor.hpp"
#include "../internal/logging.hpp"

using namespace relaysync::data;
using namespace relaysync::internal;
using namespace relaysync::messaging;
using namespace relaysync::signer;
using namespace std;

string relaysync::messaging::toString(Scheme scheme)
{
    switch (scheme)
    {
    case Scheme::Legacy:
        return "legacy";

    case Scheme::Wrapped:
        return "wrapped";

    default:
        return "unknown";
    }
};

EnvelopeDecryptor::EnvelopeDecryptor(shared_ptr<plog::IAppender> appender, shared_ptr<IKeyStore> keyStore)
{
    initLogging(appender);

    if (keyStore == nullptr)
    {
        throw invalid_argument("EnvelopeDecryptor: A key store is required.");
    }

    this->_keyStore = keyStore;
};

DecryptResult EnvelopeDecryptor::decrypt(shared_ptr<const Event> event) const
{
    if (event == nullptr)
    {
        return NotApplicable{ "no event" };
    }

    string localPubkey = this->_keyStore->localIdentity();
    if (localPubkey.empty())
    {
        return NotApplicable{ "no local identity" };
    }

    switch (kindOf(event->kind))
    {
    case EventKind::EncryptedDirectMessage:
        return this->_decryptLegacy(event, localPubkey);

    case EventKind::GiftWrap:
        return this->_decryptWrapped(event, localPubkey);

    default:
        return NotApplicable{ "not a direct message kind" };
    }
};

optional<NormalizedMessage> EnvelopeDecryptor::message(const DecryptResult& result)
{
    if (const NormalizedMessage* message = get_if<NormalizedMessage>(&result))
    {
        return *message;
    }

    return nullopt;
};

DecryptResult EnvelopeDecryptor::_decryptLegacy(shared_ptr<const Event> event, const string& localPubkey) const
{
    NormalizedMessage message;
    message.id = event->id;
    message.timestamp = event->createdAt;
    message.scheme = Scheme::Legacy;
    message.rawEvent = event;
    message.sent = event->pubkey == localPubkey;

    if (message.sent)
    {
        message.peerPubkey = event->firstTagValue("p");
        if (message.peerPubkey.empty())
        {
            PLOG_WARNING << "Legacy message " << event->id << " sent by the local identity has no recipient tag";
            return NotApplicable{ "missing recipient tag" };
        }
    }
    else
    {
        if (!event->hasTag("p", localPubkey))
        {
            return NotApplicable{ "not addressed to the local identity" };
        }

        message.peerPubkey = event->pubkey;
    }

    message.content = this->_keyStore->decrypt(CipherVersion::Nip04, message.peerPubkey, event->content);
    if (message.content.empty())
    {
        PLOG_DEBUG << "Legacy message " << event->id << " could not be decrypted";
        return NotApplicable{ "legacy payload did not decrypt" };
    }

    return message;
};

DecryptResult EnvelopeDecryptor::_decryptWrapped(shared_ptr<const Event> event, const string& localPubkey) const
{
    // The wrap is signed by a one-time key, so its pubkey is only useful as the ECDH counterparty.
    auto seal = this->_openLayer(event->pubkey, event->content);
    if (!seal.has_value())
    {
        return NotApplicable{ "gift wrap did not open" };
    }

    if (kindOf(seal->kind) != EventKind::Seal)
    {
        PLOG_DEBUG << "Gift wrap " << event->id << " holds a kind " << seal->kind << " event instead of a seal";
        return NotApplicable{ "gift wrap does not hold a seal" };
    }

    auto rumor = this->_openLayer(seal->pubkey, seal->content);
    if (!rumor.has_value())
    {
        return NotApplicable{ "seal did not open" };
    }

    if (kindOf(rumor->kind) != EventKind::PrivateDirectMessage)
    {
        PLOG_DEBUG << "Seal in gift wrap " << event->id << " holds a kind " << rumor->kind << " rumor";
        return NotApplicable{ "rumor is not a direct message" };
    }

    // The seal signature vouches for its author, so a rumor claiming another author is forged.
    if (rumor->pubkey != seal->pubkey)
    {
        PLOG_WARNING << "Rumor author " << rumor->pubkey << " does not match seal author " << seal->pubkey
            << " in gift wrap " << event->id;
        return NotApplicable{ "rumor author does not match seal author" };
    }

    NormalizedMessage message;
    message.id = event->id;
    message.content = rumor->content;
    message.timestamp = rumor->createdAt;
    message.scheme = Scheme::Wrapped;
    message.rawEvent = event;
    message.sent = rumor->pubkey == localPubkey;

    if (message.sent)
    {
        message.peerPubkey = rumor->firstTagValue("p");
        if (message.peerPubkey.empty())
        {
            PLOG_WARNING << "Sent copy in gift wrap " << event->id << " has no recipient tag";
            return NotApplicable{ "missing recipient tag" };
        }
    }
    else
    {
        message.peerPubkey = rumor->pubkey;
    }

    return message;
};

optional<Event> EnvelopeDecryptor::_openLayer(const string& senderPubkey, const string& payload) const
{
    string plaintext = this->_keyStore->decrypt(CipherVersion::Nip44, senderPubkey, payload);
    if (plaintext.empty())
    {
        return nullopt;
    }

    try
    {
        return Event::fromString(plaintext);
    }
    catch (const nlohmann::json::exception& e)
    {
        PLOG_DEBUG << "Decrypted layer is not an event: " << e.what();
        return nullopt;
    }
};
