#include <nlohmann/json.hpp>

#include "relaysync/messaging/envelope_builder.hpp"
#include "../cryptography/secure_rng.hpp"
#include "../internal/logging.hpp"

using namespace nlohmann;
using namespace relaysync::cryptography;
using namespace relaysync::data;
using namespace relaysync::internal;
using namespace relaysync::messaging;
using namespace relaysync::signer;
using namespace std;

EnvelopeBuilder::EnvelopeBuilder(shared_ptr<plog::IAppender> appender, shared_ptr<IKeyStore> keyStore)
{
    initLogging(appender);

    if (keyStore == nullptr)
    {
        throw invalid_argument("EnvelopeBuilder: A key store is required.");
    }

    this->_keyStore = keyStore;
};

shared_ptr<Event> EnvelopeBuilder::buildLegacy(const string& peerPubkey, const string& plaintext) const
{
    auto event = make_shared<Event>();
    event->kind = kindNumber(EventKind::EncryptedDirectMessage);
    event->createdAt = time(nullptr);
    event->tags.push_back({ "p", peerPubkey });

    event->content = this->_keyStore->encrypt(CipherVersion::Nip04, peerPubkey, plaintext);
    if (event->content.empty())
    {
        PLOG_ERROR << "Failed to encrypt a legacy message to " << peerPubkey;
        return nullptr;
    }

    if (!this->_keyStore->sign(event))
    {
        PLOG_ERROR << "Failed to sign a legacy message to " << peerPubkey;
        return nullptr;
    }

    return event;
};

WrappedEnvelope EnvelopeBuilder::buildWrapped(const string& peerPubkey, const string& plaintext) const
{
    string localPubkey = this->_keyStore->localIdentity();

    // The rumor is the unsigned message itself.  It keeps its ID but never gets a signature, so
    // it cannot be republished as proof of authorship.
    Event rumor;
    rumor.pubkey = localPubkey;
    rumor.createdAt = time(nullptr);
    rumor.kind = kindNumber(EventKind::PrivateDirectMessage);
    rumor.tags.push_back({ "p", peerPubkey });
    rumor.content = plaintext;
    rumor.serialize();

    json rumorJson = rumor;
    rumorJson.erase("sig");
    string rumorString = rumorJson.dump();

    WrappedEnvelope envelope;
    envelope.recipientCopy = this->_sealAndWrap(rumorString, peerPubkey);
    envelope.senderCopy = this->_sealAndWrap(rumorString, localPubkey);

    if (envelope.recipientCopy == nullptr || envelope.senderCopy == nullptr)
    {
        PLOG_ERROR << "Failed to build the gift wraps of a message to " << peerPubkey;
        return WrappedEnvelope();
    }

    return envelope;
};

shared_ptr<Event> EnvelopeBuilder::_sealAndWrap(const string& rumorJson, const string& recipientPubkey) const
{
    auto seal = make_shared<Event>();
    seal->kind = kindNumber(EventKind::Seal);
    seal->createdAt = _jitteredTimestamp();
    seal->content = this->_keyStore->encrypt(CipherVersion::Nip44, recipientPubkey, rumorJson);
    if (seal->content.empty() || !this->_keyStore->sign(seal))
    {
        PLOG_DEBUG << "Failed to seal a rumor for " << recipientPubkey;
        return nullptr;
    }

    json sealJson = *seal;

    auto ephemeralKeys = this->_keyStore->createEphemeral();
    if (ephemeralKeys == nullptr)
    {
        return nullptr;
    }

    auto wrap = make_shared<Event>();
    wrap->kind = kindNumber(EventKind::GiftWrap);
    wrap->createdAt = _jitteredTimestamp();
    wrap->tags.push_back({ "p", recipientPubkey });
    wrap->content = ephemeralKeys->encrypt(CipherVersion::Nip44, recipientPubkey, sealJson.dump());
    if (wrap->content.empty() || !ephemeralKeys->sign(wrap))
    {
        PLOG_DEBUG << "Failed to wrap a seal for " << recipientPubkey;
        return nullptr;
    }

    return wrap;
};

time_t EnvelopeBuilder::_jitteredTimestamp()
{
    return time(nullptr) - static_cast<time_t>(SecureRng::uniform(static_cast<uint32_t>(MAX_TIMESTAMP_JITTER)));
};
