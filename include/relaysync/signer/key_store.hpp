#pragma once

#include <memory>
#include <string>

#include "relaysync/data/data.hpp"

namespace relaysync
{
namespace signer
{
/**
 * @brief The payload encryption standards used for direct messages.
 */
enum class CipherVersion
{
    Nip04, ///< AES-256-CBC, used by kind 4 messages.
    Nip44 ///< Versioned ChaCha20 with HMAC, used by seals and gift wraps.
};

/**
 * @brief An interface for the holder of the local identity's keys.
 * @remark Secret key material never leaves the key store.  Callers pass public keys and payloads
 * only.
 */
class IKeyStore
{
public:
    virtual ~IKeyStore() = default;

    /**
     * @brief Gets the hex-encoded public key of the local identity.
     * @returns The public key, or an empty string if no identity is loaded.
     */
    virtual std::string localIdentity() const = 0;

    /**
     * @brief Encrypts a plaintext for the given peer.
     * @param version The encryption standard to use.
     * @param peerPubkey The hex-encoded public key of the other party.
     * @param plaintext The message to encrypt.
     * @returns The encoded payload, or an empty string if the plaintext could not be encrypted.
     */
    virtual std::string encrypt(
        CipherVersion version,
        const std::string& peerPubkey,
        const std::string& plaintext) = 0;

    /**
     * @brief Decrypts a payload exchanged with the given peer.
     * @returns The plaintext, or an empty string if the payload could not be decrypted.
     * @remark Failure is the common case for payloads addressed to someone else, and is not
     * reported beyond the empty result.
     */
    virtual std::string decrypt(
        CipherVersion version,
        const std::string& peerPubkey,
        const std::string& payload) = 0;

    /**
     * @brief Signs the given event with the local identity.
     * @param event The event to sign.
     * @returns True if the event was signed.
     * @remark The event's `pubkey`, `id`, and `sig` fields are updated in-place.
     * @throws `std::invalid_argument` if the event cannot be serialized.
     */
    virtual bool sign(std::shared_ptr<data::Event> event) = 0;

    /**
     * @brief Creates a key store holding a freshly generated, single-use identity.
     */
    virtual std::shared_ptr<IKeyStore> createEphemeral() = 0;
};
} // namespace signer
} // namespace relaysync
