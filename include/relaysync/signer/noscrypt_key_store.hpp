#pragma once

#include <memory>
#include <string>

#include <noscrypt.h>
#include <plog/Log.h>

#include "relaysync/signer/key_store.hpp"

namespace relaysync
{
namespace signer
{
/**
 * @brief A key store that holds a secp256k1 keypair in memory and uses noscrypt for every
 * cryptographic operation.
 */
class NoscryptKeyStore : public IKeyStore
{
public:
    /**
     * @brief Creates a key store with a newly generated keypair.
     * @throws `std::runtime_error` if noscrypt cannot be initialized or no valid key is produced.
     */
    NoscryptKeyStore(std::shared_ptr<plog::IAppender> appender);

    /**
     * @brief Creates a key store from an existing secret key.
     * @param secretKeyHex The hex-encoded 32-byte secret key.
     * @throws `std::invalid_argument` if the secret key is malformed or not a valid secp256k1 key.
     * @throws `std::runtime_error` if noscrypt cannot be initialized.
     */
    NoscryptKeyStore(std::shared_ptr<plog::IAppender> appender, const std::string& secretKeyHex);

    ~NoscryptKeyStore() override;

    std::string localIdentity() const override;

    std::string encrypt(
        CipherVersion version,
        const std::string& peerPubkey,
        const std::string& plaintext) override;

    std::string decrypt(
        CipherVersion version,
        const std::string& peerPubkey,
        const std::string& payload) override;

    bool sign(std::shared_ptr<data::Event> event) override;

    std::shared_ptr<IKeyStore> createEphemeral() override;

private:
    ///< Separates the ciphertext from the IV in a NIP-04 payload.
    inline static const std::string NIP04_IV_SEPARATOR = "?iv=";

    ///< The noscrypt library context, shared with any ephemeral key stores created from this one.
    std::shared_ptr<NCContext> _noscryptContext;

    std::shared_ptr<NCSecretKey> _secretKey;

    std::shared_ptr<NCPublicKey> _publicKey;

    std::string _publicKeyHex;

    NoscryptKeyStore(std::shared_ptr<NCContext> context);

    /**
     * @brief Derives the public key from the secret key and caches its hex form.
     * @throws `std::invalid_argument` if noscrypt rejects the secret key.
     */
    void _derivePublicKey();

    /**
     * @brief Parses a hex-encoded public key for use with noscrypt.
     * @returns The parsed key, or `nullptr` if the string is not a valid public key.
     */
    std::shared_ptr<NCPublicKey> _parsePublicKey(const std::string& pubkeyHex) const;

    std::string _encryptNip04(std::shared_ptr<NCPublicKey> peer, const std::string& plaintext);

    std::string _decryptNip04(std::shared_ptr<NCPublicKey> peer, const std::string& payload);

    std::string _encryptNip44(std::shared_ptr<NCPublicKey> peer, const std::string& plaintext);

    std::string _decryptNip44(std::shared_ptr<NCPublicKey> peer, const std::string& payload);
};
} // namespace signer
} // namespace relaysync
