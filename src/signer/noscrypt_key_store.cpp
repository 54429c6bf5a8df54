#include <stdexcept>
#include <vector>

#include "relaysync/cryptography/noscrypt_cipher.hpp"
#include "relaysync/signer/noscrypt_key_store.hpp"
#include "../cryptography/secure_rng.hpp"
#include "../internal/hex.hpp"
#include "../internal/logging.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace relaysync::cryptography;
using namespace relaysync::data;
using namespace relaysync::internal;
using namespace relaysync::signer;
using namespace std;

#pragma region Local Statics

static void _ncFreeContext(NCContext* ctx)
{
    NCDestroyContext(ctx);
    operator delete(ctx);
}

static shared_ptr<NCContext> _initNoscryptContext()
{
    // The context struct is opaque, so its memory is allocated by size and freed by the helper.
    void* ctxMemory = operator new(NCGetContextStructSize());
    auto ctx = shared_ptr<NCContext>(static_cast<NCContext*>(ctxMemory), _ncFreeContext);

    vector<uint8_t> entropy(NC_CONTEXT_ENTROPY_SIZE);
    SecureRng::fill(entropy);

    NCResult initResult = NCInitContext(ctx.get(), entropy.data());
    SecureRng::zero(entropy);

    if (initResult != NC_SUCCESS)
    {
        RELAYSYNC_LOG_NC_ERROR(initResult);
        throw runtime_error("NoscryptKeyStore: Failed to initialize the noscrypt context.");
    }

    return ctx;
};

static shared_ptr<NCSecretKey> _allocSecretKey()
{
    return shared_ptr<NCSecretKey>(new NCSecretKey(), [](NCSecretKey* key)
    {
        SecureRng::zero(key, sizeof(NCSecretKey));
        delete key;
    });
};

static void _generateSecretKey(const shared_ptr<const NCContext> ctx, shared_ptr<NCSecretKey> secret)
{
    // Limit the number of attempts to prevent resource exhaustion in the event of a failure.
    NCResult validationResult;
    int loopCount = 0;
    do
    {
        SecureRng::fill(secret.get(), sizeof(NCSecretKey));
        validationResult = NCValidateSecretKey(ctx.get(), secret.get());
    } while (validationResult != NC_SUCCESS && ++loopCount < 64);

    if (validationResult != NC_SUCCESS)
    {
        RELAYSYNC_LOG_NC_ERROR(validationResult);
        throw runtime_error("NoscryptKeyStore: Failed to generate a valid secret key.");
    }
};

#pragma endregion

#pragma region Constructors and Destructors

NoscryptKeyStore::NoscryptKeyStore(shared_ptr<plog::IAppender> appender)
{
    initLogging(appender);

    this->_noscryptContext = _initNoscryptContext();
    this->_secretKey = _allocSecretKey();
    _generateSecretKey(this->_noscryptContext, this->_secretKey);
    this->_derivePublicKey();
};

NoscryptKeyStore::NoscryptKeyStore(shared_ptr<plog::IAppender> appender, const string& secretKeyHex)
{
    initLogging(appender);

    this->_noscryptContext = _initNoscryptContext();
    this->_secretKey = _allocSecretKey();

    if (!fromHex(secretKeyHex, reinterpret_cast<uint8_t*>(this->_secretKey.get()), sizeof(NCSecretKey)))
    {
        throw invalid_argument("NoscryptKeyStore: The secret key must be 64 hex characters.");
    }

    NCResult validationResult = NCValidateSecretKey(this->_noscryptContext.get(), this->_secretKey.get());
    if (validationResult != NC_SUCCESS)
    {
        RELAYSYNC_LOG_NC_ERROR(validationResult);
        throw invalid_argument("NoscryptKeyStore: The secret key is not a valid secp256k1 key.");
    }

    this->_derivePublicKey();
};

NoscryptKeyStore::NoscryptKeyStore(shared_ptr<NCContext> context)
{
    this->_noscryptContext = context;
    this->_secretKey = _allocSecretKey();
    _generateSecretKey(this->_noscryptContext, this->_secretKey);
    this->_derivePublicKey();
};

NoscryptKeyStore::~NoscryptKeyStore() = default;

#pragma endregion

#pragma region Public Interface

string NoscryptKeyStore::localIdentity() const
{
    return this->_publicKeyHex;
};

string NoscryptKeyStore::encrypt(CipherVersion version, const string& peerPubkey, const string& plaintext)
{
    auto peer = this->_parsePublicKey(peerPubkey);
    if (peer == nullptr)
    {
        PLOG_WARNING << "Cannot encrypt for an invalid public key: " << peerPubkey;
        return string();
    }

    switch (version)
    {
    case CipherVersion::Nip04:
        return this->_encryptNip04(peer, plaintext);

    case CipherVersion::Nip44:
        return this->_encryptNip44(peer, plaintext);

    default:
        return string();
    }
};

string NoscryptKeyStore::decrypt(CipherVersion version, const string& peerPubkey, const string& payload)
{
    auto peer = this->_parsePublicKey(peerPubkey);
    if (peer == nullptr)
    {
        PLOG_DEBUG << "Cannot decrypt from an invalid public key: " << peerPubkey;
        return string();
    }

    switch (version)
    {
    case CipherVersion::Nip04:
        return this->_decryptNip04(peer, payload);

    case CipherVersion::Nip44:
        return this->_decryptNip44(peer, payload);

    default:
        return string();
    }
};

bool NoscryptKeyStore::sign(shared_ptr<Event> event)
{
    if (event == nullptr)
    {
        return false;
    }

    event->pubkey = this->_publicKeyHex;

    // Serializing regenerates the event ID, which is the digest that gets signed.
    event->serialize();

    uint8_t digest[32];
    if (!fromHex(event->id, digest, sizeof(digest)))
    {
        PLOG_ERROR << "Event ID is not a 32-byte hex digest: " << event->id;
        return false;
    }

    uint8_t schnorrSig[64];
    uint8_t random32[32];

    // Secure random signing entropy is required.
    SecureRng::fill(random32, sizeof(random32));

    NCResult signatureResult = NCSignDigest(
        this->_noscryptContext.get(),
        this->_secretKey.get(),
        random32,
        digest,
        schnorrSig);

    // The random buffer could leak sensitive signing information.
    SecureRng::zero(random32, sizeof(random32));

    if (signatureResult != NC_SUCCESS)
    {
        RELAYSYNC_LOG_NC_ERROR(signatureResult);
        return false;
    }

    event->sig = toHex(schnorrSig, sizeof(schnorrSig));

    return true;
};

shared_ptr<IKeyStore> NoscryptKeyStore::createEphemeral()
{
    return shared_ptr<NoscryptKeyStore>(new NoscryptKeyStore(this->_noscryptContext));
};

#pragma endregion

#pragma region Private Methods

void NoscryptKeyStore::_derivePublicKey()
{
    this->_publicKey = make_shared<NCPublicKey>();

    NCResult result = NCGetPublicKey(
        this->_noscryptContext.get(),
        this->_secretKey.get(),
        this->_publicKey.get());

    if (result != NC_SUCCESS)
    {
        RELAYSYNC_LOG_NC_ERROR(result);
        throw invalid_argument("NoscryptKeyStore: Failed to derive a public key from the secret key.");
    }

    this->_publicKeyHex = toHex(reinterpret_cast<const uint8_t*>(this->_publicKey.get()), sizeof(NCPublicKey));
};

shared_ptr<NCPublicKey> NoscryptKeyStore::_parsePublicKey(const string& pubkeyHex) const
{
    if (!isValidPublicKey(pubkeyHex))
    {
        return nullptr;
    }

    auto pubkey = make_shared<NCPublicKey>();
    if (!fromHex(pubkeyHex, reinterpret_cast<uint8_t*>(pubkey.get()), sizeof(NCPublicKey)))
    {
        return nullptr;
    }

    return pubkey;
};

string NoscryptKeyStore::_encryptNip04(shared_ptr<NCPublicKey> peer, const string& plaintext)
{
    NoscryptCipher cipher(NoscryptCipherVersion::NIP04, NoscryptCipherMode::CIPHER_MODE_ENCRYPT);

    string ciphertext = cipher.update(this->_noscryptContext, this->_secretKey, peer, plaintext);
    if (ciphertext.empty())
    {
        return string();
    }

    return NoscryptCipher::encodeBase64(ciphertext)
        + NIP04_IV_SEPARATOR
        + NoscryptCipher::encodeBase64(cipher.iv());
};

string NoscryptKeyStore::_decryptNip04(shared_ptr<NCPublicKey> peer, const string& payload)
{
    size_t separator = payload.find(NIP04_IV_SEPARATOR);
    if (separator == string::npos)
    {
        PLOG_DEBUG << "NIP-04 payload has no IV";
        return string();
    }

    string ciphertext = NoscryptCipher::decodeBase64(payload.substr(0, separator));
    string iv = NoscryptCipher::decodeBase64(payload.substr(separator + NIP04_IV_SEPARATOR.size()));
    if (ciphertext.empty() || iv.empty())
    {
        PLOG_DEBUG << "NIP-04 payload is not valid base64";
        return string();
    }

    NoscryptCipher cipher(NoscryptCipherVersion::NIP04, NoscryptCipherMode::CIPHER_MODE_DECRYPT);
    if (!cipher.setIV(iv))
    {
        return string();
    }

    return cipher.update(this->_noscryptContext, this->_secretKey, peer, ciphertext);
};

string NoscryptKeyStore::_encryptNip44(shared_ptr<NCPublicKey> peer, const string& plaintext)
{
    NoscryptCipher cipher(NoscryptCipherVersion::NIP44, NoscryptCipherMode::CIPHER_MODE_ENCRYPT);

    string output = cipher.update(this->_noscryptContext, this->_secretKey, peer, plaintext);

    return output.empty()
        ? string()
        : NoscryptCipher::encodeBase64(output);
};

string NoscryptKeyStore::_decryptNip44(shared_ptr<NCPublicKey> peer, const string& payload)
{
    string decoded = NoscryptCipher::decodeBase64(payload);
    if (decoded.empty())
    {
        PLOG_DEBUG << "NIP-44 payload is not valid base64";
        return string();
    }

    NoscryptCipher cipher(NoscryptCipherVersion::NIP44, NoscryptCipherMode::CIPHER_MODE_DECRYPT);

    return cipher.update(this->_noscryptContext, this->_secretKey, peer, decoded);
};

#pragma endregion
