#include <plog/Log.h>

#include <openssl/evp.h>

#include "relaysync/cryptography/noscrypt_cipher.hpp"
#include "secure_rng.hpp"
#include "../internal/noscrypt_logger.hpp"

using namespace std;
using namespace relaysync::cryptography;

NoscryptCipher::NoscryptCipher(NoscryptCipherVersion version, NoscryptCipherMode mode)
: _cipher(version, mode)
{
    /*
    * The IV size is known as soon as the cipher exists, so the buffer is sized once here and
    * handed to the context, which keeps a pointer to it.
    */
    this->_ivBuffer.resize(this->_cipher.ivSize());

    if (mode == NoscryptCipherMode::CIPHER_MODE_ENCRYPT)
    {
        NCResult result = this->_cipher.setIV(this->_ivBuffer);
        if (result != NC_SUCCESS)
        {
            RELAYSYNC_LOG_NC_ERROR(result);
        }
    }
};

string NoscryptCipher::update(
    const shared_ptr<const NCContext> libContext,
    const shared_ptr<const NCSecretKey> localKey,
    const shared_ptr<const NCPublicKey> remoteKey,
    const string& input)
{
    NCResult result;

    if (input.empty())
    {
        return string();
    }

    const vector<uint8_t> inputBuffer(input.begin(), input.end());

    result = this->_cipher.setInput(inputBuffer);
    if (result != NC_SUCCESS)
    {
        RELAYSYNC_LOG_NC_ERROR(result);
        return string();
    }

    /*
    * Encryption needs a fresh random nonce on every call.  This covers both the AES IV of NIP-04
    * and the ChaCha nonce of NIP-44.
    */
    if (this->_cipher.mode() == NoscryptCipherMode::CIPHER_MODE_ENCRYPT)
    {
        SecureRng::fill(this->_ivBuffer);
    }

    result = this->_cipher.update(libContext, localKey, remoteKey);
    if (result != NC_SUCCESS)
    {
        RELAYSYNC_LOG_NC_ERROR(result);
        return string();
    }

    NCResult outputSize = this->_cipher.outputSize();
    if (outputSize <= 0)
    {
        RELAYSYNC_LOG_NC_ERROR(outputSize);
        return string();
    }

    vector<uint8_t> output(outputSize);

    result = this->_cipher.readOutput(output);
    if (result != outputSize)
    {
        RELAYSYNC_LOG_NC_ERROR(result);
        return string();
    }

    string outputString(output.begin(), output.end());
    SecureRng::zero(output);

    return outputString;
};

bool NoscryptCipher::setIV(const string& iv)
{
    if (iv.size() != this->_ivBuffer.size())
    {
        PLOG_DEBUG << "Rejecting an IV of " << iv.size() << " bytes; the cipher needs " << this->_ivBuffer.size();
        return false;
    }

    copy(iv.begin(), iv.end(), this->_ivBuffer.begin());

    NCResult result = this->_cipher.setIV(this->_ivBuffer);
    if (result != NC_SUCCESS)
    {
        RELAYSYNC_LOG_NC_ERROR(result);
        return false;
    }

    return true;
};

string NoscryptCipher::iv() const
{
    return string(this->_ivBuffer.begin(), this->_ivBuffer.end());
};

string NoscryptCipher::encodeBase64(const string& data)
{
    // EVP_EncodeBlock writes four characters per three input bytes, plus a terminating NUL.
    vector<uint8_t> encoded(4 * ((data.size() + 2) / 3) + 1);

    int length = EVP_EncodeBlock(
        encoded.data(),
        reinterpret_cast<const uint8_t*>(data.data()),
        static_cast<int>(data.size()));

    return string(reinterpret_cast<const char*>(encoded.data()), length);
};

string NoscryptCipher::decodeBase64(const string& encoded)
{
    if (encoded.empty() || encoded.size() % 4 != 0)
    {
        return string();
    }

    vector<uint8_t> decoded(3 * encoded.size() / 4);

    int length = EVP_DecodeBlock(
        decoded.data(),
        reinterpret_cast<const uint8_t*>(encoded.data()),
        static_cast<int>(encoded.size()));

    if (length < 0)
    {
        return string();
    }

    // EVP_DecodeBlock counts padding characters as decoded zero bytes.
    size_t padding = 0;
    for (auto it = encoded.rbegin(); it != encoded.rend() && *it == '=' && padding < 2; ++it)
    {
        padding++;
    }

    return string(reinterpret_cast<const char*>(decoded.data()), length - padding);
};
