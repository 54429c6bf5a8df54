#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <noscrypt.h>
#include <noscryptutil.h>

namespace relaysync
{
namespace cryptography
{
enum class NoscryptCipherVersion : uint32_t
{
    NIP04 = NC_ENC_VERSION_NIP04,
    NIP44 = NC_ENC_VERSION_NIP44
};

enum class NoscryptCipherMode : uint32_t
{
    CIPHER_MODE_ENCRYPT = NC_UTIL_CIPHER_MODE_ENCRYPT,
    CIPHER_MODE_DECRYPT = NC_UTIL_CIPHER_MODE_DECRYPT
};

/**
 * @brief Owns a noscryptutil cipher context.
 * @remark The context zeroes its memory when freed.  It is created reusable, so its input may be
 * set more than once.  For decryption the MAC is verified before decrypting.
 */
class NoscryptCipherContext
{
public:
    /**
     * @throws `std::runtime_error` if noscrypt cannot allocate the context.
     */
    NoscryptCipherContext(NoscryptCipherVersion version, NoscryptCipherMode mode)
    : _mode(mode)
    {
        this->_cipher = NCUtilCipherAlloc(
            static_cast<uint32_t>(version),
            static_cast<uint32_t>(mode) | NC_UTIL_CIPHER_ZERO_ON_FREE | NC_UTIL_CIPHER_REUSEABLE);

        if (this->_cipher == nullptr)
        {
            throw std::runtime_error("NoscryptCipherContext: Failed to allocate a cipher context.");
        }
    };

    ~NoscryptCipherContext()
    {
        NCUtilCipherFree(this->_cipher);
    };

    NoscryptCipherContext(const NoscryptCipherContext&) = delete;

    NoscryptCipherContext& operator=(const NoscryptCipherContext&) = delete;

    NoscryptCipherMode mode() const { return this->_mode; };

    NCResult update(
        const std::shared_ptr<const NCContext> libContext,
        const std::shared_ptr<const NCSecretKey> localKey,
        const std::shared_ptr<const NCPublicKey> remoteKey) const
    {
        return NCUtilCipherUpdate(this->_cipher, libContext.get(), localKey.get(), remoteKey.get());
    };

    /**
     * @brief Points the context at the given IV buffer.
     * @remark noscrypt keeps the pointer, so the buffer must outlive every later `update`.
     */
    NCResult setIV(std::vector<uint8_t>& iv) const
    {
        return NCUtilCipherSetProperty(this->_cipher, NC_ENC_SET_IV, iv.data(), (uint32_t)iv.size());
    };

    /**
     * @returns The IV size of the cipher, or 0 if noscrypt reports an error.
     */
    size_t ivSize() const
    {
        NCResult size = NCUtilCipherGetIvSize(this->_cipher);
        return size <= 0 ? 0 : (size_t)size;
    };

    NCResult outputSize() const
    {
        return NCUtilCipherGetOutputSize(this->_cipher);
    };

    NCResult readOutput(std::vector<uint8_t>& output) const
    {
        return NCUtilCipherReadOutput(this->_cipher, output.data(), (uint32_t)output.size());
    };

    NCResult setInput(const std::vector<uint8_t>& input) const
    {
        return NCUtilCipherInit(this->_cipher, input.data(), input.size());
    };

private:
    NCUtilCipherContext* _cipher;

    NoscryptCipherMode _mode;
};

/**
 * @brief Encrypts or decrypts direct message payloads with noscrypt.
 * @remark Each instance performs one direction, chosen at construction.
 */
class NoscryptCipher
{
public:
    /**
     * @throws `std::runtime_error` if noscrypt cannot allocate the cipher.
     */
    NoscryptCipher(NoscryptCipherVersion version, NoscryptCipherMode mode);

    /**
     * @brief Performs the cipher operation on the input data.  Depending on the mode the cipher
     * was initialized as, this will either encrypt or decrypt the data.
     * @param libContext The noscrypt library context.
     * @param localKey The local secret key.
     * @param remoteKey The public key of the other party.
     * @param input The raw bytes to encrypt or decrypt.
     * @returns The raw output bytes, or an empty string if the operation failed.
     * @remark Encryption draws a fresh random IV, readable afterwards with `iv`.  NIP-04
     * decryption needs the sender's IV, set first with `setIV`.
     */
    std::string update(
        const std::shared_ptr<const NCContext> libContext,
        const std::shared_ptr<const NCSecretKey> localKey,
        const std::shared_ptr<const NCPublicKey> remoteKey,
        const std::string& input);

    /**
     * @brief Sets the IV used by the next decryption.
     * @returns False if the IV has the wrong size for the cipher.
     */
    bool setIV(const std::string& iv);

    /**
     * @brief Gets the IV used by the last encryption.
     */
    std::string iv() const;

    static std::string encodeBase64(const std::string& data);

    /**
     * @returns The decoded bytes, or an empty string if the input is not valid base64.
     */
    static std::string decodeBase64(const std::string& encoded);

private:
    const NoscryptCipherContext _cipher;

    /*
     * Stores the initialization vector (the nonce, for NIP-44) for the cipher.  noscrypt only
     * holds a pointer to it, so this buffer must stay valid as long as the cipher.
     */
    std::vector<uint8_t> _ivBuffer;
};
} // namespace cryptography
} // namespace relaysync
