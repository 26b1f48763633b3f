#ifndef PIIGUARD_UTIL_CIPHER_HPP
#define PIIGUARD_UTIL_CIPHER_HPP

#include <string>
#include <vector>
#include <stdexcept>
#include <openssl/evp.h>
#include <openssl/rand.h>

/**
 * @file cipher.hpp
 * @brief Reversible AES-CBC transformation used by the "encrypt" strategy.
 *
 * Wire format of a token: base64( IV[16] || AES-CBC-PKCS7(plaintext) ).
 * The key is the raw byte string supplied by the caller and must be 16, 24 or 32
 * bytes long (AES-128/192/256). A fresh random IV is drawn per call, so two
 * encryptions of the same substring differ while both decrypt to it.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 */

namespace piiguard {
namespace util {
namespace cipher {

constexpr size_t kIvLength = 16;

inline bool isValidKeyLength(size_t len)
{
    return len == 16 || len == 24 || len == 32;
}

/**
 * @brief Standard base64 (with padding) of a byte buffer.
 */
inline std::string base64Encode(const std::vector<unsigned char> &data)
{
    if (data.empty()) {
        return std::string();
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]),
                                  data.data(), static_cast<int>(data.size()));
    if (written < 0) {
        throw std::runtime_error("cipher::base64Encode: EVP_EncodeBlock failed.");
    }
    out.resize(static_cast<size_t>(written));
    return out;
}

/**
 * @brief Decode standard base64.
 * @throw std::invalid_argument if the input is not valid base64.
 */
inline std::vector<unsigned char> base64Decode(const std::string &encoded)
{
    if (encoded.empty()) {
        return {};
    }
    if (encoded.size() % 4 != 0) {
        throw std::invalid_argument("cipher::base64Decode: length is not a multiple of 4.");
    }
    std::vector<unsigned char> out(3 * encoded.size() / 4);
    int written = EVP_DecodeBlock(out.data(),
                                  reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        throw std::invalid_argument("cipher::base64Decode: invalid base64 input.");
    }
    // EVP_DecodeBlock counts padding as zero bytes
    size_t padding = 0;
    if (encoded[encoded.size() - 1] == '=') ++padding;
    if (encoded[encoded.size() - 2] == '=') ++padding;
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

inline const EVP_CIPHER *cipherForKey(const std::string &key)
{
    switch (key.size()) {
    case 16: return EVP_aes_128_cbc();
    case 24: return EVP_aes_192_cbc();
    case 32: return EVP_aes_256_cbc();
    default:
        throw std::invalid_argument("cipher: key must be 16, 24 or 32 bytes, got "
                                    + std::to_string(key.size()));
    }
}

/**
 * @brief Encrypt @p plaintext with AES-CBC under @p key.
 * @return base64(IV || ciphertext)
 * @throw std::invalid_argument on a bad key length.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string encrypt(const std::string &plaintext, const std::string &key)
{
    const EVP_CIPHER *algo = cipherForKey(key);

    std::vector<unsigned char> buffer(kIvLength + plaintext.size() + EVP_MAX_BLOCK_LENGTH);
    if (RAND_bytes(buffer.data(), static_cast<int>(kIvLength)) != 1) {
        throw std::runtime_error("cipher::encrypt: RAND_bytes failed.");
    }

    EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
    if (ctx == nullptr) {
        throw std::runtime_error("cipher::encrypt: Failed to create EVP_CIPHER_CTX.");
    }

    int len = 0;
    int total = 0;
    unsigned char *out = buffer.data() + kIvLength;
    bool ok = EVP_EncryptInit_ex(ctx, algo, nullptr,
                                 reinterpret_cast<const unsigned char*>(key.data()),
                                 buffer.data()) == 1
           && EVP_EncryptUpdate(ctx, out, &len,
                                reinterpret_cast<const unsigned char*>(plaintext.data()),
                                static_cast<int>(plaintext.size())) == 1;
    if (ok) {
        total = len;
        ok = EVP_EncryptFinal_ex(ctx, out + total, &len) == 1;
        total += len;
    }
    EVP_CIPHER_CTX_free(ctx);
    if (!ok) {
        throw std::runtime_error("cipher::encrypt: AES encryption failed.");
    }

    buffer.resize(kIvLength + static_cast<size_t>(total));
    return base64Encode(buffer);
}

/**
 * @brief Reverse encrypt(): decode, split IV, decrypt.
 * @throw std::invalid_argument on a bad key or a malformed token.
 * @throw std::runtime_error if decryption fails (wrong key, corrupted data).
 */
inline std::string decrypt(const std::string &token, const std::string &key)
{
    const EVP_CIPHER *algo = cipherForKey(key);
    std::vector<unsigned char> raw = base64Decode(token);
    if (raw.size() <= kIvLength) {
        throw std::invalid_argument("cipher::decrypt: token too short.");
    }

    EVP_CIPHER_CTX *ctx = EVP_CIPHER_CTX_new();
    if (ctx == nullptr) {
        throw std::runtime_error("cipher::decrypt: Failed to create EVP_CIPHER_CTX.");
    }

    const size_t cipherLen = raw.size() - kIvLength;
    std::string plain(cipherLen + EVP_MAX_BLOCK_LENGTH, '\0');
    unsigned char *out = reinterpret_cast<unsigned char*>(&plain[0]);
    int len = 0;
    int total = 0;
    bool ok = EVP_DecryptInit_ex(ctx, algo, nullptr,
                                 reinterpret_cast<const unsigned char*>(key.data()),
                                 raw.data()) == 1
           && EVP_DecryptUpdate(ctx, out, &len, raw.data() + kIvLength,
                                static_cast<int>(cipherLen)) == 1;
    if (ok) {
        total = len;
        ok = EVP_DecryptFinal_ex(ctx, out + total, &len) == 1;
        total += len;
    }
    EVP_CIPHER_CTX_free(ctx);
    if (!ok) {
        throw std::runtime_error("cipher::decrypt: AES decryption failed (wrong key or corrupted token).");
    }

    plain.resize(static_cast<size_t>(total));
    return plain;
}

} // namespace cipher
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_CIPHER_HPP
