#ifndef PIIGUARD_UTIL_HASHING_HPP
#define PIIGUARD_UTIL_HASHING_HPP

#include <string>
#include <stdexcept>
#include <sstream>
#include <iomanip>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief Digest routines behind the "hash" anonymization strategy.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * DESIGN:
 *   - The digest is computed over the raw UTF-8 bytes of the substring, so the same
 *     substring always yields the same token, in one request or across requests.
 *   - Output is lowercase hex: 64 characters for SHA-256, 128 for SHA-512.
 *
 * USAGE:
 *   @code
 *   using namespace piiguard::util::hashing;
 *   std::string token = sha256("John Smith");
 *   std::string wide  = digestHex("John Smith", "sha512");
 *   @endcode
 */

namespace piiguard {
namespace util {
namespace hashing {

/**
 * @brief Hex-encode raw digest bytes.
 */
inline std::string toHex(const unsigned char *data, size_t len)
{
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    for (size_t i = 0; i < len; ++i) {
        oss << std::setw(2) << static_cast<unsigned>(data[i]);
    }
    return oss.str();
}

/**
 * @brief Compute a digest of @p input with the named algorithm.
 * @param input The data to be hashed.
 * @param algorithm "sha256" or "sha512".
 * @return Lowercase hex digest.
 * @throw std::invalid_argument for an unsupported algorithm name.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string digestHex(const std::string &input, const std::string &algorithm)
{
    const EVP_MD *md = nullptr;
    if (algorithm == "sha256") {
        md = EVP_sha256();
    } else if (algorithm == "sha512") {
        md = EVP_sha512();
    } else {
        throw std::invalid_argument("hashing::digestHex: unsupported hash type '" + algorithm + "'");
    }

    EVP_MD_CTX *mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::digestHex: Failed to create EVP_MD_CTX.");
    }

    if (EVP_DigestInit_ex(mdctx, md, nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::digestHex: EVP_DigestInit_ex failed.");
    }
    if (EVP_DigestUpdate(mdctx, input.data(), input.size()) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::digestHex: EVP_DigestUpdate failed.");
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hashLen = 0;
    if (EVP_DigestFinal_ex(mdctx, hash, &hashLen) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::digestHex: EVP_DigestFinal_ex failed.");
    }
    EVP_MD_CTX_free(mdctx);

    return toHex(hash, hashLen);
}

/**
 * @brief SHA-256 of the input string as 64 lowercase hex characters.
 */
inline std::string sha256(const std::string &input)
{
    return digestHex(input, "sha256");
}

/**
 * @brief SHA-512 of the input string as 128 lowercase hex characters.
 */
inline std::string sha512(const std::string &input)
{
    return digestHex(input, "sha512");
}

} // namespace hashing
} // namespace util
} // namespace piiguard

#endif // PIIGUARD_UTIL_HASHING_HPP
