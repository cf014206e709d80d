#ifndef KEYSTONE_UTIL_HASHING_HPP
#define KEYSTONE_UTIL_HASHING_HPP

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <openssl/rand.h>
#include <openssl/sha.h>

/**
 * @file hashing.hpp
 * @brief OpenSSL-backed digests and identifiers for Keystone.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL libcrypto.
 *
 * USAGE:
 *   @code
 *   using namespace keystone::util::hashing;
 *   std::string digest = sha256("Dr. [PERSON_A] ...");   // 64 hex chars
 *   std::string sessionId = randomHex(16);               // 32 hex chars
 *   @endcode
 */

namespace keystone {
namespace util {
namespace hashing {

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
 * @brief Compute a SHA-256 hash of the input string, return as lowercase hex.
 * @throw std::runtime_error if OpenSSL fails.
 */
inline std::string sha256(const std::string &input)
{
    unsigned char hash[SHA256_DIGEST_LENGTH];
    if (!SHA256(reinterpret_cast<const unsigned char*>(input.data()), input.size(), hash)) {
        throw std::runtime_error("hashing::sha256: SHA256 computation failed.");
    }
    return toHex(hash, SHA256_DIGEST_LENGTH);
}

/**
 * @brief Cryptographically random bytes, hex encoded. Used for session ids.
 * @param byteCount Number of random bytes (the result has twice as many chars).
 * @throw std::runtime_error if the OpenSSL RNG is not seeded.
 */
inline std::string randomHex(size_t byteCount)
{
    std::vector<unsigned char> buf(byteCount);
    if (byteCount > 0 && RAND_bytes(buf.data(), static_cast<int>(buf.size())) != 1) {
        throw std::runtime_error("hashing::randomHex: RAND_bytes failed.");
    }
    return toHex(buf.data(), buf.size());
}

} // namespace hashing
} // namespace util
} // namespace keystone

#endif // KEYSTONE_UTIL_HASHING_HPP
