#ifndef CHUNKWORKER_UTIL_HASHING_HPP
#define CHUNKWORKER_UTIL_HASHING_HPP

#include <array>
#include <cstdint>
#include <string>
#include <stdexcept>
#include <vector>
#include <openssl/evp.h>

/**
 * @file hashing.hpp
 * @brief SHA-256 and hex helpers for the chunk worker.
 *
 * REQUIREMENTS:
 *   - Links against OpenSSL (libcrypto).
 *
 * DESIGN:
 *   - sha256() returns the raw 32-byte digest. The digest length reported by
 *     OpenSSL is checked; anything other than 32 bytes is an error, never a
 *     truncation.
 *   - toHex()/fromHex() convert between raw bytes and lowercase hex text, which
 *     is how ids appear on disk and in the snapshot.
 *
 * USAGE:
 *   @code
 *   #include "util/hashing.hpp"
 *   using namespace chunkworker::util::hashing;
 *
 *   Digest d = sha256("Hello World");
 *   std::string hex = toHex(d.data(), d.size());
 *   @endcode
 */

namespace chunkworker {
namespace util {
namespace hashing {

constexpr size_t DIGEST_SIZE = 32;

using Digest = std::array<uint8_t, DIGEST_SIZE>;

/**
 * @brief Compute the SHA-256 digest of a byte buffer.
 * @throw std::runtime_error if OpenSSL fails or reports an unexpected digest length.
 */
inline Digest sha256(const uint8_t *data, size_t size)
{
    unsigned char raw[EVP_MAX_MD_SIZE];
    unsigned int rawLen = 0;

    EVP_MD_CTX* mdctx = EVP_MD_CTX_new();
    if (mdctx == nullptr) {
        throw std::runtime_error("hashing::sha256: Failed to create EVP_MD_CTX.");
    }
    if (EVP_DigestInit_ex(mdctx, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP_DigestInit_ex failed.");
    }
    if (size > 0 && EVP_DigestUpdate(mdctx, data, size) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP_DigestUpdate failed.");
    }
    if (EVP_DigestFinal_ex(mdctx, raw, &rawLen) != 1) {
        EVP_MD_CTX_free(mdctx);
        throw std::runtime_error("hashing::sha256: EVP_DigestFinal_ex failed.");
    }
    EVP_MD_CTX_free(mdctx);

    if (rawLen != DIGEST_SIZE) {
        throw std::runtime_error("hashing::sha256: unexpected digest length " +
                                 std::to_string(rawLen));
    }

    Digest out{};
    for (size_t i = 0; i < DIGEST_SIZE; ++i) {
        out[i] = raw[i];
    }
    return out;
}

inline Digest sha256(const std::string &input)
{
    return sha256(reinterpret_cast<const uint8_t*>(input.data()), input.size());
}

inline Digest sha256(const std::vector<uint8_t> &input)
{
    return sha256(input.data(), input.size());
}

/**
 * @brief Lowercase hex encoding of a byte buffer.
 */
inline std::string toHex(const uint8_t *data, size_t size)
{
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(size * 2);
    for (size_t i = 0; i < size; ++i) {
        out.push_back(digits[data[i] >> 4]);
        out.push_back(digits[data[i] & 0x0f]);
    }
    return out;
}

template <size_t N>
inline std::string toHex(const std::array<uint8_t, N> &bytes)
{
    return toHex(bytes.data(), bytes.size());
}

inline std::string sha256Hex(const std::string &input)
{
    return toHex(sha256(input));
}

namespace detail {

inline int hexValue(char c)
{
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace detail

/**
 * @brief Decode a hex string (either case).
 * @throw std::runtime_error on odd length or a non-hex character.
 */
inline std::vector<uint8_t> fromHex(const std::string &hex)
{
    if (hex.size() % 2 != 0) {
        throw std::runtime_error("hashing::fromHex: odd length hex string");
    }
    std::vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = detail::hexValue(hex[i]);
        int lo = detail::hexValue(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            throw std::runtime_error("hashing::fromHex: invalid hex character in '" + hex + "'");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

/**
 * @brief Decode a hex string into a fixed-size array.
 * @throw std::runtime_error if the decoded length is not N.
 */
template <size_t N>
inline std::array<uint8_t, N> fromHexFixed(const std::string &hex)
{
    std::vector<uint8_t> bytes = fromHex(hex);
    if (bytes.size() != N) {
        throw std::runtime_error("hashing::fromHexFixed: expected " + std::to_string(N) +
                                 " bytes, got " + std::to_string(bytes.size()));
    }
    std::array<uint8_t, N> out{};
    for (size_t i = 0; i < N; ++i) {
        out[i] = bytes[i];
    }
    return out;
}

} // namespace hashing
} // namespace util
} // namespace chunkworker

#endif // CHUNKWORKER_UTIL_HASHING_HPP
