#pragma once

#include "types.hpp"
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace ari::crypto
{

    using Bytes = std::vector<uint8_t>;
    using SHA256Hash = std::array<uint8_t, 32>;
    using HmacTag = std::array<uint8_t, 32>;

    /**
     * SHA-256 hashing
     */
    class SHA256
    {
    public:
        static SHA256Hash hash(const Bytes &data);

        static SHA256Hash hash(const std::string &data);

        /** Lowercase hex digest of a string, the form stored in audit entries */
        static std::string hex_digest(const std::string &data);

        static std::string to_hex(const SHA256Hash &hash);

        static Result<SHA256Hash> from_hex(const std::string &hex);
    };

    /**
     * HMAC-SHA-256 keyed authentication (RFC 2104). Keys shorter than
     * kMinKeyBytes are refused.
     */
    class HmacSha256
    {
    public:
        static constexpr std::size_t kMinKeyBytes = 32;

        static Result<HmacTag> sign(const Bytes &key, const std::string &message);

        static Result<std::string> sign_hex(const Bytes &key, const std::string &message);

        /** Verify a hex tag in constant time. Malformed hex is a mismatch. */
        static bool verify_hex(const Bytes &key, const std::string &message, const std::string &tag_hex);
    };

    /**
     * Hex encoding/decoding
     */
    class Hex
    {
    public:
        static std::string encode(const uint8_t *data, std::size_t len);

        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &hex);
    };

    /**
     * Base64 encoding/decoding (standard alphabet)
     */
    class Base64
    {
    public:
        static std::string encode(const Bytes &data);

        static Result<Bytes> decode(const std::string &encoded);
    };

    /**
     * Cryptographically secure random number generation
     */
    class SecureRandom
    {
    public:
        static Bytes generate_bytes(std::size_t n);
    };

    /** Constant-time equality for equal-length strings */
    bool constant_time_equals(const std::string &a, const std::string &b);

    /**
     * Secret key material kept in a local file as base64.
     */
    class KeyFile
    {
    public:
        /** Read and decode a key file. Missing or short keys are errors. */
        static Result<Bytes> load(const std::string &path);

        /**
         * Load the key at path, or generate a fresh random key of key_len
         * bytes and write it with mode 0600 if the file does not exist.
         */
        static Result<Bytes> load_or_create(const std::string &path, std::size_t key_len = 32);

        static Result<void> save(const std::string &path, const Bytes &key);
    };

} // namespace ari::crypto
