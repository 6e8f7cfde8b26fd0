#include "ari/crypto.hpp"
#include <sodium.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include <format>

namespace ari::crypto
{

    // Initialize libsodium on library load
    static struct SodiumInitializer
    {
        SodiumInitializer()
        {
            if (sodium_init() < 0)
            {
                throw std::runtime_error("Failed to initialize libsodium");
            }
        }
    } sodium_initializer;

    // ============================================================================
    // SHA256 Implementation
    // ============================================================================

    SHA256Hash SHA256::hash(const Bytes &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(), data.data(), data.size());
        return output;
    }

    SHA256Hash SHA256::hash(const std::string &data)
    {
        SHA256Hash output;
        crypto_hash_sha256(output.data(),
                           reinterpret_cast<const uint8_t *>(data.data()),
                           data.size());
        return output;
    }

    std::string SHA256::hex_digest(const std::string &data)
    {
        return to_hex(hash(data));
    }

    std::string SHA256::to_hex(const SHA256Hash &hash)
    {
        return Hex::encode(hash.data(), hash.size());
    }

    Result<SHA256Hash> SHA256::from_hex(const std::string &hex)
    {
        if (hex.size() != 64)
        {
            return std::unexpected(AriError::crypto("Invalid SHA-256 hex length"));
        }

        auto bytes = Hex::decode(hex);
        if (!bytes)
            return std::unexpected(bytes.error());

        SHA256Hash hash;
        std::copy(bytes->begin(), bytes->end(), hash.begin());
        return hash;
    }

    // ============================================================================
    // HmacSha256 Implementation
    // ============================================================================

    Result<HmacTag> HmacSha256::sign(const Bytes &key, const std::string &message)
    {
        if (key.size() < kMinKeyBytes)
        {
            return std::unexpected(AriError::crypto(
                std::format("HMAC key too short: {} bytes, need at least {}", key.size(), kMinKeyBytes)));
        }

        crypto_auth_hmacsha256_state state;
        HmacTag tag;
        crypto_auth_hmacsha256_init(&state, key.data(), key.size());
        crypto_auth_hmacsha256_update(&state,
                                      reinterpret_cast<const uint8_t *>(message.data()),
                                      message.size());
        crypto_auth_hmacsha256_final(&state, tag.data());
        sodium_memzero(&state, sizeof(state));
        return tag;
    }

    Result<std::string> HmacSha256::sign_hex(const Bytes &key, const std::string &message)
    {
        auto tag = sign(key, message);
        if (!tag)
            return std::unexpected(tag.error());
        return Hex::encode(tag->data(), tag->size());
    }

    bool HmacSha256::verify_hex(const Bytes &key, const std::string &message, const std::string &tag_hex)
    {
        auto expected = sign_hex(key, message);
        if (!expected)
            return false;
        return constant_time_equals(*expected, tag_hex);
    }

    // ============================================================================
    // Hex Implementation
    // ============================================================================

    std::string Hex::encode(const uint8_t *data, std::size_t len)
    {
        std::string hex(len * 2 + 1, '\0');
        sodium_bin2hex(hex.data(), hex.size(), data, len);
        hex.resize(len * 2);
        return hex;
    }

    std::string Hex::encode(const Bytes &data)
    {
        return encode(data.data(), data.size());
    }

    Result<Bytes> Hex::decode(const std::string &hex)
    {
        if (hex.size() % 2 != 0)
        {
            return std::unexpected(AriError::crypto("Invalid hex length"));
        }

        Bytes decoded(hex.size() / 2);
        size_t decoded_len = 0;
        const char *end = nullptr;
        if (sodium_hex2bin(decoded.data(),
                           decoded.size(),
                           hex.c_str(),
                           hex.size(),
                           nullptr,
                           &decoded_len,
                           &end) != 0 ||
            end != hex.c_str() + hex.size())
        {
            return std::unexpected(AriError::crypto("Invalid hex character"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // Base64 Implementation
    // ============================================================================

    std::string Base64::encode(const Bytes &data)
    {
        size_t b64_len = sodium_base64_encoded_len(data.size(), sodium_base64_VARIANT_ORIGINAL);
        std::string encoded(b64_len, '\0');

        sodium_bin2base64(
            encoded.data(),
            b64_len,
            data.data(),
            data.size(),
            sodium_base64_VARIANT_ORIGINAL);

        // Remove null terminator
        encoded.resize(std::strlen(encoded.c_str()));
        return encoded;
    }

    Result<Bytes> Base64::decode(const std::string &encoded)
    {
        Bytes decoded(encoded.size()); // Worst case size
        size_t decoded_len;

        if (sodium_base642bin(
                decoded.data(),
                decoded.size(),
                encoded.c_str(),
                encoded.size(),
                " \r\n", // tolerate trailing newlines in key files
                &decoded_len,
                nullptr,
                sodium_base64_VARIANT_ORIGINAL) != 0)
        {
            return std::unexpected(AriError::crypto("Invalid base64 encoding"));
        }

        decoded.resize(decoded_len);
        return decoded;
    }

    // ============================================================================
    // SecureRandom Implementation
    // ============================================================================

    Bytes SecureRandom::generate_bytes(std::size_t n)
    {
        Bytes buffer(n);
        randombytes_buf(buffer.data(), n);
        return buffer;
    }

    bool constant_time_equals(const std::string &a, const std::string &b)
    {
        if (a.size() != b.size())
            return false;
        return sodium_memcmp(a.data(), b.data(), a.size()) == 0;
    }

    // ============================================================================
    // KeyFile Implementation
    // ============================================================================

    Result<Bytes> KeyFile::load(const std::string &path)
    {
        std::ifstream file(path);
        if (!file.is_open())
        {
            return std::unexpected(AriError::not_found(std::format("Key file not found: {}", path)));
        }
        std::stringstream buffer;
        buffer << file.rdbuf();

        auto key = Base64::decode(buffer.str());
        if (!key)
        {
            return std::unexpected(AriError::config(std::format("Key file {} is not valid base64", path)));
        }
        if (key->size() < HmacSha256::kMinKeyBytes)
        {
            return std::unexpected(AriError::config(
                std::format("Key file {} holds a weak key ({} bytes)", path, key->size())));
        }
        return key;
    }

    Result<Bytes> KeyFile::load_or_create(const std::string &path, std::size_t key_len)
    {
        if (std::filesystem::exists(path))
        {
            return load(path);
        }

        auto key = SecureRandom::generate_bytes(key_len);
        if (auto saved = save(path, key); !saved)
            return std::unexpected(saved.error());
        return key;
    }

    Result<void> KeyFile::save(const std::string &path, const Bytes &key)
    {
        std::error_code ec;
        auto parent = std::filesystem::path(path).parent_path();
        if (!parent.empty())
        {
            std::filesystem::create_directories(parent, ec);
            if (ec)
            {
                return std::unexpected(AriError::storage(std::format("Unable to create key directory: {}", ec.message())));
            }
        }

        int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, S_IRUSR | S_IWUSR);
        if (fd < 0)
        {
            return std::unexpected(AriError::storage(std::format("Unable to create key file {}: {}", path, std::strerror(errno))));
        }

        std::string encoded = Base64::encode(key) + "\n";
        ssize_t written = ::write(fd, encoded.data(), encoded.size());
        int write_errno = errno;
        bool synced = ::fsync(fd) == 0;
        ::close(fd);

        if (written != static_cast<ssize_t>(encoded.size()) || !synced)
        {
            return std::unexpected(AriError::storage(std::format("Unable to write key file {}: {}", path, std::strerror(write_errno))));
        }
        return {};
    }

} // namespace ari::crypto
