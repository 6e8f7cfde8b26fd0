#pragma once

#include <chrono>
#include <expected>
#include <optional>
#include <stdexcept>
#include <string>

namespace ari
{

    /**
     * Coarse classification of an actor, attached to every audit entry.
     */
    enum class TrustLevel
    {
        System = 0,
        Operator = 1,
        Verified = 2,
        Standard = 3
    };

    inline std::string trust_level_to_string(TrustLevel level)
    {
        switch (level)
        {
        case TrustLevel::System:
            return "system";
        case TrustLevel::Operator:
            return "operator";
        case TrustLevel::Verified:
            return "verified";
        case TrustLevel::Standard:
            return "standard";
        }
        return "unknown";
    }

    enum class ErrorCode
    {
        ConfigError,
        CryptoError,
        ValidationError,
        StorageError,
        ParsingError,
        IntegrityError,
        NotFound,
        InvalidInput,
        Unavailable,
        InternalError
    };

    inline std::string error_code_to_string(ErrorCode code)
    {
        switch (code)
        {
        case ErrorCode::ConfigError:
            return "config";
        case ErrorCode::CryptoError:
            return "crypto";
        case ErrorCode::ValidationError:
            return "validation";
        case ErrorCode::StorageError:
            return "storage";
        case ErrorCode::ParsingError:
            return "parsing";
        case ErrorCode::IntegrityError:
            return "integrity";
        case ErrorCode::NotFound:
            return "not_found";
        case ErrorCode::InvalidInput:
            return "invalid_input";
        case ErrorCode::Unavailable:
            return "unavailable";
        case ErrorCode::InternalError:
            return "internal";
        }
        return "unknown";
    }

    /**
     * Error with a machine-readable code and a human-readable message
     */
    class AriError : public std::runtime_error
    {
    public:
        ErrorCode code;

        AriError(ErrorCode code, const std::string &message)
            : std::runtime_error(message), code(code) {}

        static AriError config(const std::string &msg)
        {
            return AriError(ErrorCode::ConfigError, msg);
        }

        static AriError crypto(const std::string &msg)
        {
            return AriError(ErrorCode::CryptoError, msg);
        }

        static AriError validation(const std::string &msg)
        {
            return AriError(ErrorCode::ValidationError, msg);
        }

        static AriError storage(const std::string &msg)
        {
            return AriError(ErrorCode::StorageError, msg);
        }

        static AriError parsing(const std::string &msg)
        {
            return AriError(ErrorCode::ParsingError, msg);
        }

        static AriError integrity(const std::string &msg)
        {
            return AriError(ErrorCode::IntegrityError, msg);
        }

        static AriError not_found(const std::string &msg)
        {
            return AriError(ErrorCode::NotFound, msg);
        }

        static AriError invalid_input(const std::string &msg)
        {
            return AriError(ErrorCode::InvalidInput, msg);
        }

        static AriError unavailable(const std::string &msg)
        {
            return AriError(ErrorCode::Unavailable, msg);
        }
    };

    /**
     * Result type using C++23 std::expected
     */
    template <typename T>
    using Result = std::expected<T, AriError>;

    /**
     * Parse a trust level from its lowercase wire name
     */
    Result<TrustLevel> trust_level_from_string(const std::string &s);

    /** Current UTC time as ISO 8601 with millisecond precision */
    std::string now_iso8601();

    std::string format_iso8601(std::chrono::system_clock::time_point at);

    /** Parse the "YYYY-MM-DDTHH:MM:SS[.mmm]Z" form produced by now_iso8601 */
    Result<std::chrono::system_clock::time_point> parse_iso8601(const std::string &ts);

    /** Expand a leading "~/" against $HOME */
    std::string expand_home(const std::string &path);

} // namespace ari
