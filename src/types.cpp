#include "ari/types.hpp"
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <format>

namespace ari
{

    Result<TrustLevel> trust_level_from_string(const std::string &s)
    {
        if (s == "system")
            return TrustLevel::System;
        if (s == "operator")
            return TrustLevel::Operator;
        if (s == "verified")
            return TrustLevel::Verified;
        if (s == "standard")
            return TrustLevel::Standard;
        return std::unexpected(AriError::validation(std::format("Invalid trust level: {}", s)));
    }

    std::string now_iso8601()
    {
        return format_iso8601(std::chrono::system_clock::now());
    }

    std::string format_iso8601(std::chrono::system_clock::time_point at)
    {
        auto time_t_now = std::chrono::system_clock::to_time_t(at);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(at.time_since_epoch()) % 1000;

        std::tm tm_buf;
        gmtime_r(&time_t_now, &tm_buf);

        char buf[32];
        std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
        return std::format("{}.{:03}Z", buf, ms.count());
    }

    Result<std::chrono::system_clock::time_point> parse_iso8601(const std::string &ts)
    {
        int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
        int consumed = 0;
        if (std::sscanf(ts.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n", &year, &month, &day, &hour, &minute, &second, &consumed) != 6)
        {
            return std::unexpected(AriError::parsing(std::format("Invalid timestamp: {}", ts)));
        }

        std::string rest = ts.substr(static_cast<std::size_t>(consumed));
        if (!rest.empty() && rest[0] == '.')
        {
            int frac_len = 0;
            if (std::sscanf(rest.c_str(), ".%3d%n", &millis, &frac_len) != 1)
                return std::unexpected(AriError::parsing(std::format("Invalid timestamp fraction: {}", ts)));
            rest = rest.substr(static_cast<std::size_t>(frac_len));
        }
        if (rest != "Z")
        {
            return std::unexpected(AriError::parsing(std::format("Timestamp must be UTC: {}", ts)));
        }

        std::tm tm_buf{};
        tm_buf.tm_year = year - 1900;
        tm_buf.tm_mon = month - 1;
        tm_buf.tm_mday = day;
        tm_buf.tm_hour = hour;
        tm_buf.tm_min = minute;
        tm_buf.tm_sec = second;
        std::time_t t = timegm(&tm_buf);
        if (t == static_cast<std::time_t>(-1))
        {
            return std::unexpected(AriError::parsing(std::format("Timestamp out of range: {}", ts)));
        }
        return std::chrono::system_clock::from_time_t(t) + std::chrono::milliseconds(millis);
    }

    std::string expand_home(const std::string &path)
    {
        if (path == "~" || path.rfind("~/", 0) == 0)
        {
            const char *home = std::getenv("HOME");
            if (home == nullptr)
                return path;
            return std::string(home) + path.substr(1);
        }
        return path;
    }

} // namespace ari
