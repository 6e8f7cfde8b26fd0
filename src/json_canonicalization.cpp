#include "ari/json_canonicalization.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <cstdlib>
#include <vector>

namespace ari::json
{

    namespace
    {
        // Decode UTF-8 into UTF-16 code units. Malformed bytes map to U+FFFD,
        // which keeps the ordering total for arbitrary input.
        std::u16string to_utf16(const std::string &s)
        {
            std::u16string out;
            out.reserve(s.size());
            std::size_t i = 0;
            while (i < s.size())
            {
                auto c = static_cast<unsigned char>(s[i]);
                uint32_t cp = 0xFFFD;
                std::size_t len = 1;
                if (c < 0x80)
                {
                    cp = c;
                }
                else if ((c & 0xE0) == 0xC0 && i + 1 < s.size())
                {
                    cp = ((c & 0x1Fu) << 6) | (static_cast<unsigned char>(s[i + 1]) & 0x3Fu);
                    len = 2;
                }
                else if ((c & 0xF0) == 0xE0 && i + 2 < s.size())
                {
                    cp = ((c & 0x0Fu) << 12) |
                         ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 6) |
                         (static_cast<unsigned char>(s[i + 2]) & 0x3Fu);
                    len = 3;
                }
                else if ((c & 0xF8) == 0xF0 && i + 3 < s.size())
                {
                    cp = ((c & 0x07u) << 18) |
                         ((static_cast<unsigned char>(s[i + 1]) & 0x3Fu) << 12) |
                         ((static_cast<unsigned char>(s[i + 2]) & 0x3Fu) << 6) |
                         (static_cast<unsigned char>(s[i + 3]) & 0x3Fu);
                    len = 4;
                }
                i += len;

                if (cp >= 0x10000)
                {
                    cp -= 0x10000;
                    out.push_back(static_cast<char16_t>(0xD800 + (cp >> 10)));
                    out.push_back(static_cast<char16_t>(0xDC00 + (cp & 0x3FF)));
                }
                else
                {
                    out.push_back(static_cast<char16_t>(cp));
                }
            }
            return out;
        }
    } // namespace

    Result<std::string> RFC8785Canonicalizer::canonicalize(const nlohmann::json &value)
    {
        std::string output;
        if (auto res = serialize_value(value, output); !res)
            return std::unexpected(res.error());
        return output;
    }

    Result<std::string> RFC8785Canonicalizer::canonicalize_string(const std::string &json_str)
    {
        try
        {
            auto parsed = nlohmann::json::parse(json_str);
            return canonicalize(parsed);
        }
        catch (const nlohmann::json::exception &e)
        {
            return std::unexpected(AriError::invalid_input(std::format("JSON parse error: {}", e.what())));
        }
    }

    bool RFC8785Canonicalizer::is_valid_utf8(const std::string &str)
    {
        std::size_t i = 0;
        while (i < str.size())
        {
            auto c = static_cast<unsigned char>(str[i]);
            if (c < 0x80)
            {
                ++i;
                continue;
            }

            std::size_t len = 0;
            uint32_t cp = 0;
            uint32_t min = 0;
            if ((c & 0xE0) == 0xC0)
            {
                len = 2;
                cp = c & 0x1Fu;
                min = 0x80;
            }
            else if ((c & 0xF0) == 0xE0)
            {
                len = 3;
                cp = c & 0x0Fu;
                min = 0x800;
            }
            else if ((c & 0xF8) == 0xF0)
            {
                len = 4;
                cp = c & 0x07u;
                min = 0x10000;
            }
            else
            {
                return false;
            }

            if (i + len > str.size())
                return false;
            for (std::size_t k = 1; k < len; ++k)
            {
                auto cont = static_cast<unsigned char>(str[i + k]);
                if ((cont & 0xC0) != 0x80)
                    return false;
                cp = (cp << 6) | (cont & 0x3Fu);
            }
            if (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
                return false;
            i += len;
        }
        return true;
    }

    bool RFC8785Canonicalizer::utf16_less(const std::string &a, const std::string &b)
    {
        return to_utf16(a) < to_utf16(b);
    }

    std::string RFC8785Canonicalizer::format_double(double value)
    {
        if (value == 0.0)
            return "0";

        // Shortest round-trip digits in scientific form, e.g. "1.2345e+02"
        char buf[64];
        auto [end, ec] = std::to_chars(buf, buf + sizeof(buf), value, std::chars_format::scientific);
        (void)ec;
        std::string sci(buf, end);

        bool negative = sci[0] == '-';
        if (negative)
            sci.erase(0, 1);

        auto e_pos = sci.find('e');
        std::string mantissa = sci.substr(0, e_pos);
        int exponent = std::atoi(sci.c_str() + e_pos + 1);

        std::string digits;
        for (char ch : mantissa)
        {
            if (ch != '.')
                digits += ch;
        }
        int k = static_cast<int>(digits.size());
        int n = exponent + 1; // position of the decimal point relative to digits

        std::string out;
        if (k <= n && n <= 21)
        {
            out = digits + std::string(static_cast<std::size_t>(n - k), '0');
        }
        else if (0 < n && n <= 21)
        {
            out = digits.substr(0, static_cast<std::size_t>(n)) + "." + digits.substr(static_cast<std::size_t>(n));
        }
        else if (-6 < n && n <= 0)
        {
            out = "0." + std::string(static_cast<std::size_t>(-n), '0') + digits;
        }
        else
        {
            int e = n - 1;
            std::string exp_str = (e >= 0 ? "+" : "-") + std::to_string(std::abs(e));
            if (k == 1)
                out = digits + "e" + exp_str;
            else
                out = digits.substr(0, 1) + "." + digits.substr(1) + "e" + exp_str;
        }

        return negative ? "-" + out : out;
    }

    Result<void> RFC8785Canonicalizer::serialize_value(const nlohmann::json &value, std::string &output)
    {
        switch (value.type())
        {
        case nlohmann::json::value_t::null:
            output += "null";
            return {};

        case nlohmann::json::value_t::boolean:
            output += value.get<bool>() ? "true" : "false";
            return {};

        case nlohmann::json::value_t::number_integer:
            output += std::to_string(value.get<int64_t>());
            return {};

        case nlohmann::json::value_t::number_unsigned:
            output += std::to_string(value.get<uint64_t>());
            return {};

        case nlohmann::json::value_t::number_float:
        {
            double d = value.get<double>();
            if (!std::isfinite(d))
            {
                return std::unexpected(AriError::invalid_input("Non-finite number cannot be canonicalized"));
            }
            output += format_double(d);
            return {};
        }

        case nlohmann::json::value_t::string:
            return serialize_string(value.get_ref<const std::string &>(), output);

        case nlohmann::json::value_t::array:
            return serialize_array(value, output);

        case nlohmann::json::value_t::object:
            return serialize_object(value, output);

        default:
            return std::unexpected(AriError::invalid_input("Unsupported JSON value type for canonicalization"));
        }
    }

    Result<void> RFC8785Canonicalizer::serialize_string(const std::string &str, std::string &output)
    {
        if (!is_valid_utf8(str))
        {
            return std::unexpected(AriError::invalid_input("String is not valid UTF-8"));
        }

        output += '"';
        for (unsigned char ch : str)
        {
            switch (ch)
            {
            case '"':
                output += "\\\"";
                break;
            case '\\':
                output += "\\\\";
                break;
            case '\b':
                output += "\\b";
                break;
            case '\f':
                output += "\\f";
                break;
            case '\n':
                output += "\\n";
                break;
            case '\r':
                output += "\\r";
                break;
            case '\t':
                output += "\\t";
                break;
            default:
                if (ch < 0x20)
                {
                    output += std::format("\\u{:04x}", static_cast<unsigned>(ch));
                }
                else
                {
                    output += static_cast<char>(ch);
                }
                break;
            }
        }
        output += '"';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_object(const nlohmann::json &obj, std::string &output)
    {
        std::vector<std::string> keys;
        keys.reserve(obj.size());
        for (auto it = obj.begin(); it != obj.end(); ++it)
            keys.push_back(it.key());
        std::sort(keys.begin(), keys.end(), utf16_less);

        output += '{';
        bool first = true;
        for (const auto &key : keys)
        {
            if (!first)
                output += ',';
            first = false;

            if (auto res = serialize_string(key, output); !res)
                return res;
            output += ':';
            if (auto res = serialize_value(obj.at(key), output); !res)
                return res;
        }
        output += '}';
        return {};
    }

    Result<void> RFC8785Canonicalizer::serialize_array(const nlohmann::json &arr, std::string &output)
    {
        output += '[';
        bool first = true;
        for (const auto &item : arr)
        {
            if (!first)
                output += ',';
            first = false;
            if (auto res = serialize_value(item, output); !res)
                return res;
        }
        output += ']';
        return {};
    }

} // namespace ari::json
