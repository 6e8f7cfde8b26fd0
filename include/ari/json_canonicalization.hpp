#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>

namespace ari::json
{

    /**
     * RFC 8785 JSON Canonicalization Scheme (JCS)
     *
     * Deterministic serialization used as the hash input of audit entries:
     * - object members sorted by the UTF-16 code units of their names
     * - no insignificant whitespace
     * - minimal string escaping, lowercase \u00XX for other control characters
     * - numbers in the ECMAScript Number.prototype.toString form
     *
     * Non-finite numbers and strings that are not valid UTF-8 cannot be
     * represented and are rejected.
     */
    class RFC8785Canonicalizer
    {
    public:
        static Result<std::string> canonicalize(const nlohmann::json &value);

        /** Parse a JSON document and canonicalize it */
        static Result<std::string> canonicalize_string(const std::string &json_str);

        /** ECMAScript shortest round-trip rendering of a finite double */
        static std::string format_double(double value);

        /** Ordering of member names by UTF-16 code units */
        static bool utf16_less(const std::string &a, const std::string &b);

        /** Well-formed UTF-8: no overlong forms, surrogates or code points above U+10FFFF */
        static bool is_valid_utf8(const std::string &str);

    private:
        static Result<void> serialize_value(const nlohmann::json &value, std::string &output);

        static Result<void> serialize_string(const std::string &str, std::string &output);

        static Result<void> serialize_object(const nlohmann::json &obj, std::string &output);

        static Result<void> serialize_array(const nlohmann::json &arr, std::string &output);
    };

} // namespace ari::json
