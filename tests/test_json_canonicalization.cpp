#include <catch2/catch_test_macros.hpp>
#include "ari/json_canonicalization.hpp"
#include <cmath>
#include <limits>

using namespace ari;
using namespace ari::json;
using json = nlohmann::json;

TEST_CASE("RFC 8785 - Simple object canonicalization", "[json]")
{
    json obj = {
        {"z", 3},
        {"a", 1},
        {"m", 2}};

    REQUIRE(RFC8785Canonicalizer::canonicalize(obj).value() == R"({"a":1,"m":2,"z":3})");
}

TEST_CASE("RFC 8785 - Nested object canonicalization", "[json]")
{
    json obj = {
        {"outer", {{"z", "last"}, {"a", "first"}}}};

    REQUIRE(RFC8785Canonicalizer::canonicalize(obj).value() == R"({"outer":{"a":"first","z":"last"}})");
}

TEST_CASE("RFC 8785 - Arrays keep their order", "[json]")
{
    REQUIRE(RFC8785Canonicalizer::canonicalize(json{3, 1, 2}).value() == "[3,1,2]");
    REQUIRE(RFC8785Canonicalizer::canonicalize(json::object()).value() == "{}");
    REQUIRE(RFC8785Canonicalizer::canonicalize(json::array()).value() == "[]");
}

TEST_CASE("RFC 8785 - String escaping", "[json]")
{
    json obj = {
        {"quote", "He said \"hello\""},
        {"newline", "line1\nline2"},
        {"slash", "a/b\\c"},
        {"ctrl", std::string("x\x01\x1F")}};

    auto canonical = RFC8785Canonicalizer::canonicalize(obj).value();
    REQUIRE(canonical ==
            R"({"ctrl":"x\u0001\u001f","newline":"line1\nline2","quote":"He said \"hello\"","slash":"a/b\\c"})");
}

TEST_CASE("RFC 8785 - Literals and integers", "[json]")
{
    json obj = {
        {"bool_true", true},
        {"bool_false", false},
        {"null_val", nullptr},
        {"negative", -17},
        {"big", 18446744073709551615ULL}};

    REQUIRE(RFC8785Canonicalizer::canonicalize(obj).value() ==
            R"({"big":18446744073709551615,"bool_false":false,"bool_true":true,"negative":-17,"null_val":null})");
}

TEST_CASE("RFC 8785 - Floating point follows ECMAScript formatting", "[json][number]")
{
    REQUIRE(RFC8785Canonicalizer::format_double(0.5) == "0.5");
    REQUIRE(RFC8785Canonicalizer::format_double(-0.0) == "0");
    REQUIRE(RFC8785Canonicalizer::format_double(123.456) == "123.456");
    REQUIRE(RFC8785Canonicalizer::format_double(1e20) == "100000000000000000000");
    REQUIRE(RFC8785Canonicalizer::format_double(1e21) == "1e+21");
    REQUIRE(RFC8785Canonicalizer::format_double(1e-6) == "0.000001");
    REQUIRE(RFC8785Canonicalizer::format_double(1e-7) == "1e-7");
    REQUIRE(RFC8785Canonicalizer::format_double(-1.5e-9) == "-1.5e-9");

    REQUIRE(RFC8785Canonicalizer::canonicalize(json{{"f", 2.0}}).value() == R"({"f":2})");
}

TEST_CASE("RFC 8785 - Non-finite numbers are rejected", "[json][number]")
{
    auto nan = RFC8785Canonicalizer::canonicalize(json{{"x", std::numeric_limits<double>::quiet_NaN()}});
    REQUIRE_FALSE(nan.has_value());
    REQUIRE(nan.error().code == ErrorCode::InvalidInput);

    auto inf = RFC8785Canonicalizer::canonicalize(json::array({std::numeric_limits<double>::infinity()}));
    REQUIRE_FALSE(inf.has_value());
}

TEST_CASE("RFC 8785 - Strings must be well-formed UTF-8", "[json][utf8]")
{
    REQUIRE(RFC8785Canonicalizer::is_valid_utf8("caf\xC3\xA9"));
    REQUIRE(RFC8785Canonicalizer::is_valid_utf8("\xF0\x9F\x98\x80"));
    REQUIRE_FALSE(RFC8785Canonicalizer::is_valid_utf8("\xff"));
    REQUIRE_FALSE(RFC8785Canonicalizer::is_valid_utf8("\xC0\xAF"));
    REQUIRE_FALSE(RFC8785Canonicalizer::is_valid_utf8("\xED\xA0\x80"));
    REQUIRE_FALSE(RFC8785Canonicalizer::is_valid_utf8("\xF4\x90\x80\x80"));
    REQUIRE_FALSE(RFC8785Canonicalizer::is_valid_utf8("\xE2\x82"));

    auto value = RFC8785Canonicalizer::canonicalize(json{{"name", "al\xff"}});
    REQUIRE_FALSE(value.has_value());
    REQUIRE(value.error().code == ErrorCode::InvalidInput);

    auto key = RFC8785Canonicalizer::canonicalize(json{{"\xC0\xAF", 1}});
    REQUIRE_FALSE(key.has_value());
    REQUIRE(key.error().code == ErrorCode::InvalidInput);
}

TEST_CASE("RFC 8785 - Member names sort by UTF-16 code units", "[json][ordering]")
{
    // U+1F600 encodes as the surrogate pair D83D DE00, which sorts before U+E000
    const std::string emoji = "\xF0\x9F\x98\x80";
    const std::string private_use = "\xEE\x80\x80";

    REQUIRE(RFC8785Canonicalizer::utf16_less(emoji, private_use));
    REQUIRE_FALSE(RFC8785Canonicalizer::utf16_less(private_use, emoji));
    REQUIRE(RFC8785Canonicalizer::utf16_less("a", "b"));
    REQUIRE(RFC8785Canonicalizer::utf16_less("a", "aa"));

    json obj = {{private_use, 1}, {emoji, 2}};
    REQUIRE(RFC8785Canonicalizer::canonicalize(obj).value() ==
            "{\"" + emoji + "\":2,\"" + private_use + "\":1}");
}

TEST_CASE("RFC 8785 - Canonicalizing parsed text", "[json]")
{
    auto canonical = RFC8785Canonicalizer::canonicalize_string(R"({ "b" : [ 1, 2 ], "a" : { "y": null, "x": true } })");
    REQUIRE(canonical.has_value());
    REQUIRE(*canonical == R"({"a":{"x":true,"y":null},"b":[1,2]})");

    auto invalid = RFC8785Canonicalizer::canonicalize_string("{ not json");
    REQUIRE_FALSE(invalid.has_value());
    REQUIRE(invalid.error().code == ErrorCode::InvalidInput);
}
