#include <catch2/catch_test_macros.hpp>
#include "lucent/coercion.hpp"
#include <cstdint>
#include <limits>

using namespace lucent;
using nlohmann::json;

TEST_CASE("Integer coercion takes the leading numeric prefix", "[coercion]")
{
    REQUIRE(coerce(json("42"), ScalarType::Integer) == 42);
    REQUIRE(coerce(json(" 12abc"), ScalarType::Integer) == 12);
    REQUIRE(coerce(json("3.9"), ScalarType::Integer) == 3);
    REQUIRE(coerce(json("-7"), ScalarType::Integer) == -7);
    REQUIRE(coerce(json("abc"), ScalarType::Integer) == 0);
    REQUIRE(coerce(json(true), ScalarType::Integer) == 1);
}

TEST_CASE("Integer coercion keeps full 64-bit precision", "[coercion]")
{
    REQUIRE(coerce(json("9007199254740993"), ScalarType::Integer) == 9007199254740993LL);
    REQUIRE(coerce(json("123456789012345678"), ScalarType::Integer) == 123456789012345678LL);
    REQUIRE(coerce(json("+15"), ScalarType::Integer) == 15);
    REQUIRE(coerce(json("-9223372036854775808"), ScalarType::Integer) == std::numeric_limits<std::int64_t>::min());
}

TEST_CASE("Integer coercion clamps out-of-range values", "[coercion]")
{
    REQUIRE(coerce(json("99999999999999999999"), ScalarType::Integer) == std::numeric_limits<std::int64_t>::max());
    REQUIRE(coerce(json("-99999999999999999999"), ScalarType::Integer) == std::numeric_limits<std::int64_t>::min());
    REQUIRE(coerce(json(std::numeric_limits<std::uint64_t>::max()), ScalarType::Integer) ==
            std::numeric_limits<std::int64_t>::max());
    REQUIRE(coerce(json(std::numeric_limits<std::uint64_t>::max()), ScalarType::String) == "18446744073709551615");
    REQUIRE(coerce(json("1e30"), ScalarType::Integer) == std::numeric_limits<std::int64_t>::max());
}

TEST_CASE("Float coercion", "[coercion]")
{
    REQUIRE(coerce(json("2.5"), ScalarType::Float) == 2.5);
    REQUIRE(coerce(json("1e3"), ScalarType::Float) == 1000.0);
    REQUIRE(coerce(json("x"), ScalarType::Float) == 0.0);
}

TEST_CASE("Boolean coercion follows the falsy table", "[coercion]")
{
    REQUIRE(coerce(json(""), ScalarType::Boolean) == false);
    REQUIRE(coerce(json("0"), ScalarType::Boolean) == false);
    REQUIRE(coerce(json(nullptr), ScalarType::Boolean) == false);
    REQUIRE(coerce(json::array(), ScalarType::Boolean) == false);
    REQUIRE(coerce(json("false"), ScalarType::Boolean) == true);
    REQUIRE(coerce(json("yes"), ScalarType::Boolean) == true);
}

TEST_CASE("String and array coercion", "[coercion]")
{
    REQUIRE(coerce(json(5), ScalarType::String) == "5");
    REQUIRE(coerce(json(true), ScalarType::String) == "1");
    REQUIRE(coerce(json(false), ScalarType::String) == "");
    REQUIRE(coerce(json(nullptr), ScalarType::Array) == json::array());
    REQUIRE(coerce(json("a"), ScalarType::Array) == json::array({"a"}));

    json object = {{"k", 1}};
    REQUIRE(coerce(object, ScalarType::Any) == object);
}

TEST_CASE("Numeric detection covers the whole string", "[coercion]")
{
    REQUIRE(is_numeric("12"));
    REQUIRE(is_numeric(" -3.5 "));
    REQUIRE(is_numeric("1e4"));
    REQUIRE_FALSE(is_numeric("12abc"));
    REQUIRE_FALSE(is_numeric("abc"));
    REQUIRE_FALSE(is_numeric(""));
}

TEST_CASE("Scalar type names round trip through the parser", "[coercion]")
{
    for (auto type : {ScalarType::Integer, ScalarType::Float, ScalarType::Boolean,
                      ScalarType::String, ScalarType::Array, ScalarType::Any})
    {
        REQUIRE(scalar_type_from_string(scalar_type_to_string(type)) == type);
    }
    REQUIRE_FALSE(scalar_type_from_string("object").has_value());
}
