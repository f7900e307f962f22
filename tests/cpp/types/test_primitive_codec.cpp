#include <catch2/catch_test_macros.hpp>

#include <test_helpers.h>
#include <xmlmap/types/primitive_codec.h>
#include <xmlmap/util/errors.h>

#include <cmath>

TEST_CASE("Boolean tokens", "[primitive_codec]") {
    using namespace xmlmap;

    for (auto text : {"true", "TRUE", " Yes ", "1", "True"}) {
        REQUIRE(parse_primitive(text, PrimitiveType::Boolean) == Value{true});
    }
    for (auto text : {"false", "No", "0", "\tFALSE\n"}) {
        REQUIRE(parse_primitive(text, PrimitiveType::Boolean) == Value{false});
    }

    REQUIRE_THROWS_AS(parse_primitive("maybe", PrimitiveType::Boolean), InvalidPrimitiveValue);
    REQUIRE_THROWS_AS(parse_primitive("", PrimitiveType::Boolean), InvalidPrimitiveValue);
    REQUIRE_THROWS_AS(parse_primitive("2", PrimitiveType::Boolean), InvalidPrimitiveValue);
}

TEST_CASE("Integer parsing is strict", "[primitive_codec]") {
    using namespace xmlmap;

    REQUIRE(parse_primitive("42", PrimitiveType::Integer) == Value{42});
    REQUIRE(parse_primitive(" -7 ", PrimitiveType::Integer) == Value{-7});
    REQUIRE(parse_primitive("+5", PrimitiveType::Integer) == Value{5});

    for (auto text : {"4.2", "12abc", "", "+", "+-3", "99999999999999999999", "Hello"}) {
        REQUIRE_THROWS_AS(parse_primitive(text, PrimitiveType::Integer), InvalidPrimitiveValue);
    }

    try {
        (void) parse_primitive("Hello", PrimitiveType::Integer);
        FAIL("Expected an InvalidPrimitiveValue");
    } catch (const InvalidPrimitiveValue &e) {
        REQUIRE(e.detail() == "Invalid integer value: \"Hello\"");
        REQUIRE(e.raw_text() == "Hello");
        REQUIRE_FALSE(e.has_location());
    }
}

TEST_CASE("Float parsing", "[primitive_codec]") {
    using namespace xmlmap;

    REQUIRE(parse_primitive("3.5", PrimitiveType::FloatingPoint) == Value{3.5});
    REQUIRE(parse_primitive("1e3", PrimitiveType::FloatingPoint) == Value{1000.0});
    REQUIRE(parse_primitive(" -0.25 ", PrimitiveType::FloatingPoint) == Value{-0.25});
    REQUIRE(parse_primitive("7", PrimitiveType::FloatingPoint).is_float());
    REQUIRE(std::isinf(parse_primitive("inf", PrimitiveType::FloatingPoint).as_float()));

    REQUIRE_THROWS_AS(parse_primitive("abc", PrimitiveType::FloatingPoint), InvalidPrimitiveValue);
    REQUIRE_THROWS_AS(parse_primitive("1.5x", PrimitiveType::FloatingPoint), InvalidPrimitiveValue);
    REQUIRE_THROWS_AS(parse_primitive("", PrimitiveType::FloatingPoint), InvalidPrimitiveValue);
}

TEST_CASE("Strings are taken as is, optionally stripped", "[primitive_codec]") {
    using namespace xmlmap;

    REQUIRE(parse_primitive("  hi there  ", PrimitiveType::String) == Value{"hi there"});
    REQUIRE(parse_primitive("  hi there  ", PrimitiveType::String, false) == Value{"  hi there  "});
    REQUIRE(parse_primitive("", PrimitiveType::String) == Value{""});
}

TEST_CASE("Serialization of primitives", "[primitive_codec]") {
    using namespace xmlmap;

    REQUIRE(serialize_primitive(true, PrimitiveType::Boolean) == "True");
    REQUIRE(serialize_primitive(false, PrimitiveType::Boolean) == "False");
    REQUIRE(serialize_primitive(1907, PrimitiveType::Integer) == "1907");
    REQUIRE(serialize_primitive(-3, PrimitiveType::Integer) == "-3");
    REQUIRE(serialize_primitive(0.1, PrimitiveType::FloatingPoint) == "0.1");
    REQUIRE(serialize_primitive(2.5, PrimitiveType::FloatingPoint) == "2.5");
    REQUIRE(serialize_primitive(3, PrimitiveType::FloatingPoint) == "3");
    REQUIRE(serialize_primitive("Dune", PrimitiveType::String) == "Dune");

    REQUIRE_THROWS_AS(serialize_primitive("abc", PrimitiveType::Integer), InvalidPrimitiveValue);
    REQUIRE_THROWS_AS(serialize_primitive(1, PrimitiveType::Boolean), InvalidPrimitiveValue);
    REQUIRE_THROWS_AS(serialize_primitive(1.5, PrimitiveType::Integer), InvalidPrimitiveValue);
    REQUIRE_THROWS_AS(serialize_primitive(Value{}, PrimitiveType::String), InvalidPrimitiveValue);
}

TEST_CASE("Parsed values serialize back to the same value", "[primitive_codec]") {
    using namespace xmlmap;

    for (double d : {0.1, 1.0 / 3.0, 6.02214076e23, -1e-300}) {
        auto text = serialize_primitive(d, PrimitiveType::FloatingPoint);
        REQUIRE(parse_primitive(text, PrimitiveType::FloatingPoint) == Value{d});
    }
}
