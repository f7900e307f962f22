#include <catch2/catch_test_macros.hpp>

#include <test_helpers.h>
#include <xmlmap/xmlmap.h>

using xmlmap::testing::strip_xml;

namespace {
    using namespace xmlmap;

    processor_s_ptr library_processor() {
        auto author = dictionary("author", {
                                     string(".", {.attribute = "first"}),
                                     string(".", {.attribute = "last"}),
                                 });
        auto book = dictionary("book", {
                                   string(".", {.attribute = "isbn"}),
                                   string("title"),
                                   integer("published/year"),
                                   floating_point("price", {.required = false, .default_value = Value{}}),
                                   boolean("in-print", {.required = false}),
                                   author,
                                   array(string("tag", {.required = false}), {.alias = "tags", .nested = "tags"}),
                               });
        return dictionary("library", {
                              string(".", {.attribute = "name"}),
                              array(book, {.alias = "books", .nested = "catalogue"}),
                              array(string("member"), {.alias = "members"}),
                          });
    }
} // namespace

TEST_CASE("Documents survive a decode / encode cycle", "[round_trip]") {
    auto xml = strip_xml(R"(
        <library name="City">
            <catalogue>
                <book isbn="0441013597">
                    <title>Dune</title>
                    <published><year>1965</year></published>
                    <price>9.99</price>
                    <in-print>True</in-print>
                    <author first="Frank" last="Herbert"/>
                    <tags><tag>sf</tag><tag>classic</tag></tags>
                </book>
                <book isbn="0141439580">
                    <title>Emma</title>
                    <published><year>1815</year></published>
                    <in-print>False</in-print>
                    <author first="Jane" last="Austen"/>
                    <tags/>
                </book>
            </catalogue>
            <member>Ada</member>
            <member>Grace</member>
        </library>
    )");

    auto library = library_processor();
    auto value = parse_from_string(*library, xml);

    Value expected = Mapping{
        {"name", "City"},
        {
            "books", Sequence{
                Mapping{
                    {"isbn", "0441013597"}, {"title", "Dune"}, {"year", 1965}, {"price", 9.99}, {"in-print", true},
                    {"author", Mapping{{"first", "Frank"}, {"last", "Herbert"}}}, {"tags", Sequence{"sf", "classic"}},
                },
                Mapping{
                    {"isbn", "0141439580"}, {"title", "Emma"}, {"year", 1815}, {"price", Value{}}, {"in-print", false},
                    {"author", Mapping{{"first", "Jane"}, {"last", "Austen"}}}, {"tags", Sequence{}},
                },
            }
        },
        {"members", Sequence{"Ada", "Grace"}},
    };
    REQUIRE(value == expected);
    REQUIRE(serialize_to_string(*library, value) == xml);
    REQUIRE(parse_from_string(*library, serialize_to_string(*library, value, {.indent = "  "})) == value);
}

TEST_CASE("Values survive an encode / decode cycle", "[round_trip]") {
    auto readings = dictionary("readings", {
                                   array(dictionary("reading", {
                                                        string(".", {.attribute = "sensor"}),
                                                        floating_point("value"),
                                                        boolean("valid"),
                                                    }), {.alias = "items"}),
                               });

    Value value = Mapping{
        {
            "items", Sequence{
                Mapping{{"sensor", "t1"}, {"value", 0.1}, {"valid", true}},
                Mapping{{"sensor", "t2"}, {"value", -1e-7}, {"valid", false}},
                Mapping{{"sensor", "t3"}, {"value", 6.02214076e23}, {"valid", true}},
            }
        }
    };

    REQUIRE(parse_from_string(*readings, serialize_to_string(*readings, value)) == value);
}

TEST_CASE("Whitespace-only values survive a round trip when stripping is off", "[round_trip]") {
    auto padded = dictionary("padded", {string("kept", {.strip_whitespace = false})});
    Value value = Mapping{{"kept", "   "}};

    auto xml = serialize_to_string(*padded, value);
    REQUIRE(xml == "<padded><kept>   </kept></padded>");
    REQUIRE(parse_from_string(*padded, xml) == value);
    REQUIRE(parse_from_string(*padded, serialize_to_string(*padded, value, {.indent = "  "})) == value);
}
