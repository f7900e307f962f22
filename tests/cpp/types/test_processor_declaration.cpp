#include <catch2/catch_test_macros.hpp>

#include <test_helpers.h>
#include <xmlmap/types/processor.h>

namespace {
    struct Book {
        std::string title;
        int year{};
    };
} // namespace

TEST_CASE("Aliases default to the attribute, then the last element name", "[declaration]") {
    using namespace xmlmap;

    REQUIRE(integer("birth-year")->alias() == "birth-year");
    REQUIRE(string("info/name")->alias() == "name");
    REQUIRE(string(".", {.attribute = "title"})->alias() == "title");
    REQUIRE(string("author", {.attribute = "first", .alias = "first-name"})->alias() == "first-name");
    REQUIRE(dictionary("author", {})->alias() == "author");
    REQUIRE(dictionary("a/b", {}, {.alias = "c"})->alias() == "c");

    REQUIRE(array(string("item"))->alias() == "item");
    REQUIRE(array(string("item"), {.nested = "items"})->alias() == "items");
    REQUIRE(array(string("item"), {.alias = "values", .nested = "items"})->alias() == "values");
}

TEST_CASE("A value without any name is rejected", "[declaration]") {
    using namespace xmlmap;

    REQUIRE_THROWS_AS(string("."), InvalidRootConfiguration);
    REQUIRE_THROWS_AS(dictionary(".", {}), InvalidRootConfiguration);
    REQUIRE_NOTHROW(string(".", {.alias = "text"}));
    REQUIRE_THROWS_AS(string(".", {.attribute = ""}), InvalidRootConfiguration);
}

TEST_CASE("Bad selectors are rejected when declared", "[declaration]") {
    using namespace xmlmap;

    REQUIRE_THROWS_AS(string(""), InvalidRootConfiguration);
    REQUIRE_THROWS_AS(integer("a//b"), InvalidRootConfiguration);
    REQUIRE_THROWS_AS(dictionary("/a", {}), InvalidRootConfiguration);
}

TEST_CASE("omit_empty requires an optional value", "[declaration]") {
    using namespace xmlmap;

    REQUIRE_THROWS_AS(integer("x", {.required = true, .omit_empty = true}), InvalidRootConfiguration);
    REQUIRE_THROWS_AS(dictionary("x", {}, {.required = true, .omit_empty = true}), InvalidRootConfiguration);
    REQUIRE_NOTHROW(integer("x", {.required = false, .omit_empty = true}));

    // Arrays: only optional nested arrays may be omitted
    REQUIRE_THROWS_AS(array(string("item", {.required = false}), {.omit_empty = true}), InvalidRootConfiguration);
    REQUIRE_THROWS_AS(array(string("item"), {.nested = "items", .omit_empty = true}), InvalidRootConfiguration);
    REQUIRE_NOTHROW(array(string("item"), {.nested = "items", .required = false, .omit_empty = true}));
}

TEST_CASE("Defaults", "[declaration]") {
    using namespace xmlmap;

    REQUIRE(boolean("x", {.required = false})->default_value() == Value{false});
    REQUIRE(integer("x", {.required = false})->default_value() == Value{0});
    REQUIRE(floating_point("x", {.required = false})->default_value() == Value{0.0});
    REQUIRE(string("x", {.required = false})->default_value() == Value{""});
    REQUIRE(integer("x", {.required = false, .default_value = 7})->default_value() == Value{7});
    REQUIRE(integer("x", {.required = false, .default_value = Value{}})->default_value().is_null());

    // Required values never use a default
    REQUIRE(integer("x")->default_value().is_null());
    REQUIRE(integer("x", {.default_value = 5})->default_value().is_null());

    REQUIRE(dictionary("x", {}, {.required = false})->default_value().is_null());
    REQUIRE(dictionary("x", {}, {.required = false, .default_value = Mapping{{"a", 1}}})->default_value() ==
            Value{Mapping{{"a", 1}}});

    REQUIRE_THROWS_AS(integer("x", {.required = false, .default_value = "abc"}), InvalidRootConfiguration);
    REQUIRE_THROWS_AS(dictionary("x", {}, {.required = false, .default_value = 1}), InvalidRootConfiguration);
}

TEST_CASE("Children of an aggregate need distinct aliases", "[declaration]") {
    using namespace xmlmap;

    REQUIRE_THROWS_AS(dictionary("author", {string("name"), string("other/name")}), InvalidRootConfiguration);
    REQUIRE_NOTHROW(dictionary("author", {string("name"), string("other/name", {.alias = "other-name"})}));
}

TEST_CASE("Array declarations", "[declaration]") {
    using namespace xmlmap;

    REQUIRE(array(string("item"))->required());
    REQUIRE_FALSE(array(string("item", {.required = false}))->required());
    REQUIRE_FALSE(array(string("item"), {.required = false})->required());

    REQUIRE(array(string("item"))->is_embedded_array());
    REQUIRE_FALSE(array(string("item"), {.nested = "items"})->is_embedded_array());

    // Array items need their own element and cannot be embedded arrays
    REQUIRE_THROWS_AS(array(array(string("x"))), InvalidRootConfiguration);
    REQUIRE_NOTHROW(array(array(string("x"), {.nested = "row"})));
    REQUIRE_THROWS_AS(array(string(".", {.attribute = "a"})), InvalidRootConfiguration);
    REQUIRE_THROWS_AS(array(nullptr), InvalidRootConfiguration);
}

TEST_CASE("Record declarations are checked against the record type", "[declaration]") {
    using namespace xmlmap;

    auto fields = object_fields<Book>().field("title", &Book::title).field("year", &Book::year);
    REQUIRE_NOTHROW(user_object<Book>("book", fields, {string("title"), integer("year")}));
    REQUIRE_THROWS_AS(user_object<Book>("book", fields, {string("title"), integer("pages")}), InvalidRootConfiguration);
    REQUIRE_THROWS_AS(object_fields<Book>().field("title", &Book::title).field("title", &Book::title),
                      InvalidRootConfiguration);

    REQUIRE_NOTHROW(named_tuple<std::string, int>("book", {string("title"), integer("year")}));
    REQUIRE_THROWS_AS((named_tuple<std::string, int>("book", {string("title")})), InvalidRootConfiguration);
}

TEST_CASE("Root processors", "[declaration]") {
    using namespace xmlmap;

    REQUIRE_NOTHROW(check_root_processor(*dictionary("author", {})));
    REQUIRE_NOTHROW(check_root_processor(*array(string("item"), {.nested = "items"})));
    REQUIRE_THROWS_AS(check_root_processor(*string("name")), InvalidRootConfiguration);
    REQUIRE_THROWS_AS(check_root_processor(*array(string("item"))), InvalidRootConfiguration);
}

TEST_CASE("Processor descriptions", "[declaration]") {
    using namespace xmlmap;

    REQUIRE(integer("birth-year")->describe() == "integer('birth-year')");
    REQUIRE(string(".", {.attribute = "title"})->describe() == "string('.', attribute='title')");
    REQUIRE(fmt::format("{}", *dictionary("author", {})) == "dictionary('author')");
    REQUIRE(array(string("item"), {.nested = "items"})->describe() == "array('items', nested, item=string('item'))");
}
