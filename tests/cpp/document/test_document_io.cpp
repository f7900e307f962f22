#include <catch2/catch_test_macros.hpp>

#include <test_helpers.h>
#include <xmlmap/document/xml_document.h>
#include <xmlmap/serialization.h>

#include <filesystem>
#include <fstream>
#include <iterator>

namespace {
    // Removes the file when the test is done with it
    struct TempFile {
        explicit TempFile(std::string_view name) : path{std::filesystem::temp_directory_path() / name} {
        }

        ~TempFile() {
            std::error_code ec;
            std::filesystem::remove(path, ec);
        }

        std::string bytes() const {
            std::ifstream in{path, std::ios::binary};
            return {std::istreambuf_iterator<char>{in}, std::istreambuf_iterator<char>{}};
        }

        std::filesystem::path path;
    };
} // namespace

TEST_CASE("Parsed documents expose their elements", "[document]") {
    using namespace xmlmap;

    auto document = XmlDocument::parse(R"(<author id="a1"><name>Frank <![CDATA[Herbert]]></name><empty/></author>)");
    auto root = document.root();

    REQUIRE(root);
    REQUIRE(root.name() == "author");
    REQUIRE(root.attribute("id") == "a1");
    REQUIRE_FALSE(root.attribute("missing").has_value());
    REQUIRE(root.child("name")->text() == "Frank Herbert");
    REQUIRE_FALSE(root.child("empty")->text().has_value());
    REQUIRE_FALSE(root.child("missing").has_value());
    REQUIRE_FALSE(root.text().has_value());
}

TEST_CASE("Malformed markup", "[document]") {
    using namespace xmlmap;

    REQUIRE_THROWS_AS(XmlDocument::parse("<a><b></a>"), MalformedDocument);
    REQUIRE_THROWS_AS(XmlDocument::parse("not xml"), MalformedDocument);
    REQUIRE_THROWS_AS(XmlDocument::load("/nonexistent/document.xml"), MalformedDocument);

    XmlDocument empty;
    REQUIRE_FALSE(empty.root());
}

TEST_CASE("Building documents", "[document]") {
    using namespace xmlmap;

    XmlDocument document;
    auto root = document.new_root("author");
    root.set_attribute("id", "a1");
    root.set_attribute("id", "a2");

    auto name = root.child_or_append("name");
    name.set_text("Frank");
    name.set_text("Frank Herbert");
    REQUIRE(root.child_or_append("name") == name);

    auto book = root.append_child("book");
    book.set_text("Dune");
    root.append_child("book").set_text("");

    REQUIRE(document.to_string() == R"(<author id="a2"><name>Frank Herbert</name><book>Dune</book><book/></author>)");
    REQUIRE(root.children("book").size() == 2);

    document.new_root("other");
    REQUIRE(document.to_string() == "<other/>");
}

TEST_CASE("Text is written ahead of child elements", "[document]") {
    using namespace xmlmap;

    auto document = XmlDocument::parse("<price><currency>EUR</currency></price>");
    auto root = document.root();
    root.set_text("9.99");

    REQUIRE(root.text() == "9.99");
    REQUIRE(document.to_string() == "<price>9.99<currency>EUR</currency></price>");
}

TEST_CASE("Documents round trip through files", "[document]") {
    using namespace xmlmap;

    auto author = dictionary("author", {string("name"), integer("birth-year")});
    Value value = Mapping{{"name", "Frank Herbert"}, {"birth-year", 1920}};

    TempFile file{"xmlmap_document_io_utf8.xml"};
    serialize_to_file(*author, value, file.path, {.indent = "  ", .xml_declaration = true});

    REQUIRE(file.bytes().starts_with("<?xml"));
    REQUIRE(parse_from_file(*author, file.path) == value);

    REQUIRE_THROWS_AS(serialize_to_file(*author, value, "/nonexistent/dir/author.xml"), MalformedDocument);
}

TEST_CASE("Latin-1 files", "[document]") {
    using namespace xmlmap;

    auto place = dictionary("place", {string("name")});
    Value value = Mapping{{"name", "Café"}};

    TempFile file{"xmlmap_document_io_latin1.xml"};
    serialize_to_file(*place, value, file.path, {.encoding = TextEncoding::Latin1});

    auto bytes = file.bytes();
    REQUIRE(bytes.find('\xE9') != std::string::npos);
    REQUIRE(bytes.find("\xC3\xA9") == std::string::npos);

    REQUIRE(parse_from_file(*place, file.path, {.encoding = TextEncoding::Latin1}) == value);
}
