#include <catch2/catch_test_macros.hpp>

#include <test_helpers.h>
#include <xmlmap/types/record.h>
#include <xmlmap/types/value.h>

#include <cstdint>
#include <limits>
#include <stdexcept>

namespace {
    struct Point {
        int x{};
        int y{};

        bool operator==(const Point &) const = default;
    };

    struct Opaque {
        int id{};
    };
} // namespace

TEST_CASE("Value kinds and accessors", "[value]") {
    using namespace xmlmap;

    REQUIRE(Value{}.is_null());
    REQUIRE(Value{true}.kind() == ValueKind::Bool);
    REQUIRE(Value{42}.kind() == ValueKind::Int);
    REQUIRE(Value{size_t{42}}.as_int() == 42);
    REQUIRE(Value{1.5}.kind() == ValueKind::Float);
    REQUIRE(Value{"text"}.kind() == ValueKind::String);
    REQUIRE(Value{std::string{"text"}}.as_string() == "text");
    REQUIRE(Value{Mapping{}}.is_mapping());
    REQUIRE(Value{Sequence{}}.is_sequence());

    REQUIRE(Value{3}.as_float() == 3.0);
    REQUIRE_THROWS_AS(Value{"3"}.as_int(), ValueTypeMismatch);
    REQUIRE_THROWS_AS(Value{3.5}.as_int(), ValueTypeMismatch);
    REQUIRE_THROWS_AS(Value{}.as_mapping(), ValueTypeMismatch);
    REQUIRE_THROWS_AS(Value{1}.as_bool(), ValueTypeMismatch);
}

TEST_CASE("Mappings keep insertion order and compare without it", "[value]") {
    using namespace xmlmap;

    Mapping m{{"name", "Frank Herbert"}, {"birth-year", 1920}};
    REQUIRE(m.size() == 2);
    REQUIRE(m.begin()->first == "name");
    REQUIRE(m.contains("birth-year"));
    REQUIRE(m.at("birth-year") == Value{1920});
    REQUIRE(m.find("missing") == nullptr);
    REQUIRE_THROWS_AS(m.at("missing"), std::out_of_range);

    m.insert_or_assign("birth-year", 1921);
    REQUIRE(m.size() == 2);
    REQUIRE(m.at("birth-year") == Value{1921});

    Mapping reordered{{"birth-year", 1921}, {"name", "Frank Herbert"}};
    REQUIRE(m == reordered);
    REQUIRE_FALSE(m == Mapping{{"name", "Frank Herbert"}});
}

TEST_CASE("Empty predicate", "[value]") {
    using namespace xmlmap;

    REQUIRE(Value{}.is_empty());
    REQUIRE(Value{false}.is_empty());
    REQUIRE(Value{0}.is_empty());
    REQUIRE(Value{0.0}.is_empty());
    REQUIRE(Value{""}.is_empty());
    REQUIRE(Value{Sequence{}}.is_empty());
    REQUIRE(Value{Mapping{}}.is_empty());

    REQUIRE_FALSE(Value{true}.is_empty());
    REQUIRE_FALSE(Value{-1}.is_empty());
    REQUIRE_FALSE(Value{0.5}.is_empty());
    REQUIRE_FALSE(Value{" "}.is_empty());
    REQUIRE_FALSE(Value{Sequence{0}}.is_empty());
    REQUIRE_FALSE(Value{RecordInstance::make(Point{})}.is_empty());
}

TEST_CASE("Value rendering", "[value]") {
    using namespace xmlmap;

    REQUIRE(Value{}.to_string() == "null");
    REQUIRE(Value{Mapping{{"a", 1}, {"b", "x"}}}.to_string() == "{'a': 1, 'b': 'x'}");
    REQUIRE(Value{Sequence{true, 1.5, Value{}}}.to_string() == "[True, 1.5, null]");
    REQUIRE(fmt::format("{}", Value{7}) == "7");
}

TEST_CASE("Records are deep copied", "[value]") {
    using namespace xmlmap;

    Value original = RecordInstance::make(Point{1, 2});
    Value copy = original;

    REQUIRE(copy == original);
    REQUIRE(&copy.as_record().as<Point>() != &original.as_record().as<Point>());
    REQUIRE(copy.as_record().is<Point>());
    REQUIRE_FALSE(copy.as_record().is<int>());
    REQUIRE_THROWS_AS(copy.as_record().as<std::string>(), ValueTypeMismatch);

    auto record = copy.as_record();
    record.as_mutable<Point>().x = 10;
    REQUIRE(copy.as_record().as<Point>().x == 1);
    REQUIRE_FALSE(Value{record} == copy);
}

TEST_CASE("Unsigned integers beyond the Int range are rejected", "[value]") {
    using namespace xmlmap;

    constexpr auto largest = static_cast<uint64_t>(std::numeric_limits<int64_t>::max());
    REQUIRE(Value{largest}.as_int() == std::numeric_limits<int64_t>::max());
    REQUIRE_THROWS_AS(Value{largest + 1}, ValueTypeMismatch);
    REQUIRE_THROWS_AS(Value{std::numeric_limits<uint64_t>::max()}, ValueTypeMismatch);
    REQUIRE_THROWS_AS(ValueConverter<uint64_t>::to_value(std::numeric_limits<uint64_t>::max()), ValueTypeMismatch);
    REQUIRE(ValueConverter<uint32_t>::to_value(std::numeric_limits<uint32_t>::max()) ==
            Value{int64_t{std::numeric_limits<uint32_t>::max()}});
}

TEST_CASE("Records without operator== compare by identity", "[value]") {
    using namespace xmlmap;

    Value original = RecordInstance::make(Opaque{7});
    Value copy = original;

    REQUIRE(original == original);
    REQUIRE_FALSE(copy == original);
    REQUIRE(copy.as_record().as<Opaque>().id == 7);
}
