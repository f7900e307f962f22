#pragma once

/**
 * @file value.h
 * @brief The structured value decoded from, and encoded to, a document.
 *
 * A Value is a closed variant over:
 * - Null (absent optional record, or "no value")
 * - Bool, Int (int64_t), Float (double), String
 * - Mapping (insertion ordered name -> Value)
 * - Sequence (ordered Values)
 * - Record (a type-erased user object or named tuple)
 *
 * Values have value semantics; copying deep copies the whole tree, records included.
 *
 * Usage:
 * @code
 * Value author = Mapping{
 *     {"name", "Robert A. Heinlein"},
 *     {"birth-year", 1907},
 *     {"books", Sequence{Mapping{{"title", "Starship Troopers"}}}},
 * };
 * int64_t year = author.as_mapping().at("birth-year").as_int();
 * @endcode
 */

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/types/record_instance.h>
#include <xmlmap/util/errors.h>

#include <fmt/format.h>

#include <concepts>
#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace xmlmap {

class Value;

/**
 * @brief Insertion ordered string keyed map of values.
 *
 * Keys are unique; assigning an existing key replaces the value in place. Equality ignores ordering, two mappings
 * are equal when they hold the same keys bound to equal values.
 */
class XMLMAP_EXPORT Mapping {
public:
    using entry_type = std::pair<std::string, Value>;
    using container_type = std::vector<entry_type>;
    using const_iterator = container_type::const_iterator;

    Mapping() = default;
    Mapping(std::initializer_list<entry_type> entries);

    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] bool contains(std::string_view key) const;

    /// @return The value bound to key, or nullptr
    [[nodiscard]] const Value *find(std::string_view key) const;

    /// @throws std::out_of_range if the key is not present
    [[nodiscard]] const Value &at(std::string_view key) const;

    void insert_or_assign(std::string key, Value value);

    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

    [[nodiscard]] bool operator==(const Mapping &other) const;

private:
    container_type _entries;
};

/**
 * @brief Ordered list of values.
 */
class XMLMAP_EXPORT Sequence {
public:
    using container_type = std::vector<Value>;
    using const_iterator = container_type::const_iterator;

    Sequence() = default;
    Sequence(std::initializer_list<Value> items);
    explicit Sequence(container_type items);

    [[nodiscard]] size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    [[nodiscard]] const Value &operator[](size_t index) const;

    void push_back(Value value);

    [[nodiscard]] const_iterator begin() const noexcept;
    [[nodiscard]] const_iterator end() const noexcept;

    [[nodiscard]] bool operator==(const Sequence &other) const;

private:
    container_type _items;
};

/**
 * ValueKind - Classification of values, in variant index order
 */
enum class ValueKind : uint8_t {
    Null,
    Bool,
    Int,
    Float,
    String,
    Mapping,
    Sequence,
    Record,
};

[[nodiscard]] XMLMAP_EXPORT std::string_view to_string(ValueKind kind) noexcept;

class XMLMAP_EXPORT Value {
public:
    using variant_type = std::variant<std::monostate, bool, int64_t, double, std::string, Mapping, Sequence,
                                      RecordInstance>;

    Value() = default;

    Value(bool value) : _data{value} {}

    template<std::integral T>
        requires (!std::same_as<T, bool>)
    Value(T value) : _data{checked_int(value)} {}

    Value(double value) : _data{value} {}
    Value(float value) : _data{static_cast<double>(value)} {}
    Value(std::string value) : _data{std::move(value)} {}
    Value(const char *value) : _data{std::string{value}} {}
    Value(std::string_view value) : _data{std::string{value}} {}
    Value(Mapping value) : _data{std::move(value)} {}
    Value(Sequence value) : _data{std::move(value)} {}
    Value(RecordInstance value) : _data{std::move(value)} {}

    [[nodiscard]] ValueKind kind() const noexcept { return static_cast<ValueKind>(_data.index()); }

    [[nodiscard]] bool is_null() const noexcept { return kind() == ValueKind::Null; }
    [[nodiscard]] bool is_bool() const noexcept { return kind() == ValueKind::Bool; }
    [[nodiscard]] bool is_int() const noexcept { return kind() == ValueKind::Int; }
    [[nodiscard]] bool is_float() const noexcept { return kind() == ValueKind::Float; }
    [[nodiscard]] bool is_string() const noexcept { return kind() == ValueKind::String; }
    [[nodiscard]] bool is_mapping() const noexcept { return kind() == ValueKind::Mapping; }
    [[nodiscard]] bool is_sequence() const noexcept { return kind() == ValueKind::Sequence; }
    [[nodiscard]] bool is_record() const noexcept { return kind() == ValueKind::Record; }

    // Accessors throw ValueTypeMismatch when the value holds another kind.
    [[nodiscard]] bool as_bool() const;
    [[nodiscard]] int64_t as_int() const;
    [[nodiscard]] double as_float() const;
    [[nodiscard]] const std::string &as_string() const;
    [[nodiscard]] const Mapping &as_mapping() const;
    [[nodiscard]] const Sequence &as_sequence() const;
    [[nodiscard]] const RecordInstance &as_record() const;

    /**
     * @brief The omit_empty predicate.
     *
     * Null, false, 0, 0.0, the empty string, an empty sequence and an empty mapping are empty.
     * Records are never empty.
     */
    [[nodiscard]] bool is_empty() const noexcept;

    [[nodiscard]] const variant_type &data() const noexcept { return _data; }

    [[nodiscard]] bool operator==(const Value &other) const;

    [[nodiscard]] std::string to_string() const;

private:
    // Unsigned values above INT64_MAX have no Int representation
    template<std::integral T>
    static int64_t checked_int(T value) {
        if (!std::in_range<int64_t>(value)) {
            throw_error<ValueTypeMismatch>("Integer value {} does not fit a signed 64 bit Int", value);
        }
        return static_cast<int64_t>(value);
    }

    variant_type _data;
};

} // namespace xmlmap

namespace fmt {
    template<>
    struct formatter<xmlmap::Value> : formatter<string_view> {
        template<typename FormatContext>
        auto format(const xmlmap::Value &v, FormatContext &ctx) const {
            return formatter<string_view>::format(v.to_string(), ctx);
        }
    };
} // namespace fmt
