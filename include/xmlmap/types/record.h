#pragma once

/**
 * @file record.h
 * @brief Adapters that let record processors build and read user types.
 *
 * A record processor decodes exactly like a dictionary, but instead of producing a Mapping it asks a RecordAdapter
 * to construct an empty object and then assigns each decoded child value to the field named by the child's alias.
 * Encoding reads the fields back through the same adapter.
 *
 * Two adapters are provided:
 * - UserObjectAdapter<T>: binds names to data members of a default constructible type T.
 * - NamedTupleAdapter<Ts...>: maps the child processors positionally onto a std::tuple<Ts...>.
 *
 * Field values are converted with ValueConverter<T>, which can be specialised for additional field types.
 *
 * Usage:
 * @code
 * struct Book {
 *     std::string title;
 *     int year{};
 *     bool operator==(const Book &) const = default;
 * };
 *
 * auto fields = object_fields<Book>().field("title", &Book::title).field("year", &Book::year);
 * @endcode
 */

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/types/value.h>
#include <xmlmap/util/errors.h>

#include <fmt/ranges.h>

#include <algorithm>
#include <concepts>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <typeinfo>
#include <utility>
#include <vector>

namespace xmlmap {

/**
 * @brief Construct / assign / read capability used by the record processors.
 *
 * Adapters are immutable once handed to a processor and are shared by every decode and encode call.
 */
struct XMLMAP_EXPORT RecordAdapter {
    virtual ~RecordAdapter() = default;

    /// A fresh record with every field at its default
    [[nodiscard]] virtual RecordInstance construct() const = 0;

    /// Null assigned to a field that cannot hold it leaves the field unchanged
    virtual void assign_field(RecordInstance &record, std::string_view name, const Value &value) const = 0;

    [[nodiscard]] virtual Value read_field(const RecordInstance &record, std::string_view name) const = 0;

    [[nodiscard]] virtual bool has_field(std::string_view name) const = 0;

    [[nodiscard]] virtual std::string type_name() const = 0;

    /**
     * Called once when the record processor is declared, with the aliases of its children in declaration order.
     * @throws InvalidRootConfiguration if a child has no matching field
     */
    virtual void check_fields(const std::vector<std::string> &field_names) const;
};

// ============================================================================
// Field conversion
// ============================================================================

// Anything not covered below is treated as a nested record stored by value.
template<typename T>
struct ValueConverter {
    static T from_value(const Value &value) { return value.as_record().as<T>(); }
    static Value to_value(const T &value) { return RecordInstance::make(value); }
};

template<>
struct ValueConverter<Value> {
    static Value from_value(const Value &value) { return value; }
    static Value to_value(const Value &value) { return value; }
};

template<>
struct ValueConverter<bool> {
    static bool from_value(const Value &value) { return value.as_bool(); }
    static Value to_value(bool value) { return value; }
};

template<std::integral T>
struct ValueConverter<T> {
    static T from_value(const Value &value) {
        auto v = value.as_int();
        if (!std::in_range<T>(v)) {
            throw_error<ValueTypeMismatch>("Integer value {} is out of range for the record field", v);
        }
        return static_cast<T>(v);
    }

    static Value to_value(T value) { return Value{value}; }
};

template<std::floating_point T>
struct ValueConverter<T> {
    static T from_value(const Value &value) { return static_cast<T>(value.as_float()); }
    static Value to_value(T value) { return static_cast<double>(value); }
};

template<>
struct ValueConverter<std::string> {
    static std::string from_value(const Value &value) { return value.as_string(); }
    static Value to_value(const std::string &value) { return value; }
};

template<typename T>
struct ValueConverter<std::optional<T> > {
    static std::optional<T> from_value(const Value &value) {
        if (value.is_null()) { return std::nullopt; }
        return ValueConverter<T>::from_value(value);
    }

    static Value to_value(const std::optional<T> &value) {
        if (!value) { return {}; }
        return ValueConverter<T>::to_value(*value);
    }
};

template<typename T>
struct ValueConverter<std::vector<T> > {
    static std::vector<T> from_value(const Value &value) {
        std::vector<T> result;
        result.reserve(value.as_sequence().size());
        for (const auto &item : value.as_sequence()) { result.push_back(ValueConverter<T>::from_value(item)); }
        return result;
    }

    static Value to_value(const std::vector<T> &value) {
        Sequence result;
        for (const auto &item : value) { result.push_back(ValueConverter<T>::to_value(item)); }
        return result;
    }
};

namespace detail {
    template<typename T>
    inline constexpr bool accepts_null = false;

    template<typename T>
    inline constexpr bool accepts_null<std::optional<T> > = true;

    template<>
    inline constexpr bool accepts_null<Value> = true;

    template<typename F>
    void assign_converted(F &target, const Value &value) {
        if (value.is_null() && !accepts_null<F>) { return; }
        target = ValueConverter<F>::from_value(value);
    }
} // namespace detail

// ============================================================================
// User objects
// ============================================================================

template<typename T>
class UserObjectAdapter final : public RecordAdapter {
    static_assert(std::is_default_constructible_v<T>, "user objects are built from a default constructed value");

    struct FieldBinding {
        std::string name;
        std::function<void(T &, const Value &)> assign;
        std::function<Value(const T &)> read;
    };

public:
    template<typename F>
    UserObjectAdapter &field(std::string name, F T::*member) {
        if (has_field(name)) {
            throw_error<InvalidRootConfiguration>("Field '{}' is bound twice on record type '{}'", name, type_name());
        }
        _fields.push_back(FieldBinding{
            std::move(name),
            [member](T &object, const Value &value) { detail::assign_converted(object.*member, value); },
            [member](const T &object) { return ValueConverter<F>::to_value(object.*member); }
        });
        return *this;
    }

    [[nodiscard]] RecordInstance construct() const override { return RecordInstance::make(T{}); }

    void assign_field(RecordInstance &record, std::string_view name, const Value &value) const override {
        binding(name).assign(record.as_mutable<T>(), value);
    }

    [[nodiscard]] Value read_field(const RecordInstance &record, std::string_view name) const override {
        return binding(name).read(record.as<T>());
    }

    [[nodiscard]] bool has_field(std::string_view name) const override {
        return std::ranges::any_of(_fields, [name](const FieldBinding &f) { return f.name == name; });
    }

    [[nodiscard]] std::string type_name() const override { return typeid(T).name(); }

private:
    const FieldBinding &binding(std::string_view name) const {
        auto it = std::ranges::find_if(_fields, [name](const FieldBinding &f) { return f.name == name; });
        if (it == _fields.end()) {
            throw_error<InvalidRootConfiguration>("Record type '{}' has no field named '{}'", type_name(), name);
        }
        return *it;
    }

    std::vector<FieldBinding> _fields;
};

/// Starts a field binding chain for T
template<typename T>
UserObjectAdapter<T> object_fields() { return {}; }

// ============================================================================
// Named tuples
// ============================================================================

template<typename... Ts>
class NamedTupleAdapter final : public RecordAdapter {
public:
    using tuple_type = std::tuple<Ts...>;

    explicit NamedTupleAdapter(std::vector<std::string> field_names) : _field_names{std::move(field_names)} {
    }

    [[nodiscard]] RecordInstance construct() const override { return RecordInstance::make(tuple_type{}); }

    void assign_field(RecordInstance &record, std::string_view name, const Value &value) const override {
        auto &tuple = record.as_mutable<tuple_type>();
        visit_index(index_of(name), [&](auto &element) { detail::assign_converted(element, value); }, tuple);
    }

    [[nodiscard]] Value read_field(const RecordInstance &record, std::string_view name) const override {
        Value result;
        const auto &tuple = record.as<tuple_type>();
        visit_index(index_of(name), [&](const auto &element) {
            result = ValueConverter<std::remove_cvref_t<decltype(element)> >::to_value(element);
        }, tuple);
        return result;
    }

    [[nodiscard]] bool has_field(std::string_view name) const override {
        return std::ranges::find(_field_names, name) != _field_names.end();
    }

    [[nodiscard]] std::string type_name() const override {
        return fmt::format("named_tuple({})", fmt::join(_field_names, ", "));
    }

    void check_fields(const std::vector<std::string> &field_names) const override {
        if (field_names.size() != sizeof...(Ts)) {
            throw_error<InvalidRootConfiguration>("Named tuple with {} fields declared with {} child processors",
                                                  sizeof...(Ts), field_names.size());
        }
        RecordAdapter::check_fields(field_names);
    }

private:
    size_t index_of(std::string_view name) const {
        auto it = std::ranges::find(_field_names, name);
        if (it == _field_names.end()) {
            throw_error<InvalidRootConfiguration>("{} has no field named '{}'", type_name(), name);
        }
        return static_cast<size_t>(std::distance(_field_names.begin(), it));
    }

    template<typename Fn, typename Tuple>
    static void visit_index(size_t index, Fn &&fn, Tuple &tuple) {
        [&]<size_t... Is>(std::index_sequence<Is...>) {
            ((Is == index ? (void) fn(std::get<Is>(tuple)) : void()), ...);
        }(std::index_sequence_for<Ts...>{});
    }

    std::vector<std::string> _field_names;
};

} // namespace xmlmap
