#include <xmlmap/types/value.h>
#include <xmlmap/types/visitor.h>
#include <xmlmap/util/string_utils.h>

#include <fmt/ranges.h>

#include <algorithm>
#include <stdexcept>

namespace xmlmap {

// ============================================================================
// Mapping
// ============================================================================

Mapping::Mapping(std::initializer_list<entry_type> entries) {
    for (const auto &[key, value] : entries) { insert_or_assign(key, value); }
}

size_t Mapping::size() const noexcept { return _entries.size(); }

bool Mapping::empty() const noexcept { return _entries.empty(); }

bool Mapping::contains(std::string_view key) const { return find(key) != nullptr; }

const Value *Mapping::find(std::string_view key) const {
    auto it = std::find_if(_entries.begin(), _entries.end(), [key](const entry_type &e) { return e.first == key; });
    return it == _entries.end() ? nullptr : &it->second;
}

const Value &Mapping::at(std::string_view key) const {
    if (auto value = find(key)) { return *value; }
    throw std::out_of_range(fmt::format("Mapping has no key '{}'", key));
}

void Mapping::insert_or_assign(std::string key, Value value) {
    auto it = std::find_if(_entries.begin(), _entries.end(), [&key](const entry_type &e) { return e.first == key; });
    if (it != _entries.end()) {
        it->second = std::move(value);
    } else {
        _entries.emplace_back(std::move(key), std::move(value));
    }
}

Mapping::const_iterator Mapping::begin() const noexcept { return _entries.begin(); }

Mapping::const_iterator Mapping::end() const noexcept { return _entries.end(); }

bool Mapping::operator==(const Mapping &other) const {
    if (size() != other.size()) { return false; }
    return std::all_of(_entries.begin(), _entries.end(), [&other](const entry_type &e) {
        auto value = other.find(e.first);
        return value != nullptr && *value == e.second;
    });
}

// ============================================================================
// Sequence
// ============================================================================

Sequence::Sequence(std::initializer_list<Value> items) : _items{items} {}

Sequence::Sequence(container_type items) : _items{std::move(items)} {}

size_t Sequence::size() const noexcept { return _items.size(); }

bool Sequence::empty() const noexcept { return _items.empty(); }

const Value &Sequence::operator[](size_t index) const { return _items.at(index); }

void Sequence::push_back(Value value) { _items.push_back(std::move(value)); }

Sequence::const_iterator Sequence::begin() const noexcept { return _items.begin(); }

Sequence::const_iterator Sequence::end() const noexcept { return _items.end(); }

bool Sequence::operator==(const Sequence &other) const { return _items == other._items; }

// ============================================================================
// Value
// ============================================================================

std::string_view to_string(ValueKind kind) noexcept {
    switch (kind) {
        case ValueKind::Null: return "null";
        case ValueKind::Bool: return "bool";
        case ValueKind::Int: return "int";
        case ValueKind::Float: return "float";
        case ValueKind::String: return "string";
        case ValueKind::Mapping: return "mapping";
        case ValueKind::Sequence: return "sequence";
        case ValueKind::Record: return "record";
    }
    return "unknown";
}

namespace {
    template<typename T>
    const T &checked_get(const Value::variant_type &data, ValueKind expected, ValueKind actual) {
        if (auto v = std::get_if<T>(&data)) { return *v; }
        throw_error<ValueTypeMismatch>("Expected a {} value, got: {}", to_string(expected), to_string(actual));
    }
} // namespace

bool Value::as_bool() const { return checked_get<bool>(_data, ValueKind::Bool, kind()); }

int64_t Value::as_int() const { return checked_get<int64_t>(_data, ValueKind::Int, kind()); }

double Value::as_float() const {
    // Integers widen so float processors accept whole numbers
    if (is_int()) { return static_cast<double>(std::get<int64_t>(_data)); }
    return checked_get<double>(_data, ValueKind::Float, kind());
}

const std::string &Value::as_string() const { return checked_get<std::string>(_data, ValueKind::String, kind()); }

const Mapping &Value::as_mapping() const { return checked_get<Mapping>(_data, ValueKind::Mapping, kind()); }

const Sequence &Value::as_sequence() const { return checked_get<Sequence>(_data, ValueKind::Sequence, kind()); }

const RecordInstance &Value::as_record() const {
    return checked_get<RecordInstance>(_data, ValueKind::Record, kind());
}

bool Value::is_empty() const noexcept {
    return std::visit(overloaded{
                          [](const std::monostate &) { return true; },
                          [](bool v) { return !v; },
                          [](int64_t v) { return v == 0; },
                          [](double v) { return v == 0.0; },
                          [](const std::string &v) { return v.empty(); },
                          [](const Mapping &v) { return v.empty(); },
                          [](const Sequence &v) { return v.empty(); },
                          [](const RecordInstance &) { return false; }
                      }, _data);
}

bool Value::operator==(const Value &other) const { return _data == other._data; }

std::string Value::to_string() const {
    return std::visit(overloaded{
                          [](const std::monostate &) -> std::string { return "null"; },
                          [](bool v) { return xmlmap::to_string(v); },
                          [](int64_t v) { return xmlmap::to_string(v); },
                          [](double v) { return xmlmap::to_string(v); },
                          [](const std::string &v) { return fmt::format("'{}'", v); },
                          [](const Mapping &v) {
                              std::vector<std::string> entries;
                              entries.reserve(v.size());
                              for (const auto &[key, value] : v) {
                                  entries.push_back(fmt::format("'{}': {}", key, value.to_string()));
                              }
                              return fmt::format("{{{}}}", fmt::join(entries, ", "));
                          },
                          [](const Sequence &v) {
                              std::vector<std::string> items;
                              items.reserve(v.size());
                              for (const auto &item : v) { items.push_back(item.to_string()); }
                              return fmt::format("[{}]", fmt::join(items, ", "));
                          },
                          [](const RecordInstance &v) { return v.to_string(); }
                      }, _data);
}

} // namespace xmlmap
