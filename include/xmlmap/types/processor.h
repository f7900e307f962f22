#pragma once

/**
 * @file processor.h
 * @brief Declarative description of how a value maps onto an XML document.
 *
 * A processor tree is built once with the factory functions below and then used, unchanged, for any number of
 * decode and encode calls. Every processor carries the same metadata:
 * - path: the element selector, relative to the parent processor's element
 * - alias: the key of the value in the enclosing Mapping or record
 * - required: absence is an error (MissingValue) instead of producing a default
 * - default_value: used when an optional value is absent, Null when there is none
 * - omit_empty: skip writing an optional value that is empty (see Value::is_empty)
 * - hooks: user callbacks run after decode and before encode
 *
 * The kind specific part is a closed variant over PrimitiveProcessor, DictionaryProcessor, ArrayProcessor and
 * RecordProcessor, dispatched with std::visit.
 *
 * Usage:
 * @code
 * auto author = dictionary("author", {
 *     string("name"),
 *     integer("birth-year"),
 *     array(dictionary("book", {string(".", {.attribute = "title"}), integer(".", {.attribute = "published"})}),
 *           {.alias = "books", .nested = "books"}),
 * });
 * @endcode
 *
 * All declaration mistakes (bad selectors, omit_empty on a required value, unknown record fields, ...) are reported
 * eagerly with InvalidRootConfiguration.
 */

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/xmlmap_forward_declarations.h>
#include <xmlmap/types/hooks.h>
#include <xmlmap/types/path.h>
#include <xmlmap/types/primitive_codec.h>
#include <xmlmap/types/record.h>
#include <xmlmap/types/value.h>

#include <fmt/format.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace xmlmap {

// ============================================================================
// Declaration options
// ============================================================================

struct PrimitiveOptions {
    /// Read / write this attribute of the selected element instead of its text
    std::optional<std::string> attribute;
    bool required{true};
    std::optional<std::string> alias;
    /// Replaces the typed default of the factory (false, 0, 0.0, ""), Value{} for no default at all
    std::optional<Value> default_value;
    bool omit_empty{false};
    Hooks hooks;
    /// String values only
    bool strip_whitespace{true};
};

struct AggregateOptions {
    bool required{true};
    std::optional<std::string> alias;
    std::optional<Value> default_value;
    bool omit_empty{false};
    Hooks hooks;
};

struct ArrayOptions {
    std::optional<std::string> alias;
    /// Selector of the container element, the items are embedded in the parent element when not set
    std::optional<std::string> nested;
    /// Defaults to the item processor's required flag
    std::optional<bool> required;
    /// Nested, optional arrays only
    bool omit_empty{false};
    Hooks hooks;
};

// ============================================================================
// Processor kinds
// ============================================================================

struct PrimitiveProcessor {
    PrimitiveType type;
    std::optional<std::string> attribute;
    bool strip_whitespace{true};
};

struct DictionaryProcessor {
    std::vector<processor_s_ptr> children;
};

struct RecordProcessor {
    std::vector<processor_s_ptr> children;
    record_adapter_s_ptr adapter;
};

struct ArrayProcessor {
    processor_s_ptr item;
    bool nested{false};

    [[nodiscard]] bool is_nested() const noexcept { return nested; }
};

class XMLMAP_EXPORT Processor {
public:
    using kind_type = std::variant<PrimitiveProcessor, DictionaryProcessor, ArrayProcessor, RecordProcessor>;

    Processor(PathExpression path, std::string alias, bool required, Value default_value, bool omit_empty, Hooks hooks,
              kind_type kind);

    [[nodiscard]] const PathExpression &path() const noexcept { return _path; }
    [[nodiscard]] const std::string &alias() const noexcept { return _alias; }
    [[nodiscard]] bool required() const noexcept { return _required; }
    [[nodiscard]] const Value &default_value() const noexcept { return _default_value; }
    [[nodiscard]] bool omit_empty() const noexcept { return _omit_empty; }
    [[nodiscard]] const Hooks &hooks() const noexcept { return _hooks; }
    [[nodiscard]] const kind_type &kind() const noexcept { return _kind; }

    template<typename T>
    [[nodiscard]] bool is() const noexcept { return std::holds_alternative<T>(_kind); }

    template<typename T>
    [[nodiscard]] const T &as() const { return std::get<T>(_kind); }

    /// True for embedded arrays, which have no element of their own
    [[nodiscard]] bool is_embedded_array() const noexcept;

    /// Short description used by the trace and error messages, e.g. "integer('birth-year')"
    [[nodiscard]] std::string describe() const;

private:
    PathExpression _path;
    std::string _alias;
    bool _required;
    Value _default_value;
    bool _omit_empty;
    Hooks _hooks;
    kind_type _kind;
};

/**
 * Only dictionaries, records and nested arrays own an element that can be the document root.
 * @throws InvalidRootConfiguration for primitives, embedded arrays and "." selectors
 */
XMLMAP_EXPORT void check_root_processor(const Processor &processor);

// ============================================================================
// Factories
// ============================================================================

XMLMAP_EXPORT processor_s_ptr boolean(std::string_view path, PrimitiveOptions options = {});

XMLMAP_EXPORT processor_s_ptr integer(std::string_view path, PrimitiveOptions options = {});

XMLMAP_EXPORT processor_s_ptr floating_point(std::string_view path, PrimitiveOptions options = {});

XMLMAP_EXPORT processor_s_ptr string(std::string_view path, PrimitiveOptions options = {});

XMLMAP_EXPORT processor_s_ptr dictionary(std::string_view path, std::vector<processor_s_ptr> children,
                                         AggregateOptions options = {});

XMLMAP_EXPORT processor_s_ptr array(processor_s_ptr item, ArrayOptions options = {});

/// Record processor over any adapter, user_object and named_tuple are the typed front ends
XMLMAP_EXPORT processor_s_ptr record(std::string_view path, record_adapter_s_ptr adapter,
                                     std::vector<processor_s_ptr> children, AggregateOptions options = {});

/// Decoded values compare with T's operator==, a T without one only equals the very same record instance
template<typename T>
processor_s_ptr user_object(std::string_view path, const UserObjectAdapter<T> &fields,
                            std::vector<processor_s_ptr> children, AggregateOptions options = {}) {
    return record(path, std::make_shared<UserObjectAdapter<T> >(fields), std::move(children), std::move(options));
}

/// Child processors map onto the tuple elements in order, their aliases name the fields
template<typename... Ts>
processor_s_ptr named_tuple(std::string_view path, std::vector<processor_s_ptr> children,
                            AggregateOptions options = {}) {
    std::vector<std::string> field_names;
    field_names.reserve(children.size());
    for (const auto &child : children) {
        if (!child) { throw_error<InvalidRootConfiguration>("Named tuple '{}' has a null child processor", path); }
        field_names.push_back(child->alias());
    }
    return record(path, std::make_shared<NamedTupleAdapter<Ts...> >(std::move(field_names)), std::move(children),
                  std::move(options));
}

} // namespace xmlmap

namespace fmt {
    template<>
    struct formatter<xmlmap::Processor> : formatter<string_view> {
        template<typename FormatContext>
        auto format(const xmlmap::Processor &p, FormatContext &ctx) const {
            return formatter<string_view>::format(p.describe(), ctx);
        }
    };
} // namespace fmt
