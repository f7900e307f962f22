#include <xmlmap/types/processor.h>
#include <xmlmap/types/visitor.h>

#include <fmt/ranges.h>

#include <cstdio>
#include <set>

namespace xmlmap {

    Processor::Processor(PathExpression path, std::string alias, bool required, Value default_value, bool omit_empty,
                         Hooks hooks, kind_type kind)
        : _path{std::move(path)}, _alias{std::move(alias)}, _required{required},
          _default_value{std::move(default_value)}, _omit_empty{omit_empty}, _hooks{std::move(hooks)},
          _kind{std::move(kind)} {
    }

    bool Processor::is_embedded_array() const noexcept {
        auto array = std::get_if<ArrayProcessor>(&_kind);
        return array != nullptr && !array->is_nested();
    }

    std::string Processor::describe() const {
        return std::visit(overloaded{
                              [this](const PrimitiveProcessor &p) {
                                  if (p.attribute) {
                                      return fmt::format("{}('{}', attribute='{}')", to_string(p.type),
                                                         _path.to_string(), *p.attribute);
                                  }
                                  return fmt::format("{}('{}')", to_string(p.type), _path.to_string());
                              },
                              [this](const DictionaryProcessor &) {
                                  return fmt::format("dictionary('{}')", _path.to_string());
                              },
                              [this](const RecordProcessor &r) {
                                  return fmt::format("record('{}', {})", _path.to_string(), r.adapter->type_name());
                              },
                              [this](const ArrayProcessor &a) {
                                  if (a.is_nested()) {
                                      return fmt::format("array('{}', nested, item={})", _path.to_string(),
                                                         a.item->describe());
                                  }
                                  return fmt::format("array(item={})", a.item->describe());
                              }
                          }, _kind);
    }

    void check_root_processor(const Processor &processor) {
        if (processor.is<PrimitiveProcessor>() || processor.is_embedded_array()) {
            throw_error<InvalidRootConfiguration>("{} cannot be used as the root processor", processor.describe());
        }
        if (processor.path().is_self()) {
            throw_error<InvalidRootConfiguration>("Root processor {} must name the root element",
                                                  processor.describe());
        }
    }

    namespace {
        void warn(std::string_view message) { fmt::print(stderr, "Warning: {}\n", message); }

        std::string resolve_alias(const std::optional<std::string> &alias, const std::optional<std::string> &attribute,
                                  const PathExpression &path) {
            if (alias) { return *alias; }
            if (attribute) { return *attribute; }
            auto name = path.last_name();
            if (name.empty()) {
                throw_error<InvalidRootConfiguration>(
                    "Processor at '{}' needs an alias (or an attribute) to name its value", path.to_string());
            }
            return name;
        }

        void check_omit_empty(bool required, bool omit_empty, const PathExpression &path) {
            if (required && omit_empty) {
                throw_error<InvalidRootConfiguration>("omit_empty requires required=false, at '{}'", path.to_string());
            }
        }

        // Defaults only apply to optional values, a default on a required value is dropped
        Value optional_default(bool required, std::optional<Value> declared, Value fallback, const PathExpression &path,
                               bool explicit_default) {
            if (required) {
                if (explicit_default) {
                    warn(fmt::format("default ignored on required processor at '{}'", path.to_string()));
                }
                return {};
            }
            return declared ? std::move(*declared) : std::move(fallback);
        }

        processor_s_ptr make_primitive(PrimitiveType type, Value typed_default, std::string_view path_text,
                                       PrimitiveOptions options) {
            auto path = PathExpression::parse(path_text);
            if (options.attribute && options.attribute->empty()) {
                throw_error<InvalidRootConfiguration>("Attribute name must not be empty, at '{}'", path_text);
            }
            auto alias = resolve_alias(options.alias, options.attribute, path);
            check_omit_empty(options.required, options.omit_empty, path);

            bool explicit_default = options.default_value.has_value();
            auto default_value = optional_default(options.required, std::move(options.default_value),
                                                  std::move(typed_default), path, explicit_default);
            if (!default_value.is_null()) {
                try {
                    (void) serialize_primitive(default_value, type);
                } catch (const InvalidPrimitiveValue &e) {
                    throw_error<InvalidRootConfiguration>("Default for '{}' does not match its type: {}", path_text,
                                                          e.detail());
                }
            }

            return std::make_shared<const Processor>(
                std::move(path), std::move(alias), options.required, std::move(default_value), options.omit_empty,
                std::move(options.hooks),
                PrimitiveProcessor{type, std::move(options.attribute), options.strip_whitespace});
        }

        std::vector<std::string> child_aliases(std::string_view path, const std::vector<processor_s_ptr> &children) {
            std::vector<std::string> aliases;
            std::set<std::string> seen;
            for (const auto &child : children) {
                if (!child) { throw_error<InvalidRootConfiguration>("Null child processor under '{}'", path); }
                if (!seen.insert(child->alias()).second) {
                    throw_error<InvalidRootConfiguration>("Duplicate alias '{}' under '{}'", child->alias(), path);
                }
                aliases.push_back(child->alias());
            }
            return aliases;
        }

        struct AggregateCommon {
            PathExpression path;
            std::string alias;
            Value default_value;
        };

        AggregateCommon make_aggregate_common(std::string_view path_text, AggregateOptions &options,
                                              ValueKind default_kind) {
            auto path = PathExpression::parse(path_text);
            auto alias = resolve_alias(options.alias, std::nullopt, path);
            check_omit_empty(options.required, options.omit_empty, path);

            bool explicit_default = options.default_value.has_value();
            auto default_value = optional_default(options.required, std::move(options.default_value), Value{}, path,
                                                  explicit_default);
            if (!default_value.is_null() && default_value.kind() != default_kind) {
                throw_error<InvalidRootConfiguration>("Default for '{}' must be a {}, got a {}", path_text,
                                                      to_string(default_kind), to_string(default_value.kind()));
            }
            return AggregateCommon{std::move(path), std::move(alias), std::move(default_value)};
        }
    } // namespace

    processor_s_ptr boolean(std::string_view path, PrimitiveOptions options) {
        return make_primitive(PrimitiveType::Boolean, false, path, std::move(options));
    }

    processor_s_ptr integer(std::string_view path, PrimitiveOptions options) {
        return make_primitive(PrimitiveType::Integer, 0, path, std::move(options));
    }

    processor_s_ptr floating_point(std::string_view path, PrimitiveOptions options) {
        return make_primitive(PrimitiveType::FloatingPoint, 0.0, path, std::move(options));
    }

    processor_s_ptr string(std::string_view path, PrimitiveOptions options) {
        return make_primitive(PrimitiveType::String, "", path, std::move(options));
    }

    processor_s_ptr dictionary(std::string_view path, std::vector<processor_s_ptr> children, AggregateOptions options) {
        auto common = make_aggregate_common(path, options, ValueKind::Mapping);
        (void) child_aliases(path, children);
        return std::make_shared<const Processor>(
            std::move(common.path), std::move(common.alias), options.required, std::move(common.default_value),
            options.omit_empty, std::move(options.hooks), DictionaryProcessor{std::move(children)});
    }

    processor_s_ptr record(std::string_view path, record_adapter_s_ptr adapter, std::vector<processor_s_ptr> children,
                           AggregateOptions options) {
        if (!adapter) { throw_error<InvalidRootConfiguration>("Record processor '{}' has no adapter", path); }
        auto common = make_aggregate_common(path, options, ValueKind::Record);
        adapter->check_fields(child_aliases(path, children));
        return std::make_shared<const Processor>(
            std::move(common.path), std::move(common.alias), options.required, std::move(common.default_value),
            options.omit_empty, std::move(options.hooks), RecordProcessor{std::move(children), std::move(adapter)});
    }

    processor_s_ptr array(processor_s_ptr item, ArrayOptions options) {
        if (!item) { throw_error<InvalidRootConfiguration>("Array declared without an item processor"); }
        if (item->is_embedded_array()) {
            throw_error<InvalidRootConfiguration>("Item of an array must not be an embedded array: {}",
                                                  item->describe());
        }
        if (item->path().is_self()) {
            throw_error<InvalidRootConfiguration>("Array items need a named element, got '{}'",
                                                  item->path().to_string());
        }

        bool required = options.required.value_or(item->required());
        bool nested = options.nested.has_value();
        auto path = nested ? PathExpression::parse(*options.nested) : item->path();

        if (options.omit_empty && (required || !nested)) {
            throw_error<InvalidRootConfiguration>("omit_empty requires an optional nested array, at '{}'",
                                                  path.to_string());
        }

        std::string alias;
        if (options.alias) {
            alias = *options.alias;
        } else if (nested && !path.last_name().empty()) {
            alias = path.last_name();
        } else {
            alias = item->alias();
        }

        return std::make_shared<const Processor>(std::move(path), std::move(alias), required, Value{},
                                                 options.omit_empty, std::move(options.hooks),
                                                 ArrayProcessor{std::move(item), nested});
    }

} // namespace xmlmap
