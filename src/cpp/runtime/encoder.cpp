#include <xmlmap/runtime/encoder.h>
#include <xmlmap/types/visitor.h>

namespace xmlmap {

    void Encoder::encode_root(const Processor &processor, const Value &value, XmlDocument &document) {
        check_root_processor(processor);
        auto steps = processor.path().named_steps();

        auto location = _state.enter(processor.path().element_path());
        notify_before(processor, value);

        auto element = document.new_root(steps.front());
        for (size_t i = 1; i < steps.size(); ++i) { element = element.child_or_append(steps[i]); }

        // An optional root without a value still produces its (empty) root element
        if (value.is_null()) {
            if (processor.required()) { missing(processor); }
        } else {
            write_at(processor, apply_before_encode(processor.hooks(), _state.view(), value), element);
        }
        notify_after(processor);
    }

    void Encoder::encode(const Processor &processor, const Value *value, Element parent) {
        bool embedded = processor.is_embedded_array();
        auto location = _state.enter(embedded ? std::string{} : processor.path().element_path());
        Value current = value != nullptr ? *value : Value{};
        notify_before(processor, current);

        // An optional dictionary with no entries is what decoding an absent one produces
        bool absent = current.is_null() ||
                      (!processor.required() && processor.is<DictionaryProcessor>() && current.is_mapping() &&
                       current.as_mapping().empty());
        if (absent) {
            if (processor.required()) { missing(processor); }
            if (!processor.omit_empty()) {
                if (processor.is<PrimitiveProcessor>() && !processor.default_value().is_null()) {
                    write_at(processor, processor.default_value(), processor.path().resolve_or_create(parent));
                } else if (processor.is<ArrayProcessor>() && !embedded) {
                    (void) processor.path().resolve_or_create(parent);
                }
            }
            notify_after(processor);
            return;
        }

        current = apply_before_encode(processor.hooks(), _state.view(), std::move(current));
        if (processor.omit_empty() && current.is_empty()) {
            notify_after(processor);
            return;
        }

        if (embedded) {
            write_items(processor, processor.as<ArrayProcessor>(), current, parent);
        } else {
            write_at(processor, current, processor.path().resolve_or_create(parent));
        }
        notify_after(processor);
    }

    void Encoder::write_at(const Processor &processor, const Value &value, Element element) {
        std::visit(overloaded{
                       [&](const PrimitiveProcessor &primitive) {
                           std::string text;
                           try {
                               text = serialize_primitive(value, primitive.type);
                           } catch (const InvalidPrimitiveValue &e) {
                               throw InvalidPrimitiveValue{e.detail(), _state.location_string(), e.raw_text()};
                           }
                           if (primitive.attribute) {
                               element.set_attribute(*primitive.attribute, text);
                           } else {
                               element.set_text(text);
                           }
                       },
                       [&](const DictionaryProcessor &dictionary) {
                           if (!value.is_mapping()) {
                               _state.fail<ValueTypeMismatch>("Expected a mapping value for \"{}\", got: {}",
                                                              processor.alias(), to_string(value.kind()));
                           }
                           const auto &mapping = value.as_mapping();
                           for (const auto &child : dictionary.children) {
                               encode(*child, mapping.find(child->alias()), element);
                           }
                       },
                       [&](const RecordProcessor &record) {
                           if (!value.is_record()) {
                               _state.fail<ValueTypeMismatch>("Expected a record value for \"{}\", got: {}",
                                                              processor.alias(), to_string(value.kind()));
                           }
                           for (const auto &child : record.children) {
                               Value field;
                               try {
                                   field = record.adapter->read_field(value.as_record(), child->alias());
                               } catch (const ValueTypeMismatch &e) {
                                   if (e.has_location()) { throw; }
                                   throw ValueTypeMismatch{e.detail(), _state.location_string()};
                               }
                               encode(*child, &field, element);
                           }
                       },
                       [&](const ArrayProcessor &array) {
                           // element is the container of a nested array
                           write_items(processor, array, value, element);
                       }
                   }, processor.kind());
    }

    void Encoder::write_items(const Processor &processor, const ArrayProcessor &array, const Value &value,
                              Element items_parent) {
        if (!value.is_sequence()) {
            _state.fail<ValueTypeMismatch>("Expected a sequence value for \"{}\", got: {}", processor.alias(),
                                           to_string(value.kind()));
        }
        const auto &items = value.as_sequence();
        if (items.empty()) {
            if (processor.required()) { missing(processor); }
            return;
        }

        const auto &item = *array.item;
        auto prefix = item.path().parent();
        auto item_name = item.path().last_name();
        auto item_path = item.path().element_path();
        for (size_t i = 0; i < items.size(); ++i) {
            auto location = _state.enter(item_path, i);
            notify_before(item, items[i]);
            auto element = prefix.resolve_or_create(items_parent).append_child(item_name);

            // Items are never omitted, a missing item falls back to the item default
            if (items[i].is_null()) {
                if (item.required()) { missing(item); }
                if (!item.default_value().is_null()) { write_at(item, item.default_value(), element); }
            } else {
                write_at(item, apply_before_encode(item.hooks(), _state.view(), items[i]), element);
            }
            notify_after(item);
        }
    }

    void Encoder::missing(const Processor &processor) const {
        _state.fail<MissingValue>("Missing required value: \"{}\"", processor.alias());
    }

    void Encoder::notify_before(const Processor &processor, const Value &value) {
        if (auto observer = _state.observer()) { observer->on_before_encode(processor, _state.view(), value); }
    }

    void Encoder::notify_after(const Processor &processor) {
        if (auto observer = _state.observer()) { observer->on_after_encode(processor, _state.view()); }
    }

} // namespace xmlmap
