#include <xmlmap/runtime/decoder.h>
#include <xmlmap/types/visitor.h>

namespace xmlmap {

    Value Decoder::decode_root(const Processor &processor, const Element &root) {
        check_root_processor(processor);
        auto steps = processor.path().named_steps();

        auto location = _state.enter(processor.path().element_path());
        notify_before(processor);

        std::optional<Element> element;
        if (root && root.name() == steps.front()) {
            element = root;
            for (size_t i = 1; i < steps.size() && element; ++i) { element = element->child(steps[i]); }
        }

        auto result = element ? read_present(processor, *element) : absent(processor);
        notify_after(processor, result);
        return result;
    }

    Value Decoder::decode(const Processor &processor, const Element &context) {
        bool embedded = processor.is_embedded_array();
        auto location = _state.enter(embedded ? std::string{} : processor.path().element_path());
        notify_before(processor);

        Value result;
        if (embedded) {
            // Items sit directly in the context element, there is no element of our own to be absent
            result = apply_after_decode(processor.hooks(), _state.view(),
                                        read_items(processor, processor.as<ArrayProcessor>(), context));
        } else if (auto element = processor.path().resolve(context)) {
            result = read_present(processor, *element);
        } else {
            result = absent(processor);
        }

        notify_after(processor, result);
        return result;
    }

    Value Decoder::read_present(const Processor &processor, const Element &element) {
        auto value = read_at(processor, element);
        if (!value) { return absent(processor); }
        return apply_after_decode(processor.hooks(), _state.view(), std::move(*value));
    }

    std::optional<Value> Decoder::read_at(const Processor &processor, const Element &element) {
        return std::visit(overloaded{
                              [&](const PrimitiveProcessor &primitive) -> std::optional<Value> {
                                  std::optional<std::string> raw;
                                  if (primitive.attribute) {
                                      raw = element.attribute(*primitive.attribute);
                                  } else {
                                      // A present element without character data holds the empty string
                                      raw = element.text().value_or(std::string{});
                                  }
                                  if (!raw) { return std::nullopt; }

                                  try {
                                      return parse_primitive(*raw, primitive.type, primitive.strip_whitespace);
                                  } catch (const InvalidPrimitiveValue &e) {
                                      throw InvalidPrimitiveValue{e.detail(), _state.location_string(), e.raw_text()};
                                  }
                              },
                              [&](const DictionaryProcessor &dictionary) -> std::optional<Value> {
                                  Mapping result;
                                  for (const auto &child : dictionary.children) {
                                      result.insert_or_assign(child->alias(), decode(*child, element));
                                  }
                                  return Value{std::move(result)};
                              },
                              [&](const RecordProcessor &record) -> std::optional<Value> {
                                  auto result = record.adapter->construct();
                                  for (const auto &child : record.children) {
                                      auto field = decode(*child, element);
                                      auto location = _state.enter(child->path().element_path());
                                      try {
                                          record.adapter->assign_field(result, child->alias(), field);
                                      } catch (const ValueTypeMismatch &e) {
                                          if (e.has_location()) { throw; }
                                          throw ValueTypeMismatch{e.detail(), _state.location_string()};
                                      }
                                  }
                                  return Value{std::move(result)};
                              },
                              [&](const ArrayProcessor &array) -> std::optional<Value> {
                                  // element is the container of a nested array
                                  return read_items(processor, array, element);
                              }
                          }, processor.kind());
    }

    Value Decoder::read_items(const Processor &processor, const ArrayProcessor &array, const Element &items_parent) {
        const auto &item = *array.item;
        std::vector<Element> elements;
        if (auto parent = item.path().parent().resolve(items_parent)) {
            elements = parent->children(item.path().last_name());
        }

        if (elements.empty() && processor.required()) {
            _state.fail<MissingValue>("Missing required array: \"{}\"", processor.alias());
        }

        Sequence result;
        auto item_path = item.path().element_path();
        for (size_t i = 0; i < elements.size(); ++i) {
            auto location = _state.enter(item_path, i);
            notify_before(item);
            auto value = read_present(item, elements[i]);
            notify_after(item, value);
            result.push_back(std::move(value));
        }
        return Value{std::move(result)};
    }

    Value Decoder::absent(const Processor &processor) {
        return std::visit(overloaded{
                              [&](const PrimitiveProcessor &primitive) {
                                  if (processor.required()) {
                                      if (primitive.attribute) {
                                          _state.fail<MissingValue>("Missing required attribute: \"{}\"",
                                                                    *primitive.attribute);
                                      }
                                      _state.fail<MissingValue>("Missing required element: \"{}\"",
                                                                processor.path().last_name());
                                  }
                                  return processor.default_value();
                              },
                              [&](const DictionaryProcessor &) {
                                  if (processor.required()) {
                                      _state.fail<MissingValue>("Missing required aggregate: \"{}\"",
                                                                processor.path().last_name());
                                  }
                                  return processor.default_value().is_null() ? Value{Mapping{}}
                                                                             : processor.default_value();
                              },
                              [&](const RecordProcessor &) {
                                  if (processor.required()) {
                                      _state.fail<MissingValue>("Missing required aggregate: \"{}\"",
                                                                processor.path().last_name());
                                  }
                                  return processor.default_value();
                              },
                              [&](const ArrayProcessor &) {
                                  if (processor.required()) {
                                      _state.fail<MissingValue>("Missing required array: \"{}\"", processor.alias());
                                  }
                                  return Value{Sequence{}};
                              }
                          }, processor.kind());
    }

    void Decoder::notify_before(const Processor &processor) {
        if (auto observer = _state.observer()) { observer->on_before_decode(processor, _state.view()); }
    }

    void Decoder::notify_after(const Processor &processor, const Value &value) {
        if (auto observer = _state.observer()) { observer->on_after_decode(processor, _state.view(), value); }
    }

} // namespace xmlmap
