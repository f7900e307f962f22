#include <xmlmap/document/element.h>

namespace xmlmap {

    namespace {
        // pugixml takes null terminated names
        std::string c_name(std::string_view name) { return std::string{name}; }

        bool is_text(const pugi::xml_node &node) {
            return node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata;
        }
    } // namespace

    std::optional<Element> Element::child(std::string_view name) const {
        auto node = _node.child(c_name(name).c_str());
        if (!node) { return std::nullopt; }
        return Element{node};
    }

    std::vector<Element> Element::children(std::string_view name) const {
        std::vector<Element> result;
        for (auto node : _node.children(c_name(name).c_str())) { result.emplace_back(node); }
        return result;
    }

    std::optional<std::string> Element::attribute(std::string_view name) const {
        auto attr = _node.attribute(c_name(name).c_str());
        if (!attr) { return std::nullopt; }
        return std::string{attr.value()};
    }

    std::optional<std::string> Element::text() const {
        std::string result;
        bool found{false};
        for (auto node : _node.children()) {
            if (is_text(node)) {
                result += node.value();
                found = true;
            }
        }
        if (!found) { return std::nullopt; }
        return result;
    }

    Element Element::append_child(std::string_view name) {
        return Element{_node.append_child(c_name(name).c_str())};
    }

    Element Element::child_or_append(std::string_view name) {
        if (auto existing = child(name)) { return *existing; }
        return append_child(name);
    }

    void Element::set_attribute(std::string_view name, std::string_view value) {
        auto key = c_name(name);
        auto attr = _node.attribute(key.c_str());
        if (!attr) { attr = _node.append_attribute(key.c_str()); }
        attr.set_value(std::string{value}.c_str());
    }

    void Element::set_text(std::string_view value) {
        for (auto node = _node.first_child(); node;) {
            auto next = node.next_sibling();
            if (is_text(node)) { _node.remove_child(node); }
            node = next;
        }
        if (value.empty()) { return; }
        // Text goes before any child elements so mixed content stays readable
        auto text = _node.first_child() ? _node.insert_child_before(pugi::node_pcdata, _node.first_child())
                                        : _node.append_child(pugi::node_pcdata);
        text.set_value(std::string{value}.c_str());
    }

} // namespace xmlmap
