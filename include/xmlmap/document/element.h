#ifndef XMLMAP_DOCUMENT_ELEMENT_H
#define XMLMAP_DOCUMENT_ELEMENT_H

#include <xmlmap/xmlmap_export.h>

#include <pugixml.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xmlmap {

    /**
     * Non-owning handle on an element of an XmlDocument.
     *
     * This is the only tree capability the processing engine uses: lookup of children by name, attribute and text
     * access for decoding, and child / attribute / text creation for encoding. Handles stay valid for as long as
     * the owning document is alive.
     */
    class XMLMAP_EXPORT Element {
    public:
        Element() = default;

        explicit Element(pugi::xml_node node) : _node{node} {
        }

        [[nodiscard]] explicit operator bool() const noexcept { return !_node.empty(); }

        [[nodiscard]] std::string_view name() const noexcept { return _node.name(); }

        // Decode side

        /// First child element with the given name
        [[nodiscard]] std::optional<Element> child(std::string_view name) const;

        /// Every child element with the given name, in document order
        [[nodiscard]] std::vector<Element> children(std::string_view name) const;

        [[nodiscard]] std::optional<std::string> attribute(std::string_view name) const;

        /// Character data of the element, absent when the element holds no text
        [[nodiscard]] std::optional<std::string> text() const;

        // Encode side

        Element append_child(std::string_view name);

        /// The first child with the given name, appended when there is none
        Element child_or_append(std::string_view name);

        void set_attribute(std::string_view name, std::string_view value);

        /// Replaces any existing character data, an empty value leaves the element without text
        void set_text(std::string_view value);

        [[nodiscard]] pugi::xml_node node() const noexcept { return _node; }

        [[nodiscard]] bool operator==(const Element &other) const noexcept { return _node == other._node; }

    private:
        pugi::xml_node _node;
    };

} // namespace xmlmap

#endif // XMLMAP_DOCUMENT_ELEMENT_H
