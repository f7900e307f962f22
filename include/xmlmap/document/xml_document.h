#ifndef XMLMAP_DOCUMENT_XML_DOCUMENT_H
#define XMLMAP_DOCUMENT_XML_DOCUMENT_H

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/document/element.h>

#include <pugixml.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace xmlmap {

    enum class TextEncoding : uint8_t {
        Auto,  // detect from the byte order mark / declaration when reading, UTF-8 when writing
        Utf8,
        Utf16,
        Utf32,
        Latin1,
    };

    struct FormatOptions {
        /// Indentation unit, compact single line output when not set
        std::optional<std::string> indent;
        bool xml_declaration{false};
        TextEncoding encoding{TextEncoding::Auto};
    };

    /**
     * Owning XML document, a thin wrapper over pugi::xml_document.
     *
     * Element handles obtained from a document stay valid when the document is moved.
     */
    class XMLMAP_EXPORT XmlDocument {
    public:
        XmlDocument();

        XmlDocument(XmlDocument &&) noexcept = default;
        XmlDocument &operator=(XmlDocument &&) noexcept = default;

        XmlDocument(const XmlDocument &) = delete;
        XmlDocument &operator=(const XmlDocument &) = delete;

        /// @throws MalformedDocument when the markup does not parse
        static XmlDocument parse(std::string_view text, TextEncoding encoding = TextEncoding::Auto);

        /// @throws MalformedDocument when the file cannot be read or does not parse
        static XmlDocument load(const std::filesystem::path &path, TextEncoding encoding = TextEncoding::Auto);

        /// Replaces any existing content with a single root element
        Element new_root(std::string_view name);

        /// The root element, an empty handle for an empty document
        [[nodiscard]] Element root() const;

        [[nodiscard]] std::string to_string(const FormatOptions &options = {}) const;

        /// @throws MalformedDocument when the file cannot be written
        void save(const std::filesystem::path &path, const FormatOptions &options = {}) const;

    private:
        std::unique_ptr<pugi::xml_document> _document;
    };

} // namespace xmlmap

#endif // XMLMAP_DOCUMENT_XML_DOCUMENT_H
