#include <xmlmap/document/xml_document.h>
#include <xmlmap/util/errors.h>

#include <sstream>

namespace xmlmap {

    namespace {
        pugi::xml_encoding to_pugi(TextEncoding encoding) {
            switch (encoding) {
                case TextEncoding::Auto: return pugi::encoding_auto;
                case TextEncoding::Utf8: return pugi::encoding_utf8;
                case TextEncoding::Utf16: return pugi::encoding_utf16;
                case TextEncoding::Utf32: return pugi::encoding_utf32;
                case TextEncoding::Latin1: return pugi::encoding_latin1;
            }
            return pugi::encoding_auto;
        }

        unsigned format_flags(const FormatOptions &options) {
            unsigned flags = options.indent ? pugi::format_indent : pugi::format_raw;
            if (!options.xml_declaration) { flags |= pugi::format_no_declaration; }
            return flags;
        }

        std::string indent_of(const FormatOptions &options) { return options.indent.value_or(std::string{}); }

        // Keeps whitespace-only text when it is an element's only child
        constexpr unsigned parse_flags = pugi::parse_default | pugi::parse_ws_pcdata_single;
    } // namespace

    XmlDocument::XmlDocument() : _document{std::make_unique<pugi::xml_document>()} {
    }

    XmlDocument XmlDocument::parse(std::string_view text, TextEncoding encoding) {
        XmlDocument document;
        auto result = document._document->load_buffer(text.data(), text.size(), parse_flags,
                                                       to_pugi(encoding));
        if (!result) {
            throw_error<MalformedDocument>("Could not parse document: {} at offset {}", result.description(),
                                           result.offset);
        }
        return document;
    }

    XmlDocument XmlDocument::load(const std::filesystem::path &path, TextEncoding encoding) {
        XmlDocument document;
        auto result = document._document->load_file(path.c_str(), parse_flags, to_pugi(encoding));
        if (!result) {
            throw_error<MalformedDocument>("Could not load '{}': {} at offset {}", path.string(), result.description(),
                                           result.offset);
        }
        return document;
    }

    Element XmlDocument::new_root(std::string_view name) {
        _document->reset();
        return Element{_document->append_child(std::string{name}.c_str())};
    }

    Element XmlDocument::root() const { return Element{_document->document_element()}; }

    std::string XmlDocument::to_string(const FormatOptions &options) const {
        std::ostringstream out;
        auto indent = indent_of(options);
        _document->save(out, indent.c_str(), format_flags(options), pugi::encoding_utf8);
        auto text = out.str();
        // Compact output carries no trailing newline
        if (!options.indent && !text.empty() && text.back() == '\n') { text.pop_back(); }
        return text;
    }

    void XmlDocument::save(const std::filesystem::path &path, const FormatOptions &options) const {
        auto indent = indent_of(options);
        auto encoding = options.encoding == TextEncoding::Auto ? pugi::encoding_utf8 : to_pugi(options.encoding);
        if (!_document->save_file(path.c_str(), indent.c_str(), format_flags(options), encoding)) {
            throw_error<MalformedDocument>("Could not write '{}'", path.string());
        }
    }

} // namespace xmlmap
