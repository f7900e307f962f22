#include <xmlmap/serialization.h>
#include <xmlmap/runtime/decoder.h>
#include <xmlmap/runtime/encoder.h>
#include <xmlmap/runtime/processor_state.h>

namespace xmlmap {

    namespace {
        FormatOptions format_of(const SerializeOptions &options) {
            return FormatOptions{options.indent, options.xml_declaration, options.encoding};
        }
    } // namespace

    Value decode(const Processor &processor, const XmlDocument &document, const ProcessingOptions &options) {
        return decode(processor, document.root(), options);
    }

    Value decode(const Processor &processor, const Element &root, const ProcessingOptions &options) {
        ProcessorState state{options.observer};
        return Decoder{state}.decode_root(processor, root);
    }

    XmlDocument encode(const Processor &processor, const Value &value, const ProcessingOptions &options) {
        ProcessorState state{options.observer};
        XmlDocument document;
        Encoder{state}.encode_root(processor, value, document);
        return document;
    }

    Value parse_from_string(const Processor &processor, std::string_view text, const ParseOptions &options) {
        auto document = XmlDocument::parse(text, options.encoding);
        return decode(processor, document, options.processing);
    }

    Value parse_from_file(const Processor &processor, const std::filesystem::path &path, const ParseOptions &options) {
        auto document = XmlDocument::load(path, options.encoding);
        return decode(processor, document, options.processing);
    }

    std::string serialize_to_string(const Processor &processor, const Value &value, const SerializeOptions &options) {
        return encode(processor, value, options.processing).to_string(format_of(options));
    }

    void serialize_to_file(const Processor &processor, const Value &value, const std::filesystem::path &path,
                           const SerializeOptions &options) {
        encode(processor, value, options.processing).save(path, format_of(options));
    }

} // namespace xmlmap
