#ifndef XMLMAP_RUNTIME_ENCODER_H
#define XMLMAP_RUNTIME_ENCODER_H

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/document/element.h>
#include <xmlmap/document/xml_document.h>
#include <xmlmap/runtime/processor_state.h>
#include <xmlmap/types/processor.h>

namespace xmlmap {

    /**
     * The inverse walk of Decoder: writes a Value into a document following a processor tree.
     *
     * Encoding is write only. Primitives, dictionaries and nested array containers reuse an existing child with
     * the same name so several processors can contribute to one element; array items always append.
     */
    class XMLMAP_EXPORT Encoder {
    public:
        explicit Encoder(ProcessorState &state) : _state{state} {
        }

        /// Creates the root element of document and writes value beneath it
        void encode_root(const Processor &processor, const Value &value, XmlDocument &document);

        /// Writes processor's field under parent, value is nullptr when the enclosing value has no such field
        void encode(const Processor &processor, const Value *value, Element parent);

    private:
        void write_at(const Processor &processor, const Value &value, Element element);

        void write_items(const Processor &processor, const ArrayProcessor &array, const Value &value,
                         Element items_parent);

        [[noreturn]] void missing(const Processor &processor) const;

        void notify_before(const Processor &processor, const Value &value);

        void notify_after(const Processor &processor);

        ProcessorState &_state;
    };

} // namespace xmlmap

#endif // XMLMAP_RUNTIME_ENCODER_H
