#ifndef XMLMAP_RUNTIME_DECODER_H
#define XMLMAP_RUNTIME_DECODER_H

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/document/element.h>
#include <xmlmap/runtime/processor_state.h>
#include <xmlmap/types/processor.h>

#include <optional>

namespace xmlmap {

    /**
     * Depth first walk of a processor tree against a parsed document, producing the Value it describes.
     *
     * The first failure aborts the walk and propagates with the location captured at the point of failure.
     */
    class XMLMAP_EXPORT Decoder {
    public:
        explicit Decoder(ProcessorState &state) : _state{state} {
        }

        /// Decodes the document whose root element is root; the first step of the processor path names it
        [[nodiscard]] Value decode_root(const Processor &processor, const Element &root);

        /// Decodes the value of processor selected relative to context, its parent element
        [[nodiscard]] Value decode(const Processor &processor, const Element &context);

    private:
        /// The value of processor read at its own element, absent when a primitive's attribute is missing
        std::optional<Value> read_at(const Processor &processor, const Element &element);

        Value read_present(const Processor &processor, const Element &element);

        Value read_items(const Processor &processor, const ArrayProcessor &array, const Element &items_parent);

        /// The substitute for an absent value, or MissingValue when processor is required
        Value absent(const Processor &processor);

        void notify_before(const Processor &processor);

        void notify_after(const Processor &processor, const Value &value);

        ProcessorState &_state;
    };

} // namespace xmlmap

#endif // XMLMAP_RUNTIME_DECODER_H
