#ifndef XMLMAP_RUNTIME_PROCESSING_OBSERVER_H
#define XMLMAP_RUNTIME_PROCESSING_OBSERVER_H

#include <xmlmap/xmlmap_forward_declarations.h>

namespace xmlmap {

    // ProcessingLifeCycleObserver - externally owned, must outlive the decode / encode call it is handed to
    struct ProcessingLifeCycleObserver {
        using ptr = ProcessingLifeCycleObserver *;

        virtual ~ProcessingLifeCycleObserver() = default;

        virtual void on_before_decode(const Processor &, const ProcessorStateView &) {
        };

        virtual void on_after_decode(const Processor &, const ProcessorStateView &, const Value &) {
        };

        virtual void on_before_encode(const Processor &, const ProcessorStateView &, const Value &) {
        };

        virtual void on_after_encode(const Processor &, const ProcessorStateView &) {
        };
    };

} // namespace xmlmap

#endif // XMLMAP_RUNTIME_PROCESSING_OBSERVER_H
