#ifndef XMLMAP_FORWARD_DECLARATIONS_H
#define XMLMAP_FORWARD_DECLARATIONS_H

#include <memory>

namespace xmlmap {
    // Values - owned by value, deep copied
    class Value;
    class Mapping;
    class Sequence;
    class RecordInstance;

    // Processor - immutable, shared between any number of decode / encode calls
    class Processor;
    using processor_ptr = const Processor *;
    using processor_s_ptr = std::shared_ptr<const Processor>;

    // RecordAdapter - shared by the record processors built from it
    struct RecordAdapter;
    using record_adapter_s_ptr = std::shared_ptr<const RecordAdapter>;

    struct Hooks;
    class PathExpression;
    struct ProcessorLocation;

    // Per-call state, never shared between calls
    class ProcessorStateView;
    class ProcessorState;

    struct ProcessingLifeCycleObserver;
    using processing_observer_ptr = ProcessingLifeCycleObserver *;

    // Document layer
    class Element;
    class XmlDocument;
} // namespace xmlmap

#endif // XMLMAP_FORWARD_DECLARATIONS_H
