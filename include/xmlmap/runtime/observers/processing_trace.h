#pragma once

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/runtime/processing_observer.h>
#include <string>
#include <string_view>
#include <optional>

namespace xmlmap {

    /**
     * @brief Logs every step as the engine decodes or encodes a document.
     *
     * This is voluminous but can be helpful tracking down a declaration that does not match the document.
     * Lines are written to stderr, e.g. "[decode] author/birth-year >> integer('birth-year')".
     */
    class XMLMAP_EXPORT ProcessingTrace : public ProcessingLifeCycleObserver {
    public:
        /**
         * @brief Construct a new Processing Trace object
         *
         * @param filter Used to restrict which locations to report (substring match)
         * @param decode Log decode related events
         * @param encode Log encode related events
         */
        explicit ProcessingTrace(const std::optional<std::string> &filter = std::nullopt, bool decode = true,
                                 bool encode = true);

        void on_before_decode(const Processor &processor, const ProcessorStateView &state) override;
        void on_after_decode(const Processor &processor, const ProcessorStateView &state, const Value &value) override;
        void on_before_encode(const Processor &processor, const ProcessorStateView &state, const Value &value) override;
        void on_after_encode(const Processor &processor, const ProcessorStateView &state) override;

        // Static configuration
        static void set_print_values(bool value);

    private:
        std::optional<std::string> _filter;
        bool _decode;
        bool _encode;

        static bool _print_values;

        void _print(std::string_view phase, const std::string &location, const std::string &msg) const;
        bool _should_log(const std::string &location) const;
    };

} // namespace xmlmap
