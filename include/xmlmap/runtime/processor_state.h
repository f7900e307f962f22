#ifndef XMLMAP_RUNTIME_PROCESSOR_STATE_H
#define XMLMAP_RUNTIME_PROCESSOR_STATE_H

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/runtime/processing_observer.h>
#include <xmlmap/types/location.h>
#include <xmlmap/util/scope.h>

#include <optional>
#include <string>
#include <vector>

namespace xmlmap {

    /**
     * Mutable state of a single decode or encode call: the location stack and the optional observer.
     * Never shared between calls, so processor trees can be used from several threads at once.
     */
    class XMLMAP_EXPORT ProcessorState {
    public:
        explicit ProcessorState(processing_observer_ptr observer = nullptr) : _observer{observer} {
        }

        ProcessorState(const ProcessorState &) = delete;
        ProcessorState &operator=(const ProcessorState &) = delete;

        void push(ProcessorLocation location);

        void pop() noexcept;

        /**
         * Pushes the location and pops it again when the returned guard goes out of scope.
         * An empty path without an index (a "." selector) leaves the stack unchanged.
         */
        [[nodiscard]] auto enter(std::string element_path, std::optional<size_t> array_index = std::nullopt) {
            bool pushed = !element_path.empty() || array_index.has_value();
            if (pushed) { push(ProcessorLocation{std::move(element_path), array_index}); }
            return make_scope_exit([this, pushed] { if (pushed) { pop(); } });
        }

        [[nodiscard]] ProcessorStateView view() const { return ProcessorStateView{_locations}; }

        [[nodiscard]] std::string location_string() const { return view().location_string(); }

        [[nodiscard]] processing_observer_ptr observer() const noexcept { return _observer; }

        [[nodiscard]] size_t depth() const noexcept { return _locations.size(); }

        /// Throws E with the given detail and the current location
        template<typename E, typename... Ts>
        [[noreturn]] void fail(fmt::format_string<Ts...> fmt_str, Ts &&... xs) const {
            throw_error_at<E>(location_string(), fmt_str, std::forward<Ts>(xs)...);
        }

    private:
        std::vector<ProcessorLocation> _locations;
        processing_observer_ptr _observer;
    };

} // namespace xmlmap

#endif // XMLMAP_RUNTIME_PROCESSOR_STATE_H
