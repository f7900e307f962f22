#include <xmlmap/runtime/processor_state.h>

namespace xmlmap {

    void ProcessorState::push(ProcessorLocation location) { _locations.push_back(std::move(location)); }

    void ProcessorState::pop() noexcept {
        if (!_locations.empty()) { _locations.pop_back(); }
    }

} // namespace xmlmap
