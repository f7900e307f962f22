#include <xmlmap/types/hooks.h>

namespace xmlmap {

    namespace {
        Value invoke_hook(const Hooks::hook_fn &hook, const ProcessorStateView &state, Value value) {
            if (!hook) { return value; }
            try {
                return hook(state, std::move(value));
            } catch (const UserFailure &e) {
                if (e.has_location()) { throw; }
                throw UserFailure{e.detail(), state.location_string()};
            }
        }
    } // namespace

    Value apply_after_decode(const Hooks &hooks, const ProcessorStateView &state, Value value) {
        return invoke_hook(hooks.after_decode, state, std::move(value));
    }

    Value apply_before_encode(const Hooks &hooks, const ProcessorStateView &state, Value value) {
        return invoke_hook(hooks.before_encode, state, std::move(value));
    }

} // namespace xmlmap
