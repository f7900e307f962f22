#ifndef XMLMAP_TYPES_HOOKS_H
#define XMLMAP_TYPES_HOOKS_H

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/types/location.h>
#include <xmlmap/types/value.h>

#include <functional>

namespace xmlmap {

    /**
     * User callbacks run on a processor's typed value.
     *
     * after_decode receives the value just produced (never a substituted default) and returns the value to keep.
     * before_encode receives the value about to be written and returns the value to write. Either may reject the
     * value with state.raise_error(...) or by throwing UserFailure directly; a UserFailure without a location has
     * the current location attached before it leaves the engine.
     */
    struct XMLMAP_EXPORT Hooks {
        using hook_fn = std::function<Value(const ProcessorStateView &, Value)>;

        hook_fn after_decode;
        hook_fn before_encode;

        [[nodiscard]] bool empty() const noexcept { return !after_decode && !before_encode; }
    };

    [[nodiscard]] XMLMAP_EXPORT Value apply_after_decode(const Hooks &hooks, const ProcessorStateView &state,
                                                         Value value);

    [[nodiscard]] XMLMAP_EXPORT Value apply_before_encode(const Hooks &hooks, const ProcessorStateView &state,
                                                          Value value);

} // namespace xmlmap

#endif // XMLMAP_TYPES_HOOKS_H
