#ifndef XMLMAP_TYPES_LOCATION_H
#define XMLMAP_TYPES_LOCATION_H

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/util/errors.h>

#include <concepts>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xmlmap {

    /**
     * One step of the location: the element path entered by a processor and, for array items, the index of the
     * item. Renders as "city" or "city[2]".
     */
    struct XMLMAP_EXPORT ProcessorLocation {
        std::string element_path;
        std::optional<size_t> array_index;

        [[nodiscard]] std::string to_string() const;

        bool operator==(const ProcessorLocation &) const = default;
    };

    /**
     * Read-only view of the locations entered so far in a decode or encode call, handed to hooks.
     *
     * The view tracks the live state so it must not outlive the hook invocation it was given to.
     */
    class XMLMAP_EXPORT ProcessorStateView {
    public:
        explicit ProcessorStateView(const std::vector<ProcessorLocation> &locations) : _locations{locations} {
        }

        [[nodiscard]] const std::vector<ProcessorLocation> &locations() const noexcept { return _locations; }

        /// Slash joined rendering, e.g. "genre-authors/authors/author[1]/book[0]/year-published"
        [[nodiscard]] std::string location_string() const;

        /**
         * Throws E carrying message and the current location. Errors of the XmlError family receive the
         * location as a separate field, any other type is constructed from "<message>: <location>".
         */
        template<typename E = UserFailure>
        [[noreturn]] void raise_error(std::string_view message) const {
            if constexpr (std::constructible_from<E, std::string, std::string>) {
                throw E{std::string{message}, location_string()};
            } else {
                auto location = location_string();
                throw E{location.empty() ? std::string{message} : fmt::format("{}: {}", message, location)};
            }
        }

    private:
        const std::vector<ProcessorLocation> &_locations;
    };

} // namespace xmlmap

#endif // XMLMAP_TYPES_LOCATION_H
