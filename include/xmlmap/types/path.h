#ifndef XMLMAP_TYPES_PATH_H
#define XMLMAP_TYPES_PATH_H

#include <xmlmap/xmlmap_export.h>
#include <xmlmap/document/element.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace xmlmap {

    /**
     * Parsed element selector.
     *
     * Grammar: segments separated by "/", each either "." (the context element itself) or an element name.
     * "a/b/c" selects the first "c" under the first "b" under the first "a" of the context element. An empty
     * selector, or one with an empty segment ("a//b", "/a", "a/"), is rejected with InvalidRootConfiguration.
     */
    class XMLMAP_EXPORT PathExpression {
    public:
        struct Segment {
            enum class Kind { Self, Named };

            Kind kind;
            std::string name;

            [[nodiscard]] bool is_self() const noexcept { return kind == Kind::Self; }

            bool operator==(const Segment &) const = default;
        };

        static PathExpression parse(std::string_view text);

        [[nodiscard]] const std::vector<Segment> &segments() const noexcept { return _segments; }

        /// True when every segment is "." so the selector denotes the context element
        [[nodiscard]] bool is_self() const noexcept;

        /// Element names along the selector, "." segments removed
        [[nodiscard]] std::vector<std::string> named_steps() const;

        /// Named steps joined with "/", the segment recorded in the location (empty for a self selector)
        [[nodiscard]] std::string element_path() const;

        /// Name of the last named step, empty for a self selector
        [[nodiscard]] std::string last_name() const;

        /// The selector without its last named step, a self selector when there is only one named step
        [[nodiscard]] PathExpression parent() const;

        [[nodiscard]] const std::string &to_string() const noexcept { return _text; }

        /// Follows the selector from context, absent as soon as a step is missing
        [[nodiscard]] std::optional<Element> resolve(const Element &context) const;

        /// Follows the selector from context, reusing the first existing child at each step or appending one
        [[nodiscard]] Element resolve_or_create(Element context) const;

        bool operator==(const PathExpression &other) const { return _segments == other._segments; }

    private:
        PathExpression(std::vector<Segment> segments, std::string text);

        std::vector<Segment> _segments;
        std::string _text;
    };

} // namespace xmlmap

#endif // XMLMAP_TYPES_PATH_H
