#include <xmlmap/types/path.h>
#include <xmlmap/util/errors.h>
#include <xmlmap/util/string_utils.h>

#include <fmt/ranges.h>

#include <algorithm>

namespace xmlmap {

    PathExpression::PathExpression(std::vector<Segment> segments, std::string text)
        : _segments{std::move(segments)}, _text{std::move(text)} {
    }

    PathExpression PathExpression::parse(std::string_view text) {
        if (text.empty()) { throw_error<InvalidRootConfiguration>("Element path must not be empty"); }

        std::vector<Segment> segments;
        for (auto part : split(text, '/')) {
            if (part.empty()) {
                throw_error<InvalidRootConfiguration>("Element path '{}' contains an empty segment", text);
            }
            if (part == ".") {
                segments.push_back(Segment{Segment::Kind::Self, {}});
            } else {
                segments.push_back(Segment{Segment::Kind::Named, std::string{part}});
            }
        }
        return PathExpression{std::move(segments), std::string{text}};
    }

    bool PathExpression::is_self() const noexcept {
        return std::ranges::all_of(_segments, [](const Segment &s) { return s.is_self(); });
    }

    std::vector<std::string> PathExpression::named_steps() const {
        std::vector<std::string> steps;
        for (const auto &segment : _segments) {
            if (!segment.is_self()) { steps.push_back(segment.name); }
        }
        return steps;
    }

    std::string PathExpression::element_path() const { return fmt::format("{}", fmt::join(named_steps(), "/")); }

    std::string PathExpression::last_name() const {
        auto it = std::ranges::find_if(_segments.rbegin(), _segments.rend(),
                                       [](const Segment &s) { return !s.is_self(); });
        return it == _segments.rend() ? std::string{} : it->name;
    }

    PathExpression PathExpression::parent() const {
        auto steps = named_steps();
        if (steps.size() <= 1) { return PathExpression{{Segment{Segment::Kind::Self, {}}}, "."}; }
        steps.pop_back();

        std::vector<Segment> segments;
        segments.reserve(steps.size());
        for (const auto &step : steps) { segments.push_back(Segment{Segment::Kind::Named, step}); }
        return PathExpression{std::move(segments), fmt::format("{}", fmt::join(steps, "/"))};
    }

    std::optional<Element> PathExpression::resolve(const Element &context) const {
        auto current = context;
        for (const auto &segment : _segments) {
            if (segment.is_self()) { continue; }
            auto next = current.child(segment.name);
            if (!next) { return std::nullopt; }
            current = *next;
        }
        return current;
    }

    Element PathExpression::resolve_or_create(Element context) const {
        for (const auto &segment : _segments) {
            if (segment.is_self()) { continue; }
            context = context.child_or_append(segment.name);
        }
        return context;
    }

} // namespace xmlmap
