#include <xmlmap/types/location.h>

#include <fmt/ranges.h>

namespace xmlmap {

    std::string ProcessorLocation::to_string() const {
        if (array_index) { return fmt::format("{}[{}]", element_path, *array_index); }
        return element_path;
    }

    std::string ProcessorStateView::location_string() const {
        std::vector<std::string> parts;
        parts.reserve(_locations.size());
        for (const auto &location : _locations) { parts.push_back(location.to_string()); }
        return fmt::format("{}", fmt::join(parts, "/"));
    }

} // namespace xmlmap
